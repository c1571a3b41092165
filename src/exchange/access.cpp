// POWERBOND - Role Based Access Control Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/access.h>
#include <powerbond/crypto/keccak.h>
#include <powerbond/util/logging.h>

namespace powerbond {
namespace exchange {

const RoleId& DefaultAdminRole() {
    static const RoleId role;
    return role;
}

const RoleId& ExchangerRole() {
    static const RoleId role = Keccak256Hash(std::string("EXCHANGER_ROLE"));
    return role;
}

const RoleId& ManagerRole() {
    static const RoleId role = Keccak256Hash(std::string("MANAGER_ROLE"));
    return role;
}

RoleRegistry::RoleRegistry(const Address& admin) {
    members_[DefaultAdminRole()].insert(admin);
}

bool RoleRegistry::HasRole(const RoleId& role, const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return HasRoleLocked(role, account);
}

bool RoleRegistry::HasRoleLocked(const RoleId& role, const Address& account) const {
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(account) > 0;
}

RoleId RoleRegistry::GetRoleAdminLocked(const RoleId& role) const {
    auto it = admins_.find(role);
    return it == admins_.end() ? DefaultAdminRole() : it->second;
}

RoleId RoleRegistry::GetRoleAdmin(const RoleId& role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetRoleAdminLocked(role);
}

bool RoleRegistry::GrantRole(const Address& sender, const RoleId& role, const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!HasRoleLocked(GetRoleAdminLocked(role), sender)) {
        LOG_WARN(util::LogCategory::AUTH) << sender.ToString() << " may not grant role 0x"
                                          << role.ToHex();
        return false;
    }
    if (members_[role].insert(account).second) {
        LOG_INFO(util::LogCategory::AUTH) << "Granted role 0x" << role.ToHex() << " to "
                                          << account.ToString();
    }
    return true;
}

bool RoleRegistry::RevokeRole(const Address& sender, const RoleId& role, const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!HasRoleLocked(GetRoleAdminLocked(role), sender)) {
        LOG_WARN(util::LogCategory::AUTH) << sender.ToString() << " may not revoke role 0x"
                                          << role.ToHex();
        return false;
    }
    auto it = members_.find(role);
    if (it != members_.end() && it->second.erase(account) > 0) {
        LOG_INFO(util::LogCategory::AUTH) << "Revoked role 0x" << role.ToHex() << " from "
                                          << account.ToString();
    }
    return true;
}

void RoleRegistry::RenounceRole(const RoleId& role, const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(role);
    if (it != members_.end()) {
        it->second.erase(account);
    }
}

bool RoleRegistry::SetRoleAdmin(const Address& sender, const RoleId& role,
                                const RoleId& adminRole) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!HasRoleLocked(GetRoleAdminLocked(role), sender)) {
        return false;
    }
    admins_[role] = adminRole;
    return true;
}

} // namespace exchange
} // namespace powerbond
