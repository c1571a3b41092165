// POWERBOND - Role Based Access Control
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#ifndef POWERBOND_EXCHANGE_ACCESS_H
#define POWERBOND_EXCHANGE_ACCESS_H

#include <powerbond/core/types.h>

#include <map>
#include <mutex>
#include <set>

namespace powerbond {
namespace exchange {

/// Admin of every role that has no other admin (all zero bytes)
const RoleId& DefaultAdminRole();

/// keccak256("EXCHANGER_ROLE"), may submit exchanges
const RoleId& ExchangerRole();

/// keccak256("MANAGER_ROLE"), may raise the voting power cap
const RoleId& ManagerRole();

/// Answers whether an account holds a role
class IAccessControl {
public:
    virtual ~IAccessControl() = default;
    virtual bool HasRole(const RoleId& role, const Address& account) const = 0;
};

/**
 * In-memory role table.
 *
 * Granting and revoking a role requires holding that role's admin role.
 */
class RoleRegistry : public IAccessControl {
public:
    /// @param admin Receives DEFAULT_ADMIN_ROLE
    explicit RoleRegistry(const Address& admin);

    bool HasRole(const RoleId& role, const Address& account) const override;

    /// @return false if sender lacks the admin role of role
    bool GrantRole(const Address& sender, const RoleId& role, const Address& account);

    /// @return false if sender lacks the admin role of role
    bool RevokeRole(const Address& sender, const RoleId& role, const Address& account);

    /// An account may always drop its own roles
    void RenounceRole(const RoleId& role, const Address& account);

    RoleId GetRoleAdmin(const RoleId& role) const;

    /// @return false if sender lacks the current admin role of role
    bool SetRoleAdmin(const Address& sender, const RoleId& role, const RoleId& adminRole);

private:
    bool HasRoleLocked(const RoleId& role, const Address& account) const;
    RoleId GetRoleAdminLocked(const RoleId& role) const;

    std::map<RoleId, std::set<Address>> members_;
    std::map<RoleId, RoleId> admins_;
    mutable std::mutex mutex_;
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_ACCESS_H
