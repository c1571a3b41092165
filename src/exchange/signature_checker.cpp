// POWERBOND - Signature Verification Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/signature_checker.h>
#include <powerbond/crypto/keys.h>
#include <powerbond/util/logging.h>

#include <stdexcept>

namespace powerbond {
namespace exchange {

// ============================================================================
// AccountRegistry
// ============================================================================

void AccountRegistry::Register(const Address& account, AccountValidator validator) {
    if (account.IsZero()) {
        throw std::invalid_argument("cannot register the zero address");
    }
    if (!validator) {
        throw std::invalid_argument("empty account validator");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    accounts_[account] = std::move(validator);
}

bool AccountRegistry::Unregister(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.erase(account) > 0;
}

bool AccountRegistry::IsProgrammable(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.count(account) > 0;
}

std::optional<uint32_t> AccountRegistry::Validate(const Address& account,
                                                  const Hash256& digest,
                                                  const std::vector<Byte>& signature) const {
    AccountValidator validator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(account);
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        validator = it->second;
    }
    // Run outside the lock, the validator may call back into the registry
    return validator(digest, signature);
}

size_t AccountRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

// ============================================================================
// Verifiers
// ============================================================================

bool DirectKeyVerifier::Verify(const Address& signer, const Hash256& digest,
                               const std::vector<Byte>& signature) const {
    auto recovered = RecoverAddress(digest, signature);
    return recovered && *recovered == signer;
}

bool DelegatedAccountVerifier::Verify(const Address& signer, const Hash256& digest,
                                      const std::vector<Byte>& signature) const {
    try {
        auto result = registry_->Validate(signer, digest, signature);
        return result && *result == DELEGATED_MAGIC_VALUE;
    } catch (const std::exception& e) {
        // A failing account validator counts as a rejection
        LOG_WARN(util::LogCategory::AUTH) << "Account validator of " << signer.ToString()
                                          << " failed: " << e.what();
        return false;
    }
}

bool VerifySignature(const SignatureVerifier& verifier, const Address& signer,
                     const Hash256& digest, const std::vector<Byte>& signature) {
    return std::visit(
        [&](const auto& v) { return v.Verify(signer, digest, signature); },
        verifier);
}

const char* VerifierName(const SignatureVerifier& verifier) {
    return std::holds_alternative<DirectKeyVerifier>(verifier) ? "direct" : "delegated";
}

} // namespace exchange
} // namespace powerbond
