// POWERBOND - Exchange Authorization Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/authorization.h>
#include <powerbond/util/logging.h>

namespace powerbond {
namespace exchange {

AuthorizationVerifier::AuthorizationVerifier(TypedDataDomain domain,
                                             const AccountRegistry* accounts)
    : domain_(std::move(domain)),
      domainSeparator_(domain_.Separator()) {
    verifiers_.emplace_back(DirectKeyVerifier{});
    if (accounts) {
        verifiers_.emplace_back(DelegatedAccountVerifier(*accounts));
    }
}

Hash256 AuthorizationVerifier::Digest(const ExchangeIntent& intent) const {
    Hash256 structHash = ExchangeStructHash(intent.requester, intent.amount,
                                            intent.nonce, intent.expiration);
    return TypedDataDigest(domainSeparator_, structHash);
}

bool AuthorizationVerifier::Verify(const ExchangeIntent& intent) const {
    return VerifyDigest(intent.requester, Digest(intent), intent.signature);
}

bool AuthorizationVerifier::VerifyDigest(const Address& signer, const Hash256& digest,
                                         const std::vector<Byte>& signature) const {
    for (const auto& verifier : verifiers_) {
        if (auto* delegated = std::get_if<DelegatedAccountVerifier>(&verifier)) {
            if (!delegated->Handles(signer)) continue;
        }
        if (VerifySignature(verifier, signer, digest, signature)) {
            LOG_TRACE(util::LogCategory::AUTH) << "Signature of " << signer.ToString()
                                               << " accepted by " << VerifierName(verifier)
                                               << " verifier";
            return true;
        }
    }

    LOG_DEBUG(util::LogCategory::AUTH) << "Signature of " << signer.ToString()
                                       << " rejected for digest 0x" << digest.ToHex();
    return false;
}

} // namespace exchange
} // namespace powerbond
