// POWERBOND - Replay Guard Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/replay_guard.h>
#include <powerbond/db/statestore.h>
#include <powerbond/util/logging.h>

#include <stdexcept>

namespace powerbond {
namespace exchange {

// ============================================================================
// Reservation
// ============================================================================

ReplayGuard::Reservation::Reservation(Reservation&& other) noexcept
    : guard_(other.guard_),
      requester_(other.requester_),
      nonce_(other.nonce_),
      committed_(other.committed_) {
    other.guard_ = nullptr;
}

ReplayGuard::Reservation::~Reservation() {
    if (guard_ && !committed_) {
        guard_->Release(requester_, nonce_);
    }
}

// ============================================================================
// ReplayGuard
// ============================================================================

void ReplayGuard::AttachStore(db::ExchangeStateStore* store) {
    store_ = store;
    if (!store_) return;

    size_t loaded = 0;
    db::Status status = store_->ForEachNonce(
        [this](const Address& requester, const Nonce& nonce) {
            if (consumed_[requester].insert(nonce).second) {
                ++count_;
            }
        },
        &loaded);
    if (!status.ok()) {
        throw std::runtime_error("cannot load consumed nonces: " + status.ToString());
    }

    // Nonces consumed before the store was attached
    for (const auto& [requester, nonces] : consumed_) {
        for (const auto& nonce : nonces) {
            if (!store_->HasNonce(requester, nonce)) {
                db::Status s = store_->WriteNonce(requester, nonce);
                if (!s.ok()) {
                    throw std::runtime_error("cannot persist nonce: " + s.ToString());
                }
            }
        }
    }

    LOG_INFO(util::LogCategory::DB) << "Loaded " << loaded << " consumed nonces";
}

bool ReplayGuard::IsConsumed(const Address& requester, const Nonce& nonce) const {
    auto it = consumed_.find(requester);
    return it != consumed_.end() && it->second.count(nonce) > 0;
}

void ReplayGuard::Mark(const Address& requester, const Nonce& nonce) {
    if (IsConsumed(requester, nonce)) {
        throw std::logic_error("nonce 0x" + nonce.ToHex() + " of " +
                               requester.ToString() + " already consumed");
    }

    if (store_) {
        db::Status status = store_->WriteNonce(requester, nonce);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to persist nonce: " << status.ToString();
            throw std::runtime_error("cannot persist nonce: " + status.ToString());
        }
    }

    consumed_[requester].insert(nonce);
    ++count_;
}

void ReplayGuard::Consume(const Address& requester, const Nonce& nonce) {
    Mark(requester, nonce);
}

ReplayGuard::Reservation ReplayGuard::Reserve(const Address& requester, const Nonce& nonce) {
    Mark(requester, nonce);
    return Reservation(this, requester, nonce);
}

void ReplayGuard::Release(const Address& requester, const Nonce& nonce) noexcept {
    auto it = consumed_.find(requester);
    if (it == consumed_.end() || it->second.count(nonce) == 0) {
        return;
    }

    // The store decides: a mark that cannot be withdrawn there stays spent here too
    if (store_) {
        db::Status status = store_->EraseNonce(requester, nonce);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to withdraw nonce 0x" << nonce.ToHex()
                                             << " of " << requester.ToString()
                                             << ", keeping it spent: " << status.ToString();
            return;
        }
    }

    it->second.erase(nonce);
    --count_;
    if (it->second.empty()) {
        consumed_.erase(it);
    }

    LOG_DEBUG(util::LogCategory::EXCHANGE) << "Withdrew reservation of nonce 0x"
                                           << nonce.ToHex() << " for " << requester.ToString();
}

size_t ReplayGuard::Count() const {
    return count_;
}

size_t ReplayGuard::CountFor(const Address& requester) const {
    auto it = consumed_.find(requester);
    return it == consumed_.end() ? 0 : it->second.size();
}

} // namespace exchange
} // namespace powerbond
