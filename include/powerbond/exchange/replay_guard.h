// POWERBOND - Replay Guard
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Tracks which (requester, nonce) pairs have been spent. The set only
// grows; a pair is never accepted twice.

#ifndef POWERBOND_EXCHANGE_REPLAY_GUARD_H
#define POWERBOND_EXCHANGE_REPLAY_GUARD_H

#include <powerbond/core/types.h>

#include <map>
#include <set>

namespace powerbond {

namespace db {
class ExchangeStateStore;
}

namespace exchange {

class ReplayGuard {
public:
    /**
     * A nonce marked as spent on behalf of a request still in progress.
     *
     * Destroying an uncommitted reservation withdraws the mark, so a
     * discarded request leaves the nonce usable. If the attached store
     * cannot erase it, the nonce stays spent.
     */
    class Reservation {
    public:
        Reservation(Reservation&& other) noexcept;
        Reservation& operator=(Reservation&&) = delete;
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        ~Reservation();

        /// Make the mark permanent
        void Commit() noexcept { committed_ = true; }

        bool IsCommitted() const { return committed_; }
        const Address& GetRequester() const { return requester_; }
        const Nonce& GetNonce() const { return nonce_; }

    private:
        friend class ReplayGuard;
        Reservation(ReplayGuard* guard, const Address& requester, const Nonce& nonce)
            : guard_(guard), requester_(requester), nonce_(nonce) {}

        ReplayGuard* guard_;
        Address requester_;
        Nonce nonce_;
        bool committed_{false};
    };

    ReplayGuard() = default;

    ReplayGuard(const ReplayGuard&) = delete;
    ReplayGuard& operator=(const ReplayGuard&) = delete;

    /**
     * Write spent nonces through to a store, loading the ones it already holds.
     * The store must outlive the guard.
     * @throws std::runtime_error if the stored nonces cannot be read
     */
    void AttachStore(db::ExchangeStateStore* store);

    bool IsConsumed(const Address& requester, const Nonce& nonce) const;

    /**
     * Mark a pair as permanently spent.
     * @throws std::logic_error if the pair was already consumed
     * @throws std::runtime_error if the store write fails
     */
    void Consume(const Address& requester, const Nonce& nonce);

    /**
     * Mark a pair as spent until the reservation is committed or dropped.
     * The mark is persisted immediately.
     * @throws std::logic_error if the pair was already consumed
     * @throws std::runtime_error if the store write fails
     */
    [[nodiscard]] Reservation Reserve(const Address& requester, const Nonce& nonce);

    /// Total number of spent pairs
    size_t Count() const;

    /// Number of spent nonces of one requester
    size_t CountFor(const Address& requester) const;

private:
    void Mark(const Address& requester, const Nonce& nonce);
    void Release(const Address& requester, const Nonce& nonce) noexcept;

    std::map<Address, std::set<Nonce>> consumed_;
    size_t count_{0};
    db::ExchangeStateStore* store_{nullptr};
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_REPLAY_GUARD_H
