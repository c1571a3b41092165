// POWERBOND - Voting Power Cap Policy
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#ifndef POWERBOND_EXCHANGE_CAP_POLICY_H
#define POWERBOND_EXCHANGE_CAP_POLICY_H

#include <powerbond/core/uint256.h>
#include <powerbond/exchange/curve.h>

#include <functional>
#include <vector>

namespace powerbond {

namespace db {
class ExchangeStateStore;
}

namespace exchange {

/// Outcome of a cap update
enum class CapUpdateStatus {
    Updated,
    LevelIsLowerThanExisting,   ///< New cap is not strictly greater
    PersistFailed,              ///< Store rejected the write; cap unchanged
    Unauthorized,               ///< Caller lacks the manager role
};

/// Convert cap update status to string
const char* CapUpdateStatusToString(CapUpdateStatus status);

/**
 * Global ceiling on the voting power a holder can reach by exchanging.
 *
 * The cap only ever rises: every update must be strictly greater than
 * the current value.
 */
class CapPolicy {
public:
    using CapChangedCallback = std::function<void(const Uint256& oldCap, const Uint256& newCap)>;

    explicit CapPolicy(const Uint256& initialCap = DEFAULT_VOTING_POWER_CAP);

    CapPolicy(const CapPolicy&) = delete;
    CapPolicy& operator=(const CapPolicy&) = delete;

    /**
     * Persist the cap in a store. A cap already stored there replaces the
     * in-memory value; otherwise the current value is written.
     * The store must outlive the policy.
     * @throws std::runtime_error if the store cannot be read or written
     */
    void AttachStore(db::ExchangeStateStore* store);

    /// Raise the cap; subscribers see (oldCap, newCap) on success
    CapUpdateStatus SetCap(const Uint256& newCap);

    const Uint256& GetCap() const { return cap_; }

    /// Called after every successful update
    void SubscribeCapChanged(CapChangedCallback callback);

private:
    Uint256 cap_;
    db::ExchangeStateStore* store_{nullptr};
    std::vector<CapChangedCallback> subscribers_;
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_CAP_POLICY_H
