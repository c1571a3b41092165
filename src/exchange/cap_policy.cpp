// POWERBOND - Voting Power Cap Policy Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/cap_policy.h>
#include <powerbond/db/statestore.h>
#include <powerbond/util/logging.h>

#include <stdexcept>

namespace powerbond {
namespace exchange {

const char* CapUpdateStatusToString(CapUpdateStatus status) {
    switch (status) {
        case CapUpdateStatus::Updated:                  return "Updated";
        case CapUpdateStatus::LevelIsLowerThanExisting: return "LevelIsLowerThanExisting";
        case CapUpdateStatus::PersistFailed:            return "PersistFailed";
        case CapUpdateStatus::Unauthorized:             return "Unauthorized";
        default:                                        return "Unknown";
    }
}

CapPolicy::CapPolicy(const Uint256& initialCap)
    : cap_(initialCap) {}

void CapPolicy::AttachStore(db::ExchangeStateStore* store) {
    store_ = store;
    if (!store_) return;

    if (auto stored = store_->ReadCap()) {
        if (*stored != cap_) {
            LOG_WARN(util::LogCategory::CAP) << "Using stored cap " << *stored
                                             << " instead of initial cap " << cap_;
        }
        cap_ = *stored;
        return;
    }

    db::Status status = store_->WriteCap(cap_);
    if (!status.ok()) {
        throw std::runtime_error("cannot persist cap: " + status.ToString());
    }
}

CapUpdateStatus CapPolicy::SetCap(const Uint256& newCap) {
    if (newCap <= cap_) {
        LOG_DEBUG(util::LogCategory::CAP) << "Rejected cap " << newCap
                                          << ", current cap is " << cap_;
        return CapUpdateStatus::LevelIsLowerThanExisting;
    }

    if (store_) {
        db::Status status = store_->WriteCap(newCap);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::CAP) << "Failed to persist cap: " << status.ToString();
            return CapUpdateStatus::PersistFailed;
        }
    }

    Uint256 oldCap = cap_;
    cap_ = newCap;

    LOG_INFO(util::LogCategory::CAP) << "Voting power cap changed from " << oldCap
                                     << " to " << newCap;

    for (const auto& callback : subscribers_) {
        callback(oldCap, newCap);
    }
    return CapUpdateStatus::Updated;
}

void CapPolicy::SubscribeCapChanged(CapChangedCallback callback) {
    if (callback) {
        subscribers_.push_back(std::move(callback));
    }
}

} // namespace exchange
} // namespace powerbond
