// POWERBOND - Voting Power Cap Tests
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <gtest/gtest.h>

#include <powerbond/db/leveldb.h>
#include <powerbond/db/statestore.h>
#include <powerbond/exchange/cap_policy.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace powerbond {
namespace exchange {
namespace {

Uint256 Tokens(const char* amount) {
    return Uint256::FromDecimal(amount);
}

/// Database whose writes always fail
class ReadOnlyDatabase : public db::MemoryDatabase {
public:
    using db::MemoryDatabase::Put;

    db::Status Put(const db::WriteOptions&, const db::Slice&, const db::Slice&) override {
        return db::Status::IOError("read-only");
    }
};

// ============================================================================
// Cap Updates
// ============================================================================

TEST(CapPolicyTest, DefaultCap) {
    CapPolicy policy;
    EXPECT_EQ(policy.GetCap(), Tokens("100e18"));
}

TEST(CapPolicyTest, OnlyRaises) {
    CapPolicy policy(Tokens("100e18"));

    EXPECT_EQ(policy.SetCap(Tokens("100e18")), CapUpdateStatus::LevelIsLowerThanExisting);
    EXPECT_EQ(policy.SetCap(Tokens("50e18")), CapUpdateStatus::LevelIsLowerThanExisting);
    EXPECT_EQ(policy.GetCap(), Tokens("100e18"));

    EXPECT_EQ(policy.SetCap(Tokens("150e18")), CapUpdateStatus::Updated);
    EXPECT_EQ(policy.GetCap(), Tokens("150e18"));
}

TEST(CapPolicyTest, NotifiesSubscribers) {
    CapPolicy policy(Tokens("100e18"));
    std::vector<std::pair<Uint256, Uint256>> changes;
    policy.SubscribeCapChanged([&changes](const Uint256& oldCap, const Uint256& newCap) {
        changes.emplace_back(oldCap, newCap);
    });
    policy.SubscribeCapChanged(CapPolicy::CapChangedCallback());

    policy.SetCap(Tokens("90e18"));
    policy.SetCap(Tokens("120e18"));

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].first, Tokens("100e18"));
    EXPECT_EQ(changes[0].second, Tokens("120e18"));
}

TEST(CapPolicyTest, StatusNames) {
    EXPECT_STREQ(CapUpdateStatusToString(CapUpdateStatus::Updated), "Updated");
    EXPECT_STREQ(CapUpdateStatusToString(CapUpdateStatus::LevelIsLowerThanExisting),
                 "LevelIsLowerThanExisting");
    EXPECT_STREQ(CapUpdateStatusToString(CapUpdateStatus::Unauthorized), "Unauthorized");
}

// ============================================================================
// Persistence
// ============================================================================

TEST(CapPolicyTest, AttachWritesInitialCap) {
    db::ExchangeStateStore store(std::make_unique<db::MemoryDatabase>());
    CapPolicy policy(Tokens("100e18"));
    policy.AttachStore(&store);

    EXPECT_EQ(store.ReadCap(), std::optional<Uint256>(Tokens("100e18")));

    policy.SetCap(Tokens("200e18"));
    EXPECT_EQ(store.ReadCap(), std::optional<Uint256>(Tokens("200e18")));
}

TEST(CapPolicyTest, StoredCapWins) {
    db::ExchangeStateStore store(std::make_unique<db::MemoryDatabase>());
    ASSERT_TRUE(store.WriteCap(Tokens("300e18")).ok());

    CapPolicy policy(Tokens("100e18"));
    policy.AttachStore(&store);
    EXPECT_EQ(policy.GetCap(), Tokens("300e18"));
}

TEST(CapPolicyTest, PersistFailureKeepsCap) {
    db::ExchangeStateStore store(std::make_unique<ReadOnlyDatabase>());
    CapPolicy policy(Tokens("100e18"));

    EXPECT_THROW(policy.AttachStore(&store), std::runtime_error);

    int notified = 0;
    policy.SubscribeCapChanged([&notified](const Uint256&, const Uint256&) { ++notified; });
    EXPECT_EQ(policy.SetCap(Tokens("200e18")), CapUpdateStatus::PersistFailed);
    EXPECT_EQ(policy.GetCap(), Tokens("100e18"));
    EXPECT_EQ(notified, 0);
}

} // namespace
} // namespace exchange
} // namespace powerbond
