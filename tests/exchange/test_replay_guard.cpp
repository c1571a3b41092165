// POWERBOND - Replay Guard Tests
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <gtest/gtest.h>

#include <powerbond/db/leveldb.h>
#include <powerbond/db/statestore.h>
#include <powerbond/exchange/replay_guard.h>

#include <stdexcept>

namespace powerbond {
namespace exchange {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

/// Memory database whose deletes fail once switched on
class NoDeleteDatabase : public db::MemoryDatabase {
public:
    using db::MemoryDatabase::Delete;

    db::Status Delete(const db::WriteOptions& options, const db::Slice& key) override {
        if (failDeletes) return db::Status::IOError("disk full");
        return db::MemoryDatabase::Delete(options, key);
    }

    bool failDeletes{false};
};

class ReplayGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<db::ExchangeStateStore>(std::make_unique<db::MemoryDatabase>());
    }

    Address alice_ = Address::FromHex(std::string(40, 'a'));
    Address bob_ = Address::FromHex(std::string(40, 'b'));
    Nonce n1_ = Nonce::FromHex(std::string(64, '1'));
    Nonce n2_ = Nonce::FromHex(std::string(64, '2'));

    std::unique_ptr<db::ExchangeStateStore> store_;
};

// ============================================================================
// In-Memory Behaviour
// ============================================================================

TEST_F(ReplayGuardTest, ConsumeOnce) {
    ReplayGuard guard;
    EXPECT_FALSE(guard.IsConsumed(alice_, n1_));

    guard.Consume(alice_, n1_);
    EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
    EXPECT_THROW(guard.Consume(alice_, n1_), std::logic_error);
    EXPECT_EQ(guard.Count(), 1u);
}

TEST_F(ReplayGuardTest, NoncesArePerRequester) {
    ReplayGuard guard;
    guard.Consume(alice_, n1_);
    EXPECT_FALSE(guard.IsConsumed(bob_, n1_));

    guard.Consume(bob_, n1_);
    guard.Consume(alice_, n2_);
    EXPECT_EQ(guard.Count(), 3u);
    EXPECT_EQ(guard.CountFor(alice_), 2u);
    EXPECT_EQ(guard.CountFor(bob_), 1u);
    EXPECT_EQ(guard.CountFor(Address()), 0u);
}

TEST_F(ReplayGuardTest, UncommittedReservationIsReleased) {
    ReplayGuard guard;
    {
        auto reservation = guard.Reserve(alice_, n1_);
        EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
        EXPECT_FALSE(reservation.IsCommitted());
        EXPECT_EQ(reservation.GetRequester(), alice_);
        EXPECT_EQ(reservation.GetNonce(), n1_);
    }
    EXPECT_FALSE(guard.IsConsumed(alice_, n1_));
    EXPECT_EQ(guard.Count(), 0u);
}

TEST_F(ReplayGuardTest, CommittedReservationStays) {
    ReplayGuard guard;
    {
        auto reservation = guard.Reserve(alice_, n1_);
        reservation.Commit();
    }
    EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
}

TEST_F(ReplayGuardTest, ReservationReleasedOnException) {
    ReplayGuard guard;
    try {
        auto reservation = guard.Reserve(alice_, n1_);
        throw std::runtime_error("ledger failure");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(guard.IsConsumed(alice_, n1_));
}

TEST_F(ReplayGuardTest, MovedReservationReleasesOnce) {
    ReplayGuard guard;
    {
        auto first = guard.Reserve(alice_, n1_);
        auto second = std::move(first);
        EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
    }
    EXPECT_FALSE(guard.IsConsumed(alice_, n1_));
    EXPECT_EQ(guard.Count(), 0u);
}

TEST_F(ReplayGuardTest, ReserveRejectsConsumed) {
    ReplayGuard guard;
    guard.Consume(alice_, n1_);
    EXPECT_THROW((void)guard.Reserve(alice_, n1_), std::logic_error);
    EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(ReplayGuardTest, ConsumeIsPersisted) {
    ReplayGuard guard;
    guard.AttachStore(store_.get());
    guard.Consume(alice_, n1_);
    EXPECT_TRUE(store_->HasNonce(alice_, n1_));
}

TEST_F(ReplayGuardTest, ReleaseErasesFromStore) {
    ReplayGuard guard;
    guard.AttachStore(store_.get());
    {
        auto reservation = guard.Reserve(alice_, n1_);
        EXPECT_TRUE(store_->HasNonce(alice_, n1_));
    }
    EXPECT_FALSE(store_->HasNonce(alice_, n1_));
}

TEST_F(ReplayGuardTest, FailedStoreEraseKeepsNonceSpent) {
    auto database = std::make_unique<NoDeleteDatabase>();
    NoDeleteDatabase* raw = database.get();
    db::ExchangeStateStore store(std::move(database));

    ReplayGuard guard;
    guard.AttachStore(&store);
    raw->failDeletes = true;
    {
        auto reservation = guard.Reserve(alice_, n1_);
    }

    // Memory and store agree, so a restart gives the same answer
    EXPECT_TRUE(store.HasNonce(alice_, n1_));
    EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
    EXPECT_EQ(guard.Count(), 1u);

    ReplayGuard reloaded;
    reloaded.AttachStore(&store);
    EXPECT_TRUE(reloaded.IsConsumed(alice_, n1_));
}

TEST_F(ReplayGuardTest, AttachLoadsStoredNonces) {
    ASSERT_TRUE(store_->WriteNonce(alice_, n1_).ok());
    ASSERT_TRUE(store_->WriteNonce(bob_, n2_).ok());

    ReplayGuard guard;
    guard.AttachStore(store_.get());
    EXPECT_TRUE(guard.IsConsumed(alice_, n1_));
    EXPECT_TRUE(guard.IsConsumed(bob_, n2_));
    EXPECT_EQ(guard.Count(), 2u);
}

TEST_F(ReplayGuardTest, AttachPersistsEarlierNonces) {
    ReplayGuard guard;
    guard.Consume(alice_, n1_);
    ASSERT_TRUE(store_->WriteNonce(alice_, n1_).ok());
    guard.Consume(bob_, n2_);

    guard.AttachStore(store_.get());
    EXPECT_TRUE(store_->HasNonce(bob_, n2_));
    EXPECT_EQ(guard.Count(), 2u);
}

TEST_F(ReplayGuardTest, AttachFailsOnCorruptStore) {
    auto database = std::make_unique<db::MemoryDatabase>();
    database->Put(db::MakeKey(db::prefix::NONCE, db::Slice("bad")), "");
    db::ExchangeStateStore store(std::move(database));

    ReplayGuard guard;
    EXPECT_THROW(guard.AttachStore(&store), std::runtime_error);
}

} // namespace
} // namespace exchange
} // namespace powerbond
