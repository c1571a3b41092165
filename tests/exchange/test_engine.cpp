// POWERBOND - Exchange Engine Tests
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <gtest/gtest.h>

#include <powerbond/crypto/keys.h>
#include <powerbond/exchange/engine.h>
#include <powerbond/exchange/memory_ledger.h>
#include <powerbond/util/time.h>

#include <array>
#include <stdexcept>
#include <vector>

namespace powerbond {
namespace exchange {
namespace {

constexpr Timestamp NOW = 1700000000;

Uint256 Tokens(const char* amount) {
    return Uint256::FromDecimal(amount);
}

/// Governance ledger whose Mint fails a set number of times
class FailingGovernanceLedger : public MemoryGovernanceLedger {
public:
    using MemoryGovernanceLedger::MemoryGovernanceLedger;

    void Mint(const Address& to, const Uint256& amount) override {
        if (mintFailures > 0) {
            --mintFailures;
            throw LedgerError("governance token paused");
        }
        MemoryGovernanceLedger::Mint(to, amount);
    }

    void SetBurnedAmountOfUtilToken(const Address& account, const Uint256& amount) override {
        if (counterWritesAllowed == 0) {
            throw LedgerError("burned counter locked");
        }
        --counterWritesAllowed;
        MemoryGovernanceLedger::SetBurnedAmountOfUtilToken(account, amount);
    }

    int mintFailures{1};
    int counterWritesAllowed{-1};
};

/// Utility ledger whose first burn fails
class FailingUtilityLedger : public MemoryUtilityLedger {
public:
    using MemoryUtilityLedger::MemoryUtilityLedger;

    void BurnByBurner(const Address& from, const Uint256& amount) override {
        if (burnFailures > 0) {
            --burnFailures;
            throw LedgerError("utility token paused");
        }
        MemoryUtilityLedger::BurnByBurner(from, amount);
    }

    int burnFailures{1};
};

// ============================================================================
// Test Fixtures
// ============================================================================

class ExchangeEngineTest : public ::testing::Test {
protected:
    ExchangeEngineTest()
        : utility_(Address::FromHex(std::string(40, '1'))),
          governance_(Address::FromHex(std::string(40, '2'))),
          roles_(admin_),
          verifier_(MakeDomain(), &accounts_),
          capPolicy_(Tokens("100e18")),
          engine_(engineAddress_, utility_, governance_, roles_, verifier_,
                  replayGuard_, capPolicy_) {}

    void SetUp() override {
        util::SetMockTime(NOW);
        util::EnableMockTime();

        roles_.GrantRole(admin_, ExchangerRole(), exchanger_);
        roles_.GrantRole(admin_, ManagerRole(), manager_);

        utility_.Mint(exchanger_, Tokens("1000000e18"));
        utility_.Approve(exchanger_, engineAddress_, Uint256::Max());

        requester_ = KeyFromScalar(1);
    }

    void TearDown() override {
        util::DisableMockTime();
        util::SetMockTime(0);
    }

    static TypedDataDomain MakeDomain() {
        TypedDataDomain domain;
        domain.name = "PowerBond";
        domain.version = "1";
        domain.chainId = Uint256(1);
        domain.verifyingContract = Address::FromHex(std::string(39, '0') + "1");
        return domain;
    }

    static PrivateKey KeyFromScalar(Byte last) {
        std::array<Byte, PrivateKey::SIZE> raw{};
        raw[31] = last;
        return PrivateKey(raw);
    }

    ExchangeIntent MakeIntent(const Uint256& amount, char nonceFill = '1',
                              Timestamp expiration = NOW + 3600) {
        ExchangeIntent intent;
        intent.requester = requester_.GetAddress();
        intent.amount = amount;
        intent.nonce = Nonce::FromHex(std::string(64, nonceFill));
        intent.expiration = expiration;
        intent.signature = requester_.SignDigest(verifier_.Digest(intent));
        return intent;
    }

    void ExpectUntouched(const ExchangeIntent& intent) {
        EXPECT_FALSE(engine_.IsNonceUsed(intent.requester, intent.nonce));
        EXPECT_EQ(utility_.BalanceOf(exchanger_), Tokens("1000000e18"));
        EXPECT_EQ(governance_.TotalSupply(), Uint256());
    }

    Address engineAddress_ = Address::FromHex(std::string(40, 'e'));
    Address admin_ = Address::FromHex(std::string(40, 'a'));
    Address exchanger_ = Address::FromHex(std::string(40, 'b'));
    Address manager_ = Address::FromHex(std::string(40, 'c'));

    MemoryUtilityLedger utility_;
    MemoryGovernanceLedger governance_;
    RoleRegistry roles_;
    AccountRegistry accounts_;
    AuthorizationVerifier verifier_;
    ReplayGuard replayGuard_;
    CapPolicy capPolicy_;
    ExchangeEngine engine_;

    PrivateKey requester_;
};

// ============================================================================
// Successful Exchanges
// ============================================================================

TEST_F(ExchangeEngineTest, FirstExchange) {
    std::vector<VotingPowerReceived> events;
    engine_.SubscribeVotingPowerReceived(
        [&events](const VotingPowerReceived& e) { events.push_back(e); });

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    ExchangeResult result = engine_.Exchange(exchanger_, intent);

    ASSERT_TRUE(result.Ok()) << result.ToString();
    EXPECT_EQ(result.grantedPower, Tokens("1e18"));
    EXPECT_EQ(result.burnAmount, Tokens("25e18"));
    EXPECT_FALSE(result.capped);

    Address holder = intent.requester;
    EXPECT_EQ(governance_.BalanceOf(holder), Tokens("1e18"));
    EXPECT_EQ(governance_.BurnedAmountOfUtilToken(holder), Tokens("25e18"));
    EXPECT_EQ(utility_.BalanceOf(exchanger_), Tokens("999975e18"));
    EXPECT_EQ(utility_.BalanceOf(holder), Uint256());
    EXPECT_EQ(utility_.TotalSupply(), Tokens("999975e18"));
    EXPECT_TRUE(engine_.IsNonceUsed(holder, intent.nonce));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].requester, holder);
    EXPECT_EQ(events[0].grantedPower, Tokens("1e18"));
    EXPECT_EQ(events[0].burnAmount, Tokens("25e18"));
}

TEST_F(ExchangeEngineTest, SequentialExchangesFollowCumulativeBurn) {
    ASSERT_TRUE(engine_.Exchange(exchanger_, MakeIntent(Tokens("25e18"), '1')).Ok());
    ExchangeResult second = engine_.Exchange(exchanger_, MakeIntent(Tokens("25e18"), '2'));
    ASSERT_TRUE(second.Ok()) << second.ToString();

    // Same tokens buy less the second time
    EXPECT_EQ(second.grantedPower, Tokens("666666666666666666"));
    EXPECT_EQ(governance_.BalanceOf(requester_.GetAddress()), Tokens("1666666666666666666"));
    EXPECT_EQ(governance_.BurnedAmountOfUtilToken(requester_.GetAddress()), Tokens("50e18"));
}

TEST_F(ExchangeEngineTest, PartialFillAtCap) {
    Address holder = requester_.GetAddress();
    governance_.Mint(holder, Tokens("99e18"));
    governance_.SetBurnedAmountOfUtilToken(holder, Tokens("75240e18"));

    ExchangeResult result = engine_.Exchange(exchanger_, MakeIntent(Tokens("2000e18")));

    ASSERT_TRUE(result.Ok()) << result.ToString();
    EXPECT_TRUE(result.capped);
    EXPECT_EQ(result.grantedPower, Tokens("1e18"));
    EXPECT_EQ(result.burnAmount, Tokens("1510e18"));
    EXPECT_EQ(governance_.BalanceOf(holder), Tokens("100e18"));
    EXPECT_EQ(governance_.BurnedAmountOfUtilToken(holder), Tokens("76750e18"));
    EXPECT_EQ(utility_.BalanceOf(exchanger_), Tokens("998490e18"));
}

TEST_F(ExchangeEngineTest, ExpirationEqualToNowIsAccepted) {
    ExchangeResult result = engine_.Exchange(exchanger_, MakeIntent(Tokens("25e18"), '1', NOW));
    EXPECT_TRUE(result.Ok()) << result.ToString();
}

TEST_F(ExchangeEngineTest, DelegatedAccountExchange) {
    Address account = Address::FromHex(std::string(40, '7'));
    accounts_.Register(account, [](const Hash256&, const std::vector<Byte>& sig) {
        return sig == std::vector<Byte>{0x01} ? DELEGATED_MAGIC_VALUE : 0u;
    });

    ExchangeIntent intent;
    intent.requester = account;
    intent.amount = Tokens("25e18");
    intent.expiration = NOW;
    intent.signature = {0x01};

    ExchangeResult result = engine_.Exchange(exchanger_, intent);
    ASSERT_TRUE(result.Ok()) << result.ToString();
    EXPECT_EQ(governance_.BalanceOf(account), Tokens("1e18"));
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(ExchangeEngineTest, RejectsCallerWithoutRole) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    ExchangeResult result = engine_.Exchange(manager_, intent);
    EXPECT_EQ(result.status, ExchangeStatus::Unauthorized);
    ExpectUntouched(intent);
}

TEST_F(ExchangeEngineTest, RejectsZeroRequester) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    intent.requester = Address();
    EXPECT_EQ(engine_.Exchange(exchanger_, intent).status, ExchangeStatus::AddressIsZero);
    ExpectUntouched(intent);
}

TEST_F(ExchangeEngineTest, RejectsSmallAmount) {
    ExchangeIntent intent = MakeIntent(Tokens("1e18") - Uint256(1));
    EXPECT_EQ(engine_.Exchange(exchanger_, intent).status, ExchangeStatus::AmountIsTooSmall);
    ExpectUntouched(intent);

    // Exactly the minimum is fine
    EXPECT_TRUE(engine_.Exchange(exchanger_, MakeIntent(Tokens("1e18"), '2')).Ok());
}

TEST_F(ExchangeEngineTest, RejectsReplayedNonce) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    ASSERT_TRUE(engine_.Exchange(exchanger_, intent).Ok());

    Uint256 balanceAfterFirst = governance_.BalanceOf(intent.requester);
    EXPECT_EQ(engine_.Exchange(exchanger_, intent).status, ExchangeStatus::InvalidNonce);
    EXPECT_EQ(governance_.BalanceOf(intent.requester), balanceAfterFirst);
}

TEST_F(ExchangeEngineTest, RejectsConsumedNonceWhateverTheOtherFields) {
    ASSERT_TRUE(engine_.Exchange(exchanger_, MakeIntent(Tokens("25e18"), '7')).Ok());
    Uint256 exchangerBalance = utility_.BalanceOf(exchanger_);

    // Freshly signed, valid on its own, but reusing the nonce
    ExchangeIntent reused = MakeIntent(Tokens("40e18"), '7', NOW + 7200);
    ASSERT_TRUE(verifier_.Verify(reused));
    EXPECT_EQ(engine_.Exchange(exchanger_, reused).status, ExchangeStatus::InvalidNonce);
    EXPECT_EQ(utility_.BalanceOf(exchanger_), exchangerBalance);
}

TEST_F(ExchangeEngineTest, RejectsExpiredIntent) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"), '1', NOW - 1);
    ExchangeResult result = engine_.Exchange(exchanger_, intent);

    EXPECT_EQ(result.status, ExchangeStatus::SignatureExpired);
    EXPECT_EQ(result.expiration, NOW - 1);
    EXPECT_EQ(result.now, NOW);
    ExpectUntouched(intent);
}

TEST_F(ExchangeEngineTest, ExpiryAgreesWithVerifier) {
    char nonceFill = '1';
    for (Timestamp expiration : {NOW - 1, NOW, NOW + 1}) {
        ExchangeIntent intent = MakeIntent(Tokens("1e18"), nonceFill++, expiration);
        bool expired = AuthorizationVerifier::IsExpired(intent, util::GetTime());
        EXPECT_EQ(engine_.Exchange(exchanger_, intent).status == ExchangeStatus::SignatureExpired,
                  expired) << "expiration " << expiration;
    }
}

TEST_F(ExchangeEngineTest, IntentExpiresWithTime) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"), '1', NOW + 10);
    util::AdvanceMockTime(util::Seconds(11));
    EXPECT_EQ(engine_.Exchange(exchanger_, intent).status, ExchangeStatus::SignatureExpired);
}

TEST_F(ExchangeEngineTest, RejectsHolderAtCap) {
    Address holder = requester_.GetAddress();
    governance_.Mint(holder, Tokens("100e18"));

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    ExchangeResult result = engine_.Exchange(exchanger_, intent);

    EXPECT_EQ(result.status, ExchangeStatus::VotingPowerIsHigherThanCap);
    EXPECT_EQ(result.currentVotingPower, Tokens("100e18"));
    EXPECT_EQ(result.cap, Tokens("100e18"));
    EXPECT_FALSE(engine_.IsNonceUsed(holder, intent.nonce));
}

TEST_F(ExchangeEngineTest, RejectsForeignSignature) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    intent.signature = KeyFromScalar(2).SignDigest(verifier_.Digest(intent));

    ExchangeResult result = engine_.Exchange(exchanger_, intent);
    EXPECT_EQ(result.status, ExchangeStatus::InvalidSignature);
    EXPECT_EQ(result.digest, verifier_.Digest(intent));
    EXPECT_EQ(result.signature, intent.signature);
    ExpectUntouched(intent);
}

TEST_F(ExchangeEngineTest, RejectsTamperedAmount) {
    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    intent.amount = Tokens("2500e18");
    EXPECT_EQ(engine_.Exchange(exchanger_, intent).status, ExchangeStatus::InvalidSignature);
    ExpectUntouched(intent);
}

TEST_F(ExchangeEngineTest, RejectsInsufficientAllowance) {
    utility_.Approve(exchanger_, engineAddress_, Tokens("10e18"));

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    ExchangeResult result = engine_.Exchange(exchanger_, intent);

    EXPECT_EQ(result.status, ExchangeStatus::InsufficientAllowance);
    EXPECT_EQ(result.available, Tokens("10e18"));
    EXPECT_EQ(result.required, Tokens("25e18"));
    ExpectUntouched(intent);
}

TEST_F(ExchangeEngineTest, RejectsInsufficientBalance) {
    utility_.BurnByBurner(exchanger_, Tokens("999990e18"));

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    ExchangeResult result = engine_.Exchange(exchanger_, intent);

    EXPECT_EQ(result.status, ExchangeStatus::InsufficientBalance);
    EXPECT_EQ(result.available, Tokens("10e18"));
    EXPECT_FALSE(engine_.IsNonceUsed(intent.requester, intent.nonce));
}

TEST_F(ExchangeEngineTest, CappedFillOnlyNeedsFillAllowance) {
    Address holder = requester_.GetAddress();
    governance_.Mint(holder, Tokens("99e18"));
    governance_.SetBurnedAmountOfUtilToken(holder, Tokens("75240e18"));
    utility_.Approve(exchanger_, engineAddress_, Tokens("1510e18"));

    ExchangeResult result = engine_.Exchange(exchanger_, MakeIntent(Tokens("2000e18")));
    ASSERT_TRUE(result.Ok()) << result.ToString();
    EXPECT_EQ(utility_.Allowance(exchanger_, engineAddress_), Uint256());
}

// ============================================================================
// Failure After Authorization
// ============================================================================

TEST_F(ExchangeEngineTest, LedgerFailureReleasesNonce) {
    FailingGovernanceLedger failing(Address::FromHex(std::string(40, '3')));
    ReplayGuard guard;
    ExchangeEngine engine(engineAddress_, utility_, failing, roles_, verifier_, guard,
                          capPolicy_);

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    EXPECT_THROW(engine.Exchange(exchanger_, intent), LedgerError);
    EXPECT_FALSE(engine.IsNonceUsed(intent.requester, intent.nonce));
    EXPECT_EQ(guard.Count(), 0u);
}

TEST_F(ExchangeEngineTest, FailedMintReversesEarlierSteps) {
    FailingGovernanceLedger failing(Address::FromHex(std::string(40, '3')));
    ReplayGuard guard;
    ExchangeEngine engine(engineAddress_, utility_, failing, roles_, verifier_, guard,
                          capPolicy_);
    Uint256 supply = utility_.TotalSupply();

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    EXPECT_THROW(engine.Exchange(exchanger_, intent), LedgerError);

    EXPECT_EQ(utility_.BalanceOf(exchanger_), Tokens("1000000e18"));
    EXPECT_EQ(utility_.BalanceOf(intent.requester), Uint256());
    EXPECT_EQ(utility_.TotalSupply(), supply);
    EXPECT_EQ(utility_.Allowance(exchanger_, engineAddress_), Uint256::Max());
    EXPECT_EQ(failing.BurnedAmountOfUtilToken(intent.requester), Uint256());
    EXPECT_EQ(failing.BalanceOf(intent.requester), Uint256());

    // The same intent, retried once the ledger recovers, is charged exactly once
    ExchangeResult result = engine.Exchange(exchanger_, intent);
    ASSERT_TRUE(result.Ok()) << result.ToString();
    EXPECT_EQ(utility_.BalanceOf(exchanger_), Tokens("1000000e18") - Tokens("25e18"));
    EXPECT_EQ(failing.BurnedAmountOfUtilToken(intent.requester), Tokens("25e18"));
    EXPECT_EQ(failing.BalanceOf(intent.requester), Tokens("1e18"));
    EXPECT_EQ(engine.Exchange(exchanger_, intent).status, ExchangeStatus::InvalidNonce);
}

TEST_F(ExchangeEngineTest, FailedBurnReturnsTransferredTokens) {
    FailingUtilityLedger failing(Address::FromHex(std::string(40, '4')));
    failing.Mint(exchanger_, Tokens("100e18"));
    failing.Approve(exchanger_, engineAddress_, Tokens("60e18"));
    ReplayGuard guard;
    ExchangeEngine engine(engineAddress_, failing, governance_, roles_, verifier_, guard,
                          capPolicy_);

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    EXPECT_THROW(engine.Exchange(exchanger_, intent), LedgerError);

    EXPECT_EQ(failing.BalanceOf(exchanger_), Tokens("100e18"));
    EXPECT_EQ(failing.BalanceOf(intent.requester), Uint256());
    EXPECT_EQ(failing.TotalSupply(), Tokens("100e18"));
    EXPECT_EQ(failing.Allowance(exchanger_, engineAddress_), Tokens("60e18"));
    EXPECT_FALSE(engine.IsNonceUsed(intent.requester, intent.nonce));
}

TEST_F(ExchangeEngineTest, IrreversibleFailureKeepsNonceSpent) {
    FailingGovernanceLedger failing(Address::FromHex(std::string(40, '3')));
    failing.counterWritesAllowed = 1;
    ReplayGuard guard;
    ExchangeEngine engine(engineAddress_, utility_, failing, roles_, verifier_, guard,
                          capPolicy_);

    ExchangeIntent intent = MakeIntent(Tokens("25e18"));
    EXPECT_THROW(engine.Exchange(exchanger_, intent), LedgerError);

    // The counter could not be restored, so the intent must not run again
    EXPECT_TRUE(engine.IsNonceUsed(intent.requester, intent.nonce));
    EXPECT_EQ(engine.Exchange(exchanger_, intent).status, ExchangeStatus::InvalidNonce);
}

// ============================================================================
// Quotes, Cap Management, Accessors
// ============================================================================

TEST_F(ExchangeEngineTest, QuoteMatchesExchange) {
    ExchangeQuote quote = engine_.QuoteExchange(requester_.GetAddress(), Tokens("25e18"));
    EXPECT_EQ(quote.grantedPower, Tokens("1e18"));
    EXPECT_EQ(quote.burnAmount, Tokens("25e18"));
    EXPECT_FALSE(quote.capped);
    EXPECT_EQ(governance_.TotalSupply(), Uint256());
}

TEST_F(ExchangeEngineTest, QuoteAtCapGrantsNothing) {
    governance_.Mint(requester_.GetAddress(), Tokens("100e18"));
    ExchangeQuote quote = engine_.QuoteExchange(requester_.GetAddress(), Tokens("25e18"));
    EXPECT_TRUE(quote.capped);
    EXPECT_EQ(quote.grantedPower, Uint256());
    EXPECT_EQ(quote.burnAmount, Uint256());
}

TEST_F(ExchangeEngineTest, SetVotingPowerCap) {
    EXPECT_EQ(engine_.SetVotingPowerCap(exchanger_, Tokens("200e18")),
              CapUpdateStatus::Unauthorized);
    EXPECT_EQ(engine_.SetVotingPowerCap(manager_, Tokens("50e18")),
              CapUpdateStatus::LevelIsLowerThanExisting);
    EXPECT_EQ(engine_.SetVotingPowerCap(manager_, Tokens("200e18")), CapUpdateStatus::Updated);
    EXPECT_EQ(engine_.GetVotingPowerCap(), Tokens("200e18"));
}

TEST_F(ExchangeEngineTest, RaisedCapReopensExchange) {
    Address holder = requester_.GetAddress();
    governance_.Mint(holder, Tokens("100e18"));
    governance_.SetBurnedAmountOfUtilToken(holder, Tokens("76750e18"));

    EXPECT_EQ(engine_.Exchange(exchanger_, MakeIntent(Tokens("25e18"), '1')).status,
              ExchangeStatus::VotingPowerIsHigherThanCap);

    ASSERT_EQ(engine_.SetVotingPowerCap(manager_, Tokens("200e18")), CapUpdateStatus::Updated);
    EXPECT_TRUE(engine_.Exchange(exchanger_, MakeIntent(Tokens("25e18"), '1')).Ok());
}

TEST_F(ExchangeEngineTest, Accessors) {
    EXPECT_EQ(engine_.GetAddress(), engineAddress_);
    EXPECT_EQ(engine_.GetUtilityToken(), utility_.GetAddress());
    EXPECT_EQ(engine_.GetGovernanceToken(), governance_.GetAddress());
    EXPECT_EQ(engine_.GetExchangeTypeHash(), ExchangeTypeHash());
    EXPECT_EQ(engine_.GetDomainSeparator(), MakeDomain().Separator());
    EXPECT_EQ(ExchangeEngine::Precision(), Tokens("1e18"));
    EXPECT_EQ(ExchangeEngine::PrecisionFix(), Tokens("1e9"));
    EXPECT_EQ(ExchangeEngine::MinExchangeAmount(), Tokens("1e18"));
}

TEST_F(ExchangeEngineTest, ZeroEngineAddressRejected) {
    EXPECT_THROW(ExchangeEngine(Address(), utility_, governance_, roles_, verifier_,
                                replayGuard_, capPolicy_),
                 std::invalid_argument);
}

TEST(ExchangeStatusTest, Names) {
    EXPECT_STREQ(ExchangeStatusToString(ExchangeStatus::Success), "Success");
    EXPECT_STREQ(ExchangeStatusToString(ExchangeStatus::InvalidNonce), "InvalidNonce");
    EXPECT_STREQ(ExchangeStatusToString(ExchangeStatus::VotingPowerIsHigherThanCap),
                 "VotingPowerIsHigherThanCap");

    ExchangeResult result;
    result.status = ExchangeStatus::InsufficientBalance;
    result.available = Uint256(1);
    result.required = Uint256(2);
    EXPECT_NE(result.ToString().find("available=1 required=2"), std::string::npos);
}

} // namespace
} // namespace exchange
} // namespace powerbond
