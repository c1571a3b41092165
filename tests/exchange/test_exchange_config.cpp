// POWERBOND - Exchange Configuration Tests
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <gtest/gtest.h>

#include <powerbond/exchange/exchange_config.h>

namespace powerbond {
namespace exchange {
namespace {

class ExchangeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.SetDataDir("/tmp/powerbond-config-test");
    }

    util::ConfigManager config_;
    ExchangeConfig out_;
};

TEST_F(ExchangeConfigTest, Defaults) {
    auto result = ExchangeConfig::FromConfig(config_, out_);
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(out_.domain.name, "PowerBond");
    EXPECT_EQ(out_.domain.version, "1");
    EXPECT_EQ(out_.domain.chainId, Uint256(1));
    EXPECT_TRUE(out_.domain.verifyingContract.IsZero());
    EXPECT_EQ(out_.initialCap, DEFAULT_VOTING_POWER_CAP);
    EXPECT_EQ(out_.dataDir, "/tmp/powerbond-config-test");

    // Contract and both tokens fall back to the zero address
    EXPECT_EQ(result.warnings.size(), 3u);
}

TEST_F(ExchangeConfigTest, ReadsSections) {
    std::string content = R"(
[domain]
name=Test Bond
version=7
chainid=0x89
contract=0x00000000000000000000000000000000000000ff

[exchange]
cap=250e18
utiltoken=0x1111111111111111111111111111111111111111
govtoken=0x2222222222222222222222222222222222222222
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    auto result = ExchangeConfig::FromConfig(config_, out_);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_TRUE(result.warnings.empty());

    EXPECT_EQ(out_.domain.name, "Test Bond");
    EXPECT_EQ(out_.domain.version, "7");
    EXPECT_EQ(out_.domain.chainId, Uint256(137));
    EXPECT_EQ(out_.domain.verifyingContract,
              Address::FromHex("0x00000000000000000000000000000000000000ff"));
    EXPECT_EQ(out_.initialCap, Uint256::FromDecimal("250e18"));
    EXPECT_EQ(out_.utilityToken, Address::FromHex(std::string(40, '1')));
    EXPECT_EQ(out_.governanceToken, Address::FromHex(std::string(40, '2')));
}

TEST_F(ExchangeConfigTest, RejectsBadAddress) {
    config_.Set("contract", "0x1234", "domain");
    auto result = ExchangeConfig::FromConfig(config_, out_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("domain.contract"), std::string::npos);
}

TEST_F(ExchangeConfigTest, RejectsBadAmounts) {
    config_.Set("cap", "lots", "exchange");
    EXPECT_FALSE(ExchangeConfig::FromConfig(config_, out_).success);

    config_.Set("cap", "0", "exchange");
    EXPECT_FALSE(ExchangeConfig::FromConfig(config_, out_).success);

    config_.Set("cap", "1e18", "exchange");
    config_.Set("chainid", "-1", "domain");
    EXPECT_FALSE(ExchangeConfig::FromConfig(config_, out_).success);
}

TEST_F(ExchangeConfigTest, RegisteredKeysValidate) {
    ExchangeConfig::RegisterKeys(config_);
    config_.Set("loglevel", "info");
    config_.Set("cap", "1e18", "exchange");
    EXPECT_TRUE(config_.Validate().empty());

    config_.Set("capp", "1e18", "exchange");
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("exchange.capp"), std::string::npos);
}

} // namespace
} // namespace exchange
} // namespace powerbond
