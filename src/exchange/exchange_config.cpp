// POWERBOND - Exchange Configuration Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/exchange_config.h>

#include <stdexcept>

namespace powerbond {
namespace exchange {

namespace {

bool ParseAddress(const util::ConfigManager& config, const char* key, const char* section,
                  Address& out, util::ConfigParseResult& result) {
    auto value = config.TryGetString(key, section);
    if (!value) {
        result.warnings.push_back(std::string(section) + "." + key +
                                  " not set, using the zero address");
        return true;
    }
    try {
        out = Address::FromHex(*value);
    } catch (const std::invalid_argument&) {
        result = util::ConfigParseResult::Error(std::string(section) + "." + key +
                                                ": invalid address '" + *value + "'");
        return false;
    }
    return true;
}

bool ParseAmount(const util::ConfigManager& config, const char* key, const char* section,
                 Uint256& out, util::ConfigParseResult& result) {
    auto value = config.TryGetString(key, section);
    if (!value) return true;
    try {
        out = Uint256::FromString(*value);
    } catch (const std::exception& e) {
        result = util::ConfigParseResult::Error(std::string(section) + "." + key +
                                                ": " + e.what());
        return false;
    }
    return true;
}

} // namespace

util::ConfigParseResult ExchangeConfig::FromConfig(const util::ConfigManager& config,
                                                   ExchangeConfig& out) {
    using namespace util::ConfigKeys;

    auto result = util::ConfigParseResult::Success();

    out.domain.name = config.GetString(DOMAIN_NAME, defaults::DOMAIN_NAME, DOMAIN_SECTION);
    out.domain.version = config.GetString(DOMAIN_VERSION, defaults::DOMAIN_VERSION,
                                          DOMAIN_SECTION);

    out.domain.chainId = Uint256(defaults::CHAIN_ID);
    if (!ParseAmount(config, DOMAIN_CHAINID, DOMAIN_SECTION, out.domain.chainId, result)) {
        return result;
    }
    if (!ParseAddress(config, DOMAIN_CONTRACT, DOMAIN_SECTION,
                      out.domain.verifyingContract, result)) {
        return result;
    }

    if (!ParseAmount(config, EXCHANGE_CAP, EXCHANGE_SECTION, out.initialCap, result)) {
        return result;
    }
    if (out.initialCap.IsZero()) {
        return util::ConfigParseResult::Error("exchange.cap must be greater than zero");
    }

    if (!ParseAddress(config, EXCHANGE_UTILTOKEN, EXCHANGE_SECTION, out.utilityToken, result) ||
        !ParseAddress(config, EXCHANGE_GOVTOKEN, EXCHANGE_SECTION, out.governanceToken, result)) {
        return result;
    }

    out.dataDir = config.GetDataDir();
    return result;
}

void ExchangeConfig::RegisterKeys(util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    for (const char* key : {DATADIR, CONF, DEBUG, PRINTTOCONSOLE, LOGLEVEL, LOGFILE}) {
        config.AllowKey(key);
    }
    for (const char* key : {DOMAIN_NAME, DOMAIN_VERSION, DOMAIN_CHAINID, DOMAIN_CONTRACT}) {
        config.AllowKey(key, DOMAIN_SECTION);
    }
    for (const char* key : {EXCHANGE_CAP, EXCHANGE_UTILTOKEN, EXCHANGE_GOVTOKEN}) {
        config.AllowKey(key, EXCHANGE_SECTION);
    }
}

} // namespace exchange
} // namespace powerbond
