// POWERBOND - Exchange Configuration
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Typed view of the [domain] and [exchange] sections:
//
//   [domain]
//   name = PowerBond
//   version = 1
//   chainid = 1
//   contract = 0x...
//
//   [exchange]
//   cap = 100e18
//   utiltoken = 0x...
//   govtoken = 0x...

#ifndef POWERBOND_EXCHANGE_EXCHANGE_CONFIG_H
#define POWERBOND_EXCHANGE_EXCHANGE_CONFIG_H

#include <powerbond/core/types.h>
#include <powerbond/core/uint256.h>
#include <powerbond/exchange/curve.h>
#include <powerbond/exchange/typed_data.h>
#include <powerbond/util/config.h>

#include <string>

namespace powerbond {
namespace exchange {

/// Defaults used when a key is absent
namespace defaults {
    constexpr const char* DOMAIN_NAME = "PowerBond";
    constexpr const char* DOMAIN_VERSION = "1";
    constexpr uint64_t CHAIN_ID = 1;
}

struct ExchangeConfig {
    TypedDataDomain domain;

    /// Cap a fresh state store starts with
    Uint256 initialCap{DEFAULT_VOTING_POWER_CAP};

    Address utilityToken;
    Address governanceToken;

    /// Directory of the state store
    std::string dataDir;

    /**
     * Read the typed configuration.
     * Malformed values fail the parse; absent ones fall back to defaults
     * and add a warning where the default is unlikely to be intended.
     */
    static util::ConfigParseResult FromConfig(const util::ConfigManager& config,
                                              ExchangeConfig& out);

    /// Declare the recognised keys on a manager
    static void RegisterKeys(util::ConfigManager& config);
};

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_EXCHANGE_CONFIG_H
