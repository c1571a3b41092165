// POWERBOND CLI - Command Line Interface
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Offline tooling for the exchange: evaluates the bonding curve, previews
// grants, computes the typed-data digest an intent must be signed over,
// verifies signatures and inspects the persisted exchange state.

#include <powerbond/core/hex.h>
#include <powerbond/core/uint256.h>
#include <powerbond/db/statestore.h>
#include <powerbond/exchange/authorization.h>
#include <powerbond/exchange/curve.h>
#include <powerbond/exchange/engine.h>
#include <powerbond/exchange/exchange_config.h>
#include <powerbond/util/config.h>
#include <powerbond/util/logging.h>
#include <powerbond/util/time.h>

#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace powerbond {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "POWERBOND CLI";

namespace defaults {
    constexpr const char* LOG_LEVEL = "warn";
    constexpr const char* STATE_DIR = "state";
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Paths
    std::string dataDir;
    std::string configFile;

    // Logging
    std::string logLevel;
    std::string logFile;
    std::vector<std::string> debugCategories;
    bool printToConsole{false};

    // Command
    std::string method;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: powerbond-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path\n";
    std::cout << "  -d, --datadir=DIR          Data directory path\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error (default: warn)\n";
    std::cout << "  --logfile=FILE             Also write log entries to FILE\n";
    std::cout << "  --printtoconsole           Write log entries to the console\n";
    std::cout << "  --debug=CATEGORY           Only log CATEGORY (repeatable)\n";
    std::cout << "\nCommands:\n";
    std::cout << "  curve <burned>                        Voting power for a burned amount\n";
    std::cout << "  inverse <power>                       Burned amount for a voting power\n";
    std::cout << "  quote <amount> <burned> <power> [cap] Grant for an exchange\n";
    std::cout << "  digest <requester> <amount> <nonce> <expiration>\n";
    std::cout << "                                        Typed-data digest to sign\n";
    std::cout << "  verify <requester> <amount> <nonce> <expiration> <signature>\n";
    std::cout << "                                        Check a signed intent\n";
    std::cout << "  state [<requester> <nonce>]           Stored cap and nonces\n";
    std::cout << "\nAmounts accept decimal, 0x-hex or exponent form (100e18).\n";
    std::cout << "Expirations accept unix seconds or ISO 8601 (2024-01-01T00:00:00Z).\n";
    std::cout << "\nExamples:\n";
    std::cout << "  powerbond-cli curve 25e18\n";
    std::cout << "  powerbond-cli quote 2000e18 75240e18 99e18\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 POWERBOND Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"loglevel", required_argument, nullptr, 1001},
        {"logfile", required_argument, nullptr, 1002},
        {"printtoconsole", no_argument, nullptr, 1003},
        {"debug", required_argument, nullptr, 1004},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    // '+' stops at the first command word so amounts are never taken as options
    while ((opt = getopt_long(argc, argv, "+hvc:d:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'd':
                config.dataDir = optarg;
                break;
            case 1001:  // --loglevel
                config.logLevel = optarg;
                break;
            case 1002:  // --logfile
                config.logFile = optarg;
                break;
            case 1003:  // --printtoconsole
                config.printToConsole = true;
                break;
            case 1004:  // --debug
                config.debugCategories.push_back(optarg);
                break;
            case '?':
            default:
                return false;
        }
    }

    // Remaining arguments are command and params
    for (int i = optind; i < argc; ++i) {
        if (config.method.empty()) {
            config.method = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }
    return true;
}

// ============================================================================
// Setup
// ============================================================================

/// Command line values override the config file
bool LoadConfiguration(const CLIConfig& cli, util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    if (!cli.dataDir.empty()) {
        config.SetDataDir(cli.dataDir);
    }
    if (!cli.configFile.empty()) {
        config.Set(CONF, cli.configFile);
    }

    util::ConfigParseResult result = config.LoadConfigFile();
    if (!result.success) {
        std::cerr << "error: " << result.errorMessage;
        if (!result.errorFile.empty()) {
            std::cerr << " (" << result.errorFile << ":" << result.errorLine << ")";
        }
        std::cerr << "\n";
        return false;
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }

    if (cli.dataDir.empty()) {
        if (auto dir = config.TryGetString(DATADIR)) {
            config.SetDataDir(*dir);
        }
    }

    if (!cli.logLevel.empty()) config.Set(LOGLEVEL, cli.logLevel);
    if (!cli.logFile.empty()) config.Set(LOGFILE, cli.logFile);
    if (cli.printToConsole) config.Set(PRINTTOCONSOLE, "1");
    if (!cli.debugCategories.empty()) {
        std::string joined;
        for (const auto& category : cli.debugCategories) {
            if (!joined.empty()) joined += ",";
            joined += category;
        }
        config.Set(DEBUG, joined);
    }

    exchange::ExchangeConfig::RegisterKeys(config);
    for (const auto& problem : config.Validate()) {
        std::cerr << "warning: " << problem << "\n";
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(LOGLEVEL, defaults::LOG_LEVEL));
    logger.SetLevel(level);

    if (config.GetBool(PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.useStderr = true;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetPath(LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = level;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            std::cerr << "warning: cannot open log file " << logFile << "\n";
        }
    }

    if (auto categories = config.TryGetString(DEBUG)) {
        std::stringstream ss(*categories);
        std::string category;
        while (std::getline(ss, category, ',')) {
            if (!category.empty()) logger.EnableCategory(category);
        }
    }
}

// ============================================================================
// Argument Helpers
// ============================================================================

Timestamp ParseExpiration(const std::string& str) {
    if (auto iso = util::ParseISO8601(str)) {
        return *iso;
    }
    size_t pos = 0;
    long long value = std::stoll(str, &pos);
    if (pos != str.size()) {
        throw std::invalid_argument("invalid expiration '" + str + "'");
    }
    return static_cast<Timestamp>(value);
}

exchange::ExchangeIntent ParseIntent(const std::vector<std::string>& args) {
    exchange::ExchangeIntent intent;
    intent.requester = Address::FromHex(args[0]);
    intent.amount = Uint256::FromString(args[1]);
    intent.nonce = Nonce::FromHex(args[2]);
    intent.expiration = ParseExpiration(args[3]);
    if (args.size() > 4) {
        intent.signature = HexToBytes(args[4]);
    }
    return intent;
}

bool RequireArgs(const CLIConfig& config, size_t min, size_t max, const char* usage) {
    if (config.args.size() < min || config.args.size() > max) {
        std::cerr << "usage: powerbond-cli " << usage << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int CommandCurve(const CLIConfig& config) {
    if (!RequireArgs(config, 1, 1, "curve <burned>")) return 1;
    Uint256 burned = Uint256::FromString(config.args[0]);
    std::cout << exchange::VotingPowerFromBurned(burned) << "\n";
    return 0;
}

int CommandInverse(const CLIConfig& config) {
    if (!RequireArgs(config, 1, 1, "inverse <power>")) return 1;
    Uint256 power = Uint256::FromString(config.args[0]);
    std::cout << exchange::BurnedFromVotingPower(power) << "\n";
    return 0;
}

int CommandQuote(const CLIConfig& config, const exchange::ExchangeConfig& exchangeConfig) {
    if (!RequireArgs(config, 3, 4, "quote <amount> <burned> <power> [cap]")) return 1;

    Uint256 amount = Uint256::FromString(config.args[0]);
    Uint256 burned = Uint256::FromString(config.args[1]);
    Uint256 power = Uint256::FromString(config.args[2]);
    Uint256 cap = config.args.size() > 3 ? Uint256::FromString(config.args[3])
                                         : exchangeConfig.initialCap;

    if (amount < exchange::MIN_EXCHANGE_AMOUNT) {
        std::cerr << "error: amount below minimum " << exchange::MIN_EXCHANGE_AMOUNT << "\n";
        return 1;
    }
    if (power >= cap) {
        std::cerr << "error: voting power " << power << " already at cap " << cap << "\n";
        return 1;
    }

    exchange::ExchangeQuote quote = exchange::ComputeQuote(amount, burned, power, cap);
    std::cout << "granted: " << quote.grantedPower << "\n";
    std::cout << "burn:    " << quote.burnAmount << "\n";
    std::cout << "capped:  " << (quote.capped ? "yes" : "no") << "\n";
    return 0;
}

int CommandDigest(const CLIConfig& config, const exchange::ExchangeConfig& exchangeConfig) {
    if (!RequireArgs(config, 4, 4, "digest <requester> <amount> <nonce> <expiration>")) {
        return 1;
    }

    exchange::ExchangeIntent intent = ParseIntent(config.args);
    exchange::AuthorizationVerifier verifier(exchangeConfig.domain);

    std::cout << "typehash:  0x" << exchange::ExchangeTypeHash().ToHex() << "\n";
    std::cout << "domain:    0x" << verifier.GetDomainSeparator().ToHex() << "\n";
    std::cout << "struct:    0x"
              << exchange::ExchangeStructHash(intent.requester, intent.amount,
                                              intent.nonce, intent.expiration).ToHex()
              << "\n";
    std::cout << "digest:    0x" << verifier.Digest(intent).ToHex() << "\n";
    return 0;
}

int CommandVerify(const CLIConfig& config, const exchange::ExchangeConfig& exchangeConfig) {
    if (!RequireArgs(config, 5, 5,
                     "verify <requester> <amount> <nonce> <expiration> <signature>")) {
        return 1;
    }

    exchange::ExchangeIntent intent = ParseIntent(config.args);
    exchange::AuthorizationVerifier verifier(exchangeConfig.domain);

    bool valid = verifier.Verify(intent);
    bool expired = exchange::AuthorizationVerifier::IsExpired(intent, util::GetTime());

    std::cout << "signature: " << (valid ? "valid" : "invalid") << "\n";
    std::cout << "expires:   " << util::FormatISO8601(intent.expiration)
              << (expired ? " (expired)" : "") << "\n";
    return valid && !expired ? 0 : 1;
}

int CommandState(const CLIConfig& config, const exchange::ExchangeConfig& exchangeConfig) {
    if (config.args.size() != 0 && config.args.size() != 2) {
        std::cerr << "usage: powerbond-cli state [<requester> <nonce>]\n";
        return 1;
    }

    std::string dir = exchangeConfig.dataDir + "/" + defaults::STATE_DIR;
    auto store = db::ExchangeStateStore::Open(dir);

    if (config.args.size() == 2) {
        Address requester = Address::FromHex(config.args[0]);
        Nonce nonce = Nonce::FromHex(config.args[1]);
        std::cout << (store->HasNonce(requester, nonce) ? "consumed" : "unused") << "\n";
        return 0;
    }

    auto cap = store->ReadCap();
    size_t count = 0;
    db::Status status = store->ForEachNonce([](const Address&, const Nonce&) {}, &count);
    if (!status.ok()) {
        std::cerr << "error: " << status.ToString() << "\n";
        return 1;
    }

    std::cout << "cap:    " << (cap ? *cap : exchangeConfig.initialCap)
              << (cap ? "" : " (not stored, configured value)") << "\n";
    std::cout << "nonces: " << count << "\n";
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    if (config.showHelp) {
        PrintHelp();
        return 0;
    }

    if (config.showVersion) {
        PrintVersion();
        return 0;
    }

    if (config.method.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'powerbond-cli --help' for usage information.\n";
        return 1;
    }

    util::ConfigManager& settings = util::GetConfig();
    if (!LoadConfiguration(config, settings)) {
        return 1;
    }
    SetupLogging(settings);

    exchange::ExchangeConfig exchangeConfig;
    util::ConfigParseResult parsed = exchange::ExchangeConfig::FromConfig(settings, exchangeConfig);
    if (!parsed.success) {
        std::cerr << "error: " << parsed.errorMessage << "\n";
        return 1;
    }
    for (const auto& warning : parsed.warnings) {
        LOG_DEBUG(util::LogCategory::CLI) << warning;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Running " << config.method;

    int rc;
    if (config.method == "curve") {
        rc = CommandCurve(config);
    } else if (config.method == "inverse") {
        rc = CommandInverse(config);
    } else if (config.method == "quote") {
        rc = CommandQuote(config, exchangeConfig);
    } else if (config.method == "digest") {
        rc = CommandDigest(config, exchangeConfig);
    } else if (config.method == "verify") {
        rc = CommandVerify(config, exchangeConfig);
    } else if (config.method == "state") {
        rc = CommandState(config, exchangeConfig);
    } else {
        std::cerr << "Error: Unknown command '" << config.method << "'.\n";
        std::cerr << "Use 'powerbond-cli --help' for usage information.\n";
        rc = 1;
    }

    util::Logger::Instance().Flush();
    return rc;
}

} // namespace cli
} // namespace powerbond

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return powerbond::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
