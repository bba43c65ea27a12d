// DADBS Daemon - Main Entry Point
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// The dadbsd daemon hosts the stake ledger and the consensus manager:
// - Loads the node configuration (file plus command-line overrides)
// - Opens the account database under the storage path
// - Builds the account host, stake ledger and stake-backed validator set
// - Runs until SIGINT or SIGTERM

#include <dadbs/address/address.h>
#include <dadbs/consensus/consensus.h>
#include <dadbs/consensus/validator_registry.h>
#include <dadbs/db/database.h>
#include <dadbs/node/config.h>
#include <dadbs/staking/account_host.h>
#include <dadbs/staking/stake.h>
#include <dadbs/util/config.h>
#include <dadbs/util/logging.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace dadbs {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "DADBS Daemon";

namespace defaults {
    constexpr const char* ACCOUNTS_DB_NAME = "accounts";
}

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};
static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

static node::NodeConfig g_config;
static std::unique_ptr<db::Database> g_accountsDb;
static std::unique_ptr<staking::DatabaseAccountHost> g_host;
static std::unique_ptr<staking::StakeLedger> g_ledger;
static std::shared_ptr<consensus::StakeValidatorRegistry> g_registry;
static std::unique_ptr<consensus::ConsensusManager> g_consensus;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
        g_shutdownCondition.notify_all();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: dadbsd [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/dadbs.conf)\n";
    std::cout << "  -datadir=DIR               Storage directory (overrides storagepath)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  -printtoconsole=0/1        Log to the console (default: 1)\n";
    std::cout << "  -derive=ADDRESS            Print the internal address for an external\n";
    std::cout << "                             address and exit\n";
    std::cout << "\nAny config file key may also be given as -key=value, for example\n";
    std::cout << "-port=8001 or -llm.enabled=1.\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Storage backend: " << db::BackendName() << "\n";
    std::cout << "Copyright (c) 2024 DADBS Developers\n";
    std::cout << "MIT License\n";
}

int RunDerive(const std::string& external) {
    try {
        std::cout << address::Derive(external) << std::endl;
        return 0;
    } catch (const address::AddressFormatError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

// ============================================================================
// Daemon Initialization
// ============================================================================

void SetupLogging(const node::NodeConfig& config, bool printToConsole) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    util::LogLevel level = util::ParseLogLevel(config.logLevel).value_or(util::LogLevel::Info);
    logger.SetLevel(level);

    if (printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useColors = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!config.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = config.logFile;
        fileConfig.level = level;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << config.logFile << std::endl;
        }
    }
}

std::string ResolveConfigPath(const util::ConfigManager& args) {
    if (auto conf = args.TryGetString(util::ConfigKeys::CONF)) {
        return util::ConfigManager::ExpandTilde(*conf);
    }
    std::filesystem::path dir = args.GetPath(util::ConfigKeys::DATADIR, ".");
    return (dir / util::DEFAULT_CONFIG_FILENAME).string();
}

/// Load the config file (or write a default one), then apply overrides
bool LoadConfiguration(const util::ConfigManager& args, node::NodeConfig& config) {
    std::string path = ResolveConfigPath(args);
    bool explicitConf = args.HasKey(util::ConfigKeys::CONF);

    std::error_code ec;
    if (!explicitConf && !std::filesystem::exists(path, ec)) {
        config = node::NodeConfig::Default();
        if (args.HasKey(util::ConfigKeys::DATADIR)) {
            config.storagePath = args.GetPath(util::ConfigKeys::DATADIR);
        }
        node::NodeConfigResult saved = node::SaveNodeConfig(config, path);
        if (!saved.ok()) {
            std::cerr << "Error: cannot write default config: " << saved.ToString() << std::endl;
            return false;
        }
        std::cout << "Wrote default configuration to " << path << std::endl;
    } else {
        node::NodeConfigResult loaded = node::LoadNodeConfig(path, config);
        if (!loaded.ok()) {
            std::cerr << "Error: " << path << ": " << loaded.ToString() << std::endl;
            return false;
        }
    }

    node::NodeConfigResult result = node::NodeConfigFromManager(args, config);
    if (!result.ok()) {
        std::cerr << "Error: " << result.ToString() << std::endl;
        return false;
    }
    if (args.HasKey(util::ConfigKeys::DATADIR)) {
        config.storagePath = args.GetPath(util::ConfigKeys::DATADIR);
    }

    result = node::ValidateNodeConfig(config);
    if (!result.ok()) {
        std::cerr << "Error: " << result.ToString() << std::endl;
        return false;
    }
    result = node::PrepareNodeStorage(config);
    if (!result.ok()) {
        std::cerr << "Error: " << result.ToString() << std::endl;
        return false;
    }
    return true;
}

bool InitializeNode(const node::NodeConfig& config) {
    std::filesystem::path dbPath =
        std::filesystem::path(config.storagePath) / defaults::ACCOUNTS_DB_NAME;

    auto [status, database] = db::OpenDatabase(dbPath);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot open account database "
                                              << dbPath.string() << ": " << status.ToString();
        return false;
    }
    g_accountsDb = std::move(database);

    g_host = std::make_unique<staking::DatabaseAccountHost>(*g_accountsDb);
    g_ledger = std::make_unique<staking::StakeLedger>(*g_host);

    // Validators are reached over the peer transport, which this node does
    // not run; they are registered without a client.
    g_registry = std::make_shared<consensus::StakeValidatorRegistry>(
        *g_ledger, [](const std::string& identity) {
            LOG_DEBUG(util::LogCategory::CONSENSUS) << "No transport for validator " << identity;
            return std::shared_ptr<consensus::IValidatorClient>();
        });

    g_consensus = std::make_unique<consensus::ConsensusManager>(g_registry, config);
    return true;
}

void LogStatus(const node::NodeConfig& config) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Node id: " << config.nodeId;
    LOG_INFO(util::LogCategory::DEFAULT) << "Listen address: " << config.host << ":" << config.port;
    LOG_INFO(util::LogCategory::DEFAULT) << "Storage: " << config.storagePath
                                         << " (" << db::BackendName() << ")";
    LOG_INFO(util::LogCategory::DEFAULT) << "Bootstrap nodes: " << config.bootstrapNodes.size();
    if (config.llm && config.llm->enabled) {
        LOG_INFO(util::LogCategory::DEFAULT) << "LLM model: " << config.llm->modelPath;
    }

    LOG_INFO(util::LogCategory::STAKE) << "Stake program: " << g_ledger->GetProgramId()
                                       << ", stakes: " << g_ledger->GetAllStakes().size()
                                       << ", total staked: " << g_ledger->GetTotalStaked();
    for (const auto& validator : g_registry->GetValidators()) {
        LOG_INFO(util::LogCategory::CONSENSUS) << validator.ToString();
    }
    LOG_INFO(util::LogCategory::CONSENSUS) << "Validators: " << g_registry->Size()
                                           << ", consensus timeout: "
                                           << util::FormatDurationMillis(
                                                  g_consensus->GetConsensusTimeout());
}

void WaitForShutdown() {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!g_shutdownRequested.load()) {
        g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
    }
}

void Shutdown() {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";

    g_consensus.reset();
    g_registry.reset();
    g_ledger.reset();
    g_host.reset();
    g_accountsDb.reset();

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Shutdown();
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager args;
    util::ConfigParseResult parsed = args.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << std::endl;
        return 1;
    }
    for (const auto& w : parsed.warnings) {
        std::cerr << "Warning: " << w << std::endl;
    }

    if (args.GetBool("help", false) || args.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (args.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (auto external = args.TryGetString(util::ConfigKeys::DERIVE)) {
        return RunDerive(*external);
    }

    if (!LoadConfiguration(args, g_config)) {
        return 1;
    }

    SetupLogging(g_config, args.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true));
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";

    SetupSignalHandlers();

    if (!InitializeNode(g_config)) {
        Shutdown();
        return 1;
    }

    LogStatus(g_config);
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " started";

    WaitForShutdown();
    Shutdown();
    return 0;
}

} // namespace dadbs

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return dadbs::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
