// DADBS - Node Configuration Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/node/config.h>
#include <dadbs/core/hex.h>
#include <dadbs/crypto/ed25519.h>
#include <dadbs/util/logging.h>

#include <arpa/inet.h>

#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dadbs {
namespace node {

namespace fs = std::filesystem;

namespace {

constexpr size_t MAX_HOSTNAME_LENGTH = 253;
constexpr size_t MAX_LABEL_LENGTH = 63;

bool IsValidHostname(const std::string& host) {
    if (host.empty() || host.size() > MAX_HOSTNAME_LENGTH) {
        return false;
    }

    size_t start = 0;
    while (start <= host.size()) {
        size_t dot = host.find('.', start);
        size_t end = dot == std::string::npos ? host.size() : dot;
        size_t len = end - start;

        if (len == 0 || len > MAX_LABEL_LENGTH) {
            return false;
        }
        if (host[start] == '-' || host[end - 1] == '-') {
            return false;
        }
        for (size_t i = start; i < end; ++i) {
            unsigned char c = static_cast<unsigned char>(host[i]);
            if (!std::isalnum(c) && c != '-') {
                return false;
            }
        }

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

bool IsIpLiteral(const std::string& host) {
    std::array<unsigned char, 16> buf{};
    return inet_pton(AF_INET, host.c_str(), buf.data()) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf.data()) == 1;
}

NodeConfigResult ParseError(const std::string& key, const std::string& expected) {
    return NodeConfigResult::Error(NodeConfigError::Parse,
                                   "invalid value for '" + key + "': expected " + expected);
}

} // namespace

// ============================================================================
// NodeConfig
// ============================================================================

NodeConfig NodeConfig::Default() {
    NodeConfig config;
    config.nodeId = GenerateNodeId();
    for (const char* node : defaults::BOOTSTRAP_NODES) {
        config.bootstrapNodes.emplace_back(node);
    }
    return config;
}

const char* NodeConfigErrorToString(NodeConfigError error) {
    switch (error) {
        case NodeConfigError::None: return "None";
        case NodeConfigError::Io: return "Io";
        case NodeConfigError::Parse: return "Parse";
        case NodeConfigError::InvalidAddress: return "InvalidAddress";
        case NodeConfigError::InvalidBootstrapNode: return "InvalidBootstrapNode";
        case NodeConfigError::StoragePath: return "StoragePath";
    }
    return "Unknown";
}

std::string NodeConfigResult::ToString() const {
    if (ok()) {
        return "OK";
    }
    return std::string(NodeConfigErrorToString(error)) + ": " + message;
}

// ============================================================================
// Helpers
// ============================================================================

std::string GenerateNodeId() {
    std::array<uint8_t, 16> bytes;
    crypto::GetRandBytes(bytes.data(), bytes.size());

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

    std::string hex = BytesToHex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool IsValidHost(const std::string& host) {
    return IsIpLiteral(host) || IsValidHostname(host);
}

bool ParseHostPort(const std::string& str, std::string& host, uint16_t& port) {
    std::string hostPart;
    std::string portPart;

    if (!str.empty() && str[0] == '[') {
        size_t close = str.find(']');
        if (close == std::string::npos || close + 1 >= str.size() || str[close + 1] != ':') {
            return false;
        }
        hostPart = str.substr(1, close - 1);
        portPart = str.substr(close + 2);
        std::array<unsigned char, 16> buf{};
        if (inet_pton(AF_INET6, hostPart.c_str(), buf.data()) != 1) {
            return false;
        }
    } else {
        size_t colon = str.rfind(':');
        if (colon == std::string::npos || str.find(':') != colon) {
            return false;
        }
        hostPart = str.substr(0, colon);
        portPart = str.substr(colon + 1);
        if (!IsValidHost(hostPart)) {
            return false;
        }
    }

    if (portPart.empty() || portPart.size() > 5) {
        return false;
    }
    uint32_t value = 0;
    for (char c : portPart) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return false;
    }

    host = hostPart;
    port = static_cast<uint16_t>(value);
    return true;
}

// ============================================================================
// ConfigManager Conversion
// ============================================================================

NodeConfigResult NodeConfigFromManager(const util::ConfigManager& manager, NodeConfig& out) {
    using namespace util::ConfigKeys;

    NodeConfig config = out;

    if (auto v = manager.TryGetString(NODEID)) {
        config.nodeId = *v;
    }
    if (auto v = manager.TryGetString(HOST)) {
        config.host = *v;
    }
    if (manager.HasKey(PORT)) {
        auto v = manager.TryGetInt(PORT);
        if (!v) {
            return ParseError(PORT, "an integer");
        }
        config.port = *v;
    }
    if (manager.HasKey(STORAGEPATH)) {
        config.storagePath = manager.GetPath(STORAGEPATH);
    }
    if (manager.HasKey(MAXCONNECTIONS)) {
        auto v = manager.TryGetUInt(MAXCONNECTIONS);
        if (!v || *v > UINT32_MAX) {
            return ParseError(MAXCONNECTIONS, "an unsigned 32-bit integer");
        }
        config.maxConnections = static_cast<uint32_t>(*v);
    }
    if (manager.HasKey(CONSENSUSTIMEOUT)) {
        auto v = manager.TryGetUInt(CONSENSUSTIMEOUT);
        if (!v || *v > static_cast<uint64_t>(INT64_MAX)) {
            return ParseError(CONSENSUSTIMEOUT, "milliseconds");
        }
        config.consensusTimeoutMs = *v;
    }
    if (manager.HasKey(VALIDATORTHREADS)) {
        auto v = manager.TryGetUInt(VALIDATORTHREADS);
        if (!v || *v > UINT32_MAX) {
            return ParseError(VALIDATORTHREADS, "a thread count");
        }
        config.validatorThreads = static_cast<uint32_t>(*v);
    }
    if (manager.HasKey(BOOTSTRAPNODE)) {
        config.bootstrapNodes = manager.GetList(BOOTSTRAPNODE);
    }
    if (auto v = manager.TryGetString(LOGLEVEL)) {
        if (!util::ParseLogLevel(*v)) {
            return ParseError(LOGLEVEL, "trace, debug, info, warn, error, fatal or off");
        }
        config.logLevel = *v;
    }
    if (manager.HasKey(LOGFILE)) {
        config.logFile = manager.GetPath(LOGFILE);
    }

    if (manager.HasSection(LLM_SECTION)) {
        LlmConfig llm = config.llm.value_or(LlmConfig{});
        if (manager.HasKey(LLM_ENABLED, LLM_SECTION)) {
            auto v = manager.TryGetBool(LLM_ENABLED, LLM_SECTION);
            if (!v) {
                return ParseError("llm.enabled", "a boolean");
            }
            llm.enabled = *v;
        }
        if (manager.HasKey(LLM_MODELPATH, LLM_SECTION)) {
            llm.modelPath = manager.GetPath(LLM_MODELPATH, "", LLM_SECTION);
        }
        if (manager.HasKey(LLM_TOKENIZERPATH, LLM_SECTION)) {
            llm.tokenizerPath = manager.GetPath(LLM_TOKENIZERPATH, "", LLM_SECTION);
        }
        if (manager.HasKey(LLM_MAXBATCHSIZE, LLM_SECTION)) {
            auto v = manager.TryGetUInt(LLM_MAXBATCHSIZE, LLM_SECTION);
            if (!v || *v == 0 || *v > UINT32_MAX) {
                return ParseError("llm.maxbatchsize", "a positive integer");
            }
            llm.maxBatchSize = static_cast<uint32_t>(*v);
        }
        if (manager.HasKey(LLM_USEGPU, LLM_SECTION)) {
            auto v = manager.TryGetBool(LLM_USEGPU, LLM_SECTION);
            if (!v) {
                return ParseError("llm.usegpu", "a boolean");
            }
            llm.useGpu = *v;
        }
        config.llm = llm;
    }

    out = std::move(config);
    return NodeConfigResult::Success();
}

util::ConfigManager NodeConfigToManager(const NodeConfig& config) {
    using namespace util::ConfigKeys;

    util::ConfigManager manager;
    manager.Set(NODEID, config.nodeId);
    manager.Set(HOST, config.host);
    manager.Set(PORT, std::to_string(config.port));
    manager.Set(STORAGEPATH, config.storagePath);
    manager.Set(MAXCONNECTIONS, std::to_string(config.maxConnections));
    manager.Set(CONSENSUSTIMEOUT, std::to_string(config.consensusTimeoutMs));
    manager.Set(VALIDATORTHREADS, std::to_string(config.validatorThreads));
    for (const auto& node : config.bootstrapNodes) {
        manager.AddToList(BOOTSTRAPNODE, node);
    }
    manager.Set(LOGLEVEL, config.logLevel);
    if (!config.logFile.empty()) {
        manager.Set(LOGFILE, config.logFile);
    }

    if (config.llm) {
        const LlmConfig& llm = *config.llm;
        manager.Set(LLM_ENABLED, llm.enabled ? "1" : "0", LLM_SECTION);
        manager.Set(LLM_MODELPATH, llm.modelPath, LLM_SECTION);
        manager.Set(LLM_TOKENIZERPATH, llm.tokenizerPath, LLM_SECTION);
        manager.Set(LLM_MAXBATCHSIZE, std::to_string(llm.maxBatchSize), LLM_SECTION);
        manager.Set(LLM_USEGPU, llm.useGpu ? "1" : "0", LLM_SECTION);
    }
    return manager;
}

// ============================================================================
// Validation
// ============================================================================

NodeConfigResult ValidateNodeConfig(const NodeConfig& config) {
    std::vector<std::string> warnings;
    if (config.port > 0 && config.port < defaults::PRIVILEGED_PORT_LIMIT) {
        warnings.push_back("port " + std::to_string(config.port) +
                           " is privileged and may require root");
    }
    if (config.maxConnections > defaults::MAX_CONNECTIONS_WARN) {
        warnings.push_back("maxconnections " + std::to_string(config.maxConnections) +
                           " is unusually high");
    }
    if (config.consensusTimeoutMs < defaults::CONSENSUS_TIMEOUT_WARN_MS) {
        warnings.push_back("consensustimeout " + std::to_string(config.consensusTimeoutMs) +
                           "ms is very short");
    }
    for (const auto& w : warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << w;
    }

    NodeConfigResult result;
    if (config.host.empty() || !IsValidHost(config.host)) {
        result = NodeConfigResult::Error(NodeConfigError::InvalidAddress,
                                         "invalid host '" + config.host + "'");
    } else if (config.port < 0 || config.port > 65535) {
        result = NodeConfigResult::Error(NodeConfigError::InvalidAddress,
                                         "port " + std::to_string(config.port) +
                                         " out of range");
    } else {
        for (const auto& node : config.bootstrapNodes) {
            std::string host;
            uint16_t port = 0;
            if (!ParseHostPort(node, host, port)) {
                result = NodeConfigResult::Error(NodeConfigError::InvalidBootstrapNode,
                                                 "invalid bootstrap node '" + node + "'");
                break;
            }
        }
    }

    if (result.ok()) {
        std::error_code ec;
        if (config.storagePath.empty()) {
            result = NodeConfigResult::Error(NodeConfigError::StoragePath,
                                             "empty storage path");
        } else if (fs::exists(config.storagePath, ec) &&
                   !fs::is_directory(config.storagePath, ec)) {
            result = NodeConfigResult::Error(NodeConfigError::StoragePath,
                                             config.storagePath + " is not a directory");
        }
    }

    result.warnings = std::move(warnings);
    return result;
}

NodeConfigResult PrepareNodeStorage(const NodeConfig& config) {
    std::error_code ec;
    fs::create_directories(config.storagePath, ec);
    if (ec) {
        return NodeConfigResult::Error(NodeConfigError::StoragePath,
                                       "cannot create " + config.storagePath + ": " +
                                       ec.message());
    }

    if (config.llm && config.llm->enabled) {
        for (const std::string* path : {&config.llm->modelPath, &config.llm->tokenizerPath}) {
            if (path->empty() || !fs::is_regular_file(*path, ec)) {
                return NodeConfigResult::Error(NodeConfigError::Io,
                                               "LLM file not found: '" + *path + "'");
            }
        }
    }
    return NodeConfigResult::Success();
}

// ============================================================================
// Load / Save
// ============================================================================

NodeConfigResult LoadNodeConfig(const std::string& path, NodeConfig& out) {
    util::ConfigManager manager;
    util::ConfigParseResult parsed = manager.ParseFile(path);
    if (!parsed.success) {
        NodeConfigError kind = parsed.errorLine > 0 ? NodeConfigError::Parse
                                                    : NodeConfigError::Io;
        std::string msg = parsed.errorMessage;
        if (parsed.errorLine > 0) {
            msg += " (" + parsed.errorFile + ":" + std::to_string(parsed.errorLine) + ")";
        }
        return NodeConfigResult::Error(kind, msg);
    }

    NodeConfig config = NodeConfig::Default();
    NodeConfigResult result = NodeConfigFromManager(manager, config);
    if (!result.ok()) {
        return result;
    }

    result = ValidateNodeConfig(config);
    if (!result.ok()) {
        return result;
    }
    std::vector<std::string> warnings = std::move(result.warnings);
    for (const auto& w : parsed.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << w;
        warnings.push_back(w);
    }

    result = PrepareNodeStorage(config);
    result.warnings = std::move(warnings);
    if (!result.ok()) {
        return result;
    }

    LOG_INFO(util::LogCategory::CONFIG) << "Loaded node config " << path
                                        << " (node " << config.nodeId << ")";
    out = std::move(config);
    return result;
}

NodeConfigResult SaveNodeConfig(const NodeConfig& config, const std::string& path) {
    NodeConfigResult result = ValidateNodeConfig(config);
    if (!result.ok()) {
        return result;
    }

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return NodeConfigResult::Error(NodeConfigError::Io,
                                           "cannot create " + parent.string() + ": " +
                                           ec.message());
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return NodeConfigResult::Error(NodeConfigError::Io, "cannot open " + path);
    }
    file << "# DADBS node configuration\n";
    file << NodeConfigToManager(config).ToIniString();
    file.flush();
    if (!file) {
        return NodeConfigResult::Error(NodeConfigError::Io, "write failed for " + path);
    }
    return result;
}

} // namespace node
} // namespace dadbs
