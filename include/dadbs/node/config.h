// DADBS - Node Configuration
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Typed node settings loaded from an INI file through util::ConfigManager.
//
// Example dadbs.conf:
//
//   nodeid=6f1c0a52-3c5e-4b8e-9b35-0b1f9f6a2e11
//   host=127.0.0.1
//   port=8000
//   storagepath=./data
//   consensustimeout=5000
//   bootstrapnode=testnet.dadbs.io:8000
//   bootstrapnode=testnet2.dadbs.io:8000
//
//   [llm]
//   enabled=1
//   modelpath=/opt/models/model.bin
//   tokenizerpath=/opt/models/tokenizer.json

#ifndef DADBS_NODE_CONFIG_H
#define DADBS_NODE_CONFIG_H

#include <dadbs/util/config.h>
#include <dadbs/util/time.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dadbs {
namespace node {

// ============================================================================
// Defaults
// ============================================================================

namespace defaults {
    constexpr const char* HOST = "127.0.0.1";
    constexpr int64_t PORT = 8000;
    constexpr const char* STORAGE_PATH = "./data";
    constexpr uint32_t MAX_CONNECTIONS = 50;
    constexpr uint64_t CONSENSUS_TIMEOUT_MS = 5000;
    constexpr const char* LOG_LEVEL = "info";
    constexpr const char* BOOTSTRAP_NODES[] = {
        "testnet.dadbs.io:8000",
        "testnet2.dadbs.io:8000",
    };

    /// Warning thresholds
    constexpr int64_t PRIVILEGED_PORT_LIMIT = 1024;
    constexpr uint32_t MAX_CONNECTIONS_WARN = 1000;
    constexpr uint64_t CONSENSUS_TIMEOUT_WARN_MS = 1000;
}

// ============================================================================
// Configuration Structures
// ============================================================================

struct LlmConfig {
    bool enabled{false};
    std::string modelPath;
    std::string tokenizerPath;
    uint32_t maxBatchSize{1};
    bool useGpu{false};
};

struct NodeConfig {
    /// Random UUID unless configured
    std::string nodeId;

    std::string host{defaults::HOST};

    /// Listen port (0-65535)
    int64_t port{defaults::PORT};

    std::string storagePath{defaults::STORAGE_PATH};

    uint32_t maxConnections{defaults::MAX_CONNECTIONS};

    uint64_t consensusTimeoutMs{defaults::CONSENSUS_TIMEOUT_MS};

    /// Confirmation worker threads (0 = hardware concurrency)
    uint32_t validatorThreads{0};

    /// host:port entries
    std::vector<std::string> bootstrapNodes;

    std::string logLevel{defaults::LOG_LEVEL};

    /// Empty for no log file
    std::string logFile;

    /// Present only when the [llm] section exists
    std::optional<LlmConfig> llm;

    /// Defaults with a fresh node id and the default bootstrap nodes
    static NodeConfig Default();

    util::Milliseconds ConsensusTimeout() const {
        return util::Milliseconds(static_cast<int64_t>(consensusTimeoutMs));
    }
};

// ============================================================================
// Results
// ============================================================================

enum class NodeConfigError {
    None,
    Io,
    Parse,
    InvalidAddress,
    InvalidBootstrapNode,
    StoragePath,
};

const char* NodeConfigErrorToString(NodeConfigError error);

struct NodeConfigResult {
    NodeConfigError error{NodeConfigError::None};
    std::string message;
    std::vector<std::string> warnings;

    bool ok() const { return error == NodeConfigError::None; }

    static NodeConfigResult Success() { return NodeConfigResult(); }

    static NodeConfigResult Error(NodeConfigError error, const std::string& msg) {
        NodeConfigResult r;
        r.error = error;
        r.message = msg;
        return r;
    }

    std::string ToString() const;
};

// ============================================================================
// Functions
// ============================================================================

/// Random RFC 4122 version 4 UUID
std::string GenerateNodeId();

/// Hostname (RFC 1123 labels) or IPv4/IPv6 literal; no resolution
bool IsValidHost(const std::string& host);

/// Split "host:port" (IPv6 hosts in brackets); port must be 1-65535
bool ParseHostPort(const std::string& str, std::string& host, uint16_t& port);

/**
 * Fill out from parsed settings. Keys that are absent keep the values
 * already in out. Fails with Parse on malformed numbers, booleans or log
 * levels.
 */
NodeConfigResult NodeConfigFromManager(const util::ConfigManager& manager, NodeConfig& out);

/// Render as a ConfigManager holding every field
util::ConfigManager NodeConfigToManager(const NodeConfig& config);

/// Check addresses, bootstrap nodes and storage path; warnings are logged
NodeConfigResult ValidateNodeConfig(const NodeConfig& config);

/// Create the storage directory and check the LLM files when enabled
NodeConfigResult PrepareNodeStorage(const NodeConfig& config);

/// Read, parse, validate and prepare storage
NodeConfigResult LoadNodeConfig(const std::string& path, NodeConfig& out);

/// Validate, create parent directories and write INI text
NodeConfigResult SaveNodeConfig(const NodeConfig& config, const std::string& path);

} // namespace node
} // namespace dadbs

#endif // DADBS_NODE_CONFIG_H
