// DADBS - Consensus Manager
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Per-transaction admission. A transaction is accepted when, in order:
//
// 1. its Ed25519 signature verifies against the signer key
// 2. it is younger than the consensus timeout
// 3. strictly more than two thirds of the current validators confirm it
//    before the consensus deadline
//
// Every failure, including validator unavailability, yields false.

#ifndef DADBS_CONSENSUS_CONSENSUS_H
#define DADBS_CONSENSUS_CONSENSUS_H

#include <dadbs/consensus/transaction.h>
#include <dadbs/consensus/validator_registry.h>
#include <dadbs/core/types.h>
#include <dadbs/util/threadpool.h>
#include <dadbs/util/time.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace dadbs {

namespace node {
struct NodeConfig;
}

namespace consensus {

// ============================================================================
// Quorum Arithmetic
// ============================================================================

/// Confirmations must exceed this count
constexpr size_t QuorumThreshold(size_t validators) {
    return validators * 2 / 3;
}

/// k confirmations out of n validators; never true for n == 0
constexpr bool HasQuorum(size_t confirmations, size_t validators) {
    return confirmations > QuorumThreshold(validators);
}

// ============================================================================
// Consensus State
// ============================================================================

struct ConsensusState {
    /// Hash chain over accepted transactions
    Hash256 lastBlockHash;

    /// Validator set used by the most recent round
    std::vector<ValidatorInfo> validators;

    util::Milliseconds consensusTimeout{0};

    /// Unix milliseconds of the last acceptance (0 if none)
    int64_t lastConsensus{0};

    uint64_t roundsAccepted{0};
    uint64_t roundsRejected{0};
};

// ============================================================================
// Consensus Manager
// ============================================================================

struct ConsensusOptions {
    util::Milliseconds consensusTimeout{5000};

    /// Initial confirmation workers (0 = hardware concurrency); the pool
    /// grows so that a round never waits for a free worker
    size_t validatorThreads{0};

    /// Unix milliseconds; util::GetTimeMillis when empty
    std::function<int64_t()> clock;
};

class ConsensusManager {
public:
    ConsensusManager(std::shared_ptr<IValidatorRegistry> registry,
                     const ConsensusOptions& options);

    ConsensusManager(std::shared_ptr<IValidatorRegistry> registry,
                     const node::NodeConfig& config);

    ~ConsensusManager();

    ConsensusManager(const ConsensusManager&) = delete;
    ConsensusManager& operator=(const ConsensusManager&) = delete;

    /// Signature, then freshness, then quorum. Never throws.
    bool ValidateTransaction(const Transaction& tx);

    bool VerifySignature(const Transaction& tx) const;

    /// now - timestamp < timeout; timestamps in the future pass
    bool VerifyTimestamp(const Transaction& tx) const;

    /**
     * Ask every validator to confirm tx and return the confirmations seen
     * when the round closed. The round closes at the deadline, as soon as
     * quorum is reached, or once quorum can no longer be reached.
     */
    size_t CollectConfirmations(const Transaction& tx,
                                const std::vector<ValidatorInfo>& validators);

    ConsensusState GetState() const;

    util::Milliseconds GetConsensusTimeout() const { return timeout_; }

private:
    bool RunValidation(const Transaction& tx);

    int64_t Now() const;

    std::shared_ptr<IValidatorRegistry> registry_;
    const util::Milliseconds timeout_;
    std::function<int64_t()> clock_;

    util::ThreadPool pool_;

    mutable std::mutex stateMutex_;
    ConsensusState state_;
};

} // namespace consensus
} // namespace dadbs

#endif // DADBS_CONSENSUS_CONSENSUS_H
