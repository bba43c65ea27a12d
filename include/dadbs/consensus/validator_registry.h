// DADBS - Validator Registry
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// The validator set consulted by the consensus manager. A registry hands out
// snapshots; each validator carries the client used to ask it for a
// confirmation.

#ifndef DADBS_CONSENSUS_VALIDATOR_REGISTRY_H
#define DADBS_CONSENSUS_VALIDATOR_REGISTRY_H

#include <dadbs/consensus/transaction.h>
#include <dadbs/core/types.h>
#include <dadbs/staking/stake.h>
#include <dadbs/util/time.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dadbs {
namespace consensus {

/// Total active stake an owner needs to join the stake-backed validator set
constexpr Amount MIN_VALIDATOR_STAKE = 10 * BASE_UNITS_PER_TOKEN;

// ============================================================================
// Validator Client
// ============================================================================

/**
 * Capability to ask one validator to confirm a transaction. Implementations
 * should give up once timeout has elapsed; an exception counts as a refusal.
 */
class IValidatorClient {
public:
    virtual ~IValidatorClient() = default;

    virtual bool ConfirmTransaction(const Transaction& tx, util::Milliseconds timeout) = 0;
};

// ============================================================================
// Validator Info
// ============================================================================

struct ValidatorInfo {
    /// External address identifying the validator
    std::string identity;

    /// Derived internal address, for display and indexing
    std::string internalAddress;

    /// Backing stake in base units
    Amount stake{0};

    /// May be null, which counts as a validator that never confirms
    std::shared_ptr<IValidatorClient> client;

    std::string ToString() const;
};

// ============================================================================
// Registry Interface
// ============================================================================

class IValidatorRegistry {
public:
    virtual ~IValidatorRegistry() = default;

    /// Copy of the current validator set, ordered by identity
    virtual std::vector<ValidatorInfo> GetValidators() const = 0;

    virtual size_t Size() const = 0;
};

// ============================================================================
// Static Registry
// ============================================================================

/// Explicitly managed validator set
class StaticValidatorRegistry : public IValidatorRegistry {
public:
    /// Add a validator; false if identity is not a valid external address
    /// or is already registered
    bool AddValidator(const std::string& identity, Amount stake,
                      std::shared_ptr<IValidatorClient> client);

    bool RemoveValidator(const std::string& identity);

    void Clear();

    std::vector<ValidatorInfo> GetValidators() const override;

    size_t Size() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ValidatorInfo> validators_;
};

// ============================================================================
// Stake-backed Registry
// ============================================================================

/**
 * Validator set derived from the stake ledger. Every owner whose active
 * stakes sum to at least the minimum is one validator. The set is rebuilt
 * on construction and whenever the ledger reports a stake change.
 */
class StakeValidatorRegistry : public IValidatorRegistry {
public:
    /// Produces the client for a validator identity; may return null
    using ClientFactory =
        std::function<std::shared_ptr<IValidatorClient>(const std::string& identity)>;

    StakeValidatorRegistry(staking::StakeLedger& ledger, ClientFactory factory,
                           Amount minStake = MIN_VALIDATOR_STAKE);

    ~StakeValidatorRegistry() override;

    StakeValidatorRegistry(const StakeValidatorRegistry&) = delete;
    StakeValidatorRegistry& operator=(const StakeValidatorRegistry&) = delete;

    std::vector<ValidatorInfo> GetValidators() const override;

    size_t Size() const override;

    /// Rebuild the set from the ledger. Concurrent refreshes run one at a
    /// time, so the last one to finish reflects every committed change.
    void Refresh();

    Amount GetMinStake() const { return minStake_; }

private:
    staking::StakeLedger& ledger_;
    ClientFactory factory_;
    const Amount minStake_;
    size_t listenerId_{0};

    /// Held from reading the ledger until the new set is installed
    std::mutex refreshMutex_;

    mutable std::mutex mutex_;
    std::map<std::string, ValidatorInfo> validators_;
};

} // namespace consensus
} // namespace dadbs

#endif // DADBS_CONSENSUS_VALIDATOR_REGISTRY_H
