// DADBS - Consensus Manager Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/consensus/consensus.h>
#include <dadbs/crypto/sha256.h>
#include <dadbs/node/config.h>
#include <dadbs/util/logging.h>

#include <condition_variable>
#include <exception>
#include <stdexcept>

namespace dadbs {
namespace consensus {

namespace {

util::ThreadPool::Config MakePoolConfig(size_t threads) {
    util::ThreadPool::Config config;
    config.numThreads = threads;
    config.name = "validators";
    return config;
}

ConsensusOptions OptionsFromNodeConfig(const node::NodeConfig& config) {
    ConsensusOptions options;
    options.consensusTimeout = config.ConsensusTimeout();
    options.validatorThreads = config.validatorThreads;
    return options;
}

/// Shared by the collecting thread and the confirmation tasks; outlives
/// whichever finishes last
struct Round {
    std::mutex mutex;
    std::condition_variable cv;
    size_t confirmations{0};
    size_t refusals{0};
    bool closed{false};
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

ConsensusManager::ConsensusManager(std::shared_ptr<IValidatorRegistry> registry,
                                   const ConsensusOptions& options)
    : registry_(std::move(registry)),
      timeout_(options.consensusTimeout),
      clock_(options.clock),
      pool_(MakePoolConfig(options.validatorThreads)) {
    if (!registry_) {
        throw std::invalid_argument("ConsensusManager requires a validator registry");
    }
    state_.consensusTimeout = timeout_;
}

ConsensusManager::ConsensusManager(std::shared_ptr<IValidatorRegistry> registry,
                                   const node::NodeConfig& config)
    : ConsensusManager(std::move(registry), OptionsFromNodeConfig(config)) {}

ConsensusManager::~ConsensusManager() {
    pool_.Shutdown();
}

int64_t ConsensusManager::Now() const {
    return clock_ ? clock_() : util::GetTimeMillis();
}

// ============================================================================
// Checks
// ============================================================================

bool ConsensusManager::VerifySignature(const Transaction& tx) const {
    return tx.VerifySignature();
}

bool ConsensusManager::VerifyTimestamp(const Transaction& tx) const {
    int64_t now = Now();
    if (tx.timestamp >= now) {
        return true;
    }
    uint64_t age = static_cast<uint64_t>(now) - static_cast<uint64_t>(tx.timestamp);
    return age < static_cast<uint64_t>(timeout_.count());
}

size_t ConsensusManager::CollectConfirmations(const Transaction& tx,
                                              const std::vector<ValidatorInfo>& validators) {
    const size_t n = validators.size();
    if (n == 0) {
        return 0;
    }

    auto round = std::make_shared<Round>();
    auto shared = std::make_shared<const Transaction>(tx);
    util::DeadlineTimer deadline(timeout_);

    // Every validator is queried at once, even while workers are still held
    // by queries abandoned in earlier rounds
    pool_.Reserve(n);

    for (const auto& validator : validators) {
        std::shared_ptr<IValidatorClient> client = validator.client;
        std::string identity = validator.identity;

        auto task = [round, shared, client, identity, deadline]() {
            {
                std::lock_guard<std::mutex> lock(round->mutex);
                if (round->closed) {
                    return;
                }
            }

            bool confirmed = false;
            util::Milliseconds remaining = deadline.Remaining();
            if (client && remaining.count() > 0) {
                try {
                    confirmed = client->ConfirmTransaction(*shared, remaining);
                } catch (const std::exception& e) {
                    LOG_WARN(util::LogCategory::CONSENSUS) << "Validator " << identity
                                                           << " failed: " << e.what();
                }
            }

            std::lock_guard<std::mutex> lock(round->mutex);
            if (confirmed) {
                ++round->confirmations;
            } else {
                ++round->refusals;
            }
            round->cv.notify_all();
        };

        try {
            pool_.Execute(std::move(task));
        } catch (const std::runtime_error& e) {
            LOG_ERROR(util::LogCategory::CONSENSUS) << "Cannot query validator " << identity
                                                    << ": " << e.what();
            std::lock_guard<std::mutex> lock(round->mutex);
            ++round->refusals;
        }
    }

    std::unique_lock<std::mutex> lock(round->mutex);
    round->cv.wait_until(lock, deadline.GetDeadline(), [&] {
        return HasQuorum(round->confirmations, n) ||
               n - round->refusals <= QuorumThreshold(n) ||
               round->confirmations + round->refusals == n;
    });
    round->closed = true;

    LOG_DEBUG(util::LogCategory::CONSENSUS) << "Round closed: " << round->confirmations
                                            << " confirmed, " << round->refusals
                                            << " refused, " << n << " validators";
    return round->confirmations;
}

// ============================================================================
// Validation
// ============================================================================

bool ConsensusManager::RunValidation(const Transaction& tx) {
    if (!VerifySignature(tx)) {
        LOG_DEBUG(util::LogCategory::CONSENSUS) << "Rejected " << tx.GetHash().ToHex()
                                                << ": bad signature";
        return false;
    }
    if (!VerifyTimestamp(tx)) {
        LOG_DEBUG(util::LogCategory::CONSENSUS) << "Rejected " << tx.GetHash().ToHex()
                                                << ": stale timestamp " << tx.timestamp;
        return false;
    }

    std::vector<ValidatorInfo> validators = registry_->GetValidators();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_.validators = validators;
    }

    if (validators.empty()) {
        LOG_WARN(util::LogCategory::CONSENSUS) << "Rejected " << tx.GetHash().ToHex()
                                               << ": empty validator set";
        return false;
    }

    size_t confirmations = CollectConfirmations(tx, validators);
    if (!HasQuorum(confirmations, validators.size())) {
        LOG_INFO(util::LogCategory::CONSENSUS) << "Rejected " << tx.GetHash().ToHex()
                                               << ": " << confirmations << "/"
                                               << validators.size() << " confirmations";
        return false;
    }

    Hash256 txHash = tx.GetHash();
    std::lock_guard<std::mutex> lock(stateMutex_);
    crypto::SHA256 hasher;
    hasher.Write(state_.lastBlockHash);
    hasher.Write(txHash);
    state_.lastBlockHash = hasher.Finalize();
    state_.lastConsensus = Now();

    LOG_INFO(util::LogCategory::CONSENSUS) << "Accepted " << txHash.ToHex() << " with "
                                           << confirmations << "/" << validators.size()
                                           << " confirmations";
    return true;
}

bool ConsensusManager::ValidateTransaction(const Transaction& tx) {
    bool accepted = false;
    try {
        accepted = RunValidation(tx);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::CONSENSUS) << "Validation aborted: " << e.what();
        accepted = false;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (accepted) {
        ++state_.roundsAccepted;
    } else {
        ++state_.roundsRejected;
    }
    return accepted;
}

ConsensusState ConsensusManager::GetState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

} // namespace consensus
} // namespace dadbs
