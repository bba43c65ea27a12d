// DADBS - Validator Registry Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/consensus/validator_registry.h>
#include <dadbs/address/address.h>
#include <dadbs/util/logging.h>

#include <sstream>

namespace dadbs {
namespace consensus {

std::string ValidatorInfo::ToString() const {
    std::ostringstream ss;
    ss << "Validator(" << identity << ", " << internalAddress
       << ", stake=" << stake << (client ? "" : ", no client") << ")";
    return ss.str();
}

// ============================================================================
// StaticValidatorRegistry
// ============================================================================

bool StaticValidatorRegistry::AddValidator(const std::string& identity, Amount stake,
                                           std::shared_ptr<IValidatorClient> client) {
    if (!address::IsValidExternalAddress(identity)) {
        return false;
    }

    ValidatorInfo info;
    info.identity = identity;
    info.internalAddress = address::Derive(identity).ToString();
    info.stake = stake;
    info.client = std::move(client);

    std::lock_guard<std::mutex> lock(mutex_);
    return validators_.emplace(identity, std::move(info)).second;
}

bool StaticValidatorRegistry::RemoveValidator(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return validators_.erase(identity) > 0;
}

void StaticValidatorRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    validators_.clear();
}

std::vector<ValidatorInfo> StaticValidatorRegistry::GetValidators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ValidatorInfo> result;
    result.reserve(validators_.size());
    for (const auto& entry : validators_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t StaticValidatorRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validators_.size();
}

// ============================================================================
// StakeValidatorRegistry
// ============================================================================

StakeValidatorRegistry::StakeValidatorRegistry(staking::StakeLedger& ledger,
                                               ClientFactory factory,
                                               Amount minStake)
    : ledger_(ledger), factory_(std::move(factory)), minStake_(minStake) {
    // Listen first so a change committed during the initial build is not lost
    listenerId_ = ledger_.AddListener(
        [this](const std::string&, const staking::StakeAccount&) { Refresh(); });
    try {
        Refresh();
    } catch (...) {
        ledger_.RemoveListener(listenerId_);
        throw;
    }
}

StakeValidatorRegistry::~StakeValidatorRegistry() {
    ledger_.RemoveListener(listenerId_);
}

void StakeValidatorRegistry::Refresh() {
    std::lock_guard<std::mutex> refreshLock(refreshMutex_);

    std::map<std::string, Amount> stakeByOwner;
    for (const auto& entry : ledger_.GetAllStakes()) {
        const staking::StakeAccount& stake = entry.second;
        if (!stake.isActive) {
            continue;
        }
        Amount& total = stakeByOwner[stake.owner];
        if (AddWouldOverflow(total, stake.amount)) {
            total = UINT64_MAX;
        } else {
            total += stake.amount;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, ValidatorInfo> updated;
    for (const auto& entry : stakeByOwner) {
        if (entry.second < minStake_) {
            continue;
        }

        ValidatorInfo info;
        info.identity = entry.first;
        info.internalAddress = address::Derive(entry.first).ToString();
        info.stake = entry.second;

        auto existing = validators_.find(entry.first);
        if (existing != validators_.end()) {
            info.client = existing->second.client;
        } else if (factory_) {
            info.client = factory_(entry.first);
        }
        updated.emplace(entry.first, std::move(info));
    }

    if (updated.size() != validators_.size()) {
        LOG_INFO(util::LogCategory::CONSENSUS) << "Validator set now has "
                                               << updated.size() << " members";
    }
    validators_.swap(updated);
}

std::vector<ValidatorInfo> StakeValidatorRegistry::GetValidators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ValidatorInfo> result;
    result.reserve(validators_.size());
    for (const auto& entry : validators_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t StakeValidatorRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validators_.size();
}

} // namespace consensus
} // namespace dadbs
