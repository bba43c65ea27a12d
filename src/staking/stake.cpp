// DADBS - Stake Ledger Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/staking/stake.h>
#include <dadbs/address/address.h>
#include <dadbs/core/serialize.h>
#include <dadbs/util/logging.h>

#include <sstream>
#include <stdexcept>

namespace dadbs {
namespace staking {

// ============================================================================
// StakeAccount
// ============================================================================

std::vector<Byte> StakeAccount::Serialize() const {
    if (owner.size() != STAKE_OWNER_SIZE) {
        throw std::invalid_argument("stake owner must be " +
                                    std::to_string(STAKE_OWNER_SIZE) + " bytes");
    }

    DataStream s;
    ser_writedata8(s, STAKE_RECORD_VERSION);
    s.Write(owner.data(), owner.size());
    ser_writedata64(s, amount);
    ser_writedata64(s, static_cast<uint64_t>(lockedUntil));
    ser_writedata8(s, isActive ? 1 : 0);
    return s.Release();
}

std::optional<StakeAccount> StakeAccount::Deserialize(const Byte* data, size_t len) {
    if (len != STAKE_RECORD_SIZE) {
        return std::nullopt;
    }

    DataStream s(data, len);
    if (ser_readdata8(s) != STAKE_RECORD_VERSION) {
        return std::nullopt;
    }

    StakeAccount stake;
    stake.owner.resize(STAKE_OWNER_SIZE);
    s.Read(&stake.owner[0], STAKE_OWNER_SIZE);
    if (!address::IsValidExternalAddress(stake.owner)) {
        return std::nullopt;
    }
    stake.amount = ser_readdata64(s);
    stake.lockedUntil = static_cast<int64_t>(ser_readdata64(s));

    uint8_t active = ser_readdata8(s);
    if (active > 1) {
        return std::nullopt;
    }
    stake.isActive = active == 1;
    return stake;
}

std::string StakeAccount::ToString() const {
    std::ostringstream ss;
    ss << "StakeAccount(owner=" << owner
       << ", amount=" << amount
       << ", lockedUntil=" << lockedUntil
       << ", active=" << (isActive ? "yes" : "no") << ")";
    return ss.str();
}

// ============================================================================
// StakeInstruction
// ============================================================================

const char* StakeInstructionTypeToString(StakeInstructionType type) {
    switch (type) {
        case StakeInstructionType::CreateStake: return "CreateStake";
        case StakeInstructionType::Withdraw: return "Withdraw";
    }
    return "Unknown";
}

StakeInstruction StakeInstruction::CreateStake(Amount amount, int64_t lockPeriod) {
    StakeInstruction ix;
    ix.type = StakeInstructionType::CreateStake;
    ix.amount = amount;
    ix.lockPeriod = lockPeriod;
    return ix;
}

StakeInstruction StakeInstruction::Withdraw(Amount amount) {
    StakeInstruction ix;
    ix.type = StakeInstructionType::Withdraw;
    ix.amount = amount;
    return ix;
}

std::vector<Byte> StakeInstruction::Serialize() const {
    DataStream s;
    ser_writedata8(s, STAKE_INSTRUCTION_VERSION);
    ser_writedata8(s, static_cast<uint8_t>(type));
    ser_writedata64(s, amount);
    if (type == StakeInstructionType::CreateStake) {
        ser_writedata64(s, static_cast<uint64_t>(lockPeriod));
    }
    return s.Release();
}

std::optional<StakeInstruction> StakeInstruction::Deserialize(const Byte* data, size_t len) {
    if (len < 2 || data[0] != STAKE_INSTRUCTION_VERSION) {
        return std::nullopt;
    }

    DataStream s(data + 2, len - 2);
    switch (data[1]) {
        case static_cast<uint8_t>(StakeInstructionType::CreateStake): {
            if (s.size() != 16) {
                return std::nullopt;
            }
            Amount amount = ser_readdata64(s);
            int64_t lockPeriod = static_cast<int64_t>(ser_readdata64(s));
            return CreateStake(amount, lockPeriod);
        }
        case static_cast<uint8_t>(StakeInstructionType::Withdraw): {
            if (s.size() != 8) {
                return std::nullopt;
            }
            return Withdraw(ser_readdata64(s));
        }
        default:
            return std::nullopt;
    }
}

// ============================================================================
// StakeStatus
// ============================================================================

const char* StakeStatusCodeToString(StakeStatus::Code code) {
    switch (code) {
        case StakeStatus::OK: return "OK";
        case StakeStatus::ARGUMENT_ERROR: return "ArgumentError";
        case StakeStatus::PERMISSION_DENIED: return "PermissionDenied";
        case StakeStatus::STILL_LOCKED: return "StillLocked";
        case StakeStatus::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case StakeStatus::OWNERSHIP_ERROR: return "OwnershipError";
        case StakeStatus::INVALID_INSTRUCTION: return "InvalidInstruction";
        case StakeStatus::INVALID_ACCOUNT_DATA: return "InvalidAccountData";
        case StakeStatus::ACCOUNT_NOT_FOUND: return "AccountNotFound";
        case StakeStatus::HOST_ERROR: return "HostError";
    }
    return "Unknown";
}

std::string StakeStatus::ToString() const {
    std::string result = StakeStatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

// ============================================================================
// StakeLedger
// ============================================================================

StakeLedger::StakeLedger(IAccountHost& host, std::string programId)
    : host_(host), programId_(std::move(programId)) {}

StakeStatus StakeLedger::MapHostError(const HostStatus& status) {
    if (status.code() == HostStatus::INSUFFICIENT_LAMPORTS) {
        return StakeStatus(StakeStatus::INSUFFICIENT_FUNDS, status.message());
    }
    return StakeStatus(StakeStatus::HOST_ERROR, status.ToString());
}

StakeStatus StakeLedger::CreateStake(const std::string& staker,
                                     const std::string& stakeAccount,
                                     Amount amount, int64_t lockPeriod,
                                     StakeAccount* created) {
    return CreateStakeSigned({staker}, staker, stakeAccount, amount, lockPeriod, created);
}

StakeStatus StakeLedger::Withdraw(const std::string& stakeAccount,
                                  const std::string& requester,
                                  Amount amount, StakeAccount* updated) {
    return WithdrawSigned({requester}, stakeAccount, requester, amount, updated);
}

StakeStatus StakeLedger::CreateStakeSigned(const SignerSet& signers,
                                           const std::string& staker,
                                           const std::string& stakeAccount,
                                           Amount amount, int64_t lockPeriod,
                                           StakeAccount* created) {
    if (!address::IsValidExternalAddress(staker)) {
        return StakeStatus(StakeStatus::ARGUMENT_ERROR, "invalid staker address");
    }
    if (signers.count(staker) == 0) {
        return StakeStatus(StakeStatus::PERMISSION_DENIED, staker + " did not sign");
    }
    if (stakeAccount.empty()) {
        return StakeStatus(StakeStatus::ARGUMENT_ERROR, "empty stake account key");
    }
    if (amount < MIN_STAKE_AMOUNT) {
        return StakeStatus(StakeStatus::ARGUMENT_ERROR,
                           "stake amount " + std::to_string(amount) +
                           " below minimum " + std::to_string(MIN_STAKE_AMOUNT));
    }

    Amount surcharge = host_.MinimumBalance(STAKE_RECORD_SIZE);
    if (AddWouldOverflow(amount, surcharge)) {
        return StakeStatus(StakeStatus::ARGUMENT_ERROR, "stake amount overflows");
    }
    Amount total = amount + surcharge;

    StakeAccount stake;
    stake.owner = staker;
    stake.amount = amount;
    stake.lockedUntil = lockPeriod;
    stake.isActive = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<AccountChange> changes;
        changes.push_back(AccountChange::Update(staker, total, 0));
        changes.push_back(AccountChange::Create(stakeAccount, total, programId_,
                                                stake.Serialize()));

        HostStatus hs = host_.Apply(programId_, signers, changes);
        if (!hs.ok()) {
            LOG_DEBUG(util::LogCategory::STAKE) << "CreateStake " << stakeAccount
                                                << " rejected: " << hs.ToString();
            return MapHostError(hs);
        }
    }

    LOG_INFO(util::LogCategory::STAKE) << "Created stake " << stakeAccount << " for "
                                       << staker << ": " << amount << " (lock "
                                       << lockPeriod << ")";
    if (created) {
        *created = stake;
    }
    Notify(stakeAccount, stake);
    return StakeStatus::Ok();
}

StakeStatus StakeLedger::WithdrawSigned(const SignerSet& signers,
                                        const std::string& stakeAccount,
                                        const std::string& requester,
                                        Amount amount, StakeAccount* updated) {
    if (signers.count(requester) == 0) {
        return StakeStatus(StakeStatus::PERMISSION_DENIED, requester + " did not sign");
    }

    StakeAccount stake;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto account = host_.GetAccount(stakeAccount);
        if (!account) {
            return StakeStatus(StakeStatus::ACCOUNT_NOT_FOUND, stakeAccount);
        }
        if (account->owner != programId_) {
            return StakeStatus(StakeStatus::OWNERSHIP_ERROR,
                               stakeAccount + " is owned by " + account->owner);
        }

        auto decoded = StakeAccount::Deserialize(account->data);
        if (!decoded) {
            return StakeStatus(StakeStatus::INVALID_ACCOUNT_DATA, stakeAccount);
        }
        stake = *decoded;

        if (stake.owner != requester) {
            return StakeStatus(StakeStatus::PERMISSION_DENIED,
                               requester + " does not own " + stakeAccount);
        }
        if (stake.IsLocked()) {
            return StakeStatus(StakeStatus::STILL_LOCKED,
                               "locked until " + std::to_string(stake.lockedUntil));
        }
        if (amount > stake.amount) {
            return StakeStatus(StakeStatus::INSUFFICIENT_FUNDS,
                               "requested " + std::to_string(amount) + ", staked " +
                               std::to_string(stake.amount));
        }

        stake.amount -= amount;

        std::vector<AccountChange> changes;
        changes.push_back(AccountChange::Update(stakeAccount, amount, 0, stake.Serialize()));
        changes.push_back(AccountChange::Update(requester, 0, amount));

        HostStatus hs = host_.Apply(programId_, signers, changes);
        if (!hs.ok()) {
            LOG_DEBUG(util::LogCategory::STAKE) << "Withdraw from " << stakeAccount
                                                << " rejected: " << hs.ToString();
            return MapHostError(hs);
        }
    }

    LOG_INFO(util::LogCategory::STAKE) << "Withdrew " << amount << " from " << stakeAccount
                                       << ", remaining " << stake.amount;
    if (updated) {
        *updated = stake;
    }
    Notify(stakeAccount, stake);
    return StakeStatus::Ok();
}

StakeStatus StakeLedger::ProcessInstruction(const SignerSet& signers,
                                            const std::string& staker,
                                            const std::string& stakeAccount,
                                            const std::vector<Byte>& data) {
    auto ix = StakeInstruction::Deserialize(data);
    if (!ix) {
        return StakeStatus(StakeStatus::INVALID_INSTRUCTION,
                           "cannot decode " + std::to_string(data.size()) + "-byte instruction");
    }

    LOG_TRACE(util::LogCategory::STAKE) << StakeInstructionTypeToString(ix->type)
                                        << " for " << stakeAccount;

    switch (ix->type) {
        case StakeInstructionType::CreateStake:
            return CreateStakeSigned(signers, staker, stakeAccount, ix->amount,
                                     ix->lockPeriod, nullptr);
        case StakeInstructionType::Withdraw:
            return WithdrawSigned(signers, stakeAccount, staker, ix->amount, nullptr);
    }
    return StakeStatus(StakeStatus::INVALID_INSTRUCTION);
}

std::optional<StakeAccount> StakeLedger::GetStake(const std::string& stakeAccount) const {
    auto account = host_.GetAccount(stakeAccount);
    if (!account || account->owner != programId_) {
        return std::nullopt;
    }
    return StakeAccount::Deserialize(account->data);
}

std::vector<std::pair<std::string, StakeAccount>> StakeLedger::GetAllStakes() const {
    std::vector<std::pair<std::string, StakeAccount>> result;
    for (const auto& account : host_.ListAccounts(programId_)) {
        auto stake = StakeAccount::Deserialize(account.data);
        if (!stake) {
            LOG_WARN(util::LogCategory::STAKE) << "Undecodable stake record in "
                                               << account.key;
            continue;
        }
        result.emplace_back(account.key, std::move(*stake));
    }
    return result;
}

Amount StakeLedger::GetTotalStaked() const {
    Amount total = 0;
    for (const auto& entry : GetAllStakes()) {
        if (entry.second.isActive) {
            total += entry.second.amount;
        }
    }
    return total;
}

size_t StakeLedger::AddListener(StakeChangeListener listener) {
    auto slot = std::make_shared<ListenerSlot>();
    slot->callback = std::move(listener);

    std::lock_guard<std::mutex> lock(listenerMutex_);
    size_t id = nextListenerId_++;
    listeners_.emplace(id, std::move(slot));
    return id;
}

void StakeLedger::RemoveListener(size_t id) {
    std::shared_ptr<ListenerSlot> slot;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            return;
        }
        slot = std::move(it->second);
        listeners_.erase(it);
    }

    // A Notify that copied the slot before the erase may still be calling it
    std::lock_guard<std::mutex> lock(slot->callMutex);
    slot->removed = true;
}

void StakeLedger::Notify(const std::string& stakeAccount, const StakeAccount& stake) {
    std::vector<std::shared_ptr<ListenerSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (const auto& entry : listeners_) {
            slots.push_back(entry.second);
        }
    }
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->callMutex);
        if (!slot->removed) {
            slot->callback(stakeAccount, stake);
        }
    }
}

} // namespace staking
} // namespace dadbs
