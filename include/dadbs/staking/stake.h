// DADBS - Stake Ledger
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// On-chain stake program. Each stake lives in its own host account owned by
// the stake program and carries a fixed 62-byte record:
//
//   version u8 (=1) | owner 44 bytes | amount u64 LE | locked_until i64 LE |
//   is_active u8 (0 or 1)
//
// Instructions are version-tagged:
//
//   version u8 (=1) | 0 | amount u64 LE | lock_period i64 LE   CreateStake
//   version u8 (=1) | 1 | amount u64 LE                        Withdraw

#ifndef DADBS_STAKING_STAKE_H
#define DADBS_STAKING_STAKE_H

#include <dadbs/core/types.h>
#include <dadbs/staking/account_host.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dadbs {
namespace staking {

// ============================================================================
// Constants
// ============================================================================

/// Smallest stake that may be created (10 whole tokens)
constexpr Amount MIN_STAKE_AMOUNT = 10 * BASE_UNITS_PER_TOKEN;

/// Program id the ledger runs under unless configured otherwise
constexpr const char* DEFAULT_STAKE_PROGRAM_ID = "dadbs_stake";

constexpr uint8_t STAKE_RECORD_VERSION = 1;
constexpr size_t STAKE_OWNER_SIZE = 44;
constexpr size_t STAKE_RECORD_SIZE = 1 + STAKE_OWNER_SIZE + 8 + 8 + 1;

constexpr uint8_t STAKE_INSTRUCTION_VERSION = 1;

// ============================================================================
// Stake Account Record
// ============================================================================

struct StakeAccount {
    /// External address of the staker
    std::string owner;

    /// Staked amount in base units
    Amount amount{0};

    /// Non-zero while the stake is locked
    int64_t lockedUntil{0};

    bool isActive{false};

    /// Encode as a STAKE_RECORD_SIZE record (owner must be 44 bytes)
    std::vector<Byte> Serialize() const;

    /// Decode a record; nullopt on wrong size or version, a malformed owner,
    /// or a flag byte other than 0 or 1
    static std::optional<StakeAccount> Deserialize(const Byte* data, size_t len);

    static std::optional<StakeAccount> Deserialize(const std::vector<Byte>& data) {
        return Deserialize(data.data(), data.size());
    }

    bool IsLocked() const { return lockedUntil > 0; }

    std::string ToString() const;

    bool operator==(const StakeAccount& other) const {
        return owner == other.owner && amount == other.amount &&
               lockedUntil == other.lockedUntil && isActive == other.isActive;
    }
};

// ============================================================================
// Instructions
// ============================================================================

enum class StakeInstructionType : uint8_t {
    CreateStake = 0,
    Withdraw = 1,
};

const char* StakeInstructionTypeToString(StakeInstructionType type);

struct StakeInstruction {
    StakeInstructionType type{StakeInstructionType::CreateStake};
    Amount amount{0};

    /// CreateStake only
    int64_t lockPeriod{0};

    static StakeInstruction CreateStake(Amount amount, int64_t lockPeriod);
    static StakeInstruction Withdraw(Amount amount);

    std::vector<Byte> Serialize() const;

    /// Decode; nullopt on unknown version or tag, or on any length mismatch
    static std::optional<StakeInstruction> Deserialize(const Byte* data, size_t len);

    static std::optional<StakeInstruction> Deserialize(const std::vector<Byte>& data) {
        return Deserialize(data.data(), data.size());
    }
};

// ============================================================================
// Status
// ============================================================================

class StakeStatus {
public:
    enum Code {
        OK = 0,
        ARGUMENT_ERROR,
        PERMISSION_DENIED,
        STILL_LOCKED,
        INSUFFICIENT_FUNDS,
        OWNERSHIP_ERROR,
        INVALID_INSTRUCTION,
        INVALID_ACCOUNT_DATA,
        ACCOUNT_NOT_FOUND,
        HOST_ERROR,
    };

    StakeStatus() : code_(OK) {}
    StakeStatus(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static StakeStatus Ok() { return StakeStatus(); }

    bool ok() const { return code_ == OK; }
    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

const char* StakeStatusCodeToString(StakeStatus::Code code);

// ============================================================================
// Stake Ledger
// ============================================================================

/**
 * Creates and withdraws stakes through an IAccountHost. All mutations are
 * serialized by the ledger and committed as one host change set, so a
 * failed operation leaves every balance untouched.
 */
class StakeLedger {
public:
    /// Called after a stake account changes (outside the ledger lock)
    using StakeChangeListener =
        std::function<void(const std::string& stakeAccount, const StakeAccount& stake)>;

    explicit StakeLedger(IAccountHost& host,
                         std::string programId = DEFAULT_STAKE_PROGRAM_ID);

    StakeLedger(const StakeLedger&) = delete;
    StakeLedger& operator=(const StakeLedger&) = delete;

    const std::string& GetProgramId() const { return programId_; }

    /**
     * Lock amount of the staker's lamports into a new stake account.
     * The staker also pays the rent-exempt minimum for the record, which
     * stays in the stake account. The staker is taken to have signed;
     * unauthenticated requests go through ProcessInstruction.
     */
    StakeStatus CreateStake(const std::string& staker, const std::string& stakeAccount,
                            Amount amount, int64_t lockPeriod,
                            StakeAccount* created = nullptr);

    /// Move amount from a stake back to its owner's wallet
    StakeStatus Withdraw(const std::string& stakeAccount, const std::string& requester,
                         Amount amount, StakeAccount* updated = nullptr);

    /**
     * Decode and dispatch an instruction for staker (the payer of a
     * CreateStake, the requester of a Withdraw). Fails with
     * PERMISSION_DENIED unless staker is among the signers.
     */
    StakeStatus ProcessInstruction(const SignerSet& signers,
                                   const std::string& staker,
                                   const std::string& stakeAccount,
                                   const std::vector<Byte>& data);

    std::optional<StakeAccount> GetStake(const std::string& stakeAccount) const;

    /// Every decodable stake owned by this program, ordered by account key
    std::vector<std::pair<std::string, StakeAccount>> GetAllStakes() const;

    /// Sum of active stake amounts
    Amount GetTotalStaked() const;

    /// Register a listener; returns an id for RemoveListener
    size_t AddListener(StakeChangeListener listener);

    /// Unregister a listener. Waits for a call to it that is already
    /// running, so whatever it captured may be destroyed once this returns.
    /// Must not be called from inside that listener.
    void RemoveListener(size_t id);

private:
    struct ListenerSlot {
        StakeChangeListener callback;
        std::mutex callMutex;
        bool removed{false};
    };

    StakeStatus CreateStakeSigned(const SignerSet& signers, const std::string& staker,
                                  const std::string& stakeAccount, Amount amount,
                                  int64_t lockPeriod, StakeAccount* created);

    StakeStatus WithdrawSigned(const SignerSet& signers, const std::string& stakeAccount,
                               const std::string& requester, Amount amount,
                               StakeAccount* updated);

    void Notify(const std::string& stakeAccount, const StakeAccount& stake);

    static StakeStatus MapHostError(const HostStatus& status);

    IAccountHost& host_;
    const std::string programId_;

    mutable std::mutex mutex_;

    std::mutex listenerMutex_;
    std::map<size_t, std::shared_ptr<ListenerSlot>> listeners_;
    size_t nextListenerId_{1};
};

} // namespace staking
} // namespace dadbs

#endif // DADBS_STAKING_STAKE_H
