// DADBS - Account Host
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// The account host is the minimal-trust execution environment that programs
// such as the stake ledger run against. It owns every account's lamport
// balance and data, and it applies each program's change set atomically
// while enforcing:
//
// - created accounts are new and hold at least the rent-exempt minimum
// - debits never exceed an account's balance
// - only the owning program may rewrite an account's data or debit it,
//   except that a system-owned wallet may be debited as the paying side
//   when the wallet signed the change set
// - lamports are conserved: debits == credits + lamports of new accounts

#ifndef DADBS_STAKING_ACCOUNT_HOST_H
#define DADBS_STAKING_ACCOUNT_HOST_H

#include <dadbs/core/types.h>
#include <dadbs/db/database.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dadbs {
namespace staking {

// ============================================================================
// Constants
// ============================================================================

/// Owner of plain wallet accounts
constexpr const char* SYSTEM_PROGRAM_ID = "system";

/// Accounts whose keys authorized a change set
using SignerSet = std::set<std::string>;

/// Bytes of account metadata charged on top of the data length
constexpr uint64_t ACCOUNT_STORAGE_OVERHEAD = 128;

/// Rent rate per byte-year
constexpr uint64_t LAMPORTS_PER_BYTE_YEAR = 3480;

/// Years of rent an account must hold to be exempt
constexpr uint64_t EXEMPTION_THRESHOLD_YEARS = 2;

/// Rent-exempt minimum for an account holding dataLen bytes
constexpr Amount RentExemptMinimum(size_t dataLen) {
    return (ACCOUNT_STORAGE_OVERHEAD + dataLen) * LAMPORTS_PER_BYTE_YEAR *
           EXEMPTION_THRESHOLD_YEARS;
}

// ============================================================================
// Host Account
// ============================================================================

struct HostAccount {
    std::string key;
    Amount lamports{0};
    std::string owner;
    std::vector<Byte> data;

    /// Storage encoding (the key is not part of it)
    std::vector<Byte> Serialize() const;

    static std::optional<HostAccount> Deserialize(const std::string& key,
                                                  const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Change Set
// ============================================================================

/// One element of an atomic change set
struct AccountChange {
    enum class Kind { Create, Update };

    Kind kind{Kind::Update};
    std::string key;

    // Create
    Amount lamports{0};
    std::string owner;
    std::vector<Byte> data;

    // Update
    Amount debit{0};
    Amount credit{0};
    std::optional<std::vector<Byte>> newData;

    static AccountChange Create(const std::string& key, Amount lamports,
                                const std::string& owner, std::vector<Byte> data);

    static AccountChange Update(const std::string& key, Amount debit, Amount credit,
                                std::optional<std::vector<Byte>> newData = std::nullopt);
};

// ============================================================================
// Host Status
// ============================================================================

class HostStatus {
public:
    enum Code {
        OK = 0,
        ACCOUNT_EXISTS,
        ACCOUNT_NOT_FOUND,
        INSUFFICIENT_LAMPORTS,
        NOT_RENT_EXEMPT,
        PERMISSION_DENIED,
        UNBALANCED,
        INVALID_ARGUMENT,
        STORAGE_ERROR,
    };

    HostStatus() : code_(OK) {}
    HostStatus(Code code, const std::string& msg) : code_(code), message_(msg) {}

    static HostStatus Ok() { return HostStatus(); }

    bool ok() const { return code_ == OK; }
    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

const char* HostStatusCodeToString(HostStatus::Code code);

// ============================================================================
// Account Host Interface
// ============================================================================

class IAccountHost {
public:
    virtual ~IAccountHost() = default;

    virtual std::optional<HostAccount> GetAccount(const std::string& key) const = 0;

    /// Rent-exempt minimum balance for dataLen bytes of account data
    virtual Amount MinimumBalance(size_t dataLen) const = 0;

    /// Apply a change set on behalf of callerProgram, all or nothing.
    /// A system wallet is debited only if its key is in signers.
    virtual HostStatus Apply(const std::string& callerProgram, const SignerSet& signers,
                             const std::vector<AccountChange>& changes) = 0;

    /// Every account owned by a program, ordered by key
    virtual std::vector<HostAccount> ListAccounts(const std::string& owner) const = 0;
};

// ============================================================================
// Database-backed Host
// ============================================================================

/**
 * Account host persisting accounts in a db::Database. Each change set is
 * written with a single WriteBatch. The database must outlive the host.
 */
class DatabaseAccountHost : public IAccountHost {
public:
    explicit DatabaseAccountHost(db::Database& db);

    std::optional<HostAccount> GetAccount(const std::string& key) const override;

    Amount MinimumBalance(size_t dataLen) const override {
        return RentExemptMinimum(dataLen);
    }

    HostStatus Apply(const std::string& callerProgram, const SignerSet& signers,
                     const std::vector<AccountChange>& changes) override;

    std::vector<HostAccount> ListAccounts(const std::string& owner) const override;

    /// Fund a system-owned wallet, creating it if needed
    HostStatus Deposit(const std::string& key, Amount lamports);

    /// Sum of all balances
    Amount TotalLamports() const;

private:
    std::optional<HostAccount> LoadAccount(const std::string& key) const;

    std::vector<HostAccount> LoadAll() const;

    db::Database& db_;
    mutable std::mutex mutex_;
};

} // namespace staking
} // namespace dadbs

#endif // DADBS_STAKING_ACCOUNT_HOST_H
