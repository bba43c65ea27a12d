// DADBS - Account Host Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/staking/account_host.h>
#include <dadbs/core/serialize.h>
#include <dadbs/util/logging.h>

#include <map>
#include <set>
#include <sstream>

namespace dadbs {
namespace staking {

namespace {

constexpr uint8_t ACCOUNT_ENCODING_VERSION = 1;

std::string AccountDbKey(const std::string& key) {
    return db::MakeKey(db::prefix::ACCOUNT, key);
}

} // namespace

// ============================================================================
// HostAccount
// ============================================================================

std::vector<Byte> HostAccount::Serialize() const {
    DataStream s;
    ser_writedata8(s, ACCOUNT_ENCODING_VERSION);
    ser_writedata64(s, lamports);
    dadbs::Serialize(s, owner);
    dadbs::Serialize(s, data);
    return s.Release();
}

std::optional<HostAccount> HostAccount::Deserialize(const std::string& key,
                                                    const Byte* bytes, size_t len) {
    try {
        DataStream s(bytes, len);
        if (ser_readdata8(s) != ACCOUNT_ENCODING_VERSION) {
            return std::nullopt;
        }
        HostAccount account;
        account.key = key;
        account.lamports = ser_readdata64(s);
        dadbs::Unserialize(s, account.owner);
        dadbs::Unserialize(s, account.data);
        if (!s.empty()) {
            return std::nullopt;
        }
        return account;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string HostAccount::ToString() const {
    std::ostringstream ss;
    ss << "HostAccount(key=" << key << ", lamports=" << lamports
       << ", owner=" << owner << ", data=" << data.size() << " bytes)";
    return ss.str();
}

// ============================================================================
// AccountChange
// ============================================================================

AccountChange AccountChange::Create(const std::string& key, Amount lamports,
                                    const std::string& owner, std::vector<Byte> data) {
    AccountChange change;
    change.kind = Kind::Create;
    change.key = key;
    change.lamports = lamports;
    change.owner = owner;
    change.data = std::move(data);
    return change;
}

AccountChange AccountChange::Update(const std::string& key, Amount debit, Amount credit,
                                    std::optional<std::vector<Byte>> newData) {
    AccountChange change;
    change.kind = Kind::Update;
    change.key = key;
    change.debit = debit;
    change.credit = credit;
    change.newData = std::move(newData);
    return change;
}

// ============================================================================
// HostStatus
// ============================================================================

const char* HostStatusCodeToString(HostStatus::Code code) {
    switch (code) {
        case HostStatus::OK: return "OK";
        case HostStatus::ACCOUNT_EXISTS: return "AccountExists";
        case HostStatus::ACCOUNT_NOT_FOUND: return "AccountNotFound";
        case HostStatus::INSUFFICIENT_LAMPORTS: return "InsufficientLamports";
        case HostStatus::NOT_RENT_EXEMPT: return "NotRentExempt";
        case HostStatus::PERMISSION_DENIED: return "PermissionDenied";
        case HostStatus::UNBALANCED: return "Unbalanced";
        case HostStatus::INVALID_ARGUMENT: return "InvalidArgument";
        case HostStatus::STORAGE_ERROR: return "StorageError";
    }
    return "Unknown";
}

std::string HostStatus::ToString() const {
    std::string result = HostStatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

// ============================================================================
// DatabaseAccountHost
// ============================================================================

DatabaseAccountHost::DatabaseAccountHost(db::Database& db) : db_(db) {}

std::optional<HostAccount> DatabaseAccountHost::LoadAccount(const std::string& key) const {
    std::string value;
    db::Status s = db_.Get(AccountDbKey(key), &value);
    if (!s.ok()) {
        if (s.code() != db::Status::NOT_FOUND) {
            LOG_WARN(util::LogCategory::DB) << "Account read failed for " << key
                                            << ": " << s.ToString();
        }
        return std::nullopt;
    }

    auto account = HostAccount::Deserialize(
        key, reinterpret_cast<const Byte*>(value.data()), value.size());
    if (!account) {
        LOG_WARN(util::LogCategory::DB) << "Corrupt account record for " << key;
    }
    return account;
}

std::vector<HostAccount> DatabaseAccountHost::LoadAll() const {
    std::vector<HostAccount> result;
    const std::string prefix(1, db::prefix::ACCOUNT);

    auto it = db_.NewIterator();
    for (it->Seek(prefix); it->Valid(); it->Next()) {
        db::Slice k = it->key();
        if (!k.starts_with(prefix)) {
            break;
        }
        std::string key(k.data() + 1, k.size() - 1);
        db::Slice v = it->value();
        auto account = HostAccount::Deserialize(
            key, reinterpret_cast<const Byte*>(v.data()), v.size());
        if (!account) {
            LOG_WARN(util::LogCategory::DB) << "Skipping corrupt account record " << key;
            continue;
        }
        result.push_back(std::move(*account));
    }
    if (!it->status().ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Account scan failed: " << it->status().ToString();
    }
    return result;
}

std::optional<HostAccount> DatabaseAccountHost::GetAccount(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadAccount(key);
}

std::vector<HostAccount> DatabaseAccountHost::ListAccounts(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HostAccount> result;
    for (auto& account : LoadAll()) {
        if (account.owner == owner) {
            result.push_back(std::move(account));
        }
    }
    return result;
}

Amount DatabaseAccountHost::TotalLamports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& account : LoadAll()) {
        total += account.lamports;
    }
    return total;
}

HostStatus DatabaseAccountHost::Apply(const std::string& callerProgram,
                                      const SignerSet& signers,
                                      const std::vector<AccountChange>& changes) {
    if (callerProgram.empty()) {
        return HostStatus(HostStatus::INVALID_ARGUMENT, "empty caller program");
    }
    if (changes.empty()) {
        return HostStatus::Ok();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> seen;
    std::map<std::string, HostAccount> staged;
    Amount totalDebit = 0;
    Amount totalCredit = 0;

    for (const auto& change : changes) {
        if (change.key.empty()) {
            return HostStatus(HostStatus::INVALID_ARGUMENT, "empty account key");
        }
        if (!seen.insert(change.key).second) {
            return HostStatus(HostStatus::INVALID_ARGUMENT,
                              "account " + change.key + " appears twice in change set");
        }

        if (change.kind == AccountChange::Kind::Create) {
            if (change.owner.empty()) {
                return HostStatus(HostStatus::INVALID_ARGUMENT, "empty owner for " + change.key);
            }
            if (db_.Exists(AccountDbKey(change.key))) {
                return HostStatus(HostStatus::ACCOUNT_EXISTS, change.key);
            }
            Amount minimum = MinimumBalance(change.data.size());
            if (change.lamports < minimum) {
                return HostStatus(HostStatus::NOT_RENT_EXEMPT,
                                  change.key + " holds " + std::to_string(change.lamports) +
                                  ", needs " + std::to_string(minimum));
            }
            if (AddWouldOverflow(totalCredit, change.lamports)) {
                return HostStatus(HostStatus::INVALID_ARGUMENT, "lamport overflow");
            }
            totalCredit += change.lamports;

            HostAccount account;
            account.key = change.key;
            account.lamports = change.lamports;
            account.owner = change.owner;
            account.data = change.data;
            staged.emplace(change.key, std::move(account));
            continue;
        }

        auto existing = LoadAccount(change.key);
        if (!existing) {
            return HostStatus(HostStatus::ACCOUNT_NOT_FOUND, change.key);
        }
        HostAccount account = std::move(*existing);
        bool ownedByCaller = account.owner == callerProgram;

        if (change.debit > 0) {
            if (!ownedByCaller && account.owner != SYSTEM_PROGRAM_ID) {
                return HostStatus(HostStatus::PERMISSION_DENIED,
                                  callerProgram + " cannot debit " + change.key);
            }
            if (!ownedByCaller && signers.count(change.key) == 0) {
                return HostStatus(HostStatus::PERMISSION_DENIED,
                                  "wallet " + change.key + " did not sign");
            }
            if (change.debit > account.lamports) {
                return HostStatus(HostStatus::INSUFFICIENT_LAMPORTS,
                                  change.key + " holds " + std::to_string(account.lamports) +
                                  ", debit " + std::to_string(change.debit));
            }
        }
        if (change.newData && !ownedByCaller) {
            return HostStatus(HostStatus::PERMISSION_DENIED,
                              callerProgram + " cannot modify data of " + change.key);
        }

        if (AddWouldOverflow(totalDebit, change.debit) ||
            AddWouldOverflow(totalCredit, change.credit) ||
            AddWouldOverflow(account.lamports - change.debit, change.credit)) {
            return HostStatus(HostStatus::INVALID_ARGUMENT, "lamport overflow");
        }
        totalDebit += change.debit;
        totalCredit += change.credit;

        account.lamports = account.lamports - change.debit + change.credit;
        if (change.newData) {
            account.data = *change.newData;
        }

        if (!account.data.empty() && account.lamports != 0 &&
            account.lamports < MinimumBalance(account.data.size())) {
            return HostStatus(HostStatus::NOT_RENT_EXEMPT,
                              change.key + " would drop below the rent-exempt minimum");
        }
        staged.emplace(change.key, std::move(account));
    }

    if (totalDebit != totalCredit) {
        return HostStatus(HostStatus::UNBALANCED,
                          "debits " + std::to_string(totalDebit) + " != credits " +
                          std::to_string(totalCredit));
    }

    db::WriteBatch batch;
    for (const auto& entry : staged) {
        batch.Put(AccountDbKey(entry.first), entry.second.Serialize());
    }

    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Change set from " << callerProgram
                                         << " failed to commit: " << s.ToString();
        return HostStatus(HostStatus::STORAGE_ERROR, s.ToString());
    }

    LOG_TRACE(util::LogCategory::DB) << "Applied " << changes.size()
                                     << " account changes for " << callerProgram;
    return HostStatus::Ok();
}

HostStatus DatabaseAccountHost::Deposit(const std::string& key, Amount lamports) {
    if (key.empty()) {
        return HostStatus(HostStatus::INVALID_ARGUMENT, "empty account key");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    HostAccount account;
    auto existing = LoadAccount(key);
    if (existing) {
        account = std::move(*existing);
        if (AddWouldOverflow(account.lamports, lamports)) {
            return HostStatus(HostStatus::INVALID_ARGUMENT, "lamport overflow");
        }
        account.lamports += lamports;
    } else {
        if (db_.Exists(AccountDbKey(key))) {
            return HostStatus(HostStatus::STORAGE_ERROR, "unreadable account " + key);
        }
        account.key = key;
        account.lamports = lamports;
        account.owner = SYSTEM_PROGRAM_ID;
    }

    db::Status s = db_.Put(AccountDbKey(key), account.Serialize());
    if (!s.ok()) {
        return HostStatus(HostStatus::STORAGE_ERROR, s.ToString());
    }
    return HostStatus::Ok();
}

} // namespace staking
} // namespace dadbs
