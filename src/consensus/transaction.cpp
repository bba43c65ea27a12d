// DADBS - Transaction Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/consensus/transaction.h>
#include <dadbs/core/serialize.h>
#include <dadbs/crypto/sha256.h>

#include <sstream>

namespace dadbs {
namespace consensus {

std::vector<Byte> Transaction::GetSigningMessage() const {
    DataStream s;
    ser_writedata8(s, TRANSACTION_VERSION);
    dadbs::Serialize(s, payload);
    dadbs::Serialize(s, signer);
    dadbs::Serialize(s, timestamp);
    return s.Release();
}

Hash256 Transaction::GetHash() const {
    crypto::SHA256 hasher;
    hasher.Write(GetSigningMessage());
    hasher.Write(signature.data(), signature.size());
    return hasher.Finalize();
}

void Transaction::Sign(const crypto::PrivateKey& key) {
    signer = key.GetPublicKey().ToBase58();
    signature = key.Sign(GetSigningMessage());
}

bool Transaction::VerifySignature() const {
    auto pubkey = crypto::PublicKey::FromBase58(signer);
    if (!pubkey) {
        return false;
    }
    return pubkey->Verify(GetSigningMessage(), signature);
}

std::vector<Byte> Transaction::Serialize() const {
    DataStream s(GetSigningMessage());
    dadbs::Serialize(s, signature);
    return s.Release();
}

std::optional<Transaction> Transaction::Deserialize(const std::vector<Byte>& data) {
    try {
        DataStream s(data);
        if (ser_readdata8(s) != TRANSACTION_VERSION) {
            return std::nullopt;
        }
        Transaction tx;
        dadbs::Unserialize(s, tx.payload);
        dadbs::Unserialize(s, tx.signer);
        dadbs::Unserialize(s, tx.timestamp);
        dadbs::Unserialize(s, tx.signature);
        if (!s.empty()) {
            return std::nullopt;
        }
        return tx;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string Transaction::ToString() const {
    std::ostringstream ss;
    ss << "Transaction(hash=" << GetHash().ToHex()
       << ", signer=" << signer
       << ", payload=" << payload.size() << " bytes"
       << ", timestamp=" << timestamp << ")";
    return ss.str();
}

Transaction Transaction::CreateSigned(std::vector<Byte> payload,
                                      const crypto::PrivateKey& key,
                                      int64_t timestamp) {
    Transaction tx;
    tx.payload = std::move(payload);
    tx.timestamp = timestamp;
    tx.Sign(key);
    return tx;
}

} // namespace consensus
} // namespace dadbs
