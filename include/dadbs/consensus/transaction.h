// DADBS - Transaction
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// A transaction submitted for admission: an opaque payload signed with
// Ed25519 by the holder of an external-chain key.
//
// Signing message:
//   version u8 (=1) | compact-size len | payload |
//   compact-size len | signer (Base58 public key) | timestamp i64 LE
//
// Transaction hash: SHA-256(signing message || signature)

#ifndef DADBS_CONSENSUS_TRANSACTION_H
#define DADBS_CONSENSUS_TRANSACTION_H

#include <dadbs/core/types.h>
#include <dadbs/crypto/ed25519.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dadbs {
namespace consensus {

constexpr uint8_t TRANSACTION_VERSION = 1;

struct Transaction {
    std::vector<Byte> payload;

    /// Base58-encoded Ed25519 public key of the signer
    std::string signer;

    crypto::Signature signature{};

    /// Unix time in milliseconds
    int64_t timestamp{0};

    /// Bytes covered by the signature
    std::vector<Byte> GetSigningMessage() const;

    Hash256 GetHash() const;

    /// Set signer from key and sign the current payload and timestamp
    void Sign(const crypto::PrivateKey& key);

    /// True iff signer decodes to a public key and the signature verifies
    bool VerifySignature() const;

    /// Wire encoding: signing message followed by the 64-byte signature
    std::vector<Byte> Serialize() const;

    static std::optional<Transaction> Deserialize(const std::vector<Byte>& data);

    std::string ToString() const;

    /// Build and sign in one step
    static Transaction CreateSigned(std::vector<Byte> payload,
                                    const crypto::PrivateKey& key,
                                    int64_t timestamp);
};

} // namespace consensus
} // namespace dadbs

#endif // DADBS_CONSENSUS_TRANSACTION_H
