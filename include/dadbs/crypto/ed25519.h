// DADBS - Ed25519 Keys and Signatures
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Ed25519 (RFC 8032) over OpenSSL's EVP_PKEY interface. Public keys travel
// as Base58 strings, the format used for external-chain identities.

#ifndef DADBS_CRYPTO_ED25519_H
#define DADBS_CRYPTO_ED25519_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dadbs {
namespace crypto {

namespace ed25519 {
    constexpr size_t PUBLIC_KEY_SIZE = 32;
    constexpr size_t SEED_SIZE = 32;
    constexpr size_t SIGNATURE_SIZE = 64;
}

using Signature = std::array<uint8_t, ed25519::SIGNATURE_SIZE>;

/// Fill a buffer with cryptographically secure random bytes
/// (throws std::runtime_error if the RNG fails)
void GetRandBytes(uint8_t* buf, size_t len);

// ============================================================================
// Public Key
// ============================================================================

class PublicKey {
public:
    using Bytes = std::array<uint8_t, ed25519::PUBLIC_KEY_SIZE>;

    explicit PublicKey(const Bytes& bytes) : bytes_(bytes) {}

    /// Parse a Base58 string; nullopt unless it decodes to exactly 32 bytes
    static std::optional<PublicKey> FromBase58(const std::string& str);

    std::string ToBase58() const;

    const Bytes& bytes() const { return bytes_; }

    /// Verify a signature over msg; malformed keys simply fail verification
    bool Verify(const uint8_t* msg, size_t len, const Signature& sig) const;

    bool Verify(const std::vector<uint8_t>& msg, const Signature& sig) const {
        return Verify(msg.data(), msg.size(), sig);
    }

    bool operator==(const PublicKey& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    Bytes bytes_;
};

// ============================================================================
// Private Key
// ============================================================================

/// Ed25519 signing key held as its 32-byte seed; the seed is wiped on destruction
class PrivateKey {
public:
    using Seed = std::array<uint8_t, ed25519::SEED_SIZE>;

    /// Fresh random key
    static PrivateKey Generate();

    /// Deterministic key from a seed (throws std::runtime_error on failure)
    explicit PrivateKey(const Seed& seed);

    ~PrivateKey();

    PrivateKey(const PrivateKey&) = default;
    PrivateKey& operator=(const PrivateKey&) = default;

    const PublicKey& GetPublicKey() const { return publicKey_; }

    /// Sign msg (throws std::runtime_error on OpenSSL failure)
    Signature Sign(const uint8_t* msg, size_t len) const;

    Signature Sign(const std::vector<uint8_t>& msg) const {
        return Sign(msg.data(), msg.size());
    }

private:
    Seed seed_;
    PublicKey publicKey_;
};

} // namespace crypto
} // namespace dadbs

#endif // DADBS_CRYPTO_ED25519_H
