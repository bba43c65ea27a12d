// DADBS - Ed25519 Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/crypto/ed25519.h>
#include <dadbs/crypto/base58.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace dadbs {
namespace crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr NewPrivateKey(const PrivateKey::Seed& seed) {
    return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                seed.data(), seed.size()));
}

PublicKey::Bytes DerivePublic(const PrivateKey::Seed& seed) {
    PkeyPtr pkey = NewPrivateKey(seed);
    if (!pkey) {
        throw std::runtime_error("Ed25519: cannot load private key");
    }

    PublicKey::Bytes out{};
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), out.data(), &len) != 1 ||
        len != out.size()) {
        throw std::runtime_error("Ed25519: cannot derive public key");
    }
    return out;
}

} // namespace

void GetRandBytes(uint8_t* buf, size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

// ============================================================================
// PublicKey
// ============================================================================

std::optional<PublicKey> PublicKey::FromBase58(const std::string& str) {
    auto decoded = DecodeBase58(str);
    if (!decoded || decoded->size() != ed25519::PUBLIC_KEY_SIZE) {
        return std::nullopt;
    }
    Bytes bytes;
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return PublicKey(bytes);
}

std::string PublicKey::ToBase58() const {
    return EncodeBase58(std::vector<uint8_t>(bytes_.begin(), bytes_.end()));
}

bool PublicKey::Verify(const uint8_t* msg, size_t len, const Signature& sig) const {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             bytes_.data(), bytes_.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return false;
    }

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), sig.data(), sig.size(), msg, len) == 1;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey PrivateKey::Generate() {
    Seed seed;
    GetRandBytes(seed.data(), seed.size());
    PrivateKey key(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    return key;
}

PrivateKey::PrivateKey(const Seed& seed)
    : seed_(seed), publicKey_(DerivePublic(seed)) {}

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(seed_.data(), seed_.size());
}

Signature PrivateKey::Sign(const uint8_t* msg, size_t len) const {
    PkeyPtr pkey = NewPrivateKey(seed_);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        throw std::runtime_error("Ed25519: cannot allocate signing context");
    }

    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        throw std::runtime_error("Ed25519: EVP_DigestSignInit failed");
    }

    Signature sig{};
    size_t sigLen = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sigLen, msg, len) != 1 ||
        sigLen != sig.size()) {
        throw std::runtime_error("Ed25519: EVP_DigestSign failed");
    }
    return sig;
}

} // namespace crypto
} // namespace dadbs
