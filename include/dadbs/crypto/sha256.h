// DADBS - SHA256 Hash Function
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef DADBS_CRYPTO_SHA256_H
#define DADBS_CRYPTO_SHA256_H

#include <dadbs/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace dadbs {
namespace crypto {

/// SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    SHA256& Write(const Hash256& hash) {
        return Write(hash.data(), Hash256::SIZE);
    }

    /// Produce the digest; the hasher is reset afterwards
    Hash256 Finalize();

    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// SHA-256 of a byte range in one call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

} // namespace crypto
} // namespace dadbs

#endif // DADBS_CRYPTO_SHA256_H
