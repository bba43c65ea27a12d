// DADBS - Base58 Encoding
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Base58 with the Bitcoin alphabet, the encoding external-chain public keys
// arrive in.

#ifndef DADBS_CRYPTO_BASE58_H
#define DADBS_CRYPTO_BASE58_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dadbs {
namespace crypto {

/// Encode bytes as Base58 (leading zero bytes become '1')
std::string EncodeBase58(const std::vector<uint8_t>& data);

/// Decode Base58; nullopt on any character outside the alphabet
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

/// True if every character belongs to the Base58 alphabet
bool IsBase58(const std::string& str);

} // namespace crypto
} // namespace dadbs

#endif // DADBS_CRYPTO_BASE58_H
