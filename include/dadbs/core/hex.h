// DADBS - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 DADBS Developers
// MIT License

#ifndef DADBS_CORE_HEX_H
#define DADBS_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dadbs {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes (throws std::invalid_argument on bad input)
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex (either case)
bool IsValidHex(const std::string& str);

/// Check if every character is in [0-9a-f]
bool IsLowerHex(const std::string& str);

/// Format a 64-bit value as 16 zero-padded lowercase hex digits
std::string FormatHex64(uint64_t value);

} // namespace dadbs

#endif // DADBS_CORE_HEX_H
