// DADBS - Address Translation
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Maps external-chain public addresses (44-character Base58 strings) onto
// internal DADBS account identifiers of the form "dadbs" + 64 hex digits.
//
// The derivation is four chained rounds of the DJB2 string hash. It is a
// stable display and namespacing alias, NOT a collision-resistant
// identifier: never use an internal address to authorise or route funds.

#ifndef DADBS_ADDRESS_ADDRESS_H
#define DADBS_ADDRESS_ADDRESS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace dadbs {
namespace address {

// ============================================================================
// Constants
// ============================================================================

/// Namespace prefix of every internal address
constexpr const char* INTERNAL_PREFIX = "dadbs";
constexpr size_t INTERNAL_PREFIX_LENGTH = 5;

/// Hex digits after the prefix
constexpr size_t INTERNAL_HEX_LENGTH = 64;

/// Length of an external-chain address
constexpr size_t EXTERNAL_ADDRESS_LENGTH = 44;

/// Number of chained hash rounds in a derivation
constexpr int DERIVATION_ROUNDS = 4;

// ============================================================================
// Errors
// ============================================================================

/// Malformed external or internal address string
class AddressFormatError : public std::runtime_error {
public:
    explicit AddressFormatError(const std::string& reason)
        : std::runtime_error("address format error: " + reason), reason_(reason) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

// ============================================================================
// Internal Address
// ============================================================================

/**
 * A validated internal address. Instances only come from Derive() or
 * Parse(), so the string always matches "dadbs" + [0-9a-f]{64}.
 */
class InternalAddress {
public:
    const std::string& ToString() const { return str_; }

    /// The 64 hex digits after the prefix
    std::string Hex() const { return str_.substr(INTERNAL_PREFIX_LENGTH); }

    bool operator==(const InternalAddress& other) const { return str_ == other.str_; }
    bool operator!=(const InternalAddress& other) const { return str_ != other.str_; }
    bool operator<(const InternalAddress& other) const { return str_ < other.str_; }

private:
    explicit InternalAddress(std::string str) : str_(std::move(str)) {}

    friend InternalAddress Derive(const std::string& external);
    friend InternalAddress Parse(const std::string& str);

    std::string str_;
};

inline std::ostream& operator<<(std::ostream& os, const InternalAddress& addr) {
    return os << addr.ToString();
}

// ============================================================================
// Translation
// ============================================================================

/// Exactly 44 ASCII alphanumeric characters
bool IsValidExternalAddress(const std::string& external);

/// DJB2 over the bytes of input, 64-bit wrapping
uint64_t Djb2(const std::string& input);

/**
 * Derive the internal address for an external address.
 * Round 0 hashes the external address; round i+1 hashes round i's 16-digit
 * output followed by the decimal number i+1.
 * @throws AddressFormatError if the input is not a valid external address
 */
InternalAddress Derive(const std::string& external);

/**
 * Parse an internal address literal.
 * @throws AddressFormatError on a missing prefix or a remainder that is not
 *         exactly 64 lowercase hex digits
 */
InternalAddress Parse(const std::string& str);

/// Parse without throwing
std::optional<InternalAddress> TryParse(const std::string& str);

} // namespace address
} // namespace dadbs

#endif // DADBS_ADDRESS_ADDRESS_H
