// DADBS - Address Translation Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/address/address.h>
#include <dadbs/core/hex.h>

namespace dadbs {
namespace address {

namespace {

bool IsAsciiAlnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

bool IsValidExternalAddress(const std::string& external) {
    if (external.size() != EXTERNAL_ADDRESS_LENGTH) {
        return false;
    }
    for (char c : external) {
        if (!IsAsciiAlnum(c)) {
            return false;
        }
    }
    return true;
}

uint64_t Djb2(const std::string& input) {
    uint64_t acc = 5381;
    for (char c : input) {
        acc = acc * 33 + static_cast<unsigned char>(c);
    }
    return acc;
}

InternalAddress Derive(const std::string& external) {
    if (external.size() != EXTERNAL_ADDRESS_LENGTH) {
        throw AddressFormatError("external address must be " +
                                 std::to_string(EXTERNAL_ADDRESS_LENGTH) +
                                 " characters, got " + std::to_string(external.size()));
    }
    if (!IsValidExternalAddress(external)) {
        throw AddressFormatError("external address must be ASCII alphanumeric");
    }

    std::string out = INTERNAL_PREFIX;
    out.reserve(INTERNAL_PREFIX_LENGTH + INTERNAL_HEX_LENGTH);

    std::string input = external;
    for (int round = 0; round < DERIVATION_ROUNDS; ++round) {
        std::string digest = FormatHex64(Djb2(input));
        out += digest;
        input = digest + std::to_string(round + 1);
    }

    return InternalAddress(std::move(out));
}

InternalAddress Parse(const std::string& str) {
    if (str.compare(0, INTERNAL_PREFIX_LENGTH, INTERNAL_PREFIX) != 0) {
        throw AddressFormatError("missing '" + std::string(INTERNAL_PREFIX) + "' prefix");
    }

    std::string hex = str.substr(INTERNAL_PREFIX_LENGTH);
    if (hex.size() != INTERNAL_HEX_LENGTH) {
        throw AddressFormatError("expected " + std::to_string(INTERNAL_HEX_LENGTH) +
                                 " hex digits after prefix, got " +
                                 std::to_string(hex.size()));
    }
    if (!IsLowerHex(hex)) {
        throw AddressFormatError("non-hex or uppercase character after prefix");
    }

    return InternalAddress(str);
}

std::optional<InternalAddress> TryParse(const std::string& str) {
    try {
        return Parse(str);
    } catch (const AddressFormatError&) {
        return std::nullopt;
    }
}

} // namespace address
} // namespace dadbs
