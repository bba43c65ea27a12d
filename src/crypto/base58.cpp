// DADBS - Base58 Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/crypto/base58.h>

namespace dadbs {
namespace crypto {

namespace {

const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int Base58Value(char c) {
    if (c >= '1' && c <= '9') return c - '1';
    if (c >= 'A' && c <= 'H') return 9 + (c - 'A');
    if (c >= 'J' && c <= 'N') return 17 + (c - 'J');
    if (c >= 'P' && c <= 'Z') return 22 + (c - 'P');
    if (c >= 'a' && c <= 'k') return 33 + (c - 'a');
    if (c >= 'm' && c <= 'z') return 44 + (c - 'm');
    return -1;
}

} // namespace

bool IsBase58(const std::string& str) {
    for (char c : str) {
        if (Base58Value(c) < 0) {
            return false;
        }
    }
    return true;
}

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }

    // Big-endian base-58 digits, log(256)/log(58) ~ 1.38 per byte
    std::vector<uint8_t> digits((data.size() - zeroes) * 138 / 100 + 1, 0);
    size_t used = 0;

    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        used = j;
    }

    auto it = digits.begin() + (digits.size() - used);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string str(zeroes, '1');
    str.reserve(zeroes + (digits.end() - it));
    for (; it != digits.end(); ++it) {
        str += BASE58_ALPHABET[*it];
    }
    return str;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // log(58)/log(256) ~ 0.733 bytes per character
    std::vector<uint8_t> bytes((str.size() - zeroes) * 733 / 1000 + 1, 0);
    size_t used = 0;

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = Base58Value(str[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        used = j;
    }

    auto it = bytes.begin() + (bytes.size() - used);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result(zeroes, 0x00);
    result.insert(result.end(), it, bytes.end());
    return result;
}

} // namespace crypto
} // namespace dadbs
