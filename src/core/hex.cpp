// COINKEY - Hex and Byte-Order Utilities Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/core/hex.h"

#include <stdexcept>

namespace coinkey {

namespace {

int Nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Digits after an optional "0x"/"0X"
std::string Digits(const std::string& hex) {
    bool prefixed = hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
    return prefixed ? hex.substr(2) : hex;
}

} // anonymous namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return out;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    const std::string digits = Digits(hex);
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("odd number of hex digits");
    }

    std::vector<uint8_t> out(digits.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = Nibble(digits[2 * i]);
        int lo = Nibble(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("non-hex character at offset " + std::to_string(2 * i));
        }
        out[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    const std::string digits = Digits(str);
    if (digits.empty() || digits.size() % 2 != 0) {
        return false;
    }
    for (char c : digits) {
        if (Nibble(c) < 0) {
            return false;
        }
    }
    return true;
}

std::vector<uint8_t> ReverseBytes(const std::vector<uint8_t>& data) {
    return std::vector<uint8_t>(data.rbegin(), data.rend());
}

} // namespace coinkey
