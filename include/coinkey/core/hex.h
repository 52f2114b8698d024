// COINKEY - Hex and Byte-Order Utilities
// Copyright (c) 2024 COINKEY Developers
// MIT License

#ifndef COINKEY_CORE_HEX_H
#define COINKEY_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace coinkey {

/// Lowercase hex, two digits per byte
std::string BytesToHex(const uint8_t* data, size_t len);

inline std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

/// Parse hex with an optional "0x" prefix, either case.
/// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// True for non-empty, even-length hex (prefix allowed)
bool IsValidHex(const std::string& str);

/// New vector holding `data` in reverse order
std::vector<uint8_t> ReverseBytes(const std::vector<uint8_t>& data);

} // namespace coinkey

#endif // COINKEY_CORE_HEX_H
