// COINKEY - Core Types Header
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Fundamental byte and fixed-size digest types shared by every module.

#ifndef COINKEY_CORE_TYPES_H
#define COINKEY_CORE_TYPES_H

#include "coinkey/core/hex.h"

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstring>

namespace coinkey {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owning byte buffer
using Bytes = std::vector<Byte>;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size digest value
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (must be exactly SIZE bytes)
    BaseHash(const Byte* data, size_t len) {
        if (len != SIZE) {
            throw std::invalid_argument("hash length mismatch");
        }
        std::memcpy(data_.data(), data, SIZE);
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    /// Copy out as a byte vector
    Bytes ToVector() const {
        return Bytes(data_.begin(), data_.end());
    }
    
    /// Hex in storage order (digests are not displayed reversed here)
    std::string ToHex() const {
        return BytesToHex(data_.data(), SIZE);
    }

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit digest (SHA-256 output)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    
    static Hash256 FromHex(const std::string& hex) {
        auto bytes = HexToBytes(hex);
        return Hash256(bytes.data(), bytes.size());
    }
};

/// 160-bit digest (RIPEMD-160 output, pubkey hash)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    
    static Hash160 FromHex(const std::string& hex) {
        auto bytes = HexToBytes(hex);
        return Hash160(bytes.data(), bytes.size());
    }
};

} // namespace coinkey

#endif // COINKEY_CORE_TYPES_H
