// COINKEY - Scalar Values
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Arbitrary-width non-negative integers used as private keys and as
// oversized inputs prior to reduction modulo the curve order.

#ifndef COINKEY_CRYPTO_SCALAR_H
#define COINKEY_CRYPTO_SCALAR_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "coinkey/core/types.h"

namespace coinkey {

/**
 * A non-negative integer of any width.
 *
 * Stored as its minimal big-endian magnitude (no leading zero bytes, no
 * sign byte). Zero has an empty magnitude. Storage is cleansed on
 * destruction.
 */
class Scalar {
public:
    /// Default constructor (zero)
    Scalar() = default;
    
    ~Scalar();
    
    Scalar(const Scalar& other) = default;
    Scalar(Scalar&& other) noexcept = default;
    Scalar& operator=(const Scalar& other) = default;
    Scalar& operator=(Scalar&& other) noexcept = default;
    
    /// From unsigned big-endian bytes of any length
    static Scalar FromBytes(const Byte* data, size_t len);
    static Scalar FromBytes(const std::vector<Byte>& data) {
        return FromBytes(data.data(), data.size());
    }
    
    /// From big-endian hex (optional 0x prefix).
    /// Throws std::invalid_argument on malformed hex.
    static Scalar FromHex(const std::string& hex);
    
    static Scalar FromUint64(uint64_t value);
    
    bool IsZero() const { return magnitude_.empty(); }
    bool IsOne() const { return magnitude_.size() == 1 && magnitude_[0] == 1; }
    
    /// Number of significant bits (0 for zero)
    size_t BitLength() const;
    
    /// Number of significant bytes (0 for zero)
    size_t ByteLength() const { return magnitude_.size(); }
    
    /// this mod modulus. Throws std::invalid_argument if modulus is zero.
    Scalar Mod(const Scalar& modulus) const;
    
    /// Fixed-width big-endian encoding, see EncodeScalar()
    Bytes ToBytes(size_t width) const;
    
    /// Minimal big-endian magnitude
    const Bytes& Magnitude() const { return magnitude_; }
    
    /// Minimal hex form ("00" for zero)
    std::string ToHex() const;
    
    bool operator==(const Scalar& other) const { return magnitude_ == other.magnitude_; }
    bool operator!=(const Scalar& other) const { return !(*this == other); }
    bool operator<(const Scalar& other) const;

private:
    Bytes magnitude_;
};

/**
 * Encode a scalar as exactly `width` big-endian bytes, left-padded with
 * zeros. When the magnitude is wider than `width`, its low `width` bytes
 * are used.
 */
Bytes EncodeScalar(const Scalar& value, size_t width);

} // namespace coinkey

#endif // COINKEY_CRYPTO_SCALAR_H
