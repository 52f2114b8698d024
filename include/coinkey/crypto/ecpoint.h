// COINKEY - EC Point Values
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Affine secp256k1 points tagged with their serialized form.

#ifndef COINKEY_CRYPTO_ECPOINT_H
#define COINKEY_CRYPTO_ECPOINT_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <vector>
#include "coinkey/core/types.h"

namespace coinkey {

/**
 * An affine point on secp256k1 together with a compression flag.
 *
 * The encoded form (33 bytes 02/03 || x, or 65 bytes 04 || x || y) is
 * computed once at construction and always matches the flag. Changing
 * the compression returns a new value; (x, y) is never altered.
 */
class EcPoint {
public:
    using Coordinate = std::array<Byte, 32>;
    
    /// Encoding tags
    static constexpr Byte TAG_INFINITY = 0x00;
    static constexpr Byte TAG_COMPRESSED_EVEN = 0x02;
    static constexpr Byte TAG_COMPRESSED_ODD = 0x03;
    static constexpr Byte TAG_UNCOMPRESSED = 0x04;
    static constexpr Byte TAG_HYBRID_EVEN = 0x06;
    static constexpr Byte TAG_HYBRID_ODD = 0x07;
    
    /// Build from affine coordinates known to lie on the curve.
    /// Untrusted input goes through Decode().
    EcPoint(const Coordinate& x, const Coordinate& y, bool compressed);
    
    /**
     * Parse an encoded point, keeping its compression state.
     *
     * Throws UnsupportedEncodingError for infinity (00) and hybrid (06/07)
     * encodings, and InvalidKeyError for any other bad tag, a length that
     * does not match the tag, or coordinates that are not on the curve.
     */
    static EcPoint Decode(const Byte* data, size_t len);
    static EcPoint Decode(const std::vector<Byte>& data) {
        return Decode(data.data(), data.size());
    }
    
    bool IsCompressed() const { return compressed_; }
    
    const Coordinate& GetX() const { return x_; }
    const Coordinate& GetY() const { return y_; }
    
    /// Encoded bytes for the current compression flag
    const Bytes& GetEncoded() const { return encoded_; }
    
    /// Same (x, y) with the requested flag; returns *this when it already matches
    EcPoint WithCompression(bool compressed) const;
    EcPoint Compress() const { return WithCompression(true); }
    EcPoint Decompress() const { return WithCompression(false); }
    
    /// Same affine point, regardless of compression flag
    bool SameCoordinates(const EcPoint& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
    
    /// Equal coordinates and equal compression flag
    bool operator==(const EcPoint& other) const {
        return SameCoordinates(other) && compressed_ == other.compressed_;
    }
    bool operator!=(const EcPoint& other) const { return !(*this == other); }
    
    std::string ToHex() const;

private:
    Coordinate x_;
    Coordinate y_;
    bool compressed_;
    Bytes encoded_;
};

/// Free-function form of EcPoint::WithCompression
inline EcPoint WithCompression(const EcPoint& point, bool compressed) {
    return point.WithCompression(compressed);
}

} // namespace coinkey

#endif // COINKEY_CRYPTO_ECPOINT_H
