// COINKEY - secp256k1 Keys
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Private keys, public keys and key pairs, linked by DerivePublicPoint().
// PrivateKey and PublicKey are independent value types.

#ifndef COINKEY_CRYPTO_KEYS_H
#define COINKEY_CRYPTO_KEYS_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include "coinkey/core/types.h"
#include "coinkey/core/random.h"
#include "coinkey/crypto/ecpoint.h"
#include "coinkey/crypto/scalar.h"

namespace coinkey {

namespace util {
class ConfigManager;
}

// ============================================================================
// Key Policy
// ============================================================================

/// Validation switches applied when a private key is constructed
struct KeyPolicy {
    /// Reject d = 1 in addition to d = 0
    bool rejectSentinelOne{false};
    
    /// Read "strictsentinel" (or "strict") from configuration
    static KeyPolicy FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key: a single scalar d with 1 <= d < n.
 *
 * Throws InvalidKeyError when d is zero, not below the curve order, or
 * equal to one under a policy that rejects it.
 */
class PrivateKey {
public:
    /// Size in bytes
    static constexpr size_t SIZE = 32;
    
    explicit PrivateKey(Scalar d, const KeyPolicy& policy = KeyPolicy());
    
    const Scalar& GetScalar() const { return d_; }
    
    /// Exactly 32 bytes, big-endian, zero-padded
    Bytes GetPrivKeyBytes() const;
    
    std::string ToHex() const;
    
    bool operator==(const PrivateKey& other) const { return d_ == other.d_; }
    bool operator!=(const PrivateKey& other) const { return !(*this == other); }

private:
    Scalar d_;
};

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A secp256k1 public key.
 *
 * Wraps an EcPoint; the encoding (compressed 33 bytes or uncompressed
 * 65 bytes) follows the point's compression flag.
 */
class PublicKey {
public:
    explicit PublicKey(EcPoint point) : point_(std::move(point)) {}
    
    /// Parse an encoded public key. See EcPoint::Decode() for failures.
    static PublicKey FromPublicOnly(const Byte* data, size_t len);
    static PublicKey FromPublicOnly(const std::vector<Byte>& data) {
        return FromPublicOnly(data.data(), data.size());
    }
    
    const EcPoint& GetPoint() const { return point_; }
    
    /// Currently encoded bytes
    const Bytes& GetPubKey() const { return point_.GetEncoded(); }
    
    bool IsCompressed() const { return point_.IsCompressed(); }
    
    PublicKey Compress() const { return WithCompression(true); }
    PublicKey Decompress() const { return WithCompression(false); }
    PublicKey WithCompression(bool compressed) const {
        return PublicKey(point_.WithCompression(compressed));
    }
    
    /// RIPEMD160(SHA256(GetPubKey()))
    Hash160 GetPubKeyHash() const;
    
    std::string ToHex() const { return point_.ToHex(); }
    
    bool operator==(const PublicKey& other) const { return point_ == other.point_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    EcPoint point_;
};

// ============================================================================
// Derivation
// ============================================================================

/**
 * Compute d * G, tagged uncompressed.
 *
 * When bitlen(d) exceeds bitlen(n), d is reduced modulo n first. Throws
 * InvalidKeyError when d is congruent to zero (no affine point).
 */
EcPoint DerivePublicPoint(const Scalar& d);

// ============================================================================
// KeyPair
// ============================================================================

/// A private key and the public key derived from it
class KeyPair {
public:
    /// Maximum candidates drawn by Generate() before giving up
    static constexpr int MAX_GENERATE_ATTEMPTS = 64;
    
    /// Fresh key pair from the given entropy source, tagged compressed
    static KeyPair Generate(EntropySource& entropy);
    
    /// Fresh key pair from OS entropy, tagged compressed
    static KeyPair Generate();
    
    /**
     * Key pair from a private scalar.
     *
     * Scalars not below n are reduced modulo n. Throws InvalidKeyError when
     * the scalar is absent or the reduced value is rejected by PrivateKey.
     */
    static KeyPair FromPrivateScalar(const std::optional<Scalar>& d, bool compressed,
                                     const KeyPolicy& policy = KeyPolicy());
    
    /// Key pair from unsigned big-endian scalar bytes
    static KeyPair FromPrivateBytes(const Bytes& bytes, bool compressed = true,
                                    const KeyPolicy& policy = KeyPolicy());
    
    const PrivateKey& GetPrivateKey() const { return priv_; }
    const PublicKey& GetPublicKey() const { return pub_; }
    bool IsCompressed() const { return pub_.IsCompressed(); }
    
    bool operator==(const KeyPair& other) const {
        return priv_ == other.priv_ && pub_ == other.pub_;
    }
    bool operator!=(const KeyPair& other) const { return !(*this == other); }

private:
    KeyPair(PrivateKey priv, PublicKey pub)
        : priv_(std::move(priv)), pub_(std::move(pub)) {}
    
    PrivateKey priv_;
    PublicKey pub_;
};

} // namespace coinkey

#endif // COINKEY_CRYPTO_KEYS_H
