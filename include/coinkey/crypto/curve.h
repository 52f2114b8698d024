// COINKEY - secp256k1 Curve Parameters
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Standard secp256k1 constants and the process-wide OpenSSL group used
// for derivation and point validation.

#ifndef COINKEY_CRYPTO_CURVE_H
#define COINKEY_CRYPTO_CURVE_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <memory>
#include <vector>
#include "coinkey/core/types.h"
#include "coinkey/crypto/scalar.h"

#include <openssl/ec.h>

namespace coinkey {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key size (32 bytes)
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Field element / coordinate size (32 bytes)
constexpr size_t COORDINATE_SIZE = 32;

/// Compressed public key size (33 bytes: 0x02/0x03 + 32 bytes X)
constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

/// Uncompressed public key size (65 bytes: 0x04 + 32 bytes X + 32 bytes Y)
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Field size p (prime)
extern const std::array<uint8_t, 32> FIELD_PRIME;

/// Curve order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// Generator point G (compressed)
extern const std::array<uint8_t, 33> GENERATOR_COMPRESSED;

/// Generator point G (uncompressed)
extern const std::array<uint8_t, 65> GENERATOR_UNCOMPRESSED;

/// Curve parameter a (= 0 for secp256k1)
constexpr uint32_t CURVE_A = 0;

/// Curve parameter b (= 7 for secp256k1)
constexpr uint32_t CURVE_B = 7;

/// Cofactor h
constexpr uint32_t COFACTOR = 1;

} // namespace secp256k1

// ============================================================================
// Curve Parameters
// ============================================================================

/**
 * Process-wide secp256k1 domain parameters.
 *
 * Built once on first use and immutable afterwards. The group carries the
 * explicit-parameter ASN.1 flag and the uncompressed point form, so its
 * encoded ECParameters are the full SpecifiedECDomain structure. The
 * OpenSSL curve is checked against the constants above when built;
 * a mismatch is a fatal std::runtime_error.
 */
class CurveParameters {
public:
    /// The shared instance
    static const CurveParameters& Get();
    
    ~CurveParameters();
    
    CurveParameters(const CurveParameters&) = delete;
    CurveParameters& operator=(const CurveParameters&) = delete;
    
    /// OpenSSL group (read-only; generator precomputation done)
    const EC_GROUP* Group() const { return group_.get(); }
    
    /// Curve order n
    const Scalar& Order() const { return order_; }
    
    /// Bit length of n (256)
    size_t OrderBitLength() const { return orderBits_; }
    
    /// DER encoding of the explicit ECParameters
    const Bytes& EncodedParameters() const { return encodedParams_; }
    
    /// Generator in uncompressed form
    const Bytes& GeneratorUncompressed() const { return generator_; }

private:
    CurveParameters();
    
    struct GroupDeleter {
        void operator()(EC_GROUP* group) const;
    };
    
    std::unique_ptr<EC_GROUP, GroupDeleter> group_;
    Scalar order_;
    size_t orderBits_{0};
    Bytes encodedParams_;
    Bytes generator_;
};

} // namespace coinkey

#endif // COINKEY_CRYPTO_CURVE_H
