// COINKEY - secp256k1 Keys Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/crypto/keys.h"
#include "coinkey/crypto/curve.h"
#include "coinkey/crypto/errors.h"
#include "coinkey/crypto/hash.h"
#include "coinkey/util/config.h"
#include "coinkey/util/logging.h"
#include "openssl_util.h"

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/ec.h>

namespace coinkey {

namespace {

[[noreturn]] void RejectKey(const std::string& reason) {
    LOG_DEBUG(util::LogCategory::KEYS) << "Rejected private key: " << reason;
    throw InvalidKeyError(reason);
}

} // anonymous namespace

// ============================================================================
// KeyPolicy
// ============================================================================

KeyPolicy KeyPolicy::FromConfig(const util::ConfigManager& config) {
    KeyPolicy policy;
    policy.rejectSentinelOne = config.GetBool(util::ConfigKeys::STRICTSENTINEL, false) ||
                               config.GetBool(util::ConfigKeys::STRICT, false);
    return policy;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(Scalar d, const KeyPolicy& policy) : d_(std::move(d)) {
    if (d_.IsZero()) {
        RejectKey("private key scalar is zero");
    }
    if (policy.rejectSentinelOne && d_.IsOne()) {
        RejectKey("private key scalar is one");
    }
    if (!(d_ < CurveParameters::Get().Order())) {
        RejectKey("private key scalar is not below the curve order");
    }
}

Bytes PrivateKey::GetPrivKeyBytes() const {
    return EncodeScalar(d_, SIZE);
}

std::string PrivateKey::ToHex() const {
    Bytes bytes = GetPrivKeyBytes();
    std::string hex = BytesToHex(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return hex;
}

// ============================================================================
// PublicKey
// ============================================================================

PublicKey PublicKey::FromPublicOnly(const Byte* data, size_t len) {
    return PublicKey(EcPoint::Decode(data, len));
}

Hash160 PublicKey::GetPubKeyHash() const {
    return ComputeHash160(GetPubKey());
}

// ============================================================================
// Derivation
// ============================================================================

EcPoint DerivePublicPoint(const Scalar& d) {
    const CurveParameters& curve = CurveParameters::Get();
    
    const Scalar* k = &d;
    Scalar reduced;
    if (d.BitLength() > curve.OrderBitLength()) {
        reduced = d.Mod(curve.Order());
        k = &reduced;
        LogDebugF(util::LogCategory::KEYS, "Reduced %zu-bit scalar modulo the curve order",
                  d.BitLength());
    }
    
    const Bytes& mag = k->Magnitude();
    detail::BNPtr bn(BN_bin2bn(mag.data(), static_cast<int>(mag.size()), nullptr));
    if (!bn) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "BN_bin2bn");
    }
    BN_set_flags(bn.get(), BN_FLG_CONSTTIME);
    
    const EC_GROUP* group = curve.Group();
    detail::ECPointPtr point(EC_POINT_new(group));
    if (!point) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "EC_POINT_new");
    }
    detail::BNCtxPtr ctx = detail::NewBNCtx(util::LogCategory::KEYS);
    
    if (EC_POINT_mul(group, point.get(), bn.get(), nullptr, nullptr, ctx.get()) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "EC_POINT_mul");
    }
    
    if (EC_POINT_is_at_infinity(group, point.get())) {
        RejectKey("scalar is a multiple of the curve order");
    }
    
    EcPoint::Coordinate x{};
    EcPoint::Coordinate y{};
    detail::BNPtr bx = detail::NewBN(util::LogCategory::KEYS);
    detail::BNPtr by = detail::NewBN(util::LogCategory::KEYS);
    if (EC_POINT_get_affine_coordinates(group, point.get(), bx.get(), by.get(), ctx.get()) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "EC_POINT_get_affine_coordinates");
    }
    if (BN_bn2binpad(bx.get(), x.data(), static_cast<int>(x.size())) < 0 ||
        BN_bn2binpad(by.get(), y.data(), static_cast<int>(y.size())) < 0) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "BN_bn2binpad");
    }
    
    return EcPoint(x, y, false);
}

// ============================================================================
// KeyPair
// ============================================================================

KeyPair KeyPair::Generate(EntropySource& entropy) {
    const Scalar& order = CurveParameters::Get().Order();
    Byte candidate[PrivateKey::SIZE];
    
    for (int attempt = 0; attempt < MAX_GENERATE_ATTEMPTS; ++attempt) {
        entropy.GetBytes(candidate, sizeof(candidate));
        Scalar d = Scalar::FromBytes(candidate, sizeof(candidate));
        OPENSSL_cleanse(candidate, sizeof(candidate));
        
        if (d.IsZero() || !(d < order)) {
            continue;
        }
        
        PrivateKey priv(std::move(d));
        PublicKey pub(DerivePublicPoint(priv.GetScalar()).Compress());
        LOG_DEBUG(util::LogCategory::KEYS) << "Generated key pair after " << (attempt + 1)
                                           << " draw(s)";
        return KeyPair(std::move(priv), std::move(pub));
    }
    
    LOG_ERROR(util::LogCategory::KEYS) << "Entropy source produced no valid scalar in "
                                       << MAX_GENERATE_ATTEMPTS << " attempts";
    throw std::runtime_error("key generation failed: entropy source exhausted");
}

KeyPair KeyPair::Generate() {
    return Generate(GetOsEntropySource());
}

KeyPair KeyPair::FromPrivateScalar(const std::optional<Scalar>& d, bool compressed,
                                   const KeyPolicy& policy) {
    if (!d) {
        RejectKey("private key scalar is required");
    }
    
    const Scalar& order = CurveParameters::Get().Order();
    PrivateKey priv(*d < order ? *d : d->Mod(order), policy);
    PublicKey pub(DerivePublicPoint(priv.GetScalar()).WithCompression(compressed));
    return KeyPair(std::move(priv), std::move(pub));
}

KeyPair KeyPair::FromPrivateBytes(const Bytes& bytes, bool compressed, const KeyPolicy& policy) {
    return FromPrivateScalar(Scalar::FromBytes(bytes), compressed, policy);
}

} // namespace coinkey
