// COINKEY - secp256k1 Curve Parameters Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/crypto/curve.h"
#include "coinkey/util/logging.h"
#include "openssl_util.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace coinkey {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> FIELD_PRIME = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFE, 0xFF, 0xFF, 0xFC, 0x2F
}};

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

const std::array<uint8_t, 33> GENERATOR_COMPRESSED = {{
    0x02,
    0x79, 0xBE, 0x66, 0x7E, 0xF9, 0xDC, 0xBB, 0xAC,
    0x55, 0xA0, 0x62, 0x95, 0xCE, 0x87, 0x0B, 0x07,
    0x02, 0x9B, 0xFC, 0xDB, 0x2D, 0xCE, 0x28, 0xD9,
    0x59, 0xF2, 0x81, 0x5B, 0x16, 0xF8, 0x17, 0x98
}};

const std::array<uint8_t, 65> GENERATOR_UNCOMPRESSED = {{
    0x04,
    0x79, 0xBE, 0x66, 0x7E, 0xF9, 0xDC, 0xBB, 0xAC,
    0x55, 0xA0, 0x62, 0x95, 0xCE, 0x87, 0x0B, 0x07,
    0x02, 0x9B, 0xFC, 0xDB, 0x2D, 0xCE, 0x28, 0xD9,
    0x59, 0xF2, 0x81, 0x5B, 0x16, 0xF8, 0x17, 0x98,
    0x48, 0x3A, 0xDA, 0x77, 0x26, 0xA3, 0xC4, 0x65,
    0x5D, 0xA4, 0xFB, 0xFC, 0x0E, 0x11, 0x08, 0xA8,
    0xFD, 0x17, 0xB4, 0x48, 0xA6, 0x85, 0x54, 0x19,
    0x9C, 0x47, 0xD0, 0x8F, 0xFB, 0x10, 0xD4, 0xB8
}};

} // namespace secp256k1

namespace {

Bytes BNToFixed(const BIGNUM* bn, size_t width) {
    Bytes out(width, 0);
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(width)) < 0) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "BN_bn2binpad");
    }
    return out;
}

/// Fail hard if OpenSSL's curve differs from the standard constants
void CheckStandardParameter(const char* name, const Bytes& actual, const uint8_t* expected,
                            size_t len) {
    if (actual.size() != len || !std::equal(actual.begin(), actual.end(), expected)) {
        LOG_FATAL(util::LogCategory::CURVE) << "secp256k1 " << name
            << " mismatch: " << BytesToHex(actual);
        throw std::runtime_error(std::string("secp256k1 ") + name +
                                 " does not match the standard curve");
    }
}

} // anonymous namespace

void CurveParameters::GroupDeleter::operator()(EC_GROUP* group) const {
    EC_GROUP_free(group);
}

CurveParameters::CurveParameters() {
    util::ScopedLogTimer timer(util::LogCategory::CURVE, "secp256k1 initialisation");
    
    group_.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group_) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "EC_GROUP_new_by_curve_name(secp256k1)");
    }
    
    EC_GROUP_set_asn1_flag(group_.get(), OPENSSL_EC_EXPLICIT_CURVE);
    EC_GROUP_set_point_conversion_form(group_.get(), POINT_CONVERSION_UNCOMPRESSED);
    
    detail::BNCtxPtr ctx = detail::NewBNCtx(util::LogCategory::CURVE);
    detail::BNPtr p = detail::NewBN(util::LogCategory::CURVE);
    detail::BNPtr a = detail::NewBN(util::LogCategory::CURVE);
    detail::BNPtr b = detail::NewBN(util::LogCategory::CURVE);
    
    if (EC_GROUP_get_curve(group_.get(), p.get(), a.get(), b.get(), ctx.get()) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "EC_GROUP_get_curve");
    }
    
    const BIGNUM* n = EC_GROUP_get0_order(group_.get());
    const EC_POINT* g = EC_GROUP_get0_generator(group_.get());
    if (!n || !g) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "EC_GROUP_get0_order/generator");
    }
    
    generator_.resize(secp256k1::UNCOMPRESSED_PUBKEY_SIZE);
    if (EC_POINT_point2oct(group_.get(), g, POINT_CONVERSION_UNCOMPRESSED,
                           generator_.data(), generator_.size(), ctx.get()) != generator_.size()) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "EC_POINT_point2oct(generator)");
    }
    
    Bytes orderBytes = BNToFixed(n, secp256k1::PRIVATE_KEY_SIZE);
    
    CheckStandardParameter("field prime", BNToFixed(p.get(), secp256k1::COORDINATE_SIZE),
                           secp256k1::FIELD_PRIME.data(), secp256k1::FIELD_PRIME.size());
    CheckStandardParameter("order", orderBytes,
                           secp256k1::CURVE_ORDER.data(), secp256k1::CURVE_ORDER.size());
    CheckStandardParameter("generator", generator_,
                           secp256k1::GENERATOR_UNCOMPRESSED.data(),
                           secp256k1::GENERATOR_UNCOMPRESSED.size());
    if (!BN_is_zero(a.get()) || !BN_is_word(b.get(), secp256k1::CURVE_B)) {
        LOG_FATAL(util::LogCategory::CURVE) << "secp256k1 coefficients mismatch";
        throw std::runtime_error("secp256k1 coefficients do not match the standard curve");
    }
    
    order_ = Scalar::FromBytes(orderBytes);
    orderBits_ = static_cast<size_t>(BN_num_bits(n));
    
    if (EC_GROUP_precompute_mult(group_.get(), ctx.get()) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "EC_GROUP_precompute_mult");
    }
    
    unsigned char* der = nullptr;
    int derLen = i2d_ECPKParameters(group_.get(), &der);
    if (derLen <= 0) {
        detail::ThrowOpenSSLError(util::LogCategory::CURVE, "i2d_ECPKParameters");
    }
    detail::OpenSSLBuffer derOwner(der);
    encodedParams_.assign(der, der + derLen);
    
    LogDebugF(util::LogCategory::CURVE, "secp256k1 ready: order %zu bits, ECParameters %zu bytes",
              orderBits_, encodedParams_.size());
}

CurveParameters::~CurveParameters() = default;

const CurveParameters& CurveParameters::Get() {
    static const CurveParameters instance;
    return instance;
}

} // namespace coinkey
