// COINKEY - EC Point Values Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/crypto/ecpoint.h"
#include "coinkey/crypto/curve.h"
#include "coinkey/crypto/errors.h"
#include "coinkey/core/hex.h"
#include "coinkey/util/logging.h"
#include "openssl_util.h"

#include <algorithm>

#include <openssl/ec.h>
#include <openssl/err.h>

namespace coinkey {

namespace {

[[noreturn]] void RejectPoint(const std::string& reason) {
    LOG_DEBUG(util::LogCategory::KEYS) << "Rejected public key: " << reason;
    throw InvalidKeyError(reason);
}

} // anonymous namespace

EcPoint::EcPoint(const Coordinate& x, const Coordinate& y, bool compressed)
    : x_(x), y_(y), compressed_(compressed) {
    if (compressed_) {
        encoded_.reserve(secp256k1::COMPRESSED_PUBKEY_SIZE);
        encoded_.push_back((y_.back() & 1) ? TAG_COMPRESSED_ODD : TAG_COMPRESSED_EVEN);
        encoded_.insert(encoded_.end(), x_.begin(), x_.end());
    } else {
        encoded_.reserve(secp256k1::UNCOMPRESSED_PUBKEY_SIZE);
        encoded_.push_back(TAG_UNCOMPRESSED);
        encoded_.insert(encoded_.end(), x_.begin(), x_.end());
        encoded_.insert(encoded_.end(), y_.begin(), y_.end());
    }
}

EcPoint EcPoint::Decode(const Byte* data, size_t len) {
    if (len == 0) {
        RejectPoint("empty public key");
    }
    
    Byte tag = data[0];
    switch (tag) {
        case TAG_INFINITY:
        case TAG_HYBRID_EVEN:
        case TAG_HYBRID_ODD:
            LOG_DEBUG(util::LogCategory::KEYS) << "Unsupported point encoding tag 0x"
                                               << BytesToHex(&tag, 1);
            throw UnsupportedEncodingError("unsupported point encoding tag 0x" +
                                           BytesToHex(&tag, 1));
        case TAG_COMPRESSED_EVEN:
        case TAG_COMPRESSED_ODD:
            if (len != secp256k1::COMPRESSED_PUBKEY_SIZE) {
                RejectPoint("compressed public key must be 33 bytes, got " +
                            std::to_string(len));
            }
            break;
        case TAG_UNCOMPRESSED:
            if (len != secp256k1::UNCOMPRESSED_PUBKEY_SIZE) {
                RejectPoint("uncompressed public key must be 65 bytes, got " +
                            std::to_string(len));
            }
            break;
        default:
            RejectPoint("unknown point encoding tag 0x" + BytesToHex(&tag, 1));
    }
    
    const CurveParameters& curve = CurveParameters::Get();
    const EC_GROUP* group = curve.Group();
    
    detail::ECPointPtr point(EC_POINT_new(group));
    if (!point) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "EC_POINT_new");
    }
    detail::BNCtxPtr ctx = detail::NewBNCtx(util::LogCategory::KEYS);
    
    // oct2point rejects x >= p, x without a square root, and (x, y) off the curve
    if (EC_POINT_oct2point(group, point.get(), data, len, ctx.get()) != 1) {
        ERR_clear_error();
        RejectPoint("public key is not a point on secp256k1");
    }
    
    detail::BNPtr bx = detail::NewBN(util::LogCategory::KEYS);
    detail::BNPtr by = detail::NewBN(util::LogCategory::KEYS);
    if (EC_POINT_get_affine_coordinates(group, point.get(), bx.get(), by.get(), ctx.get()) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "EC_POINT_get_affine_coordinates");
    }
    
    Coordinate x{};
    Coordinate y{};
    if (BN_bn2binpad(bx.get(), x.data(), static_cast<int>(x.size())) < 0 ||
        BN_bn2binpad(by.get(), y.data(), static_cast<int>(y.size())) < 0) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "BN_bn2binpad");
    }
    
    return EcPoint(x, y, tag != TAG_UNCOMPRESSED);
}

EcPoint EcPoint::WithCompression(bool compressed) const {
    if (compressed == compressed_) {
        return *this;
    }
    return EcPoint(x_, y_, compressed);
}

std::string EcPoint::ToHex() const {
    return BytesToHex(encoded_);
}

} // namespace coinkey
