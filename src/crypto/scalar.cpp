// COINKEY - Scalar Values Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/crypto/scalar.h"
#include "coinkey/core/hex.h"
#include "coinkey/util/logging.h"
#include "openssl_util.h"

#include <algorithm>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/crypto.h>

namespace coinkey {

namespace {

detail::BNPtr ToBN(const Bytes& magnitude) {
    detail::BNPtr bn(BN_bin2bn(magnitude.data(), static_cast<int>(magnitude.size()), nullptr));
    if (!bn) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "BN_bin2bn");
    }
    return bn;
}

Bytes FromBN(const BIGNUM* bn) {
    Bytes out(static_cast<size_t>(BN_num_bytes(bn)));
    if (!out.empty()) {
        BN_bn2bin(bn, out.data());
    }
    return out;
}

} // anonymous namespace

Scalar::~Scalar() {
    if (!magnitude_.empty()) {
        OPENSSL_cleanse(magnitude_.data(), magnitude_.size());
    }
}

Scalar Scalar::FromBytes(const Byte* data, size_t len) {
    Scalar result;
    size_t start = 0;
    while (start < len && data[start] == 0) {
        ++start;
    }
    result.magnitude_.assign(data + start, data + len);
    return result;
}

Scalar Scalar::FromHex(const std::string& hex) {
    Bytes bytes = HexToBytes(hex);
    Scalar result = FromBytes(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return result;
}

Scalar Scalar::FromUint64(uint64_t value) {
    Byte buf[8];
    for (int i = 7; i >= 0; --i) {
        buf[i] = static_cast<Byte>(value & 0xff);
        value >>= 8;
    }
    return FromBytes(buf, sizeof(buf));
}

size_t Scalar::BitLength() const {
    if (magnitude_.empty()) {
        return 0;
    }
    size_t bits = (magnitude_.size() - 1) * 8;
    Byte top = magnitude_[0];
    while (top != 0) {
        ++bits;
        top >>= 1;
    }
    return bits;
}

Scalar Scalar::Mod(const Scalar& modulus) const {
    if (modulus.IsZero()) {
        throw std::invalid_argument("Scalar::Mod: zero modulus");
    }
    
    detail::BNPtr a = ToBN(magnitude_);
    detail::BNPtr m = ToBN(modulus.magnitude_);
    detail::BNPtr r = detail::NewBN(util::LogCategory::KEYS);
    detail::BNCtxPtr ctx = detail::NewBNCtx(util::LogCategory::KEYS);
    
    if (BN_nnmod(r.get(), a.get(), m.get(), ctx.get()) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "BN_nnmod");
    }
    
    Scalar result;
    result.magnitude_ = FromBN(r.get());
    return result;
}

Bytes Scalar::ToBytes(size_t width) const {
    return EncodeScalar(*this, width);
}

std::string Scalar::ToHex() const {
    if (magnitude_.empty()) {
        return "00";
    }
    return BytesToHex(magnitude_);
}

bool Scalar::operator<(const Scalar& other) const {
    if (magnitude_.size() != other.magnitude_.size()) {
        return magnitude_.size() < other.magnitude_.size();
    }
    return magnitude_ < other.magnitude_;
}

Bytes EncodeScalar(const Scalar& value, size_t width) {
    const Bytes& mag = value.Magnitude();
    Bytes out(width, 0);
    
    if (mag.size() >= width) {
        std::copy(mag.end() - static_cast<std::ptrdiff_t>(width), mag.end(), out.begin());
    } else {
        std::copy(mag.begin(), mag.end(), out.begin() + static_cast<std::ptrdiff_t>(width - mag.size()));
    }
    return out;
}

} // namespace coinkey
