// COINKEY - OpenSSL Handle Helpers (internal)
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Owning smart pointers for the OpenSSL objects used by the crypto
// modules. Not installed; included only by src/crypto/*.cpp.

#ifndef COINKEY_SRC_CRYPTO_OPENSSL_UTIL_H
#define COINKEY_SRC_CRYPTO_OPENSSL_UTIL_H

#include <memory>

#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>

namespace coinkey {
namespace detail {

struct BNDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};

struct BNCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

struct ECPointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

struct MDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct ASN1TypeDeleter {
    void operator()(ASN1_TYPE* type) const { ASN1_TYPE_free(type); }
};

struct ASN1StringDeleter {
    void operator()(ASN1_STRING* str) const { ASN1_STRING_free(str); }
};

struct ASN1IntegerDeleter {
    void operator()(ASN1_INTEGER* value) const { ASN1_INTEGER_free(value); }
};

struct ASN1SequenceDeleter {
    void operator()(ASN1_SEQUENCE_ANY* seq) const {
        sk_ASN1_TYPE_pop_free(seq, ASN1_TYPE_free);
    }
};

struct OpenSSLBufferDeleter {
    void operator()(unsigned char* buf) const { OPENSSL_free(buf); }
};

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using ECPointPtr = std::unique_ptr<EC_POINT, ECPointDeleter>;
using MDCtxPtr = std::unique_ptr<EVP_MD_CTX, MDCtxDeleter>;
using ASN1TypePtr = std::unique_ptr<ASN1_TYPE, ASN1TypeDeleter>;
using ASN1StringPtr = std::unique_ptr<ASN1_STRING, ASN1StringDeleter>;
using ASN1IntegerPtr = std::unique_ptr<ASN1_INTEGER, ASN1IntegerDeleter>;
using ASN1SequencePtr = std::unique_ptr<ASN1_SEQUENCE_ANY, ASN1SequenceDeleter>;
using OpenSSLBuffer = std::unique_ptr<unsigned char, OpenSSLBufferDeleter>;

/// Log the pending OpenSSL error queue under `category` and throw
/// std::runtime_error. Used for allocation and internal framing failures only.
[[noreturn]] void ThrowOpenSSLError(const char* category, const char* what);

/// Allocate a BIGNUM or throw; failures are logged under `category`
BNPtr NewBN(const char* category);

/// Allocate a BN_CTX or throw
BNCtxPtr NewBNCtx(const char* category);

} // namespace detail
} // namespace coinkey

#endif // COINKEY_SRC_CRYPTO_OPENSSL_UTIL_H
