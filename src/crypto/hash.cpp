// COINKEY - Hash Functions Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/crypto/hash.h"
#include "coinkey/util/logging.h"
#include "openssl_util.h"

#include <openssl/evp.h>

namespace coinkey {

namespace {

/// EVP digest context bound to one algorithm
class EvpDigest {
public:
    explicit EvpDigest(const EVP_MD* md) : md_(md), ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            detail::ThrowOpenSSLError(util::LogCategory::HASH, "EVP_MD_CTX_new");
        }
        Reset();
    }
    
    void Reset() {
        if (EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
            detail::ThrowOpenSSLError(util::LogCategory::HASH, "EVP_DigestInit_ex");
        }
    }
    
    void Update(const Byte* data, size_t len) {
        if (len == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            detail::ThrowOpenSSLError(util::LogCategory::HASH, "EVP_DigestUpdate");
        }
    }
    
    void Final(Byte* out) {
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out, &outLen) != 1) {
            detail::ThrowOpenSSLError(util::LogCategory::HASH, "EVP_DigestFinal_ex");
        }
    }

private:
    const EVP_MD* md_;
    detail::MDCtxPtr ctx_;
};

} // anonymous namespace

// ============================================================================
// SHA256 Implementation
// ============================================================================

struct SHA256::Impl {
    EvpDigest digest{EVP_sha256()};
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256::SHA256(SHA256&& other) noexcept = default;
SHA256& SHA256::operator=(SHA256&& other) noexcept = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    impl_->digest.Update(data, len);
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    impl_->digest.Final(hash);
}

SHA256& SHA256::Reset() {
    impl_->digest.Reset();
    return *this;
}

// ============================================================================
// RIPEMD160 Implementation
// ============================================================================

struct RIPEMD160::Impl {
    EvpDigest digest{EVP_ripemd160()};
};

RIPEMD160::RIPEMD160() : impl_(std::make_unique<Impl>()) {}

RIPEMD160::~RIPEMD160() = default;

RIPEMD160::RIPEMD160(RIPEMD160&& other) noexcept = default;
RIPEMD160& RIPEMD160::operator=(RIPEMD160&& other) noexcept = default;

RIPEMD160& RIPEMD160::Write(const Byte* data, size_t len) {
    impl_->digest.Update(data, len);
    return *this;
}

void RIPEMD160::Finalize(Byte hash[OUTPUT_SIZE]) {
    impl_->digest.Final(hash);
}

RIPEMD160& RIPEMD160::Reset() {
    impl_->digest.Reset();
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

Hash160 RIPEMD160Hash(const Byte* data, size_t len) {
    Hash160 result;
    RIPEMD160().Write(data, len).Finalize(result.data());
    return result;
}

Hash160 ComputeHash160(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    return RIPEMD160Hash(sha.data(), sha.size());
}

} // namespace coinkey
