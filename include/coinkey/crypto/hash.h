// COINKEY - Hash Functions
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// SHA-256 and RIPEMD-160 through OpenSSL EVP digests, and the
// Bitcoin-style Hash160 used for public key hashes.

#ifndef COINKEY_CRYPTO_HASH_H
#define COINKEY_CRYPTO_HASH_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "coinkey/core/types.h"

namespace coinkey {

// ============================================================================
// SHA-256
// ============================================================================

/// SHA-256 hasher with incremental Write/Finalize
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(SHA256&& other) noexcept;
    SHA256& operator=(SHA256&& other) noexcept;
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    
    /// Finalize the hash and write to output (OUTPUT_SIZE bytes).
    /// The hasher must be Reset() before it is reused.
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// RIPEMD-160
// ============================================================================

/// RIPEMD-160 hasher with incremental Write/Finalize
class RIPEMD160 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 20;
    
    RIPEMD160();
    ~RIPEMD160();
    
    RIPEMD160(RIPEMD160&& other) noexcept;
    RIPEMD160& operator=(RIPEMD160&& other) noexcept;
    RIPEMD160(const RIPEMD160&) = delete;
    RIPEMD160& operator=(const RIPEMD160&) = delete;
    
    RIPEMD160& Write(const Byte* data, size_t len);
    void Finalize(Byte hash[OUTPUT_SIZE]);
    RIPEMD160& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute RIPEMD160 hash of data in a single call
Hash160 RIPEMD160Hash(const Byte* data, size_t len);

inline Hash160 RIPEMD160Hash(const std::vector<Byte>& data) {
    return RIPEMD160Hash(data.data(), data.size());
}

/// RIPEMD160(SHA256(data)), the public key hash
Hash160 ComputeHash160(const Byte* data, size_t len);

inline Hash160 ComputeHash160(const std::vector<Byte>& data) {
    return ComputeHash160(data.data(), data.size());
}

} // namespace coinkey

#endif // COINKEY_CRYPTO_HASH_H
