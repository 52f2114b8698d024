// COINKEY - Secure Random Number Generation Header
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Cryptographically secure random bytes from OS entropy, plus the
// EntropySource seam used by key generation.

#ifndef COINKEY_CORE_RANDOM_H
#define COINKEY_CORE_RANDOM_H

#include "coinkey/core/types.h"
#include <cstdint>
#include <cstddef>

namespace coinkey {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes.
/// Uses the OS entropy source (getrandom on Linux, arc4random on macOS/BSD).
/// Throws std::runtime_error if the OS source fails.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

// ============================================================================
// Entropy Sources
// ============================================================================

/**
 * Source of random bytes for key generation.
 *
 * Calls block until the requested bytes are available; there is no
 * cancellation.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;
    
    /// Fill buf with len random bytes
    virtual void GetBytes(uint8_t* buf, size_t len) = 0;
};

/// Entropy source backed by GetRandBytes()
class OsEntropySource : public EntropySource {
public:
    void GetBytes(uint8_t* buf, size_t len) override {
        GetRandBytes(buf, len);
    }
};

/// Shared OS entropy source
EntropySource& GetOsEntropySource();

// ============================================================================
// Internal Entropy Functions (Platform-Specific)
// ============================================================================

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace coinkey

#endif // COINKEY_CORE_RANDOM_H
