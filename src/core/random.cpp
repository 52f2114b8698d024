// COINKEY - Secure Random Number Generation Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/core/random.h"
#include <cerrno>
#include <stdexcept>

// Platform-specific includes
#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace coinkey {

namespace detail {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    // getrandom() may return short reads for large requests or on EINTR
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        filled += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;

#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

// ============================================================================
// Core Random Functions
// ============================================================================

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

EntropySource& GetOsEntropySource() {
    static OsEntropySource source;
    return source;
}

} // namespace coinkey
