// COINKEY - OpenSSL Handle Helpers (internal)
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "openssl_util.h"
#include "coinkey/util/logging.h"

#include <stdexcept>
#include <string>

#include <openssl/err.h>

namespace coinkey {
namespace detail {

void ThrowOpenSSLError(const char* category, const char* what) {
    std::string reason;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!reason.empty()) {
            reason += "; ";
        }
        reason += buf;
    }
    
    if (reason.empty()) {
        reason = "no OpenSSL error queued";
    }
    
    LOG_ERROR(category) << what << " failed: " << reason;
    throw std::runtime_error(std::string(what) + " failed: " + reason);
}

BNPtr NewBN(const char* category) {
    BNPtr bn(BN_new());
    if (!bn) {
        ThrowOpenSSLError(category, "BN_new");
    }
    return bn;
}

BNCtxPtr NewBNCtx(const char* category) {
    BNCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        ThrowOpenSSLError(category, "BN_CTX_new");
    }
    return ctx;
}

} // namespace detail
} // namespace coinkey
