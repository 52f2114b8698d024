// COINKEY - Key Validation Errors
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Typed failures raised while constructing or importing keys from
// untrusted input. Internal OpenSSL failures are reported as plain
// std::runtime_error instead.

#ifndef COINKEY_CRYPTO_ERRORS_H
#define COINKEY_CRYPTO_ERRORS_H

#include <stdexcept>
#include <string>

namespace coinkey {

/// Base class for all key validation errors
class KeyError : public std::runtime_error {
public:
    explicit KeyError(const std::string& msg) : std::runtime_error(msg) {}
};

/// A required private scalar is absent, zero, or a rejected sentinel value,
/// or encoded public key bytes do not describe a curve point
class InvalidKeyError : public KeyError {
public:
    explicit InvalidKeyError(const std::string& msg) : KeyError(msg) {}
};

/// Structural violation in an EC private-key record
class MalformedRecordError : public KeyError {
public:
    explicit MalformedRecordError(const std::string& msg) : KeyError(msg) {}
};

/// Recognised but disallowed point encoding (infinity, hybrid)
class UnsupportedEncodingError : public KeyError {
public:
    explicit UnsupportedEncodingError(const std::string& msg) : KeyError(msg) {}
};

/// Public key carried by a record differs from the one derived from its scalar
class KeyMismatchError : public KeyError {
public:
    explicit KeyMismatchError(const std::string& msg) : KeyError(msg) {}
};

} // namespace coinkey

#endif // COINKEY_CRYPTO_ERRORS_H
