// COINKEY - EC Private Key Records
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// The legacy ASN.1 EC_PRIVATEKEY record written by OpenSSL and Bitcoin
// Core wallets:
//
//   SEQUENCE {
//     version     INTEGER (1),
//     privateKey  OCTET STRING (32 bytes),
//     [0] EXPLICIT ECParameters,
//     [1] EXPLICIT BIT STRING (33 or 65 byte public key)
//   }

#ifndef COINKEY_CRYPTO_ECPRIVKEY_H
#define COINKEY_CRYPTO_ECPRIVKEY_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "coinkey/core/types.h"
#include "coinkey/crypto/keys.h"

namespace coinkey {
namespace ecprivkey {

/// Record version
constexpr long VERSION = 1;

/// Context tag of the curve parameters element
constexpr int PARAMETERS_TAG = 0;

/// Context tag of the public key element
constexpr int PUBLIC_KEY_TAG = 1;

/// Number of elements in the outer sequence
constexpr int FIELD_COUNT = 4;

} // namespace ecprivkey

/**
 * Encode a key pair as a DER EC_PRIVATEKEY record.
 *
 * The public key is written in the key pair's current compression form.
 * OpenSSL failures are internal errors (std::runtime_error).
 */
Bytes ToRecord(const KeyPair& keys);

/**
 * Decode and cross-check a DER EC_PRIVATEKEY record.
 *
 * The key pair is re-derived from the record's scalar with
 * compressed = (public key length == 33) and its encoded public key must
 * equal the record's bit string byte for byte.
 *
 * @throws MalformedRecordError     structural violation
 * @throws UnsupportedEncodingError public key tag other than 02, 03 or 04
 * @throws KeyMismatchError         public key does not match the scalar
 * @throws InvalidKeyError          scalar rejected by PrivateKey
 */
KeyPair FromRecord(const Byte* data, size_t len, const KeyPolicy& policy = KeyPolicy());

inline KeyPair FromRecord(const std::vector<Byte>& data, const KeyPolicy& policy = KeyPolicy()) {
    return FromRecord(data.data(), data.size(), policy);
}

} // namespace coinkey

#endif // COINKEY_CRYPTO_ECPRIVKEY_H
