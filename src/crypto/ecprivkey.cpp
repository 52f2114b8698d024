// COINKEY - EC Private Key Records Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/crypto/ecprivkey.h"
#include "coinkey/crypto/curve.h"
#include "coinkey/crypto/errors.h"
#include "coinkey/core/hex.h"
#include "coinkey/util/logging.h"
#include "openssl_util.h"

#include <cstring>
#include <string>

#include <openssl/asn1.h>
#include <openssl/crypto.h>
#include <openssl/err.h>

namespace coinkey {

namespace {

// ============================================================================
// Encoding Helpers
// ============================================================================

/// Wrap a DER encoding in an explicit constructed context tag
Bytes WrapExplicit(int tag, const Bytes& inner) {
    int total = ASN1_object_size(1, static_cast<int>(inner.size()), tag);
    if (total <= 0) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_object_size");
    }
    
    Bytes out(static_cast<size_t>(total));
    unsigned char* p = out.data();
    ASN1_put_object(&p, 1, static_cast<int>(inner.size()), tag, V_ASN1_CONTEXT_SPECIFIC);
    std::memcpy(p, inner.data(), inner.size());
    return out;
}

/// DER encoding of a BIT STRING with zero unused bits
Bytes EncodeBitString(const Bytes& bits) {
    detail::ASN1StringPtr str(ASN1_BIT_STRING_new());
    if (!str || ASN1_BIT_STRING_set(str.get(), const_cast<unsigned char*>(bits.data()),
                                    static_cast<int>(bits.size())) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_BIT_STRING_set");
    }
    // Keep trailing zero bits: the key is octet-aligned
    str->flags &= ~(ASN1_STRING_FLAG_BITS_LEFT | 0x07);
    str->flags |= ASN1_STRING_FLAG_BITS_LEFT;
    
    unsigned char* der = nullptr;
    int len = i2d_ASN1_BIT_STRING(str.get(), &der);
    if (len <= 0) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "i2d_ASN1_BIT_STRING");
    }
    detail::OpenSSLBuffer owner(der);
    return Bytes(der, der + len);
}

/// Append an element to the sequence, taking ownership
void PushElement(ASN1_SEQUENCE_ANY* seq, detail::ASN1TypePtr element) {
    if (sk_ASN1_TYPE_push(seq, element.get()) <= 0) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "sk_ASN1_TYPE_push");
    }
    element.release();
}

/// ASN1_TYPE holding a pre-encoded TLV, written out verbatim
detail::ASN1TypePtr RawElement(const Bytes& der) {
    detail::ASN1StringPtr str(ASN1_STRING_new());
    if (!str || ASN1_STRING_set(str.get(), der.data(), static_cast<int>(der.size())) != 1) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_STRING_set");
    }
    detail::ASN1TypePtr type(ASN1_TYPE_new());
    if (!type) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_TYPE_new");
    }
    ASN1_TYPE_set(type.get(), V_ASN1_OTHER, str.release());
    return type;
}

// ============================================================================
// Decoding Helpers
// ============================================================================

[[noreturn]] void Malformed(const std::string& reason) {
    ERR_clear_error();
    LOG_DEBUG(util::LogCategory::ASN1) << "Malformed EC private key record: " << reason;
    throw MalformedRecordError("malformed EC private key record: " + reason);
}

/**
 * Open an explicitly tagged element. Checks the context class, the tag
 * number and the constructed bit, and returns the content octets.
 */
Bytes OpenExplicit(const ASN1_TYPE* element, int expectedTag, const char* name) {
    if (element->type != V_ASN1_OTHER) {
        Malformed(std::string(name) + " is not a context-tagged element");
    }
    
    const ASN1_STRING* raw = element->value.asn1_string;
    const unsigned char* p = ASN1_STRING_get0_data(raw);
    const unsigned char* end = p + ASN1_STRING_length(raw);
    long contentLen = 0;
    int tag = 0;
    int cls = 0;
    
    int ret = ASN1_get_object(&p, &contentLen, &tag, &cls, ASN1_STRING_length(raw));
    if (ret & 0x80) {
        Malformed(std::string(name) + " has an invalid header");
    }
    if (cls != V_ASN1_CONTEXT_SPECIFIC) {
        Malformed(std::string(name) + " is not context-specific");
    }
    if (tag != expectedTag) {
        Malformed(std::string(name) + " has tag [" + std::to_string(tag) + "], expected [" +
                  std::to_string(expectedTag) + "]");
    }
    if (!(ret & V_ASN1_CONSTRUCTED)) {
        Malformed(std::string(name) + " is not an explicit (constructed) tag");
    }
    if (contentLen < 0 || p + contentLen != end) {
        Malformed(std::string(name) + " has an inconsistent length");
    }
    
    return Bytes(p, end);
}

/// Public key bytes from the content of the [1] element
Bytes ParsePublicKeyBits(const Bytes& content) {
    const unsigned char* p = content.data();
    const unsigned char* end = p + content.size();
    
    detail::ASN1StringPtr bits(d2i_ASN1_BIT_STRING(nullptr, &p, static_cast<long>(content.size())));
    if (!bits) {
        Malformed("public key is not a BIT STRING");
    }
    if (p != end) {
        Malformed("trailing data after public key BIT STRING");
    }
    if ((bits->flags & ASN1_STRING_FLAG_BITS_LEFT) && (bits->flags & 0x07) != 0) {
        Malformed("public key BIT STRING has unused bits");
    }
    
    const unsigned char* data = ASN1_STRING_get0_data(bits.get());
    return Bytes(data, data + ASN1_STRING_length(bits.get()));
}

} // anonymous namespace

// ============================================================================
// Encode
// ============================================================================

Bytes ToRecord(const KeyPair& keys) {
    const CurveParameters& curve = CurveParameters::Get();
    
    detail::ASN1SequencePtr seq(sk_ASN1_TYPE_new_null());
    if (!seq) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "sk_ASN1_TYPE_new_null");
    }
    
    // version
    {
        detail::ASN1IntegerPtr version(ASN1_INTEGER_new());
        if (!version || ASN1_INTEGER_set(version.get(), ecprivkey::VERSION) != 1) {
            detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_INTEGER_set");
        }
        detail::ASN1TypePtr element(ASN1_TYPE_new());
        if (!element) {
            detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_TYPE_new");
        }
        ASN1_TYPE_set(element.get(), V_ASN1_INTEGER, version.release());
        PushElement(seq.get(), std::move(element));
    }
    
    // privateKey
    {
        Bytes priv = keys.GetPrivateKey().GetPrivKeyBytes();
        detail::ASN1StringPtr octets(ASN1_OCTET_STRING_new());
        bool ok = octets && ASN1_OCTET_STRING_set(octets.get(), priv.data(),
                                                  static_cast<int>(priv.size())) == 1;
        OPENSSL_cleanse(priv.data(), priv.size());
        if (!ok) {
            detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_OCTET_STRING_set");
        }
        detail::ASN1TypePtr element(ASN1_TYPE_new());
        if (!element) {
            detail::ThrowOpenSSLError(util::LogCategory::ASN1, "ASN1_TYPE_new");
        }
        ASN1_TYPE_set(element.get(), V_ASN1_OCTET_STRING, octets.release());
        PushElement(seq.get(), std::move(element));
    }
    
    // [0] parameters, [1] publicKey
    PushElement(seq.get(), RawElement(WrapExplicit(ecprivkey::PARAMETERS_TAG,
                                                   curve.EncodedParameters())));
    PushElement(seq.get(), RawElement(WrapExplicit(ecprivkey::PUBLIC_KEY_TAG,
                                                   EncodeBitString(keys.GetPublicKey().GetPubKey()))));
    
    unsigned char* der = nullptr;
    int len = i2d_ASN1_SEQUENCE_ANY(seq.get(), &der);
    if (len <= 0) {
        detail::ThrowOpenSSLError(util::LogCategory::ASN1, "i2d_ASN1_SEQUENCE_ANY");
    }
    detail::OpenSSLBuffer owner(der);
    Bytes record(der, der + len);
    OPENSSL_cleanse(der, static_cast<size_t>(len));
    
    LogDebugF(util::LogCategory::ASN1, "Encoded EC private key record (%zu bytes, %s)",
              record.size(), keys.IsCompressed() ? "compressed" : "uncompressed");
    return record;
}

// ============================================================================
// Decode
// ============================================================================

KeyPair FromRecord(const Byte* data, size_t len, const KeyPolicy& policy) {
    if (len == 0) {
        Malformed("empty input");
    }
    
    const unsigned char* p = data;
    detail::ASN1SequencePtr seq(d2i_ASN1_SEQUENCE_ANY(nullptr, &p, static_cast<long>(len)));
    if (!seq) {
        Malformed("not a DER SEQUENCE");
    }
    if (p != data + len) {
        Malformed(std::to_string((data + len) - p) + " trailing byte(s) after SEQUENCE");
    }
    
    int count = sk_ASN1_TYPE_num(seq.get());
    if (count != ecprivkey::FIELD_COUNT) {
        Malformed("expected " + std::to_string(ecprivkey::FIELD_COUNT) + " elements, got " +
                  std::to_string(count));
    }
    
    // version
    const ASN1_TYPE* version = sk_ASN1_TYPE_value(seq.get(), 0);
    if (version->type != V_ASN1_INTEGER) {
        Malformed("version is not an INTEGER");
    }
    int64_t versionValue = 0;
    if (ASN1_INTEGER_get_int64(&versionValue, version->value.integer) != 1 ||
        versionValue != ecprivkey::VERSION) {
        Malformed("unsupported version");
    }
    
    // privateKey
    const ASN1_TYPE* privElement = sk_ASN1_TYPE_value(seq.get(), 1);
    if (privElement->type != V_ASN1_OCTET_STRING) {
        Malformed("private key is not an OCTET STRING");
    }
    const ASN1_OCTET_STRING* privOctets = privElement->value.octet_string;
    int privLen = ASN1_STRING_length(privOctets);
    if (privLen < 1 || privLen > static_cast<int>(secp256k1::PRIVATE_KEY_SIZE)) {
        Malformed("private key length " + std::to_string(privLen) + " out of range");
    }
    Scalar d = Scalar::FromBytes(ASN1_STRING_get0_data(privOctets), static_cast<size_t>(privLen));
    
    // [0] parameters
    OpenExplicit(sk_ASN1_TYPE_value(seq.get(), 2), ecprivkey::PARAMETERS_TAG, "parameters");
    
    // [1] publicKey
    Bytes pubBits = ParsePublicKeyBits(
        OpenExplicit(sk_ASN1_TYPE_value(seq.get(), 3), ecprivkey::PUBLIC_KEY_TAG, "public key"));
    
    if (pubBits.size() != secp256k1::COMPRESSED_PUBKEY_SIZE &&
        pubBits.size() != secp256k1::UNCOMPRESSED_PUBKEY_SIZE) {
        Malformed("public key length " + std::to_string(pubBits.size()) +
                  " is neither 33 nor 65");
    }
    
    Byte tag = pubBits[0];
    if (tag != EcPoint::TAG_COMPRESSED_EVEN && tag != EcPoint::TAG_COMPRESSED_ODD &&
        tag != EcPoint::TAG_UNCOMPRESSED) {
        LOG_DEBUG(util::LogCategory::ASN1) << "Unsupported public key encoding tag 0x"
                                           << BytesToHex(&tag, 1);
        throw UnsupportedEncodingError("unsupported public key encoding tag 0x" +
                                       BytesToHex(&tag, 1));
    }
    
    bool compressed = pubBits.size() == secp256k1::COMPRESSED_PUBKEY_SIZE;
    KeyPair keys = KeyPair::FromPrivateScalar(d, compressed, policy);
    
    if (keys.GetPublicKey().GetPubKey() != pubBits) {
        LOG_DEBUG(util::LogCategory::ASN1) << "Record public key " << BytesToHex(pubBits)
                                           << " differs from derived "
                                           << keys.GetPublicKey().ToHex();
        throw KeyMismatchError("public key in record does not match private key");
    }
    
    return keys;
}

} // namespace coinkey
