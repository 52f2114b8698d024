// COINKEY - Key Tests
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include <gtest/gtest.h>
#include "coinkey/crypto/keys.h"
#include "coinkey/crypto/curve.h"
#include "coinkey/crypto/errors.h"
#include "coinkey/core/hex.h"
#include "coinkey/util/config.h"

#include <algorithm>
#include <deque>
#include <optional>
#include <stdexcept>
#include <vector>

namespace coinkey {
namespace test {

namespace {

const char* GX = "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
const char* GY = "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";

/// Entropy source replaying queued 32-byte candidates, then zeros
class ScriptedEntropy : public EntropySource {
public:
    void Push(const Bytes& candidate) { queue_.push_back(candidate); }
    
    void GetBytes(uint8_t* buf, size_t len) override {
        ++calls_;
        Bytes next = queue_.empty() ? Bytes(len, 0) : queue_.front();
        if (!queue_.empty()) {
            queue_.pop_front();
        }
        next.resize(len, 0);
        std::copy(next.begin(), next.end(), buf);
    }
    
    int Calls() const { return calls_; }

private:
    std::deque<Bytes> queue_;
    int calls_{0};
};

Scalar OrderMinus(uint64_t k) {
    Bytes n(secp256k1::CURVE_ORDER.begin(), secp256k1::CURVE_ORDER.end());
    // Low byte of n is 0x41, enough headroom for small k
    n.back() = static_cast<Byte>(n.back() - k);
    return Scalar::FromBytes(n);
}

} // namespace

// ============================================================================
// DerivePublicPoint
// ============================================================================

TEST(DeriveTest, OneIsGenerator) {
    EcPoint g = DerivePublicPoint(Scalar::FromUint64(1));
    EXPECT_EQ(g.GetEncoded(), CurveParameters::Get().GeneratorUncompressed());
    EXPECT_EQ(g.Compress().ToHex(), std::string("02") + GX);
    EXPECT_EQ(g.Decompress().ToHex(), std::string("04") + GX + GY);
}

TEST(DeriveTest, TwoAndThree) {
    EXPECT_EQ(DerivePublicPoint(Scalar::FromUint64(2)).ToHex(),
              "04c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
              "1ae168fea63dc339a3c58419466ceaeef7f632653266d0e1236431a950cfe52a");
    EXPECT_EQ(DerivePublicPoint(Scalar::FromUint64(3)).Compress().ToHex(),
              "02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9");
}

TEST(DeriveTest, OrderMinusOneIsNegatedGenerator) {
    EcPoint p = DerivePublicPoint(OrderMinus(1));
    EXPECT_EQ(p.Compress().ToHex(), std::string("03") + GX);
}

TEST(DeriveTest, Deterministic) {
    Scalar d = Scalar::FromHex("c0ffee0000000000000000000000000000000000000000000000000000c0ffee");
    EcPoint a = DerivePublicPoint(d);
    EcPoint b = DerivePublicPoint(d);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.Compress().GetEncoded(), b.Compress().GetEncoded());
}

TEST(DeriveTest, OversizedScalarIsReduced) {
    Bytes bytes(33, 0);
    bytes[0] = 0x01;
    bytes[32] = 0x05;
    Scalar big = Scalar::FromBytes(bytes);
    ASSERT_GT(big.BitLength(), CurveParameters::Get().OrderBitLength());
    
    EcPoint expected = DerivePublicPoint(big.Mod(CurveParameters::Get().Order()));
    EXPECT_EQ(DerivePublicPoint(big), expected);
    EXPECT_EQ(expected.Compress().ToHex(),
              "02dc7a0e31c63f7ad9cea8506497a2f1e5a2c30abe4c340a892d5f18f99aef3ae9");
}

TEST(DeriveTest, MultipleOfOrderIsInvalid) {
    EXPECT_THROW(DerivePublicPoint(Scalar()), InvalidKeyError);
    EXPECT_THROW(DerivePublicPoint(CurveParameters::Get().Order()), InvalidKeyError);
}

// ============================================================================
// PrivateKey
// ============================================================================

TEST(PrivateKeyTest, BytesAreFixedWidth) {
    PrivateKey key(Scalar::FromUint64(1));
    Bytes bytes = key.GetPrivKeyBytes();
    ASSERT_EQ(bytes.size(), PrivateKey::SIZE);
    EXPECT_EQ(bytes.back(), 0x01);
    EXPECT_EQ(key.ToHex(), std::string(62, '0') + "01");
}

TEST(PrivateKeyTest, RejectsZero) {
    EXPECT_THROW(PrivateKey{Scalar()}, InvalidKeyError);
}

TEST(PrivateKeyTest, RejectsOrderAndAbove) {
    EXPECT_THROW(PrivateKey{CurveParameters::Get().Order()}, InvalidKeyError);
    EXPECT_NO_THROW(PrivateKey{OrderMinus(1)});
}

TEST(PrivateKeyTest, SentinelOneDependsOnPolicy) {
    EXPECT_NO_THROW(PrivateKey{Scalar::FromUint64(1)});
    
    KeyPolicy strict;
    strict.rejectSentinelOne = true;
    EXPECT_THROW((PrivateKey{Scalar::FromUint64(1), strict}), InvalidKeyError);
    EXPECT_NO_THROW((PrivateKey{Scalar::FromUint64(2), strict}));
}

// ============================================================================
// KeyPolicy
// ============================================================================

TEST(KeyPolicyTest, DefaultsToLenient) {
    util::ConfigManager config;
    EXPECT_FALSE(KeyPolicy::FromConfig(config).rejectSentinelOne);
}

TEST(KeyPolicyTest, StrictSentinelFromConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("strictsentinel=1\n").success);
    EXPECT_TRUE(KeyPolicy::FromConfig(config).rejectSentinelOne);
    
    auto strict = KeyPolicy::FromConfig(config);
    EXPECT_THROW(KeyPair::FromPrivateScalar(Scalar::FromUint64(1), true, strict),
                 InvalidKeyError);
}

TEST(KeyPolicyTest, StrictFlagFromCommandLine) {
    util::ConfigManager config;
    const char* argv[] = {"coinkey-tool", "--strict", "derive"};
    ASSERT_TRUE(config.ParseCommandLine(3, argv).success);
    EXPECT_TRUE(KeyPolicy::FromConfig(config).rejectSentinelOne);
}

// ============================================================================
// PublicKey
// ============================================================================

TEST(PublicKeyTest, FromPublicOnlyKeepsForm) {
    Bytes compressed(secp256k1::GENERATOR_COMPRESSED.begin(),
                     secp256k1::GENERATOR_COMPRESSED.end());
    PublicKey pub = PublicKey::FromPublicOnly(compressed);
    EXPECT_TRUE(pub.IsCompressed());
    EXPECT_EQ(pub.GetPubKey(), compressed);
    EXPECT_FALSE(pub.Decompress().IsCompressed());
    EXPECT_EQ(pub.Decompress().Compress(), pub);
}

TEST(PublicKeyTest, HashFollowsCurrentForm) {
    PublicKey pub(DerivePublicPoint(Scalar::FromUint64(1)));
    EXPECT_EQ(pub.GetPubKeyHash().ToHex(), "91b24bf9f5288532960ac687abb035127b1d28a5");
    EXPECT_EQ(pub.Compress().GetPubKeyHash().ToHex(),
              "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(PublicKeyTest, HashOfTwoG) {
    PublicKey pub(DerivePublicPoint(Scalar::FromUint64(2)).Compress());
    EXPECT_EQ(pub.GetPubKeyHash().ToHex(), "06afd46bcdfd22ef94ac122aa11f241244a37ecc");
}

// ============================================================================
// KeyPair
// ============================================================================

TEST(KeyPairTest, FromPrivateScalarTagsCompression) {
    KeyPair c = KeyPair::FromPrivateScalar(Scalar::FromUint64(1), true);
    KeyPair u = KeyPair::FromPrivateScalar(Scalar::FromUint64(1), false);
    EXPECT_TRUE(c.IsCompressed());
    EXPECT_FALSE(u.IsCompressed());
    EXPECT_EQ(c.GetPublicKey().ToHex(), std::string("02") + GX);
    EXPECT_EQ(u.GetPublicKey().ToHex(), std::string("04") + GX + GY);
    EXPECT_NE(c, u);
}

TEST(KeyPairTest, AbsentScalarIsInvalid) {
    EXPECT_THROW(KeyPair::FromPrivateScalar(std::nullopt, true), InvalidKeyError);
}

TEST(KeyPairTest, ZeroIsInvalid) {
    EXPECT_THROW(KeyPair::FromPrivateScalar(Scalar(), true), InvalidKeyError);
    EXPECT_THROW(KeyPair::FromPrivateScalar(CurveParameters::Get().Order(), true),
                 InvalidKeyError);
}

TEST(KeyPairTest, ScalarAboveOrderIsReduced) {
    Bytes n(secp256k1::CURVE_ORDER.begin(), secp256k1::CURVE_ORDER.end());
    n.back() = static_cast<Byte>(n.back() + 2);
    KeyPair keys = KeyPair::FromPrivateScalar(Scalar::FromBytes(n), true);
    EXPECT_EQ(keys, KeyPair::FromPrivateScalar(Scalar::FromUint64(2), true));
}

TEST(KeyPairTest, FromPrivateBytes) {
    Bytes bytes(32, 0);
    bytes[31] = 0x03;
    KeyPair keys = KeyPair::FromPrivateBytes(bytes);
    EXPECT_TRUE(keys.IsCompressed());
    EXPECT_EQ(keys.GetPublicKey().ToHex(),
              "02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9");
}

TEST(KeyPairTest, PublicMatchesDerivation) {
    Scalar d = Scalar::FromHex("1f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c5b6a7988");
    KeyPair keys = KeyPair::FromPrivateScalar(d, false);
    EXPECT_EQ(keys.GetPublicKey().GetPoint(), DerivePublicPoint(d));
}

TEST(KeyPairTest, GenerateSkipsOutOfRangeCandidates) {
    ScriptedEntropy entropy;
    entropy.Push(Bytes(32, 0x00));
    entropy.Push(Bytes(32, 0xff));
    Bytes one(32, 0);
    one[31] = 0x01;
    entropy.Push(one);
    
    KeyPair keys = KeyPair::Generate(entropy);
    EXPECT_EQ(entropy.Calls(), 3);
    EXPECT_TRUE(keys.IsCompressed());
    EXPECT_EQ(keys, KeyPair::FromPrivateScalar(Scalar::FromUint64(1), true));
}

TEST(KeyPairTest, GenerateFailsOnExhaustedEntropy) {
    ScriptedEntropy entropy;
    EXPECT_THROW(KeyPair::Generate(entropy), std::runtime_error);
    EXPECT_EQ(entropy.Calls(), KeyPair::MAX_GENERATE_ATTEMPTS);
}

TEST(KeyPairTest, GenerateFromOsEntropy) {
    KeyPair a = KeyPair::Generate();
    KeyPair b = KeyPair::Generate();
    EXPECT_TRUE(a.IsCompressed());
    EXPECT_NE(a.GetPrivateKey(), b.GetPrivateKey());
    EXPECT_EQ(a.GetPublicKey().GetPoint(),
              DerivePublicPoint(a.GetPrivateKey().GetScalar()).Compress());
}

} // namespace test
} // namespace coinkey
