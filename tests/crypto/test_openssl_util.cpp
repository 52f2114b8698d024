// COINKEY - OpenSSL Helper Tests
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include <gtest/gtest.h>
#include "coinkey/util/logging.h"
#include "crypto/openssl_util.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/err.h>

namespace coinkey {
namespace test {

class OpenSSLErrorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ERR_clear_error();
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
        util::Logger::Instance().AddSink(std::make_shared<util::CallbackSink>(
            [this](const util::LogEntry& entry) { entries_.push_back(entry); },
            util::LogLevel::Trace));
    }
    
    void TearDown() override {
        util::Logger::Instance().ClearSinks();
    }
    
    std::vector<util::LogEntry> entries_;
};

TEST_F(OpenSSLErrorTest, ThrowsWithOperationName) {
    try {
        detail::ThrowOpenSSLError(util::LogCategory::KEYS, "EC_POINT_mul");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "EC_POINT_mul failed: no OpenSSL error queued");
    }
}

TEST_F(OpenSSLErrorTest, LogsUnderCallerCategory) {
    EXPECT_THROW(detail::ThrowOpenSSLError(util::LogCategory::HASH, "EVP_DigestInit_ex"),
                 std::runtime_error);
    EXPECT_THROW(detail::ThrowOpenSSLError(util::LogCategory::ASN1, "i2d_ASN1_SEQUENCE_ANY"),
                 std::runtime_error);
    
    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, util::LogLevel::Error);
    EXPECT_EQ(entries_[0].category, util::LogCategory::HASH);
    EXPECT_EQ(entries_[0].message.rfind("EVP_DigestInit_ex failed", 0), 0u);
    EXPECT_EQ(entries_[1].category, util::LogCategory::ASN1);
}

TEST_F(OpenSSLErrorTest, AllocatorsReturnHandles) {
    detail::BNPtr bn = detail::NewBN(util::LogCategory::KEYS);
    detail::BNCtxPtr ctx = detail::NewBNCtx(util::LogCategory::CURVE);
    EXPECT_TRUE(bn != nullptr);
    EXPECT_TRUE(ctx != nullptr);
    EXPECT_TRUE(entries_.empty());
}

} // namespace test
} // namespace coinkey
