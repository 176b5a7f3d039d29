#include <gtest/gtest.h>
#include "common/crypto.hpp"

using namespace agentrelay;

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
    }
};

TEST_F(CryptoTest, RandomBytesLength) {
    EXPECT_EQ(crypto::random_bytes(32).size(), 32u);
    EXPECT_TRUE(crypto::random_bytes(0).empty());
}

TEST_F(CryptoTest, RandomBytesDiffer) {
    EXPECT_NE(crypto::random_bytes(32), crypto::random_bytes(32));
}

TEST_F(CryptoTest, HexEncoding) {
    const uint8_t data[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(crypto::to_hex(data, sizeof(data)), "000fa0ff");
    EXPECT_EQ(crypto::to_hex(data, 0), "");
}

TEST_F(CryptoTest, RandomHexIsLowercaseHex) {
    auto hex = crypto::random_hex(16);
    EXPECT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}
