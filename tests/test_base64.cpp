#include <gtest/gtest.h>
#include <stdexcept>

#include "realtime/base64.hpp"

using Realtime::base64Decode;
using Realtime::base64Encode;

namespace {
std::vector<std::uint8_t> bytesOf(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
} // namespace

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(base64Encode(bytesOf("")), "");
    EXPECT_EQ(base64Encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(bytesOf("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, EncodesBinaryPcm) {
    std::vector<std::uint8_t> pcm = {0x00, 0x01, 0x02, 0xFF, 0xFE};
    EXPECT_EQ(base64Encode(pcm), "AAEC//4=");
}

TEST(Base64Test, DecodesPaddedInput) {
    EXPECT_EQ(base64Decode("Zm8="), bytesOf("fo"));
    EXPECT_EQ(base64Decode("Zg=="), bytesOf("f"));
    EXPECT_EQ(base64Decode("AAEC//4="), (std::vector<std::uint8_t>{0x00, 0x01, 0x02, 0xFF, 0xFE}));
}

TEST(Base64Test, DecodeSkipsLineBreaks) {
    EXPECT_EQ(base64Decode("Zm9v\r\nYmFy"), bytesOf("foobar"));
}

TEST(Base64Test, DecodeRejectsForeignCharacters) {
    EXPECT_THROW(base64Decode("Zm9v*mFy"), std::invalid_argument);
}
