#include <gtest/gtest.h>

#include <openssl/evp.h>

#include <string>
#include <vector>

#include "checksum.hpp"
#include "message_framer.hpp"

namespace stego::tests {

namespace {
std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> framed(const std::vector<uint8_t>& msg) {
    std::vector<uint8_t> payload;
    EXPECT_EQ(framing::frameMessage(msg, payload), StegoError::None);
    return payload;
}
}  // namespace

TEST(MessageFramerTests, DigestComesFirst) {
    const auto msg = bytes("Hello, world!");
    const auto payload = framed(msg);

    ASSERT_EQ(payload.size(), checksum::DIGEST_HEX_SIZE + msg.size());
    EXPECT_EQ(std::string(payload.begin(), payload.begin() + 32), "6cd3556deb0da54bca060b4c39479839");
    EXPECT_EQ(std::vector<uint8_t>(payload.begin() + 32, payload.end()), msg);
}

TEST(MessageFramerTests, DeframeOfFrameIsVerified) {
    const std::vector<std::vector<uint8_t>> inputs = {
        {},
        bytes("a"),
        bytes("Hello, AES GCM encryption!"),
        {0x00, 0xFF, 0xC3, 0x28},
    };
    for (const auto& msg : inputs) {
        std::vector<uint8_t> body;
        EXPECT_TRUE(framing::deframeMessage(framed(msg), body));
        EXPECT_EQ(body, msg);
    }
}

TEST(MessageFramerTests, ShortPayloadIsReturnedUnverified) {
    const auto payload = bytes("too short for a digest");
    std::vector<uint8_t> body;
    EXPECT_FALSE(framing::deframeMessage(payload, body));
    EXPECT_EQ(body, payload);
}

TEST(MessageFramerTests, MismatchStillReturnsBody) {
    auto payload = framed(bytes("original body"));
    payload.back() = '!';

    std::vector<uint8_t> body;
    EXPECT_FALSE(framing::deframeMessage(payload, body));
    EXPECT_EQ(body, bytes("original bod!"));
}

TEST(MessageFramerTests, DigestOnlyPayloadHasEmptyBody) {
    std::vector<uint8_t> body = bytes("stale");
    EXPECT_TRUE(framing::deframeMessage(bytes("d41d8cd98f00b204e9800998ecf8427e"), body));
    EXPECT_TRUE(body.empty());
}

#if OPENSSL_VERSION_MAJOR >= 3
// With only FIPS algorithms allowed MD5 cannot be fetched.
TEST(MessageFramerTests, UnavailableDigestIsAnError) {
    ASSERT_EQ(EVP_set_default_properties(nullptr, "fips=yes"), 1);
    std::vector<uint8_t> payload = bytes("stale");
    const StegoError err = framing::frameMessage(bytes("Hello"), payload);
    ASSERT_EQ(EVP_set_default_properties(nullptr, ""), 1);

    EXPECT_EQ(err, StegoError::DigestFailure);
    EXPECT_TRUE(payload.empty());
}
#endif

}  // namespace stego::tests
