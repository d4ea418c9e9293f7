#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "crypto.hpp"
#include "frame_index_channel.hpp"

namespace stego::tests {

namespace {
std::string encrypt(const crypto::CipherService& cipher, const std::string& text) {
    std::string envelope;
    EXPECT_EQ(cipher.encrypt(std::vector<uint8_t>(text.begin(), text.end()), envelope),
              StegoError::None);
    return envelope;
}
}  // namespace

class FrameIndexChannelTest : public ::testing::Test {
protected:
    crypto::CipherService cipher_{crypto::legacyCipherConfig()};
};

TEST_F(FrameIndexChannelTest, RoundTrip) {
    std::string envelope;
    ASSERT_EQ(frameindex::encodeFrameIndex(cipher_, {1, 4, 6, 7, 8}, envelope), StegoError::None);

    std::vector<int> frames;
    ASSERT_EQ(frameindex::decodeFrameIndex(cipher_, envelope, frames), StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{1, 4, 6, 7, 8}));
}

TEST_F(FrameIndexChannelTest, EncryptsTheListLiteral) {
    std::string envelope;
    ASSERT_EQ(frameindex::encodeFrameIndex(cipher_, {3, 5}, envelope), StegoError::None);

    std::vector<uint8_t> plain;
    ASSERT_EQ(cipher_.decrypt(envelope, plain), StegoError::None);
    EXPECT_EQ(std::string(plain.begin(), plain.end()), "[3, 5]");
}

TEST_F(FrameIndexChannelTest, DecodedListIsSortedAndUnique) {
    std::vector<int> frames;
    ASSERT_EQ(frameindex::decodeFrameIndex(cipher_, encrypt(cipher_, "[9, 2, 9, 4]"), frames),
              StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{2, 4, 9}));
}

TEST_F(FrameIndexChannelTest, FallsBackToRangeSpec) {
    std::vector<int> frames;
    ASSERT_EQ(frameindex::decodeFrameIndex(cipher_, encrypt(cipher_, "1-4, 10"), frames),
              StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{1, 2, 3, 4, 10}));
}

TEST_F(FrameIndexChannelTest, AcceptsSurroundingWhitespace) {
    std::vector<int> frames;
    const std::string revealed = "  " + encrypt(cipher_, " [7, 8]\n") + "\n";
    ASSERT_EQ(frameindex::decodeFrameIndex(cipher_, revealed, frames), StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{7, 8}));
}

TEST_F(FrameIndexChannelTest, AcceptsDoublyEncodedEnvelope) {
    const std::string envelope = encrypt(cipher_, "[0, 2]");
    const std::string wrapped =
        crypto::encodeBase64(std::vector<uint8_t>(envelope.begin(), envelope.end()));

    std::vector<int> frames;
    ASSERT_EQ(frameindex::decodeFrameIndex(cipher_, wrapped, frames), StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{0, 2}));
}

TEST_F(FrameIndexChannelTest, FailuresAreFrameIndexDecodeErrors) {
    std::vector<int> frames;
    EXPECT_EQ(frameindex::decodeFrameIndex(cipher_, "", frames), StegoError::FrameIndexDecode);
    EXPECT_EQ(frameindex::decodeFrameIndex(cipher_, "garbage!!", frames), StegoError::FrameIndexDecode);
    EXPECT_EQ(frameindex::decodeFrameIndex(cipher_, encrypt(cipher_, "not frames"), frames),
              StegoError::FrameIndexDecode);
    EXPECT_TRUE(frames.empty());

    crypto::CipherConfig other = crypto::legacyCipherConfig();
    other.nonce[0] ^= 0x01;
    const crypto::CipherService wrong(other);
    EXPECT_EQ(frameindex::decodeFrameIndex(wrong, encrypt(cipher_, "[1]"), frames),
              StegoError::FrameIndexDecode);
}

TEST(Utf8Tests, InvalidSequencesAreReplaced) {
    EXPECT_EQ(frameindex::sanitizeUtf8({'[', '1', ']'}), "[1]");
    EXPECT_EQ(frameindex::sanitizeUtf8({'a', 0xFF, 'b'}), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(frameindex::sanitizeUtf8({0xC3, 0xA9}), "\xC3\xA9");
    EXPECT_EQ(frameindex::sanitizeUtf8({0xC3}), "\xEF\xBF\xBD");
    // overlong encoding of '/'
    EXPECT_EQ(frameindex::sanitizeUtf8({0xC0, 0xAF}), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

}  // namespace stego::tests
