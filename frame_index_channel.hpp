#ifndef FRAME_INDEX_CHANNEL_HPP
#define FRAME_INDEX_CHANNEL_HPP

#include "crypto.hpp"
#include "stego_error.hpp"

#include <string>
#include <vector>

namespace frameindex {

    // Encrypts formatFrameList(frames) for the side channel.
    stego::StegoError encodeFrameIndex(const crypto::CipherService& cipher,
                                       const std::vector<int>& frames,
                                       std::string& outEnvelope);

    // Inverse of encodeFrameIndex. Also accepts an envelope that was Base64
    // encoded a second time, and a decrypted "1-48" style spec instead of a
    // list literal. Output is sorted and deduplicated.
    // Every failure is reported as FrameIndexDecode.
    stego::StegoError decodeFrameIndex(const crypto::CipherService& cipher,
                                       const std::string& revealedText,
                                       std::vector<int>& outFrames);

    // Invalid UTF-8 sequences become U+FFFD.
    std::string sanitizeUtf8(const std::vector<uint8_t>& bytes);
}

#endif // FRAME_INDEX_CHANNEL_HPP
