#include "frame_index_channel.hpp"
#include "frame_spec.hpp"

#include <algorithm>
#include <iostream>

namespace frameindex {

    using stego::StegoError;

    static const char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";

    // Length of the well-formed UTF-8 sequence at bytes[i], or 0.
    static size_t utf8SequenceLength(const std::vector<uint8_t>& bytes, size_t i) {
        uint8_t lead = bytes[i];
        size_t len = 0;
        uint32_t min = 0;
        uint32_t cp = 0;

        if (lead < 0x80) return 1;
        if ((lead & 0xE0) == 0xC0) { len = 2; min = 0x80;    cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; min = 0x800;   cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; min = 0x10000; cp = lead & 0x07; }
        else return 0;

        if (i + len > bytes.size()) return 0;
        for (size_t k = 1; k < len; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) return 0;
            cp = (cp << 6) | (bytes[i + k] & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
        return len;
    }

    std::string sanitizeUtf8(const std::vector<uint8_t>& bytes)
    {
        std::string out;
        out.reserve(bytes.size());

        size_t i = 0;
        while (i < bytes.size()) {
            size_t len = utf8SequenceLength(bytes, i);
            if (len == 0) {
                out += REPLACEMENT_CHAR;
                ++i;
                continue;
            }
            out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
            i += len;
        }
        return out;
    }

    StegoError encodeFrameIndex(const crypto::CipherService& cipher,
                                const std::vector<int>& frames,
                                std::string& outEnvelope)
    {
        std::string listed = framespec::formatFrameList(frames);
        std::vector<uint8_t> plain(listed.begin(), listed.end());
        return cipher.encrypt(plain, outEnvelope);
    }

    StegoError decodeFrameIndex(const crypto::CipherService& cipher,
                                const std::string& revealedText,
                                std::vector<int>& outFrames)
    {
        outFrames.clear();

        std::string envelope = framespec::trim(revealedText);
        std::vector<uint8_t> plain;

        StegoError err = cipher.decrypt(envelope, plain);
        if (err == StegoError::MalformedEnvelope || err == StegoError::AuthenticationError) {
            // side channel may carry Base64(envelope) instead of the envelope
            std::vector<uint8_t> inner;
            if (!crypto::decodeBase64(envelope, inner)) {
                std::cerr << "[frameindex] revealed text is not an envelope\n";
                return StegoError::FrameIndexDecode;
            }
            err = cipher.decrypt(std::string(inner.begin(), inner.end()), plain);
        }
        if (err != StegoError::None) {
            std::cerr << "[frameindex] decrypt failed: " << stego::errorName(err) << "\n";
            return StegoError::FrameIndexDecode;
        }

        std::string recovered = framespec::trim(sanitizeUtf8(plain));

        std::vector<int> frames;
        if (framespec::parseFrameListLiteral(recovered, frames) != StegoError::None &&
            framespec::parseFrameSpec(recovered, frames) != StegoError::None)
        {
            std::cerr << "[frameindex] could not parse frame indices from: '"
                      << recovered << "'\n";
            return StegoError::FrameIndexDecode;
        }

        std::sort(frames.begin(), frames.end());
        frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
        outFrames = std::move(frames);
        return StegoError::None;
    }

}
