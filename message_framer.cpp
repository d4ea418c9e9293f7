#include "message_framer.hpp"
#include "checksum.hpp"

#include <iostream>
#include <string>

namespace framing {

    stego::StegoError frameMessage(const std::vector<uint8_t>& message,
                                   std::vector<uint8_t>& outPayload)
    {
        outPayload.clear();

        std::string digest = checksum::computeDigest(message);
        if (digest.size() != checksum::DIGEST_HEX_SIZE) {
            std::cerr << "[md5] cannot frame message without a digest\n";
            return stego::StegoError::DigestFailure;
        }

        outPayload.reserve(digest.size() + message.size());
        outPayload.insert(outPayload.end(), digest.begin(), digest.end());
        outPayload.insert(outPayload.end(), message.begin(), message.end());
        return stego::StegoError::None;
    }

    bool deframeMessage(const std::vector<uint8_t>& payload,
                        std::vector<uint8_t>& outBody)
    {
        if (payload.size() < checksum::DIGEST_HEX_SIZE) {
            outBody = payload;
            return false;
        }

        std::string digest(payload.begin(), payload.begin() + checksum::DIGEST_HEX_SIZE);
        outBody.assign(payload.begin() + checksum::DIGEST_HEX_SIZE, payload.end());

        return checksum::verifyDigest(outBody, digest);
    }

}
