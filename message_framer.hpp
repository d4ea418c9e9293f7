#ifndef MESSAGE_FRAMER_HPP
#define MESSAGE_FRAMER_HPP

#include "stego_error.hpp"

#include <vector>
#include <cstdint>

namespace framing {

    // outPayload = digest(message) || message, digest first (32 hex chars).
    // DigestFailure if MD5 cannot be computed; outPayload is left empty.
    stego::StegoError frameMessage(const std::vector<uint8_t>& message,
                                   std::vector<uint8_t>& outPayload);

    // Splits off the 32-char digest and checks it against the rest.
    // A mismatch is reported through the return value only; outBody is always
    // filled (whole payload if it is shorter than a digest).
    bool deframeMessage(const std::vector<uint8_t>& payload,
                        std::vector<uint8_t>& outBody);
}

#endif // MESSAGE_FRAMER_HPP
