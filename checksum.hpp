#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace checksum {

    static const size_t DIGEST_HEX_SIZE = 32;

    // MD5 of message, 32 lowercase hex chars.
    // Integrity only: MD5 gives no protection against a deliberate forger.
    std::string computeDigest(const std::vector<uint8_t>& message);

    bool verifyDigest(const std::vector<uint8_t>& body, const std::string& digest);
}

#endif // CHECKSUM_HPP
