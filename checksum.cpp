#include "checksum.hpp"

#include <openssl/evp.h>

#include <iostream>

namespace checksum {

    std::string computeDigest(const std::vector<uint8_t>& message)
    {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int mdLen = 0;

        if (EVP_Digest(message.data(), message.size(),
                       md, &mdLen,
                       EVP_md5(), nullptr) != 1)
        {
            std::cerr << "[md5] EVP_Digest failed\n";
            return std::string();
        }

        static const char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(mdLen * 2);
        for (unsigned int i = 0; i < mdLen; ++i) {
            out.push_back(HEX[md[i] >> 4]);
            out.push_back(HEX[md[i] & 0x0F]);
        }
        return out;
    }

    bool verifyDigest(const std::vector<uint8_t>& body, const std::string& digest)
    {
        std::string recomputed = computeDigest(body);
        if (recomputed.empty()) {
            return false;
        }
        return recomputed == digest;
    }

}
