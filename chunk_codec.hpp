#ifndef CHUNK_CODEC_HPP
#define CHUNK_CODEC_HPP

#include "stego_error.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace chunks {

    struct Fragment {
        uint32_t index;
        std::string text;
    };

    // Split text into `count` contiguous fragments, in order.
    // Leading fragments hold ceil(len / count) chars, later ones may hold one less.
    // If text is shorter than count, one fragment per char is produced instead.
    stego::StegoError splitText(const std::string& text,
                                uint32_t count,
                                std::vector<Fragment>& outFragments);

    std::string joinFragments(const std::vector<std::string>& texts);

    // Joins in ascending index order regardless of vector order.
    std::string joinFragments(const std::vector<Fragment>& fragments);
}

#endif // CHUNK_CODEC_HPP
