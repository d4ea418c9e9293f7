#ifndef FRAME_SPEC_HPP
#define FRAME_SPEC_HPP

#include "stego_error.hpp"

#include <string>
#include <vector>

namespace framespec {

    // Upper bound on frames a single spec may expand to.
    static const size_t MAX_SPEC_FRAMES = 10000000;

    // "1,4,6-9,12" -> [1,4,6,7,8,9,12]. Ranges are inclusive and may run
    // backwards ("5-3" -> [3,4,5]). Result is sorted and deduplicated.
    stego::StegoError parseFrameSpec(const std::string& spec, std::vector<int>& outFrames);

    // Strict integer list literal: "[1, 4, 6]", "[]", "[-2, 3,]".
    // Order and duplicates are preserved.
    stego::StegoError parseFrameListLiteral(const std::string& text, std::vector<int>& outFrames);

    // Literal form accepted by parseFrameListLiteral.
    std::string formatFrameList(const std::vector<int>& frames);

    std::string trim(const std::string& s);
}

#endif // FRAME_SPEC_HPP
