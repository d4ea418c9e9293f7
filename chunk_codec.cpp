#include "chunk_codec.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace chunks {

    using stego::StegoError;

    StegoError splitText(const std::string& text,
                         uint32_t count,
                         std::vector<Fragment>& outFragments)
    {
        outFragments.clear();

        if (count == 0) {
            std::cerr << "[chunks] fragment count must be >= 1\n";
            return StegoError::InvalidFragmentCount;
        }
        if (text.empty()) {
            std::cerr << "[chunks] nothing to split\n";
            return StegoError::EmptyInput;
        }

        size_t total = count;
        if (text.size() < total) {
            std::cerr << "[chunks] only " << text.size() << " chars for "
                      << count << " fragments, using " << text.size() << "\n";
            total = text.size();
        }

        // first `longer` fragments get base + 1 chars
        size_t base   = text.size() / total;
        size_t longer = text.size() % total;

        outFragments.reserve(total);
        size_t offset = 0;
        for (size_t i = 0; i < total; ++i) {
            size_t len = base + (i < longer ? 1 : 0);

            Fragment f;
            f.index = static_cast<uint32_t>(i);
            f.text = text.substr(offset, len);
            outFragments.push_back(std::move(f));

            offset += len;
        }

        return StegoError::None;
    }

    std::string joinFragments(const std::vector<std::string>& texts)
    {
        std::string out;
        size_t total = 0;
        for (const std::string& t : texts) {
            total += t.size();
        }
        out.reserve(total);

        for (const std::string& t : texts) {
            out += t;
        }
        return out;
    }

    std::string joinFragments(const std::vector<Fragment>& fragments)
    {
        std::vector<const Fragment*> ordered;
        ordered.reserve(fragments.size());
        for (const Fragment& f : fragments) {
            ordered.push_back(&f);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const Fragment* a, const Fragment* b) { return a->index < b->index; });

        std::string out;
        for (const Fragment* f : ordered) {
            out += f->text;
        }
        return out;
    }

}
