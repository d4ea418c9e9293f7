#include "frame_slot_store.hpp"
#include "image_stego.hpp"
#include "video_stego.hpp"

#include <iostream>
#include <utility>

namespace vdstego {

    FrameSlotStore::FrameSlotStore(std::vector<std::string> imagePaths)
        : paths_(std::move(imagePaths))
    {
    }

    FrameSlotStore FrameSlotStore::fromFrameDirectory(const std::string& framesDir, int frameCount)
    {
        std::vector<std::string> paths;
        for (int i = 0; i < frameCount; ++i) {
            paths.push_back(framePath(framesDir, i));
        }
        return FrameSlotStore(std::move(paths));
    }

    int FrameSlotStore::slotCount() const
    {
        return static_cast<int>(paths_.size());
    }

    bool FrameSlotStore::validSlot(int slotId) const
    {
        if (slotId < 0 || slotId >= slotCount()) {
            std::cerr << "[frames] no slot " << slotId << " (have " << slotCount() << ")\n";
            return false;
        }
        return true;
    }

    bool FrameSlotStore::embed(int slotId, const std::string& text)
    {
        if (!validSlot(slotId)) {
            return false;
        }
        return imgstego::embedTextLSB(paths_[slotId], paths_[slotId], text);
    }

    bool FrameSlotStore::reveal(int slotId, std::optional<std::string>& outText)
    {
        outText.reset();
        if (!validSlot(slotId)) {
            return false;
        }
        return imgstego::revealTextLSB(paths_[slotId], outText);
    }

}
