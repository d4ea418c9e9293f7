#ifndef FRAME_SLOT_STORE_HPP
#define FRAME_SLOT_STORE_HPP

#include "slot_store.hpp"

#include <string>
#include <vector>

namespace vdstego {

    // Slot i is the image file imagePaths[i]; embedding rewrites it in place.
    // Files must be lossless (PNG) for the LSB payload to survive.
    class FrameSlotStore : public stego::SlotStore {
    public:
        explicit FrameSlotStore(std::vector<std::string> imagePaths);

        // Slot i -> framesDir/i.png, as written by extractFrames.
        static FrameSlotStore fromFrameDirectory(const std::string& framesDir, int frameCount);

        int slotCount() const override;
        bool embed(int slotId, const std::string& text) override;
        bool reveal(int slotId, std::optional<std::string>& outText) override;


    private:
        bool validSlot(int slotId) const;

        std::vector<std::string> paths_;
    };
}

#endif // FRAME_SLOT_STORE_HPP
