#ifndef SLOT_STORE_HPP
#define SLOT_STORE_HPP

#include <optional>
#include <string>

namespace stego {

    // Addressable carrier slots (video frames, a still image, ...).
    // Each slot holds at most one text payload.
    class SlotStore {
    public:
        virtual ~SlotStore() = default;

        virtual int slotCount() const = 0;

        // false on I/O failure or bad slot id
        virtual bool embed(int slotId, const std::string& text) = 0;

        // false on I/O failure; true with nullopt when the slot carries nothing
        virtual bool reveal(int slotId, std::optional<std::string>& outText) = 0;
    };
}

#endif // SLOT_STORE_HPP
