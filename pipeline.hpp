#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "chunk_codec.hpp"
#include "crypto.hpp"
#include "slot_store.hpp"
#include "stego_error.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace pipeline {

    // The frame list is stored in slot 0 of the side-channel store.
    static const int SIDE_CHANNEL_SLOT = 0;

    enum class EncoderState {
        Start,
        Checksum,
        Encrypt,
        Split,
        AssignSlots,
        Embed,
        EncodeIndexChannel,
        EmbedIndex,
        Done,
        Failed
    };

    enum class DecoderState {
        Start,
        SelectSlots,
        Extract,
        Join,
        Decrypt,
        Deframe,
        Done,
        Failed
    };

    const char* stateName(EncoderState state);
    const char* stateName(DecoderState state);

    struct SlotAssignment {
        uint32_t fragmentIndex;
        int slotId;
    };

    struct EncodeResult {
        stego::StegoError error = stego::StegoError::None;
        EncoderState failedAt = EncoderState::Start;   // meaningful when error != None
        std::vector<chunks::Fragment> fragments;
        std::vector<SlotAssignment> assignment;
        std::string indexEnvelope;                      // empty unless the index was stored
    };

    enum class SlotSelectionMode {
        IndexChannel,   // decrypt the frame list hidden in the side channel
        ManualSpec,     // "1,4,6-9"
        FullScan        // every slot of the carrier
    };

    struct SlotSelection {
        SlotSelectionMode mode = SlotSelectionMode::FullScan;
        std::string spec;
    };

    struct DecodeResult {
        stego::StegoError error = stego::StegoError::None;
        DecoderState failedAt = DecoderState::Start;
        std::vector<int> slots;
        size_t fragmentsRevealed = 0;
        bool verified = false;         // false = checksum missing or mismatched
        std::vector<uint8_t> body;
    };

    // checksum -> encrypt -> split. `progress` follows the stage being run.
    stego::StegoError prepareFragments(const crypto::CipherService& cipher,
                                       const std::vector<uint8_t>& message,
                                       uint32_t count,
                                       std::vector<chunks::Fragment>& outFragments,
                                       EncoderState* progress = nullptr);

    // join -> decrypt -> deframe. A checksum mismatch is not an error:
    // outBody is filled and outVerified is false.
    stego::StegoError recoverMessage(const crypto::CipherService& cipher,
                                     const std::vector<std::string>& texts,
                                     bool& outVerified,
                                     std::vector<uint8_t>& outBody,
                                     DecoderState* progress = nullptr);

    stego::StegoError selectSlots(const SlotSelection& selection,
                                  const crypto::CipherService& cipher,
                                  stego::SlotStore& carrier,
                                  stego::SlotStore* sideChannel,
                                  std::vector<int>& outSlots);

    class Encoder {
    public:
        Encoder(const crypto::CipherService& cipher,
                stego::SlotStore& carrier,
                stego::SlotStore* sideChannel = nullptr);

        // Slots must be unique and non-negative. They are used in ascending
        // order (fragment i goes to the i-th smallest slot) since every
        // decoder reads them that way.
        // With storeIndex the slots used are encrypted into the side channel.
        EncodeResult run(const std::vector<uint8_t>& message,
                         const std::vector<int>& slots,
                         bool storeIndex);

        EncoderState state() const { return state_; }

    private:
        EncodeResult& fail(EncodeResult& result, stego::StegoError err);

        const crypto::CipherService& cipher_;
        stego::SlotStore& carrier_;
        stego::SlotStore* sideChannel_;
        EncoderState state_;
    };

    class Decoder {
    public:
        Decoder(const crypto::CipherService& cipher,
                stego::SlotStore& carrier,
                stego::SlotStore* sideChannel = nullptr);

        DecodeResult run(const SlotSelection& selection);

        DecoderState state() const { return state_; }

    private:
        DecodeResult& fail(DecodeResult& result, stego::StegoError err);

        const crypto::CipherService& cipher_;
        stego::SlotStore& carrier_;
        stego::SlotStore* sideChannel_;
        DecoderState state_;
    };
}

#endif // PIPELINE_HPP
