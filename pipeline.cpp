#include "pipeline.hpp"
#include "frame_index_channel.hpp"
#include "frame_spec.hpp"
#include "message_framer.hpp"

#include <utility>
#include <iostream>
#include <set>

namespace pipeline {

    using stego::StegoError;

    static void setProgress(EncoderState* progress, EncoderState state) {
        if (progress) *progress = state;
    }

    static void setProgress(DecoderState* progress, DecoderState state) {
        if (progress) *progress = state;
    }

    const char* stateName(EncoderState state)
    {
        switch (state) {
            case EncoderState::Start:              return "Start";
            case EncoderState::Checksum:           return "Checksum";
            case EncoderState::Encrypt:            return "Encrypt";
            case EncoderState::Split:              return "Split";
            case EncoderState::AssignSlots:        return "AssignSlots";
            case EncoderState::Embed:              return "Embed";
            case EncoderState::EncodeIndexChannel: return "EncodeIndexChannel";
            case EncoderState::EmbedIndex:         return "EmbedIndex";
            case EncoderState::Done:               return "Done";
            case EncoderState::Failed:             return "Failed";
        }
        return "Unknown";
    }

    const char* stateName(DecoderState state)
    {
        switch (state) {
            case DecoderState::Start:       return "Start";
            case DecoderState::SelectSlots: return "SelectSlots";
            case DecoderState::Extract:     return "Extract";
            case DecoderState::Join:        return "Join";
            case DecoderState::Decrypt:     return "Decrypt";
            case DecoderState::Deframe:     return "Deframe";
            case DecoderState::Done:        return "Done";
            case DecoderState::Failed:      return "Failed";
        }
        return "Unknown";
    }

    StegoError prepareFragments(const crypto::CipherService& cipher,
                                const std::vector<uint8_t>& message,
                                uint32_t count,
                                std::vector<chunks::Fragment>& outFragments,
                                EncoderState* progress)
    {
        outFragments.clear();

        setProgress(progress, EncoderState::Checksum);
        std::vector<uint8_t> framed;
        StegoError err = framing::frameMessage(message, framed);
        if (err != StegoError::None) {
            return err;
        }

        setProgress(progress, EncoderState::Encrypt);
        std::string envelope;
        err = cipher.encrypt(framed, envelope);
        if (err != StegoError::None) {
            return err;
        }

        setProgress(progress, EncoderState::Split);
        return chunks::splitText(envelope, count, outFragments);
    }

    StegoError recoverMessage(const crypto::CipherService& cipher,
                              const std::vector<std::string>& texts,
                              bool& outVerified,
                              std::vector<uint8_t>& outBody,
                              DecoderState* progress)
    {
        outVerified = false;
        outBody.clear();

        setProgress(progress, DecoderState::Join);
        std::string envelope = chunks::joinFragments(texts);
        if (envelope.empty()) {
            std::cerr << "[decode] no hidden data in the selected slots\n";
            return StegoError::NoDataRevealed;
        }

        setProgress(progress, DecoderState::Decrypt);
        std::vector<uint8_t> payload;
        StegoError err = cipher.decrypt(envelope, payload);
        if (err != StegoError::None) {
            return err;
        }

        setProgress(progress, DecoderState::Deframe);
        outVerified = framing::deframeMessage(payload, outBody);
        if (!outVerified) {
            std::cerr << "[decode] md5 missing or mismatch, returning body anyway\n";
        }
        return StegoError::None;
    }

    StegoError selectSlots(const SlotSelection& selection,
                           const crypto::CipherService& cipher,
                           stego::SlotStore& carrier,
                           stego::SlotStore* sideChannel,
                           std::vector<int>& outSlots)
    {
        outSlots.clear();

        switch (selection.mode) {
            case SlotSelectionMode::IndexChannel: {
                if (!sideChannel) {
                    std::cerr << "[decode] no side channel to read the frame list from\n";
                    return StegoError::FrameIndexDecode;
                }
                std::optional<std::string> hidden;
                if (!sideChannel->reveal(SIDE_CHANNEL_SLOT, hidden) || !hidden || hidden->empty()) {
                    std::cerr << "[decode] no hidden data found in side channel\n";
                    return StegoError::FrameIndexDecode;
                }
                return frameindex::decodeFrameIndex(cipher, *hidden, outSlots);
            }

            case SlotSelectionMode::ManualSpec:
                return framespec::parseFrameSpec(selection.spec, outSlots);

            case SlotSelectionMode::FullScan: {
                int total = carrier.slotCount();
                outSlots.reserve(total > 0 ? static_cast<size_t>(total) : 0);
                for (int i = 0; i < total; ++i) {
                    outSlots.push_back(i);
                }
                return StegoError::None;
            }
        }
        return StegoError::InvalidFrameSpec;
    }

    // ---------------------------------------------------------------- Encoder

    Encoder::Encoder(const crypto::CipherService& cipher,
                     stego::SlotStore& carrier,
                     stego::SlotStore* sideChannel)
        : cipher_(cipher), carrier_(carrier), sideChannel_(sideChannel),
          state_(EncoderState::Start)
    {
    }

    EncodeResult& Encoder::fail(EncodeResult& result, StegoError err)
    {
        result.error = err;
        result.failedAt = state_;
        std::cerr << "[encode] failed in " << stateName(state_)
                  << ": " << stego::errorName(err) << "\n";
        state_ = EncoderState::Failed;
        return result;
    }

    EncodeResult Encoder::run(const std::vector<uint8_t>& message,
                              const std::vector<int>& slots,
                              bool storeIndex)
    {
        EncodeResult result;
        state_ = EncoderState::Start;

        std::set<int> unique(slots.begin(), slots.end());
        if (slots.empty() || unique.size() != slots.size() || *unique.begin() < 0) {
            std::cerr << "[encode] slots must be non-empty, unique and >= 0\n";
            return fail(result, StegoError::InvalidSlotAssignment);
        }
        if (storeIndex && !sideChannel_) {
            std::cerr << "[encode] frame list requested but no side channel given\n";
            return fail(result, StegoError::InvalidSlotAssignment);
        }
        const std::vector<int> ordered(unique.begin(), unique.end());
        if (ordered != slots) {
            std::cout << "[encode] slots reordered ascending\n";
        }

        StegoError err = prepareFragments(cipher_, message,
                                          static_cast<uint32_t>(slots.size()),
                                          result.fragments, &state_);
        if (err != StegoError::None) {
            return fail(result, err);
        }
        std::cout << "[encode] " << result.fragments.size() << " fragments\n";

        state_ = EncoderState::AssignSlots;
        int capacity = carrier_.slotCount();
        for (const chunks::Fragment& f : result.fragments) {
            int slot = ordered[f.index];
            if (slot >= capacity) {
                std::cerr << "[encode] slot " << slot << " out of range (carrier has "
                          << capacity << ")\n";
                return fail(result, StegoError::InvalidSlotAssignment);
            }
            result.assignment.push_back(SlotAssignment{f.index, slot});
        }

        state_ = EncoderState::Embed;
        for (const SlotAssignment& a : result.assignment) {
            if (!carrier_.embed(a.slotId, result.fragments[a.fragmentIndex].text)) {
                std::cerr << "[encode] embed into slot " << a.slotId << " failed\n";
                return fail(result, StegoError::SlotIoFailure);
            }
            std::cout << "[encode] slot " << a.slotId << " holds "
                      << result.fragments[a.fragmentIndex].text << "\n";
        }

        if (storeIndex) {
            state_ = EncoderState::EncodeIndexChannel;
            std::vector<int> used;
            used.reserve(result.assignment.size());
            for (const SlotAssignment& a : result.assignment) {
                used.push_back(a.slotId);
            }
            err = frameindex::encodeFrameIndex(cipher_, used, result.indexEnvelope);
            if (err != StegoError::None) {
                return fail(result, err);
            }

            state_ = EncoderState::EmbedIndex;
            if (!sideChannel_->embed(SIDE_CHANNEL_SLOT, result.indexEnvelope)) {
                std::cerr << "[encode] embedding the frame list failed\n";
                return fail(result, StegoError::SlotIoFailure);
            }
            std::cout << "[encode] frame list hidden in side channel\n";
        }

        state_ = EncoderState::Done;
        return result;
    }

    // ---------------------------------------------------------------- Decoder

    Decoder::Decoder(const crypto::CipherService& cipher,
                     stego::SlotStore& carrier,
                     stego::SlotStore* sideChannel)
        : cipher_(cipher), carrier_(carrier), sideChannel_(sideChannel),
          state_(DecoderState::Start)
    {
    }

    DecodeResult& Decoder::fail(DecodeResult& result, StegoError err)
    {
        result.error = err;
        result.failedAt = state_;
        std::cerr << "[decode] failed in " << stateName(state_)
                  << ": " << stego::errorName(err) << "\n";
        state_ = DecoderState::Failed;
        return result;
    }

    DecodeResult Decoder::run(const SlotSelection& selection)
    {
        DecodeResult result;
        state_ = DecoderState::Start;

        state_ = DecoderState::SelectSlots;
        StegoError err = selectSlots(selection, cipher_, carrier_, sideChannel_, result.slots);
        if (err != StegoError::None) {
            return fail(result, err);
        }

        state_ = DecoderState::Extract;
        int capacity = carrier_.slotCount();
        std::vector<std::string> texts;
        for (int slot : result.slots) {
            if (slot < 0 || slot >= capacity) {
                std::cerr << "[decode] skipping slot " << slot << " (carrier has "
                          << capacity << ")\n";
                continue;
            }
            std::optional<std::string> text;
            if (!carrier_.reveal(slot, text)) {
                std::cerr << "[decode] reading slot " << slot << " failed\n";
                return fail(result, StegoError::SlotIoFailure);
            }
            if (text && !text->empty()) {
                texts.push_back(std::move(*text));
            }
        }
        result.fragmentsRevealed = texts.size();
        std::cout << "[decode] " << texts.size() << " fragments revealed from "
                  << result.slots.size() << " slots\n";

        err = recoverMessage(cipher_, texts, result.verified, result.body, &state_);
        if (err != StegoError::None) {
            return fail(result, err);
        }

        state_ = DecoderState::Done;
        return result;
    }

}
