#ifndef STEGO_ERROR_HPP
#define STEGO_ERROR_HPP

namespace stego {

    // None = success. Checksum mismatch is not an error (see framing::deframeMessage).
    enum class StegoError {
        None,
        AuthenticationError,   // GCM tag did not verify
        MalformedEnvelope,     // envelope is not valid Base64 / too short
        InvalidFrameSpec,
        FrameIndexDecode,      // side channel reveal/decrypt/parse exhausted
        NoDataRevealed,
        EmptyInput,
        InvalidFragmentCount,
        InvalidSlotAssignment,
        InvalidCipherConfig,
        DigestFailure,         // MD5 unavailable (e.g. FIPS-only provider)
        CipherFailure,         // OpenSSL internal failure
        SlotIoFailure
    };

    const char* errorName(StegoError err);
}

#endif // STEGO_ERROR_HPP
