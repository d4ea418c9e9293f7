#include "stego_error.hpp"

namespace stego {

    const char* errorName(StegoError err)
    {
        switch (err) {
            case StegoError::None:                  return "None";
            case StegoError::AuthenticationError:   return "AuthenticationError";
            case StegoError::MalformedEnvelope:     return "MalformedEnvelope";
            case StegoError::InvalidFrameSpec:      return "InvalidFrameSpec";
            case StegoError::FrameIndexDecode:      return "FrameIndexDecode";
            case StegoError::NoDataRevealed:        return "NoDataRevealed";
            case StegoError::EmptyInput:            return "EmptyInput";
            case StegoError::InvalidFragmentCount:  return "InvalidFragmentCount";
            case StegoError::InvalidSlotAssignment: return "InvalidSlotAssignment";
            case StegoError::InvalidCipherConfig:   return "InvalidCipherConfig";
            case StegoError::DigestFailure:         return "DigestFailure";
            case StegoError::CipherFailure:         return "CipherFailure";
            case StegoError::SlotIoFailure:         return "SlotIoFailure";
        }
        return "Unknown";
    }

}
