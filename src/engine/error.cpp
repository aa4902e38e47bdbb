#include "raptor/error.hpp"

namespace raptor {

    const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::InvalidFormat: return "InvalidFormat";
            case ErrorCode::UnsupportedVersion: return "UnsupportedVersion";
            case ErrorCode::Truncated: return "Truncated";
            case ErrorCode::CorruptRecord: return "CorruptRecord";
            case ErrorCode::DimensionMismatch: return "DimensionMismatch";
            case ErrorCode::NotFound: return "NotFound";
            case ErrorCode::ProviderError: return "ProviderError";
            case ErrorCode::InvariantViolation: return "InvariantViolation";
        }
        return "Unknown";
    }

}
