#include "anchor/types.hpp"

namespace anchor
{

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::MalformedProof:
            return "MalformedProof";
        case ErrorCode::CommitmentNotFound:
            return "CommitmentNotFound";
        case ErrorCode::CalendarUnreachable:
            return "CalendarUnreachable";
        case ErrorCode::QuorumNotMet:
            return "QuorumNotMet";
        case ErrorCode::ChainVerificationFailed:
            return "ChainVerificationFailed";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

} // namespace anchor
