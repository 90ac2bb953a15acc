#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

namespace anchor
{

    using Bytes = std::vector<uint8_t>;

    /**
     * Error categories reported by anchor operations.
     * The first five are the proof lifecycle taxonomy; the rest are ambient.
     */
    enum class ErrorCode
    {
        MalformedProof,
        CommitmentNotFound,
        CalendarUnreachable,
        QuorumNotMet,
        ChainVerificationFailed,
        ConfigError,
        InvalidInput,
        StorageError,
        IOError,
        CryptoError,
        InternalError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * anchor error with code and message
     */
    class AnchorError : public std::runtime_error
    {
    public:
        ErrorCode code;

        AnchorError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static AnchorError malformed(const std::string &msg)
        {
            return AnchorError(ErrorCode::MalformedProof, msg);
        }

        static AnchorError not_found(const std::string &msg)
        {
            return AnchorError(ErrorCode::CommitmentNotFound, msg);
        }

        static AnchorError unreachable(const std::string &msg)
        {
            return AnchorError(ErrorCode::CalendarUnreachable, msg);
        }

        static AnchorError quorum(const std::string &msg)
        {
            return AnchorError(ErrorCode::QuorumNotMet, msg);
        }

        static AnchorError verification(const std::string &msg)
        {
            return AnchorError(ErrorCode::ChainVerificationFailed, msg);
        }

        static AnchorError config(const std::string &msg)
        {
            return AnchorError(ErrorCode::ConfigError, msg);
        }

        static AnchorError invalid_input(const std::string &msg)
        {
            return AnchorError(ErrorCode::InvalidInput, msg);
        }

        static AnchorError storage(const std::string &msg)
        {
            return AnchorError(ErrorCode::StorageError, msg);
        }

        static AnchorError io(const std::string &msg)
        {
            return AnchorError(ErrorCode::IOError, msg);
        }

        static AnchorError crypto(const std::string &msg)
        {
            return AnchorError(ErrorCode::CryptoError, msg);
        }

        static AnchorError internal(const std::string &msg)
        {
            return AnchorError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, AnchorError>;

} // namespace anchor
