#pragma once

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sigchain
{

    /**
     * Outcome of one verification attempt of a commit against the key set
     * of one of its parents.
     */
    enum class Verdict
    {
        Verified,
        NoSignature,
        NoKeyDirectory,
        ExpiredSignature,
        ExpiredKeySignature,
        RevokedKeySignature,
        BadSignature,
        SignatureError,
        Unverified
    };

    /**
     * Convert Verdict to string representation
     */
    inline std::string verdict_to_string(Verdict verdict)
    {
        switch (verdict)
        {
        case Verdict::Verified:
            return "Verified";
        case Verdict::NoSignature:
            return "NoSignature";
        case Verdict::NoKeyDirectory:
            return "NoKeyDirectory";
        case Verdict::ExpiredSignature:
            return "ExpiredSignature";
        case Verdict::ExpiredKeySignature:
            return "ExpiredKeySignature";
        case Verdict::RevokedKeySignature:
            return "RevokedKeySignature";
        case Verdict::BadSignature:
            return "BadSignature";
        case Verdict::SignatureError:
            return "SignatureError";
        case Verdict::Unverified:
            return "Unverified";
        }
        return "Unknown";
    }

    /**
     * Human readable explanation used in rejection messages
     */
    std::string verdict_description(Verdict verdict);

    /**
     * Error types for sigchain operations
     */
    enum class ErrorCode
    {
        UsageError,
        ConfigError,
        ObjectStoreError,
        ProcessError,
        ResourceError,
        NoSignature,
        NoParents,
        NoKeyDirectory,
        KeyImportError,
        Untrusted,
        ParsingError,
        InternalError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * sigchain error with code and message
     */
    class SigchainError : public std::runtime_error
    {
    public:
        ErrorCode code;

        SigchainError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static SigchainError usage(const std::string &msg)
        {
            return SigchainError(ErrorCode::UsageError, msg);
        }

        static SigchainError config(const std::string &msg)
        {
            return SigchainError(ErrorCode::ConfigError, msg);
        }

        static SigchainError object_store(const std::string &msg)
        {
            return SigchainError(ErrorCode::ObjectStoreError, msg);
        }

        static SigchainError process(const std::string &msg)
        {
            return SigchainError(ErrorCode::ProcessError, msg);
        }

        static SigchainError resource(const std::string &msg)
        {
            return SigchainError(ErrorCode::ResourceError, msg);
        }

        static SigchainError no_signature(const std::string &msg)
        {
            return SigchainError(ErrorCode::NoSignature, msg);
        }

        static SigchainError no_key_directory(const std::string &msg)
        {
            return SigchainError(ErrorCode::NoKeyDirectory, msg);
        }

        static SigchainError key_import(const std::string &msg)
        {
            return SigchainError(ErrorCode::KeyImportError, msg);
        }

        static SigchainError parsing(const std::string &msg)
        {
            return SigchainError(ErrorCode::ParsingError, msg);
        }

        static SigchainError internal(const std::string &msg)
        {
            return SigchainError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, SigchainError>;

    /** Object id git uses for "no such value" (ref creation / deletion). */
    inline constexpr std::string_view kNullObjectId = "0000000000000000000000000000000000000000";

    /**
     * True for an all-zero object id of any hash length
     */
    bool is_null_object_id(std::string_view id);

    /**
     * True for a plausible full object id (40 or 64 lowercase hex digits)
     */
    bool is_object_id(std::string_view id);

    /**
     * Abbreviate an object id for log output
     */
    inline std::string short_id(std::string_view id)
    {
        return std::string(id.substr(0, 12));
    }

} // namespace sigchain
