#include "sigchain/types.hpp"
#include <algorithm>

namespace sigchain
{

    std::string verdict_description(Verdict verdict)
    {
        switch (verdict)
        {
        case Verdict::Verified:
            return "signature verified";
        case Verdict::NoSignature:
            return "commit carries no signature";
        case Verdict::NoKeyDirectory:
            return "no key directory in parent";
        case Verdict::ExpiredSignature:
            return "signature has expired";
        case Verdict::ExpiredKeySignature:
            return "signature made by an expired key";
        case Verdict::RevokedKeySignature:
            return "signature made by a revoked key";
        case Verdict::BadSignature:
            return "bad signature";
        case Verdict::SignatureError:
            return "signature could not be checked";
        case Verdict::Unverified:
            return "signature could not be verified";
        }
        return "unknown verdict";
    }

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::UsageError:
            return "UsageError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::ObjectStoreError:
            return "ObjectStoreError";
        case ErrorCode::ProcessError:
            return "ProcessError";
        case ErrorCode::ResourceError:
            return "ResourceError";
        case ErrorCode::NoSignature:
            return "NoSignature";
        case ErrorCode::NoParents:
            return "NoParents";
        case ErrorCode::NoKeyDirectory:
            return "NoKeyDirectory";
        case ErrorCode::KeyImportError:
            return "KeyImportError";
        case ErrorCode::Untrusted:
            return "Untrusted";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    bool is_null_object_id(std::string_view id)
    {
        if (id.size() != 40 && id.size() != 64)
            return false;
        return std::all_of(id.begin(), id.end(), [](char c) { return c == '0'; });
    }

    bool is_object_id(std::string_view id)
    {
        if (id.size() != 40 && id.size() != 64)
            return false;
        return std::all_of(id.begin(), id.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }

} // namespace sigchain
