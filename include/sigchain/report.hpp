#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sigchain
{

    /** Result of checking a commit against one parent's key set */
    struct ParentAttempt
    {
        std::string parent;
        Verdict verdict{Verdict::Unverified};
        std::string detail;
        std::size_t keys_imported{0};
        std::size_t keys_skipped{0};
        std::optional<std::string> signer_key_id;
        std::optional<std::string> signer_uid;

        nlohmann::json to_json() const;
    };

    struct CommitVerification
    {
        std::string commit;
        bool accepted{false};
        std::optional<std::string> trusted_parent;
        std::vector<ParentAttempt> attempts;

        /**
         * Overall verdict: Verified when accepted, NoSignature for an unsigned
         * commit, otherwise the verdict of the last parent tried.
         */
        Verdict verdict{Verdict::Unverified};

        nlohmann::json to_json() const;
    };

    struct RefUpdate
    {
        std::string ref_name;
        std::string old_value;
        std::string new_value;
    };

    struct PushFailure
    {
        std::string commit;
        ErrorCode code{ErrorCode::Untrusted};
        std::string message;
    };

    /**
     * Everything one push evaluation decided. A push is all-or-nothing:
     * `accepted` is true only when every commit in the range verified.
     */
    struct PushReport
    {
        RefUpdate update;
        std::vector<std::string> range;
        std::vector<CommitVerification> commits;
        std::optional<PushFailure> failure;

        bool accepted() const { return !failure.has_value(); }

        nlohmann::json to_json() const;
    };

    /** Write the report as JSON to `path` */
    Result<void> write_report(const PushReport &report, const std::string &path);

} // namespace sigchain
