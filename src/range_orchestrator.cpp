#include "sigchain/range_orchestrator.hpp"
#include "sigchain/signature_extractor.hpp"
#include <set>

#include <spdlog/spdlog.h>

namespace sigchain
{

    namespace
    {
        Result<void> validate_update(const RefUpdate &update)
        {
            if (update.ref_name.empty())
                return std::unexpected(SigchainError::usage("empty ref name"));
            for (const auto *value : {&update.old_value, &update.new_value})
            {
                if (!is_null_object_id(*value) && !is_object_id(*value))
                    return std::unexpected(SigchainError::usage(std::format("not an object id: '{}'", *value)));
            }
            return {};
        }
    } // namespace

    RangeOrchestrator::RangeOrchestrator(ObjectStore &objects, ParentTrustWalker &walker, std::string key_dir)
        : objects_(objects), walker_(walker), key_dir_(std::move(key_dir))
    {
    }

    std::vector<std::string> RangeOrchestrator::exclusion_set(const RefUpdate &update,
                                                              const std::vector<RefEntry> &known_refs)
    {
        if (!is_null_object_id(update.old_value))
            return {update.old_value};

        std::set<std::string> values;
        for (const auto &ref : known_refs)
        {
            if (ref.name == update.ref_name || is_null_object_id(ref.object_id))
                continue;
            values.insert(ref.object_id);
        }
        return {values.begin(), values.end()};
    }

    Result<std::vector<std::string>> RangeOrchestrator::compute_range(const RefUpdate &update,
                                                                      const std::vector<RefEntry> &known_refs)
    {
        if (is_null_object_id(update.new_value))
            return std::vector<std::string>{};
        return objects_.rev_list(update.new_value, exclusion_set(update, known_refs));
    }

    Result<PushReport> RangeOrchestrator::verify_push(const RefUpdate &update)
    {
        if (auto valid = validate_update(update); !valid)
            return std::unexpected(valid.error());

        PushReport report;
        report.update = update;

        if (is_null_object_id(update.new_value))
        {
            spdlog::info("{} is being deleted; nothing to verify", update.ref_name);
            return report;
        }

        // Snapshot refs once so concurrent pushes cannot change the range mid-walk.
        std::vector<RefEntry> known_refs;
        if (is_null_object_id(update.old_value))
        {
            auto refs = objects_.list_refs();
            if (!refs)
                return std::unexpected(refs.error());
            known_refs = std::move(*refs);
        }

        auto range = compute_range(update, known_refs);
        if (!range)
            return std::unexpected(range.error());
        report.range = std::move(*range);

        spdlog::info("{}: verifying {} new commit(s)", update.ref_name, report.range.size());

        for (const auto &commit_id : report.range)
        {
            if (auto res = verify_commit(commit_id, report); !res)
                return std::unexpected(res.error());
            if (!report.accepted())
            {
                spdlog::error("rejecting update of {}: {}", update.ref_name, report.failure->message);
                return report;
            }
        }

        spdlog::info("{}: all commits verified", update.ref_name);
        return report;
    }

    Result<void> RangeOrchestrator::verify_commit(const std::string &commit_id, PushReport &report)
    {
        auto commit = objects_.commit(commit_id);
        if (!commit)
            return std::unexpected(commit.error());

        if (commit->parents.empty())
        {
            report.failure = PushFailure{
                commit_id, ErrorCode::NoParents,
                std::format("commit {} has no parents; a root commit has no key directory to be verified against",
                            commit_id)};
            return {};
        }

        auto signed_payload = SignatureExtractor::extract(commit->raw);
        if (!signed_payload)
        {
            if (signed_payload.error().code != ErrorCode::NoSignature)
                return std::unexpected(signed_payload.error());

            CommitVerification unsigned_commit;
            unsigned_commit.commit = commit_id;
            unsigned_commit.verdict = Verdict::NoSignature;
            report.commits.push_back(std::move(unsigned_commit));
            report.failure = PushFailure{
                commit_id, ErrorCode::NoSignature,
                std::format("commit {} is not signed", commit_id)};
            return {};
        }

        auto verification = walker_.walk(*commit, *signed_payload, key_dir_);
        if (!verification)
            return std::unexpected(verification.error());

        bool accepted = verification->accepted;
        std::string last_detail = verification->attempts.empty() ? std::string("no parent attempted")
                                                                 : verification->attempts.back().detail;
        Verdict last = verification->verdict;
        report.commits.push_back(std::move(*verification));

        if (!accepted)
        {
            report.failure = PushFailure{
                commit_id, ErrorCode::Untrusted,
                std::format("commit {} could not be verified against any parent: {} ({})",
                            commit_id, verdict_to_string(last), last_detail)};
        }
        return {};
    }

} // namespace sigchain
