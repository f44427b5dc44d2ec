#include "sigchain/parent_walker.hpp"

#include <spdlog/spdlog.h>

namespace sigchain
{

    namespace
    {
        std::string describe_outcome(const VerificationOutcome &outcome)
        {
            if (outcome.verdict == Verdict::Verified)
            {
                return std::format("good signature from {} ({})",
                                   outcome.signer_uid.value_or("unknown user"),
                                   outcome.signer_key_id.value_or("unknown key"));
            }
            if (outcome.missing_key_id)
            {
                return std::format("no public key for key id {} in key directory", *outcome.missing_key_id);
            }
            if (outcome.signer_key_id)
            {
                return std::format("{} (key {})", verdict_description(outcome.verdict), *outcome.signer_key_id);
            }
            return verdict_description(outcome.verdict);
        }
    } // namespace

    ParentTrustWalker::ParentTrustWalker(KeyMaterialLoader &loader, SignatureVerifier &verifier)
        : loader_(loader), verifier_(verifier)
    {
    }

    Result<ParentAttempt> ParentTrustWalker::attempt(const std::string &parent,
                                                     const SignedPayload &signed_payload,
                                                     const std::string &key_dir)
    {
        ParentAttempt result;
        result.parent = parent;

        // keyring (and its directory) lives until the end of this function
        auto keyring = loader_.load(parent, key_dir);
        if (!keyring)
        {
            if (keyring.error().code != ErrorCode::NoKeyDirectory)
                return std::unexpected(keyring.error());
            result.verdict = Verdict::NoKeyDirectory;
            result.detail = keyring.error().what();
            return result;
        }

        result.keys_imported = keyring->imported.size();
        result.keys_skipped = keyring->failures.size();

        auto outcome = verifier_.verify(keyring->store, signed_payload);
        if (!outcome)
            return std::unexpected(outcome.error());

        result.verdict = outcome->verdict;
        result.detail = describe_outcome(*outcome);
        result.signer_key_id = outcome->signer_key_id;
        result.signer_uid = outcome->signer_uid;
        return result;
    }

    Result<CommitVerification> ParentTrustWalker::walk(const Commit &commit,
                                                       const SignedPayload &signed_payload,
                                                       const std::string &key_dir)
    {
        CommitVerification verification;
        verification.commit = commit.id;

        for (const auto &parent : commit.parents)
        {
            spdlog::info("commit {}: trying keys from parent {}", short_id(commit.id), short_id(parent));

            auto result = attempt(parent, signed_payload, key_dir);
            if (!result)
                return std::unexpected(result.error());

            spdlog::info("commit {}: parent {}: {}: {}",
                         short_id(commit.id), short_id(parent),
                         verdict_to_string(result->verdict), result->detail);

            bool verified = result->verdict == Verdict::Verified;
            verification.verdict = result->verdict;
            verification.attempts.push_back(std::move(*result));
            if (verified)
            {
                verification.accepted = true;
                verification.trusted_parent = parent;
                break;
            }
        }

        return verification;
    }

} // namespace sigchain
