#pragma once

#include "key_loader.hpp"
#include "object_store.hpp"
#include "report.hpp"
#include "signature_extractor.hpp"
#include "signature_verifier.hpp"
#include "types.hpp"
#include <string>

namespace sigchain
{

    /**
     * Tries each parent of a commit, in recorded order, until one parent's
     * key directory vouches for the commit's signature. A fresh trust store
     * is built and torn down for every parent.
     */
    class ParentTrustWalker
    {
    public:
        ParentTrustWalker(KeyMaterialLoader &loader, SignatureVerifier &verifier);

        /**
         * Walk the parents of `commit`. Rejection is reported in the returned
         * CommitVerification; errors are reserved for failures to run the
         * check at all.
         */
        Result<CommitVerification> walk(const Commit &commit,
                                        const SignedPayload &signed_payload,
                                        const std::string &key_dir);

    private:
        Result<ParentAttempt> attempt(const std::string &parent,
                                      const SignedPayload &signed_payload,
                                      const std::string &key_dir);

        KeyMaterialLoader &loader_;
        SignatureVerifier &verifier_;
    };

} // namespace sigchain
