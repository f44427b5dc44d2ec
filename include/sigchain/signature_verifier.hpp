#pragma once

#include "signature_backend.hpp"
#include "signature_extractor.hpp"
#include "trust_store.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace sigchain
{

    struct VerificationOutcome
    {
        Verdict verdict{Verdict::Unverified};
        std::optional<std::string> signer_key_id;
        std::optional<std::string> signer_uid;
        std::optional<std::string> missing_key_id;
    };

    /** Runs the backend check for one signed payload and classifies the result */
    class SignatureVerifier
    {
    public:
        explicit SignatureVerifier(SignatureBackend &backend);

        Result<VerificationOutcome> verify(const TrustStore &store, const SignedPayload &signed_payload);

    private:
        SignatureBackend &backend_;
    };

} // namespace sigchain
