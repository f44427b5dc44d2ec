#include "sigchain/signature_verifier.hpp"
#include "sigchain/status_interpreter.hpp"

namespace sigchain
{

    SignatureVerifier::SignatureVerifier(SignatureBackend &backend) : backend_(backend)
    {
    }

    Result<VerificationOutcome> SignatureVerifier::verify(const TrustStore &store, const SignedPayload &signed_payload)
    {
        auto stream = backend_.verify(store, signed_payload.payload, signed_payload.signature);
        if (!stream)
            return std::unexpected(stream.error());

        StatusInterpreter interpreter;
        interpreter.feed_stream(*stream);

        VerificationOutcome outcome;
        outcome.verdict = interpreter.verdict();
        outcome.signer_key_id = interpreter.signer_key_id();
        outcome.signer_uid = interpreter.signer_uid();
        outcome.missing_key_id = interpreter.missing_key_id();
        return outcome;
    }

} // namespace sigchain
