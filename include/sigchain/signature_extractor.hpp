#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace sigchain
{

    /**
     * A commit split into the bytes the signer hashed and the detached
     * signature over them.
     */
    struct SignedPayload
    {
        std::string payload;
        std::string signature;
    };

    /**
     * Splits a raw commit object into payload and detached signature.
     *
     * The signature lives in a `gpgsig` header whose value continues over
     * lines that start with a single space. The payload is the commit with
     * that header removed, byte for byte, which is what the signer hashed.
     * Header recognition stops at the first empty line; a "gpgsig" line in
     * the commit message is payload.
     */
    class SignatureExtractor
    {
    public:
        static constexpr std::string_view kHeaderToken = "gpgsig";

        enum class State
        {
            Payload,
            InSignature
        };

        /** Returns NoSignature error when the commit carries no gpgsig header */
        static Result<SignedPayload> extract(std::string_view raw_commit);

    private:
        /** Consume one line (without its terminator); returns the next state */
        static State step(State state, bool in_headers, std::string_view line, SignedPayload &out, bool &found);
    };

} // namespace sigchain
