#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigchain
{

    /** One machine-readable status line from the signing program */
    struct StatusEvent
    {
        std::string keyword;
        std::vector<std::string> args;

        /** Parse "[GNUPG:] KEYWORD arg..."; nullopt for any other line */
        static std::optional<StatusEvent> parse(std::string_view line);
    };

    /**
     * Classifies a status stream into a single Verdict.
     *
     * Explicit state machine: GOODSIG moves Scanning to Good and keeps
     * consuming; any negative event (EXPSIG, EXPKEYSIG, REVKEYSIG, BADSIG,
     * ERRSIG) moves to Settled, after which further events are ignored.
     */
    class StatusInterpreter
    {
    public:
        static constexpr std::string_view kStatusPrefix = "[GNUPG:] ";

        /** ERRSIG return code meaning "no public key" */
        static constexpr std::string_view kNoPublicKeyCode = "9";

        enum class State
        {
            Scanning,
            Good,
            Settled
        };

        struct Transition
        {
            State state;
            Verdict verdict;
        };

        /** Pure transition function over (state, running verdict, event) */
        static Transition transition(State state, Verdict running, const StatusEvent &event);

        /** Feed one raw output line; non-status lines are ignored */
        void feed(std::string_view line);

        /** Feed a whole newline separated stream */
        void feed_stream(std::string_view stream);

        /** Final classification of everything fed so far */
        Verdict verdict() const;

        State state() const { return state_; }

        /** Key id and user id of the last GOODSIG, if any */
        const std::optional<std::string> &signer_key_id() const { return signer_key_id_; }
        const std::optional<std::string> &signer_uid() const { return signer_uid_; }

        /** Key id named by an ERRSIG with the "no public key" code */
        const std::optional<std::string> &missing_key_id() const { return missing_key_id_; }

        /** Convenience: classify a complete stream */
        static Verdict classify(std::string_view stream);

    private:
        State state_{State::Scanning};
        Verdict running_{Verdict::Unverified};
        std::optional<std::string> signer_key_id_;
        std::optional<std::string> signer_uid_;
        std::optional<std::string> missing_key_id_;
    };

} // namespace sigchain
