#include "sigchain/status_interpreter.hpp"

#include <spdlog/spdlog.h>

namespace sigchain
{

    std::optional<StatusEvent> StatusEvent::parse(std::string_view line)
    {
        if (!line.starts_with(StatusInterpreter::kStatusPrefix))
            return std::nullopt;
        line.remove_prefix(StatusInterpreter::kStatusPrefix.size());
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);

        StatusEvent event;
        std::size_t pos = 0;
        bool first = true;
        while (pos <= line.size())
        {
            auto sp = line.find(' ', pos);
            auto word = line.substr(pos, sp == std::string_view::npos ? std::string_view::npos : sp - pos);
            if (first)
            {
                event.keyword = std::string(word);
                first = false;
            }
            else if (!word.empty())
            {
                event.args.emplace_back(word);
            }
            if (sp == std::string_view::npos)
                break;
            pos = sp + 1;
        }

        if (event.keyword.empty())
            return std::nullopt;
        return event;
    }

    StatusInterpreter::Transition StatusInterpreter::transition(State state,
                                                                Verdict running,
                                                                const StatusEvent &event)
    {
        if (state == State::Settled)
            return {state, running};

        const auto &kw = event.keyword;
        if (kw == "GOODSIG")
            return {State::Good, Verdict::Verified};
        if (kw == "EXPSIG")
            return {State::Settled, Verdict::ExpiredSignature};
        if (kw == "EXPKEYSIG")
            return {State::Settled, Verdict::ExpiredKeySignature};
        if (kw == "REVKEYSIG")
            return {State::Settled, Verdict::RevokedKeySignature};
        if (kw == "BADSIG")
            return {State::Settled, Verdict::BadSignature};
        if (kw == "ERRSIG")
            return {State::Settled, Verdict::SignatureError};

        return {state, running};
    }

    void StatusInterpreter::feed(std::string_view line)
    {
        spdlog::debug("status: {}", line);
        auto event = StatusEvent::parse(line);
        if (!event)
            return;

        auto before = state_;
        auto next = transition(state_, running_, *event);
        state_ = next.state;
        running_ = next.verdict;

        if (before == State::Settled)
            return;

        if (event->keyword == "GOODSIG")
        {
            if (!event->args.empty())
                signer_key_id_ = event->args[0];
            std::string uid;
            for (std::size_t i = 1; i < event->args.size(); ++i)
            {
                if (!uid.empty())
                    uid += ' ';
                uid += event->args[i];
            }
            if (!uid.empty())
                signer_uid_ = uid;
        }
        else if (state_ == State::Settled && !event->args.empty())
        {
            signer_key_id_ = event->args[0];
            // ERRSIG <keyid> <pkalgo> <hashalgo> <sig_class> <time> <rc> [<fpr>]
            if (event->keyword == "ERRSIG" && event->args.size() > 5 && event->args[5] == kNoPublicKeyCode)
                missing_key_id_ = event->args[0];
        }
    }

    void StatusInterpreter::feed_stream(std::string_view stream)
    {
        std::size_t pos = 0;
        while (pos < stream.size())
        {
            auto nl = stream.find('\n', pos);
            if (nl == std::string_view::npos)
            {
                feed(stream.substr(pos));
                break;
            }
            feed(stream.substr(pos, nl - pos));
            pos = nl + 1;
        }
    }

    Verdict StatusInterpreter::verdict() const
    {
        switch (state_)
        {
        case State::Good:
            return Verdict::Verified;
        case State::Settled:
            return running_;
        case State::Scanning:
            break;
        }
        return Verdict::Unverified;
    }

    Verdict StatusInterpreter::classify(std::string_view stream)
    {
        StatusInterpreter interpreter;
        interpreter.feed_stream(stream);
        return interpreter.verdict();
    }

} // namespace sigchain
