#include "sigchain/signature_extractor.hpp"

namespace sigchain
{

    SignatureExtractor::State SignatureExtractor::step(State state,
                                                       bool in_headers,
                                                       std::string_view line,
                                                       SignedPayload &out,
                                                       bool &found)
    {
        if (state == State::InSignature && line.starts_with(' '))
        {
            // continuation: exactly one leading space is encoding, the rest is signature
            out.signature.append(line.substr(1));
            out.signature.push_back('\n');
            return State::InSignature;
        }

        if (in_headers && line.size() > kHeaderToken.size() &&
            line.starts_with(kHeaderToken) && line[kHeaderToken.size()] == ' ')
        {
            found = true;
            out.signature.append(line.substr(kHeaderToken.size() + 1));
            out.signature.push_back('\n');
            return State::InSignature;
        }

        // Everything else is payload, leading spaces included.
        out.payload.append(line);
        out.payload.push_back('\n');
        return State::Payload;
    }

    Result<SignedPayload> SignatureExtractor::extract(std::string_view raw_commit)
    {
        SignedPayload out;
        out.payload.reserve(raw_commit.size());

        State state = State::Payload;
        bool in_headers = true;
        bool found = false;

        std::size_t pos = 0;
        while (true)
        {
            auto nl = raw_commit.find('\n', pos);
            if (nl == std::string_view::npos)
            {
                // unterminated remainder (usually empty) goes through untouched
                out.payload.append(raw_commit.substr(pos));
                break;
            }

            std::string_view line = raw_commit.substr(pos, nl - pos);
            state = step(state, in_headers, line, out, found);
            if (line.empty())
                in_headers = false;
            pos = nl + 1;
        }

        if (!found)
            return std::unexpected(SigchainError::no_signature("commit has no gpgsig header"));
        return out;
    }

} // namespace sigchain
