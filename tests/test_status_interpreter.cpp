#include <catch2/catch_test_macros.hpp>
#include "sigchain/status_interpreter.hpp"
#include <string>

using namespace sigchain;

TEST_CASE("StatusEvent parses only prefixed lines", "[status]")
{
    auto ev = StatusEvent::parse("[GNUPG:] GOODSIG 0123456789ABCDEF Alice Example <alice@example.com>");
    REQUIRE(ev.has_value());
    REQUIRE(ev->keyword == "GOODSIG");
    REQUIRE(ev->args.size() == 4);
    REQUIRE(ev->args[0] == "0123456789ABCDEF");

    REQUIRE_FALSE(StatusEvent::parse("gpg: Good signature from \"Alice\"").has_value());
    REQUIRE_FALSE(StatusEvent::parse("[GNUPG:]GOODSIG x").has_value());
    REQUIRE_FALSE(StatusEvent::parse("").has_value());
}

TEST_CASE("Empty or unrelated streams are unverified", "[status]")
{
    REQUIRE(StatusInterpreter::classify("") == Verdict::Unverified);
    REQUIRE(StatusInterpreter::classify("gpg: no valid OpenPGP data found.\n") == Verdict::Unverified);
    REQUIRE(StatusInterpreter::classify("[GNUPG:] NODATA 4\n") == Verdict::Unverified);
}

TEST_CASE("GOODSIG alone verifies", "[status]")
{
    StatusInterpreter interpreter;
    interpreter.feed_stream("[GNUPG:] NEWSIG\n"
                            "[GNUPG:] KEY_CONSIDERED ABCDEF 0\n"
                            "[GNUPG:] GOODSIG 0123456789ABCDEF Alice <alice@example.com>\n"
                            "[GNUPG:] VALIDSIG ABCDEF 2023-11-14 1700000000\n"
                            "[GNUPG:] TRUST_UNDEFINED 0 pgp\n");
    REQUIRE(interpreter.verdict() == Verdict::Verified);
    REQUIRE(interpreter.state() == StatusInterpreter::State::Good);
    REQUIRE(interpreter.signer_key_id() == std::optional<std::string>("0123456789ABCDEF"));
    REQUIRE(interpreter.signer_uid() == std::optional<std::string>("Alice <alice@example.com>"));
}

TEST_CASE("Each negative event maps to its verdict", "[status]")
{
    REQUIRE(StatusInterpreter::classify("[GNUPG:] EXPSIG K Alice\n") == Verdict::ExpiredSignature);
    REQUIRE(StatusInterpreter::classify("[GNUPG:] EXPKEYSIG K Alice\n") == Verdict::ExpiredKeySignature);
    REQUIRE(StatusInterpreter::classify("[GNUPG:] REVKEYSIG K Alice\n") == Verdict::RevokedKeySignature);
    REQUIRE(StatusInterpreter::classify("[GNUPG:] BADSIG K Alice\n") == Verdict::BadSignature);
    REQUIRE(StatusInterpreter::classify("[GNUPG:] ERRSIG K 1 8 00 1700000000 4\n") == Verdict::SignatureError);
}

TEST_CASE("Negative events override an earlier GOODSIG", "[status]")
{
    REQUIRE(StatusInterpreter::classify("[GNUPG:] GOODSIG K Alice\n"
                                        "[GNUPG:] REVKEYSIG K Alice\n") == Verdict::RevokedKeySignature);
}

TEST_CASE("The first negative event is final", "[status]")
{
    StatusInterpreter interpreter;
    interpreter.feed("[GNUPG:] BADSIG K1 Mallory");
    REQUIRE(interpreter.state() == StatusInterpreter::State::Settled);
    interpreter.feed("[GNUPG:] GOODSIG K2 Alice");
    interpreter.feed("[GNUPG:] EXPSIG K2 Alice");
    REQUIRE(interpreter.verdict() == Verdict::BadSignature);
    REQUIRE(interpreter.signer_key_id() == std::optional<std::string>("K1"));
}

TEST_CASE("ERRSIG with the no-public-key code records the missing key", "[status]")
{
    StatusInterpreter interpreter;
    interpreter.feed_stream("[GNUPG:] NEWSIG\n"
                            "[GNUPG:] ERRSIG 89ABCDEF01234567 1 8 00 1700000000 9 -\n"
                            "[GNUPG:] NO_PUBKEY 89ABCDEF01234567\n");
    REQUIRE(interpreter.verdict() == Verdict::SignatureError);
    REQUIRE(interpreter.missing_key_id() == std::optional<std::string>("89ABCDEF01234567"));

    StatusInterpreter other;
    other.feed("[GNUPG:] ERRSIG 89ABCDEF01234567 1 8 00 1700000000 4 -");
    REQUIRE(other.verdict() == Verdict::SignatureError);
    REQUIRE_FALSE(other.missing_key_id().has_value());
}

TEST_CASE("Transition function is pure over synthetic events", "[status]")
{
    using State = StatusInterpreter::State;
    StatusEvent good{"GOODSIG", {"K"}};
    StatusEvent bad{"BADSIG", {"K"}};
    StatusEvent other{"VALIDSIG", {"K"}};

    auto t1 = StatusInterpreter::transition(State::Scanning, Verdict::Unverified, good);
    REQUIRE(t1.state == State::Good);
    REQUIRE(t1.verdict == Verdict::Verified);

    auto t2 = StatusInterpreter::transition(t1.state, t1.verdict, other);
    REQUIRE(t2.state == State::Good);
    REQUIRE(t2.verdict == Verdict::Verified);

    auto t3 = StatusInterpreter::transition(t2.state, t2.verdict, bad);
    REQUIRE(t3.state == State::Settled);
    REQUIRE(t3.verdict == Verdict::BadSignature);

    auto t4 = StatusInterpreter::transition(t3.state, t3.verdict, good);
    REQUIRE(t4.state == State::Settled);
    REQUIRE(t4.verdict == Verdict::BadSignature);
}

TEST_CASE("Carriage returns do not confuse the parser", "[status]")
{
    REQUIRE(StatusInterpreter::classify("[GNUPG:] GOODSIG K Alice\r\n") == Verdict::Verified);
}
