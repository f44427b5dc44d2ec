#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "sigchain/range_orchestrator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace sigchain;
using namespace sigchain::testing;
namespace fs = std::filesystem;

namespace
{
    struct PushFixture
    {
        InMemoryObjectStore objects;
        FakeSignatureBackend backend;
        KeyMaterialLoader loader{objects, backend, fs::temp_directory_path()};
        SignatureVerifier verifier{backend};
        ParentTrustWalker walker{loader, verifier};
        RangeOrchestrator orchestrator{objects, walker, "keys"};

        PushFixture()
        {
            // root commit carrying Alice's key
            objects.add_commit(oid('a'), FakeCommit{{}, commit_body({}, "root\n"),
                                                    {{"keys/alice.asc", fake_key("AAAA", "Alice")}}});
        }

        void add_signed(char id, char parent, const std::string &message, const std::string &key_id = "AAAA")
        {
            objects.add_commit(oid(id), FakeCommit{{oid(parent)}, signed_commit({oid(parent)}, message, key_id),
                                                   {{"keys/alice.asc", fake_key("AAAA", "Alice")}}});
        }
    };
}

TEST_CASE("Deleting a reference is accepted without looking at commits", "[orchestrator]")
{
    PushFixture f;
    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), null_oid()});
    REQUIRE(report.has_value());
    REQUIRE(report->accepted());
    REQUIRE(report->range.empty());
    REQUIRE(f.objects.raw_commit_requests.empty());
    REQUIRE(f.objects.list_refs_calls == 0);
}

TEST_CASE("Updating an existing reference excludes only its old value", "[orchestrator]")
{
    PushFixture f;
    f.add_signed('b', 'a', "b\n");
    f.add_signed('c', 'b', "c\n");
    f.objects.set_ref("refs/heads/other", oid('a'));

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('b'), oid('c')});
    REQUIRE(report.has_value());
    REQUIRE(report->accepted());
    REQUIRE(report->range == std::vector<std::string>{oid('c')});
    REQUIRE(f.objects.rev_list_excludes == std::vector<std::string>{oid('b')});
    REQUIRE(f.objects.list_refs_calls == 0);
}

TEST_CASE("Creating a reference excludes every other reference", "[orchestrator]")
{
    PushFixture f;
    f.add_signed('b', 'a', "b\n");
    f.add_signed('c', 'b', "c\n");
    f.add_signed('d', 'c', "d\n");
    f.objects.set_ref("refs/heads/A", oid('a'));
    f.objects.set_ref("refs/heads/B", oid('b'));

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/feature", null_oid(), oid('d')});
    REQUIRE(report.has_value());
    REQUIRE(report->accepted());
    REQUIRE(report->range == std::vector<std::string>{oid('d'), oid('c')});
    REQUIRE(f.objects.list_refs_calls == 1);

    auto excludes = f.objects.rev_list_excludes;
    std::sort(excludes.begin(), excludes.end());
    REQUIRE(excludes == std::vector<std::string>{oid('a'), oid('b')});
}

TEST_CASE("Exclusion set skips the updated ref, null values and duplicates", "[orchestrator]")
{
    std::vector<RefEntry> refs{{"refs/heads/feature", oid('9')},
                               {"refs/heads/A", oid('a')},
                               {"refs/tags/v1", oid('a')},
                               {"refs/heads/broken", null_oid()}};

    auto created = RangeOrchestrator::exclusion_set(RefUpdate{"refs/heads/feature", null_oid(), oid('d')}, refs);
    REQUIRE(created == std::vector<std::string>{oid('a')});

    auto updated = RangeOrchestrator::exclusion_set(RefUpdate{"refs/heads/feature", oid('9'), oid('d')}, refs);
    REQUIRE(updated == std::vector<std::string>{oid('9')});
}

TEST_CASE("The first unverifiable commit rejects the push", "[orchestrator]")
{
    PushFixture f;
    f.add_signed('b', 'a', "b\n");
    f.objects.add_commit(oid('c'), FakeCommit{{oid('b')}, commit_body({oid('b')}, "unsigned\n"),
                                              {{"keys/alice.asc", fake_key("AAAA", "Alice")}}});
    f.add_signed('d', 'c', "d\n");

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), oid('d')});
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->accepted());
    REQUIRE(report->range == std::vector<std::string>{oid('d'), oid('c'), oid('b')});
    REQUIRE(report->failure->commit == oid('c'));
    REQUIRE(report->failure->code == ErrorCode::NoSignature);
    REQUIRE(report->failure->message.find(oid('c')) != std::string::npos);

    // d verified, c rejected, b never read
    REQUIRE(report->commits.size() == 2);
    REQUIRE(report->commits[0].verdict == Verdict::Verified);
    REQUIRE(report->commits[1].commit == oid('c'));
    REQUIRE(report->commits[1].verdict == Verdict::NoSignature);
    REQUIRE(report->commits[1].attempts.empty());
    REQUIRE(report->to_json()["commits"][1]["verdict"] == "NoSignature");
    REQUIRE(std::find(f.objects.raw_commit_requests.begin(), f.objects.raw_commit_requests.end(), oid('b')) ==
            f.objects.raw_commit_requests.end());
}

TEST_CASE("A root commit is rejected even when signed", "[orchestrator]")
{
    PushFixture f;
    f.objects.add_commit(oid('9'), FakeCommit{{}, signed_commit({}, "new root\n", "AAAA"),
                                              {{"keys/alice.asc", fake_key("AAAA", "Alice")}}});

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/orphan", null_oid(), oid('9')});
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->accepted());
    REQUIRE(report->failure->code == ErrorCode::NoParents);
    REQUIRE(f.backend.import_calls == 0);
}

TEST_CASE("A commit signed by an unknown key is untrusted", "[orchestrator]")
{
    PushFixture f;
    f.add_signed('b', 'a', "b\n", "EEEE");

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), oid('b')});
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->accepted());
    REQUIRE(report->failure->code == ErrorCode::Untrusted);
    REQUIRE(report->failure->message.find("SignatureError") != std::string::npos);
    REQUIRE(report->commits.size() == 1);
    REQUIRE_FALSE(report->commits[0].accepted);
}

TEST_CASE("A commit may add a key that its children then use", "[orchestrator]")
{
    PushFixture f;
    f.objects.add_commit(oid('b'), FakeCommit{{oid('a')}, signed_commit({oid('a')}, "add bob\n", "AAAA"),
                                              {{"keys/alice.asc", fake_key("AAAA", "Alice")},
                                               {"keys/bob.asc", fake_key("BBBB", "Bob")}}});
    f.objects.add_commit(oid('c'), FakeCommit{{oid('b')}, signed_commit({oid('b')}, "by bob\n", "BBBB"), {}});

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), oid('c')});
    REQUIRE(report.has_value());
    REQUIRE(report->accepted());
    REQUIRE(report->commits.size() == 2);
}

TEST_CASE("A commit cannot trust a key it introduces itself", "[orchestrator]")
{
    PushFixture f;
    f.objects.add_commit(oid('b'), FakeCommit{{oid('a')}, signed_commit({oid('a')}, "self-signed\n", "BBBB"),
                                              {{"keys/bob.asc", fake_key("BBBB", "Bob")}}});

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), oid('b')});
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->accepted());
}

TEST_CASE("Verifying the same update twice gives the same answer", "[orchestrator]")
{
    PushFixture f;
    f.add_signed('b', 'a', "b\n");
    RefUpdate update{"refs/heads/main", oid('a'), oid('b')};

    auto first = f.orchestrator.verify_push(update);
    auto second = f.orchestrator.verify_push(update);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->accepted() == second->accepted());
    REQUIRE(first->to_json() == second->to_json());
}

TEST_CASE("Push report serializes decisions", "[orchestrator]")
{
    PushFixture f;
    f.add_signed('b', 'a', "b\n");

    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), oid('b')});
    REQUIRE(report.has_value());

    auto j = report->to_json();
    REQUIRE(j["ref"] == "refs/heads/main");
    REQUIRE(j["accepted"] == true);
    REQUIRE(j["failure"].is_null());
    REQUIRE(j["range"].size() == 1);
    REQUIRE(j["commits"][0]["trusted_parent"] == oid('a'));
    REQUIRE(j["commits"][0]["verdict"] == "Verified");
    REQUIRE(j["commits"][0]["attempts"][0]["verdict"] == "Verified");
    REQUIRE(j["commits"][0]["attempts"][0]["signer_uid"] == "Alice");
    REQUIRE(j["commits"][0]["attempts"][0]["keys_imported"] == 1);
}

TEST_CASE("Report is written to disk as JSON", "[orchestrator]")
{
    PushReport report;
    report.update = RefUpdate{"refs/heads/main", oid('a'), oid('b')};
    report.range = {oid('b')};
    report.failure = PushFailure{oid('b'), ErrorCode::NoSignature, "commit is not signed"};

    auto path = fs::temp_directory_path() / "sigchain-report-test.json";
    REQUIRE(write_report(report, path.string()).has_value());

    std::ifstream in(path);
    auto j = nlohmann::json::parse(in);
    REQUIRE(j["accepted"] == false);
    REQUIRE(j["failure"]["code"] == "NoSignature");
    fs::remove(path);

    auto bad = write_report(report, (fs::temp_directory_path() / "no-such-dir" / "r.json").string());
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ResourceError);
}

TEST_CASE("Malformed object ids are a usage error", "[orchestrator]")
{
    PushFixture f;
    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", "HEAD", oid('b')});
    REQUIRE_FALSE(report.has_value());
    REQUIRE(report.error().code == ErrorCode::UsageError);

    auto empty_ref = f.orchestrator.verify_push(RefUpdate{"", oid('a'), oid('b')});
    REQUIRE_FALSE(empty_ref.has_value());
}

TEST_CASE("Unknown commits surface as object store errors", "[orchestrator]")
{
    PushFixture f;
    auto report = f.orchestrator.verify_push(RefUpdate{"refs/heads/main", oid('a'), oid('e')});
    REQUIRE_FALSE(report.has_value());
    REQUIRE(report.error().code == ErrorCode::ObjectStoreError);
}
