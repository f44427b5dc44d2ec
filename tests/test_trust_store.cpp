#include <catch2/catch_test_macros.hpp>
#include "sigchain/trust_store.hpp"
#include <filesystem>
#include <fstream>

using namespace sigchain;
namespace fs = std::filesystem;

TEST_CASE("TrustStore creates a private directory and removes it on destruction", "[trust_store]")
{
    fs::path home;
    {
        auto store = TrustStore::create(fs::temp_directory_path());
        REQUIRE(store.has_value());
        home = store->home();
        REQUIRE(fs::is_directory(home));

        auto perms = fs::status(home).permissions();
        REQUIRE((perms & fs::perms::group_all) == fs::perms::none);
        REQUIRE((perms & fs::perms::others_all) == fs::perms::none);

        std::ofstream(store->scratch_file("pubring.kbx")) << "data";
        fs::create_directory(home / "private-keys-v1.d");
        std::ofstream(home / "private-keys-v1.d" / "x.key") << "data";
    }
    REQUIRE_FALSE(fs::exists(home));
}

TEST_CASE("Two trust stores never share a directory", "[trust_store]")
{
    auto a = TrustStore::create(fs::temp_directory_path());
    auto b = TrustStore::create(fs::temp_directory_path());
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->home() != b->home());
}

TEST_CASE("Moving a TrustStore transfers ownership of the directory", "[trust_store]")
{
    auto created = TrustStore::create(fs::temp_directory_path());
    REQUIRE(created.has_value());
    fs::path home = created->home();

    TrustStore moved = std::move(*created);
    REQUIRE(moved.home() == home);
    REQUIRE(created->home().empty());

    created->release();
    REQUIRE(fs::exists(home));

    moved.release();
    REQUIRE_FALSE(fs::exists(home));
    moved.release();
}

TEST_CASE("TrustStore creation fails cleanly for a missing scratch root", "[trust_store]")
{
    auto store = TrustStore::create(fs::temp_directory_path() / "sigchain-does-not-exist" / "nested");
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().code == ErrorCode::ResourceError);
}

TEST_CASE("Import counter resets on release", "[trust_store]")
{
    auto store = TrustStore::create(fs::temp_directory_path());
    REQUIRE(store.has_value());
    store->note_import();
    store->note_import();
    REQUIRE(store->imported_keys() == 2);
    store->release();
    REQUIRE(store->imported_keys() == 0);
}
