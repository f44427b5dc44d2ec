#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sigchain
{

    /** Kind of a tree entry as reported by the object store */
    enum class EntryType
    {
        Blob,
        Tree,
        Commit // submodule gitlink
    };

    struct TreeEntry
    {
        EntryType type{EntryType::Blob};
        std::string object_id;
        std::string path; // repository-relative
    };

    /** A commit as the verifier sees it; read-only */
    struct Commit
    {
        std::string id;
        std::vector<std::string> parents;
        std::string raw;
    };

    struct RefEntry
    {
        std::string name;
        std::string object_id;
    };

    /**
     * Read-only query surface over the version-control object store.
     * Nothing in the verifier writes to the repository; every call here is
     * a query.
     */
    class ObjectStore
    {
    public:
        virtual ~ObjectStore() = default;

        /** Raw serialized commit object (headers, blank line, message) */
        virtual Result<std::string> raw_commit(const std::string &commit_id) = 0;

        /** Parent ids in the order recorded in the commit */
        virtual Result<std::vector<std::string>> parents(const std::string &commit_id) = 0;

        /**
         * Type of the entry at `path` within the commit's tree, or nullopt
         * when the path does not exist in that commit.
         */
        virtual Result<std::optional<EntryType>> entry_type(
            const std::string &commit_id,
            const std::string &path) = 0;

        /** Every blob transitively under `path` within the commit's tree */
        virtual Result<std::vector<TreeEntry>> list_blobs(
            const std::string &commit_id,
            const std::string &path) = 0;

        /** Contents of the blob at `path` within the commit's tree */
        virtual Result<std::string> blob(
            const std::string &commit_id,
            const std::string &path) = 0;

        /**
         * Commits reachable from `include` but from none of `exclude`, in
         * the store's traversal order.
         */
        virtual Result<std::vector<std::string>> rev_list(
            const std::string &include,
            const std::vector<std::string> &exclude) = 0;

        /** Snapshot of all references and the objects they point at */
        virtual Result<std::vector<RefEntry>> list_refs() = 0;

        /** Repository configuration value, nullopt when unset */
        virtual Result<std::optional<std::string>> config_get(const std::string &key) = 0;

        /** Raw bytes and parents of one commit */
        Result<Commit> commit(const std::string &commit_id);
    };

    namespace git
    {

        /**
         * ObjectStore backed by the git command line. Every query spawns
         * `git --git-dir=<dir> ...`.
         */
        class GitObjectStore : public ObjectStore
        {
        public:
            GitObjectStore(std::filesystem::path git_dir, std::string git_program = "git");

            Result<std::string> raw_commit(const std::string &commit_id) override;

            Result<std::vector<std::string>> parents(const std::string &commit_id) override;

            Result<std::optional<EntryType>> entry_type(
                const std::string &commit_id,
                const std::string &path) override;

            Result<std::vector<TreeEntry>> list_blobs(
                const std::string &commit_id,
                const std::string &path) override;

            Result<std::string> blob(
                const std::string &commit_id,
                const std::string &path) override;

            Result<std::vector<std::string>> rev_list(
                const std::string &include,
                const std::vector<std::string> &exclude) override;

            Result<std::vector<RefEntry>> list_refs() override;

            Result<std::optional<std::string>> config_get(const std::string &key) override;

        private:
            Result<std::string> run_git(std::vector<std::string> args,
                                        const std::optional<std::string> &input = std::nullopt);

            std::filesystem::path git_dir_;
            std::string git_program_;
        };

        /** Parse one `ls-tree` record: "<mode> SP <type> SP <oid> TAB <path>" */
        Result<TreeEntry> parse_ls_tree_record(std::string_view record);

    } // namespace git

} // namespace sigchain
