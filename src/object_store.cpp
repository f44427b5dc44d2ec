#include "sigchain/object_store.hpp"
#include "sigchain/process.hpp"
#include <sstream>

#include <spdlog/spdlog.h>

namespace sigchain
{

    Result<Commit> ObjectStore::commit(const std::string &commit_id)
    {
        auto raw = raw_commit(commit_id);
        if (!raw)
            return std::unexpected(raw.error());
        auto parent_ids = parents(commit_id);
        if (!parent_ids)
            return std::unexpected(parent_ids.error());
        return Commit{commit_id, std::move(*parent_ids), std::move(*raw)};
    }

} // namespace sigchain

namespace sigchain::git
{

    namespace
    {
        Result<void> require_object_id(const std::string &id)
        {
            if (!is_object_id(id))
                return std::unexpected(SigchainError::object_store(std::format("not a valid object id: '{}'", id)));
            return {};
        }

        std::vector<std::string_view> split_records(std::string_view data, char sep)
        {
            std::vector<std::string_view> out;
            while (!data.empty())
            {
                auto pos = data.find(sep);
                if (pos == std::string_view::npos)
                {
                    out.push_back(data);
                    break;
                }
                if (pos > 0)
                    out.push_back(data.substr(0, pos));
                data.remove_prefix(pos + 1);
            }
            return out;
        }

        std::string trim_newline(std::string s)
        {
            while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
                s.pop_back();
            return s;
        }
    } // namespace

    Result<TreeEntry> parse_ls_tree_record(std::string_view record)
    {
        auto tab = record.find('\t');
        if (tab == std::string_view::npos)
            return std::unexpected(SigchainError::parsing(std::format("malformed ls-tree record: '{}'", record)));

        std::string_view meta = record.substr(0, tab);
        auto first_sp = meta.find(' ');
        auto second_sp = first_sp == std::string_view::npos ? std::string_view::npos : meta.find(' ', first_sp + 1);
        if (second_sp == std::string_view::npos)
            return std::unexpected(SigchainError::parsing(std::format("malformed ls-tree record: '{}'", record)));

        std::string_view type = meta.substr(first_sp + 1, second_sp - first_sp - 1);
        TreeEntry entry;
        if (type == "blob")
            entry.type = EntryType::Blob;
        else if (type == "tree")
            entry.type = EntryType::Tree;
        else if (type == "commit")
            entry.type = EntryType::Commit;
        else
            return std::unexpected(SigchainError::parsing(std::format("unknown tree entry type '{}'", type)));

        entry.object_id = std::string(meta.substr(second_sp + 1));
        entry.path = std::string(record.substr(tab + 1));
        return entry;
    }

    GitObjectStore::GitObjectStore(std::filesystem::path git_dir, std::string git_program)
        : git_dir_(std::move(git_dir)), git_program_(std::move(git_program))
    {
    }

    Result<std::string> GitObjectStore::run_git(std::vector<std::string> args,
                                                const std::optional<std::string> &input)
    {
        ProcessSpec spec;
        spec.argv.reserve(args.size() + 2);
        spec.argv.push_back(git_program_);
        spec.argv.push_back("--git-dir=" + git_dir_.string());
        for (auto &arg : args)
            spec.argv.push_back(std::move(arg));
        spec.input = input;

        spdlog::debug("running {}", describe_command(spec.argv));
        auto result = run_process(spec);
        if (!result)
            return std::unexpected(result.error());
        if (!result->ok())
        {
            return std::unexpected(SigchainError::object_store(std::format(
                "'{}' failed with exit code {}: {}",
                describe_command(spec.argv), result->exit_code, trim_newline(result->err))));
        }
        return std::move(result->out);
    }

    Result<std::string> GitObjectStore::raw_commit(const std::string &commit_id)
    {
        if (auto valid = require_object_id(commit_id); !valid)
            return std::unexpected(valid.error());
        return run_git({"cat-file", "commit", commit_id});
    }

    Result<std::vector<std::string>> GitObjectStore::parents(const std::string &commit_id)
    {
        if (auto valid = require_object_id(commit_id); !valid)
            return std::unexpected(valid.error());

        auto out = run_git({"rev-list", "--parents", "-n", "1", commit_id});
        if (!out)
            return std::unexpected(out.error());

        std::istringstream words(*out);
        std::string self;
        if (!(words >> self))
            return std::unexpected(SigchainError::object_store("no such commit: " + commit_id));

        std::vector<std::string> result;
        std::string parent;
        while (words >> parent)
            result.push_back(parent);
        return result;
    }

    Result<std::optional<EntryType>> GitObjectStore::entry_type(const std::string &commit_id,
                                                                const std::string &path)
    {
        if (auto valid = require_object_id(commit_id); !valid)
            return std::unexpected(valid.error());

        auto out = run_git({"ls-tree", "-z", "--full-tree", commit_id, "--", path});
        if (!out)
            return std::unexpected(out.error());

        for (auto record : split_records(*out, '\0'))
        {
            auto entry = parse_ls_tree_record(record);
            if (!entry)
                return std::unexpected(entry.error());
            if (entry->path == path)
                return std::optional<EntryType>(entry->type);
        }
        return std::optional<EntryType>();
    }

    Result<std::vector<TreeEntry>> GitObjectStore::list_blobs(const std::string &commit_id,
                                                              const std::string &path)
    {
        if (auto valid = require_object_id(commit_id); !valid)
            return std::unexpected(valid.error());

        auto out = run_git({"ls-tree", "-r", "-z", "--full-tree", commit_id, "--", path});
        if (!out)
            return std::unexpected(out.error());

        std::vector<TreeEntry> blobs;
        for (auto record : split_records(*out, '\0'))
        {
            auto entry = parse_ls_tree_record(record);
            if (!entry)
                return std::unexpected(entry.error());
            if (entry->type == EntryType::Blob)
                blobs.push_back(std::move(*entry));
        }
        return blobs;
    }

    Result<std::string> GitObjectStore::blob(const std::string &commit_id, const std::string &path)
    {
        if (auto valid = require_object_id(commit_id); !valid)
            return std::unexpected(valid.error());
        return run_git({"cat-file", "blob", commit_id + ":" + path});
    }

    Result<std::vector<std::string>> GitObjectStore::rev_list(const std::string &include,
                                                              const std::vector<std::string> &exclude)
    {
        if (auto valid = require_object_id(include); !valid)
            return std::unexpected(valid.error());

        std::string revisions = include + "\n";
        for (const auto &id : exclude)
        {
            if (auto valid = require_object_id(id); !valid)
                return std::unexpected(valid.error());
            revisions += "^" + id + "\n";
        }

        auto out = run_git({"rev-list", "--stdin"}, revisions);
        if (!out)
            return std::unexpected(out.error());

        std::vector<std::string> commits;
        for (auto line : split_records(*out, '\n'))
            commits.emplace_back(line);
        return commits;
    }

    Result<std::vector<RefEntry>> GitObjectStore::list_refs()
    {
        auto out = run_git({"for-each-ref", "--format=%(objectname) %(refname)"});
        if (!out)
            return std::unexpected(out.error());

        std::vector<RefEntry> refs;
        for (auto line : split_records(*out, '\n'))
        {
            auto sp = line.find(' ');
            if (sp == std::string_view::npos)
                return std::unexpected(SigchainError::parsing(std::format("malformed for-each-ref line: '{}'", line)));
            refs.push_back(RefEntry{std::string(line.substr(sp + 1)), std::string(line.substr(0, sp))});
        }
        return refs;
    }

    Result<std::optional<std::string>> GitObjectStore::config_get(const std::string &key)
    {
        ProcessSpec spec;
        spec.argv = {git_program_, "--git-dir=" + git_dir_.string(), "config", "--get", key};
        auto result = run_process(spec);
        if (!result)
            return std::unexpected(result.error());

        // git config exits 1 when the key is not set
        if (result->exit_code == 1)
            return std::optional<std::string>();
        if (!result->ok())
        {
            return std::unexpected(SigchainError::object_store(std::format(
                "git config --get {} failed: {}", key, trim_newline(result->err))));
        }
        return std::optional<std::string>(trim_newline(result->out));
    }

} // namespace sigchain::git
