#include "sigchain/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <toml++/toml.h>

namespace sigchain
{
    namespace
    {
        VerifyConfig parse_toml(const toml::table &tbl, VerifyConfig cfg)
        {
            if (auto verify = tbl["verify"].as_table())
            {
                if (auto keydir = (*verify)["keydir"].value<std::string>())
                    cfg.key_dir = *keydir;
                if (auto gpg = (*verify)["gpg_program"].value<std::string>())
                    cfg.gpg_program = *gpg;
            }

            if (auto git = tbl["git"].as_table())
            {
                if (auto program = (*git)["program"].value<std::string>())
                    cfg.git_program = *program;
            }

            if (auto log = tbl["log"].as_table())
            {
                if (auto level = (*log)["level"].value<std::string>())
                    cfg.log_level = *level;
            }

            if (auto report = tbl["report"].as_table())
            {
                if (auto path = (*report)["path"].value<std::string>())
                    cfg.report_path = *path;
            }

            if (auto scratch = tbl["scratch"].as_table())
            {
                if (auto root = (*scratch)["root"].value<std::string>())
                    cfg.scratch_root = *root;
            }

            return cfg;
        }

        bool is_log_level(const std::string &level)
        {
            return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
                   level == "warning" || level == "error" || level == "err" || level == "critical" ||
                   level == "off";
        }
    } // namespace

    std::optional<std::string> process_env(const std::string &name)
    {
        if (const char *value = std::getenv(name.c_str()))
            return std::string(value);
        return std::nullopt;
    }

    Result<std::string> normalize_key_dir(const std::string &key_dir)
    {
        if (key_dir.starts_with('/'))
            return std::unexpected(SigchainError::config("key directory must be repository-relative: " + key_dir));

        std::string out;
        std::istringstream segments(key_dir);
        std::string segment;
        while (std::getline(segments, segment, '/'))
        {
            if (segment.empty() || segment == ".")
                continue;
            if (segment == "..")
                return std::unexpected(SigchainError::config("key directory may not contain '..': " + key_dir));
            if (!out.empty())
                out += '/';
            out += segment;
        }

        if (out.empty())
            return std::unexpected(SigchainError::config("key directory is empty"));
        return out;
    }

    Result<VerifyConfig> ConfigLoader::load(const std::string &path, VerifyConfig cfg)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(SigchainError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str(), std::move(cfg));
    }

    Result<VerifyConfig> ConfigLoader::from_string(const std::string &toml_content, VerifyConfig cfg)
    {
        try
        {
            auto tbl = toml::parse(toml_content);
            return parse_toml(tbl, std::move(cfg));
        }
        catch (const std::exception &e)
        {
            return std::unexpected(SigchainError::config(std::string("Failed to parse TOML: ") + e.what()));
        }
    }

    void ConfigLoader::apply_environment(VerifyConfig &cfg, const EnvLookup &env)
    {
        if (auto git_dir = env("GIT_DIR"))
            cfg.git_dir = *git_dir;
        if (auto tmp = env("TMPDIR"); tmp && !tmp->empty())
            cfg.scratch_root = *tmp;
    }

    Result<void> ConfigLoader::apply_repository(VerifyConfig &cfg, ObjectStore &objects)
    {
        auto keydir = objects.config_get(kKeyDirConfigKey);
        if (!keydir)
            return std::unexpected(keydir.error());
        if (*keydir)
            cfg.key_dir = **keydir;

        auto gpg = objects.config_get(kGpgProgramConfigKey);
        if (!gpg)
            return std::unexpected(gpg.error());
        if (*gpg && !(*gpg)->empty())
            cfg.gpg_program = **gpg;

        return {};
    }

    void ConfigLoader::apply_env_overrides(VerifyConfig &cfg, const EnvLookup &env)
    {
        if (auto keydir = env("SIGCHAIN_KEYDIR"))
            cfg.key_dir = *keydir;
        if (auto gpg = env("SIGCHAIN_GPG_PROGRAM"))
            cfg.gpg_program = *gpg;
        if (auto level = env("SIGCHAIN_LOG_LEVEL"))
            cfg.log_level = *level;
    }

    Result<void> ConfigLoader::validate(VerifyConfig &cfg)
    {
        if (cfg.git_dir.empty())
            return std::unexpected(SigchainError::usage("GIT_DIR is not set; run this as a git hook"));
        if (cfg.git_program.empty())
            return std::unexpected(SigchainError::config("git program is empty"));
        if (cfg.gpg_program.empty())
            return std::unexpected(SigchainError::config("gpg program is empty"));
        if (!is_log_level(cfg.log_level))
            return std::unexpected(SigchainError::config("unknown log level: " + cfg.log_level));

        auto keydir = normalize_key_dir(cfg.key_dir);
        if (!keydir)
            return std::unexpected(keydir.error());
        cfg.key_dir = *keydir;
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const VerifyConfig &cfg)
    {
        nlohmann::json j;
        j["git_dir"] = cfg.git_dir.string();
        j["git_program"] = cfg.git_program;
        j["key_dir"] = cfg.key_dir;
        j["gpg_program"] = cfg.gpg_program;
        j["scratch_root"] = cfg.scratch_root.string();
        j["log_level"] = cfg.log_level;
        j["report_path"] = cfg.report_path ? nlohmann::json(*cfg.report_path) : nlohmann::json(nullptr);
        return j;
    }

} // namespace sigchain
