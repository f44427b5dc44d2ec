#pragma once

#include "object_store.hpp"
#include "types.hpp"
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sigchain
{

    /**
     * Everything the verifier needs to know about its surroundings. Built
     * once at startup and passed down; components never consult the
     * environment themselves.
     */
    struct VerifyConfig
    {
        std::filesystem::path git_dir;
        std::string git_program{"git"};
        std::string key_dir{"keys"};
        std::string gpg_program{"gpg"};
        std::filesystem::path scratch_root{"/tmp"};
        std::string log_level{"info"};
        std::optional<std::string> report_path;
    };

    /** Environment lookup; returns nullopt for unset variables */
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    /** EnvLookup over the real process environment */
    std::optional<std::string> process_env(const std::string &name);

    /**
     * ConfigLoader layers configuration sources: defaults, an optional TOML
     * file, repository config, then SIGCHAIN_* environment overrides.
     */
    class ConfigLoader
    {
    public:
        static constexpr const char *kKeyDirConfigKey = "hooks.verify.keydir";
        static constexpr const char *kGpgProgramConfigKey = "gpg.program";

        /** Load TOML from a file on top of `cfg` */
        static Result<VerifyConfig> load(const std::string &path, VerifyConfig cfg = {});

        /** Parse TOML content on top of `cfg` */
        static Result<VerifyConfig> from_string(const std::string &toml_content, VerifyConfig cfg = {});

        /** Repository binding (GIT_DIR) and scratch location (TMPDIR) */
        static void apply_environment(VerifyConfig &cfg, const EnvLookup &env);

        /** Read hooks.verify.keydir and gpg.program from the repository */
        static Result<void> apply_repository(VerifyConfig &cfg, ObjectStore &objects);

        /** SIGCHAIN_KEYDIR, SIGCHAIN_GPG_PROGRAM, SIGCHAIN_LOG_LEVEL */
        static void apply_env_overrides(VerifyConfig &cfg, const EnvLookup &env);

        /** Normalise key_dir and check required fields */
        static Result<void> validate(VerifyConfig &cfg);

        /** Serialize config to JSON for debug output */
        static nlohmann::json to_json(const VerifyConfig &cfg);
    };

    /** Collapse "." and empty segments; reject empty, absolute or ".." paths */
    Result<std::string> normalize_key_dir(const std::string &key_dir);

} // namespace sigchain
