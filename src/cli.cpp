#include "sigchain/cli.hpp"
#include "sigchain/config.hpp"
#include "sigchain/key_loader.hpp"
#include "sigchain/logging.hpp"
#include "sigchain/object_store.hpp"
#include "sigchain/parent_walker.hpp"
#include "sigchain/range_orchestrator.hpp"
#include "sigchain/report.hpp"
#include "sigchain/signature_backend.hpp"
#include "sigchain/signature_verifier.hpp"
#include <iostream>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace sigchain::cli
{

	namespace
	{
		struct Overrides
		{
			std::string config_path;
			std::string key_dir;
			std::string gpg_program;
			std::string log_level;
			std::string report_path;
		};

		Result<VerifyConfig> resolve_config(const Overrides &flags, const EnvLookup &env)
		{
			VerifyConfig cfg;
			if (!flags.config_path.empty())
			{
				auto loaded = ConfigLoader::load(flags.config_path, cfg);
				if (!loaded)
					return loaded;
				cfg = std::move(*loaded);
			}

			ConfigLoader::apply_environment(cfg, env);
			if (cfg.git_dir.empty())
				return std::unexpected(SigchainError::usage("GIT_DIR is not set; sigchain-verify must run as a git hook"));

			git::GitObjectStore objects(cfg.git_dir, cfg.git_program);
			if (auto repo = ConfigLoader::apply_repository(cfg, objects); !repo)
				return std::unexpected(repo.error());

			ConfigLoader::apply_env_overrides(cfg, env);

			if (!flags.key_dir.empty())
				cfg.key_dir = flags.key_dir;
			if (!flags.gpg_program.empty())
				cfg.gpg_program = flags.gpg_program;
			if (!flags.log_level.empty())
				cfg.log_level = flags.log_level;
			if (!flags.report_path.empty())
				cfg.report_path = flags.report_path;

			if (auto valid = ConfigLoader::validate(cfg); !valid)
				return std::unexpected(valid.error());
			return cfg;
		}
	} // namespace

	int run(int argc, char *argv[], const EnvLookup &env)
	{
		CLI::App app{"Reject ref updates containing commits not signed by a key their parent trusts"};
		app.name("sigchain-verify");

		RefUpdate update;
		Overrides flags;
		app.add_option("ref-name", update.ref_name, "Name of the ref being updated")->required();
		app.add_option("old-value", update.old_value, "Object id the ref pointed at (all zeros on creation)")->required();
		app.add_option("new-value", update.new_value, "Object id the ref will point at (all zeros on deletion)")->required();
		app.add_option("--config", flags.config_path, "Path to config TOML");
		app.add_option("--keydir", flags.key_dir, "Repository-relative key directory (default: keys)");
		app.add_option("--gpg-program", flags.gpg_program, "Signature verification program (default: gpg)");
		app.add_option("--log-level", flags.log_level, "trace, debug, info, warn, error");
		app.add_option("--report", flags.report_path, "Write a JSON verification report to this file");

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::ParseError &e)
		{
			// help and parse errors both go to stderr; stdout belongs to git
			return app.exit(e, std::cerr, std::cerr) == 0 ? kAccept : kReject;
		}

		init_logging("info");

		auto cfg = resolve_config(flags, env);
		if (!cfg)
		{
			spdlog::error("{}", cfg.error().what());
			return kReject;
		}

		init_logging(cfg->log_level);
		spdlog::debug("effective configuration: {}", ConfigLoader::to_json(*cfg).dump());

		git::GitObjectStore objects(cfg->git_dir, cfg->git_program);
		gpg::GpgBackend backend(cfg->gpg_program);
		KeyMaterialLoader loader(objects, backend, cfg->scratch_root);
		SignatureVerifier verifier(backend);
		ParentTrustWalker walker(loader, verifier);
		RangeOrchestrator orchestrator(objects, walker, cfg->key_dir);

		auto report = orchestrator.verify_push(update);
		if (!report)
		{
			spdlog::error("verification of {} aborted: {}", update.ref_name, report.error().what());
			return kReject;
		}

		if (cfg->report_path)
		{
			if (auto written = write_report(*report, *cfg->report_path); !written)
			{
				spdlog::error("{}", written.error().what());
				return kReject;
			}
		}

		return report->accepted() ? kAccept : kReject;
	}

} // namespace sigchain::cli
