#include "sigchain/process.hpp"
#include "sigchain/signature_backend.hpp"
#include <fstream>

#include <spdlog/spdlog.h>

namespace sigchain::gpg
{

    namespace
    {
        std::string first_line(const std::string &text)
        {
            auto nl = text.find('\n');
            return nl == std::string::npos ? text : text.substr(0, nl);
        }
    } // namespace

    GpgBackend::GpgBackend(std::string program) : program_(std::move(program))
    {
    }

    std::vector<std::string> GpgBackend::base_args(const TrustStore &store) const
    {
        return {program_,
                "--homedir", store.home().string(),
                "--batch",
                "--no-tty",
                "--no-autostart"};
    }

    Result<void> GpgBackend::import_key(TrustStore &store, std::string_view key_material)
    {
        ProcessSpec spec;
        spec.argv = base_args(store);
        spec.argv.push_back("--quiet");
        spec.argv.push_back("--import");
        spec.input = std::string(key_material);

        spdlog::debug("running {}", describe_command(spec.argv));
        auto result = run_process(spec);
        if (!result)
            return std::unexpected(result.error());
        if (!result->ok())
        {
            return std::unexpected(SigchainError::key_import(std::format(
                "{} --import exited with {}: {}", program_, result->exit_code, first_line(result->err))));
        }

        store.note_import();
        return {};
    }

    Result<std::string> GpgBackend::verify(const TrustStore &store,
                                           std::string_view payload,
                                           std::string_view signature)
    {
        // gpg reads a detached signature from a file and the signed data from stdin
        auto sig_path = store.scratch_file("commit.sig");
        {
            std::ofstream sig_file(sig_path, std::ios::binary | std::ios::trunc);
            if (!sig_file.is_open())
            {
                return std::unexpected(SigchainError::resource("unable to write signature file " + sig_path.string()));
            }
            sig_file.write(signature.data(), static_cast<std::streamsize>(signature.size()));
            if (!sig_file)
                return std::unexpected(SigchainError::resource("unable to write signature file " + sig_path.string()));
        }

        ProcessSpec spec;
        spec.argv = base_args(store);
        spec.argv.insert(spec.argv.end(), {"--status-fd", "1",
                                           "--trust-model", "always",
                                           "--verify", sig_path.string(), "-"});
        spec.input = std::string(payload);

        spdlog::debug("running {}", describe_command(spec.argv));
        auto result = run_process(spec);
        if (!result)
            return std::unexpected(result.error());

        // A non-zero exit only means the signature did not check out; the
        // status stream says why.
        if (!result->err.empty())
            spdlog::debug("{} stderr: {}", program_, result->err);
        return std::move(result->out);
    }

} // namespace sigchain::gpg
