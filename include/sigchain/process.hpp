#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sigchain
{

    struct ProcessResult
    {
        int exit_code{-1};
        std::string out;
        std::string err;

        bool ok() const { return exit_code == 0; }
    };

    struct ProcessSpec
    {
        /** argv[0] is looked up on PATH */
        std::vector<std::string> argv;
        std::optional<std::string> input;
        std::optional<std::filesystem::path> cwd;
    };

    /**
     * Run a child process to completion, feeding `input` on stdin and
     * capturing stdout and stderr. A non-zero exit status is not an error;
     * callers inspect ProcessResult::exit_code. Failing to spawn, or the
     * child being killed by a signal, is reported as ProcessError.
     */
    Result<ProcessResult> run_process(const ProcessSpec &spec);

    /** Render argv for log output */
    std::string describe_command(const std::vector<std::string> &argv);

} // namespace sigchain
