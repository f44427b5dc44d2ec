#pragma once

#include "config.hpp"

namespace sigchain::cli
{

    /** Exit status reported to git: 0 accepts the update, 1 rejects it */
    inline constexpr int kAccept = 0;
    inline constexpr int kReject = 1;

    /**
     * Entry point of the update hook:
     *   sigchain-verify [options] <ref-name> <old-value> <new-value>
     * All output goes to stderr.
     */
    int run(int argc, char *argv[], const EnvLookup &env = process_env);

} // namespace sigchain::cli
