#pragma once

#include <string>

namespace sigchain
{

    /**
     * Install the "sigchain" logger (stderr only) as the spdlog default.
     * stdout is left untouched because git may relay it to the client.
     */
    void init_logging(const std::string &level);

} // namespace sigchain
