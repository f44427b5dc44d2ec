#include "sigchain/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sigchain
{

    void init_logging(const std::string &level)
    {
        auto logger = spdlog::get("sigchain");
        if (!logger)
            logger = spdlog::stderr_color_mt("sigchain");
        logger->set_pattern("sigchain: [%l] %v");
        logger->set_level(spdlog::level::from_str(level));
        spdlog::set_default_logger(logger);
    }

} // namespace sigchain
