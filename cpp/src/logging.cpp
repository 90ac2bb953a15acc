#include "anchor/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace anchor::logging
{

    spdlog::level::level_enum level_for_verbosity(int verbosity)
    {
        if (verbosity <= -2)
            return spdlog::level::err;
        if (verbosity == -1)
            return spdlog::level::warn;
        if (verbosity == 0)
            return spdlog::level::info;
        if (verbosity == 1)
            return spdlog::level::debug;
        return spdlog::level::trace;
    }

    void init(int verbosity)
    {
        auto level = level_for_verbosity(verbosity);
        if (const char *env = std::getenv("ANCHOR_LOG_LEVEL"))
            level = spdlog::level::from_str(env);

        spdlog::drop("anchor");
        auto logger = spdlog::stderr_color_mt("anchor");
        logger->set_pattern(verbosity > 0 ? "[%H:%M:%S.%e] [%^%l%$] %v" : "%^%v%$");
        logger->set_level(level);
        spdlog::set_default_logger(std::move(logger));
        spdlog::flush_on(spdlog::level::warn);
    }

    void shutdown()
    {
        spdlog::shutdown();
    }

} // namespace anchor::logging
