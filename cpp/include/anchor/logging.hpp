#pragma once

#include <spdlog/common.h>

namespace anchor::logging
{

    /** -v count minus -q count to a level: <= -2 error, -1 warn, 0 info, 1 debug, >= 2 trace */
    spdlog::level::level_enum level_for_verbosity(int verbosity);

    /**
     * Install the default logger on stderr so stdout stays free for command
     * output. ANCHOR_LOG_LEVEL overrides the verbosity when set.
     */
    void init(int verbosity);

    void shutdown();

} // namespace anchor::logging
