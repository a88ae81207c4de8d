// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Implements logging initialization for the tracemux library
 *
 * The logging macros (TRACEMUX_ERROR, TRACEMUX_WARN, TRACEMUX_INFO, TRACEMUX_DEBUG,
 * TRACEMUX_TRACE) are defined in the header. This translation unit only applies the
 * runtime log level.
 *
 * Log initialization happens lazily, the first time a SetupLog is created, using
 * std::call_once to ensure thread-safe initialization.
 *
 * @see Logging.hpp for macro definitions
 * @see SetupLog.cpp for the call site
 */

#include "tracemux-internal/Logging.hpp"
#include <cstdlib>
#include <mutex>
#include <string>

namespace tracemux::lib
{
    namespace
    {
        std::once_flag loggingInitFlag;
    }

    void initializeLogging()
    {
        std::call_once(loggingInitFlag,
            []()
            {
                auto const* envLevel = std::getenv("TRACEMUX_LOG_LEVEL");
                if (envLevel == nullptr)
                {
                    return;
                }

                // spdlog maps unknown names to "off", which would silence everything on a typo.
                auto const level = spdlog::level::from_str(envLevel);
                if ((level == spdlog::level::off) && (std::string{envLevel} != "off"))
                {
                    TRACEMUX_WARN("Ignoring unknown TRACEMUX_LOG_LEVEL value '{}'", envLevel);
                    return;
                }
                spdlog::set_level(level);
            });
    }
}
