// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Exception-safe logging macros for tracemux internal diagnostics
 *
 * This file provides a thin wrapper around spdlog for the library's own logging.
 * It is distinct from the trace routing the library implements: these macros are
 * the sink of the SetupLog mirror and of the few places that have no SetupLog at hand.
 *
 * - All macros wrap log calls in try/catch so that logging never crashes the application
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG logs are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - Runtime log level is controlled by the TRACEMUX_LOG_LEVEL environment variable
 */

#pragma once

// In debug mode we keep all log statements.
// In release mode we only consider info and up.
// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
//
// Actual logging levels can be configured through the TRACEMUX_LOG_LEVEL environment variable
//
//
// Set the compile-time active log level based on build type
// This controls which log statements are actually compiled into the binary
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
       // Debug builds: include all log levels down to TRACE for maximum diagnostics
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
       // Release builds: only include INFO and above (TRACE/DEBUG compile to nothing)
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>

namespace tracemux::lib
{
    /**
     * Apply the TRACEMUX_LOG_LEVEL environment variable to the spdlog default logger.
     * Safe to call any number of times; the environment is only read on the first call.
     */
    void initializeLogging();
}

/**
 * TRACEMUX_TRACE: Most verbose logging for detailed execution traces
 * Used for fine-grained tracing of queue and pipeline internals.
 * Only compiled in debug builds. Wrapped in try/catch to ensure logging never crashes.
 */
#define TRACEMUX_TRACE(...)                 \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_TRACE(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)
/**
 * TRACEMUX_DEBUG: Debug-level logging for development diagnostics
 * Used for lifecycle details useful during development.
 * Only compiled in debug builds. Exception-safe.
 */
#define TRACEMUX_DEBUG(...)                 \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_DEBUG(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * TRACEMUX_INFO: Informational logging for normal operations
 * Used for manager start/stop and writer construction.
 * Compiled in all builds. Exception-safe.
 */
#define TRACEMUX_INFO(...)                 \
    do                                \
    {                                 \
        try                           \
        {                             \
            SPDLOG_INFO(__VA_ARGS__); \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/**
 * TRACEMUX_WARN: Warning-level logging for potential issues
 * Used for dropped entries, no-op fallbacks and other recoverable conditions.
 * Compiled in all builds. Exception-safe.
 */
#define TRACEMUX_WARN(...)                 \
    do                                \
    {                                 \
        try                           \
        {                             \
            SPDLOG_WARN(__VA_ARGS__); \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/**
 * TRACEMUX_ERROR: Error-level logging for operation failures
 * Used for sink write failures and failed writer builds.
 * Compiled in all builds. Exception-safe.
 */
#define TRACEMUX_ERROR(...)                 \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_ERROR(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * TRACEMUX_CRITICAL: Critical-level logging for unrecoverable failures
 * Used for conditions that leave a manager without any working writer.
 * Compiled in all builds. Exception-safe.
 */
#define TRACEMUX_CRITICAL(...)                 \
    do                                    \
    {                                     \
        try                               \
        {                                 \
            SPDLOG_CRITICAL(__VA_ARGS__); \
        }                                 \
        catch (...)                       \
        {}                                \
    }                                     \
    while (false)
