// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TraceEntry.hpp
 * @brief The record produced by a single trace call
 *
 * A TraceEntry is built once per trace call (only if at least one bound writer is enabled)
 * and handed to every enabled writer by const reference. Writers that need the entry after
 * write() returns must copy it; the background dispatcher does exactly that.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <tracemux/TraceLevel.hpp>

namespace tracemux::lib
{
    struct TraceEntry
    {
        /** Wall clock time of the trace call. */
        std::chrono::system_clock::time_point timestamp;

        /** Normalized name of the Tracer that produced the entry. */
        std::string tracerName;

        TraceLevel level;

        std::string message;

        /** Optional structured detail, typically the description of a caught exception. */
        std::optional<std::string> details;
    };
}
