// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SetupLog.hpp
 * @brief Self-diagnostic stream of the tracing runtime
 *
 * Problems the runtime cannot report to the caller (a sink that fails to build, throws on write,
 * or drops entries under backpressure) are appended here as TraceEntry values. Every manager
 * has one: a manager constructed without a SetupLog creates its own.
 *
 * Each appended entry is also emitted through the library's spdlog logger, so diagnostics are
 * visible even when nobody inspects the SetupLog.
 *
 * THREAD SAFETY: all member functions are thread-safe.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <tracemux/TraceEntry.hpp>
#include <tracemux/TraceLevel.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT SetupLog
    {
    public:
        typedef std::shared_ptr<SetupLog> ptr;

        SetupLog();

        SetupLog(SetupLog const&) = delete;
        SetupLog& operator=(SetupLog const&) = delete;

        /** Append an entry and mirror it to the spdlog logger. */
        void append(TraceEntry entry);

        /**
         * Append an entry stamped with the current time.
         * @param source Name of the reporting component, stored as the tracer name.
         */
        void append(TraceLevel level, std::string_view source, std::string message, std::optional<std::string> details = std::nullopt);

        void debug(std::string_view source, std::string message);
        void info(std::string_view source, std::string message);
        void warn(std::string_view source, std::string message, std::optional<std::string> details = std::nullopt);
        void error(std::string_view source, std::string message, std::optional<std::string> details = std::nullopt);
        void severe(std::string_view source, std::string message, std::optional<std::string> details = std::nullopt);

        /** Snapshot of every entry appended so far, in append order. */
        [[nodiscard]]
        std::vector<TraceEntry> entries() const;

        [[nodiscard]]
        std::size_t count() const;

        [[nodiscard]]
        std::size_t countIf(std::function<bool(TraceEntry const&)> const& predicate) const;

        /** Number of entries at or above the given level. */
        [[nodiscard]]
        std::size_t countAtLeast(TraceLevel level) const;

        /** true if any entry has a level of Error or Severe. */
        [[nodiscard]]
        bool hasErrors() const;

        void clear();

    private:
        mutable std::mutex _mutex;
        std::vector<TraceEntry> _entries;
    };
}
