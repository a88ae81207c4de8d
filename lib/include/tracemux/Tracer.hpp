// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Tracer.hpp
 * @brief Named trace handle
 *
 * A Tracer is obtained from a TraceManager by name and is shared by every caller asking for
 * that name. It holds the set of (Switch, EntryWriter) pairs that apply to its name. The
 * TraceManager replaces the whole set when it starts or stops; a call in flight sees either the
 * old or the new set.
 *
 * HOT PATH:
 *   1. atomic load of the bound set
 *   2. for each pair: switch->isEnabled(level) && entryWriter->isEnabled()
 *   3. if any pair is enabled: format the message once, build one TraceEntry
 *   4. write the entry to each enabled pair
 *
 * FAILURE ISOLATION: an exception thrown by a switch, an entry writer or message formatting
 * is reported to the SetupLog at Error level and never reaches the caller. The pair stays bound.
 *
 * USAGE:
 * ```cpp
 * auto tracer = traceManager.getTracer("App.Net");
 * tracer->info("Connected to {}:{}", host, port);
 * tracer->log(TraceLevel::Error, "Connection lost", describeCurrentException());
 * ```
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include <tracemux/EntryWriter.hpp>
#include <tracemux/SetupLog.hpp>
#include <tracemux/Switch.hpp>
#include <tracemux/TraceEntry.hpp>
#include <tracemux/TraceLevel.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    /** One bound (Switch, EntryWriter) pair. */
    struct TraceWriter
    {
        std::shared_ptr<Switch> traceSwitch;
        std::shared_ptr<EntryWriter<TraceEntry>> entryWriter;
    };

    using TraceWriterSet = std::vector<TraceWriter>;

    class TRACEMUX_EXPORT Tracer
    {
    public:
        typedef std::shared_ptr<Tracer> ptr;

        /**
         * Tracers are created by a TraceManager.
         * @param name Normalized tracer name.
         * @param setupLog Destination of failure reports. Must not be null.
         * @param writers Initially bound set. Null means no writers.
         */
        Tracer(std::string name, std::shared_ptr<SetupLog> setupLog, std::shared_ptr<TraceWriterSet const> writers);

        Tracer(Tracer const&) = delete;
        Tracer& operator=(Tracer const&) = delete;

        [[nodiscard]]
        std::string const& name() const noexcept;

        /** true if a call at this level would be written to at least one writer. */
        [[nodiscard]]
        bool isEnabled(TraceLevel level) const;

        /**
         * Write a message as is. Use this overload for messages that are not format strings.
         */
        void log(TraceLevel level, std::string message, std::optional<std::string> details = std::nullopt);

        /**
         * Format and write a message. Formatting only happens if at least one pair is enabled.
         */
        template<typename... T>
        void logFormatted(TraceLevel level, fmt::format_string<T...> fmt, T&&... args)
        {
            auto const writers = _writers.load();
            auto enabled = enabledWriters(*writers, level);
            if (enabled.empty())
            {
                return;
            }

            auto message = std::string{};
            try
            {
                message = fmt::format(fmt, std::forward<T>(args)...);
            }
            catch (...)
            {
                reportFailure("Formatting a {} trace message threw.", level);
                return;
            }
            writeEntry(enabled, level, std::move(message), std::nullopt);
        }

        template<typename... T>
        void debug(fmt::format_string<T...> fmt, T&&... args)
        {
            logFormatted(TraceLevel::Debug, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        void verbose(fmt::format_string<T...> fmt, T&&... args)
        {
            logFormatted(TraceLevel::Verbose, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        void info(fmt::format_string<T...> fmt, T&&... args)
        {
            logFormatted(TraceLevel::Info, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        void warn(fmt::format_string<T...> fmt, T&&... args)
        {
            logFormatted(TraceLevel::Warn, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        void error(fmt::format_string<T...> fmt, T&&... args)
        {
            logFormatted(TraceLevel::Error, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        void severe(fmt::format_string<T...> fmt, T&&... args)
        {
            logFormatted(TraceLevel::Severe, fmt, std::forward<T>(args)...);
        }

        /** Currently bound set. Never null. */
        [[nodiscard]]
        std::shared_ptr<TraceWriterSet const> writers() const noexcept;

        /** Replace the bound set as a whole. Called by the TraceManager. */
        void setWriters(std::shared_ptr<TraceWriterSet const> writers) noexcept;

        /** Failures that could not even be appended to the SetupLog, e.g. because memory ran out. */
        [[nodiscard]]
        std::size_t unreportedFailureCount() const noexcept;

    private:
        [[nodiscard]]
        std::vector<TraceWriter const*> enabledWriters(TraceWriterSet const& writers, TraceLevel level) const;

        void writeEntry(std::vector<TraceWriter const*> const& writers, TraceLevel level, std::string message,
            std::optional<std::string> details) const;

        /**
         * Report the exception being handled to the SetupLog. Must be called from a handler.
         * @param format Message with one replacement field, for the level.
         */
        void reportFailure(fmt::string_view format, TraceLevel level) const noexcept;

        std::string _name;
        std::shared_ptr<SetupLog> _setupLog;
        std::atomic<std::shared_ptr<TraceWriterSet const>> _writers;
        mutable std::atomic<std::size_t> _unreportedFailures{0};
    };
}
