// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SetupLog.cpp
 * @brief Thread-safe diagnostic entry store mirrored to spdlog
 */

#include "tracemux/SetupLog.hpp"
#include <algorithm>
#include <chrono>
#include <utility>
#include "tracemux-internal/Logging.hpp"

namespace tracemux::lib
{
    namespace
    {
        void mirror(TraceEntry const& entry)
        {
            auto const& details = entry.details ? *entry.details : std::string{};
            auto const separator = entry.details ? " | " : "";
            switch (entry.level)
            {
                case TraceLevel::Debug:
                case TraceLevel::Verbose:
                    TRACEMUX_DEBUG("[{}] {}{}{}", entry.tracerName, entry.message, separator, details);
                    break;
                case TraceLevel::Info:  TRACEMUX_INFO("[{}] {}{}{}", entry.tracerName, entry.message, separator, details); break;
                case TraceLevel::Warn:  TRACEMUX_WARN("[{}] {}{}{}", entry.tracerName, entry.message, separator, details); break;
                case TraceLevel::Error: TRACEMUX_ERROR("[{}] {}{}{}", entry.tracerName, entry.message, separator, details); break;
                case TraceLevel::Severe:
                case TraceLevel::Off:
                    TRACEMUX_CRITICAL("[{}] {}{}{}", entry.tracerName, entry.message, separator, details);
                    break;
            }
        }
    }

    SetupLog::SetupLog()
        : _mutex{}
        , _entries{}
    {
        initializeLogging();
    }

    void SetupLog::append(TraceEntry entry)
    {
        mirror(entry);

        auto lock = std::lock_guard{_mutex};
        _entries.push_back(std::move(entry));
    }

    void SetupLog::append(TraceLevel level, std::string_view source, std::string message, std::optional<std::string> details)
    {
        append(TraceEntry{std::chrono::system_clock::now(), std::string{source}, level, std::move(message), std::move(details)});
    }

    void SetupLog::debug(std::string_view source, std::string message)
    {
        append(TraceLevel::Debug, source, std::move(message));
    }

    void SetupLog::info(std::string_view source, std::string message)
    {
        append(TraceLevel::Info, source, std::move(message));
    }

    void SetupLog::warn(std::string_view source, std::string message, std::optional<std::string> details)
    {
        append(TraceLevel::Warn, source, std::move(message), std::move(details));
    }

    void SetupLog::error(std::string_view source, std::string message, std::optional<std::string> details)
    {
        append(TraceLevel::Error, source, std::move(message), std::move(details));
    }

    void SetupLog::severe(std::string_view source, std::string message, std::optional<std::string> details)
    {
        append(TraceLevel::Severe, source, std::move(message), std::move(details));
    }

    std::vector<TraceEntry> SetupLog::entries() const
    {
        auto lock = std::lock_guard{_mutex};
        return _entries;
    }

    std::size_t SetupLog::count() const
    {
        auto lock = std::lock_guard{_mutex};
        return _entries.size();
    }

    std::size_t SetupLog::countIf(std::function<bool(TraceEntry const&)> const& predicate) const
    {
        auto lock = std::lock_guard{_mutex};
        return static_cast<std::size_t>(std::count_if(_entries.begin(), _entries.end(), predicate));
    }

    std::size_t SetupLog::countAtLeast(TraceLevel level) const
    {
        return countIf([level](TraceEntry const& entry) { return entry.level >= level; });
    }

    bool SetupLog::hasErrors() const
    {
        return countAtLeast(TraceLevel::Error) > 0;
    }

    void SetupLog::clear()
    {
        auto lock = std::lock_guard{_mutex};
        _entries.clear();
    }
}
