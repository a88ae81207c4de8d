// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/SpdlogLogWriter.hpp"
#include <utility>
#include <spdlog/spdlog.h>

namespace tracemux::lib
{
    namespace
    {
        spdlog::level::level_enum toSpdlogLevel(TraceLevel level) noexcept
        {
            switch (level)
            {
                case TraceLevel::Debug:
                case TraceLevel::Verbose: return spdlog::level::debug;
                case TraceLevel::Info:    return spdlog::level::info;
                case TraceLevel::Warn:    return spdlog::level::warn;
                case TraceLevel::Error:   return spdlog::level::err;
                case TraceLevel::Severe:  return spdlog::level::critical;
                case TraceLevel::Off:     return spdlog::level::off;
            }
            return spdlog::level::info;
        }
    }

    SpdlogLogWriter::SpdlogLogWriter(std::shared_ptr<spdlog::logger> logger)
        : _logger{logger ? std::move(logger) : spdlog::default_logger()}
    {}

    void SpdlogLogWriter::write(TraceEntry const& entry)
    {
        auto const level = toSpdlogLevel(entry.level);
        if (!_logger->should_log(level))
        {
            return;
        }

        auto const message = entry.details ? fmt::format("[{}] {} | {}", entry.tracerName, entry.message, *entry.details)
                                           : fmt::format("[{}] {}", entry.tracerName, entry.message);
        _logger->log(entry.timestamp, spdlog::source_loc{}, level, message);
    }

    std::shared_ptr<spdlog::logger> const& SpdlogLogWriter::logger() const noexcept
    {
        return _logger;
    }
}
