// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SpdlogLogWriter.hpp
 * @brief Sink writing trace entries to an spdlog logger
 *
 * Level mapping:
 *   Debug   -> debug      Warn   -> warn
 *   Verbose -> debug      Error  -> err
 *   Info    -> info       Severe -> critical
 *
 * The entry timestamp is used as the spdlog message time. Details, when present, are appended
 * to the message after " | ".
 */

#pragma once

#include <memory>
#include <tracemux/LogWriter.hpp>
#include <tracemux/TraceEntry.hpp>
#include <tracemux/platform.hpp>

namespace spdlog
{
    class logger;
}

namespace tracemux::lib
{
    class TRACEMUX_EXPORT SpdlogLogWriter final : public SingleEntryTypeLogWriter<TraceEntry>
    {
    public:
        /**
         * @param logger Destination logger. The spdlog default logger when null.
         */
        explicit SpdlogLogWriter(std::shared_ptr<spdlog::logger> logger = nullptr);

        void write(TraceEntry const& entry) override;

        [[nodiscard]]
        std::shared_ptr<spdlog::logger> const& logger() const noexcept;

    private:
        std::shared_ptr<spdlog::logger> _logger;
    };
}
