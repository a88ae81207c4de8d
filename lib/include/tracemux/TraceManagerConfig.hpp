// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TraceManagerConfig.hpp
 * @brief Which log writers receive trace entries, and which switches guard them
 */

#pragma once

#include <initializer_list>
#include <memory>
#include <vector>
#include <tracemux/LogWriterConfig.hpp>
#include <tracemux/SwitchSet.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    /**
     * A log writer descriptor and the switches deciding, per tracer name, what reaches it.
     */
    struct TRACEMUX_EXPORT TraceWriterConfig
    {
        TraceWriterConfig() = default;

        TraceWriterConfig(std::shared_ptr<LogWriterConfig const> in_logWriterConfig, SwitchSet in_switches);

        std::shared_ptr<LogWriterConfig const> logWriterConfig;
        SwitchSet switches;
    };

    class TRACEMUX_EXPORT TraceManagerConfig
    {
    public:
        TraceManagerConfig() = default;

        /**
         * @throws Exception (Status::ConfigurationError) if a log writer descriptor is null.
         */
        TraceManagerConfig(std::initializer_list<TraceWriterConfig> writers);

        /**
         * @throws Exception (Status::ConfigurationError) if the log writer descriptor is null.
         */
        TraceManagerConfig& add(TraceWriterConfig writer);

        [[nodiscard]]
        std::vector<TraceWriterConfig> const& writers() const noexcept;

    private:
        std::vector<TraceWriterConfig> _writers;
    };
}
