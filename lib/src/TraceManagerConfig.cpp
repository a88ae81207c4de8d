// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/TraceManagerConfig.hpp"
#include <utility>
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    TraceWriterConfig::TraceWriterConfig(std::shared_ptr<LogWriterConfig const> in_logWriterConfig, SwitchSet in_switches)
        : logWriterConfig{std::move(in_logWriterConfig)}
        , switches{std::move(in_switches)}
    {}

    TraceManagerConfig::TraceManagerConfig(std::initializer_list<TraceWriterConfig> writers)
    {
        for (auto const& writer : writers)
        {
            add(writer);
        }
    }

    TraceManagerConfig& TraceManagerConfig::add(TraceWriterConfig writer)
    {
        if (!writer.logWriterConfig)
        {
            throw Exception::configuration("A trace writer config requires a log writer config.");
        }
        _writers.push_back(std::move(writer));
        return *this;
    }

    std::vector<TraceWriterConfig> const& TraceManagerConfig::writers() const noexcept
    {
        return _writers;
    }
}
