// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/LogManagerConfig.hpp"
#include <algorithm>
#include <utility>
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    LogManagerConfig::LogManagerConfig(std::initializer_list<std::shared_ptr<LogWriterConfig const>> writers)
    {
        for (auto const& writer : writers)
        {
            addWriter(writer);
        }
    }

    bool LogManagerConfig::addWriter(std::shared_ptr<LogWriterConfig const> writer)
    {
        if (!writer)
        {
            throw Exception::configuration("Null log writer config added to a log manager config.");
        }
        if (containsWriter(*writer))
        {
            return false;
        }
        _writers.push_back(std::move(writer));
        return true;
    }

    bool LogManagerConfig::containsWriter(LogWriterConfig const& writer) const
    {
        return std::any_of(_writers.begin(), _writers.end(), [&writer](auto const& existing) { return *existing == writer; });
    }

    std::vector<std::shared_ptr<LogWriterConfig const>> const& LogManagerConfig::writers() const noexcept
    {
        return _writers;
    }

    LogManagerConfig& LogManagerConfig::addInitializer(std::shared_ptr<LogWriterInitializer> initializer)
    {
        if (!initializer)
        {
            throw Exception::configuration("Null initializer added to a log manager config.");
        }
        _initializers.push_back(std::move(initializer));
        return *this;
    }

    std::vector<std::shared_ptr<LogWriterInitializer>> const& LogManagerConfig::initializers() const noexcept
    {
        return _initializers;
    }

    std::size_t LogManagerConfig::size() const noexcept
    {
        return _writers.size();
    }

    bool LogManagerConfig::empty() const noexcept
    {
        return _writers.empty();
    }
}
