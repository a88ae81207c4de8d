// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Tracer.cpp
 * @brief Per-call switch evaluation and isolated delivery to bound writers
 */

#include "tracemux/Tracer.hpp"
#include <chrono>
#include <exception>
#include <optional>
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    namespace
    {
        std::shared_ptr<TraceWriterSet const> orEmpty(std::shared_ptr<TraceWriterSet const> writers)
        {
            if (!writers)
            {
                return std::make_shared<TraceWriterSet>();
            }
            return writers;
        }
    }

    Tracer::Tracer(std::string name, std::shared_ptr<SetupLog> setupLog, std::shared_ptr<TraceWriterSet const> writers)
        : _name{std::move(name)}
        , _setupLog{std::move(setupLog)}
        , _writers{orEmpty(std::move(writers))}
    {}

    std::string const& Tracer::name() const noexcept
    {
        return _name;
    }

    bool Tracer::isEnabled(TraceLevel level) const
    {
        auto const writers = _writers.load();
        return !enabledWriters(*writers, level).empty();
    }

    void Tracer::log(TraceLevel level, std::string message, std::optional<std::string> details)
    {
        auto const writers = _writers.load();
        auto const enabled = enabledWriters(*writers, level);
        if (!enabled.empty())
        {
            writeEntry(enabled, level, std::move(message), std::move(details));
        }
    }

    std::shared_ptr<TraceWriterSet const> Tracer::writers() const noexcept
    {
        return _writers.load();
    }

    void Tracer::setWriters(std::shared_ptr<TraceWriterSet const> writers) noexcept
    {
        _writers.store(orEmpty(std::move(writers)));
    }

    std::vector<TraceWriter const*> Tracer::enabledWriters(TraceWriterSet const& writers, TraceLevel level) const
    {
        auto result = std::vector<TraceWriter const*>{};
        if (level == TraceLevel::Off)
        {
            return result;
        }

        for (auto const& writer : writers)
        {
            try
            {
                if (writer.traceSwitch->isEnabled(level) && writer.entryWriter->isEnabled())
                {
                    result.push_back(&writer);
                }
            }
            catch (...)
            {
                reportFailure("Evaluating whether {} is enabled threw.", level);
            }
        }
        return result;
    }

    void Tracer::writeEntry(std::vector<TraceWriter const*> const& writers, TraceLevel level, std::string message,
        std::optional<std::string> details) const
    {
        auto entry = std::optional<TraceEntry>{};
        try
        {
            entry.emplace(TraceEntry{std::chrono::system_clock::now(), _name, level, std::move(message), std::move(details)});
        }
        catch (...)
        {
            reportFailure("Building a {} trace entry threw.", level);
            return;
        }

        for (auto const* writer : writers)
        {
            try
            {
                writer->entryWriter->write(*entry);
            }
            catch (...)
            {
                reportFailure("WriteFailure: writing a {} entry threw.", level);
            }
        }
    }

    std::size_t Tracer::unreportedFailureCount() const noexcept
    {
        return _unreportedFailures.load();
    }

    void Tracer::reportFailure(fmt::string_view format, TraceLevel level) const noexcept
    {
        try
        {
            auto message = fmt::format(fmt::runtime(format), level);
            try
            {
                _setupLog->error(_name, message, describeCurrentException());
            }
            catch (std::exception const&)
            {
                // The exception itself could not be described
                _setupLog->error(_name, std::move(message), "no description available");
            }
        }
        catch (std::exception const&)
        {
            ++_unreportedFailures;
        }
    }
}
