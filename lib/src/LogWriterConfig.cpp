// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file LogWriterConfig.cpp
 * @brief Descriptor equality, hashing and the existing-writer descriptor
 */

#include "tracemux/LogWriterConfig.hpp"
#include <functional>
#include <typeinfo>
#include <utility>
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    LogWriterInitializer::~LogWriterInitializer() = default;

    LogWriterConfig::~LogWriterConfig() = default;

    std::string LogWriterConfig::describe() const
    {
        return typeid(*this).name();
    }

    bool LogWriterConfig::disposeOnStop() const noexcept
    {
        return _disposeOnStop;
    }

    void LogWriterConfig::setDisposeOnStop(bool disposeOnStop) noexcept
    {
        _disposeOnStop = disposeOnStop;
    }

    std::vector<std::shared_ptr<LogWriterInitializer>> const& LogWriterConfig::initializers() const noexcept
    {
        return _initializers;
    }

    LogWriterConfig& LogWriterConfig::addInitializer(std::shared_ptr<LogWriterInitializer> initializer)
    {
        if (!initializer)
        {
            throw Exception::configuration("Null initializer added to log writer config {}.", describe());
        }
        _initializers.push_back(std::move(initializer));
        return *this;
    }

    bool operator==(LogWriterConfig const& lhs, LogWriterConfig const& rhs)
    {
        if (&lhs == &rhs)
        {
            return true;
        }
        return (typeid(lhs) == typeid(rhs)) && lhs.equals(rhs);
    }

    UseExistingLogWriterConfig::UseExistingLogWriterConfig(std::shared_ptr<LogWriter> logWriter)
        : _logWriter{std::move(logWriter)}
    {
        if (!_logWriter)
        {
            throw Exception::configuration("UseExistingLogWriterConfig requires a log writer.");
        }
    }

    std::shared_ptr<LogWriter> UseExistingLogWriterConfig::createLogWriter(SetupLog&) const
    {
        return _logWriter;
    }

    bool UseExistingLogWriterConfig::equals(LogWriterConfig const& other) const
    {
        return _logWriter == static_cast<UseExistingLogWriterConfig const&>(other)._logWriter;
    }

    std::size_t UseExistingLogWriterConfig::hash() const
    {
        return std::hash<LogWriter*>{}(_logWriter.get());
    }

    std::string UseExistingLogWriterConfig::describe() const
    {
        auto const& writer = *_logWriter;
        return fmt::format("existing {}@{}", typeid(writer).name(), static_cast<void const*>(_logWriter.get()));
    }

    std::shared_ptr<LogWriter> const& UseExistingLogWriterConfig::logWriter() const noexcept
    {
        return _logWriter;
    }
}
