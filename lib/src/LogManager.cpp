// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file LogManager.cpp
 * @brief Pipeline construction and lifecycle of configured log writers
 *
 * START SEQUENCE (under the Startable lifecycle mutex):
 *   1. Snapshot the configuration.
 *   2. Build every descriptor, in configuration order, with _mutex released. Pipeline
 *      initializers may call back into getOrCreateBackgroundMultiLogWriter().
 *   3. Publish the instance table.
 *   4. Start the background writer, then every built writer.
 *
 * STOP SEQUENCE:
 *   1. Unpublish the instance table and the background writer.
 *   2. Stop every writer. Background proxies stop accepting entries.
 *   3. Stop the background writer: drain, then stop the real sinks.
 *   4. Dispose writers whose descriptor asks for it, then the background writer.
 */

#include "tracemux/LogManager.hpp"
#include <algorithm>
#include <typeinfo>
#include <utility>
#include <fmt/format.h>
#include "tracemux/DependencyRegistry.hpp"
#include "tracemux/Exception.hpp"
#include "tracemux-internal/Logging.hpp"

namespace tracemux::lib
{
    namespace
    {
        constexpr auto source = std::string_view{"LogManager"};
    }

    LogManager::LogManager(LogManagerConfig config, std::shared_ptr<SetupLog> setupLog)
        : _setupLog{setupLog ? std::move(setupLog) : std::make_shared<SetupLog>()}
        , _mutex{}
        , _config{std::move(config)}
        , _instances{}
        , _backgroundWriter{}
    {}

    LogManager::~LogManager()
    {
        try
        {
            stop();
        }
        catch (std::exception const& e)
        {
            TRACEMUX_ERROR("Failed to stop log manager on destruction: {}", e.what());
        }
    }

    LogManagerConfig LogManager::config() const
    {
        auto lock = std::lock_guard{_mutex};
        return _config;
    }

    bool LogManager::addWriterConfig(std::shared_ptr<LogWriterConfig const> config)
    {
        auto lock = std::lock_guard{_mutex};
        return _config.addWriter(std::move(config));
    }

    bool LogManager::hasWriterConfig(LogWriterConfig const& config) const
    {
        auto lock = std::lock_guard{_mutex};
        return _config.containsWriter(config);
    }

    std::shared_ptr<LogWriter> LogManager::getLogWriter(LogWriterConfig const& config)
    {
        ensureStarted();

        auto lock = std::lock_guard{_mutex};
        return findInstanceLocked(config).writer;
    }

    std::shared_ptr<BackgroundMultiLogWriter> LogManager::getOrCreateBackgroundMultiLogWriter(BackgroundWriterOptions const& options)
    {
        auto lock = std::lock_guard{_mutex};
        if (!_backgroundWriter)
        {
            _backgroundWriter = std::make_shared<BackgroundMultiLogWriter>(_setupLog, options);
            TRACEMUX_DEBUG("Created background writer (capacity={}, policy={})", options.queueCapacity, toString(options.overflowPolicy));
        }
        else if (!(_backgroundWriter->options() == options))
        {
            TRACEMUX_DEBUG("Background writer already exists; requested options are ignored");
        }
        return _backgroundWriter;
    }

    std::shared_ptr<SetupLog> const& LogManager::setupLog() const noexcept
    {
        return _setupLog;
    }

    void LogManager::onStart()
    {
        auto const config = this->config();

        auto instances = std::vector<Instance>{};
        instances.reserve(config.size());
        for (auto const& descriptor : config.writers())
        {
            auto const alreadyBuilt = std::any_of(
                instances.begin(), instances.end(), [&descriptor](auto const& instance) { return *instance.config == *descriptor; });
            if (alreadyBuilt)
            {
                _setupLog->severe(source, fmt::format("Log writer config {} is already instantiated; skipping it.", *descriptor));
                continue;
            }
            instances.push_back(Instance{descriptor, buildLogWriter(descriptor, config.initializers())});
        }

        auto backgroundWriter = std::shared_ptr<BackgroundMultiLogWriter>{};
        {
            auto lock = std::lock_guard{_mutex};
            _instances = instances;
            backgroundWriter = _backgroundWriter;
        }

        if (backgroundWriter)
        {
            try
            {
                backgroundWriter->ensureStarted();
            }
            catch (...)
            {
                _setupLog->error(source, "Failed to start the background writer.", describeCurrentException());
            }
        }

        auto started = std::size_t{0};
        for (auto const& instance : instances)
        {
            if (!instance.writer)
            {
                continue;
            }
            try
            {
                instance.writer->ensureStarted();
                ++started;
            }
            catch (...)
            {
                _setupLog->error(source, fmt::format("Failed to start the log writer of {}.", *instance.config), describeCurrentException());
            }
        }

        TRACEMUX_INFO("Log manager started {} of {} log writers", started, instances.size());
    }

    void LogManager::onStop()
    {
        auto instances = std::vector<Instance>{};
        auto backgroundWriter = std::shared_ptr<BackgroundMultiLogWriter>{};
        {
            auto lock = std::lock_guard{_mutex};
            instances.swap(_instances);
            backgroundWriter.swap(_backgroundWriter);
        }

        for (auto const& instance : instances)
        {
            if (!instance.writer)
            {
                continue;
            }
            try
            {
                instance.writer->stop();
            }
            catch (...)
            {
                _setupLog->error(source, fmt::format("Failed to stop the log writer of {}.", *instance.config), describeCurrentException());
            }
        }

        if (backgroundWriter)
        {
            try
            {
                backgroundWriter->stop();
            }
            catch (...)
            {
                _setupLog->error(source, "Failed to stop the background writer.", describeCurrentException());
            }
        }

        for (auto const& instance : instances)
        {
            if (!instance.writer || !instance.config->disposeOnStop())
            {
                continue;
            }
            try
            {
                instance.writer->dispose();
            }
            catch (...)
            {
                _setupLog->error(source, fmt::format("Failed to dispose the log writer of {}.", *instance.config), describeCurrentException());
            }
        }

        if (backgroundWriter)
        {
            try
            {
                backgroundWriter->dispose();
            }
            catch (...)
            {
                _setupLog->error(source, "Failed to dispose the background writer.", describeCurrentException());
            }
        }

        TRACEMUX_INFO("Log manager stopped {} log writers", instances.size());
    }

    std::shared_ptr<LogWriter> LogManager::buildLogWriter(std::shared_ptr<LogWriterConfig const> const& config,
        std::vector<std::shared_ptr<LogWriterInitializer>> const& managerInitializers)
    {
        auto writer = std::shared_ptr<LogWriter>{};
        try
        {
            writer = config->createLogWriter(*_setupLog);
        }
        catch (...)
        {
            _setupLog->severe(source,
                fmt::format("{}: creating the log writer for {} threw.", toString(Status::BuildFailure), *config),
                describeCurrentException());
            return nullptr;
        }

        if (!writer)
        {
            _setupLog->severe(source, fmt::format("{}: {} created no log writer.", toString(Status::BuildFailure), *config));
            return nullptr;
        }

        auto initializers = config->initializers();
        initializers.insert(initializers.end(), managerInitializers.begin(), managerInitializers.end());

        try
        {
            // Initializers only see this manager for the duration of the build, so a non-owning
            // pointer is enough when the manager is not owned by a shared_ptr
            auto self = weak_from_this().lock();
            if (!self)
            {
                self = std::shared_ptr<LogManager>{std::shared_ptr<void>{}, this};
            }

            auto registry = DependencyRegistry{};
            registry.add<SetupLog>(_setupLog);
            registry.add<LogManager>(self);
            registry.add<LogWriterConfig const>(config);
            registry.addLogWriter(writer);

            for (auto const& initializer : initializers)
            {
                if (auto pipeline = std::dynamic_pointer_cast<PipelineInitializer>(initializer); pipeline)
                {
                    auto next = pipeline->initializeLogWriter(*_setupLog, writer, registry);
                    if (!next)
                    {
                        auto const& stage = *pipeline;
                        throw Exception::buildFailure("Pipeline initializer {} returned no log writer.", typeid(stage).name());
                    }
                    writer = std::move(next);
                    registry.addLogWriter(writer);
                }
            }

            registry.seal();

            for (auto const& initializer : initializers)
            {
                if (auto import = std::dynamic_pointer_cast<ImportInitializer>(initializer); import)
                {
                    import->importDependencies(*_setupLog, registry);
                }
            }
        }
        catch (...)
        {
            _setupLog->severe(source,
                fmt::format("{}: the initializer pipeline of {} failed.", toString(Status::BuildFailure), *config),
                describeCurrentException());
            return nullptr;
        }

        TRACEMUX_DEBUG("Built log writer for {}", *config);
        return writer;
    }

    std::shared_ptr<EntryWriterBase> LogManager::findEntryWriter(LogWriterConfig const& config, std::type_index entryType)
    {
        ensureStarted();

        auto writer = std::shared_ptr<LogWriter>{};
        {
            auto lock = std::lock_guard{_mutex};
            writer = findInstanceLocked(config).writer;
        }

        if (!writer)
        {
            _setupLog->warn(source, fmt::format("The log writer of {} failed to build; returning a no-op entry writer.", config));
            return nullptr;
        }
        if (!writer->isStarted())
        {
            _setupLog->warn(source,
                fmt::format("The log writer of {} is {}; returning a no-op entry writer.", config, toString(writer->state())));
            return nullptr;
        }

        auto entryWriter = writer->findEntryWriter(entryType);
        if (!entryWriter)
        {
            _setupLog->warn(source,
                fmt::format("The log writer of {} has no entry writer for {}; returning a no-op entry writer.", config, entryType.name()));
        }
        return entryWriter;
    }

    std::vector<std::shared_ptr<EntryWriterBase>> LogManager::findEntryWriters(std::type_index entryType)
    {
        ensureStarted();

        auto instances = std::vector<Instance>{};
        {
            auto lock = std::lock_guard{_mutex};
            instances = _instances;
        }

        auto result = std::vector<std::shared_ptr<EntryWriterBase>>{};
        for (auto const& instance : instances)
        {
            if (!instance.writer || !instance.writer->isStarted())
            {
                continue;
            }
            if (auto entryWriter = instance.writer->findEntryWriter(entryType); entryWriter)
            {
                result.push_back(std::move(entryWriter));
            }
        }
        return result;
    }

    LogManager::Instance const& LogManager::findInstanceLocked(LogWriterConfig const& config) const
    {
        auto const it = std::find_if(_instances.begin(), _instances.end(), [&config](auto const& instance) { return *instance.config == config; });
        if (it == _instances.end())
        {
            throw Exception::notFound("Log writer config {} is not registered with this log manager.", config);
        }
        return *it;
    }
}
