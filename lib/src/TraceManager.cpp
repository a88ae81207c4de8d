// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TraceManager.cpp
 * @brief Tracer cache and writer set rebinding
 */

#include "tracemux/TraceManager.hpp"
#include <utility>
#include "tracemux/Exception.hpp"
#include "tracemux/SpdlogLogWriter.hpp"
#include "tracemux-internal/Logging.hpp"

namespace tracemux::lib
{
    namespace
    {
        TraceManagerConfig singleWriterConfig(std::shared_ptr<LogWriter> logWriter, SwitchSet switches)
        {
            auto config = TraceManagerConfig{};
            config.add(TraceWriterConfig{std::make_shared<UseExistingLogWriterConfig>(std::move(logWriter)), std::move(switches)});
            return config;
        }

        SwitchSet singleSwitch(std::shared_ptr<Switch> sw, std::string_view prefix)
        {
            auto switches = SwitchSet{};
            switches.add(prefix, sw ? std::move(sw) : std::make_shared<ThresholdSwitch>(TraceLevel::Info));
            return switches;
        }
    }

    TraceManager::TraceManager(TraceManagerConfig config, std::shared_ptr<SetupLog> setupLog)
        : _logManager{std::make_shared<LogManager>(LogManagerConfig{}, std::move(setupLog))}
        , _ownsLogManager{true}
        , _mutex{}
        , _config{std::move(config)}
        , _activeWriters{}
        , _tracers{}
    {}

    TraceManager::TraceManager(std::shared_ptr<LogManager> logManager, TraceManagerConfig config)
        : _logManager{std::move(logManager)}
        , _ownsLogManager{false}
        , _mutex{}
        , _config{std::move(config)}
        , _activeWriters{}
        , _tracers{}
    {
        if (!_logManager)
        {
            throw Exception::configuration("TraceManager requires a log manager.");
        }
    }

    TraceManager::TraceManager(TraceWriterConfig config, std::shared_ptr<SetupLog> setupLog)
        : TraceManager{TraceManagerConfig{std::move(config)}, std::move(setupLog)}
    {}

    TraceManager::TraceManager(std::shared_ptr<LogWriter> logWriter, std::shared_ptr<Switch> sw, std::string_view prefix,
        std::shared_ptr<SetupLog> setupLog)
        : TraceManager{singleWriterConfig(std::move(logWriter), singleSwitch(std::move(sw), prefix)), std::move(setupLog)}
    {}

    TraceManager::TraceManager(std::shared_ptr<LogWriter> logWriter, SwitchSet switches, std::shared_ptr<SetupLog> setupLog)
        : TraceManager{singleWriterConfig(std::move(logWriter), std::move(switches)), std::move(setupLog)}
    {}

    TraceManager::TraceManager(std::shared_ptr<LogWriter> logWriter, TraceLevel threshold, std::shared_ptr<SetupLog> setupLog)
        : TraceManager{std::move(logWriter), std::make_shared<ThresholdSwitch>(threshold), std::string_view{}, std::move(setupLog)}
    {}

    TraceManager::~TraceManager()
    {
        try
        {
            stop();
        }
        catch (std::exception const& e)
        {
            TRACEMUX_ERROR("Failed to stop trace manager on destruction: {}", e.what());
        }
    }

    std::shared_ptr<Tracer> TraceManager::getTracer(std::string_view name)
    {
        ensureStarted();

        auto normalized = normalizeTracerName(name);

        auto lock = std::lock_guard{_mutex};
        if (auto const it = _tracers.find(normalized); it != _tracers.end())
        {
            if (auto tracer = it->second.lock(); tracer)
            {
                return tracer;
            }
        }

        purgeLocked();
        auto tracer = std::make_shared<Tracer>(normalized, _logManager->setupLog(), writersForLocked(normalized));
        _tracers.insert_or_assign(std::move(normalized), tracer);
        return tracer;
    }

    TraceManagerConfig TraceManager::config() const
    {
        auto lock = std::lock_guard{_mutex};
        return _config;
    }

    std::shared_ptr<LogManager> const& TraceManager::logManager() const noexcept
    {
        return _logManager;
    }

    std::shared_ptr<SetupLog> const& TraceManager::setupLog() const noexcept
    {
        return _logManager->setupLog();
    }

    std::size_t TraceManager::liveTracerCount()
    {
        auto lock = std::lock_guard{_mutex};
        purgeLocked();
        return _tracers.size();
    }

    TraceManager& TraceManager::defaultInstance()
    {
        static auto once = std::once_flag{};
        static auto instance = std::unique_ptr<TraceManager>{};
        std::call_once(once,
            []()
            {
                initializeLogging();
                instance = std::make_unique<TraceManager>(std::make_shared<SpdlogLogWriter>(), TraceLevel::Info);
            });
        return *instance;
    }

    void TraceManager::onStart()
    {
        auto lock = std::lock_guard{_mutex};

        auto missing = false;
        for (auto const& writer : _config.writers())
        {
            missing = _logManager->addWriterConfig(writer.logWriterConfig) || missing;
        }
        if (missing)
        {
            _logManager->start();
        }
        else
        {
            _logManager->ensureStarted();
        }

        _activeWriters.clear();
        for (auto const& writer : _config.writers())
        {
            _activeWriters.push_back(ActiveWriter{writer, _logManager->getEntryWriter<TraceEntry>(*writer.logWriterConfig)});
        }

        purgeLocked();
        for (auto const& [name, weakTracer] : _tracers)
        {
            if (auto tracer = weakTracer.lock(); tracer)
            {
                tracer->setWriters(writersForLocked(name));
            }
        }

        TRACEMUX_DEBUG("Trace manager started with {} trace writers and {} live tracers", _activeWriters.size(), _tracers.size());
    }

    void TraceManager::onStop()
    {
        {
            auto lock = std::lock_guard{_mutex};
            _activeWriters.clear();

            auto const empty = std::shared_ptr<TraceWriterSet const>{std::make_shared<TraceWriterSet>()};
            purgeLocked();
            for (auto const& [name, weakTracer] : _tracers)
            {
                if (auto tracer = weakTracer.lock(); tracer)
                {
                    tracer->setWriters(empty);
                }
            }
        }

        if (_ownsLogManager)
        {
            _logManager->stop();
        }
    }

    std::shared_ptr<TraceWriterSet const> TraceManager::writersForLocked(std::string const& name) const
    {
        auto writers = std::make_shared<TraceWriterSet>();
        for (auto const& active : _activeWriters)
        {
            if (auto [found, sw] = active.config.switches.findBestMatch(name); found)
            {
                writers->push_back(TraceWriter{std::move(sw), active.entryWriter});
            }
        }
        return writers;
    }

    void TraceManager::purgeLocked()
    {
        std::erase_if(_tracers, [](auto const& item) { return item.second.expired(); });
    }
}
