// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TraceManager.hpp
 * @brief Hands out Tracers and keeps them bound to the configured writers
 *
 * LIFECYCLE:
 * - getTracer() starts the manager if needed.
 * - start() adds the configured log writer descriptors to the LogManager (restarting it when
 *   descriptors were missing), then rebinds every live Tracer.
 * - stop() rebinds every live Tracer to the empty set. Calls on existing Tracers then do
 *   nothing and never block. A LogManager created by this TraceManager is stopped too; a
 *   LogManager passed in by the caller is left running.
 *
 * TRACER CACHE: at most one live Tracer per normalized name. The manager only keeps weak
 * references; a Tracer is reclaimed once every caller released it, and its cache entry is
 * purged on the next lookup or rebinding sweep.
 *
 * THREAD SAFETY: all member functions are thread-safe. The manager mutex is held around
 * bookkeeping and rebinding only, never while an entry is written.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <tracemux/LogManager.hpp>
#include <tracemux/LogWriter.hpp>
#include <tracemux/SetupLog.hpp>
#include <tracemux/Startable.hpp>
#include <tracemux/Switch.hpp>
#include <tracemux/SwitchSet.hpp>
#include <tracemux/TraceManagerConfig.hpp>
#include <tracemux/Tracer.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT TraceManager final : public Startable
    {
    public:
        typedef std::shared_ptr<TraceManager> ptr;

        /**
         * Owns a new LogManager built from the trace writer configs.
         */
        explicit TraceManager(TraceManagerConfig config, std::shared_ptr<SetupLog> setupLog = nullptr);

        /**
         * Uses a LogManager shared with other components. The LogManager is not stopped by stop().
         * @throws Exception (Status::ConfigurationError) if the LogManager is null.
         */
        TraceManager(std::shared_ptr<LogManager> logManager, TraceManagerConfig config);

        explicit TraceManager(TraceWriterConfig config, std::shared_ptr<SetupLog> setupLog = nullptr);

        /**
         * Route the names selected by a prefix to one writer, guarded by one switch.
         * @param sw Defaults to a ThresholdSwitch at TraceLevel::Info.
         * @param prefix Defaults to the root prefix (every name).
         */
        explicit TraceManager(std::shared_ptr<LogWriter> logWriter, std::shared_ptr<Switch> sw = nullptr, std::string_view prefix = {},
            std::shared_ptr<SetupLog> setupLog = nullptr);

        TraceManager(std::shared_ptr<LogWriter> logWriter, SwitchSet switches, std::shared_ptr<SetupLog> setupLog = nullptr);

        /** Every name, at or above a threshold. */
        TraceManager(std::shared_ptr<LogWriter> logWriter, TraceLevel threshold, std::shared_ptr<SetupLog> setupLog = nullptr);

        ~TraceManager() override;

        /**
         * The Tracer for a name. The name is trimmed; the empty name is the root tracer.
         * Returns the same instance as long as a caller holds it.
         */
        [[nodiscard]]
        std::shared_ptr<Tracer> getTracer(std::string_view name);

        /** Snapshot of the configuration. */
        [[nodiscard]]
        TraceManagerConfig config() const;

        [[nodiscard]]
        std::shared_ptr<LogManager> const& logManager() const noexcept;

        [[nodiscard]]
        std::shared_ptr<SetupLog> const& setupLog() const noexcept;

        /** Number of Tracers still referenced by a caller. Purges reclaimed entries. */
        [[nodiscard]]
        std::size_t liveTracerCount();

        /**
         * Process-wide manager routing TraceLevel::Info and above of every name to the spdlog
         * default logger. Created on first use. Meant for top-level entry points; library code
         * should receive a TraceManager explicitly.
         */
        [[nodiscard]]
        static TraceManager& defaultInstance();

    protected:
        void onStart() override;
        void onStop() override;

    private:
        struct ActiveWriter
        {
            TraceWriterConfig config;
            std::shared_ptr<EntryWriter<TraceEntry>> entryWriter;
        };

        /** Requires _mutex to be held. */
        [[nodiscard]]
        std::shared_ptr<TraceWriterSet const> writersForLocked(std::string const& name) const;

        /** Requires _mutex to be held. */
        void purgeLocked();

        std::shared_ptr<LogManager> _logManager;
        bool _ownsLogManager;

        mutable std::mutex _mutex;
        TraceManagerConfig _config;
        std::vector<ActiveWriter> _activeWriters;
        std::unordered_map<std::string, std::weak_ptr<Tracer>> _tracers;
    };
}
