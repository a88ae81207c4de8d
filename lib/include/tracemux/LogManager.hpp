// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file LogManager.hpp
 * @brief Builds, starts and stops the log writers of a LogManagerConfig
 *
 * RESPONSIBILITIES:
 * - Build one runtime writer per configured descriptor through its initializer pipeline
 *   (see LogWriterConfig.hpp).
 * - Start the shared background writer, then every built writer.
 * - Hand out typed entry writers by descriptor, or for all writers at once.
 * - Stop, drain and dispose on stop(); rebuild everything on the next start().
 *
 * FAILURE HANDLING:
 * - A descriptor whose writer fails to build is kept with no writer. The failure is reported
 *   to the SetupLog at Severe level; every other descriptor still builds.
 * - A writer that fails to start is left in FailedToStart and reported at Error level.
 * - Asking for an unknown descriptor is a caller error and throws Status::NotFound. Asking a
 *   failed writer, or one without the requested entry type, returns a disabled
 *   NoOpEntryWriter and reports a Warn diagnostic.
 *
 * THREAD SAFETY:
 * - start()/stop() are serialized by the Startable lifecycle mutex.
 * - The instance table is guarded by an internal mutex, never held while a writer is built,
 *   started, stopped or written to.
 * - Lookups lazily start the manager. Do not call them from a pipeline initializer, which runs
 *   while the manager is starting.
 */

#pragma once

#include <memory>
#include <mutex>
#include <typeindex>
#include <vector>
#include <tracemux/BackgroundMultiLogWriter.hpp>
#include <tracemux/EntryWriter.hpp>
#include <tracemux/FanOutEntryWriter.hpp>
#include <tracemux/LogManagerConfig.hpp>
#include <tracemux/LogWriter.hpp>
#include <tracemux/SetupLog.hpp>
#include <tracemux/Startable.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT LogManager final
        : public Startable
        , public std::enable_shared_from_this<LogManager>
    {
    public:
        typedef std::shared_ptr<LogManager> ptr;

        /**
         * @param config Descriptors and manager-wide initializers.
         * @param setupLog Destination of diagnostics. A new SetupLog is created when null.
         */
        explicit LogManager(LogManagerConfig config = {}, std::shared_ptr<SetupLog> setupLog = nullptr);

        ~LogManager() override;

        /** Snapshot of the current configuration. */
        [[nodiscard]]
        LogManagerConfig config() const;

        /**
         * Add a descriptor. Takes effect on the next start().
         * @return false if an equal descriptor is already configured.
         */
        bool addWriterConfig(std::shared_ptr<LogWriterConfig const> config);

        [[nodiscard]]
        bool hasWriterConfig(LogWriterConfig const& config) const;

        /**
         * The runtime writer built for a descriptor. Starts the manager if needed.
         * @return null if the descriptor's writer failed to build.
         * @throws Exception (Status::NotFound) if the descriptor is not configured.
         */
        [[nodiscard]]
        std::shared_ptr<LogWriter> getLogWriter(LogWriterConfig const& config);

        /**
         * The entry writer for Entry of the writer built for a descriptor. Starts the manager if
         * needed.
         * @return A disabled NoOpEntryWriter if the writer failed to build or start, or has no
         *         entry writer for Entry.
         * @throws Exception (Status::NotFound) if the descriptor is not configured.
         */
        template<typename Entry>
        [[nodiscard]]
        std::shared_ptr<EntryWriter<Entry>> getEntryWriter(LogWriterConfig const& config)
        {
            if (auto entryWriter = std::dynamic_pointer_cast<EntryWriter<Entry>>(findEntryWriter(config, typeid(Entry))); entryWriter)
            {
                return entryWriter;
            }
            return std::make_shared<NoOpEntryWriter<Entry>>();
        }

        /**
         * Every entry writer for Entry of every started writer, in configuration order.
         */
        template<typename Entry>
        [[nodiscard]]
        std::vector<std::shared_ptr<EntryWriter<Entry>>> getEntryWriters()
        {
            auto result = std::vector<std::shared_ptr<EntryWriter<Entry>>>{};
            for (auto const& entryWriter : findEntryWriters(typeid(Entry)))
            {
                if (auto typed = std::dynamic_pointer_cast<EntryWriter<Entry>>(entryWriter); typed)
                {
                    result.push_back(std::move(typed));
                }
            }
            return result;
        }

        /**
         * One entry writer reaching every started writer that accepts Entry: a no-op writer if
         * there is none, the writer itself if there is one, a FanOutEntryWriter otherwise.
         */
        template<typename Entry>
        [[nodiscard]]
        std::shared_ptr<EntryWriter<Entry>> getEntryWriter()
        {
            auto entryWriters = getEntryWriters<Entry>();
            if (entryWriters.empty())
            {
                return std::make_shared<NoOpEntryWriter<Entry>>();
            }
            if (entryWriters.size() == 1)
            {
                return entryWriters.front();
            }
            return std::make_shared<FanOutEntryWriter<Entry>>(std::move(entryWriters), _setupLog);
        }

        /**
         * The background writer shared by every descriptor of the current run. Created with the
         * given options on first use; later calls return the same instance whatever their options.
         * The background writer is stopped, drained and discarded when the manager stops.
         */
        [[nodiscard]]
        std::shared_ptr<BackgroundMultiLogWriter> getOrCreateBackgroundMultiLogWriter(BackgroundWriterOptions const& options = {});

        [[nodiscard]]
        std::shared_ptr<SetupLog> const& setupLog() const noexcept;

    protected:
        void onStart() override;
        void onStop() override;

    private:
        struct Instance
        {
            std::shared_ptr<LogWriterConfig const> config;
            std::shared_ptr<LogWriter> writer;
        };

        [[nodiscard]]
        std::shared_ptr<LogWriter> buildLogWriter(std::shared_ptr<LogWriterConfig const> const& config,
            std::vector<std::shared_ptr<LogWriterInitializer>> const& managerInitializers);

        [[nodiscard]]
        std::shared_ptr<EntryWriterBase> findEntryWriter(LogWriterConfig const& config, std::type_index entryType);

        [[nodiscard]]
        std::vector<std::shared_ptr<EntryWriterBase>> findEntryWriters(std::type_index entryType);

        /** Requires _mutex to be held. */
        [[nodiscard]]
        Instance const& findInstanceLocked(LogWriterConfig const& config) const;

        std::shared_ptr<SetupLog> _setupLog;

        mutable std::mutex _mutex;
        LogManagerConfig _config;
        std::vector<Instance> _instances;
        std::shared_ptr<BackgroundMultiLogWriter> _backgroundWriter;
    };
}
