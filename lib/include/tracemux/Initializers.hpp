// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Initializers.hpp
 * @brief Ready-made pipeline stages
 *
 * - BackgroundDispatchInitializer: front the writer with a proxy of the manager's shared
 *   BackgroundMultiLogWriter, so that producers never wait on the sink.
 * - SynchronizingInitializer: serialize every write to the writer with a mutex, for sinks that
 *   are not thread-safe and are used without background dispatch.
 * - FunctionPipelineInitializer / FunctionImportInitializer: adapt a callable.
 *
 * USAGE:
 * ```cpp
 * auto config = std::make_shared<MySinkConfig>();
 * config->addInitializer(std::make_shared<BackgroundDispatchInitializer>(R"({"overflowPolicy": "dropOldest"})"));
 * ```
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <tracemux/BackgroundMultiLogWriter.hpp>
#include <tracemux/DependencyRegistry.hpp>
#include <tracemux/EntryWriter.hpp>
#include <tracemux/LogWriter.hpp>
#include <tracemux/LogWriterConfig.hpp>
#include <tracemux/SetupLog.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT FunctionPipelineInitializer final : public PipelineInitializer
    {
    public:
        using Function = std::function<std::shared_ptr<LogWriter>(SetupLog&, std::shared_ptr<LogWriter>, DependencyRegistry&)>;

        /**
         * @throws Exception (Status::ConfigurationError) if the function is empty.
         */
        explicit FunctionPipelineInitializer(Function function);

        [[nodiscard]]
        std::shared_ptr<LogWriter> initializeLogWriter(SetupLog& setupLog, std::shared_ptr<LogWriter> writer,
            DependencyRegistry& registry) override;

    private:
        Function _function;
    };

    class TRACEMUX_EXPORT FunctionImportInitializer final : public ImportInitializer
    {
    public:
        using Function = std::function<void(SetupLog&, DependencyRegistry&)>;

        /**
         * @throws Exception (Status::ConfigurationError) if the function is empty.
         */
        explicit FunctionImportInitializer(Function function);

        void importDependencies(SetupLog& setupLog, DependencyRegistry& registry) override;

    private:
        Function _function;
    };

    /**
     * Replaces the writer with the proxy returned by
     * LogManager::getOrCreateBackgroundMultiLogWriter(options).createProxyFor(writer).
     * Registers the BackgroundMultiLogWriter in the registry.
     */
    class TRACEMUX_EXPORT BackgroundDispatchInitializer final : public PipelineInitializer
    {
    public:
        explicit BackgroundDispatchInitializer(BackgroundWriterOptions options = {});

        /**
         * @param jsonOptions Options in the BackgroundWriterOptionsParser format.
         * @throws Exception (Status::ConfigurationError) if the options are malformed.
         */
        explicit BackgroundDispatchInitializer(std::string const& jsonOptions);

        [[nodiscard]]
        std::shared_ptr<LogWriter> initializeLogWriter(SetupLog& setupLog, std::shared_ptr<LogWriter> writer,
            DependencyRegistry& registry) override;

        [[nodiscard]]
        BackgroundWriterOptions const& options() const noexcept;

    private:
        BackgroundWriterOptions _options;
    };

    /**
     * Wraps a writer so that writes through any of its entry writers are serialized by one mutex.
     * Lifecycle calls are forwarded to the wrapped writer. The returned entry writers keep this
     * object alive.
     */
    class TRACEMUX_EXPORT SynchronizingLogWriter final
        : public LogWriter
        , public DeferredWriteQueue
        , public std::enable_shared_from_this<SynchronizingLogWriter>
    {
        /// Restricts construction to create().
        struct PrivateTag
        {
            explicit PrivateTag() = default;
        };

    public:
        SynchronizingLogWriter(PrivateTag, std::shared_ptr<LogWriter> inner);

        /**
         * @throws Exception (Status::ConfigurationError) if the writer is null.
         */
        [[nodiscard]]
        static std::shared_ptr<SynchronizingLogWriter> create(std::shared_ptr<LogWriter> inner);

        [[nodiscard]]
        std::vector<std::shared_ptr<EntryWriterBase>> listEntryWriters() const override;

        [[nodiscard]]
        bool isAccepting() const noexcept override;

        /** Runs the write right away, holding the mutex. */
        void post(std::function<void()> write) override;

        [[nodiscard]]
        std::shared_ptr<LogWriter> const& inner() const noexcept;

    protected:
        void onStart() override;
        void onStop() override;
        void onDispose() override;

    private:
        std::shared_ptr<LogWriter> _inner;
        std::mutex _writeMutex;
    };

    class TRACEMUX_EXPORT SynchronizingInitializer final : public PipelineInitializer
    {
    public:
        [[nodiscard]]
        std::shared_ptr<LogWriter> initializeLogWriter(SetupLog& setupLog, std::shared_ptr<LogWriter> writer,
            DependencyRegistry& registry) override;
    };
}
