// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file BackgroundMultiLogWriter.hpp
 * @brief Asynchronous multiplexer decoupling producers from sink I/O
 *
 * ARCHITECTURE:
 *
 *   producer threads                          consumer thread (one per BackgroundMultiLogWriter)
 *
 *   Tracer --> Proxy A entry writer --+
 *                                     +--> [bounded FIFO A] --+
 *   Tracer --> Proxy A entry writer --+                       +--> round-robin, batchSize per turn
 *                                                             |        |
 *   Tracer --> Proxy B entry writer ----> [bounded FIFO B] ---+        +--> sink A / sink B
 *
 * - createProxyFor(sink) fronts a real sink with a Proxy LogWriter. The proxy exposes one
 *   entry writer per entry type of the sink; a write copies the entry into the proxy queue.
 * - Entries are written to the sink outside the queue lock, FIFO per proxy. There is no
 *   ordering across proxies.
 * - A sink that throws is reported to the SetupLog; the consumer keeps going.
 *
 * BACKPRESSURE (OverflowPolicy, applied when a proxy queue holds queueCapacity entries):
 * - Block:      wait up to enqueueTimeout for space, then drop the new entry
 * - DropNewest: drop the new entry
 * - DropOldest: drop the oldest queued entry and enqueue the new one
 * Every drop is counted in droppedCount().
 *
 * FLUSH: after a batch, a sink implementing BufferingLogWriter is flushed when its flush
 * predicate returns true. A buffering sink without a predicate gets "the proxy queue is empty".
 *
 * SHUTDOWN: stop() stops accepting entries, drains the queues until they are empty or
 * drainTimeout expired, joins the consumer, counts what is left as dropped, reports the drops
 * of the run to the SetupLog, then stops the sinks.
 *
 * OWNERSHIP: a BackgroundMultiLogWriter must be owned by a std::shared_ptr. Each Proxy keeps
 * its BackgroundMultiLogWriter alive.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>
#include <tracemux/LogWriter.hpp>
#include <tracemux/SetupLog.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    enum class OverflowPolicy
    {
        Block,
        DropNewest,
        DropOldest
    };

    [[nodiscard]]
    TRACEMUX_EXPORT std::string_view toString(OverflowPolicy policy) noexcept;

    struct BackgroundWriterOptions
    {
        /** Maximum number of queued entries per proxy. At least 1. */
        std::size_t queueCapacity = 1024;

        OverflowPolicy overflowPolicy = OverflowPolicy::Block;

        /** Longest time a producer waits for queue space under OverflowPolicy::Block. */
        std::chrono::milliseconds enqueueTimeout{100};

        /** Longest time stop() lets the consumer drain the queues. */
        std::chrono::milliseconds drainTimeout{5000};

        /** Maximum number of entries taken from one proxy per consumer turn. At least 1. */
        std::size_t batchSize = 64;

        bool operator==(BackgroundWriterOptions const&) const = default;
    };

    class TRACEMUX_EXPORT BackgroundMultiLogWriter final
        : public LogWriter
        , public std::enable_shared_from_this<BackgroundMultiLogWriter>
    {
    public:
        typedef std::shared_ptr<BackgroundMultiLogWriter> ptr;

        class Channel;
        struct State;

        /**
         * Front of one real sink. Started by the LogManager like any other writer; its entry
         * writers are enabled while the proxy accepts entries and the sink is enabled.
         *
         * Stopping a proxy only stops it from accepting entries. Queued entries are still written
         * and the sink is stopped by the BackgroundMultiLogWriter once drained.
         */
        class TRACEMUX_EXPORT Proxy final : public LogWriter
        {
        public:
            Proxy(std::shared_ptr<BackgroundMultiLogWriter> parent, std::shared_ptr<Channel> channel);

            [[nodiscard]]
            std::vector<std::shared_ptr<EntryWriterBase>> listEntryWriters() const override;

            [[nodiscard]]
            std::shared_ptr<LogWriter> const& sink() const noexcept;

            [[nodiscard]]
            std::shared_ptr<BackgroundMultiLogWriter> const& parent() const noexcept;

            /** Number of entries waiting in this proxy's queue. */
            [[nodiscard]]
            std::size_t queuedCount() const;

        protected:
            void onStart() override;
            void onStop() override;
            void onDispose() override;

        private:
            std::shared_ptr<BackgroundMultiLogWriter> _parent;
            std::shared_ptr<Channel> _channel;
            std::vector<std::shared_ptr<EntryWriterBase>> _entryWriters;
        };

        /**
         * @throws Exception (Status::ConfigurationError) if queueCapacity or batchSize is 0.
         */
        explicit BackgroundMultiLogWriter(std::shared_ptr<SetupLog> setupLog, BackgroundWriterOptions options = {});

        ~BackgroundMultiLogWriter() override;

        /**
         * Create the proxy fronting a sink. If this writer is already started the sink is started.
         * @throws Exception (Status::ConfigurationError) if the sink is null.
         */
        [[nodiscard]]
        std::shared_ptr<Proxy> createProxyFor(std::shared_ptr<LogWriter> sink);

        /** Always empty; entries are written through the proxies. */
        [[nodiscard]]
        std::vector<std::shared_ptr<EntryWriterBase>> listEntryWriters() const override;

        /** Cumulative number of dropped entries since construction. */
        [[nodiscard]]
        std::uint64_t droppedCount() const noexcept;

        /** Number of entries queued across all proxies. */
        [[nodiscard]]
        std::size_t queuedCount() const;

        [[nodiscard]]
        BackgroundWriterOptions const& options() const noexcept;

    protected:
        void onStart() override;
        void onStop() override;
        void onDispose() override;

    private:
        void run();

        std::shared_ptr<State> _state;
        std::thread _consumer;
    };
}
