// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file BackgroundMultiLogWriter.cpp
 * @brief Bounded per-proxy queues drained by one consumer thread
 *
 * All queues share the mutex of the State object. Producers hold it only to push into a
 * deque; the consumer holds it only to move a batch out. Sink writes and flushes always run
 * with the mutex released.
 *
 * OWNERSHIP GRAPH:
 *
 *   BackgroundMultiLogWriter --> State --> Channel --> sink
 *          ^                       ^          ^
 *          |                       |          |
 *        Proxy --------------------+----------+
 *                                  |          |
 *   DeferredEntryWriter -----------+----------+   (held by tracers)
 *
 * The State -> Channel edge is cut when the BackgroundMultiLogWriter is disposed or destroyed,
 * so a tracer outliving everything else only keeps a stopped Channel alive.
 */

#include "tracemux/BackgroundMultiLogWriter.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <typeinfo>
#include <utility>
#include <fmt/format.h>
#include "tracemux/Exception.hpp"
#include "tracemux-internal/Logging.hpp"

namespace tracemux::lib
{
    namespace
    {
        constexpr auto source = std::string_view{"BackgroundMultiLogWriter"};

        std::string describeSink(LogWriter const& sink)
        {
            return fmt::format("{}@{}", typeid(sink).name(), static_cast<void const*>(&sink));
        }

        /// now() + timeout, saturated at the largest representable time point.
        std::chrono::steady_clock::time_point deadlineAfter(std::chrono::milliseconds timeout)
        {
            using Clock = std::chrono::steady_clock;
            auto const now = Clock::now();
            auto const headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
            if (timeout >= headroom)
            {
                return Clock::time_point::max();
            }
            return now + std::chrono::duration_cast<Clock::duration>(timeout);
        }
    }

    std::string_view toString(OverflowPolicy policy) noexcept
    {
        switch (policy)
        {
            case OverflowPolicy::Block:      return "block";
            case OverflowPolicy::DropNewest: return "dropNewest";
            case OverflowPolicy::DropOldest: return "dropOldest";
        }
        return "unknown";
    }

    ///
    /// Shared state of the queues and the consumer.
    ///
    struct BackgroundMultiLogWriter::State
    {
        State(std::shared_ptr<SetupLog> in_setupLog, BackgroundWriterOptions in_options)
            : setupLog{std::move(in_setupLog)}
            , options{in_options}
        {}

        /// Requires mutex to be held.
        [[nodiscard]]
        bool hasQueuedEntries() const;

        void enqueue(Channel& channel, std::function<void()> write);

        std::shared_ptr<SetupLog> setupLog;
        BackgroundWriterOptions options;

        mutable std::mutex mutex;
        std::condition_variable workAvailable;
        std::condition_variable spaceAvailable;

        // Guarded by mutex
        std::vector<std::shared_ptr<Channel>> channels;
        bool stopRequested = false;
        std::chrono::steady_clock::time_point drainDeadline{};
        std::uint64_t droppedAtStart = 0;

        std::atomic<bool> accepting{false};
        std::atomic<std::uint64_t> dropped{0};
    };

    ///
    /// One proxy queue. This is the DeferredWriteQueue the proxy entry writers post to.
    ///
    class BackgroundMultiLogWriter::Channel final : public DeferredWriteQueue
    {
    public:
        Channel(std::shared_ptr<State> in_state, std::shared_ptr<LogWriter> in_sink)
            : state{std::move(in_state)}
            , sink{std::move(in_sink)}
        {}

        [[nodiscard]]
        bool isAccepting() const noexcept override
        {
            return accepting.load(std::memory_order_relaxed) && state->accepting.load(std::memory_order_relaxed);
        }

        void post(std::function<void()> write) override
        {
            state->enqueue(*this, std::move(write));
        }

        [[nodiscard]]
        std::size_t queuedCount() const
        {
            auto lock = std::lock_guard{state->mutex};
            return queue.size();
        }

        std::shared_ptr<State> state;
        std::shared_ptr<LogWriter> sink;
        std::shared_ptr<BufferingLogWriter> buffering;

        // Guarded by state->mutex
        std::deque<std::function<void()>> queue;

        std::atomic<bool> accepting{false};
    };

    bool BackgroundMultiLogWriter::State::hasQueuedEntries() const
    {
        return std::any_of(channels.begin(), channels.end(), [](auto const& channel) { return !channel->queue.empty(); });
    }

    void BackgroundMultiLogWriter::State::enqueue(Channel& channel, std::function<void()> write)
    {
        auto lock = std::unique_lock{mutex};
        if (!accepting.load() || !channel.accepting.load())
        {
            ++dropped;
            return;
        }

        if (channel.queue.size() >= options.queueCapacity)
        {
            switch (options.overflowPolicy)
            {
                case OverflowPolicy::DropNewest:
                    ++dropped;
                    return;

                case OverflowPolicy::DropOldest:
                {
                    auto oldest = std::move(channel.queue.front());
                    channel.queue.pop_front();
                    channel.queue.push_back(std::move(write));
                    // The dropped write is destroyed after the lock is released
                    write = std::move(oldest);
                    ++dropped;
                    lock.unlock();
                    workAvailable.notify_one();
                    return;
                }

                case OverflowPolicy::Block:
                {
                    auto const hasSpace = spaceAvailable.wait_until(lock,
                        deadlineAfter(options.enqueueTimeout),
                        [this, &channel]() { return !accepting.load() || (channel.queue.size() < options.queueCapacity); });
                    if (!hasSpace || !accepting.load())
                    {
                        ++dropped;
                        return;
                    }
                    break;
                }
            }
        }

        channel.queue.push_back(std::move(write));
        lock.unlock();
        workAvailable.notify_one();
    }

    ///
    /// Proxy
    ///
    BackgroundMultiLogWriter::Proxy::Proxy(std::shared_ptr<BackgroundMultiLogWriter> parent, std::shared_ptr<Channel> channel)
        : _parent{std::move(parent)}
        , _channel{std::move(channel)}
    {
        for (auto const& entryWriter : _channel->sink->listEntryWriters())
        {
            if (entryWriter)
            {
                _entryWriters.push_back(entryWriter->createDeferredProxy(entryWriter, _channel));
            }
        }
    }

    std::vector<std::shared_ptr<EntryWriterBase>> BackgroundMultiLogWriter::Proxy::listEntryWriters() const
    {
        return _entryWriters;
    }

    std::shared_ptr<LogWriter> const& BackgroundMultiLogWriter::Proxy::sink() const noexcept
    {
        return _channel->sink;
    }

    std::shared_ptr<BackgroundMultiLogWriter> const& BackgroundMultiLogWriter::Proxy::parent() const noexcept
    {
        return _parent;
    }

    std::size_t BackgroundMultiLogWriter::Proxy::queuedCount() const
    {
        return _channel->queuedCount();
    }

    void BackgroundMultiLogWriter::Proxy::onStart()
    {
        _parent->ensureStarted();
        if (!_channel->sink->isStarted())
        {
            // Rethrows the sink's start failure so that this proxy ends in FailedToStart
            _channel->sink->start();
        }
        _channel->accepting = true;
    }

    void BackgroundMultiLogWriter::Proxy::onStop()
    {
        _channel->accepting = false;
    }

    void BackgroundMultiLogWriter::Proxy::onDispose()
    {
        _channel->sink->dispose();
    }

    ///
    /// BackgroundMultiLogWriter
    ///
    BackgroundMultiLogWriter::BackgroundMultiLogWriter(std::shared_ptr<SetupLog> setupLog, BackgroundWriterOptions options)
        : _state{}
        , _consumer{}
    {
        if (options.queueCapacity == 0)
        {
            throw Exception::configuration("queueCapacity must be greater or equal to 1.");
        }
        if (options.batchSize == 0)
        {
            throw Exception::configuration("batchSize must be greater or equal to 1.");
        }
        if ((options.enqueueTimeout.count() < 0) || (options.drainTimeout.count() < 0))
        {
            throw Exception::configuration("enqueueTimeout and drainTimeout must not be negative.");
        }
        if (!setupLog)
        {
            setupLog = std::make_shared<SetupLog>();
        }
        _state = std::make_shared<State>(std::move(setupLog), options);
    }

    BackgroundMultiLogWriter::~BackgroundMultiLogWriter()
    {
        try
        {
            stop();
        }
        catch (std::exception const& e)
        {
            TRACEMUX_ERROR("Failed to stop background writer on destruction: {}", e.what());
        }

        auto lock = std::lock_guard{_state->mutex};
        _state->channels.clear();
    }

    std::shared_ptr<BackgroundMultiLogWriter::Proxy> BackgroundMultiLogWriter::createProxyFor(std::shared_ptr<LogWriter> sink)
    {
        if (!sink)
        {
            throw Exception::configuration("Cannot create a background proxy for a null log writer.");
        }

        auto channel = std::make_shared<Channel>(_state, sink);
        if (auto buffering = std::dynamic_pointer_cast<BufferingLogWriter>(sink); buffering)
        {
            channel->buffering = buffering;
            if (!buffering->flushPredicate())
            {
                // Flush whenever this proxy has nothing more queued
                buffering->setFlushPredicate([weakChannel = std::weak_ptr<Channel>{channel}]()
                    {
                        auto const c = weakChannel.lock();
                        return !c || (c->queuedCount() == 0);
                    });
            }
        }

        {
            auto lock = std::lock_guard{_state->mutex};
            _state->channels.push_back(channel);
        }

        if (isStarted())
        {
            try
            {
                sink->ensureStarted();
            }
            catch (...)
            {
                _state->setupLog->error(source, fmt::format("Failed to start {}.", describeSink(*sink)), describeCurrentException());
            }
        }

        TRACEMUX_DEBUG("Created background proxy for {}", describeSink(*sink));
        return std::make_shared<Proxy>(shared_from_this(), std::move(channel));
    }

    std::vector<std::shared_ptr<EntryWriterBase>> BackgroundMultiLogWriter::listEntryWriters() const
    {
        return {};
    }

    std::uint64_t BackgroundMultiLogWriter::droppedCount() const noexcept
    {
        return _state->dropped.load();
    }

    std::size_t BackgroundMultiLogWriter::queuedCount() const
    {
        auto lock = std::lock_guard{_state->mutex};
        auto total = std::size_t{0};
        for (auto const& channel : _state->channels)
        {
            total += channel->queue.size();
        }
        return total;
    }

    BackgroundWriterOptions const& BackgroundMultiLogWriter::options() const noexcept
    {
        return _state->options;
    }

    void BackgroundMultiLogWriter::onStart()
    {
        auto& state = *_state;
        auto channels = std::vector<std::shared_ptr<Channel>>{};
        {
            auto lock = std::lock_guard{state.mutex};
            state.stopRequested = false;
            state.droppedAtStart = state.dropped.load();
            channels = state.channels;
        }

        for (auto const& channel : channels)
        {
            try
            {
                channel->sink->ensureStarted();
            }
            catch (...)
            {
                state.setupLog->error(source, fmt::format("Failed to start {}.", describeSink(*channel->sink)), describeCurrentException());
            }
        }

        state.accepting = true;
        _consumer = std::thread{[this]() { run(); }};
        TRACEMUX_DEBUG("Background writer started with {} proxies", channels.size());
    }

    void BackgroundMultiLogWriter::onStop()
    {
        auto& state = *_state;
        {
            auto lock = std::lock_guard{state.mutex};
            state.accepting = false;
            state.stopRequested = true;
            state.drainDeadline = deadlineAfter(state.options.drainTimeout);
        }
        state.workAvailable.notify_all();
        state.spaceAvailable.notify_all();

        if (_consumer.joinable())
        {
            _consumer.join();
        }

        // Whatever the consumer could not drain in time is dropped
        auto channels = std::vector<std::shared_ptr<Channel>>{};
        auto discarded = std::vector<std::deque<std::function<void()>>>{};
        auto remaining = std::size_t{0};
        {
            auto lock = std::lock_guard{state.mutex};
            channels = state.channels;
            for (auto const& channel : channels)
            {
                remaining += channel->queue.size();
                discarded.push_back(std::move(channel->queue));
                channel->queue.clear();
            }
        }
        discarded.clear();
        state.dropped += remaining;

        auto const droppedThisRun = state.dropped.load() - state.droppedAtStart;
        if (droppedThisRun > 0)
        {
            state.setupLog->warn(source,
                fmt::format("{} entries were dropped while running; {} of them were still queued at shutdown.", droppedThisRun, remaining));
        }

        for (auto const& channel : channels)
        {
            try
            {
                channel->sink->stop();
            }
            catch (...)
            {
                state.setupLog->error(source, fmt::format("Failed to stop {}.", describeSink(*channel->sink)), describeCurrentException());
            }
        }
    }

    void BackgroundMultiLogWriter::onDispose()
    {
        auto lock = std::lock_guard{_state->mutex};
        _state->channels.clear();
    }

    void BackgroundMultiLogWriter::run()
    {
        auto& state = *_state;
        auto next = std::size_t{0};
        auto batch = std::vector<std::function<void()>>{};
        batch.reserve(std::min<std::size_t>(state.options.batchSize, 1024));

        auto lock = std::unique_lock{state.mutex};
        while (true)
        {
            state.workAvailable.wait(lock, [&state]() { return state.stopRequested || state.hasQueuedEntries(); });
            if (state.stopRequested && (!state.hasQueuedEntries() || (std::chrono::steady_clock::now() >= state.drainDeadline)))
            {
                break;
            }

            // Round-robin: the first non-empty queue at or after `next`
            auto channel = std::shared_ptr<Channel>{};
            auto const channelCount = state.channels.size();
            for (auto i = std::size_t{0}; i < channelCount; ++i)
            {
                auto const index = (next + i) % channelCount;
                if (!state.channels[index]->queue.empty())
                {
                    channel = state.channels[index];
                    next = (index + 1) % channelCount;
                    break;
                }
            }

            auto const count = std::min(state.options.batchSize, channel->queue.size());
            for (auto i = std::size_t{0}; i < count; ++i)
            {
                batch.push_back(std::move(channel->queue.front()));
                channel->queue.pop_front();
            }
            lock.unlock();
            state.spaceAvailable.notify_all();

            for (auto& write : batch)
            {
                try
                {
                    write();
                }
                catch (...)
                {
                    state.setupLog->error(source,
                        fmt::format("{}: {} threw while writing an entry.", toString(Status::WriteFailure), describeSink(*channel->sink)),
                        describeCurrentException());
                }
            }
            batch.clear();

            if (channel->buffering)
            {
                try
                {
                    auto const predicate = channel->buffering->flushPredicate();
                    if (predicate && predicate())
                    {
                        channel->buffering->flush();
                    }
                }
                catch (...)
                {
                    state.setupLog->error(source, fmt::format("Failed to flush {}.", describeSink(*channel->sink)), describeCurrentException());
                }
            }

            lock.lock();
        }
        TRACEMUX_TRACE("Background consumer exiting");
    }
}
