// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <tracemux/LogWriter.hpp>
#include <tracemux/LogWriterConfig.hpp>
#include <tracemux/SetupLog.hpp>
#include <tracemux/TraceEntry.hpp>

namespace tracemux::tests
{
    using namespace tracemux::lib;

    /// An entry type no trace sink accepts.
    struct MetricEntry
    {
        std::string name;
        double value;
    };

    /// Poll a condition until it holds or the timeout expires.
    inline bool waitUntil(std::function<bool()> const& condition, std::chrono::milliseconds timeout = std::chrono::seconds{5})
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (!condition())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return true;
    }

    ///
    /// In-memory sink recording every entry written while started.
    ///
    template<typename Entry>
    class ListLogWriter : public SingleEntryTypeLogWriter<Entry>
    {
    public:
        void write(Entry const& entry) override
        {
            auto lock = std::lock_guard{_mutex};
            _entries.push_back(entry);
        }

        std::vector<Entry> entries() const
        {
            auto lock = std::lock_guard{_mutex};
            return _entries;
        }

        std::size_t count() const
        {
            auto lock = std::lock_guard{_mutex};
            return _entries.size();
        }

    private:
        mutable std::mutex _mutex;
        std::vector<Entry> _entries;
    };

    using TraceListLogWriter = ListLogWriter<TraceEntry>;

    ///
    /// Sink whose write always throws.
    ///
    template<typename Entry>
    class ExceptionThrowingLogWriter final : public SingleEntryTypeLogWriter<Entry>
    {
    public:
        void write(Entry const&) override
        {
            ++_attempts;
            throw std::runtime_error{"write failed on purpose"};
        }

        std::size_t attempts() const noexcept
        {
            return _attempts.load();
        }

    private:
        std::atomic<std::size_t> _attempts{0};
    };

    ///
    /// Sink whose start always throws.
    ///
    class FailingStartLogWriter final : public SingleEntryTypeLogWriter<TraceEntry>
    {
    public:
        void write(TraceEntry const&) override
        {}

    protected:
        void onStart() override
        {
            throw std::runtime_error{"start failed on purpose"};
        }
    };

    ///
    /// List sink that also buffers: counts flushes.
    ///
    class BufferingListLogWriter final
        : public ListLogWriter<TraceEntry>
        , public BufferingLogWriter
    {
    public:
        FlushPredicate flushPredicate() const override
        {
            auto lock = std::lock_guard{_flushMutex};
            return _flushPredicate;
        }

        void setFlushPredicate(FlushPredicate predicate) override
        {
            auto lock = std::lock_guard{_flushMutex};
            _flushPredicate = std::move(predicate);
        }

        void flush() override
        {
            ++_flushCount;
        }

        std::size_t flushCount() const noexcept
        {
            return _flushCount.load();
        }

    private:
        mutable std::mutex _flushMutex;
        FlushPredicate _flushPredicate;
        std::atomic<std::size_t> _flushCount{0};
    };

    ///
    /// List sink whose writes block until the gate is opened. Used to stall the background consumer.
    ///
    class GatedLogWriter final : public ListLogWriter<TraceEntry>
    {
    public:
        void write(TraceEntry const& entry) override
        {
            {
                auto lock = std::unique_lock{_gateMutex};
                ++_waiting;
                _gateChanged.notify_all();
                _gateChanged.wait(lock, [this]() { return _open; });
                --_waiting;
            }
            ListLogWriter<TraceEntry>::write(entry);
        }

        /// Wait until a write is blocked on the gate.
        bool waitForBlockedWrite(std::chrono::milliseconds timeout = std::chrono::seconds{5})
        {
            auto lock = std::unique_lock{_gateMutex};
            return _gateChanged.wait_for(lock, timeout, [this]() { return _waiting > 0; });
        }

        void open()
        {
            {
                auto lock = std::lock_guard{_gateMutex};
                _open = true;
            }
            _gateChanged.notify_all();
        }

    private:
        std::mutex _gateMutex;
        std::condition_variable _gateChanged;
        std::size_t _waiting = 0;
        bool _open = false;
    };

    ///
    /// Descriptor identified by a name, creating a sink with a factory. Remembers the last
    /// created writer so that tests can inspect it.
    ///
    class TestLogWriterConfig final : public LogWriterConfig
    {
    public:
        using Factory = std::function<std::shared_ptr<LogWriter>()>;

        TestLogWriterConfig(std::string name, Factory factory)
            : _name{std::move(name)}
            , _factory{std::move(factory)}
        {}

        std::shared_ptr<LogWriter> createLogWriter(SetupLog&) const override
        {
            auto writer = _factory();
            ++_createCount;
            _created = writer;
            return writer;
        }

        bool equals(LogWriterConfig const& other) const override
        {
            return _name == static_cast<TestLogWriterConfig const&>(other)._name;
        }

        std::size_t hash() const override
        {
            return std::hash<std::string>{}(_name);
        }

        std::string describe() const override
        {
            return "TestLogWriterConfig(" + _name + ")";
        }

        template<typename T = LogWriter>
        std::shared_ptr<T> created() const
        {
            return std::dynamic_pointer_cast<T>(_created);
        }

        std::size_t createCount() const noexcept
        {
            return _createCount;
        }

    private:
        std::string _name;
        Factory _factory;
        mutable std::shared_ptr<LogWriter> _created;
        mutable std::size_t _createCount = 0;
    };

    /// Descriptor of a new TraceListLogWriter per build.
    inline std::shared_ptr<TestLogWriterConfig> makeListConfig(std::string name)
    {
        return std::make_shared<TestLogWriterConfig>(std::move(name), []() { return std::make_shared<TraceListLogWriter>(); });
    }

    /// Descriptor whose writer construction throws.
    inline std::shared_ptr<TestLogWriterConfig> makeFailingConfig(std::string name)
    {
        return std::make_shared<TestLogWriterConfig>(
            std::move(name), []() -> std::shared_ptr<LogWriter> { throw std::runtime_error{"construction failed on purpose"}; });
    }

    inline std::size_t countAtLevel(SetupLog const& setupLog, TraceLevel level)
    {
        return setupLog.countIf([level](TraceEntry const& entry) { return entry.level == level; });
    }

    inline std::vector<std::string> messages(std::vector<TraceEntry> const& entries)
    {
        auto result = std::vector<std::string>{};
        for (auto const& entry : entries)
        {
            result.push_back(entry.message);
        }
        return result;
    }
} // namespace tracemux::tests
