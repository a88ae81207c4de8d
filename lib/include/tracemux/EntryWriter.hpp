// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file EntryWriter.hpp
 * @brief Typed write endpoint of a sink
 *
 * ARCHITECTURE:
 *
 *   EntryWriterBase (type-erased: entry type, enabled state)
 *     |
 *     +-- EntryWriter<Entry> (typed write(Entry const&))
 *           |
 *           +-- implemented by sinks (external), and by:
 *           +-- NoOpEntryWriter<Entry>      returned when no real writer is available
 *           +-- DeferredEntryWriter<Entry>  copies the entry and posts the write to a queue
 *           +-- FanOutEntryWriter<Entry>    see FanOutEntryWriter.hpp
 *
 * CONTRACT FOR IMPLEMENTATIONS:
 * - write() receives the entry by const reference; it must not keep the reference after
 *   returning. Copy the entry to keep it.
 * - isEnabled() is called from producer threads and must be thread-safe.
 * - write() may throw. Every caller inside the library catches and reports the exception.
 */

#pragma once

#include <functional>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    /**
     * A queue that accepts deferred writes. Implemented by the background dispatcher.
     */
    class TRACEMUX_EXPORT DeferredWriteQueue
    {
    public:
        virtual ~DeferredWriteQueue();

        /** false once the queue stopped accepting work (stopped or not yet started). */
        [[nodiscard]]
        virtual bool isAccepting() const noexcept = 0;

        /**
         * Enqueue a write. May block up to the configured enqueue timeout, or drop the write,
         * depending on the overflow policy. Never throws for a full queue.
         */
        virtual void post(std::function<void()> write) = 0;
    };

    class TRACEMUX_EXPORT EntryWriterBase
    {
    public:
        virtual ~EntryWriterBase();

        /** The entry type accepted by this writer. */
        [[nodiscard]]
        virtual std::type_index entryType() const noexcept = 0;

        /** true if write() would currently do anything. */
        [[nodiscard]]
        virtual bool isEnabled() const = 0;

        /**
         * Create an entry writer of the same entry type that posts each write to a queue,
         * to be executed later against this writer.
         *
         * @param self Shared ownership of this object (the proxy keeps the real writer alive).
         * @param queue The queue receiving the deferred writes.
         */
        [[nodiscard]]
        virtual std::shared_ptr<EntryWriterBase> createDeferredProxy(std::shared_ptr<EntryWriterBase> const& self,
            std::shared_ptr<DeferredWriteQueue> const& queue) const = 0;
    };

    template<typename Entry>
    class EntryWriter : public EntryWriterBase
    {
    public:
        using entry_type = Entry;

        virtual void write(Entry const& entry) = 0;

        [[nodiscard]]
        std::type_index entryType() const noexcept final
        {
            return typeid(Entry);
        }

        [[nodiscard]]
        std::shared_ptr<EntryWriterBase> createDeferredProxy(std::shared_ptr<EntryWriterBase> const& self,
            std::shared_ptr<DeferredWriteQueue> const& queue) const final;
    };

    /**
     * An entry writer that drops everything. Always disabled.
     */
    template<typename Entry>
    class NoOpEntryWriter final : public EntryWriter<Entry>
    {
    public:
        [[nodiscard]]
        bool isEnabled() const override
        {
            return false;
        }

        void write(Entry const&) override
        {}
    };

    /**
     * Copies every entry written to it and posts the write against the real writer to a queue.
     */
    template<typename Entry>
    class DeferredEntryWriter final : public EntryWriter<Entry>
    {
    public:
        DeferredEntryWriter(std::shared_ptr<EntryWriter<Entry>> inner, std::shared_ptr<DeferredWriteQueue> queue)
            : _inner{std::move(inner)}
            , _queue{std::move(queue)}
        {}

        [[nodiscard]]
        bool isEnabled() const override
        {
            return _queue->isAccepting() && _inner->isEnabled();
        }

        void write(Entry const& entry) override
        {
            _queue->post([inner = _inner, copy = entry]() { inner->write(copy); });
        }

        [[nodiscard]]
        std::shared_ptr<EntryWriter<Entry>> const& inner() const noexcept
        {
            return _inner;
        }

    private:
        std::shared_ptr<EntryWriter<Entry>> _inner;
        std::shared_ptr<DeferredWriteQueue> _queue;
    };

    template<typename Entry>
    std::shared_ptr<EntryWriterBase> EntryWriter<Entry>::createDeferredProxy(std::shared_ptr<EntryWriterBase> const& self,
        std::shared_ptr<DeferredWriteQueue> const& queue) const
    {
        auto typedSelf = std::static_pointer_cast<EntryWriter<Entry>>(self);
        return std::make_shared<DeferredEntryWriter<Entry>>(std::move(typedSelf), queue);
    }
}
