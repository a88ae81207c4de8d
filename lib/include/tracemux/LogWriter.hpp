// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file LogWriter.hpp
 * @brief Runtime sink capability: lifecycle plus typed entry writer negotiation
 *
 * A LogWriter is a started/stopped sink that exposes one EntryWriter per entry type it can
 * accept. Callers never ask a sink for an entry type it does not support and fail: the
 * negotiation returns null and the caller decides what to do (the LogManager substitutes a
 * NoOpEntryWriter).
 *
 * NEGOTIATION:
 * ```cpp
 * if (auto entryWriter = logWriter->tryGetEntryWriter<TraceEntry>(); entryWriter)
 * {
 *     entryWriter->write(entry);
 * }
 * ```
 *
 * LIFECYCLE: inherited from Startable. Entry writers of a stopped LogWriter report
 * isEnabled() == false.
 */

#pragma once

#include <functional>
#include <memory>
#include <typeindex>
#include <vector>
#include <tracemux/EntryWriter.hpp>
#include <tracemux/Startable.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT LogWriter : public Startable
    {
    public:
        typedef std::shared_ptr<LogWriter> ptr;

        ~LogWriter() override;

        /**
         * Every entry writer exposed by this log writer. Each element reports its entry type.
         */
        [[nodiscard]]
        virtual std::vector<std::shared_ptr<EntryWriterBase>> listEntryWriters() const = 0;

        /**
         * Find the entry writer accepting the given entry type.
         * The default implementation scans listEntryWriters().
         * @return null when no entry writer accepts the type.
         */
        [[nodiscard]]
        virtual std::shared_ptr<EntryWriterBase> findEntryWriter(std::type_index entryType) const;

        /**
         * Typed negotiation. Never throws for an unsupported entry type.
         * @return null when this writer does not accept Entry.
         */
        template<typename Entry>
        [[nodiscard]]
        std::shared_ptr<EntryWriter<Entry>> tryGetEntryWriter() const
        {
            return std::dynamic_pointer_cast<EntryWriter<Entry>>(findEntryWriter(typeid(Entry)));
        }
    };

    /**
     * Base class of sinks that accept exactly one entry type and are their own entry writer.
     * The entry writer is enabled while the sink is started.
     *
     * Objects of derived classes must be owned by a std::shared_ptr.
     */
    template<typename Entry>
    class SingleEntryTypeLogWriter
        : public LogWriter
        , public EntryWriter<Entry>
        , public std::enable_shared_from_this<SingleEntryTypeLogWriter<Entry>>
    {
    public:
        [[nodiscard]]
        std::vector<std::shared_ptr<EntryWriterBase>> listEntryWriters() const override
        {
            auto self = std::const_pointer_cast<SingleEntryTypeLogWriter<Entry>>(this->shared_from_this());
            return {std::static_pointer_cast<EntryWriter<Entry>>(self)};
        }

        [[nodiscard]]
        bool isEnabled() const override
        {
            return isStarted();
        }
    };

    /**
     * Capability of sinks that buffer output and need an explicit flush.
     *
     * The background dispatcher calls flush() after a batch when the flush predicate returns
     * true. A buffering sink without a predicate that gets a background proxy receives the
     * predicate "the proxy queue is empty".
     */
    class TRACEMUX_EXPORT BufferingLogWriter
    {
    public:
        using FlushPredicate = std::function<bool()>;

        virtual ~BufferingLogWriter();

        [[nodiscard]]
        virtual FlushPredicate flushPredicate() const = 0;

        virtual void setFlushPredicate(FlushPredicate predicate) = 0;

        virtual void flush() = 0;
    };
}
