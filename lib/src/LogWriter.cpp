// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/LogWriter.hpp"
#include "tracemux/EntryWriter.hpp"

namespace tracemux::lib
{
    DeferredWriteQueue::~DeferredWriteQueue() = default;

    EntryWriterBase::~EntryWriterBase() = default;

    LogWriter::~LogWriter() = default;

    std::shared_ptr<EntryWriterBase> LogWriter::findEntryWriter(std::type_index entryType) const
    {
        for (auto const& entryWriter : listEntryWriters())
        {
            if (entryWriter && (entryWriter->entryType() == entryType))
            {
                return entryWriter;
            }
        }
        return nullptr;
    }

    BufferingLogWriter::~BufferingLogWriter() = default;
}
