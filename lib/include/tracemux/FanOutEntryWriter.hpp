// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FanOutEntryWriter.hpp
 * @brief Broadcast one write to several entry writers with per-writer failure isolation
 *
 * FAILURE ISOLATION:
 * - Writers are called in order.
 * - A writer that throws is reported to the SetupLog (Error, with the exception as detail)
 *   and the remaining writers still receive the entry.
 * - Nothing propagates to the caller.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include <tracemux/EntryWriter.hpp>
#include <tracemux/Exception.hpp>
#include <tracemux/SetupLog.hpp>

namespace tracemux::lib
{
    template<typename Entry>
    class FanOutEntryWriter final : public EntryWriter<Entry>
    {
    public:
        FanOutEntryWriter(std::vector<std::shared_ptr<EntryWriter<Entry>>> writers, std::shared_ptr<SetupLog> setupLog)
            : _writers{std::move(writers)}
            , _setupLog{std::move(setupLog)}
        {}

        [[nodiscard]]
        bool isEnabled() const override
        {
            for (auto const& writer : _writers)
            {
                if (writer->isEnabled())
                {
                    return true;
                }
            }
            return false;
        }

        void write(Entry const& entry) override
        {
            for (auto i = std::size_t{0}; i < _writers.size(); ++i)
            {
                try
                {
                    _writers[i]->write(entry);
                }
                catch (...)
                {
                    _setupLog->error("FanOutEntryWriter",
                        fmt::format("{}: entry writer {} of {} threw while writing.", toString(Status::WriteFailure), i, _writers.size()),
                        describeCurrentException());
                }
            }
        }

        [[nodiscard]]
        std::vector<std::shared_ptr<EntryWriter<Entry>>> const& writers() const noexcept
        {
            return _writers;
        }

    private:
        std::vector<std::shared_ptr<EntryWriter<Entry>>> _writers;
        std::shared_ptr<SetupLog> _setupLog;
    };
}
