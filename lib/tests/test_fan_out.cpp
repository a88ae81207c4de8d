// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_fan_out.cpp
 * @brief Tests for broadcasting one write to several entry writers
 */

#include <memory>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <tracemux/FanOutEntryWriter.hpp>
#include "Utils.hpp"

using namespace tracemux::tests;

namespace
{
    TraceEntry makeEntry(std::string message)
    {
        return TraceEntry{std::chrono::system_clock::now(), "FanOut", TraceLevel::Warn, std::move(message), std::nullopt};
    }
}

/**
 * @brief A throwing writer neither blocks nor skips the writers registered after it
 */
TEST_CASE("Fan-out isolates failing writers", "[fanout]")
{
    auto const setupLog = std::make_shared<SetupLog>();
    auto const failing = std::make_shared<ExceptionThrowingLogWriter<TraceEntry>>();
    auto const clean = std::make_shared<TraceListLogWriter>();
    failing->start();
    clean->start();

    auto fanOut = FanOutEntryWriter<TraceEntry>{
        {failing, clean},
        setupLog
    };

    constexpr auto calls = 5;
    for (auto i = 0; i < calls; ++i)
    {
        REQUIRE_NOTHROW(fanOut.write(makeEntry(std::to_string(i))));
    }

    REQUIRE(clean->count() == calls);
    REQUIRE(failing->attempts() == calls);
    REQUIRE(countAtLevel(*setupLog, TraceLevel::Error) == calls);

    auto const diagnostics = setupLog->entries();
    REQUIRE(diagnostics.front().tracerName == "FanOutEntryWriter");
    REQUIRE(diagnostics.front().message.find("WriteFailure") != std::string::npos);
}

/**
 * @brief Enabled if any wrapped writer is enabled
 */
TEST_CASE("Fan-out enabled state", "[fanout]")
{
    auto const first = std::make_shared<TraceListLogWriter>();
    auto const second = std::make_shared<TraceListLogWriter>();
    auto const fanOut = FanOutEntryWriter<TraceEntry>{
        {first, second},
        std::make_shared<SetupLog>()
    };

    REQUIRE_FALSE(fanOut.isEnabled());

    second->start();
    REQUIRE(fanOut.isEnabled());

    first->start();
    second->stop();
    REQUIRE(fanOut.isEnabled());

    first->stop();
    REQUIRE_FALSE(fanOut.isEnabled());

    auto const empty = FanOutEntryWriter<TraceEntry>{{}, std::make_shared<SetupLog>()};
    REQUIRE_FALSE(empty.isEnabled());
}
