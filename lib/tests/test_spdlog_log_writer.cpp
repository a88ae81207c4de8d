// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_spdlog_log_writer.cpp
 * @brief Tests for the spdlog sink and the self-diagnostic log
 */

#include <memory>
#include <sstream>
#include <string>
#include <catch2/catch_test_macros.hpp>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <tracemux/SetupLog.hpp>
#include <tracemux/SpdlogLogWriter.hpp>
#include <tracemux/TraceManager.hpp>
#include "Utils.hpp"

using namespace tracemux::tests;

namespace
{
    std::shared_ptr<spdlog::logger> makeLogger(std::ostringstream& out)
    {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%l %v");
        auto logger = std::make_shared<spdlog::logger>("tracemux-test", std::move(sink));
        logger->set_level(spdlog::level::trace);
        return logger;
    }
}

TEST_CASE("Entries are written to the spdlog logger", "[spdlog]")
{
    auto out = std::ostringstream{};
    auto const logger = makeLogger(out);
    auto const writer = std::make_shared<SpdlogLogWriter>(logger);
    REQUIRE(writer->logger() == logger);

    auto manager = TraceManager{writer, TraceLevel::Verbose};
    auto const tracer = manager.getTracer("App.Net");
    tracer->info("connected to {}", "server");
    tracer->log(TraceLevel::Error, "send failed", "connection reset");
    tracer->debug("below the threshold");
    logger->flush();

    auto const text = out.str();
    REQUIRE(text.find("info [App.Net] connected to server") != std::string::npos);
    REQUIRE(text.find("error [App.Net] send failed | connection reset") != std::string::npos);
    REQUIRE(text.find("below the threshold") == std::string::npos);
}

TEST_CASE("Logger level filters entries", "[spdlog]")
{
    auto out = std::ostringstream{};
    auto const logger = makeLogger(out);
    logger->set_level(spdlog::level::warn);

    auto manager = TraceManager{std::make_shared<SpdlogLogWriter>(logger), TraceLevel::Debug};
    auto const tracer = manager.getTracer("App");
    tracer->info("filtered by spdlog");
    tracer->severe("written");
    logger->flush();

    auto const text = out.str();
    REQUIRE(text.find("filtered by spdlog") == std::string::npos);
    REQUIRE(text.find("critical [App] written") != std::string::npos);
}

TEST_CASE("Default logger", "[spdlog]")
{
    auto const writer = SpdlogLogWriter{};
    REQUIRE(writer.logger() != nullptr);
}

/**
 * @brief The self-diagnostic log keeps every entry and answers queries on it
 */
TEST_CASE("Setup log", "[setuplog]")
{
    auto setupLog = SetupLog{};
    REQUIRE(setupLog.count() == 0);
    REQUIRE_FALSE(setupLog.hasErrors());

    setupLog.debug("Test", "debug");
    setupLog.info("Test", "info");
    setupLog.warn("Test", "warn", "details");
    REQUIRE_FALSE(setupLog.hasErrors());
    REQUIRE(setupLog.countAtLeast(TraceLevel::Info) == 2);

    setupLog.error("Test", "error");
    setupLog.severe("Other", "severe");
    REQUIRE(setupLog.hasErrors());
    REQUIRE(setupLog.count() == 5);
    REQUIRE(setupLog.countAtLeast(TraceLevel::Error) == 2);
    REQUIRE(setupLog.countIf([](TraceEntry const& entry) { return entry.tracerName == "Other"; }) == 1);

    auto const entries = setupLog.entries();
    REQUIRE(messages(entries) == std::vector<std::string>{"debug", "info", "warn", "error", "severe"});
    REQUIRE(entries[2].details == "details");
    REQUIRE(entries[2].level == TraceLevel::Warn);

    setupLog.clear();
    REQUIRE(setupLog.count() == 0);
}
