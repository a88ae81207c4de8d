// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_options_parser.cpp
 * @brief Tests for the JSON options of the background dispatcher
 */

#include <chrono>
#include <string>
#include <catch2/catch_test_macros.hpp>
#include <tracemux/Exception.hpp>
#include "tracemux-internal/BackgroundWriterOptionsParser.hpp"

using namespace tracemux::lib;
using namespace std::chrono_literals;

namespace
{
    Status parseStatus(std::string const& json)
    {
        try
        {
            (void)parseBackgroundWriterOptions(json);
        }
        catch (Exception const& e)
        {
            return e.status();
        }
        return Status::NotFound;
    }
}

TEST_CASE("Empty options are the defaults", "[options]")
{
    REQUIRE(parseBackgroundWriterOptions("") == BackgroundWriterOptions{});
    REQUIRE(parseBackgroundWriterOptions("{}") == BackgroundWriterOptions{});
    REQUIRE(BackgroundWriterOptionsParser{}.getOptions() == BackgroundWriterOptions{});

    auto const defaults = BackgroundWriterOptions{};
    REQUIRE(defaults.queueCapacity == 1024);
    REQUIRE(defaults.overflowPolicy == OverflowPolicy::Block);
    REQUIRE(defaults.enqueueTimeout == 100ms);
    REQUIRE(defaults.drainTimeout == 5000ms);
    REQUIRE(defaults.batchSize == 64);
}

TEST_CASE("Every field is read", "[options]")
{
    auto const parser = BackgroundWriterOptionsParser{R"({
        "queueCapacity": 16,
        "overflowPolicy": "dropOldest",
        "enqueueTimeoutMs": 0,
        "drainTimeoutMs": 250,
        "batchSize": 4,
        "comment": "ignored"
    })"};

    auto const& options = parser.getOptions();
    REQUIRE(options.queueCapacity == 16);
    REQUIRE(options.overflowPolicy == OverflowPolicy::DropOldest);
    REQUIRE(options.enqueueTimeout == 0ms);
    REQUIRE(options.drainTimeout == 250ms);
    REQUIRE(options.batchSize == 4);

    REQUIRE(parseBackgroundWriterOptions(R"({"overflowPolicy": "dropNewest"})").overflowPolicy == OverflowPolicy::DropNewest);
    REQUIRE(parseBackgroundWriterOptions(R"({"overflowPolicy": "block"})").overflowPolicy == OverflowPolicy::Block);
}

TEST_CASE("Malformed options are configuration errors", "[options]")
{
    // Not JSON
    REQUIRE(parseStatus("{queueCapacity: 1") == Status::ConfigurationError);

    // Not an object
    REQUIRE(parseStatus("[1, 2]") == Status::ConfigurationError);
    REQUIRE(parseStatus("\"block\"") == Status::ConfigurationError);

    // Wrong types
    REQUIRE(parseStatus(R"({"queueCapacity": "large"})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"overflowPolicy": 1})") == Status::ConfigurationError);

    // Out of range
    REQUIRE(parseStatus(R"({"queueCapacity": 0})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"batchSize": 0})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"enqueueTimeoutMs": -1})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"drainTimeoutMs": -5})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"queueCapacity": 1e30})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"batchSize": 16777217})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"drainTimeoutMs": 1e13})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"enqueueTimeoutMs": 1e19})") == Status::ConfigurationError);

    // Fractions
    REQUIRE(parseStatus(R"({"batchSize": 1.5})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"drainTimeoutMs": 0.25})") == Status::ConfigurationError);

    // Unknown policy names, which are case sensitive
    REQUIRE(parseStatus(R"({"overflowPolicy": "dropAll"})") == Status::ConfigurationError);
    REQUIRE(parseStatus(R"({"overflowPolicy": "Block"})") == Status::ConfigurationError);
}

TEST_CASE("Largest accepted values", "[options]")
{
    auto const options = parseBackgroundWriterOptions(R"({
        "queueCapacity": 16777216,
        "batchSize": 16777216,
        "enqueueTimeoutMs": 9223372036854,
        "drainTimeoutMs": 9223372036854
    })");
    REQUIRE(options.queueCapacity == 16'777'216);
    REQUIRE(options.batchSize == 16'777'216);
    REQUIRE(options.enqueueTimeout == 9'223'372'036'854ms);
    REQUIRE(options.drainTimeout == 9'223'372'036'854ms);

    // Whole numbers written with an exponent
    REQUIRE(parseBackgroundWriterOptions(R"({"queueCapacity": 1e3})").queueCapacity == 1000);
}

TEST_CASE("Overflow policy names", "[options]")
{
    REQUIRE(toString(OverflowPolicy::Block) == "block");
    REQUIRE(toString(OverflowPolicy::DropNewest) == "dropNewest");
    REQUIRE(toString(OverflowPolicy::DropOldest) == "dropOldest");
}
