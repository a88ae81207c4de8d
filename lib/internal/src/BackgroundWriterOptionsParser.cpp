// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file BackgroundWriterOptionsParser.cpp
 * @brief Parses background dispatch options from JSON
 *
 * Validation rules:
 * - queueCapacity, batchSize: whole number in [1, maxCount]
 * - enqueueTimeoutMs, drainTimeoutMs: whole number in [0, maxTimeoutMs]
 * - overflowPolicy: one of "block", "dropNewest", "dropOldest"
 */

#include "tracemux-internal/BackgroundWriterOptionsParser.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <picojson/picojson.h>
#include "tracemux/Exception.hpp"
#include "tracemux-internal/Logging.hpp"

namespace tracemux::lib
{
    namespace
    {
        /// Largest timeout that still fits steady_clock nanoseconds.
        constexpr auto maxTimeoutMs = std::numeric_limits<std::int64_t>::max() / 1'000'000;

        /// Largest queue capacity or batch size.
        constexpr auto maxCount = std::int64_t{1} << 24;

        std::int64_t readWholeNumber(picojson::object const& root, std::string const& field, std::int64_t minimum, std::int64_t maximum,
            std::int64_t fallback)
        {
            auto const it = root.find(field);
            if (it == root.end())
            {
                return fallback;
            }

            // Validate type
            if (!it->second.is<double>())
            {
                throw Exception::configuration("{} must be a number.", field);
            }

            // Validate range before converting, an out of range double has no integer value
            auto const v = it->second.get<double>();
            if (!std::isfinite(v) || (v < static_cast<double>(minimum)) || (v > static_cast<double>(maximum)))
            {
                throw Exception::configuration("{} must be between {} and {}.", field, minimum, maximum);
            }
            if (std::trunc(v) != v)
            {
                throw Exception::configuration("{} must be a whole number.", field);
            }
            return static_cast<std::int64_t>(v);
        }

        OverflowPolicy readPolicy(picojson::object const& root, OverflowPolicy fallback)
        {
            auto const it = root.find("overflowPolicy");
            if (it == root.end())
            {
                return fallback;
            }

            if (!it->second.is<std::string>())
            {
                throw Exception::configuration("overflowPolicy must be a string.");
            }

            auto const& name = it->second.get<std::string>();
            for (auto const policy : {OverflowPolicy::Block, OverflowPolicy::DropNewest, OverflowPolicy::DropOldest})
            {
                if (name == toString(policy))
                {
                    return policy;
                }
            }
            throw Exception::configuration("Unknown overflowPolicy '{}'. Expected block, dropNewest or dropOldest.", name);
        }
    }

    BackgroundWriterOptionsParser::BackgroundWriterOptionsParser(std::string const& in_options)
    {
        // Empty options string means use all defaults
        if (in_options.empty())
        {
            return;
        }

        //
        // Parse the JSON options string
        //
        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_options);
        if (!err.empty())
        {
            throw Exception::configuration("Invalid JSON options. {}", err);
        }

        // Confirm that the root is a JSON object (not array, string, etc.)
        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::configuration("Expected a JSON object for background writer options.");
        }
        auto const& root = jsonValue.get<picojson::object>();

        auto const defaults = BackgroundWriterOptions{};
        _options.queueCapacity = static_cast<std::size_t>(
            readWholeNumber(root, "queueCapacity", 1, maxCount, static_cast<std::int64_t>(defaults.queueCapacity)));
        _options.batchSize = static_cast<std::size_t>(readWholeNumber(root, "batchSize", 1, maxCount, static_cast<std::int64_t>(defaults.batchSize)));
        _options.enqueueTimeout = std::chrono::milliseconds{
            readWholeNumber(root, "enqueueTimeoutMs", 0, maxTimeoutMs, defaults.enqueueTimeout.count())};
        _options.drainTimeout = std::chrono::milliseconds{
            readWholeNumber(root, "drainTimeoutMs", 0, maxTimeoutMs, defaults.drainTimeout.count())};
        _options.overflowPolicy = readPolicy(root, defaults.overflowPolicy);

        TRACEMUX_DEBUG("Background writer options: capacity={} policy={} enqueueTimeout={}ms drainTimeout={}ms batch={}",
            _options.queueCapacity,
            toString(_options.overflowPolicy),
            _options.enqueueTimeout.count(),
            _options.drainTimeout.count(),
            _options.batchSize);
    }

    BackgroundWriterOptions const& BackgroundWriterOptionsParser::getOptions() const noexcept
    {
        return _options;
    }

    BackgroundWriterOptions parseBackgroundWriterOptions(std::string const& json)
    {
        return BackgroundWriterOptionsParser{json}.getOptions();
    }
}
