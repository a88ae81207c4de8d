// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file BackgroundWriterOptionsParser.hpp
 * @brief Parse background dispatch options from JSON
 *
 * Example options JSON:
 * {
 *   "queueCapacity": 4096,          // Entries buffered per proxy before the overflow policy applies
 *   "overflowPolicy": "dropOldest", // "block", "dropNewest" or "dropOldest"
 *   "enqueueTimeoutMs": 20,         // Producer wait under "block"
 *   "drainTimeoutMs": 2000,         // Shutdown drain budget
 *   "batchSize": 128                // Entries written per proxy per consumer turn
 * }
 *
 * Every field is optional; a missing field keeps the BackgroundWriterOptions default.
 * Unknown fields are ignored. Numbers must be whole; timeouts are capped at
 * INT64_MAX / 1'000'000 ms and counts at 2^24.
 */

#pragma once

#include <string>
#include <tracemux/BackgroundMultiLogWriter.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    /**
     * Thread-safety: Immutable after construction (thread-safe for reads).
     */
    class TRACEMUX_EXPORT BackgroundWriterOptionsParser
    {
    public:
        /** No options: every value is the default. */
        BackgroundWriterOptionsParser() = default;

        /**
         * Parse a JSON string of options. An empty string means defaults.
         *
         * @param in_options JSON object
         * @throws Exception (Status::ConfigurationError) if the JSON is malformed, a field has the
         *         wrong type, or a value is out of range.
         */
        explicit BackgroundWriterOptionsParser(std::string const& in_options);

        [[nodiscard]]
        BackgroundWriterOptions const& getOptions() const noexcept;

    private:
        BackgroundWriterOptions _options;
    };

    /** Shorthand for BackgroundWriterOptionsParser{json}.getOptions(). */
    [[nodiscard]]
    TRACEMUX_EXPORT BackgroundWriterOptions parseBackgroundWriterOptions(std::string const& json);
}
