// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TraceLevel.hpp
 * @brief Severity levels of trace calls
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <fmt/format.h>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    /**
     * Ordered severity of a trace call, from least to most severe.
     *
     * TraceLevel::Off is never the level of an entry. It is only meaningful as the threshold
     * of a ThresholdSwitch, where it disables every level.
     */
    enum class TraceLevel : std::uint8_t
    {
        Debug,
        Verbose,
        Info,
        Warn,
        Error,
        Severe,
        Off
    };

    [[nodiscard]]
    TRACEMUX_EXPORT std::string_view toString(TraceLevel level) noexcept;
}

template<>
struct fmt::formatter<tracemux::lib::TraceLevel> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(tracemux::lib::TraceLevel level, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(tracemux::lib::toString(level), ctx);
    }
};
