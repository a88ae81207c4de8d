// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/TraceLevel.hpp"

namespace tracemux::lib
{
    std::string_view toString(TraceLevel level) noexcept
    {
        switch (level)
        {
            case TraceLevel::Debug:   return "Debug";
            case TraceLevel::Verbose: return "Verbose";
            case TraceLevel::Info:    return "Info";
            case TraceLevel::Warn:    return "Warn";
            case TraceLevel::Error:   return "Error";
            case TraceLevel::Severe:  return "Severe";
            case TraceLevel::Off:     return "Off";
        }
        return "Unknown";
    }
}
