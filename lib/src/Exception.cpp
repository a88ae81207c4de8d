// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.cpp
 * @brief Implementation of the tracemux exception type
 */

#include "tracemux/Exception.hpp"
#include <typeinfo>

namespace tracemux::lib
{
    std::string_view toString(Status status) noexcept
    {
        switch (status)
        {
            case Status::ConfigurationError: return "ConfigurationError";
            case Status::BuildFailure:       return "BuildFailure";
            case Status::WriteFailure:       return "WriteFailure";
            case Status::StateError:         return "StateError";
            case Status::NotFound:           return "NotFound";
        }
        return "Unknown";
    }

    // Construct Exception with message and status code
    Exception::Exception(std::string msg, Status status)
        : _msg(std::move(msg))
        , _status(status)
    {}

    Status Exception::status() const noexcept
    {
        return _status;
    }

    // Implement std::exception::what() - return error message
    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }

    std::string describeCurrentException()
    {
        try
        {
            throw;
        }
        catch (Exception const& e)
        {
            return fmt::format("{}: {}", toString(e.status()), e.what());
        }
        catch (std::exception const& e)
        {
            return fmt::format("{}: {}", typeid(e).name(), e.what());
        }
        catch (...)
        {
            // Not derived from std::exception, nothing more can be said about it.
            return "unknown exception";
        }
    }
}
