// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception type raised by the tracemux library
 *
 * ERROR HANDLING STRATEGY:
 * - Configuration and lookup errors are reported to the caller with tracemux::lib::Exception
 * - Faults raised by sinks (building, starting or writing) never reach the caller of a
 *   log call; they are caught at the closest boundary and reported to the SetupLog
 * - The Status carried by the exception identifies the category of the error
 *
 * USAGE PATTERN:
 * ```cpp
 * throw Exception::notFound("Log writer config {} is not registered.", config);
 * ```
 */

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    /**
     * @brief Category of a tracemux error.
     */
    enum class Status
    {
        ConfigurationError, ///< Duplicate or invalid descriptor, malformed options
        BuildFailure,       ///< Exception while constructing a writer or running its pipeline
        WriteFailure,       ///< Exception while delivering a single entry
        StateError,         ///< Operation invalid for the current lifecycle state
        NotFound,           ///< Lookup of an unknown key (caller error)
    };

    /**
     * @brief Return a short human readable name for a status value.
     */
    [[nodiscard]]
    TRACEMUX_EXPORT std::string_view toString(Status status) noexcept;

    /**
     * @class Exception
     * @brief The single exception type thrown by the library
     *
     * The class provides factory methods for creating specific error types:
     * - configuration() for Status::ConfigurationError
     * - buildFailure() for Status::BuildFailure
     * - writeFailure() for Status::WriteFailure
     * - invalidState() for Status::StateError
     * - notFound() for Status::NotFound
     *
     * These factory methods use fmt::format for type-safe, printf-style formatting.
     */
    class TRACEMUX_EXPORT Exception : public std::exception
    {
    public:
        Exception(std::string msg, Status status);

        /** \brief Make any type of exception.
         */
        template<typename... T>
        static Exception make(Status status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make a Status::ConfigurationError exception.
         */
        template<typename... T>
        static Exception configuration(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::ConfigurationError, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a Status::BuildFailure exception.
         */
        template<typename... T>
        static Exception buildFailure(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::BuildFailure, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a Status::WriteFailure exception.
         */
        template<typename... T>
        static Exception writeFailure(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::WriteFailure, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a Status::StateError exception.
         */
        template<typename... T>
        static Exception invalidState(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::StateError, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a Status::NotFound exception.
         */
        template<typename... T>
        static Exception notFound(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(Status::NotFound, fmt, std::forward<T>(args)...);
        }

        /** \brief Return the status code that describes the condition that led to the exception being thrown.
         */
        [[nodiscard]]
        Status status() const noexcept;

        /** \brief Implements std::exception, returns a descriptive string about the error.
         */
        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        Status _status;
    };

    /**
     * \brief Describe the exception currently being handled.
     *
     * Must be called from inside a catch block. Used to turn any caught exception into the
     * detail text of a diagnostic entry.
     */
    [[nodiscard]]
    TRACEMUX_EXPORT std::string describeCurrentException();
}
