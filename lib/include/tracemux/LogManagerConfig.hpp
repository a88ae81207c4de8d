// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file LogManagerConfig.hpp
 * @brief Ordered, deduplicated set of log writer descriptors plus manager-wide initializers
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <vector>
#include <tracemux/LogWriterConfig.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT LogManagerConfig
    {
    public:
        LogManagerConfig() = default;

        /**
         * Add each descriptor in order. Equal descriptors are kept once.
         * @throws Exception (Status::ConfigurationError) if a descriptor is null.
         */
        LogManagerConfig(std::initializer_list<std::shared_ptr<LogWriterConfig const>> writers);

        /**
         * Add a descriptor unless an equal one is already configured.
         * @return false if an equal descriptor was already present (the call is a no-op).
         * @throws Exception (Status::ConfigurationError) if the descriptor is null.
         */
        bool addWriter(std::shared_ptr<LogWriterConfig const> writer);

        [[nodiscard]]
        bool containsWriter(LogWriterConfig const& writer) const;

        /** Descriptors in configuration order. */
        [[nodiscard]]
        std::vector<std::shared_ptr<LogWriterConfig const>> const& writers() const noexcept;

        /**
         * Append an initializer run for every descriptor, after the descriptor's own initializers.
         * @throws Exception (Status::ConfigurationError) if the initializer is null.
         */
        LogManagerConfig& addInitializer(std::shared_ptr<LogWriterInitializer> initializer);

        [[nodiscard]]
        std::vector<std::shared_ptr<LogWriterInitializer>> const& initializers() const noexcept;

        [[nodiscard]]
        std::size_t size() const noexcept;

        [[nodiscard]]
        bool empty() const noexcept;

    private:
        std::vector<std::shared_ptr<LogWriterConfig const>> _writers;
        std::vector<std::shared_ptr<LogWriterInitializer>> _initializers;
    };
}
