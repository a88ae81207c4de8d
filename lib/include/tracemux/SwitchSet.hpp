// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SwitchSet.hpp
 * @brief Ordered mapping from tracer name prefix to Switch
 *
 * Tracer names are dot-segmented hierarchical identifiers ("App.Net.Socket"). A SwitchSet
 * decides which Switch applies to a name by longest prefix match:
 *
 *   prefix ""          matches every name (catch-all default)
 *   prefix "App"       matches "App", "App.Net", "App.Net.Socket"; not "Application"
 *   prefix "App."      same as "App", written with the separator
 *
 * The longest matching prefix wins. Two registrations of the same prefix resolve to the
 * first one registered; the set is backed by a vector so the outcome never depends on hash
 * or tree iteration order.
 *
 * THREAD SAFETY:
 * - A SwitchSet is built during configuration and read while a manager starts.
 * - It is not synchronized; do not add switches while a manager using it is (re)starting.
 * - The Switch instances themselves are shared and may be mutated at any time.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <tracemux/Switch.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT SwitchSet
    {
    public:
        using Entry = std::pair<std::string, std::shared_ptr<Switch>>;

        SwitchSet() = default;

        /**
         * Build from a list of (prefix, switch) pairs, in registration order.
         * @throws Exception (Status::ConfigurationError) if a switch is null.
         */
        SwitchSet(std::initializer_list<Entry> entries);

        /**
         * Register a switch for a name prefix. The prefix is trimmed like a tracer name.
         * @throws Exception (Status::ConfigurationError) if the switch is null.
         */
        void add(std::string_view prefix, std::shared_ptr<Switch> sw);

        /**
         * Find the switch of the longest registered prefix matching the name.
         *
         * @param name A normalized tracer name.
         * @return (found, switch). When found is false the switch is null, and the SwitchSet
         *         disables logging for that name.
         */
        [[nodiscard]]
        std::pair<bool, std::shared_ptr<Switch>> findBestMatch(std::string_view name) const;

        [[nodiscard]]
        std::vector<Entry> const& entries() const noexcept;

        [[nodiscard]]
        std::size_t size() const noexcept;

        [[nodiscard]]
        bool empty() const noexcept;

    private:
        std::vector<Entry> _entries;
    };

    /**
     * Returns true if the prefix selects the tracer name (see file comment for the rules).
     */
    [[nodiscard]]
    TRACEMUX_EXPORT bool prefixMatches(std::string_view prefix, std::string_view name) noexcept;

    /**
     * Normalize a tracer name or prefix: strip leading and trailing whitespace.
     * The empty string is the root name.
     */
    [[nodiscard]]
    TRACEMUX_EXPORT std::string normalizeTracerName(std::string_view name);
}
