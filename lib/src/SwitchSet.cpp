// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SwitchSet.cpp
 * @brief Longest-prefix resolution of switches by tracer name
 */

#include "tracemux/SwitchSet.hpp"
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    namespace
    {
        constexpr char separator = '.';

        constexpr bool isSpace(char c) noexcept
        {
            return (c == ' ') || (c == '\t') || (c == '\n') || (c == '\r') || (c == '\f') || (c == '\v');
        }
    }

    std::string normalizeTracerName(std::string_view name)
    {
        auto begin = std::size_t{0};
        auto end = name.size();
        while ((begin < end) && isSpace(name[begin]))
        {
            ++begin;
        }
        while ((end > begin) && isSpace(name[end - 1]))
        {
            --end;
        }
        return std::string{name.substr(begin, end - begin)};
    }

    bool prefixMatches(std::string_view prefix, std::string_view name) noexcept
    {
        if (prefix.empty())
        {
            return true;
        }

        if (prefix.back() == separator)
        {
            // "App." selects "App" itself and everything below it
            auto const stem = prefix.substr(0, prefix.size() - 1);
            return (name == stem) || name.starts_with(prefix);
        }

        if (!name.starts_with(prefix))
        {
            return false;
        }
        // Exact match, or the prefix ends on a segment boundary ("App" must not select "Application")
        return (name.size() == prefix.size()) || (name[prefix.size()] == separator);
    }

    SwitchSet::SwitchSet(std::initializer_list<Entry> entries)
    {
        for (auto const& [prefix, sw] : entries)
        {
            add(prefix, sw);
        }
    }

    void SwitchSet::add(std::string_view prefix, std::shared_ptr<Switch> sw)
    {
        if (!sw)
        {
            throw Exception::configuration("Null switch registered for tracer name prefix '{}'.", prefix);
        }
        _entries.emplace_back(normalizeTracerName(prefix), std::move(sw));
    }

    std::pair<bool, std::shared_ptr<Switch>> SwitchSet::findBestMatch(std::string_view name) const
    {
        Entry const* best = nullptr;
        for (auto const& entry : _entries)
        {
            if (!prefixMatches(entry.first, name))
            {
                continue;
            }
            // Strictly longer only: on equal length the earlier registration is kept
            if ((best == nullptr) || (entry.first.size() > best->first.size()))
            {
                best = &entry;
            }
        }

        if (best == nullptr)
        {
            return {false, nullptr};
        }
        return {true, best->second};
    }

    std::vector<SwitchSet::Entry> const& SwitchSet::entries() const noexcept
    {
        return _entries;
    }

    std::size_t SwitchSet::size() const noexcept
    {
        return _entries.size();
    }

    bool SwitchSet::empty() const noexcept
    {
        return _entries.empty();
    }
}
