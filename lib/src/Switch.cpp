// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Switch.cpp
 * @brief Implementation of the built-in switch variants
 *
 * The mutable switches store their state in atomics with relaxed ordering: a trace call
 * only needs to observe *some* recent value, and no other memory is published through them.
 */

#include "tracemux/Switch.hpp"
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    Switch::~Switch() = default;

    ThresholdSwitch::ThresholdSwitch(TraceLevel threshold) noexcept
        : _threshold{threshold}
    {}

    bool ThresholdSwitch::isEnabled(TraceLevel level) const noexcept
    {
        auto const threshold = _threshold.load(std::memory_order_relaxed);
        return (threshold != TraceLevel::Off) && (level >= threshold);
    }

    TraceLevel ThresholdSwitch::threshold() const noexcept
    {
        return _threshold.load(std::memory_order_relaxed);
    }

    void ThresholdSwitch::setThreshold(TraceLevel threshold) noexcept
    {
        _threshold.store(threshold, std::memory_order_relaxed);
    }

    OnOffSwitch::OnOffSwitch(bool enabled) noexcept
        : _enabled{enabled}
    {}

    bool OnOffSwitch::isEnabled(TraceLevel) const noexcept
    {
        return _enabled.load(std::memory_order_relaxed);
    }

    bool OnOffSwitch::enabled() const noexcept
    {
        return _enabled.load(std::memory_order_relaxed);
    }

    void OnOffSwitch::setEnabled(bool enabled) noexcept
    {
        _enabled.store(enabled, std::memory_order_relaxed);
    }

    PredicateSwitch::PredicateSwitch(Predicate predicate)
        : _predicate{std::move(predicate)}
    {
        if (!_predicate)
        {
            throw Exception::configuration("PredicateSwitch requires a predicate function.");
        }
    }

    bool PredicateSwitch::isEnabled(TraceLevel level) const
    {
        return _predicate(level);
    }
}
