// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Switch.hpp
 * @brief Predicates deciding whether a severity level is active
 *
 * A Switch is consulted on every trace call, so isEnabled() must be cheap and thread-safe.
 * ThresholdSwitch and OnOffSwitch can be changed at runtime; the change is picked up by the
 * next trace call of every Tracer bound to the switch, without re-acquiring the Tracer.
 *
 *   Switch (abstract)
 *     +-- ThresholdSwitch  enabled when level >= threshold
 *     +-- OnOffSwitch      enabled for every level, or for none
 *     +-- PredicateSwitch  enabled when a user supplied function says so
 */

#pragma once

#include <atomic>
#include <functional>
#include <tracemux/TraceLevel.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT Switch
    {
    public:
        virtual ~Switch();

        /**
         * @param level Level of the trace call. Never TraceLevel::Off.
         * @return true if a call at this level should be written.
         * Implementations may throw; the Tracer reports the exception and skips the writer.
         */
        [[nodiscard]]
        virtual bool isEnabled(TraceLevel level) const = 0;
    };

    /**
     * Enables every level at or above a threshold.
     * A threshold of TraceLevel::Off disables everything.
     */
    class TRACEMUX_EXPORT ThresholdSwitch final : public Switch
    {
    public:
        explicit ThresholdSwitch(TraceLevel threshold = TraceLevel::Info) noexcept;

        [[nodiscard]]
        bool isEnabled(TraceLevel level) const noexcept override;

        [[nodiscard]]
        TraceLevel threshold() const noexcept;

        /** Takes effect on the next trace call. */
        void setThreshold(TraceLevel threshold) noexcept;

    private:
        std::atomic<TraceLevel> _threshold;
    };

    /**
     * Enables all levels or none.
     */
    class TRACEMUX_EXPORT OnOffSwitch final : public Switch
    {
    public:
        explicit OnOffSwitch(bool enabled) noexcept;

        [[nodiscard]]
        bool isEnabled(TraceLevel level) const noexcept override;

        [[nodiscard]]
        bool enabled() const noexcept;

        /** Takes effect on the next trace call. */
        void setEnabled(bool enabled) noexcept;

    private:
        std::atomic<bool> _enabled;
    };

    /**
     * Delegates the decision to a function.
     *
     * The function is called from any thread that traces. If it throws, the exception is
     * reported by the Tracer and the call is not written to the writer guarded by this switch.
     */
    class TRACEMUX_EXPORT PredicateSwitch final : public Switch
    {
    public:
        using Predicate = std::function<bool(TraceLevel)>;

        /**
         * @throws Exception (Status::ConfigurationError) if the predicate is empty.
         */
        explicit PredicateSwitch(Predicate predicate);

        [[nodiscard]]
        bool isEnabled(TraceLevel level) const override;

    private:
        Predicate _predicate;
    };
}
