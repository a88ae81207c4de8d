// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Startable.hpp
 * @brief Lifecycle state machine shared by managers and log writers
 *
 * STATES:
 *
 *   Unstarted --start()--> Starting --ok--> Started --stop()--> Stopping --> Stopped
 *                             |                                               |
 *                             +--throws--> FailedToStart                      |
 *                                                                             |
 *   any state --dispose()--> Disposed (terminal)  <------- start() again -----+
 *
 * - start() on a Started object restarts it (stop, then start).
 * - ensureStarted() only starts an object that is not Started.
 * - stop() is idempotent and is a no-op unless the object is Started, Starting or FailedToStart.
 * - dispose() stops, releases resources, and makes any further start() throw.
 *
 * THREAD SAFETY:
 * - Transitions are serialized by an internal mutex; onStart()/onStop()/onDispose() run under it.
 * - state() and isStarted() are lock-free reads.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    enum class StartableState : std::uint8_t
    {
        Unstarted,
        Starting,
        Started,
        Stopping,
        Stopped,
        FailedToStart,
        Disposed
    };

    [[nodiscard]]
    TRACEMUX_EXPORT std::string_view toString(StartableState state) noexcept;

    class TRACEMUX_EXPORT Startable
    {
    public:
        Startable(Startable const&) = delete;
        Startable& operator=(Startable const&) = delete;

        virtual ~Startable();

        /**
         * Start, or restart if already started.
         * @throws Exception (Status::StateError) if disposed.
         * @throws whatever onStart() throws; the state is then FailedToStart.
         */
        void start();

        /** Start unless already started. */
        void ensureStarted();

        void stop();

        /**
         * Stop and release resources. Further start() calls throw. Idempotent.
         */
        void dispose();

        [[nodiscard]]
        bool isStarted() const noexcept;

        [[nodiscard]]
        bool isDisposed() const noexcept;

        [[nodiscard]]
        StartableState state() const noexcept;

    protected:
        Startable() noexcept;

        virtual void onStart();
        virtual void onStop();
        virtual void onDispose();

    private:
        void startLocked();
        void stopLocked();

        std::mutex _lifecycleMutex;
        std::atomic<StartableState> _state;
    };
}
