// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Startable.cpp
 * @brief Implementation of the shared lifecycle state machine
 */

#include "tracemux/Startable.hpp"
#include "tracemux/Exception.hpp"

namespace tracemux::lib
{
    std::string_view toString(StartableState state) noexcept
    {
        switch (state)
        {
            case StartableState::Unstarted:     return "Unstarted";
            case StartableState::Starting:      return "Starting";
            case StartableState::Started:       return "Started";
            case StartableState::Stopping:      return "Stopping";
            case StartableState::Stopped:       return "Stopped";
            case StartableState::FailedToStart: return "FailedToStart";
            case StartableState::Disposed:      return "Disposed";
        }
        return "Unknown";
    }

    Startable::Startable() noexcept
        : _lifecycleMutex{}
        , _state{StartableState::Unstarted}
    {}

    Startable::~Startable() = default;

    void Startable::start()
    {
        auto lock = std::lock_guard{_lifecycleMutex};
        if (_state.load() == StartableState::Started)
        {
            stopLocked();
        }
        startLocked();
    }

    void Startable::ensureStarted()
    {
        if (isStarted())
        {
            return;
        }

        auto lock = std::lock_guard{_lifecycleMutex};
        // Another thread may have won the race for the lock
        if (_state.load() != StartableState::Started)
        {
            startLocked();
        }
    }

    void Startable::stop()
    {
        auto lock = std::lock_guard{_lifecycleMutex};
        stopLocked();
    }

    void Startable::dispose()
    {
        auto lock = std::lock_guard{_lifecycleMutex};
        if (_state.load() == StartableState::Disposed)
        {
            return;
        }
        stopLocked();
        onDispose();
        _state = StartableState::Disposed;
    }

    bool Startable::isStarted() const noexcept
    {
        return _state.load() == StartableState::Started;
    }

    bool Startable::isDisposed() const noexcept
    {
        return _state.load() == StartableState::Disposed;
    }

    StartableState Startable::state() const noexcept
    {
        return _state.load();
    }

    void Startable::onStart()
    {}

    void Startable::onStop()
    {}

    void Startable::onDispose()
    {}

    void Startable::startLocked()
    {
        if (_state.load() == StartableState::Disposed)
        {
            throw Exception::invalidState("Cannot start an object that has been disposed.");
        }

        _state = StartableState::Starting;
        try
        {
            onStart();
        }
        catch (...)
        {
            _state = StartableState::FailedToStart;
            throw;
        }
        _state = StartableState::Started;
    }

    void Startable::stopLocked()
    {
        switch (_state.load())
        {
            case StartableState::Starting:
            case StartableState::Started:
            case StartableState::FailedToStart:
                break;
            default:
                return;
        }

        _state = StartableState::Stopping;
        try
        {
            onStop();
        }
        catch (...)
        {
            _state = StartableState::Stopped;
            throw;
        }
        _state = StartableState::Stopped;
    }
}
