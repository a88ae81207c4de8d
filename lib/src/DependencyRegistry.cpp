// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/DependencyRegistry.hpp"
#include <algorithm>

namespace tracemux::lib
{
    void DependencyRegistry::addLogWriter(std::shared_ptr<LogWriter> const& writer)
    {
        throwIfSealed();
        if (!writer)
        {
            throw Exception::configuration("A null log writer cannot be registered.");
        }

        addIfNotDefined<LogWriter>(writer);

        // Keyed by the most derived type. The aliasing constructor keeps ownership on the
        // writer while pointing at the most derived object, as static_pointer_cast<T> expects.
        auto& writerRef = *writer;
        auto mostDerived = std::shared_ptr<void>{writer, dynamic_cast<void*>(writer.get())};
        addUntyped(typeid(writerRef), std::move(mostDerived), false);

        if (std::find(_logWriters.begin(), _logWriters.end(), writer) == _logWriters.end())
        {
            _logWriters.push_back(writer);
        }
    }

    std::vector<std::shared_ptr<LogWriter>> const& DependencyRegistry::logWriters() const noexcept
    {
        return _logWriters;
    }

    void DependencyRegistry::seal() noexcept
    {
        _sealed = true;
    }

    bool DependencyRegistry::isSealed() const noexcept
    {
        return _sealed;
    }

    bool DependencyRegistry::addUntyped(std::type_index key, std::shared_ptr<void> instance, bool replace)
    {
        throwIfSealed();
        if (replace)
        {
            _instances.insert_or_assign(key, std::move(instance));
            return true;
        }
        return _instances.try_emplace(key, std::move(instance)).second;
    }

    void DependencyRegistry::throwIfSealed() const
    {
        if (_sealed)
        {
            throw Exception::invalidState("The dependency registry is sealed; no more instances can be added.");
        }
    }
}
