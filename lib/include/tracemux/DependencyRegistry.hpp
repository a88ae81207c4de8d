// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file DependencyRegistry.hpp
 * @brief Typed instance store scoped to the construction of one log writer pipeline
 *
 * While the LogManager builds a writer it seeds a fresh registry with the SetupLog, the
 * LogManager, the descriptor and the base writer. Pipeline initializers add what they create
 * (a background proxy, a synchronizing wrapper). Once every pipeline stage ran the registry is
 * sealed, and import initializers read from it to wire instances created by different stages
 * together.
 *
 * KEYS: instances are keyed by std::type_index. A writer is registered both under the LogWriter
 * key (first one wins) and under its dynamic type, so that
 *
 *   registry.get<LogWriter>()                 is the base writer
 *   registry.findLogWriter<BufferingLogWriter>() finds the most recent stage with that capability
 *
 * LIFETIME: one registry per pipeline build; it is discarded when the build completes.
 * THREAD SAFETY: none required, a build runs on a single thread.
 */

#pragma once

#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include <tracemux/Exception.hpp>
#include <tracemux/LogWriter.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class TRACEMUX_EXPORT DependencyRegistry
    {
    public:
        DependencyRegistry() = default;

        DependencyRegistry(DependencyRegistry const&) = delete;
        DependencyRegistry& operator=(DependencyRegistry const&) = delete;

        /**
         * Register an instance under the key T, replacing any previous one.
         * @throws Exception (Status::StateError) once the registry is sealed.
         */
        template<typename T>
        void add(std::shared_ptr<T> instance)
        {
            addUntyped(typeid(T), toVoid(std::move(instance)), true);
        }

        /**
         * Register an instance under the key T unless the key is already defined.
         * @return true if the instance was registered.
         * @throws Exception (Status::StateError) once the registry is sealed.
         */
        template<typename T>
        bool addIfNotDefined(std::shared_ptr<T> instance)
        {
            return addUntyped(typeid(T), toVoid(std::move(instance)), false);
        }

        /**
         * Register a writer produced by a pipeline stage: under LogWriter if not yet defined, and
         * under its dynamic type if not yet defined.
         * @throws Exception (Status::StateError) once the registry is sealed.
         */
        void addLogWriter(std::shared_ptr<LogWriter> const& writer);

        template<typename T>
        [[nodiscard]]
        bool isDefined() const
        {
            return _instances.contains(typeid(T));
        }

        /**
         * @return the instance registered under T.
         * @throws Exception (Status::NotFound) if no instance is registered under T.
         */
        template<typename T>
        [[nodiscard]]
        std::shared_ptr<T> get() const
        {
            if (auto instance = tryGet<T>(); instance)
            {
                return instance;
            }
            throw Exception::notFound("No dependency registered for type {}.", typeid(T).name());
        }

        /** @return the instance registered under T, or null. */
        template<typename T>
        [[nodiscard]]
        std::shared_ptr<T> tryGet() const
        {
            auto const it = _instances.find(typeid(T));
            if (it == _instances.end())
            {
                return nullptr;
            }
            return std::static_pointer_cast<T>(it->second);
        }

        /**
         * Find the most recently registered pipeline writer that is-a T. T may be a capability
         * interface such as BufferingLogWriter.
         * @return null if no registered writer converts to T.
         */
        template<typename T>
        [[nodiscard]]
        std::shared_ptr<T> findLogWriter() const
        {
            for (auto it = _logWriters.rbegin(); it != _logWriters.rend(); ++it)
            {
                if (auto match = std::dynamic_pointer_cast<T>(*it); match)
                {
                    return match;
                }
            }
            return nullptr;
        }

        /** Pipeline writers in registration order. */
        [[nodiscard]]
        std::vector<std::shared_ptr<LogWriter>> const& logWriters() const noexcept;

        /** Forbid further registrations. */
        void seal() noexcept;

        [[nodiscard]]
        bool isSealed() const noexcept;

    private:
        template<typename T>
        static std::shared_ptr<void> toVoid(std::shared_ptr<T> instance)
        {
            return std::static_pointer_cast<void>(std::const_pointer_cast<std::remove_cv_t<T>>(std::move(instance)));
        }

        bool addUntyped(std::type_index key, std::shared_ptr<void> instance, bool replace);
        void throwIfSealed() const;

        std::unordered_map<std::type_index, std::shared_ptr<void>> _instances;
        std::vector<std::shared_ptr<LogWriter>> _logWriters;
        bool _sealed = false;
    };
}
