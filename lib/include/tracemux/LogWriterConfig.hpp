// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file LogWriterConfig.hpp
 * @brief Declarative descriptor of a log writer and its construction pipeline
 *
 * A LogWriterConfig is a value: two descriptors that compare equal describe the same sink,
 * and a manager builds at most one runtime writer for them. Subclasses define equality and
 * hashing over their own fields. operator== only calls equals() on descriptors of the same
 * dynamic type.
 *
 * PIPELINE:
 *
 *   createLogWriter(setupLog)              base writer (may be null or throw)
 *        |
 *        v
 *   PipelineInitializer #1 .. #n           each may wrap or replace the writer
 *        |                                 (descriptor initializers, then manager-wide ones)
 *        v
 *   DependencyRegistry::seal()
 *        |
 *        v
 *   ImportInitializer #1 .. #n             wire instances registered by earlier stages
 *        |
 *        v
 *   final writer, stored by the LogManager under the descriptor
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>
#include <tracemux/LogWriter.hpp>
#include <tracemux/platform.hpp>

namespace tracemux::lib
{
    class DependencyRegistry;
    class SetupLog;

    /**
     * Common base of every pipeline stage. A stage implements PipelineInitializer,
     * ImportInitializer, or both.
     */
    class TRACEMUX_EXPORT LogWriterInitializer
    {
    public:
        typedef std::shared_ptr<LogWriterInitializer> ptr;

        virtual ~LogWriterInitializer();
    };

    class TRACEMUX_EXPORT PipelineInitializer : public virtual LogWriterInitializer
    {
    public:
        /**
         * Transform the writer built so far.
         *
         * @param setupLog Destination of diagnostics.
         * @param writer Output of the previous stage. Never null.
         * @param registry Open (unsealed) registry of this build.
         * @return The writer handed to the next stage. Returning the input unchanged is valid.
         */
        [[nodiscard]]
        virtual std::shared_ptr<LogWriter> initializeLogWriter(SetupLog& setupLog, std::shared_ptr<LogWriter> writer,
            DependencyRegistry& registry) = 0;
    };

    class TRACEMUX_EXPORT ImportInitializer : public virtual LogWriterInitializer
    {
    public:
        /**
         * Called once every pipeline stage ran, with the sealed registry of the build.
         */
        virtual void importDependencies(SetupLog& setupLog, DependencyRegistry& registry) = 0;
    };

    class TRACEMUX_EXPORT LogWriterConfig
    {
    public:
        typedef std::shared_ptr<LogWriterConfig const> ptr;

        virtual ~LogWriterConfig();

        /**
         * Create the base writer. May return null or throw; the LogManager reports both and keeps
         * the descriptor with no writer.
         */
        [[nodiscard]]
        virtual std::shared_ptr<LogWriter> createLogWriter(SetupLog& setupLog) const = 0;

        /**
         * Structural equality. Only called with a descriptor of the same dynamic type.
         */
        [[nodiscard]]
        virtual bool equals(LogWriterConfig const& other) const = 0;

        /** Hash consistent with equals(). */
        [[nodiscard]]
        virtual std::size_t hash() const = 0;

        /** Short human readable description used in diagnostics. */
        [[nodiscard]]
        virtual std::string describe() const;

        /** true if the runtime writer is disposed when the manager stops. Defaults to false. */
        [[nodiscard]]
        bool disposeOnStop() const noexcept;

        void setDisposeOnStop(bool disposeOnStop) noexcept;

        /** Ordered initializers run for this descriptor only. */
        [[nodiscard]]
        std::vector<std::shared_ptr<LogWriterInitializer>> const& initializers() const noexcept;

        /**
         * Append an initializer to this descriptor's pipeline.
         * @throws Exception (Status::ConfigurationError) if the initializer is null.
         */
        LogWriterConfig& addInitializer(std::shared_ptr<LogWriterInitializer> initializer);

    private:
        bool _disposeOnStop = false;
        std::vector<std::shared_ptr<LogWriterInitializer>> _initializers;
    };

    /** Same dynamic type and equals(). */
    [[nodiscard]]
    TRACEMUX_EXPORT bool operator==(LogWriterConfig const& lhs, LogWriterConfig const& rhs);

    /**
     * Descriptor of a writer constructed by the caller. Two such descriptors are equal when they
     * wrap the same writer instance.
     */
    class TRACEMUX_EXPORT UseExistingLogWriterConfig final : public LogWriterConfig
    {
    public:
        /**
         * @throws Exception (Status::ConfigurationError) if the writer is null.
         */
        explicit UseExistingLogWriterConfig(std::shared_ptr<LogWriter> logWriter);

        [[nodiscard]]
        std::shared_ptr<LogWriter> createLogWriter(SetupLog& setupLog) const override;

        [[nodiscard]]
        bool equals(LogWriterConfig const& other) const override;

        [[nodiscard]]
        std::size_t hash() const override;

        [[nodiscard]]
        std::string describe() const override;

        [[nodiscard]]
        std::shared_ptr<LogWriter> const& logWriter() const noexcept;

    private:
        std::shared_ptr<LogWriter> _logWriter;
    };
}

template<>
struct fmt::formatter<tracemux::lib::LogWriterConfig> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(tracemux::lib::LogWriterConfig const& config, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(config.describe(), ctx);
    }
};
