// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

#include "tracemux/Initializers.hpp"
#include <utility>
#include "tracemux/Exception.hpp"
#include "tracemux/LogManager.hpp"
#include "tracemux-internal/BackgroundWriterOptionsParser.hpp"

namespace tracemux::lib
{
    FunctionPipelineInitializer::FunctionPipelineInitializer(Function function)
        : _function{std::move(function)}
    {
        if (!_function)
        {
            throw Exception::configuration("FunctionPipelineInitializer requires a function.");
        }
    }

    std::shared_ptr<LogWriter> FunctionPipelineInitializer::initializeLogWriter(SetupLog& setupLog, std::shared_ptr<LogWriter> writer,
        DependencyRegistry& registry)
    {
        return _function(setupLog, std::move(writer), registry);
    }

    FunctionImportInitializer::FunctionImportInitializer(Function function)
        : _function{std::move(function)}
    {
        if (!_function)
        {
            throw Exception::configuration("FunctionImportInitializer requires a function.");
        }
    }

    void FunctionImportInitializer::importDependencies(SetupLog& setupLog, DependencyRegistry& registry)
    {
        _function(setupLog, registry);
    }

    BackgroundDispatchInitializer::BackgroundDispatchInitializer(BackgroundWriterOptions options)
        : _options{options}
    {}

    BackgroundDispatchInitializer::BackgroundDispatchInitializer(std::string const& jsonOptions)
        : _options{parseBackgroundWriterOptions(jsonOptions)}
    {}

    std::shared_ptr<LogWriter> BackgroundDispatchInitializer::initializeLogWriter(SetupLog&, std::shared_ptr<LogWriter> writer,
        DependencyRegistry& registry)
    {
        auto const manager = registry.get<LogManager>();
        auto backgroundWriter = manager->getOrCreateBackgroundMultiLogWriter(_options);
        registry.addIfNotDefined<BackgroundMultiLogWriter>(backgroundWriter);
        return backgroundWriter->createProxyFor(std::move(writer));
    }

    BackgroundWriterOptions const& BackgroundDispatchInitializer::options() const noexcept
    {
        return _options;
    }

    SynchronizingLogWriter::SynchronizingLogWriter(PrivateTag, std::shared_ptr<LogWriter> inner)
        : _inner{std::move(inner)}
    {}

    std::shared_ptr<SynchronizingLogWriter> SynchronizingLogWriter::create(std::shared_ptr<LogWriter> inner)
    {
        if (!inner)
        {
            throw Exception::configuration("SynchronizingLogWriter requires a log writer.");
        }
        return std::make_shared<SynchronizingLogWriter>(PrivateTag{}, std::move(inner));
    }

    std::vector<std::shared_ptr<EntryWriterBase>> SynchronizingLogWriter::listEntryWriters() const
    {
        auto self = std::const_pointer_cast<SynchronizingLogWriter>(shared_from_this());
        auto const queue = std::static_pointer_cast<DeferredWriteQueue>(self);

        auto result = std::vector<std::shared_ptr<EntryWriterBase>>{};
        for (auto const& entryWriter : _inner->listEntryWriters())
        {
            if (entryWriter)
            {
                result.push_back(entryWriter->createDeferredProxy(entryWriter, queue));
            }
        }
        return result;
    }

    bool SynchronizingLogWriter::isAccepting() const noexcept
    {
        return isStarted();
    }

    void SynchronizingLogWriter::post(std::function<void()> write)
    {
        auto lock = std::lock_guard{_writeMutex};
        write();
    }

    std::shared_ptr<LogWriter> const& SynchronizingLogWriter::inner() const noexcept
    {
        return _inner;
    }

    void SynchronizingLogWriter::onStart()
    {
        _inner->ensureStarted();
    }

    void SynchronizingLogWriter::onStop()
    {
        _inner->stop();
    }

    void SynchronizingLogWriter::onDispose()
    {
        _inner->dispose();
    }

    std::shared_ptr<LogWriter> SynchronizingInitializer::initializeLogWriter(SetupLog&, std::shared_ptr<LogWriter> writer, DependencyRegistry&)
    {
        return SynchronizingLogWriter::create(std::move(writer));
    }
}
