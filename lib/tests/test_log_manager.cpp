// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_log_manager.cpp
 * @brief Tests for log writer construction and lifecycle in the LogManager
 *
 * This test suite validates:
 *   - One runtime writer per distinct descriptor
 *   - Exclusion of descriptors whose writer fails to build or start
 *   - Entry writer lookup by descriptor and by entry type
 *   - Restart, dispose on stop and initializer pipelines
 *   - Serialized writes through SynchronizingInitializer
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <tracemux/BackgroundMultiLogWriter.hpp>
#include <tracemux/DependencyRegistry.hpp>
#include <tracemux/Exception.hpp>
#include <tracemux/FanOutEntryWriter.hpp>
#include <tracemux/Initializers.hpp>
#include <tracemux/LogManager.hpp>
#include "Utils.hpp"

using namespace tracemux::tests;

namespace
{
    TraceEntry makeEntry(std::string message)
    {
        return TraceEntry{std::chrono::system_clock::now(), "Test", TraceLevel::Info, std::move(message), std::nullopt};
    }

    /// Sink with no locking of its own. Counts writes that overlap.
    class UnsynchronizedListLogWriter final : public SingleEntryTypeLogWriter<TraceEntry>
    {
    public:
        void write(TraceEntry const& entry) override
        {
            if (_writing.exchange(true))
            {
                ++_overlaps;
            }
            _entries.push_back(entry);
            std::this_thread::yield();
            _writing = false;
        }

        std::size_t count() const noexcept
        {
            return _entries.size();
        }

        std::size_t overlaps() const noexcept
        {
            return _overlaps.load();
        }

    private:
        std::vector<TraceEntry> _entries;
        std::atomic<bool> _writing{false};
        std::atomic<std::size_t> _overlaps{0};
    };

    Status statusOf(std::function<void()> const& action)
    {
        try
        {
            action();
        }
        catch (Exception const& e)
        {
            return e.status();
        }
        FAIL("No exception was thrown");
        return Status::StateError;
    }
}

/**
 * @brief Equal descriptors produce a single writer
 */
TEST_CASE("Equal descriptors are built once", "[logmanager]")
{
    auto const first = makeListConfig("same");
    auto const second = makeListConfig("same");

    auto manager = std::make_shared<LogManager>();
    REQUIRE(manager->addWriterConfig(first));
    REQUIRE_FALSE(manager->addWriterConfig(second));
    REQUIRE(manager->hasWriterConfig(*second));
    REQUIRE(manager->config().size() == 1);

    manager->start();
    REQUIRE(first->createCount() == 1);
    REQUIRE(second->createCount() == 0);

    // Lookup by an equal descriptor finds the same writer
    REQUIRE(manager->getLogWriter(*second) == first->created());
}

/**
 * @brief A descriptor whose writer fails to build is excluded and reported; others keep working
 */
TEST_CASE("Build failure is isolated", "[logmanager]")
{
    auto const setupLog = std::make_shared<SetupLog>();
    auto const failing = makeFailingConfig("failing");
    auto const working = makeListConfig("working");

    auto manager = std::make_shared<LogManager>(LogManagerConfig{failing, working}, setupLog);
    manager->start();

    REQUIRE(manager->isStarted());
    REQUIRE(manager->getLogWriter(*failing) == nullptr);
    REQUIRE(manager->getLogWriter(*working) != nullptr);

    auto const severe = setupLog->countIf(
        [](TraceEntry const& entry) { return entry.level == TraceLevel::Severe && entry.message.find("BuildFailure") != std::string::npos; });
    REQUIRE(severe == 1);

    auto const diagnostics = setupLog->entries();
    auto const it = std::find_if(diagnostics.begin(), diagnostics.end(), [](auto const& entry) { return entry.level == TraceLevel::Severe; });
    REQUIRE(it != diagnostics.end());
    REQUIRE(it->details.has_value());
    REQUIRE(it->details->find("construction failed on purpose") != std::string::npos);

    // The failed descriptor yields a disabled no-op writer and a warning
    auto const noOp = manager->getEntryWriter<TraceEntry>(*failing);
    REQUIRE_FALSE(noOp->isEnabled());
    REQUIRE_NOTHROW(noOp->write(makeEntry("ignored")));
    REQUIRE(countAtLevel(*setupLog, TraceLevel::Warn) == 1);

    auto const entryWriter = manager->getEntryWriter<TraceEntry>(*working);
    REQUIRE(entryWriter->isEnabled());
    entryWriter->write(makeEntry("delivered"));
    REQUIRE(working->created<TraceListLogWriter>()->count() == 1);
}

/**
 * @brief A factory returning null is a build failure too
 */
TEST_CASE("Null writer is a build failure", "[logmanager]")
{
    auto const setupLog = std::make_shared<SetupLog>();
    auto const config = std::make_shared<TestLogWriterConfig>("null", []() { return std::shared_ptr<LogWriter>{}; });

    auto manager = std::make_shared<LogManager>(LogManagerConfig{config}, setupLog);
    REQUIRE(manager->getLogWriter(*config) == nullptr);
    REQUIRE(countAtLevel(*setupLog, TraceLevel::Severe) == 1);
}

/**
 * @brief Unknown descriptors are NotFound; lookups start the manager lazily
 */
TEST_CASE("Unknown descriptor", "[logmanager]")
{
    auto manager = std::make_shared<LogManager>(LogManagerConfig{makeListConfig("known")});
    auto const unknown = makeListConfig("unknown");

    REQUIRE(manager->state() == StartableState::Unstarted);
    REQUIRE(statusOf([&]() { (void)manager->getEntryWriter<TraceEntry>(*unknown); }) == Status::NotFound);
    REQUIRE(manager->isStarted());
    REQUIRE(statusOf([&]() { (void)manager->getLogWriter(*unknown); }) == Status::NotFound);
    REQUIRE(unknown->createCount() == 0);
}

/**
 * @brief Asking a writer for an entry type it does not accept gives a disabled no-op writer
 */
TEST_CASE("Unsupported entry type", "[logmanager]")
{
    auto const setupLog = std::make_shared<SetupLog>();
    auto const config = makeListConfig("traces");
    auto manager = std::make_shared<LogManager>(LogManagerConfig{config}, setupLog);

    auto const metrics = manager->getEntryWriter<MetricEntry>(*config);
    REQUIRE(metrics != nullptr);
    REQUIRE_FALSE(metrics->isEnabled());
    REQUIRE_NOTHROW(metrics->write(MetricEntry{"latency", 1.5}));
    REQUIRE(countAtLevel(*setupLog, TraceLevel::Warn) == 1);

    REQUIRE(manager->getEntryWriters<MetricEntry>().empty());
}

/**
 * @brief A writer that fails to start is reported and yields a no-op entry writer
 */
TEST_CASE("Start failure", "[logmanager]")
{
    auto const setupLog = std::make_shared<SetupLog>();
    auto const config = std::make_shared<TestLogWriterConfig>("failing start", []() { return std::make_shared<FailingStartLogWriter>(); });
    auto const working = makeListConfig("working");
    auto manager = std::make_shared<LogManager>(LogManagerConfig{config, working}, setupLog);

    manager->start();
    REQUIRE(manager->isStarted());

    auto const writer = manager->getLogWriter(*config);
    REQUIRE(writer != nullptr);
    REQUIRE(writer->state() == StartableState::FailedToStart);
    REQUIRE(countAtLevel(*setupLog, TraceLevel::Error) == 1);

    REQUIRE_FALSE(manager->getEntryWriter<TraceEntry>(*config)->isEnabled());
    REQUIRE(manager->getEntryWriters<TraceEntry>().size() == 1);
}

/**
 * @brief Lookup of every writer of an entry type: none, one, or a fan-out over many
 */
TEST_CASE("Entry writer by entry type", "[logmanager]")
{
    SECTION("No writer")
    {
        auto manager = std::make_shared<LogManager>();
        auto const entryWriter = manager->getEntryWriter<TraceEntry>();
        REQUIRE_FALSE(entryWriter->isEnabled());
        REQUIRE(std::dynamic_pointer_cast<NoOpEntryWriter<TraceEntry>>(entryWriter) != nullptr);
    }

    SECTION("One writer")
    {
        auto const config = makeListConfig("one");
        auto manager = std::make_shared<LogManager>(LogManagerConfig{config});
        auto const entryWriter = manager->getEntryWriter<TraceEntry>();
        REQUIRE(entryWriter == config->created<TraceListLogWriter>());
    }

    SECTION("Many writers")
    {
        auto const first = makeListConfig("first");
        auto const second = makeListConfig("second");
        auto manager = std::make_shared<LogManager>(LogManagerConfig{first, second});

        auto const entryWriter = manager->getEntryWriter<TraceEntry>();
        auto const fanOut = std::dynamic_pointer_cast<FanOutEntryWriter<TraceEntry>>(entryWriter);
        REQUIRE(fanOut != nullptr);
        REQUIRE(fanOut->writers().size() == 2);

        entryWriter->write(makeEntry("both"));
        REQUIRE(first->created<TraceListLogWriter>()->count() == 1);
        REQUIRE(second->created<TraceListLogWriter>()->count() == 1);
    }
}

/**
 * @brief A restart rebuilds every writer; stop leaves the old ones stopped
 */
TEST_CASE("Restart rebuilds writers", "[logmanager]")
{
    auto const config = makeListConfig("restart");
    auto manager = std::make_shared<LogManager>(LogManagerConfig{config});

    manager->start();
    auto const firstWriter = config->created();
    REQUIRE(firstWriter->isStarted());

    manager->start();
    auto const secondWriter = config->created();
    REQUIRE(config->createCount() == 2);
    REQUIRE(secondWriter != firstWriter);
    REQUIRE_FALSE(firstWriter->isStarted());
    REQUIRE(secondWriter->isStarted());

    manager->stop();
    REQUIRE_FALSE(secondWriter->isStarted());
    REQUIRE_FALSE(secondWriter->isDisposed());
}

/**
 * @brief Descriptors asking for it have their writers disposed on stop
 */
TEST_CASE("Dispose on stop", "[logmanager]")
{
    auto const disposed = makeListConfig("disposed");
    disposed->setDisposeOnStop(true);
    auto const kept = makeListConfig("kept");

    auto manager = std::make_shared<LogManager>(LogManagerConfig{disposed, kept});
    manager->start();
    manager->stop();

    REQUIRE(disposed->created()->isDisposed());
    REQUIRE_FALSE(kept->created()->isDisposed());
    REQUIRE(kept->created()->state() == StartableState::Stopped);
}

/**
 * @brief Pipeline initializers run in order, descriptor first then manager-wide, and each
 * result is registered for the next stage
 */
TEST_CASE("Pipeline initializers", "[logmanager]")
{
    auto order = std::vector<std::string>{};

    auto const config = makeListConfig("pipeline");
    config->addInitializer(std::make_shared<FunctionPipelineInitializer>(
        [&order](SetupLog&, std::shared_ptr<LogWriter> writer, DependencyRegistry& registry)
        {
            order.push_back("descriptor");
            REQUIRE(registry.isDefined<LogManager>());
            REQUIRE(registry.isDefined<SetupLog>());
            REQUIRE(registry.get<LogWriterConfig const>()->describe() == "TestLogWriterConfig(pipeline)");
            REQUIRE(registry.logWriters().size() == 1);
            return SynchronizingLogWriter::create(writer);
        }));

    auto managerConfig = LogManagerConfig{config};
    managerConfig.addInitializer(std::make_shared<FunctionPipelineInitializer>(
        [&order](SetupLog&, std::shared_ptr<LogWriter> writer, DependencyRegistry& registry)
        {
            order.push_back("manager");
            REQUIRE(registry.logWriters().size() == 2);
            REQUIRE(registry.findLogWriter<SynchronizingLogWriter>() == writer);
            REQUIRE(registry.findLogWriter<TraceListLogWriter>() != nullptr);
            return writer;
        }));

    auto manager = std::make_shared<LogManager>(managerConfig);
    auto const writer = manager->getLogWriter(*config);

    REQUIRE(order == std::vector<std::string>{"descriptor", "manager"});
    REQUIRE(std::dynamic_pointer_cast<SynchronizingLogWriter>(writer) != nullptr);

    manager->getEntryWriter<TraceEntry>(*config)->write(makeEntry("synchronized"));
    REQUIRE(config->created<TraceListLogWriter>()->count() == 1);
}

/**
 * @brief Writes from several threads reach a sink without locking one at a time, and the entry
 * writer is enabled only while the wrapper is started
 */
TEST_CASE("Synchronizing initializer serializes writes", "[logmanager]")
{
    constexpr auto threadCount = 4;
    constexpr auto entriesPerThread = 250;

    auto const config = std::make_shared<TestLogWriterConfig>("synchronized", []() { return std::make_shared<UnsynchronizedListLogWriter>(); });
    config->addInitializer(std::make_shared<SynchronizingInitializer>());

    auto manager = std::make_shared<LogManager>(LogManagerConfig{config});
    manager->start();

    auto const wrapper = std::dynamic_pointer_cast<SynchronizingLogWriter>(manager->getLogWriter(*config));
    REQUIRE(wrapper != nullptr);
    auto const sink = config->created<UnsynchronizedListLogWriter>();
    REQUIRE(wrapper->inner() == sink);
    REQUIRE(wrapper->isStarted());
    REQUIRE(sink->isStarted());

    auto const entryWriter = manager->getEntryWriter<TraceEntry>(*config);
    REQUIRE(entryWriter != nullptr);
    REQUIRE(entryWriter->isEnabled());

    auto producers = std::vector<std::thread>{};
    for (auto t = 0; t < threadCount; ++t)
    {
        producers.emplace_back(
            [&entryWriter, t]()
            {
                for (auto i = 0; i < entriesPerThread; ++i)
                {
                    entryWriter->write(makeEntry(std::to_string(t) + ":" + std::to_string(i)));
                }
            });
    }
    for (auto& producer : producers)
    {
        producer.join();
    }

    REQUIRE(sink->count() == threadCount * entriesPerThread);
    REQUIRE(sink->overlaps() == 0);

    manager->stop();
    REQUIRE(wrapper->state() == StartableState::Stopped);
    REQUIRE_FALSE(sink->isStarted());
    REQUIRE_FALSE(entryWriter->isEnabled());

    wrapper->start();
    REQUIRE(sink->isStarted());
    REQUIRE(entryWriter->isEnabled());

    wrapper->stop();
    REQUIRE_FALSE(entryWriter->isEnabled());
}

/**
 * @brief A pipeline stage returning null fails the whole build
 */
TEST_CASE("Pipeline stage returning null", "[logmanager]")
{
    auto const setupLog = std::make_shared<SetupLog>();
    auto const config = makeListConfig("broken pipeline");
    config->addInitializer(std::make_shared<FunctionPipelineInitializer>(
        [](SetupLog&, std::shared_ptr<LogWriter>, DependencyRegistry&) { return std::shared_ptr<LogWriter>{}; }));

    auto manager = std::make_shared<LogManager>(LogManagerConfig{config}, setupLog);
    REQUIRE(manager->getLogWriter(*config) == nullptr);
    REQUIRE(countAtLevel(*setupLog, TraceLevel::Severe) == 1);
}

/**
 * @brief Import initializers see every stage of the sealed registry
 */
TEST_CASE("Import initializers", "[logmanager]")
{
    auto baseWriter = std::shared_ptr<TraceListLogWriter>{};
    auto proxy = std::shared_ptr<BackgroundMultiLogWriter::Proxy>{};
    auto background = std::shared_ptr<BackgroundMultiLogWriter>{};
    auto sealedAddStatus = std::optional<Status>{};

    auto const config = makeListConfig("imports");
    config->addInitializer(std::make_shared<BackgroundDispatchInitializer>());
    config->addInitializer(std::make_shared<FunctionImportInitializer>(
        [&](SetupLog&, DependencyRegistry& registry)
        {
            REQUIRE(registry.isSealed());
            baseWriter = registry.findLogWriter<TraceListLogWriter>();
            proxy = registry.findLogWriter<BackgroundMultiLogWriter::Proxy>();
            background = registry.tryGet<BackgroundMultiLogWriter>();
            try
            {
                registry.add<std::string>(std::make_shared<std::string>("late"));
            }
            catch (Exception const& e)
            {
                sealedAddStatus = e.status();
            }
        }));

    auto manager = std::make_shared<LogManager>(LogManagerConfig{config});
    auto const writer = manager->getLogWriter(*config);

    REQUIRE(baseWriter != nullptr);
    REQUIRE(baseWriter == config->created<TraceListLogWriter>());
    REQUIRE(proxy != nullptr);
    REQUIRE(proxy == writer);
    REQUIRE(proxy->sink() == baseWriter);
    REQUIRE(background == manager->getOrCreateBackgroundMultiLogWriter());
    REQUIRE(sealedAddStatus == Status::StateError);

    manager->getEntryWriter<TraceEntry>(*config)->write(makeEntry("queued"));
    manager->stop();
    REQUIRE(baseWriter->count() == 1);
}

TEST_CASE("Initializer construction", "[logmanager]")
{
    REQUIRE_THROWS_AS(FunctionPipelineInitializer{FunctionPipelineInitializer::Function{}}, Exception);
    REQUIRE_THROWS_AS(FunctionImportInitializer{FunctionImportInitializer::Function{}}, Exception);
    REQUIRE_THROWS_AS(SynchronizingLogWriter::create(nullptr), Exception);
    REQUIRE_THROWS_AS(BackgroundDispatchInitializer{std::string{"not json"}}, Exception);

    auto config = LogManagerConfig{};
    REQUIRE_THROWS_AS(config.addWriter(nullptr), Exception);
    REQUIRE_THROWS_AS(config.addInitializer(nullptr), Exception);
}

/**
 * @brief A writer owned by the caller is used as is
 */
TEST_CASE("Existing writer descriptor", "[logmanager]")
{
    auto const sink = std::make_shared<TraceListLogWriter>();
    auto const config = std::make_shared<UseExistingLogWriterConfig>(sink);
    auto const sameWriter = std::make_shared<UseExistingLogWriterConfig>(sink);
    auto const otherWriter = std::make_shared<UseExistingLogWriterConfig>(std::make_shared<TraceListLogWriter>());

    REQUIRE(*config == *sameWriter);
    REQUIRE_FALSE(*config == *otherWriter);

    auto manager = LogManager{LogManagerConfig{config}};
    REQUIRE(manager.getLogWriter(*sameWriter) == sink);
    REQUIRE(sink->isStarted());

    manager.stop();
    REQUIRE_FALSE(sink->isStarted());
    REQUIRE_FALSE(sink->isDisposed());
}
