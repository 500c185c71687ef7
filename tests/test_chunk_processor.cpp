// EN: Unit tests for the ChunkProcessor: ordering, bounded concurrency, retry, timeout, pause and stop
// FR: Tests unitaires pour le ChunkProcessor : ordre, concurrence bornée, retry, timeout, pause et arrêt

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../include/streaming/chunk_processor.hpp"
#include "../include/core/streaming_errors.hpp"
#include "../include/infrastructure/logging/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace GCS;
using namespace std::chrono_literals;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Return;

namespace {

// EN: Controller double that can fail a number of lines per chunk and slow every send down
// FR: Double de contrôleur pouvant faire échouer un nombre de lignes par chunk et ralentir chaque envoi
class FakeController : public IStreamingManager {
public:
    std::string sendLine(const std::string& line, const LineContext& context) override {
        const auto delay = std::chrono::milliseconds(delay_ms_.load());
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = failures_.find(context.chunk_index);
        if (it != failures_.end() && it->second > 0) {
            it->second--;
            throw std::runtime_error("error:20 unsupported command");
        }
        sent_.push_back(line);
        return "ok";
    }

    void failLines(size_t chunk_index, size_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[chunk_index] = count;
    }

    void setDelay(std::chrono::milliseconds delay) { delay_ms_.store(delay.count()); }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t sentCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<size_t, size_t> failures_;
    std::vector<std::string> sent_;
    std::atomic<int64_t> delay_ms_{0};
};

class MockStreamingManager : public IStreamingManager {
public:
    MOCK_METHOD(std::string, sendLine, (const std::string& line, const LineContext& context), (override));
};

std::vector<Chunk> makeChunks(size_t count, size_t lines_per_chunk) {
    std::vector<Chunk> chunks;
    size_t line_number = 1;
    uint64_t offset = 0;
    for (size_t index = 0; index < count; ++index) {
        Chunk chunk;
        chunk.index = index;
        chunk.start_line = line_number;
        chunk.start_byte_offset = offset;
        for (size_t i = 0; i < lines_per_chunk; ++i) {
            std::string line = "G1 X" + std::to_string(index) + " Y" + std::to_string(i);
            offset += line.size() + 1;
            chunk.lines.push_back(std::move(line));
        }
        chunk.line_count = lines_per_chunk;
        chunk.end_line = line_number + lines_per_chunk - 1;
        chunk.end_byte_offset = offset;
        chunk.byte_length = chunk.end_byte_offset - chunk.start_byte_offset;
        line_number += lines_per_chunk;
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

// EN: Records the highest number of sendLine calls seen running at once
// FR: Enregistre le plus grand nombre d'appels sendLine observés simultanément
class OverlapDetectingController : public IStreamingManager {
public:
    std::string sendLine(const std::string&, const LineContext&) override {
        const int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        --in_flight_;
        ++lines_;
        return "ok";
    }

    int maxInFlight() const { return max_in_flight_.load(); }
    size_t lines() const { return lines_.load(); }

private:
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::atomic<size_t> lines_{0};
};

bool waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

} // namespace

class ChunkProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        config_.chunk_timeout = 5000ms;
    }

    void record(ChunkProcessor& processor) {
        processor.addEventListener("test", [this](const ProcessorEvent& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        });
    }

    size_t countEvents(ProcessorEventType type, std::optional<size_t> chunk_index = std::nullopt) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(), [&](const ProcessorEvent& event) {
            return event.type == type && (!chunk_index || event.chunk_index == chunk_index);
        }));
    }

    FakeController controller_;
    ChunkProcessorConfig config_;
    std::mutex events_mutex_;
    std::vector<ProcessorEvent> events_;
};

TEST_F(ChunkProcessorTest, SendsEveryLineInOrderWithOneWorker) {
    ChunkProcessor processor(controller_, config_);
    record(processor);
    auto chunks = makeChunks(5, 3);

    ProcessingSummary summary = processor.startProcessing(chunks);

    EXPECT_FALSE(summary.stopped);
    EXPECT_EQ(summary.total_chunks, 5u);
    EXPECT_EQ(summary.completed_chunks, 5u);
    EXPECT_EQ(summary.failed_chunks, 0u);

    std::vector<std::string> expected;
    for (const auto& chunk : chunks) {
        expected.insert(expected.end(), chunk.lines.begin(), chunk.lines.end());
    }
    EXPECT_EQ(controller_.sent(), expected);

    ProcessingState state = processor.getState();
    EXPECT_FALSE(state.is_processing);
    EXPECT_EQ(state.lines_settled, 15u);
    EXPECT_EQ(state.current_chunk_index, 5u);
    EXPECT_EQ(state.bytes_settled, chunks.back().end_byte_offset);
    EXPECT_EQ(countEvents(ProcessorEventType::PROCESSING_STARTED), 1u);
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_COMPLETED), 5u);
    EXPECT_EQ(countEvents(ProcessorEventType::PROCESSING_COMPLETED), 1u);
}

TEST_F(ChunkProcessorTest, PassesLineContextToTheController) {
    MockStreamingManager manager;
    {
        ::testing::InSequence sequence;
        EXPECT_CALL(manager, sendLine("G21", AllOf(Field(&LineContext::line_number, 1u),
                                                   Field(&LineContext::chunk_index, 0u),
                                                   Field(&LineContext::is_last_line_in_chunk, false))))
            .WillOnce(Return("ok"));
        EXPECT_CALL(manager, sendLine("G90", AllOf(Field(&LineContext::line_number, 2u),
                                                   Field(&LineContext::is_last_line_in_chunk, true))))
            .WillOnce(Return("ok"));
    }

    Chunk chunk;
    chunk.start_line = 1;
    chunk.end_line = 2;
    chunk.line_count = 2;
    chunk.lines = {"G21", "G90"};

    ChunkProcessor processor(manager, config_);
    EXPECT_EQ(processor.startProcessing({chunk}).completed_chunks, 1u);
}

// EN: Chunk 3 fails twice then succeeds while two chunks are in flight
// FR: Le chunk 3 échoue deux fois puis réussit avec deux chunks en vol
TEST_F(ChunkProcessorTest, RetriesFailedChunkWithTwoWorkers) {
    config_.max_concurrent_chunks = 2;
    controller_.failLines(3, 6);
    ChunkProcessor processor(controller_, config_);
    record(processor);

    ProcessingSummary summary = processor.startProcessing(makeChunks(6, 3));

    EXPECT_EQ(summary.completed_chunks, 6u);
    EXPECT_EQ(summary.failed_chunks, 0u);
    EXPECT_EQ(summary.retry_attempts, 2u);
    EXPECT_EQ(processor.getRetryCounts().at(3), 2u);
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_RETRY_QUEUED, 3), 2u);
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_STARTED, 3), 3u);
    EXPECT_EQ(controller_.sentCount(), 18u);
    EXPECT_LE(processor.getMetrics().max_concurrency_reached, 2u);
    EXPECT_EQ(processor.getState().current_chunk_index, 6u);
}

TEST_F(ChunkProcessorTest, SerializedManagerKeepsOneLineInFlight) {
    config_.max_concurrent_chunks = 2;
    OverlapDetectingController transport;
    SerializedStreamingManager serialized(transport);
    ChunkProcessor processor(serialized, config_);

    ProcessingSummary summary = processor.startProcessing(makeChunks(6, 5));

    EXPECT_EQ(summary.completed_chunks, 6u);
    EXPECT_EQ(transport.lines(), 30u);
    EXPECT_EQ(processor.getMetrics().max_concurrency_reached, 2u);
    EXPECT_EQ(transport.maxInFlight(), 1);
}

TEST_F(ChunkProcessorTest, PermanentFailureAfterMaxRetries) {
    config_.max_chunk_retries = 3;
    controller_.failLines(1, 1000);
    ChunkProcessor processor(controller_, config_);
    record(processor);

    ProcessingSummary summary = processor.startProcessing(makeChunks(3, 2));

    EXPECT_EQ(summary.completed_chunks, 2u);
    EXPECT_EQ(summary.failed_chunks, 1u);
    EXPECT_EQ(summary.failed_chunk_indices, (std::vector<size_t>{1}));
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_STARTED, 1), 4u);
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_RETRY_QUEUED, 1), 3u);
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_FAILED, 1), 1u);

    // EN: A failed chunk still advances the settled prefix / FR: Un chunk en échec fait avancer le préfixe réglé
    ProcessingState state = processor.getState();
    EXPECT_EQ(state.current_chunk_index, 3u);
    EXPECT_EQ(state.lines_settled, 6u);
    EXPECT_EQ(processor.getFailedChunks(), (std::vector<size_t>{1}));
}

TEST_F(ChunkProcessorTest, NoRetryWhenRetriesDisabled) {
    config_.retry_failed_chunks = false;
    controller_.failLines(0, 2);
    ChunkProcessor processor(controller_, config_);

    ProcessingSummary summary = processor.startProcessing(makeChunks(2, 2));

    EXPECT_EQ(summary.failed_chunks, 1u);
    EXPECT_EQ(summary.retry_attempts, 0u);
    EXPECT_EQ(summary.completed_chunks, 1u);
}

TEST_F(ChunkProcessorTest, ToleratesIsolatedLineFailures) {
    controller_.failLines(0, 1);
    ChunkProcessor processor(controller_, config_);
    record(processor);

    ProcessingSummary summary = processor.startProcessing(makeChunks(1, 4));

    EXPECT_EQ(summary.completed_chunks, 1u);
    EXPECT_EQ(summary.retry_attempts, 0u);
    auto metrics = processor.getMetrics();
    EXPECT_EQ(metrics.lines_sent, 3u);
    EXPECT_EQ(metrics.lines_failed, 1u);
    EXPECT_EQ(countEvents(ProcessorEventType::CHUNK_VALIDATION_WARNING), 1u);
}

TEST_F(ChunkProcessorTest, ZeroToleranceFailsOnFirstBadLine) {
    config_.line_failure_tolerance = 0.0;
    config_.retry_failed_chunks = false;
    controller_.failLines(0, 1);
    ChunkProcessor processor(controller_, config_);

    EXPECT_EQ(processor.startProcessing(makeChunks(1, 4)).failed_chunks, 1u);
}

TEST_F(ChunkProcessorTest, TimedOutAttemptIsFailedAndLateResultDiscarded) {
    config_.chunk_timeout = 50ms;
    config_.retry_failed_chunks = false;
    controller_.setDelay(30ms);
    ChunkProcessor processor(controller_, config_);
    record(processor);

    ProcessingSummary summary = processor.startProcessing(makeChunks(1, 6));

    EXPECT_EQ(summary.failed_chunks, 1u);
    EXPECT_EQ(summary.completed_chunks, 0u);
    EXPECT_EQ(processor.getMetrics().timeouts, 1u);
    EXPECT_TRUE(waitFor([&processor] { return processor.getMetrics().late_results_discarded == 1; }));
    EXPECT_LT(controller_.sentCount(), 6u);
}

TEST_F(ChunkProcessorTest, StopCancelsRemainingChunks) {
    controller_.setDelay(10ms);
    ChunkProcessor processor(controller_, config_);
    record(processor);
    auto chunks = makeChunks(20, 2);

    auto run = std::async(std::launch::async, [&processor, &chunks] { return processor.startProcessing(chunks); });
    ASSERT_TRUE(waitFor([this] { return controller_.sentCount() >= 2; }));

    std::optional<ProcessingSummary> stopped = processor.stop();
    ASSERT_TRUE(stopped.has_value());
    EXPECT_TRUE(stopped->stopped);

    ProcessingSummary summary = run.get();
    EXPECT_TRUE(summary.stopped);
    EXPECT_LT(summary.completed_chunks, 20u);
    EXPECT_EQ(countEvents(ProcessorEventType::PROCESSING_STOPPED), 1u);
    EXPECT_EQ(countEvents(ProcessorEventType::PROCESSING_COMPLETED), 0u);

    EXPECT_FALSE(processor.isProcessing());
    EXPECT_FALSE(processor.stop().has_value());
}

TEST_F(ChunkProcessorTest, PauseHoldsDispatchUntilResume) {
    controller_.setDelay(5ms);
    ChunkProcessor processor(controller_, config_);
    auto chunks = makeChunks(10, 2);

    auto run = std::async(std::launch::async, [&processor, &chunks] { return processor.startProcessing(chunks); });
    ASSERT_TRUE(waitFor([this] { return controller_.sentCount() >= 1; }));

    EXPECT_TRUE(processor.pause());
    EXPECT_FALSE(processor.pause());
    EXPECT_TRUE(processor.waitUntilIdle(2000ms));
    EXPECT_TRUE(processor.getState().is_paused);

    const size_t sent_while_paused = controller_.sentCount();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(controller_.sentCount(), sent_while_paused);
    EXPECT_LT(sent_while_paused, 20u);

    EXPECT_TRUE(processor.resume());
    EXPECT_FALSE(processor.resume());

    ProcessingSummary summary = run.get();
    EXPECT_EQ(summary.completed_chunks, 10u);
    EXPECT_EQ(controller_.sentCount(), 20u);
}

TEST_F(ChunkProcessorTest, RejectsConcurrentStart) {
    controller_.setDelay(5ms);
    ChunkProcessor processor(controller_, config_);
    auto chunks = makeChunks(10, 2);

    auto run = std::async(std::launch::async, [&processor, &chunks] { return processor.startProcessing(chunks); });
    ASSERT_TRUE(waitFor([&processor] { return processor.isProcessing(); }));

    EXPECT_THROW(processor.startProcessing(chunks), ProcessingStateError);

    processor.stop();
    EXPECT_TRUE(run.get().stopped);
}

TEST_F(ChunkProcessorTest, StartIndexSkipsSettledChunks) {
    ChunkProcessor processor(controller_, config_);
    auto chunks = makeChunks(5, 2);

    ProcessingOptions options;
    options.start_index = 2;
    ProcessingSummary summary = processor.startProcessing(chunks, options);

    EXPECT_EQ(summary.skipped_chunks, 2u);
    EXPECT_EQ(summary.completed_chunks, 3u);
    EXPECT_EQ(controller_.sentCount(), 6u);
    EXPECT_EQ(controller_.sent().front(), chunks[2].lines.front());
    EXPECT_EQ(processor.getState().lines_settled, 10u);
}

TEST_F(ChunkProcessorTest, RetryIndicesAreQueuedBelowStartIndex) {
    ChunkProcessor processor(controller_, config_);
    auto chunks = makeChunks(5, 2);

    ProcessingOptions options;
    options.start_index = 3;
    options.retry_indices = {1};
    ProcessingSummary summary = processor.startProcessing(chunks, options);

    EXPECT_EQ(summary.skipped_chunks, 2u);
    EXPECT_EQ(summary.completed_chunks, 3u);
    EXPECT_EQ(summary.failed_chunks, 0u);
    ASSERT_EQ(controller_.sentCount(), 6u);
    EXPECT_EQ(controller_.sent().front(), chunks[1].lines.front());
    EXPECT_EQ(processor.getState().current_chunk_index, 5u);
}

// EN: An unsent re-queued chunk holds the watermark so a stop checkpoint still points at it
// FR: Un chunk remis en queue non envoyé retient le watermark, un checkpoint d'arrêt le désigne encore
TEST_F(ChunkProcessorTest, PendingRetryIndexHoldsWatermark) {
    ChunkProcessor processor(controller_, config_);
    processor.addEventListener("holder", [&processor](const ProcessorEvent& event) {
        if (event.type == ProcessorEventType::PROCESSING_STARTED) {
            processor.pause();
        }
    });
    auto chunks = makeChunks(5, 2);

    ProcessingOptions options;
    options.start_index = 4;
    options.retry_indices = {2};
    auto run = std::async(std::launch::async, [&processor, &chunks, &options] {
        return processor.startProcessing(chunks, options);
    });
    ASSERT_TRUE(waitFor([&processor] { return processor.getState().is_paused; }));

    EXPECT_EQ(processor.getState().current_chunk_index, 2u);
    EXPECT_EQ(processor.getState().skipped_chunks, 3u);

    processor.stop();
    EXPECT_TRUE(run.get().stopped);
    EXPECT_EQ(controller_.sentCount(), 0u);
}

TEST_F(ChunkProcessorTest, LoadsLinesForChunksWithoutRetainedLines) {
    auto chunks = makeChunks(2, 3);
    auto retained = chunks;
    for (auto& chunk : chunks) {
        chunk.lines.clear();
    }

    ChunkProcessor processor(controller_, config_);
    ProcessingOptions options;
    options.line_loader = [&retained](const Chunk& chunk) { return retained[chunk.index].lines; };

    EXPECT_EQ(processor.startProcessing(chunks, options).completed_chunks, 2u);
    EXPECT_EQ(controller_.sentCount(), 6u);
}

TEST_F(ChunkProcessorTest, MissingLinesWithoutLoaderFailTheChunk) {
    config_.retry_failed_chunks = false;
    auto chunks = makeChunks(1, 3);
    chunks[0].lines.clear();

    ChunkProcessor processor(controller_, config_);
    ProcessingSummary summary = processor.startProcessing(chunks);
    EXPECT_EQ(summary.failed_chunks, 1u);
    EXPECT_EQ(controller_.sentCount(), 0u);
}

TEST_F(ChunkProcessorTest, EmptyChunkListCompletesImmediately) {
    ChunkProcessor processor(controller_, config_);
    ProcessingSummary summary = processor.startProcessing({});
    EXPECT_EQ(summary.total_chunks, 0u);
    EXPECT_FALSE(summary.stopped);
}

TEST_F(ChunkProcessorTest, ControlsAreNoOpsWhenIdle) {
    ChunkProcessor processor(controller_, config_);
    EXPECT_FALSE(processor.pause());
    EXPECT_FALSE(processor.resume());
    EXPECT_FALSE(processor.stop().has_value());
    EXPECT_TRUE(processor.waitUntilIdle(10ms));
}

TEST_F(ChunkProcessorTest, RejectsInvalidConfiguration) {
    ChunkProcessorConfig bad = config_;
    bad.max_concurrent_chunks = 0;
    EXPECT_THROW(ChunkProcessor processor(controller_, bad), ConfigurationError);

    bad = config_;
    bad.line_failure_tolerance = 1.5;
    EXPECT_THROW(ChunkProcessor processor(controller_, bad), ConfigurationError);
}

TEST_F(ChunkProcessorTest, ExportDataReflectsRun) {
    controller_.failLines(1, 2);
    ChunkProcessor processor(controller_, config_);
    processor.startProcessing(makeChunks(3, 2));

    auto data = processor.exportData();
    EXPECT_EQ(data["state"]["processed_chunks"], 3);
    EXPECT_EQ(data["metrics"]["chunks_retried"], 1);
    EXPECT_EQ(data["retry_counts"]["1"], 1);
    EXPECT_DOUBLE_EQ(data["metrics"]["success_rate"].get<double>(), 100.0);
    EXPECT_EQ(data["config"]["max_concurrent_chunks"], 1);
}
