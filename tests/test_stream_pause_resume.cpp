// EN: Unit tests for StreamPauseResume: reason codes, graceful acknowledgement and the pause watchdog
// FR: Tests unitaires pour StreamPauseResume : codes de raison, acquittement gracieux et chien de garde

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../include/streaming/stream_pause_resume.hpp"
#include "../include/infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace GCS;
using namespace std::chrono_literals;

class StreamPauseResumeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        config_.pause_timeout = 100ms;
        config_.resume_timeout = 100ms;
    }

    // EN: Records event types from any thread
    // FR: Enregistre les types d'événements depuis n'importe quel thread
    void record(StreamPauseResume& coordinator) {
        coordinator.addEventListener("test", [this](const PauseEvent& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event.type);
        });
    }

    std::vector<PauseEventType> events() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_;
    }

    PauseResumeConfig config_;
    std::mutex events_mutex_;
    std::vector<PauseEventType> events_;
};

TEST_F(StreamPauseResumeTest, PauseThenResume) {
    StreamPauseResume coordinator(config_);
    record(coordinator);

    PauseResult pause = coordinator.requestPause("operator");
    ASSERT_TRUE(pause.success);
    EXPECT_TRUE(pause.pause_time.has_value());
    EXPECT_TRUE(coordinator.isPaused());
    EXPECT_EQ(coordinator.getPauseState().pause_reason, "operator");
    EXPECT_TRUE(coordinator.getPauseState().saved_state.has_value());
    EXPECT_FALSE(coordinator.canPause());
    EXPECT_TRUE(coordinator.canResume());

    ResumeResult resume = coordinator.requestResume();
    ASSERT_TRUE(resume.success);
    EXPECT_TRUE(resume.pause_duration.has_value());
    EXPECT_FALSE(coordinator.isPaused());

    EXPECT_EQ(events(), (std::vector<PauseEventType>{
        PauseEventType::PAUSE_REQUESTED, PauseEventType::PAUSE_EXECUTE, PauseEventType::STREAM_PAUSED,
        PauseEventType::RESUME_EXECUTE, PauseEventType::STREAM_RESUMED}));
}

TEST_F(StreamPauseResumeTest, ReportsAlreadyPausedAndNotPaused) {
    StreamPauseResume coordinator(config_);

    ResumeResult early = coordinator.requestResume();
    EXPECT_FALSE(early.success);
    EXPECT_EQ(early.reason, "not_paused");

    ASSERT_TRUE(coordinator.requestPause().success);
    PauseResult again = coordinator.requestPause();
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.reason, "already_paused");

    // EN: Expected refusals are not counted as failures / FR: Les refus attendus ne comptent pas comme échecs
    auto metrics = coordinator.getMetrics();
    EXPECT_EQ(metrics.total_pauses, 1u);
    EXPECT_EQ(metrics.failed_pauses, 0u);
    EXPECT_EQ(metrics.failed_resumes, 0u);
}

TEST_F(StreamPauseResumeTest, DisabledCoordinatorRefusesEverything) {
    config_.enable_pause_resume = false;
    StreamPauseResume coordinator(config_);

    EXPECT_EQ(coordinator.requestPause().reason, "disabled");
    EXPECT_EQ(coordinator.requestResume().reason, "disabled");
    EXPECT_FALSE(coordinator.canPause());
    EXPECT_FALSE(coordinator.getCapabilities().enable_pause_resume);
}

// EN: The participant acknowledges from the PAUSE_REQUESTED listener
// FR: Le participant acquitte depuis le listener PAUSE_REQUESTED
TEST_F(StreamPauseResumeTest, GracefulPauseCompletesWhenParticipantAcknowledges) {
    StreamPauseResume coordinator(config_);
    coordinator.addPauseParticipant("worker");
    coordinator.addEventListener("worker", [&coordinator](const PauseEvent& event) {
        if (event.type == PauseEventType::PAUSE_REQUESTED) {
            coordinator.acknowledgePause("worker");
        }
    });

    PauseResult result = coordinator.requestPause("graceful");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(coordinator.isPaused());
    EXPECT_FALSE(coordinator.acknowledgePause("worker"));
}

TEST_F(StreamPauseResumeTest, GracefulPauseTimesOutWithoutAcknowledgement) {
    StreamPauseResume coordinator(config_);
    coordinator.addPauseParticipant("worker");
    record(coordinator);

    const auto started = std::chrono::steady_clock::now();
    PauseResult result = coordinator.requestPause("graceful");
    const auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, "pause_timeout");
    EXPECT_GE(waited, config_.pause_timeout);
    EXPECT_FALSE(coordinator.isPaused());
    EXPECT_TRUE(coordinator.canPause());
    EXPECT_EQ(coordinator.getMetrics().failed_pauses, 1u);
    EXPECT_THAT(events(), ::testing::Contains(PauseEventType::PAUSE_FAILED));
}

TEST_F(StreamPauseResumeTest, NonGracefulPauseSkipsAcknowledgement) {
    StreamPauseResume coordinator(config_);
    coordinator.addPauseParticipant("worker");
    record(coordinator);

    PauseOptions options;
    options.graceful = false;
    EXPECT_TRUE(coordinator.requestPause("immediate", options).success);
    EXPECT_THAT(events(), ::testing::Not(::testing::Contains(PauseEventType::PAUSE_REQUESTED)));
}

TEST_F(StreamPauseResumeTest, RemovedParticipantNoLongerBlocksPause) {
    StreamPauseResume coordinator(config_);
    coordinator.addPauseParticipant("worker");
    coordinator.removePauseParticipant("worker");

    EXPECT_TRUE(coordinator.requestPause().success);
}

TEST_F(StreamPauseResumeTest, WatchdogForcesResumeAfterMaxPauseDuration) {
    config_.max_pause_duration = 50ms;
    StreamPauseResume coordinator(config_);
    record(coordinator);

    ASSERT_TRUE(coordinator.requestPause("long").success);

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (coordinator.isPaused() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_FALSE(coordinator.isPaused());

    auto metrics = coordinator.getMetrics();
    EXPECT_EQ(metrics.forced_resumes, 1u);
    EXPECT_EQ(metrics.total_resumes, 1u);
    EXPECT_GE(metrics.longest_pause, 50ms);
    EXPECT_THAT(events(), ::testing::Contains(PauseEventType::PAUSE_TIMEOUT_EXCEEDED));
}

TEST_F(StreamPauseResumeTest, WatchdogIsCancelledByManualResume) {
    config_.max_pause_duration = 100ms;
    StreamPauseResume coordinator(config_);

    ASSERT_TRUE(coordinator.requestPause().success);
    ASSERT_TRUE(coordinator.requestResume().success);
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(coordinator.getMetrics().forced_resumes, 0u);
    EXPECT_EQ(coordinator.getMetrics().total_resumes, 1u);
}

TEST_F(StreamPauseResumeTest, ResumeCallbacksRunOnce) {
    StreamPauseResume coordinator(config_);
    std::atomic<int> calls{0};
    coordinator.addResumeCallback([&calls](const ResumeInfo&) { calls++; });

    ASSERT_TRUE(coordinator.requestPause().success);
    ASSERT_TRUE(coordinator.requestResume().success);
    EXPECT_EQ(calls.load(), 1);

    ASSERT_TRUE(coordinator.requestPause().success);
    ASSERT_TRUE(coordinator.requestResume().success);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(StreamPauseResumeTest, ThrowingResumeCallbackDoesNotBlockResume) {
    StreamPauseResume coordinator(config_);
    coordinator.addResumeCallback([](const ResumeInfo&) { throw std::runtime_error("boom"); });

    ASSERT_TRUE(coordinator.requestPause().success);
    EXPECT_TRUE(coordinator.requestResume().success);
    EXPECT_FALSE(coordinator.isPaused());
}

TEST_F(StreamPauseResumeTest, MetricsAndExport) {
    StreamPauseResume coordinator(config_);
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(coordinator.requestPause().success);
        std::this_thread::sleep_for(10ms);
        ASSERT_TRUE(coordinator.requestResume().success);
    }

    auto metrics = coordinator.getMetrics();
    EXPECT_EQ(metrics.total_pauses, 2u);
    EXPECT_EQ(metrics.total_resumes, 2u);
    EXPECT_DOUBLE_EQ(metrics.pause_success_rate, 100.0);
    EXPECT_DOUBLE_EQ(metrics.resume_success_rate, 100.0);
    EXPECT_LE(metrics.shortest_pause, metrics.longest_pause);
    EXPECT_GE(coordinator.getPauseState().total_pause_duration, 20ms);

    auto data = coordinator.exportData();
    EXPECT_EQ(data["metrics"]["total_pauses"], 2);
    EXPECT_EQ(data["state"]["is_paused"], false);
    EXPECT_EQ(data["capabilities"]["current_state"], "running");

    coordinator.resetStatistics();
    EXPECT_EQ(coordinator.getMetrics().total_pauses, 0u);
}
