// EN: Implementation of StreamPauseResume.
// FR: Implémentation de StreamPauseResume.

#include "streaming/stream_pause_resume.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace GCS {

namespace {

std::string joinIds(const std::set<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += id;
    }
    return joined;
}

int64_t toEpochMs(std::chrono::system_clock::time_point time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

} // namespace

StreamPauseResume::StreamPauseResume(const PauseResumeConfig& config) : config_(config) {
    metrics_.created_at = std::chrono::system_clock::now();
}

StreamPauseResume::~StreamPauseResume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    watchdog_cv_.notify_all();
    state_cv_.notify_all();

    std::lock_guard<std::mutex> guard(watchdog_mutex_);
    const auto self = std::this_thread::get_id();
    if (watchdog_thread_.joinable() && watchdog_thread_.get_id() != self) {
        watchdog_thread_.join();
    }
    for (auto& thread : retired_watchdogs_) {
        if (thread.joinable() && thread.get_id() != self) {
            thread.join();
        }
    }
}

PauseResult StreamPauseResume::requestPause(const std::string& reason, const PauseOptions& options) {
    const bool graceful = options.graceful && config_.enable_graceful_pause;
    bool wait_for_acks = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enable_pause_resume) {
            return PauseResult{false, "disabled", std::nullopt};
        }
        if (is_paused_ || pause_in_progress_) {
            return PauseResult{false, "already_paused", std::nullopt};
        }
        pause_in_progress_ = true;
        if (graceful) {
            pending_acks_ = participants_;
            wait_for_acks = !pending_acks_.empty();
        }
    }

    LOG_INFO_META("pause_resume", "Pause requested", (std::unordered_map<std::string, std::string>{
        {"reason", reason}, {"graceful", graceful ? "true" : "false"}}));

    if (graceful) {
        const auto deadline = std::chrono::steady_clock::now() + config_.pause_timeout;
        emit(PauseEvent{PauseEventType::PAUSE_REQUESTED, reason, true, std::chrono::system_clock::now(), std::nullopt});

        if (wait_for_acks) {
            std::unique_lock<std::mutex> lock(mutex_);
            bool acknowledged = state_cv_.wait_until(lock, deadline, [this] {
                return pending_acks_.empty() || shutting_down_;
            });
            if (!acknowledged || shutting_down_) {
                const std::string missing = joinIds(pending_acks_);
                pending_acks_.clear();
                pause_in_progress_ = false;
                metrics_.failed_pauses++;
                lock.unlock();
                state_cv_.notify_all();

                LOG_WARN("pause_resume", "Pause not acknowledged in time by: " + missing);
                emit(PauseEvent{PauseEventType::PAUSE_FAILED, "pause_timeout", true,
                                std::chrono::system_clock::now(), std::nullopt});
                return PauseResult{false, "pause_timeout", std::nullopt};
            }
        }
    }

    const auto pause_time = std::chrono::system_clock::now();
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_paused_ = true;
        pause_in_progress_ = false;
        pause_time_ = pause_time;
        pause_started_ = std::chrono::steady_clock::now();
        pause_reason_ = reason;
        state_expected_ = options.preserve_state && config_.save_state_on_pause;
        if (state_expected_) {
            saved_state_ = SavedPauseState{pause_time, reason};
        } else {
            saved_state_.reset();
        }
        metrics_.total_pauses++;
        generation = ++watchdog_generation_;
    }
    state_cv_.notify_all();

    emit(PauseEvent{PauseEventType::PAUSE_EXECUTE, reason, graceful, pause_time, std::nullopt});
    emit(PauseEvent{PauseEventType::STREAM_PAUSED, reason, graceful, pause_time, std::nullopt});
    armWatchdog(generation);

    LOG_INFO("pause_resume", "Stream paused (" + reason + ")");
    return PauseResult{true, "", pause_time};
}

ResumeResult StreamPauseResume::requestResume(const ResumeOptions& options) {
    std::chrono::milliseconds pause_duration{0};
    std::string pause_reason;

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!config_.enable_pause_resume) {
            return ResumeResult{false, "disabled", std::nullopt, std::nullopt};
        }
        if (pause_in_progress_) {
            state_cv_.wait_for(lock, config_.resume_timeout, [this] {
                return !pause_in_progress_ || shutting_down_;
            });
        }
        if (is_resuming_) {
            return ResumeResult{false, "resume_in_progress", std::nullopt, std::nullopt};
        }
        if (!is_paused_) {
            return ResumeResult{false, "not_paused", std::nullopt, std::nullopt};
        }

        is_resuming_ = true;
        pause_reason = pause_reason_;
        pause_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pause_started_);

        if (options.validate_state && config_.validate_state_on_resume && !options.forced &&
            !validateSavedStateLocked(pause_duration)) {
            is_resuming_ = false;
            metrics_.failed_resumes++;
            lock.unlock();
            LOG_ERROR("pause_resume", "Saved pause state is invalid, stream stays paused");
            emit(PauseEvent{PauseEventType::RESUME_FAILED, "invalid_state", false,
                            std::chrono::system_clock::now(), pause_duration});
            return ResumeResult{false, "invalid_state", std::nullopt, std::nullopt};
        }
    }

    emit(PauseEvent{PauseEventType::RESUME_EXECUTE, pause_reason, false, std::chrono::system_clock::now(), pause_duration});

    const auto resume_time = std::chrono::system_clock::now();
    std::vector<ResumeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_paused_ = false;
        is_resuming_ = false;
        pause_time_.reset();
        saved_state_.reset();
        state_expected_ = false;
        pause_reason_.clear();
        total_pause_duration_ += pause_duration;

        metrics_.total_resumes++;
        if (options.forced) {
            metrics_.forced_resumes++;
        }
        metrics_.longest_pause = std::max(metrics_.longest_pause, pause_duration);
        metrics_.shortest_pause = metrics_.total_resumes == 1
            ? pause_duration : std::min(metrics_.shortest_pause, pause_duration);
        callbacks.swap(resume_callbacks_);
    }
    watchdog_cv_.notify_all();
    state_cv_.notify_all();

    const ResumeInfo info{pause_duration, resume_time};
    for (const auto& callback : callbacks) {
        try {
            callback(info);
        } catch (const std::exception& e) {
            LOG_WARN("pause_resume", "Resume callback failed: " + std::string(e.what()));
        }
    }

    emit(PauseEvent{PauseEventType::STREAM_RESUMED, pause_reason, false, resume_time, pause_duration});
    LOG_INFO_META("pause_resume", options.forced ? "Stream force-resumed" : "Stream resumed",
                  (std::unordered_map<std::string, std::string>{
                      {"pause_duration_ms", std::to_string(pause_duration.count())}}));
    return ResumeResult{true, "", resume_time, pause_duration};
}

bool StreamPauseResume::validateSavedStateLocked(std::chrono::milliseconds pause_duration) const {
    if (state_expected_) {
        if (!saved_state_) {
            return false;
        }
        if (saved_state_->timestamp > std::chrono::system_clock::now() ||
            saved_state_->timestamp.time_since_epoch().count() <= 0) {
            return false;
        }
    }
    if (pause_duration > config_.max_pause_duration) {
        LOG_WARN("pause_resume", "Pause lasted " + std::to_string(pause_duration.count()) +
                 "ms, above the " + std::to_string(config_.max_pause_duration.count()) + "ms limit");
    }
    return true;
}

void StreamPauseResume::armWatchdog(uint64_t generation) {
    std::lock_guard<std::mutex> guard(watchdog_mutex_);
    if (watchdog_thread_.joinable()) {
        // EN: A resume callback may pause again from the watchdog thread itself.
        // FR: Un callback de reprise peut relancer une pause depuis le thread du chien de garde.
        if (watchdog_thread_.get_id() == std::this_thread::get_id()) {
            retired_watchdogs_.push_back(std::move(watchdog_thread_));
        } else {
            watchdog_thread_.join();
        }
    }
    watchdog_thread_ = std::thread(&StreamPauseResume::watchdogLoop, this, generation);
}

void StreamPauseResume::watchdogLoop(uint64_t generation) {
    std::chrono::milliseconds pause_duration{0};
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool cancelled = watchdog_cv_.wait_for(lock, config_.max_pause_duration, [this, generation] {
            return shutting_down_ || !is_paused_ || watchdog_generation_ != generation;
        });
        if (cancelled || is_resuming_) {
            return;
        }
        pause_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pause_started_);
    }

    LOG_WARN("pause_resume", "Pause duration exceeded maximum limit, forcing resume");
    emit(PauseEvent{PauseEventType::PAUSE_TIMEOUT_EXCEEDED, "max_pause_duration", false,
                    std::chrono::system_clock::now(), pause_duration});

    ResumeOptions forced;
    forced.validate_state = false;
    forced.forced = true;
    ResumeResult result = requestResume(forced);
    if (!result.success) {
        LOG_DEBUG("pause_resume", "Forced resume skipped: " + result.reason);
    }
}

void StreamPauseResume::addPauseParticipant(const std::string& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    participants_.insert(participant_id);
}

void StreamPauseResume::removePauseParticipant(const std::string& participant_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        participants_.erase(participant_id);
        pending_acks_.erase(participant_id);
    }
    state_cv_.notify_all();
}

bool StreamPauseResume::acknowledgePause(const std::string& participant_id) {
    bool acknowledged = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        acknowledged = pending_acks_.erase(participant_id) > 0;
    }
    if (acknowledged) {
        state_cv_.notify_all();
    }
    return acknowledged;
}

void StreamPauseResume::addResumeCallback(ResumeCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    resume_callbacks_.push_back(std::move(callback));
}

bool StreamPauseResume::canPause() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.enable_pause_resume && !is_paused_ && !is_resuming_ && !pause_in_progress_;
}

bool StreamPauseResume::canResume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.enable_pause_resume && is_paused_ && !is_resuming_;
}

bool StreamPauseResume::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_paused_;
}

PauseCapabilities StreamPauseResume::getCapabilities() const {
    PauseCapabilities capabilities;
    capabilities.can_pause = canPause();
    capabilities.can_resume = canResume();
    capabilities.enable_pause_resume = config_.enable_pause_resume;
    capabilities.enable_graceful_pause = config_.enable_graceful_pause;
    capabilities.max_pause_duration = config_.max_pause_duration;
    capabilities.current_state = isPaused() ? "paused" : "running";
    return capabilities;
}

PauseState StreamPauseResume::getPauseState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PauseState state;
    state.is_paused = is_paused_;
    state.is_resuming = is_resuming_;
    state.pause_time = pause_time_;
    state.pause_reason = pause_reason_;
    state.saved_state = saved_state_;
    state.total_pause_duration = total_pause_duration_;
    if (is_paused_) {
        state.current_pause_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pause_started_);
    }
    return state;
}

PauseMetrics StreamPauseResume::buildMetricsLocked() const {
    PauseMetrics metrics = metrics_;
    const size_t pause_attempts = metrics.total_pauses + metrics.failed_pauses;
    const size_t resume_attempts = metrics.total_resumes + metrics.failed_resumes;
    metrics.pause_success_rate = pause_attempts > 0
        ? static_cast<double>(metrics.total_pauses) * 100.0 / static_cast<double>(pause_attempts) : 0.0;
    metrics.resume_success_rate = resume_attempts > 0
        ? static_cast<double>(metrics.total_resumes) * 100.0 / static_cast<double>(resume_attempts) : 0.0;
    if (metrics.total_resumes > 0) {
        metrics.average_pause = total_pause_duration_ / static_cast<long>(metrics.total_resumes);
    }
    return metrics;
}

PauseMetrics StreamPauseResume::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buildMetricsLocked();
}

nlohmann::json StreamPauseResume::exportData() const {
    const PauseState state = getPauseState();
    const PauseMetrics metrics = getMetrics();
    const PauseCapabilities capabilities = getCapabilities();

    nlohmann::json data;
    data["state"] = {
        {"is_paused", state.is_paused},
        {"is_resuming", state.is_resuming},
        {"pause_reason", state.pause_reason},
        {"pause_time", state.pause_time ? nlohmann::json(toEpochMs(*state.pause_time)) : nlohmann::json(nullptr)},
        {"current_pause_duration_ms", state.current_pause_duration.count()},
        {"total_pause_duration_ms", state.total_pause_duration.count()}
    };
    data["metrics"] = {
        {"total_pauses", metrics.total_pauses},
        {"total_resumes", metrics.total_resumes},
        {"failed_pauses", metrics.failed_pauses},
        {"failed_resumes", metrics.failed_resumes},
        {"forced_resumes", metrics.forced_resumes},
        {"pause_success_rate", metrics.pause_success_rate},
        {"resume_success_rate", metrics.resume_success_rate},
        {"longest_pause_ms", metrics.longest_pause.count()},
        {"shortest_pause_ms", metrics.shortest_pause.count()},
        {"average_pause_ms", metrics.average_pause.count()}
    };
    data["capabilities"] = {
        {"can_pause", capabilities.can_pause},
        {"can_resume", capabilities.can_resume},
        {"current_state", capabilities.current_state}
    };
    data["config"] = {
        {"enable_pause_resume", config_.enable_pause_resume},
        {"enable_graceful_pause", config_.enable_graceful_pause},
        {"pause_timeout_ms", config_.pause_timeout.count()},
        {"resume_timeout_ms", config_.resume_timeout.count()},
        {"max_pause_duration_ms", config_.max_pause_duration.count()},
        {"save_state_on_pause", config_.save_state_on_pause},
        {"validate_state_on_resume", config_.validate_state_on_resume}
    };
    return data;
}

void StreamPauseResume::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = PauseMetrics{};
    metrics_.created_at = std::chrono::system_clock::now();
    total_pause_duration_ = std::chrono::milliseconds{0};
}

void StreamPauseResume::addEventListener(const std::string& listener_id, EventCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_[listener_id] = std::move(callback);
}

void StreamPauseResume::removeEventListener(const std::string& listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

void StreamPauseResume::emit(const PauseEvent& event) {
    std::map<std::string, EventCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& [id, callback] : listeners) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LOG_ERROR("pause_resume", "Listener '" + id + "' threw: " + std::string(e.what()));
        }
    }
}

} // namespace GCS
