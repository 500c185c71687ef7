// EN: Implementation of the ChunkProcessor: dispatch loop, worker attempts, timeout and retry handling.
// FR: Implémentation du ChunkProcessor : boucle de dispatch, tentatives sur workers, timeout et retry.

#include "streaming/chunk_processor.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "streaming/memory_manager.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace GCS {

namespace {

// EN: Share of failed lines above which a completed chunk is flagged.
// FR: Part de lignes en échec au-delà de laquelle un chunk terminé est signalé.
constexpr double kValidationFailureRate = 0.10;

uint64_t chunkBytes(const Chunk& chunk) {
    if (chunk.byte_length > 0) {
        return chunk.byte_length;
    }
    uint64_t bytes = 0;
    for (const auto& line : chunk.lines) {
        bytes += line.size() + 1;
    }
    return bytes;
}

} // namespace

ChunkProcessor::ChunkProcessor(IStreamingManager& streaming_manager,
                               const ChunkProcessorConfig& config,
                               MemoryManager* memory_manager)
    : streaming_manager_(streaming_manager), config_(config), memory_manager_(memory_manager) {
    if (config_.max_concurrent_chunks == 0) {
        throw ConfigurationError("max_concurrent_chunks must be at least 1");
    }
    if (config_.chunk_timeout.count() <= 0) {
        throw ConfigurationError("chunk_timeout must be positive");
    }
    if (config_.line_failure_tolerance < 0.0 || config_.line_failure_tolerance > 1.0) {
        throw ConfigurationError("line_failure_tolerance must be within [0, 1]");
    }

    metrics_.created_at = std::chrono::system_clock::now();

    ThreadPoolConfig pool_config;
    pool_config.worker_count = config_.max_concurrent_chunks;
    pool_config.name = "threadpool";
    pool_ = std::make_unique<ThreadPool>(pool_config);

    if (config_.max_concurrent_chunks > 1) {
        LOG_WARN("chunk_processor", "Up to " + std::to_string(config_.max_concurrent_chunks) +
                 " chunks in flight: the streaming manager must serialize sends on a single-command channel");
    }
}

ChunkProcessor::~ChunkProcessor() {
    if (stop()) {
        LOG_DEBUG("chunk_processor", "Processing stopped on destruction");
    }
    pool_.reset();
}

ProcessingSummary ChunkProcessor::startProcessing(std::vector<Chunk> chunks, const ProcessingOptions& options) {
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.is_processing) {
            throw ProcessingStateError("Chunk processing already in progress");
        }

        chunks_.clear();
        chunks_.reserve(chunks.size());
        for (auto& chunk : chunks) {
            chunks_.push_back(std::make_shared<const Chunk>(std::move(chunk)));
        }
        settled_.assign(chunks_.size(), false);
        watermark_ = 0;
        queue_.clear();
        retry_queue_.clear();
        active_.clear();
        retry_counts_.clear();
        completed_chunks_.clear();
        failed_chunks_.clear();
        run_retry_attempts_ = 0;
        line_loader_ = options.line_loader;
        paused_ = false;
        stop_requested_ = false;

        state_ = ProcessingState{};
        state_.is_processing = true;
        state_.total_chunks = chunks_.size();
        state_.current_chunk_index = chunks_.empty() ? 0 : chunks_.front()->index;
        state_.start_time = std::chrono::system_clock::now();
        run_started_ = std::chrono::steady_clock::now();

        const std::unordered_set<size_t> requeued(options.retry_indices.begin(), options.retry_indices.end());
        for (size_t position = 0; position < chunks_.size(); ++position) {
            const size_t index = chunks_[position]->index;
            if (index < options.start_index && requeued.count(index) == 0) {
                state_.skipped_chunks++;
                settleLocked(position);
            } else {
                queue_.push_back(position);
            }
        }
        events.push_back(makeEventLocked(ProcessorEventType::PROCESSING_STARTED, std::nullopt, 0,
                                         "Processing " + std::to_string(queue_.size()) + " chunks"));
    }

    LOG_INFO_META("chunk_processor", "Chunk processing started", (std::unordered_map<std::string, std::string>{
        {"total_chunks", std::to_string(chunks.size())},
        {"start_index", std::to_string(options.start_index)},
        {"requeued", std::to_string(options.retry_indices.size())},
        {"max_concurrent", std::to_string(config_.max_concurrent_chunks)}}));
    emit(events);
    events.clear();

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        expireTimedOutLocked(events);

        if (!paused_) {
            while (!stop_requested_ && active_.size() < config_.max_concurrent_chunks &&
                   (!queue_.empty() || !retry_queue_.empty())) {
                const bool is_retry = queue_.empty();
                const size_t position = is_retry ? retry_queue_.front() : queue_.front();

                // EN: Under memory pressure, let in-flight chunks drain before adding more.
                // FR: Sous pression mémoire, laisse les chunks en vol se vider avant d'en ajouter.
                if (memory_manager_ && !active_.empty() &&
                    !memory_manager_->isMemoryAvailable(chunkBytes(*chunks_[position]))) {
                    LOG_DEBUG("chunk_processor", "Dispatch deferred until memory is released");
                    break;
                }

                if (is_retry) {
                    retry_queue_.pop_front();
                } else {
                    queue_.pop_front();
                }
                dispatchLocked(position, is_retry, events);
            }
        }

        if (queue_.empty() && retry_queue_.empty() && active_.empty() && pending_emits_ == 0) {
            break;
        }

        if (!events.empty()) {
            lock.unlock();
            emit(events);
            events.clear();
            lock.lock();
            continue;
        }

        auto deadline = std::chrono::steady_clock::time_point::max();
        for (const auto& entry : active_) {
            deadline = std::min(deadline, entry.second.deadline);
        }
        if (deadline == std::chrono::steady_clock::time_point::max()) {
            cv_.wait(lock);
        } else {
            cv_.wait_until(lock, deadline);
        }
    }

    const bool stopped = stop_requested_;
    paused_ = false;
    state_.is_paused = false;
    state_.is_processing = false;
    ProcessingSummary summary = buildSummaryLocked();
    summary.stopped = stopped;
    if (!stopped) {
        events.push_back(makeEventLocked(ProcessorEventType::PROCESSING_COMPLETED, std::nullopt, 0,
                                         "Processing completed"));
    }
    lock.unlock();
    cv_.notify_all();
    emit(events);

    LOG_INFO_META("chunk_processor", stopped ? "Chunk processing stopped" : "Chunk processing completed",
                  (std::unordered_map<std::string, std::string>{
                      {"completed", std::to_string(summary.completed_chunks)},
                      {"failed", std::to_string(summary.failed_chunks)},
                      {"retries", std::to_string(summary.retry_attempts)},
                      {"duration_ms", std::to_string(summary.duration.count())}}));
    return summary;
}

void ChunkProcessor::dispatchLocked(size_t position, bool is_retry, EventList& events) {
    const std::shared_ptr<const Chunk> chunk = chunks_[position];
    const uint64_t attempt_id = next_attempt_id_++;

    ActiveAttempt attempt;
    attempt.position = position;
    auto retries = retry_counts_.find(chunk->index);
    attempt.attempt = (retries == retry_counts_.end() ? 0 : retries->second) + 1;
    attempt.cancelled = std::make_shared<std::atomic<bool>>(false);
    if (memory_manager_) {
        attempt.tracked_bytes = chunkBytes(*chunk);
        memory_manager_->trackChunkMemory(chunk->index, attempt.tracked_bytes);
    }

    auto cancelled = attempt.cancelled;
    const size_t attempt_number = attempt.attempt;
    active_.emplace(attempt_id, std::move(attempt));
    metrics_.max_concurrency_reached = std::max(metrics_.max_concurrency_reached, active_.size());
    events.push_back(makeEventLocked(ProcessorEventType::CHUNK_STARTED, position, attempt_number,
                                     is_retry ? "retry" : "first attempt"));

    try {
        pool_->submitNamed("chunk_" + std::to_string(chunk->index),
                           is_retry ? TaskPriority::HIGH : TaskPriority::NORMAL,
                           [this, attempt_id, chunk, cancelled]() { runAttempt(attempt_id, chunk, cancelled); });
    } catch (const std::exception& e) {
        auto it = active_.find(attempt_id);
        releaseLocked(it->second);
        active_.erase(it);

        ChunkResult result;
        result.chunk_index = chunk->index;
        result.attempt = attempt_number;
        result.error = std::string("worker pool rejected chunk: ") + e.what();
        handleFailureLocked(position, std::move(result), events);
    }
}

void ChunkProcessor::runAttempt(uint64_t attempt_id, std::shared_ptr<const Chunk> chunk,
                                std::shared_ptr<std::atomic<bool>> cancelled) {
    ChunkResult result;
    result.chunk_index = chunk->index;
    std::function<std::vector<std::string>(const Chunk&)> loader;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(attempt_id);
        if (it == active_.end() || cancelled->load()) {
            return;
        }
        it->second.deadline = std::chrono::steady_clock::now() + config_.chunk_timeout;
        result.attempt = it->second.attempt;
        loader = line_loader_;
    }
    cv_.notify_all();

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::string> loaded;
    const std::vector<std::string>* lines = &chunk->lines;
    std::optional<std::string> load_error;
    if (chunk->lines.empty() && chunk->line_count > 0) {
        if (!loader) {
            load_error = "no retained lines and no line loader";
        } else {
            try {
                loaded = loader(*chunk);
                lines = &loaded;
            } catch (const std::exception& e) {
                load_error = std::string("line loader failed: ") + e.what();
            }
        }
    }

    // EN: Lines of one chunk go out strictly in order; a failed line does not stop the chunk.
    // FR: Les lignes d'un chunk partent strictement dans l'ordre ; une ligne en échec n'arrête pas le chunk.
    if (!load_error) {
        for (size_t i = 0; i < lines->size(); ++i) {
            if (cancelled->load()) {
                break;
            }
            LineContext context;
            context.line_number = chunk->start_line + i;
            context.chunk_index = chunk->index;
            context.is_last_line_in_chunk = (i + 1 == lines->size());
            try {
                streaming_manager_.sendLine((*lines)[i], context);
                result.lines_sent++;
            } catch (const std::exception& e) {
                result.lines_failed++;
                result.line_failures.push_back(LineFailure{context.line_number, e.what()});
            }
        }
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(attempt_id);
        if (it == active_.end()) {
            metrics_.late_results_discarded++;
            LOG_DEBUG("chunk_processor", "Discarding late result for chunk " + std::to_string(chunk->index));
            return;
        }
        const size_t position = it->second.position;
        releaseLocked(it->second);
        active_.erase(it);

        const size_t total = lines->size();
        if (load_error) {
            result.error = ChunkExecutionError(chunk->index, 0, chunk->line_count, *load_error).what();
            handleFailureLocked(position, std::move(result), events);
        } else if (total > 0 &&
                   static_cast<double>(result.lines_failed) / static_cast<double>(total) > config_.line_failure_tolerance) {
            result.error = ChunkExecutionError(chunk->index, result.lines_failed, total,
                                               result.line_failures.back().error).what();
            handleFailureLocked(position, std::move(result), events);
        } else {
            result.success = true;
            handleSuccessLocked(position, result, events);
        }
        pending_emits_++;
    }
    cv_.notify_all();
    emit(events);

    // EN: The run only ends once chunk events from workers have reached the listeners.
    // FR: Le run ne se termine qu'une fois les événements des workers remis aux listeners.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_emits_--;
    }
    cv_.notify_all();
}

void ChunkProcessor::expireTimedOutLocked(EventList& events) {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second.deadline > now) {
            ++it;
            continue;
        }

        // EN: The worker notices the flag at its next line boundary; its result is then discarded.
        // FR: Le worker voit le drapeau à la prochaine frontière de ligne ; son résultat est ignoré.
        ActiveAttempt attempt = it->second;
        attempt.cancelled->store(true);
        releaseLocked(attempt);
        it = active_.erase(it);

        const size_t index = chunks_[attempt.position]->index;
        ChunkResult result;
        result.chunk_index = index;
        result.attempt = attempt.attempt;
        result.timed_out = true;
        result.duration = config_.chunk_timeout;
        result.error = ChunkTimeoutError(index, config_.chunk_timeout).what();
        handleFailureLocked(attempt.position, std::move(result), events);
    }
}

void ChunkProcessor::handleSuccessLocked(size_t position, const ChunkResult& result, EventList& events) {
    recordAttemptLocked(result);
    const Chunk& chunk = *chunks_[position];

    settleLocked(position);
    completed_chunks_.push_back(chunk.index);
    state_.processed_chunks++;
    metrics_.chunks_successful++;

    if (config_.validate_chunk_completion) {
        if (result.lines_sent + result.lines_failed != chunk.line_count) {
            const std::string message = "Line count mismatch: " + std::to_string(result.lines_sent) + " sent + " +
                                        std::to_string(result.lines_failed) + " failed != " +
                                        std::to_string(chunk.line_count) + " declared";
            LOG_WARN("chunk_processor", "Chunk " + std::to_string(chunk.index) + ": " + message);
            events.push_back(makeEventLocked(ProcessorEventType::CHUNK_VALIDATION_WARNING, position, result.attempt, message));
        }
        if (chunk.line_count > 0 &&
            static_cast<double>(result.lines_failed) / static_cast<double>(chunk.line_count) > kValidationFailureRate) {
            const std::string message = "High line failure rate: " + std::to_string(result.lines_failed) + "/" +
                                        std::to_string(chunk.line_count);
            LOG_WARN("chunk_processor", "Chunk " + std::to_string(chunk.index) + ": " + message);
            events.push_back(makeEventLocked(ProcessorEventType::CHUNK_VALIDATION_WARNING, position, result.attempt, message));
        }
    }

    LOG_DEBUG("chunk_processor", "Chunk " + std::to_string(chunk.index) + " completed in " +
              std::to_string(result.duration.count()) + "ms");
    events.push_back(makeEventLocked(ProcessorEventType::CHUNK_COMPLETED, position, result.attempt, "", result));
}

void ChunkProcessor::handleFailureLocked(size_t position, ChunkResult result, EventList& events) {
    recordAttemptLocked(result);
    const size_t index = chunks_[position]->index;
    const std::string error = result.error.value_or("unknown error");

    size_t& retries = retry_counts_[index];
    if (config_.retry_failed_chunks && retries < config_.max_chunk_retries && !stop_requested_) {
        retries++;
        run_retry_attempts_++;
        metrics_.chunks_retried++;
        retry_queue_.push_back(position);

        LOG_WARN_META("chunk_processor", "Chunk queued for retry", (std::unordered_map<std::string, std::string>{
            {"chunk", std::to_string(index)},
            {"retry", std::to_string(retries) + "/" + std::to_string(config_.max_chunk_retries)},
            {"error", error}}));
        events.push_back(makeEventLocked(ProcessorEventType::CHUNK_RETRY_QUEUED, position, retries, error, std::move(result)));
        return;
    }

    const size_t attempts = result.attempt;
    settleLocked(position);
    failed_chunks_.push_back(index);
    state_.failed_chunks++;
    metrics_.chunks_failed++;

    LOG_ERROR_META("chunk_processor", "Chunk permanently failed", (std::unordered_map<std::string, std::string>{
        {"chunk", std::to_string(index)},
        {"attempts", std::to_string(attempts)},
        {"error", error}}));
    events.push_back(makeEventLocked(ProcessorEventType::CHUNK_FAILED, position, attempts, error, std::move(result)));
}

void ChunkProcessor::settleLocked(size_t position) {
    settled_[position] = true;
    while (watermark_ < chunks_.size() && settled_[watermark_]) {
        state_.lines_settled += chunks_[watermark_]->line_count;
        state_.bytes_settled += chunks_[watermark_]->byte_length;
        ++watermark_;
    }
    state_.current_chunk_index = watermark_ < chunks_.size()
        ? chunks_[watermark_]->index
        : (chunks_.empty() ? 0 : chunks_.back()->index + 1);
}

void ChunkProcessor::releaseLocked(const ActiveAttempt& attempt) {
    if (memory_manager_) {
        memory_manager_->releaseChunkMemory(chunks_[attempt.position]->index);
    }
}

void ChunkProcessor::recordAttemptLocked(const ChunkResult& result) {
    metrics_.attempts_finished++;
    metrics_.lines_sent += result.lines_sent;
    metrics_.lines_failed += result.lines_failed;
    if (result.timed_out) {
        metrics_.timeouts++;
    }
    total_chunk_time_ms_ += static_cast<double>(result.duration.count());
}

ProcessingSummary ChunkProcessor::buildSummaryLocked() const {
    ProcessingSummary summary;
    summary.total_chunks = chunks_.size();
    summary.completed_chunks = completed_chunks_.size();
    summary.failed_chunks = failed_chunks_.size();
    summary.skipped_chunks = state_.skipped_chunks;
    summary.retry_attempts = run_retry_attempts_;
    summary.failed_chunk_indices = failed_chunks_;
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - run_started_);
    return summary;
}

ProcessingState ChunkProcessor::snapshotLocked() const {
    ProcessingState state = state_;
    state.is_paused = paused_;
    return state;
}

ProcessorEvent ChunkProcessor::makeEventLocked(ProcessorEventType type, std::optional<size_t> position,
                                               size_t attempt, std::string message,
                                               std::optional<ChunkResult> result) const {
    ProcessorEvent event;
    event.type = type;
    if (position) {
        event.chunk_index = chunks_[*position]->index;
    }
    event.attempt = attempt;
    event.message = std::move(message);
    event.result = std::move(result);
    event.state = snapshotLocked();
    return event;
}

bool ChunkProcessor::pause() {
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is_processing || paused_ || stop_requested_) {
            return false;
        }
        paused_ = true;
        state_.is_paused = true;
        events.push_back(makeEventLocked(ProcessorEventType::PROCESSING_PAUSED, std::nullopt, 0,
                                         std::to_string(active_.size()) + " chunks still active"));
    }
    cv_.notify_all();
    LOG_INFO("chunk_processor", "Processing paused");
    emit(events);
    return true;
}

bool ChunkProcessor::resume() {
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is_processing || !paused_) {
            return false;
        }
        paused_ = false;
        state_.is_paused = false;
        events.push_back(makeEventLocked(ProcessorEventType::PROCESSING_RESUMED, std::nullopt, 0, ""));
    }
    cv_.notify_all();
    LOG_INFO("chunk_processor", "Processing resumed");
    emit(events);
    return true;
}

std::optional<ProcessingSummary> ChunkProcessor::stop() {
    EventList events;
    ProcessingSummary summary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is_processing || stop_requested_) {
            return std::nullopt;
        }
        stop_requested_ = true;
        for (auto& entry : active_) {
            entry.second.cancelled->store(true);
            releaseLocked(entry.second);
        }
        const size_t cancelled = active_.size();
        active_.clear();
        queue_.clear();
        retry_queue_.clear();
        paused_ = false;
        state_.is_paused = false;

        summary = buildSummaryLocked();
        summary.stopped = true;
        events.push_back(makeEventLocked(ProcessorEventType::PROCESSING_STOPPED, std::nullopt, 0,
                                         std::to_string(cancelled) + " active chunks cancelled"));
    }
    cv_.notify_all();
    LOG_INFO("chunk_processor", "Processing stop requested");
    emit(events);
    return summary;
}

bool ChunkProcessor::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return active_.empty(); });
}

bool ChunkProcessor::isProcessing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.is_processing;
}

ProcessingState ChunkProcessor::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

ProcessorStatus ChunkProcessor::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProcessorStatus status;
    status.state = snapshotLocked();
    const size_t settled = state_.processed_chunks + state_.failed_chunks + state_.skipped_chunks;
    status.progress_percent = state_.total_chunks > 0
        ? static_cast<double>(settled) * 100.0 / static_cast<double>(state_.total_chunks) : 0.0;
    status.queued_chunks = queue_.size();
    status.retry_queued_chunks = retry_queue_.size();
    status.active_chunks = active_.size();
    return status;
}

ProcessorMetrics ChunkProcessor::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProcessorMetrics metrics = metrics_;
    if (metrics.attempts_finished > 0) {
        metrics.average_chunk_time_ms = total_chunk_time_ms_ / static_cast<double>(metrics.attempts_finished);
    }
    const size_t settled = metrics.chunks_successful + metrics.chunks_failed;
    if (settled > 0) {
        metrics.success_rate = static_cast<double>(metrics.chunks_successful) * 100.0 / static_cast<double>(settled);
        metrics.failure_rate = static_cast<double>(metrics.chunks_failed) * 100.0 / static_cast<double>(settled);
    }
    return metrics;
}

std::vector<size_t> ChunkProcessor::getCompletedChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_chunks_;
}

std::map<size_t, size_t> ChunkProcessor::getRetryCounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_counts_;
}

std::vector<size_t> ChunkProcessor::getFailedChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_chunks_;
}

nlohmann::json ChunkProcessor::exportData() const {
    const ProcessorStatus status = getStatus();
    const ProcessorMetrics metrics = getMetrics();

    nlohmann::json retry_counts = nlohmann::json::object();
    for (const auto& [index, count] : getRetryCounts()) {
        retry_counts[std::to_string(index)] = count;
    }

    nlohmann::json data;
    data["state"] = {
        {"is_processing", status.state.is_processing},
        {"is_paused", status.state.is_paused},
        {"current_chunk_index", status.state.current_chunk_index},
        {"total_chunks", status.state.total_chunks},
        {"processed_chunks", status.state.processed_chunks},
        {"failed_chunks", status.state.failed_chunks},
        {"skipped_chunks", status.state.skipped_chunks},
        {"lines_settled", status.state.lines_settled},
        {"progress_percent", status.progress_percent},
        {"queued_chunks", status.queued_chunks},
        {"retry_queued_chunks", status.retry_queued_chunks},
        {"active_chunks", status.active_chunks}
    };
    data["metrics"] = {
        {"attempts_finished", metrics.attempts_finished},
        {"chunks_successful", metrics.chunks_successful},
        {"chunks_failed", metrics.chunks_failed},
        {"chunks_retried", metrics.chunks_retried},
        {"timeouts", metrics.timeouts},
        {"late_results_discarded", metrics.late_results_discarded},
        {"lines_sent", metrics.lines_sent},
        {"lines_failed", metrics.lines_failed},
        {"average_chunk_time_ms", metrics.average_chunk_time_ms},
        {"max_concurrency_reached", metrics.max_concurrency_reached},
        {"success_rate", metrics.success_rate},
        {"failure_rate", metrics.failure_rate}
    };
    data["completed_chunks"] = getCompletedChunks();
    data["failed_chunks"] = getFailedChunks();
    data["retry_counts"] = retry_counts;
    data["config"] = {
        {"max_concurrent_chunks", config_.max_concurrent_chunks},
        {"retry_failed_chunks", config_.retry_failed_chunks},
        {"max_chunk_retries", config_.max_chunk_retries},
        {"chunk_timeout_ms", config_.chunk_timeout.count()},
        {"validate_chunk_completion", config_.validate_chunk_completion},
        {"line_failure_tolerance", config_.line_failure_tolerance}
    };
    return data;
}

void ChunkProcessor::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = ProcessorMetrics{};
    metrics_.created_at = std::chrono::system_clock::now();
    total_chunk_time_ms_ = 0.0;
}

void ChunkProcessor::addEventListener(const std::string& listener_id, EventCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_[listener_id] = std::move(callback);
}

void ChunkProcessor::removeEventListener(const std::string& listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

void ChunkProcessor::emit(const EventList& events) {
    if (events.empty()) {
        return;
    }
    std::map<std::string, EventCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& event : events) {
        for (const auto& [id, callback] : listeners) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                LOG_ERROR("chunk_processor", "Listener '" + id + "' threw: " + std::string(e.what()));
            }
        }
    }
}

} // namespace GCS
