// EN: Implementation of the ChunkedFileStreamer orchestration.
// FR: Implémentation de l'orchestration du ChunkedFileStreamer.

#include "streaming/chunked_file_streamer.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace GCS {

namespace {

constexpr const char* kListenerId = "streamer";

double percent(uint64_t part, uint64_t total) {
    return total > 0 ? static_cast<double>(part) * 100.0 / static_cast<double>(total) : 0.0;
}

} // namespace

ChunkedFileStreamer::ChunkedFileStreamer(IStreamingManager& streaming_manager, const StreamingConfig& config,
                                         MemoryManager::MemorySampler sampler)
    : config_(config),
      streaming_manager_(streaming_manager),
      analyzer_(config_.analysis),
      memory_manager_(config_.memory, std::move(sampler)),
      checkpoint_manager_(config_.checkpoint),
      processor_(streaming_manager_, config_.processing, &memory_manager_),
      pause_resume_(config_.pause) {
    StreamingConfigLoader::validate(config_);

    pause_resume_.addPauseParticipant(kPauseParticipant);
    pause_resume_.addEventListener(kListenerId, [this](const PauseEvent& event) { onPauseEvent(event); });
    processor_.addEventListener(kListenerId, [this](const ProcessorEvent& event) { onProcessorEvent(event); });
}

ChunkedFileStreamer::~ChunkedFileStreamer() {
    pause_resume_.removeEventListener(kListenerId);
    processor_.removeEventListener(kListenerId);
    if (processor_.stop()) {
        LOG_WARN("streamer", "Streamer destroyed while streaming, processing stopped");
    }
    memory_manager_.stopMonitoring();
}

StreamingResult ChunkedFileStreamer::startStreaming(const std::string& file_path, const StreamingOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_streaming_) {
            throw ProcessingStateError("Already streaming " + current_file_);
        }
        is_streaming_ = true;
        current_file_ = file_path;
        chunk_size_ = 0;
        total_lines_ = 0;
        total_bytes_ = 0;
        last_checkpoint_lines_ = 0;
    }

    const bool started_monitoring = config_.enable_memory_monitoring && memory_manager_.startMonitoring();
    const auto started = std::chrono::steady_clock::now();

    StreamingResult result;
    result.file_path = file_path;

    try {
        size_t chunk_size = config_.analysis.chunk_size;
        size_t start_index = 0;
        int64_t start_time_ms = CheckpointUtils::nowMs();

        std::optional<Checkpoint> checkpoint;
        if (options.resume_from_checkpoint) {
            checkpoint = checkpoint_manager_.loadCheckpoint(file_path);
        }
        if (checkpoint && checkpoint->metadata.chunk_size > 0) {
            chunk_size = checkpoint->metadata.chunk_size;
            start_index = checkpoint->state.current_chunk;
            start_time_ms = checkpoint->state.start_time_ms;
            result.resumed = true;
        } else {
            memory_manager_.checkMemoryUsage();
            chunk_size = std::min(chunk_size, memory_manager_.getChunkSizeRecommendation(chunk_size));
        }

        AnalysisOptions analysis_options;
        analysis_options.chunk_size = chunk_size;
        FileAnalysis analysis = analyzer_.analyzeFile(file_path, analysis_options);

        if (result.resumed && checkpoint->state.total_chunks != analysis.chunks.size()) {
            LOG_WARN_META("streamer", "Checkpoint does not match the current file, restarting from the beginning",
                          (std::unordered_map<std::string, std::string>{
                              {"checkpoint_chunks", std::to_string(checkpoint->state.total_chunks)},
                              {"file_chunks", std::to_string(analysis.chunks.size())}}));
            start_index = 0;
            result.resumed = false;
        }

        // EN: The watermark moves past permanently failed chunks, so they are sent again explicitly.
        // FR: Le watermark dépasse les chunks en échec définitif, ils sont donc renvoyés explicitement.
        if (result.resumed) {
            for (size_t index : checkpoint->metadata.failed_chunk_indices) {
                if (index < start_index && index < analysis.chunks.size()) {
                    result.requeued_chunks.push_back(index);
                }
            }
            std::sort(result.requeued_chunks.begin(), result.requeued_chunks.end());
            result.requeued_chunks.erase(std::unique(result.requeued_chunks.begin(), result.requeued_chunks.end()),
                                         result.requeued_chunks.end());
        }

        size_t settled_lines = 0;
        for (const auto& chunk : analysis.chunks) {
            if (chunk.index < start_index &&
                !std::binary_search(result.requeued_chunks.begin(), result.requeued_chunks.end(), chunk.index)) {
                settled_lines += chunk.line_count;
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            chunk_size_ = chunk_size;
            total_lines_ = analysis.total_lines;
            total_bytes_ = analysis.file_size;
            start_time_ms_ = start_time_ms;
            last_checkpoint_lines_ = settled_lines;
        }

        result.chunk_size = chunk_size;
        result.start_chunk = start_index;
        result.total_chunks = analysis.chunks.size();
        result.total_lines = analysis.total_lines;

        LOG_INFO_META("streamer", result.resumed ? "Resuming stream from checkpoint" : "Starting stream",
                      (std::unordered_map<std::string, std::string>{
                          {"file", file_path},
                          {"chunks", std::to_string(analysis.chunks.size())},
                          {"chunk_size", std::to_string(chunk_size)},
                          {"start_chunk", std::to_string(start_index)},
                          {"requeued_chunks", std::to_string(result.requeued_chunks.size())}}));

        ProcessingOptions processing_options;
        processing_options.start_index = start_index;
        processing_options.retry_indices = result.requeued_chunks;
        if (!config_.analysis.retain_lines) {
            processing_options.line_loader = [this, file_path](const Chunk& chunk) {
                return analyzer_.readChunkLines(file_path, chunk);
            };
        }

        ProcessingSummary summary = processor_.startProcessing(std::move(analysis.chunks), processing_options);

        result.stopped = summary.stopped;
        result.completed_chunks = summary.completed_chunks;
        result.failed_chunks = summary.failed_chunks;
        result.skipped_chunks = summary.skipped_chunks;
        result.retry_attempts = summary.retry_attempts;
        result.failed_chunk_indices = summary.failed_chunk_indices;
        result.success = !summary.stopped && summary.failed_chunks == 0;

        if (result.success) {
            checkpoint_manager_.clearAllCheckpoints(file_path);
        } else if (!summary.stopped) {
            checkpointFromState(processor_.getState(), "completed_with_failures");
        }
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            is_streaming_ = false;
        }
        if (started_monitoring) {
            memory_manager_.stopMonitoring();
        }
        throw;
    }

    if (started_monitoring) {
        memory_manager_.stopMonitoring();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_streaming_ = false;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_INFO_META("streamer", "Stream finished", (std::unordered_map<std::string, std::string>{
        {"file", file_path},
        {"success", result.success ? "true" : "false"},
        {"completed", std::to_string(result.completed_chunks)},
        {"failed", std::to_string(result.failed_chunks)},
        {"duration_ms", std::to_string(result.duration.count())}}));
    return result;
}

PauseResult ChunkedFileStreamer::pauseStreaming(const std::string& reason, bool graceful) {
    PauseOptions options;
    options.graceful = graceful;
    options.preserve_state = config_.pause.save_state_on_pause;
    return pause_resume_.requestPause(reason, options);
}

ResumeResult ChunkedFileStreamer::resumeStreaming() {
    return pause_resume_.requestResume();
}

std::optional<ProcessingSummary> ChunkedFileStreamer::stopStreaming() {
    auto summary = processor_.stop();
    if (!summary) {
        return std::nullopt;
    }

    checkpointFromState(processor_.getState(), "stop");
    if (pause_resume_.isPaused()) {
        ResumeOptions options;
        options.validate_state = false;
        pause_resume_.requestResume(options);
    }
    return summary;
}

std::optional<Checkpoint> ChunkedFileStreamer::createCheckpoint() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_streaming_) {
            return std::nullopt;
        }
    }
    return checkpointFromState(processor_.getState(), "manual");
}

std::optional<Checkpoint> ChunkedFileStreamer::checkpointFromState(const ProcessingState& state,
                                                                   const std::string& trigger) {
    ProgressSnapshot snapshot;
    CheckpointMetadata metadata;
    std::string file_path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_file_.empty()) {
            return std::nullopt;
        }
        file_path = current_file_;
        snapshot.total_lines = total_lines_;
        snapshot.total_bytes = total_bytes_;
        snapshot.start_time_ms = start_time_ms_;
        metadata.chunk_size = chunk_size_;
        last_checkpoint_lines_ = std::max(last_checkpoint_lines_, state.lines_settled);
    }

    snapshot.current_chunk = state.current_chunk_index;
    snapshot.total_chunks = state.total_chunks;
    snapshot.current_line = state.lines_settled;
    snapshot.bytes_processed = state.bytes_settled;
    const auto pause_state = pause_resume_.getPauseState();
    if (pause_state.pause_time) {
        snapshot.pause_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            pause_state.pause_time->time_since_epoch()).count();
    }

    const ProcessorMetrics metrics = processor_.getMetrics();
    metadata.chunks_successful = state.processed_chunks;
    metadata.chunks_failed = state.failed_chunks;
    metadata.average_chunk_time_ms = metrics.average_chunk_time_ms;
    metadata.failed_chunk_indices = processor_.getFailedChunks();
    metadata.extra["trigger"] = trigger;

    return checkpoint_manager_.createCheckpoint(file_path, snapshot, metadata);
}

void ChunkedFileStreamer::onProcessorEvent(const ProcessorEvent& event) {
    if (event.type != ProcessorEventType::CHUNK_COMPLETED && event.type != ProcessorEventType::CHUNK_FAILED) {
        return;
    }
    if (!config_.checkpoint.enable_checkpointing) {
        return;
    }

    bool due = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        due = event.state.lines_settled >= last_checkpoint_lines_ + config_.checkpoint.checkpoint_interval;
    }
    if (due) {
        checkpointFromState(event.state, "interval");
    }
}

// EN: Bridges pause notifications to the processor. A graceful pause is acknowledged only once
//     no chunk is in flight.
// FR: Relie les notifications de pause au processeur. Une pause gracieuse n'est acquittée que
//     lorsqu'aucun chunk n'est en vol.
void ChunkedFileStreamer::onPauseEvent(const PauseEvent& event) {
    switch (event.type) {
        case PauseEventType::PAUSE_REQUESTED:
            processor_.pause();
            if (processor_.waitUntilIdle(config_.pause.pause_timeout)) {
                pause_resume_.acknowledgePause(kPauseParticipant);
            } else {
                LOG_WARN("streamer", "Active chunks did not drain before the pause timeout");
            }
            break;
        case PauseEventType::PAUSE_EXECUTE:
            processor_.pause();
            if (config_.pause.save_state_on_pause && processor_.isProcessing()) {
                checkpointFromState(processor_.getState(), "pause");
            }
            break;
        case PauseEventType::PAUSE_FAILED:
        case PauseEventType::RESUME_EXECUTE:
            processor_.resume();
            break;
        case PauseEventType::PAUSE_TIMEOUT_EXCEEDED:
            LOG_WARN("streamer", "Maximum pause duration reached, stream will resume");
            break;
        default:
            break;
    }
}

StreamingProgress ChunkedFileStreamer::getProgress() const {
    StreamingProgress progress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress.file_path = current_file_;
        progress.is_streaming = is_streaming_;
        progress.total_lines = total_lines_;
        progress.total_bytes = total_bytes_;
    }

    const ProcessingState state = processor_.getState();
    progress.is_paused = state.is_paused;
    progress.current_chunk = state.current_chunk_index;
    progress.total_chunks = state.total_chunks;
    progress.current_line = state.lines_settled;
    progress.bytes_processed = state.bytes_settled;
    progress.chunk_percent = percent(state.processed_chunks + state.failed_chunks + state.skipped_chunks,
                                     state.total_chunks);
    progress.line_percent = percent(progress.current_line, progress.total_lines);
    progress.byte_percent = percent(progress.bytes_processed, progress.total_bytes);
    return progress;
}

nlohmann::json ChunkedFileStreamer::getStreamingStats() const {
    const StreamingProgress progress = getProgress();
    const MemoryStatus memory_status = memory_manager_.getMemoryStatus();
    const MemoryMetrics memory_metrics = memory_manager_.getMemoryMetrics();
    const AnalysisStatistics analysis_stats = analyzer_.getAnalysisStatistics();

    nlohmann::json stats;
    stats["progress"] = {
        {"file_path", progress.file_path},
        {"is_streaming", progress.is_streaming},
        {"is_paused", progress.is_paused},
        {"current_chunk", progress.current_chunk},
        {"total_chunks", progress.total_chunks},
        {"current_line", progress.current_line},
        {"total_lines", progress.total_lines},
        {"chunk_percent", progress.chunk_percent},
        {"line_percent", progress.line_percent},
        {"byte_percent", progress.byte_percent}
    };
    stats["analysis"] = {
        {"total_files", analysis_stats.total_files},
        {"total_lines", analysis_stats.total_lines},
        {"total_bytes", analysis_stats.total_bytes},
        {"average_analysis_time_ms", analysis_stats.average_analysis_time_ms}
    };
    stats["memory"] = {
        {"status", memory_status.status},
        {"current_usage", memory_status.current_usage},
        {"peak_usage", memory_status.peak_usage},
        {"usage_fraction", memory_status.usage_fraction},
        {"tracked_chunks", memory_status.tracked_chunks},
        {"warnings", memory_metrics.memory_warnings},
        {"criticals", memory_metrics.memory_criticals},
        {"garbage_collections", memory_metrics.garbage_collections}
    };
    stats["processor"] = processor_.exportData();
    stats["checkpoints"] = checkpoint_manager_.exportData();
    stats["pause"] = pause_resume_.exportData();
    stats["config"] = StreamingConfigLoader::toJson(config_);
    return stats;
}

} // namespace GCS
