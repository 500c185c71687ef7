// EN: Chunked File Streamer for GStream - wires analysis, processing, memory, checkpoints and pause for one file
// FR: Streamer de fichiers par chunks pour GStream - relie analyse, traitement, mémoire, checkpoints et pause

#pragma once

#include "infrastructure/config/streaming_config.hpp"
#include "streaming/checkpoint_manager.hpp"
#include "streaming/chunk_processor.hpp"
#include "streaming/file_analyzer.hpp"
#include "streaming/memory_manager.hpp"
#include "streaming/stream_pause_resume.hpp"
#include "streaming/streaming_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GCS {

struct StreamingOptions {
    bool resume_from_checkpoint{true};
};

struct StreamingResult {
    std::string file_path;
    bool success{false};              // EN: Every chunk completed and the run was not stopped / FR: Tous les chunks terminés sans arrêt
    bool stopped{false};
    bool resumed{false};              // EN: Started from a checkpoint / FR: Démarré depuis un checkpoint
    size_t start_chunk{0};
    std::vector<size_t> requeued_chunks; // EN: Failed chunks carried over from the checkpoint / FR: Chunks en échec repris du checkpoint
    size_t chunk_size{0};
    size_t total_chunks{0};
    size_t total_lines{0};
    size_t completed_chunks{0};
    size_t failed_chunks{0};
    size_t skipped_chunks{0};
    size_t retry_attempts{0};
    std::vector<size_t> failed_chunk_indices;
    std::chrono::milliseconds duration{0};
};

struct StreamingProgress {
    std::string file_path;
    bool is_streaming{false};
    bool is_paused{false};
    size_t current_chunk{0};
    size_t total_chunks{0};
    size_t current_line{0};
    size_t total_lines{0};
    uint64_t bytes_processed{0};
    uint64_t total_bytes{0};
    double chunk_percent{0.0};
    double line_percent{0.0};
    double byte_percent{0.0};
};

// EN: Top-level entry point. One file is streamed at a time; startStreaming blocks until the run
//     ends while pause, resume and stop may be called from other threads.
// FR: Point d'entrée principal. Un fichier à la fois ; startStreaming bloque jusqu'à la fin du run
//     tandis que pause, reprise et arrêt peuvent être appelés depuis d'autres threads.
class ChunkedFileStreamer {
public:
    static constexpr const char* kPauseParticipant = "chunk_processor";

    ChunkedFileStreamer(IStreamingManager& streaming_manager, const StreamingConfig& config,
                        MemoryManager::MemorySampler sampler = MemoryManager::MemorySampler{});
    ~ChunkedFileStreamer();

    // EN: Non-copyable and non-movable
    // FR: Non-copiable et non-déplaçable
    ChunkedFileStreamer(const ChunkedFileStreamer&) = delete;
    ChunkedFileStreamer& operator=(const ChunkedFileStreamer&) = delete;
    ChunkedFileStreamer(ChunkedFileStreamer&&) = delete;
    ChunkedFileStreamer& operator=(ChunkedFileStreamer&&) = delete;

    // EN: Throws AnalysisError for an unreadable file and ProcessingStateError when already streaming.
    // FR: Lance AnalysisError si le fichier est illisible et ProcessingStateError si un streaming est en cours.
    StreamingResult startStreaming(const std::string& file_path, const StreamingOptions& options = StreamingOptions{});

    PauseResult pauseStreaming(const std::string& reason = "user_request", bool graceful = true);
    ResumeResult resumeStreaming();

    // EN: Stops processing and writes a final checkpoint. nullopt when nothing was streaming.
    // FR: Arrête le traitement et écrit un checkpoint final. nullopt si rien n'était en cours.
    std::optional<ProcessingSummary> stopStreaming();

    std::optional<Checkpoint> createCheckpoint();
    StreamingProgress getProgress() const;
    nlohmann::json getStreamingStats() const;

    FileAnalyzer& analyzer() { return analyzer_; }
    MemoryManager& memoryManager() { return memory_manager_; }
    CheckpointManager& checkpointManager() { return checkpoint_manager_; }
    ChunkProcessor& processor() { return processor_; }
    StreamPauseResume& pauseResume() { return pause_resume_; }

private:
    void onProcessorEvent(const ProcessorEvent& event);
    void onPauseEvent(const PauseEvent& event);
    std::optional<Checkpoint> checkpointFromState(const ProcessingState& state, const std::string& trigger);

    StreamingConfig config_;
    IStreamingManager& streaming_manager_;

    FileAnalyzer analyzer_;
    MemoryManager memory_manager_;
    CheckpointManager checkpoint_manager_;
    ChunkProcessor processor_;
    StreamPauseResume pause_resume_;

    mutable std::mutex mutex_;
    bool is_streaming_{false};
    std::string current_file_;
    size_t chunk_size_{0};
    size_t total_lines_{0};
    uint64_t total_bytes_{0};
    int64_t start_time_ms_{0};
    size_t last_checkpoint_lines_{0};
};

} // namespace GCS
