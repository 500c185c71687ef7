// EN: Chunk Processor for GStream - bounded-concurrency chunk execution with timeout and retry
// FR: Processeur de chunks pour GStream - exécution de chunks à concurrence bornée avec timeout et retry

#pragma once

#include "streaming/chunk_types.hpp"
#include "streaming/streaming_manager.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GCS {

// EN: Forward declarations for dependency injection
// FR: Déclarations forward pour l'injection de dépendances
class MemoryManager;
class ThreadPool;

struct ChunkProcessorConfig {
    size_t max_concurrent_chunks{1};                  // EN: In-flight chunk bound, also the worker count / FR: Borne de chunks en vol, aussi le nombre de workers
    bool retry_failed_chunks{true};
    size_t max_chunk_retries{3};                      // EN: Retries after the first attempt / FR: Retries après la première tentative
    std::chrono::milliseconds chunk_timeout{30000};   // EN: Counted from the start of an attempt / FR: Compté depuis le début d'une tentative
    bool validate_chunk_completion{true};
    double line_failure_tolerance{0.5};               // EN: Failed-line fraction above which an attempt fails / FR: Fraction de lignes en échec au-delà de laquelle la tentative échoue
};

struct ProcessingOptions {
    size_t start_index{0};                            // EN: Chunks with a lower index are treated as done / FR: Les chunks d'indice inférieur sont considérés faits

    // EN: Indices queued even below start_index, e.g. chunks a previous run failed to deliver.
    // FR: Indices mis en queue même sous start_index, ex. chunks qu'un run précédent n'a pas livrés.
    std::vector<size_t> retry_indices;

    // EN: Supplies lines for chunks analyzed without retained lines.
    // FR: Fournit les lignes des chunks analysés sans conservation des lignes.
    std::function<std::vector<std::string>(const Chunk&)> line_loader;
};

struct ProcessingState {
    bool is_processing{false};
    bool is_paused{false};
    size_t current_chunk_index{0};                    // EN: First chunk index not yet settled / FR: Premier indice de chunk non réglé
    size_t total_chunks{0};
    size_t processed_chunks{0};
    size_t failed_chunks{0};
    size_t skipped_chunks{0};
    size_t lines_settled{0};                          // EN: Lines covered by the settled prefix / FR: Lignes couvertes par le préfixe réglé
    uint64_t bytes_settled{0};
    std::chrono::system_clock::time_point start_time;
};

struct LineFailure {
    size_t line_number{0};
    std::string error;
};

struct ChunkResult {
    size_t chunk_index{0};
    size_t attempt{0};                                // EN: 1 for the first attempt / FR: 1 pour la première tentative
    bool success{false};
    bool timed_out{false};
    size_t lines_sent{0};
    size_t lines_failed{0};
    std::vector<LineFailure> line_failures;
    std::optional<std::string> error;
    std::chrono::milliseconds duration{0};
};

struct ProcessingSummary {
    size_t total_chunks{0};
    size_t completed_chunks{0};
    size_t failed_chunks{0};
    size_t skipped_chunks{0};
    size_t retry_attempts{0};
    bool stopped{false};
    std::vector<size_t> failed_chunk_indices;
    std::chrono::milliseconds duration{0};
};

struct ProcessorStatus {
    ProcessingState state;
    double progress_percent{0.0};
    size_t queued_chunks{0};
    size_t retry_queued_chunks{0};
    size_t active_chunks{0};
};

struct ProcessorMetrics {
    std::chrono::system_clock::time_point created_at;
    size_t attempts_finished{0};
    size_t chunks_successful{0};
    size_t chunks_failed{0};
    size_t chunks_retried{0};
    size_t timeouts{0};
    size_t late_results_discarded{0};
    size_t lines_sent{0};
    size_t lines_failed{0};
    double average_chunk_time_ms{0.0};
    size_t max_concurrency_reached{0};
    double success_rate{0.0};                         // EN: Percent of settled chunks / FR: Pourcentage des chunks réglés
    double failure_rate{0.0};
};

enum class ProcessorEventType {
    PROCESSING_STARTED,
    CHUNK_STARTED,
    CHUNK_COMPLETED,
    CHUNK_RETRY_QUEUED,
    CHUNK_FAILED,
    CHUNK_VALIDATION_WARNING,
    PROCESSING_PAUSED,
    PROCESSING_RESUMED,
    PROCESSING_STOPPED,
    PROCESSING_COMPLETED
};

struct ProcessorEvent {
    ProcessorEventType type;
    std::optional<size_t> chunk_index;
    size_t attempt{0};
    std::string message;
    std::optional<ChunkResult> result;
    ProcessingState state;
};

// EN: Drives chunks through the streaming manager. startProcessing runs the dispatch loop on the
//     calling thread while chunk attempts run on a worker pool of max_concurrent_chunks threads.
//     Listeners may be invoked from worker threads and must be thread-safe.
// FR: Fait passer les chunks par le streaming manager. startProcessing exécute la boucle de
//     dispatch sur le thread appelant, les tentatives tournent sur un pool de max_concurrent_chunks
//     workers. Les listeners peuvent être appelés depuis les workers et doivent être thread-safe.
class ChunkProcessor {
public:
    using EventCallback = std::function<void(const ProcessorEvent&)>;

    // EN: memory_manager is optional and must outlive the processor.
    // FR: memory_manager est optionnel et doit survivre au processeur.
    ChunkProcessor(IStreamingManager& streaming_manager,
                   const ChunkProcessorConfig& config = ChunkProcessorConfig{},
                   MemoryManager* memory_manager = nullptr);
    ~ChunkProcessor();

    // EN: Non-copyable and non-movable
    // FR: Non-copiable et non-déplaçable
    ChunkProcessor(const ChunkProcessor&) = delete;
    ChunkProcessor& operator=(const ChunkProcessor&) = delete;
    ChunkProcessor(ChunkProcessor&&) = delete;
    ChunkProcessor& operator=(ChunkProcessor&&) = delete;

    // EN: Blocks until every chunk is settled or stop() is called.
    //     Throws ProcessingStateError when processing is already in progress.
    // FR: Bloque jusqu'à ce que chaque chunk soit réglé ou que stop() soit appelé.
    //     Lance ProcessingStateError si un traitement est déjà en cours.
    ProcessingSummary startProcessing(std::vector<Chunk> chunks, const ProcessingOptions& options = ProcessingOptions{});

    // EN: Stop dispatching new chunks; active chunks run to completion.
    // FR: Arrête de dispatcher de nouveaux chunks ; les chunks actifs se terminent.
    bool pause();
    bool resume();

    // EN: Cancels active attempts, clears both queues. nullopt when nothing was running.
    //     A line already handed to the streaming manager cannot be retracted.
    // FR: Annule les tentatives actives, vide les deux queues. nullopt si rien ne tournait.
    //     Une ligne déjà remise au streaming manager ne peut pas être retirée.
    std::optional<ProcessingSummary> stop();

    // EN: True once no chunk attempt is active.
    // FR: Vrai dès qu'aucune tentative de chunk n'est active.
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    bool isProcessing() const;
    ProcessingState getState() const;
    ProcessorStatus getStatus() const;
    ProcessorMetrics getMetrics() const;
    std::vector<size_t> getCompletedChunks() const;
    std::map<size_t, size_t> getRetryCounts() const;
    std::vector<size_t> getFailedChunks() const;
    nlohmann::json exportData() const;
    void resetStatistics();

    void addEventListener(const std::string& listener_id, EventCallback callback);
    void removeEventListener(const std::string& listener_id);

    const ChunkProcessorConfig& getConfig() const { return config_; }

private:
    struct ActiveAttempt {
        size_t position{0};
        size_t attempt{0};
        std::shared_ptr<std::atomic<bool>> cancelled;
        std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
        uint64_t tracked_bytes{0};
    };

    using EventList = std::vector<ProcessorEvent>;

    void dispatchLocked(size_t position, bool is_retry, EventList& events);
    void runAttempt(uint64_t attempt_id, std::shared_ptr<const Chunk> chunk,
                    std::shared_ptr<std::atomic<bool>> cancelled);
    void expireTimedOutLocked(EventList& events);
    void handleSuccessLocked(size_t position, const ChunkResult& result, EventList& events);
    void handleFailureLocked(size_t position, ChunkResult result, EventList& events);
    void settleLocked(size_t position);
    void releaseLocked(const ActiveAttempt& attempt);
    void recordAttemptLocked(const ChunkResult& result);
    ProcessingSummary buildSummaryLocked() const;
    ProcessingState snapshotLocked() const;
    ProcessorEvent makeEventLocked(ProcessorEventType type, std::optional<size_t> position,
                                   size_t attempt, std::string message,
                                   std::optional<ChunkResult> result = std::nullopt) const;
    void emit(const EventList& events);

    IStreamingManager& streaming_manager_;
    ChunkProcessorConfig config_;
    MemoryManager* memory_manager_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<std::shared_ptr<const Chunk>> chunks_;
    std::vector<bool> settled_;
    size_t watermark_{0};
    std::deque<size_t> queue_;
    std::deque<size_t> retry_queue_;
    std::map<uint64_t, ActiveAttempt> active_;
    size_t pending_emits_{0};
    uint64_t next_attempt_id_{1};
    std::map<size_t, size_t> retry_counts_;
    std::vector<size_t> completed_chunks_;
    std::vector<size_t> failed_chunks_;
    size_t run_retry_attempts_{0};
    std::function<std::vector<std::string>(const Chunk&)> line_loader_;

    ProcessingState state_;
    bool paused_{false};
    bool stop_requested_{false};
    std::chrono::steady_clock::time_point run_started_;

    ProcessorMetrics metrics_;
    double total_chunk_time_ms_{0.0};

    std::mutex listeners_mutex_;
    std::map<std::string, EventCallback> listeners_;

    // EN: Declared last so that workers are joined before any other member is destroyed.
    // FR: Déclaré en dernier pour que les workers soient joints avant la destruction des autres membres.
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace GCS
