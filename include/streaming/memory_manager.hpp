// EN: Memory Manager for GStream - host memory pressure monitoring and adaptive chunk sizing
// FR: Gestionnaire mémoire pour GStream - surveillance de la pression mémoire et taille de chunk adaptative

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace GCS {

enum class MemoryPressure {
    NORMAL,
    WARNING,
    CRITICAL
};

struct MemoryManagerConfig {
    uint64_t max_memory_usage{50ULL * 1024 * 1024};   // EN: Ceiling used for classification (50MB) / FR: Plafond utilisé pour la classification (50MB)
    double warning_threshold{0.8};                    // EN: Fraction of max / FR: Fraction du max
    double critical_threshold{0.9};                   // EN: Fraction of max / FR: Fraction du max
    std::chrono::milliseconds monitoring_interval{1000};
    bool enable_garbage_collection{true};             // EN: Trim the heap on critical pressure / FR: Réduit le tas en pression critique
    double chunk_size_reduction{0.5};                 // EN: Factor applied at critical pressure / FR: Facteur appliqué en pression critique
    bool enable_memory_optimization{true};
    bool track_chunk_memory{true};
    bool enable_leak_detection{true};
};

struct MemorySample {
    std::chrono::system_clock::time_point timestamp;
    uint64_t usage{0};
    double usage_fraction{0.0};
};

struct MemoryState {
    uint64_t current_usage{0};
    uint64_t peak_usage{0};
    uint64_t baseline_usage{0};
    MemoryPressure pressure{MemoryPressure::NORMAL};
    std::chrono::system_clock::time_point last_check;
};

struct MemoryLeakReport {
    double growth_percentage{0.0};   // EN: Share of increasing consecutive pairs, in percent / FR: Part des paires croissantes, en pourcent
    int64_t recent_growth_bytes{0};  // EN: Last sample minus first sample of the window / FR: Dernier moins premier échantillon de la fenêtre
    size_t samples{0};
};

struct MemoryStatus {
    std::string status;              // EN: "normal", "warning" or "critical" / FR: "normal", "warning" ou "critical"
    uint64_t current_usage{0};
    uint64_t peak_usage{0};
    uint64_t baseline_usage{0};
    uint64_t max_memory_usage{0};
    double usage_fraction{0.0};
    double warning_threshold{0.0};
    double critical_threshold{0.0};
    size_t tracked_chunks{0};
    uint64_t tracked_chunk_bytes{0};
    bool monitoring{false};
};

struct MemoryMetrics {
    std::chrono::system_clock::time_point created_at;
    size_t samples_taken{0};
    size_t memory_warnings{0};
    size_t memory_criticals{0};
    size_t optimizations_performed{0};
    size_t garbage_collections{0};
    size_t leaks_detected{0};
    double average_usage{0.0};
};

enum class MemoryEventType {
    STATUS,
    WARNING,
    CRITICAL,
    OPTIMIZED,
    GARBAGE_COLLECTED,
    LEAK_DETECTED
};

struct MemoryEvent {
    MemoryEventType type;
    MemoryStatus status;
    size_t removed_entries{0};
    std::optional<MemoryLeakReport> leak;
};

// EN: Samples host memory usage, classifies pressure and recommends chunk sizes.
// FR: Échantillonne la mémoire de l'hôte, classe la pression et recommande des tailles de chunk.
class MemoryManager {
public:
    using MemorySampler = std::function<uint64_t()>;
    using EventCallback = std::function<void(const MemoryEvent&)>;

    static constexpr size_t kMaxHistory = 100;
    static constexpr size_t kTrimmedHistory = 50;
    static constexpr size_t kLeakWindow = 10;
    static constexpr double kLeakGrowthRatio = 0.8;

    // EN: Without a sampler, the process resident set size is read from /proc/self/statm.
    // FR: Sans échantillonneur, la taille résidente du processus est lue dans /proc/self/statm.
    explicit MemoryManager(const MemoryManagerConfig& config = MemoryManagerConfig{},
                           MemorySampler sampler = MemorySampler{});
    ~MemoryManager();

    // EN: Non-copyable and non-movable
    // FR: Non-copiable et non-déplaçable
    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;
    MemoryManager(MemoryManager&&) = delete;
    MemoryManager& operator=(MemoryManager&&) = delete;

    // EN: Returns false when monitoring was already in the requested state.
    // FR: Retourne false si la surveillance était déjà dans l'état demandé.
    bool startMonitoring();
    bool stopMonitoring();
    bool isMonitoring() const { return monitoring_.load(); }

    // EN: Take one sample, update history and run mitigation for the resulting pressure.
    // FR: Prend un échantillon, met à jour l'historique et applique la mitigation.
    MemoryPressure checkMemoryUsage();

    size_t getChunkSizeRecommendation(size_t current_size) const;
    bool isMemoryAvailable(uint64_t required_bytes) const;

    // EN: Heuristic only: warns, never blocks processing.
    // FR: Heuristique seulement : avertit, ne bloque jamais le traitement.
    std::optional<MemoryLeakReport> detectMemoryLeaks();

    // EN: Prune stale history and released chunk entries. Returns the number of removed entries.
    // FR: Élague l'historique périmé et les chunks libérés. Retourne le nombre d'entrées supprimées.
    size_t optimizeMemory();

    // EN: Ask the allocator to return free pages; false when the host offers no such call.
    // FR: Demande à l'allocateur de rendre les pages libres ; false si l'hôte ne le permet pas.
    bool forceGarbageCollection();

    void trackChunkMemory(size_t chunk_index, uint64_t bytes);
    void releaseChunkMemory(size_t chunk_index);

    MemoryStatus getMemoryStatus() const;
    MemoryState getMemoryState() const;
    MemoryMetrics getMemoryMetrics() const;
    std::vector<MemorySample> getMemoryHistory() const;
    void resetStatistics();

    void addEventListener(const std::string& listener_id, EventCallback callback);
    void removeEventListener(const std::string& listener_id);

    const MemoryManagerConfig& getConfig() const { return config_; }

    static uint64_t sampleProcessMemory();
    static std::string pressureToString(MemoryPressure pressure);

private:
    struct TrackedChunk {
        uint64_t bytes{0};
        std::chrono::system_clock::time_point tracked_at;
        bool released{false};
    };

    void monitoringLoop();
    MemoryPressure classify(double usage_fraction) const;
    double usageFraction(uint64_t usage) const;
    MemoryStatus buildStatusLocked() const;
    void emit(const MemoryEvent& event);

    MemoryManagerConfig config_;
    MemorySampler sampler_;

    mutable std::mutex mutex_;
    MemoryState state_;
    bool baseline_set_{false};
    std::deque<MemorySample> history_;
    std::map<size_t, TrackedChunk> tracked_chunks_;
    MemoryMetrics metrics_;
    double usage_fraction_sum_{0.0};

    std::atomic<bool> monitoring_{false};
    std::thread monitor_thread_;
    std::mutex monitor_mutex_;
    std::mutex lifecycle_mutex_;      // EN: Serializes startMonitoring / FR: Sérialise startMonitoring
    std::condition_variable monitor_cv_;

    std::mutex listeners_mutex_;
    std::map<std::string, EventCallback> listeners_;
};

} // namespace GCS
