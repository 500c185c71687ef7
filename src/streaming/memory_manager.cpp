// EN: Implementation of the MemoryManager: sampling, pressure classification and mitigation.
// FR: Implémentation du MemoryManager : échantillonnage, classification de pression et mitigation.

#include "streaming/memory_manager.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <unistd.h>
#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace GCS {

namespace {

constexpr auto kHistoryRetention = std::chrono::minutes(5);
constexpr auto kChunkTrackingRetention = std::chrono::minutes(10);

std::string formatFraction(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

} // namespace

MemoryManager::MemoryManager(const MemoryManagerConfig& config, MemorySampler sampler)
    : config_(config), sampler_(std::move(sampler)) {
    if (config_.max_memory_usage == 0) {
        throw ConfigurationError("max_memory_usage must be greater than zero");
    }
    if (config_.warning_threshold <= 0.0 || config_.critical_threshold > 1.0 ||
        config_.warning_threshold >= config_.critical_threshold) {
        throw ConfigurationError("memory thresholds must satisfy 0 < warning < critical <= 1");
    }
    if (config_.chunk_size_reduction <= 0.0 || config_.chunk_size_reduction >= 1.0) {
        throw ConfigurationError("chunk_size_reduction must be in (0, 1)");
    }
    if (!sampler_) {
        sampler_ = &MemoryManager::sampleProcessMemory;
    }
    metrics_.created_at = std::chrono::system_clock::now();
}

MemoryManager::~MemoryManager() {
    stopMonitoring();

    // EN: A stop issued from a listener on the monitor thread leaves that thread joinable.
    // FR: Un arrêt émis depuis un listener du thread de surveillance laisse ce thread joignable.
    if (monitor_thread_.joinable()) {
        if (monitor_thread_.get_id() == std::this_thread::get_id()) {
            monitor_thread_.detach();
        } else {
            monitor_thread_.join();
        }
    }
}

// EN: Resident set size of the current process, 0 when /proc is unavailable.
// FR: Taille résidente du processus courant, 0 si /proc est indisponible.
uint64_t MemoryManager::sampleProcessMemory() {
    std::ifstream statm("/proc/self/statm");
    if (!statm) {
        return 0;
    }
    uint64_t size = 0;
    uint64_t resident = 0;
    statm >> size >> resident;
    long page_size = sysconf(_SC_PAGESIZE);
    if (!statm || page_size <= 0) {
        return 0;
    }
    return resident * static_cast<uint64_t>(page_size);
}

std::string MemoryManager::pressureToString(MemoryPressure pressure) {
    switch (pressure) {
        case MemoryPressure::NORMAL:   return "normal";
        case MemoryPressure::WARNING:  return "warning";
        case MemoryPressure::CRITICAL: return "critical";
    }
    return "unknown";
}

bool MemoryManager::startMonitoring() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (monitoring_.load()) {
        return false;
    }

    // EN: A loop stopped from one of its own listeners may still be unwinding; reclaim it first.
    // FR: Une boucle arrêtée par l'un de ses listeners peut encore se dérouler ; on la récupère d'abord.
    if (monitor_thread_.joinable()) {
        if (monitor_thread_.get_id() == std::this_thread::get_id()) {
            monitor_thread_.detach();
        } else {
            monitor_thread_.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!baseline_set_) {
            uint64_t baseline = sampler_();
            state_.baseline_usage = baseline;
            state_.current_usage = baseline;
            state_.peak_usage = std::max(state_.peak_usage, baseline);
            baseline_set_ = true;
        }
    }

    monitoring_.store(true);
    monitor_thread_ = std::thread(&MemoryManager::monitoringLoop, this);
    LOG_INFO("memory_manager", "Memory monitoring started (interval " +
             std::to_string(config_.monitoring_interval.count()) + "ms, max " +
             std::to_string(config_.max_memory_usage) + " bytes)");
    return true;
}

bool MemoryManager::stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (!monitoring_.exchange(false)) {
            return false;
        }
    }
    monitor_cv_.notify_all();
    if (monitor_thread_.joinable() && monitor_thread_.get_id() != std::this_thread::get_id()) {
        monitor_thread_.join();
    }
    LOG_INFO("memory_manager", "Memory monitoring stopped");
    return true;
}

void MemoryManager::monitoringLoop() {
    while (monitoring_.load()) {
        checkMemoryUsage();
        if (config_.enable_leak_detection) {
            detectMemoryLeaks();
        }

        std::unique_lock<std::mutex> lock(monitor_mutex_);
        monitor_cv_.wait_for(lock, config_.monitoring_interval, [this] { return !monitoring_.load(); });
    }
}

double MemoryManager::usageFraction(uint64_t usage) const {
    return static_cast<double>(usage) / static_cast<double>(config_.max_memory_usage);
}

MemoryPressure MemoryManager::classify(double usage_fraction) const {
    if (usage_fraction >= config_.critical_threshold) {
        return MemoryPressure::CRITICAL;
    }
    if (usage_fraction >= config_.warning_threshold) {
        return MemoryPressure::WARNING;
    }
    return MemoryPressure::NORMAL;
}

MemoryPressure MemoryManager::checkMemoryUsage() {
    const uint64_t usage = sampler_();
    const auto now = std::chrono::system_clock::now();
    const double fraction = usageFraction(usage);
    const MemoryPressure pressure = classify(fraction);

    MemoryStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!baseline_set_) {
            state_.baseline_usage = usage;
            baseline_set_ = true;
        }
        state_.current_usage = usage;
        state_.peak_usage = std::max(state_.peak_usage, usage);
        state_.pressure = pressure;
        state_.last_check = now;

        history_.push_back(MemorySample{now, usage, fraction});
        if (history_.size() > kMaxHistory) {
            history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(kTrimmedHistory));
        }

        metrics_.samples_taken++;
        usage_fraction_sum_ += fraction;
        metrics_.average_usage = usage_fraction_sum_ / static_cast<double>(metrics_.samples_taken);
        if (pressure == MemoryPressure::WARNING) {
            metrics_.memory_warnings++;
        } else if (pressure == MemoryPressure::CRITICAL) {
            metrics_.memory_criticals++;
        }
        status = buildStatusLocked();
    }

    emit(MemoryEvent{MemoryEventType::STATUS, status, 0, std::nullopt});

    if (pressure == MemoryPressure::CRITICAL) {
        LOG_WARN_META("memory_manager", "Critical memory pressure", (std::unordered_map<std::string, std::string>{
            {"usage", std::to_string(usage)}, {"fraction", formatFraction(fraction)}}));
        emit(MemoryEvent{MemoryEventType::CRITICAL, status, 0, std::nullopt});
        if (config_.enable_memory_optimization) {
            optimizeMemory();
        }
        if (config_.enable_garbage_collection) {
            forceGarbageCollection();
        }
    } else if (pressure == MemoryPressure::WARNING) {
        LOG_WARN("memory_manager", "Memory usage at " + formatFraction(fraction) + " of maximum");
        emit(MemoryEvent{MemoryEventType::WARNING, status, 0, std::nullopt});
        if (config_.enable_memory_optimization) {
            optimizeMemory();
        }
    }
    return pressure;
}

// EN: Pure function of the last sampled usage fraction. Never returns less than 1.
// FR: Fonction pure de la dernière fraction échantillonnée. Ne retourne jamais moins de 1.
size_t MemoryManager::getChunkSizeRecommendation(size_t current_size) const {
    double fraction = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fraction = usageFraction(state_.current_usage);
    }

    double factor = 1.0;
    if (fraction >= config_.critical_threshold) {
        factor = config_.chunk_size_reduction;
    } else if (fraction >= config_.warning_threshold) {
        factor = 0.75;
    } else if (fraction < 0.5) {
        factor = 1.25;
    }

    size_t recommended = static_cast<size_t>(std::floor(static_cast<double>(current_size) * factor));
    return std::max<size_t>(recommended, 1);
}

bool MemoryManager::isMemoryAvailable(uint64_t required_bytes) const {
    const uint64_t usage = sampler_();
    const double limit = static_cast<double>(config_.max_memory_usage) * config_.warning_threshold;
    return static_cast<double>(usage + required_bytes) <= limit;
}

std::optional<MemoryLeakReport> MemoryManager::detectMemoryLeaks() {
    MemoryLeakReport report;
    MemoryStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (history_.size() < kLeakWindow) {
            return std::nullopt;
        }

        auto window_begin = history_.end() - static_cast<std::ptrdiff_t>(kLeakWindow);
        size_t increases = 0;
        for (auto it = window_begin + 1; it != history_.end(); ++it) {
            if (it->usage > (it - 1)->usage) {
                ++increases;
            }
        }
        double growth_ratio = static_cast<double>(increases) / static_cast<double>(kLeakWindow - 1);
        if (growth_ratio <= kLeakGrowthRatio) {
            return std::nullopt;
        }

        report.growth_percentage = growth_ratio * 100.0;
        report.recent_growth_bytes = static_cast<int64_t>(history_.back().usage) -
                                     static_cast<int64_t>(window_begin->usage);
        report.samples = kLeakWindow;
        metrics_.leaks_detected++;
        status = buildStatusLocked();
    }

    LOG_WARN_META("memory_manager", "Possible memory leak detected", (std::unordered_map<std::string, std::string>{
        {"growth_percentage", std::to_string(report.growth_percentage)},
        {"recent_growth_bytes", std::to_string(report.recent_growth_bytes)}}));
    emit(MemoryEvent{MemoryEventType::LEAK_DETECTED, status, 0, report});
    return report;
}

size_t MemoryManager::optimizeMemory() {
    const auto now = std::chrono::system_clock::now();
    size_t removed = 0;
    MemoryStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!history_.empty() && now - history_.front().timestamp > kHistoryRetention) {
            history_.pop_front();
            ++removed;
        }
        for (auto it = tracked_chunks_.begin(); it != tracked_chunks_.end();) {
            if (it->second.released || now - it->second.tracked_at > kChunkTrackingRetention) {
                it = tracked_chunks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        metrics_.optimizations_performed++;
        status = buildStatusLocked();
    }

    LOG_DEBUG("memory_manager", "Memory optimization removed " + std::to_string(removed) + " entries");
    emit(MemoryEvent{MemoryEventType::OPTIMIZED, status, removed, std::nullopt});
    return removed;
}

bool MemoryManager::forceGarbageCollection() {
#if defined(__GLIBC__)
    malloc_trim(0);
    MemoryStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.garbage_collections++;
        status = buildStatusLocked();
    }
    LOG_DEBUG("memory_manager", "Heap trimmed");
    emit(MemoryEvent{MemoryEventType::GARBAGE_COLLECTED, status, 0, std::nullopt});
    return true;
#else
    LOG_DEBUG("memory_manager", "Forced collection not available on this host");
    return false;
#endif
}

void MemoryManager::trackChunkMemory(size_t chunk_index, uint64_t bytes) {
    if (!config_.track_chunk_memory) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_chunks_[chunk_index] = TrackedChunk{bytes, std::chrono::system_clock::now(), false};
}

void MemoryManager::releaseChunkMemory(size_t chunk_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_chunks_.find(chunk_index);
    if (it != tracked_chunks_.end()) {
        it->second.released = true;
    }
}

MemoryStatus MemoryManager::buildStatusLocked() const {
    MemoryStatus status;
    status.status = pressureToString(state_.pressure);
    status.current_usage = state_.current_usage;
    status.peak_usage = state_.peak_usage;
    status.baseline_usage = state_.baseline_usage;
    status.max_memory_usage = config_.max_memory_usage;
    status.usage_fraction = usageFraction(state_.current_usage);
    status.warning_threshold = config_.warning_threshold;
    status.critical_threshold = config_.critical_threshold;
    status.monitoring = monitoring_.load();
    for (const auto& [index, tracked] : tracked_chunks_) {
        if (!tracked.released) {
            status.tracked_chunks++;
            status.tracked_chunk_bytes += tracked.bytes;
        }
    }
    return status;
}

MemoryStatus MemoryManager::getMemoryStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buildStatusLocked();
}

MemoryState MemoryManager::getMemoryState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

MemoryMetrics MemoryManager::getMemoryMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

std::vector<MemorySample> MemoryManager::getMemoryHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<MemorySample>(history_.begin(), history_.end());
}

void MemoryManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = MemoryMetrics{};
    metrics_.created_at = std::chrono::system_clock::now();
    usage_fraction_sum_ = 0.0;
    history_.clear();
    state_.peak_usage = state_.current_usage;
}

void MemoryManager::addEventListener(const std::string& listener_id, EventCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_[listener_id] = std::move(callback);
}

void MemoryManager::removeEventListener(const std::string& listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

void MemoryManager::emit(const MemoryEvent& event) {
    std::map<std::string, EventCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& [id, callback] : listeners) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LOG_ERROR("memory_manager", "Listener '" + id + "' threw: " + std::string(e.what()));
        }
    }
}

} // namespace GCS
