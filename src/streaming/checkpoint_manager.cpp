// EN: Implementation of the CheckpointManager: creation, rotation, validation and reload.
// FR: Implémentation du CheckpointManager : création, rotation, validation et rechargement.

#include "streaming/checkpoint_manager.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <random>
#include <set>
#include <unordered_map>

namespace GCS {

namespace {

constexpr int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

} // namespace

CheckpointManager::CheckpointManager(const CheckpointConfig& config,
                                     std::unique_ptr<ICheckpointStore> memory_store,
                                     std::unique_ptr<ICheckpointStore> disk_store)
    : config_(config), memory_store_(std::move(memory_store)), disk_store_(std::move(disk_store)) {
    if (config_.max_checkpoints == 0) {
        throw ConfigurationError("max_checkpoints must be greater than zero");
    }
    if (config_.retention_days <= 0) {
        throw ConfigurationError("retention_days must be greater than zero");
    }
    if (!memory_store_) {
        memory_store_ = std::make_unique<MemoryCheckpointStore>();
    }
    if (!disk_store_) {
        disk_store_ = std::make_unique<FileCheckpointStore>(config_.checkpoint_directory);
    }
    stats_.created_at = std::chrono::system_clock::now();
}

std::string CheckpointManager::normalizePath(const std::string& file_path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(std::filesystem::path(file_path), ec);
    if (ec) {
        return std::filesystem::path(file_path).lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

// EN: "cp_<13-digit ms>_<6-digit sequence>_<4 hex>" so that lexical order is creation order.
// FR: "cp_<ms sur 13 chiffres>_<séquence sur 6>_<4 hex>" pour que l'ordre lexical suive la création.
std::string CheckpointManager::generateCheckpointId() {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution(0, 0xFFFF);

    const uint64_t sequence = sequence_.fetch_add(1) % 1000000ULL;
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "cp_%013lld_%06llu_%04x",
                  static_cast<long long>(CheckpointUtils::nowMs()),
                  static_cast<unsigned long long>(sequence),
                  distribution(generator));
    return buffer;
}

int64_t CheckpointManager::retentionMs() const {
    return static_cast<int64_t>(config_.retention_days) * kMsPerDay;
}

std::optional<Checkpoint> CheckpointManager::createCheckpoint(const std::string& file_path,
                                                              const ProgressSnapshot& state,
                                                              const CheckpointMetadata& metadata,
                                                              const CreateCheckpointOptions& options) {
    if (!config_.enable_checkpointing) {
        return std::nullopt;
    }

    const std::string normalized = normalizePath(file_path);

    Checkpoint checkpoint;
    checkpoint.id = generateCheckpointId();
    checkpoint.timestamp_ms = CheckpointUtils::nowMs();
    checkpoint.file_path = normalized;
    checkpoint.state = state;
    checkpoint.metadata = metadata;
    checkpoint.checksum = CheckpointUtils::computeChecksum(checkpoint);

    const nlohmann::json record = CheckpointUtils::toJson(checkpoint);
    const std::string compact = record.dump();
    memory_store_->write(normalized, checkpoint.id, compact);

    uint64_t record_size = compact.size();
    bool saved = false;
    std::string save_error;
    if (options.persist) {
        try {
            const std::string payload = config_.compression_enabled
                ? CheckpointUtils::encodeCompressed(compact)
                : record.dump(2);
            record_size = payload.size();
            saved = disk_store_->write(normalized, checkpoint.id, payload);
            if (!saved) {
                save_error = "write to " + disk_store_->name() + " store failed";
            }
        } catch (const std::exception& e) {
            save_error = e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        checkpoint_files_[checkpoint.id] = normalized;
        stats_.checkpoints_created++;
        stats_.total_checkpoint_bytes += record_size;
        stats_.average_checkpoint_size =
            static_cast<double>(stats_.total_checkpoint_bytes) / static_cast<double>(stats_.checkpoints_created);
        if (saved) {
            stats_.checkpoints_saved++;
        } else if (options.persist) {
            stats_.save_failures++;
        }
    }

    if (options.persist && !saved) {
        LOG_ERROR_META("checkpoint_manager", "Failed to persist checkpoint", (std::unordered_map<std::string, std::string>{
            {"checkpoint_id", checkpoint.id}, {"file", normalized}, {"error", save_error}}));
        emit(CheckpointEvent{CheckpointEventType::SAVE_FAILED, checkpoint.id, normalized, disk_store_->name(), save_error, 0});
    }

    pruneStore(*memory_store_, normalized);
    if (options.persist) {
        pruneStore(*disk_store_, normalized);
        if (config_.auto_cleanup) {
            cleanupExpired(normalized);
        }
    }

    LOG_DEBUG_META("checkpoint_manager", "Checkpoint created", (std::unordered_map<std::string, std::string>{
        {"checkpoint_id", checkpoint.id},
        {"chunk", std::to_string(state.current_chunk) + "/" + std::to_string(state.total_chunks)},
        {"line", std::to_string(state.current_line)}}));
    emit(CheckpointEvent{CheckpointEventType::CREATED, checkpoint.id, normalized,
                         saved ? disk_store_->name() : memory_store_->name(), "", 0});
    return checkpoint;
}

std::optional<Checkpoint> CheckpointManager::loadCheckpoint(const std::string& file_path,
                                                            const LoadCheckpointOptions& options) {
    if (!config_.enable_checkpointing) {
        return std::nullopt;
    }

    const std::string normalized = normalizePath(file_path);
    std::optional<Checkpoint> checkpoint;
    ICheckpointStore* source = nullptr;

    if (options.prefer_memory || options.memory_only) {
        checkpoint = loadFromStore(*memory_store_, normalized);
        source = memory_store_.get();
    }
    if (!checkpoint && !options.memory_only) {
        checkpoint = loadFromStore(*disk_store_, normalized);
        source = disk_store_.get();
        if (checkpoint) {
            memory_store_->write(normalized, checkpoint->id, CheckpointUtils::toJson(*checkpoint).dump());
            pruneStore(*memory_store_, normalized);
        }
    }

    if (!checkpoint) {
        LOG_DEBUG("checkpoint_manager", "No valid checkpoint for " + normalized);
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        checkpoint_files_[checkpoint->id] = normalized;
        stats_.checkpoints_loaded++;
    }

    LOG_INFO_META("checkpoint_manager", "Checkpoint loaded", (std::unordered_map<std::string, std::string>{
        {"checkpoint_id", checkpoint->id}, {"source", source->name()},
        {"chunk", std::to_string(checkpoint->state.current_chunk)}}));
    emit(CheckpointEvent{CheckpointEventType::LOADED, checkpoint->id, normalized, source->name(), "", 0});
    return checkpoint;
}

std::optional<Checkpoint> CheckpointManager::loadFromStore(ICheckpointStore& store, const std::string& file_path) {
    for (const auto& id : store.list(file_path)) {
        auto payload = store.read(file_path, id);
        if (!payload) {
            continue;
        }
        try {
            return parseAndValidate(id, *payload, file_path);
        } catch (const CheckpointCorruption& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.corrupted_checkpoints++;
            }
            LOG_WARN_META("checkpoint_manager", "Skipping invalid checkpoint", (std::unordered_map<std::string, std::string>{
                {"checkpoint_id", id}, {"store", store.name()}, {"reason", e.reason()}}));
            emit(CheckpointEvent{CheckpointEventType::CORRUPTED, id, file_path, store.name(), e.reason(), 0});
        }
    }
    return std::nullopt;
}

Checkpoint CheckpointManager::parseAndValidate(const std::string& checkpoint_id, const std::string& payload,
                                               const std::string& file_path) const {
    nlohmann::json record;
    try {
        record = nlohmann::json::parse(CheckpointUtils::decodePayload(payload));
    } catch (const std::exception& e) {
        throw CheckpointCorruption(checkpoint_id, std::string("unreadable record: ") + e.what());
    }

    Checkpoint checkpoint = CheckpointUtils::fromJson(record);

    if (!record.contains("checksum") || !record["checksum"].is_string()) {
        throw CheckpointCorruption(checkpoint_id, "missing field 'checksum'");
    }
    if (checkpoint.id != checkpoint_id) {
        throw CheckpointCorruption(checkpoint_id, "record id '" + checkpoint.id + "' does not match");
    }
    if (config_.validate_checksums) {
        const std::string expected = CheckpointUtils::computeChecksum(record);
        if (expected != checkpoint.checksum) {
            throw CheckpointCorruption(checkpoint_id, "checksum mismatch (stored " + checkpoint.checksum +
                                                      ", computed " + expected + ")");
        }
    }
    if (normalizePath(checkpoint.file_path) != file_path) {
        throw CheckpointCorruption(checkpoint_id, "belongs to another file: " + checkpoint.file_path);
    }
    const int64_t age = CheckpointUtils::nowMs() - checkpoint.timestamp_ms;
    if (age > retentionMs()) {
        throw CheckpointCorruption(checkpoint_id, "stale checkpoint (" + std::to_string(age / kMsPerDay) + " days old)");
    }
    return checkpoint;
}

bool CheckpointManager::validateCheckpoint(const Checkpoint& checkpoint) const {
    if (checkpoint.id.empty() || checkpoint.file_path.empty() || checkpoint.timestamp_ms <= 0 ||
        checkpoint.checksum.empty()) {
        return false;
    }
    if (config_.validate_checksums && CheckpointUtils::computeChecksum(checkpoint) != checkpoint.checksum) {
        return false;
    }
    return CheckpointUtils::nowMs() - checkpoint.timestamp_ms <= retentionMs();
}

size_t CheckpointManager::pruneStore(ICheckpointStore& store, const std::string& file_path) {
    const auto ids = store.list(file_path);
    size_t removed = 0;
    for (size_t i = config_.max_checkpoints; i < ids.size(); ++i) {
        if (store.remove(file_path, ids[i])) {
            ++removed;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("checkpoint_manager", "Pruned " + std::to_string(removed) + " checkpoints from " +
                  store.name() + " store");
    }
    return removed;
}

size_t CheckpointManager::cleanupExpired(const std::string& file_path) {
    const std::string normalized = normalizePath(file_path);
    const int64_t now = CheckpointUtils::nowMs();
    size_t removed = 0;

    for (ICheckpointStore* store : {memory_store_.get(), disk_store_.get()}) {
        for (const auto& id : store->list(normalized)) {
            auto created = CheckpointUtils::timestampFromId(id);
            if (created && now - *created > retentionMs() && store->remove(normalized, id)) {
                ++removed;
            }
        }
    }

    if (removed > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.expired_removed += removed;
        LOG_INFO("checkpoint_manager", "Removed " + std::to_string(removed) + " expired checkpoints");
    }
    return removed;
}

bool CheckpointManager::removeCheckpoint(const std::string& checkpoint_id, bool remove_from_disk) {
    std::string file_path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoint_files_.find(checkpoint_id);
        if (it == checkpoint_files_.end()) {
            return false;
        }
        file_path = it->second;
        checkpoint_files_.erase(it);
        stats_.checkpoints_removed++;
    }

    memory_store_->remove(file_path, checkpoint_id);
    if (remove_from_disk && !disk_store_->remove(file_path, checkpoint_id)) {
        LOG_DEBUG("checkpoint_manager", "Checkpoint " + checkpoint_id + " was not on disk");
    }

    emit(CheckpointEvent{CheckpointEventType::REMOVED, checkpoint_id, file_path, "", "", 0});
    return true;
}

size_t CheckpointManager::clearAllCheckpoints(const std::string& file_path) {
    const std::string normalized = normalizePath(file_path);

    std::set<std::string> ids;
    for (const auto& id : memory_store_->list(normalized)) {
        ids.insert(id);
    }
    for (const auto& id : disk_store_->list(normalized)) {
        ids.insert(id);
    }
    memory_store_->clear(normalized);
    disk_store_->clear(normalized);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = checkpoint_files_.begin(); it != checkpoint_files_.end();) {
            if (it->second == normalized) {
                it = checkpoint_files_.erase(it);
            } else {
                ++it;
            }
        }
        stats_.checkpoints_removed += ids.size();
    }

    LOG_INFO("checkpoint_manager", "Cleared " + std::to_string(ids.size()) + " checkpoints for " + normalized);
    emit(CheckpointEvent{CheckpointEventType::CLEARED, "", normalized, "", "", ids.size()});
    return ids.size();
}

std::vector<Checkpoint> CheckpointManager::getCheckpointsForFile(const std::string& file_path) const {
    const std::string normalized = normalizePath(file_path);
    std::vector<Checkpoint> checkpoints;
    for (const auto& id : memory_store_->list(normalized)) {
        auto payload = memory_store_->read(normalized, id);
        if (!payload) {
            continue;
        }
        try {
            checkpoints.push_back(CheckpointUtils::fromJson(nlohmann::json::parse(*payload)));
        } catch (const std::exception& e) {
            LOG_WARN("checkpoint_manager", "Unreadable in-memory checkpoint " + id + ": " + e.what());
        }
    }
    return checkpoints;
}

CheckpointStatistics CheckpointManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CheckpointManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = CheckpointStatistics{};
    stats_.created_at = std::chrono::system_clock::now();
}

nlohmann::json CheckpointManager::exportData() const {
    const auto stats = getStatistics();
    nlohmann::json data;
    data["statistics"] = {
        {"checkpoints_created", stats.checkpoints_created},
        {"checkpoints_loaded", stats.checkpoints_loaded},
        {"checkpoints_saved", stats.checkpoints_saved},
        {"checkpoints_removed", stats.checkpoints_removed},
        {"corrupted_checkpoints", stats.corrupted_checkpoints},
        {"save_failures", stats.save_failures},
        {"expired_removed", stats.expired_removed},
        {"average_checkpoint_size", stats.average_checkpoint_size}
    };
    data["config"] = {
        {"enable_checkpointing", config_.enable_checkpointing},
        {"checkpoint_interval", config_.checkpoint_interval},
        {"checkpoint_directory", config_.checkpoint_directory},
        {"max_checkpoints", config_.max_checkpoints},
        {"compression_enabled", config_.compression_enabled},
        {"validate_checksums", config_.validate_checksums},
        {"auto_cleanup", config_.auto_cleanup},
        {"retention_days", config_.retention_days}
    };

    std::map<std::string, size_t> per_file;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : checkpoint_files_) {
            per_file[entry.second]++;
        }
    }
    data["active_checkpoints"] = per_file;
    return data;
}

void CheckpointManager::addEventListener(const std::string& listener_id, EventCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_[listener_id] = std::move(callback);
}

void CheckpointManager::removeEventListener(const std::string& listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

void CheckpointManager::emit(const CheckpointEvent& event) {
    std::map<std::string, EventCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& [id, callback] : listeners) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LOG_ERROR("checkpoint_manager", "Listener '" + id + "' threw: " + std::string(e.what()));
        }
    }
}

} // namespace GCS
