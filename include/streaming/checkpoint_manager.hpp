// EN: Checkpoint Manager for GStream - checksum-verified progress snapshots for resume after interruption
// FR: Gestionnaire de checkpoints pour GStream - instantanés de progression vérifiés pour reprise après interruption

#pragma once

#include "streaming/checkpoint_store.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GCS {

struct CheckpointConfig {
    bool enable_checkpointing{true};
    size_t checkpoint_interval{5000};                     // EN: Lines of settled progress between checkpoints / FR: Lignes de progression entre checkpoints
    std::string checkpoint_directory{".checkpoints"};     // EN: Relative paths resolve beside the source file / FR: Chemin relatif résolu à côté du fichier source
    size_t max_checkpoints{10};                           // EN: Retained per file, newest kept / FR: Conservés par fichier, les plus récents
    bool compression_enabled{false};
    bool validate_checksums{true};
    bool auto_cleanup{true};                              // EN: Delete expired records after each save / FR: Supprime les enregistrements expirés après chaque sauvegarde
    int retention_days{7};
};

struct CreateCheckpointOptions {
    bool persist{true};                                   // EN: false keeps the checkpoint in memory only / FR: false garde le checkpoint en mémoire uniquement
};

struct LoadCheckpointOptions {
    bool prefer_memory{true};                             // EN: Try the in-memory index before the disk / FR: Essaie l'index mémoire avant le disque
    bool memory_only{false};
};

struct CheckpointStatistics {
    std::chrono::system_clock::time_point created_at;
    size_t checkpoints_created{0};
    size_t checkpoints_loaded{0};
    size_t checkpoints_saved{0};
    size_t checkpoints_removed{0};
    size_t corrupted_checkpoints{0};
    size_t save_failures{0};
    size_t expired_removed{0};
    uint64_t total_checkpoint_bytes{0};
    double average_checkpoint_size{0.0};
};

enum class CheckpointEventType {
    CREATED,
    LOADED,
    REMOVED,
    CLEARED,
    CORRUPTED,
    SAVE_FAILED
};

struct CheckpointEvent {
    CheckpointEventType type;
    std::string checkpoint_id;
    std::string file_path;
    std::string source;                                   // EN: Store name ("memory" / "disk") / FR: Nom du store ("memory" / "disk")
    std::string reason;
    size_t count{0};                                      // EN: Records affected by CLEARED / FR: Enregistrements concernés par CLEARED
};

// EN: Creates, validates, rotates and reloads checkpoints. Retention and validation are written once
//     here and applied to both storage backends.
// FR: Crée, valide, fait tourner et recharge les checkpoints. Rétention et validation sont écrites une
//     seule fois ici et appliquées aux deux backends.
class CheckpointManager {
public:
    using EventCallback = std::function<void(const CheckpointEvent&)>;

    // EN: Null stores default to MemoryCheckpointStore and FileCheckpointStore(checkpoint_directory).
    // FR: Les stores nuls deviennent MemoryCheckpointStore et FileCheckpointStore(checkpoint_directory).
    explicit CheckpointManager(const CheckpointConfig& config = CheckpointConfig{},
                               std::unique_ptr<ICheckpointStore> memory_store = nullptr,
                               std::unique_ptr<ICheckpointStore> disk_store = nullptr);
    ~CheckpointManager() = default;

    // EN: Non-copyable and non-movable
    // FR: Non-copiable et non-déplaçable
    CheckpointManager(const CheckpointManager&) = delete;
    CheckpointManager& operator=(const CheckpointManager&) = delete;
    CheckpointManager(CheckpointManager&&) = delete;
    CheckpointManager& operator=(CheckpointManager&&) = delete;

    // EN: nullopt when checkpointing is disabled. A failed disk write is counted and reported
    //     but the returned checkpoint stays valid in memory.
    // FR: nullopt si les checkpoints sont désactivés. Un échec d'écriture disque est compté et
    //     signalé mais le checkpoint retourné reste valide en mémoire.
    std::optional<Checkpoint> createCheckpoint(const std::string& file_path,
                                               const ProgressSnapshot& state,
                                               const CheckpointMetadata& metadata = CheckpointMetadata{},
                                               const CreateCheckpointOptions& options = CreateCheckpointOptions{});

    // EN: Newest valid checkpoint for the file. Invalid candidates are skipped, never fatal.
    // FR: Checkpoint valide le plus récent du fichier. Les candidats invalides sont ignorés.
    std::optional<Checkpoint> loadCheckpoint(const std::string& file_path,
                                             const LoadCheckpointOptions& options = LoadCheckpointOptions{});

    bool removeCheckpoint(const std::string& checkpoint_id, bool remove_from_disk = true);
    size_t clearAllCheckpoints(const std::string& file_path);

    // EN: In-memory checkpoints for the file, newest first.
    // FR: Checkpoints en mémoire du fichier, du plus récent au plus ancien.
    std::vector<Checkpoint> getCheckpointsForFile(const std::string& file_path) const;

    // EN: Checksum, required fields and age. Does not throw.
    // FR: Checksum, champs requis et âge. Ne lève pas d'exception.
    bool validateCheckpoint(const Checkpoint& checkpoint) const;

    // EN: Remove on-disk records older than retention_days. Returns the number removed.
    // FR: Supprime les enregistrements disque plus vieux que retention_days. Retourne le nombre supprimé.
    size_t cleanupExpired(const std::string& file_path);

    CheckpointStatistics getStatistics() const;
    void resetStatistics();
    nlohmann::json exportData() const;

    void addEventListener(const std::string& listener_id, EventCallback callback);
    void removeEventListener(const std::string& listener_id);

    const CheckpointConfig& getConfig() const { return config_; }

    static std::string normalizePath(const std::string& file_path);

private:
    std::string generateCheckpointId();
    int64_t retentionMs() const;

    // EN: Throws CheckpointCorruption when the payload does not yield a valid checkpoint for file_path.
    // FR: Lance CheckpointCorruption si le contenu ne donne pas un checkpoint valide pour file_path.
    Checkpoint parseAndValidate(const std::string& checkpoint_id, const std::string& payload,
                                const std::string& file_path) const;

    std::optional<Checkpoint> loadFromStore(ICheckpointStore& store, const std::string& file_path);
    size_t pruneStore(ICheckpointStore& store, const std::string& file_path);
    void emit(const CheckpointEvent& event);

    CheckpointConfig config_;
    std::unique_ptr<ICheckpointStore> memory_store_;
    std::unique_ptr<ICheckpointStore> disk_store_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> checkpoint_files_;   // EN: id -> normalized source path / FR: id -> chemin source normalisé
    CheckpointStatistics stats_;
    std::atomic<uint64_t> sequence_{0};

    std::mutex listeners_mutex_;
    std::map<std::string, EventCallback> listeners_;
};

} // namespace GCS
