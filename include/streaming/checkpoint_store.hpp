#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GCS {

// EN: Progress captured in a checkpoint. Times are milliseconds since the Unix epoch.
// FR: Progression capturée dans un checkpoint. Temps en millisecondes depuis l'epoch Unix.
struct ProgressSnapshot {
    size_t current_chunk = 0;
    size_t total_chunks = 0;
    size_t current_line = 0;
    size_t total_lines = 0;
    uint64_t bytes_processed = 0;
    uint64_t total_bytes = 0;
    int64_t start_time_ms = 0;
    std::optional<int64_t> pause_time_ms;

    bool operator==(const ProgressSnapshot& other) const;
    bool operator!=(const ProgressSnapshot& other) const { return !(*this == other); }
};

struct CheckpointMetadata {
    size_t chunk_size = 0;                        // EN: Needed to rebuild identical chunk indices / FR: Requis pour reconstruire les mêmes indices
    size_t chunks_successful = 0;
    size_t chunks_failed = 0;
    double average_chunk_time_ms = 0.0;
    std::vector<size_t> failed_chunk_indices;
    std::optional<std::string> last_error;
    std::map<std::string, std::string> extra;     // EN: Caller-supplied key/values / FR: Clés/valeurs fournies par l'appelant

    bool operator==(const CheckpointMetadata& other) const;
};

struct Checkpoint {
    std::string id;
    std::string version = "1.0";
    int64_t timestamp_ms = 0;
    std::string file_path;
    ProgressSnapshot state;
    CheckpointMetadata metadata;
    std::string checksum;
};

// EN: Storage backend holding opaque serialized records keyed by source file and checkpoint id.
// FR: Backend de stockage contenant des enregistrements sérialisés opaques, indexés par fichier source et id.
class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    virtual std::string name() const = 0;
    virtual bool write(const std::string& file_path, const std::string& checkpoint_id, const std::string& payload) = 0;
    virtual std::optional<std::string> read(const std::string& file_path, const std::string& checkpoint_id) const = 0;

    // EN: Ids for the file, newest first.
    // FR: Ids du fichier, du plus récent au plus ancien.
    virtual std::vector<std::string> list(const std::string& file_path) const = 0;

    virtual bool remove(const std::string& file_path, const std::string& checkpoint_id) = 0;
    virtual size_t clear(const std::string& file_path) = 0;
};

class MemoryCheckpointStore : public ICheckpointStore {
public:
    std::string name() const override { return "memory"; }
    bool write(const std::string& file_path, const std::string& checkpoint_id, const std::string& payload) override;
    std::optional<std::string> read(const std::string& file_path, const std::string& checkpoint_id) const override;
    std::vector<std::string> list(const std::string& file_path) const override;
    bool remove(const std::string& file_path, const std::string& checkpoint_id) override;
    size_t clear(const std::string& file_path) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> records_;
};

// EN: One file per checkpoint under <root>/<source name>_<crc32 of source path>/<id>.json.
//     A relative root is resolved beside the source file.
// FR: Un fichier par checkpoint sous <racine>/<nom source>_<crc32 du chemin>/<id>.json.
//     Une racine relative est résolue à côté du fichier source.
class FileCheckpointStore : public ICheckpointStore {
public:
    explicit FileCheckpointStore(std::string checkpoint_directory);

    std::string name() const override { return "disk"; }
    bool write(const std::string& file_path, const std::string& checkpoint_id, const std::string& payload) override;
    std::optional<std::string> read(const std::string& file_path, const std::string& checkpoint_id) const override;
    std::vector<std::string> list(const std::string& file_path) const override;
    bool remove(const std::string& file_path, const std::string& checkpoint_id) override;
    size_t clear(const std::string& file_path) override;

    std::filesystem::path locationFor(const std::string& file_path) const;

private:
    std::string checkpoint_directory_;
    mutable std::mutex mutex_;
};

namespace CheckpointUtils {

    inline constexpr const char* kCompressedMarker = "compressed:";

    // EN: Canonical JSON form. The checksum field is left out when include_checksum is false.
    // FR: Forme JSON canonique. Le champ checksum est omis si include_checksum est faux.
    nlohmann::json toJson(const Checkpoint& checkpoint, bool include_checksum = true);

    // EN: Throws CheckpointCorruption when a required field is missing or has the wrong type.
    // FR: Lance CheckpointCorruption si un champ requis manque ou a un mauvais type.
    Checkpoint fromJson(const nlohmann::json& record);

    // EN: CRC32 of the record without its checksum field, as 8 lowercase hex digits.
    // FR: CRC32 de l'enregistrement sans son champ checksum, en 8 chiffres hexadécimaux.
    std::string computeChecksum(const nlohmann::json& record);
    std::string computeChecksum(const Checkpoint& checkpoint);

    std::string crc32Hex(const std::string& data);

    // EN: zlib deflate then base64, prefixed with the compressed marker.
    // FR: Deflate zlib puis base64, préfixé par le marqueur de compression.
    std::string encodeCompressed(const std::string& json_text);

    // EN: Accepts both plain JSON and compressed payloads. Throws std::runtime_error on malformed data.
    // FR: Accepte le JSON brut et les contenus compressés. Lance std::runtime_error si malformé.
    std::string decodePayload(const std::string& payload);

    std::string base64Encode(const std::string& data);
    std::string base64Decode(const std::string& encoded);

    // EN: Epoch milliseconds embedded in an id "cp_<ms>_<seq>_<rand>", nullopt otherwise.
    // FR: Millisecondes epoch contenues dans un id "cp_<ms>_<seq>_<rand>", nullopt sinon.
    std::optional<int64_t> timestampFromId(const std::string& checkpoint_id);

    int64_t nowMs();

} // namespace CheckpointUtils

} // namespace GCS
