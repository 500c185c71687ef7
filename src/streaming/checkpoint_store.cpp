// EN: Checkpoint record serialization and the memory / disk storage backends.
// FR: Sérialisation des checkpoints et backends de stockage mémoire / disque.

#include "streaming/checkpoint_store.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace GCS {

bool ProgressSnapshot::operator==(const ProgressSnapshot& other) const {
    return current_chunk == other.current_chunk &&
           total_chunks == other.total_chunks &&
           current_line == other.current_line &&
           total_lines == other.total_lines &&
           bytes_processed == other.bytes_processed &&
           total_bytes == other.total_bytes &&
           start_time_ms == other.start_time_ms &&
           pause_time_ms == other.pause_time_ms;
}

bool CheckpointMetadata::operator==(const CheckpointMetadata& other) const {
    return chunk_size == other.chunk_size &&
           chunks_successful == other.chunks_successful &&
           chunks_failed == other.chunks_failed &&
           average_chunk_time_ms == other.average_chunk_time_ms &&
           failed_chunk_indices == other.failed_chunk_indices &&
           last_error == other.last_error &&
           extra == other.extra;
}

// ---------------------------------------------------------------------------
// MemoryCheckpointStore
// ---------------------------------------------------------------------------

bool MemoryCheckpointStore::write(const std::string& file_path, const std::string& checkpoint_id,
                                  const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[file_path][checkpoint_id] = payload;
    return true;
}

std::optional<std::string> MemoryCheckpointStore::read(const std::string& file_path,
                                                       const std::string& checkpoint_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_it = records_.find(file_path);
    if (file_it == records_.end()) {
        return std::nullopt;
    }
    auto it = file_it->second.find(checkpoint_id);
    if (it == file_it->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryCheckpointStore::list(const std::string& file_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    auto file_it = records_.find(file_path);
    if (file_it != records_.end()) {
        for (auto it = file_it->second.rbegin(); it != file_it->second.rend(); ++it) {
            ids.push_back(it->first);
        }
    }
    return ids;
}

bool MemoryCheckpointStore::remove(const std::string& file_path, const std::string& checkpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_it = records_.find(file_path);
    if (file_it == records_.end()) {
        return false;
    }
    bool removed = file_it->second.erase(checkpoint_id) > 0;
    if (file_it->second.empty()) {
        records_.erase(file_it);
    }
    return removed;
}

size_t MemoryCheckpointStore::clear(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_it = records_.find(file_path);
    if (file_it == records_.end()) {
        return 0;
    }
    size_t count = file_it->second.size();
    records_.erase(file_it);
    return count;
}

// ---------------------------------------------------------------------------
// FileCheckpointStore
// ---------------------------------------------------------------------------

FileCheckpointStore::FileCheckpointStore(std::string checkpoint_directory)
    : checkpoint_directory_(std::move(checkpoint_directory)) {}

std::filesystem::path FileCheckpointStore::locationFor(const std::string& file_path) const {
    std::filesystem::path source(file_path);
    std::filesystem::path root(checkpoint_directory_);
    if (root.is_relative()) {
        root = source.parent_path() / root;
    }
    std::error_code ec;
    std::filesystem::path absolute_source = std::filesystem::absolute(source, ec);
    const std::string key = ec ? source.lexically_normal().string() : absolute_source.lexically_normal().string();
    return root / (source.filename().string() + "_" + CheckpointUtils::crc32Hex(key));
}

// EN: Written to a temporary file then renamed, so a crash never leaves a half-written record.
// FR: Écrit dans un fichier temporaire puis renommé, un crash ne laisse jamais d'enregistrement partiel.
bool FileCheckpointStore::write(const std::string& file_path, const std::string& checkpoint_id,
                                const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto directory = locationFor(file_path);
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        LOG_ERROR("checkpoint_manager", "Cannot create checkpoint directory " + directory.string() + ": " + ec.message());
        return false;
    }

    const auto target = directory / (checkpoint_id + ".json");
    const auto temp = directory / (checkpoint_id + ".json.tmp");
    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            LOG_ERROR("checkpoint_manager", "Failed to open checkpoint file for writing: " + temp.string());
            return false;
        }
        file << payload;
        file.flush();
        if (!file) {
            LOG_ERROR("checkpoint_manager", "Failed to write checkpoint file: " + temp.string());
            std::filesystem::remove(temp, ec);
            return false;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        LOG_ERROR("checkpoint_manager", "Failed to finalize checkpoint file " + target.string() + ": " + ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

std::optional<std::string> FileCheckpointStore::read(const std::string& file_path,
                                                     const std::string& checkpoint_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = locationFor(file_path) / (checkpoint_id + ".json");
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        LOG_WARN("checkpoint_manager", "Read error on checkpoint file " + path.string());
        return std::nullopt;
    }
    return content.str();
}

std::vector<std::string> FileCheckpointStore::list(const std::string& file_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    const auto directory = locationFor(file_path);
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return ids;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            ids.push_back(entry.path().stem().string());
        }
    }
    std::sort(ids.begin(), ids.end(), std::greater<std::string>());
    return ids;
}

bool FileCheckpointStore::remove(const std::string& file_path, const std::string& checkpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    bool removed = std::filesystem::remove(locationFor(file_path) / (checkpoint_id + ".json"), ec);
    if (ec) {
        LOG_WARN("checkpoint_manager", "Failed to delete checkpoint " + checkpoint_id + ": " + ec.message());
        return false;
    }
    return removed;
}

size_t FileCheckpointStore::clear(const std::string& file_path) {
    size_t removed = 0;
    for (const auto& id : list(file_path)) {
        if (remove(file_path, id)) {
            ++removed;
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const auto directory = locationFor(file_path);
    if (std::filesystem::is_directory(directory, ec) && std::filesystem::is_empty(directory, ec)) {
        std::filesystem::remove(directory, ec);
    }
    return removed;
}

// ---------------------------------------------------------------------------
// CheckpointUtils
// ---------------------------------------------------------------------------

namespace CheckpointUtils {

nlohmann::json toJson(const Checkpoint& checkpoint, bool include_checksum) {
    nlohmann::json state;
    state["current_chunk"] = checkpoint.state.current_chunk;
    state["total_chunks"] = checkpoint.state.total_chunks;
    state["current_line"] = checkpoint.state.current_line;
    state["total_lines"] = checkpoint.state.total_lines;
    state["bytes_processed"] = checkpoint.state.bytes_processed;
    state["total_bytes"] = checkpoint.state.total_bytes;
    state["start_time"] = checkpoint.state.start_time_ms;
    state["pause_time"] = checkpoint.state.pause_time_ms
        ? nlohmann::json(*checkpoint.state.pause_time_ms) : nlohmann::json(nullptr);

    nlohmann::json metadata;
    metadata["chunk_size"] = checkpoint.metadata.chunk_size;
    metadata["chunks_successful"] = checkpoint.metadata.chunks_successful;
    metadata["chunks_failed"] = checkpoint.metadata.chunks_failed;
    metadata["average_chunk_time_ms"] = checkpoint.metadata.average_chunk_time_ms;
    metadata["failed_chunk_indices"] = checkpoint.metadata.failed_chunk_indices;
    metadata["last_error"] = checkpoint.metadata.last_error
        ? nlohmann::json(*checkpoint.metadata.last_error) : nlohmann::json(nullptr);
    metadata["extra"] = checkpoint.metadata.extra;

    nlohmann::json record;
    record["id"] = checkpoint.id;
    record["version"] = checkpoint.version;
    record["timestamp"] = checkpoint.timestamp_ms;
    record["file_path"] = checkpoint.file_path;
    record["state"] = std::move(state);
    record["metadata"] = std::move(metadata);
    if (include_checksum) {
        record["checksum"] = checkpoint.checksum;
    }
    return record;
}

Checkpoint fromJson(const nlohmann::json& record) {
    const std::string id = record.is_object() && record.contains("id") && record["id"].is_string()
        ? record["id"].get<std::string>() : std::string("<unknown>");

    for (const char* field : {"id", "timestamp", "file_path", "state"}) {
        if (!record.is_object() || !record.contains(field)) {
            throw CheckpointCorruption(id, std::string("missing field '") + field + "'");
        }
    }

    try {
        Checkpoint checkpoint;
        checkpoint.id = record.at("id").get<std::string>();
        checkpoint.version = record.value("version", std::string("1.0"));
        checkpoint.timestamp_ms = record.at("timestamp").get<int64_t>();
        checkpoint.file_path = record.at("file_path").get<std::string>();
        checkpoint.checksum = record.value("checksum", std::string());

        const auto& state = record.at("state");
        checkpoint.state.current_chunk = state.at("current_chunk").get<size_t>();
        checkpoint.state.total_chunks = state.at("total_chunks").get<size_t>();
        checkpoint.state.current_line = state.at("current_line").get<size_t>();
        checkpoint.state.total_lines = state.at("total_lines").get<size_t>();
        checkpoint.state.bytes_processed = state.at("bytes_processed").get<uint64_t>();
        checkpoint.state.total_bytes = state.at("total_bytes").get<uint64_t>();
        checkpoint.state.start_time_ms = state.at("start_time").get<int64_t>();
        if (state.contains("pause_time") && !state["pause_time"].is_null()) {
            checkpoint.state.pause_time_ms = state["pause_time"].get<int64_t>();
        }

        if (record.contains("metadata") && record["metadata"].is_object()) {
            const auto& metadata = record["metadata"];
            checkpoint.metadata.chunk_size = metadata.value("chunk_size", size_t{0});
            checkpoint.metadata.chunks_successful = metadata.value("chunks_successful", size_t{0});
            checkpoint.metadata.chunks_failed = metadata.value("chunks_failed", size_t{0});
            checkpoint.metadata.average_chunk_time_ms = metadata.value("average_chunk_time_ms", 0.0);
            if (metadata.contains("failed_chunk_indices")) {
                checkpoint.metadata.failed_chunk_indices =
                    metadata["failed_chunk_indices"].get<std::vector<size_t>>();
            }
            if (metadata.contains("last_error") && !metadata["last_error"].is_null()) {
                checkpoint.metadata.last_error = metadata["last_error"].get<std::string>();
            }
            if (metadata.contains("extra")) {
                checkpoint.metadata.extra = metadata["extra"].get<std::map<std::string, std::string>>();
            }
        }
        return checkpoint;
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointCorruption(id, std::string("malformed record: ") + e.what());
    }
}

std::string crc32Hex(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << (crc & 0xFFFFFFFFUL);
    return oss.str();
}

std::string computeChecksum(const nlohmann::json& record) {
    nlohmann::json unsigned_record = record;
    if (unsigned_record.is_object()) {
        unsigned_record.erase("checksum");
    }
    return crc32Hex(unsigned_record.dump());
}

std::string computeChecksum(const Checkpoint& checkpoint) {
    return crc32Hex(toJson(checkpoint, false).dump());
}

std::string encodeCompressed(const std::string& json_text) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (deflateInit(&zs, Z_BEST_COMPRESSION) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib compression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(json_text.data()));
    zs.avail_in = static_cast<uInt>(json_text.size());

    std::array<char, 32768> buffer{};
    std::string compressed;
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("zlib compression failed");
        }
        compressed.append(buffer.data(), buffer.size() - zs.avail_out);
    } while (ret != Z_STREAM_END);
    deflateEnd(&zs);

    return std::string(kCompressedMarker) + base64Encode(compressed);
}

std::string decodePayload(const std::string& payload) {
    const std::string marker(kCompressedMarker);
    if (payload.compare(0, marker.size(), marker) != 0) {
        return payload;
    }

    const std::string compressed = base64Decode(payload.substr(marker.size()));
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit(&zs) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib decompression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::array<char, 32768> buffer{};
    std::string output;
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            throw std::runtime_error("zlib decompression failed (code " + std::to_string(ret) + ")");
        }
        output.append(buffer.data(), buffer.size() - zs.avail_out);
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw std::runtime_error("truncated compressed checkpoint");
        }
    } while (ret != Z_STREAM_END);
    inflateEnd(&zs);
    return output;
}

namespace {
    constexpr char kBase64Alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

std::string base64Encode(const std::string& data) {
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t triple = (static_cast<uint8_t>(data[i]) << 16) |
                          (static_cast<uint8_t>(data[i + 1]) << 8) |
                          static_cast<uint8_t>(data[i + 2]);
        encoded.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(kBase64Alphabet[triple & 0x3F]);
        i += 3;
    }

    const size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t value = static_cast<uint8_t>(data[i]) << 16;
        encoded.push_back(kBase64Alphabet[(value >> 18) & 0x3F]);
        encoded.push_back(kBase64Alphabet[(value >> 12) & 0x3F]);
        encoded += "==";
    } else if (remaining == 2) {
        uint32_t value = (static_cast<uint8_t>(data[i]) << 16) | (static_cast<uint8_t>(data[i + 1]) << 8);
        encoded.push_back(kBase64Alphabet[(value >> 18) & 0x3F]);
        encoded.push_back(kBase64Alphabet[(value >> 12) & 0x3F]);
        encoded.push_back(kBase64Alphabet[(value >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}

std::string base64Decode(const std::string& encoded) {
    std::array<int, 256> lookup;
    lookup.fill(-1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
    }

    std::string decoded;
    decoded.reserve(encoded.size() / 4 * 3);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        if (c == '=') {
            break;
        }
        if (c == '\n' || c == '\r') {
            continue;
        }
        int value = lookup[static_cast<unsigned char>(c)];
        if (value < 0) {
            throw std::runtime_error("invalid base64 character");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return decoded;
}

std::optional<int64_t> timestampFromId(const std::string& checkpoint_id) {
    const std::string prefix = "cp_";
    if (checkpoint_id.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    size_t end = checkpoint_id.find('_', prefix.size());
    std::string digits = checkpoint_id.substr(prefix.size(), end == std::string::npos ? std::string::npos : end - prefix.size());
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return std::stoll(digits);
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace CheckpointUtils

} // namespace GCS
