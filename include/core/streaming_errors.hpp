#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace GCS {

// EN: Base class for every error raised by the streaming engine.
// FR: Classe de base de toutes les erreurs levées par le moteur de streaming.
class StreamingError : public std::runtime_error {
public:
    explicit StreamingError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Source file cannot be opened or read. Fatal to the analysis call.
// FR: Le fichier source ne peut pas être ouvert ou lu. Fatal pour l'appel d'analyse.
class AnalysisError : public StreamingError {
public:
    AnalysisError(const std::string& file_path, const std::string& reason)
        : StreamingError("Failed to analyze '" + file_path + "': " + reason),
          file_path_(file_path) {}

    const std::string& filePath() const { return file_path_; }

private:
    std::string file_path_;
};

// EN: A chunk attempt exceeded its processing time. Recoverable.
// FR: Une tentative de chunk a dépassé son temps de traitement. Récupérable.
class ChunkTimeoutError : public StreamingError {
public:
    ChunkTimeoutError(size_t chunk_index, std::chrono::milliseconds timeout)
        : StreamingError("Chunk " + std::to_string(chunk_index) + " processing timeout after " +
                         std::to_string(timeout.count()) + "ms"),
          chunk_index_(chunk_index) {}

    size_t chunkIndex() const { return chunk_index_; }

private:
    size_t chunk_index_;
};

// EN: Too many line failures inside one chunk attempt. Recoverable up to the retry limit.
// FR: Trop d'échecs de lignes dans une tentative de chunk. Récupérable jusqu'à la limite de retries.
class ChunkExecutionError : public StreamingError {
public:
    ChunkExecutionError(size_t chunk_index, size_t failed_lines, size_t total_lines,
                        const std::string& last_error)
        : StreamingError("Chunk " + std::to_string(chunk_index) + " failed " +
                         std::to_string(failed_lines) + "/" + std::to_string(total_lines) +
                         " lines" + (last_error.empty() ? "" : ": " + last_error)),
          chunk_index_(chunk_index), failed_lines_(failed_lines) {}

    size_t chunkIndex() const { return chunk_index_; }
    size_t failedLines() const { return failed_lines_; }

private:
    size_t chunk_index_;
    size_t failed_lines_;
};

// EN: A checkpoint candidate failed validation. Raised and caught inside the load loop.
// FR: Un checkpoint candidat a échoué à la validation. Levée et capturée dans la boucle de chargement.
class CheckpointCorruption : public StreamingError {
public:
    CheckpointCorruption(const std::string& checkpoint_id, const std::string& reason)
        : StreamingError("Checkpoint '" + checkpoint_id + "' rejected: " + reason),
          checkpoint_id_(checkpoint_id), reason_(reason) {}

    const std::string& checkpointId() const { return checkpoint_id_; }
    const std::string& reason() const { return reason_; }

private:
    std::string checkpoint_id_;
    std::string reason_;
};

// EN: Invalid lifecycle transition, e.g. starting while already processing.
// FR: Transition de cycle de vie invalide, par ex. démarrer pendant un traitement.
class ProcessingStateError : public StreamingError {
public:
    explicit ProcessingStateError(const std::string& message) : StreamingError(message) {}
};

class ConfigurationError : public StreamingError {
public:
    explicit ConfigurationError(const std::string& message) : StreamingError(message) {}
};

} // namespace GCS
