#pragma once

#include "streaming/chunk_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GCS {

struct FileAnalyzerConfig {
    size_t chunk_size = 1000;           // EN: Lines per chunk / FR: Lignes par chunk
    size_t buffer_size = 64 * 1024;     // EN: Read buffer in bytes / FR: Tampon de lecture en octets
    bool enable_metadata = true;        // EN: Collect file metadata / FR: Collecte les métadonnées du fichier
    bool validate_chunks = true;        // EN: Check contiguity after build / FR: Vérifie la contiguïté après construction
    bool skip_empty_lines = true;
    bool skip_comments = true;          // EN: Lines starting with ';' or '(' / FR: Lignes commençant par ';' ou '('
    bool retain_lines = true;           // EN: Keep line text inside chunks / FR: Garde le texte des lignes dans les chunks
};

struct AnalysisOptions {
    std::optional<size_t> chunk_size;   // EN: Overrides FileAnalyzerConfig::chunk_size / FR: Surcharge chunk_size
};

struct AnalysisProgress {
    std::string file_path;
    size_t lines_processed = 0;
    uint64_t bytes_processed = 0;
    double percent = 0.0;
};

struct AnalysisStatistics {
    size_t total_files = 0;
    size_t total_lines = 0;
    uint64_t total_bytes = 0;
    double average_analysis_time_ms = 0.0;
    std::chrono::milliseconds total_analysis_time{0};
};

struct SourceFileInfo {
    std::string path;
    std::string extension;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified_at;
};

// EN: Streams a G-code file with a bounded read buffer and partitions kept lines into chunks.
// FR: Lit un fichier G-code avec un tampon borné et découpe les lignes conservées en chunks.
class FileAnalyzer {
public:
    using ProgressCallback = std::function<void(const AnalysisProgress&)>;
    using AnalyzedCallback = std::function<void(const FileAnalysis&)>;

    static constexpr size_t kProgressInterval = 10000;

    explicit FileAnalyzer(const FileAnalyzerConfig& config = FileAnalyzerConfig{});

    // EN: Throws AnalysisError when the file cannot be opened or read.
    // FR: Lance AnalysisError si le fichier ne peut pas être ouvert ou lu.
    FileAnalysis analyzeFile(const std::string& file_path, const AnalysisOptions& options = {});

    // EN: Re-read the kept lines of a chunk from its byte range.
    // FR: Relit les lignes conservées d'un chunk depuis sa plage d'octets.
    std::vector<std::string> readChunkLines(const std::string& file_path, const Chunk& chunk) const;

    std::optional<SourceFileInfo> getFileMetadata(const std::string& file_path) const;

    // EN: Estimated from the running bytes-per-millisecond average; zero before the first analysis.
    // FR: Estimée depuis la moyenne courante octets par milliseconde ; zéro avant la première analyse.
    std::chrono::milliseconds estimateAnalysisTime(const std::string& file_path) const;

    AnalysisStatistics getAnalysisStatistics() const;
    void resetStatistics();

    void addProgressListener(const std::string& listener_id, ProgressCallback callback);
    void addAnalyzedListener(const std::string& listener_id, AnalyzedCallback callback);
    void removeListener(const std::string& listener_id);

    const FileAnalyzerConfig& getConfig() const { return config_; }

    // EN: Weighted operation score of a set of lines, normalized by line count and rounded to one decimal.
    // FR: Score pondéré des opérations d'un ensemble de lignes, normalisé par ligne et arrondi à une décimale.
    static double calculateComplexity(const std::vector<std::string>& lines);

    // EN: True when the line would be dropped under the given skip settings.
    // FR: Vrai si la ligne serait ignorée avec ces réglages.
    static bool shouldSkipLine(const std::string& line, bool skip_empty, bool skip_comments);

private:
    bool keepLine(const std::string& line) const;
    void updateFileMetadata(const std::string& line, FileMetadata& metadata) const;
    ChunkStatistics computeChunkStatistics(const std::vector<Chunk>& chunks, size_t total_lines) const;
    void validateChunkSequence(const FileAnalysis& analysis) const;

    void emitProgress(const AnalysisProgress& progress);
    void emitAnalyzed(const FileAnalysis& analysis);

    FileAnalyzerConfig config_;

    mutable std::mutex stats_mutex_;
    AnalysisStatistics stats_;

    std::mutex listeners_mutex_;
    std::map<std::string, ProgressCallback> progress_listeners_;
    std::map<std::string, AnalyzedCallback> analyzed_listeners_;
};

} // namespace GCS
