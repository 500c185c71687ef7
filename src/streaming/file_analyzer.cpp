// EN: Implementation of the FileAnalyzer: bounded streaming read, metadata extraction and chunking.
// FR: Implémentation du FileAnalyzer : lecture bornée, extraction de métadonnées et découpage.

#include "streaming/file_analyzer.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

namespace GCS {

namespace {

// EN: Operations found on one line; each category counts once per line.
// FR: Opérations trouvées sur une ligne ; chaque catégorie compte une fois par ligne.
struct LineOperations {
    bool linear = false;
    bool rapid = false;
    bool arc = false;
    bool tool_change = false;
    bool coordinate_change = false;
    bool sub_program = false;
    bool feed_rate = false;

    double weight() const {
        double total = 0.0;
        if (linear) total += 1.0;
        if (rapid) total += 0.5;
        if (arc) total += 3.0;
        if (tool_change) total += 5.0;
        if (coordinate_change) total += 2.0;
        return total;
    }
};

// EN: Scan address words (letter + number), skipping "( ... )" and everything after ';'.
// FR: Parcourt les mots d'adresse (lettre + nombre), en ignorant "( ... )" et tout ce qui suit ';'.
LineOperations scanLine(const std::string& line) {
    LineOperations ops;
    size_t i = 0;
    const size_t n = line.size();

    while (i < n) {
        char c = line[i];
        if (c == ';') {
            break;
        }
        if (c == '(') {
            size_t close = line.find(')', i);
            if (close == std::string::npos) {
                break;
            }
            i = close + 1;
            continue;
        }

        char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (letter != 'G' && letter != 'M' && letter != 'T' && letter != 'F') {
            ++i;
            continue;
        }

        size_t j = i + 1;
        while (j < n && line[j] == ' ') {
            ++j;
        }
        size_t digits_start = j;
        while (j < n && std::isdigit(static_cast<unsigned char>(line[j]))) {
            ++j;
        }
        if (j == digits_start) {
            ++i;
            continue;
        }

        int code = 0;
        for (size_t k = digits_start; k < j && k < digits_start + 6; ++k) {
            code = code * 10 + (line[k] - '0');
        }
        bool has_fraction = j < n && line[j] == '.';
        if (has_fraction) {
            ++j;
            while (j < n && std::isdigit(static_cast<unsigned char>(line[j]))) {
                ++j;
            }
        }

        switch (letter) {
            case 'G':
                if (!has_fraction) {
                    if (code == 0) ops.rapid = true;
                    else if (code == 1) ops.linear = true;
                    else if (code == 2 || code == 3) ops.arc = true;
                }
                if (code >= 54 && code <= 59) ops.coordinate_change = true;
                break;
            case 'M':
                if (code == 6) ops.tool_change = true;
                if (code == 98 || code == 99) ops.sub_program = true;
                break;
            case 'T':
                ops.tool_change = true;
                break;
            case 'F':
                ops.feed_rate = true;
                break;
            default:
                break;
        }
        i = j;
    }
    return ops;
}

double roundComplexity(double weight_sum, size_t line_count) {
    if (line_count == 0) {
        return 0.0;
    }
    return std::round(weight_sum / static_cast<double>(line_count) * 10.0) / 10.0;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

// EN: In-progress chunk accumulated while streaming.
// FR: Chunk en cours accumulé pendant la lecture.
struct ChunkBuilder {
    size_t start_line = 0;
    size_t line_count = 0;
    uint64_t start_offset = 0;
    uint64_t end_offset = 0;
    double weight_sum = 0.0;
    bool has_tool_change = false;
    bool has_coordinate_change = false;
    std::vector<std::string> lines;

    Chunk build(size_t index) {
        Chunk chunk;
        chunk.index = index;
        chunk.start_line = start_line;
        chunk.end_line = start_line + line_count - 1;
        chunk.line_count = line_count;
        chunk.start_byte_offset = start_offset;
        chunk.end_byte_offset = end_offset;
        chunk.byte_length = end_offset - start_offset;
        chunk.lines = std::move(lines);
        chunk.metadata.has_tool_change = has_tool_change;
        chunk.metadata.has_coordinate_change = has_coordinate_change;
        chunk.metadata.complexity = roundComplexity(weight_sum, line_count);
        *this = ChunkBuilder{};
        return chunk;
    }
};

} // namespace

FileAnalyzer::FileAnalyzer(const FileAnalyzerConfig& config) : config_(config) {
    if (config_.chunk_size == 0) {
        throw ConfigurationError("FileAnalyzer chunk_size must be at least 1");
    }
    if (config_.buffer_size == 0) {
        throw ConfigurationError("FileAnalyzer buffer_size must be at least 1");
    }
}

bool FileAnalyzer::shouldSkipLine(const std::string& line, bool skip_empty, bool skip_comments) {
    std::string trimmed = trim(line);
    if (skip_empty && trimmed.empty()) {
        return true;
    }
    if (skip_comments && !trimmed.empty() && (trimmed[0] == ';' || trimmed[0] == '(')) {
        return true;
    }
    return false;
}

bool FileAnalyzer::keepLine(const std::string& line) const {
    return !shouldSkipLine(line, config_.skip_empty_lines, config_.skip_comments);
}

double FileAnalyzer::calculateComplexity(const std::vector<std::string>& lines) {
    double weight_sum = 0.0;
    for (const auto& line : lines) {
        weight_sum += scanLine(line).weight();
    }
    return roundComplexity(weight_sum, lines.size());
}

void FileAnalyzer::updateFileMetadata(const std::string& line, FileMetadata& metadata) const {
    if (line.find(';') != std::string::npos || line.find('(') != std::string::npos) {
        metadata.has_comments = true;
    }
    LineOperations ops = scanLine(line);
    if (ops.sub_program) metadata.has_sub_programs = true;
    if (ops.tool_change) metadata.tool_changes++;
    if (ops.coordinate_change) metadata.coordinate_system_changes++;
    if (ops.linear || ops.rapid || ops.arc) metadata.motion_commands++;
    if (ops.feed_rate) metadata.feed_rate_changes++;
}

FileAnalysis FileAnalyzer::analyzeFile(const std::string& file_path, const AnalysisOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    const size_t chunk_size = options.chunk_size.value_or(config_.chunk_size);
    if (chunk_size == 0) {
        throw ConfigurationError("chunk_size must be at least 1");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        throw AnalysisError(file_path, "not a regular file");
    }
    const uint64_t file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        throw AnalysisError(file_path, ec.message());
    }

    std::vector<char> read_buffer(config_.buffer_size);
    std::ifstream file;
    file.rdbuf()->pubsetbuf(read_buffer.data(), static_cast<std::streamsize>(read_buffer.size()));
    file.open(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw AnalysisError(file_path, "cannot open file");
    }

    LOG_INFO("file_analyzer", "Analyzing " + file_path + " (" + std::to_string(file_size) + " bytes)");

    FileAnalysis analysis;
    analysis.file_path = file_path;
    analysis.file_size = file_size;
    analysis.chunk_size = chunk_size;

    ChunkBuilder builder;
    uint64_t offset = 0;
    size_t raw_lines = 0;
    size_t kept_lines = 0;
    std::string line;

    while (std::getline(file, line)) {
        const uint64_t line_offset = offset;
        const uint64_t raw_length = line.size() + (file.eof() ? 0 : 1);
        offset += raw_length;
        ++raw_lines;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (keepLine(line)) {
            ++kept_lines;
            if (config_.enable_metadata) {
                updateFileMetadata(line, analysis.metadata);
            }

            if (builder.line_count == 0) {
                builder.start_line = kept_lines;
                builder.start_offset = line_offset;
            }
            LineOperations ops = scanLine(line);
            builder.weight_sum += ops.weight();
            builder.has_tool_change = builder.has_tool_change || ops.tool_change;
            builder.has_coordinate_change = builder.has_coordinate_change || ops.coordinate_change;
            builder.end_offset = line_offset + raw_length;
            builder.line_count++;
            if (config_.retain_lines) {
                builder.lines.push_back(line);
            }

            if (builder.line_count >= chunk_size) {
                analysis.chunks.push_back(builder.build(analysis.chunks.size()));
            }

            // EN: Cadence follows kept lines; comments and blanks do not advance it.
            // FR: La cadence suit les lignes conservées ; commentaires et lignes vides ne la font pas avancer.
            if (kept_lines % kProgressInterval == 0) {
                AnalysisProgress progress;
                progress.file_path = file_path;
                progress.lines_processed = kept_lines;
                progress.bytes_processed = offset;
                progress.percent = file_size > 0
                    ? static_cast<double>(offset) / static_cast<double>(file_size) * 100.0
                    : 100.0;
                emitProgress(progress);
            }
        }
    }

    if (file.bad()) {
        throw AnalysisError(file_path, "read error after " + std::to_string(offset) + " bytes");
    }

    if (builder.line_count > 0) {
        analysis.chunks.push_back(builder.build(analysis.chunks.size()));
    }

    analysis.total_lines = kept_lines;
    analysis.chunk_statistics = computeChunkStatistics(analysis.chunks, kept_lines);
    analysis.analysis_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (config_.validate_chunks) {
        validateChunkSequence(analysis);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_files++;
        stats_.total_lines += kept_lines;
        stats_.total_bytes += file_size;
        stats_.total_analysis_time += analysis.analysis_time;
        stats_.average_analysis_time_ms =
            static_cast<double>(stats_.total_analysis_time.count()) / static_cast<double>(stats_.total_files);
    }

    LOG_INFO_META("file_analyzer", "File analyzed", (std::unordered_map<std::string, std::string>{
        {"file", file_path},
        {"lines", std::to_string(kept_lines)},
        {"skipped_lines", std::to_string(raw_lines - kept_lines)},
        {"chunks", std::to_string(analysis.chunks.size())},
        {"analysis_ms", std::to_string(analysis.analysis_time.count())}
    }));

    emitAnalyzed(analysis);
    return analysis;
}

ChunkStatistics FileAnalyzer::computeChunkStatistics(const std::vector<Chunk>& chunks, size_t total_lines) const {
    ChunkStatistics stats;
    stats.total_chunks = chunks.size();
    if (chunks.empty()) {
        return stats;
    }

    stats.average_chunk_size = static_cast<size_t>(
        std::llround(static_cast<double>(total_lines) / static_cast<double>(chunks.size())));
    stats.smallest_chunk = std::numeric_limits<size_t>::max();
    for (const auto& chunk : chunks) {
        stats.largest_chunk = std::max(stats.largest_chunk, chunk.line_count);
        stats.smallest_chunk = std::min(stats.smallest_chunk, chunk.line_count);
        stats.total_complexity += chunk.metadata.complexity;
    }
    return stats;
}

// EN: Violations are logged only; the analysis is still returned.
// FR: Les violations sont seulement journalisées ; l'analyse est quand même retournée.
void FileAnalyzer::validateChunkSequence(const FileAnalysis& analysis) const {
    const auto& chunks = analysis.chunks;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        if (chunk.index != i) {
            LOG_WARN("file_analyzer", "Chunk index mismatch: expected " + std::to_string(i) +
                     ", got " + std::to_string(chunk.index));
        }
        if (chunk.end_line < chunk.start_line) {
            LOG_WARN("file_analyzer", "Chunk " + std::to_string(i) + " has end line before start line");
        }
        if (i == 0 && chunk.start_line != 1) {
            LOG_WARN("file_analyzer", "First chunk does not start at line 1");
        }
        if (i > 0 && chunks[i - 1].end_line + 1 != chunk.start_line) {
            LOG_WARN("file_analyzer", "Line continuity broken between chunks " + std::to_string(i - 1) +
                     " and " + std::to_string(i));
        }
    }
    if (!chunks.empty() && chunks.back().end_line != analysis.total_lines) {
        LOG_WARN("file_analyzer", "Last chunk ends at line " + std::to_string(chunks.back().end_line) +
                 " but file has " + std::to_string(analysis.total_lines) + " lines");
    }
}

std::vector<std::string> FileAnalyzer::readChunkLines(const std::string& file_path, const Chunk& chunk) const {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw AnalysisError(file_path, "cannot open file");
    }
    file.seekg(static_cast<std::streamoff>(chunk.start_byte_offset));
    if (!file) {
        throw AnalysisError(file_path, "cannot seek to offset " + std::to_string(chunk.start_byte_offset));
    }

    std::vector<std::string> lines;
    lines.reserve(chunk.line_count);
    uint64_t offset = chunk.start_byte_offset;
    std::string line;
    while (lines.size() < chunk.line_count && offset < chunk.end_byte_offset && std::getline(file, line)) {
        offset += line.size() + (file.eof() ? 0 : 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (keepLine(line)) {
            lines.push_back(line);
        }
    }

    if (lines.size() != chunk.line_count) {
        throw AnalysisError(file_path, "chunk " + std::to_string(chunk.index) + " expected " +
                            std::to_string(chunk.line_count) + " lines, read " + std::to_string(lines.size()));
    }
    return lines;
}

std::optional<SourceFileInfo> FileAnalyzer::getFileMetadata(const std::string& file_path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return std::nullopt;
    }

    SourceFileInfo info;
    info.path = file_path;
    info.extension = std::filesystem::path(file_path).extension().string();
    info.size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto write_time = std::filesystem::last_write_time(file_path, ec);
    if (!ec) {
        info.modified_at = std::chrono::system_clock::now() +
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                write_time - std::filesystem::file_time_type::clock::now());
    }
    return info;
}

std::chrono::milliseconds FileAnalyzer::estimateAnalysisTime(const std::string& file_path) const {
    auto info = getFileMetadata(file_path);
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!info || stats_.total_bytes == 0) {
        return std::chrono::milliseconds{0};
    }
    double ms_per_byte = static_cast<double>(stats_.total_analysis_time.count()) /
                         static_cast<double>(stats_.total_bytes);
    return std::chrono::milliseconds{static_cast<long long>(std::ceil(ms_per_byte * static_cast<double>(info->size)))};
}

AnalysisStatistics FileAnalyzer::getAnalysisStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void FileAnalyzer::resetStatistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = AnalysisStatistics{};
}

void FileAnalyzer::addProgressListener(const std::string& listener_id, ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    progress_listeners_[listener_id] = std::move(callback);
}

void FileAnalyzer::addAnalyzedListener(const std::string& listener_id, AnalyzedCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    analyzed_listeners_[listener_id] = std::move(callback);
}

void FileAnalyzer::removeListener(const std::string& listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    progress_listeners_.erase(listener_id);
    analyzed_listeners_.erase(listener_id);
}

void FileAnalyzer::emitProgress(const AnalysisProgress& progress) {
    std::map<std::string, ProgressCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = progress_listeners_;
    }
    for (const auto& [id, callback] : listeners) {
        callback(progress);
    }
}

void FileAnalyzer::emitAnalyzed(const FileAnalysis& analysis) {
    std::map<std::string, AnalyzedCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = analyzed_listeners_;
    }
    for (const auto& [id, callback] : listeners) {
        callback(analysis);
    }
}

} // namespace GCS
