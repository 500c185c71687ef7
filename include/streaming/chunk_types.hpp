// EN: Chunk model for GStream - line ranges produced by analysis and consumed by processing
// FR: Modèle de chunk pour GStream - plages de lignes produites par l'analyse et consommées par le traitement

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace GCS {

struct ChunkMetadata {
    bool has_tool_change = false;       // EN: T-word or M6 present / FR: Mot T ou M6 présent
    bool has_coordinate_change = false; // EN: G54..G59 present / FR: G54..G59 présent
    double complexity = 0.0;            // EN: Weighted ops per line, one decimal / FR: Ops pondérées par ligne, une décimale
};

// EN: Contiguous slice of kept program lines. Line numbers are 1-based and inclusive,
//     byte offsets are relative to the source file, end offset exclusive.
// FR: Tranche contiguë de lignes conservées. Numéros de ligne à partir de 1 et inclusifs,
//     offsets en octets relatifs au fichier source, offset de fin exclusif.
struct Chunk {
    size_t index = 0;
    size_t start_line = 0;
    size_t end_line = 0;
    size_t line_count = 0;
    uint64_t start_byte_offset = 0;
    uint64_t end_byte_offset = 0;
    uint64_t byte_length = 0;
    std::vector<std::string> lines;  // EN: Empty when analysis ran without retaining lines / FR: Vide si l'analyse n'a pas conservé les lignes
    ChunkMetadata metadata;
};

struct FileMetadata {
    bool has_comments = false;
    bool has_sub_programs = false;
    size_t tool_changes = 0;
    size_t coordinate_system_changes = 0;
    size_t motion_commands = 0;
    size_t feed_rate_changes = 0;
};

struct ChunkStatistics {
    size_t total_chunks = 0;
    size_t average_chunk_size = 0;
    size_t largest_chunk = 0;
    size_t smallest_chunk = 0;
    double total_complexity = 0.0;
};

// EN: Result of one analysis pass. Immutable once returned.
// FR: Résultat d'une passe d'analyse. Immuable une fois retourné.
struct FileAnalysis {
    std::string file_path;
    uint64_t file_size = 0;
    size_t total_lines = 0;
    size_t chunk_size = 0;
    std::vector<Chunk> chunks;
    FileMetadata metadata;
    ChunkStatistics chunk_statistics;
    std::chrono::milliseconds analysis_time{0};
};

} // namespace GCS
