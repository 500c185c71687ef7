// EN: Unit tests for the FileAnalyzer: chunk partitioning, line filtering and metadata
// FR: Tests unitaires pour le FileAnalyzer : découpage en chunks, filtrage des lignes et métadonnées

#include <gtest/gtest.h>
#include "../include/streaming/file_analyzer.hpp"
#include "../include/core/streaming_errors.hpp"
#include "../include/infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace GCS;

// EN: Test fixture writing G-code programs into a scratch directory
// FR: Fixture de test écrivant des programmes G-code dans un répertoire temporaire
class FileAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        dir_ = std::filesystem::temp_directory_path() /
               ("gstream_analyzer_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string writeProgram(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    std::string writeLines(const std::string& name, size_t count) {
        std::string content;
        for (size_t i = 0; i < count; ++i) {
            content += "G1 X" + std::to_string(i) + " Y" + std::to_string(i % 7) + " F1200\n";
        }
        return writeProgram(name, content);
    }

    std::filesystem::path dir_;
};

TEST_F(FileAnalyzerTest, PartitionsTenThousandLinesIntoTenChunks) {
    const std::string path = writeLines("part.gcode", 10000);
    FileAnalyzer analyzer;

    FileAnalysis analysis = analyzer.analyzeFile(path, AnalysisOptions{1000});

    EXPECT_EQ(analysis.total_lines, 10000u);
    ASSERT_EQ(analysis.chunks.size(), 10u);
    for (size_t i = 0; i < analysis.chunks.size(); ++i) {
        const Chunk& chunk = analysis.chunks[i];
        EXPECT_EQ(chunk.index, i);
        EXPECT_EQ(chunk.start_line, i * 1000 + 1);
        EXPECT_EQ(chunk.end_line, (i + 1) * 1000);
        EXPECT_EQ(chunk.line_count, 1000u);
        EXPECT_EQ(chunk.lines.size(), 1000u);
    }
    EXPECT_EQ(analysis.chunk_statistics.total_chunks, 10u);
    EXPECT_EQ(analysis.chunk_statistics.average_chunk_size, 1000u);
}

// EN: Chunks cover every kept line exactly once, in order, with contiguous byte ranges
// FR: Les chunks couvrent chaque ligne conservée une seule fois, dans l'ordre, avec des plages d'octets contiguës
TEST_F(FileAnalyzerTest, ChunksAreContiguousWithShortFinalChunk) {
    const std::string path = writeLines("short.gcode", 2500);
    FileAnalyzer analyzer;

    FileAnalysis analysis = analyzer.analyzeFile(path, AnalysisOptions{1000});

    ASSERT_EQ(analysis.chunks.size(), 3u);
    EXPECT_EQ(analysis.chunks.back().line_count, 500u);
    EXPECT_EQ(analysis.chunks.front().start_byte_offset, 0u);
    for (size_t i = 1; i < analysis.chunks.size(); ++i) {
        EXPECT_EQ(analysis.chunks[i - 1].end_line + 1, analysis.chunks[i].start_line);
        EXPECT_EQ(analysis.chunks[i - 1].end_byte_offset, analysis.chunks[i].start_byte_offset);
    }
    EXPECT_EQ(analysis.chunks.back().end_byte_offset, analysis.file_size);
    EXPECT_EQ(analysis.chunk_statistics.largest_chunk, 1000u);
    EXPECT_EQ(analysis.chunk_statistics.smallest_chunk, 500u);
}

TEST_F(FileAnalyzerTest, SkipsCommentsAndBlankLinesByDefault) {
    const std::string path = writeProgram("comments.gcode",
        "; header comment\n"
        "(program start)\n"
        "\n"
        "G21\r\n"
        "   \n"
        "G0 X0 Y0 ; rapid home\n"
        "G1 X10 F300\n");
    FileAnalyzer analyzer;

    FileAnalysis analysis = analyzer.analyzeFile(path);

    EXPECT_EQ(analysis.total_lines, 3u);
    ASSERT_EQ(analysis.chunks.size(), 1u);
    EXPECT_EQ(analysis.chunks[0].lines,
              (std::vector<std::string>{"G21", "G0 X0 Y0 ; rapid home", "G1 X10 F300"}));
    EXPECT_TRUE(analysis.metadata.has_comments);
    EXPECT_EQ(analysis.metadata.motion_commands, 2u);
    EXPECT_EQ(analysis.metadata.feed_rate_changes, 1u);
}

TEST_F(FileAnalyzerTest, KeepsEverythingWhenFilteringDisabled) {
    const std::string path = writeProgram("keep.gcode", "; c\n\nG1 X1\n");
    FileAnalyzerConfig config;
    config.skip_comments = false;
    config.skip_empty_lines = false;
    FileAnalyzer analyzer(config);

    EXPECT_EQ(analyzer.analyzeFile(path).total_lines, 3u);
}

TEST_F(FileAnalyzerTest, ShouldSkipLineRules) {
    EXPECT_TRUE(FileAnalyzer::shouldSkipLine("   ", true, false));
    EXPECT_FALSE(FileAnalyzer::shouldSkipLine("   ", false, false));
    EXPECT_TRUE(FileAnalyzer::shouldSkipLine("  ; note", false, true));
    EXPECT_TRUE(FileAnalyzer::shouldSkipLine("(tool 3)", false, true));
    EXPECT_FALSE(FileAnalyzer::shouldSkipLine("G1 X1 (inline)", true, true));
}

TEST_F(FileAnalyzerTest, ComplexityIsDeterministicAndWeighted) {
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({}), 0.0);
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({"G1 X1"}), 1.0);
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({"G1 X1", "G0 X0"}), 0.8);
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({"G2 X1 Y1 I1 J0"}), 3.0);
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({"T2 M6"}), 5.0);
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({"G54"}), 2.0);

    // EN: Words inside comments are ignored / FR: Les mots dans les commentaires sont ignorés
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity({"(G2 T1) G1 X5 ; G3"}), 1.0);

    const std::vector<std::string> program = {"G0 X0", "G1 X5 F100", "G3 X1 Y1 R1", "T4 M6", "G55"};
    EXPECT_DOUBLE_EQ(FileAnalyzer::calculateComplexity(program), FileAnalyzer::calculateComplexity(program));
}

TEST_F(FileAnalyzerTest, ChunkMetadataFlagsToolAndCoordinateChanges) {
    const std::string path = writeProgram("tools.gcode", "G54\nG1 X1\nT1 M6\nG1 X2\n");
    FileAnalyzer analyzer;

    FileAnalysis analysis = analyzer.analyzeFile(path, AnalysisOptions{2});

    ASSERT_EQ(analysis.chunks.size(), 2u);
    EXPECT_TRUE(analysis.chunks[0].metadata.has_coordinate_change);
    EXPECT_FALSE(analysis.chunks[0].metadata.has_tool_change);
    EXPECT_TRUE(analysis.chunks[1].metadata.has_tool_change);
    EXPECT_EQ(analysis.metadata.tool_changes, 1u);
    EXPECT_EQ(analysis.metadata.coordinate_system_changes, 1u);
}

TEST_F(FileAnalyzerTest, MissingFileThrowsAnalysisError) {
    FileAnalyzer analyzer;
    const std::string missing = (dir_ / "missing.gcode").string();
    try {
        analyzer.analyzeFile(missing);
        FAIL() << "Expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.filePath(), missing);
    }
    EXPECT_THROW(analyzer.analyzeFile(dir_.string()), AnalysisError);
}

TEST_F(FileAnalyzerTest, EmptyFileHasNoChunks) {
    const std::string path = writeProgram("empty.gcode", "");
    FileAnalyzer analyzer;

    FileAnalysis analysis = analyzer.analyzeFile(path);
    EXPECT_EQ(analysis.total_lines, 0u);
    EXPECT_TRUE(analysis.chunks.empty());
}

TEST_F(FileAnalyzerTest, ReadChunkLinesReloadsWithoutRetention) {
    const std::string path = writeProgram("reload.gcode",
        "G21\n; skipped\nG1 X1\nG1 X2\n\nG1 X3\nG1 X4\n");
    FileAnalyzerConfig config;
    config.retain_lines = false;
    FileAnalyzer analyzer(config);

    FileAnalysis analysis = analyzer.analyzeFile(path, AnalysisOptions{2});
    ASSERT_EQ(analysis.chunks.size(), 3u);
    EXPECT_TRUE(analysis.chunks[1].lines.empty());

    EXPECT_EQ(analyzer.readChunkLines(path, analysis.chunks[0]), (std::vector<std::string>{"G21", "G1 X1"}));
    EXPECT_EQ(analyzer.readChunkLines(path, analysis.chunks[1]), (std::vector<std::string>{"G1 X2", "G1 X3"}));
    EXPECT_EQ(analyzer.readChunkLines(path, analysis.chunks[2]), (std::vector<std::string>{"G1 X4"}));
}

TEST_F(FileAnalyzerTest, EmitsProgressAndAnalyzedEvents) {
    const std::string path = writeLines("events.gcode", 25000);
    FileAnalyzer analyzer;

    std::vector<size_t> progress_lines;
    size_t analyzed_chunks = 0;
    analyzer.addProgressListener("test", [&progress_lines](const AnalysisProgress& progress) {
        progress_lines.push_back(progress.lines_processed);
    });
    analyzer.addAnalyzedListener("test", [&analyzed_chunks](const FileAnalysis& analysis) {
        analyzed_chunks = analysis.chunks.size();
    });

    analyzer.analyzeFile(path, AnalysisOptions{5000});

    EXPECT_EQ(progress_lines, (std::vector<size_t>{10000, 20000}));
    EXPECT_EQ(analyzed_chunks, 5u);

    analyzer.removeListener("test");
    progress_lines.clear();
    analyzer.analyzeFile(path);
    EXPECT_TRUE(progress_lines.empty());
}

TEST_F(FileAnalyzerTest, ProgressCountsKeptLinesOnly) {
    std::string content;
    for (size_t i = 0; i < 15000; ++i) {
        content += "; step " + std::to_string(i) + "\n\nG1 X" + std::to_string(i) + "\n";
    }
    const std::string path = writeProgram("commented.gcode", content);
    FileAnalyzer analyzer;

    std::vector<size_t> progress_lines;
    analyzer.addProgressListener("test", [&progress_lines](const AnalysisProgress& progress) {
        progress_lines.push_back(progress.lines_processed);
    });

    FileAnalysis analysis = analyzer.analyzeFile(path);

    EXPECT_EQ(analysis.total_lines, 15000u);
    EXPECT_EQ(progress_lines, (std::vector<size_t>{10000}));
}

TEST_F(FileAnalyzerTest, StatisticsAndFileMetadata) {
    const std::string path = writeLines("stats.nc", 100);
    FileAnalyzer analyzer;
    analyzer.analyzeFile(path);
    analyzer.analyzeFile(path);

    auto stats = analyzer.getAnalysisStatistics();
    EXPECT_EQ(stats.total_files, 2u);
    EXPECT_EQ(stats.total_lines, 200u);

    auto info = analyzer.getFileMetadata(path);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->extension, ".nc");
    EXPECT_EQ(info->size * 2, stats.total_bytes);
    EXPECT_FALSE(analyzer.getFileMetadata((dir_ / "none").string()).has_value());

    analyzer.resetStatistics();
    EXPECT_EQ(analyzer.getAnalysisStatistics().total_files, 0u);
}

TEST_F(FileAnalyzerTest, RejectsZeroChunkSize) {
    FileAnalyzerConfig config;
    config.chunk_size = 0;
    EXPECT_THROW(FileAnalyzer analyzer(config), ConfigurationError);
}

TEST_F(FileAnalyzerTest, EstimatesAnalysisTimeFromHistory) {
    const std::string path = writeLines("estimate.gcode", 1000);
    FileAnalyzer analyzer;

    EXPECT_EQ(analyzer.estimateAnalysisTime(path).count(), 0);
    analyzer.analyzeFile(path);
    EXPECT_GE(analyzer.estimateAnalysisTime(path).count(), 0);
    EXPECT_EQ(analyzer.estimateAnalysisTime((dir_ / "none").string()).count(), 0);
}
