#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/streaming_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "core/streaming_errors.hpp"
#include "streaming/chunked_file_streamer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

// EN: Controller stand-in that prints every line with its position
// FR: Remplaçant de contrôleur qui affiche chaque ligne avec sa position
class ConsoleStreamingManager : public GCS::IStreamingManager {
public:
    explicit ConsoleStreamingManager(std::chrono::milliseconds line_delay) : line_delay_(line_delay) {}

    std::string sendLine(const std::string& line, const GCS::LineContext& context) override {
        if (line_delay_.count() > 0) {
            std::this_thread::sleep_for(line_delay_);
        }
        std::cout << "[" << context.chunk_index << ":" << context.line_number << "] " << line
                  << (context.is_last_line_in_chunk ? "  <- end of chunk" : "") << std::endl;
        return "ok";
    }

private:
    std::chrono::milliseconds line_delay_;
};

std::atomic<GCS::ChunkedFileStreamer*> g_streamer{nullptr};
std::atomic<bool> g_interrupted{false};

void handleInterrupt(int) {
    g_interrupted.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <program.gcode> [config.yaml]" << std::endl;
        return 1;
    }

    auto& logger = GCS::Logger::getInstance();
    logger.setLogLevel(GCS::LogLevel::INFO);
    logger.setCorrelationId(logger.generateCorrelationId());

    auto& config = GCS::ConfigManager::getInstance();
    if (argc > 2 && !config.loadFromFile(argv[2])) {
        LOG_ERROR("stream_example", std::string("Failed to load configuration from ") + argv[2]);
        return 1;
    }

    GCS::StreamingConfig streaming_config;
    try {
        streaming_config = GCS::StreamingConfigLoader::fromConfigManager(config);
    } catch (const GCS::ConfigurationError& e) {
        LOG_ERROR("stream_example", e.what());
        return 1;
    }

    const int line_delay_ms = config.has("example", "line_delay_ms")
        ? CONFIG_GET_SECTION("example", "line_delay_ms").asOrDefault<int>(0) : 0;
    ConsoleStreamingManager controller{std::chrono::milliseconds(line_delay_ms)};

    // EN: The console accepts one line at a time even when several chunks are in flight
    // FR: La console n'accepte qu'une ligne à la fois même avec plusieurs chunks en vol
    GCS::SerializedStreamingManager serialized(controller);
    GCS::ChunkedFileStreamer streamer(serialized, streaming_config);
    g_streamer.store(&streamer);

    // EN: Ctrl-C stops the run; the final checkpoint lets the next invocation resume
    // FR: Ctrl-C arrête le run ; le checkpoint final permet à l'invocation suivante de reprendre
    std::signal(SIGINT, handleInterrupt);
    std::thread watcher([]() {
        while (g_streamer.load() && !g_interrupted.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (auto* streamer = g_streamer.load()) {
            streamer->stopStreaming();
        }
    });

    int exit_code = 0;
    try {
        GCS::StreamingResult result = streamer.startStreaming(argv[1]);
        std::cout << "Streamed " << result.completed_chunks << "/" << result.total_chunks << " chunks ("
                  << result.total_lines << " lines, chunk size " << result.chunk_size << ")"
                  << (result.resumed ? ", resumed at chunk " + std::to_string(result.start_chunk) : "")
                  << (result.requeued_chunks.empty() ? "" : ", " + std::to_string(result.requeued_chunks.size()) +
                      " failed chunks resent")
                  << std::endl;
        if (!result.success) {
            std::cout << (result.stopped ? "Stopped, resume with the same command" : "Some chunks failed")
                      << std::endl;
            exit_code = 2;
        }
    } catch (const GCS::StreamingError& e) {
        LOG_ERROR("stream_example", e.what());
        exit_code = 1;
    }

    g_streamer.store(nullptr);
    watcher.join();

    std::cout << streamer.getStreamingStats()["processor"]["metrics"].dump(2) << std::endl;
    return exit_code;
}
