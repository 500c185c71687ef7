// EN: Pause/resume coordinator for GStream - graceful pausing, state preservation and pause watchdog
// FR: Coordinateur pause/reprise pour GStream - pause gracieuse, préservation d'état et chien de garde

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace GCS {

struct PauseResumeConfig {
    bool enable_pause_resume{true};
    std::chrono::milliseconds pause_timeout{5000};        // EN: Bound on waiting for participant acknowledgements / FR: Attente max des acquittements
    std::chrono::milliseconds resume_timeout{5000};       // EN: Bound on waiting for an in-flight pause to settle / FR: Attente max d'une pause en cours
    bool save_state_on_pause{true};
    bool validate_state_on_resume{true};
    std::chrono::milliseconds max_pause_duration{300000}; // EN: Watchdog forces a resume after this / FR: Le chien de garde force la reprise après ce délai
    bool enable_graceful_pause{true};
};

struct PauseOptions {
    bool graceful{true};          // EN: Ignored when graceful pause is disabled in config / FR: Ignoré si la pause gracieuse est désactivée
    bool preserve_state{true};
};

struct ResumeOptions {
    bool validate_state{true};
    bool forced{false};           // EN: Set by the watchdog / FR: Positionné par le chien de garde
};

struct PauseResult {
    bool success{false};
    std::string reason;           // EN: Reason code on failure / FR: Code de raison en cas d'échec
    std::optional<std::chrono::system_clock::time_point> pause_time;
};

struct ResumeResult {
    bool success{false};
    std::string reason;
    std::optional<std::chrono::system_clock::time_point> resume_time;
    std::optional<std::chrono::milliseconds> pause_duration;
};

struct SavedPauseState {
    std::chrono::system_clock::time_point timestamp;
    std::string pause_reason;
};

struct PauseState {
    bool is_paused{false};
    bool is_resuming{false};
    std::optional<std::chrono::system_clock::time_point> pause_time;
    std::string pause_reason;
    std::optional<SavedPauseState> saved_state;
    std::chrono::milliseconds current_pause_duration{0};
    std::chrono::milliseconds total_pause_duration{0};
};

struct PauseCapabilities {
    bool can_pause{false};
    bool can_resume{false};
    bool enable_pause_resume{false};
    bool enable_graceful_pause{false};
    std::chrono::milliseconds max_pause_duration{0};
    std::string current_state;    // EN: "paused" or "running" / FR: "paused" ou "running"
};

struct PauseMetrics {
    std::chrono::system_clock::time_point created_at;
    size_t total_pauses{0};
    size_t total_resumes{0};
    size_t failed_pauses{0};
    size_t failed_resumes{0};
    size_t forced_resumes{0};
    double pause_success_rate{0.0};   // EN: Percent / FR: Pourcentage
    double resume_success_rate{0.0};
    std::chrono::milliseconds longest_pause{0};
    std::chrono::milliseconds shortest_pause{0};
    std::chrono::milliseconds average_pause{0};
};

enum class PauseEventType {
    PAUSE_REQUESTED,
    PAUSE_EXECUTE,
    STREAM_PAUSED,
    PAUSE_FAILED,
    RESUME_EXECUTE,
    STREAM_RESUMED,
    RESUME_FAILED,
    PAUSE_TIMEOUT_EXCEEDED
};

struct PauseEvent {
    PauseEventType type;
    std::string reason;
    bool graceful{false};
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::chrono::milliseconds> pause_duration;
};

struct ResumeInfo {
    std::chrono::milliseconds pause_duration{0};
    std::chrono::system_clock::time_point resume_time;
};

// EN: Coordinates pause and resume of a stream. Expected refusals are reported through result
//     reason codes. Listeners run on the requesting thread, or on the watchdog thread for a
//     forced resume, and never under the internal lock.
// FR: Coordonne la pause et la reprise d'un flux. Les refus attendus sont signalés par codes de
//     raison. Les listeners tournent sur le thread demandeur, ou sur le thread du chien de garde
//     pour une reprise forcée, jamais sous le verrou interne.
class StreamPauseResume {
public:
    using EventCallback = std::function<void(const PauseEvent&)>;
    using ResumeCallback = std::function<void(const ResumeInfo&)>;

    explicit StreamPauseResume(const PauseResumeConfig& config = PauseResumeConfig{});
    ~StreamPauseResume();

    // EN: Non-copyable and non-movable
    // FR: Non-copiable et non-déplaçable
    StreamPauseResume(const StreamPauseResume&) = delete;
    StreamPauseResume& operator=(const StreamPauseResume&) = delete;
    StreamPauseResume(StreamPauseResume&&) = delete;
    StreamPauseResume& operator=(StreamPauseResume&&) = delete;

    PauseResult requestPause(const std::string& reason = "user_request",
                             const PauseOptions& options = PauseOptions{});
    ResumeResult requestResume(const ResumeOptions& options = ResumeOptions{});

    // EN: A graceful pause waits until every registered participant has acknowledged it.
    // FR: Une pause gracieuse attend que chaque participant enregistré l'ait acquittée.
    void addPauseParticipant(const std::string& participant_id);
    void removePauseParticipant(const std::string& participant_id);
    bool acknowledgePause(const std::string& participant_id);

    // EN: Invoked once on the next successful resume, then discarded.
    // FR: Appelé une fois à la prochaine reprise réussie, puis supprimé.
    void addResumeCallback(ResumeCallback callback);

    bool canPause() const;
    bool canResume() const;
    bool isPaused() const;
    PauseCapabilities getCapabilities() const;
    PauseState getPauseState() const;
    PauseMetrics getMetrics() const;
    nlohmann::json exportData() const;
    void resetStatistics();

    void addEventListener(const std::string& listener_id, EventCallback callback);
    void removeEventListener(const std::string& listener_id);

    const PauseResumeConfig& getConfig() const { return config_; }

private:
    void armWatchdog(uint64_t generation);
    void watchdogLoop(uint64_t generation);
    bool validateSavedStateLocked(std::chrono::milliseconds pause_duration) const;
    PauseMetrics buildMetricsLocked() const;
    void emit(const PauseEvent& event);

    PauseResumeConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::condition_variable watchdog_cv_;

    bool is_paused_{false};
    bool is_resuming_{false};
    bool pause_in_progress_{false};
    bool state_expected_{false};
    bool shutting_down_{false};
    std::optional<std::chrono::system_clock::time_point> pause_time_;
    std::chrono::steady_clock::time_point pause_started_;
    std::string pause_reason_;
    std::optional<SavedPauseState> saved_state_;
    std::chrono::milliseconds total_pause_duration_{0};

    std::set<std::string> participants_;
    std::set<std::string> pending_acks_;
    std::vector<ResumeCallback> resume_callbacks_;

    PauseMetrics metrics_;
    uint64_t watchdog_generation_{0};

    std::mutex watchdog_mutex_;
    std::thread watchdog_thread_;
    std::vector<std::thread> retired_watchdogs_;

    std::mutex listeners_mutex_;
    std::map<std::string, EventCallback> listeners_;
};

} // namespace GCS
