#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "audio/speech_engine.hpp"
#include "core/timer_host.hpp"
#include "reader/chunker.hpp"
#include "reader/document.hpp"
#include "reader/interjection_coordinator.hpp"
#include "reader/utterance.hpp"
#include "reader/utterance_queue.hpp"
#include "reader/volume_fader.hpp"

namespace reader {

enum class PlaybackState {
    Idle,         ///< Nothing loaded or stopped by the user
    Preparing,    ///< Document loaded, lookahead filled, waiting for play()
    Playing,
    Paused,
    Completed,    ///< Content ran out
    Error         ///< Transient; falls back to Idle
};

const char* to_string(PlaybackState state);

/// Where to pick up a previously read document
struct ResumePoint {
    int64_t position = 0;              ///< Character offset; clamped into the text
    double total_duration_s = 0.0;     ///< Listening time already accumulated
};

struct ReadingProgress {
    size_t position = 0;
    size_t text_length = 0;
    double total_duration_s = 0.0;
    bool is_completed = false;

    double fraction() const {
        return text_length == 0 ? 0.0 : static_cast<double>(position) / static_cast<double>(text_length);
    }
};

struct SectionInfo {
    size_t index = 0;
    SectionKind kind = SectionKind::Paragraph;
    std::optional<int> level;
    bool skippable = false;
    std::optional<std::string> language;
    size_t start_index = 0;
    size_t end_index = 0;
};

struct SectionChange {
    int section_index = -1;
    SectionKind kind = SectionKind::Paragraph;
    bool entered = false;              ///< false = exited
};

struct VoiceSettings {
    std::string main_voice_id;
    std::string announcement_voice_id;   ///< Empty = same as main voice
    float speed = 1.0f;
    float pitch = 1.0f;
    float volume = 1.0f;
};

/**
 * @brief Drives the speech engine through a document
 *
 * Pulls utterances from the queue, keeps the lookahead filled from the
 * chunker, gives the interjection coordinator a turn at every utterance
 * boundary, and starts the next utterance from the completion of the
 * previous one so there is no gap between them.
 *
 * Single-context: every method, engine callback and timer must run on the
 * same thread (the ReaderController's event loop). Engine callbacks are
 * matched to the in-flight request id; anything else is stale and ignored.
 */
class PlaybackScheduler {
public:
    static constexpr float kMinSpeed = 0.5f;
    static constexpr float kMaxSpeed = 2.0f;
    static constexpr float kMinPitch = 0.5f;
    static constexpr float kMaxPitch = 2.0f;
    static constexpr float kMinVolume = 0.1f;
    static constexpr float kMaxVolume = 1.0f;

    /// Rewind estimate when nothing has been measured yet
    static constexpr double kFallbackWordsPerMinute = 150.0;
    static constexpr double kAverageWordLength = 5.0;

    struct Config {
        size_t lookahead_threshold = 3;        ///< Refill when fewer utterances are pending (at least 1)
        size_t refill_batch = 6;               ///< Utterances requested per chunker call

        // Main voice
        double main_pre_delay_s = 0.1;
        double main_post_delay_s = 0.1;
        double code_post_delay_s = 0.4;        ///< After code placeholders

        // Announcement voice
        float announcement_rate_factor = 1.1f;
        float announcement_volume_factor = 0.8f;
        double announcement_pre_delay_s = 0.2;
        double announcement_post_delay_s = 0.4;

        bool fade_in = true;
        int fade_in_ms = 300;
        int fade_steps = 6;

        bool replay_context_after_interjection = false;

        // Signals
        std::function<void(PlaybackState)> on_state_changed;
        std::function<void(size_t position)> on_position_changed;
        std::function<void(const SectionChange&)> on_section_changed;
        std::function<void(const Utterance&)> on_interjection_played;
        std::function<void(FeedbackType)> on_feedback;
        std::function<void(const Utterance&)> on_utterance_completed;   ///< performance is set
        std::function<void(const std::string& message)> on_error;
    };

    PlaybackScheduler(audio::ISpeechEngine& engine,
                      UtteranceQueueManager& queue,
                      InterjectionCoordinator& coordinator,
                      const Chunker& chunker,
                      core::ITimerHost* timers = nullptr);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    //==========================================================================
    // Transport
    //==========================================================================

    /// Replace the document and reset queue, history and position tracking
    void load(Document document, const ResumePoint& resume = ResumePoint());

    /// Start or resume. No-op while playing, after completion, or with nothing loaded.
    bool play();

    /// Engine-level pause. Only from Playing.
    bool pause();

    /// Cancel synthesis and drop all queued and recycled content. Position is kept.
    bool stop();

    /// Jump back by listening time; replays recorded audio when enough is recorded
    bool rewind(double seconds);

    bool skip_to_next_section();
    bool skip_to_previous_section();

    /// Replay the last @p depth main-content utterances
    bool replay_context(size_t depth = UtteranceQueueManager::kDefaultContextReplayDepth);

    /// Queue an announcement for the next utterance boundary
    bool submit_interjection(const InterjectionEvent& event);

    //==========================================================================
    // Voice (applies to utterances started afterwards)
    //==========================================================================

    void set_speed(float speed);
    void set_pitch(float pitch);
    void set_volume(float volume);
    void set_main_voice(const std::string& voice_id);
    void set_announcement_voice(const std::string& voice_id);
    const VoiceSettings& voice() const { return voice_; }

    //==========================================================================
    // Engine callbacks
    //==========================================================================

    void on_utterance_finished(uint64_t request_id, double actual_duration_s);
    void on_engine_error(uint64_t request_id, const std::string& message);

    //==========================================================================
    // Queries
    //==========================================================================

    PlaybackState state() const { return state_; }
    size_t current_position() const { return current_position_; }
    int current_section_index() const;
    std::optional<SectionInfo> current_section_info() const;
    bool can_skip_current_section() const;
    const std::optional<Utterance>& in_flight() const { return in_flight_; }
    uint64_t in_flight_request_id() const { return in_flight_request_; }
    ReadingProgress progress() const;
    const Document& document() const { return document_; }
    bool has_document() const { return loaded_; }

    /// Characters per second used for rewind estimates
    double estimated_characters_per_second() const;

    /// Voice parameters an utterance would be spoken with right now
    audio::VoiceParams voice_for(const Utterance& utterance) const;

private:
    void set_state(PlaybackState state);
    void emit_feedback(FeedbackType type);
    void emit_position();

    void refill_if_needed();
    bool start_next();
    bool start_utterance(Utterance utterance);
    void cancel_in_flight(bool requeue);
    void handle_engine_failure(const std::string& message);
    void finish_document();

    void reposition(size_t position);
    bool jump_to_section(size_t index);
    void after_seek(bool resume_playing);

    void track_section(const Utterance& utterance);
    void leave_section();
    void start_fade(float target);

    audio::ISpeechEngine& engine_;
    UtteranceQueueManager& queue_;
    InterjectionCoordinator& coordinator_;
    const Chunker& chunker_;
    core::ITimerHost* timers_;
    VolumeFader fader_;

    Config config_;
    VoiceSettings voice_;

    Document document_;
    bool loaded_ = false;
    PlaybackState state_ = PlaybackState::Idle;

    size_t current_position_ = 0;     ///< End of the last completed utterance
    size_t chunk_cursor_ = 0;         ///< Where the chunker resumes
    bool chunker_exhausted_ = true;
    int current_section_ = -1;        ///< Section being heard
    double total_elapsed_s_ = 0.0;
    bool completed_ = false;

    std::optional<Utterance> in_flight_;
    uint64_t in_flight_request_ = 0;
    uint64_t next_request_id_ = 1;
    std::chrono::steady_clock::time_point in_flight_started_;
    bool user_stopped_ = false;
    bool fade_pending_ = false;
};

} // namespace reader
