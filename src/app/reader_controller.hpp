// Copyright (c) 2025 VAM Talk Reader
// Application API - Reader Controller Interface
//
// Thread-safe, event-driven API for reading a document aloud. Owns the
// speech engine and the playback scheduler and runs both on one event loop.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "audio/speech_engine.hpp"
#include "reader/document.hpp"
#include "reader/interjection_coordinator.hpp"
#include "reader/playback_scheduler.hpp"
#include "reader/utterance.hpp"

namespace app {

// Forward declarations
class ReaderControllerImpl;

//==============================================================================
// Configuration Structures
//==============================================================================

/// Configuration for a reading session
struct ReaderConfig {
    // Speech Engine
    std::string engine_id = "synthetic";          ///< Engine from list_speech_engines()
    double engine_time_scale = 1.0;               ///< Synthetic engine only: <1.0 runs faster than real time
    bool echo_utterances = true;                  ///< Synthetic engine only: log what is "spoken"

    // Chunking
    size_t target_chunk_chars = 220;              ///< Pack sentences up to this length
    size_t max_chunk_chars = 300;                 ///< Never exceed unless a single word does
    bool skip_technical_sections = false;         ///< Drop code blocks entirely

    // Queueing
    size_t recycle_capacity = 10;                 ///< Finished utterances kept for rewind
    size_t lookahead_threshold = 3;               ///< Refill when fewer are pending
    size_t refill_batch = 6;                      ///< Utterances per chunking pass

    // Announcements
    reader::CodeBlockNotificationStyle notification_style = reader::CodeBlockNotificationStyle::SmartDetection;
    bool announce_language = true;                ///< Say "python code" before code blocks
    bool replay_context_after_interjection = false;

    // Voice
    std::string main_voice;                       ///< Empty = engine default
    std::string announcement_voice;               ///< Empty = main voice
    float speed = 1.0f;                           ///< 0.5 - 2.0
    float pitch = 1.0f;                           ///< 0.5 - 2.0
    float volume = 1.0f;                          ///< 0.1 - 1.0
    bool fade_in = true;                          ///< Ramp volume up when playback starts
};

//==============================================================================
// Event Structures
//==============================================================================

/// Reader status information
struct ReaderStatus {
    /// Current state of playback
    enum class State {
        IDLE,                                     ///< Nothing playing
        PREPARING,                                ///< Document loaded, ready to play
        PLAYING,                                  ///< Speaking
        PAUSED,                                   ///< Paused by user
        COMPLETED,                                ///< Reached the end of the document
        ERROR                                     ///< Engine failure (transient)
    };

    State state = State::IDLE;                    ///< Current playback state
    size_t position = 0;                          ///< Character offset of what has been heard
    size_t text_length = 0;                       ///< Length of the loaded plain text
    int section_index = -1;                       ///< Section being read, -1 if none
    double elapsed_s = 0.0;                       ///< Listening time accumulated (including resumed)
    float speed = 1.0f;                           ///< Current speaking rate
    size_t queued = 0;                            ///< Utterances waiting
    size_t recycled = 0;                          ///< Utterances available for rewind
    bool is_completed = false;
};

/// A section was entered or left
struct SectionEvent {
    int section_index;                            ///< Index into the document's sections
    reader::SectionKind kind;                     ///< Kind of that section
    bool entered;                                 ///< false = exited
};

/// An interjection finished playing
struct InterjectionNotice {
    uint64_t utterance_id;                        ///< Utterance that carried it
    std::string text;                             ///< What was said
    int section_index;                            ///< Section it belongs to, -1 for submitted ones
};

/// Measured playback of one utterance
struct UtteranceTelemetry {
    uint64_t id;                                  ///< Utterance id
    std::string text;                             ///< Spoken text
    size_t start_position;                        ///< Range in the plain text
    size_t end_position;
    double duration_s;                            ///< Speaking time
    double characters_per_second;                 ///< Observed rate
    bool is_interjection;
};

/// Error/warning event
struct ReaderError {
    /// Error severity level
    enum class Severity {
        WARNING,                                  ///< Non-fatal, can continue
        ERROR,                                    ///< Playback stopped, recoverable with play()
        CRITICAL                                  ///< Engine unusable
    };

    Severity severity;                            ///< Error severity
    std::string message;                          ///< Human-readable error message
    std::string details;                          ///< Technical details for debugging
    int64_t timestamp_ms;                         ///< When error occurred (ms since start())
};

//==============================================================================
// Callback Types
//==============================================================================

using StatusCallback = std::function<void(const ReaderStatus&)>;
using SectionCallback = std::function<void(const SectionEvent&)>;
using InterjectionCallback = std::function<void(const InterjectionNotice&)>;
using FeedbackCallback = std::function<void(reader::FeedbackType)>;
using TelemetryCallback = std::function<void(const UtteranceTelemetry&)>;
using ErrorCallback = std::function<void(const ReaderError&)>;

const char* to_string(ReaderStatus::State state);

//==============================================================================
// Main Controller Class
//==============================================================================

/// Main controller for reading documents aloud
///
/// Thread Safety:
/// - All public methods are thread-safe
/// - Commands are queued onto an internal event loop and return immediately
/// - Callbacks are invoked from the event loop thread
///
/// Example:
/// @code
/// ReaderController controller;
/// controller.subscribe_to_status([](const ReaderStatus& s) {
///     std::cout << to_string(s.state) << " @ " << s.position << "\n";
/// });
///
/// ReaderConfig config;
/// controller.start(config);
/// controller.load_document(document);
/// controller.play();
/// @endcode
class ReaderController {
public:
    //==========================================================================
    // Lifecycle
    //==========================================================================

    ReaderController();

    /// Destructor (shuts down if started)
    ~ReaderController();

    // Non-copyable, non-movable
    ReaderController(const ReaderController&) = delete;
    ReaderController& operator=(const ReaderController&) = delete;
    ReaderController(ReaderController&&) = delete;
    ReaderController& operator=(ReaderController&&) = delete;

    /// Get list of available speech engines
    static std::vector<audio::SpeechEngineInfo> list_speech_engines();

    /// Create the engine and start the event loop
    /// @return false if already started or the engine could not be created
    bool start(const ReaderConfig& config);

    /// Stop playback, the event loop and the engine
    /// @note Safe to call even if not started
    void shutdown();

    bool is_started() const;

    //==========================================================================
    // Playback Control (asynchronous; false if not started)
    //==========================================================================

    bool load_document(reader::Document document, const reader::ResumePoint& resume = reader::ResumePoint());
    bool play();
    bool pause();
    bool stop();
    bool rewind(double seconds);
    bool skip_to_next_section();
    bool skip_to_previous_section();
    bool replay_context(size_t depth = 3);
    bool submit_interjection(const reader::InterjectionEvent& event);

    bool set_speed(float speed);
    bool set_pitch(float pitch);
    bool set_volume(float volume);
    bool set_main_voice(const std::string& voice_id);
    bool set_announcement_voice(const std::string& voice_id);

    //==========================================================================
    // Status
    //==========================================================================

    /// Latest published status snapshot
    ReaderStatus get_status() const;

    /// Block until the status reaches @p state or @p timeout expires
    /// @return true if the state was reached
    bool wait_for_state(ReaderStatus::State state, std::chrono::milliseconds timeout) const;

    /// Block until every command posted so far has been handled
    bool flush(std::chrono::milliseconds timeout);

    /// Recent per-utterance telemetry, oldest first
    std::vector<UtteranceTelemetry> get_recent_telemetry() const;

    //==========================================================================
    // Event Subscription
    //==========================================================================

    void subscribe_to_status(StatusCallback callback);
    void subscribe_to_sections(SectionCallback callback);
    void subscribe_to_interjections(InterjectionCallback callback);
    void subscribe_to_feedback(FeedbackCallback callback);
    void subscribe_to_telemetry(TelemetryCallback callback);
    void subscribe_to_errors(ErrorCallback callback);

    /// Clear all event subscriptions
    void clear_subscriptions();

private:
    std::unique_ptr<ReaderControllerImpl> impl_;  ///< PIMPL implementation
};

} // namespace app
