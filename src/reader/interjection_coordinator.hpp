#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "reader/utterance.hpp"
#include "reader/utterance_queue.hpp"

namespace reader {

/// How code blocks are signalled to the listener
enum class CodeBlockNotificationStyle {
    SmartDetection,   ///< Spoken language notice, end tone
    VoiceOnly,        ///< Spoken notice only
    TonesOnly,        ///< Start/end tones, placeholder read by the main voice
    Both              ///< Start tone, spoken notice, end tone
};

/// Non-speech cues for the host to render (tones, haptics)
enum class FeedbackType {
    PlayStarted,
    PlayPaused,
    PlayStopped,
    PlayCompleted,
    SectionChanged,
    VoiceChanged,
    Error,
    CodeBlockStart,
    CodeBlockEnd
};

const char* to_string(CodeBlockNotificationStyle style);
const char* to_string(FeedbackType type);
bool parse_notification_style(const std::string& name, CodeBlockNotificationStyle& out);

/**
 * @brief Decides what gets said between utterances
 *
 * Runs only at utterance boundaries, never while something is being spoken.
 * Holds a single slot for an externally submitted interjection; code-block
 * events come from the placeholders the chunker leaves in the queue.
 */
class InterjectionCoordinator {
public:
    struct Config {
        CodeBlockNotificationStyle style = CodeBlockNotificationStyle::SmartDetection;
        bool announce_language = true;
    };

    using FeedbackCallback = std::function<void(FeedbackType)>;

    InterjectionCoordinator() = default;
    explicit InterjectionCoordinator(const Config& config) : config_(config) {}

    const Config& config() const { return config_; }
    void set_config(const Config& config) { config_ = config; }
    void set_feedback_callback(FeedbackCallback callback) { feedback_ = std::move(callback); }

    /// Offer an interjection for the next boundary. False while one is already waiting.
    bool submit(const InterjectionEvent& event);
    bool has_pending() const { return pending_.has_value(); }

    /**
     * @brief Boundary hook; call when nothing is in flight, before dequeuing
     * @param queue Forward queue; an announcement may be inserted at its front
     * @param position Current reading position, used for zero-width interjections
     * @return true if an announcement utterance was inserted
     */
    bool on_boundary(UtteranceQueueManager& queue, size_t position);

    /// Completion hook; emits the end cue once the tracked code block has been passed
    void on_utterance_finished(const Utterance& finished);

    /// Text spoken for an event ("python code", "code", the insight text, ...)
    static std::string announcement_text(const InterjectionEvent& event);

    /// Forget code-block tracking (seek). The submitted slot survives.
    void cancel_section_tracking() { awaiting_end_section_.reset(); }

    /// Forget everything (stop, reload)
    void reset();

private:
    bool speaks_code_blocks() const;
    bool plays_start_tone() const;
    bool plays_end_tone() const;
    void emit(FeedbackType type) const;

    Config config_;
    FeedbackCallback feedback_;
    std::optional<InterjectionEvent> pending_;
    std::optional<int> awaiting_end_section_;
};

} // namespace reader
