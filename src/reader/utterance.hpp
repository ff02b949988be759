#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reader/document.hpp"

namespace reader {

/// Queue priority. Values are ordered; only Interjection and above may jump the queue.
enum class Priority {
    Background = 0,
    Normal = 1,
    Interjection = 2,
    Urgent = 3,
    Critical = 4
};

/// Which voice profile speaks an utterance
enum class VoiceRole {
    Main,           ///< Document content
    Announcement    ///< Short contextual notices (code block language, insights)
};

const char* to_string(Priority priority);
const char* to_string(VoiceRole voice);

/// A contextual notice that may be spoken between utterances
struct InterjectionEvent {
    enum class Type {
        CodeBlockStart,     ///< language?, section_index
        CodeBlockEnd,       ///< section_index
        AssistantInsight,   ///< text, context
        UserQuestion,       ///< text (the query)
        ContextualHelp      ///< text (the topic)
    };

    Type type = Type::CodeBlockStart;
    std::optional<std::string> language;
    int section_index = -1;
    std::string text;
    std::string context;

    static InterjectionEvent code_block_start(std::optional<std::string> language, int section_index);
    static InterjectionEvent code_block_end(int section_index);
    static InterjectionEvent assistant_insight(std::string text, std::string context = "");
    static InterjectionEvent user_question(std::string query);
    static InterjectionEvent contextual_help(std::string topic);
};

const char* to_string(InterjectionEvent::Type type);

struct UtteranceMetadata {
    SectionKind content_kind = SectionKind::Paragraph;
    std::optional<std::string> language;
    bool is_skippable = false;
    std::vector<InterjectionEvent> pending_announcements;   ///< Consumed once by the coordinator
};

/// Measured once the engine reports completion
struct UtterancePerformance {
    double actual_duration_s = 0.0;
    double characters_per_second = 0.0;
    std::chrono::system_clock::time_point completed_at;
};

/// The atomic unit handed to the speech engine
struct Utterance {
    uint64_t id = 0;                              ///< Assigned on first enqueue, kept on replay
    std::string text;
    size_t start_position = 0;                    ///< Range in the document's plain text
    size_t end_position = 0;
    int section_index = -1;
    bool is_interjection = false;
    Priority priority = Priority::Normal;
    VoiceRole voice = VoiceRole::Main;
    UtteranceMetadata metadata;
    std::optional<UtterancePerformance> performance;

    size_t span() const { return end_position > start_position ? end_position - start_position : 0; }
    bool has_pending_announcements() const { return !metadata.pending_announcements.empty(); }
};

/// Measure an utterance from its spoken duration. Rate uses the spoken text length.
UtterancePerformance measure_performance(const Utterance& utterance, double actual_duration_s);

/// Short printable form for logs: #id [start-end) "text..."
std::string describe(const Utterance& utterance);

} // namespace reader
