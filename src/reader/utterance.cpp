#include "reader/utterance.hpp"

#include <sstream>

namespace reader {

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::Background: return "background";
        case Priority::Normal: return "normal";
        case Priority::Interjection: return "interjection";
        case Priority::Urgent: return "urgent";
        case Priority::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(VoiceRole voice) {
    return voice == VoiceRole::Announcement ? "announcement" : "main";
}

const char* to_string(InterjectionEvent::Type type) {
    switch (type) {
        case InterjectionEvent::Type::CodeBlockStart: return "code_block_start";
        case InterjectionEvent::Type::CodeBlockEnd: return "code_block_end";
        case InterjectionEvent::Type::AssistantInsight: return "assistant_insight";
        case InterjectionEvent::Type::UserQuestion: return "user_question";
        case InterjectionEvent::Type::ContextualHelp: return "contextual_help";
    }
    return "unknown";
}

InterjectionEvent InterjectionEvent::code_block_start(std::optional<std::string> language, int section_index) {
    InterjectionEvent e;
    e.type = Type::CodeBlockStart;
    e.language = std::move(language);
    e.section_index = section_index;
    return e;
}

InterjectionEvent InterjectionEvent::code_block_end(int section_index) {
    InterjectionEvent e;
    e.type = Type::CodeBlockEnd;
    e.section_index = section_index;
    return e;
}

InterjectionEvent InterjectionEvent::assistant_insight(std::string text, std::string context) {
    InterjectionEvent e;
    e.type = Type::AssistantInsight;
    e.text = std::move(text);
    e.context = std::move(context);
    return e;
}

InterjectionEvent InterjectionEvent::user_question(std::string query) {
    InterjectionEvent e;
    e.type = Type::UserQuestion;
    e.text = std::move(query);
    return e;
}

InterjectionEvent InterjectionEvent::contextual_help(std::string topic) {
    InterjectionEvent e;
    e.type = Type::ContextualHelp;
    e.text = std::move(topic);
    return e;
}

UtterancePerformance measure_performance(const Utterance& utterance, double actual_duration_s) {
    UtterancePerformance perf;
    perf.actual_duration_s = actual_duration_s > 0.0 ? actual_duration_s : 0.0;
    perf.characters_per_second = perf.actual_duration_s > 0.0
        ? static_cast<double>(utterance.text.size()) / perf.actual_duration_s
        : 0.0;
    perf.completed_at = std::chrono::system_clock::now();
    return perf;
}

std::string describe(const Utterance& utterance) {
    std::ostringstream os;
    os << "#" << utterance.id << " [" << utterance.start_position << "-" << utterance.end_position << ") ";
    if (utterance.is_interjection) os << "(interjection) ";
    const size_t kPreview = 40;
    if (utterance.text.size() > kPreview) {
        os << "\"" << utterance.text.substr(0, kPreview) << "...\"";
    } else {
        os << "\"" << utterance.text << "\"";
    }
    return os.str();
}

} // namespace reader
