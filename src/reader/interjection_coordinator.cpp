#include "reader/interjection_coordinator.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>

namespace reader {

const char* to_string(CodeBlockNotificationStyle style) {
    switch (style) {
        case CodeBlockNotificationStyle::SmartDetection: return "smart";
        case CodeBlockNotificationStyle::VoiceOnly: return "voice";
        case CodeBlockNotificationStyle::TonesOnly: return "tones";
        case CodeBlockNotificationStyle::Both: return "both";
    }
    return "unknown";
}

const char* to_string(FeedbackType type) {
    switch (type) {
        case FeedbackType::PlayStarted: return "play_started";
        case FeedbackType::PlayPaused: return "play_paused";
        case FeedbackType::PlayStopped: return "play_stopped";
        case FeedbackType::PlayCompleted: return "play_completed";
        case FeedbackType::SectionChanged: return "section_changed";
        case FeedbackType::VoiceChanged: return "voice_changed";
        case FeedbackType::Error: return "error";
        case FeedbackType::CodeBlockStart: return "code_block_start";
        case FeedbackType::CodeBlockEnd: return "code_block_end";
    }
    return "unknown";
}

bool parse_notification_style(const std::string& name, CodeBlockNotificationStyle& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "smart") { out = CodeBlockNotificationStyle::SmartDetection; return true; }
    if (lower == "voice") { out = CodeBlockNotificationStyle::VoiceOnly; return true; }
    if (lower == "tones") { out = CodeBlockNotificationStyle::TonesOnly; return true; }
    if (lower == "both")  { out = CodeBlockNotificationStyle::Both; return true; }
    return false;
}

std::string InterjectionCoordinator::announcement_text(const InterjectionEvent& event) {
    switch (event.type) {
        case InterjectionEvent::Type::CodeBlockStart:
            if (event.language && !event.language->empty()) {
                return *event.language + " code";
            }
            return "code";
        case InterjectionEvent::Type::CodeBlockEnd:
            return "end of code";
        case InterjectionEvent::Type::AssistantInsight:
        case InterjectionEvent::Type::UserQuestion:
            return event.text;
        case InterjectionEvent::Type::ContextualHelp:
            return event.text.empty() ? std::string("help") : "help on " + event.text;
    }
    return std::string();
}

bool InterjectionCoordinator::submit(const InterjectionEvent& event) {
    if (pending_) {
        core::log_warn(std::string("Interjection slot busy, dropping ") + to_string(event.type));
        return false;
    }
    pending_ = event;
    return true;
}

bool InterjectionCoordinator::on_boundary(UtteranceQueueManager& queue, size_t position) {
    if (pending_) {
        Utterance u;
        u.text = announcement_text(*pending_);
        u.start_position = position;
        u.end_position = position;
        u.section_index = pending_->section_index;
        u.is_interjection = true;
        u.priority = Priority::Interjection;
        u.voice = VoiceRole::Announcement;
        pending_.reset();
        if (u.text.empty()) {
            return false;
        }
        return queue.insert_at_front(std::move(u));
    }

    const Utterance* head = queue.peek_next();
    if (!head || !head->has_pending_announcements()) {
        return false;
    }

    bool inserted = false;
    for (const auto& event : queue.take_front_announcements()) {
        switch (event.type) {
            case InterjectionEvent::Type::CodeBlockStart: {
                if (plays_start_tone()) {
                    emit(FeedbackType::CodeBlockStart);
                }
                if (!speaks_code_blocks()) {
                    break;   // placeholder plays as ordinary content
                }
                auto placeholder = queue.dequeue_next();
                if (!placeholder) {
                    break;
                }
                Utterance a;
                a.text = announcement_text(event);
                a.start_position = placeholder->start_position;
                a.end_position = placeholder->end_position;
                a.section_index = placeholder->section_index;
                a.is_interjection = true;
                a.priority = Priority::Interjection;
                a.voice = VoiceRole::Announcement;
                a.metadata = placeholder->metadata;
                inserted = queue.insert_at_front(std::move(a)) || inserted;
                break;
            }
            case InterjectionEvent::Type::CodeBlockEnd:
                awaiting_end_section_ = event.section_index;
                break;
            default: {
                // Other events riding on content play just ahead of it
                Utterance a;
                a.text = announcement_text(event);
                a.start_position = head->start_position;
                a.end_position = head->start_position;
                a.section_index = head->section_index;
                a.is_interjection = true;
                a.priority = Priority::Interjection;
                a.voice = VoiceRole::Announcement;
                if (!a.text.empty()) {
                    inserted = queue.insert_at_front(std::move(a)) || inserted;
                }
                break;
            }
        }
        // The head may have changed; refresh for the next event
        head = queue.peek_next();
        if (!head) break;
    }
    return inserted;
}

void InterjectionCoordinator::on_utterance_finished(const Utterance& finished) {
    if (!awaiting_end_section_ || finished.section_index != *awaiting_end_section_) {
        return;
    }
    awaiting_end_section_.reset();
    if (plays_end_tone()) {
        emit(FeedbackType::CodeBlockEnd);
    }
}

void InterjectionCoordinator::reset() {
    pending_.reset();
    awaiting_end_section_.reset();
}

bool InterjectionCoordinator::speaks_code_blocks() const {
    if (!config_.announce_language) return false;
    return config_.style != CodeBlockNotificationStyle::TonesOnly;
}

bool InterjectionCoordinator::plays_start_tone() const {
    switch (config_.style) {
        case CodeBlockNotificationStyle::TonesOnly:
        case CodeBlockNotificationStyle::Both:
            return true;
        case CodeBlockNotificationStyle::SmartDetection:
            return !config_.announce_language;
        case CodeBlockNotificationStyle::VoiceOnly:
            return false;
    }
    return false;
}

bool InterjectionCoordinator::plays_end_tone() const {
    return config_.style != CodeBlockNotificationStyle::VoiceOnly;
}

void InterjectionCoordinator::emit(FeedbackType type) const {
    if (feedback_) {
        feedback_(type);
    }
}

} // namespace reader
