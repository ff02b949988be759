#include "reader/utterance_queue.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace reader {

UtteranceQueueManager::UtteranceQueueManager(size_t recycle_capacity)
    : recycle_(recycle_capacity) {}

void UtteranceQueueManager::assign_id(Utterance& utterance) {
    if (utterance.id == 0) {
        utterance.id = next_id_++;
    }
}

bool UtteranceQueueManager::enqueue(Utterance utterance) {
    if (!utterance.is_interjection && utterance.span() > 0) {
        auto dup = std::find_if(queue_.begin(), queue_.end(), [&](const Utterance& u) {
            return !u.is_interjection &&
                   u.start_position == utterance.start_position &&
                   u.end_position == utterance.end_position;
        });
        if (dup != queue_.end()) {
            core::log_warn("Refusing duplicate utterance range " + describe(utterance));
            return false;
        }
    }
    assign_id(utterance);
    queue_.push_back(std::move(utterance));
    return true;
}

size_t UtteranceQueueManager::enqueue_many(std::vector<Utterance> utterances) {
    size_t accepted = 0;
    for (auto& u : utterances) {
        if (enqueue(std::move(u))) ++accepted;
    }
    return accepted;
}

bool UtteranceQueueManager::insert_at_front(Utterance utterance) {
    if (utterance.priority < Priority::Interjection) {
        core::log_warn(std::string("insert_at_front refused for priority ") + to_string(utterance.priority));
        return false;
    }
    assign_id(utterance);
    queue_.push_front(std::move(utterance));
    return true;
}

void UtteranceQueueManager::return_to_front(Utterance utterance) {
    assign_id(utterance);
    utterance.performance.reset();
    queue_.push_front(std::move(utterance));
}

std::optional<Utterance> UtteranceQueueManager::dequeue_next() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    Utterance u = std::move(queue_.front());
    queue_.pop_front();
    return u;
}

const Utterance* UtteranceQueueManager::peek_next() const {
    return queue_.empty() ? nullptr : &queue_.front();
}

const Utterance* UtteranceQueueManager::back() const {
    return queue_.empty() ? nullptr : &queue_.back();
}

std::vector<InterjectionEvent> UtteranceQueueManager::take_front_announcements() {
    if (queue_.empty()) {
        return {};
    }
    std::vector<InterjectionEvent> events;
    events.swap(queue_.front().metadata.pending_announcements);
    return events;
}

void UtteranceQueueManager::move_to_recycle(Utterance utterance, const UtterancePerformance& performance) {
    assign_id(utterance);
    utterance.performance = performance;
    recycle_.append(std::move(utterance));
}

std::optional<std::vector<Utterance>> UtteranceQueueManager::find_replay_utterances(double target_seconds) const {
    if (recycle_.is_empty()) {
        return std::nullopt;
    }

    std::vector<Utterance> picked;
    double accumulated = 0.0;
    for (const auto& u : recycle_.reversed()) {
        picked.push_back(u);
        accumulated += u.performance ? u.performance->actual_duration_s : 0.0;
        if (accumulated >= target_seconds) {
            break;
        }
    }
    std::reverse(picked.begin(), picked.end());
    return picked;
}

std::optional<Utterance> UtteranceQueueManager::last_main_content_utterance() const {
    for (const auto& u : recycle_.reversed()) {
        if (!u.is_interjection) {
            return u;
        }
    }
    return std::nullopt;
}

std::vector<Utterance> UtteranceQueueManager::context_replay_utterances(size_t depth) const {
    std::vector<Utterance> picked;
    if (depth == 0) return picked;
    for (const auto& u : recycle_.reversed()) {
        if (u.is_interjection) continue;
        picked.push_back(u);
        if (picked.size() == depth) break;
    }
    std::reverse(picked.begin(), picked.end());
    return picked;
}

size_t UtteranceQueueManager::requeue_for_replay(const std::vector<Utterance>& utterances) {
    if (utterances.empty()) return 0;

    std::unordered_set<uint64_t> ids;
    for (const auto& u : utterances) ids.insert(u.id);

    // Rebuild history without the replayed entries so nothing is pending and recycled at once
    auto history = recycle_.elements();
    recycle_.clear();
    for (auto& h : history) {
        if (ids.count(h.id) == 0) recycle_.append(std::move(h));
    }

    size_t inserted = 0;
    for (auto it = utterances.rbegin(); it != utterances.rend(); ++it) {
        Utterance u = *it;
        u.priority = Priority::Urgent;
        u.performance.reset();
        u.metadata.pending_announcements.clear();
        if (insert_at_front(std::move(u))) ++inserted;
    }
    return inserted;
}

double UtteranceQueueManager::recycled_duration() const {
    double total = 0.0;
    for (const auto& u : recycle_.elements()) {
        if (u.performance) total += u.performance->actual_duration_s;
    }
    return total;
}

std::optional<double> UtteranceQueueManager::average_characters_per_second() const {
    double sum = 0.0;
    size_t n = 0;
    for (const auto& u : recycle_.elements()) {
        if (u.performance && u.performance->characters_per_second > 0.0) {
            sum += u.performance->characters_per_second;
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

void UtteranceQueueManager::clear_main_queue() {
    queue_.clear();
}

void UtteranceQueueManager::reset_all() {
    queue_.clear();
    recycle_.clear();
}

} // namespace reader
