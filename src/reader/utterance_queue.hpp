#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "core/circular_buffer.hpp"
#include "reader/utterance.hpp"

namespace reader {

/**
 * @brief Pending utterances plus a bounded history of finished ones
 *
 * The forward queue is FIFO except for priority inserts at the front. The
 * recycle buffer keeps the most recent finished utterances (with their
 * measured performance) so rewinds can replay audio without re-chunking.
 * An utterance is never in both at once.
 *
 * Not synchronized; the scheduler's context owns it.
 */
class UtteranceQueueManager {
public:
    static constexpr size_t kDefaultRecycleCapacity = 10;
    static constexpr size_t kDefaultContextReplayDepth = 3;

    explicit UtteranceQueueManager(size_t recycle_capacity = kDefaultRecycleCapacity);

    /// Append. Refuses a main-content utterance whose range is already pending.
    bool enqueue(Utterance utterance);

    /// Append in order. Returns how many were accepted.
    size_t enqueue_many(std::vector<Utterance> utterances);

    /// Jump the queue. Only Interjection priority and above; returns false otherwise.
    bool insert_at_front(Utterance utterance);

    /// Put an interrupted utterance back at the head without touching its priority
    void return_to_front(Utterance utterance);

    /// Pop the head. Empty means the chunker should be asked for more.
    std::optional<Utterance> dequeue_next();

    /// Head of the queue, or nullptr
    const Utterance* peek_next() const;

    /// Last pending utterance, or nullptr
    const Utterance* back() const;

    /// Remove and return the head's pending announcement events
    std::vector<InterjectionEvent> take_front_announcements();

    /// File a finished utterance into history with its measured performance
    void move_to_recycle(Utterance utterance, const UtterancePerformance& performance);

    /// Newest-first walk until @p target_seconds is covered; returned oldest first.
    /// nullopt when history is empty.
    std::optional<std::vector<Utterance>> find_replay_utterances(double target_seconds) const;

    std::optional<Utterance> last_main_content_utterance() const;

    /// Up to @p depth most recent main-content utterances, oldest first
    std::vector<Utterance> context_replay_utterances(size_t depth = kDefaultContextReplayDepth) const;

    /// Take @p utterances out of history and queue them at the front as Urgent, oldest playing first
    size_t requeue_for_replay(const std::vector<Utterance>& utterances);

    /// Sum of recorded durations in history
    double recycled_duration() const;

    /// Mean characters/second over history entries with a measurement
    std::optional<double> average_characters_per_second() const;

    std::vector<Utterance> recycled() const { return recycle_.elements(); }

    size_t queue_count() const { return queue_.size(); }
    size_t recycle_count() const { return recycle_.size(); }
    size_t recycle_capacity() const { return recycle_.capacity(); }
    bool is_main_queue_empty() const { return queue_.empty(); }
    bool has_recycled_content() const { return !recycle_.is_empty(); }

    void clear_main_queue();
    void reset_all();

private:
    void assign_id(Utterance& utterance);

    std::deque<Utterance> queue_;
    core::CircularBuffer<Utterance> recycle_;
    uint64_t next_id_ = 1;
};

} // namespace reader
