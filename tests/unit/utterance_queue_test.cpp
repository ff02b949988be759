#include <cassert>
#include <cmath>
#include <string>
#include <vector>
#include "reader/utterance_queue.hpp"

using reader::Priority;
using reader::Utterance;
using reader::UtterancePerformance;
using reader::UtteranceQueueManager;

static Utterance make(const std::string& text, size_t start, Priority priority = Priority::Normal) {
    Utterance u;
    u.text = text;
    u.start_position = start;
    u.end_position = start + text.size();
    u.priority = priority;
    return u;
}

static UtterancePerformance perf(double seconds) {
    UtterancePerformance p;
    p.actual_duration_s = seconds;
    p.characters_per_second = 10.0 / seconds;
    return p;
}

static void test_fifo_order() {
    UtteranceQueueManager q;
    q.enqueue(make("a", 0));
    q.enqueue(make("b", 1));
    q.enqueue(make("c", 2));
    assert(q.queue_count() == 3);
    assert(q.dequeue_next()->text == "a");
    assert(q.dequeue_next()->text == "b");
    assert(q.dequeue_next()->text == "c");
    assert(!q.dequeue_next());
    assert(q.is_main_queue_empty());
}

static void test_urgent_preempts_normal() {
    UtteranceQueueManager q;
    q.enqueue(make("first", 0));
    q.enqueue(make("second", 5));
    assert(q.insert_at_front(make("urgent", 0, Priority::Urgent)));
    assert(q.dequeue_next()->text == "urgent");
    assert(q.dequeue_next()->text == "first");

    // Normal priority may not jump the queue
    assert(!q.insert_at_front(make("sneaky", 20)));
    assert(q.queue_count() == 1);
}

static void test_ids_and_duplicate_ranges() {
    UtteranceQueueManager q;
    assert(q.enqueue(make("same", 0)));
    assert(!q.enqueue(make("same", 0)));
    Utterance interjection = make("note", 0);
    interjection.end_position = 0;
    interjection.is_interjection = true;
    assert(q.enqueue(interjection));
    auto a = q.dequeue_next();
    auto b = q.dequeue_next();
    assert(a->id != 0 && b->id != 0 && a->id != b->id);
}

static void test_recycle_overwrites_oldest() {
    UtteranceQueueManager q(3);
    for (int i = 0; i < 5; ++i) {
        q.move_to_recycle(make("u" + std::to_string(i), static_cast<size_t>(i) * 10), perf(1.0));
    }
    assert(q.recycle_count() == 3);
    auto history = q.recycled();
    assert(history.front().text == "u2");
    assert(history.back().text == "u4");
    assert(history.back().performance);
}

static void test_find_replay_utterances() {
    UtteranceQueueManager q;
    assert(!q.find_replay_utterances(2.5));

    q.move_to_recycle(make("one", 0), perf(1.0));
    q.move_to_recycle(make("two", 10), perf(1.5));
    q.move_to_recycle(make("three", 20), perf(2.0));

    auto replay = q.find_replay_utterances(2.5);
    assert(replay);
    assert(replay->size() == 2);
    assert((*replay)[0].text == "two");
    assert((*replay)[1].text == "three");

    // Asking for more than is recorded returns everything
    auto all = q.find_replay_utterances(100.0);
    assert(all->size() == 3);
    assert(std::fabs(q.recycled_duration() - 4.5) < 1e-9);
}

static void test_context_replay() {
    UtteranceQueueManager q;
    assert(q.context_replay_utterances(3).empty());
    assert(!q.last_main_content_utterance());

    Utterance note = make("python code", 0);
    note.is_interjection = true;
    q.move_to_recycle(make("only", 0), perf(1.0));
    q.move_to_recycle(note, perf(0.5));

    auto ctx = q.context_replay_utterances(3);
    assert(ctx.size() == 1);
    assert(ctx[0].text == "only");
    assert(q.last_main_content_utterance()->text == "only");

    q.move_to_recycle(make("b", 10), perf(1.0));
    q.move_to_recycle(make("c", 20), perf(1.0));
    q.move_to_recycle(make("d", 30), perf(1.0));
    ctx = q.context_replay_utterances(3);
    assert(ctx.size() == 3);
    assert(ctx[0].text == "b" && ctx[2].text == "d");
}

static void test_requeue_for_replay() {
    UtteranceQueueManager q;
    q.enqueue(make("next", 30));
    q.move_to_recycle(make("one", 0), perf(1.0));
    q.move_to_recycle(make("two", 10), perf(1.0));
    q.move_to_recycle(make("three", 20), perf(1.0));

    auto replay = *q.find_replay_utterances(2.0);
    assert(q.requeue_for_replay(replay) == 2);

    // Nothing is both pending and recycled
    assert(q.recycle_count() == 1);
    assert(q.recycled().front().text == "one");

    auto a = q.dequeue_next();
    assert(a->text == "two");
    assert(a->priority == Priority::Urgent);
    assert(!a->performance);
    assert(q.dequeue_next()->text == "three");
    assert(q.dequeue_next()->text == "next");
}

static void test_announcements_and_return_to_front() {
    UtteranceQueueManager q;
    Utterance ph = make("[code]", 0);
    ph.metadata.pending_announcements.push_back(reader::InterjectionEvent::code_block_start(std::nullopt, 0));
    q.enqueue(ph);
    q.enqueue(make("after", 10));
    assert(q.peek_next()->has_pending_announcements());
    auto events = q.take_front_announcements();
    assert(events.size() == 1);
    assert(!q.peek_next()->has_pending_announcements());
    assert(q.take_front_announcements().empty());

    auto head = q.dequeue_next();
    q.return_to_front(*head);
    assert(q.peek_next()->id == head->id);
    assert(q.back()->text == "after");
}

static void test_average_rate_and_reset() {
    UtteranceQueueManager q;
    assert(!q.average_characters_per_second());
    q.move_to_recycle(make("x", 0), perf(1.0));    // 10 cps
    q.move_to_recycle(make("y", 1), perf(2.0));    // 5 cps
    assert(std::fabs(*q.average_characters_per_second() - 7.5) < 1e-9);

    q.enqueue(make("z", 2));
    q.clear_main_queue();
    assert(q.is_main_queue_empty());
    assert(q.has_recycled_content());
    q.reset_all();
    assert(!q.has_recycled_content());
}

int main() {
    test_fifo_order();
    test_urgent_preempts_normal();
    test_ids_and_duplicate_ranges();
    test_recycle_overwrites_oldest();
    test_find_replay_utterances();
    test_context_replay();
    test_requeue_for_replay();
    test_announcements_and_return_to_front();
    test_average_rate_and_reset();
    return 0;
}
