#include <algorithm>
#include <cassert>
#include <cmath>
#include <string>
#include <vector>
#include "reader/playback_scheduler.hpp"
#include "test_support.hpp"

using namespace reader;

struct Harness {
    test::FakeSpeechEngine engine;
    UtteranceQueueManager queue;
    InterjectionCoordinator coordinator;
    Chunker chunker;
    test::ManualTimerHost timers;
    PlaybackScheduler scheduler;

    std::vector<PlaybackState> states;
    std::vector<FeedbackType> feedback;
    std::vector<SectionChange> sections;
    std::vector<Utterance> interjections;
    std::vector<Utterance> completed;
    std::vector<std::string> errors;

    explicit Harness(const Chunker::Config& chunk_config = Chunker::Config())
        : chunker(chunk_config)
        , scheduler(engine, queue, coordinator, chunker, &timers) {
        PlaybackScheduler::Config cfg;
        cfg.on_state_changed = [this](PlaybackState s) { states.push_back(s); };
        cfg.on_feedback = [this](FeedbackType t) { feedback.push_back(t); };
        cfg.on_section_changed = [this](const SectionChange& c) { sections.push_back(c); };
        cfg.on_interjection_played = [this](const Utterance& u) { interjections.push_back(u); };
        cfg.on_utterance_completed = [this](const Utterance& u) { completed.push_back(u); };
        cfg.on_error = [this](const std::string& m) { errors.push_back(m); };
        scheduler.set_config(cfg);
    }

    void finish(double seconds = 1.0) {
        scheduler.on_utterance_finished(scheduler.in_flight_request_id(), seconds);
    }

    bool saw(FeedbackType type) const {
        return std::find(feedback.begin(), feedback.end(), type) != feedback.end();
    }
};

static Chunker::Config one_sentence_per_utterance() {
    Chunker::Config cfg;
    cfg.target_chars = 1;
    return cfg;
}

static void test_code_block_announced_after_prose() {
    Harness h;
    Document doc = DocumentBuilder()
        .header("Title", 1)
        .paragraph("Some prose.")
        .code_block("def f():\n    return 1", "python")
        .build();
    h.scheduler.load(doc);
    assert(h.scheduler.state() == PlaybackState::Preparing);

    assert(h.scheduler.play());
    assert(h.engine.last().text == "Title");
    h.finish();
    assert(h.engine.last().text == "Some prose.");
    h.finish();

    const auto& request = h.engine.last();
    assert(request.text.find("python") != std::string::npos);
    assert(request.text.find("return") == std::string::npos);
    assert(h.scheduler.in_flight()->priority == Priority::Interjection);
    assert(h.scheduler.in_flight()->voice == VoiceRole::Announcement);
    assert(std::fabs(request.voice.rate - 1.1f) < 1e-5);
    assert(std::fabs(request.voice.pre_delay_s - 0.2) < 1e-9);
    assert(h.scheduler.can_skip_current_section());

    h.finish();
    assert(h.interjections.size() == 1);
    assert(h.saw(FeedbackType::CodeBlockEnd));
    assert(h.scheduler.state() == PlaybackState::Completed);
    assert(h.scheduler.progress().is_completed);
    assert(h.scheduler.current_position() == doc.plain_text.size());
    assert(h.saw(FeedbackType::PlayCompleted));
}

static void test_stop_suppresses_stale_completion() {
    Harness h;
    h.scheduler.load(DocumentBuilder().paragraph("Hello there. General reading.").build());
    h.scheduler.play();
    const uint64_t request = h.scheduler.in_flight_request_id();
    assert(request != 0);

    assert(h.scheduler.stop());
    assert(h.scheduler.state() == PlaybackState::Idle);
    assert(h.engine.stop_calls == 1);
    assert(h.queue.is_main_queue_empty());

    h.scheduler.on_utterance_finished(request, 1.0);
    assert(h.scheduler.current_position() == 0);
    assert(h.completed.empty());
    assert(!h.scheduler.stop());   // already idle

    // Playing again restarts from the kept position
    assert(h.scheduler.play());
    assert(h.engine.last().text == "Hello there. General reading.");
}

static void test_rewind_estimate_floors_at_zero() {
    Harness h;
    ResumePoint resume;
    resume.position = 10;
    h.scheduler.load(DocumentBuilder().paragraph("Ten chars. And then a good deal more prose to read.").build(), resume);
    assert(h.scheduler.current_position() == 10);

    assert(h.scheduler.rewind(10.0));
    assert(h.scheduler.current_position() == 0);
    assert(h.queue.peek_next()->start_position == 0);
    assert(h.scheduler.state() == PlaybackState::Preparing);

    // 150 wpm at 5 chars per word
    assert(std::fabs(h.scheduler.estimated_characters_per_second() - 12.5) < 1e-9);
    assert(!h.scheduler.rewind(0.0));
}

static void test_rewind_replays_recorded_audio() {
    Harness h(one_sentence_per_utterance());
    h.scheduler.load(DocumentBuilder()
        .paragraph("Alpha one. Bravo two. Charlie three. Delta four. Echo five.")
        .build());
    h.scheduler.play();
    h.finish(1.0);   // Alpha
    h.finish(1.5);   // Bravo
    h.finish(2.0);   // Charlie
    assert(h.engine.last().text == "Delta four.");
    const size_t requests_before = h.engine.requests.size();

    assert(h.scheduler.rewind(2.5));
    assert(h.engine.stop_calls == 1);
    assert(h.engine.requests.size() == requests_before + 1);
    assert(h.engine.last().text == "Bravo two.");
    assert(h.scheduler.in_flight()->priority == Priority::Urgent);
    assert(h.scheduler.current_position() == h.scheduler.in_flight()->start_position);
    assert(h.queue.recycle_count() == 1);

    h.finish(1.5);
    assert(h.engine.last().text == "Charlie three.");
    h.finish(2.0);
    assert(h.engine.last().text == "Delta four.");
    h.finish(1.0);
    assert(h.engine.last().text == "Echo five.");
}

static void test_engine_error_recovers_to_idle() {
    Harness h;
    h.scheduler.load(DocumentBuilder().header("One").paragraph("Two.").build());
    h.scheduler.play();
    const uint64_t request = h.scheduler.in_flight_request_id();

    h.scheduler.on_engine_error(request + 100, "stale");
    assert(h.errors.empty());

    h.scheduler.on_engine_error(request, "synthesis failed");
    assert(h.errors.size() == 1);
    assert(h.scheduler.state() == PlaybackState::Idle);
    assert(std::find(h.states.begin(), h.states.end(), PlaybackState::Error) != h.states.end());
    assert(h.saw(FeedbackType::Error));
    assert(!h.scheduler.in_flight());
    assert(h.queue.peek_next()->text == "One");

    // Rejected speak is reported the same way
    h.engine.reject_next = true;
    assert(!h.scheduler.play());
    assert(h.errors.size() == 2);
    assert(h.queue.peek_next()->text == "One");

    assert(h.scheduler.play());
    assert(h.engine.last().text == "One");
}

static void test_section_skips_are_clamped() {
    Harness h;
    h.scheduler.load(DocumentBuilder()
        .header("One")
        .paragraph("First body.")
        .header("Two")
        .paragraph("Second body.")
        .build());
    h.scheduler.play();
    assert(h.scheduler.current_section_index() == 0);
    assert(!h.scheduler.skip_to_previous_section());

    assert(h.scheduler.skip_to_next_section());
    assert(h.engine.last().text == "First body.");
    assert(h.saw(FeedbackType::SectionChanged));
    assert(h.scheduler.skip_to_next_section());
    assert(h.engine.last().text == "Two");
    assert(h.scheduler.skip_to_next_section());
    assert(h.engine.last().text == "Second body.");
    assert(!h.scheduler.skip_to_next_section());
    assert(h.scheduler.current_section_index() == 3);

    assert(h.scheduler.skip_to_previous_section());
    assert(h.engine.last().text == "Two");
    assert(h.scheduler.current_section_info()->kind == SectionKind::Header);

    // Section signals pair every entry with an exit
    size_t entered = 0, exited = 0;
    for (const auto& c : h.sections) (c.entered ? entered : exited)++;
    assert(entered == exited + 1);
}

static void test_pause_and_resume() {
    Harness h;
    h.scheduler.load(DocumentBuilder().paragraph("First.").paragraph("Second.").build());
    assert(!h.scheduler.pause());
    h.scheduler.play();
    assert(h.scheduler.pause());
    assert(h.engine.pause_calls == 1);
    assert(h.scheduler.state() == PlaybackState::Paused);

    assert(h.scheduler.play());
    assert(h.engine.resume_calls == 1);
    assert(h.engine.requests.size() == 1);
    assert(h.scheduler.state() == PlaybackState::Playing);

    // Completion that lands while paused does not start the next utterance
    h.scheduler.pause();
    h.finish();
    assert(h.engine.requests.size() == 1);
    assert(h.scheduler.current_position() > 0);
    h.scheduler.play();
    assert(h.engine.requests.size() == 2);
    assert(h.engine.last().text == "Second.");
}

static void test_voice_settings_are_clamped() {
    Harness h;
    h.scheduler.set_speed(3.0f);
    assert(h.scheduler.voice().speed == PlaybackScheduler::kMaxSpeed);
    h.scheduler.set_speed(0.1f);
    assert(h.scheduler.voice().speed == PlaybackScheduler::kMinSpeed);
    h.scheduler.set_pitch(5.0f);
    assert(h.scheduler.voice().pitch == PlaybackScheduler::kMaxPitch);
    h.scheduler.set_volume(0.0f);
    assert(h.scheduler.voice().volume == PlaybackScheduler::kMinVolume);

    h.scheduler.set_speed(1.5f);
    h.scheduler.set_volume(1.0f);
    h.scheduler.set_main_voice("narrator");
    assert(h.saw(FeedbackType::VoiceChanged));

    Utterance code;
    code.metadata.is_skippable = true;
    auto main = h.scheduler.voice_for(code);
    assert(main.voice_id == "narrator");
    assert(std::fabs(main.rate - 1.5f) < 1e-5);
    assert(std::fabs(main.post_delay_s - 0.4) < 1e-9);

    Utterance notice;
    notice.voice = VoiceRole::Announcement;
    auto ann = h.scheduler.voice_for(notice);
    assert(ann.voice_id == "narrator");
    assert(std::fabs(ann.volume - 0.8f) < 1e-5);

    // Speed applies to the next utterance started
    h.scheduler.load(DocumentBuilder().paragraph("Quick.").build());
    h.scheduler.play();
    assert(std::fabs(h.engine.last().voice.rate - 1.5f) < 1e-5);
}

static void test_empty_and_out_of_range_loads() {
    Harness h;
    h.scheduler.load(Document());
    assert(h.scheduler.state() == PlaybackState::Completed);
    assert(!h.scheduler.play());
    assert(h.engine.requests.empty());

    ResumePoint past_end;
    past_end.position = 1000;
    Document doc = DocumentBuilder().paragraph("Short.").build();
    h.scheduler.load(doc, past_end);
    assert(h.scheduler.current_position() == doc.plain_text.size());
    assert(h.scheduler.state() == PlaybackState::Completed);

    ResumePoint negative;
    negative.position = -5;
    h.scheduler.load(doc, negative);
    assert(h.scheduler.current_position() == 0);
    assert(h.scheduler.state() == PlaybackState::Preparing);
}

static void test_fade_in_on_start() {
    Harness h;
    h.scheduler.load(DocumentBuilder().paragraph("Fading in.").build());
    h.scheduler.play();
    assert(h.engine.last().voice.volume == 0.0f);
    assert(h.timers.pending() == 1);
    h.timers.advance(100);
    assert(h.engine.volume > 0.0f && h.engine.volume < 1.0f);

    // Pausing mid-fade cancels the timer
    h.scheduler.pause();
    assert(h.timers.pending() == 0);
    h.scheduler.play();
    h.timers.advance(1000);
    assert(std::fabs(h.engine.volume - 1.0f) < 1e-5);
    assert(h.timers.pending() == 0);
}

static void test_lookahead_is_lazy() {
    std::string text;
    for (int i = 0; i < 30; ++i) text += "Sentence number " + std::to_string(i) + ". ";
    Harness h(one_sentence_per_utterance());
    h.scheduler.load(DocumentBuilder().paragraph(text).build());
    assert(h.queue.queue_count() == h.scheduler.config().refill_batch);
    h.scheduler.play();
    for (int i = 0; i < 10; ++i) h.finish();
    assert(h.queue.queue_count() >= h.scheduler.config().lookahead_threshold - 1);
    assert(h.queue.queue_count() <= h.scheduler.config().refill_batch + h.scheduler.config().lookahead_threshold);
    assert(h.engine.last().text == "Sentence number 10.");
}

static void test_progress_accumulates_resumed_time() {
    Harness h(one_sentence_per_utterance());
    ResumePoint resume;
    resume.total_duration_s = 10.0;
    h.scheduler.load(DocumentBuilder().paragraph("A. B.").build(), resume);
    h.scheduler.play();
    h.finish(1.0);
    h.finish(2.0);
    auto progress = h.scheduler.progress();
    assert(progress.is_completed);
    assert(std::fabs(progress.total_duration_s - 13.0) < 1e-9);
    assert(progress.position == progress.text_length);
    assert(std::fabs(progress.fraction() - 1.0) < 1e-9);
    assert(h.completed.size() == 2);
    assert(h.completed[1].performance && h.completed[1].performance->actual_duration_s == 2.0);
}

static void test_submitted_interjection_and_context_replay() {
    Harness h;
    auto cfg = h.scheduler.config();
    cfg.replay_context_after_interjection = true;
    h.scheduler.set_config(cfg);

    h.scheduler.load(DocumentBuilder().paragraph("Opening line.").paragraph("Closing line.").build());
    h.scheduler.play();
    assert(h.scheduler.submit_interjection(InterjectionEvent::assistant_insight("A quick aside.")));
    assert(!h.scheduler.submit_interjection(InterjectionEvent::user_question("Another?")));

    h.finish();
    assert(h.engine.last().text == "A quick aside.");
    assert(h.engine.last().voice.pre_delay_s > 0.1);
    h.finish();
    assert(h.interjections.size() == 1);
    assert(h.engine.last().text == "Opening line.");   // context replay
    h.finish();
    assert(h.engine.last().text == "Closing line.");
}

static void test_replay_context_command() {
    Harness h(one_sentence_per_utterance());
    h.scheduler.load(DocumentBuilder().paragraph("One. Two. Three. Four.").build());
    assert(!h.scheduler.replay_context(2));
    h.scheduler.play();
    h.finish();
    h.finish();
    h.finish();
    assert(h.engine.last().text == "Four.");
    assert(h.scheduler.replay_context(2));
    assert(h.engine.last().text == "Two.");
    h.finish();
    assert(h.engine.last().text == "Three.");
    h.finish();
    assert(h.engine.last().text == "Four.");
}

static void test_long_word_reads_through_once() {
    Harness h;
    h.scheduler.load(DocumentBuilder().paragraph(std::string(2000, 'x')).build());
    h.scheduler.play();
    size_t spoken = 1;
    while (h.scheduler.state() == PlaybackState::Playing && spoken < 50) {
        h.finish();
        if (h.scheduler.in_flight()) ++spoken;
    }
    assert(h.scheduler.state() == PlaybackState::Completed);
    assert(h.engine.requests.size() == 7);
    assert(h.completed.size() == 7);
    for (size_t i = 1; i < h.completed.size(); ++i) {
        assert(h.completed[i].start_position == h.completed[i - 1].end_position);
    }
    assert(h.scheduler.current_position() == 2000);
}

static void test_resume_point_inside_word_backs_up() {
    Harness h;
    ResumePoint resume;
    resume.position = 8;   // inside "wonderful"
    h.scheduler.load(DocumentBuilder().paragraph("Hello wonderful world.").build(), resume);
    assert(h.scheduler.current_position() == 6);
    h.scheduler.play();
    assert(h.engine.last().text == "wonderful world.");
}

static void test_announcements_follow_section_order() {
    Harness h;
    h.scheduler.load(DocumentBuilder()
        .paragraph("Intro.")
        .code_block("fn main() {}", "rust")
        .code_block("func main() {}", "go")
        .paragraph("Outro.")
        .build());
    h.scheduler.play();
    assert(h.engine.last().text == "Intro.");
    assert(h.scheduler.submit_interjection(InterjectionEvent::assistant_insight("A note.")));

    std::vector<std::string> heard{h.engine.last().text};
    while (h.scheduler.state() == PlaybackState::Playing) {
        h.finish();
        if (h.scheduler.in_flight()) heard.push_back(h.engine.last().text);
    }
    const std::vector<std::string> expected{"Intro.", "A note.", "rust code", "go code", "Outro."};
    assert(heard == expected);
    assert(std::count(h.feedback.begin(), h.feedback.end(), FeedbackType::CodeBlockEnd) == 2);
    assert(h.interjections.size() == 3);
    assert(h.interjections[1].section_index == 1);
    assert(h.interjections[2].section_index == 2);
    assert(h.scheduler.state() == PlaybackState::Completed);
}

static void test_zero_lookahead_still_reads() {
    Harness h;
    auto cfg = h.scheduler.config();
    cfg.lookahead_threshold = 0;
    h.scheduler.set_config(cfg);
    h.scheduler.load(DocumentBuilder().paragraph("First.").paragraph("Second.").build());
    assert(h.scheduler.state() == PlaybackState::Preparing);
    assert(h.queue.queue_count() >= 1);
    h.scheduler.play();
    assert(h.engine.last().text == "First.");
    h.finish();
    assert(h.engine.last().text == "Second.");
    h.finish();
    assert(h.scheduler.state() == PlaybackState::Completed);
}

int main() {
    test_code_block_announced_after_prose();
    test_stop_suppresses_stale_completion();
    test_rewind_estimate_floors_at_zero();
    test_rewind_replays_recorded_audio();
    test_engine_error_recovers_to_idle();
    test_section_skips_are_clamped();
    test_pause_and_resume();
    test_voice_settings_are_clamped();
    test_empty_and_out_of_range_loads();
    test_fade_in_on_start();
    test_lookahead_is_lazy();
    test_progress_accumulates_resumed_time();
    test_submitted_interjection_and_context_replay();
    test_replay_context_command();
    test_long_word_reads_through_once();
    test_resume_point_inside_word_backs_up();
    test_announcements_follow_section_order();
    test_zero_lookahead_still_reads();
    return 0;
}
