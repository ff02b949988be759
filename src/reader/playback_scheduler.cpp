#include "reader/playback_scheduler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace reader {

const char* to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Idle: return "idle";
        case PlaybackState::Preparing: return "preparing";
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused: return "paused";
        case PlaybackState::Completed: return "completed";
        case PlaybackState::Error: return "error";
    }
    return "unknown";
}

PlaybackScheduler::PlaybackScheduler(audio::ISpeechEngine& engine,
                                     UtteranceQueueManager& queue,
                                     InterjectionCoordinator& coordinator,
                                     const Chunker& chunker,
                                     core::ITimerHost* timers)
    : engine_(engine)
    , queue_(queue)
    , coordinator_(coordinator)
    , chunker_(chunker)
    , timers_(timers)
    , fader_(timers) {
    coordinator_.set_feedback_callback([this](FeedbackType type) { emit_feedback(type); });
}

PlaybackScheduler::~PlaybackScheduler() {
    fader_.cancel();
    coordinator_.set_feedback_callback(nullptr);
    if (in_flight_) {
        engine_.stop();
    }
}

//==============================================================================
// Transport
//==============================================================================

void PlaybackScheduler::load(Document document, const ResumePoint& resume) {
    fader_.cancel();
    cancel_in_flight(false);
    leave_section();
    queue_.reset_all();
    coordinator_.reset();

    document_ = std::move(document);
    document_.normalize();
    loaded_ = true;

    const size_t length = document_.plain_text.size();
    size_t position = 0;
    if (resume.position > 0) {
        position = Chunker::align_to_word_start(document_, std::min(static_cast<size_t>(resume.position), length));
    }
    current_position_ = position;
    chunk_cursor_ = position;
    chunker_exhausted_ = false;
    total_elapsed_s_ = std::max(0.0, resume.total_duration_s);
    user_stopped_ = false;
    completed_ = false;

    refill_if_needed();

    std::ostringstream os;
    os << "Loaded document: " << length << " chars, " << document_.sections.size()
       << " sections, resuming at " << position;
    core::log_info(os.str());

    if (queue_.is_main_queue_empty()) {
        completed_ = true;
        set_state(PlaybackState::Completed);
        emit_position();
        return;
    }
    set_state(PlaybackState::Preparing);
    emit_position();
}

bool PlaybackScheduler::play() {
    if (!loaded_) {
        core::log_warn("play() called with no document loaded");
        return false;
    }
    if (state_ == PlaybackState::Playing) {
        return false;
    }
    if (state_ == PlaybackState::Completed) {
        core::log_info("Document already completed");
        return false;
    }

    user_stopped_ = false;

    if (state_ == PlaybackState::Paused && in_flight_) {
        if (engine_.resume()) {
            set_state(PlaybackState::Playing);
            emit_feedback(FeedbackType::PlayStarted);
            start_fade(voice_for(*in_flight_).volume);
            return true;
        }
        // The engine no longer holds it; say it again from the top
        cancel_in_flight(true);
    }

    emit_feedback(FeedbackType::PlayStarted);
    fade_pending_ = config_.fade_in;
    return start_next();
}

bool PlaybackScheduler::pause() {
    if (state_ != PlaybackState::Playing) {
        return false;
    }
    fader_.cancel();
    if (in_flight_ && !engine_.pause()) {
        core::log_debug("Engine had nothing to pause");
    }
    set_state(PlaybackState::Paused);
    emit_feedback(FeedbackType::PlayPaused);
    return true;
}

bool PlaybackScheduler::stop() {
    if (state_ == PlaybackState::Idle) {
        return false;
    }
    user_stopped_ = true;
    fader_.cancel();
    cancel_in_flight(false);
    queue_.reset_all();
    coordinator_.reset();
    leave_section();

    chunk_cursor_ = current_position_;
    chunker_exhausted_ = false;
    completed_ = false;

    set_state(PlaybackState::Idle);
    emit_feedback(FeedbackType::PlayStopped);
    return true;
}

bool PlaybackScheduler::rewind(double seconds) {
    if (!loaded_ || !(seconds > 0.0)) {
        return false;
    }

    const bool resume_playing = state_ == PlaybackState::Playing;
    fader_.cancel();
    // The interrupted utterance plays again after whatever is replayed
    cancel_in_flight(true);

    std::ostringstream os;
    if (queue_.recycled_duration() >= seconds) {
        auto replay = queue_.find_replay_utterances(seconds);
        const size_t earliest = replay->front().start_position;
        size_t requeued = queue_.requeue_for_replay(*replay);
        current_position_ = std::min(current_position_, earliest);
        os << "Rewind " << seconds << "s: replaying " << requeued << " recorded utterance(s) from " << earliest;
    } else {
        const double cps = estimated_characters_per_second();
        const auto chars = static_cast<size_t>(std::llround(seconds * cps));
        const size_t target = Chunker::align_to_word_start(
            document_, current_position_ > chars ? current_position_ - chars : 0);
        queue_.reset_all();
        reposition(target);
        os << "Rewind " << seconds << "s: estimated " << chars << " chars at " << cps
           << " chars/s, re-reading from " << target;
    }
    core::log_info(os.str());

    completed_ = false;
    emit_position();
    after_seek(resume_playing);
    return true;
}

bool PlaybackScheduler::skip_to_next_section() {
    if (!loaded_ || document_.sections.empty()) {
        return false;
    }
    int current = std::max(0, current_section_index());
    size_t target = static_cast<size_t>(current) + 1;
    if (target >= document_.sections.size()) {
        core::log_debug("Already in the last section");
        return false;
    }
    return jump_to_section(target);
}

bool PlaybackScheduler::skip_to_previous_section() {
    if (!loaded_ || document_.sections.empty()) {
        return false;
    }
    int current = current_section_index();
    if (current <= 0) {
        core::log_debug("Already in the first section");
        return false;
    }
    return jump_to_section(static_cast<size_t>(current - 1));
}

bool PlaybackScheduler::replay_context(size_t depth) {
    if (!loaded_) {
        return false;
    }
    auto context = queue_.context_replay_utterances(depth);
    if (context.empty()) {
        return false;
    }

    const bool resume_playing = state_ == PlaybackState::Playing;
    fader_.cancel();
    cancel_in_flight(true);
    queue_.requeue_for_replay(context);
    current_position_ = std::min(current_position_, context.front().start_position);
    completed_ = false;
    emit_position();
    after_seek(resume_playing);
    return true;
}

bool PlaybackScheduler::submit_interjection(const InterjectionEvent& event) {
    return coordinator_.submit(event);
}

//==============================================================================
// Voice
//==============================================================================

void PlaybackScheduler::set_speed(float speed) {
    voice_.speed = std::clamp(speed, kMinSpeed, kMaxSpeed);
}

void PlaybackScheduler::set_pitch(float pitch) {
    voice_.pitch = std::clamp(pitch, kMinPitch, kMaxPitch);
}

void PlaybackScheduler::set_volume(float volume) {
    voice_.volume = std::clamp(volume, kMinVolume, kMaxVolume);
}

void PlaybackScheduler::set_main_voice(const std::string& voice_id) {
    if (voice_.main_voice_id == voice_id) return;
    voice_.main_voice_id = voice_id;
    emit_feedback(FeedbackType::VoiceChanged);
}

void PlaybackScheduler::set_announcement_voice(const std::string& voice_id) {
    voice_.announcement_voice_id = voice_id;
}

audio::VoiceParams PlaybackScheduler::voice_for(const Utterance& utterance) const {
    audio::VoiceParams p;
    p.pitch = voice_.pitch;
    if (utterance.voice == VoiceRole::Announcement) {
        p.voice_id = voice_.announcement_voice_id.empty() ? voice_.main_voice_id : voice_.announcement_voice_id;
        p.rate = voice_.speed * config_.announcement_rate_factor;
        p.volume = voice_.volume * config_.announcement_volume_factor;
        p.pre_delay_s = config_.announcement_pre_delay_s;
        p.post_delay_s = config_.announcement_post_delay_s;
    } else {
        p.voice_id = voice_.main_voice_id;
        p.rate = voice_.speed;
        p.volume = voice_.volume;
        p.pre_delay_s = config_.main_pre_delay_s;
        p.post_delay_s = utterance.metadata.is_skippable ? config_.code_post_delay_s : config_.main_post_delay_s;
    }
    return p;
}

//==============================================================================
// Engine callbacks
//==============================================================================

void PlaybackScheduler::on_utterance_finished(uint64_t request_id, double actual_duration_s) {
    if (user_stopped_ || !in_flight_ || request_id != in_flight_request_) {
        core::log_debug("Ignoring stale completion for request " + std::to_string(request_id));
        return;
    }

    Utterance done = std::move(*in_flight_);
    in_flight_.reset();
    in_flight_request_ = 0;

    if (!(actual_duration_s > 0.0)) {
        actual_duration_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - in_flight_started_).count();
    }
    const UtterancePerformance perf = measure_performance(done, actual_duration_s);
    done.performance = perf;

    current_position_ = std::max(current_position_, done.end_position);
    total_elapsed_s_ += perf.actual_duration_s;

    if (config_.on_utterance_completed) {
        config_.on_utterance_completed(done);
    }
    if (done.is_interjection && config_.on_interjection_played) {
        config_.on_interjection_played(done);
    }
    coordinator_.on_utterance_finished(done);

    const bool submitted_interjection = done.is_interjection && done.span() == 0;
    queue_.move_to_recycle(std::move(done), perf);
    emit_position();

    if (submitted_interjection && config_.replay_context_after_interjection) {
        queue_.requeue_for_replay(queue_.context_replay_utterances(1));
    }

    refill_if_needed();

    if (state_ != PlaybackState::Playing) {
        return;   // paused on a boundary; play() picks up from here
    }
    start_next();
}

void PlaybackScheduler::on_engine_error(uint64_t request_id, const std::string& message) {
    if (request_id != 0 && request_id != in_flight_request_) {
        core::log_debug("Ignoring error for stale request " + std::to_string(request_id) + ": " + message);
        return;
    }
    handle_engine_failure(message);
}

//==============================================================================
// Queries
//==============================================================================

int PlaybackScheduler::current_section_index() const {
    if (in_flight_ && in_flight_->section_index >= 0) {
        return in_flight_->section_index;
    }
    auto idx = document_.section_index_at(current_position_);
    return idx ? static_cast<int>(*idx) : -1;
}

std::optional<SectionInfo> PlaybackScheduler::current_section_info() const {
    int idx = current_section_index();
    if (idx < 0 || static_cast<size_t>(idx) >= document_.sections.size()) {
        return std::nullopt;
    }
    const ContentSection& s = document_.sections[static_cast<size_t>(idx)];
    SectionInfo info;
    info.index = static_cast<size_t>(idx);
    info.kind = s.kind;
    info.level = s.level;
    info.skippable = s.skippable;
    info.language = Chunker::section_language(document_, s);
    info.start_index = s.start_index;
    info.end_index = s.end_index;
    return info;
}

bool PlaybackScheduler::can_skip_current_section() const {
    auto info = current_section_info();
    return info && info->skippable;
}

ReadingProgress PlaybackScheduler::progress() const {
    ReadingProgress p;
    p.position = current_position_;
    p.text_length = document_.plain_text.size();
    p.total_duration_s = total_elapsed_s_;
    p.is_completed = completed_;
    return p;
}

double PlaybackScheduler::estimated_characters_per_second() const {
    if (auto measured = queue_.average_characters_per_second()) {
        return *measured;
    }
    return kFallbackWordsPerMinute * kAverageWordLength / 60.0 * voice_.speed;
}

//==============================================================================
// Internals
//==============================================================================

void PlaybackScheduler::set_state(PlaybackState state) {
    if (state_ == state) {
        return;
    }
    core::log_debug(std::string("Playback state ") + to_string(state_) + " -> " + to_string(state));
    state_ = state;
    if (config_.on_state_changed) {
        config_.on_state_changed(state);
    }
}

void PlaybackScheduler::emit_feedback(FeedbackType type) {
    if (config_.on_feedback) {
        config_.on_feedback(type);
    }
}

void PlaybackScheduler::emit_position() {
    if (config_.on_position_changed) {
        config_.on_position_changed(current_position_);
    }
}

void PlaybackScheduler::refill_if_needed() {
    if (!loaded_) {
        return;
    }
    const size_t batch_size = std::max<size_t>(1, config_.refill_batch);
    const size_t threshold = std::max<size_t>(1, config_.lookahead_threshold);
    while (!chunker_exhausted_ && queue_.queue_count() < threshold) {
        ChunkBatch batch = chunker_.next_chunks(document_, chunk_cursor_, batch_size);
        const size_t produced = batch.utterances.size();
        chunk_cursor_ = batch.next_position;
        queue_.enqueue_many(std::move(batch.utterances));
        if (batch.reached_end) {
            chunker_exhausted_ = true;
        } else if (produced == 0) {
            core::log_warn("Chunker made no progress at " + std::to_string(chunk_cursor_));
            break;
        }
    }
}

bool PlaybackScheduler::start_next() {
    refill_if_needed();
    coordinator_.on_boundary(queue_, current_position_);

    auto next = queue_.dequeue_next();
    if (!next) {
        finish_document();
        return false;
    }
    refill_if_needed();
    return start_utterance(std::move(*next));
}

bool PlaybackScheduler::start_utterance(Utterance utterance) {
    audio::SpeechRequest request;
    request.id = next_request_id_++;
    request.text = utterance.text;
    request.voice = voice_for(utterance);

    const float target_volume = request.voice.volume;
    const bool fade = fade_pending_ && timers_ != nullptr;
    fade_pending_ = false;
    if (fade) {
        request.voice.volume = 0.0f;
    }

    core::log_debug("Speaking " + describe(utterance));
    in_flight_ = std::move(utterance);
    in_flight_request_ = request.id;
    in_flight_started_ = std::chrono::steady_clock::now();
    track_section(*in_flight_);
    set_state(PlaybackState::Playing);

    if (!engine_.speak(request)) {
        handle_engine_failure("Speech engine rejected " + describe(*in_flight_));
        return false;
    }
    if (fade) {
        start_fade(target_volume);
    }
    return true;
}

void PlaybackScheduler::cancel_in_flight(bool requeue) {
    if (!in_flight_) {
        return;
    }
    engine_.stop();
    if (requeue) {
        queue_.return_to_front(std::move(*in_flight_));
    }
    in_flight_.reset();
    in_flight_request_ = 0;
}

void PlaybackScheduler::handle_engine_failure(const std::string& message) {
    fader_.cancel();
    if (in_flight_) {
        queue_.return_to_front(std::move(*in_flight_));
        in_flight_.reset();
        in_flight_request_ = 0;
    }
    core::log_error("Speech engine error: " + message);
    set_state(PlaybackState::Error);
    emit_feedback(FeedbackType::Error);
    if (config_.on_error) {
        config_.on_error(message);
    }
    set_state(PlaybackState::Idle);
}

void PlaybackScheduler::finish_document() {
    fader_.cancel();
    leave_section();
    completed_ = true;
    set_state(PlaybackState::Completed);
    emit_feedback(FeedbackType::PlayCompleted);
    core::log_info("Reached end of document at " + std::to_string(current_position_));
}

void PlaybackScheduler::reposition(size_t position) {
    queue_.clear_main_queue();
    coordinator_.cancel_section_tracking();
    current_position_ = std::min(position, document_.plain_text.size());
    chunk_cursor_ = current_position_;
    chunker_exhausted_ = false;
    refill_if_needed();
}

bool PlaybackScheduler::jump_to_section(size_t index) {
    const bool resume_playing = state_ == PlaybackState::Playing;
    fader_.cancel();
    cancel_in_flight(false);
    leave_section();
    reposition(document_.sections[index].start_index);
    completed_ = false;

    core::log_info("Jumped to section " + std::to_string(index) + " (" +
                   to_string(document_.sections[index].kind) + ")");
    emit_feedback(FeedbackType::SectionChanged);
    emit_position();
    after_seek(resume_playing);
    return true;
}

void PlaybackScheduler::after_seek(bool resume_playing) {
    if (queue_.is_main_queue_empty()) {
        finish_document();
        return;
    }
    if (resume_playing) {
        fade_pending_ = config_.fade_in;
        start_next();
    } else if (state_ == PlaybackState::Completed) {
        set_state(PlaybackState::Preparing);
    }
}

void PlaybackScheduler::track_section(const Utterance& utterance) {
    if (utterance.section_index < 0 || utterance.section_index == current_section_) {
        return;
    }
    leave_section();
    current_section_ = utterance.section_index;
    if (config_.on_section_changed && static_cast<size_t>(current_section_) < document_.sections.size()) {
        SectionChange change;
        change.section_index = current_section_;
        change.kind = document_.sections[static_cast<size_t>(current_section_)].kind;
        change.entered = true;
        config_.on_section_changed(change);
    }
}

void PlaybackScheduler::leave_section() {
    if (current_section_ < 0) {
        return;
    }
    const int exited = current_section_;
    current_section_ = -1;
    if (config_.on_section_changed && static_cast<size_t>(exited) < document_.sections.size()) {
        SectionChange change;
        change.section_index = exited;
        change.kind = document_.sections[static_cast<size_t>(exited)].kind;
        change.entered = false;
        config_.on_section_changed(change);
    }
}

void PlaybackScheduler::start_fade(float target) {
    if (!config_.fade_in || !timers_) {
        engine_.set_volume(target);
        return;
    }
    fader_.fade(0.0f, target, config_.fade_in_ms, config_.fade_steps,
                [this](float volume) { engine_.set_volume(volume); });
}

} // namespace reader
