// Copyright (c) 2025 VAM Talk Reader
// Application API - Reader Controller Implementation

#include "app/reader_controller.hpp"

#include "core/event_loop.hpp"
#include "core/logging.hpp"
#include "reader/chunker.hpp"
#include "reader/utterance_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>

namespace app {

const char* to_string(ReaderStatus::State state) {
    switch (state) {
        case ReaderStatus::State::IDLE: return "IDLE";
        case ReaderStatus::State::PREPARING: return "PREPARING";
        case ReaderStatus::State::PLAYING: return "PLAYING";
        case ReaderStatus::State::PAUSED: return "PAUSED";
        case ReaderStatus::State::COMPLETED: return "COMPLETED";
        case ReaderStatus::State::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

namespace {

ReaderStatus::State to_status_state(reader::PlaybackState state) {
    switch (state) {
        case reader::PlaybackState::Idle: return ReaderStatus::State::IDLE;
        case reader::PlaybackState::Preparing: return ReaderStatus::State::PREPARING;
        case reader::PlaybackState::Playing: return ReaderStatus::State::PLAYING;
        case reader::PlaybackState::Paused: return ReaderStatus::State::PAUSED;
        case reader::PlaybackState::Completed: return ReaderStatus::State::COMPLETED;
        case reader::PlaybackState::Error: return ReaderStatus::State::ERROR;
    }
    return ReaderStatus::State::IDLE;
}

const size_t MAX_TELEMETRY = 1000;

} // namespace

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class ReaderControllerImpl {
public:
    ReaderControllerImpl() = default;
    ~ReaderControllerImpl() {
        shutdown();
    }

    bool start(const ReaderConfig& config);
    void shutdown();
    bool is_started() const { return started_.load(); }

    // Runs @p command on the event loop, then republishes status
    bool post_command(std::function<void(reader::PlaybackScheduler&)> command);

    ReaderStatus get_status() const;
    bool wait_for_state(ReaderStatus::State state, std::chrono::milliseconds timeout) const;
    bool flush(std::chrono::milliseconds timeout);
    std::vector<UtteranceTelemetry> get_recent_telemetry() const;

    // Event Subscription
    void subscribe_to_status(StatusCallback callback);
    void subscribe_to_sections(SectionCallback callback);
    void subscribe_to_interjections(InterjectionCallback callback);
    void subscribe_to_feedback(FeedbackCallback callback);
    void subscribe_to_telemetry(TelemetryCallback callback);
    void subscribe_to_errors(ErrorCallback callback);
    void clear_subscriptions();

private:
    // Session
    std::atomic<bool> started_{false};
    std::mutex lifecycle_mutex_;
    std::chrono::steady_clock::time_point session_start_;

    // Playback pipeline (touched only on the loop thread once started)
    core::EventLoop loop_;
    std::unique_ptr<audio::ISpeechEngine> engine_;
    std::unique_ptr<reader::UtteranceQueueManager> queue_;
    reader::InterjectionCoordinator coordinator_;
    reader::Chunker chunker_;
    std::unique_ptr<reader::PlaybackScheduler> scheduler_;

    // Status snapshot
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    ReaderStatus status_;

    // Telemetry history
    mutable std::mutex telemetry_mutex_;
    std::deque<UtteranceTelemetry> telemetry_;

    // Callbacks
    mutable std::mutex callbacks_mutex_;
    std::vector<StatusCallback> status_callbacks_;
    std::vector<SectionCallback> section_callbacks_;
    std::vector<InterjectionCallback> interjection_callbacks_;
    std::vector<FeedbackCallback> feedback_callbacks_;
    std::vector<TelemetryCallback> telemetry_callbacks_;
    std::vector<ErrorCallback> error_callbacks_;

    reader::PlaybackScheduler::Config make_scheduler_config(const ReaderConfig& config);
    int64_t elapsed_ms() const;

    void publish_status();
    void emit_status(const ReaderStatus& status);
    void emit_section(const SectionEvent& event);
    void emit_interjection(const InterjectionNotice& notice);
    void emit_feedback(reader::FeedbackType type);
    void emit_telemetry(const UtteranceTelemetry& telemetry);
    void emit_error(const ReaderError& error);
};

//==============================================================================
// Lifecycle
//==============================================================================

bool ReaderControllerImpl::start(const ReaderConfig& config) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_.load()) {
        core::log_warn("Reader already started");
        return false;
    }
    session_start_ = std::chrono::steady_clock::now();

    engine_ = audio::SpeechEngineFactory::create_engine(config.engine_id);
    if (!engine_) {
        emit_error({ReaderError::Severity::CRITICAL, "Unknown speech engine",
                    "engine_id=" + config.engine_id, elapsed_ms()});
        return false;
    }

    audio::SpeechEngineConfig engine_config;
    engine_config.engine_id = config.engine_id;
    engine_config.time_scale = config.engine_time_scale;
    engine_config.echo_text = config.echo_utterances;

    // Engine callbacks arrive on the engine thread; hop onto the loop
    audio::SpeechEngineCallbacks callbacks;
    callbacks.on_started = [](uint64_t request_id) {
        core::log_debug("Engine started request " + std::to_string(request_id));
    };
    callbacks.on_finished = [this](uint64_t request_id, double duration_s) {
        loop_.post([this, request_id, duration_s]() {
            scheduler_->on_utterance_finished(request_id, duration_s);
            publish_status();
        });
    };
    callbacks.on_error = [this](uint64_t request_id, const std::string& message, bool is_fatal) {
        if (is_fatal) {
            emit_error({ReaderError::Severity::CRITICAL, "Speech engine failure", message, elapsed_ms()});
        }
        loop_.post([this, request_id, message]() {
            scheduler_->on_engine_error(request_id, message);
            publish_status();
        });
    };

    if (!engine_->initialize(engine_config, callbacks)) {
        emit_error({ReaderError::Severity::CRITICAL, "Failed to initialize speech engine",
                    "engine_id=" + config.engine_id, elapsed_ms()});
        engine_.reset();
        return false;
    }

    reader::Chunker::Config chunk_config;
    chunk_config.target_chars = config.target_chunk_chars;
    chunk_config.max_chars = config.max_chunk_chars;
    chunk_config.skip_technical_sections = config.skip_technical_sections;
    chunker_.set_config(chunk_config);

    reader::InterjectionCoordinator::Config coordinator_config;
    coordinator_config.style = config.notification_style;
    coordinator_config.announce_language = config.announce_language;
    coordinator_.set_config(coordinator_config);

    queue_ = std::make_unique<reader::UtteranceQueueManager>(config.recycle_capacity);
    scheduler_ = std::make_unique<reader::PlaybackScheduler>(*engine_, *queue_, coordinator_, chunker_, &loop_);
    scheduler_->set_config(make_scheduler_config(config));
    scheduler_->set_speed(config.speed);
    scheduler_->set_pitch(config.pitch);
    scheduler_->set_volume(config.volume);
    scheduler_->set_main_voice(config.main_voice);
    scheduler_->set_announcement_voice(config.announcement_voice);

    if (!loop_.start()) {
        emit_error({ReaderError::Severity::CRITICAL, "Failed to start event loop", "", elapsed_ms()});
        scheduler_.reset();
        engine_.reset();
        return false;
    }

    started_.store(true);
    core::log_info("Reader started with engine '" + engine_->get_engine_info().name + "'");
    loop_.post([this]() { publish_status(); });
    return true;
}

void ReaderControllerImpl::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_.exchange(false)) {
        return;
    }

    loop_.post([this]() {
        scheduler_->stop();
        publish_status();
    });
    loop_.stop();   // drains posted work, then joins

    scheduler_.reset();
    engine_.reset();  // joins the engine thread
    queue_.reset();
    core::log_info("Reader shut down");
}

bool ReaderControllerImpl::post_command(std::function<void(reader::PlaybackScheduler&)> command) {
    if (!started_.load()) {
        return false;
    }
    return loop_.post([this, command]() {
        command(*scheduler_);
        publish_status();
    });
}

reader::PlaybackScheduler::Config ReaderControllerImpl::make_scheduler_config(const ReaderConfig& config) {
    reader::PlaybackScheduler::Config sc;
    sc.lookahead_threshold = config.lookahead_threshold;
    sc.refill_batch = config.refill_batch;
    sc.fade_in = config.fade_in;
    sc.replay_context_after_interjection = config.replay_context_after_interjection;

    sc.on_state_changed = [this](reader::PlaybackState) { publish_status(); };
    sc.on_section_changed = [this](const reader::SectionChange& change) {
        emit_section({change.section_index, change.kind, change.entered});
    };
    sc.on_interjection_played = [this](const reader::Utterance& u) {
        emit_interjection({u.id, u.text, u.section_index});
    };
    sc.on_feedback = [this](reader::FeedbackType type) { emit_feedback(type); };
    sc.on_utterance_completed = [this](const reader::Utterance& u) {
        UtteranceTelemetry t;
        t.id = u.id;
        t.text = u.text;
        t.start_position = u.start_position;
        t.end_position = u.end_position;
        t.duration_s = u.performance ? u.performance->actual_duration_s : 0.0;
        t.characters_per_second = u.performance ? u.performance->characters_per_second : 0.0;
        t.is_interjection = u.is_interjection;
        emit_telemetry(t);
    };
    sc.on_error = [this](const std::string& message) {
        emit_error({ReaderError::Severity::ERROR, "Playback interrupted", message, elapsed_ms()});
    };
    return sc;
}

int64_t ReaderControllerImpl::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session_start_).count();
}

//==============================================================================
// Status
//==============================================================================

ReaderStatus ReaderControllerImpl::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

bool ReaderControllerImpl::wait_for_state(ReaderStatus::State state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return status_.state == state; });
}

bool ReaderControllerImpl::flush(std::chrono::milliseconds timeout) {
    if (!started_.load()) {
        return false;
    }
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!loop_.post([done]() { done->set_value(); })) {
        return false;
    }
    return future.wait_for(timeout) == std::future_status::ready;
}

std::vector<UtteranceTelemetry> ReaderControllerImpl::get_recent_telemetry() const {
    std::lock_guard<std::mutex> lock(telemetry_mutex_);
    return std::vector<UtteranceTelemetry>(telemetry_.begin(), telemetry_.end());
}

//==============================================================================
// Event Subscription
//==============================================================================

void ReaderControllerImpl::subscribe_to_status(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    status_callbacks_.push_back(std::move(callback));
}

void ReaderControllerImpl::subscribe_to_sections(SectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    section_callbacks_.push_back(std::move(callback));
}

void ReaderControllerImpl::subscribe_to_interjections(InterjectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    interjection_callbacks_.push_back(std::move(callback));
}

void ReaderControllerImpl::subscribe_to_feedback(FeedbackCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    feedback_callbacks_.push_back(std::move(callback));
}

void ReaderControllerImpl::subscribe_to_telemetry(TelemetryCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    telemetry_callbacks_.push_back(std::move(callback));
}

void ReaderControllerImpl::subscribe_to_errors(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    error_callbacks_.push_back(std::move(callback));
}

void ReaderControllerImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    status_callbacks_.clear();
    section_callbacks_.clear();
    interjection_callbacks_.clear();
    feedback_callbacks_.clear();
    telemetry_callbacks_.clear();
    error_callbacks_.clear();
}

//==============================================================================
// Internal Methods Implementation
//==============================================================================

void ReaderControllerImpl::publish_status() {
    if (!scheduler_) {
        return;
    }
    ReaderStatus status;
    status.state = to_status_state(scheduler_->state());
    auto progress = scheduler_->progress();
    status.position = progress.position;
    status.text_length = progress.text_length;
    status.section_index = scheduler_->current_section_index();
    status.elapsed_s = progress.total_duration_s;
    status.speed = scheduler_->voice().speed;
    status.queued = queue_->queue_count();
    status.recycled = queue_->recycle_count();
    status.is_completed = progress.is_completed;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = status;
    }
    state_cv_.notify_all();
    emit_status(status);
}

void ReaderControllerImpl::emit_status(const ReaderStatus& status) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : status_callbacks_) {
        try {
            callback(status);
        } catch (const std::exception& e) {
            core::log_error(std::string("Status callback exception: ") + e.what());
        }
    }
}

void ReaderControllerImpl::emit_section(const SectionEvent& event) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : section_callbacks_) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            core::log_error(std::string("Section callback exception: ") + e.what());
        }
    }
}

void ReaderControllerImpl::emit_interjection(const InterjectionNotice& notice) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : interjection_callbacks_) {
        try {
            callback(notice);
        } catch (const std::exception& e) {
            core::log_error(std::string("Interjection callback exception: ") + e.what());
        }
    }
}

void ReaderControllerImpl::emit_feedback(reader::FeedbackType type) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : feedback_callbacks_) {
        try {
            callback(type);
        } catch (const std::exception& e) {
            core::log_error(std::string("Feedback callback exception: ") + e.what());
        }
    }
}

void ReaderControllerImpl::emit_telemetry(const UtteranceTelemetry& telemetry) {
    {
        std::lock_guard<std::mutex> lock(telemetry_mutex_);
        telemetry_.push_back(telemetry);
        // Keep last N entries (prevent unbounded growth)
        if (telemetry_.size() > MAX_TELEMETRY) {
            telemetry_.pop_front();
        }
    }

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : telemetry_callbacks_) {
        try {
            callback(telemetry);
        } catch (const std::exception& e) {
            core::log_error(std::string("Telemetry callback exception: ") + e.what());
        }
    }
}

void ReaderControllerImpl::emit_error(const ReaderError& error) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : error_callbacks_) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            core::log_error(std::string("Error callback exception: ") + e.what());
        }
    }
}

//==============================================================================
// ReaderController Public Interface (Forwarding to PIMPL)
//==============================================================================

ReaderController::ReaderController()
    : impl_(std::make_unique<ReaderControllerImpl>()) {
}

ReaderController::~ReaderController() = default;

std::vector<audio::SpeechEngineInfo> ReaderController::list_speech_engines() {
    return audio::SpeechEngineFactory::enumerate_engines();
}

bool ReaderController::start(const ReaderConfig& config) {
    return impl_->start(config);
}

void ReaderController::shutdown() {
    impl_->shutdown();
}

bool ReaderController::is_started() const {
    return impl_->is_started();
}

bool ReaderController::load_document(reader::Document document, const reader::ResumePoint& resume) {
    auto shared = std::make_shared<reader::Document>(std::move(document));
    return impl_->post_command([shared, resume](reader::PlaybackScheduler& s) {
        s.load(std::move(*shared), resume);
    });
}

bool ReaderController::play() {
    return impl_->post_command([](reader::PlaybackScheduler& s) { s.play(); });
}

bool ReaderController::pause() {
    return impl_->post_command([](reader::PlaybackScheduler& s) { s.pause(); });
}

bool ReaderController::stop() {
    return impl_->post_command([](reader::PlaybackScheduler& s) { s.stop(); });
}

bool ReaderController::rewind(double seconds) {
    return impl_->post_command([seconds](reader::PlaybackScheduler& s) { s.rewind(seconds); });
}

bool ReaderController::skip_to_next_section() {
    return impl_->post_command([](reader::PlaybackScheduler& s) { s.skip_to_next_section(); });
}

bool ReaderController::skip_to_previous_section() {
    return impl_->post_command([](reader::PlaybackScheduler& s) { s.skip_to_previous_section(); });
}

bool ReaderController::replay_context(size_t depth) {
    return impl_->post_command([depth](reader::PlaybackScheduler& s) { s.replay_context(depth); });
}

bool ReaderController::submit_interjection(const reader::InterjectionEvent& event) {
    return impl_->post_command([event](reader::PlaybackScheduler& s) { s.submit_interjection(event); });
}

bool ReaderController::set_speed(float speed) {
    return impl_->post_command([speed](reader::PlaybackScheduler& s) { s.set_speed(speed); });
}

bool ReaderController::set_pitch(float pitch) {
    return impl_->post_command([pitch](reader::PlaybackScheduler& s) { s.set_pitch(pitch); });
}

bool ReaderController::set_volume(float volume) {
    return impl_->post_command([volume](reader::PlaybackScheduler& s) { s.set_volume(volume); });
}

bool ReaderController::set_main_voice(const std::string& voice_id) {
    return impl_->post_command([voice_id](reader::PlaybackScheduler& s) { s.set_main_voice(voice_id); });
}

bool ReaderController::set_announcement_voice(const std::string& voice_id) {
    return impl_->post_command([voice_id](reader::PlaybackScheduler& s) { s.set_announcement_voice(voice_id); });
}

ReaderStatus ReaderController::get_status() const {
    return impl_->get_status();
}

bool ReaderController::wait_for_state(ReaderStatus::State state, std::chrono::milliseconds timeout) const {
    return impl_->wait_for_state(state, timeout);
}

bool ReaderController::flush(std::chrono::milliseconds timeout) {
    return impl_->flush(timeout);
}

std::vector<UtteranceTelemetry> ReaderController::get_recent_telemetry() const {
    return impl_->get_recent_telemetry();
}

void ReaderController::subscribe_to_status(StatusCallback callback) {
    impl_->subscribe_to_status(std::move(callback));
}

void ReaderController::subscribe_to_sections(SectionCallback callback) {
    impl_->subscribe_to_sections(std::move(callback));
}

void ReaderController::subscribe_to_interjections(InterjectionCallback callback) {
    impl_->subscribe_to_interjections(std::move(callback));
}

void ReaderController::subscribe_to_feedback(FeedbackCallback callback) {
    impl_->subscribe_to_feedback(std::move(callback));
}

void ReaderController::subscribe_to_telemetry(TelemetryCallback callback) {
    impl_->subscribe_to_telemetry(std::move(callback));
}

void ReaderController::subscribe_to_errors(ErrorCallback callback) {
    impl_->subscribe_to_errors(std::move(callback));
}

void ReaderController::clear_subscriptions() {
    impl_->clear_subscriptions();
}

} // namespace app
