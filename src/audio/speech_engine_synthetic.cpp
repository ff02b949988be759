#include "speech_engine_synthetic.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <sstream>

namespace audio {

SpeechEngine_Synthetic::SpeechEngine_Synthetic() = default;

SpeechEngine_Synthetic::~SpeechEngine_Synthetic() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_stop_ = true;
        active_.reset();
        ++generation_;
    }
    cv_.notify_all();
    if (speech_thread_ && speech_thread_->joinable()) {
        speech_thread_->join();
    }
}

bool SpeechEngine_Synthetic::initialize(const SpeechEngineConfig& config, SpeechEngineCallbacks callbacks) {
    if (speech_thread_) {
        if (callbacks.on_error) {
            callbacks.on_error(0, "Synthetic engine already initialized", false);
        }
        return false;
    }
    if (config.base_characters_per_second <= 0.0 || config.time_scale < 0.0) {
        if (callbacks.on_error) {
            callbacks.on_error(0, "Synthetic engine needs a positive speaking rate", true);
        }
        return false;
    }

    config_ = config;
    callbacks_ = std::move(callbacks);
    should_stop_ = false;
    speech_thread_ = std::make_unique<std::thread>(&SpeechEngine_Synthetic::speech_thread_func, this);
    return true;
}

bool SpeechEngine_Synthetic::speak(const SpeechRequest& request) {
    bool blank = std::all_of(request.text.begin(), request.text.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!speech_thread_ || should_stop_) {
            return false;
        }
        active_ = request;
        started_ = false;
        paused_ = false;
        ++generation_;
    }
    volume_.store(request.voice.volume);
    cv_.notify_all();
    return true;
}

bool SpeechEngine_Synthetic::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || paused_) {
            return false;
        }
        paused_ = true;
    }
    cv_.notify_all();
    return true;
}

bool SpeechEngine_Synthetic::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || !paused_) {
            return false;
        }
        paused_ = false;
    }
    cv_.notify_all();
    return true;
}

void SpeechEngine_Synthetic::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.reset();
        started_ = false;
        paused_ = false;
        ++generation_;
    }
    cv_.notify_all();
}

bool SpeechEngine_Synthetic::is_speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.has_value();
}

double SpeechEngine_Synthetic::simulated_duration(const SpeechRequest& request) const {
    double rate = std::max(0.1f, request.voice.rate);
    double speaking = static_cast<double>(request.text.size()) / (config_.base_characters_per_second * rate);
    return request.voice.pre_delay_s + speaking + request.voice.post_delay_s;
}

void SpeechEngine_Synthetic::speech_thread_func() {
    using Clock = std::chrono::steady_clock;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!should_stop_) {
        cv_.wait(lock, [this] { return should_stop_ || (active_ && !started_); });
        if (should_stop_) {
            break;
        }

        const SpeechRequest request = *active_;
        const uint64_t generation = generation_;
        started_ = true;

        const double nominal_s = simulated_duration(request);
        auto remaining = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(nominal_s * config_.time_scale));

        lock.unlock();
        if (config_.echo_text) {
            std::ostringstream os;
            os << "[speak " << (request.voice.voice_id.empty() ? "default" : request.voice.voice_id)
               << " x" << request.voice.rate << "] " << request.text;
            core::log_info(os.str());
        }
        if (callbacks_.on_started) {
            callbacks_.on_started(request.id);
        }
        lock.lock();

        bool finished = false;
        while (!should_stop_ && generation == generation_) {
            if (paused_) {
                cv_.wait(lock, [&] { return !paused_ || should_stop_ || generation != generation_; });
                continue;
            }
            const auto deadline = Clock::now() + remaining;
            bool interrupted = cv_.wait_until(lock, deadline, [&] {
                return should_stop_ || generation != generation_ || paused_;
            });
            if (!interrupted) {
                finished = true;
                break;
            }
            if (paused_ && generation == generation_) {
                remaining = std::max(Clock::duration::zero(), deadline - Clock::now());
            }
        }

        if (finished) {
            active_.reset();
            started_ = false;
            lock.unlock();
            if (callbacks_.on_finished) {
                callbacks_.on_finished(request.id, nominal_s);
            }
            lock.lock();
        }
    }
}

SpeechEngineInfo SpeechEngine_Synthetic::get_engine_info() const {
    SpeechEngineInfo info;
    info.id = "synthetic";
    info.name = "Synthetic Speech (timed simulation)";
    info.driver = "Synthetic";
    info.base_characters_per_second = config_.base_characters_per_second;
    info.is_default = true;
    return info;
}

} // namespace audio
