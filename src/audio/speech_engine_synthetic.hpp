#pragma once

#include "speech_engine.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace audio {

/**
 * @brief Speech engine that simulates speaking time instead of producing audio
 *
 * Features:
 * - Duration = pre-delay + characters / (base rate x voice rate) + post-delay
 * - Honors pause/resume/stop and replacement by a new speak()
 * - time_scale shrinks wall-clock time for fast demos and tests
 * - Optionally logs each utterance so console runs show what would be heard
 */
class SpeechEngine_Synthetic : public ISpeechEngine {
public:
    SpeechEngine_Synthetic();
    ~SpeechEngine_Synthetic() override;

    bool initialize(const SpeechEngineConfig& config, SpeechEngineCallbacks callbacks) override;

    bool speak(const SpeechRequest& request) override;
    bool pause() override;
    bool resume() override;
    void stop() override;
    void set_volume(float volume) override { volume_.store(volume); }
    bool is_speaking() const override;
    SpeechEngineInfo get_engine_info() const override;

    /// Speaking time the simulation uses for a request, in seconds
    double simulated_duration(const SpeechRequest& request) const;

    float current_volume() const { return volume_.load(); }

private:
    void speech_thread_func();

    SpeechEngineConfig config_;
    SpeechEngineCallbacks callbacks_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<SpeechRequest> active_;
    bool started_ = false;
    bool paused_ = false;
    bool should_stop_ = false;
    uint64_t generation_ = 0;

    std::atomic<float> volume_{1.0f};
    std::unique_ptr<std::thread> speech_thread_;
};

} // namespace audio
