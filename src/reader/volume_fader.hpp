#pragma once

#include <cstdint>
#include <functional>

#include "core/timer_host.hpp"

namespace reader {

// Steps a volume from one level to another on a timer host.
// Starting a fade cancels the previous one; a late tick from a cancelled fade is ignored.
class VolumeFader {
public:
    using ApplyFn = std::function<void(float volume)>;

    explicit VolumeFader(core::ITimerHost* timers = nullptr) : timers_(timers) {}
    ~VolumeFader();

    VolumeFader(const VolumeFader&) = delete;
    VolumeFader& operator=(const VolumeFader&) = delete;

    void set_timer_host(core::ITimerHost* timers);

    // Applies @p from immediately, then reaches @p to after @p duration_ms in @p steps ticks.
    // Without a timer host the target is applied at once.
    void fade(float from, float to, int duration_ms, int steps, ApplyFn apply);

    void cancel();
    bool is_fading() const { return timer_ != core::INVALID_TIMER; }

private:
    void schedule_step();

    core::ITimerHost* timers_;
    core::TimerId timer_ = core::INVALID_TIMER;
    uint64_t generation_ = 0;

    float from_ = 0.0f;
    float to_ = 0.0f;
    int step_ = 0;
    int steps_ = 0;
    int step_ms_ = 0;
    ApplyFn apply_;
};

} // namespace reader
