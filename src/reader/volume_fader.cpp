#include "reader/volume_fader.hpp"

#include <algorithm>
#include <chrono>

namespace reader {

VolumeFader::~VolumeFader() {
    cancel();
}

void VolumeFader::set_timer_host(core::ITimerHost* timers) {
    cancel();
    timers_ = timers;
}

void VolumeFader::fade(float from, float to, int duration_ms, int steps, ApplyFn apply) {
    cancel();
    if (!apply) return;

    if (!timers_ || steps <= 0 || duration_ms <= 0) {
        apply(to);
        return;
    }

    from_ = from;
    to_ = to;
    step_ = 0;
    steps_ = steps;
    step_ms_ = std::max(1, duration_ms / steps);
    apply_ = std::move(apply);

    apply_(from_);
    schedule_step();
}

void VolumeFader::cancel() {
    ++generation_;
    if (timer_ != core::INVALID_TIMER && timers_) {
        timers_->cancel(timer_);
    }
    timer_ = core::INVALID_TIMER;
}

void VolumeFader::schedule_step() {
    const uint64_t generation = generation_;
    timer_ = timers_->schedule_after(std::chrono::milliseconds(step_ms_), [this, generation]() {
        if (generation != generation_) {
            return;   // superseded
        }
        timer_ = core::INVALID_TIMER;
        ++step_;
        float t = static_cast<float>(step_) / static_cast<float>(steps_);
        apply_(from_ + (to_ - from_) * std::min(t, 1.0f));
        if (step_ < steps_) {
            schedule_step();
        }
    });
}

} // namespace reader
