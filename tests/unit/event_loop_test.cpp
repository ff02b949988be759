#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/event_loop.hpp"
#include "reader/volume_fader.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

// Blocks until everything posted so far has run
static void drain(core::EventLoop& loop) {
    std::promise<void> done;
    auto f = done.get_future();
    assert(loop.post([&done]() { done.set_value(); }));
    assert(f.wait_for(2s) == std::future_status::ready);
}

static void test_tasks_run_in_post_order() {
    core::EventLoop loop;
    assert(!loop.post([]() {}));   // not started
    assert(loop.start());
    assert(loop.is_running());
    assert(!loop.is_loop_thread());

    std::vector<int> order;
    std::atomic<bool> on_loop{false};
    for (int i = 0; i < 50; ++i) {
        loop.post([&order, i]() { order.push_back(i); });
    }
    loop.post([&]() { on_loop = loop.is_loop_thread(); });
    drain(loop);

    assert(order.size() == 50);
    for (int i = 0; i < 50; ++i) assert(order[i] == i);
    assert(on_loop.load());

    loop.stop();
    assert(!loop.is_running());
    assert(!loop.post([]() {}));
}

static void test_throwing_task_does_not_kill_loop() {
    core::EventLoop loop;
    loop.start();
    loop.post([]() { throw std::runtime_error("boom"); });
    bool ran = false;
    loop.post([&ran]() { ran = true; });
    drain(loop);
    assert(ran);
}

static void test_timers_fire_in_due_order() {
    core::EventLoop loop;
    loop.start();

    std::mutex m;
    std::vector<int> fired;
    std::promise<void> last;
    auto f = last.get_future();
    loop.schedule_after(60ms, [&]() {
        std::lock_guard<std::mutex> lock(m);
        fired.push_back(3);
        last.set_value();
    });
    loop.schedule_after(20ms, [&]() { std::lock_guard<std::mutex> lock(m); fired.push_back(1); });
    loop.schedule_after(40ms, [&]() { std::lock_guard<std::mutex> lock(m); fired.push_back(2); });
    assert(f.wait_for(2s) == std::future_status::ready);

    std::lock_guard<std::mutex> lock(m);
    assert((fired == std::vector<int>{1, 2, 3}));
}

static void test_cancelled_timer_never_fires() {
    core::EventLoop loop;
    loop.start();

    std::atomic<int> hits{0};
    core::TimerId id = loop.schedule_after(30ms, [&hits]() { ++hits; });
    assert(id != core::INVALID_TIMER);
    assert(loop.pending_timers() == 1);
    loop.cancel(id);
    assert(loop.pending_timers() == 0);
    loop.cancel(id);   // twice is harmless

    std::this_thread::sleep_for(80ms);
    drain(loop);
    assert(hits.load() == 0);
}

static void test_stop_drops_timers_but_runs_tasks() {
    core::EventLoop loop;
    loop.start();
    std::atomic<int> timer_hits{0};
    std::atomic<int> task_hits{0};
    loop.schedule_after(5s, [&timer_hits]() { ++timer_hits; });
    loop.post([&task_hits]() {
        std::this_thread::sleep_for(20ms);
        ++task_hits;
    });
    loop.post([&task_hits]() { ++task_hits; });
    loop.stop();
    assert(task_hits.load() == 2);
    assert(timer_hits.load() == 0);
    assert(loop.pending_timers() == 0);
}

static void test_fader_steps_to_target() {
    test::ManualTimerHost timers;
    reader::VolumeFader fader(&timers);
    std::vector<float> applied;
    fader.fade(0.0f, 1.0f, 100, 4, [&applied](float v) { applied.push_back(v); });
    assert(applied.size() == 1 && applied[0] == 0.0f);
    assert(fader.is_fading());

    timers.advance(50);
    assert(applied.size() == 3);
    assert(applied[1] > 0.2f && applied[1] < 0.3f);
    timers.advance(50);
    assert(applied.size() == 5);
    assert(applied.back() == 1.0f);
    assert(!fader.is_fading());
    assert(timers.pending() == 0);
}

static void test_new_fade_supersedes_old() {
    test::ManualTimerHost timers;
    reader::VolumeFader fader(&timers);
    float first = -1.0f;
    float second = -1.0f;
    fader.fade(0.0f, 1.0f, 100, 4, [&first](float v) { first = v; });
    timers.advance(25);
    fader.fade(1.0f, 0.5f, 100, 2, [&second](float v) { second = v; });
    const float first_at_switch = first;
    timers.advance(200);
    assert(first == first_at_switch);
    assert(second == 0.5f);

    // No timer host: jump straight to the target
    reader::VolumeFader immediate;
    float v = 0.0f;
    immediate.fade(0.0f, 0.7f, 300, 6, [&v](float x) { v = x; });
    assert(v == 0.7f);
    assert(!immediate.is_fading());
}

int main() {
    test_tasks_run_in_post_order();
    test_throwing_task_does_not_kill_loop();
    test_timers_fire_in_due_order();
    test_cancelled_timer_never_fires();
    test_stop_drops_timers_but_runs_tasks();
    test_fader_steps_to_target();
    test_new_fade_supersedes_old();
    return 0;
}
