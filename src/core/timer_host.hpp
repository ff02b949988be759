#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace core {

using TimerId = uint64_t;
constexpr TimerId INVALID_TIMER = 0;

/**
 * @brief Something that can run a task later on the caller's own context
 *
 * Implemented by EventLoop for production use and by a manual clock in tests.
 * Tasks never run concurrently with each other or with other work posted to
 * the same host.
 */
class ITimerHost {
public:
    virtual ~ITimerHost() = default;

    /**
     * @brief Run @p task once after @p delay
     * @return Id for cancel(), never INVALID_TIMER
     */
    virtual TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> task) = 0;

    /**
     * @brief Cancel a pending task. Unknown or already-fired ids are ignored.
     */
    virtual void cancel(TimerId id) = 0;
};

} // namespace core
