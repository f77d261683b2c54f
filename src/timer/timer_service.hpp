/*
 * timer_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Abstract one-shot timer scheduling with explicit cancellation

**************************************************/

#ifndef PURELINK_TIMER_TIMER_SERVICE_HPP
#define PURELINK_TIMER_TIMER_SERVICE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace purelink::timer {

using TimerId = std::uint64_t;

/**
 * @class TimerService
 * @brief Runs one-shot tasks after a delay on the service's own context.
 *
 * Every scheduled task is identified by a TimerId. Once cancel() returned
 * true for an id, the task is guaranteed never to run.
 */
class TimerService {
public:
    using Task = std::function<void()>;

    virtual ~TimerService() = default;

    /**
     * @brief Schedule a task to run once after a delay
     * @param delay Time to wait before running the task
     * @param task Callable to run
     * @return Identifier usable with cancel()
     */
    virtual auto schedule(std::chrono::milliseconds delay, Task task)
        -> TimerId = 0;

    /**
     * @brief Cancel a pending task
     * @param id Identifier returned by schedule()
     * @return true if the task was still pending and is now cancelled
     */
    virtual auto cancel(TimerId id) -> bool = 0;

    /**
     * @brief Number of tasks that are scheduled and have not fired yet
     */
    [[nodiscard]] virtual auto pendingCount() const -> std::size_t = 0;
};

}  // namespace purelink::timer

#endif  // PURELINK_TIMER_TIMER_SERVICE_HPP
