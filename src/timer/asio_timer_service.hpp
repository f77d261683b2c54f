/*
 * asio_timer_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: TimerService backed by a Boost.Asio io_context and one worker

**************************************************/

#ifndef PURELINK_TIMER_ASIO_TIMER_SERVICE_HPP
#define PURELINK_TIMER_ASIO_TIMER_SERVICE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "timer_service.hpp"

namespace purelink::timer {

/**
 * @class AsioTimerService
 * @brief Runs every timer of the process on a single background thread.
 *
 * Timers are armed and cancelled on the io thread; callers only touch the
 * pending map, which decides whether a fired timer still runs its task.
 */
class AsioTimerService : public TimerService {
public:
    AsioTimerService();
    ~AsioTimerService() override;

    AsioTimerService(const AsioTimerService&) = delete;
    AsioTimerService& operator=(const AsioTimerService&) = delete;

    auto schedule(std::chrono::milliseconds delay, Task task)
        -> TimerId override;

    auto cancel(TimerId id) -> bool override;

    [[nodiscard]] auto pendingCount() const -> std::size_t override;

    /**
     * @brief Cancel all pending timers and join the worker thread
     *
     * Safe to call more than once. Tasks scheduled afterwards never run.
     * When called from a task, the worker thread is detached and exits after
     * that task returns; the task must not use the service after stop().
     */
    void stop();

    [[nodiscard]] auto isRunning() const -> bool { return running_.load(); }

private:
    void fire(TimerId id, const Task& task);

    std::shared_ptr<boost::asio::io_context> io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work_;
    std::thread worker_;
    std::atomic<bool> running_{true};
    std::atomic<TimerId> nextId_{1};

    mutable std::mutex mutex_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>>
        pending_;
};

}  // namespace purelink::timer

#endif  // PURELINK_TIMER_ASIO_TIMER_SERVICE_HPP
