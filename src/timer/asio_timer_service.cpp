/*
 * asio_timer_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "asio_timer_service.hpp"

#include <functional>

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

namespace purelink::timer {

AsioTimerService::AsioTimerService()
    : io_(std::make_shared<boost::asio::io_context>()),
      work_(boost::asio::make_work_guard(*io_)) {
    // The worker keeps its own reference to the io_context and never touches
    // this object, so the service may be destroyed from one of its tasks.
    worker_ = std::thread([io = io_] {
        spdlog::debug("Timer worker started [Thread ID: {}]",
                      std::hash<std::thread::id>{}(std::this_thread::get_id()));
        io->run();
        spdlog::debug("Timer worker terminated");
    });
}

AsioTimerService::~AsioTimerService() { stop(); }

auto AsioTimerService::schedule(std::chrono::milliseconds delay, Task task)
    -> TimerId {
    const TimerId id = nextId_.fetch_add(1);

    std::lock_guard lock(mutex_);
    if (!running_.load()) {
        spdlog::warn("Timer service stopped; dropping timer {}", id);
        return id;
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(*io_);
    pending_.emplace(id, timer);

    // Armed on the io thread so a later cancel() can never race async_wait.
    boost::asio::post(*io_, [this, id, delay, timer, task = std::move(task)] {
        timer->expires_after(delay);
        timer->async_wait(
            [this, id, task](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                fire(id, task);
            });
    });
    return id;
}

auto AsioTimerService::cancel(TimerId id) -> bool {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    auto timer = it->second;
    pending_.erase(it);
    boost::asio::post(*io_, [timer] { timer->cancel(); });
    return true;
}

auto AsioTimerService::pendingCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

void AsioTimerService::fire(TimerId id, const Task& task) {
    {
        std::lock_guard lock(mutex_);
        if (pending_.erase(id) == 0) {
            // Cancelled after expiry but before the handler ran.
            return;
        }
    }

    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Timer {} task failed: {}", id, e.what());
    }
}

void AsioTimerService::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        pending_.clear();
    }

    work_.reset();
    io_->stop();

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            // Stopped from a task; run() returns once that task finishes.
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    spdlog::debug("Timer service stopped");
}

}  // namespace purelink::timer
