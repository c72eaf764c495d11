/**
 * Event Loop - implementation
 */

#include "event_loop.hpp"

#include <utility>

namespace tritpow {
namespace engine {

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

bool EventLoop::pop(Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty()) return false;
    task = std::move(tasks_.front());
    tasks_.pop();
    return true;
}

bool EventLoop::run_one() {
    Task task;
    if (!pop(task)) return false;
    task();
    return true;
}

size_t EventLoop::poll() {
    size_t count = 0;
    while (run_one()) {
        count++;
    }
    return count;
}

bool EventLoop::run_until(const std::function<bool()>& done) {
    while (!done()) {
        if (!run_one()) break;
    }
    return done();
}

void EventLoop::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_) {
                // Consumed here, so the next run() blocks again
                stop_ = false;
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace engine
}  // namespace tritpow
