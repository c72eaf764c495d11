/**
 * Event Loop
 *
 * Single-threaded cooperative scheduler. The search engine posts one task per
 * round; between tasks the host is free to queue requests, interrupt or
 * resume. Tasks run on the thread that calls run_one()/poll()/run().
 *
 * post() may be called from any thread.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace tritpow {
namespace engine {

class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * Queue a task behind everything already posted.
     */
    void post(Task task);

    /**
     * Run the oldest pending task. Returns false if none was pending.
     */
    bool run_one();

    /**
     * Run tasks until the queue is empty (including tasks they post).
     * Returns the number of tasks run.
     */
    size_t poll();

    /**
     * Run tasks until `done()` holds or the queue drains.
     * Returns done().
     */
    bool run_until(const std::function<bool()>& done);

    /**
     * Block, running tasks as they arrive, until stop() is called.
     */
    void run();

    /**
     * Make run() return after the current task. A stop() issued while run()
     * is not running makes the next run() return before any task.
     */
    void stop();

    size_t pending() const;

private:
    bool pop(Task& task);

    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

}  // namespace engine
}  // namespace tritpow
