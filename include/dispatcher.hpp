#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace termamp {

// Serial task queue for the coordination thread. Tasks may be posted from any
// thread; they run in FIFO order on whichever thread drives run() or
// run_pending(). Delayed tasks become ready once their deadline has passed.
class Dispatcher {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    Dispatcher() = default;
    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    void post(Task task);
    void post_after(std::chrono::milliseconds delay, Task task);

    // Runs the tasks that are ready now and returns how many ran. Tasks
    // posted while running wait for the next call.
    std::size_t run_pending();

    // Calls run_pending() until nothing is ready.
    std::size_t drain();

    // Blocks the calling thread, running tasks until stop() is called.
    void run();
    void stop();

    bool on_dispatch_thread() const;
    std::size_t pending() const;

private:
    struct TimedTask {
        Clock::time_point due;
        std::uint64_t sequence;
        Task task;
    };

    void promote_due_locked(Clock::time_point now);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    std::vector<TimedTask> timed_;
    std::uint64_t sequence_{0};
    bool stop_requested_{false};
    std::thread::id dispatch_thread_{};
};

}
