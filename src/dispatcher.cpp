#include "dispatcher.hpp"

#include "log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace termamp {

namespace {

bool later_first(const auto &a, const auto &b) {
    if (a.due != b.due) {
        return a.due > b.due;
    }
    return a.sequence > b.sequence;
}

}

void Dispatcher::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void Dispatcher::post_after(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard lock(mutex_);
        timed_.push_back(TimedTask{Clock::now() + delay, sequence_++, std::move(task)});
        std::push_heap(timed_.begin(), timed_.end(), [](const TimedTask &a, const TimedTask &b) {
            return later_first(a, b);
        });
    }
    cv_.notify_one();
}

void Dispatcher::promote_due_locked(Clock::time_point now) {
    auto cmp = [](const TimedTask &a, const TimedTask &b) { return later_first(a, b); };
    while (!timed_.empty() && timed_.front().due <= now) {
        std::pop_heap(timed_.begin(), timed_.end(), cmp);
        ready_.push_back(std::move(timed_.back().task));
        timed_.pop_back();
    }
}

std::size_t Dispatcher::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        if (dispatch_thread_ == std::thread::id{}) {
            dispatch_thread_ = std::this_thread::get_id();
        }
        promote_due_locked(Clock::now());
        batch.swap(ready_);
    }

    for (auto &task : batch) {
        try {
            task();
        } catch (const std::exception &ex) {
            log_error(std::string("Unhandled error in coordination task: ") + ex.what());
        }
    }
    return batch.size();
}

std::size_t Dispatcher::drain() {
    std::size_t total = 0;
    while (std::size_t ran = run_pending()) {
        total += ran;
    }
    return total;
}

void Dispatcher::run() {
    {
        std::lock_guard lock(mutex_);
        dispatch_thread_ = std::this_thread::get_id();
    }

    while (true) {
        {
            std::unique_lock lock(mutex_);
            while (!stop_requested_ && ready_.empty()) {
                if (timed_.empty()) {
                    cv_.wait(lock);
                } else if (cv_.wait_until(lock, timed_.front().due) == std::cv_status::timeout) {
                    break;
                }
            }
            if (stop_requested_) {
                break;
            }
        }
        run_pending();
    }
}

void Dispatcher::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

bool Dispatcher::on_dispatch_thread() const {
    std::lock_guard lock(mutex_);
    return dispatch_thread_ == std::this_thread::get_id();
}

std::size_t Dispatcher::pending() const {
    std::lock_guard lock(mutex_);
    return ready_.size() + timed_.size();
}

}
