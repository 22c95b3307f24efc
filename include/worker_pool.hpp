#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace termamp {

// Background threads for blocking work (decoder open, folder scans, playlist
// files). With zero threads, jobs run inline on the submitting thread.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void submit(Job job);

    // Finishes queued jobs and joins the threads. Later submissions run inline.
    void shutdown();

    std::size_t thread_count() const noexcept { return threads_.size(); }

private:
    void worker_loop();
    static void run_job(Job &job);

    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool shutting_down_{false};
};

}
