#include "worker_pool.hpp"

#include "log.hpp"

#include <exception>
#include <utility>

namespace termamp {

WorkerPool::WorkerPool(std::size_t thread_count) {
    threads_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (!threads_.empty() && !shutting_down_) {
            jobs_.push_back(std::move(job));
            cv_.notify_one();
            return;
        }
    }
    run_job(job);
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
    }
    cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [&] { return shutting_down_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        run_job(job);
    }
}

void WorkerPool::run_job(Job &job) {
    try {
        job();
    } catch (const std::exception &ex) {
        log_error(std::string("Background job failed: ") + ex.what());
    }
}

}
