#include "util/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace photodb::util {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4; // Fallback
    }

    Logger::debug("WorkerPool: Initializing with " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug("WorkerPool: Shutdown complete");
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        job_queue_.push(std::move(job));
        ++in_flight_;
    }

    cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return in_flight_ == 0;
    });
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return in_flight_;
}

void WorkerPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            // Drain remaining jobs before honouring stop
            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        // Execute job outside the lock
        try {
            if (job) job();
        } catch (const std::exception& e) {
            Logger::error("WorkerPool: job threw: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
            if (in_flight_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace photodb::util
