#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace photodb::util {

// Fixed-size thread pool with a completion barrier.
// The synchronizer submits one directory's files, then calls wait_idle()
// before it commits that directory's watermark.
class WorkerPool {
public:
    using Job = std::function<void()>;

    // num_threads == 0 picks hardware_concurrency (fallback 4)
    explicit WorkerPool(size_t num_threads);

    // Destructor drains the queue and joins all workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a job. Returns false once shutdown has begun.
    [[nodiscard]] bool submit(Job job);

    // Block until every submitted job has finished running
    void wait_idle();

    [[nodiscard]] size_t thread_count() const { return workers_.size(); }
    [[nodiscard]] size_t pending() const;

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;        // Signals workers: job available or stop
    std::condition_variable idle_cv_;   // Signals waiters: in-flight count reached zero

    size_t in_flight_ = 0;  // Queued + running, guarded by queue_mutex_
    std::atomic<bool> stop_{false};
};

} // namespace photodb::util
