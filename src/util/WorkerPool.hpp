#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hashflow {

/**
 * @brief Fixed set of worker threads draining a FIFO of jobs
 *
 * Bounds how many file pipelines run at once: a job submitted while every
 * worker is busy waits in the queue. shutdown() stops intake, lets queued
 * jobs run to completion and joins the workers.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /// Starts workerCount threads (0 means 1); throws std::system_error if one cannot start
    explicit WorkerPool(size_t workerCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job; false once shutdown has begun
    bool submit(Job job);

    /// Stop accepting jobs, finish queued ones and join all workers
    void shutdown();

    size_t workerCount() const { return workers.size(); }

    /// Jobs queued but not yet picked up by a worker
    size_t pendingJobs() const;

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<Job> jobs;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool running{true};
};

}
