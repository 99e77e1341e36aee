#include "util/WorkerPool.hpp"

#include <exception>
#include <string>
#include <system_error>

#include "util/Logger.hpp"

namespace hashflow {

WorkerPool::WorkerPool(size_t workerCount) {
    if (workerCount == 0) workerCount = 1;
    workers.reserve(workerCount);
    try {
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(&WorkerPool::workerLoop, this);
        }
    } catch (const std::system_error& e) {
        // Join what already started; a joinable thread must not be destroyed
        Logger::instance().error(std::string("worker start failed: ") + e.what());
        shutdown();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::scoped_lock lock(mtx);
        if (!running) return false;
        jobs.push(std::move(job));
    }
    cv.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mtx);
        if (!running && workers.empty()) return;
        running = false;
    }
    cv.notify_all();

    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    workers.clear();
}

size_t WorkerPool::pendingJobs() const {
    std::scoped_lock lock(mtx);
    return jobs.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait(lock, [this] { return !jobs.empty() || !running; });

            if (!running && jobs.empty()) {
                return;
            }

            job = std::move(jobs.front());
            jobs.pop();
        }

        // Run outside the lock
        try {
            job();
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("worker job failed: ") + e.what());
        }
    }
}

}
