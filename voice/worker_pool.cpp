#include "voice/worker_pool.hpp"
#include "logger.hpp"

#include <algorithm>

namespace Voice {

WorkerPool::WorkerPool(std::string name, std::size_t threads)
    : name_(std::move(name)) {
    threads = std::max<std::size_t>(threads, 1);
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; i++) {
        threads_.emplace_back([this, i, threads]() { workerMain(i, threads); });
    }
    LOG_DEBUG("WorkerPool", name_ + " started with " + std::to_string(threads) + " thread(s)");
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::enqueue(std::packaged_task<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            LOG_WARN("WorkerPool", name_ + ": job submitted after shutdown, dropped");
            return false;
        }
        jobs_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

std::size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return threads_.size();
}

void WorkerPool::shutdown() {
    std::lock_guard<std::mutex> joinLock(joinMtx_);

    std::deque<std::packaged_task<void()>> dropped;
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (threads_.empty()) return; // already joined
        stopping_ = true;
        dropped.swap(jobs_);
        threads.swap(threads_);
    }
    cv_.notify_all();

    if (!dropped.empty()) {
        LOG_WARN("WorkerPool", name_ + ": dropped " + std::to_string(dropped.size()) +
                               " queued job(s) at shutdown");
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    LOG_DEBUG("WorkerPool", name_ + " stopped");
}

void WorkerPool::workerMain(std::size_t index, std::size_t count) {
    setThreadLabel(count > 1 ? name_ + "-" + std::to_string(index) : name_);

    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_) break;
            task = std::move(jobs_.front());
            jobs_.pop_front();
        }
        // packaged_task stores any exception in the job's future
        task();
    }
}

} // namespace Voice
