#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Voice {

/// WorkerPool
/// Fixed number of named threads draining a FIFO of move-only jobs.
/// shutdown() stops intake, drops queued jobs (their futures become
/// broken promises) and joins every thread. Concurrent callers block
/// until the join has finished.
class WorkerPool {
public:
    WorkerPool(std::string name, std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job. Returns an invalid future if the pool is shut down.
    template <typename F>
    std::future<void> submit(F&& job) {
        std::packaged_task<void()> task(std::forward<F>(job));
        auto fut = task.get_future();
        if (!enqueue(std::move(task))) {
            return {};
        }
        return fut;
    }

    void shutdown();

    const std::string& name() const { return name_; }
    std::size_t size() const;
    std::size_t pending() const;

private:
    bool enqueue(std::packaged_task<void()> task);
    void workerMain(std::size_t index, std::size_t count);

    std::string name_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> jobs_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
    std::mutex joinMtx_; // held while the first shutdown() joins
};

} // namespace Voice
