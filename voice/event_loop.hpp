#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace Voice {

/// EventLoop
/// Single-owner orchestrator thread. Every session state change, every
/// result coming back from a worker and every listener callback runs here,
/// one task at a time, in posting order.
class EventLoop {
public:
    using Task = std::function<void()>;

    explicit EventLoop(std::string name = "loop");
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task. Returns false (task dropped) once shutdown has begun.
    bool post(Task task);

    /// True when called from the loop thread itself.
    bool isLoopThread() const;

    /// Block until every task posted before this call has run.
    /// Runs nothing and returns immediately when called from the loop thread.
    void flush();

    /// Run the remaining queue, then stop and join the thread. Idempotent.
    void shutdown();

private:
    void run();

    std::string name_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::thread thread_;
    std::thread::id threadId_;
};

} // namespace Voice
