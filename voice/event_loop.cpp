#include "voice/event_loop.hpp"
#include "logger.hpp"

#include <exception>
#include <future>

namespace Voice {

EventLoop::EventLoop(std::string name)
    : name_(std::move(name)) {
    thread_ = std::thread([this]() { run(); });
    threadId_ = thread_.get_id();
}

EventLoop::~EventLoop() {
    shutdown();
}

bool EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            LOG_WARN("EventLoop", name_ + ": task posted after shutdown, dropped");
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool EventLoop::isLoopThread() const {
    return std::this_thread::get_id() == threadId_;
}

void EventLoop::flush() {
    if (isLoopThread()) return;

    std::promise<void> done;
    auto fut = done.get_future();
    if (!post([&done]() { done.set_value(); })) {
        return;
    }
    fut.wait();
}

void EventLoop::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable() && !isLoopThread()) {
        thread_.join();
    }
}

void EventLoop::run() {
    setThreadLabel(name_);
    LOG_DEBUG("EventLoop", name_ + " started");

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break; // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop", name_ + ": task threw: " + e.what());
        } catch (...) {
            LOG_ERROR("EventLoop", name_ + ": task threw a non-standard exception");
        }
    }

    LOG_DEBUG("EventLoop", name_ + " stopped");
}

} // namespace Voice
