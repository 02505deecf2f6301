// src/executor.cpp
// Thread pool and cooperative event loop.

#include "telemetrydeck/executor.hpp"
#include "telemetrydeck/error.hpp"
#include "logging.hpp"

#include <exception>

namespace telemetrydeck {

// --- ThreadPoolExecutor ---

ThreadPoolExecutor::ThreadPoolExecutor(size_t threads) {
    if (threads == 0) {
        throw TelemetryDeckError::configuration("thread pool needs at least one thread");
    }
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        threads_.emplace_back(&ThreadPoolExecutor::run, this);
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

void ThreadPoolExecutor::spawn(Task task) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            TELEMETRYDECK_LOG_DEBUG("task discarded after shutdown");
            return;
        }
        if (queue_.size() >= MAX_QUEUE_SIZE) {
            // Drop oldest
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();

    if (dropped) {
        TELEMETRYDECK_LOG_DEBUG("executor queue full, dropped oldest task",
            {logging::int_field("capacity", static_cast<int64_t>(MAX_QUEUE_SIZE))});
    }
}

void ThreadPoolExecutor::shutdown() {
    // Workers are taken out under the lock, so a concurrent caller finds
    // nothing left to join.
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        workers.swap(threads_);
    }
    cv_.notify_all();

    for (auto& t : workers) {
        if (!t.joinable()) continue;
        // A task that shuts down its own pool cannot join itself.
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }
}

size_t ThreadPoolExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ThreadPoolExecutor::thread_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

void ThreadPoolExecutor::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            // Stopped and drained
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            TELEMETRYDECK_LOG_WARN("executor task failed",
                {logging::string_field("error", e.what())});
        }
    }
}

// --- EventLoop ---

void EventLoop::spawn(Task task) {
    if (queue_.size() >= MAX_QUEUE_SIZE) {
        // Drop oldest
        queue_.pop_front();
        TELEMETRYDECK_LOG_DEBUG("event loop queue full, dropped oldest task",
            {logging::int_field("capacity", static_cast<int64_t>(MAX_QUEUE_SIZE))});
    }
    queue_.push_back(std::move(task));
}

bool EventLoop::run_once() {
    if (queue_.empty()) return false;
    Task task = std::move(queue_.front());
    queue_.pop_front();
    task();
    return true;
}

size_t EventLoop::run_until_idle() {
    size_t count = 0;
    while (run_once()) {
        count++;
    }
    return count;
}

// --- Process-wide executors ---

std::shared_ptr<EventLoop> host_event_loop() {
    static auto* loop = new std::shared_ptr<EventLoop>(std::make_shared<EventLoop>());
    return *loop;
}

std::shared_ptr<Executor> default_executor() {
#if defined(TELEMETRYDECK_COOPERATIVE_HOST)
    return host_event_loop();
#else
    // Never destroyed: detached sends still queued at process exit are lost,
    // not waited for.
    static auto* pool = new std::shared_ptr<ThreadPoolExecutor>(
        std::make_shared<ThreadPoolExecutor>());
    return *pool;
#endif
}

} // namespace telemetrydeck
