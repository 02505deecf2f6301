// include/telemetrydeck/executor.hpp
// Task executors backing fire-and-forget delivery.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace telemetrydeck {

// Runs detached units of work. spawn() never waits for the task.
class Executor {
public:
    using Task = std::function<void()>;

    virtual ~Executor() = default;

    virtual void spawn(Task task) = 0;
};

// Background thread pool for natively threaded hosts.
//
// Workers start in the constructor. Tasks run in FIFO order; when the queue is
// full the oldest pending task is dropped. shutdown() runs what is already
// queued, then joins the workers; tasks spawned afterwards are discarded.
class ThreadPoolExecutor : public Executor {
public:
    // Throws TelemetryDeckError if threads is zero.
    explicit ThreadPoolExecutor(size_t threads = DEFAULT_THREADS);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void spawn(Task task) override;

    void shutdown();

    size_t pending() const;
    size_t thread_count() const;

    static constexpr size_t DEFAULT_THREADS = 2;
    static constexpr size_t MAX_QUEUE_SIZE = 10000;

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{true};
};

// Cooperative task queue for single-threaded hosts.
//
// spawn() only enqueues. The host drives the loop from its own turns with
// run_once() or run_until_idle(); a loop that is never pumped holds at most
// MAX_QUEUE_SIZE tasks, dropping the oldest. Not thread-safe: every call must
// come from the host thread.
class EventLoop : public Executor {
public:
    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void spawn(Task task) override;

    // Run the oldest pending task. Returns false if there was none.
    // An exception thrown by the task propagates to the caller.
    bool run_once();

    // Run tasks until the queue is empty, including tasks spawned meanwhile.
    // Returns the number of tasks run.
    size_t run_until_idle();

    size_t pending() const noexcept { return queue_.size(); }

    static constexpr size_t MAX_QUEUE_SIZE = ThreadPoolExecutor::MAX_QUEUE_SIZE;

private:
    std::deque<Task> queue_;
};

// Process-wide loop used as the default executor on cooperative hosts. The
// host must pump it for fire-and-forget sends to go out.
std::shared_ptr<EventLoop> host_event_loop();

// Process-wide executor for the current build environment: a running
// ThreadPoolExecutor, or host_event_loop() when built with
// TELEMETRYDECK_COOPERATIVE_HOST.
std::shared_ptr<Executor> default_executor();

} // namespace telemetrydeck
