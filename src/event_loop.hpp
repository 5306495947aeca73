#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace genstream {

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;
using Task = std::function<void()>;
using TimerId = uint64_t;

// Single-threaded reactor. All component state is mutated from tasks running
// on the loop thread; only post() and offload() may be called from elsewhere.
class EventLoop {
public:
    virtual ~EventLoop() = default;

    virtual Clock::time_point now() const = 0;

    // Queue a task for the loop thread. Thread-safe.
    virtual void post(Task task) = 0;

    // Run task once after delay. Returns an id usable with cancel().
    virtual TimerId call_later(Millis delay, Task task) = 0;

    // Cancel a pending timer. Unknown or already-fired ids are a no-op;
    // returns true only if a pending timer was removed.
    virtual bool cancel(TimerId id) = 0;

    // Run blocking work off the loop thread. The work reports back by post().
    virtual void offload(Task work) = 0;

    // fd readiness callbacks (poll(2) event mask), invoked on the loop thread.
    using IoCallback = std::function<void(short revents)>;
    virtual void watch(int fd, short events, IoCallback cb) = 0;
    virtual void unwatch(int fd) = 0;
};

// poll(2)-based loop with a self-pipe wakeup and a small worker pool for
// offloaded blocking calls.
class PollEventLoop : public EventLoop {
public:
    explicit PollEventLoop(size_t workers = 2);
    ~PollEventLoop() override;

    PollEventLoop(const PollEventLoop&) = delete;
    PollEventLoop& operator=(const PollEventLoop&) = delete;

    Clock::time_point now() const override { return Clock::now(); }
    void post(Task task) override;
    TimerId call_later(Millis delay, Task task) override;
    bool cancel(TimerId id) override;
    void offload(Task work) override;
    void watch(int fd, short events, IoCallback cb) override;
    void unwatch(int fd) override;

    // Run until stop(). Must be called from the thread that owns the loop.
    void run();

    // Thread-safe; run() returns after the current iteration. A stop that
    // arrives before run() makes the next run() return immediately.
    void stop();

private:
    void wake();
    void drain_wake_pipe();
    void run_posted();
    void run_due_timers();
    int next_timeout_ms() const;
    void worker_main();

    int wake_pipe_[2] = {-1, -1};
    std::atomic<bool> stop_requested_{false};

    std::mutex post_mutex_;
    std::vector<Task> posted_;

    struct Timer {
        TimerId id;
        Task task;
    };
    std::multimap<Clock::time_point, Timer> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_index_;
    TimerId next_timer_id_ = 1;

    struct Watch {
        short events;
        IoCallback cb;
    };
    std::map<int, Watch> watches_;

    std::mutex work_mutex_;
    std::condition_variable work_cv_;
    std::deque<Task> work_;
    bool workers_stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace genstream
