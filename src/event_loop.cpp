#include "event_loop.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace genstream {

PollEventLoop::PollEventLoop(size_t workers) {
    if (::pipe(wake_pipe_) != 0)
        throw std::runtime_error(std::string("event loop: pipe failed: ") + std::strerror(errno));
    for (int fd : wake_pipe_) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i)
        workers_.emplace_back([this]() { worker_main(); });
}

PollEventLoop::~PollEventLoop() {
    {
        std::lock_guard<std::mutex> lock(work_mutex_);
        workers_stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    if (wake_pipe_[0] >= 0) ::close(wake_pipe_[0]);
    if (wake_pipe_[1] >= 0) ::close(wake_pipe_[1]);
}

void PollEventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    wake();
}

TimerId PollEventLoop::call_later(Millis delay, Task task) {
    TimerId id = next_timer_id_++;
    auto due = Clock::now() + delay;
    timers_.emplace(due, Timer{id, std::move(task)});
    timer_index_[id] = due;
    return id;
}

bool PollEventLoop::cancel(TimerId id) {
    auto idx = timer_index_.find(id);
    if (idx == timer_index_.end()) return false;
    auto range = timers_.equal_range(idx->second);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second.id == id) {
            timers_.erase(it);
            break;
        }
    }
    timer_index_.erase(idx);
    return true;
}

void PollEventLoop::offload(Task work) {
    {
        std::lock_guard<std::mutex> lock(work_mutex_);
        if (workers_stopping_) return;
        work_.push_back(std::move(work));
    }
    work_cv_.notify_one();
}

void PollEventLoop::watch(int fd, short events, IoCallback cb) {
    watches_[fd] = Watch{events, std::move(cb)};
}

void PollEventLoop::unwatch(int fd) {
    watches_.erase(fd);
}

void PollEventLoop::stop() {
    stop_requested_.store(true);
    wake();
}

void PollEventLoop::wake() {
    char b = 1;
    // A full pipe already guarantees a pending wakeup.
    if (::write(wake_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
        std::cerr << "[loop] wake failed: " << std::strerror(errno) << "\n";
    }
}

void PollEventLoop::drain_wake_pipe() {
    char buf[64];
    while (::read(wake_pipe_[0], buf, sizeof(buf)) > 0) {}
}

void PollEventLoop::run_posted() {
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        batch.swap(posted_);
    }
    for (auto& task : batch) task();
}

void PollEventLoop::run_due_timers() {
    auto now = Clock::now();
    // Timers scheduled by a firing timer wait for the next iteration.
    std::vector<Task> due;
    while (!timers_.empty() && timers_.begin()->first <= now) {
        auto it = timers_.begin();
        timer_index_.erase(it->second.id);
        due.push_back(std::move(it->second.task));
        timers_.erase(it);
    }
    for (auto& task : due) task();
}

int PollEventLoop::next_timeout_ms() const {
    if (timers_.empty()) return 1000;
    auto delta = std::chrono::duration_cast<Millis>(timers_.begin()->first - Clock::now());
    if (delta.count() <= 0) return 0;
    return static_cast<int>(std::min<int64_t>(delta.count() + 1, 1000));
}

void PollEventLoop::run() {
    std::vector<pollfd> fds;
    while (!stop_requested_.load()) {
        fds.clear();
        fds.push_back({wake_pipe_[0], POLLIN, 0});
        for (const auto& [fd, w] : watches_) fds.push_back({fd, w.events, 0});

        int ret = ::poll(fds.data(), fds.size(), next_timeout_ms());
        if (ret < 0 && errno != EINTR) {
            std::cerr << "[loop] poll failed: " << std::strerror(errno) << "\n";
            break;
        }

        if (ret > 0) {
            if (fds[0].revents & POLLIN) drain_wake_pipe();
            for (size_t i = 1; i < fds.size(); ++i) {
                if (fds[i].revents == 0) continue;
                // A callback may unwatch other fds; look each one up again.
                auto it = watches_.find(fds[i].fd);
                if (it == watches_.end()) continue;
                IoCallback cb = it->second.cb;
                cb(fds[i].revents);
            }
        }

        run_posted();
        run_due_timers();
    }
    stop_requested_.store(false);
}

void PollEventLoop::worker_main() {
    for (;;) {
        Task work;
        {
            std::unique_lock<std::mutex> lock(work_mutex_);
            work_cv_.wait(lock, [this]() { return workers_stopping_ || !work_.empty(); });
            if (workers_stopping_ && work_.empty()) return;
            work = std::move(work_.front());
            work_.pop_front();
        }
        try {
            work();
        } catch (const std::exception& e) {
            std::cerr << "[loop] offloaded task failed: " << e.what() << "\n";
        }
    }
}

} // namespace genstream
