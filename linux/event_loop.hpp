#pragma once

#include <session/scheduler.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <vector>

namespace loop {

// Single-threaded poll(2) loop: watched fds plus timers
class EventLoop : public probelink::Scheduler {
public:
    using FdHandler = std::function<void(short revents)>;

    // Dispatch handler when fd becomes readable or reports an error
    void watch(int fd, FdHandler handler);
    void unwatch(int fd);

    probelink::TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback,
                                bool repeat) override;
    void cancel(probelink::TimerId id) override;

    // Wait up to max_wait for fd activity or the next timer, then dispatch.
    // Returns false on a poll error.
    bool run_once(std::chrono::milliseconds max_wait);

    // Run until quit()
    void run();
    void quit() { running_ = false; }
    bool running() const { return running_; }

    size_t pending_timers() const { return timers_.size(); }

private:
    using Clock = std::chrono::steady_clock;

    struct TimerEntry {
        Clock::time_point due;
        std::chrono::milliseconds period;
        bool repeat;
        std::function<void()> callback;
    };

    void fire_due_timers();

    std::map<probelink::TimerId, TimerEntry> timers_;
    probelink::TimerId next_id_ = 1;
    std::vector<std::pair<int, FdHandler>> watches_;
    std::atomic<bool> running_{false};
};

} // namespace loop
