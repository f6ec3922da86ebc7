#pragma once

#include <session/scheduler.hpp>

#include <chrono>
#include <functional>
#include <map>

namespace probelink::fakes {

// Scheduler driven by advance() instead of a clock
class ManualScheduler : public Scheduler {
public:
    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback,
                     bool repeat) override {
        TimerId id = next_id_++;
        timers_.emplace(id, Entry{now_ + delay, delay, repeat, std::move(callback)});
        return id;
    }

    void cancel(TimerId id) override {
        timers_.erase(id);
    }

    // Move time forward, firing due timers in deadline order
    void advance(std::chrono::milliseconds delta) {
        auto target = now_ + delta;
        while (true) {
            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.due <= target &&
                    (next == timers_.end() || it->second.due < next->second.due)) {
                    next = it;
                }
            }
            if (next == timers_.end()) break;

            now_ = next->second.due;
            std::function<void()> callback;
            if (next->second.repeat) {
                next->second.due += next->second.period;
                callback = next->second.callback;
            } else {
                callback = std::move(next->second.callback);
                timers_.erase(next);
            }
            callback();
        }
        now_ = target;
    }

    size_t pending() const { return timers_.size(); }
    std::chrono::milliseconds now() const { return now_; }

private:
    struct Entry {
        std::chrono::milliseconds due;
        std::chrono::milliseconds period;
        bool repeat;
        std::function<void()> callback;
    };

    std::map<TimerId, Entry> timers_;
    TimerId next_id_ = 1;
    std::chrono::milliseconds now_{0};
};

} // namespace probelink::fakes
