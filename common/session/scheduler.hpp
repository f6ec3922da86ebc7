#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace probelink {

using TimerId = uint64_t;
constexpr TimerId INVALID_TIMER = 0;

// Timer source driven by the owner's event loop
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Run callback after delay, then every delay if repeat is set
    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback,
                             bool repeat) = 0;

    // Unknown or already fired ids are ignored
    virtual void cancel(TimerId id) = 0;
};

// Owning handle, cancels the timer when reset or destroyed
class Timer {
public:
    Timer() = default;
    Timer(Scheduler* scheduler, TimerId id) : scheduler_(scheduler), id_(id) {}

    Timer(Timer&& other) noexcept : scheduler_(other.scheduler_), id_(other.id_) {
        other.id_ = INVALID_TIMER;
    }

    Timer& operator=(Timer&& other) noexcept {
        if (this != &other) {
            cancel();
            scheduler_ = other.scheduler_;
            id_ = other.id_;
            other.id_ = INVALID_TIMER;
        }
        return *this;
    }

    ~Timer() { cancel(); }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void cancel() {
        if (scheduler_ && id_ != INVALID_TIMER) {
            scheduler_->cancel(id_);
        }
        id_ = INVALID_TIMER;
    }

    bool armed() const { return id_ != INVALID_TIMER; }

private:
    Scheduler* scheduler_ = nullptr;
    TimerId id_ = INVALID_TIMER;
};

} // namespace probelink
