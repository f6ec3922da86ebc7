#include "event_loop.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace loop {

void EventLoop::watch(int fd, FdHandler handler) {
    unwatch(fd);
    watches_.emplace_back(fd, std::move(handler));
}

void EventLoop::unwatch(int fd) {
    watches_.erase(std::remove_if(watches_.begin(), watches_.end(),
                                  [fd](const auto& w) { return w.first == fd; }),
                   watches_.end());
}

probelink::TimerId EventLoop::schedule(std::chrono::milliseconds delay,
                                       std::function<void()> callback, bool repeat) {
    probelink::TimerId id = next_id_++;
    timers_.emplace(id, TimerEntry{Clock::now() + delay, delay, repeat, std::move(callback)});
    return id;
}

void EventLoop::cancel(probelink::TimerId id) {
    timers_.erase(id);
}

void EventLoop::fire_due_timers() {
    auto now = Clock::now();

    std::vector<probelink::TimerId> due;
    for (const auto& [id, entry] : timers_) {
        if (entry.due <= now) due.push_back(id);
    }

    for (auto id : due) {
        // An earlier callback may have cancelled it
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;

        std::function<void()> callback;
        if (it->second.repeat) {
            it->second.due = now + it->second.period;
            callback = it->second.callback;
        } else {
            callback = std::move(it->second.callback);
            timers_.erase(it);
        }
        callback();
    }
}

bool EventLoop::run_once(std::chrono::milliseconds max_wait) {
    auto timeout = max_wait;
    auto now = Clock::now();
    for (const auto& [id, entry] : timers_) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(entry.due - now);
        timeout = std::max(std::chrono::milliseconds(0), std::min(timeout, until));
    }

    std::vector<pollfd> fds;
    fds.reserve(watches_.size());
    for (const auto& [fd, handler] : watches_) {
        pollfd pfd = {};
        pfd.fd = fd;
        pfd.events = POLLIN;
        fds.push_back(pfd);
    }

    int ret = poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
    if (ret < 0) {
        if (errno == EINTR) return true;
        std::cerr << "loop: poll error: " << strerror(errno) << std::endl;
        return false;
    }

    if (ret > 0) {
        // Handlers may change the watch list
        auto watches = watches_;
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents & (POLLIN | POLLERR | POLLHUP)) {
                watches[i].second(fds[i].revents);
            }
        }
    }

    fire_due_timers();
    return true;
}

void EventLoop::run() {
    running_ = true;
    while (running_) {
        if (!run_once(std::chrono::milliseconds(100))) {
            break;
        }
    }
    running_ = false;
}

} // namespace loop
