#pragma once

#include "../types/device.hpp"
#include "../types/enums.hpp"
#include "../types/error.hpp"
#include "options.hpp"
#include "registry.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace probelink {

// Delivered for every advertisement applied during a scan
struct ScanEvent {
    DeviceRecord device;                 // registry state after the update
    std::optional<Error> decode_error;   // payload present but undecodable
};

struct ScanCallbacks {
    std::function<void(const ScanEvent&)> on_device;
    std::function<void()> on_stopped;
};

// One logical discovery operation feeding a DeviceRegistry
class ScanSession {
public:
    ScanSession(Transport& transport, Scheduler& scheduler, DeviceRegistry& registry);
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    // Clear the registry and start delivering advertisements for service_uuid.
    // Fails with InvalidState while already active.
    Status start(const std::string& service_uuid, ScanCallbacks callbacks,
                 std::optional<std::chrono::milliseconds> duration = std::nullopt);

    // Same, taking filter, duration and refresh interval from options
    Status start(const ScanOptions& options, ScanCallbacks callbacks);

    // Idle afterwards even if the stack reports a failure. Also disables
    // periodic refresh. No-op success when idle.
    Status stop();

    // Re-issue the last scan without clearing the registry. No-op while active.
    Status refresh();

    // Call refresh() every interval until disable_refresh(), stop() or destruction
    void enable_refresh(std::chrono::milliseconds interval);
    void disable_refresh();

    ScanState state() const { return state_; }
    bool active() const { return state_ == ScanState::Active; }

private:
    Status begin();
    Status end_scan();
    void handle_advertisement(const Advertisement& adv);

    Transport& transport_;
    Scheduler& scheduler_;
    DeviceRegistry& registry_;

    ScanState state_ = ScanState::Idle;
    std::optional<std::string> service_uuid_;
    std::optional<std::chrono::milliseconds> duration_;
    ScanCallbacks callbacks_;

    Timer auto_stop_;
    Timer refresh_;
};

} // namespace probelink
