#pragma once

#include "../protocol/packets.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace probelink {

struct ScanOptions {
    std::string service_uuid = packets::uuids::PRIMARY_SERVICE;

    // Auto-stop after this long, run until stop() when unset
    std::optional<std::chrono::milliseconds> duration = std::chrono::milliseconds(5000);

    // Re-issue the scan on this interval while idle, to refresh signal strength
    std::optional<std::chrono::milliseconds> refresh_interval;
};

struct PollOptions {
    std::chrono::milliseconds interval{5000};
};

} // namespace probelink
