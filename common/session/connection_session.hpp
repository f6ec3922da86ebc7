#pragma once

#include "../protocol/commands.hpp"
#include "../types/acknowledgment.hpp"
#include "../types/enums.hpp"
#include "../types/error.hpp"
#include "options.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace probelink {

using AcknowledgmentHandler = std::function<void(const AcknowledgmentFrame&)>;
using StatusHandler = std::function<void(uint8_t level)>;

struct SessionCallbacks {
    std::function<void(ConnectionState)> on_state_changed;

    // Decode failures on notifications and failed status polls
    std::function<void(const Error&)> on_error;
};

// Command channel of a single device.
//
// Disconnected -> Connecting -> Connected -> Subscribed -> Disconnected.
// A link drop reported by the transport forces Disconnected from any state
// and cancels the status poll.
class ConnectionSession {
public:
    ConnectionSession(Transport& transport, Scheduler& scheduler, std::string device_id,
                      SessionCallbacks callbacks = {});

    // Disconnects if still connected
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    Status connect();

    // Informational, state unchanged
    Result<ServiceMap> list_interaction_points();

    // Status-battery value, one byte, not clamped
    Result<uint8_t> read_status();

    // Connected -> Subscribed. Every notification is decoded and passed to
    // on_frame; undecodable ones go to on_error and the subscription stays.
    Status subscribe_acknowledgments(AcknowledgmentHandler on_frame);

    Status send_command(commands::Opcode opcode);

    Status beep() { return send_command(commands::Opcode::Beep); }

    // Subscribe if needed, then send the request. The serial number arrives
    // as an acknowledgment frame through on_frame.
    Status request_serial_number(AcknowledgmentHandler on_frame);

    // Any state -> Disconnected. Success when already disconnected.
    Status disconnect();

    // Read the status value every interval while the link is up. A failed
    // read stops polling and is reported to on_error; the state is kept.
    Status start_status_polling(std::chrono::milliseconds interval, StatusHandler on_status);
    Status start_status_polling(const PollOptions& options, StatusHandler on_status) {
        return start_status_polling(options.interval, std::move(on_status));
    }
    void stop_status_polling();
    bool polling() const { return poll_timer_.armed(); }

    ConnectionState state() const { return state_; }
    const std::string& device_id() const { return device_id_; }

private:
    void set_state(ConnectionState state);
    void handle_link_lost();
    void handle_notification(std::span<const uint8_t> data);
    void report(const Error& error);
    void poll_status();
    Status require_link(const char* operation) const;

    Transport& transport_;
    Scheduler& scheduler_;
    std::string device_id_;
    SessionCallbacks callbacks_;

    ConnectionState state_ = ConnectionState::Disconnected;
    AcknowledgmentHandler on_frame_;
    StatusHandler on_status_;
    Timer poll_timer_;
};

} // namespace probelink
