#include "connection_session.hpp"
#include "../protocol/packets.hpp"
#include "../protocol/parse.hpp"
#include <iostream>

namespace probelink {

using namespace packets;

ConnectionSession::ConnectionSession(Transport& transport, Scheduler& scheduler,
                                     std::string device_id, SessionCallbacks callbacks)
    : transport_(transport),
      scheduler_(scheduler),
      device_id_(std::move(device_id)),
      callbacks_(std::move(callbacks)) {}

ConnectionSession::~ConnectionSession() {
    callbacks_ = {};
    if (state_ != ConnectionState::Disconnected) {
        auto status = disconnect();
        if (!status) {
            std::cerr << "session: " << device_id_ << ": disconnect on teardown failed: "
                      << status.error().message << std::endl;
        }
    }
}

void ConnectionSession::set_state(ConnectionState state) {
    if (state == state_) return;
    state_ = state;
    std::cout << "session: " << device_id_ << " -> " << to_string(state) << std::endl;
    if (callbacks_.on_state_changed) {
        callbacks_.on_state_changed(state);
    }
}

void ConnectionSession::report(const Error& error) {
    std::cerr << "session: " << device_id_ << ": " << error.message << std::endl;
    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

Status ConnectionSession::require_link(const char* operation) const {
    if (is_link_up(state_)) return {};
    return Status::failure(ErrorKind::InvalidState,
        std::string(operation) + " requires a connection, state is " +
        std::string(to_string(state_)));
}

Status ConnectionSession::connect() {
    if (state_ != ConnectionState::Disconnected) {
        return Status::failure(ErrorKind::InvalidState,
            "connect while " + std::string(to_string(state_)));
    }

    set_state(ConnectionState::Connecting);

    auto status = transport_.connect(device_id_, [this](const std::string&) {
        handle_link_lost();
    });
    if (!status) {
        std::cerr << "session: " << device_id_ << ": connect failed: "
                  << status.error().message << std::endl;
        set_state(ConnectionState::Disconnected);
        return status;
    }

    set_state(ConnectionState::Connected);
    return {};
}

Result<ServiceMap> ConnectionSession::list_interaction_points() {
    return transport_.list_services(device_id_);
}

Result<uint8_t> ConnectionSession::read_status() {
    if (auto status = require_link("read_status"); !status) {
        return status.error();
    }

    auto value = transport_.read_characteristic(device_id_, uuids::PRIMARY_SERVICE,
                                                uuids::STATUS_BATTERY);
    if (!value) {
        return value.error();
    }
    if (value->empty()) {
        return Result<uint8_t>::failure(ErrorKind::TransportFailure, "empty status value");
    }
    return value->front();
}

Status ConnectionSession::subscribe_acknowledgments(AcknowledgmentHandler on_frame) {
    if (state_ == ConnectionState::Subscribed) {
        on_frame_ = std::move(on_frame);
        return {};
    }
    if (state_ != ConnectionState::Connected) {
        return Status::failure(ErrorKind::InvalidState,
            "subscribe while " + std::string(to_string(state_)));
    }

    on_frame_ = std::move(on_frame);
    auto status = transport_.subscribe_notifications(device_id_, uuids::PRIMARY_SERVICE,
        uuids::COMMAND_ACK, [this](std::span<const uint8_t> data) {
            handle_notification(data);
        });
    if (!status) {
        on_frame_ = nullptr;
        return status;
    }

    set_state(ConnectionState::Subscribed);
    return {};
}

void ConnectionSession::handle_notification(std::span<const uint8_t> data) {
    if (state_ != ConnectionState::Subscribed) return;

    auto frame = parse::parse_acknowledgment(data);
    if (!frame) {
        report(frame.error());
        return;
    }

    std::cout << "session: " << device_id_ << ": ack type=" << frame->command_type
              << " code=0x" << std::hex << static_cast<int>(frame->command_code) << std::dec
              << " seq=" << frame->sequential_command_number
              << " status=" << frame->command_status << std::endl;

    if (on_frame_) {
        on_frame_(*frame);
    }
}

Status ConnectionSession::send_command(commands::Opcode opcode) {
    if (auto status = require_link("send_command"); !status) {
        return status;
    }

    auto packet = commands::encode(opcode);
    auto status = transport_.write_characteristic(device_id_, uuids::PRIMARY_SERVICE,
                                                  uuids::COMMAND_WRITE, packet);
    if (status) {
        std::cout << "session: " << device_id_ << ": sent " << commands::to_string(opcode)
                  << std::endl;
    }
    return status;
}

Status ConnectionSession::request_serial_number(AcknowledgmentHandler on_frame) {
    if (state_ == ConnectionState::Connected) {
        if (auto status = subscribe_acknowledgments(std::move(on_frame)); !status) {
            return status;
        }
    } else if (state_ == ConnectionState::Subscribed && on_frame) {
        on_frame_ = std::move(on_frame);
    }

    return send_command(commands::Opcode::RequestSerialNumber);
}

Status ConnectionSession::disconnect() {
    stop_status_polling();

    if (state_ == ConnectionState::Disconnected) {
        return {};
    }

    if (state_ == ConnectionState::Subscribed) {
        auto status = transport_.unsubscribe_notifications(device_id_, uuids::PRIMARY_SERVICE,
                                                           uuids::COMMAND_ACK);
        if (!status) {
            std::cerr << "session: " << device_id_ << ": unsubscribe failed: "
                      << status.error().message << std::endl;
        }
    }
    on_frame_ = nullptr;

    auto status = transport_.disconnect(device_id_);
    set_state(ConnectionState::Disconnected);
    return status;
}

void ConnectionSession::handle_link_lost() {
    std::cout << "session: " << device_id_ << ": link lost" << std::endl;
    stop_status_polling();
    on_frame_ = nullptr;
    set_state(ConnectionState::Disconnected);
}

Status ConnectionSession::start_status_polling(std::chrono::milliseconds interval,
                                               StatusHandler on_status) {
    if (auto status = require_link("status polling"); !status) {
        return status;
    }

    on_status_ = std::move(on_status);
    poll_timer_ = Timer(&scheduler_, scheduler_.schedule(interval, [this]() {
        poll_status();
    }, true));
    return {};
}

void ConnectionSession::stop_status_polling() {
    poll_timer_.cancel();
}

void ConnectionSession::poll_status() {
    auto level = read_status();
    if (!level) {
        // Caller decides whether to disconnect
        stop_status_polling();
        report(level.error());
        return;
    }

    if (on_status_) {
        on_status_(*level);
    }
}

} // namespace probelink
