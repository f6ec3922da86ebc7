#include "scan_session.hpp"
#include <iostream>

namespace probelink {

ScanSession::ScanSession(Transport& transport, Scheduler& scheduler, DeviceRegistry& registry)
    : transport_(transport), scheduler_(scheduler), registry_(registry) {}

ScanSession::~ScanSession() {
    callbacks_ = {};
    auto status = stop();
    if (!status) {
        std::cerr << "scan: stop on teardown failed: " << status.error().message << std::endl;
    }
}

Status ScanSession::start(const std::string& service_uuid, ScanCallbacks callbacks,
                          std::optional<std::chrono::milliseconds> duration) {
    if (active()) {
        return Status::failure(ErrorKind::InvalidState, "scan already active");
    }

    service_uuid_ = service_uuid;
    duration_ = duration;
    callbacks_ = std::move(callbacks);

    // Records only live for one scan session
    registry_.clear();

    return begin();
}

Status ScanSession::start(const ScanOptions& options, ScanCallbacks callbacks) {
    auto status = start(options.service_uuid, std::move(callbacks), options.duration);
    if (status && options.refresh_interval) {
        enable_refresh(*options.refresh_interval);
    }
    return status;
}

Status ScanSession::begin() {
    auto status = transport_.request_scan(*service_uuid_, [this](const Advertisement& adv) {
        handle_advertisement(adv);
    });
    if (!status) {
        std::cerr << "scan: request failed: " << status.error().message << std::endl;
        return status;
    }

    state_ = ScanState::Active;
    std::cout << "scan: started for " << *service_uuid_ << std::endl;

    if (duration_) {
        auto_stop_ = Timer(&scheduler_, scheduler_.schedule(*duration_, [this]() {
            // Refresh stays armed so the next tick restarts the scan
            auto stopped = end_scan();
            if (!stopped) {
                std::cerr << "scan: auto-stop failed: " << stopped.error().message << std::endl;
            }
        }, false));
    }
    return {};
}

Status ScanSession::stop() {
    refresh_.cancel();
    return end_scan();
}

Status ScanSession::end_scan() {
    if (!active()) {
        return {};
    }

    auto_stop_.cancel();
    state_ = ScanState::Idle;

    auto status = transport_.stop_scan();
    if (!status) {
        std::cerr << "scan: stop failed: " << status.error().message << std::endl;
    } else {
        std::cout << "scan: stopped, " << registry_.size() << " device(s)" << std::endl;
    }

    if (callbacks_.on_stopped) {
        callbacks_.on_stopped();
    }
    return status;
}

Status ScanSession::refresh() {
    if (active()) {
        return {};
    }
    if (!service_uuid_) {
        return Status::failure(ErrorKind::InvalidState, "no scan to refresh");
    }
    return begin();
}

void ScanSession::enable_refresh(std::chrono::milliseconds interval) {
    refresh_ = Timer(&scheduler_, scheduler_.schedule(interval, [this]() {
        auto status = refresh();
        if (!status) {
            std::cerr << "scan: refresh failed: " << status.error().message << std::endl;
        }
    }, true));
}

void ScanSession::disable_refresh() {
    refresh_.cancel();
}

void ScanSession::handle_advertisement(const Advertisement& adv) {
    // Late delivery after stop()
    if (!active()) return;

    auto status = registry_.apply_advertisement(adv);

    ScanEvent event;
    if (!status) {
        std::cerr << "scan: " << adv.id << ": " << status.error().message << std::endl;
        event.decode_error = status.error();
    }

    auto record = registry_.find(adv.id);
    if (!record) return;
    event.device = std::move(*record);

    if (callbacks_.on_device) {
        callbacks_.on_device(event);
    }
}

} // namespace probelink
