#include <gtest/gtest.h>

#include <protocol/packets.hpp>
#include <session/scan_session.hpp>

#include "TestData.hpp"
#include "fakes/FakeTransport.hpp"
#include "fakes/ManualScheduler.hpp"

#include <memory>

using namespace probelink;
using namespace std::chrono_literals;

class ScanSessionTests : public ::testing::Test {
protected:
    fakes::FakeTransport transport;
    fakes::ManualScheduler scheduler;
    DeviceRegistry registry;
    std::unique_ptr<ScanSession> scan;

    std::vector<ScanEvent> events;
    int stopped = 0;

    void SetUp() override {
        scan = std::make_unique<ScanSession>(transport, scheduler, registry);
    }

    ScanCallbacks callbacks() {
        ScanCallbacks cb;
        cb.on_device = [this](const ScanEvent& event) { events.push_back(event); };
        cb.on_stopped = [this]() { ++stopped; };
        return cb;
    }
};

TEST_F(ScanSessionTests, StartRequestsScanForService) {
    auto status = scan->start(packets::uuids::PRIMARY_SERVICE, callbacks());

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(scan->state(), ScanState::Active);
    ASSERT_EQ(transport.scan_requests.size(), 1u);
    EXPECT_EQ(transport.scan_requests[0], packets::uuids::PRIMARY_SERVICE);
}

TEST_F(ScanSessionTests, SecondStartWhileActiveIsRejected) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    auto status = scan->start("svc", callbacks());

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::InvalidState);
    EXPECT_EQ(transport.scan_requests.size(), 1u);
    EXPECT_TRUE(scan->active());
}

TEST_F(ScanSessionTests, StartClearsPreviousRecords) {
    registry.apply_advertisement(Advertisement{"old", std::nullopt, -50, std::nullopt});

    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ScanSessionTests, AdvertisementsReachRegistryAndCallback) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    transport.advertise("d1", -58, testdata::temperature_probe_payload(), "probe-1");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].device.id, "d1");
    EXPECT_EQ(events[0].device.signal_strength, -58);
    EXPECT_FALSE(events[0].decode_error.has_value());
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ScanSessionTests, DecodeFailureIsReportedAndScanContinues) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    transport.advertise("d1", -58, std::vector<uint8_t>{0x01, 0x02});
    transport.advertise("d2", -60, testdata::temperature_probe_payload());

    ASSERT_EQ(events.size(), 2u);
    ASSERT_TRUE(events[0].decode_error.has_value());
    EXPECT_EQ(events[0].decode_error->kind, ErrorKind::TooShort);
    EXPECT_FALSE(events[1].decode_error.has_value());
    EXPECT_TRUE(scan->active());
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(ScanSessionTests, StopIsIdempotent) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    EXPECT_TRUE(scan->stop().ok());
    EXPECT_TRUE(scan->stop().ok());

    EXPECT_EQ(scan->state(), ScanState::Idle);
    EXPECT_EQ(transport.stop_calls, 1);
    EXPECT_EQ(stopped, 1);
}

TEST_F(ScanSessionTests, StopWhenNeverStartedDoesNothing) {
    EXPECT_TRUE(scan->stop().ok());
    EXPECT_EQ(transport.stop_calls, 0);
}

TEST_F(ScanSessionTests, StopFailureStillEndsScan) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());
    transport.stop_result = Status::failure(ErrorKind::TransportFailure, "stop rejected");

    auto status = scan->stop();

    EXPECT_FALSE(status.ok());
    EXPECT_EQ(scan->state(), ScanState::Idle);
    EXPECT_EQ(stopped, 1);
}

TEST_F(ScanSessionTests, LateAdvertisementAfterStopIsIgnored) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());
    ASSERT_TRUE(scan->stop().ok());

    transport.advertise("d1", -58);

    EXPECT_TRUE(events.empty());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ScanSessionTests, StopsAfterDuration) {
    ASSERT_TRUE(scan->start("svc", callbacks(), 5000ms).ok());

    scheduler.advance(4999ms);
    EXPECT_TRUE(scan->active());

    scheduler.advance(1ms);
    EXPECT_FALSE(scan->active());
    EXPECT_EQ(transport.stop_calls, 1);
    EXPECT_EQ(stopped, 1);
}

TEST_F(ScanSessionTests, ManualStopCancelsAutoStop) {
    ASSERT_TRUE(scan->start("svc", callbacks(), 5000ms).ok());
    ASSERT_TRUE(scan->stop().ok());

    EXPECT_EQ(scheduler.pending(), 0u);
    scheduler.advance(10000ms);
    EXPECT_EQ(transport.stop_calls, 1);
}

TEST_F(ScanSessionTests, WithoutDurationRunsUntilStopped) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    scheduler.advance(60000ms);

    EXPECT_TRUE(scan->active());
}

TEST_F(ScanSessionTests, RequestFailureLeavesScanIdle) {
    transport.scan_result = Status::failure(ErrorKind::TransportUnavailable, "adapter off");

    auto status = scan->start("svc", callbacks(), 5000ms);

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::TransportUnavailable);
    EXPECT_EQ(scan->state(), ScanState::Idle);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(ScanSessionTests, RefreshWhileActiveIsNoOp) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());

    EXPECT_TRUE(scan->refresh().ok());

    EXPECT_EQ(transport.scan_requests.size(), 1u);
    EXPECT_TRUE(scan->active());
}

TEST_F(ScanSessionTests, RefreshWhileIdleKeepsRecords) {
    ASSERT_TRUE(scan->start("svc", callbacks()).ok());
    transport.advertise("d1", -58);
    ASSERT_TRUE(scan->stop().ok());

    ASSERT_TRUE(scan->refresh().ok());

    EXPECT_TRUE(scan->active());
    EXPECT_EQ(transport.scan_requests.size(), 2u);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ScanSessionTests, RefreshBeforeAnyScanIsRejected) {
    auto status = scan->refresh();

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::InvalidState);
    EXPECT_TRUE(transport.scan_requests.empty());
}

TEST_F(ScanSessionTests, PeriodicRefreshRestartsStoppedScan) {
    ScanOptions options;
    options.service_uuid = "svc";
    options.duration = 1000ms;
    options.refresh_interval = 3000ms;
    ASSERT_TRUE(scan->start(options, callbacks()).ok());
    transport.advertise("d1", -58);

    scheduler.advance(1000ms);
    EXPECT_FALSE(scan->active());

    scheduler.advance(2000ms);
    EXPECT_TRUE(scan->active());
    EXPECT_EQ(transport.scan_requests.size(), 2u);
    EXPECT_EQ(registry.size(), 1u);

    // Auto-stop re-armed for the refreshed scan
    scheduler.advance(1000ms);
    EXPECT_FALSE(scan->active());

    scan->disable_refresh();
    scheduler.advance(10000ms);
    EXPECT_EQ(transport.scan_requests.size(), 2u);
}

TEST_F(ScanSessionTests, ExplicitStopDisablesRefresh) {
    ScanOptions options;
    options.service_uuid = "svc";
    options.duration = std::nullopt;
    options.refresh_interval = 3000ms;
    ASSERT_TRUE(scan->start(options, callbacks()).ok());

    ASSERT_TRUE(scan->stop().ok());
    scheduler.advance(3000ms);
    transport.advertise("d1", -58);

    EXPECT_FALSE(scan->active());
    EXPECT_EQ(transport.scan_requests.size(), 1u);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(scheduler.pending(), 0u);
}

// After an auto-stop the scan is already idle; stop() still ends refreshing
TEST_F(ScanSessionTests, StopAfterAutoStopDisablesRefresh) {
    ScanOptions options;
    options.service_uuid = "svc";
    options.duration = 1000ms;
    options.refresh_interval = 3000ms;
    ASSERT_TRUE(scan->start(options, callbacks()).ok());

    scheduler.advance(1000ms);
    ASSERT_FALSE(scan->active());
    EXPECT_TRUE(scan->stop().ok());

    scheduler.advance(10000ms);
    EXPECT_FALSE(scan->active());
    EXPECT_EQ(transport.scan_requests.size(), 1u);
    EXPECT_EQ(stopped, 1);
}

TEST_F(ScanSessionTests, DestructionStopsActiveScan) {
    ASSERT_TRUE(scan->start("svc", callbacks(), 5000ms).ok());

    scan.reset();

    EXPECT_EQ(transport.stop_calls, 1);
    EXPECT_EQ(stopped, 0);
    EXPECT_EQ(scheduler.pending(), 0u);
}
