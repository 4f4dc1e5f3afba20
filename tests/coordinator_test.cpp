// LinkBridge headers
#include "core/Coordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "link/LinkError.hpp"
#include "link/LinkSession.hpp"

// LinkBridge-Fake headers
#include "FakeLinkDriver.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <memory>
#include <optional>
#include <vector>

namespace linkbridge::test {

  using core::Coordinator;
  using core::ErrorMonitor;
  using core::SessionRef;
  using link::ConnectionState;
  using link::DriverError;
  using link::LinkError;
  using link::LinkErrorCode;
  using link::RadioState;
  namespace ev = io::events;

  class CoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      driver = std::make_shared<FakeLinkDriver>();
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      logger = std::make_shared<core::Logger>(core::LogLevel::Error);
      coordinator = Coordinator::create(driver, std::static_pointer_cast<ErrorMonitor>(errorMonitor), logger);
    }

    void discovered(const link::DeviceId& id, std::optional<int> rssi = std::nullopt) {
      driver->emit(ev::DeviceDiscovered{ id, std::nullopt, { 0x02, 0x01, 0x06 }, rssi });
    }

    std::shared_ptr<FakeLinkDriver> driver;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<core::Logger> logger;
    std::shared_ptr<Coordinator> coordinator;
  };

  //---readiness----------------------------------------------------------

  TEST_F(CoordinatorTest, create_attaches_and_seeds_radio_state) {
    EXPECT_TRUE(driver->attached());
    EXPECT_EQ(coordinator->radioState().current(), RadioState::PoweredOn);
  }

  TEST_F(CoordinatorTest, start_reports_readiness_changes) {
    driver->radio = RadioState::PoweredOff;
    auto states = coordinator->start();
    EXPECT_EQ(states.tryNext(), RadioState::PoweredOff);

    driver->radio = RadioState::PoweredOn;
    driver->emit(ev::RadioStateChanged{ RadioState::PoweredOn });
    EXPECT_EQ(states.tryNext(), RadioState::PoweredOn);
  }

  TEST_F(CoordinatorTest, destruction_detaches_from_driver) {
    auto stream = coordinator->beginDiscovery({});
    coordinator.reset();

    EXPECT_FALSE(driver->attached());
    EXPECT_EQ(driver->stop_scan_calls, 1);
    EXPECT_FALSE(stream.next());
  }

  //---discovery----------------------------------------------------------

  TEST_F(CoordinatorTest, discovery_needs_powered_on_driver) {
    driver->emit(ev::RadioStateChanged{ RadioState::PoweredOff });
    try {
      coordinator->beginDiscovery({});
      FAIL() << "expected NotPoweredOn";
    } catch (const LinkError& e) {
      EXPECT_EQ(e.code(), LinkErrorCode::NotPoweredOn);
    }
    EXPECT_EQ(driver->start_scan_calls, 0);
  }

  TEST_F(CoordinatorTest, second_discovery_is_rejected) {
    auto stream = coordinator->beginDiscovery({ "180D" });
    EXPECT_EQ(driver->last_scan_groups, std::vector<link::GroupId>{ "180D" });
    EXPECT_TRUE(coordinator->scanning().current());

    try {
      coordinator->beginDiscovery({});
      FAIL() << "expected AlreadyScanning";
    } catch (const LinkError& e) {
      EXPECT_EQ(e.code(), LinkErrorCode::AlreadyScanning);
    }
    EXPECT_EQ(driver->start_scan_calls, 1);
  }

  TEST_F(CoordinatorTest, device_surfaces_once_per_discovery) {
    auto stream = coordinator->beginDiscovery({});
    discovered("D1", -70);
    discovered("D1", -60);
    discovered("D2");

    auto first = stream.tryNext();
    auto second = stream.tryNext();
    ASSERT_TRUE(first && second);
    EXPECT_EQ((*first)->id(), "D1");
    EXPECT_EQ((*second)->id(), "D2");
    EXPECT_FALSE(stream.tryNext());

    EXPECT_EQ((*first)->signalStrength().current(), -60);
    EXPECT_EQ((*first)->advertisement().current(), (link::Bytes{ 0x02, 0x01, 0x06 }));
  }

  TEST_F(CoordinatorTest, dropping_stream_stops_scan_exactly_once) {
    {
      auto stream = coordinator->beginDiscovery({});
      discovered("D1");
    }
    EXPECT_EQ(driver->stop_scan_calls, 1);
    EXPECT_FALSE(coordinator->scanning().current());

    coordinator->stopDiscovery();
    EXPECT_EQ(driver->stop_scan_calls, 1);

    auto again = coordinator->beginDiscovery({});
    discovered("D1");
    auto d = again.tryNext();
    ASSERT_TRUE(d);
    EXPECT_EQ((*d)->id(), "D1");
    EXPECT_EQ(driver->start_scan_calls, 2);
  }

  TEST_F(CoordinatorTest, explicit_stop_finishes_stream) {
    auto stream = coordinator->beginDiscovery({});
    discovered("D1");
    coordinator->stopDiscovery();

    EXPECT_EQ(driver->stop_scan_calls, 1);
    EXPECT_TRUE(stream.next());
    EXPECT_FALSE(stream.next());

    stream.cancel();
    EXPECT_EQ(driver->stop_scan_calls, 1);
  }

  TEST_F(CoordinatorTest, stale_stream_does_not_stop_newer_discovery) {
    auto old = coordinator->beginDiscovery({});
    coordinator->stopDiscovery();
    auto current = coordinator->beginDiscovery({});

    old.cancel();
    EXPECT_TRUE(coordinator->scanning().current());
    EXPECT_EQ(driver->stop_scan_calls, 1);
  }

  TEST_F(CoordinatorTest, radio_loss_ends_discovery) {
    auto stream = coordinator->beginDiscovery({});
    driver->emit(ev::RadioStateChanged{ RadioState::PoweredOff });

    EXPECT_FALSE(coordinator->scanning().current());
    EXPECT_FALSE(stream.next());
    EXPECT_EQ(driver->stop_scan_calls, 0);
  }

  TEST_F(CoordinatorTest, results_outside_discovery_are_ignored) {
    discovered("D9");
    EXPECT_EQ(coordinator->cache().find("D9"), nullptr);
  }

  TEST_F(CoordinatorTest, default_scan_groups_come_from_config) {
    core::LinkConfig cfg;
    cfg.logLevel = core::LogLevel::Error;
    cfg.scanGroups = { "180F" };
    coordinator->applyConfig(cfg);

    auto stream = coordinator->beginDiscovery();
    EXPECT_EQ(driver->last_scan_groups, std::vector<link::GroupId>{ "180F" });
  }

  //---identity-----------------------------------------------------------

  TEST_F(CoordinatorTest, every_path_yields_the_same_session) {
    driver->known = { "D1" };
    driver->linked = { "D1" };

    auto stream = coordinator->beginDiscovery({});
    discovered("D1");
    auto fromScan = stream.tryNext();
    ASSERT_TRUE(fromScan);

    auto fromRetrieve = coordinator->retrieveSessions({ "D1", "D7" });
    auto fromLinked = coordinator->retrieveLinkedSessions({ "180D" });
    ASSERT_EQ(fromRetrieve.size(), 1u);
    ASSERT_EQ(fromLinked.size(), 1u);

    EXPECT_EQ(*fromScan, fromRetrieve.front());
    EXPECT_EQ(*fromScan, fromLinked.front());
    EXPECT_EQ(*fromScan, coordinator->session("D1"));
    EXPECT_EQ(coordinator->cache().size(), 1u);
  }

  //---event routing------------------------------------------------------

  TEST_F(CoordinatorTest, events_are_routed_to_their_session) {
    auto states = coordinator->connect("D1");
    auto other = coordinator->session("D2");
    driver->emit(ev::LinkEstablished{ "D1" });

    EXPECT_EQ(coordinator->session("D1")->connectionState().current(), ConnectionState::connected());
    EXPECT_EQ(other->connectionState().current(), ConnectionState::disconnected());
    EXPECT_EQ(driver->connects, std::vector<link::DeviceId>{ "D1" });

    coordinator->cancelConnection("D1");
    EXPECT_EQ(driver->cancels, std::vector<link::DeviceId>{ "D1" });
  }

  TEST_F(CoordinatorTest, events_for_unknown_devices_are_dropped) {
    driver->emit(ev::LinkEstablished{ "ghost" });
    EXPECT_EQ(coordinator->cache().find("ghost"), nullptr);
  }

  TEST_F(CoordinatorTest, connection_failures_are_escalated) {
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("D1 failed to connect"))).Times(1);
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("D1 link dropped"))).Times(1);

    coordinator->connect("D1");
    driver->emit(ev::LinkFailed{ "D1", DriverError{ 62, "connection timed out" } });

    coordinator->connect("D1");
    driver->emit(ev::LinkEstablished{ "D1" });
    driver->emit(ev::LinkDropped{ "D1", DriverError{ 8, "supervision timeout" } });
  }

  TEST_F(CoordinatorTest, clean_disconnect_is_not_escalated) {
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::_)).Times(0);

    coordinator->connect("D1");
    driver->emit(ev::LinkEstablished{ "D1" });
    coordinator->cancelConnection("D1");
    driver->emit(ev::LinkDropped{ "D1", std::nullopt });

    EXPECT_EQ(coordinator->session("D1")->connectionState().current(), ConnectionState::disconnected());
  }

} // namespace linkbridge::test
