// LinkBridge headers
#include "core/Coordinator.hpp"
#include "link/LinkError.hpp"
#include "link/LinkSession.hpp"

// LinkBridge-Fake headers
#include "FakeLinkDriver.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

namespace linkbridge::test {

  using link::Bytes;
  using link::ConnectionState;
  using link::DriverError;
  using link::LinkError;
  using link::LinkErrorCode;
  namespace ev = io::events;

  /// Full pass through a device: connect, discover, subscribe, notify, drop.
  TEST(end_to_end, notify_then_unexpected_drop) {
    auto driver = std::make_shared<FakeLinkDriver>();
    auto errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
    auto logger = std::make_shared<core::Logger>(core::LogLevel::Error);
    auto coordinator = core::Coordinator::create(driver, errorMonitor, logger);

    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("link dropped"))).Times(1);

    // connect D1
    auto states = coordinator->connect("D1");
    driver->emit(ev::LinkEstablished{ "D1" });
    auto connected = states.firstWhere([](const ConnectionState& s) { return s.is(ConnectionState::Kind::Connected); },
                                       std::chrono::milliseconds(100));
    ASSERT_TRUE(connected);
    auto d1 = coordinator->session("D1");

    // G1 -> I1
    auto groups = d1->discoverGroups({ "G1" }, link::Lookup::RequireAll);
    driver->emit(ev::GroupsDiscovered{ "D1", { { "G1", true } }, std::nullopt });
    auto g1 = groups.get().at("G1");

    auto items = d1->discoverItems(g1, { "I1" }, link::Lookup::RequireAll);
    driver->emit(ev::ItemsDiscovered{ "D1", "G1", { { "I1", link::kRead | link::kNotify } }, std::nullopt });
    auto i1 = items.get().at("I1");
    EXPECT_TRUE(i1->has(link::kNotify));

    // subscribe
    auto subscribed = d1->setSubscription(i1, true);
    driver->emit(ev::SubscriptionChanged{ "D1", i1->ref(), true, std::nullopt });
    ASSERT_TRUE(subscribed.get());

    // notification 0x02
    auto values = i1->value().subscribe();
    driver->emit(ev::ValueUpdated{ "D1", i1->ref(), { 0x02 }, std::nullopt });
    auto notified = values.firstWhere([](const std::optional<Bytes>& v) { return v.has_value(); },
                                      std::chrono::milliseconds(100));
    ASSERT_TRUE(notified);
    EXPECT_EQ(**notified, Bytes{ 0x02 });

    // a read left in flight when the link drops
    auto inFlight = d1->read(i1);

    // the drop is delivered from the driver's own thread
    DriverError e{ 19, "remote user terminated connection" };
    std::thread radio([&] { driver->emit(ev::LinkDropped{ "D1", e }); });
    radio.join();

    auto dropped = states.firstWhere([](const ConnectionState& s) { return s.isDown(); },
                                     std::chrono::milliseconds(100));
    ASSERT_TRUE(dropped);
    EXPECT_EQ(*dropped, ConnectionState::disconnected(e));

    try {
      inFlight.get();
      FAIL() << "read should have failed with the link";
    } catch (const LinkError& err) {
      EXPECT_EQ(err.code(), LinkErrorCode::DisconnectedWhileWorking);
    }

    EXPECT_FALSE(i1->subscribed().current());
    EXPECT_EQ(i1->value().current(), Bytes{ 0x02 });
    EXPECT_EQ(coordinator->session("D1"), d1);
  }

} // namespace linkbridge::test
