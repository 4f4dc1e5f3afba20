#pragma once
/** @file  LinkSession.hpp
 *  @brief Per-device connection state machine, capability tree and request
 *         correlation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// LinkBridge headers
#include "core/CorrelationQueue.hpp"
#include "core/StateBroadcast.hpp"
#include "core/Stream.hpp"
#include "io/DriverEvent.hpp"
#include "link/Group.hpp"
#include "link/Item.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace core {
    class Logger;
  } // namespace core
  namespace io {
    class LinkDriver;
  } // namespace io

  namespace link {

    /// How a discovery treats requested ids that the device does not report.
    enum class Lookup : std::uint8_t {
      Any,        ///< return whatever matched
      RequireAll, ///< fail with NotFound if any requested id is absent
    };

    /**
 * @class LinkSession
 * @brief One per physical device for the lifetime of the IdentityCache.
 *
 *  * Every mutation (state transition, queue push/pop, tree change) happens
 *    under this session's own lock; sessions never touch each other.
 *  * Requests append a pending handle and issue the driver command under the
 *    same lock, so per-key queue order equals command order.
 *  * Entering disconnected / failed-to-connect drains every queue with
 *    `DisconnectedWhileWorking`. Requests issued afterwards fail the
 *    connected precondition instead of being queued.
 *  * The lock is re-entrant: a driver may complete synchronously from inside
 *    a command call.
 */
    class LinkSession : public std::enable_shared_from_this<LinkSession> {
    public:
      LinkSession(DeviceId id, std::shared_ptr<io::LinkDriver> driver, std::shared_ptr<core::Logger> logger);
      ~LinkSession() = default;

      const DeviceId& id() const { return id_; }

      //---observable state-------------------------------------------------
      const core::StateBroadcast<ConnectionState>& connectionState() const { return state_; }
      const core::StateBroadcast<std::optional<std::string>>& name() const { return name_; }
      const core::StateBroadcast<std::optional<int>>& signalStrength() const { return rssi_; }
      const core::StateBroadcast<Bytes>& advertisement() const { return advertisement_; }

      //---link lifecycle---------------------------------------------------
      /**
       * disconnected / failed -> connecting and issues the driver connect.
       * While connecting or connected: no driver command, returns the stream.
       * @throws LinkError(AlreadyDisconnecting) while a cancel is in progress.
       */
      core::Stream<ConnectionState> connect();

      /// connected / connecting -> disconnecting; no-op when already down or disconnecting.
      core::Stream<ConnectionState> cancelConnection();

      /// Same stream connect() returns, without changing anything.
      core::Stream<ConnectionState> watchConnection() const { return state_.subscribe(); }

      //---capability tree--------------------------------------------------
      std::vector<std::shared_ptr<Group>> groups() const;
      std::shared_ptr<Group> group(const GroupId& id) const;
      std::shared_ptr<Item> item(const ItemRef& ref) const;

      //---requests (all throw LinkError(NotConnected) unless connected)---
      core::Pending<GroupMap> discoverGroups(std::vector<GroupId> filter = {}, Lookup lookup = Lookup::Any);
      core::Pending<ItemMap> discoverItems(const std::shared_ptr<Group>& group, std::vector<ItemId> filter = {},
                                           Lookup lookup = Lookup::Any);
      core::Pending<Bytes> read(const std::shared_ptr<Item>& item);
      core::Pending<void> write(const std::shared_ptr<Item>& item, const Bytes& value);
      /// Fire-and-forget. @throws LinkError(DriverRejected) if the driver refuses it.
      void writeWithoutAck(const std::shared_ptr<Item>& item, const Bytes& value);
      /// Resolves immediately when the item is already in the requested state.
      core::Pending<bool> setSubscription(const std::shared_ptr<Item>& item, bool enabled);
      core::Pending<int> readSignalStrength();

      /// Entry point for every driver event addressed to this device.
      void handleEvent(const io::DriverEvent& event);

      /// Advertisement seen while scanning.
      void noteAdvertisement(const std::optional<std::string>& name, const Bytes& data, std::optional<int> rssi);

      /// Requests still waiting for a driver completion (abandoned ones included).
      std::size_t pendingRequests() const;

      LinkSession(const LinkSession&) = delete;
      LinkSession& operator=(const LinkSession&) = delete;

    private:
      struct DiscoveryContext {
        std::vector<std::string> filter;
        Lookup lookup{ Lookup::Any };
      };

      void onLinkEstablished();
      void onLinkFailed(const DriverError& error);
      void onLinkDropped(const std::optional<DriverError>& error);
      void onGroupsDiscovered(const io::events::GroupsDiscovered& ev);
      void onItemsDiscovered(const io::events::ItemsDiscovered& ev);
      void onValueUpdated(const io::events::ValueUpdated& ev);
      void onWriteCompleted(const io::events::WriteCompleted& ev);
      void onSubscriptionChanged(const io::events::SubscriptionChanged& ev);
      void onSignalStrengthRead(const io::events::SignalStrengthRead& ev);

      void transition(ConnectionState next);
      void enterDown(ConnectionState next);
      void requireConnected(const char* operation) const;
      std::shared_ptr<Item> ownItem(const std::shared_ptr<Item>& item, const char* operation) const;
      std::shared_ptr<Group> ownGroup(const std::shared_ptr<Group>& group, const char* operation) const;
      std::exception_ptr driverFailure(const DriverError& error, const std::string& what) const;

      const DeviceId id_;
      std::shared_ptr<io::LinkDriver> driver_; ///< back-reference to the owning driver handle
      std::shared_ptr<core::Logger> logger_;

      mutable std::recursive_mutex mtx_;

      core::StateBroadcast<ConnectionState> state_{ ConnectionState::disconnected() };
      core::StateBroadcast<std::optional<std::string>> name_{ std::nullopt };
      core::StateBroadcast<std::optional<int>> rssi_{ std::nullopt };
      core::StateBroadcast<Bytes> advertisement_{ Bytes{} };

      std::vector<std::shared_ptr<Group>> groups_; ///< discovery order

      core::CorrelationQueue<DeviceId, GroupMap, DiscoveryContext> groupDiscoveries_;
      core::CorrelationQueue<GroupId, ItemMap, DiscoveryContext> itemDiscoveries_;
      core::CorrelationQueue<ItemRef, Bytes> reads_;
      core::CorrelationQueue<ItemRef, void> writes_;
      core::CorrelationQueue<ItemRef, bool> subscriptions_;
      core::CorrelationQueue<DeviceId, int> signalReads_;
    };

  } // namespace link
} // namespace linkbridge
