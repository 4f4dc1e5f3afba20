#pragma once
/** @file  LinkDriver.hpp
 *  @brief Command side of the hardware discovery/link driver.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <vector>

// LinkBridge headers
#include "io/DriverEvent.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace io {

    /**
 * @class LinkDriver
 * @brief Abstract driver the core talks to. Implemented by the platform stack
 *        (or by a simulated driver in tests).
 *
 *  * Commands return immediately; outcomes arrive later as DriverEvents on the
 *    registered sink, from any thread.
 *  * Completions for one item / group are delivered in command order.
 *  * Completions carry no request token, only the identifiers.
 */
    class LinkDriver {
    public:
      using EventSink = std::function<void(const DriverEvent&)>;

      virtual ~LinkDriver() = default;

      /// Replaces the event sink; an empty sink detaches.
      virtual void setEventSink(EventSink sink) = 0;

      virtual link::RadioState radioState() const = 0;

      //---discovery------------------------------------------------------
      virtual void startScan(const std::vector<link::GroupId>& groups) = 0;
      virtual void stopScan() = 0;

      //---link lifecycle-------------------------------------------------
      virtual void connect(const link::DeviceId& device) = 0;
      virtual void cancelConnection(const link::DeviceId& device) = 0;

      //---capabilities---------------------------------------------------
      virtual void discoverGroups(const link::DeviceId& device,
                                  const std::vector<link::GroupId>& groups) = 0;
      virtual void discoverItems(const link::DeviceId& device, const link::GroupId& group,
                                 const std::vector<link::ItemId>& items) = 0;
      virtual void read(const link::DeviceId& device, const link::ItemRef& item) = 0;

      /** @returns false when the driver synchronously rejects the write. */
      virtual bool write(const link::DeviceId& device, const link::ItemRef& item,
                         const link::Bytes& value, bool ackRequired) = 0;
      virtual void setSubscription(const link::DeviceId& device, const link::ItemRef& item,
                                   bool enabled) = 0;
      virtual void readSignalStrength(const link::DeviceId& device) = 0;

      //---retrieval (synchronous)----------------------------------------
      /// Subset of \p devices the driver knows about.
      virtual std::vector<link::DeviceId> knownDevices(const std::vector<link::DeviceId>& devices) = 0;
      /// Devices currently linked at system level that offer any of \p groups.
      virtual std::vector<link::DeviceId> linkedDevices(const std::vector<link::GroupId>& groups) = 0;
    };

  } // namespace io
} // namespace linkbridge
