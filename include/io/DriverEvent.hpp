#pragma once
/** @file  DriverEvent.hpp
 *  @brief Every callback the hardware driver can emit, as one closed variant.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <variant>
#include <vector>

// LinkBridge headers
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace io {

    namespace events {
      using link::Bytes;
      using link::DeviceId;
      using link::DriverError;
      using link::GroupId;
      using link::ItemRef;

      struct RadioStateChanged {
        link::RadioState state;
      };
      struct DeviceDiscovered {
        DeviceId device;
        std::optional<std::string> name;
        Bytes advertisement;
        std::optional<int> rssi;
      };
      struct LinkEstablished {
        DeviceId device;
      };
      struct LinkFailed {
        DeviceId device;
        DriverError error;
      };
      struct LinkDropped {
        DeviceId device;
        std::optional<DriverError> error;
      };
      struct GroupsDiscovered {
        DeviceId device;
        std::vector<link::GroupInfo> groups;
        std::optional<DriverError> error;
      };
      struct ItemsDiscovered {
        DeviceId device;
        GroupId group;
        std::vector<link::ItemInfo> items;
        std::optional<DriverError> error;
      };
      /// Read response or unsolicited notification. The two are indistinguishable
      /// here, so a notification arriving while a read is pending resolves that read.
      struct ValueUpdated {
        DeviceId device;
        ItemRef item;
        Bytes value;
        std::optional<DriverError> error;
      };
      struct WriteCompleted {
        DeviceId device;
        ItemRef item;
        std::optional<DriverError> error;
      };
      struct SubscriptionChanged {
        DeviceId device;
        ItemRef item;
        bool enabled{ false };
        std::optional<DriverError> error;
      };
      struct NameUpdated {
        DeviceId device;
        std::optional<std::string> name;
      };
      struct SignalStrengthRead {
        DeviceId device;
        int rssi{ 0 };
        std::optional<DriverError> error;
      };
    } // namespace events

    using DriverEvent = std::variant<events::RadioStateChanged, events::DeviceDiscovered,
                                     events::LinkEstablished, events::LinkFailed, events::LinkDropped,
                                     events::GroupsDiscovered, events::ItemsDiscovered,
                                     events::ValueUpdated, events::WriteCompleted,
                                     events::SubscriptionChanged, events::NameUpdated,
                                     events::SignalStrengthRead>;

    /// std::visit helper: one lambda per alternative.
    template <typename... Fs> struct Overloaded : Fs... {
      using Fs::operator()...;
    };
    template <typename... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;

    /// Short tag for log lines.
    const char* eventName(const DriverEvent& event);

  } // namespace io
} // namespace linkbridge
