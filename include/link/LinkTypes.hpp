#pragma once
/** @file  LinkTypes.hpp
 *  @brief Value types shared by the driver boundary, sessions and the coordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linkbridge {
  namespace link {

    using DeviceId = std::string; ///< opaque, stable per physical device
    using GroupId = std::string;  ///< service-like UUID string
    using ItemId = std::string;   ///< characteristic-like UUID string
    using Bytes = std::vector<std::uint8_t>;

    /// Item address inside one device: item ids are only unique per group.
    struct ItemRef {
      GroupId group;
      ItemId item;

      bool operator==(const ItemRef&) const = default;
      bool operator<(const ItemRef& o) const {
        return group < o.group || (group == o.group && item < o.item);
      }
    };

    /// Driver readiness, mirrors the radio power states a host stack reports.
    enum class RadioState : std::uint8_t {
      Unknown,
      Resetting,
      Unsupported,
      Unauthorized,
      PoweredOff,
      PoweredOn
    };

    inline const char* toString(RadioState s) {
      switch (s) {
      case RadioState::Unknown:
        return "Unknown";
      case RadioState::Resetting:
        return "Resetting";
      case RadioState::Unsupported:
        return "Unsupported";
      case RadioState::Unauthorized:
        return "Unauthorized";
      case RadioState::PoweredOff:
        return "PoweredOff";
      case RadioState::PoweredOn:
        return "PoweredOn";
      default:
        return "Unknown";
      }
    }

    /// Error as reported by the driver (code is driver specific).
    struct DriverError {
      int code{ 0 };
      std::string message;

      bool operator==(const DriverError&) const = default;
    };

    /// Capability flags of an Item.
    enum ItemProperty : std::uint8_t {
      kRead = 1 << 0,
      kWrite = 1 << 1,
      kWriteWithoutAck = 1 << 2,
      kNotify = 1 << 3,
      kIndicate = 1 << 4,
    };

    /// Group as reported by a discovery completion.
    struct GroupInfo {
      GroupId id;
      bool primary{ true };
    };

    /// Item as reported by a discovery completion.
    struct ItemInfo {
      ItemId id;
      std::uint8_t properties{ 0 }; ///< ItemProperty bitmask
    };

    /**
 * @struct ConnectionState
 * @brief disconnected(optional error) | connecting | connected | disconnecting
 *        | failed-to-connect(error).
 */
    struct ConnectionState {
      enum class Kind : std::uint8_t { Disconnected, Connecting, Connected, Disconnecting, FailedToConnect };

      Kind kind{ Kind::Disconnected };
      std::optional<DriverError> error{}; ///< set for Disconnected(err) and FailedToConnect

      static ConnectionState disconnected(std::optional<DriverError> err = std::nullopt) {
        return { Kind::Disconnected, std::move(err) };
      }
      static ConnectionState connecting() { return { Kind::Connecting, std::nullopt }; }
      static ConnectionState connected() { return { Kind::Connected, std::nullopt }; }
      static ConnectionState disconnecting() { return { Kind::Disconnecting, std::nullopt }; }
      static ConnectionState failedToConnect(DriverError err) {
        return { Kind::FailedToConnect, std::move(err) };
      }

      bool is(Kind k) const { return kind == k; }
      /// disconnected or failed-to-connect
      bool isDown() const { return kind == Kind::Disconnected || kind == Kind::FailedToConnect; }

      bool operator==(const ConnectionState&) const = default;
    };

    const char* toString(ConnectionState::Kind k);
    std::string describe(const ConnectionState& s);

  } // namespace link
} // namespace linkbridge
