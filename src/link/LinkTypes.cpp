/* @file LinkTypes.cpp
 * @brief string helpers for link value types and LinkError
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// LinkBridge headers
#include "link/LinkError.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace link {

    const char* toString(ConnectionState::Kind k) {
      switch (k) {
      case ConnectionState::Kind::Disconnected:
        return "disconnected";
      case ConnectionState::Kind::Connecting:
        return "connecting";
      case ConnectionState::Kind::Connected:
        return "connected";
      case ConnectionState::Kind::Disconnecting:
        return "disconnecting";
      case ConnectionState::Kind::FailedToConnect:
        return "failed-to-connect";
      default:
        return "unknown";
      }
    }

    std::string describe(const ConnectionState& s) {
      std::string out = toString(s.kind);
      if (s.error)
        out += "(" + std::to_string(s.error->code) + ": " + s.error->message + ")";
      return out;
    }

    const char* toString(LinkErrorCode code) {
      switch (code) {
      case LinkErrorCode::NotPoweredOn:
        return "not powered on";
      case LinkErrorCode::AlreadyScanning:
        return "already scanning";
      case LinkErrorCode::AlreadyDisconnecting:
        return "already disconnecting";
      case LinkErrorCode::NotConnected:
        return "not connected";
      case LinkErrorCode::UnknownCapability:
        return "unknown capability";
      case LinkErrorCode::DriverRejected:
        return "driver rejected command";
      case LinkErrorCode::Driver:
        return "driver error";
      case LinkErrorCode::DisconnectedWhileWorking:
        return "disconnected while working";
      case LinkErrorCode::NotFound:
        return "not found";
      case LinkErrorCode::Abandoned:
        return "abandoned";
      default:
        return "unknown";
      }
    }

    LinkError::LinkError(LinkErrorCode code, const std::string& what)
        : std::runtime_error(std::string("[") + toString(code) + "] " + what), code_(code) {}

    LinkError::LinkError(DriverError driverError, const std::string& context)
        : std::runtime_error("[driver error " + std::to_string(driverError.code) + "] " + context
                             + ": " + driverError.message),
          code_(LinkErrorCode::Driver), driverError_(std::move(driverError)) {}

  } // namespace link
} // namespace linkbridge
