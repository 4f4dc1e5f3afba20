#pragma once
/** @file  LinkError.hpp
 *  @brief Exception type for every failure surfaced to LinkBridge callers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// LinkBridge headers
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace link {

    enum class LinkErrorCode : std::uint8_t {
      // precondition errors, thrown synchronously
      NotPoweredOn,
      AlreadyScanning,
      AlreadyDisconnecting,
      NotConnected,
      UnknownCapability,
      DriverRejected,
      // asynchronous failures
      Driver,
      DisconnectedWhileWorking,
      NotFound,
      Abandoned,
    };

    const char* toString(LinkErrorCode code);

    /**
 * @class LinkError
 * @brief `std::runtime_error` tagged with a LinkErrorCode and, for driver
 *        reported failures, the original DriverError.
 */
    class LinkError : public std::runtime_error {
    public:
      LinkError(LinkErrorCode code, const std::string& what);
      LinkError(DriverError driverError, const std::string& context);

      LinkErrorCode code() const noexcept { return code_; }
      const std::optional<DriverError>& driverError() const noexcept { return driverError_; }

    private:
      LinkErrorCode code_;
      std::optional<DriverError> driverError_{};
    };

  } // namespace link
} // namespace linkbridge
