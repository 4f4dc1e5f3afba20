/* @file DriverEvent.cpp
 * @brief log tags for driver events
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iterator>

// LinkBridge headers
#include "io/DriverEvent.hpp"

namespace linkbridge {
  namespace io {

    const char* eventName(const DriverEvent& event) {
      static constexpr const char* kNames[] = {
        "radio-state-changed", "device-discovered",   "link-established",    "link-failed",
        "link-dropped",        "groups-discovered",   "items-discovered",    "value-updated",
        "write-completed",     "subscription-changed", "name-updated",       "signal-strength-read",
      };
      static_assert(std::size(kNames) == std::variant_size_v<DriverEvent>,
                    "DriverEvent alternatives changed please update eventName()");
      return kNames[event.index()];
    }

  } // namespace io
} // namespace linkbridge
