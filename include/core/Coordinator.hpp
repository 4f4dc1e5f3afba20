#pragma once

/** @file  Coordinator.hpp
 *  @brief Driver readiness, the single discovery session, and event dispatch
 *         to link sessions.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

// LinkBridge headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/IdentityCache.hpp"
#include "core/Logger.hpp"
#include "core/StateBroadcast.hpp"
#include "core/Stream.hpp"
#include "io/DriverEvent.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace io {
    class LinkDriver;
  } // namespace io
  namespace link {
    class LinkSession;
  } // namespace link

  namespace core {

    using SessionRef = std::shared_ptr<link::LinkSession>;

    /**
 * @class Coordinator
 * @brief Owns the IdentityCache and the discovery session; routes every driver
 *        event to the session it names.
 *
 *  * Always owned by a shared_ptr (see create()); the driver sink and the
 *    discovery stream hold it weakly.
 *  * Never mutates a session directly, only forwards events to it.
 *  * Connection-level driver failures are also reported to the ErrorMonitor.
 */
    class Coordinator : public std::enable_shared_from_this<Coordinator> {
      struct Passkey {
        explicit Passkey() = default;
      };

    public:
      static std::shared_ptr<Coordinator> create(std::shared_ptr<io::LinkDriver> driver,
                                                 std::shared_ptr<ErrorMonitor> errMonitor = nullptr,
                                                 std::shared_ptr<Logger> logger = nullptr);

      Coordinator(Passkey, std::shared_ptr<io::LinkDriver> driver, std::shared_ptr<ErrorMonitor> errMonitor,
                  std::shared_ptr<Logger> logger);
      ~Coordinator(); ///< detaches from the driver, stops an active scan

      // ---- readiness ----------------------------------------------------------
      /// Re-reads the driver readiness, publishes it and returns a subscription.
      Stream<link::RadioState> start();
      const StateBroadcast<link::RadioState>& radioState() const { return radio_; }

      // ---- discovery ----------------------------------------------------------
      const StateBroadcast<bool>& scanning() const { return scanning_; }

      /**
       * Starts a scan; each device is surfaced once per discovery session.
       * Dropping or cancelling the stream stops the driver scan.
       * @throws link::LinkError NotPoweredOn / AlreadyScanning before any driver command.
       */
      Stream<SessionRef> beginDiscovery(const std::vector<link::GroupId>& groups);
      /// Uses the scan filter from the applied LinkConfig.
      Stream<SessionRef> beginDiscovery();
      /// Imperative stop; no-op when not scanning.
      void stopDiscovery();

      // ---- sessions -----------------------------------------------------------
      SessionRef session(const link::DeviceId& id);
      std::vector<SessionRef> retrieveSessions(const std::vector<link::DeviceId>& ids);
      std::vector<SessionRef> retrieveLinkedSessions(const std::vector<link::GroupId>& groups);

      Stream<link::ConnectionState> connect(const link::DeviceId& id);
      Stream<link::ConnectionState> cancelConnection(const link::DeviceId& id);

      // ---- configuration / plumbing ------------------------------------------
      void applyConfig(const LinkConfig& cfg);

      /// Driver event entry point (the registered sink forwards here).
      void handleEvent(const io::DriverEvent& event);

      IdentityCache& cache() { return cache_; }
      Logger& logger() { return *logger_; }

      Coordinator(const Coordinator&) = delete;
      Coordinator& operator=(const Coordinator&) = delete;

    private:
      struct DiscoverySession {
        std::uint64_t token{ 0 };
        std::set<link::DeviceId> seen; ///< de-dupe set
        StreamWriter<SessionRef> writer;
      };

      void attachToDriver();
      void onRadioState(link::RadioState state);
      void onDeviceDiscovered(const io::events::DeviceDiscovered& ev);
      void stopDiscovery(std::uint64_t token);
      void endDiscovery(bool stopDriverScan);
      void escalate(const std::string& message);

      std::shared_ptr<io::LinkDriver> driver_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      IdentityCache cache_;

      mutable std::recursive_mutex mtx_;
      StateBroadcast<link::RadioState> radio_{ link::RadioState::Unknown };
      StateBroadcast<bool> scanning_{ false };
      std::optional<DiscoverySession> discovery_;
      std::uint64_t nextToken_{ 1 };
      std::vector<link::GroupId> defaultScanGroups_;
    };

  } // namespace core
} // namespace linkbridge
