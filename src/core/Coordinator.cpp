/* @file Coordinator.cpp
 * @brief readiness tracking, discovery session lifecycle and driver event routing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// LinkBridge headers
#include "core/Coordinator.hpp"
#include "io/LinkDriver.hpp"
#include "link/LinkError.hpp"
#include "link/LinkSession.hpp"

namespace linkbridge {
  namespace core {

    using link::LinkError;
    using link::LinkErrorCode;
    using link::RadioState;

    namespace {
      constexpr const char* kComponent = "Coordinator";
    }

    std::shared_ptr<Coordinator> Coordinator::create(std::shared_ptr<io::LinkDriver> driver,
                                                     std::shared_ptr<ErrorMonitor> errMonitor,
                                                     std::shared_ptr<Logger> logger) {
      auto coordinator =
          std::make_shared<Coordinator>(Passkey{}, std::move(driver), std::move(errMonitor), std::move(logger));
      coordinator->attachToDriver();
      return coordinator;
    }

    Coordinator::Coordinator(Passkey, std::shared_ptr<io::LinkDriver> driver,
                             std::shared_ptr<ErrorMonitor> errMonitor, std::shared_ptr<Logger> logger)
        : driver_(std::move(driver)),
          errorMonitor_(errMonitor ? std::move(errMonitor) : std::make_shared<ErrorMonitor>()),
          logger_(logger ? std::move(logger) : std::make_shared<Logger>()),
          cache_([this](const link::DeviceId& id) { return std::make_shared<link::LinkSession>(id, driver_, logger_); }) {
      if (!driver_)
        throw std::invalid_argument("[Coordinator] driver is nullptr");
    }

    Coordinator::~Coordinator() {
      driver_->setEventSink(nullptr);

      std::lock_guard<std::recursive_mutex> lk(mtx_);
      if (discovery_)
        endDiscovery(true);
    }

    void Coordinator::attachToDriver() {
      std::weak_ptr<Coordinator> weak = weak_from_this();
      driver_->setEventSink([weak](const io::DriverEvent& event) {
        if (auto self = weak.lock())
          self->handleEvent(event);
      });

      std::lock_guard<std::recursive_mutex> lk(mtx_);
      radio_.publish(driver_->radioState());
    }

    // ---------------------------------------------------------------------------
    // readiness
    // ---------------------------------------------------------------------------

    Stream<RadioState> Coordinator::start() {
      std::lock_guard<std::recursive_mutex> lk(mtx_);
      const auto state = driver_->radioState();
      if (state != radio_.current())
        onRadioState(state);
      return radio_.subscribe();
    }

    void Coordinator::onRadioState(RadioState state) {
      std::lock_guard<std::recursive_mutex> lk(mtx_);
      if (state == radio_.current())
        return;

      logger_->info(kComponent, std::string("radio ") + link::toString(radio_.current()) + " -> " + link::toString(state));
      radio_.publish(state);

      if (state != RadioState::PoweredOn && discovery_) {
        logger_->warn(kComponent, "radio left PoweredOn, ending discovery");
        endDiscovery(false);
      }
    }

    // ---------------------------------------------------------------------------
    // discovery
    // ---------------------------------------------------------------------------

    Stream<SessionRef> Coordinator::beginDiscovery() {
      std::vector<link::GroupId> groups;
      {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        groups = defaultScanGroups_;
      }
      return beginDiscovery(groups);
    }

    Stream<SessionRef> Coordinator::beginDiscovery(const std::vector<link::GroupId>& groups) {
      std::lock_guard<std::recursive_mutex> lk(mtx_);

      if (radio_.current() != RadioState::PoweredOn)
        throw LinkError(LinkErrorCode::NotPoweredOn,
                        std::string("[Coordinator] discovery needs a powered-on driver, state is ")
                            + link::toString(radio_.current()));
      if (discovery_)
        throw LinkError(LinkErrorCode::AlreadyScanning, "[Coordinator] a discovery session is already active");

      const auto token = nextToken_++;
      std::weak_ptr<Coordinator> weak = weak_from_this();
      auto [writer, stream] = makeStream<SessionRef>([weak, token] {
        if (auto self = weak.lock())
          self->stopDiscovery(token);
      });

      discovery_ = DiscoverySession{ token, {}, std::move(writer) };
      scanning_.publish(true);
      logger_->info(kComponent, "discovery #" + std::to_string(token) + " started");

      driver_->startScan(groups);
      return std::move(stream);
    }

    void Coordinator::stopDiscovery() {
      std::lock_guard<std::recursive_mutex> lk(mtx_);
      if (!discovery_)
        return;
      endDiscovery(true);
    }

    void Coordinator::stopDiscovery(std::uint64_t token) {
      std::lock_guard<std::recursive_mutex> lk(mtx_);
      if (!discovery_ || discovery_->token != token)
        return; // already ended, or a newer session
      endDiscovery(true);
    }

    void Coordinator::endDiscovery(bool stopDriverScan) {
      if (stopDriverScan)
        driver_->stopScan();

      logger_->info(kComponent, "discovery #" + std::to_string(discovery_->token) + " ended after "
                                    + std::to_string(discovery_->seen.size()) + " device(s)");
      discovery_->writer.finish();
      discovery_.reset();
      scanning_.publish(false);
    }

    void Coordinator::onDeviceDiscovered(const io::events::DeviceDiscovered& ev) {
      std::lock_guard<std::recursive_mutex> lk(mtx_);
      if (!discovery_) {
        logger_->debug(kComponent, "discovery result for " + ev.device + " outside a discovery session");
        return;
      }

      auto s = cache_.resolveOrCreate(ev.device);
      s->noteAdvertisement(ev.name, ev.advertisement, ev.rssi);

      if (discovery_->seen.insert(ev.device).second)
        discovery_->writer.push(std::move(s));
    }

    // ---------------------------------------------------------------------------
    // sessions
    // ---------------------------------------------------------------------------

    SessionRef Coordinator::session(const link::DeviceId& id) { return cache_.resolveOrCreate(id); }

    std::vector<SessionRef> Coordinator::retrieveSessions(const std::vector<link::DeviceId>& ids) {
      std::vector<SessionRef> out;
      for (const auto& id : driver_->knownDevices(ids))
        out.push_back(cache_.resolveOrCreate(id));
      return out;
    }

    std::vector<SessionRef> Coordinator::retrieveLinkedSessions(const std::vector<link::GroupId>& groups) {
      std::vector<SessionRef> out;
      for (const auto& id : driver_->linkedDevices(groups))
        out.push_back(cache_.resolveOrCreate(id));
      return out;
    }

    Stream<link::ConnectionState> Coordinator::connect(const link::DeviceId& id) { return session(id)->connect(); }

    Stream<link::ConnectionState> Coordinator::cancelConnection(const link::DeviceId& id) {
      return session(id)->cancelConnection();
    }

    void Coordinator::applyConfig(const LinkConfig& cfg) {
      logger_->setThreshold(cfg.logLevel);
      if (!cfg.logFile.empty() && !logger_->startNewRun(cfg.logFile))
        throw std::runtime_error("[Coordinator] cannot open log file " + cfg.logFile);

      std::lock_guard<std::recursive_mutex> lk(mtx_);
      defaultScanGroups_ = cfg.scanGroups;
    }

    // ---------------------------------------------------------------------------
    // driver event routing
    // ---------------------------------------------------------------------------

    void Coordinator::handleEvent(const io::DriverEvent& event) {
      namespace ev = io::events;

      auto forward = [this, &event](const link::DeviceId& id) {
        auto s = cache_.find(id);
        if (!s) {
          logger_->warn(kComponent, std::string(io::eventName(event)) + " for unknown device " + id);
          return;
        }
        s->handleEvent(event);
      };

      std::visit(io::Overloaded{
                     [this](const ev::RadioStateChanged& e) { onRadioState(e.state); },
                     [this](const ev::DeviceDiscovered& e) { onDeviceDiscovered(e); },
                     [this, &forward](const ev::LinkFailed& e) {
                       forward(e.device);
                       escalate(e.device + " failed to connect: [" + std::to_string(e.error.code) + "] "
                                + e.error.message);
                     },
                     [this, &forward](const ev::LinkDropped& e) {
                       forward(e.device);
                       if (e.error)
                         escalate(e.device + " link dropped: [" + std::to_string(e.error->code) + "] "
                                  + e.error->message);
                     },
                     [&forward](const auto& e) { forward(e.device); },
                 },
                 event);
    }

    void Coordinator::escalate(const std::string& message) {
      logger_->error(kComponent, message);
      errorMonitor_->notifyFailure("[Coordinator] " + message);
    }

  } // namespace core
} // namespace linkbridge
