/* @file LinkSession.cpp
 * @brief per-device state machine, capability tree and FIFO request correlation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// LinkBridge headers
#include "core/Logger.hpp"
#include "io/LinkDriver.hpp"
#include "link/LinkError.hpp"
#include "link/LinkSession.hpp"

using namespace linkbridge::link;
using linkbridge::core::Pending;
using linkbridge::core::Stream;

namespace {
  constexpr const char* kComponent = "LinkSession";

  std::exception_ptr abandonedError(const DeviceId& id) {
    return std::make_exception_ptr(LinkError(LinkErrorCode::Abandoned, id + ": request abandoned by caller"));
  }

  /// Restricts \p found to \p filter (all of it when the filter is empty) and
  /// collects the requested ids the device did not report.
  template <typename Map>
  Map narrow(const Map& found, const std::vector<std::string>& filter, std::vector<std::string>& missing) {
    if (filter.empty())
      return found;
    Map out;
    for (const auto& id : filter) {
      auto it = found.find(id);
      if (it == found.end())
        missing.push_back(id);
      else
        out.emplace(id, it->second);
    }
    return out;
  }

  std::string join(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids)
      out += (out.empty() ? "" : ", ") + id;
    return out;
  }

  std::string label(const ItemRef& ref) { return ref.group + "/" + ref.item; }
} // namespace

LinkSession::LinkSession(DeviceId id, std::shared_ptr<io::LinkDriver> driver,
                         std::shared_ptr<core::Logger> logger)
    : id_(std::move(id)), driver_(std::move(driver)), logger_(std::move(logger)),
      groupDiscoveries_(abandonedError(id_)), itemDiscoveries_(abandonedError(id_)),
      reads_(abandonedError(id_)), writes_(abandonedError(id_)), subscriptions_(abandonedError(id_)),
      signalReads_(abandonedError(id_)) {
  if (!driver_)
    throw std::invalid_argument("[LinkSession] driver is nullptr");
  if (!logger_)
    logger_ = std::make_shared<core::Logger>();
}

// ---------------------------------------------------------------------------
// link lifecycle
// ---------------------------------------------------------------------------

Stream<ConnectionState> LinkSession::connect() {
  std::lock_guard<std::recursive_mutex> lk(mtx_);

  const auto current = state_.current();
  if (current.is(ConnectionState::Kind::Connecting) || current.is(ConnectionState::Kind::Connected)) {
    logger_->debug(kComponent, id_ + ": connect ignored, already " + describe(current));
    return state_.subscribe();
  }
  if (current.is(ConnectionState::Kind::Disconnecting))
    throw LinkError(LinkErrorCode::AlreadyDisconnecting, id_ + ": connect while a cancel is in progress");

  transition(ConnectionState::connecting());
  auto stream = state_.subscribe();
  driver_->connect(id_);
  return stream;
}

Stream<ConnectionState> LinkSession::cancelConnection() {
  std::lock_guard<std::recursive_mutex> lk(mtx_);

  const auto current = state_.current();
  if (current.isDown() || current.is(ConnectionState::Kind::Disconnecting)) {
    logger_->debug(kComponent, id_ + ": cancel ignored, already " + describe(current));
    return state_.subscribe();
  }

  transition(ConnectionState::disconnecting());
  auto stream = state_.subscribe();
  driver_->cancelConnection(id_);
  return stream;
}

void LinkSession::transition(ConnectionState next) {
  logger_->debug(kComponent, id_ + ": " + describe(state_.current()) + " -> " + describe(next));
  state_.publish(std::move(next));
}

void LinkSession::enterDown(ConnectionState next) {
  const std::string reason = describe(next);
  transition(std::move(next));

  auto failure = std::make_exception_ptr(
      LinkError(LinkErrorCode::DisconnectedWhileWorking, id_ + " went " + reason + " with the request outstanding"));
  std::size_t failed = groupDiscoveries_.drain(failure) + itemDiscoveries_.drain(failure) + reads_.drain(failure)
                       + writes_.drain(failure) + subscriptions_.drain(failure) + signalReads_.drain(failure);
  if (failed > 0)
    logger_->warn(kComponent, id_ + ": failed " + std::to_string(failed) + " outstanding request(s) on " + reason);

  for (const auto& g : groups_) {
    for (const auto& i : g->items()) {
      if (i->subscribed_.current())
        i->subscribed_.publish(false);
    }
  }
}

void LinkSession::onLinkEstablished() {
  if (!state_.current().is(ConnectionState::Kind::Connecting)) {
    logger_->warn(kComponent, id_ + ": link-established ignored in state " + describe(state_.current()));
    return;
  }
  transition(ConnectionState::connected());
}

void LinkSession::onLinkFailed(const DriverError& error) {
  const auto current = state_.current();
  if (!current.is(ConnectionState::Kind::Connecting) && !current.is(ConnectionState::Kind::Disconnecting)) {
    logger_->warn(kComponent, id_ + ": link-failed ignored in state " + describe(state_.current()));
    return;
  }
  enterDown(ConnectionState::failedToConnect(error));
}

void LinkSession::onLinkDropped(const std::optional<DriverError>& error) {
  if (state_.current().isDown()) {
    logger_->debug(kComponent, id_ + ": link-dropped ignored, already " + describe(state_.current()));
    return;
  }
  enterDown(ConnectionState::disconnected(error));
}

// ---------------------------------------------------------------------------
// capability tree
// ---------------------------------------------------------------------------

std::vector<std::shared_ptr<Group>> LinkSession::groups() const {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  return groups_;
}

std::shared_ptr<Group> LinkSession::group(const GroupId& id) const {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  auto it = std::find_if(groups_.begin(), groups_.end(), [&](const auto& g) { return g->id() == id; });
  return it == groups_.end() ? nullptr : *it;
}

std::shared_ptr<Item> LinkSession::item(const ItemRef& ref) const {
  auto g = group(ref.group);
  return g ? g->item(ref.item) : nullptr;
}

// ---------------------------------------------------------------------------
// requests
// ---------------------------------------------------------------------------

void LinkSession::requireConnected(const char* operation) const {
  const auto current = state_.current();
  if (!current.is(ConnectionState::Kind::Connected))
    throw LinkError(LinkErrorCode::NotConnected,
                    id_ + ": " + operation + " requires a connected link (state " + describe(current) + ")");
}

std::shared_ptr<Group> LinkSession::ownGroup(const std::shared_ptr<Group>& g, const char* operation) const {
  if (!g || g->device() != id_ || group(g->id()) != g)
    throw LinkError(LinkErrorCode::UnknownCapability,
                    id_ + ": " + operation + " on a group that does not belong to this device");
  return g;
}

std::shared_ptr<Item> LinkSession::ownItem(const std::shared_ptr<Item>& i, const char* operation) const {
  if (!i || item(i->ref()) != i)
    throw LinkError(LinkErrorCode::UnknownCapability,
                    id_ + ": " + operation + " on an item that does not belong to this device");
  return i;
}

std::exception_ptr LinkSession::driverFailure(const DriverError& error, const std::string& what) const {
  return std::make_exception_ptr(LinkError(error, id_ + ": " + what));
}

Pending<GroupMap> LinkSession::discoverGroups(std::vector<GroupId> filter, Lookup lookup) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  requireConnected("discover groups");

  auto pending = groupDiscoveries_.enqueue(id_, DiscoveryContext{ filter, lookup });
  driver_->discoverGroups(id_, filter);
  return pending;
}

Pending<ItemMap> LinkSession::discoverItems(const std::shared_ptr<Group>& g, std::vector<ItemId> filter,
                                            Lookup lookup) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  requireConnected("discover items");
  ownGroup(g, "discover items");

  auto pending = itemDiscoveries_.enqueue(g->id(), DiscoveryContext{ filter, lookup });
  driver_->discoverItems(id_, g->id(), filter);
  return pending;
}

Pending<Bytes> LinkSession::read(const std::shared_ptr<Item>& i) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  requireConnected("read");
  ownItem(i, "read");

  auto pending = reads_.enqueue(i->ref());
  driver_->read(id_, i->ref());
  return pending;
}

Pending<void> LinkSession::write(const std::shared_ptr<Item>& i, const Bytes& value) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  requireConnected("write");
  ownItem(i, "write");

  const auto ref = i->ref();
  auto pending = writes_.enqueue(ref);
  if (!driver_->write(id_, ref, value, true)) {
    auto rejected = LinkError(LinkErrorCode::DriverRejected, id_ + ": write to " + label(ref));
    writes_.failLast(ref, std::make_exception_ptr(rejected));
    throw rejected;
  }
  return pending;
}

void LinkSession::writeWithoutAck(const std::shared_ptr<Item>& i, const Bytes& value) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  requireConnected("write without ack");
  ownItem(i, "write without ack");

  if (!driver_->write(id_, i->ref(), value, false))
    throw LinkError(LinkErrorCode::DriverRejected, id_ + ": write without ack to " + label(i->ref()));
}

Pending<bool> LinkSession::setSubscription(const std::shared_ptr<Item>& i, bool enabled) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  ownItem(i, "set subscription");
  if (i->subscribed_.current() == enabled)
    return Pending<bool>::ready(enabled);
  requireConnected("set subscription");

  auto pending = subscriptions_.enqueue(i->ref());
  driver_->setSubscription(id_, i->ref(), enabled);
  return pending;
}

Pending<int> LinkSession::readSignalStrength() {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  requireConnected("read signal strength");

  auto pending = signalReads_.enqueue(id_);
  driver_->readSignalStrength(id_);
  return pending;
}

std::size_t LinkSession::pendingRequests() const {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  return groupDiscoveries_.size() + itemDiscoveries_.size() + reads_.size() + writes_.size()
         + subscriptions_.size() + signalReads_.size();
}

// ---------------------------------------------------------------------------
// driver events
// ---------------------------------------------------------------------------

void LinkSession::handleEvent(const io::DriverEvent& event) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  namespace ev = io::events;

  std::visit(io::Overloaded{
                 [this](const ev::LinkEstablished&) { onLinkEstablished(); },
                 [this](const ev::LinkFailed& e) { onLinkFailed(e.error); },
                 [this](const ev::LinkDropped& e) { onLinkDropped(e.error); },
                 [this](const ev::GroupsDiscovered& e) { onGroupsDiscovered(e); },
                 [this](const ev::ItemsDiscovered& e) { onItemsDiscovered(e); },
                 [this](const ev::ValueUpdated& e) { onValueUpdated(e); },
                 [this](const ev::WriteCompleted& e) { onWriteCompleted(e); },
                 [this](const ev::SubscriptionChanged& e) { onSubscriptionChanged(e); },
                 [this](const ev::SignalStrengthRead& e) { onSignalStrengthRead(e); },
                 [this](const ev::NameUpdated& e) { name_.publish(e.name); },
                 [this](const ev::DeviceDiscovered& e) { noteAdvertisement(e.name, e.advertisement, e.rssi); },
                 [this, &event](const ev::RadioStateChanged&) {
                   logger_->warn(kComponent, id_ + ": unexpected " + io::eventName(event));
                 },
             },
             event);
}

void LinkSession::noteAdvertisement(const std::optional<std::string>& name, const Bytes& data,
                                    std::optional<int> rssi) {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  if (name && name_.current() != name)
    name_.publish(name);
  advertisement_.publish(data);
  if (rssi)
    rssi_.publish(rssi);
}

void LinkSession::onGroupsDiscovered(const io::events::GroupsDiscovered& ev) {
  auto entry = groupDiscoveries_.pop(id_);
  if (ev.error) {
    if (entry)
      entry->slot->fail(driverFailure(*ev.error, "discover groups"));
    else
      logger_->warn(kComponent, id_ + ": unsolicited group discovery error " + ev.error->message);
    return;
  }

  GroupMap reported;
  for (const auto& info : ev.groups) {
    auto g = group(info.id);
    if (!g) {
      g = std::make_shared<Group>(info.id, info.primary, id_, weak_from_this());
      groups_.push_back(g);
    }
    reported.emplace(info.id, g);
  }

  if (!entry) {
    logger_->debug(kComponent, id_ + ": unsolicited group discovery merged into tree");
    return;
  }
  if (entry->slot->abandoned()) {
    logger_->debug(kComponent, id_ + ": discarding group discovery for abandoned request");
    return;
  }

  std::vector<std::string> missing;
  auto result = narrow(reported, entry->context.filter, missing);
  if (!missing.empty() && entry->context.lookup == Lookup::RequireAll) {
    entry->slot->fail(std::make_exception_ptr(
        LinkError(LinkErrorCode::NotFound, id_ + ": group(s) not found: " + join(missing))));
    return;
  }
  entry->slot->resolve(std::move(result));
}

void LinkSession::onItemsDiscovered(const io::events::ItemsDiscovered& ev) {
  auto entry = itemDiscoveries_.pop(ev.group);
  if (ev.error) {
    if (entry)
      entry->slot->fail(driverFailure(*ev.error, "discover items of " + ev.group));
    else
      logger_->warn(kComponent, id_ + ": unsolicited item discovery error " + ev.error->message);
    return;
  }

  auto g = group(ev.group);
  if (!g) {
    logger_->warn(kComponent, id_ + ": items reported for unknown group " + ev.group);
    if (entry)
      entry->slot->fail(std::make_exception_ptr(
          LinkError(LinkErrorCode::UnknownCapability, id_ + ": unknown group " + ev.group)));
    return;
  }

  ItemMap reported;
  for (const auto& info : ev.items)
    reported.emplace(info.id, g->attach(info));

  if (!entry) {
    logger_->debug(kComponent, id_ + ": unsolicited item discovery merged into " + ev.group);
    return;
  }
  if (entry->slot->abandoned()) {
    logger_->debug(kComponent, id_ + ": discarding item discovery for abandoned request");
    return;
  }

  std::vector<std::string> missing;
  auto result = narrow(reported, entry->context.filter, missing);
  if (!missing.empty() && entry->context.lookup == Lookup::RequireAll) {
    entry->slot->fail(std::make_exception_ptr(
        LinkError(LinkErrorCode::NotFound, id_ + ": item(s) not found in " + ev.group + ": " + join(missing))));
    return;
  }
  entry->slot->resolve(std::move(result));
}

void LinkSession::onValueUpdated(const io::events::ValueUpdated& ev) {
  auto i = item(ev.item);
  if (!i) {
    logger_->warn(kComponent, id_ + ": value for unknown item " + label(ev.item));
    return;
  }

  if (ev.error)
    i->error_.publish(ev.error);
  else
    i->value_.publish(ev.value);

  // a pending read claims the update; otherwise it was a notification
  auto entry = reads_.pop(ev.item);
  if (!entry)
    return;
  if (entry->slot->abandoned()) {
    logger_->debug(kComponent, id_ + ": discarding read of " + label(ev.item) + " for abandoned request");
    return;
  }
  if (ev.error)
    entry->slot->fail(driverFailure(*ev.error, "read " + label(ev.item)));
  else
    entry->slot->resolve(ev.value);
}

void LinkSession::onWriteCompleted(const io::events::WriteCompleted& ev) {
  auto entry = writes_.pop(ev.item);
  if (ev.error) {
    if (auto i = item(ev.item))
      i->error_.publish(ev.error);
  }

  if (!entry) {
    logger_->warn(kComponent, id_ + ": unsolicited write completion for " + label(ev.item));
    return;
  }
  if (entry->slot->abandoned())
    return;
  if (ev.error)
    entry->slot->fail(driverFailure(*ev.error, "write " + label(ev.item)));
  else
    entry->slot->resolve();
}

void LinkSession::onSubscriptionChanged(const io::events::SubscriptionChanged& ev) {
  auto entry = subscriptions_.pop(ev.item);
  auto i = item(ev.item);

  if (ev.error) {
    if (i)
      i->error_.publish(ev.error);
  } else if (i && i->subscribed_.current() != ev.enabled) {
    i->subscribed_.publish(ev.enabled);
  }

  if (!entry || entry->slot->abandoned())
    return;
  if (ev.error)
    entry->slot->fail(driverFailure(*ev.error, "set subscription on " + label(ev.item)));
  else
    entry->slot->resolve(ev.enabled);
}

void LinkSession::onSignalStrengthRead(const io::events::SignalStrengthRead& ev) {
  auto entry = signalReads_.pop(id_);
  if (!ev.error)
    rssi_.publish(ev.rssi);

  if (!entry || entry->slot->abandoned())
    return;
  if (ev.error)
    entry->slot->fail(driverFailure(*ev.error, "read signal strength"));
  else
    entry->slot->resolve(ev.rssi);
}
