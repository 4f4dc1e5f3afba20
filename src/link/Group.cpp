/* @file Group.cpp
 * @brief capability tree nodes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// LinkBridge headers
#include "link/Group.hpp"
#include "link/Item.hpp"

using namespace linkbridge::link;

Group::Group(GroupId id, bool primary, DeviceId device, std::weak_ptr<LinkSession> session)
    : id_(std::move(id)), primary_(primary), device_(std::move(device)), session_(std::move(session)) {}

std::vector<std::shared_ptr<Item>> Group::items() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return items_;
}

std::shared_ptr<Item> Group::item(const ItemId& id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = std::find_if(items_.begin(), items_.end(), [&](const auto& i) { return i->id() == id; });
  return it == items_.end() ? nullptr : *it;
}

std::shared_ptr<Item> Group::attach(const ItemInfo& info) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = std::find_if(items_.begin(), items_.end(), [&](const auto& i) { return i->id() == info.id; });
  if (it != items_.end())
    return *it;

  auto created = std::make_shared<Item>(info.id, info.properties, id_, weak_from_this());
  items_.push_back(created);
  return created;
}
