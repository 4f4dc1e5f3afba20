#pragma once
/** @file  Item.hpp
 *  @brief Discovered characteristic-like capability of a Group.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <optional>

// LinkBridge headers
#include "core/StateBroadcast.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace link {

    class Group;
    class LinkSession;

    /**
 * @class Item
 * @brief Addressable sub-capability with three independent observable slots.
 *
 *  * `value()`  : last known bytes (read response or notification), never
 *                 cleared by a failure.
 *  * `error()`  : last reported error, never cleared by a value.
 *  * `subscribed()` : notification/indication active flag.
 *  * Only the owning LinkSession publishes; everyone else observes.
 *  * Holds its Group weakly; the Group owns the Item.
 */
    class Item {
    public:
      Item(ItemId id, std::uint8_t properties, GroupId groupId, std::weak_ptr<Group> group);

      const ItemId& id() const { return id_; }
      const GroupId& groupId() const { return groupId_; }
      ItemRef ref() const { return { groupId_, id_ }; }

      std::uint8_t properties() const { return properties_; }
      bool has(ItemProperty p) const { return (properties_ & p) != 0; }

      /// Owning group, or nullptr once the tree is gone.
      std::shared_ptr<Group> group() const { return group_.lock(); }

      const core::StateBroadcast<std::optional<Bytes>>& value() const { return value_; }
      const core::StateBroadcast<std::optional<DriverError>>& error() const { return error_; }
      const core::StateBroadcast<bool>& subscribed() const { return subscribed_; }

      Item(const Item&) = delete;
      Item& operator=(const Item&) = delete;

    private:
      friend class LinkSession;

      const ItemId id_;
      const GroupId groupId_;
      const std::uint8_t properties_;
      std::weak_ptr<Group> group_;

      core::StateBroadcast<std::optional<Bytes>> value_{ std::nullopt };
      core::StateBroadcast<std::optional<DriverError>> error_{ std::nullopt };
      core::StateBroadcast<bool> subscribed_{ false };
    };

  } // namespace link
} // namespace linkbridge
