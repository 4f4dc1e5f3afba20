#pragma once
/** @file  Group.hpp
 *  @brief Discovered service-like capability grouping of a Link Session.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <memory>
#include <mutex>
#include <vector>

// LinkBridge headers
#include "link/Item.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace link {

    class LinkSession;

    /**
 * @class Group
 * @brief Owns its Items in discovery order; refers back to its session weakly.
 *
 *  * Created by the session on a discovery response, never mutated afterwards
 *    except to attach Items.
 *  * `items()` returns a snapshot safe to read from any thread.
 */
    class Group : public std::enable_shared_from_this<Group> {
    public:
      Group(GroupId id, bool primary, DeviceId device, std::weak_ptr<LinkSession> session);

      const GroupId& id() const { return id_; }
      bool isPrimary() const { return primary_; }
      const DeviceId& device() const { return device_; }

      std::shared_ptr<LinkSession> session() const { return session_.lock(); }

      std::vector<std::shared_ptr<Item>> items() const;
      std::shared_ptr<Item> item(const ItemId& id) const;

      Group(const Group&) = delete;
      Group& operator=(const Group&) = delete;

    private:
      friend class LinkSession;

      /// Returns the existing Item for info.id or appends a new one.
      std::shared_ptr<Item> attach(const ItemInfo& info);

      const GroupId id_;
      const bool primary_;
      const DeviceId device_;
      std::weak_ptr<LinkSession> session_;

      mutable std::mutex mtx_;
      std::vector<std::shared_ptr<Item>> items_; ///< discovery order
    };

    using GroupMap = std::map<GroupId, std::shared_ptr<Group>>;
    using ItemMap = std::map<ItemId, std::shared_ptr<Item>>;

  } // namespace link
} // namespace linkbridge
