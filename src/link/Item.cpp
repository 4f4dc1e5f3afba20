/* @file Item.cpp
 * @brief capability leaf of the tree
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// LinkBridge headers
#include "link/Item.hpp"

using namespace linkbridge::link;

Item::Item(ItemId id, std::uint8_t properties, GroupId groupId, std::weak_ptr<Group> group)
    : id_(std::move(id)), groupId_(std::move(groupId)), properties_(properties), group_(std::move(group)) {}
