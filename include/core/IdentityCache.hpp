#pragma once
/** @file  IdentityCache.hpp
 *  @brief Device identifier -> the one LinkSession for that device.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "link/LinkTypes.hpp"

namespace linkbridge {
  namespace link {
    class LinkSession;
  } // namespace link

  namespace core {

    /**
 * @class IdentityCache
 * @brief Lazily creates one LinkSession per identifier and hands the same
 *        instance back on every later lookup, whatever the call path.
 *
 *  * Owned by the Coordinator; lives exactly as long as it does.
 *  * Sessions are never evicted; disconnection does not remove them.
 *  * Thread-safe; creation happens under the lock so two racing lookups
 *    cannot both create.
 */
    class IdentityCache {
    public:
      using Factory = std::function<std::shared_ptr<link::LinkSession>(const link::DeviceId&)>;

      explicit IdentityCache(Factory factory);

      std::shared_ptr<link::LinkSession> resolveOrCreate(const link::DeviceId& id);

      /// nullptr if \p id was never referenced.
      std::shared_ptr<link::LinkSession> find(const link::DeviceId& id) const;

      std::vector<std::shared_ptr<link::LinkSession>> sessions() const;
      std::size_t size() const;

      IdentityCache(const IdentityCache&) = delete;
      IdentityCache& operator=(const IdentityCache&) = delete;

    private:
      Factory factory_;
      mutable std::mutex mtx_;
      std::unordered_map<link::DeviceId, std::shared_ptr<link::LinkSession>> sessions_;
    };

  } // namespace core
} // namespace linkbridge
