/* @file IdentityCache.cpp
 * @brief resolve-or-create store of link sessions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// LinkBridge headers
#include "core/IdentityCache.hpp"
#include "link/LinkSession.hpp"

namespace linkbridge {
  namespace core {

    IdentityCache::IdentityCache(Factory factory) : factory_(std::move(factory)) {
      if (!factory_)
        throw std::invalid_argument("[IdentityCache] session factory is empty");
    }

    std::shared_ptr<link::LinkSession> IdentityCache::resolveOrCreate(const link::DeviceId& id) {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = sessions_.find(id);
      if (it != sessions_.end())
        return it->second;

      auto session = factory_(id);
      if (!session)
        throw std::runtime_error("[IdentityCache] factory returned no session for " + id);
      sessions_.emplace(id, session);
      return session;
    }

    std::shared_ptr<link::LinkSession> IdentityCache::find(const link::DeviceId& id) const {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = sessions_.find(id);
      return it == sessions_.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<link::LinkSession>> IdentityCache::sessions() const {
      std::lock_guard<std::mutex> lk(mtx_);
      std::vector<std::shared_ptr<link::LinkSession>> out;
      out.reserve(sessions_.size());
      for (const auto& [id, session] : sessions_)
        out.push_back(session);
      return out;
    }

    std::size_t IdentityCache::size() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return sessions_.size();
    }

  } // namespace core
} // namespace linkbridge
