/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// LinkBridge headers
#include "core/ErrorMonitor.hpp"

namespace linkbridge {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lk(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!markSeen(message))
          return;
        escalate = escalation_;
      }
      // outside the lock: the callback may call back into us
      if (escalate)
        escalate(message);
    }

    void ErrorMonitor::clear() {
      std::lock_guard<std::mutex> lk(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::markSeen(const std::string& message) {
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace linkbridge
