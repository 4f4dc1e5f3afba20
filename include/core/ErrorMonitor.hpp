#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace linkbridge::core {

  /**
 * @class ErrorMonitor
 * @brief The coordinator calls `notifyFailure()` for every connection-level
 *        driver failure; we call the registered escalation callback exactly
 *        once per unique message.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the application doesn't get spammed.
 * * `clear()` re-arms every message (e.g. after the user acknowledged).
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a link fault to the application.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called on fault; will forward to the escalation callback if new.
    virtual void notifyFailure(const std::string& message);

    /// Forget every message seen so far.
    void clear();

    std::size_t uniqueFailures() const;

  private:
    bool markSeen(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace linkbridge::core
