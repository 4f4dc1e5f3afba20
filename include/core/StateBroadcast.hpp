#pragma once
/** @file  StateBroadcast.hpp
 *  @brief Current-value + multi-subscriber observable used for every piece of
 *         observable state (connection, scanning flag, item value/error slots).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

// LinkBridge headers
#include "core/Stream.hpp"

namespace linkbridge {
  namespace core {

    namespace detail {
      template <typename T> struct BroadcastShared {
        explicit BroadcastShared(T initial) : value(std::move(initial)) {}

        mutable std::mutex mtx;
        T value;
        std::uint64_t version{ 0 };
        std::vector<std::weak_ptr<StreamState<T>>> subscribers;
      };
    } // namespace detail

    /**
 * @class LatestView
 * @brief Passive read-only handle on a StateBroadcast for polling front-ends.
 *
 *  * Cheap to copy; stays valid after the broadcast itself is destroyed.
 *  * `version()` grows by one per publish so a UI can redraw only on change.
 */
    template <typename T> class LatestView {
    public:
      explicit LatestView(std::shared_ptr<const detail::BroadcastShared<T>> shared)
          : shared_(std::move(shared)) {}

      T get() const {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        return shared_->value;
      }

      std::uint64_t version() const {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        return shared_->version;
      }

    private:
      std::shared_ptr<const detail::BroadcastShared<T>> shared_;
    };

    /**
 * @class StateBroadcast
 * @brief Snapshot + independent live subscriptions.
 *
 *  * `subscribe()` seeds the new stream with the current value under the same
 *    lock `publish()` takes, so no update falls between snapshot and stream.
 *  * Ending one subscription never affects the publisher or other subscribers.
 *  * Thread-safe; payload agnostic.
 */
    template <typename T> class StateBroadcast {
    public:
      explicit StateBroadcast(T initial = T{})
          : shared_(std::make_shared<detail::BroadcastShared<T>>(std::move(initial))) {}
      ~StateBroadcast() { finishAll(); }

      T current() const {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        return shared_->value;
      }

      Stream<T> subscribe() const {
        auto state = std::make_shared<detail::StreamState<T>>();
        std::lock_guard<std::mutex> lk(shared_->mtx);
        state->push(shared_->value);
        shared_->subscribers.push_back(state);
        return Stream<T>(std::move(state));
      }

      void publish(T value) {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        shared_->value = value;
        ++shared_->version;

        auto& subs = shared_->subscribers;
        for (auto it = subs.begin(); it != subs.end();) {
          auto sub = it->lock();
          if (!sub || !sub->push(value)) {
            it = subs.erase(it); // consumer went away
          } else {
            ++it;
          }
        }
      }

      LatestView<T> view() const { return LatestView<T>(shared_); }

      /// Number of subscriptions still consuming.
      std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        std::size_t n = 0;
        for (const auto& weak : shared_->subscribers) {
          if (auto sub = weak.lock(); sub && sub->live())
            ++n;
        }
        return n;
      }

      //---non-copyable-----------------------------------------------------
      StateBroadcast(const StateBroadcast&) = delete;
      StateBroadcast& operator=(const StateBroadcast&) = delete;

    private:
      void finishAll() {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        for (auto& weak : shared_->subscribers) {
          if (auto sub = weak.lock())
            sub->finish();
        }
        shared_->subscribers.clear();
      }

      std::shared_ptr<detail::BroadcastShared<T>> shared_;
    };

  } // namespace core
} // namespace linkbridge
