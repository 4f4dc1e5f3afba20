#pragma once
/** @file  CorrelationQueue.hpp
 *  @brief Per-key FIFO of pending request handles, matching token-less driver
 *         completions to the requests that caused them.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace linkbridge {
  namespace core {

    /**
 * @class PendingSlot
 * @brief One outstanding request. Settles exactly once: by resolve(), fail()
 *        or abandon(), whichever comes first.
 */
    template <typename T> class PendingSlot {
    public:
      std::future<T> future() { return promise_.get_future(); }

      template <typename... Args> bool resolve(Args&&... value) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (settled_)
          return false;
        settled_ = true;
        promise_.set_value(std::forward<Args>(value)...);
        return true;
      }

      bool fail(std::exception_ptr error) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (settled_)
          return false;
        settled_ = true;
        promise_.set_exception(std::move(error));
        return true;
      }

      /// Caller gave up waiting. The slot keeps its queue position.
      void abandon(std::exception_ptr error) {
        std::lock_guard<std::mutex> lk(mtx_);
        abandoned_ = true;
        if (!settled_) {
          settled_ = true;
          promise_.set_exception(std::move(error));
        }
      }

      bool abandoned() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return abandoned_;
      }

    private:
      mutable std::mutex mtx_;
      std::promise<T> promise_;
      bool settled_{ false };
      bool abandoned_{ false };
    };

    /**
 * @class Pending
 * @brief Caller-side handle of a request in flight.
 *
 *  * `get()` blocks and rethrows the failure; call it once.
 *  * No timeout of its own; race `waitFor()` against a deadline instead.
 *  * `abandon()` fails this handle now. The driver command is not cancelled;
 *    its completion is consumed by this slot and discarded.
 */
    template <typename T> class Pending {
    public:
      Pending(std::shared_ptr<PendingSlot<T>> slot, std::exception_ptr abandonError)
          : slot_(std::move(slot)), future_(slot_->future()), abandonError_(std::move(abandonError)) {}

      /// Already-settled handle, for requests that need no driver round-trip.
      template <typename... Args> static Pending ready(Args&&... value) {
        auto slot = std::make_shared<PendingSlot<T>>();
        Pending p(slot, nullptr);
        slot->resolve(std::forward<Args>(value)...);
        return p;
      }

      T get() { return future_.get(); }

      bool waitFor(std::chrono::milliseconds timeout) const {
        return future_.wait_for(timeout) == std::future_status::ready;
      }

      bool isReady() const { return waitFor(std::chrono::milliseconds{ 0 }); }

      void abandon() { slot_->abandon(abandonError_); }

      Pending(Pending&&) noexcept = default;
      Pending& operator=(Pending&&) noexcept = default;
      Pending(const Pending&) = delete;
      Pending& operator=(const Pending&) = delete;

    private:
      std::shared_ptr<PendingSlot<T>> slot_;
      std::future<T> future_;
      std::exception_ptr abandonError_;
    };

    /// Default per-request context: none.
    struct NoContext {};

    /**
 * @class CorrelationQueue
 * @brief map<Key, FIFO<slot>>: enqueue appends, complete pops the head.
 *
 *  * Not thread-safe: the owning session serialises every call.
 *  * `Context` travels with the slot (e.g. the filter a discovery asked for).
 */
    template <typename Key, typename T, typename Context = NoContext> class CorrelationQueue {
    public:
      struct Entry {
        std::shared_ptr<PendingSlot<T>> slot;
        Context context{};
      };

      explicit CorrelationQueue(std::exception_ptr abandonError) : abandonError_(std::move(abandonError)) {}

      Pending<T> enqueue(const Key& key, Context context = Context{}) {
        auto slot = std::make_shared<PendingSlot<T>>();
        queues_[key].push_back(Entry{ slot, std::move(context) });
        return Pending<T>(std::move(slot), abandonError_);
      }

      /// Removes and returns the head for \p key; std::nullopt if nothing is pending.
      std::optional<Entry> pop(const Key& key) {
        auto it = queues_.find(key);
        if (it == queues_.end() || it->second.empty())
          return std::nullopt;
        Entry head = std::move(it->second.front());
        it->second.pop_front();
        if (it->second.empty())
          queues_.erase(it);
        return head;
      }

      /// Fails and removes the newest slot for \p key (command rejected before it left).
      void failLast(const Key& key, const std::exception_ptr& error) {
        auto it = queues_.find(key);
        if (it == queues_.end() || it->second.empty())
          return;
        it->second.back().slot->fail(error);
        it->second.pop_back();
        if (it->second.empty())
          queues_.erase(it);
      }

      /// Fails every pending slot with \p error and empties the queue.
      std::size_t drain(const std::exception_ptr& error) {
        std::size_t failed = 0;
        for (auto& [key, fifo] : queues_) {
          for (auto& entry : fifo) {
            if (entry.slot->fail(error))
              ++failed;
          }
        }
        queues_.clear();
        return failed;
      }

      std::size_t size(const Key& key) const {
        auto it = queues_.find(key);
        return it == queues_.end() ? 0 : it->second.size();
      }

      std::size_t size() const {
        std::size_t n = 0;
        for (const auto& [key, fifo] : queues_)
          n += fifo.size();
        return n;
      }

      bool empty() const { return queues_.empty(); }

    private:
      std::map<Key, std::deque<Entry>> queues_;
      std::exception_ptr abandonError_;
    };

  } // namespace core
} // namespace linkbridge
