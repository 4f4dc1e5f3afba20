#pragma once
/** @file  Stream.hpp
 *  @brief Blocking, unbounded, single-consumer value stream.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace linkbridge {
  namespace core {

    namespace detail {

      /**
 * @class StreamState
 * @brief Shared buffer between one producer side and one consumer side.
 *
 *  * `finished` is set by the producer; buffered values stay readable.
 *  * `cancelled` is set by the consumer; further pushes are dropped.
 */
      template <typename T> class StreamState {
      public:
        /// @returns false when the consumer has cancelled or the stream finished.
        bool push(T value) {
          {
            std::lock_guard<std::mutex> lk(mtx_);
            if (cancelled_ || finished_)
              return false;
            buffer_.push_back(std::move(value));
          }
          cv_.notify_one();
          return true;
        }

        void finish() {
          {
            std::lock_guard<std::mutex> lk(mtx_);
            finished_ = true;
          }
          cv_.notify_all();
        }

        /// Consumer side stop. Runs the termination hook at most once.
        void cancel() {
          std::function<void()> hook;
          {
            std::lock_guard<std::mutex> lk(mtx_);
            if (cancelled_)
              return;
            cancelled_ = true;
            buffer_.clear();
            hook = std::move(onTermination_);
            onTermination_ = nullptr;
          }
          cv_.notify_all();
          if (hook)
            hook();
        }

        void setOnTermination(std::function<void()> hook) {
          std::lock_guard<std::mutex> lk(mtx_);
          onTermination_ = std::move(hook);
        }

        bool live() const {
          std::lock_guard<std::mutex> lk(mtx_);
          return !cancelled_ && !finished_;
        }

        bool drained() const {
          std::lock_guard<std::mutex> lk(mtx_);
          return buffer_.empty() && (finished_ || cancelled_);
        }

        std::optional<T> pop(std::optional<std::chrono::milliseconds> timeout) {
          std::unique_lock<std::mutex> lk(mtx_);
          auto ready = [this] { return !buffer_.empty() || finished_ || cancelled_; };
          if (timeout) {
            if (!cv_.wait_for(lk, *timeout, ready))
              return std::nullopt; // timeout
          } else {
            cv_.wait(lk, ready);
          }
          if (buffer_.empty())
            return std::nullopt;
          T value = std::move(buffer_.front());
          buffer_.pop_front();
          return value;
        }

        std::optional<T> tryPop() {
          std::lock_guard<std::mutex> lk(mtx_);
          if (buffer_.empty())
            return std::nullopt;
          T value = std::move(buffer_.front());
          buffer_.pop_front();
          return value;
        }

      private:
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<T> buffer_;
        bool finished_{ false };
        bool cancelled_{ false };
        std::function<void()> onTermination_{};
      };

    } // namespace detail

    /**
 * @class Stream
 * @brief Consumer handle of a value stream.
 *
 *  * `next()` blocks until a value arrives or the producer finishes.
 *  * Destroying the handle (or `cancel()`) tells the producer the consumer
 *    stopped consuming; the termination hook fires exactly once.
 *  * Non-copyable, move-enabled.
 */
    template <typename T> class Stream {
    public:
      Stream() = default;
      explicit Stream(std::shared_ptr<detail::StreamState<T>> state) : state_(std::move(state)) {}
      ~Stream() { cancel(); }

      /// Blocks for the next value; std::nullopt once the stream is finished.
      std::optional<T> next() {
        if (!state_)
          return std::nullopt;
        return state_->pop(std::nullopt);
      }

      /// Like next() but gives up after \p timeout.
      std::optional<T> nextFor(std::chrono::milliseconds timeout) {
        if (!state_)
          return std::nullopt;
        return state_->pop(timeout);
      }

      std::optional<T> tryNext() {
        if (!state_)
          return std::nullopt;
        return state_->tryPop();
      }

      /// Consumes values until one satisfies \p pred or \p timeout elapses.
      template <typename Pred>
      std::optional<T> firstWhere(Pred pred, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
          auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
              deadline - std::chrono::steady_clock::now());
          if (left.count() < 0)
            return std::nullopt;
          auto value = nextFor(left);
          if (!value)
            return std::nullopt;
          if (pred(*value))
            return value;
        }
      }

      /// True once the producer finished and every buffered value was read.
      bool finished() const { return !state_ || state_->drained(); }

      void cancel() {
        if (state_)
          state_->cancel();
      }

      //---non-copyable, move-enabled---------------------------------------
      Stream(const Stream&) = delete;
      Stream& operator=(const Stream&) = delete;
      Stream(Stream&&) noexcept = default;
      Stream& operator=(Stream&& other) noexcept {
        if (this != &other) {
          cancel();
          state_ = std::move(other.state_);
        }
        return *this;
      }

    private:
      std::shared_ptr<detail::StreamState<T>> state_;
    };

    /**
 * @class StreamWriter
 * @brief Producer handle paired with a Stream.
 */
    template <typename T> class StreamWriter {
    public:
      StreamWriter() = default;
      explicit StreamWriter(std::shared_ptr<detail::StreamState<T>> state) : state_(std::move(state)) {}

      bool push(T value) { return state_ && state_->push(std::move(value)); }
      void finish() {
        if (state_)
          state_->finish();
      }
      bool live() const { return state_ && state_->live(); }

    private:
      std::shared_ptr<detail::StreamState<T>> state_;
    };

    /// Creates a connected writer/stream pair. \p onTermination runs when the
    /// consumer cancels or drops its Stream.
    template <typename T>
    std::pair<StreamWriter<T>, Stream<T>> makeStream(std::function<void()> onTermination = nullptr) {
      auto state = std::make_shared<detail::StreamState<T>>();
      if (onTermination)
        state->setOnTermination(std::move(onTermination));
      return { StreamWriter<T>(state), Stream<T>(state) };
    }

  } // namespace core
} // namespace linkbridge
