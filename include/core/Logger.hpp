#pragma once
/** @file  Logger.hpp
 *  @brief Levelled logger; stderr by default, asynchronous CSV run file on demand.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace linkbridge {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);
    /// Case-insensitive "debug" / "info" / "warn" / "error".
    std::optional<LogLevel> parseLogLevel(std::string_view text);

    struct LogEvent {
      std::chrono::system_clock::time_point at;
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    /// `timestamp_ms,level,component,message` with RFC-4180 quoting of the message.
    std::string toCsv(const LogEvent& event);

    /**
 * @class Logger
 * @brief Shared by the coordinator and every link session.
 *
 *  * Records below the threshold are dropped.
 *  * Outside a run, records are written synchronously to std::cerr.
 *  * Inside a run, `log()` only enqueues; a worker thread drains to the CSV file.
 */
    class Logger {

    public:
      explicit Logger(LogLevel threshold = LogLevel::Info);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogLevel level, std::string_view component, std::string message);
      void finishRun(); ///< flush + join worker thread

      void debug(std::string_view component, std::string message) {
        log(LogLevel::Debug, component, std::move(message));
      }
      void info(std::string_view component, std::string message) {
        log(LogLevel::Info, component, std::move(message));
      }
      void warn(std::string_view component, std::string message) {
        log(LogLevel::Warn, component, std::move(message));
      }
      void error(std::string_view component, std::string message) {
        log(LogLevel::Error, component, std::move(message));
      }

      void setThreshold(LogLevel level) { threshold_.store(level); }
      LogLevel threshold() const { return threshold_.load(); }
      bool enabled(LogLevel level) const { return level >= threshold_.load(); }
      bool running() const { return running_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();

      std::atomic<LogLevel> threshold_;
      std::unique_ptr<io::FileLogger> csvFile_;
      std::deque<LogEvent> queue_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace linkbridge
