/* @file Logger.cpp
 * @brief levelled logger with an optional CSV run file drained by a worker thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

// LinkBridge headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

namespace linkbridge {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "?";
      }
    }

    std::optional<LogLevel> parseLogLevel(std::string_view text) {
      std::string lower(text);
      std::transform(lower.begin(), lower.end(), lower.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (lower == "debug")
        return LogLevel::Debug;
      if (lower == "info")
        return LogLevel::Info;
      if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
      if (lower == "error")
        return LogLevel::Error;
      return std::nullopt;
    }

    std::string toCsv(const LogEvent& event) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(event.at.time_since_epoch()).count();

      std::string message = event.message;
      if (message.find_first_of(",\"\n") != std::string::npos) {
        std::string quoted = "\"";
        for (char c : message) {
          if (c == '"')
            quoted += '"';
          quoted += c;
        }
        quoted += '"';
        message = std::move(quoted);
      }
      return std::to_string(ms) + "," + toString(event.level) + "," + event.component + "," + message
             + "\n";
    }

    Logger::Logger(LogLevel threshold) : threshold_(threshold) {}

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& csvPath) {
      finishRun();

      auto file = std::make_unique<io::FileLogger>();
      if (!file->open(csvPath))
        return false;
      file->write("timestamp_ms,level,component,message\n");

      {
        std::lock_guard<std::mutex> lk(mtx_);
        csvFile_ = std::move(file);
        running_ = true;
      }
      worker_ = std::thread(&Logger::workerLoop, this);
      return true;
    }

    void Logger::log(LogLevel level, std::string_view component, std::string message) {
      if (!enabled(level))
        return;

      LogEvent event{ std::chrono::system_clock::now(), level, std::string(component), std::move(message) };

      {
        std::lock_guard<std::mutex> lk(mtx_);
        if (running_) {
          queue_.push_back(std::move(event));
          cv_.notify_one();
          return;
        }
      }
      std::cerr << "[" << toString(level) << "] [" << event.component << "] " << event.message << '\n';
    }

    void Logger::finishRun() {
      {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_)
          return;
        running_ = false;
      }
      cv_.notify_all();
      if (worker_.joinable())
        worker_.join();

      std::lock_guard<std::mutex> lk(mtx_);
      if (csvFile_) {
        csvFile_->close();
        csvFile_.reset();
      }
    }

    void Logger::workerLoop() {
      std::unique_lock<std::mutex> lk(mtx_);
      while (true) {
        cv_.wait(lk, [this] { return !queue_.empty() || !running_; });

        std::deque<LogEvent> batch;
        batch.swap(queue_);
        lk.unlock();
        for (const auto& event : batch)
          csvFile_->write(toCsv(event));
        csvFile_->flush();
        lk.lock();

        if (!running_ && queue_.empty())
          break;
      }
    }

  } // namespace core
} // namespace linkbridge
