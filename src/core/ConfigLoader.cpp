/* @file ConfigLoader.cpp
 * @brief JSON config file loading and LinkConfig validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// LinkBridge headers
#include "core/ConfigLoader.hpp"

namespace linkbridge::core {

  namespace {
    /// nullptr when \p key is absent or null
    const nlohmann::json* member(const nlohmann::json& obj, const char* key) {
      auto it = obj.find(key);
      if (it == obj.end() || it->is_null())
        return nullptr;
      return &*it;
    }

    [[noreturn]] void typeError(const std::string& key, const char* expected) {
      throw std::runtime_error("[ConfigLoader] '" + key + "' must be " + expected);
    }
  } // namespace

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  nlohmann::json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

    try {
      return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("[ConfigLoader] malformed config file " + path_ + ": " + e.what());
    }
  }

  LinkConfig ConfigLoader::loadLinkConfig() const { return parseLinkConfig(load()); }

  LinkConfig parseLinkConfig(const nlohmann::json& root) {
    if (!root.is_object())
      typeError("<root>", "an object");

    LinkConfig cfg;

    if (const auto* log = member(root, "log")) {
      if (!log->is_object())
        typeError("log", "an object");

      if (const auto* level = member(*log, "level")) {
        if (!level->is_string())
          typeError("log.level", "a string");
        auto parsed = parseLogLevel(level->get<std::string>());
        if (!parsed)
          throw std::runtime_error("[ConfigLoader] unknown log.level '" + level->get<std::string>() + "'");
        cfg.logLevel = *parsed;
      }

      if (const auto* file = member(*log, "file")) {
        if (!file->is_string())
          typeError("log.file", "a string");
        cfg.logFile = file->get<std::string>();
      }
    }

    if (const auto* scan = member(root, "scan")) {
      if (!scan->is_object())
        typeError("scan", "an object");

      if (const auto* groups = member(*scan, "groups")) {
        if (!groups->is_array())
          typeError("scan.groups", "an array of strings");
        for (const auto& g : *groups) {
          if (!g.is_string())
            typeError("scan.groups", "an array of strings");
          cfg.scanGroups.push_back(g.get<std::string>());
        }
      }
    }

    return cfg;
  }

} // namespace linkbridge::core
