#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"
#include "link/LinkTypes.hpp"

namespace linkbridge::core {

  /// Validated settings the coordinator understands.
  struct LinkConfig {
    LogLevel logLevel{ LogLevel::Info };
    std::string logFile{};                  ///< empty = stderr only
    std::vector<link::GroupId> scanGroups{}; ///< default discovery filter, empty = all
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller.
 *
 *  * No caching: every call to `load()` re-reads the file (cheap, tiny file).
 *  * Schema validation lives in `parseLinkConfig()`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() + parseLinkConfig().
    LinkConfig loadLinkConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

  /**
   * Maps `{"log": {"level", "file"}, "scan": {"groups": [...]}}` onto LinkConfig.
   * Missing keys keep their defaults; wrong types throw `std::runtime_error`.
   */
  LinkConfig parseLinkConfig(const nlohmann::json& root);

} // namespace linkbridge::core
