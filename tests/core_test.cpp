// LinkBridge headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/IdentityCache.hpp"
#include "core/Logger.hpp"
#include "link/LinkError.hpp"
#include "link/LinkSession.hpp"

// LinkBridge-Fake headers
#include "FakeLinkDriver.hpp"

// third-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace linkbridge::test {

  using core::ConfigLoader;
  using core::ErrorMonitor;
  using core::IdentityCache;
  using core::LinkConfig;
  using core::LogLevel;
  using nlohmann::json;

  //---ErrorMonitor-------------------------------------------------------

  TEST(error_monitor, escalates_each_message_once) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

    monitor.notifyFailure("D1 link dropped");
    monitor.notifyFailure("D1 link dropped");
    monitor.notifyFailure("D2 failed to connect");

    ASSERT_EQ(escalated.size(), 2u);
    EXPECT_EQ(escalated[0], "D1 link dropped");
    EXPECT_EQ(monitor.uniqueFailures(), 2u);

    monitor.clear();
    monitor.notifyFailure("D1 link dropped");
    EXPECT_EQ(escalated.size(), 3u);
  }

  TEST(error_monitor, works_without_escalation) {
    ErrorMonitor monitor;
    EXPECT_NO_THROW(monitor.notifyFailure("nobody listening"));
    EXPECT_EQ(monitor.uniqueFailures(), 1u);
  }

  //---IdentityCache------------------------------------------------------

  class IdentityCacheTest : public ::testing::Test {
  protected:
    void SetUp() override {
      driver = std::make_shared<FakeLinkDriver>();
      cache = std::make_unique<IdentityCache>([this](const link::DeviceId& id) {
        ++created;
        return std::make_shared<link::LinkSession>(id, driver, nullptr);
      });
    }

    std::shared_ptr<FakeLinkDriver> driver;
    std::unique_ptr<IdentityCache> cache;
    int created = 0;
  };

  TEST_F(IdentityCacheTest, same_identifier_same_instance) {
    auto a = cache->resolveOrCreate("D1");
    auto b = cache->resolveOrCreate("D1");
    auto c = cache->resolveOrCreate("D2");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(cache->find("D1"), a);
    EXPECT_EQ(cache->find("D3"), nullptr);
    EXPECT_EQ(cache->size(), 2u);
    EXPECT_EQ(created, 2);
  }

  TEST_F(IdentityCacheTest, racing_lookups_create_once) {
    std::vector<std::shared_ptr<link::LinkSession>> seen(8);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < seen.size(); ++t)
      threads.emplace_back([&, t] { seen[t] = cache->resolveOrCreate("D1"); });
    for (auto& th : threads)
      th.join();

    EXPECT_EQ(created, 1);
    for (const auto& s : seen)
      EXPECT_EQ(s, seen.front());
  }

  TEST(identity_cache, rejects_empty_factory) {
    EXPECT_THROW({ IdentityCache empty(nullptr); }, std::invalid_argument);
  }

  //---ConfigLoader-------------------------------------------------------

  TEST(config, defaults_when_keys_missing) {
    auto cfg = core::parseLinkConfig(json::object());
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_TRUE(cfg.scanGroups.empty());
  }

  TEST(config, parses_every_section) {
    auto cfg = core::parseLinkConfig(json::parse(R"({
      "log":  { "level": "Debug", "file": "/tmp/linkbridge.csv" },
      "scan": { "groups": ["180D", "180F"] }
    })"));

    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_EQ(cfg.logFile, "/tmp/linkbridge.csv");
    EXPECT_EQ(cfg.scanGroups, (std::vector<link::GroupId>{ "180D", "180F" }));
  }

  TEST(config, rejects_wrong_types) {
    EXPECT_THROW(core::parseLinkConfig(json::array()), std::runtime_error);
    EXPECT_THROW(core::parseLinkConfig(json::parse(R"({"log": {"level": 3}})")), std::runtime_error);
    EXPECT_THROW(core::parseLinkConfig(json::parse(R"({"log": {"level": "loud"}})")), std::runtime_error);
    EXPECT_THROW(core::parseLinkConfig(json::parse(R"({"scan": {"groups": "180D"}})")), std::runtime_error);
    EXPECT_THROW(core::parseLinkConfig(json::parse(R"({"scan": {"groups": [1]}})")), std::runtime_error);
  }

  TEST(config, loads_from_file) {
    auto path = std::filesystem::temp_directory_path() / "linkbridge_config_test.json";
    {
      std::ofstream out(path);
      out << R"({"log": {"level": "warn"}, "scan": {"groups": ["FEAA"]}})";
    }

    ConfigLoader loader(path.string());
    auto cfg = loader.loadLinkConfig();
    EXPECT_EQ(cfg.logLevel, LogLevel::Warn);
    EXPECT_EQ(cfg.scanGroups.size(), 1u);

    std::filesystem::remove(path);
  }

  TEST(config, missing_or_malformed_file_throws) {
    EXPECT_THROW(ConfigLoader("/nonexistent/linkbridge.json").load(), std::runtime_error);

    auto path = std::filesystem::temp_directory_path() / "linkbridge_config_bad.json";
    {
      std::ofstream out(path);
      out << "{ not json";
    }
    EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);
    std::filesystem::remove(path);
  }

  //---LinkError----------------------------------------------------------

  TEST(link_error, carries_driver_error) {
    link::LinkError e(link::DriverError{ 5, "insufficient authentication" }, "D1: read G1/I1");
    EXPECT_EQ(e.code(), link::LinkErrorCode::Driver);
    ASSERT_TRUE(e.driverError());
    EXPECT_EQ(e.driverError()->code, 5);
    EXPECT_NE(std::string(e.what()).find("insufficient authentication"), std::string::npos);
  }

  TEST(link_error, describes_connection_states) {
    EXPECT_EQ(link::describe(link::ConnectionState::connected()), "connected");
    EXPECT_EQ(link::describe(link::ConnectionState::failedToConnect({ 7, "timeout" })),
              "failed-to-connect(7: timeout)");
  }

} // namespace linkbridge::test
