#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "daemon_config.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;
using namespace std::string_literals;
using namespace std::string_view_literals;

TEST_CASE("daemon config parsing")
{
  auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
  spdlog::set_default_logger(logger);

  SECTION("empty config returns defaults")
  {
    auto result = service::parse_daemon_config(""sv);
    REQUIRE(result.has_value());

    auto& config = *result;
    REQUIRE_EQ(config.state_dir, "/var/lib/zmd"sv);
    REQUIRE_EQ(config.zfs_binary, "zfs"sv);
    REQUIRE(!config.use_sudo);
    REQUIRE_EQ(config.log_level, "info"sv);
    REQUIRE_EQ(config.grace_period_ms, 5000);
    REQUIRE_EQ(config.transfer_log.max_bytes, 1024 * 1024);
  }
  SECTION("valid complete config")
  {
    constexpr auto json = R"({
      "state_dir": "/srv/zmd",
      "zfs_binary": "/usr/sbin/zfs",
      "zpool_binary": "/usr/sbin/zpool",
      "use_sudo": true,
      "log_file": "/tmp/zmd.log",
      "log_level": "debug",
      "grace_period_ms": 10000,
      "resume_token_retries": 5,
      "resume_token_retry_delay_ms": 500,
      "transfer_log": {
        "max_bytes": 65536,
        "gist_tail_lines": 40
      }
    })"sv;

    auto result = service::parse_daemon_config(json);
    REQUIRE(result.has_value());

    auto& config = *result;
    REQUIRE_EQ(config.state_dir, "/srv/zmd"sv);
    REQUIRE_EQ(config.zfs_binary, "/usr/sbin/zfs"sv);
    REQUIRE_EQ(config.zpool_binary, "/usr/sbin/zpool"sv);
    REQUIRE(config.use_sudo);
    REQUIRE_EQ(config.log_file, "/tmp/zmd.log"sv);
    REQUIRE_EQ(config.log_level, "debug"sv);
    REQUIRE_EQ(config.grace_period_ms, 10000);
    REQUIRE_EQ(config.resume_token_retries, 5);
    REQUIRE_EQ(config.resume_token_retry_delay_ms, 500);
    REQUIRE_EQ(config.transfer_log.max_bytes, 65536);
    REQUIRE_EQ(config.transfer_log.gist_tail_lines, 40);
    REQUIRE_EQ(config.transfer_log.head_lines, 20);

    const auto manager_config = service::to_manager_config(config);
    REQUIRE_EQ(manager_config.state_dir, "/srv/zmd"sv);
    REQUIRE_EQ(manager_config.grace_period, 10000ms);
    REQUIRE_EQ(manager_config.resume_token_retries, 5);
    REQUIRE_EQ(manager_config.resume_token_retry_delay, 500ms);
    REQUIRE_EQ(manager_config.log_config.max_bytes, 65536);
  }
  SECTION("invalid JSON")
  {
    auto result = service::parse_daemon_config("{ invalid json }"sv);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().contains("JSON parse error"sv));
  }
  SECTION("root must be an object")
  {
    auto result = service::parse_daemon_config("[]"sv);
    REQUIRE(!result.has_value());
    REQUIRE_EQ(result.error(), "JSON root must be an object");
  }
  SECTION("invalid log level")
  {
    auto result = service::parse_daemon_config(R"({"log_level": "verbose"})"sv);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().contains("Invalid log level 'verbose'"sv));
  }
  SECTION("wrong types")
  {
    auto result = service::parse_daemon_config(R"({"state_dir": 42})"sv);
    REQUIRE(!result.has_value());
    REQUIRE_EQ(result.error(), "'state_dir' must be a string");

    result = service::parse_daemon_config(R"({"use_sudo": "yes"})"sv);
    REQUIRE(!result.has_value());
    REQUIRE_EQ(result.error(), "'use_sudo' must be a boolean");

    result = service::parse_daemon_config(R"({"resume_token_retries": -1})"sv);
    REQUIRE(!result.has_value());
    REQUIRE_EQ(result.error(), "'resume_token_retries' must be a non-negative integer");
  }
  SECTION("grace period must be positive")
  {
    auto result = service::parse_daemon_config(R"({"grace_period_ms": 0})"sv);
    REQUIRE(!result.has_value());
    REQUIRE_EQ(result.error(), "'grace_period_ms' must be positive");
  }
  SECTION("empty tool binary")
  {
    auto result = service::parse_daemon_config(R"({"zfs_binary": ""})"sv);
    REQUIRE(!result.has_value());
  }
  SECTION("invalid transfer log bounds")
  {
    auto result = service::parse_daemon_config(R"({"transfer_log": {"gist_max_bytes": 0}})"sv);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().starts_with("'transfer_log'"sv));
  }
}

TEST_CASE("log level names")
{
  REQUIRE_EQ(service::log_level_from_string("trace"sv), spdlog::level::trace);
  REQUIRE_EQ(service::log_level_from_string("error"sv), spdlog::level::err);
  REQUIRE_EQ(service::log_level_from_string("off"sv), spdlog::level::off);
  REQUIRE(!service::log_level_from_string("critical"sv).has_value());
  REQUIRE(!service::log_level_from_string(""sv).has_value());
}
