#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "zmd/log_store.hpp"
#include "zmd/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

using zmd::transfer::LogConfig;
using zmd::transfer::LogStore;
using zmd::transfer::StreamSource;

namespace {

// Whether every line of needle appears in haystack, in order.
auto is_line_subsequence(std::string_view needle, std::string_view haystack) -> bool {
    const auto& needle_lines   = zmd::utils::make_multiline_view(needle);
    const auto& haystack_lines = zmd::utils::make_multiline_view(haystack);
    std::size_t pos{};
    for (const auto& line : needle_lines) {
        while (pos < haystack_lines.size() && haystack_lines[pos] != line) {
            ++pos;
        }
        if (pos == haystack_lines.size()) {
            return false;
        }
        ++pos;
    }
    return true;
}

}  // namespace

TEST_CASE("log line format")
{
  const auto time_point = zmd::transfer::from_unix_ms(1700000000123);
  const auto line       = zmd::transfer::format_log_line(time_point, StreamSource::Receive, "receiving full stream"sv);
  REQUIRE_EQ(line, "2023-11-14T22:13:20.123Z [receive] receiving full stream");
}

TEST_CASE("log store bounds")
{
  SECTION("small logs are kept whole")
  {
    LogStore log{LogConfig{}};
    log.append(StreamSource::Transfer, "send: zfs send -P -v pool/data@snap1"sv);
    log.append(StreamSource::Send, "full\tpool/data@snap1\t4096"sv);
    log.append(StreamSource::Receive, "received 4.00K stream"sv);

    REQUIRE_EQ(log.line_count(), 3);
    REQUIRE_EQ(log.dropped_lines(), 0);
    const auto full = log.full();
    REQUIRE(full.contains("[transfer] send: zfs send"sv));
    REQUIRE(full.contains("[receive] received 4.00K stream"sv));
    REQUIRE_EQ(log.gist(), full);
  }
  SECTION("long lines are cut")
  {
    LogStore log{LogConfig{.max_line_bytes = 64}};
    log.append(StreamSource::Send, std::string(1000, 'x'));
    REQUIRE_EQ(log.size_bytes(), 65);
  }
  SECTION("cuts never split a character")
  {
    LogStore log{LogConfig{.max_line_bytes = 40}};
    std::string text{};
    for (int i = 0; i < 10; ++i) {
      text += "\xc3\xa9";
    }
    log.append(zmd::transfer::from_unix_ms(1700000000123), StreamSource::Receive, text);

    // 35 bytes of timestamp and tag, then two whole characters
    const auto full = log.full();
    REQUIRE_EQ(full, "2023-11-14T22:13:20.123Z [receive] \xc3\xa9\xc3\xa9\n");
    REQUIRE_EQ(log.size_bytes(), 40);
  }
  SECTION("eviction keeps the head and the cap")
  {
    const LogConfig config{.max_bytes = 4096, .head_lines = 5, .gist_head_lines = 3, .gist_tail_lines = 3, .gist_max_bytes = 1024};
    LogStore log{config};
    for (int i = 0; i < 1000; ++i) {
      log.append(StreamSource::Send, fmt::format("line {:04}", i));
      REQUIRE(log.size_bytes() <= config.max_bytes);
    }

    REQUIRE(log.dropped_lines() > 0);
    const auto full = log.full();
    REQUIRE(full.contains("line 0000"sv));
    REQUIRE(full.contains("line 0004"sv));
    REQUIRE_FALSE(full.contains("line 0005"sv));
    REQUIRE(full.contains("line 0999"sv));
    REQUIRE(full.contains(fmt::format("[... {} lines dropped ...]", log.dropped_lines())));

    const auto gist = log.gist();
    REQUIRE(gist.size() <= config.gist_max_bytes);
    REQUIRE(gist.contains("line 0000"sv));
    REQUIRE(gist.contains("line 0002"sv));
    REQUIRE_FALSE(gist.contains("line 0003"sv));
    REQUIRE(gist.contains("line 0997"sv));
    REQUIRE(gist.contains("line 0999"sv));
    REQUIRE(is_line_subsequence(gist, full));
  }
  SECTION("gist stays within a tiny limit")
  {
    const LogConfig config{.gist_max_bytes = 200};
    LogStore log{config};
    for (int i = 0; i < 200; ++i) {
      log.append(StreamSource::Receive, fmt::format("receiving incremental stream chunk {}", i));
    }
    const auto gist = log.gist();
    REQUIRE(!gist.empty());
    REQUIRE(gist.size() <= config.gist_max_bytes);
    REQUIRE(is_line_subsequence(gist, log.full()));
  }
}

TEST_CASE("log store reload")
{
  const LogConfig config{.max_bytes = 2048, .head_lines = 2};
  LogStore original{config};
  for (int i = 0; i < 200; ++i) {
    original.append(StreamSource::Send, fmt::format("progress {}", i));
  }
  const auto persisted = original.full();

  LogStore restored{config};
  restored.load(persisted);
  REQUIRE_EQ(restored.full(), persisted);
  REQUIRE_EQ(restored.dropped_lines(), original.dropped_lines());
  REQUIRE_EQ(restored.line_count(), original.line_count());

  restored.append(StreamSource::Transfer, "daemon restarted while the transfer was active"sv);
  REQUIRE(restored.full().contains("daemon restarted"sv));
  REQUIRE(restored.size_bytes() <= config.max_bytes);
}
