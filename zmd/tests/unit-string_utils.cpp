#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "zmd/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

TEST_CASE("Split test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto tokens = zmd::utils::make_multiline_view(input, false, ',');
    REQUIRE_EQ(tokens.size(), 0);
  }
  SECTION("single delim string view")
  {
    static constexpr auto input = ","sv;
    const auto tokens = zmd::utils::make_multiline_view(input, false, ',');
    REQUIRE_EQ(tokens.size(), 0);
  }
  SECTION("short string view")
  {
    static constexpr auto input = "1,22,333"sv;
    const auto tokens = zmd::utils::make_multiline_view(input, false, ',');
    REQUIRE_EQ(input.data(), tokens[0].data());
    REQUIRE_EQ(tokens.size(), 3);
    REQUIRE_EQ(tokens[0], "1");
    REQUIRE_EQ(tokens[1], "22");
    REQUIRE_EQ(tokens[2], "333");
  }
  SECTION("reversed")
  {
    static constexpr auto input = "1,22,333"sv;
    const auto tokens = zmd::utils::make_multiline_view(input, true, ',');
    REQUIRE_EQ(tokens.size(), 3);
    REQUIRE_EQ(tokens[0], "333");
    REQUIRE_EQ(tokens[2], "1");
  }
  SECTION("empty lines are skipped")
  {
    static constexpr auto input = "first\n\n\nsecond\n"sv;
    const auto lines = zmd::utils::make_multiline_view(input);
    REQUIRE_EQ(lines.size(), 2);
    REQUIRE_EQ(lines[0], "first");
    REQUIRE_EQ(lines[1], "second");
  }
  SECTION("zfs send progress fields")
  {
    static constexpr auto input = "incremental\tpool/data@snap1\tpool/data@snap2\t1048576"sv;
    const auto fields = zmd::utils::make_multiline_view(input, false, '\t');
    REQUIRE_EQ(fields.size(), 4);
    REQUIRE_EQ(fields[0], "incremental");
    REQUIRE_EQ(fields[2], "pool/data@snap2");
    REQUIRE_EQ(fields[3], "1048576");
  }
}

TEST_CASE("join test")
{
  SECTION("empty vector")
  {
    const std::vector<std::string> input{};
    const auto joined_str = zmd::utils::join(input, ","sv);
    REQUIRE(joined_str.empty());
  }
  SECTION("single element")
  {
    const std::vector<std::string> input{","};
    const auto joined_str = zmd::utils::join(input, ","sv);
    REQUIRE_EQ(joined_str, ",");
  }
  SECTION("short vector")
  {
    const std::vector<std::string> input{"1", "22", "333"};
    const auto joined_str = zmd::utils::join(input, ","sv);
    REQUIRE_EQ(joined_str.size(), 8);
    REQUIRE_EQ(joined_str, "1,22,333");
  }
  SECTION("default delimiter is newline")
  {
    const std::vector<std::string> input{"cannot receive", "destination exists"};
    REQUIRE_EQ(zmd::utils::join(input), "cannot receive\ndestination exists");
  }
}

TEST_CASE("trim test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto trimmed_str = zmd::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 0);
    REQUIRE_EQ(trimmed_str, input);
  }
  SECTION("only chars to trim")
  {
    static constexpr auto input = "\n\t \t\v\f"sv;
    const auto trimmed_str = zmd::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 0);
    REQUIRE_EQ(trimmed_str, ""sv);
  }
  SECTION("short string view")
  {
    static constexpr auto input = "\n\t 2\t\v\f"sv;
    const auto trimmed_str = zmd::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 1);
    REQUIRE_EQ(trimmed_str, "2"sv);
  }
  SECTION("resume token output")
  {
    static constexpr auto input = "1-e604ea4bf-e0-789c63a2\n"sv;
    REQUIRE_EQ(zmd::utils::trim(input), "1-e604ea4bf-e0-789c63a2"sv);
  }
}

TEST_CASE("utf8 prefix test")
{
  // "grüße" is 7 bytes, ü and ß take two each
  static constexpr auto input = "gr\xc3\xbc\xc3\x9f" "e"sv;
  SECTION("short strings are kept")
  {
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(input, 16), input.size());
  }
  SECTION("cut between characters")
  {
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(input, 4), 4);
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(input, 2), 2);
  }
  SECTION("cut inside a character")
  {
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(input, 3), 2);
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(input, 5), 4);
  }
  SECTION("four byte sequence")
  {
    static constexpr auto emoji = "ok\xf0\x9f\x91\x8d"sv;
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(emoji, 3), 2);
    REQUIRE_EQ(zmd::utils::utf8_prefix_length(emoji, 5), 2);
  }
  SECTION("plain bytes")
  {
    REQUIRE_EQ(zmd::utils::utf8_prefix_length("zfs receive"sv, 3), 3);
  }
}
