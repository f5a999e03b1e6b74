#include "zmd/string_utils.hpp"

#include <algorithm>  // for for_each, reverse

namespace zmd::utils {

auto make_multiline_view(std::string_view str, bool reverse, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    if (reverse) {
        std::ranges::reverse(lines);
    }
    return lines;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    std::string res{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            res += delim;
        }
        res += lines[i];
    }
    return res;
}

auto trim(std::string_view str) noexcept -> std::string_view {
    constexpr auto whitespace = " \t\r\n\v\f";

    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

auto utf8_prefix_length(std::string_view str, std::size_t max_bytes) noexcept -> std::size_t {
    if (str.size() <= max_bytes) {
        return str.size();
    }
    // step back over continuation bytes (10xxxxxx) and the lead byte they follow,
    // a sequence is at most four bytes long
    std::size_t len = max_bytes;
    for (std::size_t steps = 0; len > 0 && steps < 3 && (static_cast<unsigned char>(str[len]) & 0xC0U) == 0x80U; ++steps) {
        --len;
    }
    if ((static_cast<unsigned char>(str[len]) & 0xC0U) == 0xC0U) {
        return len;
    }
    return max_bytes;
}

}  // namespace zmd::utils
