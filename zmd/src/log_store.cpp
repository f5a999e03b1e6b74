#include "zmd/log_store.hpp"
#include "zmd/string_utils.hpp"

#include <algorithm>     // for min
#include <charconv>      // for from_chars
#include <chrono>        // for floor, duration_cast
#include <optional>      // for optional
#include <system_error>  // for errc
#include <utility>       // for move

#include <fmt/chrono.h>
#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

constexpr auto kDroppedPrefix = "[... "sv;
constexpr auto kDroppedSuffix = " lines dropped ...]"sv;

auto dropped_marker(std::size_t count) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}{}{}"), kDroppedPrefix, count, kDroppedSuffix);
}

// Number from a marker line, std::nullopt for any other line.
auto parse_dropped_marker(std::string_view line) noexcept -> std::optional<std::size_t> {
    if (!line.starts_with(kDroppedPrefix) || !line.ends_with(kDroppedSuffix)) {
        return std::nullopt;
    }
    line.remove_prefix(kDroppedPrefix.size());
    line.remove_suffix(kDroppedSuffix.size());

    std::size_t count{};
    const auto* end      = line.data() + line.size();
    const auto [ptr, ec] = std::from_chars(line.data(), end, count);
    if (line.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return count;
}

constexpr auto line_bytes(const std::string& line) noexcept -> std::size_t {
    return line.size() + 1;
}

}  // namespace

namespace zmd::transfer {

auto format_log_line(TimePoint time_point, StreamSource source, std::string_view text) noexcept -> std::string {
    const auto& secs = std::chrono::floor<std::chrono::seconds>(time_point);
    const auto& ms   = std::chrono::duration_cast<std::chrono::milliseconds>(time_point - secs).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z [{}] {}",
        fmt::gmtime(Clock::to_time_t(secs)), ms, stream_source_to_string(source), text);
}

LogStore::LogStore(LogConfig config) noexcept : m_config(config) { }

void LogStore::append(StreamSource source, std::string_view text) noexcept {
    append(Clock::now(), source, text);
}

void LogStore::append(TimePoint time_point, StreamSource source, std::string_view text) noexcept {
    auto line = format_log_line(time_point, source, text);

    std::lock_guard<std::mutex> lock(m_mutex);
    push_line(std::move(line));
}

void LogStore::load(std::string_view content) noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_head.clear();
    m_tail.clear();
    m_bytes   = 0;
    m_dropped = 0;

    for (const auto& line : utils::make_split_view(content)) {
        if (auto dropped = parse_dropped_marker(line); dropped) {
            m_dropped += *dropped;
            continue;
        }
        push_line(std::string{line});
    }
}

// Caller holds m_mutex.
void LogStore::push_line(std::string line) noexcept {
    const auto line_cap = std::min(m_config.max_line_bytes, m_config.max_bytes > 0 ? m_config.max_bytes - 1 : 0);
    if (line.size() > line_cap) {
        line.resize(utils::utf8_prefix_length(line, line_cap));
    }

    const auto bytes = line_bytes(line);
    // the head is kept forever, so it may never outgrow the cap on its own
    if (m_tail.empty() && m_head.size() < m_config.head_lines && m_bytes + bytes <= m_config.max_bytes) {
        m_bytes += bytes;
        m_head.emplace_back(std::move(line));
        return;
    }

    m_bytes += bytes;
    m_tail.emplace_back(std::move(line));
    while (m_bytes > m_config.max_bytes && !m_tail.empty()) {
        m_bytes -= line_bytes(m_tail.front());
        m_tail.pop_front();
        ++m_dropped;
    }
}

auto LogStore::full() const noexcept -> std::string {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string result{};
    result.reserve(m_bytes + 64);
    for (const auto& line : m_head) {
        result += line;
        result += '\n';
    }
    if (m_dropped > 0) {
        result += dropped_marker(m_dropped);
        result += '\n';
    }
    for (const auto& line : m_tail) {
        result += line;
        result += '\n';
    }
    return result;
}

auto LogStore::gist() const noexcept -> std::string {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto total     = m_head.size() + m_tail.size();
    const auto line_at   = [this](std::size_t index) -> const std::string& {
        return index < m_head.size() ? m_head[index] : m_tail[index - m_head.size()];
    };
    const auto head_want = std::min(m_config.gist_head_lines, total);
    const auto tail_want = std::min(m_config.gist_tail_lines, total - head_want);

    // the head may use half of gist_max_bytes, the tail gets what the head left
    const auto limit = m_config.gist_max_bytes;
    std::size_t used{};
    std::size_t head_taken{};
    while (head_taken < head_want && used + line_bytes(line_at(head_taken)) <= limit / 2) {
        used += line_bytes(line_at(head_taken));
        ++head_taken;
    }

    std::size_t tail_taken{};
    while (tail_taken < tail_want) {
        const auto& line = line_at(total - 1 - tail_taken);
        if (used + line_bytes(line) > limit) {
            break;
        }
        used += line_bytes(line);
        ++tail_taken;
    }

    std::string result{};
    result.reserve(used);
    for (std::size_t i = 0; i < head_taken; ++i) {
        result += line_at(i);
        result += '\n';
    }
    for (std::size_t i = total - tail_taken; i < total; ++i) {
        result += line_at(i);
        result += '\n';
    }
    return result;
}

auto LogStore::line_count() const noexcept -> std::size_t {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_head.size() + m_tail.size();
}

auto LogStore::dropped_lines() const noexcept -> std::size_t {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

auto LogStore::size_bytes() const noexcept -> std::size_t {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bytes;
}

}  // namespace zmd::transfer
