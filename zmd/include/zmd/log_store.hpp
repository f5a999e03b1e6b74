#ifndef LOG_STORE_HPP
#define LOG_STORE_HPP

#include "zmd/pipeline.hpp"
#include "zmd/transfer_types.hpp"

#include <cstddef>      // for size_t
#include <deque>        // for deque
#include <mutex>        // for mutex
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace zmd::transfer {

/// @brief Bounded, timestamped capture of one job's output.
///
/// The first LogConfig::head_lines lines are kept for the lifetime of the store,
/// later lines form a ring which drops its oldest entries once the store
/// exceeds LogConfig::max_bytes.
class LogStore final {
 public:
    explicit LogStore(LogConfig config) noexcept;

    LogStore(const LogStore&)     = delete;
    auto operator=(const LogStore&) = delete;

    /// @brief Append a line stamped with the current time.
    void append(StreamSource source, std::string_view text) noexcept;
    void append(TimePoint time_point, StreamSource source, std::string_view text) noexcept;

    /// @brief Replace the content with a previously persisted full view.
    void load(std::string_view content) noexcept;

    /// @brief Every retained line, with a marker where lines were dropped.
    [[nodiscard]] auto full() const noexcept -> std::string;

    /// @brief Leading and trailing lines of the retained log within gist_max_bytes.
    [[nodiscard]] auto gist() const noexcept -> std::string;

    [[nodiscard]] auto line_count() const noexcept -> std::size_t;
    [[nodiscard]] auto dropped_lines() const noexcept -> std::size_t;
    /// @brief Bytes held by the retained lines, newlines included.
    [[nodiscard]] auto size_bytes() const noexcept -> std::size_t;
    [[nodiscard]] auto config() const noexcept -> const LogConfig& { return m_config; }

 private:
    void push_line(std::string line) noexcept;

    const LogConfig m_config;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_head{};
    std::deque<std::string> m_tail{};
    std::size_t m_bytes{};
    std::size_t m_dropped{};
};

/// @brief "<ISO-8601 UTC with ms> [source] text".
auto format_log_line(TimePoint time_point, StreamSource source, std::string_view text) noexcept -> std::string;

}  // namespace zmd::transfer

#endif  // LOG_STORE_HPP
