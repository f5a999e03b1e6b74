#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace zmd::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Whether every executed command line should be logged (LOG_EXEC_CMDS=1).
auto log_exec_cmds() noexcept -> bool;

/// @brief Read a whole file into a string.
/// @return True on success.
auto read_whole_file(const std::string& file_path, std::string& content) noexcept -> bool;

/// @brief Atomically replace a file: write into "<path>.tmp" and rename over.
auto write_file_atomic(const std::string& file_path, std::string_view content) noexcept -> bool;

/// @brief Render argv as a single shell-like string for logs.
auto format_command(const std::vector<std::string>& args) noexcept -> std::string;

}  // namespace zmd::utils

#endif  // IO_UTILS_HPP
