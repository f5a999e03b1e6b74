#include "zmd/io_utils.hpp"

#include <cstdlib>  // for getenv

#include <filesystem>  // for rename
#include <fstream>     // for ifstream, ofstream
#include <iterator>    // for istreambuf_iterator

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace zmd::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto log_exec_cmds() noexcept -> bool {
    return utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
}

auto read_whole_file(const std::string& file_path, std::string& content) noexcept -> bool {
    std::ifstream file_stream{file_path, std::ios::binary};
    if (!file_stream.is_open()) {
        return false;
    }
    content.assign(std::istreambuf_iterator<char>{file_stream}, std::istreambuf_iterator<char>{});
    return !file_stream.bad();
}

auto write_file_atomic(const std::string& file_path, std::string_view content) noexcept -> bool {
    const auto& tmp_path = fmt::format(FMT_COMPILE("{}.tmp"), file_path);
    {
        std::ofstream file_stream{tmp_path, std::ios::binary | std::ios::trunc};
        if (!file_stream.is_open()) {
            spdlog::error("Failed to open '{}' for writing", tmp_path);
            return false;
        }
        file_stream.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file_stream) {
            spdlog::error("Failed to write '{}'", tmp_path);
            return false;
        }
    }

    std::error_code err{};
    fs::rename(tmp_path, file_path, err);
    if (err) {
        spdlog::error("Failed to rename '{}' to '{}': {}", tmp_path, file_path, err.message());
        return false;
    }
    return true;
}

auto format_command(const std::vector<std::string>& args) noexcept -> std::string {
    std::string result{};
    for (const auto& arg : args) {
        if (!result.empty()) {
            result += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
            result += fmt::format(FMT_COMPILE("'{}'"), arg);
        } else {
            result += arg;
        }
    }
    return result;
}

}  // namespace zmd::utils
