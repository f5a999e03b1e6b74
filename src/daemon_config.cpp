#include "daemon_config.hpp"

// import zmd
#include "zmd/io_utils.hpp"
#include "zmd/transfer_json.hpp"

#include <chrono>        // for milliseconds
#include <filesystem>    // for exists
#include <system_error>  // for error_code
#include <utility>       // for move, pair

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

auto read_string_field(const rapidjson::Document& doc, const char* key, std::string& out) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out = doc[key].GetString();
    return {};
}

auto read_int_field(const rapidjson::Document& doc, const char* key, std::int32_t& out) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsInt() || doc[key].GetInt() < 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a non-negative integer"), key));
    }
    out = doc[key].GetInt();
    return {};
}

}  // namespace

namespace service {

auto log_level_from_string(std::string_view level_str) noexcept
    -> std::optional<spdlog::level::level_enum> {
    if (level_str == "trace"sv) {
        return spdlog::level::trace;
    }
    if (level_str == "debug"sv) {
        return spdlog::level::debug;
    }
    if (level_str == "info"sv) {
        return spdlog::level::info;
    }
    if (level_str == "warn"sv) {
        return spdlog::level::warn;
    }
    if (level_str == "error"sv) {
        return spdlog::level::err;
    }
    if (level_str == "off"sv) {
        return spdlog::level::off;
    }
    return std::nullopt;
}

auto parse_daemon_config(std::string_view json_content) noexcept
    -> std::expected<DaemonConfig, std::string> {
    DaemonConfig config{};
    if (json_content.empty()) {
        return config;
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    for (const auto& [key, field] : {
             std::pair{"state_dir", &config.state_dir},
             std::pair{"zfs_binary", &config.zfs_binary},
             std::pair{"zpool_binary", &config.zpool_binary},
             std::pair{"log_file", &config.log_file},
             std::pair{"log_level", &config.log_level},
         }) {
        if (auto res = read_string_field(doc, key, *field); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    // Parse use_sudo (optional, default false)
    if (doc.HasMember("use_sudo")) {
        if (!doc["use_sudo"].IsBool()) {
            return std::unexpected("'use_sudo' must be a boolean");
        }
        config.use_sudo = doc["use_sudo"].GetBool();
    }

    if (!log_level_from_string(config.log_level)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid log level '{}'. Valid levels: trace, debug, info, warn, error, off"), config.log_level));
    }
    if (config.zfs_binary.empty() || config.zpool_binary.empty()) {
        return std::unexpected("tool binaries must not be empty");
    }

    for (const auto& [key, field] : {
             std::pair{"grace_period_ms", &config.grace_period_ms},
             std::pair{"resume_token_retries", &config.resume_token_retries},
             std::pair{"resume_token_retry_delay_ms", &config.resume_token_retry_delay_ms},
         }) {
        if (auto res = read_int_field(doc, key, *field); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }
    if (config.grace_period_ms == 0) {
        return std::unexpected("'grace_period_ms' must be positive");
    }

    // Parse transfer_log (optional, defaults per field)
    if (doc.HasMember("transfer_log")) {
        auto log_config = zmd::transfer::json::log_config_from_json(doc["transfer_log"], config.transfer_log);
        if (!log_config) {
            return std::unexpected(fmt::format(FMT_COMPILE("'transfer_log': {}"), log_config.error()));
        }
        config.transfer_log = *log_config;
    }

    return config;
}

auto load_daemon_config() noexcept -> std::expected<DaemonConfig, std::string> {
    auto config_path = std::string{zmd::utils::safe_getenv("ZMD_CONFIG")};
    if (config_path.empty()) {
        config_path = kDefaultConfigPath;
    }

    std::error_code err{};
    if (!fs::exists(config_path, err)) {
        return DaemonConfig{};
    }

    std::string content{};
    if (!zmd::utils::read_whole_file(config_path, content)) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to read config file '{}'"), config_path));
    }
    auto config = parse_daemon_config(content);
    if (!config) {
        return std::unexpected(fmt::format(FMT_COMPILE("{}: {}"), config_path, config.error()));
    }
    return config;
}

auto to_manager_config(const DaemonConfig& config) noexcept
    -> zmd::transfer::TransferManager::Config {
    return zmd::transfer::TransferManager::Config{
        .state_dir                = config.state_dir,
        .log_config               = config.transfer_log,
        .grace_period             = std::chrono::milliseconds{config.grace_period_ms},
        .resume_token_retries     = config.resume_token_retries,
        .resume_token_retry_delay = std::chrono::milliseconds{config.resume_token_retry_delay_ms},
    };
}

}  // namespace service
