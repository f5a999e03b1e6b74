#ifndef DAEMON_CONFIG_HPP
#define DAEMON_CONFIG_HPP

#include "zmd/transfer_manager.hpp"
#include "zmd/transfer_types.hpp"

#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/common.h>

namespace service {

/// Path used when ZMD_CONFIG is not set.
inline constexpr std::string_view kDefaultConfigPath = "/etc/zmd/config.json";

/// Daemon configuration.
struct DaemonConfig {
    // Persistence
    std::string state_dir{"/var/lib/zmd"};

    // Tools
    std::string zfs_binary{"zfs"};
    std::string zpool_binary{"zpool"};
    bool use_sudo{false};

    // Logging
    std::string log_file{"/var/log/zmd.log"};
    std::string log_level{"info"};

    // Transfers
    std::int32_t grace_period_ms{5000};
    std::int32_t resume_token_retries{3};
    std::int32_t resume_token_retry_delay_ms{2000};
    zmd::transfer::LogConfig transfer_log{};
};

/// Converts a level name such as "debug" to the spdlog level.
/// @return The level or std::nullopt if invalid.
[[nodiscard]] auto log_level_from_string(std::string_view level_str) noexcept
    -> std::optional<spdlog::level::level_enum>;

/// Parses daemon configuration from JSON string content.
/// @param json_content The JSON configuration content, empty means defaults.
/// @return DaemonConfig on success, or error string on failure.
[[nodiscard]] auto parse_daemon_config(std::string_view json_content) noexcept
    -> std::expected<DaemonConfig, std::string>;

/// Reads the file named by ZMD_CONFIG, or kDefaultConfigPath.
/// A missing file yields the defaults.
[[nodiscard]] auto load_daemon_config() noexcept -> std::expected<DaemonConfig, std::string>;

/// Settings of the transfer manager derived from config.
[[nodiscard]] auto to_manager_config(const DaemonConfig& config) noexcept
    -> zmd::transfer::TransferManager::Config;

}  // namespace service

#endif  // DAEMON_CONFIG_HPP
