#ifndef COMMAND_EXECUTOR_HPP
#define COMMAND_EXECUTOR_HPP

#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace zmd::utils {

/// @brief Flags appended after the subcommand.
struct CommandOptions {
    bool json{false};        // -j, only for commands supporting it
    bool parsable{false};    // -p
    bool recursive{false};   // -r
    bool force{false};       // -f
    bool no_headers{false};  // -H
};

/// @brief Failure of an executed command, with whatever it printed.
struct CommandError {
    std::string command;
    /// Exit status, -1 when the process could not be run at all.
    std::int32_t exit_code{-1};
    /// Captured standard error.
    std::string output;
    std::string message;
};

/// @brief Captured result of a finished child process.
struct ProcessOutput {
    std::int32_t exit_code{};
    std::string out;
    std::string err;
};

/// @brief Run argv to completion, capturing stdout and stderr separately.
/// @param args The arguments to launch, args[0] is looked up in PATH.
/// @return Captured output, or an error string if the process could not be spawned.
auto run_captured(const std::vector<std::string>& args) noexcept -> std::expected<ProcessOutput, std::string>;

/// @brief Executes zfs/zpool subcommands with argument checks.
class CommandExecutor final {
 public:
    struct Config {
        std::string zfs_binary{"zfs"};
        std::string zpool_binary{"zpool"};
        bool use_sudo{false};
    };

    CommandExecutor() = default;
    explicit CommandExecutor(Config config) noexcept;

    /// @brief Run a command such as "zfs get" with the given arguments.
    /// @param options Flags to add after the subcommand.
    /// @param command Base command and subcommand, e.g. "zfs receive".
    /// @param args Remaining arguments.
    /// @return Standard output on success.
    [[nodiscard]] auto execute(const CommandOptions& options, std::string_view command,
        const std::vector<std::string>& args) const noexcept -> std::expected<std::string, CommandError>;

    /// @brief Build the final argv for a command without running it.
    [[nodiscard]] auto build_args(const CommandOptions& options, std::string_view command,
        const std::vector<std::string>& args) const noexcept -> std::expected<std::vector<std::string>, CommandError>;

    [[nodiscard]] auto config() const noexcept -> const Config& { return m_config; }

 private:
    Config m_config{};
};

}  // namespace zmd::utils

#endif  // COMMAND_EXECUTOR_HPP
