#include "zmd/command_executor.hpp"
#include "zmd/io_utils.hpp"
#include "zmd/string_utils.hpp"

#include <poll.h>  // for poll, pollfd

#include <cerrno>   // for errno
#include <cstdint>  // for uint32_t
#include <cstdio>   // for fileno
#include <cstring>  // for strerror

#include <algorithm>  // for transform, find
#include <array>      // for array
#include <iterator>   // for back_inserter
#include <ranges>     // for ranges::*
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <subprocess.h>

using namespace std::string_view_literals;

namespace {

constexpr std::size_t kMaxCommandArgs = 64;

// Commands that support JSON output
constexpr std::array kJsonSupportedCommands{
    "zfs get"sv,
    "zfs list"sv,
    "zfs version"sv,
    "zpool get"sv,
    "zpool list"sv,
    "zpool status"sv,
};

// Commands that require sudo
constexpr std::array kSudoRequiredCommands{
    "zfs create"sv,
    "zfs destroy"sv,
    "zfs rename"sv,
    "zfs snapshot"sv,
    "zfs rollback"sv,
    "zfs clone"sv,
    "zfs set"sv,
    "zfs send"sv,
    "zfs receive"sv,
    "zpool create"sv,
    "zpool destroy"sv,
    "zpool set"sv,
};

constexpr auto is_listed(const auto& list, std::string_view command) noexcept -> bool {
    return std::ranges::find(list, command) != std::ranges::end(list);
}

// Drain stdout and stderr together, a child blocked on a full stderr pipe
// never closes its stdout.
void read_streams(subprocess_s* process, zmd::utils::ProcessOutput& output) noexcept {
    std::array<pollfd, 2> fds{{
        {.fd = ::fileno(subprocess_stdout(process)), .events = POLLIN, .revents = 0},
        {.fd = ::fileno(subprocess_stderr(process)), .events = POLLIN, .revents = 0},
    }};
    std::array<char, 4096> buf{};

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[run_captured] poll failed: {}", std::strerror(errno));
            return;
        }
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const auto bytes_read = (i == 0)
                ? subprocess_read_stdout(process, buf.data(), static_cast<std::uint32_t>(buf.size()))
                : subprocess_read_stderr(process, buf.data(), static_cast<std::uint32_t>(buf.size()));
            if (bytes_read == 0) {
                // closed, a negative fd is skipped by poll
                fds[i].fd = -1;
                continue;
            }
            (i == 0 ? output.out : output.err).append(buf.data(), bytes_read);
        }
    }
}

}  // namespace

namespace zmd::utils {

auto run_captured(const std::vector<std::string>& args) noexcept -> std::expected<ProcessOutput, std::string> {
    if (args.empty()) {
        return std::unexpected("empty command");
    }
    if (utils::log_exec_cmds() && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[run_captured] cmd := {}", args);
    }

    std::vector<const char*> argv;
    std::transform(args.cbegin(), args.cend(), std::back_inserter(argv),
        [](const std::string& arg) -> const char* { return arg.c_str(); });
    argv.push_back(nullptr);

    static constexpr const char* environment[] = {"PATH=/sbin:/bin:/usr/local/sbin:/usr/local/bin:/usr/bin:/usr/sbin", nullptr};

    subprocess_s process{};
    const auto options = subprocess_option_enable_async | subprocess_option_search_user_path;
    if (subprocess_create_ex(argv.data(), options, environment, &process) != 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to spawn '{}'"), args.front()));
    }

    ProcessOutput output{};
    read_streams(&process, output);

    int ret{0};
    if (subprocess_join(&process, &ret) != 0) {
        spdlog::error("[run_captured] Failed to join process: return code {}", ret);
        subprocess_destroy(&process);
        return std::unexpected(fmt::format(FMT_COMPILE("failed to join '{}'"), args.front()));
    }
    if (subprocess_destroy(&process) != 0) {
        spdlog::error("[run_captured] Failed to destroy process");
    }
    output.exit_code = ret;
    return output;
}

CommandExecutor::CommandExecutor(Config config) noexcept : m_config(std::move(config)) { }

auto CommandExecutor::build_args(const CommandOptions& options, std::string_view command,
    const std::vector<std::string>& args) const noexcept -> std::expected<std::vector<std::string>, CommandError> {
    const auto& parts = utils::make_multiline_view(command, false, ' ');
    if (parts.empty()) {
        return std::unexpected(CommandError{.command = std::string{command}, .message = "empty command"});
    }

    // Only allow zfs/zpool commands
    const auto& base = parts.front();
    if (base != "zfs"sv && base != "zpool"sv) {
        return std::unexpected(CommandError{.command = std::string{command}, .message = "only zfs and zpool commands are allowed"});
    }

    constexpr auto dangerous_chars = ";&|><$`\\"sv;
    for (const auto& arg : args) {
        if (arg.find_first_of(dangerous_chars) != std::string::npos) {
            return std::unexpected(CommandError{.command = std::string{command}, .message = fmt::format(FMT_COMPILE("argument '{}' contains invalid characters"), arg)});
        }
        if (arg.contains(".."sv)) {
            return std::unexpected(CommandError{.command = std::string{command}, .message = "path traversal not allowed"});
        }
    }

    std::vector<std::string> cmd_args{};
    if (m_config.use_sudo && is_listed(kSudoRequiredCommands, command)) {
        cmd_args.emplace_back("sudo");
    }
    cmd_args.emplace_back(base == "zfs"sv ? m_config.zfs_binary : m_config.zpool_binary);
    if (parts.size() > 1) {
        cmd_args.emplace_back(parts[1]);
    }

    if (options.json && is_listed(kJsonSupportedCommands, command)) {
        cmd_args.emplace_back("-j");
    }
    if (options.parsable) {
        cmd_args.emplace_back("-p");
    }
    if (options.recursive) {
        cmd_args.emplace_back("-r");
    }
    if (options.force) {
        cmd_args.emplace_back("-f");
    }
    if (options.no_headers) {
        cmd_args.emplace_back("-H");
    }
    cmd_args.insert(cmd_args.end(), args.begin(), args.end());

    if (cmd_args.size() > kMaxCommandArgs) {
        return std::unexpected(CommandError{.command = std::string{command}, .message = "too many arguments"});
    }
    return cmd_args;
}

auto CommandExecutor::execute(const CommandOptions& options, std::string_view command,
    const std::vector<std::string>& args) const noexcept -> std::expected<std::string, CommandError> {
    auto cmd_args = build_args(options, command, args);
    if (!cmd_args) {
        spdlog::error("Rejected command '{}': {}", command, cmd_args.error().message);
        return std::unexpected(std::move(cmd_args.error()));
    }

    const auto& cmd_line = utils::format_command(*cmd_args);
    spdlog::debug("Executing command: {}", cmd_line);

    auto output = utils::run_captured(*cmd_args);
    if (!output) {
        return std::unexpected(CommandError{.command = cmd_line, .message = std::move(output.error())});
    }
    if (output->exit_code != 0) {
        return std::unexpected(CommandError{
            .command   = cmd_line,
            .exit_code = output->exit_code,
            .output    = std::string{utils::trim(output->err)},
            .message   = fmt::format(FMT_COMPILE("command exited with status {}"), output->exit_code),
        });
    }
    return std::move(output->out);
}

}  // namespace zmd::utils
