#include "control.hpp"        // for ControlChannel
#include "daemon_config.hpp"  // for load_daemon_config

// import zmd
#include "zmd/command_executor.hpp"
#include "zmd/logger.hpp"
#include "zmd/transfer_manager.hpp"
#include "zmd/zfs.hpp"

#include <poll.h>          // for poll, pollfd
#include <pthread.h>       // for pthread_sigmask
#include <signal.h>        // for sigset_t, sigaddset
#include <sys/signalfd.h>  // for signalfd, signalfd_siginfo
#include <unistd.h>        // for read, geteuid, STDIN_FILENO

#include <array>        // for array
#include <cerrno>       // for errno, EINTR
#include <chrono>       // for seconds
#include <cstdio>       // for stderr, stdout, fflush
#include <cstring>      // for strerror
#include <memory>       // for make_shared
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

#include <fmt/core.h>

#include <spdlog/async.h>                  // for create_async
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

namespace {

// Blocks termination signals in every thread and returns a descriptor
// delivering them instead. Must run before any thread is created.
auto open_signal_fd() noexcept -> int {
    sigset_t mask{};
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        return -1;
    }
    return signalfd(-1, &mask, SFD_CLOEXEC);
}

// Answer every complete line of buffer and keep the unfinished rest.
void handle_lines(service::ControlChannel& channel, std::string& buffer) noexcept {
    std::size_t start{};
    for (auto pos = buffer.find('\n'); pos != std::string::npos; pos = buffer.find('\n', start)) {
        const std::string_view line{buffer.data() + start, pos - start};
        start = pos + 1;
        if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
            continue;
        }
        fmt::print("{}\n", channel.handle_request(line));
        std::fflush(stdout);
    }
    buffer.erase(0, start);
}

// Serves the control channel until a termination signal or EOF on stdin.
void serve(service::ControlChannel& channel, int signal_fd) noexcept {
    std::string buffer{};
    std::array<char, 4096> chunk{};
    std::array<pollfd, 2> fds{
        pollfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0},
        pollfd{.fd = signal_fd, .events = POLLIN, .revents = 0},
    };

    while (true) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed: {}", std::strerror(errno));
            return;
        }

        if ((fds[1].revents & POLLIN) != 0) {
            signalfd_siginfo info{};
            if (::read(signal_fd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                spdlog::info("Received signal {}, shutting down", info.ssi_signo);
            }
            return;
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            const auto bytes = ::read(STDIN_FILENO, chunk.data(), chunk.size());
            if (bytes < 0 && errno == EINTR) {
                continue;
            }
            if (bytes <= 0) {
                if (!buffer.empty()) {
                    buffer.push_back('\n');
                    handle_lines(channel, buffer);
                }
                spdlog::info("Control channel closed, shutting down");
                return;
            }
            buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
            handle_lines(channel, buffer);
        }
    }
}

}  // namespace

int main() {
    auto config = service::load_daemon_config();
    if (!config) {
        fmt::print(stderr, "Failed to load configuration: {}\n", config.error());
        return 1;
    }

    const int signal_fd = open_signal_fd();
    if (signal_fd < 0) {
        fmt::print(stderr, "Failed to set up signal handling: {}\n", std::strerror(errno));
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("zmd_logger", config->log_file);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(*service::log_level_from_string(config->log_level));
    spdlog::flush_every(std::chrono::seconds(5));

    // Set zmd logger.
    zmd::logger::set_logger(logger);

    if (!config->use_sudo && ::geteuid() != 0) {
        spdlog::warn("Running unprivileged without sudo, zfs commands may be refused");
    }

    auto datasets = std::make_shared<zmd::zfs::ZfsDatasetManager>(zmd::utils::CommandExecutor{zmd::utils::CommandExecutor::Config{
        .zfs_binary   = config->zfs_binary,
        .zpool_binary = config->zpool_binary,
        .use_sudo     = config->use_sudo,
    }});

    {
        zmd::transfer::TransferManager manager{std::move(datasets), service::to_manager_config(*config)};
        service::ControlChannel channel{manager, config->transfer_log};
        spdlog::info("zmd started, state directory {}", config->state_dir);

        serve(channel, signal_fd);
        manager.shutdown();
    }

    ::close(signal_fd);
    spdlog::info("zmd stopped");
    spdlog::shutdown();
}
