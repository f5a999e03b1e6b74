#include "zmd/pipeline.hpp"
#include "zmd/io_utils.hpp"
#include "zmd/string_utils.hpp"

#include <fcntl.h>     // for open, O_CLOEXEC, O_RDONLY
#include <poll.h>      // for poll, pollfd
#include <signal.h>    // for kill, sigaction, sigprocmask
#include <sys/wait.h>  // for waitid, waitpid
#include <unistd.h>    // for close, dup2, execvp, fork, pipe2, read, setpgid, write

#include <cerrno>  // for errno

#include <algorithm>     // for transform
#include <array>         // for array
#include <deque>         // for deque
#include <iterator>      // for back_inserter
#include <system_error>  // for system_category
#include <utility>       // for exchange, move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using zmd::transfer::CancelIntent;
using zmd::transfer::ProcessStatus;
using zmd::transfer::StreamSource;
using LineCallback = zmd::transfer::PipelineRunner::LineCallback;

// longest partial line buffered before it is emitted anyway
constexpr std::size_t kMaxPendingLine = 64 * 1024;
// poll rounds spent collecting output after both processes are gone
constexpr std::int32_t kDrainRounds = 20;

auto errno_message(int err) noexcept -> std::string {
    return std::system_category().message(err);
}

class FileDescriptor final {
 public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : m_fd(fd) { }
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&)     = delete;
    auto operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(std::exchange(other.m_fd, -1)) { }
    auto operator=(FileDescriptor&& other) noexcept -> FileDescriptor& {
        if (this != &other) {
            reset();
            m_fd = std::exchange(other.m_fd, -1);
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return m_fd; }
    [[nodiscard]] auto valid() const noexcept -> bool { return m_fd >= 0; }

    void reset() noexcept {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

 private:
    int m_fd{-1};
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

auto make_pipe() noexcept -> std::optional<Pipe> {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return std::nullopt;
    }
    return Pipe{.read_end = FileDescriptor{fds[0]}, .write_end = FileDescriptor{fds[1]}};
}

struct ChildFds {
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
};

auto status_from_wait(int status) noexcept -> ProcessStatus {
    ProcessStatus result{.launched = true};
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

// Blocks until the child is reaped.
auto reap(pid_t pid) noexcept -> ProcessStatus {
    int status{};
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid, errno_message(errno));
            return ProcessStatus{.launched = true};
        }
    }
    return status_from_wait(status);
}

// Whether the child has terminated, without reaping it.
auto has_exited(pid_t pid) noexcept -> bool {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

void signal_group(pid_t pgid, int sig) noexcept {
    if (::kill(-pgid, sig) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to send signal {} to process group {}: {}", sig, pgid, errno_message(errno));
    }
}

constexpr auto intent_rank(CancelIntent intent) noexcept -> std::int32_t {
    switch (intent) {
    case CancelIntent::None:
        return 0;
    case CancelIntent::PauseRequested:
        return 1;
    case CancelIntent::StopRequested:
        return 2;
    }
    return 0;
}

/// Fork and exec a child joined to process group pgid (0 makes it the leader).
auto spawn_child(const std::vector<std::string>& args, ChildFds fds, pid_t pgid) noexcept -> std::expected<pid_t, std::string> {
    std::vector<char*> argv;
    std::transform(args.cbegin(), args.cend(), std::back_inserter(argv),
        [=](const std::string& arg) -> char* { return const_cast<char*>(arg.data()); });
    argv.push_back(nullptr);

    // carries errno of a failed exec back to the parent
    auto status_pipe = make_pipe();
    if (!status_pipe) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to create status pipe: {}"), errno_message(errno)));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to fork '{}': {}"), args.front(), errno_message(errno)));
    }
    if (pid == 0) {
        // only async-signal-safe calls until exec
        ::setpgid(0, pgid);

        struct sigaction default_action{};
        default_action.sa_handler = SIG_DFL;
        sigemptyset(&default_action.sa_mask);
        for (const int sig : {SIGPIPE, SIGINT, SIGTERM, SIGHUP}) {
            ::sigaction(sig, &default_action, nullptr);
        }
        sigset_t empty_mask{};
        sigemptyset(&empty_mask);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        if (::dup2(fds.stdin_fd, STDIN_FILENO) >= 0 && ::dup2(fds.stdout_fd, STDOUT_FILENO) >= 0
            && ::dup2(fds.stderr_fd, STDERR_FILENO) >= 0) {
            ::execvp(argv[0], argv.data());
        }
        const int err = errno;
        [[maybe_unused]] const auto written = ::write(status_pipe->write_end.get(), &err, sizeof(err));
        ::_exit(127);
    }

    // both sides call setpgid, whichever runs first wins
    if (::setpgid(pid, pgid == 0 ? pid : pgid) != 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) failed: {}", pid, errno_message(errno));
    }

    status_pipe->write_end.reset();
    int exec_errno{};
    ssize_t bytes_read{};
    do {
        bytes_read = ::read(status_pipe->read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        reap(pid);
        return std::unexpected(fmt::format(FMT_COMPILE("failed to execute '{}': {}"), args.front(), errno_message(exec_errno)));
    }
    return pid;
}

/// Splits one output stream into lines and remembers the last few.
class LineReader final {
 public:
    LineReader(StreamSource source, FileDescriptor fd, std::size_t tail_cap) noexcept
      : m_source(source), m_fd(std::move(fd)), m_tail_cap(tail_cap) { }

    [[nodiscard]] auto is_open() const noexcept -> bool { return m_fd.valid(); }
    [[nodiscard]] auto fd() const noexcept -> int { return m_fd.get(); }

    // Called once poll reported the descriptor readable; closes it at EOF.
    void read_some(const LineCallback& on_line) noexcept {
        std::array<char, 4096> buf{};
        const auto bytes_read = ::read(m_fd.get(), buf.data(), buf.size());
        if (bytes_read < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return;
            }
            spdlog::error("Failed to read {} output: {}", zmd::transfer::stream_source_to_string(m_source), errno_message(errno));
            finish(on_line);
            return;
        }
        if (bytes_read == 0) {
            finish(on_line);
            return;
        }

        m_pending.append(buf.data(), static_cast<std::size_t>(bytes_read));
        std::size_t line_start{};
        for (auto pos = m_pending.find('\n'); pos != std::string::npos; pos = m_pending.find('\n', line_start)) {
            emit(std::string_view{m_pending}.substr(line_start, pos - line_start), on_line);
            line_start = pos + 1;
        }
        m_pending.erase(0, line_start);
        while (m_pending.size() >= kMaxPendingLine) {
            const auto cut = zmd::utils::utf8_prefix_length(m_pending, kMaxPendingLine);
            emit(std::string_view{m_pending}.substr(0, cut), on_line);
            m_pending.erase(0, cut);
        }
    }

    // Emit a trailing partial line and close.
    void finish(const LineCallback& on_line) noexcept {
        if (!m_pending.empty()) {
            emit(m_pending, on_line);
            m_pending.clear();
        }
        m_fd.reset();
    }

    auto take_tail() noexcept -> std::vector<std::string> {
        return {std::make_move_iterator(m_tail.begin()), std::make_move_iterator(m_tail.end())};
    }

 private:
    void emit(std::string_view line, const LineCallback& on_line) noexcept {
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            return;
        }
        if (on_line) {
            on_line(m_source, line);
        }
        m_tail.emplace_back(line);
        if (m_tail.size() > m_tail_cap) {
            m_tail.pop_front();
        }
    }

    StreamSource m_source;
    FileDescriptor m_fd;
    std::size_t m_tail_cap;
    std::string m_pending{};
    std::deque<std::string> m_tail{};
};

// Wait up to timeout for output and consume whatever is readable.
void pump(std::array<LineReader*, 2> readers, std::chrono::milliseconds timeout, const LineCallback& on_line) noexcept {
    std::array<pollfd, 2> poll_fds{};
    std::array<LineReader*, 2> polled{};
    nfds_t count{};
    for (auto* reader : readers) {
        if (reader->is_open()) {
            poll_fds[count] = pollfd{.fd = reader->fd(), .events = POLLIN, .revents = 0};
            polled[count]   = reader;
            ++count;
        }
    }

    const int ready = ::poll(poll_fds.data(), count, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno != EINTR) {
            spdlog::error("poll failed: {}", errno_message(errno));
        }
        return;
    }
    for (nfds_t i = 0; i < count; ++i) {
        if ((poll_fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            polled[i]->read_some(on_line);
        }
    }
}

}  // namespace

namespace zmd::transfer {

auto stream_source_to_string(StreamSource source) noexcept -> std::string_view {
    switch (source) {
    case StreamSource::Send:
        return "send"sv;
    case StreamSource::Receive:
        return "receive"sv;
    case StreamSource::Transfer:
        return "transfer"sv;
    }
    return "unknown"sv;
}

auto ProcessStatus::describe() const noexcept -> std::string {
    if (!launched) {
        return "not launched";
    }
    if (term_signal != 0) {
        return fmt::format(FMT_COMPILE("killed by signal {}"), term_signal);
    }
    return fmt::format(FMT_COMPILE("exit status {}"), exit_code);
}

PipelineRunner::PipelineRunner(Config config) noexcept : m_config(config) { }

auto PipelineRunner::run(const PipelineCommands& commands, const LineCallback& on_line,
    const IntentCallback& poll_intent, const StartedCallback& on_started) const noexcept -> PipelineResult {
    PipelineResult result{};
    if (commands.send.empty() || commands.receive.empty()) {
        result.launch_error = "empty pipeline command";
        return result;
    }
    if (utils::log_exec_cmds()) {
        spdlog::debug("[pipeline] send := {}, receive := {}", commands.send, commands.receive);
    }

    auto data_pipe    = make_pipe();
    auto send_stderr  = make_pipe();
    auto recv_output  = make_pipe();
    if (!data_pipe || !send_stderr || !recv_output) {
        result.launch_error = fmt::format(FMT_COMPILE("failed to create pipes: {}"), errno_message(errno));
        return result;
    }
    FileDescriptor dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (!dev_null.valid()) {
        result.launch_error = fmt::format(FMT_COMPILE("failed to open /dev/null: {}"), errno_message(errno));
        return result;
    }

    const auto send_pid = spawn_child(commands.send,
        ChildFds{.stdin_fd = dev_null.get(), .stdout_fd = data_pipe->write_end.get(), .stderr_fd = send_stderr->write_end.get()}, 0);
    if (!send_pid) {
        result.launch_error = send_pid.error();
        return result;
    }
    result.send.launched = true;
    const pid_t pgid     = *send_pid;

    const auto receive_pid = spawn_child(commands.receive,
        ChildFds{.stdin_fd = data_pipe->read_end.get(), .stdout_fd = recv_output->write_end.get(), .stderr_fd = recv_output->write_end.get()}, pgid);
    if (!receive_pid) {
        result.launch_error = receive_pid.error();
        // nobody will ever read the stream
        signal_group(pgid, SIGKILL);
        result.send = reap(*send_pid);
        return result;
    }
    result.receive.launched = true;

    // the children hold their own copies now
    data_pipe->read_end.reset();
    data_pipe->write_end.reset();
    send_stderr->write_end.reset();
    recv_output->write_end.reset();
    dev_null.reset();

    if (on_started) {
        on_started(*send_pid, *receive_pid);
    }

    LineReader send_reader{StreamSource::Send, std::move(send_stderr->read_end), m_config.tail_lines};
    LineReader recv_reader{StreamSource::Receive, std::move(recv_output->read_end), m_config.tail_lines};
    const std::array<LineReader*, 2> readers{&send_reader, &recv_reader};

    bool send_done{false};
    bool recv_done{false};
    std::optional<std::chrono::steady_clock::time_point> signaled_at{};

    const auto try_reap = [&](pid_t pid, bool other_done, ProcessStatus& status) -> bool {
        if (!has_exited(pid)) {
            return false;
        }
        // the last member keeps the group id reserved until it is reaped
        if (other_done) {
            signal_group(pgid, SIGKILL);
        }
        status = reap(pid);
        return true;
    };

    while (!send_done || !recv_done) {
        pump(readers, m_config.poll_interval, on_line);

        if (poll_intent) {
            const auto intent = poll_intent();
            if (intent_rank(intent) > intent_rank(result.signaled_intent)) {
                const int sig = (intent == CancelIntent::StopRequested) ? SIGTERM : SIGINT;
                spdlog::debug("[pipeline] {} requested, signaling group {} with {}", cancel_intent_to_string(intent), pgid, sig);
                signal_group(pgid, sig);
                result.signaled_intent = intent;
                if (!signaled_at) {
                    signaled_at = std::chrono::steady_clock::now();
                }
            }
        }
        if (signaled_at && !result.killed && std::chrono::steady_clock::now() - *signaled_at >= m_config.grace_period) {
            spdlog::warn("[pipeline] grace period expired, killing process group {}", pgid);
            signal_group(pgid, SIGKILL);
            result.killed = true;
        }

        if (!send_done) {
            send_done = try_reap(*send_pid, recv_done, result.send);
        }
        if (!recv_done) {
            recv_done = try_reap(*receive_pid, send_done, result.receive);
        }
    }

    for (std::int32_t round = 0; round < kDrainRounds && (send_reader.is_open() || recv_reader.is_open()); ++round) {
        pump(readers, m_config.poll_interval, on_line);
    }
    send_reader.finish(on_line);
    recv_reader.finish(on_line);

    result.send_tail    = send_reader.take_tail();
    result.receive_tail = recv_reader.take_tail();
    return result;
}

}  // namespace zmd::transfer
