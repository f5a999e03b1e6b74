#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "zmd/transfer_types.hpp"

#include <sys/types.h>  // for pid_t

#include <chrono>       // for milliseconds
#include <cstddef>      // for size_t
#include <cstdint>      // for int32_t, uint8_t
#include <expected>     // for expected
#include <functional>   // for function
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace zmd::transfer {

/// @brief Origin of a captured log line.
enum class StreamSource : std::uint8_t {
    Send,
    Receive,
    Transfer
};

[[nodiscard]] auto stream_source_to_string(StreamSource source) noexcept -> std::string_view;

/// @brief How one side of the pipeline ended.
struct ProcessStatus {
    bool launched{false};
    /// Exit status, -1 unless the process exited on its own.
    std::int32_t exit_code{-1};
    /// Terminating signal, 0 unless the process was killed.
    std::int32_t term_signal{0};

    [[nodiscard]] auto success() const noexcept -> bool { return launched && term_signal == 0 && exit_code == 0; }
    /// @brief "exit status N", "killed by signal N" or "not launched".
    [[nodiscard]] auto describe() const noexcept -> std::string;
};

struct PipelineCommands {
    std::vector<std::string> send;
    std::vector<std::string> receive;
};

struct PipelineResult {
    ProcessStatus send{};
    ProcessStatus receive{};
    /// Set when a pipe, fork or exec failed and the pipeline never ran.
    std::optional<std::string> launch_error{};
    /// Strongest intent the process group was signaled for.
    CancelIntent signaled_intent{CancelIntent::None};
    /// Whether the grace period expired and SIGKILL was sent.
    bool killed{false};
    /// Last lines printed by each side.
    std::vector<std::string> send_tail{};
    std::vector<std::string> receive_tail{};

    [[nodiscard]] auto success() const noexcept -> bool { return !launch_error && send.success() && receive.success(); }
};

/// @brief Runs `send | receive` as one process group and supervises it.
///
/// Both children are always reaped before run() returns, whatever the outcome.
class PipelineRunner final {
 public:
    using LineCallback    = std::function<void(StreamSource, std::string_view)>;
    using IntentCallback  = std::function<CancelIntent()>;
    using StartedCallback = std::function<void(pid_t send_pid, pid_t receive_pid)>;

    struct Config {
        /// Time between the interrupt signal and SIGKILL.
        std::chrono::milliseconds grace_period{5000};
        /// Interval of cancel intent checks while the pipeline runs.
        std::chrono::milliseconds poll_interval{50};
        std::size_t tail_lines{20};
    };

    explicit PipelineRunner(Config config) noexcept;

    /// @brief Launch the pipeline and block until both processes are reaped.
    /// @param commands Full argv of each side.
    /// @param on_line Receives every complete output line.
    /// @param poll_intent Polled for caller interruption: PauseRequested sends
    /// SIGINT, StopRequested SIGTERM to the process group.
    /// @param on_started Called once both processes exist.
    auto run(const PipelineCommands& commands, const LineCallback& on_line,
        const IntentCallback& poll_intent = {}, const StartedCallback& on_started = {}) const noexcept -> PipelineResult;

 private:
    Config m_config;
};

}  // namespace zmd::transfer

#endif  // PIPELINE_HPP
