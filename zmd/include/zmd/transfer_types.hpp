#ifndef TRANSFER_TYPES_HPP
#define TRANSFER_TYPES_HPP

#include "zmd/zfs_types.hpp"

#include <chrono>       // for system_clock
#include <cstddef>      // for size_t
#include <cstdint>      // for int32_t, uint8_t, uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

#include <fmt/format.h>

namespace zmd::transfer {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Lifecycle of a transfer job.
enum class TransferState : std::uint8_t {
    Pending,
    Running,
    Paused,
    Completed,
    Failed,
    Stopped
};

/// Listing buckets. Every state belongs to exactly one of Active, Completed, Failed.
enum class TransferKind : std::uint8_t {
    All,
    Active,
    Completed,
    Failed
};

/// Pending caller interruption of a running pipeline.
enum class CancelIntent : std::uint8_t {
    None,
    PauseRequested,
    StopRequested
};

enum class ErrorCode : std::uint8_t {
    ValidationError,
    ProcessLaunchError,
    StreamError,
    RemoteRejected,
    ResumeUnavailable,
    NotFound,
    InvalidStateTransition,
    PersistenceError
};

/// @brief Classified failure, returned by manager calls and recorded on failed jobs.
struct TransferError {
    ErrorCode code{ErrorCode::StreamError};
    std::string message;
    /// Exit status of the failing process, when one exited.
    std::optional<std::int32_t> exit_code{};
    /// Tail of the captured process output.
    std::string output{};
    /// Token left behind by a resumable receive that failed on its own.
    std::optional<std::string> resume_token{};
};

[[nodiscard]] auto make_error(ErrorCode code, std::string message) noexcept -> TransferError;

/// @brief Bounds of a job's captured log.
struct LogConfig {
    /// Cap of the whole retained log in bytes.
    std::size_t max_bytes{1024 * 1024};
    /// Longer lines are cut to this size.
    std::size_t max_line_bytes{4096};
    /// Number of leading lines never evicted.
    std::size_t head_lines{20};
    std::size_t gist_head_lines{20};
    std::size_t gist_tail_lines{20};
    std::size_t gist_max_bytes{16 * 1024};
};

struct TransferProgress {
    std::uint64_t bytes_transferred{};
    std::uint64_t total_bytes{};
    /// "full_send", "incremental_send" or "resume".
    std::string phase{};
};

/// @brief Parameters of a new transfer.
struct TransferRequest {
    zfs::SendSpec send;
    zfs::ReceiveSpec receive;
    std::optional<LogConfig> log_config{};
};

/// @brief Point-in-time copy of a transfer job.
struct TransferInfo {
    std::string id;
    zfs::SendSpec send{};
    zfs::ReceiveSpec receive{};
    LogConfig log_config{};
    TransferState state{TransferState::Pending};
    std::optional<std::string> resume_token{};
    std::optional<TransferError> error{};
    TimePoint created_at{};
    std::optional<TimePoint> started_at{};
    std::optional<TimePoint> ended_at{};
    std::optional<TimePoint> last_paused_at{};
    TransferProgress progress{};
    std::optional<zfs::SendSizeEstimate> size_info{};
    std::int32_t send_pid{};
    std::int32_t receive_pid{};
    std::uint64_t revision{};
};

[[nodiscard]] auto transfer_state_to_string(TransferState state) noexcept -> std::string_view;
[[nodiscard]] auto transfer_state_from_string(std::string_view state_str) noexcept -> std::optional<TransferState>;

[[nodiscard]] auto transfer_kind_to_string(TransferKind kind) noexcept -> std::string_view;
/// @return The kind, or std::nullopt for unknown input.
[[nodiscard]] auto transfer_kind_from_string(std::string_view kind_str) noexcept -> std::optional<TransferKind>;

[[nodiscard]] auto error_code_to_string(ErrorCode code) noexcept -> std::string_view;
[[nodiscard]] auto error_code_from_string(std::string_view code_str) noexcept -> std::optional<ErrorCode>;

[[nodiscard]] auto cancel_intent_to_string(CancelIntent intent) noexcept -> std::string_view;

/// @brief Completed, Failed and Stopped are terminal.
[[nodiscard]] auto is_terminal(TransferState state) noexcept -> bool;

/// @brief The listing bucket a state belongs to; never TransferKind::All.
[[nodiscard]] auto transfer_kind_of(TransferState state) noexcept -> TransferKind;

/// @brief Whether a job in the given state is listed under kind.
[[nodiscard]] auto kind_contains(TransferKind kind, TransferState state) noexcept -> bool;

/// @brief The allowed edges of the job state machine.
[[nodiscard]] auto can_transition(TransferState from, TransferState to) noexcept -> bool;

/// @brief Milliseconds since the epoch.
[[nodiscard]] auto to_unix_ms(TimePoint time_point) noexcept -> std::int64_t;
[[nodiscard]] auto from_unix_ms(std::int64_t unix_ms) noexcept -> TimePoint;

}  // namespace zmd::transfer

template <>
struct fmt::formatter<zmd::transfer::TransferState> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(zmd::transfer::TransferState state, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(zmd::transfer::transfer_state_to_string(state), ctx);
    }
};

template <>
struct fmt::formatter<zmd::transfer::TransferError> : fmt::formatter<std::string> {
    // parse is inherited from fmt::formatter<std::string>.
    template <typename FormatContext>
    auto format(const zmd::transfer::TransferError& c, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}: {}", zmd::transfer::error_code_to_string(c.code), c.message);
    }
};

#endif  // TRANSFER_TYPES_HPP
