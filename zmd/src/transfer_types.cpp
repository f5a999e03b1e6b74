#include "zmd/transfer_types.hpp"

#include <utility>  // for move

using namespace std::string_view_literals;

namespace zmd::transfer {

auto make_error(ErrorCode code, std::string message) noexcept -> TransferError {
    return TransferError{.code = code, .message = std::move(message)};
}

auto transfer_state_to_string(TransferState state) noexcept -> std::string_view {
    switch (state) {
    case TransferState::Pending:
        return "pending"sv;
    case TransferState::Running:
        return "running"sv;
    case TransferState::Paused:
        return "paused"sv;
    case TransferState::Completed:
        return "completed"sv;
    case TransferState::Failed:
        return "failed"sv;
    case TransferState::Stopped:
        return "stopped"sv;
    }
    return "unknown"sv;
}

auto transfer_state_from_string(std::string_view state_str) noexcept -> std::optional<TransferState> {
    if (state_str == "pending"sv) {
        return TransferState::Pending;
    }
    if (state_str == "running"sv) {
        return TransferState::Running;
    }
    if (state_str == "paused"sv) {
        return TransferState::Paused;
    }
    if (state_str == "completed"sv) {
        return TransferState::Completed;
    }
    if (state_str == "failed"sv) {
        return TransferState::Failed;
    }
    if (state_str == "stopped"sv) {
        return TransferState::Stopped;
    }
    return std::nullopt;
}

auto transfer_kind_to_string(TransferKind kind) noexcept -> std::string_view {
    switch (kind) {
    case TransferKind::All:
        return "all"sv;
    case TransferKind::Active:
        return "active"sv;
    case TransferKind::Completed:
        return "completed"sv;
    case TransferKind::Failed:
        return "failed"sv;
    }
    return "unknown"sv;
}

auto transfer_kind_from_string(std::string_view kind_str) noexcept -> std::optional<TransferKind> {
    if (kind_str == "all"sv) {
        return TransferKind::All;
    }
    if (kind_str == "active"sv) {
        return TransferKind::Active;
    }
    if (kind_str == "completed"sv) {
        return TransferKind::Completed;
    }
    if (kind_str == "failed"sv) {
        return TransferKind::Failed;
    }
    return std::nullopt;
}

auto error_code_to_string(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
    case ErrorCode::ValidationError:
        return "validation_error"sv;
    case ErrorCode::ProcessLaunchError:
        return "process_launch_error"sv;
    case ErrorCode::StreamError:
        return "stream_error"sv;
    case ErrorCode::RemoteRejected:
        return "remote_rejected"sv;
    case ErrorCode::ResumeUnavailable:
        return "resume_unavailable"sv;
    case ErrorCode::NotFound:
        return "not_found"sv;
    case ErrorCode::InvalidStateTransition:
        return "invalid_state_transition"sv;
    case ErrorCode::PersistenceError:
        return "persistence_error"sv;
    }
    return "unknown"sv;
}

auto error_code_from_string(std::string_view code_str) noexcept -> std::optional<ErrorCode> {
    constexpr ErrorCode all_codes[] = {
        ErrorCode::ValidationError,
        ErrorCode::ProcessLaunchError,
        ErrorCode::StreamError,
        ErrorCode::RemoteRejected,
        ErrorCode::ResumeUnavailable,
        ErrorCode::NotFound,
        ErrorCode::InvalidStateTransition,
        ErrorCode::PersistenceError,
    };
    for (const auto code : all_codes) {
        if (error_code_to_string(code) == code_str) {
            return code;
        }
    }
    return std::nullopt;
}

auto cancel_intent_to_string(CancelIntent intent) noexcept -> std::string_view {
    switch (intent) {
    case CancelIntent::None:
        return "none"sv;
    case CancelIntent::PauseRequested:
        return "pause"sv;
    case CancelIntent::StopRequested:
        return "stop"sv;
    }
    return "unknown"sv;
}

auto is_terminal(TransferState state) noexcept -> bool {
    return transfer_kind_of(state) != TransferKind::Active;
}

auto transfer_kind_of(TransferState state) noexcept -> TransferKind {
    switch (state) {
    case TransferState::Pending:
    case TransferState::Running:
    case TransferState::Paused:
        return TransferKind::Active;
    case TransferState::Completed:
        return TransferKind::Completed;
    case TransferState::Failed:
    case TransferState::Stopped:
        return TransferKind::Failed;
    }
    return TransferKind::Failed;
}

auto kind_contains(TransferKind kind, TransferState state) noexcept -> bool {
    return kind == TransferKind::All || transfer_kind_of(state) == kind;
}

auto can_transition(TransferState from, TransferState to) noexcept -> bool {
    switch (from) {
    case TransferState::Pending:
        // a stop can land before the worker got to run
        return to == TransferState::Running || to == TransferState::Stopped || to == TransferState::Failed;
    case TransferState::Running:
        return to == TransferState::Completed || to == TransferState::Paused
            || to == TransferState::Failed || to == TransferState::Stopped;
    case TransferState::Paused:
        return to == TransferState::Running || to == TransferState::Stopped;
    case TransferState::Completed:
    case TransferState::Failed:
    case TransferState::Stopped:
        return false;
    }
    return false;
}

auto to_unix_ms(TimePoint time_point) noexcept -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

auto from_unix_ms(std::int64_t unix_ms) noexcept -> TimePoint {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{unix_ms})};
}

}  // namespace zmd::transfer
