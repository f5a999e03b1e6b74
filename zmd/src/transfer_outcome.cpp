#include "zmd/transfer_outcome.hpp"
#include "zmd/string_utils.hpp"

#include <algorithm>  // for any_of
#include <array>      // for array
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

constexpr std::array kRejectionMessages{
    "exists"sv,
    "has been modified"sv,
    "must specify -F"sv,
    "destination already exists"sv,
};

constexpr std::array kPartialStateMessages{
    "zfs send -t"sv,
    "partially-complete state"sv,
    "receive_resume_token"sv,
};

auto any_line_mentions(const std::vector<std::string>& lines, const auto& needles) noexcept -> bool {
    return std::ranges::any_of(lines, [&needles](const std::string& line) {
        return std::ranges::any_of(needles, [&line](std::string_view needle) { return line.contains(needle); });
    });
}

auto failure_error(const zmd::transfer::PipelineResult& result) noexcept -> zmd::transfer::TransferError {
    using zmd::transfer::ErrorCode;

    const bool receive_failed = !result.receive.success();
    const auto& failed_side   = receive_failed ? result.receive : result.send;
    const auto code           = (receive_failed && zmd::transfer::reports_rejection(result.receive_tail))
                  ? ErrorCode::RemoteRejected
                  : ErrorCode::StreamError;

    auto error = zmd::transfer::make_error(code,
        fmt::format(FMT_COMPILE("zfs {} failed ({})"), receive_failed ? "receive"sv : "send"sv, failed_side.describe()));
    if (failed_side.term_signal == 0) {
        error.exit_code = failed_side.exit_code;
    }
    error.output = zmd::utils::join(receive_failed ? result.receive_tail : result.send_tail);
    return error;
}

}  // namespace

namespace zmd::transfer {

auto reports_rejection(const std::vector<std::string>& receive_output) noexcept -> bool {
    return any_line_mentions(receive_output, kRejectionMessages);
}

auto reports_partial_state(const std::vector<std::string>& receive_output) noexcept -> bool {
    return any_line_mentions(receive_output, kPartialStateMessages);
}

auto needs_resume_token(const PipelineResult& result, CancelIntent intent, bool resumable_receive) noexcept -> bool {
    if (!resumable_receive || result.launch_error || result.success()) {
        return false;
    }
    switch (intent) {
    case CancelIntent::StopRequested:
        return false;
    case CancelIntent::PauseRequested:
        return true;
    case CancelIntent::None:
        return reports_partial_state(result.receive_tail);
    }
    return false;
}

auto classify_outcome(const PipelineResult& result, CancelIntent intent, const std::optional<std::string>& token) noexcept -> TransferOutcome {
    if (intent == CancelIntent::StopRequested) {
        return TransferOutcome{.state = TransferState::Stopped};
    }
    if (result.launch_error) {
        return TransferOutcome{.error = make_error(ErrorCode::ProcessLaunchError, *result.launch_error)};
    }
    // the pipeline may finish on its own before a pause signal lands
    if (result.success()) {
        return TransferOutcome{.state = TransferState::Completed};
    }

    if (intent == CancelIntent::PauseRequested) {
        if (token && !token->empty()) {
            return TransferOutcome{.state = TransferState::Paused, .resume_token = *token};
        }
        auto error   = make_error(ErrorCode::ResumeUnavailable, "pause requested but the destination kept no resumable state");
        error.output = utils::join(result.receive_tail);
        return TransferOutcome{.error = std::move(error)};
    }

    auto error = failure_error(result);
    if (token && !token->empty()) {
        error.resume_token = *token;
    }
    return TransferOutcome{.error = std::move(error)};
}

}  // namespace zmd::transfer
