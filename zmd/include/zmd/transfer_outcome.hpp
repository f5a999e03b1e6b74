#ifndef TRANSFER_OUTCOME_HPP
#define TRANSFER_OUTCOME_HPP

#include "zmd/pipeline.hpp"
#include "zmd/transfer_types.hpp"

#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

namespace zmd::transfer {

/// @brief State a finished run moves its job into.
struct TransferOutcome {
    TransferState state{TransferState::Failed};
    std::optional<TransferError> error{};
    /// Only set together with TransferState::Paused.
    std::optional<std::string> resume_token{};
};

/// @brief Whether receive output reports a destination refusing the stream.
auto reports_rejection(const std::vector<std::string>& receive_output) noexcept -> bool;

/// @brief Whether receive output reports a resumable partially received state.
auto reports_partial_state(const std::vector<std::string>& receive_output) noexcept -> bool;

/// @brief Whether classify_outcome() needs the destination's resume token.
auto needs_resume_token(const PipelineResult& result, CancelIntent intent, bool resumable_receive) noexcept -> bool;

/// @brief Map a finished run and the consumed cancel intent to the next state.
/// @param token Token of the destination, if one was queried and present.
///
/// StopRequested always yields Stopped. PauseRequested yields Paused when a token
/// exists, otherwise Failed with ResumeUnavailable. Without an intent any failure
/// yields Failed, keeping a token for information only.
auto classify_outcome(const PipelineResult& result, CancelIntent intent, const std::optional<std::string>& token) noexcept -> TransferOutcome;

}  // namespace zmd::transfer

#endif  // TRANSFER_OUTCOME_HPP
