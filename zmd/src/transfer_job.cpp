#include "zmd/transfer_job.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

namespace zmd::transfer {

TransferJob::TransferJob(TransferInfo info_) noexcept
  : info(std::move(info_)), log(info.log_config), m_id(info.id) { }

auto TransferJob::snapshot() const noexcept -> TransferInfo {
    std::lock_guard<std::mutex> lock(mutex);
    return info;
}

auto TransferJob::transition(TransferState to) noexcept -> bool {
    const auto from = info.state;
    if (!can_transition(from, to)) {
        spdlog::warn("Transfer {}: rejected transition {} -> {}", m_id, from, to);
        return false;
    }

    const auto now = Clock::now();
    switch (to) {
    case TransferState::Running:
        if (!info.started_at) {
            info.started_at = now;
        }
        info.error.reset();
        break;
    case TransferState::Paused:
        info.last_paused_at = now;
        break;
    case TransferState::Completed:
    case TransferState::Failed:
    case TransferState::Stopped:
        info.ended_at = now;
        break;
    case TransferState::Pending:
        break;
    }
    if (to != TransferState::Paused) {
        info.resume_token.reset();
    }
    info.send_pid    = 0;
    info.receive_pid = 0;
    info.state       = to;
    ++info.revision;

    spdlog::info("Transfer {}: {} -> {}", m_id, from, to);
    return true;
}

}  // namespace zmd::transfer
