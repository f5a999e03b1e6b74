#include "zmd/resume_token.hpp"

#include <thread>   // for sleep_for
#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace zmd::transfer {

ResumeTokenBridge::ResumeTokenBridge(zfs::DatasetManager& datasets, Config config) noexcept
  : m_datasets(datasets), m_config(config) { }

auto ResumeTokenBridge::fetch_token(std::string_view dataset) const noexcept -> std::expected<std::optional<std::string>, TransferError> {
    for (std::int32_t attempt = 0;; ++attempt) {
        auto token = m_datasets.get_resume_token(dataset);
        if (token) {
            return std::move(*token);
        }

        const auto& error = token.error();
        const bool busy   = error.output.contains("busy"sv);
        if (!busy || attempt >= m_config.retries) {
            spdlog::error("Failed to query resume token of {}: {} {}", dataset, error.message, error.output);
            auto result   = make_error(ErrorCode::ResumeUnavailable, fmt::format(FMT_COMPILE("failed to query resume token of '{}': {}"), dataset, error.message));
            result.output = error.output;
            return std::unexpected(std::move(result));
        }
        spdlog::debug("{} is busy, retrying resume token query in {}ms", dataset, m_config.retry_delay.count());
        std::this_thread::sleep_for(m_config.retry_delay);
    }
}

auto ResumeTokenBridge::build_commands(const zfs::SendSpec& send, const zfs::ReceiveSpec& receive,
    std::optional<std::string_view> token) const noexcept -> std::expected<PipelineCommands, TransferError> {
    auto send_argv = m_datasets.send_command(send, token);
    if (!send_argv) {
        return std::unexpected(make_error(ErrorCode::ValidationError, send_argv.error().message));
    }
    // a resumed stream is refused together with -F
    auto receive_argv = m_datasets.receive_command(receive, token.has_value());
    if (!receive_argv) {
        return std::unexpected(make_error(ErrorCode::ValidationError, receive_argv.error().message));
    }
    return PipelineCommands{.send = std::move(*send_argv), .receive = std::move(*receive_argv)};
}

auto ResumeTokenBridge::discard_partial_state(std::string_view dataset) const noexcept -> bool {
    auto aborted = m_datasets.abort_partial_receive(dataset);
    if (aborted) {
        spdlog::info("Discarded partial receive state of {}", dataset);
        return true;
    }
    const auto& output = aborted.error().output;
    if (output.contains("does not have any resumable receive state"sv) || output.contains("does not exist"sv)) {
        return true;
    }
    spdlog::error("Failed to discard partial receive state of {}: {}", dataset, output);
    return false;
}

}  // namespace zmd::transfer
