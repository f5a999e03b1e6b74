#ifndef RESUME_TOKEN_HPP
#define RESUME_TOKEN_HPP

#include "zmd/pipeline.hpp"
#include "zmd/transfer_types.hpp"
#include "zmd/zfs.hpp"

#include <chrono>       // for milliseconds
#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace zmd::transfer {

/// @brief Connects interrupted receives with the send that continues them.
///
/// This is the only place where incremental-range arguments and resume-token
/// arguments are chosen between.
class ResumeTokenBridge final {
 public:
    struct Config {
        /// Extra attempts while the dataset reports being busy.
        std::int32_t retries{3};
        std::chrono::milliseconds retry_delay{2000};
    };

    ResumeTokenBridge(zfs::DatasetManager& datasets, Config config) noexcept;

    /// @brief Query the token an interrupted receive left on the dataset.
    /// @return The token, std::nullopt if there is none.
    [[nodiscard]] auto fetch_token(std::string_view dataset) const noexcept -> std::expected<std::optional<std::string>, TransferError>;

    /// @brief Both argvs of a run, continuing from token when one is given.
    [[nodiscard]] auto build_commands(const zfs::SendSpec& send, const zfs::ReceiveSpec& receive,
        std::optional<std::string_view> token) const noexcept -> std::expected<PipelineCommands, TransferError>;

    /// @brief Throw away the partially received state (`zfs receive -A`).
    /// @return True if no partial state remains.
    auto discard_partial_state(std::string_view dataset) const noexcept -> bool;

 private:
    zfs::DatasetManager& m_datasets;
    Config m_config;
};

}  // namespace zmd::transfer

#endif  // RESUME_TOKEN_HPP
