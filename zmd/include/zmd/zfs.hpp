#ifndef ZFS_HPP
#define ZFS_HPP

#include "zmd/command_executor.hpp"
#include "zmd/zfs_types.hpp"

#include <cstdint>      // for uint64_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace zmd::zfs {

/// @brief Progress reported by a single `zfs send -P -v` line.
struct SendProgressLine {
    std::optional<std::uint64_t> total_bytes{};
    std::optional<std::uint64_t> bytes_transferred{};
};

/// @brief Checks the flag combinations `zfs send` rejects.
/// @return An explanation of the first problem found, std::nullopt if valid.
auto validate_send_spec(const SendSpec& spec) noexcept -> std::optional<std::string>;

/// @brief "full", "incremental" or "intermediary".
auto send_transfer_type(const SendSpec& spec) noexcept -> std::string_view;

/// @brief Arguments following `zfs send` for a full or incremental stream.
auto build_send_args(const SendSpec& spec) noexcept -> std::vector<std::string>;

/// @brief Arguments following `zfs send` when continuing from a resume token.
///
/// @note The token already encodes the snapshot range and most stream flags,
/// only -P, -v and -e are carried over from the SendSpec.
auto build_resume_send_args(const SendSpec& spec, std::string_view token) noexcept -> std::vector<std::string>;

/// @brief Arguments following `zfs receive`.
/// @param resume_mode Drops -F, which `zfs receive` refuses on a resumed stream.
auto build_receive_args(const ReceiveSpec& spec, bool resume_mode = false) noexcept -> std::vector<std::string>;

/// @brief Full stream of the incremental base, for a destination that lacks it.
/// @return std::nullopt for full streams and bookmark bases, which cannot be sent on their own.
auto initial_send_spec(const SendSpec& spec) noexcept -> std::optional<SendSpec>;

/// @brief Name the incremental base carries on the destination, "<target>@<snap>".
auto target_base_snapshot(const SendSpec& spec, std::string_view target) noexcept -> std::optional<std::string>;

/// @brief Arguments following `zfs send` for a dry run printing the stream size.
auto build_dry_run_args(const SendSpec& spec) noexcept -> std::vector<std::string>;

/// @brief Extract the total from the "size\t<bytes>" line of a dry run.
auto parse_send_size(std::string_view output) noexcept -> std::optional<std::uint64_t>;

/// @brief Parse one line of `zfs send -P -v` progress output.
auto parse_send_progress(std::string_view line) noexcept -> std::optional<SendProgressLine>;

/// @brief Dataset operations the transfer engine depends on.
class DatasetManager {
 public:
    virtual ~DatasetManager() = default;

    /// @brief Query `receive_resume_token` of a dataset.
    /// @return The token, std::nullopt when the dataset holds no partial state.
    virtual auto get_resume_token(std::string_view dataset) noexcept -> std::expected<std::optional<std::string>, utils::CommandError> = 0;

    /// @brief Discard the partially received state of a dataset (`zfs receive -A`).
    virtual auto abort_partial_receive(std::string_view dataset) noexcept -> std::expected<void, utils::CommandError> = 0;

    /// @brief Whether a snapshot exists, an error if the lookup itself failed.
    virtual auto snapshot_exists(std::string_view snapshot) noexcept -> std::expected<bool, utils::CommandError> = 0;

    virtual auto estimate_send_size(const SendSpec& spec) noexcept -> std::expected<SendSizeEstimate, utils::CommandError> = 0;

    /// @brief Run a send/receive pipeline to completion, blocking the caller.
    virtual auto send_receive(const SendSpec& send, const ReceiveSpec& receive) noexcept -> std::expected<void, utils::CommandError> = 0;

    /// @brief Full argv of the send side.
    [[nodiscard]] virtual auto send_command(const SendSpec& spec, std::optional<std::string_view> resume_token) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> = 0;

    /// @brief Full argv of the receive side.
    [[nodiscard]] virtual auto receive_command(const ReceiveSpec& spec, bool resume_mode) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> = 0;
};

/// @brief DatasetManager backed by the zfs command line tools.
class ZfsDatasetManager final : public DatasetManager {
 public:
    explicit ZfsDatasetManager(utils::CommandExecutor executor) noexcept;

    auto get_resume_token(std::string_view dataset) noexcept -> std::expected<std::optional<std::string>, utils::CommandError> override;
    auto abort_partial_receive(std::string_view dataset) noexcept -> std::expected<void, utils::CommandError> override;
    auto snapshot_exists(std::string_view snapshot) noexcept -> std::expected<bool, utils::CommandError> override;
    auto estimate_send_size(const SendSpec& spec) noexcept -> std::expected<SendSizeEstimate, utils::CommandError> override;
    auto send_receive(const SendSpec& send, const ReceiveSpec& receive) noexcept -> std::expected<void, utils::CommandError> override;

    [[nodiscard]] auto send_command(const SendSpec& spec, std::optional<std::string_view> resume_token) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> override;
    [[nodiscard]] auto receive_command(const ReceiveSpec& spec, bool resume_mode) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> override;

 private:
    utils::CommandExecutor m_executor;
};

}  // namespace zmd::zfs

#endif  // ZFS_HPP
