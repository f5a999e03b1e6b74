#ifndef TRANSFER_STORE_HPP
#define TRANSFER_STORE_HPP

#include "zmd/transfer_types.hpp"

#include <cstdint>        // for uint64_t
#include <expected>       // for expected
#include <mutex>          // for mutex
#include <string>         // for string
#include <string_view>    // for string_view
#include <unordered_map>  // for unordered_map
#include <unordered_set>  // for unordered_set
#include <vector>         // for vector

namespace zmd::transfer {

/// @brief A job record and its log as found in the state directory.
struct StoredTransfer {
    TransferInfo info;
    std::string log;
};

/// @brief Keeps "<id>.json" and "<id>.log" per job in a state directory.
///
/// Saves are ordered by TransferInfo::revision: a save carrying a revision not
/// newer than the last one written for that id is skipped. Removed ids are
/// retired, later saves for them are skipped as well.
class TransferStore final {
 public:
    /// @param state_dir Directory of the files, empty disables persistence.
    explicit TransferStore(std::string state_dir) noexcept;

    [[nodiscard]] auto enabled() const noexcept -> bool { return !m_state_dir.empty(); }
    [[nodiscard]] auto state_dir() const noexcept -> const std::string& { return m_state_dir; }

    /// @brief Create the state directory if it is missing.
    auto prepare() noexcept -> bool;

    auto save(const TransferInfo& info, std::string_view log_content) noexcept -> std::expected<void, TransferError>;
    auto remove(std::string_view id) noexcept -> std::expected<void, TransferError>;

    /// @brief Read every record, skipping (and logging) unreadable ones.
    auto load_all() noexcept -> std::vector<StoredTransfer>;

 private:
    [[nodiscard]] auto record_path(std::string_view id) const noexcept -> std::string;
    [[nodiscard]] auto log_path(std::string_view id) const noexcept -> std::string;

    const std::string m_state_dir;
    std::mutex m_mutex;
    std::unordered_map<std::string, std::uint64_t> m_saved_revisions{};
    std::unordered_set<std::string> m_removed_ids{};
};

}  // namespace zmd::transfer

#endif  // TRANSFER_STORE_HPP
