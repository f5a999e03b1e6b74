#include "zmd/transfer_store.hpp"
#include "zmd/io_utils.hpp"
#include "zmd/transfer_id.hpp"
#include "zmd/transfer_json.hpp"

#include <algorithm>     // for sort
#include <filesystem>    // for directory_iterator, create_directories, remove
#include <system_error>  // for error_code
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace zmd::transfer {

TransferStore::TransferStore(std::string state_dir) noexcept : m_state_dir(std::move(state_dir)) { }

auto TransferStore::prepare() noexcept -> bool {
    if (!enabled()) {
        return true;
    }
    std::error_code err{};
    fs::create_directories(m_state_dir, err);
    if (err) {
        spdlog::error("Failed to create state directory {}: {}", m_state_dir, err.message());
        return false;
    }
    return true;
}

auto TransferStore::record_path(std::string_view id) const noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/{}.json"), m_state_dir, id);
}

auto TransferStore::log_path(std::string_view id) const noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/{}.log"), m_state_dir, id);
}

auto TransferStore::save(const TransferInfo& info, std::string_view log_content) noexcept -> std::expected<void, TransferError> {
    if (!enabled()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_removed_ids.contains(info.id)) {
        return {};
    }
    // a slower writer must not replace a newer state
    if (auto it = m_saved_revisions.find(info.id); it != m_saved_revisions.end() && it->second >= info.revision) {
        return {};
    }

    if (!utils::write_file_atomic(log_path(info.id), log_content)) {
        return std::unexpected(make_error(ErrorCode::PersistenceError, fmt::format(FMT_COMPILE("failed to write log of transfer {}"), info.id)));
    }
    if (!utils::write_file_atomic(record_path(info.id), json::record_to_json(info))) {
        return std::unexpected(make_error(ErrorCode::PersistenceError, fmt::format(FMT_COMPILE("failed to write record of transfer {}"), info.id)));
    }
    m_saved_revisions.insert_or_assign(info.id, info.revision);
    return {};
}

auto TransferStore::remove(std::string_view id) noexcept -> std::expected<void, TransferError> {
    if (!enabled()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_saved_revisions.erase(std::string{id});
    m_removed_ids.emplace(id);

    bool removed_all{true};
    for (const auto& path : {record_path(id), log_path(id)}) {
        std::error_code err{};
        fs::remove(path, err);
        if (err) {
            spdlog::error("Failed to remove {}: {}", path, err.message());
            removed_all = false;
        }
    }
    if (!removed_all) {
        return std::unexpected(make_error(ErrorCode::PersistenceError, fmt::format(FMT_COMPILE("failed to remove files of transfer {}"), id)));
    }
    return {};
}

auto TransferStore::load_all() noexcept -> std::vector<StoredTransfer> {
    std::vector<StoredTransfer> result{};
    if (!enabled()) {
        return result;
    }

    std::error_code err{};
    fs::directory_iterator dir_it{m_state_dir, err};
    if (err) {
        spdlog::error("Failed to open state directory {}: {}", m_state_dir, err.message());
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (; dir_it != fs::directory_iterator{}; dir_it.increment(err)) {
        if (err) {
            spdlog::error("Failed to list state directory {}: {}", m_state_dir, err.message());
            break;
        }
        const auto& path = dir_it->path();
        if (path.extension() != ".json" || !is_valid_transfer_id(path.stem().string())) {
            continue;
        }

        std::string content{};
        if (!utils::read_whole_file(path.string(), content)) {
            spdlog::error("Failed to read transfer record {}", path.string());
            continue;
        }
        auto info = json::record_from_json(content);
        if (!info) {
            spdlog::error("Skipping invalid transfer record {}: {}", path.string(), info.error());
            continue;
        }
        if (info->id != path.stem().string()) {
            spdlog::error("Skipping transfer record {}: id mismatch '{}'", path.string(), info->id);
            continue;
        }

        // a missing log only loses output, the record stays usable
        std::string log{};
        if (!utils::read_whole_file(log_path(info->id), log)) {
            spdlog::warn("No log found for transfer {}", info->id);
        }

        m_saved_revisions.insert_or_assign(info->id, info->revision);
        result.emplace_back(StoredTransfer{.info = std::move(*info), .log = std::move(log)});
    }

    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) { return lhs.info.id < rhs.info.id; });
    return result;
}

}  // namespace zmd::transfer
