#ifndef ZFS_TYPES_HPP
#define ZFS_TYPES_HPP

#include <cstdint>  // for uint64_t
#include <map>      // for map
#include <string>   // for string
#include <vector>   // for vector

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace zmd::zfs {

/// @brief Source side of a replication stream (`zfs send`).
struct SendSpec {
    /// @brief The snapshot (or filesystem/volume) to send, e.g. "pool/data@snap2".
    std::string snapshot;

    /// @brief Optional incremental base, e.g. "pool/data@snap1" or "#bookmark".
    ///
    /// @note Empty means a full stream.
    std::string from_snapshot;

    /// @brief Use `-I` (all intermediary snapshots) instead of `-i`.
    bool intermediary{false};

    bool raw{false};            // -w
    bool compressed{false};     // -c
    bool properties{false};     // -p
    bool replicate{false};      // -R
    bool skip_missing{false};   // -s, only valid with -R
    bool large_blocks{false};   // -L
    bool embed_data{false};     // -e
    bool holds{false};          // -h
    bool backup_stream{false};  // -b
    bool verbose{true};         // -v
    bool parsable{true};        // -P
};

/// @brief Destination side of a replication stream (`zfs receive`).
struct ReceiveSpec {
    /// @brief The dataset to materialize, e.g. "backup/data".
    std::string target;

    bool force{false};       // -F
    bool resumable{true};    // -s
    bool unmounted{false};   // -u
    bool use_parent{false};  // -d
    bool verbose{false};     // -v

    /// @brief Optional clone origin (-o origin=...).
    std::string origin;

    /// @brief Properties to set on the received dataset (-o name=value).
    std::map<std::string, std::string> properties;

    /// @brief Properties to exclude from the stream (-x name).
    std::vector<std::string> exclude_properties;
};

/// @brief Stream size reported by a dry-run send.
struct SendSizeEstimate {
    std::uint64_t bytes{};
    /// "full", "incremental" or "intermediary".
    std::string transfer_type;
};

}  // namespace zmd::zfs

template <>
struct fmt::formatter<zmd::zfs::SendSpec> : fmt::formatter<std::string> {
    // parse is inherited from fmt::formatter<std::string>.
    template <typename FormatContext>
    auto format(const zmd::zfs::SendSpec& c, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "(snapshot:'{}', from_snapshot:'{}', intermediary:{}, raw:{}, compressed:{}, replicate:{})",
            c.snapshot, c.from_snapshot, c.intermediary, c.raw, c.compressed, c.replicate);
    }
};

template <>
struct fmt::formatter<zmd::zfs::ReceiveSpec> : fmt::formatter<std::string> {
    // parse is inherited from fmt::formatter<std::string>.
    template <typename FormatContext>
    auto format(const zmd::zfs::ReceiveSpec& c, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "(target:'{}', force:{}, resumable:{}, properties:{})",
            c.target, c.force, c.resumable, c.properties);
    }
};

#endif  // ZFS_TYPES_HPP
