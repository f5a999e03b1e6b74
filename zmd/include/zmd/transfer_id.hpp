#ifndef TRANSFER_ID_HPP
#define TRANSFER_ID_HPP

#include <cstdint>      // for uint16_t, uint64_t
#include <functional>   // for less
#include <mutex>        // for mutex
#include <random>       // for mt19937_64
#include <set>          // for set
#include <string>       // for string
#include <string_view>  // for string_view

namespace zmd::transfer {

/// @brief Issues time-ordered UUIDv7 ids which are never handed out twice.
///
/// Ids created later always compare greater, ordering by id equals ordering
/// by creation time.
class TransferIdGenerator final {
 public:
    TransferIdGenerator() noexcept;

    [[nodiscard]] auto next() noexcept -> std::string;

    /// @brief Mark an id as taken, e.g. one restored from disk.
    void reserve(std::string_view id) noexcept;

    [[nodiscard]] auto is_reserved(std::string_view id) const noexcept -> bool;

 private:
    mutable std::mutex m_mutex;
    std::mt19937_64 m_rng;
    std::uint64_t m_last_ms{};
    std::uint16_t m_counter{};
    std::set<std::string, std::less<>> m_taken{};
};

/// @brief Whether str has the 8-4-4-4-12 lowercase hex layout of an id.
auto is_valid_transfer_id(std::string_view str) noexcept -> bool;

}  // namespace zmd::transfer

#endif  // TRANSFER_ID_HPP
