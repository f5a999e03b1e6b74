#include "zmd/transfer_id.hpp"

#include <array>   // for array
#include <chrono>  // for system_clock

#include <fmt/compile.h>
#include <fmt/format.h>

namespace {

constexpr std::uint16_t kMaxCounter = 0x0FFF;

auto now_ms() noexcept -> std::uint64_t {
    const auto& since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

}  // namespace

namespace zmd::transfer {

TransferIdGenerator::TransferIdGenerator() noexcept : m_rng(std::random_device{}()) { }

auto TransferIdGenerator::next() noexcept -> std::string {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (;;) {
        // 12-bit counter within one millisecond, borrowing the next one on overflow
        auto unix_ms = now_ms();
        if (unix_ms > m_last_ms) {
            m_last_ms = unix_ms;
            m_counter = 0;
        } else if (m_counter < kMaxCounter) {
            ++m_counter;
        } else {
            ++m_last_ms;
            m_counter = 0;
        }

        const auto random_bits = m_rng();
        const auto time_high   = static_cast<std::uint32_t>(m_last_ms >> 16U);
        const auto time_low    = static_cast<std::uint16_t>(m_last_ms & 0xFFFFU);
        const auto version     = static_cast<std::uint16_t>(0x7000U | m_counter);
        const auto variant     = static_cast<std::uint16_t>(0x8000U | ((random_bits >> 48U) & 0x3FFFU));
        const auto node        = random_bits & 0xFFFFFFFFFFFFULL;

        auto id = fmt::format(FMT_COMPILE("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}"), time_high, time_low, version, variant, node);
        if (m_taken.insert(id).second) {
            return id;
        }
    }
}

void TransferIdGenerator::reserve(std::string_view id) noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_taken.emplace(id);
}

auto TransferIdGenerator::is_reserved(std::string_view id) const noexcept -> bool {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_taken.find(id) != m_taken.end();
}

auto is_valid_transfer_id(std::string_view str) noexcept -> bool {
    constexpr std::array dash_positions{8UL, 13UL, 18UL, 23UL};
    if (str.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < str.size(); ++i) {
        const char c = str[i];
        if (i == dash_positions[0] || i == dash_positions[1] || i == dash_positions[2] || i == dash_positions[3]) {
            if (c != '-') {
                return false;
            }
            continue;
        }
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

}  // namespace zmd::transfer
