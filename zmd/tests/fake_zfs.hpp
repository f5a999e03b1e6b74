#ifndef FAKE_ZFS_HPP
#define FAKE_ZFS_HPP

#include "zmd/command_executor.hpp"
#include "zmd/zfs.hpp"

#include <stdlib.h>  // for mkdtemp

#include <chrono>        // for milliseconds
#include <cstdint>       // for int32_t
#include <expected>      // for expected
#include <filesystem>    // for temp_directory_path, remove_all, permissions
#include <fstream>       // for ofstream
#include <functional>    // for function
#include <mutex>         // for mutex, lock_guard
#include <optional>      // for optional
#include <string>        // for string
#include <string_view>   // for string_view
#include <system_error>  // for error_code
#include <thread>        // for sleep_for
#include <utility>       // for move
#include <vector>        // for vector

namespace zmd::test {

/// Directory removed with everything in it on destruction.
class TempDir final {
 public:
    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "zmd-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) != nullptr) {
            m_path = std::move(pattern);
        }
    }
    ~TempDir() {
        std::error_code err{};
        std::filesystem::remove_all(m_path, err);
    }

    TempDir(const TempDir&)         = delete;
    auto operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::string& { return m_path; }
    [[nodiscard]] auto file(std::string_view name) const -> std::string { return m_path + "/" + std::string{name}; }

 private:
    std::string m_path{};
};

/// Write an executable /bin/sh script.
inline void write_script(const std::string& path, std::string_view body) {
    {
        std::ofstream script{path, std::ios::trunc};
        script << "#!/bin/sh\n"
               << body << '\n';
    }
    namespace fs = std::filesystem;
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec
            | fs::perms::others_read | fs::perms::others_exec);
}

/// Poll cond every 20ms until it holds or timeout passed.
inline auto wait_until(const std::function<bool()>& cond, std::chrono::milliseconds timeout = std::chrono::seconds(15)) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return cond();
}

/// DatasetManager running shell snippets in place of zfs send/receive.
///
/// Resume tokens are whatever the test put on the destination.
class FakeDatasetManager final : public zfs::DatasetManager {
 public:
    void set_send_script(std::string script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_send_script = std::move(script);
    }
    void set_resume_send_script(std::string script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_resume_send_script = std::move(script);
    }
    void set_receive_script(std::string script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_receive_script = std::move(script);
    }
    void set_token(std::optional<std::string> token) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_token = std::move(token);
    }
    void set_estimate(std::optional<std::uint64_t> bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_estimate = bytes;
    }
    /// Report the incremental base as missing on the destination.
    void set_base_missing(bool missing) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_base_missing = missing;
    }
    void set_snapshot_lookup_fails(bool fails) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lookup_fails = fails;
    }
    /// Report the destination as busy for the next count token queries.
    void set_busy_queries(std::int32_t count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy_queries = count;
    }

    [[nodiscard]] auto token() const -> std::optional<std::string> {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_token;
    }
    [[nodiscard]] auto abort_count() const -> std::int32_t {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_aborts;
    }
    [[nodiscard]] auto token_queries() const -> std::int32_t {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_token_queries;
    }
    /// Snapshots the fresh sends were built for, in order.
    [[nodiscard]] auto sent_snapshots() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sent_snapshots;
    }
    [[nodiscard]] auto looked_up_snapshots() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_looked_up;
    }
    /// Tokens the resumed sends were built with.
    [[nodiscard]] auto sent_tokens() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sent_tokens;
    }

    auto get_resume_token(std::string_view) noexcept -> std::expected<std::optional<std::string>, utils::CommandError> override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_token_queries;
        if (m_busy_queries > 0) {
            --m_busy_queries;
            return std::unexpected(utils::CommandError{.command = "zfs get", .exit_code = 1, .output = "cannot get property: dataset is busy", .message = "command exited with status 1"});
        }
        return m_token;
    }

    auto abort_partial_receive(std::string_view) noexcept -> std::expected<void, utils::CommandError> override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_aborts;
        if (!m_token) {
            return std::unexpected(utils::CommandError{.command = "zfs receive -A", .exit_code = 1, .output = "cannot resume: does not have any resumable receive state to abort", .message = "command exited with status 1"});
        }
        m_token.reset();
        return {};
    }

    auto snapshot_exists(std::string_view snapshot) noexcept -> std::expected<bool, utils::CommandError> override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_looked_up.emplace_back(snapshot);
        if (m_lookup_fails) {
            return std::unexpected(utils::CommandError{.command = "zfs list", .exit_code = 1, .output = "permission denied", .message = "command exited with status 1"});
        }
        return !m_base_missing;
    }

    auto estimate_send_size(const zfs::SendSpec& spec) noexcept -> std::expected<zfs::SendSizeEstimate, utils::CommandError> override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_estimate) {
            return std::unexpected(utils::CommandError{.command = "zfs send -n", .message = "no estimate"});
        }
        return zfs::SendSizeEstimate{.bytes = *m_estimate, .transfer_type = std::string{zfs::send_transfer_type(spec)}};
    }

    auto send_receive(const zfs::SendSpec&, const zfs::ReceiveSpec&) noexcept -> std::expected<void, utils::CommandError> override {
        return {};
    }

    [[nodiscard]] auto send_command(const zfs::SendSpec& spec, std::optional<std::string_view> resume_token) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (resume_token) {
            m_sent_tokens.emplace_back(*resume_token);
            return std::vector<std::string>{"/bin/sh", "-c", m_resume_send_script};
        }
        m_sent_snapshots.emplace_back(spec.snapshot);
        return std::vector<std::string>{"/bin/sh", "-c", m_send_script};
    }

    [[nodiscard]] auto receive_command(const zfs::ReceiveSpec&, bool) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::vector<std::string>{"/bin/sh", "-c", m_receive_script};
    }

 private:
    mutable std::mutex m_mutex;
    std::string m_send_script{"printf 'stream'"};
    std::string m_resume_send_script{"printf 'rest'"};
    std::string m_receive_script{"cat > /dev/null"};
    std::optional<std::string> m_token{};
    std::optional<std::uint64_t> m_estimate{};
    bool m_base_missing{false};
    bool m_lookup_fails{false};
    std::int32_t m_busy_queries{};
    std::int32_t m_aborts{};
    std::int32_t m_token_queries{};
    mutable std::vector<std::string> m_sent_tokens{};
    mutable std::vector<std::string> m_sent_snapshots{};
    std::vector<std::string> m_looked_up{};
};

}  // namespace zmd::test

#endif  // FAKE_ZFS_HPP
