#ifndef TRANSFER_JOB_HPP
#define TRANSFER_JOB_HPP

#include "zmd/log_store.hpp"
#include "zmd/transfer_types.hpp"

#include <condition_variable>  // for condition_variable
#include <mutex>               // for mutex
#include <string>              // for string
#include <thread>              // for thread

namespace zmd::transfer {

/// @brief One replication job: its record, its log and the worker driving it.
///
/// Everything except the log is guarded by mutex. Waiters on state_changed are
/// woken whenever the worker settles the job.
class TransferJob final {
 public:
    explicit TransferJob(TransferInfo info) noexcept;

    TransferJob(const TransferJob&)     = delete;
    auto operator=(const TransferJob&) = delete;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return m_id; }

    /// @brief Copy of the record, taken under the lock.
    [[nodiscard]] auto snapshot() const noexcept -> TransferInfo;

    /// @brief The single place a job changes state. Caller holds mutex.
    ///
    /// Stamps timestamps, clears the resume token outside Paused and bumps the
    /// revision.
    /// @return False, leaving the record untouched, if the edge is not allowed.
    auto transition(TransferState to) noexcept -> bool;

    /// @brief Bump the revision after changing the record in place. Caller holds mutex.
    void touch() noexcept { ++info.revision; }

    mutable std::mutex mutex;
    std::condition_variable state_changed;

    TransferInfo info;
    CancelIntent intent{CancelIntent::None};
    /// Worker of the current run; replaced on resume.
    std::thread worker;

    LogStore log;

 private:
    const std::string m_id;
};

}  // namespace zmd::transfer

#endif  // TRANSFER_JOB_HPP
