#ifndef TRANSFER_MANAGER_HPP
#define TRANSFER_MANAGER_HPP

#include "zmd/pipeline.hpp"
#include "zmd/resume_token.hpp"
#include "zmd/transfer_id.hpp"
#include "zmd/transfer_job.hpp"
#include "zmd/transfer_store.hpp"
#include "zmd/transfer_types.hpp"
#include "zmd/zfs.hpp"

#include <atomic>       // for atomic_bool
#include <chrono>       // for milliseconds
#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <functional>   // for less
#include <map>          // for map
#include <memory>       // for shared_ptr
#include <optional>     // for optional
#include <shared_mutex> // for shared_mutex
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace zmd::transfer {

/// @brief Registry of all transfer jobs and the only way to mutate them.
///
/// Each job runs its pipeline on its own worker thread. Callers only ever get
/// copies of job records.
class TransferManager final {
 public:
    struct Config {
        /// Where records and logs are kept, empty disables persistence.
        std::string state_dir{};
        /// Log bounds of jobs started without their own.
        LogConfig log_config{};
        std::chrono::milliseconds grace_period{5000};
        std::int32_t resume_token_retries{3};
        std::chrono::milliseconds resume_token_retry_delay{2000};
    };

    /// @brief Restores the jobs found in Config::state_dir.
    TransferManager(std::shared_ptr<zfs::DatasetManager> datasets, Config config) noexcept;
    ~TransferManager();

    TransferManager(const TransferManager&)     = delete;
    auto operator=(const TransferManager&) = delete;

    /// @brief Validate the request, register a Pending job and dispatch its worker.
    /// @return The new job's id, never one handed out before.
    auto start_transfer(TransferRequest request) noexcept -> std::expected<std::string, TransferError>;

    [[nodiscard]] auto get_transfer(std::string_view id) const noexcept -> std::expected<TransferInfo, TransferError>;

    /// @brief Jobs of the given bucket, oldest first.
    [[nodiscard]] auto list_transfers(TransferKind kind) const noexcept -> std::vector<TransferInfo>;

    /// @brief Interrupt a Running job, keeping the destination resumable.
    ///
    /// Blocks until the worker settled the job. Fails with ResumeUnavailable if
    /// the job ended Failed because no token was left, InvalidStateTransition if
    /// the job finished or got stopped first.
    auto pause_transfer(std::string_view id) noexcept -> std::expected<void, TransferError>;

    /// @brief Continue a Paused job from its resume token.
    auto resume_transfer(std::string_view id) noexcept -> std::expected<void, TransferError>;

    /// @brief End a non-terminal job as Stopped and abort any partial receive.
    auto stop_transfer(std::string_view id) noexcept -> std::expected<void, TransferError>;

    /// @brief Forget a terminal job together with its log and files.
    auto delete_transfer(std::string_view id) noexcept -> std::expected<void, TransferError>;

    [[nodiscard]] auto get_transfer_log(std::string_view id) const noexcept -> std::expected<std::string, TransferError>;
    [[nodiscard]] auto get_transfer_log_gist(std::string_view id) const noexcept -> std::expected<std::string, TransferError>;

    /// @brief Pause running resumable jobs, stop the others, join every worker.
    void shutdown() noexcept;

 private:
    using JobPtr = std::shared_ptr<TransferJob>;

    [[nodiscard]] auto find_job(std::string_view id) const noexcept -> std::expected<JobPtr, TransferError>;

    /// @brief Body of a job's worker thread, up to the job's next settled state.
    void run_worker(const JobPtr& job, std::optional<std::string> resume_token) noexcept;
    /// @brief Full send of the incremental base when the destination lacks it.
    auto prepare_initial_send(const JobPtr& job, const zfs::SendSpec& send, const zfs::ReceiveSpec& receive) noexcept -> std::optional<zfs::SendSpec>;
    /// @brief One pipeline run, unless the job was interrupted before launch.
    auto run_stage(const JobPtr& job, const zfs::SendSpec& send, const zfs::ReceiveSpec& receive,
        std::optional<std::string_view> resume_token) noexcept -> PipelineResult;
    void dispatch(const JobPtr& job, std::optional<std::string> resume_token) noexcept;

    /// @brief Write the job's record and log to the state directory.
    void persist(const JobPtr& job) noexcept;

    void restore() noexcept;
    void restore_interrupted(TransferJob& job) noexcept;

    std::shared_ptr<zfs::DatasetManager> m_datasets;
    Config m_config;
    ResumeTokenBridge m_bridge;
    PipelineRunner m_runner;
    TransferStore m_store;
    TransferIdGenerator m_ids;

    mutable std::shared_mutex m_registry_mutex;
    std::map<std::string, JobPtr, std::less<>> m_jobs;
    std::atomic_bool m_shut_down{false};
};

}  // namespace zmd::transfer

#endif  // TRANSFER_MANAGER_HPP
