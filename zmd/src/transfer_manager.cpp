#include "zmd/transfer_manager.hpp"
#include "zmd/io_utils.hpp"
#include "zmd/transfer_outcome.hpp"

#include <mutex>         // for lock_guard, unique_lock
#include <system_error>  // for system_error
#include <thread>        // for thread
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using zmd::transfer::ErrorCode;
using zmd::transfer::TransferState;

auto invalid_transition(std::string_view id, std::string_view action, TransferState state) noexcept -> zmd::transfer::TransferError {
    return zmd::transfer::make_error(ErrorCode::InvalidStateTransition,
        fmt::format(FMT_COMPILE("cannot {} transfer {} in state {}"), action, id, zmd::transfer::transfer_state_to_string(state)));
}

constexpr auto kInitialSendPhase = "initial_send"sv;

constexpr auto is_active_run(TransferState state) noexcept -> bool {
    return state == TransferState::Pending || state == TransferState::Running;
}

auto initial_phase(const zmd::zfs::SendSpec& send, bool resuming) noexcept -> std::string {
    if (resuming) {
        return "resume";
    }
    return send.from_snapshot.empty() ? "full_send" : "incremental_send";
}

auto describe_outcome(const zmd::transfer::TransferOutcome& outcome) noexcept -> std::string {
    switch (outcome.state) {
    case TransferState::Completed:
        return "transfer completed";
    case TransferState::Paused:
        return "transfer paused, resume token saved";
    case TransferState::Stopped:
        return "transfer stopped";
    case TransferState::Failed:
        if (outcome.error) {
            return fmt::format(FMT_COMPILE("transfer failed: {}"), *outcome.error);
        }
        return "transfer failed";
    case TransferState::Pending:
    case TransferState::Running:
        break;
    }
    return fmt::format(FMT_COMPILE("transfer {}"), zmd::transfer::transfer_state_to_string(outcome.state));
}

}  // namespace

namespace zmd::transfer {

TransferManager::TransferManager(std::shared_ptr<zfs::DatasetManager> datasets, Config config) noexcept
  : m_datasets(std::move(datasets)),
    m_config(std::move(config)),
    m_bridge(*m_datasets, ResumeTokenBridge::Config{.retries = m_config.resume_token_retries, .retry_delay = m_config.resume_token_retry_delay}),
    m_runner(PipelineRunner::Config{.grace_period = m_config.grace_period}),
    m_store(m_config.state_dir) {
    if (!m_store.prepare()) {
        spdlog::error("Transfers will not survive a restart, state directory {} is unusable", m_config.state_dir);
    }
    restore();
}

TransferManager::~TransferManager() {
    shutdown();
}

auto TransferManager::find_job(std::string_view id) const noexcept -> std::expected<JobPtr, TransferError> {
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    const auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return std::unexpected(make_error(ErrorCode::NotFound, fmt::format(FMT_COMPILE("transfer '{}' not found"), id)));
    }
    return it->second;
}

auto TransferManager::start_transfer(TransferRequest request) noexcept -> std::expected<std::string, TransferError> {
    if (m_shut_down) {
        return std::unexpected(make_error(ErrorCode::InvalidStateTransition, "transfer manager is shutting down"));
    }
    if (auto problem = zfs::validate_send_spec(request.send); problem) {
        return std::unexpected(make_error(ErrorCode::ValidationError, std::move(*problem)));
    }
    if (request.receive.target.empty()) {
        return std::unexpected(make_error(ErrorCode::ValidationError, "receive target is required"));
    }

    TransferInfo info{
        .id         = m_ids.next(),
        .send       = std::move(request.send),
        .receive    = std::move(request.receive),
        .log_config = request.log_config.value_or(m_config.log_config),
        .created_at = Clock::now(),
        .revision   = 1,
    };
    auto job      = std::make_shared<TransferJob>(std::move(info));
    const auto id = job->id();
    job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("transfer created: {} -> {}"), job->info.send.snapshot, job->info.receive.target));

    {
        std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
        m_jobs.emplace(id, job);
    }
    spdlog::info("Transfer {} created: send={} receive={}", id, job->info.send, job->info.receive);
    persist(job);
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        dispatch(job, std::nullopt);
    }
    return id;
}

// Caller holds job->mutex.
void TransferManager::dispatch(const JobPtr& job, std::optional<std::string> resume_token) noexcept {
    try {
        job->worker = std::thread([this, job, token = std::move(resume_token)]() mutable {
            run_worker(job, std::move(token));
        });
    } catch (const std::system_error& err) {
        spdlog::error("Transfer {}: failed to start worker: {}", job->id(), err.what());
        if (job->transition(TransferState::Failed)) {
            job->info.error = make_error(ErrorCode::ProcessLaunchError, fmt::format(FMT_COMPILE("failed to start worker: {}"), err.what()));
        }
    }
}

void TransferManager::run_worker(const JobPtr& job, std::optional<std::string> resume_token) noexcept {
    const bool resuming = resume_token.has_value();
    zfs::SendSpec send{};
    zfs::ReceiveSpec receive{};
    bool need_estimate{false};
    bool resuming_initial{false};
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        if (job->info.state == TransferState::Pending) {
            job->transition(TransferState::Running);
        }
        send             = job->info.send;
        receive          = job->info.receive;
        resuming_initial = resuming && job->info.progress.phase == kInitialSendPhase;
        job->info.progress = TransferProgress{.phase = resuming_initial ? std::string{kInitialSendPhase} : initial_phase(send, resuming)};
        need_estimate      = !resuming && !job->info.size_info;
    }
    persist(job);

    if (need_estimate) {
        auto estimate = m_datasets->estimate_send_size(send);
        if (estimate) {
            job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("estimated {} stream size: {} bytes"), estimate->transfer_type, estimate->bytes));
            std::lock_guard<std::mutex> lock(job->mutex);
            job->info.progress.total_bytes = estimate->bytes;
            job->info.size_info            = std::move(*estimate);
            job->touch();
        } else {
            spdlog::warn("Transfer {}: size estimate failed: {}", job->id(), estimate.error().message);
            job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("size estimate unavailable: {}"), estimate.error().message));
        }
    }

    std::optional<zfs::SendSpec> initial{};
    if (resuming_initial) {
        initial = zfs::initial_send_spec(send);
    } else if (!resuming) {
        initial = prepare_initial_send(job, send, receive);
    }

    PipelineResult result{};
    if (initial) {
        result = run_stage(job, *initial, receive, resume_token);
        if (result.success()) {
            job->log.append(StreamSource::Transfer, "initial snapshot sent, continuing with the incremental stream"sv);
            {
                std::lock_guard<std::mutex> lock(job->mutex);
                job->info.progress = TransferProgress{.phase = "incremental_send"};
                if (job->info.size_info) {
                    job->info.progress.total_bytes = job->info.size_info->bytes;
                }
                job->touch();
            }
            persist(job);
            result = run_stage(job, send, receive, std::nullopt);
        }
    } else {
        result = run_stage(job, send, receive, resume_token);
    }

    // The intent is consumed together with the transition. If it changed while
    // the bridge was queried, classify again with the new one.
    TransferOutcome outcome{};
    for (;;) {
        const auto intent = [&job] {
            std::lock_guard<std::mutex> lock(job->mutex);
            return job->intent;
        }();

        std::optional<std::string> token{};
        if (needs_resume_token(result, intent, receive.resumable)) {
            auto fetched = m_bridge.fetch_token(receive.target);
            if (fetched) {
                token = std::move(*fetched);
            } else {
                job->log.append(StreamSource::Transfer, fetched.error().message);
            }
        }

        std::lock_guard<std::mutex> lock(job->mutex);
        if (job->intent != intent) {
            continue;
        }
        job->intent = CancelIntent::None;
        outcome     = classify_outcome(result, intent, token);
        if (job->transition(outcome.state)) {
            job->info.error        = outcome.error;
            job->info.resume_token = outcome.resume_token;
        }
        break;
    }

    job->log.append(StreamSource::Transfer, describe_outcome(outcome));
    if (outcome.state == TransferState::Failed && outcome.error) {
        spdlog::error("Transfer {} failed: {}", job->id(), *outcome.error);
    }
    persist(job);
    if (outcome.state == TransferState::Stopped && receive.resumable) {
        m_bridge.discard_partial_state(receive.target);
    }
    job->state_changed.notify_all();
}

auto TransferManager::prepare_initial_send(const JobPtr& job, const zfs::SendSpec& send, const zfs::ReceiveSpec& receive) noexcept -> std::optional<zfs::SendSpec> {
    auto initial = zfs::initial_send_spec(send);
    auto base    = zfs::target_base_snapshot(send, receive.target);
    if (!initial || !base) {
        return std::nullopt;
    }

    const auto exists = m_datasets->snapshot_exists(*base);
    if (!exists) {
        spdlog::warn("Transfer {}: could not check for {} on the destination, proceeding anyway: {}", job->id(), *base, exists.error().message);
        job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("could not check for {}: {}"), *base, exists.error().message));
        return std::nullopt;
    }
    if (*exists) {
        return std::nullopt;
    }

    spdlog::info("Transfer {}: {} missing on the destination, sending {} first", job->id(), *base, initial->snapshot);
    job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("{} is missing on the destination, sending {} first"), *base, initial->snapshot));
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->info.progress.phase = kInitialSendPhase;
        job->touch();
    }
    persist(job);
    return initial;
}

auto TransferManager::run_stage(const JobPtr& job, const zfs::SendSpec& send, const zfs::ReceiveSpec& receive,
    std::optional<std::string_view> resume_token) noexcept -> PipelineResult {
    PipelineResult result{};
    auto commands = m_bridge.build_commands(send, receive, resume_token);
    const bool cancelled_early = [&job] {
        std::lock_guard<std::mutex> lock(job->mutex);
        return job->intent != CancelIntent::None;
    }();

    if (!commands) {
        result.launch_error = commands.error().message;
        job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("cannot build commands: {}"), commands.error().message));
        return result;
    }
    if (cancelled_early) {
        job->log.append(StreamSource::Transfer, "interrupted before launch"sv);
        return result;
    }

    if (resume_token) {
        job->log.append(StreamSource::Transfer, "resuming from receive_resume_token"sv);
    }
    job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("send: {}"), utils::format_command(commands->send)));
    job->log.append(StreamSource::Transfer, fmt::format(FMT_COMPILE("receive: {}"), utils::format_command(commands->receive)));

    return m_runner.run(
        *commands,
        [&job](StreamSource source, std::string_view line) {
            job->log.append(source, line);
            if (source != StreamSource::Send) {
                return;
            }
            if (auto progress = zfs::parse_send_progress(line); progress) {
                std::lock_guard<std::mutex> lock(job->mutex);
                if (progress->total_bytes) {
                    job->info.progress.total_bytes = *progress->total_bytes;
                }
                if (progress->bytes_transferred) {
                    job->info.progress.bytes_transferred = *progress->bytes_transferred;
                }
            }
        },
        [&job]() {
            std::lock_guard<std::mutex> lock(job->mutex);
            return job->intent;
        },
        [&job](pid_t send_pid, pid_t receive_pid) {
            std::lock_guard<std::mutex> lock(job->mutex);
            job->info.send_pid    = send_pid;
            job->info.receive_pid = receive_pid;
        });
}

auto TransferManager::get_transfer(std::string_view id) const noexcept -> std::expected<TransferInfo, TransferError> {
    auto job = find_job(id);
    if (!job) {
        return std::unexpected(std::move(job.error()));
    }
    return (*job)->snapshot();
}

auto TransferManager::list_transfers(TransferKind kind) const noexcept -> std::vector<TransferInfo> {
    std::vector<JobPtr> jobs{};
    {
        std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
        jobs.reserve(m_jobs.size());
        for (const auto& [id, job] : m_jobs) {
            jobs.push_back(job);
        }
    }

    std::vector<TransferInfo> result{};
    for (const auto& job : jobs) {
        auto info = job->snapshot();
        if (kind_contains(kind, info.state)) {
            result.emplace_back(std::move(info));
        }
    }
    return result;
}

auto TransferManager::pause_transfer(std::string_view id) noexcept -> std::expected<void, TransferError> {
    auto found = find_job(id);
    if (!found) {
        return std::unexpected(std::move(found.error()));
    }
    auto& job = **found;

    std::unique_lock<std::mutex> lock(job.mutex);
    if (job.info.state != TransferState::Running) {
        return std::unexpected(invalid_transition(id, "pause"sv, job.info.state));
    }
    if (job.intent == CancelIntent::StopRequested) {
        return std::unexpected(make_error(ErrorCode::InvalidStateTransition, fmt::format(FMT_COMPILE("transfer {} is being stopped"), id)));
    }
    job.intent = CancelIntent::PauseRequested;
    spdlog::info("Transfer {}: pause requested", id);

    job.state_changed.wait(lock, [&job] { return job.info.state != TransferState::Running; });
    if (job.info.state == TransferState::Paused) {
        return {};
    }
    if (job.info.state == TransferState::Failed && job.info.error && job.info.error->code == ErrorCode::ResumeUnavailable) {
        return std::unexpected(*job.info.error);
    }
    return std::unexpected(make_error(ErrorCode::InvalidStateTransition,
        fmt::format(FMT_COMPILE("transfer {} became {} before it could be paused"), id, job.info.state)));
}

auto TransferManager::resume_transfer(std::string_view id) noexcept -> std::expected<void, TransferError> {
    auto found = find_job(id);
    if (!found) {
        return std::unexpected(std::move(found.error()));
    }
    const auto& job = *found;

    std::unique_lock<std::mutex> lock(job->mutex);
    if (job->info.state != TransferState::Paused) {
        return std::unexpected(invalid_transition(id, "resume"sv, job->info.state));
    }
    if (!job->info.resume_token || job->info.resume_token->empty()) {
        return std::unexpected(make_error(ErrorCode::ResumeUnavailable, fmt::format(FMT_COMPILE("transfer {} has no resume token"), id)));
    }
    if (m_shut_down) {
        return std::unexpected(make_error(ErrorCode::InvalidStateTransition, "transfer manager is shutting down"));
    }

    auto token = std::move(*job->info.resume_token);
    job->transition(TransferState::Running);
    auto previous = std::move(job->worker);
    dispatch(job, std::move(token));
    lock.unlock();

    // the previous run already settled, its thread is at most finishing up
    if (previous.joinable()) {
        previous.join();
    }
    persist(job);
    return {};
}

auto TransferManager::stop_transfer(std::string_view id) noexcept -> std::expected<void, TransferError> {
    auto found = find_job(id);
    if (!found) {
        return std::unexpected(std::move(found.error()));
    }
    const auto& job = *found;

    std::unique_lock<std::mutex> lock(job->mutex);
    if (is_terminal(job->info.state)) {
        return std::unexpected(invalid_transition(id, "stop"sv, job->info.state));
    }

    if (job->info.state == TransferState::Paused) {
        job->transition(TransferState::Stopped);
        const auto target    = job->info.receive.target;
        const bool resumable = job->info.receive.resumable;
        lock.unlock();

        job->log.append(StreamSource::Transfer, "transfer stopped while paused"sv);
        persist(job);
        if (resumable) {
            m_bridge.discard_partial_state(target);
        }
        job->state_changed.notify_all();
        return {};
    }

    job->intent = CancelIntent::StopRequested;
    spdlog::info("Transfer {}: stop requested", id);
    job->state_changed.wait(lock, [&job] { return is_terminal(job->info.state); });
    if (job->info.state != TransferState::Stopped) {
        return std::unexpected(make_error(ErrorCode::InvalidStateTransition,
            fmt::format(FMT_COMPILE("transfer {} became {} before it could be stopped"), id, job->info.state)));
    }
    return {};
}

auto TransferManager::delete_transfer(std::string_view id) noexcept -> std::expected<void, TransferError> {
    auto found = find_job(id);
    if (!found) {
        return std::unexpected(std::move(found.error()));
    }
    const auto& job = *found;

    std::thread worker{};
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        if (!is_terminal(job->info.state)) {
            return std::unexpected(invalid_transition(id, "delete"sv, job->info.state));
        }
        worker = std::move(job->worker);
    }
    {
        std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
        if (m_jobs.erase(std::string{id}) == 0) {
            return std::unexpected(make_error(ErrorCode::NotFound, fmt::format(FMT_COMPILE("transfer '{}' not found"), id)));
        }
    }

    // the worker may still be writing its final record
    if (worker.joinable()) {
        worker.join();
    }
    if (auto removed = m_store.remove(id); !removed) {
        spdlog::error("{}", removed.error());
    }
    spdlog::info("Transfer {} deleted", id);
    return {};
}

auto TransferManager::get_transfer_log(std::string_view id) const noexcept -> std::expected<std::string, TransferError> {
    auto job = find_job(id);
    if (!job) {
        return std::unexpected(std::move(job.error()));
    }
    return (*job)->log.full();
}

auto TransferManager::get_transfer_log_gist(std::string_view id) const noexcept -> std::expected<std::string, TransferError> {
    auto job = find_job(id);
    if (!job) {
        return std::unexpected(std::move(job.error()));
    }
    return (*job)->log.gist();
}

void TransferManager::shutdown() noexcept {
    if (m_shut_down.exchange(true)) {
        return;
    }

    std::vector<JobPtr> jobs{};
    {
        std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
        for (const auto& [id, job] : m_jobs) {
            jobs.push_back(job);
        }
    }

    std::size_t interrupted{};
    for (const auto& job : jobs) {
        std::lock_guard<std::mutex> lock(job->mutex);
        if (job->intent == CancelIntent::StopRequested) {
            continue;
        }
        if (job->info.state == TransferState::Running) {
            job->intent = job->info.receive.resumable ? CancelIntent::PauseRequested : CancelIntent::StopRequested;
            ++interrupted;
        } else if (job->info.state == TransferState::Pending) {
            job->intent = CancelIntent::StopRequested;
            ++interrupted;
        }
    }
    if (interrupted > 0) {
        spdlog::info("Shutting down, interrupting {} active transfers", interrupted);
    }

    for (const auto& job : jobs) {
        std::thread worker{};
        {
            std::unique_lock<std::mutex> lock(job->mutex);
            job->state_changed.wait(lock, [&job] { return !is_active_run(job->info.state); });
            worker = std::move(job->worker);
        }
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TransferManager::persist(const JobPtr& job) noexcept {
    if (!m_store.enabled()) {
        return;
    }
    const auto info = job->snapshot();
    if (auto saved = m_store.save(info, job->log.full()); !saved) {
        spdlog::error("{}", saved.error());
    }
}

void TransferManager::restore() noexcept {
    auto stored = m_store.load_all();
    for (auto& record : stored) {
        m_ids.reserve(record.info.id);
        auto job = std::make_shared<TransferJob>(std::move(record.info));
        job->log.load(record.log);
        {
            std::lock_guard<std::mutex> lock(job->mutex);
            job->info.send_pid    = 0;
            job->info.receive_pid = 0;
            if (is_active_run(job->info.state)) {
                restore_interrupted(*job);
            }
        }
        {
            std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
            m_jobs.emplace(job->id(), job);
        }
        persist(job);
    }
    if (!stored.empty()) {
        spdlog::info("Restored {} transfers from {}", stored.size(), m_config.state_dir);
    }
}

// Caller holds job.mutex. The previous daemon died during the run.
void TransferManager::restore_interrupted(TransferJob& job) noexcept {
    job.log.append(StreamSource::Transfer, "daemon restarted while the transfer was active"sv);
    if (job.info.state == TransferState::Pending) {
        job.transition(TransferState::Running);
    }

    std::optional<std::string> token{};
    if (job.info.receive.resumable) {
        auto fetched = m_bridge.fetch_token(job.info.receive.target);
        if (fetched) {
            token = std::move(*fetched);
        } else {
            job.log.append(StreamSource::Transfer, fetched.error().message);
        }
    }

    if (token) {
        job.transition(TransferState::Paused);
        job.info.resume_token = std::move(token);
        job.log.append(StreamSource::Transfer, "transfer paused, resume token saved"sv);
        return;
    }
    job.transition(TransferState::Failed);
    job.info.error = make_error(ErrorCode::StreamError, "daemon stopped while the transfer was running");
    job.log.append(StreamSource::Transfer, "transfer failed: no resumable state left"sv);
}

}  // namespace zmd::transfer
