#include "zmd/zfs.hpp"
#include "zmd/io_utils.hpp"
#include "zmd/pipeline.hpp"
#include "zmd/string_utils.hpp"

#include <charconv>      // for from_chars
#include <system_error>  // for errc
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto parse_u64(std::string_view str) noexcept -> std::optional<std::uint64_t> {
    str = zmd::utils::trim(str);
    std::uint64_t value{};
    const auto* end = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (str.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// HH:MM:SS as printed in front of every progress line
constexpr auto is_clock_field(std::string_view field) noexcept -> bool {
    if (field.size() != 8 || field[2] != ':' || field[5] != ':') {
        return false;
    }
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (i == 2 || i == 5) {
            continue;
        }
        if (field[i] < '0' || field[i] > '9') {
            return false;
        }
    }
    return true;
}

void append_stream_flags(std::vector<std::string>& args, const zmd::zfs::SendSpec& spec) noexcept {
    if (spec.raw) {
        args.emplace_back("-w");
    }
    if (spec.compressed) {
        args.emplace_back("-c");
    }
    if (spec.properties) {
        args.emplace_back("-p");
    }
    if (spec.replicate) {
        args.emplace_back("-R");
        if (spec.skip_missing) {
            args.emplace_back("-s");
        }
    }
    if (spec.large_blocks) {
        args.emplace_back("-L");
    }
    if (spec.embed_data) {
        args.emplace_back("-e");
    }
    if (spec.holds) {
        args.emplace_back("-h");
    }
    if (spec.backup_stream) {
        args.emplace_back("-b");
    }
}

void append_range(std::vector<std::string>& args, const zmd::zfs::SendSpec& spec) noexcept {
    if (!spec.from_snapshot.empty()) {
        args.emplace_back(spec.intermediary ? "-I" : "-i");
        args.emplace_back(spec.from_snapshot);
    }
    args.emplace_back(spec.snapshot);
}

}  // namespace

namespace zmd::zfs {

auto validate_send_spec(const SendSpec& spec) noexcept -> std::optional<std::string> {
    if (spec.snapshot.empty()) {
        return "send snapshot is required";
    }
    if (spec.skip_missing && !spec.replicate) {
        return "skip_missing (-s) requires replicate (-R)";
    }
    if (spec.intermediary && spec.from_snapshot.empty()) {
        return "intermediary (-I) requires from_snapshot";
    }
    if (!spec.from_snapshot.empty() && spec.from_snapshot == spec.snapshot) {
        return "from_snapshot must differ from snapshot";
    }
    return std::nullopt;
}

auto send_transfer_type(const SendSpec& spec) noexcept -> std::string_view {
    if (spec.from_snapshot.empty()) {
        return "full"sv;
    }
    return spec.intermediary ? "intermediary"sv : "incremental"sv;
}

auto build_send_args(const SendSpec& spec) noexcept -> std::vector<std::string> {
    std::vector<std::string> args{};
    if (spec.parsable) {
        args.emplace_back("-P");
    }
    if (spec.verbose) {
        args.emplace_back("-v");
    }
    append_stream_flags(args, spec);
    append_range(args, spec);
    return args;
}

auto build_resume_send_args(const SendSpec& spec, std::string_view token) noexcept -> std::vector<std::string> {
    std::vector<std::string> args{};
    if (spec.parsable) {
        args.emplace_back("-P");
    }
    if (spec.verbose) {
        args.emplace_back("-v");
    }
    if (spec.embed_data) {
        args.emplace_back("-e");
    }
    args.emplace_back("-t");
    args.emplace_back(token);
    return args;
}

auto build_receive_args(const ReceiveSpec& spec, bool resume_mode) noexcept -> std::vector<std::string> {
    std::vector<std::string> args{};
    if (spec.force && !resume_mode) {
        args.emplace_back("-F");
    }
    if (spec.resumable) {
        args.emplace_back("-s");
    }
    if (spec.unmounted) {
        args.emplace_back("-u");
    }
    if (spec.use_parent) {
        args.emplace_back("-d");
    }
    if (spec.verbose) {
        args.emplace_back("-v");
    }
    if (!spec.origin.empty()) {
        args.emplace_back("-o");
        args.emplace_back(fmt::format(FMT_COMPILE("origin={}"), spec.origin));
    }
    for (const auto& [name, value] : spec.properties) {
        args.emplace_back("-o");
        args.emplace_back(fmt::format(FMT_COMPILE("{}={}"), name, value));
    }
    for (const auto& name : spec.exclude_properties) {
        args.emplace_back("-x");
        args.emplace_back(name);
    }
    args.emplace_back(spec.target);
    return args;
}

auto initial_send_spec(const SendSpec& spec) noexcept -> std::optional<SendSpec> {
    const auto& base = spec.from_snapshot;
    if (base.empty() || base.contains('#')) {
        return std::nullopt;
    }

    SendSpec initial{spec};
    if (base.starts_with('@')) {
        // "@snap" is short for a snapshot of the sent dataset
        const auto dataset_end = spec.snapshot.find('@');
        if (dataset_end == std::string::npos) {
            return std::nullopt;
        }
        initial.snapshot = spec.snapshot.substr(0, dataset_end) + base;
    } else if (base.contains('@')) {
        initial.snapshot = base;
    } else {
        return std::nullopt;
    }
    initial.from_snapshot.clear();
    initial.intermediary = false;
    return initial;
}

auto target_base_snapshot(const SendSpec& spec, std::string_view target) noexcept -> std::optional<std::string> {
    const auto& base = spec.from_snapshot;
    const auto name  = base.find('@');
    if (name == std::string::npos || base.contains('#') || target.empty()) {
        return std::nullopt;
    }
    return fmt::format(FMT_COMPILE("{}{}"), target, std::string_view{base}.substr(name));
}

auto build_dry_run_args(const SendSpec& spec) noexcept -> std::vector<std::string> {
    std::vector<std::string> args{"-n", "-P", "-v"};
    append_stream_flags(args, spec);
    append_range(args, spec);
    return args;
}

auto parse_send_size(std::string_view output) noexcept -> std::optional<std::uint64_t> {
    for (const auto& line : utils::make_split_view(output)) {
        const auto& fields = utils::make_multiline_view(line, false, '\t');
        if (fields.size() == 2 && fields[0] == "size"sv) {
            return parse_u64(fields[1]);
        }
    }
    return std::nullopt;
}

auto parse_send_progress(std::string_view line) noexcept -> std::optional<SendProgressLine> {
    const auto& fields = utils::make_multiline_view(line, false, '\t');
    if (fields.size() < 2) {
        return std::nullopt;
    }

    const auto& head = fields.front();
    if (head == "size"sv) {
        if (auto total = parse_u64(fields[1]); total) {
            return SendProgressLine{.total_bytes = *total};
        }
        return std::nullopt;
    }
    if (head == "full"sv || head == "incremental"sv) {
        // full <snap> <size>, incremental <from> <snap> <size>
        if (auto total = parse_u64(fields.back()); total) {
            return SendProgressLine{.total_bytes = *total};
        }
        return std::nullopt;
    }
    if (is_clock_field(head)) {
        if (auto done = parse_u64(fields[1]); done) {
            return SendProgressLine{.bytes_transferred = *done};
        }
    }
    return std::nullopt;
}

ZfsDatasetManager::ZfsDatasetManager(utils::CommandExecutor executor) noexcept : m_executor(std::move(executor)) { }

auto ZfsDatasetManager::get_resume_token(std::string_view dataset) noexcept -> std::expected<std::optional<std::string>, utils::CommandError> {
    auto output = m_executor.execute({.no_headers = true}, "zfs get"sv,
        {"-o", "value", "receive_resume_token", std::string{dataset}});
    if (!output) {
        // nothing was received yet, so nothing can be resumed
        if (output.error().output.contains("does not exist"sv)) {
            return std::nullopt;
        }
        return std::unexpected(std::move(output.error()));
    }

    const auto& token = utils::trim(*output);
    if (token.empty() || token == "-"sv) {
        return std::nullopt;
    }
    return std::string{token};
}

auto ZfsDatasetManager::abort_partial_receive(std::string_view dataset) noexcept -> std::expected<void, utils::CommandError> {
    auto output = m_executor.execute({}, "zfs receive"sv, {"-A", std::string{dataset}});
    if (!output) {
        return std::unexpected(std::move(output.error()));
    }
    return {};
}

auto ZfsDatasetManager::snapshot_exists(std::string_view snapshot) noexcept -> std::expected<bool, utils::CommandError> {
    auto output = m_executor.execute({.no_headers = true}, "zfs list"sv,
        {"-o", "name", "-t", "snapshot", std::string{snapshot}});
    if (!output) {
        if (output.error().output.contains("does not exist"sv)) {
            return false;
        }
        return std::unexpected(std::move(output.error()));
    }
    return true;
}

auto ZfsDatasetManager::estimate_send_size(const SendSpec& spec) noexcept -> std::expected<SendSizeEstimate, utils::CommandError> {
    auto output = m_executor.execute({}, "zfs send"sv, build_dry_run_args(spec));
    if (!output) {
        return std::unexpected(std::move(output.error()));
    }
    const auto& bytes = parse_send_size(*output);
    if (!bytes) {
        return std::unexpected(utils::CommandError{.command = "zfs send -n", .exit_code = 0, .output = *output, .message = "no size in dry run output"});
    }
    return SendSizeEstimate{.bytes = *bytes, .transfer_type = std::string{send_transfer_type(spec)}};
}

auto ZfsDatasetManager::send_receive(const SendSpec& send, const ReceiveSpec& receive) noexcept -> std::expected<void, utils::CommandError> {
    auto send_argv = send_command(send, std::nullopt);
    if (!send_argv) {
        return std::unexpected(std::move(send_argv.error()));
    }
    auto receive_argv = receive_command(receive, false);
    if (!receive_argv) {
        return std::unexpected(std::move(receive_argv.error()));
    }

    const auto& cmd_line = fmt::format(FMT_COMPILE("{} | {}"), utils::format_command(*send_argv), utils::format_command(*receive_argv));
    spdlog::info("Running send/receive: {}", cmd_line);

    std::string receive_output{};
    transfer::PipelineRunner runner{transfer::PipelineRunner::Config{}};
    const auto& result = runner.run(
        transfer::PipelineCommands{.send = std::move(*send_argv), .receive = std::move(*receive_argv)},
        [&receive_output](transfer::StreamSource source, std::string_view line) {
            spdlog::debug("[{}] {}", transfer::stream_source_to_string(source), line);
            if (source == transfer::StreamSource::Receive) {
                receive_output += line;
                receive_output += '\n';
            }
        });

    if (result.launch_error) {
        return std::unexpected(utils::CommandError{.command = cmd_line, .message = *result.launch_error});
    }
    if (!result.success()) {
        const auto& failed = !result.receive.success() ? result.receive : result.send;
        return std::unexpected(utils::CommandError{
            .command   = cmd_line,
            .exit_code = failed.exit_code,
            .output    = std::string{utils::trim(receive_output)},
            .message   = fmt::format(FMT_COMPILE("send/receive failed ({})"), failed.describe()),
        });
    }
    return {};
}

auto ZfsDatasetManager::send_command(const SendSpec& spec, std::optional<std::string_view> resume_token) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> {
    if (resume_token) {
        return m_executor.build_args({}, "zfs send"sv, build_resume_send_args(spec, *resume_token));
    }
    return m_executor.build_args({}, "zfs send"sv, build_send_args(spec));
}

auto ZfsDatasetManager::receive_command(const ReceiveSpec& spec, bool resume_mode) const noexcept -> std::expected<std::vector<std::string>, utils::CommandError> {
    return m_executor.build_args({}, "zfs receive"sv, build_receive_args(spec, resume_mode));
}

}  // namespace zmd::zfs
