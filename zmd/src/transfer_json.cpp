#include "zmd/transfer_json.hpp"

#include <array>    // for array
#include <cstdint>  // for int64_t, uint64_t
#include <utility>  // for move, pair

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using zmd::transfer::LogConfig;
using zmd::transfer::TimePoint;
using zmd::transfer::TransferError;
using zmd::transfer::TransferInfo;
using zmd::zfs::ReceiveSpec;
using zmd::zfs::SendSpec;

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

constexpr std::array kSendFlags{
    std::pair{"intermediary", &SendSpec::intermediary},
    std::pair{"raw", &SendSpec::raw},
    std::pair{"compressed", &SendSpec::compressed},
    std::pair{"properties", &SendSpec::properties},
    std::pair{"replicate", &SendSpec::replicate},
    std::pair{"skip_missing", &SendSpec::skip_missing},
    std::pair{"large_blocks", &SendSpec::large_blocks},
    std::pair{"embed_data", &SendSpec::embed_data},
    std::pair{"holds", &SendSpec::holds},
    std::pair{"backup_stream", &SendSpec::backup_stream},
    std::pair{"verbose", &SendSpec::verbose},
    std::pair{"parsable", &SendSpec::parsable},
};

constexpr std::array kReceiveFlags{
    std::pair{"force", &ReceiveSpec::force},
    std::pair{"resumable", &ReceiveSpec::resumable},
    std::pair{"unmounted", &ReceiveSpec::unmounted},
    std::pair{"use_parent", &ReceiveSpec::use_parent},
    std::pair{"verbose", &ReceiveSpec::verbose},
};

constexpr std::array kLogConfigFields{
    std::pair{"max_bytes", &LogConfig::max_bytes},
    std::pair{"max_line_bytes", &LogConfig::max_line_bytes},
    std::pair{"head_lines", &LogConfig::head_lines},
    std::pair{"gist_head_lines", &LogConfig::gist_head_lines},
    std::pair{"gist_tail_lines", &LogConfig::gist_tail_lines},
    std::pair{"gist_max_bytes", &LogConfig::gist_max_bytes},
};

// Readers leave out untouched when the key is absent.

auto read_bool(const rapidjson::Value& obj, const char* key, bool& out) noexcept -> std::expected<void, std::string> {
    if (!obj.HasMember(key)) {
        return {};
    }
    if (!obj[key].IsBool()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a boolean"), key));
    }
    out = obj[key].GetBool();
    return {};
}

auto read_string(const rapidjson::Value& obj, const char* key, std::string& out) noexcept -> std::expected<void, std::string> {
    if (!obj.HasMember(key)) {
        return {};
    }
    if (!obj[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out.assign(obj[key].GetString(), obj[key].GetStringLength());
    return {};
}

auto read_uint64(const rapidjson::Value& obj, const char* key, std::uint64_t& out) noexcept -> std::expected<void, std::string> {
    if (!obj.HasMember(key)) {
        return {};
    }
    if (!obj[key].IsUint64()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a non-negative integer"), key));
    }
    out = obj[key].GetUint64();
    return {};
}

auto read_timestamp(const rapidjson::Value& obj, const char* key, std::optional<TimePoint>& out) noexcept -> std::expected<void, std::string> {
    if (!obj.HasMember(key) || obj[key].IsNull()) {
        out.reset();
        return {};
    }
    if (!obj[key].IsInt64()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be milliseconds since the epoch"), key));
    }
    out = zmd::transfer::from_unix_ms(obj[key].GetInt64());
    return {};
}

auto read_error(const rapidjson::Value& value) noexcept -> std::expected<TransferError, std::string> {
    if (!value.IsObject()) {
        return std::unexpected("'error' must be an object");
    }
    if (!value.HasMember("code") || !value["code"].IsString()) {
        return std::unexpected("'error.code' is required and must be a string");
    }
    const auto& code = zmd::transfer::error_code_from_string(value["code"].GetString());
    if (!code) {
        return std::unexpected(fmt::format(FMT_COMPILE("unknown error code '{}'"), value["code"].GetString()));
    }

    TransferError error{.code = *code};
    if (auto res = read_string(value, "message", error.message); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = read_string(value, "output", error.output); !res) {
        return std::unexpected(res.error());
    }
    if (value.HasMember("exit_code") && !value["exit_code"].IsNull()) {
        if (!value["exit_code"].IsInt()) {
            return std::unexpected("'error.exit_code' must be an integer");
        }
        error.exit_code = value["exit_code"].GetInt();
    }
    if (value.HasMember("resume_token") && !value["resume_token"].IsNull()) {
        if (!value["resume_token"].IsString()) {
            return std::unexpected("'error.resume_token' must be a string");
        }
        error.resume_token = value["resume_token"].GetString();
    }
    return error;
}

void write_key(JsonWriter& writer, std::string_view key) noexcept {
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
}

void write_string(JsonWriter& writer, std::string_view value) noexcept {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_member(JsonWriter& writer, std::string_view key, std::string_view value) noexcept {
    write_key(writer, key);
    write_string(writer, value);
}

void write_timestamp(JsonWriter& writer, std::string_view key, const std::optional<TimePoint>& time_point) noexcept {
    write_key(writer, key);
    if (time_point) {
        writer.Int64(zmd::transfer::to_unix_ms(*time_point));
    } else {
        writer.Null();
    }
}

void write_send_spec(JsonWriter& writer, const SendSpec& spec) noexcept {
    writer.StartObject();
    write_member(writer, "snapshot"sv, spec.snapshot);
    write_member(writer, "from_snapshot"sv, spec.from_snapshot);
    for (const auto& [key, flag] : kSendFlags) {
        writer.Key(key);
        writer.Bool(spec.*flag);
    }
    writer.EndObject();
}

void write_receive_spec(JsonWriter& writer, const ReceiveSpec& spec) noexcept {
    writer.StartObject();
    write_member(writer, "target"sv, spec.target);
    for (const auto& [key, flag] : kReceiveFlags) {
        writer.Key(key);
        writer.Bool(spec.*flag);
    }
    write_member(writer, "origin"sv, spec.origin);
    writer.Key("properties");
    writer.StartObject();
    for (const auto& [name, value] : spec.properties) {
        write_member(writer, name, value);
    }
    writer.EndObject();
    writer.Key("exclude_properties");
    writer.StartArray();
    for (const auto& name : spec.exclude_properties) {
        write_string(writer, name);
    }
    writer.EndArray();
    writer.EndObject();
}

void write_log_config(JsonWriter& writer, const LogConfig& config) noexcept {
    writer.StartObject();
    for (const auto& [key, field] : kLogConfigFields) {
        writer.Key(key);
        writer.Uint64(config.*field);
    }
    writer.EndObject();
}

void write_error(JsonWriter& writer, const TransferError& error, bool brief) noexcept {
    writer.StartObject();
    write_member(writer, "code"sv, zmd::transfer::error_code_to_string(error.code));
    write_member(writer, "message"sv, error.message);
    if (!brief) {
        writer.Key("exit_code");
        if (error.exit_code) {
            writer.Int(*error.exit_code);
        } else {
            writer.Null();
        }
        write_member(writer, "output"sv, error.output);
        writer.Key("resume_token");
        if (error.resume_token) {
            write_string(writer, *error.resume_token);
        } else {
            writer.Null();
        }
    }
    writer.EndObject();
}

// The record carries what is needed to rebuild the job, the API view hides the token.
void write_info(JsonWriter& writer, const TransferInfo& info, bool record) noexcept {
    writer.StartObject();
    write_member(writer, "id"sv, info.id);
    write_member(writer, "state"sv, zmd::transfer::transfer_state_to_string(info.state));
    writer.Key("created_at");
    writer.Int64(zmd::transfer::to_unix_ms(info.created_at));
    write_timestamp(writer, "started_at"sv, info.started_at);
    write_timestamp(writer, "ended_at"sv, info.ended_at);
    write_timestamp(writer, "last_paused_at"sv, info.last_paused_at);

    writer.Key("has_resume_token");
    writer.Bool(info.resume_token.has_value());
    if (record) {
        writer.Key("resume_token");
        if (info.resume_token) {
            write_string(writer, *info.resume_token);
        } else {
            writer.Null();
        }
    }

    writer.Key("error");
    if (info.error) {
        write_error(writer, *info.error, false);
    } else {
        writer.Null();
    }

    writer.Key("progress");
    writer.StartObject();
    writer.Key("bytes_transferred");
    writer.Uint64(info.progress.bytes_transferred);
    writer.Key("total_bytes");
    writer.Uint64(info.progress.total_bytes);
    write_member(writer, "phase"sv, info.progress.phase);
    writer.EndObject();

    writer.Key("size_info");
    if (info.size_info) {
        writer.StartObject();
        writer.Key("bytes");
        writer.Uint64(info.size_info->bytes);
        write_member(writer, "transfer_type"sv, info.size_info->transfer_type);
        writer.EndObject();
    } else {
        writer.Null();
    }

    writer.Key("send_pid");
    writer.Int(info.send_pid);
    writer.Key("receive_pid");
    writer.Int(info.receive_pid);

    writer.Key("send");
    write_send_spec(writer, info.send);
    writer.Key("receive");
    write_receive_spec(writer, info.receive);

    if (record) {
        writer.Key("log_config");
        write_log_config(writer, info.log_config);
        writer.Key("revision");
        writer.Uint64(info.revision);
    }
    writer.EndObject();
}

auto buffer_to_string(const rapidjson::StringBuffer& buffer) noexcept -> std::string {
    return std::string{buffer.GetString(), buffer.GetSize()};
}

}  // namespace

namespace zmd::transfer::json {

auto send_spec_from_json(const rapidjson::Value& value) noexcept -> std::expected<zfs::SendSpec, std::string> {
    if (!value.IsObject()) {
        return std::unexpected("'send' must be an object");
    }

    zfs::SendSpec spec{};
    if (auto res = read_string(value, "snapshot", spec.snapshot); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = read_string(value, "from_snapshot", spec.from_snapshot); !res) {
        return std::unexpected(res.error());
    }
    for (const auto& [key, flag] : kSendFlags) {
        if (auto res = read_bool(value, key, spec.*flag); !res) {
            return std::unexpected(res.error());
        }
    }
    return spec;
}

auto receive_spec_from_json(const rapidjson::Value& value) noexcept -> std::expected<zfs::ReceiveSpec, std::string> {
    if (!value.IsObject()) {
        return std::unexpected("'receive' must be an object");
    }

    zfs::ReceiveSpec spec{};
    if (auto res = read_string(value, "target", spec.target); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = read_string(value, "origin", spec.origin); !res) {
        return std::unexpected(res.error());
    }
    for (const auto& [key, flag] : kReceiveFlags) {
        if (auto res = read_bool(value, key, spec.*flag); !res) {
            return std::unexpected(res.error());
        }
    }

    if (value.HasMember("properties")) {
        if (!value["properties"].IsObject()) {
            return std::unexpected("'properties' must be an object");
        }
        for (const auto& member : value["properties"].GetObject()) {
            if (!member.value.IsString()) {
                return std::unexpected(fmt::format(FMT_COMPILE("property '{}' must be a string"), member.name.GetString()));
            }
            spec.properties.emplace(member.name.GetString(), member.value.GetString());
        }
    }
    if (value.HasMember("exclude_properties")) {
        if (!value["exclude_properties"].IsArray()) {
            return std::unexpected("'exclude_properties' must be an array");
        }
        for (const auto& name : value["exclude_properties"].GetArray()) {
            if (!name.IsString()) {
                return std::unexpected("Each excluded property must be a string");
            }
            spec.exclude_properties.emplace_back(name.GetString());
        }
    }
    return spec;
}

auto log_config_from_json(const rapidjson::Value& value, LogConfig defaults) noexcept -> std::expected<LogConfig, std::string> {
    if (!value.IsObject()) {
        return std::unexpected("log configuration must be an object");
    }
    for (const auto& [key, field] : kLogConfigFields) {
        std::uint64_t number{defaults.*field};
        if (auto res = read_uint64(value, key, number); !res) {
            return std::unexpected(res.error());
        }
        defaults.*field = static_cast<std::size_t>(number);
    }
    if (defaults.max_bytes == 0 || defaults.max_line_bytes == 0 || defaults.gist_max_bytes == 0) {
        return std::unexpected("log size limits must be positive");
    }
    return defaults;
}

auto transfer_request_from_json(const rapidjson::Value& value, const LogConfig& log_defaults) noexcept -> std::expected<TransferRequest, std::string> {
    if (!value.IsObject()) {
        return std::unexpected("request must be an object");
    }
    if (!value.HasMember("send")) {
        return std::unexpected("'send' is required");
    }
    if (!value.HasMember("receive")) {
        return std::unexpected("'receive' is required");
    }

    auto send = send_spec_from_json(value["send"]);
    if (!send) {
        return std::unexpected(std::move(send.error()));
    }
    auto receive = receive_spec_from_json(value["receive"]);
    if (!receive) {
        return std::unexpected(std::move(receive.error()));
    }

    TransferRequest request{.send = std::move(*send), .receive = std::move(*receive)};
    if (value.HasMember("log_config")) {
        auto log_config = log_config_from_json(value["log_config"], log_defaults);
        if (!log_config) {
            return std::unexpected(std::move(log_config.error()));
        }
        request.log_config = *log_config;
    }
    return request;
}

auto record_to_json(const TransferInfo& info) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    write_info(writer, info, true);
    return buffer_to_string(buffer);
}

auto record_from_json(std::string_view json_content) noexcept -> std::expected<TransferInfo, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"), doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    TransferInfo info{};
    if (!doc.HasMember("id") || !doc["id"].IsString()) {
        return std::unexpected("'id' is required and must be a string");
    }
    info.id = doc["id"].GetString();

    if (!doc.HasMember("state") || !doc["state"].IsString()) {
        return std::unexpected("'state' is required and must be a string");
    }
    const auto& state = transfer_state_from_string(doc["state"].GetString());
    if (!state) {
        return std::unexpected(fmt::format(FMT_COMPILE("unknown state '{}'"), doc["state"].GetString()));
    }
    info.state = *state;

    if (!doc.HasMember("created_at") || !doc["created_at"].IsInt64()) {
        return std::unexpected("'created_at' is required and must be an integer");
    }
    info.created_at = from_unix_ms(doc["created_at"].GetInt64());
    for (const auto& [key, field] : {std::pair{"started_at", &info.started_at}, std::pair{"ended_at", &info.ended_at}, std::pair{"last_paused_at", &info.last_paused_at}}) {
        if (auto res = read_timestamp(doc, key, *field); !res) {
            return std::unexpected(res.error());
        }
    }

    if (doc.HasMember("resume_token") && !doc["resume_token"].IsNull()) {
        if (!doc["resume_token"].IsString()) {
            return std::unexpected("'resume_token' must be a string");
        }
        info.resume_token = doc["resume_token"].GetString();
    }
    if (doc.HasMember("error") && !doc["error"].IsNull()) {
        auto error = read_error(doc["error"]);
        if (!error) {
            return std::unexpected(std::move(error.error()));
        }
        info.error = std::move(*error);
    }

    if (doc.HasMember("progress")) {
        const auto& progress = doc["progress"];
        if (!progress.IsObject()) {
            return std::unexpected("'progress' must be an object");
        }
        if (auto res = read_uint64(progress, "bytes_transferred", info.progress.bytes_transferred); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = read_uint64(progress, "total_bytes", info.progress.total_bytes); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = read_string(progress, "phase", info.progress.phase); !res) {
            return std::unexpected(res.error());
        }
    }
    if (doc.HasMember("size_info") && !doc["size_info"].IsNull()) {
        const auto& size_info = doc["size_info"];
        if (!size_info.IsObject()) {
            return std::unexpected("'size_info' must be an object");
        }
        zfs::SendSizeEstimate estimate{};
        if (auto res = read_uint64(size_info, "bytes", estimate.bytes); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = read_string(size_info, "transfer_type", estimate.transfer_type); !res) {
            return std::unexpected(res.error());
        }
        info.size_info = std::move(estimate);
    }

    if (!doc.HasMember("send") || !doc.HasMember("receive")) {
        return std::unexpected("'send' and 'receive' are required");
    }
    auto send = send_spec_from_json(doc["send"]);
    if (!send) {
        return std::unexpected(std::move(send.error()));
    }
    info.send = std::move(*send);
    auto receive = receive_spec_from_json(doc["receive"]);
    if (!receive) {
        return std::unexpected(std::move(receive.error()));
    }
    info.receive = std::move(*receive);

    if (doc.HasMember("log_config")) {
        auto log_config = log_config_from_json(doc["log_config"], LogConfig{});
        if (!log_config) {
            return std::unexpected(std::move(log_config.error()));
        }
        info.log_config = *log_config;
    }
    if (auto res = read_uint64(doc, "revision", info.revision); !res) {
        return std::unexpected(res.error());
    }
    return info;
}

auto start_response(std::string_view transfer_id) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    write_member(writer, "transfer_id"sv, transfer_id);
    writer.EndObject();
    return buffer_to_string(buffer);
}

auto transfer_response(const TransferInfo& info) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    write_info(writer, info, false);
    return buffer_to_string(buffer);
}

auto list_response(const std::vector<TransferInfo>& transfers, TransferKind kind) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("transfers");
    writer.StartArray();
    for (const auto& info : transfers) {
        write_info(writer, info, false);
    }
    writer.EndArray();
    write_member(writer, "type"sv, transfer_kind_to_string(kind));
    writer.Key("count");
    writer.Uint64(transfers.size());
    writer.EndObject();
    return buffer_to_string(buffer);
}

auto log_response(std::string_view transfer_id, std::string_view content, std::string_view type) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    write_member(writer, "transfer_id"sv, transfer_id);
    write_member(writer, "log_content"sv, content);
    write_member(writer, "type"sv, type);
    writer.EndObject();
    return buffer_to_string(buffer);
}

auto success_response() noexcept -> std::string {
    return R"({"success":true})";
}

auto error_response(const TransferError& error) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("success");
    writer.Bool(false);
    writer.Key("error");
    write_error(writer, error, true);
    writer.EndObject();
    return buffer_to_string(buffer);
}

}  // namespace zmd::transfer::json
