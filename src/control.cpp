#include "control.hpp"

// import zmd
#include "zmd/transfer_json.hpp"

#include <utility>  // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace json = zmd::transfer::json;

using zmd::transfer::ErrorCode;
using zmd::transfer::make_error;

namespace {

auto validation_error(std::string message) noexcept -> std::string {
    return json::error_response(make_error(ErrorCode::ValidationError, std::move(message)));
}

auto to_response(const std::expected<void, zmd::transfer::TransferError>& result) noexcept -> std::string {
    if (!result) {
        return json::error_response(result.error());
    }
    return json::success_response();
}

}  // namespace

namespace service {

ControlChannel::ControlChannel(zmd::transfer::TransferManager& manager, zmd::transfer::LogConfig log_defaults) noexcept
  : m_manager(manager), m_log_defaults(log_defaults) { }

auto ControlChannel::handle_request(std::string_view request_line) noexcept -> std::string {
    rapidjson::Document doc;
    doc.Parse(request_line.data(), request_line.size());
    if (doc.HasParseError()) {
        return validation_error(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return validation_error("request must be an object");
    }
    if (!doc.HasMember("op") || !doc["op"].IsString()) {
        return validation_error("'op' is required and must be a string");
    }
    const std::string_view op{doc["op"].GetString(), doc["op"].GetStringLength()};
    spdlog::debug("Control request: {}", op);

    if (op == "start"sv) {
        auto request = json::transfer_request_from_json(doc, m_log_defaults);
        if (!request) {
            return validation_error(std::move(request.error()));
        }
        auto id = m_manager.start_transfer(std::move(*request));
        if (!id) {
            return json::error_response(id.error());
        }
        return json::start_response(*id);
    }

    if (op == "list"sv) {
        auto kind = zmd::transfer::TransferKind::Active;
        if (doc.HasMember("type")) {
            if (!doc["type"].IsString()) {
                return validation_error("'type' must be a string");
            }
            const std::string_view type_str{doc["type"].GetString(), doc["type"].GetStringLength()};
            auto parsed = zmd::transfer::transfer_kind_from_string(type_str);
            if (!parsed) {
                return validation_error(fmt::format(FMT_COMPILE("Invalid transfer type '{}'. Valid types: all, active, completed, failed"), type_str));
            }
            kind = *parsed;
        }
        return json::list_response(m_manager.list_transfers(kind), kind);
    }

    // everything else addresses one transfer
    if (!doc.HasMember("transfer_id") || !doc["transfer_id"].IsString()) {
        return validation_error("'transfer_id' is required and must be a string");
    }
    const std::string_view id{doc["transfer_id"].GetString(), doc["transfer_id"].GetStringLength()};

    if (op == "get"sv) {
        auto info = m_manager.get_transfer(id);
        if (!info) {
            return json::error_response(info.error());
        }
        return json::transfer_response(*info);
    }
    if (op == "pause"sv) {
        return to_response(m_manager.pause_transfer(id));
    }
    if (op == "resume"sv) {
        return to_response(m_manager.resume_transfer(id));
    }
    if (op == "stop"sv) {
        return to_response(m_manager.stop_transfer(id));
    }
    if (op == "delete"sv) {
        return to_response(m_manager.delete_transfer(id));
    }
    if (op == "log"sv || op == "gist"sv) {
        auto content = (op == "log"sv) ? m_manager.get_transfer_log(id) : m_manager.get_transfer_log_gist(id);
        if (!content) {
            return json::error_response(content.error());
        }
        return json::log_response(id, *content, (op == "log"sv) ? "full"sv : "gist"sv);
    }

    return validation_error(fmt::format(FMT_COMPILE("unknown op '{}'"), op));
}

}  // namespace service
