#ifndef TRANSFER_JSON_HPP
#define TRANSFER_JSON_HPP

#include "zmd/transfer_types.hpp"
#include "zmd/zfs_types.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <rapidjson/fwd.h>

namespace zmd::transfer::json {

/// @name Request parsing
/// @{
auto send_spec_from_json(const rapidjson::Value& value) noexcept -> std::expected<zfs::SendSpec, std::string>;
auto receive_spec_from_json(const rapidjson::Value& value) noexcept -> std::expected<zfs::ReceiveSpec, std::string>;

/// @brief Read LogConfig fields present in value, keeping defaults for the others.
auto log_config_from_json(const rapidjson::Value& value, LogConfig defaults) noexcept -> std::expected<LogConfig, std::string>;

/// @brief {"send": {...}, "receive": {...}, "log_config": {...}?}
/// @param log_defaults Base of a partial "log_config".
auto transfer_request_from_json(const rapidjson::Value& value, const LogConfig& log_defaults = {}) noexcept -> std::expected<TransferRequest, std::string>;
/// @}

/// @name Persisted records
/// @{
auto record_to_json(const TransferInfo& info) noexcept -> std::string;
auto record_from_json(std::string_view json_content) noexcept -> std::expected<TransferInfo, std::string>;
/// @}

/// @name API responses
/// @{
auto start_response(std::string_view transfer_id) noexcept -> std::string;
auto transfer_response(const TransferInfo& info) noexcept -> std::string;
auto list_response(const std::vector<TransferInfo>& transfers, TransferKind kind) noexcept -> std::string;
auto log_response(std::string_view transfer_id, std::string_view content, std::string_view type) noexcept -> std::string;
auto success_response() noexcept -> std::string;
auto error_response(const TransferError& error) noexcept -> std::string;
/// @}

}  // namespace zmd::transfer::json

#endif  // TRANSFER_JSON_HPP
