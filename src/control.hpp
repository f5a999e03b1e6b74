#ifndef CONTROL_HPP
#define CONTROL_HPP

#include "zmd/transfer_manager.hpp"
#include "zmd/transfer_types.hpp"

#include <string>       // for string
#include <string_view>  // for string_view

namespace service {

/// @brief Answers control requests, one JSON object per line.
///
/// A request names its operation in "op": start, get, list, pause, resume,
/// stop, delete, log or gist. Every request yields exactly one JSON response.
class ControlChannel final {
 public:
    /// @param log_defaults Base of a partial "log_config" in start requests.
    ControlChannel(zmd::transfer::TransferManager& manager, zmd::transfer::LogConfig log_defaults) noexcept;

    [[nodiscard]] auto handle_request(std::string_view request_line) noexcept -> std::string;

 private:
    zmd::transfer::TransferManager& m_manager;
    zmd::transfer::LogConfig m_log_defaults;
};

}  // namespace service

#endif  // CONTROL_HPP
