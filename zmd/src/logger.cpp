#include "zmd/logger.hpp"

#include <utility>  // for move

namespace zmd::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

}  // namespace zmd::logger
