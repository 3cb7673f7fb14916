#include "deswitch/logger.hpp"

#include <utility>  // for move

namespace deswitch::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
    spdlog::debug("deswitch logger attached");
}

}  // namespace deswitch::logger
