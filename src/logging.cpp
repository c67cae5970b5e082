// =============================================================================
// logging.cpp - Shared spdlog Logger
// =============================================================================

#include "colend/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace colend {
namespace log {

namespace {
constexpr const char* LOGGER_NAME = "colend";
std::once_flag init_flag;
}

std::shared_ptr<spdlog::logger> get() {
    std::call_once(init_flag, [] {
        if (!spdlog::get(LOGGER_NAME)) {
            auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            logger->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(LOGGER_NAME);
}

void set_level(std::string_view level) {
    auto lvl = spdlog::level::from_str(std::string(level));
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    get()->set_level(lvl);
}

} // namespace log
} // namespace colend
