#ifndef COLEND_LOGGING_HPP
#define COLEND_LOGGING_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace colend {
namespace log {

// Shared "colend" logger, stderr with color. Created on first use.
std::shared_ptr<spdlog::logger> get();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
// Unknown names fall back to info.
void set_level(std::string_view level);

} // namespace log
} // namespace colend

#endif // COLEND_LOGGING_HPP
