#include "logging.hpp"
#include <spdlog/spdlog.h>

namespace pi_blocks {
namespace logging {

void init(const std::string& level) {
    // from_str maps unknown names to off
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace logging
} // namespace pi_blocks
