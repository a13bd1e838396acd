#pragma once

#include <string>

namespace pi_blocks {
namespace logging {

/**
 * @brief Configure the default spdlog logger
 *
 * Unknown level names fall back to info.
 * @param level Level name (trace, debug, info, warn, error, critical, off)
 */
void init(const std::string& level);

} // namespace logging
} // namespace pi_blocks
