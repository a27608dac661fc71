#pragma once

#include "chunkup/core/result.hpp"

#include <string>

namespace chunkup {

/**
 * @brief Apply the process-wide spdlog pattern and level
 *
 * Accepts the spdlog level names (trace, debug, info, warn, error,
 * critical, off). Unknown names are rejected so a typo in a config file
 * does not silently turn logging off.
 */
Result<void> configure_logging(const std::string& level);

} // namespace chunkup
