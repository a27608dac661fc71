#include "chunkup/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace chunkup {

Result<void> configure_logging(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return Err<void>(make_error(ErrorCode::InvalidState, "Unknown log level: " + level));
    }

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(parsed);
    return Ok();
}

} // namespace chunkup
