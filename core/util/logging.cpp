#include "util/logging.hpp"

#include <spdlog/spdlog.h>

namespace warmpath {

void configureLogging(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace warmpath
