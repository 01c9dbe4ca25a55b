#pragma once

#include <string>

namespace warmpath {

/// Configure the process-wide spdlog logger.
/// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
/// "critical", "off"). Unknown names fall back to "info".
void configureLogging(const std::string& level = "info");

} // namespace warmpath
