#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace invoicemap {

// Returns the library's named logger, creating a stderr logger on first use.
std::shared_ptr<spdlog::logger> logger();

// Configures the named logger with a colored stderr sink at the given level
// ("trace", "debug", "info", "warn", "error", "off"). Unknown names mean "info".
void initLogging(const std::string& level);

} // namespace invoicemap
