#include "logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace invoicemap {

namespace {

constexpr const char* kLoggerName = "invoicemap";

std::mutex& loggerMutex() {
  static std::mutex m;
  return m;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
  auto existing = spdlog::get(kLoggerName);
  if (existing) return existing;

  std::lock_guard<std::mutex> lock(loggerMutex());
  existing = spdlog::get(kLoggerName);
  if (existing) return existing;
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_level(spdlog::level::warn);
  return created;
}

void initLogging(const std::string& level) {
  auto log = logger();
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"
  if (parsed == spdlog::level::off && level != "off") parsed = spdlog::level::info;
  log->set_level(parsed);
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
}

} // namespace invoicemap
