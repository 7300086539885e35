#pragma once

#include "confidence.hpp"
#include "routing.hpp"

#include <map>
#include <stdexcept>
#include <string>

namespace invoicemap {

struct EngineConfig {
  ConfidenceSettings confidence;
  RoutingConfig routing;
  std::string logLevel = "warn";
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// forwarder id -> field history. The empty key holds history shared by all forwarders.
using HistoryTable = std::map<std::string, FieldHistory>;

// Keys not present keep their defaults. Throws ConfigError on invalid values.
EngineConfig parseEngineConfig(const std::string& document);
EngineConfig loadEngineConfig(const std::string& path);

// Throws ConfigError when the configuration is inconsistent.
void validateConfig(const EngineConfig& config);

HistoryTable parseHistoricalAccuracy(const std::string& document);
HistoryTable loadHistoricalAccuracy(const std::string& path);

// History for the forwarder, falling back to the shared entry; nullptr when none.
const FieldHistory* historyFor(const HistoryTable& table, const std::string& forwarderId);

} // namespace invoicemap
