#include "engine_config.hpp"

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace invoicemap {

namespace {

std::string readFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

YAML::Node loadDocument(const std::string& document) {
  try {
    return YAML::Load(document);
  } catch (const YAML::Exception& ex) {
    throw ConfigError(std::string("malformed configuration: ") + ex.what());
  }
}

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
  if (!node || !node[key]) return;
  try {
    out = node[key].as<T>();
  } catch (const YAML::Exception& ex) {
    throw ConfigError(std::string("invalid value for '") + key + "': " + ex.what());
  }
}

} // namespace

EngineConfig parseEngineConfig(const std::string& document) {
  EngineConfig config;
  const YAML::Node root = loadDocument(document);
  if (!root || root.IsNull()) return config;
  if (!root.IsMap()) throw ConfigError("configuration must be a map");

  if (const YAML::Node confidence = root["confidence"]) {
    const YAML::Node weights = confidence["weights"];
    read(weights, "ocrConfidence", config.confidence.weights.ocrConfidence);
    read(weights, "ruleMatch", config.confidence.weights.ruleMatch);
    read(weights, "formatValidation", config.confidence.weights.formatValidation);
    read(weights, "historicalAccuracy", config.confidence.weights.historicalAccuracy);
    read(confidence, "defaultHistoricalAccuracy", config.confidence.defaultHistoricalAccuracy);
  }

  if (const YAML::Node routing = root["routing"]) {
    const YAML::Node thresholds = routing["thresholds"];
    read(thresholds, "autoApprove", config.routing.thresholds.autoApprove);
    read(thresholds, "quickReview", config.routing.thresholds.quickReview);
    read(thresholds, "manualCriticalCount", config.routing.thresholds.manualCriticalCount);

    const YAML::Node priority = routing["priority"];
    read(priority, "quickReviewBase", config.routing.priority.quickReviewBase);
    read(priority, "fullReviewBase", config.routing.priority.fullReviewBase);
    read(priority, "manualRequiredBase", config.routing.priority.manualRequiredBase);
    read(priority, "agePointsPerDay", config.routing.priority.agePointsPerDay);
    read(priority, "ageBonusCap", config.routing.priority.ageBonusCap);
    read(priority, "perCriticalField", config.routing.priority.perCriticalField);

    read(routing, "criticalFields", config.routing.criticalFields);
  }

  if (const YAML::Node logging = root["logging"]) {
    read(logging, "level", config.logLevel);
  }

  validateConfig(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  return parseEngineConfig(readFile(path));
}

void validateConfig(const EngineConfig& config) {
  if (!validateWeights(config.confidence.weights)) {
    throw ConfigError("confidence weights must be non-negative and sum to 1.0");
  }
  double history = config.confidence.defaultHistoricalAccuracy;
  if (history < 0.0 || history > 100.0) {
    throw ConfigError("defaultHistoricalAccuracy must be within 0..100");
  }
  const RoutingThresholds& t = config.routing.thresholds;
  if (t.quickReview < 0.0 || t.autoApprove > 100.0 || t.quickReview > t.autoApprove) {
    throw ConfigError("routing thresholds must satisfy 0 <= quickReview <= autoApprove <= 100");
  }
  if (t.manualCriticalCount < 1) {
    throw ConfigError("manualCriticalCount must be at least 1");
  }
  const PriorityPolicy& p = config.routing.priority;
  if (p.agePointsPerDay < 0 || p.ageBonusCap < 0 || p.perCriticalField < 0) {
    throw ConfigError("priority bonuses must be non-negative");
  }
}

HistoryTable parseHistoricalAccuracy(const std::string& document) {
  HistoryTable table;
  const YAML::Node root = loadDocument(document);
  if (!root || root.IsNull()) return table;
  if (!root.IsMap()) throw ConfigError("historical accuracy must be a map of forwarders");

  for (const auto& forwarder : root) {
    const std::string forwarderId = forwarder.first.as<std::string>();
    const std::string key = forwarderId == "*" ? "" : forwarderId;
    if (!forwarder.second.IsMap()) throw ConfigError("history for '" + forwarderId + "' must be a map");
    for (const auto& field : forwarder.second) {
      HistoricalAccuracy h;
      read(field.second, "accuracy", h.accuracy);
      read(field.second, "samples", h.sampleSize);
      if (h.accuracy < 0.0 || h.accuracy > 100.0 || h.sampleSize < 0) {
        throw ConfigError("history for " + forwarderId + "/" + field.first.as<std::string>() + " out of range");
      }
      table[key][field.first.as<std::string>()] = h;
    }
  }
  return table;
}

HistoryTable loadHistoricalAccuracy(const std::string& path) {
  return parseHistoricalAccuracy(readFile(path));
}

const FieldHistory* historyFor(const HistoryTable& table, const std::string& forwarderId) {
  auto it = table.find(forwarderId);
  if (it != table.end()) return &it->second;
  it = table.find("");
  return it == table.end() ? nullptr : &it->second;
}

} // namespace invoicemap
