#include <catch2/catch_all.hpp>

#include "engine_config.hpp"

#include <string>

using namespace invoicemap;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

TEST_CASE("parseEngineConfig keeps defaults for missing keys", "[config]") {
  EngineConfig config = parseEngineConfig("");
  REQUIRE_THAT(config.confidence.weights.ocrConfidence, WithinAbs(0.30, 1e-9));
  REQUIRE_THAT(config.confidence.defaultHistoricalAccuracy, WithinAbs(75.0, 1e-9));
  REQUIRE_THAT(config.routing.thresholds.autoApprove, WithinAbs(95.0, 1e-9));
  REQUIRE(config.routing.criticalFields.size() == 6);
  REQUIRE(config.logLevel == "warn");
}

TEST_CASE("parseEngineConfig reads every section", "[config]") {
  const char* yaml = R"yaml(
confidence:
  weights:
    ocrConfidence: 0.4
    ruleMatch: 0.3
    formatValidation: 0.2
    historicalAccuracy: 0.1
  defaultHistoricalAccuracy: 60
routing:
  thresholds:
    autoApprove: 97
    quickReview: 85
    manualCriticalCount: 2
  priority:
    fullReviewBase: 55
    ageBonusCap: 10
  criticalFields: [invoice_number, total_amount]
logging:
  level: debug
)yaml";

  EngineConfig config = parseEngineConfig(yaml);
  REQUIRE_THAT(config.confidence.weights.ocrConfidence, WithinAbs(0.4, 1e-9));
  REQUIRE_THAT(config.confidence.weights.historicalAccuracy, WithinAbs(0.1, 1e-9));
  REQUIRE_THAT(config.confidence.defaultHistoricalAccuracy, WithinAbs(60.0, 1e-9));
  REQUIRE_THAT(config.routing.thresholds.autoApprove, WithinAbs(97.0, 1e-9));
  REQUIRE(config.routing.thresholds.manualCriticalCount == 2);
  REQUIRE(config.routing.priority.fullReviewBase == 55);
  REQUIRE(config.routing.priority.ageBonusCap == 10);
  REQUIRE(config.routing.priority.quickReviewBase == 30);
  REQUIRE(config.routing.criticalFields == std::vector<std::string>{"invoice_number", "total_amount"});
  REQUIRE(config.logLevel == "debug");
}

TEST_CASE("parseEngineConfig rejects inconsistent settings", "[config]") {
  REQUIRE_THROWS_WITH(parseEngineConfig("confidence: {weights: {ocrConfidence: 0.9}}"),
                      ContainsSubstring("sum to 1.0"));
  REQUIRE_THROWS_AS(parseEngineConfig("routing: {thresholds: {autoApprove: 70, quickReview: 80}}"), ConfigError);
  REQUIRE_THROWS_AS(parseEngineConfig("routing: {thresholds: {manualCriticalCount: 0}}"), ConfigError);
  REQUIRE_THROWS_WITH(parseEngineConfig("routing: {thresholds: {autoApprove: high}}"),
                      ContainsSubstring("autoApprove"));
  REQUIRE_THROWS_AS(parseEngineConfig("[1, 2"), ConfigError);
  REQUIRE_THROWS_AS(loadEngineConfig("/nonexistent/config.yaml"), ConfigError);
}

TEST_CASE("historical accuracy is looked up per forwarder", "[config]") {
  const char* yaml = R"yaml(
"*":
  invoice_number: {accuracy: 80, samples: 500}
dhl:
  invoice_number: {accuracy: 98, samples: 40}
  total_amount: {accuracy: 91, samples: 120}
)yaml";

  HistoryTable table = parseHistoricalAccuracy(yaml);
  REQUIRE(table.size() == 2);

  const FieldHistory* dhl = historyFor(table, "dhl");
  REQUIRE(dhl != nullptr);
  REQUIRE(dhl->at("invoice_number").sampleSize == 40);
  REQUIRE_THAT(dhl->at("total_amount").accuracy, WithinAbs(91.0, 1e-9));

  const FieldHistory* shared = historyFor(table, "ups");
  REQUIRE(shared != nullptr);
  REQUIRE_THAT(shared->at("invoice_number").accuracy, WithinAbs(80.0, 1e-9));

  REQUIRE(historyFor(HistoryTable{}, "dhl") == nullptr);
  REQUIRE_THROWS_AS(parseHistoricalAccuracy("dhl: {invoice_number: {accuracy: 140}}"), ConfigError);
}
