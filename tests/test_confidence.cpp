#include <catch2/catch_all.hpp>

#include "confidence.hpp"

#include <stdexcept>
#include <string>

using namespace invoicemap;
using Catch::Matchers::WithinAbs;

namespace {

FieldMapping mapped(const std::string& name, int confidence,
                    ExtractionMethod method = ExtractionMethod::Regex, bool valid = true) {
  FieldMapping m;
  m.fieldName = name;
  m.value = "x";
  m.rawValue = "x";
  m.isEmpty = false;
  m.confidence = confidence;
  m.method = method;
  m.isValid = valid;
  return m;
}

FieldMapping empty(const std::string& name) {
  FieldMapping m;
  m.fieldName = name;
  m.emptyReason = kNoMatchingRule;
  return m;
}

} // namespace

TEST_CASE("validateWeights requires non-negative weights summing to one", "[confidence]") {
  REQUIRE(validateWeights(ConfidenceWeights{}));
  REQUIRE(validateWeights(ConfidenceWeights{0.25, 0.25, 0.25, 0.2495}));
  REQUIRE_FALSE(validateWeights(ConfidenceWeights{0.5, 0.5, 0.5, 0.0}));
  REQUIRE_FALSE(validateWeights(ConfidenceWeights{1.2, -0.2, 0.0, 0.0}));
}

TEST_CASE("levelFor bands scores", "[confidence]") {
  REQUIRE(levelFor(90.0) == ConfidenceLevel::High);
  REQUIRE(levelFor(89.99) == ConfidenceLevel::Medium);
  REQUIRE(levelFor(70.0) == ConfidenceLevel::Medium);
  REQUIRE(levelFor(69.99) == ConfidenceLevel::Low);
  REQUIRE(std::string(toString(ConfidenceLevel::Medium)) == "medium");
}

TEST_CASE("historical accuracy is weighted by sample size", "[confidence]") {
  REQUIRE_THAT(adjustedHistoricalAccuracy(HistoricalAccuracy{95.0, 50}, 75.0), WithinAbs(85.0, 1e-9));
  REQUIRE_THAT(adjustedHistoricalAccuracy(HistoricalAccuracy{95.0, 400}, 75.0), WithinAbs(95.0, 1e-9));
  REQUIRE_THAT(adjustedHistoricalAccuracy(HistoricalAccuracy{10.0, 0}, 75.0), WithinAbs(75.0, 1e-9));
}

TEST_CASE("gatherFactors derives the four factors", "[confidence]") {
  ConfidenceSettings settings;

  ConfidenceFactors regex = gatherFactors(mapped("invoice_number", 85), 0.9, nullptr, settings);
  REQUIRE_THAT(regex.ocrConfidence, WithinAbs(90.0, 1e-9));
  REQUIRE_THAT(regex.ruleMatch, WithinAbs(85.0, 1e-9));
  REQUIRE_THAT(regex.formatValidation, WithinAbs(100.0, 1e-9));
  REQUIRE_THAT(regex.historicalAccuracy, WithinAbs(75.0, 1e-9));

  ConfidenceFactors service = gatherFactors(mapped("invoice_number", 97, ExtractionMethod::Pretrained),
                                            0.5, nullptr, settings);
  REQUIRE_THAT(service.ocrConfidence, WithinAbs(97.0, 1e-9));

  ConfidenceFactors invalid = gatherFactors(mapped("currency", 85, ExtractionMethod::Regex, false),
                                            std::nullopt, nullptr, settings);
  REQUIRE_THAT(invalid.ocrConfidence, WithinAbs(85.0, 1e-9));
  REQUIRE_THAT(invalid.formatValidation, WithinAbs(40.0, 1e-9));
}

TEST_CASE("blendScore applies the weights", "[confidence]") {
  ConfidenceFactors factors{85.0, 85.0, 100.0, 75.0};
  std::vector<FactorContribution> breakdown;
  // 25.5 + 25.5 + 25 + 11.25
  REQUIRE(blendScore(factors, ConfidenceWeights{}, &breakdown) == 87);
  REQUIRE(breakdown.size() == 4);
  REQUIRE(breakdown[0].factor == "ocrConfidence");
  REQUIRE_THAT(breakdown[3].contribution, WithinAbs(11.25, 1e-9));
}

TEST_CASE("blendScore rejects factors outside 0..100", "[confidence]") {
  REQUIRE_THROWS_AS(blendScore(ConfidenceFactors{101.0, 50.0, 50.0, 50.0}, ConfidenceWeights{}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(blendScore(ConfidenceFactors{50.0, -1.0, 50.0, 50.0}, ConfidenceWeights{}),
                    std::invalid_argument);
}

TEST_CASE("scoreDocument excludes empty fields from the average", "[confidence]") {
  FieldHistory history;
  history["invoice_number"] = HistoricalAccuracy{100.0, 100};

  std::vector<FieldMapping> fields = {mapped("invoice_number", 100), empty("due_date"), empty("currency")};
  DocumentConfidence doc = scoreDocument(fields, std::nullopt, &history, ConfidenceSettings{});

  REQUIRE(doc.fields.size() == 3);
  REQUIRE(doc.fields[0].score == 100);
  REQUIRE(doc.fields[1].isEmpty);
  REQUIRE(doc.fields[1].score == 0);
  REQUIRE(doc.overallScore == Catch::Approx(100.0));
  REQUIRE(doc.level == ConfidenceLevel::High);
  REQUIRE(doc.highCount == 1);
  REQUIRE(doc.mediumCount + doc.lowCount == 0);
}

TEST_CASE("scoreDocument reports distribution and bounds", "[confidence]") {
  std::vector<FieldMapping> fields = {
    mapped("invoice_number", 85),
    mapped("currency", 85, ExtractionMethod::Regex, false),
    mapped("forwarder_name", 50, ExtractionMethod::Default),
  };
  DocumentConfidence doc = scoreDocument(fields, std::nullopt, nullptr, ConfidenceSettings{});

  // 87; 25.5 + 25.5 + 10 + 11.25 = 72.25; 15 + 15 + 25 + 11.25 = 66.25
  REQUIRE(doc.fields[0].score == 87);
  REQUIRE(doc.fields[1].score == 72);
  REQUIRE(doc.fields[2].score == 66);
  REQUIRE(doc.maxScore == 87);
  REQUIRE(doc.minScore == 66);
  REQUIRE(doc.mediumCount == 2);
  REQUIRE(doc.lowCount == 1);
  REQUIRE(doc.overallScore == Catch::Approx(75.0));
}

TEST_CASE("a document with no extracted fields scores zero", "[confidence]") {
  DocumentConfidence doc = scoreDocument({empty("invoice_number")}, 0.99, nullptr, ConfidenceSettings{});
  REQUIRE(doc.overallScore == 0.0);
  REQUIRE(doc.level == ConfidenceLevel::Low);
}
