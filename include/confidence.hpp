#pragma once

#include "field_mapper.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace invoicemap {

// Blend weights; must be non-negative and sum to 1.0.
struct ConfidenceWeights {
  double ocrConfidence = 0.30;
  double ruleMatch = 0.30;
  double formatValidation = 0.25;
  double historicalAccuracy = 0.15;
};

bool validateWeights(const ConfidenceWeights& weights);

struct ConfidenceSettings {
  ConfidenceWeights weights;
  // Stand-in for the historical factor when no history is known.
  double defaultHistoricalAccuracy = 75.0;
};

// Reviewer accuracy for one forwarder+field, as computed by the correction-learning job.
struct HistoricalAccuracy {
  double accuracy = 0.0;
  int sampleSize = 0;
};

// field name -> accuracy, for one forwarder.
using FieldHistory = std::map<std::string, HistoricalAccuracy>;

// All inputs are 0..100.
struct ConfidenceFactors {
  double ocrConfidence = 0.0;
  double ruleMatch = 0.0;
  double formatValidation = 0.0;
  double historicalAccuracy = 0.0;
};

struct FactorContribution {
  std::string factor;
  double weight;
  double rawScore;
  double contribution;
};

enum class ConfidenceLevel {
  High,
  Medium,
  Low
};

struct FieldConfidence {
  std::string fieldName;
  bool isEmpty = true;
  int score = 0;
  ConfidenceLevel level = ConfidenceLevel::Low;
  ConfidenceFactors factors;
  std::vector<FactorContribution> breakdown;
};

struct DocumentConfidence {
  // Mean of non-empty field scores, two decimals.
  double overallScore = 0.0;
  ConfidenceLevel level = ConfidenceLevel::Low;
  std::vector<FieldConfidence> fields;
  int highCount = 0;
  int mediumCount = 0;
  int lowCount = 0;
  int minScore = 0;
  int maxScore = 0;
};

// high >= 90, medium >= 70, else low.
ConfidenceLevel levelFor(double score);

// Mixes the reported accuracy with the default by sample weight min(1, samples/100).
double adjustedHistoricalAccuracy(const HistoricalAccuracy& history, double defaultAccuracy);

// Derives the four factors for a non-empty mapping. ocrEngineConfidence is the
// payload's 0..1 document confidence, if any.
ConfidenceFactors gatherFactors(const FieldMapping& mapping,
                                std::optional<double> ocrEngineConfidence,
                                const HistoricalAccuracy* history,
                                const ConfidenceSettings& settings);

// Weighted sum rounded to the nearest integer. Throws std::invalid_argument
// when a factor lies outside 0..100.
int blendScore(const ConfidenceFactors& factors, const ConfidenceWeights& weights,
               std::vector<FactorContribution>* breakdown = nullptr);

FieldConfidence scoreField(const FieldMapping& mapping,
                           std::optional<double> ocrEngineConfidence,
                           const HistoricalAccuracy* history,
                           const ConfidenceSettings& settings);

// Arithmetic mean over non-empty fields, rounded to two decimals; 0 when all are empty.
double overallConfidence(const std::vector<FieldConfidence>& fields);

DocumentConfidence scoreDocument(const std::vector<FieldMapping>& fields,
                                 std::optional<double> ocrEngineConfidence,
                                 const FieldHistory* history,
                                 const ConfidenceSettings& settings);

const char* toString(ConfidenceLevel level);

} // namespace invoicemap
