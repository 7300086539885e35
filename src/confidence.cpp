#include "confidence.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace invoicemap {

namespace {

constexpr int kInvalidFormatScore = 40;

void checkRange(double value, const char* factor) {
  if (value < 0.0 || value > 100.0 || std::isnan(value)) {
    throw std::invalid_argument(std::string("confidence factor '") + factor + "' out of range 0..100");
  }
}

} // namespace

bool validateWeights(const ConfidenceWeights& w) {
  if (w.ocrConfidence < 0 || w.ruleMatch < 0 || w.formatValidation < 0 || w.historicalAccuracy < 0) {
    return false;
  }
  double sum = w.ocrConfidence + w.ruleMatch + w.formatValidation + w.historicalAccuracy;
  return std::abs(sum - 1.0) <= 0.001;
}

ConfidenceLevel levelFor(double score) {
  if (score >= 90.0) return ConfidenceLevel::High;
  if (score >= 70.0) return ConfidenceLevel::Medium;
  return ConfidenceLevel::Low;
}

double adjustedHistoricalAccuracy(const HistoricalAccuracy& history, double defaultAccuracy) {
  double sampleWeight = std::min(1.0, std::max(0, history.sampleSize) / 100.0);
  return history.accuracy * sampleWeight + defaultAccuracy * (1.0 - sampleWeight);
}

ConfidenceFactors gatherFactors(const FieldMapping& mapping,
                                std::optional<double> ocrEngineConfidence,
                                const HistoricalAccuracy* history,
                                const ConfidenceSettings& settings) {
  ConfidenceFactors factors;
  if (mapping.isEmpty) return factors;

  // Method confidence stands in for rule-match strength.
  factors.ruleMatch = mapping.confidence;

  if (mapping.method == ExtractionMethod::Pretrained) {
    factors.ocrConfidence = mapping.confidence;
  } else if (ocrEngineConfidence) {
    factors.ocrConfidence = *ocrEngineConfidence * 100.0;
  } else {
    factors.ocrConfidence = mapping.confidence;
  }

  factors.formatValidation = mapping.isValid ? 100.0 : kInvalidFormatScore;
  factors.historicalAccuracy = history
    ? adjustedHistoricalAccuracy(*history, settings.defaultHistoricalAccuracy)
    : settings.defaultHistoricalAccuracy;
  return factors;
}

int blendScore(const ConfidenceFactors& factors, const ConfidenceWeights& weights,
               std::vector<FactorContribution>* breakdown) {
  const FactorContribution parts[] = {
    {"ocrConfidence", weights.ocrConfidence, factors.ocrConfidence, 0.0},
    {"ruleMatch", weights.ruleMatch, factors.ruleMatch, 0.0},
    {"formatValidation", weights.formatValidation, factors.formatValidation, 0.0},
    {"historicalAccuracy", weights.historicalAccuracy, factors.historicalAccuracy, 0.0},
  };

  double total = 0.0;
  for (auto part : parts) {
    checkRange(part.rawScore, part.factor.c_str());
    part.contribution = part.rawScore * part.weight;
    total += part.contribution;
    if (breakdown) breakdown->push_back(part);
  }
  return static_cast<int>(std::lround(total));
}

FieldConfidence scoreField(const FieldMapping& mapping,
                           std::optional<double> ocrEngineConfidence,
                           const HistoricalAccuracy* history,
                           const ConfidenceSettings& settings) {
  FieldConfidence result;
  result.fieldName = mapping.fieldName;
  result.isEmpty = mapping.isEmpty;
  if (mapping.isEmpty) return result;

  result.factors = gatherFactors(mapping, ocrEngineConfidence, history, settings);
  result.score = blendScore(result.factors, settings.weights, &result.breakdown);
  result.level = levelFor(result.score);
  return result;
}

double overallConfidence(const std::vector<FieldConfidence>& fields) {
  double sum = 0.0;
  int count = 0;
  for (const auto& f : fields) {
    if (f.isEmpty) continue;
    sum += f.score;
    count++;
  }
  if (count == 0) return 0.0;
  return std::round(sum / count * 100.0) / 100.0;
}

DocumentConfidence scoreDocument(const std::vector<FieldMapping>& fields,
                                 std::optional<double> ocrEngineConfidence,
                                 const FieldHistory* history,
                                 const ConfidenceSettings& settings) {
  DocumentConfidence doc;
  bool first = true;
  for (const auto& mapping : fields) {
    const HistoricalAccuracy* fieldHistory = nullptr;
    if (history) {
      auto it = history->find(mapping.fieldName);
      if (it != history->end()) fieldHistory = &it->second;
    }
    FieldConfidence fc = scoreField(mapping, ocrEngineConfidence, fieldHistory, settings);
    if (!fc.isEmpty) {
      switch (fc.level) {
        case ConfidenceLevel::High: doc.highCount++; break;
        case ConfidenceLevel::Medium: doc.mediumCount++; break;
        case ConfidenceLevel::Low: doc.lowCount++; break;
      }
      doc.minScore = first ? fc.score : std::min(doc.minScore, fc.score);
      doc.maxScore = first ? fc.score : std::max(doc.maxScore, fc.score);
      first = false;
    }
    doc.fields.push_back(std::move(fc));
  }
  doc.overallScore = overallConfidence(doc.fields);
  doc.level = levelFor(doc.overallScore);
  return doc;
}

const char* toString(ConfidenceLevel level) {
  switch (level) {
    case ConfidenceLevel::High: return "high";
    case ConfidenceLevel::Medium: return "medium";
    case ConfidenceLevel::Low: return "low";
  }
  return "unknown";
}

} // namespace invoicemap
