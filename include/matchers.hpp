#pragma once

#include "mapping_rule.hpp"
#include "ocr_payload.hpp"

#include <optional>
#include <string>

namespace invoicemap {

// Method-intrinsic confidence of each text strategy (0..100).
constexpr int kRegexConfidence = 85;
constexpr int kKeywordConfidence = 70;
constexpr int kPositionConfidence = 75;

struct MatchCandidate {
  std::string value;
  // The OCR line the value was read from.
  std::string sourceText;
  int page = 1;
  std::optional<BoundingBox> position;
  int confidence = 0;
};

// Every matcher returns std::nullopt for input it does not match and throws
// RuleError only when the pattern itself cannot be applied.

std::optional<MatchCandidate> matchRegex(const RegexPattern& pattern, const OcrPayload& payload);

std::optional<MatchCandidate> matchKeyword(const KeywordPattern& pattern, const OcrPayload& payload);

std::optional<MatchCandidate> matchPosition(const PositionPattern& pattern, const OcrPayload& payload);

// Looks the name up among the service's pre-extracted fields; confidence is the
// service's 0..1 confidence scaled to 0..100.
std::optional<MatchCandidate> matchPretrained(const std::string& serviceFieldName, const OcrPayload& payload);

// Dispatches on the pattern alternative.
std::optional<MatchCandidate> applyPattern(const ExtractionPattern& pattern, const OcrPayload& payload);

} // namespace invoicemap
