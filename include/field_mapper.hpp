#pragma once

#include "mapping_rule.hpp"
#include "ocr_payload.hpp"

#include <optional>
#include <string>
#include <vector>

namespace invoicemap {

enum class ExtractionMethod {
  None,
  Pretrained,
  Regex,
  Keyword,
  Position,
  Default
};

// Confidence of a value that came from a rule's default.
constexpr int kDefaultValueConfidence = 50;

constexpr const char* kNoMatchingRule = "no matching rule found";

// Result of mapping one standardized field of one document.
// isEmpty implies value is empty; isValid == false implies !isEmpty.
struct FieldMapping {
  std::string fieldName;
  std::optional<std::string> rawValue;
  std::optional<std::string> value;
  int sourcePage = 0;
  std::string sourceText;
  std::optional<BoundingBox> sourceRegion;
  int confidence = 0;
  ExtractionMethod method = ExtractionMethod::None;
  std::optional<std::string> ruleId;
  bool isValid = true;
  std::optional<std::string> validationError;
  bool isEmpty = true;
  std::optional<std::string> emptyReason;
  // Methods tried, in order, before the field resolved or gave up.
  std::vector<std::string> attempts;
};

struct ExtractionSummary {
  int totalFields = 0;
  int mappedFields = 0;
  int unmappedFields = 0;
  int validFields = 0;
  int invalidFields = 0;
  // Mean confidence of mapped fields, two decimals.
  double averageConfidence = 0.0;
};

struct MappingResult {
  std::vector<FieldMapping> fields;
  ExtractionSummary summary;
  // Ids of rules that could not be applied in this run.
  std::vector<std::string> skippedRules;
};

// Produces exactly one FieldMapping per catalog field, in catalog order.
// Pre-extracted service fields win first; then rules by priority (descending,
// ties by rule id), first non-empty candidate wins; then a rule default.
MappingResult mapFields(const OcrPayload& payload, const std::vector<MappingRule>& rules);

ExtractionSummary summarize(const std::vector<FieldMapping>& fields);

const FieldMapping* findMapping(const MappingResult& result, const std::string& fieldName);

const char* toString(ExtractionMethod method);

} // namespace invoicemap
