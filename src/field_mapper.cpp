#include "field_mapper.hpp"

#include "field_catalog.hpp"
#include "logging.hpp"
#include "matchers.hpp"
#include "normalize.hpp"

#include <cmath>
#include <map>

namespace invoicemap {

namespace {

ExtractionMethod methodOf(const ExtractionPattern& pattern) {
  struct Visitor {
    ExtractionMethod operator()(const RegexPattern&) const { return ExtractionMethod::Regex; }
    ExtractionMethod operator()(const KeywordPattern&) const { return ExtractionMethod::Keyword; }
    ExtractionMethod operator()(const PositionPattern&) const { return ExtractionMethod::Position; }
    ExtractionMethod operator()(const PretrainedFieldPattern&) const { return ExtractionMethod::Pretrained; }
  };
  return std::visit(Visitor{}, pattern);
}

void applyValue(FieldMapping& mapping, const std::string& raw, const std::string& validationPattern) {
  mapping.rawValue = raw;
  mapping.value = normalizeValue(mapping.fieldName, raw);
  mapping.isEmpty = false;
  mapping.emptyReason.reset();

  ValidationResult check = validateValue(*mapping.value, validationPattern);
  mapping.isValid = check.isValid;
  mapping.validationError = check.error;
}

void applyCandidate(FieldMapping& mapping, const MatchCandidate& candidate, const std::string& validationPattern) {
  mapping.sourcePage = candidate.page;
  mapping.sourceText = candidate.sourceText;
  mapping.sourceRegion = candidate.position;
  mapping.confidence = candidate.confidence;
  applyValue(mapping, candidate.value, validationPattern);
}

std::string validationFor(const MappingRule* rule, const StandardField& field) {
  if (rule && rule->validationPattern && !rule->validationPattern->empty()) return *rule->validationPattern;
  return field.validationPattern;
}

FieldMapping resolveField(const StandardField& field,
                          const std::vector<const MappingRule*>& rules,
                          const OcrPayload& payload,
                          std::vector<std::string>& skippedRules) {
  FieldMapping mapping;
  mapping.fieldName = field.name;

  if (auto serviceName = pretrainedFieldFor(field.name)) {
    mapping.attempts.push_back("pretrained");
    if (auto candidate = matchPretrained(*serviceName, payload)) {
      mapping.method = ExtractionMethod::Pretrained;
      applyCandidate(mapping, *candidate, validationFor(nullptr, field));
      return mapping;
    }
  }

  for (const MappingRule* rule : rules) {
    mapping.attempts.push_back(methodName(rule->pattern));
    try {
      auto candidate = applyPattern(rule->pattern, payload);
      if (!candidate) continue;
      mapping.method = methodOf(rule->pattern);
      mapping.ruleId = rule->id;
      applyCandidate(mapping, *candidate, validationFor(rule, field));
      logger()->debug("{}: rule {} ({}) matched '{}'", field.name, rule->id,
                      methodName(rule->pattern), *mapping.value);
      return mapping;
    } catch (const RuleError& ex) {
      logger()->warn("rule {} for {} skipped: {}", rule->id, field.name, ex.what());
      skippedRules.push_back(rule->id);
    }
  }

  for (const MappingRule* rule : rules) {
    if (!rule->defaultValue || normalizeValue(field.name, *rule->defaultValue).empty()) continue;
    mapping.attempts.push_back("default");
    mapping.method = ExtractionMethod::Default;
    mapping.ruleId = rule->id;
    mapping.confidence = kDefaultValueConfidence;
    applyValue(mapping, *rule->defaultValue, validationFor(rule, field));
    return mapping;
  }

  mapping.emptyReason = kNoMatchingRule;
  return mapping;
}

} // namespace

MappingResult mapFields(const OcrPayload& payload, const std::vector<MappingRule>& rules) {
  std::vector<MappingRule> sorted = rules;
  sortByPriority(sorted);

  std::map<std::string, std::vector<const MappingRule*>> rulesByField;
  for (const auto& rule : sorted) {
    if (!rule.isActive) continue;
    if (!findField(rule.fieldName)) {
      logger()->debug("rule {} targets unknown field '{}'", rule.id, rule.fieldName);
      continue;
    }
    rulesByField[rule.fieldName].push_back(&rule);
  }

  MappingResult result;
  static const std::vector<const MappingRule*> noRules;
  for (const auto& field : standardFields()) {
    auto it = rulesByField.find(field.name);
    const auto& fieldRules = it == rulesByField.end() ? noRules : it->second;
    result.fields.push_back(resolveField(field, fieldRules, payload, result.skippedRules));
  }

  result.summary = summarize(result.fields);
  logger()->debug("mapped {}/{} fields, {} rule(s) skipped", result.summary.mappedFields,
                  result.summary.totalFields, result.skippedRules.size());
  return result;
}

ExtractionSummary summarize(const std::vector<FieldMapping>& fields) {
  ExtractionSummary summary;
  summary.totalFields = static_cast<int>(fields.size());
  long confidenceSum = 0;
  for (const auto& f : fields) {
    if (f.isEmpty) {
      summary.unmappedFields++;
      continue;
    }
    summary.mappedFields++;
    confidenceSum += f.confidence;
    if (f.isValid) summary.validFields++;
    else summary.invalidFields++;
  }
  if (summary.mappedFields > 0) {
    double avg = static_cast<double>(confidenceSum) / summary.mappedFields;
    summary.averageConfidence = std::round(avg * 100.0) / 100.0;
  }
  return summary;
}

const FieldMapping* findMapping(const MappingResult& result, const std::string& fieldName) {
  for (const auto& f : result.fields) {
    if (f.fieldName == fieldName) return &f;
  }
  return nullptr;
}

const char* toString(ExtractionMethod method) {
  switch (method) {
    case ExtractionMethod::None: return "none";
    case ExtractionMethod::Pretrained: return "pretrained";
    case ExtractionMethod::Regex: return "regex";
    case ExtractionMethod::Keyword: return "keyword";
    case ExtractionMethod::Position: return "position";
    case ExtractionMethod::Default: return "default";
  }
  return "unknown";
}

} // namespace invoicemap
