#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace invoicemap {

enum class Preprocessor {
  None,
  Trim,
  Uppercase,
  Lowercase
};

// confidenceBoost is added to the method confidence of a match, capped at 100.

struct RegexPattern {
  std::string pattern;
  bool caseInsensitive = false;
  bool multiline = false;
  // '.' also matches line breaks.
  bool dotAll = false;
  // 0 = whole match.
  int group = 0;
  Preprocessor preprocess = Preprocessor::None;
  int confidenceBoost = 0;
};

// Labels are tried in order; the first one followed by a value wins.
struct KeywordPattern {
  std::vector<std::string> labels;
  Preprocessor preprocess = Preprocessor::None;
  int confidenceBoost = 0;
};

// "page:row[:col]", 1-based page and row. col selects a whitespace-separated token.
struct PositionPattern {
  std::string selector;
  int confidenceBoost = 0;
};

struct PretrainedFieldPattern {
  std::string name;
  int confidenceBoost = 0;
};

using ExtractionPattern = std::variant<RegexPattern, KeywordPattern, PositionPattern, PretrainedFieldPattern>;

struct MappingRule {
  std::string id;
  std::string fieldName;
  // Empty = universal rule.
  std::string forwarderId;
  ExtractionPattern pattern;
  int priority = 0;
  std::optional<std::string> validationPattern;
  std::optional<std::string> defaultValue;
  bool isActive = true;
};

// A rule definition that cannot be applied (bad regex, bad selector, missing keys).
class RuleError : public std::runtime_error {
public:
  explicit RuleError(const std::string& message) : std::runtime_error(message) {}
};

// Unknown names map to Preprocessor::None.
Preprocessor parsePreprocessor(const std::string& name);

std::string applyPreprocessor(Preprocessor preprocess, const std::string& value);

// Short method tag for a pattern: "regex", "keyword", "position" or "pretrained".
const char* methodName(const ExtractionPattern& pattern);

int confidenceBoost(const ExtractionPattern& pattern);

// Parses `rules:` from a YAML document. Entries that fail to parse are skipped with a warning.
std::vector<MappingRule> parseRuleCatalog(const std::string& document);

// Reads a rule catalog file. Throws std::runtime_error when the file cannot be read or parsed.
std::vector<MappingRule> loadRuleCatalog(const std::string& path);

// Active universal rules plus active rules scoped to forwarderId.
std::vector<MappingRule> rulesForForwarder(const std::vector<MappingRule>& catalog,
                                           const std::string& forwarderId);

// Priority descending, rule id ascending on equal priority.
void sortByPriority(std::vector<MappingRule>& rules);

} // namespace invoicemap
