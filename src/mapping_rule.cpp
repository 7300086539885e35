#include "mapping_rule.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace invoicemap {

namespace {

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string requireString(const YAML::Node& node, const char* key) {
  if (!node[key]) throw RuleError(std::string("missing '") + key + "'");
  return node[key].as<std::string>();
}

int parseBoost(const YAML::Node& node) {
  if (!node["confidenceBoost"]) return 0;
  int boost = node["confidenceBoost"].as<int>();
  if (boost < 0 || boost > 100) throw RuleError("confidenceBoost must be within 0..100");
  return boost;
}

ExtractionPattern parsePattern(const YAML::Node& node) {
  if (!node || !node.IsMap()) throw RuleError("missing 'pattern' map");
  const std::string method = node["method"] ? node["method"].as<std::string>() : "regex";

  if (method == "regex") {
    RegexPattern p;
    p.pattern = requireString(node, "pattern");
    const std::string flags = node["flags"] ? node["flags"].as<std::string>() : "";
    p.caseInsensitive = flags.find('i') != std::string::npos;
    p.multiline = flags.find('m') != std::string::npos;
    p.dotAll = flags.find('s') != std::string::npos;
    p.group = node["group"] ? node["group"].as<int>() : 0;
    if (node["preprocess"]) p.preprocess = parsePreprocessor(node["preprocess"].as<std::string>());
    p.confidenceBoost = parseBoost(node);
    return p;
  }
  if (method == "keyword") {
    KeywordPattern p;
    if (node["keyword"] && !trim(node["keyword"].as<std::string>()).empty()) {
      p.labels.push_back(node["keyword"].as<std::string>());
    }
    if (node["keywords"]) {
      if (!node["keywords"].IsSequence()) throw RuleError("'keywords' must be a list");
      for (const auto& keyword : node["keywords"]) {
        std::string label = keyword.as<std::string>();
        if (!trim(label).empty()) p.labels.push_back(label);
      }
    }
    if (p.labels.empty()) throw RuleError("missing 'keyword'");
    if (node["preprocess"]) p.preprocess = parsePreprocessor(node["preprocess"].as<std::string>());
    p.confidenceBoost = parseBoost(node);
    return p;
  }
  if (method == "position") {
    return PositionPattern{requireString(node, "selector"), parseBoost(node)};
  }
  if (method == "pretrained" || method == "azure_field") {
    const char* key = node["azureFieldName"] && !node["name"] ? "azureFieldName" : "name";
    return PretrainedFieldPattern{requireString(node, key), parseBoost(node)};
  }
  throw RuleError("unknown method '" + method + "'");
}

MappingRule parseRule(const YAML::Node& node) {
  MappingRule rule;
  rule.id = requireString(node, "id");
  rule.fieldName = requireString(node, "field");
  if (node["forwarder"] && !node["forwarder"].IsNull()) rule.forwarderId = node["forwarder"].as<std::string>();
  rule.pattern = parsePattern(node["pattern"]);
  if (node["priority"]) rule.priority = node["priority"].as<int>();
  if (node["active"]) rule.isActive = node["active"].as<bool>();
  if (node["validation"]) rule.validationPattern = node["validation"].as<std::string>();
  if (node["default"]) rule.defaultValue = node["default"].as<std::string>();
  return rule;
}

} // namespace

Preprocessor parsePreprocessor(const std::string& name) {
  if (name == "trim") return Preprocessor::Trim;
  if (name == "uppercase") return Preprocessor::Uppercase;
  if (name == "lowercase") return Preprocessor::Lowercase;
  return Preprocessor::None;
}

std::string applyPreprocessor(Preprocessor preprocess, const std::string& value) {
  std::string out = value;
  switch (preprocess) {
    case Preprocessor::None:
      break;
    case Preprocessor::Trim:
      out = trim(out);
      break;
    case Preprocessor::Uppercase:
      std::transform(out.begin(), out.end(), out.begin(),
                     [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
      break;
    case Preprocessor::Lowercase:
      std::transform(out.begin(), out.end(), out.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      break;
  }
  return out;
}

const char* methodName(const ExtractionPattern& pattern) {
  struct Visitor {
    const char* operator()(const RegexPattern&) const { return "regex"; }
    const char* operator()(const KeywordPattern&) const { return "keyword"; }
    const char* operator()(const PositionPattern&) const { return "position"; }
    const char* operator()(const PretrainedFieldPattern&) const { return "pretrained"; }
  };
  return std::visit(Visitor{}, pattern);
}

int confidenceBoost(const ExtractionPattern& pattern) {
  return std::visit([](const auto& p) { return p.confidenceBoost; }, pattern);
}

std::vector<MappingRule> parseRuleCatalog(const std::string& document) {
  YAML::Node root;
  try {
    root = YAML::Load(document);
  } catch (const YAML::Exception& ex) {
    throw std::runtime_error(std::string("malformed rule catalog: ") + ex.what());
  }

  const YAML::Node list = root.IsMap() ? root["rules"] : root;
  std::vector<MappingRule> rules;
  if (!list) return rules;
  if (!list.IsSequence()) throw std::runtime_error("rule catalog: 'rules' must be a sequence");

  size_t index = 0;
  for (const auto& node : list) {
    try {
      rules.push_back(parseRule(node));
    } catch (const RuleError& ex) {
      logger()->warn("rule #{} skipped: {}", index, ex.what());
    } catch (const YAML::Exception& ex) {
      logger()->warn("rule #{} skipped: {}", index, ex.what());
    }
    index++;
  }
  return rules;
}

std::vector<MappingRule> loadRuleCatalog(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open rule catalog: " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseRuleCatalog(buffer.str());
}

std::vector<MappingRule> rulesForForwarder(const std::vector<MappingRule>& catalog,
                                           const std::string& forwarderId) {
  std::vector<MappingRule> out;
  for (const auto& rule : catalog) {
    if (!rule.isActive) continue;
    if (rule.forwarderId.empty() || rule.forwarderId == forwarderId) out.push_back(rule);
  }
  return out;
}

void sortByPriority(std::vector<MappingRule>& rules) {
  std::stable_sort(rules.begin(), rules.end(), [](const MappingRule& a, const MappingRule& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.id < b.id;
  });
}

} // namespace invoicemap
