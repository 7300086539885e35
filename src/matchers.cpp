#include "matchers.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace invoicemap {

namespace {

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Pages in plain text are separated by form feeds, as pdftotext emits them.
int pageAt(const std::string& text, size_t pos) {
  return 1 + static_cast<int>(std::count(text.begin(), text.begin() + std::min(pos, text.size()), '\f'));
}

std::string lineAround(const std::string& text, size_t pos) {
  size_t start = text.find_last_of("\n\f", pos == 0 ? 0 : pos - 1);
  start = (start == std::string::npos || pos == 0) ? 0 : start + 1;
  size_t end = text.find_first_of("\r\n\f", pos);
  if (end == std::string::npos) end = text.size();
  return trim(text.substr(start, end - start));
}

const OcrPage* findPage(const OcrPayload& payload, int pageNumber) {
  for (const auto& page : payload.pages) {
    if (page.pageNumber == pageNumber) return &page;
  }
  return nullptr;
}

// Attaches the bounding box of the first layout line on the page containing the value.
void locate(const OcrPayload& payload, MatchCandidate& candidate) {
  const OcrPage* page = findPage(payload, candidate.page);
  if (!page) return;
  for (const auto& line : page->lines) {
    if (line.boundingBox && line.content.find(candidate.value) != std::string::npos) {
      candidate.position = line.boundingBox;
      return;
    }
  }
}

std::string stripSeparators(const std::string& s) {
  size_t start = 0;
  while (start < s.size() &&
         (s[start] == ':' || s[start] == ';' || s[start] == '=' ||
          std::isspace(static_cast<unsigned char>(s[start])))) {
    start++;
  }
  size_t end = s.size();
  while (end > start &&
         (s[end - 1] == ',' || s[end - 1] == ';' || s[end - 1] == ':' ||
          std::isspace(static_cast<unsigned char>(s[end - 1])))) {
    end--;
  }
  return s.substr(start, end - start);
}

int parseSelectorPart(const std::string& part, const std::string& selector) {
  if (part.empty() || !std::all_of(part.begin(), part.end(),
                                   [](unsigned char c) { return std::isdigit(c); })) {
    throw RuleError("malformed position selector '" + selector + "'");
  }
  try {
    return std::stoi(part);
  } catch (const std::out_of_range&) {
    throw RuleError("position selector '" + selector + "' out of range");
  }
}

// ECMAScript has no dotall flag: rewrite every unescaped '.' outside a
// character class to [\s\S].
std::string expandDotAll(const std::string& pattern) {
  std::string out;
  out.reserve(pattern.size());
  bool inClass = false;
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\' && i + 1 < pattern.size()) {
      out += c;
      out += pattern[++i];
      continue;
    }
    if (inClass) {
      if (c == ']') inClass = false;
    } else if (c == '[') {
      inClass = true;
    } else if (c == '.') {
      out += "[\\s\\S]";
      continue;
    }
    out += c;
  }
  return out;
}

} // namespace

std::optional<MatchCandidate> matchRegex(const RegexPattern& pattern, const OcrPayload& payload) {
  auto flags = std::regex::ECMAScript;
  if (pattern.caseInsensitive) flags |= std::regex::icase;
  if (pattern.multiline) flags |= std::regex::multiline;

  std::regex re;
  try {
    re.assign(pattern.dotAll ? expandDotAll(pattern.pattern) : pattern.pattern, flags);
  } catch (const std::regex_error& ex) {
    throw RuleError("invalid regex '" + pattern.pattern + "': " + ex.what());
  }

  std::smatch m;
  if (!std::regex_search(payload.text, m, re)) return std::nullopt;

  // A group the pattern does not define falls back to the whole match.
  size_t group = pattern.group >= 0 && static_cast<size_t>(pattern.group) < m.size()
                   ? static_cast<size_t>(pattern.group) : 0;
  if (!m[group].matched) return std::nullopt;

  std::string value = applyPreprocessor(pattern.preprocess, m[group].str());
  if (trim(value).empty()) return std::nullopt;

  size_t pos = static_cast<size_t>(m.position(group));
  MatchCandidate candidate;
  candidate.value = value;
  candidate.sourceText = lineAround(payload.text, pos);
  candidate.page = pageAt(payload.text, pos);
  candidate.confidence = kRegexConfidence;
  locate(payload, candidate);
  return candidate;
}

std::optional<MatchCandidate> matchKeyword(const KeywordPattern& pattern, const OcrPayload& payload) {
  if (pattern.labels.empty()) throw RuleError("empty keyword");

  const std::string haystack = lower(payload.text);
  for (const auto& label : pattern.labels) {
    if (label.empty()) throw RuleError("empty keyword");
    const std::string needle = lower(label);

    size_t idx = haystack.find(needle);
    while (idx != std::string::npos) {
      size_t start = idx + needle.size();
      size_t end = payload.text.find_first_of("\r\n\f", start);
      if (end == std::string::npos) end = payload.text.size();

      std::string value = stripSeparators(payload.text.substr(start, end - start));
      value = applyPreprocessor(pattern.preprocess, value);
      if (!value.empty()) {
        MatchCandidate candidate;
        candidate.value = value;
        candidate.sourceText = lineAround(payload.text, idx);
        candidate.page = pageAt(payload.text, idx);
        candidate.confidence = kKeywordConfidence;
        locate(payload, candidate);
        return candidate;
      }
      idx = haystack.find(needle, start);
    }
  }
  return std::nullopt;
}

std::optional<MatchCandidate> matchPosition(const PositionPattern& pattern, const OcrPayload& payload) {
  std::vector<std::string> parts;
  std::stringstream ss(pattern.selector);
  std::string part;
  while (std::getline(ss, part, ':')) parts.push_back(trim(part));
  if (parts.size() < 2 || parts.size() > 3) {
    throw RuleError("malformed position selector '" + pattern.selector + "'");
  }

  int pageNumber = parseSelectorPart(parts[0], pattern.selector);
  int row = parseSelectorPart(parts[1], pattern.selector);
  int col = parts.size() == 3 ? parseSelectorPart(parts[2], pattern.selector) : 0;

  const OcrPage* page = findPage(payload, pageNumber);
  if (!page || row < 1 || static_cast<size_t>(row) > page->lines.size()) return std::nullopt;

  const OcrLine& line = page->lines[static_cast<size_t>(row - 1)];
  std::string value = trim(line.content);
  if (col > 0) {
    std::istringstream tokens(line.content);
    std::string token;
    int i = 0;
    value.clear();
    while (tokens >> token) {
      if (++i == col) {
        value = token;
        break;
      }
    }
  }
  if (value.empty()) return std::nullopt;

  MatchCandidate candidate;
  candidate.value = value;
  candidate.sourceText = trim(line.content);
  candidate.page = pageNumber;
  candidate.position = line.boundingBox;
  candidate.confidence = kPositionConfidence;
  return candidate;
}

std::optional<MatchCandidate> matchPretrained(const std::string& serviceFieldName, const OcrPayload& payload) {
  const PretrainedField* field = findPretrainedField(payload, serviceFieldName);
  if (!field) return std::nullopt;

  std::string value = trim(field->value);
  if (value.empty()) return std::nullopt;

  MatchCandidate candidate;
  candidate.value = value;
  candidate.sourceText = field->value;
  candidate.confidence = static_cast<int>(std::lround(field->confidence * 100.0));
  // The service does not say where it read the value; search the text for it.
  size_t pos = payload.text.find(value);
  if (pos != std::string::npos) {
    candidate.sourceText = lineAround(payload.text, pos);
    candidate.page = pageAt(payload.text, pos);
    locate(payload, candidate);
  }
  return candidate;
}

std::optional<MatchCandidate> applyPattern(const ExtractionPattern& pattern, const OcrPayload& payload) {
  struct Visitor {
    const OcrPayload& payload;
    std::optional<MatchCandidate> operator()(const RegexPattern& p) const { return matchRegex(p, payload); }
    std::optional<MatchCandidate> operator()(const KeywordPattern& p) const { return matchKeyword(p, payload); }
    std::optional<MatchCandidate> operator()(const PositionPattern& p) const { return matchPosition(p, payload); }
    std::optional<MatchCandidate> operator()(const PretrainedFieldPattern& p) const {
      return matchPretrained(p.name, payload);
    }
  };
  auto candidate = std::visit(Visitor{payload}, pattern);
  if (candidate) candidate->confidence = std::min(100, candidate->confidence + confidenceBoost(pattern));
  return candidate;
}

} // namespace invoicemap
