#include "normalize.hpp"

#include "field_catalog.hpp"
#include "logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <regex>

namespace invoicemap {

namespace {

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool isRealDate(int y, int m, int d) {
  static const std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (y < 1900 || y > 2999 || m < 1 || m > 12 || d < 1) return false;
  int limit = days[static_cast<size_t>(m - 1)] + (m == 2 && isLeapYear(y) ? 1 : 0);
  return d <= limit;
}

std::string formatDate(int y, int m, int d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
  return buf;
}

int monthFromName(const std::string& name) {
  static const std::array<const char*, 12> months = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
  std::string key = name.substr(0, 3);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (size_t i = 0; i < months.size(); ++i) {
    if (key == months[i]) return static_cast<int>(i) + 1;
  }
  return 0;
}

enum class DateOrder { YMD, MDY, DMY, DMonY, MonDY };

struct DateFormat {
  std::regex re;
  DateOrder order;
};

const std::vector<DateFormat>& dateFormats() {
  static const std::vector<DateFormat> formats = {
    {std::regex(R"((\d{4})-(\d{1,2})-(\d{1,2}))"), DateOrder::YMD},
    {std::regex(R"((\d{1,2})/(\d{1,2})/(\d{4}))"), DateOrder::MDY},
    {std::regex(R"((\d{1,2})-(\d{1,2})-(\d{4}))"), DateOrder::MDY},
    {std::regex(R"((\d{1,2})\.(\d{1,2})\.(\d{4}))"), DateOrder::DMY},
    {std::regex(R"((\d{1,2})[\s-]+([A-Za-z]{3,9})\.?[\s-]+(\d{4}))"), DateOrder::DMonY},
    {std::regex(R"(([A-Za-z]{3,9})\.?\s+(\d{1,2}),?\s+(\d{4}))"), DateOrder::MonDY},
  };
  return formats;
}

} // namespace

std::optional<std::string> normalizeDate(const std::string& value) {
  for (const auto& format : dateFormats()) {
    std::smatch m;
    if (!std::regex_search(value, m, format.re)) continue;

    int y = 0, mo = 0, d = 0;
    switch (format.order) {
      case DateOrder::YMD:
        y = std::stoi(m[1].str()); mo = std::stoi(m[2].str()); d = std::stoi(m[3].str());
        break;
      case DateOrder::MDY:
        mo = std::stoi(m[1].str()); d = std::stoi(m[2].str()); y = std::stoi(m[3].str());
        break;
      case DateOrder::DMY:
        d = std::stoi(m[1].str()); mo = std::stoi(m[2].str()); y = std::stoi(m[3].str());
        break;
      case DateOrder::DMonY:
        d = std::stoi(m[1].str()); mo = monthFromName(m[2].str()); y = std::stoi(m[3].str());
        break;
      case DateOrder::MonDY:
        mo = monthFromName(m[1].str()); d = std::stoi(m[2].str()); y = std::stoi(m[3].str());
        break;
    }
    if (isRealDate(y, mo, d)) return formatDate(y, mo, d);
  }
  return std::nullopt;
}

std::optional<std::string> normalizeAmount(const std::string& value) {
  std::string cleaned;
  for (char c : value) {
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ',' || c == '-') cleaned.push_back(c);
  }
  if (cleaned.empty()) return std::nullopt;

  size_t lastComma = cleaned.rfind(',');
  size_t lastDot = cleaned.rfind('.');
  char decimal = '.';
  if (lastComma != std::string::npos && lastDot != std::string::npos) {
    // Both present: whichever comes last is the decimal separator.
    decimal = lastComma > lastDot ? ',' : '.';
  } else if (lastComma != std::string::npos) {
    // "12,5" or "12,50" reads as a decimal comma; "1,234" as thousands.
    size_t digitsAfter = cleaned.size() - lastComma - 1;
    bool single = cleaned.find(',') == lastComma;
    decimal = (single && digitsAfter >= 1 && digitsAfter <= 2) ? ',' : '.';
  }

  std::string number;
  for (char c : cleaned) {
    if (c == decimal) number.push_back('.');
    else if (c == '.' || c == ',') continue;
    else number.push_back(c);
  }

  char* end = nullptr;
  double amount = std::strtod(number.c_str(), &end);
  if (number.empty() || end == number.c_str() || *end != '\0') return std::nullopt;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", amount);
  return std::string(buf);
}

std::optional<std::string> normalizeWeight(const std::string& value) {
  static const std::regex unit(R"((kgs?|lbs?|grams?|g)\.?)", std::regex::icase);
  static const std::regex number(R"([\d.,]+)");
  std::string cleaned = std::regex_replace(value, unit, "");
  std::smatch m;
  if (!std::regex_search(cleaned, m, number)) return std::nullopt;
  return normalizeAmount(m.str());
}

std::string normalizeValue(const std::string& fieldName, const std::string& value) {
  std::string trimmed = trim(value);
  if (trimmed.empty()) return trimmed;

  const StandardField* field = findField(fieldName);
  if (!field) return trimmed;

  std::optional<std::string> normalized;
  switch (field->dataType) {
    case FieldDataType::Date: normalized = normalizeDate(trimmed); break;
    case FieldDataType::Currency: normalized = normalizeAmount(trimmed); break;
    case FieldDataType::Weight: normalized = normalizeWeight(trimmed); break;
    default: break;
  }
  return normalized ? *normalized : trimmed;
}

ValidationResult validateValue(const std::string& value, const std::string& pattern) {
  if (pattern.empty() || value.empty()) return {};
  try {
    std::regex re(pattern);
    if (std::regex_search(value, re, std::regex_constants::match_continuous)) return {};
    return {false, "Value does not match pattern: " + pattern};
  } catch (const std::regex_error& ex) {
    logger()->warn("invalid validation pattern '{}': {}", pattern, ex.what());
    return {};
  }
}

} // namespace invoicemap
