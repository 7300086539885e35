#pragma once

#include <optional>
#include <string>

namespace invoicemap {

// Canonical YYYY-MM-DD. Tries, in order: YYYY-MM-DD, MM/DD/YYYY, MM-DD-YYYY,
// DD.MM.YYYY, "D Mon YYYY", "Mon D, YYYY". Returns nullopt when none yields a real date.
std::optional<std::string> normalizeDate(const std::string& value);

// Strips currency symbols and thousands separators, uses '.' as decimal
// separator and formats with two decimals.
std::optional<std::string> normalizeAmount(const std::string& value);

// Drops the unit and normalizes the number like an amount.
std::optional<std::string> normalizeWeight(const std::string& value);

// Trims the value and applies the normalizer for the field's data type.
// Values a normalizer cannot handle are returned trimmed but otherwise unchanged.
std::string normalizeValue(const std::string& fieldName, const std::string& value);

struct ValidationResult {
  bool isValid = true;
  std::optional<std::string> error;
};

// Anchored at the start of the value. An unusable pattern is logged and treated as a pass.
ValidationResult validateValue(const std::string& value, const std::string& pattern);

} // namespace invoicemap
