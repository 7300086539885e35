#pragma once

#include <optional>
#include <string>
#include <vector>

namespace invoicemap {

enum class FieldCategory {
  Basic,
  Shipper,
  Consignee,
  Shipping,
  Package,
  Charges,
  Reference,
  Payment
};

enum class FieldDataType {
  String,
  Number,
  Date,
  Currency,
  Address,
  Phone,
  Email,
  Weight,
  Dimension
};

struct StandardField {
  std::string name;
  std::string label;
  FieldCategory category;
  FieldDataType dataType;
  bool isRequired;
  // Applied when the winning rule has no validation pattern of its own. Empty = none.
  std::string validationPattern;
};

// The fixed catalog of standardized invoice fields, in display order.
const std::vector<StandardField>& standardFields();

const StandardField* findField(const std::string& name);

std::vector<StandardField> fieldsByCategory(FieldCategory category);

// Fields whose individual failure can force manual processing.
const std::vector<std::string>& defaultCriticalFields();

bool isCriticalField(const std::string& name, const std::vector<std::string>& criticalFields);

// Name of the OCR service's own pre-extracted field for a standardized field, if it has one.
std::optional<std::string> pretrainedFieldFor(const std::string& fieldName);

const char* toString(FieldCategory category);
const char* toString(FieldDataType dataType);

} // namespace invoicemap
