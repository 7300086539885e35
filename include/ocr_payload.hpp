#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace invoicemap {

struct BoundingBox {
  double xMin;
  double yMin;
  double xMax;
  double yMax;
};

struct OcrLine {
  std::string content;
  std::optional<BoundingBox> boundingBox;
};

struct OcrPage {
  int pageNumber;
  std::vector<OcrLine> lines;
};

// A field the OCR service extracted on its own. confidence is 0..1.
struct PretrainedField {
  std::string value;
  double confidence;
};

struct OcrPayload {
  std::string text;
  std::vector<OcrPage> pages;
  std::map<std::string, PretrainedField> pretrainedFields;
  // Document-level engine confidence (0..1), when the service reports one.
  std::optional<double> confidence;
};

// The OCR payload is missing or malformed. Fatal for that document's run.
class PayloadError : public std::runtime_error {
public:
  explicit PayloadError(const std::string& message) : std::runtime_error(message) {}
};

// Parses a payload from YAML or JSON text. Throws PayloadError.
OcrPayload parseOcrPayload(const std::string& document);

// Reads and parses a payload file. Throws PayloadError.
OcrPayload loadOcrPayload(const std::string& path);

// Exact name lookup first, then case-insensitive.
const PretrainedField* findPretrainedField(const OcrPayload& payload, const std::string& name);

} // namespace invoicemap
