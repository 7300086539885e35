#pragma once

#include "ocr_payload.hpp"

#include <string>
#include <vector>

namespace invoicemap {

// Returns the full text of a text-layer PDF by invoking `pdftotext -layout`.
// Throws std::runtime_error when pdftotext is missing or fails.
std::string extractPdfText(const std::string& pdfPath);

// Groups the words of `pdftotext -bbox-layout` output into lines per page,
// clustering by vertical centre. Each line carries the union of its word boxes.
std::vector<OcrPage> parseBboxLayout(const std::string& xmlish);

// Builds an OCR payload (text plus page/line layout) for a text-layer PDF.
// No pre-extracted fields and no engine confidence are available on this path.
OcrPayload ocrPayloadFromPdf(const std::string& pdfPath);

} // namespace invoicemap
