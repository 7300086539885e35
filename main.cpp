#include "engine_config.hpp"
#include "logging.hpp"
#include "mapping_rule.hpp"
#include "ocr_payload.hpp"
#include "pdf_layout.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace invoicemap;

namespace {

std::string quote(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\f': out += "\\f"; break;
      default: out += c;
    }
  }
  return out + "\"";
}

std::string optionalQuote(const std::optional<std::string>& s) {
  return s ? quote(*s) : "null";
}

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " --rules=<rules.yaml> [--config=<config.yaml>] [--history=<history.yaml>]"
               " [--forwarder=<id>] [--document-id=<id>] [--age-hours=<n>] [--pdf] [-v]"
               " <payload.json|payload.yaml|file.pdf>\n";
}

void printOutcome(const DocumentOutcome& outcome) {
  const auto& summary = outcome.mapping.summary;
  const auto& decision = outcome.decision;

  // Print a compact JSON view
  std::cout << "{\n";
  std::cout << "  \"documentId\": " << quote(outcome.documentId) << ",\n";
  std::cout << "  \"fields\": {\n";
  bool first = true;
  for (size_t i = 0; i < outcome.mapping.fields.size(); ++i) {
    const FieldMapping& f = outcome.mapping.fields[i];
    if (f.isEmpty) continue;
    const FieldConfidence& fc = outcome.confidence.fields[i];
    if (!first) std::cout << ",\n";
    first = false;
    std::cout << "    " << quote(f.fieldName) << ": {"
              << "\"value\": " << optionalQuote(f.value)
              << ", \"raw\": " << optionalQuote(f.rawValue)
              << ", \"method\": " << quote(toString(f.method))
              << ", \"ruleId\": " << optionalQuote(f.ruleId)
              << ", \"page\": " << f.sourcePage
              << ", \"confidence\": " << fc.score
              << ", \"valid\": " << (f.isValid ? "true" : "false");
    if (f.validationError) std::cout << ", \"validationError\": " << quote(*f.validationError);
    std::cout << "}";
  }
  std::cout << "\n  },\n";

  std::cout << "  \"summary\": {"
            << "\"totalFields\": " << summary.totalFields
            << ", \"mappedFields\": " << summary.mappedFields
            << ", \"unmappedFields\": " << summary.unmappedFields
            << ", \"validFields\": " << summary.validFields
            << ", \"invalidFields\": " << summary.invalidFields
            << ", \"averageConfidence\": " << summary.averageConfidence
            << ", \"skippedRules\": " << outcome.mapping.skippedRules.size() << "},\n";

  auto printArray = [&](const std::vector<std::string>& arr) {
    std::cout << "[";
    for (size_t i = 0; i < arr.size(); ++i) {
      std::cout << quote(arr[i]) << (i + 1 == arr.size() ? "" : ", ");
    }
    std::cout << "]";
  };

  std::cout << "  \"routing\": {\n";
  std::cout << "    \"path\": " << quote(toString(decision.path)) << ",\n";
  std::cout << "    \"reason\": " << quote(decision.reason) << ",\n";
  std::cout << "    \"confidence\": " << decision.confidence << ",\n";
  std::cout << "    \"priority\": " << decision.priority << ",\n";
  std::cout << "    \"lowConfidenceFields\": ";
  printArray(decision.lowConfidenceFields);
  std::cout << ",\n    \"criticalFieldsAffected\": ";
  printArray(decision.criticalFieldsAffected);
  std::cout << "\n  },\n";
  std::cout << "  \"status\": " << quote(toString(outcome.status)) << "\n";
  std::cout << "}\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string payloadPath;
    std::string rulesPath;
    std::string configPath;
    std::string historyPath;
    std::string forwarderId;
    std::string documentId;
    double ageHours = 0.0;
    bool fromPdf = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--pdf") {
        fromPdf = true;
      } else if (arg == "-v" || arg == "--verbose") {
        verbose = true;
      } else if (arg.rfind("--rules=", 0) == 0) {
        rulesPath = arg.substr(std::string("--rules=").size());
      } else if (arg.rfind("--config=", 0) == 0) {
        configPath = arg.substr(std::string("--config=").size());
      } else if (arg.rfind("--history=", 0) == 0) {
        historyPath = arg.substr(std::string("--history=").size());
      } else if (arg.rfind("--forwarder=", 0) == 0) {
        forwarderId = arg.substr(std::string("--forwarder=").size());
      } else if (arg.rfind("--document-id=", 0) == 0) {
        documentId = arg.substr(std::string("--document-id=").size());
      } else if (arg.rfind("--age-hours=", 0) == 0) {
        try {
          ageHours = std::stod(arg.substr(std::string("--age-hours=").size()));
        } catch (const std::logic_error&) {
          std::cerr << "Invalid --age-hours value: " << arg << "\n";
          printUsage(argv[0]);
          return 2;
        }
      } else if (payloadPath.empty()) {
        payloadPath = arg;
      }
    }

    if (payloadPath.empty() || rulesPath.empty()) {
      printUsage(argv[0]);
      return 2;
    }
    if (!std::filesystem::exists(payloadPath)) {
      std::cerr << "Payload not found: " << payloadPath << "\n";
      printUsage(argv[0]);
      return 2;
    }

    EngineConfig config = configPath.empty() ? EngineConfig{} : loadEngineConfig(configPath);
    initLogging(verbose ? "debug" : config.logLevel);

    HistoryTable history = historyPath.empty() ? HistoryTable{} : loadHistoricalAccuracy(historyPath);
    std::vector<MappingRule> catalog = loadRuleCatalog(rulesPath);

    DocumentJob job;
    job.documentId = documentId.empty() ? std::filesystem::path(payloadPath).stem().string() : documentId;
    job.forwarderId = forwarderId;
    job.ageHours = ageHours;
    job.payload = fromPdf ? ocrPayloadFromPdf(payloadPath) : loadOcrPayload(payloadPath);

    ProcessingQueue queue;
    DocumentOutcome outcome = processDocument(job, catalog, history, config, queue, Clock::now());
    printOutcome(outcome);
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
