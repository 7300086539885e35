#pragma once

#include "confidence.hpp"
#include "engine_config.hpp"
#include "field_mapper.hpp"
#include "mapping_rule.hpp"
#include "ocr_payload.hpp"
#include "processing_queue.hpp"
#include "routing.hpp"

#include <optional>
#include <string>
#include <vector>

namespace invoicemap {

enum class DocumentStatus {
  Completed,
  PendingReview,
  Failed
};

struct DocumentJob {
  std::string documentId;
  // Empty = universal rules only.
  std::string forwarderId;
  OcrPayload payload;
  double ageHours = 0.0;
};

struct DocumentOutcome {
  std::string documentId;
  MappingResult mapping;
  DocumentConfidence confidence;
  RoutingDecision decision;
  DocumentStatus status = DocumentStatus::PendingReview;
  std::optional<QueueItem> queueItem;
  // The queue kept an in-flight review instead of applying this decision.
  bool rerouteRejected = false;
};

struct BatchEntry {
  std::string documentId;
  // Failed when processing threw; outcome is then empty and error holds the message.
  DocumentStatus status = DocumentStatus::Failed;
  std::optional<DocumentOutcome> outcome;
  std::string error;
};

// Throws PayloadError when the payload carries nothing to map or reports a
// confidence outside 0..1.
void validatePayload(const OcrPayload& payload);

// map -> score -> route -> queue or complete. Throws PayloadError for unusable input;
// nothing is queued in that case.
DocumentOutcome processDocument(const DocumentJob& job,
                                const std::vector<MappingRule>& catalog,
                                const HistoryTable& history,
                                const EngineConfig& config,
                                ProcessingQueue& queue,
                                Clock::time_point now);

// Runs the jobs on at most maxWorkers threads (0 = hardware concurrency). A failing
// document yields a Failed entry and leaves the others untouched. Entries keep the
// order of jobs.
std::vector<BatchEntry> processBatch(const std::vector<DocumentJob>& jobs,
                                     const std::vector<MappingRule>& catalog,
                                     const HistoryTable& history,
                                     const EngineConfig& config,
                                     ProcessingQueue& queue,
                                     Clock::time_point now,
                                     size_t maxWorkers = 0);

const char* toString(DocumentStatus status);

} // namespace invoicemap
