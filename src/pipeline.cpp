#include "pipeline.hpp"

#include "logging.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <thread>

namespace invoicemap {

void validatePayload(const OcrPayload& payload) {
  if (payload.text.empty() && payload.pages.empty() && payload.pretrainedFields.empty()) {
    throw PayloadError("payload has no text, layout or pre-extracted fields");
  }
  for (const auto& page : payload.pages) {
    if (page.pageNumber < 1) throw PayloadError("page numbers must start at 1");
  }
  auto inRange = [](double c) { return c >= 0.0 && c <= 1.0; };
  if (payload.confidence && !inRange(*payload.confidence)) {
    throw PayloadError("document confidence out of range 0..1");
  }
  for (const auto& kv : payload.pretrainedFields) {
    if (!inRange(kv.second.confidence)) throw PayloadError("field " + kv.first + " confidence out of range 0..1");
  }
}

DocumentOutcome processDocument(const DocumentJob& job,
                                const std::vector<MappingRule>& catalog,
                                const HistoryTable& history,
                                const EngineConfig& config,
                                ProcessingQueue& queue,
                                Clock::time_point now) {
  validatePayload(job.payload);

  DocumentOutcome outcome;
  outcome.documentId = job.documentId;

  std::vector<MappingRule> rules = rulesForForwarder(catalog, job.forwarderId);
  if (rules.empty()) {
    logger()->warn("{}: no active rules for forwarder '{}'", job.documentId, job.forwarderId);
  }

  outcome.mapping = mapFields(job.payload, rules);
  outcome.confidence = scoreDocument(outcome.mapping.fields, job.payload.confidence,
                                     historyFor(history, job.forwarderId), config.confidence);
  outcome.decision = routeDocument(outcome.confidence, job.ageHours, now, config.routing);

  logger()->info("{}: {} ({})", job.documentId, toString(outcome.decision.path), outcome.decision.reason);

  try {
    outcome.queueItem = queue.route(job.documentId, outcome.decision, now);
  } catch (const QueueError& ex) {
    logger()->warn("{}: {}", job.documentId, ex.what());
    outcome.rerouteRejected = true;
    outcome.queueItem = queue.find(job.documentId);
  }

  bool open = outcome.queueItem && !isClosed(outcome.queueItem->status);
  outcome.status = open ? DocumentStatus::PendingReview : DocumentStatus::Completed;
  return outcome;
}

std::vector<BatchEntry> processBatch(const std::vector<DocumentJob>& jobs,
                                     const std::vector<MappingRule>& catalog,
                                     const HistoryTable& history,
                                     const EngineConfig& config,
                                     ProcessingQueue& queue,
                                     Clock::time_point now,
                                     size_t maxWorkers) {
  std::vector<BatchEntry> entries(jobs.size());
  if (jobs.empty()) return entries;

  // Each worker owns a contiguous slice of entries.
  auto runRange = [&jobs, &catalog, &history, &config, &queue, &entries, now](size_t start, size_t end) {
    for (size_t i = start; i < end; ++i) {
      BatchEntry& entry = entries[i];
      entry.documentId = jobs[i].documentId;
      try {
        entry.outcome = processDocument(jobs[i], catalog, history, config, queue, now);
        entry.status = entry.outcome->status;
      } catch (const std::exception& ex) {
        logger()->error("{}: processing failed: {}", jobs[i].documentId, ex.what());
        entry.status = DocumentStatus::Failed;
        entry.error = ex.what();
      }
    }
  };

  size_t workers = maxWorkers > 0 ? maxWorkers : std::max(1u, std::thread::hardware_concurrency());
  workers = std::min(workers, jobs.size());
  const size_t chunk = (jobs.size() + workers - 1) / workers;

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t start = 0; start < jobs.size(); start += chunk) {
    const size_t end = std::min(jobs.size(), start + chunk);
    try {
      futures.push_back(std::async(std::launch::async, runRange, start, end));
    } catch (const std::system_error& ex) {
      logger()->warn("could not start batch worker ({}); processing documents {}..{} inline",
                     ex.what(), start, end - 1);
      runRange(start, end);
    }
  }
  for (auto& f : futures) f.get();
  return entries;
}

const char* toString(DocumentStatus status) {
  switch (status) {
    case DocumentStatus::Completed: return "COMPLETED";
    case DocumentStatus::PendingReview: return "PENDING_REVIEW";
    case DocumentStatus::Failed: return "FAILED";
  }
  return "UNKNOWN";
}

} // namespace invoicemap
