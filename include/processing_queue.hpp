#pragma once

#include "routing.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace invoicemap {

enum class QueueStatus {
  Pending,
  InProgress,
  Completed,
  Skipped,
  Cancelled
};

struct QueueItem {
  std::string documentId;
  ProcessingPath path = ProcessingPath::FullReview;
  int priority = 0;
  std::string routingReason;
  QueueStatus status = QueueStatus::Pending;
  std::optional<std::string> assignee;
  Clock::time_point enteredAt;
  std::optional<Clock::time_point> startedAt;
  std::optional<Clock::time_point> completedAt;
  int fieldsReviewed = 0;
  int fieldsModified = 0;
  std::string notes;
};

struct ReviewSummary {
  int fieldsReviewed = 0;
  int fieldsModified = 0;
  std::string notes;
};

// An illegal queue transition (double assignment, completing an unassigned item, ...).
class QueueError : public std::runtime_error {
public:
  explicit QueueError(const std::string& message) : std::runtime_error(message) {}
};

bool isClosed(QueueStatus status);

// Transition functions. Each returns the new state or throws QueueError.

// New PENDING item. AutoApprove decisions never enter the queue.
QueueItem enterQueue(const std::string& documentId, const RoutingDecision& decision, Clock::time_point now);

// Applies a new routing decision to an existing item. PENDING items take the new
// path, priority and reason; closed items re-enter PENDING; IN_PROGRESS items are
// rejected. An AutoApprove decision cancels a PENDING item.
QueueItem reroute(const QueueItem& item, const RoutingDecision& decision, Clock::time_point now);

QueueItem assign(const QueueItem& item, const std::string& reviewer, Clock::time_point now);

QueueItem complete(const QueueItem& item, const ReviewSummary& summary, Clock::time_point now);

QueueItem skip(const QueueItem& item, const std::string& reason, Clock::time_point now);

QueueItem cancel(const QueueItem& item, const std::string& reason, Clock::time_point now);

struct QueueStats {
  std::map<ProcessingPath, int> byPath;
  std::map<QueueStatus, int> byStatus;
  // Mean wait of PENDING items, whole minutes.
  long averageWaitMinutes = 0;
};

// Thread-safe store of queue items, one per document.
class ProcessingQueue {
public:
  // Creates, re-routes or (for AutoApprove) cancels the document's item.
  // Returns the item after the update, or nullopt when an AutoApprove document has none.
  // Throws QueueError when the item is IN_PROGRESS.
  std::optional<QueueItem> route(const std::string& documentId, const RoutingDecision& decision,
                                 Clock::time_point now);

  // Atomic check-and-set: exactly one of concurrent callers succeeds.
  QueueItem assign(const std::string& documentId, const std::string& reviewer, Clock::time_point now);

  QueueItem complete(const std::string& documentId, const ReviewSummary& summary, Clock::time_point now);

  QueueItem skip(const std::string& documentId, const std::string& reason, Clock::time_point now);

  QueueItem cancel(const std::string& documentId, const std::string& reason, Clock::time_point now);

  std::optional<QueueItem> find(const std::string& documentId) const;

  // Priority descending, then oldest first. limit 0 = all.
  std::vector<QueueItem> list(std::optional<ProcessingPath> path = std::nullopt,
                              QueueStatus status = QueueStatus::Pending,
                              size_t limit = 0) const;

  std::optional<QueueItem> next(std::optional<ProcessingPath> path = std::nullopt) const;

  QueueStats stats(Clock::time_point now) const;

  int inProgressCount(const std::string& reviewer) const;

  size_t size() const;

private:
  template <typename Fn>
  QueueItem update(const std::string& documentId, Fn fn);

  mutable std::mutex m_mutex;
  std::map<std::string, QueueItem> m_items;
};

const char* toString(QueueStatus status);

} // namespace invoicemap
