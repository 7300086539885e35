#include "processing_queue.hpp"

#include "logging.hpp"

#include <algorithm>

namespace invoicemap {

namespace {

std::string alreadyClosed(const QueueItem& item, const char* action) {
  return std::string("cannot ") + action + " queue item " + item.documentId + ": already closed (" +
         toString(item.status) + ")";
}

} // namespace

bool isClosed(QueueStatus status) {
  return status == QueueStatus::Completed || status == QueueStatus::Skipped || status == QueueStatus::Cancelled;
}

QueueItem enterQueue(const std::string& documentId, const RoutingDecision& decision, Clock::time_point now) {
  if (decision.path == ProcessingPath::AutoApprove) {
    throw QueueError("auto-approved document " + documentId + " does not enter the queue");
  }
  QueueItem item;
  item.documentId = documentId;
  item.path = decision.path;
  item.priority = decision.priority;
  item.routingReason = decision.reason;
  item.status = QueueStatus::Pending;
  item.enteredAt = now;
  return item;
}

QueueItem reroute(const QueueItem& item, const RoutingDecision& decision, Clock::time_point now) {
  if (item.status == QueueStatus::InProgress) {
    throw QueueError("cannot re-route " + item.documentId + ": review in progress by " +
                     item.assignee.value_or("unknown reviewer"));
  }

  if (decision.path == ProcessingPath::AutoApprove) {
    if (item.status != QueueStatus::Pending) return item;
    return cancel(item, "auto-approved after re-routing", now);
  }

  if (isClosed(item.status)) return enterQueue(item.documentId, decision, now);

  QueueItem next = item;
  next.path = decision.path;
  next.priority = decision.priority;
  next.routingReason = decision.reason;
  return next;
}

QueueItem assign(const QueueItem& item, const std::string& reviewer, Clock::time_point now) {
  if (item.status != QueueStatus::Pending) {
    throw QueueError("queue item " + item.documentId + " is not pending");
  }
  QueueItem next = item;
  next.status = QueueStatus::InProgress;
  next.assignee = reviewer;
  next.startedAt = now;
  return next;
}

QueueItem complete(const QueueItem& item, const ReviewSummary& summary, Clock::time_point now) {
  if (item.status != QueueStatus::InProgress) {
    throw QueueError("queue item " + item.documentId + " is not in progress");
  }
  QueueItem next = item;
  next.status = QueueStatus::Completed;
  next.completedAt = now;
  next.fieldsReviewed = summary.fieldsReviewed;
  next.fieldsModified = summary.fieldsModified;
  next.notes = summary.notes;
  return next;
}

QueueItem skip(const QueueItem& item, const std::string& reason, Clock::time_point now) {
  if (isClosed(item.status)) throw QueueError(alreadyClosed(item, "skip"));
  QueueItem next = item;
  next.status = QueueStatus::Skipped;
  next.completedAt = now;
  next.notes = reason;
  return next;
}

QueueItem cancel(const QueueItem& item, const std::string& reason, Clock::time_point now) {
  if (isClosed(item.status)) throw QueueError(alreadyClosed(item, "cancel"));
  QueueItem next = item;
  next.status = QueueStatus::Cancelled;
  next.completedAt = now;
  next.notes = reason;
  return next;
}

std::optional<QueueItem> ProcessingQueue::route(const std::string& documentId, const RoutingDecision& decision,
                                                Clock::time_point now) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_items.find(documentId);
  if (it == m_items.end()) {
    if (decision.path == ProcessingPath::AutoApprove) return std::nullopt;
    QueueItem item = enterQueue(documentId, decision, now);
    m_items.emplace(documentId, item);
    logger()->info("{} queued for {} (priority {})", documentId, toString(item.path), item.priority);
    return item;
  }

  it->second = reroute(it->second, decision, now);
  logger()->info("{} re-routed: {} {} (priority {})", documentId, toString(it->second.path),
                 toString(it->second.status), it->second.priority);
  return it->second;
}

template <typename Fn>
QueueItem ProcessingQueue::update(const std::string& documentId, Fn fn) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_items.find(documentId);
  if (it == m_items.end()) throw QueueError("queue item not found: " + documentId);
  it->second = fn(it->second);
  return it->second;
}

QueueItem ProcessingQueue::assign(const std::string& documentId, const std::string& reviewer, Clock::time_point now) {
  return update(documentId, [&](const QueueItem& item) { return invoicemap::assign(item, reviewer, now); });
}

QueueItem ProcessingQueue::complete(const std::string& documentId, const ReviewSummary& summary, Clock::time_point now) {
  return update(documentId, [&](const QueueItem& item) { return invoicemap::complete(item, summary, now); });
}

QueueItem ProcessingQueue::skip(const std::string& documentId, const std::string& reason, Clock::time_point now) {
  return update(documentId, [&](const QueueItem& item) { return invoicemap::skip(item, reason, now); });
}

QueueItem ProcessingQueue::cancel(const std::string& documentId, const std::string& reason, Clock::time_point now) {
  return update(documentId, [&](const QueueItem& item) { return invoicemap::cancel(item, reason, now); });
}

std::optional<QueueItem> ProcessingQueue::find(const std::string& documentId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_items.find(documentId);
  if (it == m_items.end()) return std::nullopt;
  return it->second;
}

std::vector<QueueItem> ProcessingQueue::list(std::optional<ProcessingPath> path, QueueStatus status, size_t limit) const {
  std::vector<QueueItem> out;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& kv : m_items) {
      const QueueItem& item = kv.second;
      if (item.status != status) continue;
      if (path && item.path != *path) continue;
      out.push_back(item);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const QueueItem& a, const QueueItem& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.enteredAt < b.enteredAt;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::optional<QueueItem> ProcessingQueue::next(std::optional<ProcessingPath> path) const {
  auto items = list(path, QueueStatus::Pending, 1);
  if (items.empty()) return std::nullopt;
  return items.front();
}

QueueStats ProcessingQueue::stats(Clock::time_point now) const {
  QueueStats stats;
  long long waitMinutes = 0;
  int pending = 0;
  std::lock_guard<std::mutex> lock(m_mutex);
  for (const auto& kv : m_items) {
    const QueueItem& item = kv.second;
    stats.byPath[item.path]++;
    stats.byStatus[item.status]++;
    if (item.status == QueueStatus::Pending) {
      waitMinutes += std::chrono::duration_cast<std::chrono::minutes>(now - item.enteredAt).count();
      pending++;
    }
  }
  if (pending > 0) stats.averageWaitMinutes = static_cast<long>(waitMinutes / pending);
  return stats;
}

int ProcessingQueue::inProgressCount(const std::string& reviewer) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return static_cast<int>(std::count_if(m_items.begin(), m_items.end(), [&](const auto& kv) {
    return kv.second.status == QueueStatus::InProgress && kv.second.assignee == reviewer;
  }));
}

size_t ProcessingQueue::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_items.size();
}

const char* toString(QueueStatus status) {
  switch (status) {
    case QueueStatus::Pending: return "PENDING";
    case QueueStatus::InProgress: return "IN_PROGRESS";
    case QueueStatus::Completed: return "COMPLETED";
    case QueueStatus::Skipped: return "SKIPPED";
    case QueueStatus::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

} // namespace invoicemap
