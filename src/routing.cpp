#include "routing.hpp"

#include "field_catalog.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>

#include <fmt/format.h>

namespace invoicemap {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

std::string reasonFor(ProcessingPath path, double score, const RoutingDecision& d, const RoutingThresholds& t) {
  switch (path) {
    case ProcessingPath::ManualRequired:
      return fmt::format("{} critical fields below {:.0f}% confidence ({}); manual processing required "
                         "(overall confidence {:.2f}%)",
                         d.criticalFieldsAffected.size(), t.quickReview,
                         joinNames(d.criticalFieldsAffected), score);
    case ProcessingPath::AutoApprove:
      return fmt::format("Overall confidence {:.2f}% meets the auto-approve threshold (>= {:.0f}%)",
                         score, t.autoApprove);
    case ProcessingPath::QuickReview:
      return fmt::format("Overall confidence {:.2f}% is between {:.0f}% and {:.0f}%; "
                         "{} field(s) need quick review",
                         score, t.quickReview, t.autoApprove, d.lowConfidenceFields.size());
    case ProcessingPath::FullReview:
      return fmt::format("Overall confidence {:.2f}% is below {:.0f}%; full review of all fields required "
                         "({} low-confidence field(s), {} critical)",
                         score, t.quickReview, d.lowConfidenceFields.size(),
                         d.criticalFieldsAffected.size());
  }
  return {};
}

} // namespace

RoutingConfig::RoutingConfig() : criticalFields(defaultCriticalFields()) {}

bool operator==(const RoutingDecision& a, const RoutingDecision& b) {
  return a.path == b.path && a.reason == b.reason && a.confidence == b.confidence &&
         a.lowConfidenceFields == b.lowConfidenceFields &&
         a.criticalFieldsAffected == b.criticalFieldsAffected && a.priority == b.priority &&
         a.decidedAt == b.decidedAt && a.decidedBy == b.decidedBy;
}

ProcessingPath determinePath(double overallScore, int criticalFailures, const RoutingThresholds& thresholds) {
  // Scores come from the aggregator, which rejects out-of-range inputs.
  assert(overallScore >= 0.0 && overallScore <= 100.0);

  if (criticalFailures >= thresholds.manualCriticalCount) return ProcessingPath::ManualRequired;
  if (overallScore >= thresholds.autoApprove) return ProcessingPath::AutoApprove;
  if (overallScore >= thresholds.quickReview) return ProcessingPath::QuickReview;
  return ProcessingPath::FullReview;
}

int queuePriority(ProcessingPath path, double documentAgeHours, int criticalCount, const PriorityPolicy& policy) {
  int base = 0;
  switch (path) {
    case ProcessingPath::AutoApprove: return 0;
    case ProcessingPath::QuickReview: base = policy.quickReviewBase; break;
    case ProcessingPath::FullReview: base = policy.fullReviewBase; break;
    case ProcessingPath::ManualRequired: base = policy.manualRequiredBase; break;
  }

  // More full days than the cap can never add more points, so clamp before converting.
  double fullDays = documentAgeHours > 0 ? std::floor(documentAgeHours / 24.0) : 0.0;
  int days = static_cast<int>(std::min(fullDays, static_cast<double>(std::max(0, policy.ageBonusCap))));
  long long points = static_cast<long long>(days) * std::max(0, policy.agePointsPerDay);
  int ageBonus = static_cast<int>(std::min<long long>(policy.ageBonusCap, points));
  int criticalBonus = std::max(0, criticalCount) * policy.perCriticalField;
  return std::clamp(base + ageBonus + criticalBonus, 0, 100);
}

RoutingDecision routeDocument(const DocumentConfidence& confidence,
                              double documentAgeHours,
                              Clock::time_point decidedAt,
                              const RoutingConfig& config) {
  RoutingDecision decision;
  decision.confidence = confidence.overallScore;
  decision.decidedAt = decidedAt;

  for (const auto& field : confidence.fields) {
    bool critical = isCriticalField(field.fieldName, config.criticalFields);
    // An empty field is only a failure when the document cannot do without it.
    if (field.isEmpty && !critical) continue;
    if (field.isEmpty || field.score < config.thresholds.quickReview) {
      decision.lowConfidenceFields.push_back(field.fieldName);
      if (critical) decision.criticalFieldsAffected.push_back(field.fieldName);
    }
  }

  int criticalFailures = static_cast<int>(decision.criticalFieldsAffected.size());
  decision.path = determinePath(confidence.overallScore, criticalFailures, config.thresholds);
  decision.reason = reasonFor(decision.path, confidence.overallScore, decision, config.thresholds);
  decision.priority = queuePriority(decision.path, documentAgeHours, criticalFailures, config.priority);
  return decision;
}

const char* toString(ProcessingPath path) {
  switch (path) {
    case ProcessingPath::AutoApprove: return "AUTO_APPROVE";
    case ProcessingPath::QuickReview: return "QUICK_REVIEW";
    case ProcessingPath::FullReview: return "FULL_REVIEW";
    case ProcessingPath::ManualRequired: return "MANUAL_REQUIRED";
  }
  return "UNKNOWN";
}

} // namespace invoicemap
