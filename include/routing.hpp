#pragma once

#include "confidence.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace invoicemap {

enum class ProcessingPath {
  AutoApprove,
  QuickReview,
  FullReview,
  ManualRequired
};

struct RoutingThresholds {
  double autoApprove = 95.0;
  double quickReview = 80.0;
  // This many critical fields below quickReview force ManualRequired.
  int manualCriticalCount = 3;
};

struct PriorityPolicy {
  int quickReviewBase = 30;
  int fullReviewBase = 60;
  int manualRequiredBase = 70;
  int agePointsPerDay = 2;
  int ageBonusCap = 20;
  int perCriticalField = 5;
};

struct RoutingConfig {
  RoutingThresholds thresholds;
  PriorityPolicy priority;
  std::vector<std::string> criticalFields;

  RoutingConfig();
};

using Clock = std::chrono::system_clock;

struct RoutingDecision {
  ProcessingPath path = ProcessingPath::FullReview;
  std::string reason;
  double confidence = 0.0;
  // Non-empty fields below the quick-review threshold plus empty critical fields, catalog order.
  std::vector<std::string> lowConfidenceFields;
  std::vector<std::string> criticalFieldsAffected;
  // Queue priority 0..100; 0 for AutoApprove.
  int priority = 0;
  Clock::time_point decidedAt;
  std::string decidedBy = "system";
};

bool operator==(const RoutingDecision& a, const RoutingDecision& b);

// The critical-field override is checked before the score bands.
ProcessingPath determinePath(double overallScore, int criticalFailures, const RoutingThresholds& thresholds);

// base(path) + min(cap, perDay * full days waited) + perCritical * criticalCount, clamped to 0..100.
int queuePriority(ProcessingPath path, double documentAgeHours, int criticalCount, const PriorityPolicy& policy);

// Pure function of its inputs: identical inputs give an identical decision.
RoutingDecision routeDocument(const DocumentConfidence& confidence,
                              double documentAgeHours,
                              Clock::time_point decidedAt,
                              const RoutingConfig& config);

const char* toString(ProcessingPath path);

} // namespace invoicemap
