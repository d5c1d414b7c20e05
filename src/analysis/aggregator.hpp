#pragma once

#include "registry/registry.hpp"
#include "sim/trial_record.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace glancelab::analysis {

// Canonical reporting order for per-condition summaries.
inline const std::vector<std::string> kConditionOrder = {"C0", "C1", "C2", "C3", "C4"};

// Aggregate statistics over a record subset, always recomputed from the
// records. An empty subset yields all-zero fields.
struct ConditionSummary {
  std::string condition;
  double n = 0.0;
  double success_rate = 0.0;
  double tests_pass_rate = 0.0;
  double avg_pr_readiness = 0.0;
  double median_runtime = 0.0;
  double median_tokens = 0.0;
  double median_cost = 0.0;
  double context_utilization_rate = 0.0;
  double avg_maintainability = 0.0;
  double avg_test_quality = 0.0;
};

// Conjunction of optional predicates; an unset field matches everything.
struct RecordFilter {
  std::optional<std::string> condition;
  std::optional<std::set<registry::Tier>> tiers;

  bool Matches(const sim::TrialRecord& record) const;
};

std::vector<sim::TrialRecord> FilterRecords(const std::vector<sim::TrialRecord>& records,
                                            const RecordFilter& filter);

// `condition` on the result is left empty; callers label it.
ConditionSummary Summarize(const std::vector<sim::TrialRecord>& records);

// One summary per condition in `order`, skipping conditions with no rows.
std::vector<ConditionSummary> SummarizeByCondition(
    const std::vector<sim::TrialRecord>& records,
    const std::vector<std::string>& order = kConditionOrder);

// Statistical median; mean of the two middle values for even sizes, 0 when
// empty.
double Median(std::vector<double> values);

} // namespace glancelab::analysis
