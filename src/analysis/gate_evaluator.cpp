#include "analysis/gate_evaluator.hpp"

#include "analysis/aggregator.hpp"

#include <algorithm>
#include <limits>

namespace glancelab::analysis {

namespace {

ConditionSummary SummarizeSubset(const std::vector<sim::TrialRecord>& records,
                                 const std::string& condition,
                                 const std::set<registry::Tier>* tiers) {
  RecordFilter filter;
  filter.condition = condition;
  if (tiers != nullptr) {
    filter.tiers = *tiers;
  }
  return Summarize(FilterRecords(records, filter));
}

} // namespace

double RelativeChange(double candidate, double baseline) {
  if (baseline == 0.0) {
    return candidate == 0.0 ? 0.0 : 1.0;
  }
  return (candidate - baseline) / baseline;
}

double QualityCostRatio(double quality_gain, double cost_regression) {
  if (cost_regression <= 0.0) {
    return quality_gain >= 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
  }
  return quality_gain / cost_regression;
}

GateEvaluation EvaluateCondition(const std::vector<sim::TrialRecord>& records,
                                 const std::string& candidate, const GatePolicy& policy) {
  const std::string& baseline = policy.baseline_condition;

  const ConditionSummary baseline_easy = SummarizeSubset(records, baseline, &policy.easiest_tiers);
  const ConditionSummary baseline_hard = SummarizeSubset(records, baseline, &policy.harder_tiers);
  const ConditionSummary baseline_all = SummarizeSubset(records, baseline, nullptr);
  const ConditionSummary candidate_easy =
      SummarizeSubset(records, candidate, &policy.easiest_tiers);
  const ConditionSummary candidate_hard =
      SummarizeSubset(records, candidate, &policy.harder_tiers);
  const ConditionSummary candidate_all = SummarizeSubset(records, candidate, nullptr);

  GateEvaluation eval;
  eval.condition = candidate;
  eval.baseline_harder_success_rate = baseline_hard.success_rate;
  eval.harder_success_rate = candidate_hard.success_rate;
  eval.success_lift = RelativeChange(candidate_hard.success_rate, baseline_hard.success_rate);
  eval.quality_gain = candidate_hard.success_rate - baseline_hard.success_rate;
  eval.easy_runtime_regression =
      RelativeChange(candidate_easy.median_runtime, baseline_easy.median_runtime);
  eval.maintainability_delta =
      candidate_all.avg_maintainability - baseline_all.avg_maintainability;
  eval.test_quality_delta = candidate_all.avg_test_quality - baseline_all.avg_test_quality;
  eval.cost_regression = RelativeChange(candidate_all.median_cost, baseline_all.median_cost);
  eval.quality_cost_ratio = QualityCostRatio(eval.quality_gain, eval.cost_regression);

  eval.gate_success = eval.success_lift >= policy.min_success_lift;
  eval.gate_runtime = eval.easy_runtime_regression <= policy.max_runtime_regression;
  eval.gate_quality = eval.maintainability_delta >= policy.quality_delta_tolerance &&
                      eval.test_quality_delta >= policy.quality_delta_tolerance;
  eval.gate_cost = eval.cost_regression <= policy.max_cost_regression ||
                   eval.quality_cost_ratio >= policy.min_quality_cost_ratio;
  eval.gate_count = static_cast<int>(eval.gate_success) + static_cast<int>(eval.gate_runtime) +
                    static_cast<int>(eval.gate_quality) + static_cast<int>(eval.gate_cost);

  // Cost or runtime drops below the baseline earn no credit.
  eval.frontier_score = eval.quality_gain -
                        policy.cost_penalty_weight * std::max(eval.cost_regression, 0.0) -
                        policy.runtime_penalty_weight * std::max(eval.easy_runtime_regression, 0.0);
  return eval;
}

} // namespace glancelab::analysis
