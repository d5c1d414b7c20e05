#pragma once

#include "registry/registry.hpp"
#include "sim/trial_record.hpp"

#include <set>
#include <string>
#include <vector>

namespace glancelab::analysis {

// Gate thresholds and frontier weights. Defaults are the adoption policy the
// experiment was designed around; tests override individual fields.
struct GatePolicy {
  std::string baseline_condition = "C0";
  std::set<registry::Tier> harder_tiers = {registry::Tier::kT2, registry::Tier::kT3};
  std::set<registry::Tier> easiest_tiers = {registry::Tier::kT1};

  double min_success_lift = 0.10;
  double max_runtime_regression = 0.15;
  // Maintainability and test-quality deltas must both stay at or above this.
  double quality_delta_tolerance = -0.02;
  double max_cost_regression = 0.25;
  double min_quality_cost_ratio = 0.25;

  double cost_penalty_weight = 0.30;
  double runtime_penalty_weight = 0.20;
};

// One candidate condition compared to the baseline.
struct GateEvaluation {
  std::string condition;
  double baseline_harder_success_rate = 0.0;
  double harder_success_rate = 0.0;
  double success_lift = 0.0;
  double quality_gain = 0.0;
  double easy_runtime_regression = 0.0;
  double maintainability_delta = 0.0;
  double test_quality_delta = 0.0;
  double cost_regression = 0.0;
  // May be +infinity; see QualityCostRatio.
  double quality_cost_ratio = 0.0;
  bool gate_success = false;
  bool gate_runtime = false;
  bool gate_quality = false;
  bool gate_cost = false;
  int gate_count = 0;
  double frontier_score = 0.0;

  bool PassesAllGates() const {
    return gate_success && gate_runtime && gate_quality && gate_cost;
  }
};

// (candidate - baseline) / baseline. A zero baseline yields 0 when the
// candidate is also zero and 1 otherwise; gate thresholds were tuned against
// that convention.
double RelativeChange(double candidate, double baseline);

// Quality gained per unit of relative cost increase. When cost did not rise
// (regression <= 0) the ratio is +infinity for a non-negative gain and 0 for a
// loss.
double QualityCostRatio(double quality_gain, double cost_regression);

// Evaluates `candidate` against `policy.baseline_condition` over `records`.
// Total: empty subsets fall back to all-zero summaries.
GateEvaluation EvaluateCondition(const std::vector<sim::TrialRecord>& records,
                                 const std::string& candidate,
                                 const GatePolicy& policy = GatePolicy{});

} // namespace glancelab::analysis
