#ifndef GLANCELAB_TESTS_COMMON_TRIAL_FIXTURES_HPP_
#define GLANCELAB_TESTS_COMMON_TRIAL_FIXTURES_HPP_

#include "registry/registry.hpp"
#include "sim/trial_record.hpp"

#include <string>
#include <vector>

namespace glancelab::tests::common {

// Per-condition shape for hand-built analysis fixtures. Each tier gets ten
// rows; the first `tN_successes` of them succeed.
struct ConditionRowProfile {
  int t1_successes = 0;
  int t2_successes = 0;
  int t3_successes = 0;
  double t1_runtime = 0.0;
  double t2_runtime = 0.0;
  double t3_runtime = 0.0;
  double cost = 0.0;
  double maintainability = 0.0;
  double test_quality = 0.0;
};

inline sim::TrialRecord MakeTrialRow(const std::string& condition, registry::Tier tier,
                                     bool success, double runtime, double cost,
                                     double maintainability, double test_quality) {
  sim::TrialRecord record;
  record.condition = condition;
  record.tier = tier;
  record.outcome.task_success = success;
  record.outcome.tests_passed = success;
  record.outcome.context_utilized = condition != "C0";
  record.outcome.runtime_seconds = runtime;
  record.outcome.total_tokens = 10000;
  record.outcome.estimated_cost_usd = cost;
  record.outcome.pr_readiness_score = success ? 0.75 : 0.45;
  record.outcome.judges.maintainability = maintainability;
  record.outcome.judges.test_quality = test_quality;
  return record;
}

inline void AppendConditionRows(std::vector<sim::TrialRecord>& rows, const std::string& condition,
                                const ConditionRowProfile& profile) {
  for (int index = 0; index < 10; ++index) {
    rows.push_back(MakeTrialRow(condition, registry::Tier::kT1, index < profile.t1_successes,
                                profile.t1_runtime, profile.cost, profile.maintainability,
                                profile.test_quality));
    rows.push_back(MakeTrialRow(condition, registry::Tier::kT2, index < profile.t2_successes,
                                profile.t2_runtime, profile.cost, profile.maintainability,
                                profile.test_quality));
    rows.push_back(MakeTrialRow(condition, registry::Tier::kT3, index < profile.t3_successes,
                                profile.t3_runtime, profile.cost, profile.maintainability,
                                profile.test_quality));
  }
}

} // namespace glancelab::tests::common

#endif // GLANCELAB_TESTS_COMMON_TRIAL_FIXTURES_HPP_
