#pragma once

#include "registry/registry.hpp"
#include "sim/outcome_record.hpp"
#include "sim/trial_rng.hpp"
#include "tasks/task_model.hpp"

namespace glancelab::sim {

// Synthetic outcome model for one (task, condition, model) trial.
//
// The simulator holds only a reference to immutable registry tables, so
// `Simulate` is a pure function of its arguments plus the stream state:
// the same stream state in yields the same record out. The stream is consumed
// in this fixed order:
//   1. success perturbation U(-0.05, 0.05), success draw
//   2. tests-passed draw (only when success drew false)
//   3. utilization perturbation U(-0.04, 0.04), utilization draw
//      (both skipped when the condition ships no glance files)
//   4. runtime noise U(-0.10, 0.10)
//   5. input-token noise U(-0.09, 0.09), output-token noise U(-0.08, 0.08)
//   6. judge noise: correctness U(+-0.07), maintainability U(+-0.08),
//      architectural fit U(+-0.08), test quality U(+-0.08),
//      minimality U(+-0.07)
//
// The simulator is total: tasks are validated by the loader and conditions
// and models come from the registry.
class TrialSimulator {
public:
  explicit TrialSimulator(const registry::Registry& registry) : registry_(&registry) {}

  OutcomeRecord Simulate(const tasks::Task& task, const registry::ConditionConfig& condition,
                         const registry::ModelProfile& model, TrialRng& rng) const;

private:
  const registry::Registry* registry_;
};

} // namespace glancelab::sim
