#include "analysis/adoption_ranker.hpp"

#include <algorithm>
#include <tuple>

namespace glancelab::analysis {

void RankEvaluations(std::vector<GateEvaluation>& evaluations) {
  std::stable_sort(evaluations.begin(), evaluations.end(),
                   [](const GateEvaluation& lhs, const GateEvaluation& rhs) {
                     return std::tie(lhs.gate_count, lhs.frontier_score,
                                     lhs.harder_success_rate) >
                            std::tie(rhs.gate_count, rhs.frontier_score,
                                     rhs.harder_success_rate);
                   });
}

bool EvaluateAdoption(const std::vector<sim::TrialRecord>& records,
                      const std::vector<std::string>& candidates, const GatePolicy& policy,
                      AdoptionDecision& decision, std::string& error) {
  decision = AdoptionDecision{};
  if (candidates.empty()) {
    error = "at least one candidate condition is required";
    return false;
  }

  std::vector<GateEvaluation> evaluations;
  evaluations.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    if (candidate == policy.baseline_condition) {
      error = "candidate list must not include the baseline condition " +
              policy.baseline_condition;
      return false;
    }
    evaluations.push_back(EvaluateCondition(records, candidate, policy));
  }

  RankEvaluations(evaluations);

  decision.recommended = evaluations.front();
  decision.recommended_condition = decision.recommended.condition;
  decision.adopt = decision.recommended.PassesAllGates();
  decision.candidates = std::move(evaluations);
  return true;
}

} // namespace glancelab::analysis
