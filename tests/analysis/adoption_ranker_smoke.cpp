#include "analysis/adoption_ranker.hpp"

#include "../common/assertions.hpp"
#include "../common/trial_fixtures.hpp"

#include <string>
#include <vector>

namespace {

using glancelab::analysis::GateEvaluation;
using glancelab::tests::common::AppendConditionRows;
using glancelab::tests::common::AssertContains;
using glancelab::tests::common::ConditionRowProfile;
using glancelab::tests::common::Expect;
using glancelab::tests::common::Fail;

glancelab::analysis::AdoptionDecision Decide(const std::vector<glancelab::sim::TrialRecord>& rows) {
  glancelab::analysis::AdoptionDecision decision;
  std::string error;
  if (!glancelab::analysis::EvaluateAdoption(rows, glancelab::analysis::kDefaultCandidates,
                                             glancelab::analysis::GatePolicy{}, decision,
                                             error)) {
    Fail("adoption evaluation failed: " + error);
  }
  return decision;
}

// C3 lifts hard-tier success the most but pays for it in T1 runtime; C4 keeps
// every gate green and wins on frontier score.
void AssertPrefersBalancedCandidate() {
  std::vector<glancelab::sim::TrialRecord> rows;
  AppendConditionRows(rows, "C0",
                      {.t1_successes = 8, .t2_successes = 5, .t3_successes = 4,
                       .t1_runtime = 100.0, .t2_runtime = 220.0, .t3_runtime = 340.0,
                       .cost = 1.0, .maintainability = 0.70, .test_quality = 0.71});
  AppendConditionRows(rows, "C2",
                      {.t1_successes = 8, .t2_successes = 6, .t3_successes = 5,
                       .t1_runtime = 108.0, .t2_runtime = 230.0, .t3_runtime = 350.0,
                       .cost = 1.15, .maintainability = 0.72, .test_quality = 0.72});
  AppendConditionRows(rows, "C3",
                      {.t1_successes = 8, .t2_successes = 7, .t3_successes = 7,
                       .t1_runtime = 136.0, .t2_runtime = 262.0, .t3_runtime = 392.0,
                       .cost = 1.35, .maintainability = 0.68, .test_quality = 0.69});
  AppendConditionRows(rows, "C4",
                      {.t1_successes = 8, .t2_successes = 7, .t3_successes = 6,
                       .t1_runtime = 112.0, .t2_runtime = 244.0, .t3_runtime = 368.0,
                       .cost = 1.20, .maintainability = 0.73, .test_quality = 0.74});

  const auto decision = Decide(rows);
  Expect(decision.recommended_condition == "C4", "C4 must be recommended");
  Expect(decision.adopt, "C4 passes all gates, so adoption is accepted");
  Expect(decision.recommended.condition == "C4", "recommended evaluation matches");
  Expect(decision.candidates.size() == 3U, "every candidate is ranked");
  Expect(decision.candidates[1].condition == "C2", "C2 ranks second");
  Expect(!decision.candidates[2].gate_runtime, "C3 fails the runtime gate");
}

void AssertRejectsWhenNoCandidateLifts() {
  std::vector<glancelab::sim::TrialRecord> rows;
  for (const std::string condition : {"C0", "C2", "C3", "C4"}) {
    const bool baseline = condition == "C0";
    AppendConditionRows(rows, condition,
                        ConditionRowProfile{.t1_successes = 7,
                                         .t2_successes = 5,
                                         .t3_successes = 4,
                                         .t1_runtime = baseline ? 100.0 : 123.0,
                                         .t2_runtime = 220.0,
                                         .t3_runtime = 340.0,
                                         .cost = baseline ? 1.0 : 1.4,
                                         .maintainability = baseline ? 0.70 : 0.66,
                                         .test_quality = baseline ? 0.70 : 0.66});
  }

  const auto decision = Decide(rows);
  Expect(!decision.adopt, "no candidate passes every gate");
  Expect(!decision.recommended_condition.empty(), "a best-available condition is still named");
  for (const auto& candidate : decision.candidates) {
    Expect(!candidate.gate_success, "no candidate lifts hard-tier success");
  }
}

void AssertTieBreakOrder() {
  std::vector<GateEvaluation> evaluations(4);
  evaluations[0].condition = "low-gates";
  evaluations[0].gate_count = 2;
  evaluations[0].frontier_score = 0.9;
  evaluations[1].condition = "same-frontier-lower-success";
  evaluations[1].gate_count = 3;
  evaluations[1].frontier_score = 0.1;
  evaluations[1].harder_success_rate = 0.5;
  evaluations[2].condition = "same-frontier-higher-success";
  evaluations[2].gate_count = 3;
  evaluations[2].frontier_score = 0.1;
  evaluations[2].harder_success_rate = 0.6;
  evaluations[3].condition = "full-tie";
  evaluations[3].gate_count = 3;
  evaluations[3].frontier_score = 0.1;
  evaluations[3].harder_success_rate = 0.5;

  glancelab::analysis::RankEvaluations(evaluations);
  Expect(evaluations[0].condition == "same-frontier-higher-success",
         "harder-tier success breaks frontier ties");
  Expect(evaluations[1].condition == "same-frontier-lower-success" &&
             evaluations[2].condition == "full-tie",
         "full ties keep input order");
  Expect(evaluations[3].condition == "low-gates", "gate count dominates frontier score");
}

void AssertCandidateListValidation() {
  std::vector<glancelab::sim::TrialRecord> rows;
  glancelab::analysis::AdoptionDecision decision;
  std::string error;
  Expect(!glancelab::analysis::EvaluateAdoption(rows, {}, glancelab::analysis::GatePolicy{},
                                                decision, error),
         "empty candidate list must be rejected");
  AssertContains(error, "at least one candidate");

  Expect(!glancelab::analysis::EvaluateAdoption(rows, {"C0", "C4"},
                                                glancelab::analysis::GatePolicy{}, decision,
                                                error),
         "baseline must not be a candidate");
  AssertContains(error, "baseline");
}

} // namespace

int main() {
  AssertPrefersBalancedCandidate();
  AssertRejectsWhenNoCandidateLifts();
  AssertTieBreakOrder();
  AssertCandidateListValidation();
  return 0;
}
