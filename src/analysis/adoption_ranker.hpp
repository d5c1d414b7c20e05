#pragma once

#include "analysis/gate_evaluator.hpp"
#include "sim/trial_record.hpp"

#include <string>
#include <vector>

namespace glancelab::analysis {

inline const std::vector<std::string> kDefaultCandidates = {"C2", "C3", "C4"};

// Final verdict for one analysis run. Built once from a complete record set
// and read-only afterwards.
struct AdoptionDecision {
  std::string recommended_condition;
  bool adopt = false;
  GateEvaluation recommended;
  // Every candidate, best first.
  std::vector<GateEvaluation> candidates;
};

// Sorts best-first by (gate_count, frontier_score, harder_success_rate), each
// field breaking ties in the previous one. Full ties keep input order.
void RankEvaluations(std::vector<GateEvaluation>& evaluations);

// Evaluates every candidate against the baseline, ranks them and recommends
// the top entry. `adopt` is true only when the recommended entry passes all
// four gates. A recommendation is produced even when no candidate passes
// every gate.
//
// Returns false and sets `error` when `candidates` is empty or names the
// baseline itself.
bool EvaluateAdoption(const std::vector<sim::TrialRecord>& records,
                      const std::vector<std::string>& candidates, const GatePolicy& policy,
                      AdoptionDecision& decision, std::string& error);

} // namespace glancelab::analysis
