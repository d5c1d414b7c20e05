#pragma once

#include <cstdint>
#include <string>

namespace glancelab::sim {

// Five blinded-judge sub-scores, each in [0, 1].
struct JudgeScores {
  double correctness = 0.0;
  double maintainability = 0.0;
  double architectural_fit = 0.0;
  double test_quality = 0.0;
  double minimality = 0.0;

  bool operator==(const JudgeScores& other) const = default;
};

// Result of one simulated trial. Records are facts: produced once by the
// simulator (or read back from a trial table) and never modified.
//
// Invariant: `task_success` implies `tests_passed`.
struct OutcomeRecord {
  bool task_success = false;
  bool tests_passed = false;
  bool context_utilized = false;
  double runtime_seconds = 0.0;
  std::int64_t input_tokens = 0;
  std::int64_t output_tokens = 0;
  std::int64_t total_tokens = 0;
  double estimated_cost_usd = 0.0;
  JudgeScores judges;
  double pr_readiness_score = 0.0;

  bool operator==(const OutcomeRecord& other) const = default;
};

// Composite PR-readiness: mean of the five sub-scores, +0.08 when tests pass
// and -0.12 when they fail, clamped to [0, 1].
double ComputeReadiness(const JudgeScores& scores, bool tests_passed);

// "ok" when tests passed, "failed_checks" otherwise.
const char* StatusTag(const OutcomeRecord& record);

} // namespace glancelab::sim
