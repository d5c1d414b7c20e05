#include "sim/outcome_record.hpp"

#include <algorithm>

namespace glancelab::sim {

double ComputeReadiness(const JudgeScores& scores, bool tests_passed) {
  const double mean = (scores.correctness + scores.maintainability + scores.architectural_fit +
                       scores.test_quality + scores.minimality) /
                      5.0;
  const double adjusted = mean + (tests_passed ? 0.08 : -0.12);
  return std::clamp(adjusted, 0.0, 1.0);
}

const char* StatusTag(const OutcomeRecord& record) {
  return record.tests_passed ? "ok" : "failed_checks";
}

} // namespace glancelab::sim
