#include "sim/trial_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace glancelab::sim {

namespace {

constexpr double kMinSuccessProbability = 0.02;
constexpr double kMaxSuccessProbability = 0.98;
constexpr double kSuccessNoise = 0.05;
// Tests can pass on a rejected change ("green but not accepted").
constexpr double kTestsPassWithoutSuccess = 0.08;
constexpr double kUtilizationNoise = 0.04;
constexpr double kUtilizedRuntimeMultiplier = 1.04;
constexpr double kRuntimeNoise = 0.10;
constexpr double kMinRuntimeSeconds = 120.0;
constexpr double kInputTokenNoise = 0.09;
constexpr double kOutputTokenNoise = 0.08;
constexpr double kMinInputTokens = 800.0;
constexpr double kMinOutputTokens = 200.0;
constexpr double kSuccessOutputBonus = 0.11;
constexpr double kFailureOutputPenalty = -0.06;

double Clamp(double value, double low, double high) {
  return std::max(low, std::min(high, value));
}

double RoundTo(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

JudgeScores RoundScores(const JudgeScores& scores) {
  return {
      .correctness = RoundTo(scores.correctness, 4),
      .maintainability = RoundTo(scores.maintainability, 4),
      .architectural_fit = RoundTo(scores.architectural_fit, 4),
      .test_quality = RoundTo(scores.test_quality, 4),
      .minimality = RoundTo(scores.minimality, 4),
  };
}

} // namespace

OutcomeRecord TrialSimulator::Simulate(const tasks::Task& task,
                                       const registry::ConditionConfig& condition,
                                       const registry::ModelProfile& model, TrialRng& rng) const {
  const registry::TierProfile& tier = registry_->TierProfileFor(task.tier);
  const registry::RepoTypeProfile& repo = registry_->RepoTypeProfileFor(task.repo_type);
  const std::size_t tier_index = registry::Index(task.tier);
  const bool easiest_tier = task.tier == registry::Tier::kT1;

  OutcomeRecord record;

  const double success_probability =
      Clamp(tier.success_base + repo.success_delta + model.success_bias +
                condition.success_delta + condition.tier_success_bonus[tier_index] +
                rng.Uniform(-kSuccessNoise, kSuccessNoise),
            kMinSuccessProbability, kMaxSuccessProbability);
  record.task_success = rng.Bernoulli(success_probability);

  // Passing tests is a precondition for success, enforced after both draws.
  record.tests_passed = record.task_success || rng.Bernoulli(kTestsPassWithoutSuccess);
  if (!record.tests_passed) {
    record.task_success = false;
  }

  if (condition.has_glance_files) {
    const double utilization_probability =
        Clamp(tier.context_base + condition.utilization_boost + model.utilization_bonus +
                  rng.Uniform(-kUtilizationNoise, kUtilizationNoise),
              0.0, 1.0);
    record.context_utilized = rng.Bernoulli(utilization_probability);
  }

  double runtime = tier.runtime_base_seconds * repo.runtime_multiplier;
  runtime *= 1.0 + condition.runtime_delta;
  runtime *= condition.tier_runtime_surcharge[tier_index];
  if (record.context_utilized && !easiest_tier) {
    runtime *= kUtilizedRuntimeMultiplier;
  }
  runtime *= 1.0 + rng.Uniform(-kRuntimeNoise, kRuntimeNoise);
  record.runtime_seconds = RoundTo(std::max(kMinRuntimeSeconds, runtime), 2);

  const double raw_input = tier.input_token_base * repo.token_multiplier *
                           model.token_multiplier * (1.0 + condition.token_delta) *
                           (1.0 + rng.Uniform(-kInputTokenNoise, kInputTokenNoise));
  record.input_tokens = static_cast<std::int64_t>(std::max(kMinInputTokens, raw_input));

  const double raw_output =
      static_cast<double>(record.input_tokens) * model.output_ratio *
      (1.0 + (record.task_success ? kSuccessOutputBonus : kFailureOutputPenalty)) *
      (1.0 + rng.Uniform(-kOutputTokenNoise, kOutputTokenNoise));
  record.output_tokens = static_cast<std::int64_t>(std::max(kMinOutputTokens, raw_output));
  record.total_tokens = record.input_tokens + record.output_tokens;

  const double cost =
      (static_cast<double>(record.input_tokens) / 1000.0) * model.input_cost_per_1k +
      (static_cast<double>(record.output_tokens) / 1000.0) * model.output_cost_per_1k;
  record.estimated_cost_usd = RoundTo(cost, 4);

  JudgeScores scores;
  scores.correctness = Clamp(0.25 + (record.task_success ? 0.56 : 0.20) +
                                 condition.success_delta + model.success_bias +
                                 rng.Uniform(-0.07, 0.07),
                             0.0, 1.0);
  scores.maintainability = Clamp(0.44 + (record.task_success ? 0.20 : -0.04) +
                                     condition.readiness_delta + model.readiness_bias +
                                     rng.Uniform(-0.08, 0.08),
                                 0.0, 1.0);
  scores.architectural_fit = Clamp(0.40 + (record.context_utilized ? 0.26 : 0.0) +
                                       (record.task_success ? 0.16 : 0.0) +
                                       rng.Uniform(-0.08, 0.08),
                                   0.0, 1.0);
  scores.test_quality = Clamp(0.38 + (record.tests_passed ? 0.28 : -0.05) +
                                  condition.readiness_delta + rng.Uniform(-0.08, 0.08),
                              0.0, 1.0);
  scores.minimality =
      Clamp(0.64 - condition.minimality_penalty -
                (easiest_tier ? condition.easy_tier_minimality_penalty : 0.0) +
                rng.Uniform(-0.07, 0.07),
            0.0, 1.0);

  record.pr_readiness_score = RoundTo(ComputeReadiness(scores, record.tests_passed), 4);
  record.judges = RoundScores(scores);
  return record;
}

} // namespace glancelab::sim
