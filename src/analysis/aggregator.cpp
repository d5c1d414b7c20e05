#include "analysis/aggregator.hpp"

#include <algorithm>
#include <iterator>

namespace glancelab::analysis {

namespace {

double SafeMean(double sum, std::size_t count) {
  return count == 0U ? 0.0 : sum / static_cast<double>(count);
}

double AsRate(bool flag) {
  return flag ? 1.0 : 0.0;
}

} // namespace

bool RecordFilter::Matches(const sim::TrialRecord& record) const {
  if (condition.has_value() && record.condition != condition.value()) {
    return false;
  }
  if (tiers.has_value() && tiers->count(record.tier) == 0U) {
    return false;
  }
  return true;
}

std::vector<sim::TrialRecord> FilterRecords(const std::vector<sim::TrialRecord>& records,
                                            const RecordFilter& filter) {
  std::vector<sim::TrialRecord> filtered;
  std::copy_if(records.begin(), records.end(), std::back_inserter(filtered),
               [&filter](const sim::TrialRecord& record) { return filter.Matches(record); });
  return filtered;
}

double Median(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  const std::size_t mid = values.size() / 2U;
  if (values.size() % 2U == 1U) {
    return values[mid];
  }
  return (values[mid - 1U] + values[mid]) / 2.0;
}

ConditionSummary Summarize(const std::vector<sim::TrialRecord>& records) {
  ConditionSummary summary;
  const std::size_t count = records.size();
  summary.n = static_cast<double>(count);
  if (count == 0U) {
    return summary;
  }

  double success = 0.0;
  double tests = 0.0;
  double readiness = 0.0;
  double utilized = 0.0;
  double maintainability = 0.0;
  double test_quality = 0.0;
  std::vector<double> runtimes;
  std::vector<double> tokens;
  std::vector<double> costs;
  runtimes.reserve(count);
  tokens.reserve(count);
  costs.reserve(count);

  for (const auto& record : records) {
    const sim::OutcomeRecord& outcome = record.outcome;
    success += AsRate(outcome.task_success);
    tests += AsRate(outcome.tests_passed);
    utilized += AsRate(outcome.context_utilized);
    readiness += outcome.pr_readiness_score;
    maintainability += outcome.judges.maintainability;
    test_quality += outcome.judges.test_quality;
    runtimes.push_back(outcome.runtime_seconds);
    tokens.push_back(static_cast<double>(outcome.total_tokens));
    costs.push_back(outcome.estimated_cost_usd);
  }

  summary.success_rate = SafeMean(success, count);
  summary.tests_pass_rate = SafeMean(tests, count);
  summary.avg_pr_readiness = SafeMean(readiness, count);
  summary.median_runtime = Median(std::move(runtimes));
  summary.median_tokens = Median(std::move(tokens));
  summary.median_cost = Median(std::move(costs));
  summary.context_utilization_rate = SafeMean(utilized, count);
  summary.avg_maintainability = SafeMean(maintainability, count);
  summary.avg_test_quality = SafeMean(test_quality, count);
  return summary;
}

std::vector<ConditionSummary> SummarizeByCondition(const std::vector<sim::TrialRecord>& records,
                                                   const std::vector<std::string>& order) {
  std::vector<ConditionSummary> summaries;
  for (const auto& condition : order) {
    const std::vector<sim::TrialRecord> subset =
        FilterRecords(records, RecordFilter{.condition = condition});
    if (subset.empty()) {
      continue;
    }
    ConditionSummary summary = Summarize(subset);
    summary.condition = condition;
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

} // namespace glancelab::analysis
