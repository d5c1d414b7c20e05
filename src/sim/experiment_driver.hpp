#pragma once

#include "registry/registry.hpp"
#include "sim/trial_record.hpp"
#include "tasks/task_model.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace glancelab::sim {

inline constexpr std::int64_t kDefaultSeed = 20260220;
inline constexpr std::string_view kModeSimulate = "simulate";
inline constexpr std::string_view kModeLive = "live";

// Everything the driver needs to build the trial matrix. Empty id lists and
// sets are invalid; callers fill them from CLI flags or registry defaults.
struct ExperimentPlan {
  std::string mode = std::string(kModeSimulate);
  std::vector<std::string> condition_ids;
  std::vector<std::string> model_ids;
  std::set<registry::Tier> tiers;
  std::set<registry::RepoType> repo_types;
  std::int64_t repeats = 5;
  std::int64_t seed = kDefaultSeed;
  // 0 keeps every task that survives the tier/repo filters.
  std::int64_t max_tasks = 0;
};

// Plan populated with every condition, model, tier and repo type.
ExperimentPlan DefaultPlan(const registry::Registry& registry);

// Splits a comma-separated flag value, trimming blanks, and checks each item
// against `allowed`.
//
// Errors (returns false):
// - no non-blank items: "<field> must include at least one value."
// - unknown items: "<field> includes unsupported values: X, Y; allowed=..."
//   with the allowed set sorted.
bool ParseIdList(std::string_view raw, const std::vector<std::string>& allowed,
                 std::string_view field_name, std::vector<std::string>& values,
                 std::string& error);

bool ParseTierSet(std::string_view raw, std::string_view field_name,
                  std::set<registry::Tier>& tiers, std::string& error);

bool ParseRepoTypeSet(std::string_view raw, std::string_view field_name,
                      std::set<registry::RepoType>& repo_types, std::string& error);

// Checks mode, repeats, max_tasks and that every id is known to `registry`.
bool ValidatePlan(const ExperimentPlan& plan, const registry::Registry& registry,
                  std::string& error);

// Generates the full trial matrix eagerly:
//   for task (filtered, suite order) x condition x model x repeat 1..N
// with one stream seeded from `plan.seed` advanced sequentially. Trial ids
// start at 1.
//
// Validation runs to completion before any trial is simulated; on failure
// `records` is left empty and `error` names the offending value.
bool RunExperiment(const ExperimentPlan& plan, const std::vector<tasks::Task>& tasks,
                   const registry::Registry& registry, std::vector<TrialRecord>& records,
                   std::string& error);

} // namespace glancelab::sim
