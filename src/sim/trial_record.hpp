#pragma once

#include "registry/registry.hpp"
#include "sim/outcome_record.hpp"

#include <cstdint>
#include <string>

namespace glancelab::sim {

// One row of the trial table: where the trial came from plus what happened.
// Analysis reads only `condition`, `tier` and `outcome`; the rest is carried
// so the CSV stays self-describing.
struct TrialRecord {
  std::int64_t trial_id = 0;
  std::string task_id;
  std::string task_title;
  registry::Tier tier = registry::Tier::kT1;
  std::string repo_type;
  std::string repo_slug;
  std::string repo_locator;
  std::string model;
  std::string condition;
  std::string condition_label;
  int repeat_index = 0;
  bool has_glance_files = false;
  bool discovery_instruction = false;
  std::string inline_strategy;
  int inline_budget_tokens = 0;
  OutcomeRecord outcome;
};

} // namespace glancelab::sim
