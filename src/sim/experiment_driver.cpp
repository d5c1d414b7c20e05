#include "sim/experiment_driver.hpp"

#include "sim/trial_rng.hpp"
#include "sim/trial_simulator.hpp"
#include "tasks/task_suite_loader.hpp"

#include <algorithm>
#include <cctype>

namespace glancelab::sim {

namespace {

std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

std::string Join(const std::vector<std::string>& items) {
  std::string joined;
  for (const auto& item : items) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += item;
  }
  return joined;
}

std::vector<std::string> SortedCopy(std::vector<std::string> items) {
  std::sort(items.begin(), items.end());
  return items;
}

// Plan values may be set directly by C++ callers, so ids are re-checked even
// when they came through ParseIdList.
bool CheckKnownIds(const std::vector<std::string>& ids, const std::vector<std::string>& allowed,
                   std::string_view field_name, std::string& error) {
  if (ids.empty()) {
    error = std::string(field_name) + " must include at least one value.";
    return false;
  }
  std::vector<std::string> invalid;
  for (const auto& id : ids) {
    if (std::find(allowed.begin(), allowed.end(), id) == allowed.end()) {
      invalid.push_back(id);
    }
  }
  if (!invalid.empty()) {
    error = std::string(field_name) + " includes unsupported values: " + Join(invalid) +
            "; allowed=" + Join(SortedCopy(allowed));
    return false;
  }
  return true;
}

} // namespace

ExperimentPlan DefaultPlan(const registry::Registry& registry) {
  ExperimentPlan plan;
  plan.condition_ids = registry.ConditionIds();
  plan.model_ids = registry.ModelIds();
  for (std::size_t i = 0; i < registry::kTierCount; ++i) {
    plan.tiers.insert(static_cast<registry::Tier>(i));
  }
  for (std::size_t i = 0; i < registry::kRepoTypeCount; ++i) {
    plan.repo_types.insert(static_cast<registry::RepoType>(i));
  }
  return plan;
}

bool ParseIdList(std::string_view raw, const std::vector<std::string>& allowed,
                 std::string_view field_name, std::vector<std::string>& values,
                 std::string& error) {
  std::vector<std::string> parsed;
  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t comma = raw.find(',', start);
    const std::size_t stop = comma == std::string_view::npos ? raw.size() : comma;
    std::string item = Trim(raw.substr(start, stop - start));
    if (!item.empty()) {
      parsed.push_back(std::move(item));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }

  if (!CheckKnownIds(parsed, allowed, field_name, error)) {
    return false;
  }
  values = std::move(parsed);
  return true;
}

bool ParseTierSet(std::string_view raw, std::string_view field_name,
                  std::set<registry::Tier>& tiers, std::string& error) {
  std::vector<std::string> names;
  if (!ParseIdList(raw, registry::AllTierNames(), field_name, names, error)) {
    return false;
  }
  tiers.clear();
  for (const auto& name : names) {
    tiers.insert(registry::ParseTier(name).value());
  }
  return true;
}

bool ParseRepoTypeSet(std::string_view raw, std::string_view field_name,
                      std::set<registry::RepoType>& repo_types, std::string& error) {
  std::vector<std::string> names;
  if (!ParseIdList(raw, registry::AllRepoTypeNames(), field_name, names, error)) {
    return false;
  }
  repo_types.clear();
  for (const auto& name : names) {
    repo_types.insert(registry::ParseRepoType(name).value());
  }
  return true;
}

bool ValidatePlan(const ExperimentPlan& plan, const registry::Registry& registry,
                  std::string& error) {
  if (plan.mode == kModeLive) {
    error = "live mode is not wired yet; use --mode simulate";
    return false;
  }
  if (plan.mode != kModeSimulate) {
    error = "unsupported mode: " + plan.mode + " (allowed=live, simulate)";
    return false;
  }
  if (plan.repeats <= 0) {
    error = "--repeats must be >= 1 (got " + std::to_string(plan.repeats) + ")";
    return false;
  }
  if (plan.max_tasks < 0) {
    error = "--max-tasks must be >= 0 (got " + std::to_string(plan.max_tasks) + ")";
    return false;
  }
  if (!CheckKnownIds(plan.condition_ids, registry.ConditionIds(), "--conditions", error) ||
      !CheckKnownIds(plan.model_ids, registry.ModelIds(), "--models", error)) {
    return false;
  }
  if (plan.tiers.empty()) {
    error = "--tiers must include at least one value.";
    return false;
  }
  if (plan.repo_types.empty()) {
    error = "--repo-types must include at least one value.";
    return false;
  }
  return true;
}

bool RunExperiment(const ExperimentPlan& plan, const std::vector<tasks::Task>& tasks,
                   const registry::Registry& registry, std::vector<TrialRecord>& records,
                   std::string& error) {
  records.clear();
  if (!ValidatePlan(plan, registry, error)) {
    return false;
  }

  const std::vector<tasks::Task> selected = tasks::FilterTasks(
      tasks, plan.tiers, plan.repo_types, static_cast<std::size_t>(plan.max_tasks));
  if (selected.empty()) {
    error = "No tasks selected after filters. Adjust --tiers/--repo-types/--max-tasks.";
    return false;
  }

  // ValidatePlan guarantees every id resolves.
  std::vector<const registry::ConditionConfig*> conditions;
  for (const auto& id : plan.condition_ids) {
    conditions.push_back(registry.FindCondition(id));
  }
  std::vector<const registry::ModelProfile*> models;
  for (const auto& id : plan.model_ids) {
    models.push_back(registry.FindModel(id));
  }

  const TrialSimulator simulator(registry);
  TrialRng rng(static_cast<std::uint64_t>(plan.seed));

  std::vector<TrialRecord> generated;
  generated.reserve(selected.size() * conditions.size() * models.size() *
                    static_cast<std::size_t>(plan.repeats));
  std::int64_t trial_id = 1;
  for (const auto& task : selected) {
    for (const auto* condition : conditions) {
      for (const auto* model : models) {
        for (std::int64_t repeat = 1; repeat <= plan.repeats; ++repeat) {
          TrialRecord record;
          record.trial_id = trial_id++;
          record.task_id = task.task_id;
          record.task_title = task.title;
          record.tier = task.tier;
          record.repo_type = registry::ToString(task.repo_type);
          record.repo_slug = task.repo_slug;
          record.repo_locator = task.repo_locator;
          record.model = model->id;
          record.condition = condition->id;
          record.condition_label = condition->label;
          record.repeat_index = static_cast<int>(repeat);
          record.has_glance_files = condition->has_glance_files;
          record.discovery_instruction = condition->discovery_instruction;
          record.inline_strategy = condition->inline_strategy;
          record.inline_budget_tokens = condition->inline_budget_tokens;
          record.outcome = simulator.Simulate(task, *condition, *model, rng);
          generated.push_back(std::move(record));
        }
      }
    }
  }

  records = std::move(generated);
  return true;
}

} // namespace glancelab::sim
