#include "tasks/task_suite_loader.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace glancelab::tasks {

namespace {

using JsonValue = core::json::Value;

constexpr std::array<std::string_view, 7> kRequiredStringKeys = {
    "task_id", "title", "tier", "repo_type", "repo_slug", "repo_locator", "summary",
};
constexpr std::string_view kAcceptanceChecksKey = "acceptance_checks";

std::string JoinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

// Missing keys in sorted order, independent of document key order.
std::vector<std::string> MissingKeys(const JsonValue& task) {
  std::vector<std::string> missing;
  for (const auto key : kRequiredStringKeys) {
    if (task.Find(key) == nullptr) {
      missing.emplace_back(key);
    }
  }
  if (task.Find(kAcceptanceChecksKey) == nullptr) {
    missing.emplace_back(kAcceptanceChecksKey);
  }
  std::sort(missing.begin(), missing.end());
  return missing;
}

bool ReadStringField(const JsonValue& task, std::string_view key, std::string_view task_label,
                     std::string& out, std::string& error) {
  const JsonValue* field = task.Find(key);
  if (field == nullptr || !field->IsString()) {
    error = "Task " + std::string(task_label) + " field '" + std::string(key) +
            "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ParseTask(const JsonValue& raw, std::size_t index, Task& task, std::string& error) {
  const std::string index_label = std::to_string(index);
  if (!raw.IsObject()) {
    error = "Invalid task at index " + index_label + ": expected object.";
    return false;
  }

  const std::vector<std::string> missing = MissingKeys(raw);
  if (!missing.empty()) {
    error = "Task " + index_label + " missing required keys: " + JoinNames(missing);
    return false;
  }

  if (!ReadStringField(raw, "task_id", index_label, task.task_id, error)) {
    return false;
  }
  if (task.task_id.empty()) {
    error = "Task " + index_label + " has an empty task_id";
    return false;
  }
  const std::string& id = task.task_id;

  std::string tier_text;
  std::string repo_type_text;
  if (!ReadStringField(raw, "title", id, task.title, error) ||
      !ReadStringField(raw, "tier", id, tier_text, error) ||
      !ReadStringField(raw, "repo_type", id, repo_type_text, error) ||
      !ReadStringField(raw, "repo_slug", id, task.repo_slug, error) ||
      !ReadStringField(raw, "repo_locator", id, task.repo_locator, error) ||
      !ReadStringField(raw, "summary", id, task.summary, error)) {
    return false;
  }

  const auto tier = registry::ParseTier(tier_text);
  if (!tier.has_value()) {
    error = "Task " + id + " has unsupported tier: " + tier_text +
            " (allowed=" + JoinNames(registry::AllTierNames()) + ")";
    return false;
  }
  task.tier = tier.value();

  const auto repo_type = registry::ParseRepoType(repo_type_text);
  if (!repo_type.has_value()) {
    error = "Task " + id + " has unsupported repo_type: " + repo_type_text +
            " (allowed=" + JoinNames(registry::AllRepoTypeNames()) + ")";
    return false;
  }
  task.repo_type = repo_type.value();

  const JsonValue* checks = raw.Find(kAcceptanceChecksKey);
  if (!checks->IsArray() || checks->array_value.empty()) {
    error = "Task " + id + " must include non-empty acceptance_checks.";
    return false;
  }
  task.acceptance_checks.clear();
  for (const auto& check : checks->array_value) {
    if (!check.IsString()) {
      error = "Task " + id + " acceptance_checks entries must be strings.";
      return false;
    }
    task.acceptance_checks.push_back(check.string_value);
  }

  return true;
}

} // namespace

bool ParseTaskSuiteText(std::string_view json_text, std::vector<Task>& tasks,
                        std::string& error) {
  tasks.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "Invalid task suite: " + parse_error;
    return false;
  }

  const JsonValue* task_list = root.Find("tasks");
  if (!root.IsObject() || task_list == nullptr) {
    error = "Invalid task suite: expected object with 'tasks'.";
    return false;
  }
  if (!task_list->IsArray() || task_list->array_value.empty()) {
    error = "Invalid task suite: 'tasks' must be a non-empty list.";
    return false;
  }

  std::vector<Task> parsed;
  parsed.reserve(task_list->array_value.size());
  std::size_t index = 1;
  for (const auto& raw_task : task_list->array_value) {
    Task task;
    if (!ParseTask(raw_task, index, task, error)) {
      return false;
    }
    parsed.push_back(std::move(task));
    ++index;
  }

  tasks = std::move(parsed);
  return true;
}

bool LoadTaskSuiteFile(const std::filesystem::path& suite_path, std::vector<Task>& tasks,
                       std::string& error) {
  tasks.clear();

  std::string contents;
  if (!core::ReadTextFile(suite_path, contents, error)) {
    return false;
  }

  std::string parse_error;
  if (!ParseTaskSuiteText(contents, tasks, parse_error)) {
    error = suite_path.string() + ": " + parse_error;
    return false;
  }
  return true;
}

std::vector<Task> FilterTasks(const std::vector<Task>& tasks,
                              const std::set<registry::Tier>& tiers,
                              const std::set<registry::RepoType>& repo_types,
                              std::size_t max_tasks) {
  std::vector<Task> filtered;
  for (const auto& task : tasks) {
    if (tiers.count(task.tier) == 0U || repo_types.count(task.repo_type) == 0U) {
      continue;
    }
    filtered.push_back(task);
    if (max_tasks > 0U && filtered.size() == max_tasks) {
      break;
    }
  }
  return filtered;
}

} // namespace glancelab::tasks
