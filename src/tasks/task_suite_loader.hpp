#pragma once

#include "registry/registry.hpp"
#include "tasks/task_model.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace glancelab::tasks {

// Parses a task-suite document: `{"tasks": [ {...}, ... ]}`.
//
// Contract:
// - every task needs task_id, title, tier, repo_type, repo_slug,
//   repo_locator, summary (strings) and acceptance_checks (non-empty string
//   array).
// - fails fast on the first bad task; the message cites the 1-based task
//   index and, once readable, the task id.
// - returns false and sets `error` on any parse or schema failure; `tasks` is
//   left empty in that case.
bool ParseTaskSuiteText(std::string_view json_text, std::vector<Task>& tasks, std::string& error);

// Reads and parses a task-suite file. Error messages are prefixed with the path.
bool LoadTaskSuiteFile(const std::filesystem::path& suite_path, std::vector<Task>& tasks,
                       std::string& error);

// Keeps tasks whose tier and repo type are both selected, in suite order, then
// truncates to `max_tasks` when it is > 0.
std::vector<Task> FilterTasks(const std::vector<Task>& tasks,
                              const std::set<registry::Tier>& tiers,
                              const std::set<registry::RepoType>& repo_types,
                              std::size_t max_tasks);

} // namespace glancelab::tasks
