#pragma once

#include "registry/registry.hpp"

#include <string>
#include <vector>

namespace glancelab::tasks {

// One benchmark task from the suite. Loaded once and never modified; the
// loader guarantees `tier`/`repo_type` are valid enum members and that
// `acceptance_checks` is non-empty.
struct Task {
  std::string task_id;
  std::string title;
  registry::Tier tier = registry::Tier::kT1;
  registry::RepoType repo_type = registry::RepoType::kLibraryCli;
  std::string repo_slug;
  std::string repo_locator;
  std::string summary;
  std::vector<std::string> acceptance_checks;
};

} // namespace glancelab::tasks
