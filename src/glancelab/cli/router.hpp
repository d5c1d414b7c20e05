#pragma once

#include "core/logging/logger.hpp"
#include "sim/experiment_driver.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace glancelab::cli {

// Options for `glancelab simulate`. List-valued fields hold the raw
// comma-separated flag text; unset means "every value the registry knows".
struct SimulateOptions {
  std::filesystem::path task_suite_path = "data/task_suite_v1.json";
  std::optional<std::string> conditions;
  std::optional<std::string> models;
  std::optional<std::string> tiers;
  std::optional<std::string> repo_types;
  std::int64_t repeats = 5;
  std::int64_t seed = sim::kDefaultSeed;
  std::int64_t max_tasks = 0;
  std::string mode = std::string(sim::kModeSimulate);
  // Unset means `data/runs_<utc stamp>.csv`.
  std::optional<std::filesystem::path> output_path;
  std::filesystem::path latest_path = "data/runs_latest.csv";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options for `glancelab analyze`.
struct AnalyzeOptions {
  std::filesystem::path input_path = "data/runs_latest.csv";
  std::filesystem::path report_dir = "report";
  // Unset means `<report_dir>/charts/condition_summary_latest.csv`.
  std::optional<std::filesystem::path> summary_csv_path;
  std::optional<std::string> candidates;
  bool fail_on_reject = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs the full simulate pipeline (load suite, build plan, generate matrix,
// write run CSV and latest copy) and returns a process exit code.
int ExecuteSimulate(const SimulateOptions& options);

// Runs the full analyze pipeline (load run CSV, summarize, evaluate adoption,
// write summary CSV, decision.json and findings.md) and returns a process
// exit code.
int ExecuteAnalyze(const AnalyzeOptions& options);

// Routes `glancelab` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation (I/O)
//   2  => usage error (unknown command / invalid args / live mode)
//   10 => experiment configuration invalid
//   11 => task suite or run CSV invalid
//   30 => adoption rejected (analyze --fail-on-reject only)
int Dispatch(int argc, char** argv);

} // namespace glancelab::cli
