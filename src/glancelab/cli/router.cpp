#include "glancelab/cli/router.hpp"

#include "analysis/adoption_ranker.hpp"
#include "analysis/aggregator.hpp"
#include "analysis/gate_evaluator.hpp"
#include "artifacts/decision_json_writer.hpp"
#include "artifacts/findings_writer.hpp"
#include "artifacts/summary_csv_writer.hpp"
#include "core/csv_utils.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "io/trial_table.hpp"
#include "registry/registry.hpp"
#include "tasks/task_suite_loader.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace glancelab::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);
constexpr int kExitAdoptionRejected =
    core::errors::ToInt(core::errors::ExitCode::kAdoptionRejected);

constexpr std::string_view kVersion = "0.1.0";
constexpr std::string_view kStampPattern = "%Y%m%d_%H%M%S";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  glancelab simulate [--task-suite <file.json>] [--conditions C0,..] "
         "[--models m,..] [--tiers T1,..] [--repo-types r,..] [--repeats N] [--seed N] "
         "[--max-tasks N] [--mode simulate|live] [--out <runs.csv>] "
         "[--latest <runs_latest.csv>] [--log-level <debug|info|warn|error>]\n"
      << "  glancelab analyze [--input <runs.csv>] [--report-dir <dir>] "
         "[--summary-csv <file>] [--candidates C2,C3,C4] [--fail-on-reject] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  glancelab validate-tasks <file.json>\n"
      << "  glancelab version\n"
      << "  glancelab help\n";
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool TakeInt(const std::vector<std::string_view>& args, std::size_t& i, std::int64_t& value,
             std::string& error) {
  const std::string flag(args[i]);
  std::string raw;
  if (!TakeValue(args, i, raw, error)) {
    return false;
  }
  if (!core::csv::ParseInt64(raw, value)) {
    error = "invalid integer for " + flag + ": " + raw;
    return false;
  }
  return true;
}

bool TakeLogLevel(const std::vector<std::string_view>& args, std::size_t& i,
                  core::logging::LogLevel& level, std::string& error) {
  std::string raw;
  if (!TakeValue(args, i, raw, error)) {
    return false;
  }
  return core::logging::ParseLogLevel(raw, level, error);
}

// Parse `simulate` args. Only syntax is checked here; id membership and
// numeric ranges are configuration errors reported after parsing.
bool ParseSimulateOptions(const std::vector<std::string_view>& args, SimulateOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--task-suite") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.task_suite_path = value;
      continue;
    }
    if (token == "--conditions" || token == "--models" || token == "--tiers" ||
        token == "--repo-types") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (token == "--conditions") {
        options.conditions = value;
      } else if (token == "--models") {
        options.models = value;
      } else if (token == "--tiers") {
        options.tiers = value;
      } else {
        options.repo_types = value;
      }
      continue;
    }
    if (token == "--repeats") {
      if (!TakeInt(args, i, options.repeats, error)) {
        return false;
      }
      continue;
    }
    if (token == "--seed") {
      if (!TakeInt(args, i, options.seed, error)) {
        return false;
      }
      continue;
    }
    if (token == "--max-tasks") {
      if (!TakeInt(args, i, options.max_tasks, error)) {
        return false;
      }
      continue;
    }
    if (token == "--mode") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (value != sim::kModeSimulate && value != sim::kModeLive) {
        error = "invalid value for --mode: " + value + " (allowed=live, simulate)";
        return false;
      }
      options.mode = value;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (token == "--latest") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.latest_path = value;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeLogLevel(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "simulate does not accept positional arguments: " + std::string(token);
    }
    return false;
  }
  return true;
}

bool ParseAnalyzeOptions(const std::vector<std::string_view>& args, AnalyzeOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--input") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.input_path = value;
      continue;
    }
    if (token == "--report-dir") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.report_dir = value;
      continue;
    }
    if (token == "--summary-csv") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.summary_csv_path = fs::path(value);
      continue;
    }
    if (token == "--candidates") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.candidates = value;
      continue;
    }
    if (token == "--fail-on-reject") {
      options.fail_on_reject = true;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeLogLevel(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "analyze does not accept positional arguments: " + std::string(token);
    }
    return false;
  }
  return true;
}

// Resolves raw flag text into a plan. Any failure here is a configuration
// error: unknown ids are reported with the allowed set.
bool BuildExperimentPlan(const SimulateOptions& options, const registry::Registry& registry,
                         sim::ExperimentPlan& plan, std::string& error) {
  plan = sim::DefaultPlan(registry);
  plan.mode = options.mode;
  plan.repeats = options.repeats;
  plan.seed = options.seed;
  plan.max_tasks = options.max_tasks;

  if (options.conditions.has_value() &&
      !sim::ParseIdList(*options.conditions, registry.ConditionIds(), "--conditions",
                        plan.condition_ids, error)) {
    return false;
  }
  if (options.models.has_value() &&
      !sim::ParseIdList(*options.models, registry.ModelIds(), "--models", plan.model_ids,
                        error)) {
    return false;
  }
  if (options.tiers.has_value() &&
      !sim::ParseTierSet(*options.tiers, "--tiers", plan.tiers, error)) {
    return false;
  }
  if (options.repo_types.has_value() &&
      !sim::ParseRepoTypeSet(*options.repo_types, "--repo-types", plan.repo_types, error)) {
    return false;
  }
  return sim::ValidatePlan(plan, registry, error);
}

// True when both paths name the same file, including when neither exists yet
// but they normalize to the same location.
bool SameFile(const fs::path& lhs, const fs::path& rhs) {
  std::error_code ec;
  if (fs::exists(lhs, ec) && fs::exists(rhs, ec)) {
    const bool equivalent = fs::equivalent(lhs, rhs, ec);
    if (!ec) {
      return equivalent;
    }
  }
  const fs::path lhs_normalized = fs::weakly_canonical(lhs, ec);
  if (ec) {
    return lhs.lexically_normal() == rhs.lexically_normal();
  }
  const fs::path rhs_normalized = fs::weakly_canonical(rhs, ec);
  if (ec) {
    return lhs.lexically_normal() == rhs.lexically_normal();
  }
  return lhs_normalized == rhs_normalized;
}

bool CopyToLatest(const fs::path& source, const fs::path& latest, std::string& error) {
  if (!core::EnsureParentDirectory(latest, error)) {
    return false;
  }
  std::error_code ec;
  fs::copy_file(source, latest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "failed to copy '" + source.string() + "' to '" + latest.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "glancelab " << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidateTasks(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-tasks requires exactly 1 argument: <file.json>\n";
    return kExitUsage;
  }

  const fs::path suite_path(args.front());
  std::vector<tasks::Task> suite;
  std::string error;
  if (!tasks::LoadTaskSuiteFile(suite_path, suite, error)) {
    std::cerr << "invalid task suite: " << error << '\n';
    return kExitInputInvalid;
  }

  std::cout << "valid: " << suite_path.string() << " tasks=" << suite.size() << '\n';
  return kExitSuccess;
}

int CommandSimulate(const std::vector<std::string_view>& args) {
  SimulateOptions options;
  std::string error;
  if (!ParseSimulateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteSimulate(options);
}

int CommandAnalyze(const std::vector<std::string_view>& args) {
  AnalyzeOptions options;
  std::string error;
  if (!ParseAnalyzeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteAnalyze(options);
}

} // namespace

int ExecuteSimulate(const SimulateOptions& options) {
  core::logging::Logger logger(options.log_level);
  logger.SetCommand("simulate");

  if (options.mode == sim::kModeLive) {
    logger.Error("live mode requested", {{"mode", options.mode}});
    std::cerr << "error: live mode is not wired yet; use --mode simulate\n";
    return kExitUsage;
  }

  const registry::Registry registry = registry::BuildDefaultRegistry();
  std::string error;
  sim::ExperimentPlan plan;
  if (!BuildExperimentPlan(options, registry, plan, error)) {
    logger.Error("invalid experiment configuration", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::vector<tasks::Task> suite;
  if (!tasks::LoadTaskSuiteFile(options.task_suite_path, suite, error)) {
    logger.Error("failed to load task suite",
                 {{"task_suite", options.task_suite_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInputInvalid;
  }

  const auto started_at = std::chrono::system_clock::now();
  const std::string stamp = core::FormatUtcStamp(started_at, kStampPattern);
  io::TrialTableMeta meta;
  meta.run_id = meta.experiment_id + "-" + stamp;
  meta.timestamp_utc = core::FormatUtcTimestamp(started_at);
  meta.mode = plan.mode;
  meta.seed = plan.seed;
  logger.SetRunId(meta.run_id);
  logger.Info("simulation requested",
              {{"task_suite", options.task_suite_path.string()},
               {"tasks_loaded", std::to_string(suite.size())},
               {"conditions", std::to_string(plan.condition_ids.size())},
               {"models", std::to_string(plan.model_ids.size())},
               {"repeats", std::to_string(plan.repeats)},
               {"seed", std::to_string(plan.seed)}});

  std::vector<sim::TrialRecord> records;
  if (!sim::RunExperiment(plan, suite, registry, records, error)) {
    logger.Error("experiment rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  logger.Debug("trial matrix generated", {{"trials", std::to_string(records.size())}});

  const fs::path output_path =
      options.output_path.value_or(fs::path("data") / ("runs_" + stamp + ".csv"));
  if (!io::WriteTrialTableCsv(records, meta, output_path, error)) {
    logger.Error("failed to write run csv",
                 {{"output", output_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (SameFile(output_path, options.latest_path)) {
    logger.Debug("latest path equals output path; skipping copy",
                 {{"latest", options.latest_path.string()}});
  } else if (!CopyToLatest(output_path, options.latest_path, error)) {
    logger.Error("failed to update latest run csv",
                 {{"latest", options.latest_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("simulation completed",
              {{"trials", std::to_string(records.size())}, {"output", output_path.string()}});
  std::cout << "run_id: " << meta.run_id << '\n';
  std::cout << "trials: " << records.size() << '\n';
  std::ostringstream success_rate;
  success_rate << std::fixed << std::setprecision(3) << analysis::Summarize(records).success_rate;
  std::cout << "success_rate: " << success_rate.str() << '\n';
  std::cout << "output: " << output_path.string() << '\n';
  std::cout << "latest: " << options.latest_path.string() << '\n';
  return kExitSuccess;
}

int ExecuteAnalyze(const AnalyzeOptions& options) {
  core::logging::Logger logger(options.log_level);
  logger.SetCommand("analyze");

  const registry::Registry registry = registry::BuildDefaultRegistry();
  analysis::GatePolicy policy;
  policy.baseline_condition = registry.BaselineConditionId();

  std::string error;
  std::vector<std::string> candidates = analysis::kDefaultCandidates;
  if (options.candidates.has_value() &&
      !sim::ParseIdList(*options.candidates, registry.ConditionIds(), "--candidates", candidates,
                        error)) {
    logger.Error("invalid candidate list", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::vector<sim::TrialRecord> records;
  if (!io::LoadTrialTableCsv(options.input_path, records, error)) {
    logger.Error("failed to load run csv",
                 {{"input", options.input_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInputInvalid;
  }
  logger.Info("run csv loaded",
              {{"input", options.input_path.string()}, {"rows", std::to_string(records.size())}});

  analysis::AdoptionDecision decision;
  if (!analysis::EvaluateAdoption(records, candidates, policy, decision, error)) {
    logger.Error("adoption evaluation rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  for (const auto& evaluation : decision.candidates) {
    logger.Debug("candidate evaluated",
                 {{"condition", evaluation.condition},
                  {"gate_count", std::to_string(evaluation.gate_count)},
                  {"frontier_score", std::to_string(evaluation.frontier_score)}});
  }

  const std::vector<analysis::ConditionSummary> summaries =
      analysis::SummarizeByCondition(records);

  const fs::path summary_csv_path = options.summary_csv_path.value_or(
      options.report_dir / "charts" / "condition_summary_latest.csv");
  if (!artifacts::WriteConditionSummaryCsv(summaries, summary_csv_path, error)) {
    logger.Error("failed to write summary csv",
                 {{"output", summary_csv_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  fs::path decision_path;
  if (!artifacts::WriteDecisionJson(decision, options.report_dir, decision_path, error)) {
    logger.Error("failed to write decision.json", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  artifacts::FindingsContext context;
  context.generated_at_utc = core::FormatUtcTimestamp(std::chrono::system_clock::now());
  context.input_path = options.input_path.string();
  context.total_rows = records.size();
  context.policy = policy;
  fs::path findings_path;
  if (!artifacts::WriteFindingsMarkdown(summaries, decision, context, options.report_dir,
                                        findings_path, error)) {
    logger.Error("failed to write findings.md", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("analysis completed",
              {{"recommended", decision.recommended_condition},
               {"adopt", decision.adopt ? "true" : "false"}});
  std::cout << "analyzed: " << records.size() << " rows from " << options.input_path.string()
            << '\n';
  std::cout << "recommended_condition: " << decision.recommended_condition << '\n';
  std::cout << "adoption: " << (decision.adopt ? "adopt" : "not ready") << '\n';
  std::cout << "summary_csv: " << summary_csv_path.string() << '\n';
  std::cout << "decision_json: " << decision_path.string() << '\n';
  std::cout << "findings_md: " << findings_path.string() << '\n';

  if (options.fail_on_reject && !decision.adopt) {
    logger.Warn("adoption rejected", {{"recommended", decision.recommended_condition}});
    return kExitAdoptionRejected;
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "simulate") {
    return CommandSimulate(args);
  }

  if (command == "analyze") {
    return CommandAnalyze(args);
  }

  if (command == "validate-tasks") {
    return CommandValidateTasks(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace glancelab::cli
