#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using glancelab::tests::common::AssertContains;
using glancelab::tests::common::AssertNotContains;
using glancelab::tests::common::DispatchArgsCaptured;
using glancelab::tests::common::ExpectExitCode;

struct CliResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

CliResult Run(const std::vector<std::string>& argv) {
  CliResult result;
  result.exit_code = DispatchArgsCaptured(argv, result.out, result.err);
  return result;
}

void AssertUsageErrors() {
  const CliResult no_command = Run({"glancelab"});
  ExpectExitCode(no_command.exit_code, 2, "no command");
  AssertContains(no_command.err, "usage:");

  const CliResult unknown = Run({"glancelab", "bogus"});
  ExpectExitCode(unknown.exit_code, 2, "unknown command");

  const CliResult unknown_flag = Run({"glancelab", "simulate", "--bogus"});
  ExpectExitCode(unknown_flag.exit_code, 2, "unknown simulate flag");
  AssertContains(unknown_flag.err, "unknown option: --bogus");

  const CliResult bad_int = Run({"glancelab", "simulate", "--repeats", "many"});
  ExpectExitCode(bad_int.exit_code, 2, "non-integer repeats");
  AssertContains(bad_int.err, "invalid integer for --repeats: many");

  const CliResult bad_mode = Run({"glancelab", "simulate", "--mode", "replay"});
  ExpectExitCode(bad_mode.exit_code, 2, "unknown mode");

  const CliResult live = Run({"glancelab", "simulate", "--mode", "live"});
  ExpectExitCode(live.exit_code, 2, "live mode");
  AssertContains(live.err, "live mode is not wired yet");

  const CliResult bad_level = Run({"glancelab", "analyze", "--log-level", "loud"});
  ExpectExitCode(bad_level.exit_code, 2, "bad log level");
  AssertContains(bad_level.err, "invalid --log-level 'loud'");

  const CliResult help = Run({"glancelab", "help"});
  ExpectExitCode(help.exit_code, 0, "help");
  AssertContains(help.out, "glancelab simulate");
  AssertContains(help.out, "glancelab analyze");
}

void AssertConfigErrors(const fs::path& temp) {
  const std::string out = (temp / "unused.csv").string();
  const std::string latest = (temp / "unused_latest.csv").string();

  const CliResult bad_condition =
      Run({"glancelab", "simulate", "--conditions", "C0,C9", "--out", out, "--latest", latest});
  ExpectExitCode(bad_condition.exit_code, 10, "unsupported condition");
  AssertContains(bad_condition.err, "--conditions includes unsupported values: C9");
  AssertContains(bad_condition.err, "allowed=C0, C1, C2, C3, C4");

  const CliResult bad_tier =
      Run({"glancelab", "simulate", "--tiers", "T4", "--out", out, "--latest", latest});
  ExpectExitCode(bad_tier.exit_code, 10, "unsupported tier");

  const CliResult zero_repeats =
      Run({"glancelab", "simulate", "--repeats", "0", "--out", out, "--latest", latest});
  ExpectExitCode(zero_repeats.exit_code, 10, "zero repeats");
  AssertContains(zero_repeats.err, "--repeats must be >= 1");

  const CliResult bad_candidate = Run({"glancelab", "analyze", "--candidates", "C7"});
  ExpectExitCode(bad_candidate.exit_code, 10, "unsupported candidate");

  // Rejected configurations must not leave a run file behind.
  glancelab::tests::common::Expect(!fs::exists(out), "config errors must not write output");
}

void AssertInputErrors(const fs::path& temp) {
  const fs::path broken_suite = temp / "broken_suite.json";
  glancelab::tests::common::WriteStringToFile(broken_suite, "{\"tasks\": []}");

  const CliResult bad_suite =
      Run({"glancelab", "simulate", "--task-suite", broken_suite.string(), "--out",
           (temp / "x.csv").string(), "--latest", (temp / "x_latest.csv").string()});
  ExpectExitCode(bad_suite.exit_code, 11, "invalid task suite");
  AssertContains(bad_suite.err, "'tasks' must be a non-empty list");

  const CliResult missing_suite =
      Run({"glancelab", "validate-tasks", (temp / "absent.json").string()});
  ExpectExitCode(missing_suite.exit_code, 11, "missing task suite");
  AssertContains(missing_suite.err, "invalid task suite:");

  const CliResult missing_input =
      Run({"glancelab", "analyze", "--input", (temp / "absent.csv").string(), "--report-dir",
           (temp / "report").string()});
  ExpectExitCode(missing_input.exit_code, 11, "missing run csv");
  glancelab::tests::common::Expect(!fs::exists(temp / "report" / "decision.json"),
                                   "input errors must not write reports");

  const fs::path malformed = temp / "malformed.csv";
  glancelab::tests::common::WriteStringToFile(malformed,
                                              "condition,task_tier,task_success\n"
                                              "C0,T2,yes\n");
  const CliResult malformed_input =
      Run({"glancelab", "analyze", "--input", malformed.string(), "--report-dir",
           (temp / "report").string()});
  ExpectExitCode(malformed_input.exit_code, 11, "malformed run csv");
  AssertContains(malformed_input.err, "column 'task_success' is not numeric");
}

void AssertInformational() {
  const CliResult version = Run({"glancelab", "version"});
  ExpectExitCode(version.exit_code, 0, "version");
  AssertContains(version.out, "glancelab 0.1.0");

  const fs::path suite = glancelab::tests::common::ResolveRepoFile("data/task_suite_v1.json");
  const CliResult valid = Run({"glancelab", "validate-tasks", suite.string()});
  ExpectExitCode(valid.exit_code, 0, "validate-tasks");
  AssertContains(valid.out, "tasks=12");
}

void AssertLogging(const fs::path& temp) {
  const fs::path suite = glancelab::tests::common::ResolveRepoFile("data/task_suite_v1.json");
  const CliResult quiet =
      Run({"glancelab", "simulate", "--task-suite", suite.string(), "--max-tasks", "1",
           "--repeats", "1", "--out", (temp / "quiet.csv").string(), "--latest",
           (temp / "quiet_latest.csv").string(), "--log-level", "warn"});
  ExpectExitCode(quiet.exit_code, 0, "quiet simulate");
  AssertNotContains(quiet.err, "level=INFO");

  const CliResult verbose =
      Run({"glancelab", "simulate", "--task-suite", suite.string(), "--max-tasks", "1",
           "--repeats", "1", "--out", (temp / "verbose.csv").string(), "--latest",
           (temp / "verbose_latest.csv").string(), "--log-level", "debug"});
  ExpectExitCode(verbose.exit_code, 0, "verbose simulate");
  AssertContains(verbose.out, "trials: 10");
  AssertContains(verbose.err, "level=DEBUG cmd=\"simulate\"");
  AssertContains(verbose.err, "msg=\"trial matrix generated\" trials=\"10\"");
  AssertContains(verbose.err, "run_id=\"glance-context-ablations-");
}

} // namespace

int main() {
  const glancelab::tests::common::ScopedTempDir temp("glancelab-cli-contract");
  AssertUsageErrors();
  AssertConfigErrors(temp.Path());
  AssertInputErrors(temp.Path());
  AssertInformational();
  AssertLogging(temp.Path());
  return 0;
}
