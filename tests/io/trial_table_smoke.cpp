#include "io/trial_table.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace {

using glancelab::tests::common::AssertContains;
using glancelab::tests::common::Expect;
using glancelab::tests::common::Fail;

glancelab::sim::TrialRecord MakeRecord() {
  glancelab::sim::TrialRecord record;
  record.trial_id = 7;
  record.task_id = "T2-SVC-001";
  record.task_title = "Add \"idempotency\" keys, safely";
  record.tier = glancelab::registry::Tier::kT2;
  record.repo_type = "service_backend";
  record.repo_slug = "fixture/orders-api";
  record.repo_locator = "fixtures/repos/orders-api";
  record.model = "codex-gpt-5";
  record.condition = "C4";
  record.condition_label = "summary_inline_plus_retrieval";
  record.repeat_index = 2;
  record.has_glance_files = true;
  record.discovery_instruction = true;
  record.inline_strategy = "summary_plus_retrieval";
  record.inline_budget_tokens = 400;

  auto& outcome = record.outcome;
  outcome.task_success = true;
  outcome.tests_passed = true;
  outcome.context_utilized = true;
  outcome.runtime_seconds = 2512.37;
  outcome.input_tokens = 15011;
  outcome.output_tokens = 4210;
  outcome.total_tokens = 19221;
  outcome.estimated_cost_usd = 0.0616;
  outcome.judges = {.correctness = 0.9123,
                    .maintainability = 0.7012,
                    .architectural_fit = 0.8455,
                    .test_quality = 0.6901,
                    .minimality = 0.5877};
  outcome.pr_readiness_score = 0.8274;
  return record;
}

glancelab::io::TrialTableMeta MakeMeta() {
  glancelab::io::TrialTableMeta meta;
  meta.run_id = "glance-context-ablations-20260220_120000";
  meta.timestamp_utc = "2026-02-20T12:00:00.000Z";
  meta.seed = 20260220;
  return meta;
}

void AssertHeaderAndQuoting() {
  const auto& columns = glancelab::io::TrialTableColumns();
  Expect(columns.size() == 36U, "trial table has 36 columns");
  Expect(columns.front() == "schema_version" && columns.back() == "pr_readiness_score",
         "column order is fixed");

  const std::string csv = glancelab::io::RenderTrialTableCsv({MakeRecord()}, MakeMeta());
  AssertContains(csv, "schema_version,experiment_id,run_id,timestamp_utc,mode,seed,trial_id,");
  AssertContains(csv, "glance_context_run_v1,glance-context-ablations,");
  AssertContains(csv, "\"Add \"\"idempotency\"\" keys, safely\"");
  AssertContains(csv, ",ok,2512.37,15011,4210,19221,0.0616,0.9123,");
  AssertContains(csv, ",T2,service_backend,");
}

void AssertWriteThenLoadPreservesAnalysisFields() {
  const glancelab::tests::common::ScopedTempDir temp("glancelab-trial-table");
  const auto path = temp.Path() / "nested" / "runs.csv";

  glancelab::sim::TrialRecord failed = MakeRecord();
  failed.trial_id = 8;
  failed.tier = glancelab::registry::Tier::kT1;
  failed.outcome.task_success = false;
  failed.outcome.tests_passed = false;
  const std::vector<glancelab::sim::TrialRecord> records = {MakeRecord(), failed};

  std::string error;
  if (!glancelab::io::WriteTrialTableCsv(records, MakeMeta(), path, error)) {
    Fail("write failed: " + error);
  }
  AssertContains(glancelab::tests::common::ReadFileToString(path), ",failed_checks,");

  std::vector<glancelab::sim::TrialRecord> loaded;
  if (!glancelab::io::LoadTrialTableCsv(path, loaded, error)) {
    Fail("load failed: " + error);
  }
  Expect(loaded.size() == 2U, "two rows expected");
  Expect(loaded[0].task_title == records[0].task_title, "quoted title survives");
  Expect(loaded[0].tier == glancelab::registry::Tier::kT2, "tier survives");
  Expect(loaded[0].outcome == records[0].outcome, "outcome survives at emitted precision");
  Expect(loaded[1].tier == glancelab::registry::Tier::kT1 && !loaded[1].outcome.tests_passed,
         "second row survives");
}

void AssertMinimalTablesAndErrors() {
  std::vector<glancelab::sim::TrialRecord> records;
  std::string error;

  Expect(glancelab::io::ParseTrialTableCsv("condition,task_tier,task_success,runtime_seconds\n"
                                           "C0,T1,1,\n"
                                           "C2,T3,,12.5\n",
                                           records, error),
         "minimal table must parse: " + error);
  Expect(records.size() == 2U, "two minimal rows");
  Expect(records[0].outcome.task_success && records[0].outcome.runtime_seconds == 0.0,
         "empty numeric cells read as zero");
  Expect(!records[1].outcome.task_success && records[1].outcome.runtime_seconds == 12.5,
         "numeric cells parse");

  Expect(!glancelab::io::ParseTrialTableCsv("condition,task_success\nC0,1\n", records, error),
         "task_tier column is required");
  AssertContains(error, "missing required column: task_tier");

  Expect(!glancelab::io::ParseTrialTableCsv("condition,task_tier,runtime_seconds\n"
                                            "C0,T1,10\n"
                                            "C0,T1,fast\n",
                                            records, error),
         "non-numeric runtime must be rejected");
  AssertContains(error, "line 3");
  AssertContains(error, "runtime_seconds");

  Expect(!glancelab::io::ParseTrialTableCsv("condition,task_tier\nC0,T7\n", records, error),
         "unknown tier must be rejected");
  AssertContains(error, "line 2");

  Expect(!glancelab::io::ParseTrialTableCsv("condition,task_tier\n", records, error),
         "header-only table must be rejected");
  AssertContains(error, "no trial rows");
}

void ExpectRowRejected(const std::string& header, const std::string& row,
                       const std::string& column) {
  std::vector<glancelab::sim::TrialRecord> records;
  std::string error;
  if (glancelab::io::ParseTrialTableCsv("condition,task_tier," + header + "\nC0,T1," + row + "\n",
                                        records, error)) {
    Fail(column + " value '" + row + "' must be rejected");
  }
  AssertContains(error, "line 2: column '" + column + "' is not numeric: '" + row + "'");
  Expect(records.empty(), "rejected tables leave no records");
}

void AssertNumericCellsAreRangeChecked() {
  ExpectRowRejected("total_tokens", "1e30", "total_tokens");
  ExpectRowRejected("total_tokens", "-1e19", "total_tokens");
  ExpectRowRejected("total_tokens", "9223372036854775808", "total_tokens");
  ExpectRowRejected("total_tokens", "nan", "total_tokens");
  ExpectRowRejected("total_tokens", "inf", "total_tokens");
  ExpectRowRejected("input_tokens", "12.5", "input_tokens");
  ExpectRowRejected("task_success", "nan", "task_success");
  ExpectRowRejected("runtime_seconds", "nan", "runtime_seconds");
  ExpectRowRejected("runtime_seconds", "inf", "runtime_seconds");
  ExpectRowRejected("estimated_cost_usd", "-inf", "estimated_cost_usd");
  ExpectRowRejected("judge_maintainability", "NaN", "judge_maintainability");

  std::vector<glancelab::sim::TrialRecord> records;
  std::string error;
  Expect(glancelab::io::ParseTrialTableCsv("condition,task_tier,total_tokens,repeat_index\n"
                                           "C0,T1,12000.0,-3.0\n"
                                           "C0,T1,9223372036854775807,1\n",
                                           records, error),
         "integral doubles and int64 max must parse: " + error);
  Expect(records[0].outcome.total_tokens == 12000 && records[0].repeat_index == -3,
         "integral .0 cells read as integers");
  Expect(records[1].outcome.total_tokens == INT64_MAX, "int64 max reads exactly");
}

} // namespace

int main() {
  AssertHeaderAndQuoting();
  AssertWriteThenLoadPreservesAnalysisFields();
  AssertMinimalTablesAndErrors();
  AssertNumericCellsAreRangeChecked();
  return 0;
}
