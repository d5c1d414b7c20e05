#include "artifacts/decision_json_writer.hpp"
#include "artifacts/findings_writer.hpp"
#include "artifacts/summary_csv_writer.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include "core/json_dom.hpp"

#include <limits>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using glancelab::tests::common::AssertContains;
using glancelab::tests::common::AssertNotContains;
using glancelab::tests::common::Expect;
using glancelab::tests::common::Fail;

glancelab::analysis::GateEvaluation MakeEvaluation(const std::string& condition, int gates) {
  glancelab::analysis::GateEvaluation eval;
  eval.condition = condition;
  eval.baseline_harder_success_rate = 0.45;
  eval.harder_success_rate = 0.65;
  eval.success_lift = 0.444444;
  eval.quality_gain = 0.2;
  eval.easy_runtime_regression = 0.12;
  eval.maintainability_delta = 0.03;
  eval.test_quality_delta = -0.01;
  eval.cost_regression = 0.2;
  eval.quality_cost_ratio = 1.0;
  eval.gate_success = gates >= 1;
  eval.gate_runtime = gates >= 2;
  eval.gate_quality = gates >= 3;
  eval.gate_cost = gates >= 4;
  eval.gate_count = gates;
  eval.frontier_score = 0.116;
  return eval;
}

glancelab::analysis::AdoptionDecision MakeDecision() {
  glancelab::analysis::AdoptionDecision decision;
  auto winner = MakeEvaluation("C4", 4);
  auto runner_up = MakeEvaluation("C2", 3);
  runner_up.cost_regression = -0.1;
  runner_up.quality_cost_ratio = std::numeric_limits<double>::infinity();
  decision.candidates = {winner, runner_up};
  decision.recommended = winner;
  decision.recommended_condition = "C4";
  decision.adopt = true;
  return decision;
}

void AssertDecisionJson() {
  const glancelab::tests::common::ScopedTempDir temp("glancelab-decision-json");
  fs::path written;
  std::string error;
  if (!glancelab::artifacts::WriteDecisionJson(MakeDecision(), temp.Path() / "report", written,
                                               error)) {
    Fail("decision write failed: " + error);
  }
  Expect(written == temp.Path() / "report" / "decision.json", "decision path");

  const std::string text = glancelab::tests::common::ReadFileToString(written);
  glancelab::core::json::Value root;
  if (!glancelab::core::json::Parse(text, root, error)) {
    Fail("decision.json must be valid JSON: " + error);
  }
  const auto* recommended = root.Find("recommended_condition");
  Expect(recommended != nullptr && recommended->string_value == "C4", "recommended condition");
  const auto* adopt = root.Find("adopt");
  Expect(adopt != nullptr && adopt->bool_value, "adopt flag");

  const auto* candidates = root.Find("candidates");
  Expect(candidates != nullptr && candidates->array_value.size() == 2U, "ranked candidates");
  const auto& bounded = candidates->array_value[0];
  const auto& unbounded = candidates->array_value[1];
  for (const auto* key : {"condition", "success_lift", "quality_gain", "easy_runtime_regression",
                          "maintainability_delta", "test_quality_delta", "cost_regression",
                          "quality_cost_ratio", "quality_cost_ratio_unbounded", "gate_success",
                          "gate_runtime", "gate_quality", "gate_cost", "gate_count",
                          "frontier_score", "harder_success_rate",
                          "baseline_harder_success_rate"}) {
    if (bounded.Find(key) == nullptr || unbounded.Find(key) == nullptr) {
      Fail(std::string("every evaluation must carry key: ") + key);
    }
  }
  Expect(bounded.Find("quality_cost_ratio")->IsNumber(), "finite ratio is a number");
  Expect(!bounded.Find("quality_cost_ratio_unbounded")->bool_value, "finite ratio is bounded");
  Expect(unbounded.Find("quality_cost_ratio")->type ==
             glancelab::core::json::Value::Type::kNull,
         "infinite ratio is null");
  Expect(unbounded.Find("quality_cost_ratio_unbounded")->bool_value, "infinite ratio flagged");
  AssertNotContains(text, "inf");
}

void AssertSummaryCsv() {
  glancelab::analysis::ConditionSummary summary;
  summary.condition = "C0";
  summary.n = 30.0;
  summary.success_rate = 0.5;
  summary.median_runtime = 220.0;
  const std::string csv = glancelab::artifacts::RenderConditionSummaryCsv({summary});
  AssertContains(csv,
                 "condition,n,success_rate,tests_pass_rate,avg_pr_readiness,median_runtime,"
                 "median_tokens,median_cost,context_utilization_rate,avg_maintainability,"
                 "avg_test_quality\n");
  AssertContains(csv, "C0,30.000000,0.500000,0.000000,0.000000,220.000000,");

  const glancelab::tests::common::ScopedTempDir temp("glancelab-summary-csv");
  const fs::path path = temp.Path() / "charts" / "condition_summary_latest.csv";
  std::string error;
  if (!glancelab::artifacts::WriteConditionSummaryCsv({summary}, path, error)) {
    Fail("summary write failed: " + error);
  }
  Expect(glancelab::tests::common::ReadFileToString(path) == csv, "written csv matches render");
}

void AssertFindingsMarkdown() {
  glancelab::analysis::ConditionSummary summary;
  summary.condition = "C4";
  summary.n = 30.0;
  summary.success_rate = 0.7;
  summary.median_cost = 1.2;

  glancelab::artifacts::FindingsContext context;
  context.generated_at_utc = "2026-02-20T12:00:00.000Z";
  context.input_path = "data/runs_latest.csv";
  context.total_rows = 120;

  const std::string markdown =
      glancelab::artifacts::RenderFindingsMarkdown({summary}, MakeDecision(), context);
  AssertContains(markdown, "# Findings");
  AssertContains(markdown, "Input run file: `data/runs_latest.csv`");
  AssertContains(markdown, "Total rows: 120");
  AssertContains(markdown, "| C4 | 30 | 70.0% |");
  AssertContains(markdown, "$1.2000");
  AssertContains(markdown, "## Gate Evaluation (`C2`, `C4` vs `C0`)");
  AssertContains(markdown, "| Condition | T2+T3 Success | Relative Lift vs C0 | T1 Runtime");
  AssertContains(markdown, "| +0.030 | -0.010 |");
  AssertContains(markdown, "| 4/4 |");
  AssertContains(markdown, "- Recommended condition: `C4`");
  AssertContains(markdown, "- Adoption status: **Adopt**");
  AssertContains(markdown, "success lift on `T2+T3` >= 10.0%: pass");
}

} // namespace

int main() {
  AssertDecisionJson();
  AssertSummaryCsv();
  AssertFindingsMarkdown();
  return 0;
}
