#include "artifacts/findings_writer.hpp"

#include "core/fs_utils.hpp"

#include <cstdio>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace glancelab::artifacts {

namespace {

std::string Format(const char* pattern, double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), pattern, value);
  return buffer;
}

std::string Percent(double ratio) {
  return Format("%.1f%%", ratio * 100.0);
}

std::string Currency(double value) {
  return Format("$%.4f", value);
}

std::string SignedDelta(double value) {
  return Format("%+.3f", value);
}

const char* PassFail(bool passed) {
  return passed ? "pass" : "fail";
}

std::string TierLabel(const std::set<registry::Tier>& tiers) {
  std::string label;
  for (const auto tier : tiers) {
    if (!label.empty()) {
      label += "+";
    }
    label += registry::ToString(tier);
  }
  return label;
}

std::string ConditionList(const std::vector<analysis::GateEvaluation>& candidates) {
  std::set<std::string> ids;
  for (const auto& candidate : candidates) {
    ids.insert(candidate.condition);
  }
  std::string joined;
  for (const auto& id : ids) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += "`" + id + "`";
  }
  return joined;
}

void WriteConditionTable(std::ostringstream& out,
                         const std::vector<analysis::ConditionSummary>& summaries) {
  out << "| Condition | N | Success | Tests Pass | PR Readiness | Median Runtime (s) | "
         "Median Tokens | Median Cost | Context Utilization |\n"
      << "|---|---:|---:|---:|---:|---:|---:|---:|---:|\n";
  for (const auto& summary : summaries) {
    out << "| " << summary.condition << " | " << Format("%.0f", summary.n) << " | "
        << Percent(summary.success_rate) << " | " << Percent(summary.tests_pass_rate) << " | "
        << Format("%.3f", summary.avg_pr_readiness) << " | "
        << Format("%.1f", summary.median_runtime) << " | " << Format("%.0f", summary.median_tokens)
        << " | " << Currency(summary.median_cost) << " | "
        << Percent(summary.context_utilization_rate) << " |\n";
  }
}

void WriteCandidateTable(std::ostringstream& out,
                         const std::vector<analysis::GateEvaluation>& candidates,
                         const analysis::GatePolicy& policy) {
  out << "| Condition | " << TierLabel(policy.harder_tiers) << " Success | Relative Lift vs "
      << policy.baseline_condition << " | " << TierLabel(policy.easiest_tiers)
      << " Runtime Regression | Maintainability Delta | Test Quality Delta | Cost Regression | "
         "Gates Passed |\n"
      << "|---|---:|---:|---:|---:|---:|---:|---:|\n";
  for (const auto& candidate : candidates) {
    out << "| " << candidate.condition << " | " << Percent(candidate.harder_success_rate) << " | "
        << Percent(candidate.success_lift) << " | " << Percent(candidate.easy_runtime_regression)
        << " | " << SignedDelta(candidate.maintainability_delta) << " | "
        << SignedDelta(candidate.test_quality_delta) << " | "
        << Percent(candidate.cost_regression) << " | " << candidate.gate_count << "/4 |\n";
  }
}

} // namespace

std::string RenderFindingsMarkdown(const std::vector<analysis::ConditionSummary>& summaries,
                                   const analysis::AdoptionDecision& decision,
                                   const FindingsContext& context) {
  const analysis::GatePolicy& policy = context.policy;
  const analysis::GateEvaluation& recommended = decision.recommended;
  const std::string harder = TierLabel(policy.harder_tiers);
  const std::string easiest = TierLabel(policy.easiest_tiers);

  std::ostringstream out;
  out << "# Findings\n\n"
      << "Generated: " << context.generated_at_utc << "\n\n"
      << "Input run file: `" << context.input_path << "`\n\n"
      << "Total rows: " << context.total_rows << "\n\n"
      << "## Condition Summary\n\n";
  WriteConditionTable(out, summaries);

  out << "\n## Gate Evaluation (" << ConditionList(decision.candidates) << " vs `"
      << policy.baseline_condition << "`)\n\n";
  WriteCandidateTable(out, decision.candidates, policy);

  out << "\n## Decision\n\n"
      << "- Recommended condition: `" << decision.recommended_condition << "`\n"
      << "- Adoption status: **" << (decision.adopt ? "Adopt" : "Do not adopt yet") << "**\n"
      << "- Gate results for `" << decision.recommended_condition << "`:\n"
      << "  - success lift on `" << harder << "` >= " << Percent(policy.min_success_lift) << ": "
      << PassFail(recommended.gate_success) << "\n"
      << "  - `" << easiest << "` runtime regression <= "
      << Percent(policy.max_runtime_regression) << ": " << PassFail(recommended.gate_runtime)
      << "\n"
      << "  - maintainability/test-quality non-regression: "
      << PassFail(recommended.gate_quality) << "\n"
      << "  - cost increase justified by quality lift: " << PassFail(recommended.gate_cost)
      << "\n";
  return out.str();
}

bool WriteFindingsMarkdown(const std::vector<analysis::ConditionSummary>& summaries,
                           const analysis::AdoptionDecision& decision,
                           const FindingsContext& context, const fs::path& output_dir,
                           fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "findings.md";
  return core::WriteTextFileAtomic(written_path,
                                   RenderFindingsMarkdown(summaries, decision, context), error);
}

} // namespace glancelab::artifacts
