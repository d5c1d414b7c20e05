#pragma once

#include "analysis/adoption_ranker.hpp"
#include "analysis/aggregator.hpp"
#include "analysis/gate_evaluator.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace glancelab::artifacts {

// Provenance lines printed at the top of `findings.md`, plus the policy the
// decision was made under so gate descriptions show the real thresholds.
struct FindingsContext {
  std::string generated_at_utc;
  std::string input_path;
  std::size_t total_rows = 0;
  analysis::GatePolicy policy;
};

// Renders the Markdown findings report: condition summary table, candidate
// gate table and the decision with per-gate results for the recommendation.
std::string RenderFindingsMarkdown(const std::vector<analysis::ConditionSummary>& summaries,
                                   const analysis::AdoptionDecision& decision,
                                   const FindingsContext& context);

// Emits `<output_dir>/findings.md`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteFindingsMarkdown(const std::vector<analysis::ConditionSummary>& summaries,
                           const analysis::AdoptionDecision& decision,
                           const FindingsContext& context, const std::filesystem::path& output_dir,
                           std::filesystem::path& written_path, std::string& error);

} // namespace glancelab::artifacts
