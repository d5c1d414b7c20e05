#pragma once

#include "analysis/aggregator.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace glancelab::artifacts {

// Renders the condition summary table, one row per summary in the given
// order. Every numeric field uses fixed 6-decimal formatting.
std::string RenderConditionSummaryCsv(const std::vector<analysis::ConditionSummary>& summaries);

// Emits the condition summary CSV.
//
// Contract:
// - Creates the parent directory of `output_path` if needed.
// - Replaces `output_path` atomically.
// - Returns false on failure and populates `error`.
bool WriteConditionSummaryCsv(const std::vector<analysis::ConditionSummary>& summaries,
                              const std::filesystem::path& output_path, std::string& error);

} // namespace glancelab::artifacts
