#pragma once

#include "analysis/adoption_ranker.hpp"

#include <filesystem>
#include <string>

namespace glancelab::artifacts {

// Renders `decision.json`.
//
// Every evaluation object carries every key. JSON has no infinity, so an
// unbounded quality-cost ratio is written as `null` alongside
// `"quality_cost_ratio_unbounded": true`.
std::string RenderDecisionJson(const analysis::AdoptionDecision& decision);

// Emits `<output_dir>/decision.json`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteDecisionJson(const analysis::AdoptionDecision& decision,
                       const std::filesystem::path& output_dir,
                       std::filesystem::path& written_path, std::string& error);

} // namespace glancelab::artifacts
