#pragma once

#include "sim/trial_record.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace glancelab::io {

inline constexpr std::string_view kSchemaVersion = "glance_context_run_v1";
inline constexpr std::string_view kExperimentId = "glance-context-ablations";

// Run-level columns repeated on every row.
struct TrialTableMeta {
  std::string schema_version = std::string(kSchemaVersion);
  std::string experiment_id = std::string(kExperimentId);
  std::string run_id;
  std::string timestamp_utc;
  std::string mode = "simulate";
  std::int64_t seed = 0;
};

// The fixed 36-column header, in emission order.
const std::vector<std::string>& TrialTableColumns();

// Renders the full CSV document (header + one row per record).
std::string RenderTrialTableCsv(const std::vector<sim::TrialRecord>& records,
                                const TrialTableMeta& meta);

// Writes `RenderTrialTableCsv` to `output_path` atomically, creating parent
// directories as needed.
bool WriteTrialTableCsv(const std::vector<sim::TrialRecord>& records, const TrialTableMeta& meta,
                        const std::filesystem::path& output_path, std::string& error);

// Parses a trial table.
//
// Contract:
// - columns are matched by header name; extra columns are ignored.
// - `condition` and `task_tier` columns are required; tiers must be T1..T3.
// - absent or empty numeric cells read as zero; any other non-numeric text in
//   a numeric column is an error citing the line number.
// - a table without data rows is an error.
bool ParseTrialTableCsv(std::string_view csv_text, std::vector<sim::TrialRecord>& records,
                        std::string& error);

bool LoadTrialTableCsv(const std::filesystem::path& input_path,
                       std::vector<sim::TrialRecord>& records, std::string& error);

} // namespace glancelab::io
