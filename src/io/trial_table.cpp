#include "io/trial_table.hpp"

#include "core/csv_utils.hpp"
#include "core/fs_utils.hpp"
#include "registry/registry.hpp"

#include <cmath>
#include <cstdio>
#include <map>
#include <sstream>

namespace glancelab::io {

namespace {

// [-2^63, 2^63): both bounds are exact doubles.
constexpr double kInt64Lower = -9223372036854775808.0;
constexpr double kInt64UpperExclusive = 9223372036854775808.0;

std::string FormatFixed(double value, int precision) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return buffer;
}

std::string Flag(bool value) {
  return value ? "1" : "0";
}

std::vector<std::string> RenderRow(const sim::TrialRecord& record, const TrialTableMeta& meta) {
  const sim::OutcomeRecord& outcome = record.outcome;
  return {
      meta.schema_version,
      meta.experiment_id,
      meta.run_id,
      meta.timestamp_utc,
      meta.mode,
      std::to_string(meta.seed),
      std::to_string(record.trial_id),
      record.task_id,
      record.task_title,
      registry::ToString(record.tier),
      record.repo_type,
      record.repo_slug,
      record.repo_locator,
      record.model,
      record.condition,
      record.condition_label,
      std::to_string(record.repeat_index),
      Flag(record.has_glance_files),
      Flag(record.discovery_instruction),
      record.inline_strategy,
      std::to_string(record.inline_budget_tokens),
      Flag(outcome.context_utilized),
      Flag(outcome.task_success),
      Flag(outcome.tests_passed),
      sim::StatusTag(outcome),
      FormatFixed(outcome.runtime_seconds, 2),
      std::to_string(outcome.input_tokens),
      std::to_string(outcome.output_tokens),
      std::to_string(outcome.total_tokens),
      FormatFixed(outcome.estimated_cost_usd, 4),
      FormatFixed(outcome.judges.correctness, 4),
      FormatFixed(outcome.judges.maintainability, 4),
      FormatFixed(outcome.judges.architectural_fit, 4),
      FormatFixed(outcome.judges.test_quality, 4),
      FormatFixed(outcome.judges.minimality, 4),
      FormatFixed(outcome.pr_readiness_score, 4),
  };
}

void AppendCsvLine(std::string& out, const std::vector<std::string>& cells) {
  bool first = true;
  for (const auto& cell : cells) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += core::csv::QuoteField(cell);
  }
  out.push_back('\n');
}

// Column lookup for one parsed row. Missing columns and short rows read as
// empty cells.
class RowView {
public:
  RowView(const std::map<std::string, std::size_t>& index, const std::vector<std::string>& cells,
          std::size_t line_number)
      : index_(&index), cells_(&cells), line_number_(line_number) {}

  std::string Text(const std::string& column) const {
    const auto it = index_->find(column);
    if (it == index_->end() || it->second >= cells_->size()) {
      return "";
    }
    return (*cells_)[it->second];
  }

  bool Int(const std::string& column, std::int64_t& value, std::string& error) const {
    const std::string text = Text(column);
    value = 0;
    if (text.empty()) {
      return true;
    }
    if (core::csv::ParseInt64(text, value)) {
      return true;
    }
    // Integer columns written by other tools may carry a ".0" suffix. Only
    // integral values inside the int64 range are accepted.
    double as_double = 0.0;
    if (core::csv::ParseDouble(text, as_double) && std::trunc(as_double) == as_double &&
        as_double >= kInt64Lower && as_double < kInt64UpperExclusive) {
      value = static_cast<std::int64_t>(as_double);
      return true;
    }
    error = NonNumericError(column, text);
    return false;
  }

  bool Flag(const std::string& column, bool& value, std::string& error) const {
    std::int64_t parsed = 0;
    if (!Int(column, parsed, error)) {
      return false;
    }
    value = parsed != 0;
    return true;
  }

  bool Double(const std::string& column, double& value, std::string& error) const {
    const std::string text = Text(column);
    value = 0.0;
    if (text.empty()) {
      return true;
    }
    if (core::csv::ParseDouble(text, value)) {
      return true;
    }
    error = NonNumericError(column, text);
    return false;
  }

  std::size_t LineNumber() const {
    return line_number_;
  }

private:
  std::string NonNumericError(const std::string& column, const std::string& text) const {
    return "line " + std::to_string(line_number_) + ": column '" + column +
           "' is not numeric: '" + text + "'";
  }

  const std::map<std::string, std::size_t>* index_;
  const std::vector<std::string>* cells_;
  std::size_t line_number_;
};

bool ParseRecord(const RowView& row, sim::TrialRecord& record, std::string& error) {
  record.condition = row.Text("condition");
  if (record.condition.empty()) {
    error = "line " + std::to_string(row.LineNumber()) + ": condition is empty";
    return false;
  }
  const std::string tier_text = row.Text("task_tier");
  const auto tier = registry::ParseTier(tier_text);
  if (!tier.has_value()) {
    error = "line " + std::to_string(row.LineNumber()) + ": unsupported task_tier '" +
            tier_text + "'";
    return false;
  }
  record.tier = tier.value();

  record.task_id = row.Text("task_id");
  record.task_title = row.Text("task_title");
  record.repo_type = row.Text("repo_type");
  record.repo_slug = row.Text("repo_slug");
  record.repo_locator = row.Text("repo_locator");
  record.model = row.Text("model");
  record.condition_label = row.Text("condition_label");
  record.inline_strategy = row.Text("inline_strategy");

  std::int64_t repeat_index = 0;
  std::int64_t inline_budget = 0;
  sim::OutcomeRecord& outcome = record.outcome;
  const bool ok = row.Int("trial_id", record.trial_id, error) &&
                  row.Int("repeat_index", repeat_index, error) &&
                  row.Flag("has_glance_files", record.has_glance_files, error) &&
                  row.Flag("discovery_instruction", record.discovery_instruction, error) &&
                  row.Int("inline_budget_tokens", inline_budget, error) &&
                  row.Flag("context_utilized", outcome.context_utilized, error) &&
                  row.Flag("task_success", outcome.task_success, error) &&
                  row.Flag("tests_passed", outcome.tests_passed, error) &&
                  row.Double("runtime_seconds", outcome.runtime_seconds, error) &&
                  row.Int("input_tokens", outcome.input_tokens, error) &&
                  row.Int("output_tokens", outcome.output_tokens, error) &&
                  row.Int("total_tokens", outcome.total_tokens, error) &&
                  row.Double("estimated_cost_usd", outcome.estimated_cost_usd, error) &&
                  row.Double("judge_correctness", outcome.judges.correctness, error) &&
                  row.Double("judge_maintainability", outcome.judges.maintainability, error) &&
                  row.Double("judge_architectural_fit", outcome.judges.architectural_fit,
                             error) &&
                  row.Double("judge_test_quality", outcome.judges.test_quality, error) &&
                  row.Double("judge_minimality", outcome.judges.minimality, error) &&
                  row.Double("pr_readiness_score", outcome.pr_readiness_score, error);
  if (!ok) {
    return false;
  }
  record.repeat_index = static_cast<int>(repeat_index);
  record.inline_budget_tokens = static_cast<int>(inline_budget);
  return true;
}

} // namespace

const std::vector<std::string>& TrialTableColumns() {
  static const std::vector<std::string> columns = {
      "schema_version",
      "experiment_id",
      "run_id",
      "timestamp_utc",
      "mode",
      "seed",
      "trial_id",
      "task_id",
      "task_title",
      "task_tier",
      "repo_type",
      "repo_slug",
      "repo_locator",
      "model",
      "condition",
      "condition_label",
      "repeat_index",
      "has_glance_files",
      "discovery_instruction",
      "inline_strategy",
      "inline_budget_tokens",
      "context_utilized",
      "task_success",
      "tests_passed",
      "status",
      "runtime_seconds",
      "input_tokens",
      "output_tokens",
      "total_tokens",
      "estimated_cost_usd",
      "judge_correctness",
      "judge_maintainability",
      "judge_architectural_fit",
      "judge_test_quality",
      "judge_minimality",
      "pr_readiness_score",
  };
  return columns;
}

std::string RenderTrialTableCsv(const std::vector<sim::TrialRecord>& records,
                                const TrialTableMeta& meta) {
  std::string out;
  AppendCsvLine(out, TrialTableColumns());
  for (const auto& record : records) {
    AppendCsvLine(out, RenderRow(record, meta));
  }
  return out;
}

bool WriteTrialTableCsv(const std::vector<sim::TrialRecord>& records, const TrialTableMeta& meta,
                        const std::filesystem::path& output_path, std::string& error) {
  return core::WriteTextFileAtomic(output_path, RenderTrialTableCsv(records, meta), error);
}

bool ParseTrialTableCsv(std::string_view csv_text, std::vector<sim::TrialRecord>& records,
                        std::string& error) {
  records.clear();
  std::istringstream input{std::string(csv_text)};

  std::vector<std::string> header;
  bool has_record = false;
  std::size_t line_number = 0;
  if (!core::csv::ReadRecord(input, header, has_record, line_number, error)) {
    return false;
  }
  if (!has_record) {
    error = "trial table is empty";
    return false;
  }

  std::map<std::string, std::size_t> column_index;
  for (std::size_t i = 0; i < header.size(); ++i) {
    column_index.emplace(header[i], i);
  }
  for (const char* required : {"condition", "task_tier"}) {
    if (column_index.count(required) == 0U) {
      error = "trial table is missing required column: " + std::string(required);
      return false;
    }
  }

  std::vector<sim::TrialRecord> parsed;
  std::vector<std::string> cells;
  while (true) {
    if (!core::csv::ReadRecord(input, cells, has_record, line_number, error)) {
      return false;
    }
    if (!has_record) {
      break;
    }
    if (cells.size() == 1U && cells.front().empty()) {
      continue;
    }

    sim::TrialRecord record;
    if (!ParseRecord(RowView(column_index, cells, line_number), record, error)) {
      return false;
    }
    parsed.push_back(std::move(record));
  }

  if (parsed.empty()) {
    error = "no trial rows found";
    return false;
  }
  records = std::move(parsed);
  return true;
}

bool LoadTrialTableCsv(const std::filesystem::path& input_path,
                       std::vector<sim::TrialRecord>& records, std::string& error) {
  records.clear();
  std::string contents;
  if (!core::ReadTextFile(input_path, contents, error)) {
    return false;
  }
  std::string parse_error;
  if (!ParseTrialTableCsv(contents, records, parse_error)) {
    error = input_path.string() + ": " + parse_error;
    return false;
  }
  return true;
}

} // namespace glancelab::io
