#include "artifacts/decision_json_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <sstream>

namespace fs = std::filesystem;

namespace glancelab::artifacts {

namespace {

const char* BoolJson(bool value) {
  return value ? "true" : "false";
}

void WriteEvaluationObject(std::ostringstream& out, const analysis::GateEvaluation& evaluation,
                           const std::string& indent) {
  const bool unbounded = std::isinf(evaluation.quality_cost_ratio);
  out << "{\n"
      << indent << "  \"condition\": \"" << core::EscapeJson(evaluation.condition) << "\",\n"
      << indent << "  \"baseline_harder_success_rate\": "
      << core::FormatJsonNumber(evaluation.baseline_harder_success_rate) << ",\n"
      << indent << "  \"harder_success_rate\": "
      << core::FormatJsonNumber(evaluation.harder_success_rate) << ",\n"
      << indent << "  \"success_lift\": " << core::FormatJsonNumber(evaluation.success_lift)
      << ",\n"
      << indent << "  \"quality_gain\": " << core::FormatJsonNumber(evaluation.quality_gain)
      << ",\n"
      << indent << "  \"easy_runtime_regression\": "
      << core::FormatJsonNumber(evaluation.easy_runtime_regression) << ",\n"
      << indent << "  \"maintainability_delta\": "
      << core::FormatJsonNumber(evaluation.maintainability_delta) << ",\n"
      << indent << "  \"test_quality_delta\": "
      << core::FormatJsonNumber(evaluation.test_quality_delta) << ",\n"
      << indent << "  \"cost_regression\": " << core::FormatJsonNumber(evaluation.cost_regression)
      << ",\n"
      << indent << "  \"quality_cost_ratio\": "
      << core::FormatJsonNumber(evaluation.quality_cost_ratio) << ",\n"
      << indent << "  \"quality_cost_ratio_unbounded\": " << BoolJson(unbounded) << ",\n"
      << indent << "  \"gate_success\": " << BoolJson(evaluation.gate_success) << ",\n"
      << indent << "  \"gate_runtime\": " << BoolJson(evaluation.gate_runtime) << ",\n"
      << indent << "  \"gate_quality\": " << BoolJson(evaluation.gate_quality) << ",\n"
      << indent << "  \"gate_cost\": " << BoolJson(evaluation.gate_cost) << ",\n"
      << indent << "  \"gate_count\": " << evaluation.gate_count << ",\n"
      << indent << "  \"frontier_score\": " << core::FormatJsonNumber(evaluation.frontier_score)
      << "\n"
      << indent << "}";
}

} // namespace

std::string RenderDecisionJson(const analysis::AdoptionDecision& decision) {
  std::ostringstream out;
  out << "{\n"
      << "  \"recommended_condition\": \"" << core::EscapeJson(decision.recommended_condition)
      << "\",\n"
      << "  \"adopt\": " << BoolJson(decision.adopt) << ",\n"
      << "  \"recommended\": ";
  WriteEvaluationObject(out, decision.recommended, "  ");
  out << ",\n"
      << "  \"candidates\": [";
  for (std::size_t i = 0; i < decision.candidates.size(); ++i) {
    out << (i == 0U ? "\n    " : ",\n    ");
    WriteEvaluationObject(out, decision.candidates[i], "    ");
  }
  if (!decision.candidates.empty()) {
    out << "\n  ";
  }
  out << "]\n"
      << "}\n";
  return out.str();
}

bool WriteDecisionJson(const analysis::AdoptionDecision& decision, const fs::path& output_dir,
                       fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "decision.json";
  return core::WriteTextFileAtomic(written_path, RenderDecisionJson(decision), error);
}

} // namespace glancelab::artifacts
