#include "artifacts/summary_csv_writer.hpp"

#include "core/csv_utils.hpp"
#include "core/fs_utils.hpp"

#include <iomanip>
#include <sstream>

namespace glancelab::artifacts {

std::string RenderConditionSummaryCsv(const std::vector<analysis::ConditionSummary>& summaries) {
  std::ostringstream out;
  out << "condition,n,success_rate,tests_pass_rate,avg_pr_readiness,median_runtime,"
         "median_tokens,median_cost,context_utilization_rate,avg_maintainability,"
         "avg_test_quality\n";
  out << std::fixed << std::setprecision(6);
  for (const auto& summary : summaries) {
    out << core::csv::QuoteField(summary.condition) << "," << summary.n << ","
        << summary.success_rate << "," << summary.tests_pass_rate << ","
        << summary.avg_pr_readiness << "," << summary.median_runtime << ","
        << summary.median_tokens << "," << summary.median_cost << ","
        << summary.context_utilization_rate << "," << summary.avg_maintainability << ","
        << summary.avg_test_quality << "\n";
  }
  return out.str();
}

bool WriteConditionSummaryCsv(const std::vector<analysis::ConditionSummary>& summaries,
                              const std::filesystem::path& output_path, std::string& error) {
  return core::WriteTextFileAtomic(output_path, RenderConditionSummaryCsv(summaries), error);
}

} // namespace glancelab::artifacts
