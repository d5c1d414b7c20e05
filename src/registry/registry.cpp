#include "registry/registry.hpp"

#include <utility>

namespace glancelab::registry {

namespace {

constexpr std::array<const char*, kTierCount> kTierNames = {"T1", "T2", "T3"};
constexpr std::array<const char*, kRepoTypeCount> kRepoTypeNames = {
    "library_cli",
    "service_backend",
    "fullstack_app",
    "monorepo",
};

std::vector<ConditionConfig> DefaultConditions() {
  std::vector<ConditionConfig> conditions;

  conditions.push_back({.id = "C0", .label = "no_glance"});

  conditions.push_back({
      .id = "C1",
      .label = "files_present_silent",
      .has_glance_files = true,
      .success_delta = 0.01,
      .readiness_delta = 0.01,
      .runtime_delta = 0.01,
      .token_delta = 0.02,
      .utilization_boost = 0.03,
  });

  conditions.push_back({
      .id = "C2",
      .label = "files_plus_discovery_instruction",
      .has_glance_files = true,
      .discovery_instruction = true,
      .success_delta = 0.06,
      .readiness_delta = 0.05,
      .runtime_delta = 0.04,
      .token_delta = 0.06,
      .utilization_boost = 0.22,
  });

  // Full-root inlining helps hard tiers, costs time and minimality on T1.
  conditions.push_back({
      .id = "C3",
      .label = "full_root_inline",
      .has_glance_files = true,
      .discovery_instruction = true,
      .inline_strategy = "full_root",
      .inline_budget_tokens = 1600,
      .success_delta = 0.07,
      .readiness_delta = 0.05,
      .runtime_delta = 0.18,
      .token_delta = 0.32,
      .utilization_boost = 0.30,
      .tier_success_bonus = {-0.03, 0.05, 0.09},
      .tier_runtime_surcharge = {1.10, 1.0, 1.0},
      .minimality_penalty = 0.10,
      .easy_tier_minimality_penalty = 0.05,
  });

  conditions.push_back({
      .id = "C4",
      .label = "summary_inline_plus_retrieval",
      .has_glance_files = true,
      .discovery_instruction = true,
      .inline_strategy = "summary_plus_retrieval",
      .inline_budget_tokens = 400,
      .success_delta = 0.08,
      .readiness_delta = 0.07,
      .runtime_delta = 0.08,
      .token_delta = 0.14,
      .utilization_boost = 0.28,
      .tier_success_bonus = {0.02, 0.07, 0.08},
      .easy_tier_minimality_penalty = 0.05,
  });

  return conditions;
}

std::vector<ModelProfile> DefaultModels() {
  return {
      {
          .id = "claude-sonnet-4.5",
          .success_bias = 0.03,
          .readiness_bias = 0.02,
          .token_multiplier = 1.00,
          .output_ratio = 0.28,
          .input_cost_per_1k = 0.0030,
          .output_cost_per_1k = 0.0150,
          .utilization_bonus = 0.04,
      },
      {
          .id = "codex-gpt-5",
          .success_bias = 0.02,
          .readiness_bias = 0.01,
          .token_multiplier = 0.93,
          .output_ratio = 0.25,
          .input_cost_per_1k = 0.0013,
          .output_cost_per_1k = 0.0100,
          .utilization_bonus = 0.02,
      },
  };
}

} // namespace

const char* ToString(Tier tier) {
  return kTierNames[Index(tier)];
}

const char* ToString(RepoType repo_type) {
  return kRepoTypeNames[Index(repo_type)];
}

std::optional<Tier> ParseTier(std::string_view raw) {
  for (std::size_t i = 0; i < kTierNames.size(); ++i) {
    if (raw == kTierNames[i]) {
      return static_cast<Tier>(i);
    }
  }
  return std::nullopt;
}

std::optional<RepoType> ParseRepoType(std::string_view raw) {
  for (std::size_t i = 0; i < kRepoTypeNames.size(); ++i) {
    if (raw == kRepoTypeNames[i]) {
      return static_cast<RepoType>(i);
    }
  }
  return std::nullopt;
}

const std::vector<std::string>& AllTierNames() {
  static const std::vector<std::string> names(kTierNames.begin(), kTierNames.end());
  return names;
}

const std::vector<std::string>& AllRepoTypeNames() {
  static const std::vector<std::string> names(kRepoTypeNames.begin(), kRepoTypeNames.end());
  return names;
}

Registry::Registry(std::vector<ConditionConfig> conditions, std::vector<ModelProfile> models,
                   TierTable<TierProfile> tiers,
                   std::array<RepoTypeProfile, kRepoTypeCount> repo_types,
                   std::string baseline_condition_id)
    : tiers_(tiers), repo_types_(repo_types),
      baseline_condition_id_(std::move(baseline_condition_id)) {
  for (auto& condition : conditions) {
    condition_ids_.push_back(condition.id);
    std::string key = condition.id;
    conditions_.insert_or_assign(std::move(key), std::move(condition));
  }
  for (auto& model : models) {
    model_ids_.push_back(model.id);
    std::string key = model.id;
    models_.insert_or_assign(std::move(key), std::move(model));
  }
}

const ConditionConfig* Registry::FindCondition(std::string_view id) const {
  const auto it = conditions_.find(id);
  return it == conditions_.end() ? nullptr : &it->second;
}

const ModelProfile* Registry::FindModel(std::string_view id) const {
  const auto it = models_.find(id);
  return it == models_.end() ? nullptr : &it->second;
}

Registry BuildDefaultRegistry() {
  const TierTable<TierProfile> tiers = {{
      {.success_base = 0.74, .runtime_base_seconds = 900.0, .input_token_base = 5500.0,
       .context_base = 0.20},
      {.success_base = 0.58, .runtime_base_seconds = 2400.0, .input_token_base = 14500.0,
       .context_base = 0.38},
      {.success_base = 0.43, .runtime_base_seconds = 5100.0, .input_token_base = 29000.0,
       .context_base = 0.52},
  }};

  const std::array<RepoTypeProfile, kRepoTypeCount> repo_types = {{
      {.success_delta = 0.02, .runtime_multiplier = 0.80, .token_multiplier = 0.85},
      {.success_delta = -0.02, .runtime_multiplier = 1.00, .token_multiplier = 1.00},
      {.success_delta = -0.05, .runtime_multiplier = 1.16, .token_multiplier = 1.15},
      {.success_delta = -0.08, .runtime_multiplier = 1.30, .token_multiplier = 1.35},
  }};

  return Registry(DefaultConditions(), DefaultModels(), tiers, repo_types, "C0");
}

} // namespace glancelab::registry
