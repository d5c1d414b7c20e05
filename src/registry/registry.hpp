#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glancelab::registry {

// Task difficulty bucket. Enumerator order is the difficulty order and is used
// as the index into per-tier tables.
enum class Tier {
  kT1 = 0,
  kT2 = 1,
  kT3 = 2,
};

inline constexpr std::size_t kTierCount = 3;

// Repository archetype. Order matches the canonical reporting order.
enum class RepoType {
  kLibraryCli = 0,
  kServiceBackend = 1,
  kFullstackApp = 2,
  kMonorepo = 3,
};

inline constexpr std::size_t kRepoTypeCount = 4;

const char* ToString(Tier tier);
const char* ToString(RepoType repo_type);
std::optional<Tier> ParseTier(std::string_view raw);
std::optional<RepoType> ParseRepoType(std::string_view raw);

constexpr std::size_t Index(Tier tier) {
  return static_cast<std::size_t>(tier);
}

constexpr std::size_t Index(RepoType repo_type) {
  return static_cast<std::size_t>(repo_type);
}

// Per-tier tables keyed by `Index(Tier)`.
template <typename T>
using TierTable = std::array<T, kTierCount>;

// One experimental context-exposure condition.
//
// The five deltas feed the simulator additively (success, readiness,
// utilization) or multiplicatively (runtime, token). Condition-specific
// effects that only apply on some tiers are carried here as data so the
// simulator never branches on a condition id.
struct ConditionConfig {
  std::string id;
  std::string label;
  bool has_glance_files = false;
  bool discovery_instruction = false;
  std::string inline_strategy = "none";
  int inline_budget_tokens = 0;

  double success_delta = 0.0;
  double readiness_delta = 0.0;
  double runtime_delta = 0.0;
  double token_delta = 0.0;
  double utilization_boost = 0.0;

  // Condition x tier success interaction, added to the success probability.
  TierTable<double> tier_success_bonus{0.0, 0.0, 0.0};
  // Multiplier applied to runtime on top of `runtime_delta`.
  TierTable<double> tier_runtime_surcharge{1.0, 1.0, 1.0};
  double minimality_penalty = 0.0;
  // Extra minimality penalty on the easiest tier only.
  double easy_tier_minimality_penalty = 0.0;
};

struct ModelProfile {
  std::string id;
  double success_bias = 0.0;
  double readiness_bias = 0.0;
  double token_multiplier = 1.0;
  double output_ratio = 0.25;
  double input_cost_per_1k = 0.0;
  double output_cost_per_1k = 0.0;
  // Added to the context-utilization probability.
  double utilization_bonus = 0.0;
};

struct TierProfile {
  double success_base = 0.0;
  double runtime_base_seconds = 0.0;
  double input_token_base = 0.0;
  double context_base = 0.0;
};

struct RepoTypeProfile {
  double success_delta = 0.0;
  double runtime_multiplier = 1.0;
  double token_multiplier = 1.0;
};

// Immutable lookup tables consumed by the simulator and the experiment
// driver. Built once per process and passed by const reference.
class Registry {
public:
  Registry(std::vector<ConditionConfig> conditions, std::vector<ModelProfile> models,
           TierTable<TierProfile> tiers, std::array<RepoTypeProfile, kRepoTypeCount> repo_types,
           std::string baseline_condition_id);

  // nullptr when the id is unknown.
  const ConditionConfig* FindCondition(std::string_view id) const;
  const ModelProfile* FindModel(std::string_view id) const;

  const TierProfile& TierProfileFor(registry::Tier tier) const {
    return tiers_[Index(tier)];
  }

  const RepoTypeProfile& RepoTypeProfileFor(registry::RepoType repo_type) const {
    return repo_types_[Index(repo_type)];
  }

  // Ids in declaration order; used for defaults and allow-list messages.
  const std::vector<std::string>& ConditionIds() const {
    return condition_ids_;
  }
  const std::vector<std::string>& ModelIds() const {
    return model_ids_;
  }

  const std::string& BaselineConditionId() const {
    return baseline_condition_id_;
  }

private:
  std::map<std::string, ConditionConfig, std::less<>> conditions_;
  std::map<std::string, ModelProfile, std::less<>> models_;
  std::vector<std::string> condition_ids_;
  std::vector<std::string> model_ids_;
  TierTable<TierProfile> tiers_;
  std::array<RepoTypeProfile, kRepoTypeCount> repo_types_;
  std::string baseline_condition_id_;
};

// The glance-context-ablation tables: conditions C0..C4, two model profiles,
// three tiers and four repository archetypes. C0 is the baseline.
Registry BuildDefaultRegistry();

// Canonical orders used for defaults and for "allowed=" diagnostics.
const std::vector<std::string>& AllTierNames();
const std::vector<std::string>& AllRepoTypeNames();

} // namespace glancelab::registry
