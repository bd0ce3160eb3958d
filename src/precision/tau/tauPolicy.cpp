#include "precision/tau/tauPolicy.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace cutprec::precision::tau {

namespace {

struct Preset {
	const char* name;
	TauObjective objective;
	TauConstraints constraints;
};

static const Preset PRESETS[] = {
        {"balanced", TauObjective::BalancedAccuracyThenGap, {25.0, 10.0, std::nullopt, std::nullopt}},
        {"strict", TauObjective::BalancedAccuracyThenGap, {15.0, 20.0, std::nullopt, 0.95}},
        {"lenient", TauObjective::BalancedAccuracy, {40.0, std::nullopt, 0.9, std::nullopt}},
};

static void requireRange(const std::optional<double>& value, double low, double high, const char* name) {
	if (value && (*value < low || *value > high)) {
		throw std::invalid_argument(fmt::format("{} must be in [{}, {}]", name, low, high));
	}
}

} // namespace

std::string_view toString(TauObjective objective) {
	switch (objective) {
	case TauObjective::BalancedAccuracy:
		return "balanced_accuracy";
	case TauObjective::BalancedAccuracyThenGap:
		return "balanced_accuracy_then_gap";
	case TauObjective::GapThenBalancedAccuracy:
		return "gap_then_balanced_accuracy";
	}
	return "balanced_accuracy_then_gap";
}

TauObjective parseTauObjective(std::string_view name) {
	for (const auto objective: {TauObjective::BalancedAccuracy, TauObjective::BalancedAccuracyThenGap, TauObjective::GapThenBalancedAccuracy}) {
		if (toString(objective) == name) {
			return objective;
		}
	}
	throw std::invalid_argument(fmt::format("Unknown tau objective '{}'", name));
}

std::vector<std::string> tauPolicyPresetNames() {
	std::vector<std::string> names;
	for (const auto& preset: PRESETS) {
		names.emplace_back(preset.name);
	}
	return names;
}

TauPolicy tauPolicyPreset(std::string_view name) {
	for (const auto& preset: PRESETS) {
		if (name == preset.name) {
			return TauPolicy{preset.name, preset.objective, preset.constraints};
		}
	}
	throw std::invalid_argument(fmt::format("Unknown tau policy preset '{}'", name));
}

TauPolicy resolveLabeledPolicy(const std::optional<std::string>& preset, const TauPolicyOverrides& overrides) {
	TauPolicy policy = preset ? tauPolicyPreset(*preset) : TauPolicy{};

	if (overrides.objective)
		policy.objective = *overrides.objective;
	if (overrides.maxMeanIpnBad)
		policy.constraints.maxMeanIpnBad = overrides.maxMeanIpnBad;
	if (overrides.minMeanIpnGap)
		policy.constraints.minMeanIpnGap = overrides.minMeanIpnGap;
	if (overrides.minTpr)
		policy.constraints.minTpr = overrides.minTpr;
	if (overrides.minTnr)
		policy.constraints.minTnr = overrides.minTnr;

	requireRange(policy.constraints.maxMeanIpnBad, 0.0, 100.0, "max_mean_ipn_bad");
	requireRange(policy.constraints.minMeanIpnGap, -100.0, 100.0, "min_mean_ipn_gap");
	requireRange(policy.constraints.minTpr, 0.0, 1.0, "min_tpr");
	requireRange(policy.constraints.minTnr, 0.0, 1.0, "min_tnr");
	return policy;
}

} // namespace cutprec::precision::tau
