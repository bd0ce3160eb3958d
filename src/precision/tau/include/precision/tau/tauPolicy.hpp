#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cutprec::precision::tau {

//! Ranking used to pick the best tau on the labeled curve. Lower tau always breaks the final tie.
enum class TauObjective {
	BalancedAccuracy,         //!< Maximise balanced accuracy.
	BalancedAccuracyThenGap,  //!< Balanced accuracy, then the mean IPN gap between good and bad.
	GapThenBalancedAccuracy,  //!< Mean IPN gap, then balanced accuracy.
};

std::string_view toString(TauObjective objective);
TauObjective parseTauObjective(std::string_view name); //!< Throws std::invalid_argument on unknown names.

//! Feasibility limits on a curve point. Unset limits are inactive.
struct TauConstraints {
	std::optional<double> maxMeanIpnBad{};
	std::optional<double> minMeanIpnGap{};
	std::optional<double> minTpr{};
	std::optional<double> minTnr{};

	bool any() const {
		return maxMeanIpnBad || minMeanIpnGap || minTpr || minTnr;
	}
};

//! Named combination of objective and constraints.
struct TauPolicy {
	std::string name{"custom"};
	TauObjective objective{TauObjective::BalancedAccuracyThenGap};
	TauConstraints constraints{};
};

//! Explicit settings that override the preset field by field.
struct TauPolicyOverrides {
	std::optional<TauObjective> objective{};
	std::optional<double> maxMeanIpnBad{};
	std::optional<double> minMeanIpnGap{};
	std::optional<double> minTpr{};
	std::optional<double> minTnr{};
};

//! Names of the built in presets ("balanced", "strict", "lenient").
std::vector<std::string> tauPolicyPresetNames();

//! Preset by name. Throws std::invalid_argument on unknown names.
TauPolicy tauPolicyPreset(std::string_view name);

//! Start from the preset (or "custom" without preset) and apply the overrides.
//! \throws std::invalid_argument for unknown presets or out of range limits (rates outside [0,1], IPN outside [0,100]).
TauPolicy resolveLabeledPolicy(const std::optional<std::string>& preset, const TauPolicyOverrides& overrides = {});

} // namespace cutprec::precision::tau
