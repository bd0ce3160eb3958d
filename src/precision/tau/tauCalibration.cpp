#include "precision/tau/tauCalibration.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace cutprec::precision::tau {

namespace {

//! Candidate taus closer than this are considered equal.
static constexpr double CANDIDATE_EPS = 1e-12;
//! Slack for comparing rates and IPN values against constraints and between curve points.
static constexpr double COMPARE_EPS = 1e-9;

static double median(std::vector<double> values) {
	std::sort(values.begin(), values.end());
	const std::size_t mid = values.size() / 2;
	return values.size() % 2 == 1 ? values[mid] : 0.5 * (values[mid - 1] + values[mid]);
}

static double aggregate(const std::vector<double>& values, TauStatistic statistic) {
	switch (statistic) {
	case TauStatistic::Mean:
		return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	case TauStatistic::P75: {
		std::vector<double> sorted = values;
		std::sort(sorted.begin(), sorted.end());
		return sorted[static_cast<std::size_t>(0.75 * static_cast<double>(sorted.size() - 1))];
	}
	case TauStatistic::Median:
		break;
	}
	return median(values);
}

static void validateRange(double tauMin, double tauMax) {
	if (tauMin <= 0.0) {
		throw std::invalid_argument("tau_min must be > 0");
	}
	if (tauMax <= tauMin) {
		throw std::invalid_argument("tau_max must be greater than tau_min");
	}
}

//! Tau for one report, trying the preferred units first.
static std::optional<TauCandidate> tauFromReport(const std::string& path, double targetIpn, bool preferMm) {
	const auto metrics = loadReportMetrics(path);
	if (!metrics) {
		return std::nullopt;
	}

	const TauUnits order[2] = {preferMm ? TauUnits::Mm : TauUnits::Px, preferMm ? TauUnits::Px : TauUnits::Mm};
	for (const TauUnits units: order) {
		// targetIpn = 100 * (1 - mad / (tau * scale))  =>  tau = (mad / scale) / (1 - targetIpn / 100)
		if (const auto ratio = metrics->ratio(units)) {
			return TauCandidate{path, *ratio / (1.0 - targetIpn / 100.0), units};
		}
	}
	return std::nullopt;
}

//! Strict ordering of curve points under an objective. Equal scores prefer the lower tau.
static bool isBetter(const TauCurvePoint& a, const TauCurvePoint& b, TauObjective objective) {
	const auto compare = [](double x, double y) { return x > y + COMPARE_EPS ? 1 : (x < y - COMPARE_EPS ? -1 : 0); };

	int order = 0;
	switch (objective) {
	case TauObjective::BalancedAccuracy:
		order = compare(a.balancedAccuracy, b.balancedAccuracy);
		break;
	case TauObjective::BalancedAccuracyThenGap:
		order = compare(a.balancedAccuracy, b.balancedAccuracy);
		if (order == 0)
			order = compare(a.meanIpnGap, b.meanIpnGap);
		break;
	case TauObjective::GapThenBalancedAccuracy:
		order = compare(a.meanIpnGap, b.meanIpnGap);
		if (order == 0)
			order = compare(a.balancedAccuracy, b.balancedAccuracy);
		break;
	}

	if (order != 0) {
		return order > 0;
	}
	return a.tau < b.tau;
}

static bool isFeasible(const TauCurvePoint& p, const TauConstraints& c) {
	if (c.maxMeanIpnBad && p.meanIpnBad > *c.maxMeanIpnBad + COMPARE_EPS)
		return false;
	if (c.minMeanIpnGap && p.meanIpnGap < *c.minMeanIpnGap - COMPARE_EPS)
		return false;
	if (c.minTpr && p.tpr < *c.minTpr - COMPARE_EPS)
		return false;
	if (c.minTnr && p.tnr < *c.minTnr - COMPARE_EPS)
		return false;
	return true;
}

static const TauCurvePoint* bestPoint(const std::vector<const TauCurvePoint*>& points, TauObjective objective) {
	const TauCurvePoint* best = nullptr;
	for (const auto* p: points) {
		if (best == nullptr || isBetter(*p, *best, objective)) {
			best = p;
		}
	}
	return best;
}

static double meanIpn(const std::vector<double>& ratios, double tau) {
	if (ratios.empty()) {
		return 0.0;
	}
	double sum = 0.0;
	for (double r: ratios) {
		sum += ipnFromRatio(r, tau);
	}
	return sum / static_cast<double>(ratios.size());
}

static std::vector<double> ratiosOf(const std::vector<std::string>& paths, TauUnits units, std::vector<std::string>& usedPaths) {
	std::vector<double> out;
	for (const auto& path: paths) {
		const auto metrics = loadReportMetrics(path);
		if (!metrics) {
			continue;
		}
		if (const auto ratio = metrics->ratio(units)) {
			out.push_back(*ratio);
			usedPaths.push_back(path);
		}
	}
	return out;
}

} // namespace

std::string_view toString(TauStatistic statistic) {
	switch (statistic) {
	case TauStatistic::Median:
		return "median";
	case TauStatistic::Mean:
		return "mean";
	case TauStatistic::P75:
		return "p75";
	}
	return "median";
}

TauStatistic parseTauStatistic(std::string_view name) {
	if (name == "median")
		return TauStatistic::Median;
	if (name == "mean")
		return TauStatistic::Mean;
	if (name == "p75")
		return TauStatistic::P75;
	throw std::invalid_argument(fmt::format("Unknown tau statistic '{}' (expected median, mean or p75)", name));
}

double ipnFromRatio(double ratio, double tau) {
	if (tau <= 0.0) {
		return 0.0;
	}
	return std::clamp(100.0 * (1.0 - ratio / tau), 0.0, 100.0);
}

TauCalibrationResult calibrateTauFromReports(const std::vector<std::string>& reportPaths, const TargetTauOptions& options) {
	if (!(options.targetIpn > 0.0 && options.targetIpn < 100.0)) {
		throw std::invalid_argument("target_ipn must be between 0 and 100");
	}
	validateRange(options.tauMin, options.tauMax);

	TauCalibrationResult result{};
	for (const auto& path: reportPaths) {
		if (auto candidate = tauFromReport(path, options.targetIpn, options.preferMm)) {
			result.candidates.push_back(std::move(*candidate));
		}
	}
	if (result.candidates.empty()) {
		throw std::invalid_argument("No valid reports found for tau calibration");
	}

	std::vector<double> taus;
	taus.reserve(result.candidates.size());
	for (const auto& c: result.candidates) {
		taus.push_back(c.tau);
	}

	result.tau         = std::clamp(aggregate(taus, options.statistic), options.tauMin, options.tauMax);
	result.units       = result.candidates.front().units;
	result.reportsUsed = static_cast<int>(result.candidates.size());
	result.targetIpn   = options.targetIpn;
	result.statistic   = options.statistic;
	result.tauMin      = options.tauMin;
	result.tauMax      = options.tauMax;
	return result;
}

void validateLabeledOptions(double acceptIpn, double tauMin, double tauMax) {
	if (!(acceptIpn > 0.0 && acceptIpn < 100.0)) {
		throw std::invalid_argument("accept_ipn must be between 0 and 100");
	}
	validateRange(tauMin, tauMax);
}

LabeledRatios loadLabeledRatios(const std::vector<std::string>& goodPaths, const std::vector<std::string>& badPaths, bool preferMm) {
	if (goodPaths.empty() || badPaths.empty()) {
		throw std::invalid_argument("Both good and bad report sets are required");
	}

	// Units are chosen for the whole set so good and bad ratios stay comparable.
	bool allMm = true;
	bool allPx = true;
	for (const auto* paths: {&goodPaths, &badPaths}) {
		for (const auto& path: *paths) {
			const auto metrics = loadReportMetrics(path);
			if (!metrics) {
				continue;
			}
			allMm = allMm && metrics->has(TauUnits::Mm);
			allPx = allPx && metrics->has(TauUnits::Px);
		}
	}

	LabeledRatios ratios{};
	if (preferMm && allMm) {
		ratios.units = TauUnits::Mm;
	} else if (allPx) {
		ratios.units = TauUnits::Px;
	} else if (allMm) {
		ratios.units = TauUnits::Mm;
	} else {
		throw std::invalid_argument("No usable metrics (px/mm) found in report set");
	}

	ratios.good = ratiosOf(goodPaths, ratios.units, ratios.goodPaths);
	ratios.bad  = ratiosOf(badPaths, ratios.units, ratios.badPaths);
	if (ratios.good.empty() || ratios.bad.empty()) {
		throw std::invalid_argument("No valid reports available for labeled calibration");
	}
	return ratios;
}

std::vector<double> tauCandidates(const LabeledRatios& ratios, double acceptIpn, double tauMin, double tauMax) {
	const double factor = 1.0 - acceptIpn / 100.0;

	std::vector<double> boundaries{tauMin, tauMax};
	for (const auto* values: {&ratios.good, &ratios.bad}) {
		for (double ratio: *values) {
			const double boundary = ratio / factor;
			if (std::isfinite(boundary)) {
				boundaries.push_back(std::clamp(boundary, tauMin, tauMax));
			}
		}
	}
	std::sort(boundaries.begin(), boundaries.end());
	boundaries.erase(std::unique(boundaries.begin(), boundaries.end()), boundaries.end());

	std::vector<double> candidates = boundaries;
	for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
		candidates.push_back(0.5 * (boundaries[i] + boundaries[i + 1]));
	}
	std::sort(candidates.begin(), candidates.end());
	candidates.erase(std::unique(candidates.begin(), candidates.end(), [](double a, double b) { return std::abs(a - b) <= CANDIDATE_EPS; }),
	                 candidates.end());
	return candidates;
}

TauCurvePoint evaluateTau(const LabeledRatios& ratios, double tau, double acceptIpn) {
	TauCurvePoint p{};
	p.tau            = tau;
	p.thresholdRatio = tau * (1.0 - acceptIpn / 100.0);

	p.tp = static_cast<int>(std::count_if(ratios.good.begin(), ratios.good.end(), [&](double r) { return r <= p.thresholdRatio; }));
	p.fn = static_cast<int>(ratios.good.size()) - p.tp;
	p.tn = static_cast<int>(std::count_if(ratios.bad.begin(), ratios.bad.end(), [&](double r) { return r > p.thresholdRatio; }));
	p.fp = static_cast<int>(ratios.bad.size()) - p.tn;

	p.tpr              = ratios.good.empty() ? 0.0 : static_cast<double>(p.tp) / static_cast<double>(ratios.good.size());
	p.tnr              = ratios.bad.empty() ? 0.0 : static_cast<double>(p.tn) / static_cast<double>(ratios.bad.size());
	p.balancedAccuracy = 0.5 * (p.tpr + p.tnr);

	p.meanIpnGood = meanIpn(ratios.good, tau);
	p.meanIpnBad  = meanIpn(ratios.bad, tau);
	p.meanIpnGap  = p.meanIpnGood - p.meanIpnBad;
	return p;
}

TauCurve buildTauCurve(const LabeledRatios& ratios, double acceptIpn, double tauMin, double tauMax) {
	TauCurve curve{};
	curve.units           = ratios.units;
	curve.acceptIpn       = acceptIpn;
	curve.tauMin          = tauMin;
	curve.tauMax          = tauMax;
	curve.goodReportsUsed = static_cast<int>(ratios.good.size());
	curve.badReportsUsed  = static_cast<int>(ratios.bad.size());

	for (double tau: tauCandidates(ratios, acceptIpn, tauMin, tauMax)) {
		curve.points.push_back(evaluateTau(ratios, tau, acceptIpn));
	}
	return curve;
}

TauCurve downsampleTauCurve(const TauCurve& curve, int maxPoints) {
	if (maxPoints <= 0) {
		throw std::invalid_argument("max_points must be > 0");
	}

	const std::size_t n = curve.points.size();
	const auto k        = static_cast<std::size_t>(maxPoints);
	if (n <= k) {
		return curve;
	}

	TauCurve out = curve;
	out.points.clear();
	if (k == 1u) {
		out.points.push_back(curve.points.front());
		return out;
	}

	std::size_t last = n;
	for (std::size_t i = 0; i < k; ++i) {
		const auto idx = static_cast<std::size_t>(std::lround(static_cast<double>(i) * static_cast<double>(n - 1) / static_cast<double>(k - 1)));
		if (idx != last) {
			out.points.push_back(curve.points[idx]);
			last = idx;
		}
	}
	return out;
}

TauClassCalibrationResult calibrateTauFromRatios(const LabeledRatios& ratios, const LabeledTauOptions& options) {
	validateLabeledOptions(options.acceptIpn, options.tauMin, options.tauMax);

	const TauCurve curve = buildTauCurve(ratios, options.acceptIpn, options.tauMin, options.tauMax);
	if (curve.points.empty()) {
		throw std::invalid_argument("No tau candidates available for labeled calibration");
	}

	std::vector<const TauCurvePoint*> all, feasible;
	for (const auto& p: curve.points) {
		all.push_back(&p);
		if (isFeasible(p, options.constraints)) {
			feasible.push_back(&p);
		}
	}

	TauClassCalibrationResult result{};
	result.units           = ratios.units;
	result.goodReportsUsed = static_cast<int>(ratios.good.size());
	result.badReportsUsed  = static_cast<int>(ratios.bad.size());
	result.acceptIpn       = options.acceptIpn;
	result.tauMin          = options.tauMin;
	result.tauMax          = options.tauMax;
	result.objective       = options.objective;
	result.constraints     = options.constraints;
	result.feasiblePoints  = static_cast<int>(feasible.size());
	result.goodPaths       = ratios.goodPaths;
	result.badPaths        = ratios.badPaths;

	if (feasible.empty()) {
		// Constraints cannot be met: still deliver the best unconstrained tau and flag it.
		result.selected             = *bestPoint(all, options.objective);
		result.constraintsSatisfied = false;
		result.fallbackReason       = "no_feasible_points_for_constraints";
	} else {
		result.selected             = *bestPoint(feasible, options.objective);
		result.constraintsSatisfied = true;
	}
	result.tau = result.selected.tau;
	return result;
}

TauClassCalibrationResult calibrateTauFromLabeledReports(const std::vector<std::string>& goodPaths, const std::vector<std::string>& badPaths,
                                                         const LabeledTauOptions& options) {
	validateLabeledOptions(options.acceptIpn, options.tauMin, options.tauMax);
	return calibrateTauFromRatios(loadLabeledRatios(goodPaths, badPaths, options.preferMm), options);
}

TauCurve buildLabeledTauCurve(const std::vector<std::string>& goodPaths, const std::vector<std::string>& badPaths, double acceptIpn, bool preferMm,
                              double tauMin, double tauMax, int maxPoints) {
	validateLabeledOptions(acceptIpn, tauMin, tauMax);
	if (maxPoints <= 0) {
		throw std::invalid_argument("max_points must be > 0");
	}
	const LabeledRatios ratios = loadLabeledRatios(goodPaths, badPaths, preferMm);
	return downsampleTauCurve(buildTauCurve(ratios, acceptIpn, tauMin, tauMax), maxPoints);
}

} // namespace cutprec::precision::tau
