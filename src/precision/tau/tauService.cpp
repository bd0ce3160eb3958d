#include "precision/tau/tauService.hpp"

#include "precision/tau/reportMetrics.hpp"
#include "precision/tau/tauExport.hpp"

namespace cutprec::precision::tau {

std::vector<std::string> TargetTauOutput::reportPaths() const {
	std::vector<std::string> paths;
	for (const auto& c: result.candidates) {
		paths.push_back(c.reportPath);
	}
	return paths;
}

nlohmann::json optionalToJson(const std::optional<double>& value) {
	return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

TargetTauOutput calibrateTargetTauFromPatterns(const TargetTauRequest& request) {
	TargetTauOptions options{};
	options.targetIpn = request.targetIpn;
	options.preferMm  = !request.preferPx;
	options.statistic = request.statistic;
	options.tauMin    = request.tauMin;
	options.tauMax    = request.tauMax;

	return TargetTauOutput{calibrateTauFromReports(collectReportPaths(request.reportPatterns), options), request.reportPatterns};
}

LabeledTauOutput calibrateLabeledTauFromPatterns(const LabeledTauRequest& request) {
	const auto goodPaths = collectReportPaths(request.goodReportPatterns);
	const auto badPaths  = collectReportPaths(request.badReportPatterns);
	const TauPolicy policy = resolveLabeledPolicy(request.policy, request.overrides);

	LabeledTauOptions options{};
	options.acceptIpn   = request.acceptIpn;
	options.preferMm    = !request.preferPx;
	options.tauMin      = request.tauMin;
	options.tauMax      = request.tauMax;
	options.objective   = policy.objective;
	options.constraints = policy.constraints;

	validateLabeledOptions(options.acceptIpn, options.tauMin, options.tauMax);
	const LabeledRatios ratios = loadLabeledRatios(goodPaths, badPaths, options.preferMm);

	LabeledTauOutput output{calibrateTauFromRatios(ratios, options), policy, request.goodReportPatterns, request.badReportPatterns};

	const TauCurve curve = downsampleTauCurve(buildTauCurve(ratios, options.acceptIpn, options.tauMin, options.tauMax), request.curveMaxPoints);
	output.curvePoints   = static_cast<int>(curve.points.size());
	if (request.curveCsv) {
		output.curveCsv = writeTauCurveCsv(*request.curveCsv, curve);
	}
	if (request.curvePng) {
		output.curvePng = writeTauCurvePng(*request.curvePng, curve, output.result.tau);
	}
	return output;
}

nlohmann::json buildTargetTauPayload(const TargetTauOutput& calibration) {
	const auto& r = calibration.result;

	nlohmann::json candidates = nlohmann::json::array();
	for (const auto& c: r.candidates) {
		candidates.push_back(c.tau);
	}

	return {
	        {"mode", "target_ipn"},
	        {"tau", r.tau},
	        {"units", toString(r.units)},
	        {"reports_used", r.reportsUsed},
	        {"target_ipn", r.targetIpn},
	        {"statistic", std::string(toString(r.statistic))},
	        {"tau_min", r.tauMin},
	        {"tau_max", r.tauMax},
	        {"report_paths", calibration.reportPaths()},
	        {"tau_candidates", candidates},
	};
}

nlohmann::json buildLabeledTauPayload(const LabeledTauOutput& calibration) {
	const auto& r = calibration.result;
	const auto& p = r.selected;

	const auto pathOrNull = [](const std::optional<std::filesystem::path>& path) {
		return path ? nlohmann::json(path->string()) : nlohmann::json(nullptr);
	};

	return {
	        {"mode", "labeled"},
	        {"tau", r.tau},
	        {"units", toString(r.units)},
	        {"good_reports_used", r.goodReportsUsed},
	        {"bad_reports_used", r.badReportsUsed},
	        {"accept_ipn", r.acceptIpn},
	        {"policy", calibration.policy.name},
	        {"objective", std::string(toString(r.objective))},
	        {"max_mean_ipn_bad", optionalToJson(r.constraints.maxMeanIpnBad)},
	        {"min_mean_ipn_gap", optionalToJson(r.constraints.minMeanIpnGap)},
	        {"min_tpr", optionalToJson(r.constraints.minTpr)},
	        {"min_tnr", optionalToJson(r.constraints.minTnr)},
	        {"constraints_satisfied", r.constraintsSatisfied},
	        {"feasible_points", r.feasiblePoints},
	        {"fallback_reason", r.fallbackReason ? nlohmann::json(*r.fallbackReason) : nlohmann::json(nullptr)},
	        {"balanced_accuracy", p.balancedAccuracy},
	        {"tpr", p.tpr},
	        {"tnr", p.tnr},
	        {"mean_ipn_good", p.meanIpnGood},
	        {"mean_ipn_bad", p.meanIpnBad},
	        {"mean_ipn_gap", p.meanIpnGap},
	        {"tp", p.tp},
	        {"fn", p.fn},
	        {"tn", p.tn},
	        {"fp", p.fp},
	        {"tau_min", r.tauMin},
	        {"tau_max", r.tauMax},
	        {"good_paths", r.goodPaths},
	        {"bad_paths", r.badPaths},
	        {"curve_csv", pathOrNull(calibration.curveCsv)},
	        {"curve_png", pathOrNull(calibration.curvePng)},
	        {"curve_points", calibration.curvePoints},
	};
}

} // namespace cutprec::precision::tau
