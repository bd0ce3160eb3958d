#include "precision/pipeline/report.hpp"

#include "precision/pipeline/configLoader.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>

#ifndef CUTPREC_VERSION
#define CUTPREC_VERSION "0.0.0"
#endif

namespace cutprec::precision::pipeline {

namespace {

using nlohmann::json;

static json optionalNumber(const std::optional<double>& value) {
	return value ? json(*value) : json(nullptr);
}

static json optionalPath(const std::optional<std::filesystem::path>& path) {
	return path ? json(path->string()) : json(nullptr);
}

static json inputsToJson(const ReportInputs& inputs) {
	return {
	        {"template", std::filesystem::absolute(inputs.templatePath).lexically_normal().string()},
	        {"test", std::filesystem::absolute(inputs.testPath).lexically_normal().string()},
	};
}

static json candidateRow(const core::RegistrationCandidateRow& row) {
	const auto& r = row.result;
	return {
	        {"method", std::string(core::toString(r.method))},
	        {"success", r.success},
	        {"reason", r.reason ? json(std::string(core::toString(*r.reason))) : json(nullptr)},
	        {"matches_total", r.matchesTotal},
	        {"matches_used", r.matchesUsed},
	        {"inlier_ratio", r.inlierRatio},
	        {"reprojection_error_px", optionalNumber(r.reprojectionErrorPx)},
	        {"selection_mad_px", optionalNumber(row.selectionMadPx)},
	};
}

static json registrationToJson(const core::RegistrationSelection& selection) {
	const auto& r = selection.selected;

	json candidates = json::array();
	for (const auto& row: selection.candidates) {
		candidates.push_back(candidateRow(row));
	}

	return {
	        {"status", r.success ? "ok" : "warning"},
	        {"method", std::string(core::toString(r.method))},
	        {"matches_total", r.matchesTotal},
	        {"matches_used", r.matchesUsed},
	        {"inlier_ratio", r.inlierRatio},
	        {"reprojection_error_px", optionalNumber(r.reprojectionErrorPx)},
	        {"reason", r.reason ? json(std::string(core::toString(*r.reason))) : json(nullptr)},
	        {"selection_strategy", "min_contour_mad_kdtree"},
	        {"selection_mad_px", optionalNumber(selection.selectionMadPx)},
	        {"candidates", candidates},
	};
}

static json diagnosticsToJson(const core::ContourDiagnostics& px, const std::optional<core::ContourDiagnostics>& mm) {
	return {
	        {"directed_mad_real_to_ideal_px", px.madRealToIdeal},
	        {"directed_mad_ideal_to_real_px", px.madIdealToReal},
	        {"bidirectional_mad_px", px.bidirectionalMad},
	        {"hausdorff_px", px.hausdorff},
	        {"directed_mad_real_to_ideal_mm", mm ? json(mm->madRealToIdeal) : json(nullptr)},
	        {"directed_mad_ideal_to_real_mm", mm ? json(mm->madIdealToReal) : json(nullptr)},
	        {"bidirectional_mad_mm", mm ? json(mm->bidirectionalMad) : json(nullptr)},
	        {"hausdorff_mm", mm ? json(mm->hausdorff) : json(nullptr)},
	};
}

static json metricsToJson(const core::Measurement& m, double tau) {
	const auto& mm = m.statsMm;
	return {
	        {"mad_px", m.statsPx.mad},
	        {"std_px", m.statsPx.std},
	        {"p95_px", m.statsPx.p95},
	        {"max_px", m.statsPx.maxError},
	        {"mad_mm", mm ? json(mm->mad) : json(nullptr)},
	        {"std_mm", mm ? json(mm->std) : json(nullptr)},
	        {"p95_mm", mm ? json(mm->p95) : json(nullptr)},
	        {"max_mm", mm ? json(mm->maxError) : json(nullptr)},
	        {"scale_px", m.scalePx},
	        {"scale_mm", optionalNumber(m.scaleMm)},
	        {"tau", tau},
	        {"tolerance_px", m.ipnPx.tolerance},
	        {"tolerance_mm", m.ipnMm ? json(m.ipnMm->tolerance) : json(nullptr)},
	        {"ipn_px", m.ipnPx.ipn},
	        {"ipn_mm", m.ipnMm ? json(m.ipnMm->ipn) : json(nullptr)},
	};
}

static json artifactsToJson(const std::filesystem::path& outDir) {
	const auto file = [&outDir](const char* name) { return std::filesystem::absolute(outDir / name).lexically_normal().string(); };
	return {
	        {"report_json", file("report.json")},
	        {"overlay_png", file("overlay.png")},
	        {"error_map_png", file("error_map.png")},
	        {"error_hist_png", file("error_hist.png")},
	        {"distances_csv", file("distances.csv")},
	        {"run_log", file("run.log")},
	        {"run_jsonl", file("run.jsonl")},
	};
}

} // namespace

TauCalibrationContext TauCalibrationContext::fixed() {
	return TauCalibrationContext{};
}

TauCalibrationContext TauCalibrationContext::fromAutoReports(tau::TargetTauOutput calibration) {
	TauCalibrationContext context{"auto_from_reports", "reports"};
	context.target = std::move(calibration);
	return context;
}

TauCalibrationContext TauCalibrationContext::fromAutoLabeledReports(tau::LabeledTauOutput calibration) {
	TauCalibrationContext context{"auto_from_labeled_reports", "reports_labeled"};
	context.labeled = std::move(calibration);
	return context;
}

json TauCalibrationContext::toJson() const {
	json out = {
	        {"mode", mode},
	        {"source", source},
	        {"policy", "custom"},
	        {"target_ipn", nullptr},
	        {"accept_ipn", nullptr},
	        {"reports_used", 0},
	        {"good_reports_used", 0},
	        {"bad_reports_used", 0},
	        {"report_patterns", json::array()},
	        {"good_report_patterns", json::array()},
	        {"bad_report_patterns", json::array()},
	        {"report_paths", json::array()},
	        {"good_report_paths", json::array()},
	        {"bad_report_paths", json::array()},
	        {"statistic", nullptr},
	        {"units", nullptr},
	        {"objective", nullptr},
	        {"max_mean_ipn_bad", nullptr},
	        {"min_mean_ipn_gap", nullptr},
	        {"min_tpr", nullptr},
	        {"min_tnr", nullptr},
	        {"constraints_satisfied", nullptr},
	        {"feasible_points", nullptr},
	        {"fallback_reason", nullptr},
	        {"balanced_accuracy", nullptr},
	        {"tpr", nullptr},
	        {"tnr", nullptr},
	        {"mean_ipn_good", nullptr},
	        {"mean_ipn_bad", nullptr},
	        {"mean_ipn_gap", nullptr},
	        {"tp", nullptr},
	        {"fn", nullptr},
	        {"tn", nullptr},
	        {"fp", nullptr},
	        {"curve_csv", nullptr},
	        {"curve_png", nullptr},
	        {"curve_points", nullptr},
	};

	if (target) {
		const auto& r           = target->result;
		out["target_ipn"]      = r.targetIpn;
		out["reports_used"]    = r.reportsUsed;
		out["report_patterns"] = target->reportPatterns;
		out["report_paths"]    = target->reportPaths();
		out["statistic"]       = std::string(tau::toString(r.statistic));
		out["units"]           = tau::toString(r.units);
	}

	if (labeled) {
		const auto& r = labeled->result;
		const auto& p = r.selected;

		out["policy"]                = labeled->policy.name;
		out["accept_ipn"]            = r.acceptIpn;
		out["reports_used"]          = r.goodReportsUsed + r.badReportsUsed;
		out["good_reports_used"]     = r.goodReportsUsed;
		out["bad_reports_used"]      = r.badReportsUsed;
		out["good_report_patterns"]  = labeled->goodReportPatterns;
		out["bad_report_patterns"]   = labeled->badReportPatterns;
		out["good_report_paths"]     = r.goodPaths;
		out["bad_report_paths"]      = r.badPaths;
		out["units"]                 = tau::toString(r.units);
		out["objective"]             = std::string(tau::toString(r.objective));
		out["max_mean_ipn_bad"]      = optionalNumber(r.constraints.maxMeanIpnBad);
		out["min_mean_ipn_gap"]      = optionalNumber(r.constraints.minMeanIpnGap);
		out["min_tpr"]               = optionalNumber(r.constraints.minTpr);
		out["min_tnr"]               = optionalNumber(r.constraints.minTnr);
		out["constraints_satisfied"] = r.constraintsSatisfied;
		out["feasible_points"]       = r.feasiblePoints;
		out["fallback_reason"]       = r.fallbackReason ? json(*r.fallbackReason) : json(nullptr);
		out["balanced_accuracy"]     = p.balancedAccuracy;
		out["tpr"]                   = p.tpr;
		out["tnr"]                   = p.tnr;
		out["mean_ipn_good"]         = p.meanIpnGood;
		out["mean_ipn_bad"]          = p.meanIpnBad;
		out["mean_ipn_gap"]          = p.meanIpnGap;
		out["tp"]                    = p.tp;
		out["fn"]                    = p.fn;
		out["tn"]                    = p.tn;
		out["fp"]                    = p.fp;
		out["curve_csv"]             = optionalPath(labeled->curveCsv);
		out["curve_png"]             = optionalPath(labeled->curvePng);
		out["curve_points"]          = labeled->curvePoints;
	}

	return out;
}

std::string utcTimestamp() {
	const auto now     = std::chrono::system_clock::now();
	const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
	const auto micros  = std::chrono::duration_cast<std::chrono::microseconds>(now - seconds).count();
	return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}+00:00", fmt::gmtime(std::chrono::system_clock::to_time_t(seconds)), micros);
}

json buildFailureReport(const ReportInputs& inputs, const core::AppConfig& config, const core::Measurement& measurement, const std::string& runId) {
	const auto stage = [](const core::ExtractionResult& r) { return json{{"success", r.success}, {"reason", r.success ? json(nullptr) : json(r.reason)}}; };

	return {
	        {"status", "failed"},
	        {"run_id", runId},
	        {"timestamp_utc", utcTimestamp()},
	        {"version", CUTPREC_VERSION},
	        {"inputs", inputsToJson(inputs)},
	        {"stages",
	         {
	                 {"ideal_extraction", stage(measurement.ideal)},
	                 {"real_extraction", stage(measurement.real)},
	         }},
	        {"config", configToJson(config)},
	};
}

json buildSuccessReport(const ReportInputs& inputs, const core::AppConfig& config, const core::Measurement& measurement, const std::string& runId,
                        const std::filesystem::path& outDir, const TauCalibrationContext& tauContext, const std::optional<std::string>& gitCommit) {
	const auto& calibration = measurement.calibration;
	const auto& validation  = measurement.validation;

	return {
	        {"status", "ok"},
	        {"run_id", runId},
	        {"timestamp_utc", utcTimestamp()},
	        {"version", CUTPREC_VERSION},
	        {"inputs", inputsToJson(inputs)},
	        {"registration", registrationToJson(measurement.registration)},
	        {"calibration",
	         {
	                 {"status", core::toString(calibration.status)},
	                 {"method", core::toString(calibration.method)},
	                 {"mm_per_px", optionalNumber(calibration.mmPerPx)},
	                 {"details", calibration.details},
	         }},
	        {"distance_method",
	         {
	                 {"primary", "distance_transform"},
	                 {"validation", config.distance.validateWithKdTree ? "kdtree" : "disabled"},
	                 {"validation_status", core::toString(validation.status)},
	                 {"validation_mean_abs_delta_px", optionalNumber(validation.meanAbsDeltaPx)},
	         }},
	        {"diagnostics", diagnosticsToJson(measurement.diagnosticsPx, measurement.diagnosticsMm)},
	        {"metrics", metricsToJson(measurement, config.metrics.tau)},
	        {"tau_calibration", tauContext.toJson()},
	        {"artifacts", artifactsToJson(outDir)},
	        {"config", configToJson(config)},
	        {"git", {{"commit", gitCommit ? json(*gitCommit) : json(nullptr)}}},
	};
}

} // namespace cutprec::precision::pipeline
