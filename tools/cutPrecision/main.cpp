#include "precision/core/config.hpp"
#include "precision/pipeline/pipeline.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>

namespace {

using cutprec::precision::pipeline::PipelineOptions;

//! CLI11 needs plain values for options; optionals are filled from them after parsing.
struct OptionalValues {
	double stepPx{0.0};
	int numPoints{0};
	double tau{0.0};
	double manualMmPerPx{0.0};
	std::string config;
	std::string policy;
	std::string objective;
	double maxMeanIpnBad{0.0};
	double minMeanIpnGap{0.0};
	double minTpr{0.0};
	double minTnr{0.0};
	std::string curveCsv;
	std::string curvePng;
};

} // namespace

int main(int argc, char** argv) {
	CLI::App app{"Measure how precisely a part was cut compared to its template drawing"};

	PipelineOptions options{};
	OptionalValues values{};
	std::string templatePath;
	std::string testPath;
	std::string outDir{"out"};

	app.add_option("--template", templatePath, "Template drawing (ideal contour)")->required();
	app.add_option("--test", testPath, "Photo of the cut part (real contour)")->required();
	app.add_option("--out", outDir, "Output directory")->capture_default_str();
	auto* configOpt = app.add_option("--config", values.config, "JSON or YAML configuration file");

	auto* stepOpt   = app.add_option("--step-px", values.stepPx, "Resampling step in pixels");
	auto* pointsOpt = app.add_option("--num-points", values.numPoints, "Fixed number of resampled points");
	auto* tauOpt    = app.add_option("--tau", values.tau, "Tolerance as fraction of the part diagonal");

	auto& tauAuto = options.tauAuto;
	app.add_option("--tau-auto-reports", tauAuto.reports, "Report globs for target IPN calibration");
	app.add_option("--tau-auto-target-ipn", tauAuto.targetIpn, "Target IPN of a typical report")->capture_default_str();
	app.add_option("--tau-auto-statistic", tauAuto.statistic, "median, mean or p75")->capture_default_str();
	app.add_option("--tau-auto-good-reports", tauAuto.goodReports, "Report globs of accepted parts");
	app.add_option("--tau-auto-bad-reports", tauAuto.badReports, "Report globs of rejected parts");
	app.add_option("--tau-auto-accept-ipn", tauAuto.acceptIpn, "IPN a part needs to be accepted")->capture_default_str();
	auto* policyOpt    = app.add_option("--tau-auto-policy", values.policy, "Preset: balanced, strict or lenient");
	auto* objectiveOpt = app.add_option("--tau-auto-objective", values.objective,
	                                    "balanced_accuracy, balanced_accuracy_then_gap or gap_then_balanced_accuracy");
	auto* maxBadOpt    = app.add_option("--tau-auto-max-mean-ipn-bad", values.maxMeanIpnBad, "Upper limit of the mean IPN of bad parts");
	auto* minGapOpt    = app.add_option("--tau-auto-min-mean-ipn-gap", values.minMeanIpnGap, "Lower limit of the mean IPN gap");
	auto* minTprOpt    = app.add_option("--tau-auto-min-tpr", values.minTpr, "Lower limit of the true positive rate");
	auto* minTnrOpt    = app.add_option("--tau-auto-min-tnr", values.minTnr, "Lower limit of the true negative rate");
	app.add_flag("--tau-auto-prefer-px", tauAuto.preferPx, "Prefer pixel metrics over millimeter metrics");
	app.add_option("--tau-auto-min", tauAuto.tauMin, "Smallest tau considered")->capture_default_str();
	app.add_option("--tau-auto-max", tauAuto.tauMax, "Largest tau considered")->capture_default_str();
	auto* csvOpt = app.add_option("--tau-auto-curve-csv", values.curveCsv, "Write the labeled tau curve as CSV");
	auto* pngOpt = app.add_option("--tau-auto-curve-png", values.curvePng, "Write the labeled tau curve as PNG");
	app.add_option("--tau-auto-curve-max-points", tauAuto.curveMaxPoints, "Points in the exported curve")->capture_default_str();

	auto* mmOpt = app.add_option("--manual-mm-per-px", values.manualMmPerPx, "Skip ruler detection and use this scale");
	app.add_flag("--no-kd-validate", options.noKdValidate, "Disable the k-d tree cross check of the distances");
	app.add_flag("--debug", options.debug, "Verbose console output and extraction masks");

	CLI11_PARSE(app, argc, argv);

	options.templatePath = templatePath;
	options.testPath     = testPath;
	options.outDir       = outDir;
	if (*configOpt)
		options.configPath = values.config;
	if (*stepOpt)
		options.stepPx = values.stepPx;
	if (*pointsOpt)
		options.numPoints = values.numPoints;
	if (*tauOpt)
		options.tau = values.tau;
	if (*policyOpt)
		tauAuto.policy = values.policy;
	if (*objectiveOpt)
		tauAuto.objective = values.objective;
	if (*maxBadOpt)
		tauAuto.maxMeanIpnBad = values.maxMeanIpnBad;
	if (*minGapOpt)
		tauAuto.minMeanIpnGap = values.minMeanIpnGap;
	if (*minTprOpt)
		tauAuto.minTpr = values.minTpr;
	if (*minTnrOpt)
		tauAuto.minTnr = values.minTnr;
	if (*csvOpt)
		tauAuto.curveCsv = values.curveCsv;
	if (*pngOpt)
		tauAuto.curvePng = values.curvePng;
	if (*mmOpt)
		options.manualMmPerPx = values.manualMmPerPx;

	try {
		const auto result = cutprec::precision::pipeline::runPipeline(options);
		const auto& printed = result.exitCode == cutprec::precision::pipeline::EXIT_OK ? result.report.at("metrics") : result.report;
		std::cout << printed.dump(2) << std::endl;
		return result.exitCode;
	} catch (const cutprec::precision::core::ConfigError& e) {
		spdlog::error("Invalid configuration: {}", e.what());
	} catch (const std::exception& e) {
		spdlog::error("{}", e.what());
	}
	return cutprec::precision::pipeline::EXIT_ERROR;
}
