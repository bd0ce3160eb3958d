#include "precision/tau/tauService.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>

using namespace cutprec::precision::tau;

int main(int argc, char** argv) {
	CLI::App app{"Calibrate the IPN tolerance tau from earlier measurement reports"};

	std::vector<std::string> reports;
	std::vector<std::string> goodReports;
	std::vector<std::string> badReports;

	double targetIpn = DEFAULT_TARGET_IPN;
	double acceptIpn = DEFAULT_ACCEPT_IPN;
	std::string statistic{"median"};
	bool preferPx  = false;
	double tauMin  = DEFAULT_TAU_MIN;
	double tauMax  = 0.2;
	int maxPoints  = DEFAULT_CURVE_MAX_POINTS;

	std::string policy;
	std::string objective;
	double maxMeanIpnBad = 0.0;
	double minMeanIpnGap = 0.0;
	double minTpr        = 0.0;
	double minTnr        = 0.0;
	std::string curveCsv;
	std::string curvePng;

	auto* reportsOpt = app.add_option("--reports", reports, "Report globs for target IPN calibration");
	auto* goodOpt    = app.add_option("--good-reports", goodReports, "Report globs of accepted parts");
	auto* badOpt     = app.add_option("--bad-reports", badReports, "Report globs of rejected parts");
	reportsOpt->excludes(goodOpt)->excludes(badOpt);
	goodOpt->needs(badOpt);
	badOpt->needs(goodOpt);

	app.add_option("--target-ipn", targetIpn, "Target IPN of a typical report")->capture_default_str();
	app.add_option("--accept-ipn", acceptIpn, "IPN a part needs to be accepted")->capture_default_str();
	app.add_option("--statistic", statistic, "median, mean or p75")->capture_default_str();
	app.add_flag("--prefer-px", preferPx, "Prefer pixel metrics over millimeter metrics");
	app.add_option("--tau-min", tauMin, "Smallest tau considered")->capture_default_str();
	app.add_option("--tau-max", tauMax, "Largest tau considered")->capture_default_str();
	auto* policyOpt    = app.add_option("--policy", policy, "Preset: balanced, strict or lenient");
	auto* objectiveOpt = app.add_option("--objective", objective, "balanced_accuracy, balanced_accuracy_then_gap or gap_then_balanced_accuracy");
	auto* maxBadOpt    = app.add_option("--max-mean-ipn-bad", maxMeanIpnBad, "Upper limit of the mean IPN of bad parts");
	auto* minGapOpt    = app.add_option("--min-mean-ipn-gap", minMeanIpnGap, "Lower limit of the mean IPN gap");
	auto* minTprOpt    = app.add_option("--min-tpr", minTpr, "Lower limit of the true positive rate");
	auto* minTnrOpt    = app.add_option("--min-tnr", minTnr, "Lower limit of the true negative rate");
	auto* csvOpt       = app.add_option("--curve-csv", curveCsv, "Write the labeled tau curve as CSV");
	auto* pngOpt       = app.add_option("--curve-png", curvePng, "Write the labeled tau curve as PNG");
	app.add_option("--curve-max-points", maxPoints, "Points in the exported curve")->capture_default_str();

	CLI11_PARSE(app, argc, argv);

	try {
		if (reports.empty() && goodReports.empty()) {
			throw std::invalid_argument("Provide --reports or both --good-reports and --bad-reports");
		}

		if (!reports.empty()) {
			if (*csvOpt || *pngOpt) {
				throw std::invalid_argument("--curve-csv/--curve-png are only available in labeled mode");
			}

			TargetTauRequest request{};
			request.reportPatterns = reports;
			request.targetIpn      = targetIpn;
			request.preferPx       = preferPx;
			request.statistic      = parseTauStatistic(statistic);
			request.tauMin         = tauMin;
			request.tauMax         = tauMax;

			std::cout << buildTargetTauPayload(calibrateTargetTauFromPatterns(request)).dump(2) << std::endl;
			return 0;
		}

		LabeledTauRequest request{};
		request.goodReportPatterns = goodReports;
		request.badReportPatterns  = badReports;
		request.acceptIpn          = acceptIpn;
		request.preferPx           = preferPx;
		request.tauMin             = tauMin;
		request.tauMax             = tauMax;
		request.curveMaxPoints     = maxPoints;
		if (*policyOpt)
			request.policy = policy;
		if (*objectiveOpt)
			request.overrides.objective = parseTauObjective(objective);
		if (*maxBadOpt)
			request.overrides.maxMeanIpnBad = maxMeanIpnBad;
		if (*minGapOpt)
			request.overrides.minMeanIpnGap = minMeanIpnGap;
		if (*minTprOpt)
			request.overrides.minTpr = minTpr;
		if (*minTnrOpt)
			request.overrides.minTnr = minTnr;
		if (*csvOpt)
			request.curveCsv = curveCsv;
		if (*pngOpt)
			request.curvePng = curvePng;

		std::cout << buildLabeledTauPayload(calibrateLabeledTauFromPatterns(request)).dump(2) << std::endl;
		return 0;
	} catch (const std::exception& e) {
		spdlog::error("{}", e.what());
	}
	return 1;
}
