#include "precision/tau/tauService.hpp"

#include "reportFixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace cutprec::precision::tau {
namespace gtest {

using TauService = ReportDirectory;

TEST_F(TauService, Labeled_BalancedPolicy) {
	writeReport("good1.json", 8.0, 100.0);
	writeReport("good2.json", 10.0, 100.0);
	writeReport("bad1.json", 35.0, 100.0);
	writeReport("bad2.json", 40.0, 100.0);

	LabeledTauRequest request{};
	request.goodReportPatterns = {pattern("good*.json")};
	request.badReportPatterns  = {pattern("bad*.json")};
	request.acceptIpn          = 70.0;
	request.preferPx           = true;
	request.tauMin             = 0.05;
	request.tauMax             = 0.5;
	request.policy             = "balanced";

	const LabeledTauOutput output = calibrateLabeledTauFromPatterns(request);
	const nlohmann::json payload  = buildLabeledTauPayload(output);

	EXPECT_EQ(payload["mode"], "labeled");
	EXPECT_EQ(payload["units"], "px");
	EXPECT_EQ(payload["policy"], "balanced");
	EXPECT_EQ(payload["objective"], "balanced_accuracy_then_gap");
	EXPECT_EQ(payload["max_mean_ipn_bad"], 25.0);
	EXPECT_EQ(payload["min_mean_ipn_gap"], 10.0);
	EXPECT_TRUE(payload["min_tpr"].is_null());
	EXPECT_EQ(payload["constraints_satisfied"], true);
	EXPECT_GE(payload["feasible_points"].get<int>(), 1);
	EXPECT_TRUE(payload["fallback_reason"].is_null());
	EXPECT_EQ(payload["balanced_accuracy"], 1.0);
	EXPECT_EQ(payload["good_paths"].size(), 2u);
	EXPECT_TRUE(payload["curve_csv"].is_null());
	EXPECT_GT(payload["curve_points"].get<int>(), 0);
}

TEST_F(TauService, Labeled_ExportsCurve) {
	writeReport("good.json", 10.0, 100.0);
	writeReport("bad.json", 40.0, 100.0);

	LabeledTauRequest request{};
	request.goodReportPatterns = {pattern("good*.json")};
	request.badReportPatterns  = {pattern("bad*.json")};
	request.preferPx           = true;
	request.curveMaxPoints     = 3;
	request.curveCsv           = dir() / "curve" / "tau_curve.csv";
	request.curvePng           = dir() / "curve" / "tau_curve.png";

	const LabeledTauOutput output = calibrateLabeledTauFromPatterns(request);
	ASSERT_TRUE(output.curveCsv.has_value());
	ASSERT_TRUE(output.curvePng.has_value());
	EXPECT_TRUE(std::filesystem::exists(*output.curveCsv));
	EXPECT_TRUE(std::filesystem::exists(*output.curvePng));
	EXPECT_LE(output.curvePoints, 3);

	std::ifstream csv(*output.curveCsv);
	std::string header;
	std::getline(csv, header);
	EXPECT_EQ(header, "tau,threshold_ratio,balanced_accuracy,tpr,tnr,mean_ipn_good,mean_ipn_bad,mean_ipn_gap,tp,fn,tn,fp");

	int rows = 0;
	for (std::string line; std::getline(csv, line);) {
		++rows;
	}
	EXPECT_EQ(rows, output.curvePoints);
}

TEST_F(TauService, Target_Payload) {
	writeReport("r1.json", 10.0, 100.0, 4.0, 40.0);
	writeReport("r2.json", 8.0, 100.0, 2.0, 40.0);

	TargetTauRequest request{};
	request.reportPatterns = {pattern("r*.json")};
	request.tauMin         = 0.01;
	request.tauMax         = 1.0;

	const TargetTauOutput output = calibrateTargetTauFromPatterns(request);
	const nlohmann::json payload = buildTargetTauPayload(output);

	EXPECT_EQ(payload["mode"], "target_ipn");
	EXPECT_EQ(payload["units"], "mm");
	EXPECT_EQ(payload["reports_used"], 2);
	EXPECT_EQ(payload["statistic"], "median");
	EXPECT_NEAR(payload["tau"].get<double>(), 0.375, 1e-12);
	EXPECT_EQ(payload["report_paths"].size(), 2u);
	EXPECT_EQ(payload["tau_candidates"].size(), 2u);
	EXPECT_EQ(output.reportPaths().size(), 2u);
}

TEST_F(TauService, Target_NoReports) {
	TargetTauRequest request{};
	request.reportPatterns = {pattern("*.json")};
	EXPECT_THROW(calibrateTargetTauFromPatterns(request), std::invalid_argument);
}

TEST(TauServiceJson, OptionalValue) {
	EXPECT_TRUE(optionalToJson(std::nullopt).is_null());
	EXPECT_EQ(optionalToJson(0.25), 0.25);
}

} // namespace gtest
} // namespace cutprec::precision::tau
