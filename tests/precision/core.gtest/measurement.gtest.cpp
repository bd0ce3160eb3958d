#include "precision/core/measurement.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace cutprec::precision::core {
namespace gtest {

//! Circle outline drawing and the photo of a matching dark disc. Both are already aligned.
static std::pair<cv::Mat, cv::Mat> circlePair() {
	cv::Mat drawing(400, 400, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::circle(drawing, {200, 200}, 100, cv::Scalar(0, 0, 0), 2, cv::LINE_AA);

	cv::Mat photo(400, 400, CV_8UC3, cv::Scalar(235, 235, 235));
	cv::circle(photo, {200, 200}, 100, cv::Scalar(30, 30, 30), cv::FILLED, cv::LINE_AA);
	return {drawing, photo};
}

//! Registration is forced to fail so the identity transform is used.
static AppConfig identityConfig() {
	AppConfig config{};
	config.registration.minMatches      = 100000;
	config.registration.useAxesFallback = false;
	config.registration.useEccFallback  = false;
	config.calibration.manualMmPerPx    = 0.1;
	return config;
}

TEST(Measurement, AlignedCircle) {
	const auto [drawing, photo] = circlePair();

	std::vector<StageEvent> events;
	const StageReporter reporter = [&](const StageEvent& e) { events.push_back(e); };

	const Measurement m = measureCut(drawing, photo, identityConfig(), reporter);
	ASSERT_EQ(m.status, MeasurementStatus::Ok);

	EXPECT_FALSE(m.registration.selected.success);
	EXPECT_EQ(m.registration.candidates.size(), 1u);

	EXPECT_FALSE(m.idealPoints.empty());
	EXPECT_FALSE(m.realPoints.empty());
	EXPECT_EQ(m.distancesPx.size(), m.realPoints.size());
	EXPECT_EQ(m.treeRealToIdeal.size(), m.realPoints.size());
	EXPECT_EQ(m.treeIdealToReal.size(), m.idealPoints.size());
	EXPECT_EQ(m.distanceMap.size(), drawing.size());

	EXPECT_LT(m.statsPx.mad, 5.0);
	EXPECT_EQ(m.validation.status, ValidationStatus::Ok);
	EXPECT_GE(m.ipnPx.ipn, 0.0);
	EXPECT_LE(m.ipnPx.ipn, 100.0);
	EXPECT_NEAR(m.scalePx, 200.0 * std::sqrt(2.0), 15.0);

	EXPECT_EQ(m.calibration.method, CalibrationMethod::Manual);
	ASSERT_TRUE(m.distancesMm.has_value());
	ASSERT_TRUE(m.statsMm.has_value());
	ASSERT_TRUE(m.scaleMm.has_value());
	ASSERT_TRUE(m.ipnMm.has_value());
	EXPECT_NEAR(m.statsMm->mad, 0.1 * m.statsPx.mad, 1e-9);
	EXPECT_NEAR(*m.scaleMm, 0.1 * m.scalePx, 1e-9);
	EXPECT_NEAR(m.ipnMm->ipn, m.ipnPx.ipn, 1e-6);

	ASSERT_FALSE(events.empty());
	EXPECT_EQ(events.front().stage, "extract.ideal");
	EXPECT_EQ(events.front().status, StageStatus::Started);
	const auto registerEnd = std::find_if(events.begin(), events.end(), [](const StageEvent& e) { return e.stage == "register" && e.status != StageStatus::Started; });
	ASSERT_NE(registerEnd, events.end());
	EXPECT_EQ(registerEnd->status, StageStatus::Failed);
	EXPECT_EQ(registerEnd->detail, "no_successful_registration");
	EXPECT_EQ(events.back().stage, "metrics.compute");
	EXPECT_EQ(events.back().status, StageStatus::Ok);
}

TEST(Measurement, WithoutCalibration_NoMillimeters) {
	const auto [drawing, photo] = circlePair();

	AppConfig config = identityConfig();
	config.calibration.manualMmPerPx.reset();
	config.distance.validateWithKdTree = false;

	const Measurement m = measureCut(drawing, photo, config);
	ASSERT_EQ(m.status, MeasurementStatus::Ok);
	EXPECT_EQ(m.validation.status, ValidationStatus::Disabled);
	if (!m.calibration.mmPerPx) {
		EXPECT_FALSE(m.distancesMm.has_value());
		EXPECT_FALSE(m.statsMm.has_value());
		EXPECT_FALSE(m.ipnMm.has_value());
	}
}

TEST(Measurement, BlankImages_ExtractionFails) {
	const cv::Mat blank(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));

	std::vector<StageEvent> events;
	const StageReporter reporter = [&](const StageEvent& e) { events.push_back(e); };

	const Measurement m = measureCut(blank, blank, AppConfig{}, reporter);
	EXPECT_EQ(m.status, MeasurementStatus::ExtractionFailed);
	EXPECT_EQ(m.ideal.reason, "no_ideal_contour_found");
	EXPECT_EQ(m.real.reason, "no_real_contour_found");
	EXPECT_TRUE(m.distancesPx.empty());

	ASSERT_EQ(events.size(), 4u);
	EXPECT_EQ(events[1].status, StageStatus::Failed);
	EXPECT_EQ(events[3].stage, "extract.real");
	EXPECT_EQ(events[3].status, StageStatus::Failed);
}

TEST(Measurement, Debugger_CollectsDistanceStage) {
	const auto [drawing, photo] = circlePair();

	DebugVisualizer debugger;
	measureCut(drawing, photo, identityConfig(), {}, &debugger);
	EXPECT_FALSE(debugger.stageImages("Distances").empty());
	EXPECT_FALSE(debugger.buildMosaic().empty());
}

} // namespace gtest
} // namespace cutprec::precision::core
