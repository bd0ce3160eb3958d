#include "precision/core/contourExtractor.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <cmath>

namespace cutprec::precision::core {
namespace gtest {

//! Mean distance of the contour points from a circle center.
static double meanRadius(const Contour& contour, cv::Point2f center) {
	double sum = 0.0;
	for (const auto& p: contour) {
		sum += std::hypot(p.x - center.x, p.y - center.y);
	}
	return sum / static_cast<double>(contour.size());
}

TEST(ContourExtractor, ComponentGroup_PrefersCentralComponents) {
	cv::Mat mask = cv::Mat::zeros(200, 200, CV_8UC1);
	cv::circle(mask, {85, 100}, 18, cv::Scalar(255), cv::FILLED);
	cv::circle(mask, {115, 100}, 18, cv::Scalar(255), cv::FILLED);
	cv::rectangle(mask, {0, 40}, {30, 140}, cv::Scalar(255), cv::FILLED); // Border touching distraction.

	ExtractionConfig config{};
	config.idealMinAreaRatio           = 0.001;
	config.idealGroupAreaRatioToMax    = 0.3;
	config.idealGroupCenterRadiusRatio = 0.5;
	config.idealGroupCloseKernel       = 11;

	const cv::Mat grouped = selectIdealComponentGroup(mask, config);
	ASSERT_FALSE(grouped.empty());

	EXPECT_EQ(cv::countNonZero(grouped.colRange(0, 20)), 0);

	cv::Mat labels, stats, centroids;
	const int count = cv::connectedComponentsWithStats(grouped > 0, labels, stats, centroids, 8);
	ASSERT_GE(count, 2);
	EXPECT_GT(stats.at<int>(1, cv::CC_STAT_AREA), 1500);
}

TEST(ContourExtractor, ComponentGroup_JoinsCentralFragments) {
	cv::Mat mask = cv::Mat::zeros(200, 200, CV_8UC1);
	cv::rectangle(mask, {70, 70}, {98, 130}, cv::Scalar(255), cv::FILLED);
	cv::rectangle(mask, {102, 70}, {130, 130}, cv::Scalar(255), cv::FILLED);

	ExtractionConfig config{};
	config.idealGroupCloseKernel = 9;

	const cv::Mat grouped = selectIdealComponentGroup(mask, config);
	ASSERT_FALSE(grouped.empty());

	cv::Mat labels;
	EXPECT_EQ(cv::connectedComponents(grouped > 0, labels, 8), 2); // Background and one merged part.
}

TEST(ContourExtractor, ComponentGroup_EmptyMask) {
	EXPECT_TRUE(selectIdealComponentGroup(cv::Mat::zeros(50, 50, CV_8UC1), ExtractionConfig{}).empty());
}

TEST(ContourExtractor, Ideal_CircleDrawing) {
	cv::Mat drawing(400, 400, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::circle(drawing, {200, 200}, 100, cv::Scalar(0, 0, 0), 2, cv::LINE_AA);

	const ExtractionResult result = extractIdealContour(drawing, ExtractionConfig{});
	ASSERT_TRUE(result.success) << result.reason;
	EXPECT_TRUE(result.reason.empty());
	EXPECT_FALSE(result.cleanedMask.empty());
	EXPECT_NEAR(meanRadius(result.contour, {200.f, 200.f}), 100.0, 6.0);
}

TEST(ContourExtractor, Real_DarkPartOnLightBackground) {
	cv::Mat photo(400, 400, CV_8UC3, cv::Scalar(235, 235, 235));
	cv::circle(photo, {200, 200}, 100, cv::Scalar(30, 30, 30), cv::FILLED);

	const ExtractionResult result = extractRealContour(photo, ExtractionConfig{});
	ASSERT_TRUE(result.success) << result.reason;
	EXPECT_NEAR(meanRadius(result.contour, {200.f, 200.f}), 100.0, 2.0);
}

TEST(ContourExtractor, Blank_ReportsReason) {
	const cv::Mat blank(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));

	const ExtractionResult ideal = extractIdealContour(blank, ExtractionConfig{});
	EXPECT_FALSE(ideal.success);
	EXPECT_EQ(ideal.reason, "no_ideal_contour_found");
	EXPECT_TRUE(ideal.contour.empty());

	const ExtractionResult real = extractRealContour(blank, ExtractionConfig{});
	EXPECT_FALSE(real.success);
	EXPECT_EQ(real.reason, "no_real_contour_found");
}

TEST(ContourExtractor, Debugger_CollectsStages) {
	cv::Mat photo(200, 200, CV_8UC3, cv::Scalar(235, 235, 235));
	cv::circle(photo, {100, 100}, 50, cv::Scalar(30, 30, 30), cv::FILLED);

	DebugVisualizer debugger;
	extractRealContour(photo, ExtractionConfig{}, &debugger);
	EXPECT_FALSE(debugger.stageImages("Extract Real").empty());
	EXPECT_FALSE(debugger.buildMosaic().empty());
}

TEST(ContourExtractor, Debugger_StageClosedWhenIdealFails) {
	const cv::Mat blank(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));

	DebugVisualizer debugger;
	const ExtractionResult ideal = extractIdealContour(blank, ExtractionConfig{}, &debugger);
	ASSERT_FALSE(ideal.success);

	// A closed stage does not pick up later images.
	debugger.add("Later", blank);
	EXPECT_EQ(debugger.stageImages("Extract Ideal").size(), 3u);
	EXPECT_EQ(debugger.stageImages("").size(), 1u);
}

} // namespace gtest
} // namespace cutprec::precision::core
