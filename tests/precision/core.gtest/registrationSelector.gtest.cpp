#include "precision/core/registrationSelector.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace cutprec::precision::core {
namespace gtest {

//! Outline of the 100x100 square with one point per pixel.
static Contour squareOutline() {
	Contour points;
	for (int x = 0; x <= 100; ++x)
		points.emplace_back(static_cast<float>(x), 0.f);
	for (int y = 1; y <= 100; ++y)
		points.emplace_back(100.f, static_cast<float>(y));
	for (int x = 99; x >= 0; --x)
		points.emplace_back(static_cast<float>(x), 100.f);
	for (int y = 99; y >= 1; --y)
		points.emplace_back(0.f, static_cast<float>(y));
	return points;
}

static RegistrationResult translation(RegistrationMethod method, double tx, double ty, bool success = true) {
	RegistrationResult result{};
	result.method  = method;
	result.success = success;
	if (success) {
		result.homography  = (cv::Mat_<double>(3, 3) << 1.0, 0.0, tx, 0.0, 1.0, ty, 0.0, 0.0, 1.0);
		result.inlierRatio = 1.0;
	} else {
		result.reason = RegistrationFailure::EccFailed;
	}
	return result;
}

TEST(RegistrationSelector, LowestMadWins) {
	const Contour ideal = squareOutline();
	Contour real;
	for (const auto& p: ideal) {
		real.emplace_back(p.x + 20.f, p.y - 10.f);
	}

	const auto bad    = translation(RegistrationMethod::OrbHomography, 0.0, 0.0);
	const auto good   = translation(RegistrationMethod::AxesFallback, -20.0, 10.0);
	const auto failed = translation(RegistrationMethod::EccFallback, 0.0, 0.0, false);

	const RegistrationSelection selection = selectRegistration({bad, good, failed}, real, ideal);
	EXPECT_EQ(selection.selected.method, RegistrationMethod::AxesFallback);
	ASSERT_TRUE(selection.selectionMadPx.has_value());
	EXPECT_LT(*selection.selectionMadPx, 0.5);

	ASSERT_EQ(selection.candidates.size(), 3u);
	EXPECT_TRUE(selection.candidates[0].selectionMadPx.has_value());
	EXPECT_GT(*selection.candidates[0].selectionMadPx, 5.0);
	EXPECT_TRUE(selection.candidates[1].selectionMadPx.has_value());
	EXPECT_FALSE(selection.candidates[2].selectionMadPx.has_value());
}

TEST(RegistrationSelector, AllFailed_KeepsFirstCandidate) {
	const Contour ideal = squareOutline();

	const auto first  = translation(RegistrationMethod::OrbHomography, 0.0, 0.0, false);
	const auto second = translation(RegistrationMethod::EccFallback, 0.0, 0.0, false);

	const RegistrationSelection selection = selectRegistration({first, second}, ideal, ideal);
	EXPECT_EQ(selection.selected.method, RegistrationMethod::OrbHomography);
	EXPECT_FALSE(selection.selected.success);
	EXPECT_FALSE(selection.selectionMadPx.has_value());
	EXPECT_EQ(selection.candidates.size(), 2u);
}

TEST(RegistrationSelector, Ties_KeepEarlierCandidate) {
	const Contour ideal = squareOutline();

	const auto first  = translation(RegistrationMethod::OrbHomography, 0.0, 0.0);
	const auto second = translation(RegistrationMethod::AxesFallback, 0.0, 0.0);

	const RegistrationSelection selection = selectRegistration({first, second}, ideal, ideal);
	EXPECT_EQ(selection.selected.method, RegistrationMethod::OrbHomography);
}

TEST(RegistrationSelector, DegenerateHomography_NeverWins) {
	const Contour ideal = squareOutline();

	// All points collapse onto the origin.
	auto collapsed       = translation(RegistrationMethod::OrbHomography, 0.0, 0.0);
	collapsed.homography = cv::Mat::zeros(3, 3, CV_64F);

	auto nan                        = translation(RegistrationMethod::EccFallback, 0.0, 0.0);
	nan.homography.at<double>(0, 0) = std::numeric_limits<double>::quiet_NaN();

	const auto offset = translation(RegistrationMethod::AxesFallback, 3.0, 0.0);

	const RegistrationSelection selection = selectRegistration({collapsed, offset, nan}, ideal, ideal);
	EXPECT_EQ(selection.selected.method, RegistrationMethod::AxesFallback);
	ASSERT_TRUE(selection.selectionMadPx.has_value());
	EXPECT_TRUE(std::isfinite(*selection.selectionMadPx));

	ASSERT_EQ(selection.candidates.size(), 3u);
	EXPECT_FALSE(selection.candidates[0].selectionMadPx.has_value());
	EXPECT_TRUE(selection.candidates[1].selectionMadPx.has_value());
	EXPECT_FALSE(selection.candidates[2].selectionMadPx.has_value());
}

TEST(RegistrationSelector, OnlyDegenerateCandidates_KeepFirst) {
	const Contour ideal = squareOutline();

	auto collapsed       = translation(RegistrationMethod::OrbHomography, 0.0, 0.0);
	collapsed.homography = cv::Mat::zeros(3, 3, CV_64F);

	const RegistrationSelection selection = selectRegistration({collapsed}, ideal, ideal);
	EXPECT_EQ(selection.selected.method, RegistrationMethod::OrbHomography);
	EXPECT_FALSE(selection.selectionMadPx.has_value());
}

TEST(RegistrationSelector, NoCandidates_Throws) {
	const Contour ideal = squareOutline();
	EXPECT_THROW(selectRegistration({}, ideal, ideal), std::invalid_argument);
}

} // namespace gtest
} // namespace cutprec::precision::core
