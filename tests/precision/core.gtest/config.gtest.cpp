#include "precision/core/config.hpp"

#include <gtest/gtest.h>

#include <string>

namespace cutprec::precision::core {
namespace gtest {

//! Field name of the ConfigError raised by validate, empty if it passes.
template <typename T>
static std::string failingField(const T& config) {
	try {
		config.validate();
	} catch (const ConfigError& e) {
		return e.field();
	}
	return {};
}

TEST(Config, Defaults_AreValid) {
	const AppConfig config{};
	EXPECT_NO_THROW(config.validate());
	EXPECT_GT(config.metrics.tau, 0.0);
	EXPECT_EQ(config.registration.eccMotion, EccMotion::Affine);
	EXPECT_FALSE(config.calibration.manualMmPerPx.has_value());
}

TEST(Config, Extraction_EvenBlockSize) {
	ExtractionConfig config{};
	config.idealAdaptiveBlockSize = 10;
	EXPECT_EQ(failingField(config), "extraction.ideal_adaptive_block_size");
}

TEST(Config, Registration_CannyOrder) {
	RegistrationConfig config{};
	config.axesCannyLow  = 180.0;
	config.axesCannyHigh = 120.0;
	EXPECT_EQ(failingField(config), "registration.axes_canny_low");
}

TEST(Config, Metrics_TauMustBePositive) {
	AppConfig config{};
	config.metrics.tau = 0.0;
	EXPECT_EQ(failingField(config), "metrics.tau");
}

TEST(Config, Sampling_NumPoints) {
	SamplingConfig config{};
	config.numPoints = 2;
	EXPECT_EQ(failingField(config), "sampling.num_points");

	config.numPoints = 3;
	EXPECT_TRUE(failingField(config).empty());
}

TEST(Config, Calibration_ManualScale) {
	CalibrationConfig config{};
	config.manualMmPerPx = -0.1;
	EXPECT_EQ(failingField(config), "calibration.manual_mm_per_px");
}

TEST(Config, EccMotion_Names) {
	for (const auto motion: {EccMotion::Translation, EccMotion::Euclidean, EccMotion::Affine, EccMotion::Homography}) {
		EXPECT_EQ(parseEccMotion(toString(motion)), motion);
	}

	try {
		parseEccMotion("projective");
		FAIL() << "Expected ConfigError";
	} catch (const ConfigError& e) {
		EXPECT_EQ(e.field(), "registration.ecc_motion");
		EXPECT_NE(std::string(e.what()).find("projective"), std::string::npos);
	}
}

TEST(Config, Error_MessageStartsWithField) {
	const ConfigError error("metrics.tau", "must be > 0");
	EXPECT_STREQ(error.what(), "metrics.tau: must be > 0");
}

} // namespace gtest
} // namespace cutprec::precision::core
