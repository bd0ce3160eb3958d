#include "precision/pipeline/configLoader.hpp"

#include "tempDirectory.hpp"

#include <gtest/gtest.h>

#include <string>

namespace cutprec::precision::pipeline {
namespace gtest {

using ConfigLoader = TempDirectory;

//! Field name of the ConfigError raised while loading, empty if loading succeeds.
static std::string failingField(const std::optional<std::filesystem::path>& path) {
	try {
		loadAppConfig(path);
	} catch (const core::ConfigError& e) {
		return e.field();
	}
	return {};
}

TEST_F(ConfigLoader, NoPath_Defaults) {
	const core::AppConfig config = loadAppConfig(std::nullopt);
	EXPECT_DOUBLE_EQ(config.metrics.tau, core::MetricsConfig{}.tau);
	EXPECT_DOUBLE_EQ(config.sampling.stepPx, core::SamplingConfig{}.stepPx);
}

TEST_F(ConfigLoader, Json_MergesOverDefaults) {
	const auto path = writeText("config.json", R"({
		"metrics": {"tau": 0.05},
		"registration": {"ecc_motion": "homography", "use_axes_fallback": false},
		"calibration": {"manual_mm_per_px": 0.2},
		"sampling": {"num_points": 500}
	})");

	const core::AppConfig config = loadAppConfig(path);
	EXPECT_DOUBLE_EQ(config.metrics.tau, 0.05);
	EXPECT_EQ(config.registration.eccMotion, core::EccMotion::Homography);
	EXPECT_FALSE(config.registration.useAxesFallback);
	EXPECT_EQ(config.calibration.manualMmPerPx, 0.2);
	EXPECT_EQ(config.sampling.numPoints, 500);

	// Untouched keys keep their defaults.
	EXPECT_EQ(config.registration.orbNFeatures, core::RegistrationConfig{}.orbNFeatures);
	EXPECT_DOUBLE_EQ(config.metrics.clampHigh, 100.0);
}

TEST_F(ConfigLoader, Yaml_MergesOverDefaults) {
	const auto path = writeText("config.yaml",
	                            "extraction:\n"
	                            "  ideal_adaptive_block_size: 31\n"
	                            "registration:\n"
	                            "  ecc_motion: \"translation\"\n"
	                            "  knn_ratio: 0.8\n"
	                            "distance:\n"
	                            "  use_bilinear: false\n"
	                            "sampling:\n"
	                            "  num_points: ~\n"
	                            "  step_px: 2\n");

	const core::AppConfig config = loadAppConfig(path);
	EXPECT_EQ(config.extraction.idealAdaptiveBlockSize, 31);
	EXPECT_EQ(config.registration.eccMotion, core::EccMotion::Translation);
	EXPECT_DOUBLE_EQ(config.registration.knnRatio, 0.8);
	EXPECT_FALSE(config.distance.useBilinear);
	EXPECT_FALSE(config.sampling.numPoints.has_value());
	EXPECT_DOUBLE_EQ(config.sampling.stepPx, 2.0);
}

TEST_F(ConfigLoader, EmptyYaml_Defaults) {
	const core::AppConfig config = loadAppConfig(writeText("empty.yml", ""));
	EXPECT_DOUBLE_EQ(config.metrics.tau, core::MetricsConfig{}.tau);
}

TEST_F(ConfigLoader, InvalidValues) {
	EXPECT_EQ(failingField(writeText("tau.json", R"({"metrics": {"tau": 0.0}})")), "metrics.tau");
	EXPECT_EQ(failingField(writeText("canny.json", R"({"registration": {"axes_canny_low": 180, "axes_canny_high": 120}})")),
	          "registration.axes_canny_low");
	EXPECT_EQ(failingField(writeText("motion.json", R"({"registration": {"ecc_motion": "projective"}})")), "registration.ecc_motion");
	EXPECT_EQ(failingField(writeText("block.yaml", "extraction:\n  ideal_adaptive_block_size: 10\n")), "extraction.ideal_adaptive_block_size");
}

TEST_F(ConfigLoader, InvalidStructure) {
	EXPECT_EQ(failingField(writeText("section.json", R"({"plotting": {"dpi": 300}})")), "plotting");
	EXPECT_EQ(failingField(writeText("key.json", R"({"metrics": {"taux": 0.1}})")), "metrics.taux");
	EXPECT_EQ(failingField(writeText("mapping.json", R"({"metrics": 0.1})")), "metrics");
	EXPECT_EQ(failingField(writeText("type.json", R"({"sampling": {"max_points": "many"}})")), "sampling.max_points");
	EXPECT_EQ(failingField(writeText("integer.json", R"({"sampling": {"max_points": 100.5}})")), "sampling.max_points");
	EXPECT_EQ(failingField(writeText("bool.json", R"({"distance": {"use_bilinear": 1}})")), "distance.use_bilinear");
}

TEST_F(ConfigLoader, InvalidFiles) {
	EXPECT_EQ(failingField(dir() / "missing.json"), "config");
	EXPECT_EQ(failingField(writeText("config.toml", "[metrics]\ntau = 0.1\n")), "config");
	EXPECT_EQ(failingField(writeText("broken.json", "{\"metrics\": ")), "config");
	EXPECT_EQ(failingField(writeText("broken.yaml", "metrics: [1, 2\n")), "config");
	EXPECT_EQ(failingField(writeText("list.yaml", "- 1\n- 2\n")), "config");
}

TEST(ConfigJson, ToJsonAndBack) {
	core::AppConfig config{};
	config.metrics.tau                = 0.03;
	config.registration.eccMotion     = core::EccMotion::Euclidean;
	config.calibration.manualMmPerPx  = 0.25;

	const nlohmann::json document = configToJson(config);
	EXPECT_EQ(document["metrics"]["tau"], 0.03);
	EXPECT_EQ(document["registration"]["ecc_motion"], "euclidean");
	EXPECT_TRUE(document["sampling"]["num_points"].is_null());

	const core::AppConfig restored = configFromJson(document);
	EXPECT_DOUBLE_EQ(restored.metrics.tau, 0.03);
	EXPECT_EQ(restored.registration.eccMotion, core::EccMotion::Euclidean);
	EXPECT_EQ(restored.calibration.manualMmPerPx, 0.25);
	EXPECT_EQ(configToJson(restored), document);
}

} // namespace gtest
} // namespace cutprec::precision::pipeline
