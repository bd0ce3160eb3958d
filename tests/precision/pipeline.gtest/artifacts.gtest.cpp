#include "precision/pipeline/artifacts.hpp"

#include "tempDirectory.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <stdexcept>
#include <string>

namespace cutprec::precision::pipeline {
namespace gtest {

using Artifacts = TempDirectory;

TEST_F(Artifacts, ReadImage_LoadsWrittenImage) {
	cv::Mat sample = cv::Mat::zeros(12, 16, CV_8UC3);
	sample(cv::Rect(5, 2, 3, 2)).setTo(cv::Scalar(255, 255, 255));
	ASSERT_TRUE(cv::imwrite((dir() / "sample.png").string(), sample));

	const cv::Mat loaded = readBgrImage(dir() / "sample.png");
	EXPECT_EQ(loaded.size(), sample.size());
	EXPECT_EQ(loaded.type(), CV_8UC3);
}

TEST_F(Artifacts, ReadImage_GrayBecomesBgr) {
	ASSERT_TRUE(cv::imwrite((dir() / "gray.png").string(), cv::Mat(8, 8, CV_8UC1, cv::Scalar(128))));
	EXPECT_EQ(readBgrImage(dir() / "gray.png").channels(), 3);
}

TEST_F(Artifacts, ReadImage_MissingFile) {
	try {
		readBgrImage(dir() / "missing.png");
		FAIL() << "Expected std::runtime_error";
	} catch (const std::runtime_error& e) {
		EXPECT_NE(std::string(e.what()).find("Could not load image"), std::string::npos);
	}
}

TEST_F(Artifacts, WriteJson_CreatesParentDirectories) {
	const auto path = dir() / "reports" / "run" / "report.json";
	const nlohmann::json payload{{"status", "ok"}, {"message", "métrica válida"}};

	writeJson(path, payload);
	ASSERT_TRUE(std::filesystem::exists(path));
	EXPECT_EQ(nlohmann::json::parse(readText(path)), payload);
}

TEST_F(Artifacts, DistancesCsv_WithoutCalibration) {
	const auto path = dir() / "distances.csv";
	writeDistancesCsv(path, {{10.f, 20.f}, {11.f, 20.f}}, {1.5, 2.0}, std::nullopt);

	EXPECT_EQ(readText(path), "idx,x,y,d_px,d_mm\n0,10,20,1.5,\n1,11,20,2,\n");
}

TEST_F(Artifacts, DistancesCsv_WithCalibration) {
	const auto path = dir() / "distances.csv";
	writeDistancesCsv(path, {{10.f, 20.f}}, {2.0}, 0.5);

	EXPECT_EQ(readText(path), "idx,x,y,d_px,d_mm\n0,10,20,2,1\n");
}

TEST_F(Artifacts, DistancesCsv_SizeMismatch) {
	EXPECT_THROW(writeDistancesCsv(dir() / "distances.csv", {{1.f, 1.f}}, {}, std::nullopt), std::invalid_argument);
}

TEST_F(Artifacts, Plots_AreWritten) {
	const cv::Mat background(200, 300, CV_8UC3, cv::Scalar(255, 255, 255));
	const core::Contour ideal{{50.f, 50.f}, {250.f, 50.f}, {250.f, 150.f}, {50.f, 150.f}};
	const core::Contour real{{52.f, 51.f}, {248.f, 53.f}, {251.f, 149.f}, {49.f, 148.f}};
	const std::vector<double> distances{1.0, 3.0, 1.0, 2.0};

	writeOverlay(dir() / "plots" / "overlay.png", background, ideal, real);
	writeErrorMap(dir() / "plots" / "error_map.png", background, real, distances);
	writeErrorHistogram(dir() / "plots" / "error_hist.png", distances);

	const cv::Mat overlay = cv::imread((dir() / "plots" / "overlay.png").string());
	EXPECT_EQ(overlay.size(), background.size());

	const cv::Mat errorMap = cv::imread((dir() / "plots" / "error_map.png").string());
	EXPECT_EQ(errorMap.rows, background.rows);
	EXPECT_GT(errorMap.cols, background.cols);

	const cv::Mat histogram = cv::imread((dir() / "plots" / "error_hist.png").string());
	EXPECT_EQ(histogram.cols, 800);
	EXPECT_EQ(histogram.rows, 400);
}

TEST_F(Artifacts, WriteImage_UnknownExtension) {
	EXPECT_THROW(writeImage(dir() / "image.unknown_format", cv::Mat::zeros(4, 4, CV_8UC3)), std::runtime_error);
}

} // namespace gtest
} // namespace cutprec::precision::pipeline
