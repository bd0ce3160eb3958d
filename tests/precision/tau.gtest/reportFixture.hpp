#pragma once

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace cutprec::precision::tau {
namespace gtest {

//! Temporary directory with measurement reports that only carry the metrics object.
class ReportDirectory : public ::testing::Test {
protected:
	void SetUp() override {
		const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
		m_dir = std::filesystem::temp_directory_path() / "cutprec_tau_gtest" / (std::string(info->test_suite_name()) + "_" + info->name());
		std::filesystem::remove_all(m_dir);
		std::filesystem::create_directories(m_dir);
	}

	void TearDown() override {
		std::error_code ec;
		std::filesystem::remove_all(m_dir, ec);
	}

	std::string writeReport(const std::string& name, double madPx, double scalePx, std::optional<double> madMm = std::nullopt,
	                        std::optional<double> scaleMm = std::nullopt) const {
		nlohmann::json metrics{{"mad_px", madPx}, {"scale_px", scalePx}};
		metrics["mad_mm"]   = madMm ? nlohmann::json(*madMm) : nlohmann::json(nullptr);
		metrics["scale_mm"] = scaleMm ? nlohmann::json(*scaleMm) : nlohmann::json(nullptr);
		return writeText(name, nlohmann::json{{"metrics", metrics}}.dump());
	}

	std::string writeText(const std::string& name, const std::string& text) const {
		const auto path = m_dir / name;
		std::ofstream out(path);
		out << text;
		return path.string();
	}

	std::string pattern(const std::string& glob) const {
		return (m_dir / glob).string();
	}

	const std::filesystem::path& dir() const {
		return m_dir;
	}

private:
	std::filesystem::path m_dir;
};

} // namespace gtest
} // namespace cutprec::precision::tau
