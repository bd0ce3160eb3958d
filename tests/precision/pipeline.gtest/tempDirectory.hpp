#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace cutprec::precision::pipeline {
namespace gtest {

//! Fresh directory per test, removed afterwards.
class TempDirectory : public ::testing::Test {
protected:
	void SetUp() override {
		const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
		m_dir = std::filesystem::temp_directory_path() / "cutprec_pipeline_gtest" / (std::string(info->test_suite_name()) + "_" + info->name());
		std::filesystem::remove_all(m_dir);
		std::filesystem::create_directories(m_dir);
	}

	void TearDown() override {
		std::error_code ec;
		std::filesystem::remove_all(m_dir, ec);
	}

	std::filesystem::path writeText(const std::string& name, const std::string& text) const {
		const auto path = m_dir / name;
		std::ofstream out(path);
		out << text;
		return path;
	}

	std::string readText(const std::filesystem::path& path) const {
		std::ifstream in(path);
		return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	const std::filesystem::path& dir() const {
		return m_dir;
	}

private:
	std::filesystem::path m_dir;
};

} // namespace gtest
} // namespace cutprec::precision::pipeline
