#pragma once

#include "precision/tau/tauService.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cutprec::precision::pipeline {

//! Automatic tau selection from earlier reports. Target mode uses reports, labeled mode goodReports and badReports.
struct TauAutoOptions {
	std::vector<std::string> reports{};
	double targetIpn{tau::DEFAULT_TARGET_IPN};
	std::string statistic{"median"};

	std::vector<std::string> goodReports{};
	std::vector<std::string> badReports{};
	double acceptIpn{tau::DEFAULT_ACCEPT_IPN};
	std::optional<std::string> policy{};
	std::optional<std::string> objective{};
	std::optional<double> maxMeanIpnBad{};
	std::optional<double> minMeanIpnGap{};
	std::optional<double> minTpr{};
	std::optional<double> minTnr{};
	std::optional<std::filesystem::path> curveCsv{};
	std::optional<std::filesystem::path> curvePng{};
	int curveMaxPoints{tau::DEFAULT_CURVE_MAX_POINTS};

	bool preferPx{false};
	double tauMin{tau::DEFAULT_TAU_MIN};
	double tauMax{tau::DEFAULT_TAU_MAX};
};

//! Inputs of one measurement run. Optional values override the configuration file.
struct PipelineOptions {
	std::filesystem::path templatePath;
	std::filesystem::path testPath;
	std::filesystem::path outDir{"out"};
	std::optional<std::filesystem::path> configPath{};

	std::optional<double> stepPx{};
	std::optional<int> numPoints{};
	std::optional<double> tau{};
	TauAutoOptions tauAuto{};
	std::optional<double> manualMmPerPx{};
	bool noKdValidate{false};
	bool debug{false}; //!< Debug console output and extraction masks in the run directory.
};

//! Exit codes of the measurement command.
static constexpr int EXIT_OK                 = 0;
static constexpr int EXIT_ERROR              = 1;
static constexpr int EXIT_EXTRACTION_FAILURE = 2;

struct PipelineResult {
	int exitCode{EXIT_OK};
	nlohmann::json report{}; //!< Content of report.json.
	std::filesystem::path reportPath{};
};

//! Measure one template / test pair and write all artifacts into options.outDir.
//! Extraction failures produce a failure report and EXIT_EXTRACTION_FAILURE.
//! \throws core::ConfigError and std::invalid_argument for invalid options, std::runtime_error for I/O failures.
PipelineResult runPipeline(const PipelineOptions& options);

} // namespace cutprec::precision::pipeline
