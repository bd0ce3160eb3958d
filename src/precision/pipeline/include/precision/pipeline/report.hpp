#pragma once

#include "precision/core/config.hpp"
#include "precision/core/measurement.hpp"
#include "precision/tau/tauService.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace cutprec::precision::pipeline {

//! Where the tau used for a run came from.
struct TauCalibrationContext {
	std::string mode{"fixed"};            //!< "fixed", "auto_from_reports" or "auto_from_labeled_reports".
	std::string source{"config_or_cli"};  //!< "config_or_cli", "cli_tau", "reports" or "reports_labeled".
	std::optional<tau::TargetTauOutput> target{};
	std::optional<tau::LabeledTauOutput> labeled{};

	static TauCalibrationContext fixed();
	static TauCalibrationContext fromAutoReports(tau::TargetTauOutput calibration);
	static TauCalibrationContext fromAutoLabeledReports(tau::LabeledTauOutput calibration);

	//! Report section. Fields of the modes that were not used are null or empty.
	nlohmann::json toJson() const;
};

//! Input images as given on the command line.
struct ReportInputs {
	std::filesystem::path templatePath;
	std::filesystem::path testPath;
};

//! Current UTC time, ISO 8601 with microseconds.
std::string utcTimestamp();

//! Report for a run that stopped after contour extraction.
nlohmann::json buildFailureReport(const ReportInputs& inputs, const core::AppConfig& config, const core::Measurement& measurement, const std::string& runId);

//! Complete report of a successful measurement.
//! \param [in] outDir  Run directory, used for the artifact paths.
nlohmann::json buildSuccessReport(const ReportInputs& inputs, const core::AppConfig& config, const core::Measurement& measurement, const std::string& runId,
                                  const std::filesystem::path& outDir, const TauCalibrationContext& tauContext, const std::optional<std::string>& gitCommit);

} // namespace cutprec::precision::pipeline
