#pragma once

#include "precision/tau/tauCalibration.hpp"
#include "precision/tau/tauPolicy.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cutprec::precision::tau {

//! Defaults shared by both command line tools.
static constexpr double DEFAULT_TARGET_IPN      = 80.0;
static constexpr double DEFAULT_ACCEPT_IPN      = 70.0;
static constexpr double DEFAULT_TAU_MIN         = 0.005;
static constexpr double DEFAULT_TAU_MAX         = 0.5;
static constexpr int DEFAULT_CURVE_MAX_POINTS   = 400;

struct TargetTauRequest {
	std::vector<std::string> reportPatterns{};
	double targetIpn{DEFAULT_TARGET_IPN};
	bool preferPx{false};
	TauStatistic statistic{TauStatistic::Median};
	double tauMin{DEFAULT_TAU_MIN};
	double tauMax{DEFAULT_TAU_MAX};
};

struct TargetTauOutput {
	TauCalibrationResult result;
	std::vector<std::string> reportPatterns;

	std::vector<std::string> reportPaths() const; //!< Paths of the reports that produced a candidate.
};

struct LabeledTauRequest {
	std::vector<std::string> goodReportPatterns{};
	std::vector<std::string> badReportPatterns{};
	double acceptIpn{DEFAULT_ACCEPT_IPN};
	bool preferPx{false};
	double tauMin{DEFAULT_TAU_MIN};
	double tauMax{DEFAULT_TAU_MAX};
	int curveMaxPoints{DEFAULT_CURVE_MAX_POINTS};
	std::optional<std::string> policy{}; //!< Preset name.
	TauPolicyOverrides overrides{};
	std::optional<std::filesystem::path> curveCsv{};
	std::optional<std::filesystem::path> curvePng{};
};

struct LabeledTauOutput {
	TauClassCalibrationResult result;
	TauPolicy policy;
	std::vector<std::string> goodReportPatterns;
	std::vector<std::string> badReportPatterns;
	std::optional<std::filesystem::path> curveCsv{}; //!< Absolute path if written.
	std::optional<std::filesystem::path> curvePng{}; //!< Absolute path if written.
	int curvePoints{0};                               //!< Points in the exported (downsampled) curve.
};

//! Expand patterns and run target IPN calibration.
TargetTauOutput calibrateTargetTauFromPatterns(const TargetTauRequest& request);

//! Expand patterns, resolve the policy, run labeled calibration and export the curve if requested.
LabeledTauOutput calibrateLabeledTauFromPatterns(const LabeledTauRequest& request);

nlohmann::json buildTargetTauPayload(const TargetTauOutput& calibration);
nlohmann::json buildLabeledTauPayload(const LabeledTauOutput& calibration);

//! Constraint value or null.
nlohmann::json optionalToJson(const std::optional<double>& value);

} // namespace cutprec::precision::tau
