#pragma once

#include "precision/tau/reportMetrics.hpp"
#include "precision/tau/tauPolicy.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cutprec::precision::tau {

//! Aggregation of per report tau values in target mode.
enum class TauStatistic { Median, Mean, P75 };

std::string_view toString(TauStatistic statistic);
TauStatistic parseTauStatistic(std::string_view name); //!< Throws std::invalid_argument on unknown names.

//! IPN of a report with the given mad/scale ratio, clamped to [0, 100].
double ipnFromRatio(double ratio, double tau);

// Target IPN mode.

//! Tau that would have given one report exactly the target IPN.
struct TauCandidate {
	std::string reportPath;
	double tau{0.0};
	TauUnits units{TauUnits::Mm};
};

struct TargetTauOptions {
	double targetIpn{80.0};
	bool preferMm{true};
	TauStatistic statistic{TauStatistic::Median};
	double tauMin{0.005};
	double tauMax{0.2};
};

struct TauCalibrationResult {
	double tau{0.0};               //!< Aggregated and clamped tau.
	TauUnits units{TauUnits::Mm}; //!< Units of the first usable report.
	int reportsUsed{0};
	double targetIpn{0.0};
	TauStatistic statistic{TauStatistic::Median};
	double tauMin{0.0};
	double tauMax{0.0};
	std::vector<TauCandidate> candidates{};
};

//! Tau such that a typical historic report scores the target IPN.
//! Unreadable reports and reports without usable metrics are skipped.
//! \throws std::invalid_argument on invalid options or if no report is usable.
TauCalibrationResult calibrateTauFromReports(const std::vector<std::string>& reportPaths, const TargetTauOptions& options = {});

// Labeled good/bad mode.

//! One evaluated tau of the labeled sweep.
struct TauCurvePoint {
	double tau{0.0};
	double thresholdRatio{0.0}; //!< Largest accepted mad/scale ratio, tau * (1 - acceptIpn / 100).
	double balancedAccuracy{0.0};
	double tpr{0.0};
	double tnr{0.0};
	double meanIpnGood{0.0};
	double meanIpnBad{0.0};
	double meanIpnGap{0.0}; //!< meanIpnGood - meanIpnBad.
	int tp{0};
	int fn{0};
	int tn{0};
	int fp{0};
};

struct TauCurve {
	TauUnits units{TauUnits::Mm};
	double acceptIpn{0.0};
	double tauMin{0.0};
	double tauMax{0.0};
	int goodReportsUsed{0};
	int badReportsUsed{0};
	std::vector<TauCurvePoint> points{}; //!< Ascending tau.
};

//! mad/scale ratios of the labeled report sets in common units.
struct LabeledRatios {
	TauUnits units{TauUnits::Mm};
	std::vector<std::string> goodPaths{};
	std::vector<double> good{};
	std::vector<std::string> badPaths{};
	std::vector<double> bad{};
};

struct LabeledTauOptions {
	double acceptIpn{70.0};
	bool preferMm{true};
	double tauMin{0.005};
	double tauMax{0.2};
	TauObjective objective{TauObjective::BalancedAccuracyThenGap};
	TauConstraints constraints{};
};

struct TauClassCalibrationResult {
	double tau{0.0};
	TauUnits units{TauUnits::Mm};
	int goodReportsUsed{0};
	int badReportsUsed{0};
	double acceptIpn{0.0};
	double tauMin{0.0};
	double tauMax{0.0};
	TauObjective objective{TauObjective::BalancedAccuracyThenGap};
	TauConstraints constraints{};
	bool constraintsSatisfied{true}; //!< False if no curve point met the active constraints.
	int feasiblePoints{0};
	std::optional<std::string> fallbackReason{}; //!< "no_feasible_points_for_constraints" when constraints could not be met.
	TauCurvePoint selected{};                    //!< Metrics of the chosen tau.
	std::vector<std::string> goodPaths{};
	std::vector<std::string> badPaths{};
};

//! Validate the shared labeled options. Throws std::invalid_argument.
void validateLabeledOptions(double acceptIpn, double tauMin, double tauMax);

//! Load both report sets, pick common units and compute ratios.
//! \throws std::invalid_argument if no usable units exist or either class ends up empty.
LabeledRatios loadLabeledRatios(const std::vector<std::string>& goodPaths, const std::vector<std::string>& badPaths, bool preferMm);

//! Candidate taus: clamped range ends, every decision boundary ratio / (1 - acceptIpn / 100) and midpoints between them.
//! Sorted ascending, no duplicates (1e-12).
std::vector<double> tauCandidates(const LabeledRatios& ratios, double acceptIpn, double tauMin, double tauMax);

//! Classification metrics and class mean IPN for one tau.
TauCurvePoint evaluateTau(const LabeledRatios& ratios, double tau, double acceptIpn);

//! Evaluate every candidate tau.
TauCurve buildTauCurve(const LabeledRatios& ratios, double acceptIpn, double tauMin, double tauMax);

//! Evenly spaced subset of at most maxPoints points, always keeping the first and last point.
TauCurve downsampleTauCurve(const TauCurve& curve, int maxPoints);

//! Pick the best tau on the full candidate sweep of already loaded ratios.
TauClassCalibrationResult calibrateTauFromRatios(const LabeledRatios& ratios, const LabeledTauOptions& options = {});

//! Tau separating good from bad reports.
//! \throws std::invalid_argument on invalid options, empty sets or unusable reports.
TauClassCalibrationResult calibrateTauFromLabeledReports(const std::vector<std::string>& goodPaths, const std::vector<std::string>& badPaths,
                                                         const LabeledTauOptions& options = {});

//! Full curve of the labeled sweep, downsampled to maxPoints for presentation.
TauCurve buildLabeledTauCurve(const std::vector<std::string>& goodPaths, const std::vector<std::string>& badPaths, double acceptIpn = 70.0,
                              bool preferMm = true, double tauMin = 0.005, double tauMax = 0.2, int maxPoints = 400);

} // namespace cutprec::precision::tau
