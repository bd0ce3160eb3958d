#pragma once

#include "precision/core/calibration.hpp"
#include "precision/core/config.hpp"
#include "precision/core/contourExtractor.hpp"
#include "precision/core/debugVisualizer.hpp"
#include "precision/core/distance.hpp"
#include "precision/core/metrics.hpp"
#include "precision/core/registrationSelector.hpp"
#include "precision/core/stageReporter.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <vector>

namespace cutprec::precision::core {

enum class MeasurementStatus { Ok, ExtractionFailed };

//! Everything computed for one template / test pair.
//! Only the extraction results are meaningful if status is ExtractionFailed.
struct Measurement {
	MeasurementStatus status{MeasurementStatus::ExtractionFailed};

	ExtractionResult ideal{};
	ExtractionResult real{};
	RegistrationSelection registration{};

	Contour idealPoints{}; //!< Resampled ideal contour (template coordinates).
	Contour realPoints{};  //!< Registered and resampled real contour (template coordinates).

	cv::Mat distanceMap{};                             //!< Distance to the ideal outline for every template pixel.
	std::vector<double> distancesPx{};                 //!< Raster distance at every real point. Basis of all metrics.
	std::optional<std::vector<double>> distancesMm{};  //!< Absent without calibration.
	std::vector<double> treeRealToIdeal{};
	std::vector<double> treeIdealToReal{};
	DistanceValidation validation{};

	ContourDiagnostics diagnosticsPx{};
	std::optional<ContourDiagnostics> diagnosticsMm{};
	MetricsSummary statsPx{};
	std::optional<MetricsSummary> statsMm{};
	CalibrationResult calibration{};

	double scalePx{0.0}; //!< Bounding box diagonal of the resampled ideal contour.
	std::optional<double> scaleMm{};
	IpnResult ipnPx{};
	std::optional<IpnResult> ipnMm{};
};

//! Run extraction, registration, resampling, distances, calibration and scoring.
//! \param [in] templateImage BGR template drawing.
//! \param [in] testImage     BGR photo of the cut part.
//! \param [in] config        Validated configuration.
//! \param [in] reporter      Receives start/end events for every stage.
//! \param [in] debugger      Optional sink for intermediate images.
Measurement measureCut(const cv::Mat& templateImage, const cv::Mat& testImage, const AppConfig& config, const StageReporter& reporter = {},
                       DebugVisualizer* debugger = nullptr);

} // namespace cutprec::precision::core
