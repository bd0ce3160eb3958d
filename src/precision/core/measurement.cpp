#include "precision/core/measurement.hpp"

#include "precision/core/registration.hpp"
#include "precision/core/resampler.hpp"

#include <algorithm>
#include <string>

namespace cutprec::precision::core {

namespace {

static std::vector<double> scaled(const std::vector<double>& values, double factor) {
	std::vector<double> out(values.size());
	std::transform(values.begin(), values.end(), out.begin(), [factor](double v) { return v * factor; });
	return out;
}

} // namespace

Measurement measureCut(const cv::Mat& templateImage, const cv::Mat& testImage, const AppConfig& config, const StageReporter& reporter,
                       DebugVisualizer* debugger) {
	Measurement m{};

	{
		ScopedStage stage(reporter, "extract.ideal");
		m.ideal = extractIdealContour(templateImage, config.extraction, debugger);
		if (!m.ideal.success) {
			stage.fail(m.ideal.reason);
		}
	}
	{
		ScopedStage stage(reporter, "extract.real");
		m.real = extractRealContour(testImage, config.extraction, debugger);
		if (!m.real.success) {
			stage.fail(m.real.reason);
		}
	}
	if (!m.ideal.success || !m.real.success) {
		m.status = MeasurementStatus::ExtractionFailed;
		return m;
	}

	{
		ScopedStage stage(reporter, "register");
		m.idealPoints = resampleClosedContour(m.ideal.contour, config.sampling);

		const auto candidates = estimateRegistrationCandidates(templateImage, testImage, config.registration, debugger);
		m.registration        = selectRegistration(candidates, m.real.contour, m.idealPoints);
		if (!m.registration.selected.success) {
			stage.fail("no_successful_registration");
		}
	}

	{
		ScopedStage stage(reporter, "resample");
		const Contour aligned = warpPoints(m.real.contour, m.registration.selected.homography);
		m.realPoints          = resampleClosedContour(aligned, config.sampling);
	}

	{
		ScopedStage stage(reporter, "distance.compute");
		m.distanceMap = buildDistanceTransform(templateImage.size(), m.idealPoints, config.distance.drawThickness);
		m.distancesPx = config.distance.useBilinear ? sampleDistanceMapBilinear(m.distanceMap, m.realPoints)
		                                            : sampleDistanceMapNearest(m.distanceMap, m.realPoints);

		m.treeRealToIdeal = nearestNeighborDistances(m.realPoints, m.idealPoints);
		m.treeIdealToReal = nearestNeighborDistances(m.idealPoints, m.realPoints);
		m.diagnosticsPx   = computeBidirectionalDiagnostics(m.treeRealToIdeal, m.treeIdealToReal);

		if (config.distance.validateWithKdTree) {
			m.validation = validateDistanceMethods(m.distancesPx, m.treeRealToIdeal, config.distance.validationTolerancePx);
			if (m.validation.status != ValidationStatus::Ok) {
				stage.fail(std::string("validation_") + toString(m.validation.status));
			}
		} else {
			m.validation = DistanceValidation{ValidationStatus::Disabled, std::nullopt};
		}

		if (debugger) {
			debugger->beginStage("Distances");
			debugger->add("Distance Map", m.distanceMap);
			debugger->addContours("Aligned", templateImage, {{m.idealPoints, cv::Scalar(0, 200, 0)}, {m.realPoints, cv::Scalar(0, 0, 220)}});
			debugger->endStage();
		}
	}

	{
		ScopedStage stage(reporter, "metrics.compute");
		m.statsPx     = computeStatistics(m.distancesPx);
		m.calibration = estimateMmPerPx(templateImage, config.calibration);
		m.distancesMm = toMm(m.distancesPx, m.calibration.mmPerPx);
		if (m.distancesMm) {
			m.statsMm       = computeStatistics(*m.distancesMm);
			m.diagnosticsMm = computeBidirectionalDiagnostics(scaled(m.treeRealToIdeal, *m.calibration.mmPerPx),
			                                                  scaled(m.treeIdealToReal, *m.calibration.mmPerPx));
		}

		m.scalePx = bboxDiagonal(m.idealPoints);
		m.ipnPx   = computeIpn(m.statsPx.mad, m.scalePx, config.metrics.tau, config.metrics.clampLow, config.metrics.clampHigh);
		if (m.calibration.mmPerPx) {
			m.scaleMm = m.scalePx * *m.calibration.mmPerPx;
			m.ipnMm   = computeIpn(m.statsMm->mad, *m.scaleMm, config.metrics.tau, config.metrics.clampLow, config.metrics.clampHigh);
		}
	}

	m.status = MeasurementStatus::Ok;
	return m;
}

} // namespace cutprec::precision::core
