#pragma once

#include "precision/core/config.hpp"
#include "precision/core/contour.hpp"
#include "precision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

#include <string>

namespace cutprec::precision::core {

//! Outline of the part found in one image.
struct ExtractionResult {
	Contour contour{};    //!< Closed outline. Empty on failure.
	cv::Mat binaryMask{}; //!< Raw segmentation before cleanup.
	cv::Mat cleanedMask{}; //!< Mask after morphology and component selection.
	bool success{false};
	std::string reason{}; //!< "no_ideal_contour_found" or "no_real_contour_found" on failure.
};

//! Outline of the part drawn in a template (line art on a light background).
//! Thin long lines (frames, axes, rulers) are removed and the drawing fragments closest to the image center are grouped.
//! \param [in] image    BGR (or grayscale) template image.
//! \param [in] config   Extraction parameters.
//! \param [in] debugger Optional sink for intermediate masks.
ExtractionResult extractIdealContour(const cv::Mat& image, const ExtractionConfig& config, DebugVisualizer* debugger = nullptr);

//! Outline of the physical part in a photo (dark part on a light background).
//! \param [in] image    BGR photo.
//! \param [in] config   Extraction parameters.
//! \param [in] debugger Optional sink for intermediate masks.
ExtractionResult extractRealContour(const cv::Mat& image, const ExtractionConfig& config, DebugVisualizer* debugger = nullptr);

//! Component selection on a binary drawing mask. Returns a mask with the anchor component and its grouped fragments.
//! Empty mask if there is no foreground at all.
cv::Mat selectIdealComponentGroup(const cv::Mat& binaryMask, const ExtractionConfig& config);

} // namespace cutprec::precision::core
