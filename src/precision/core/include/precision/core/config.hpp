#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cutprec::precision::core {

//! Raised for any invalid configuration value. The message starts with the qualified field name (e.g. "metrics.tau").
class ConfigError : public std::invalid_argument {
public:
	ConfigError(const std::string& field, const std::string& message);

	const std::string& field() const noexcept {
		return m_field;
	}

private:
	std::string m_field;
};

//! Motion model used by the ECC registration fallback.
enum class EccMotion { Translation, Euclidean, Affine, Homography };

std::string_view toString(EccMotion motion);
EccMotion parseEccMotion(std::string_view name); //!< Throws ConfigError("registration.ecc_motion") on unknown names.

//! Parameters of the ideal (template) and real (photo) contour extraction.
struct ExtractionConfig {
	int idealAdaptiveBlockSize{35}; //!< Adaptive threshold neighbourhood. Odd and >= 3.
	double idealAdaptiveC{7.0};     //!< Constant subtracted from the weighted mean.
	int idealCloseKernel{5};
	int idealDilateKernel{3};
	double idealMinAreaRatio{0.001}; //!< Minimum component area as fraction of the image area.

	double idealGroupAreaRatioToMax{0.35};    //!< Fragments need this fraction of the anchor component area to join the group.
	double idealGroupCenterRadiusRatio{0.45}; //!< Fragment centroids must lie within this fraction of min(h,w) from the image center.
	int idealGroupCloseKernel{9};             //!< Closing kernel used to merge the grouped fragments.

	double lineRemovalMinLengthRatio{0.3}; //!< Hough segments longer than this fraction of max(h,w) are erased.
	int lineRemovalThickness{3};

	int realLabLThreshold{95}; //!< Pixels darker than this in Lab L belong to the part.
	int realHsvVThreshold{90}; //!< Pixels darker than this in HSV V belong to the part.
	int realCloseKernel{5};
	int realOpenKernel{3};

	void validate() const;
};

//! Parameters of the three registration estimators.
struct RegistrationConfig {
	int orbNFeatures{3000};
	double knnRatio{0.75};
	double ransacReprojThreshold{3.0};
	int minMatches{20};
	double minInlierRatio{0.2};

	bool useAxesFallback{true};
	double axesCannyLow{50.0};
	double axesCannyHigh{150.0};
	int axesHoughThreshold{120};
	double axesMinLineRatio{0.20};        //!< Read and validated for configuration files; the axis frame only rejects degenerate spans.
	double axesSegmentMinLineRatio{0.05}; //!< Minimum Hough segment length as a fraction of max(h,w).
	int axesMaxLineGap{15};
	double axesAngleToleranceDeg{20.0};
	double axesHorizontalRoiMinYRatio{0.65};
	double axesVerticalRoiMaxXRatio{0.35};

	bool useEccFallback{true};
	EccMotion eccMotion{EccMotion::Affine};
	int eccIterations{1500};
	double eccEps{1e-6};

	void validate() const;
};

//! Ruler based pixel to millimeter calibration.
struct CalibrationConfig {
	std::optional<double> manualMmPerPx{}; //!< If set, ruler detection is skipped.
	double rulerMm{120.0};                 //!< Physical length of the reference ruler.
	double cannyLow{50.0};
	double cannyHigh{150.0};
	int houghThreshold{80};
	int houghMaxGap{10};
	double rulerMinLineRatio{0.2};

	void validate() const;
};

struct DistanceConfig {
	int drawThickness{1};
	bool useBilinear{true};
	bool validateWithKdTree{true};
	double validationTolerancePx{1.5}; //!< Maximum accepted mean |raster - tree| difference.

	void validate() const;
};

struct MetricsConfig {
	double tau{0.02}; //!< Tolerance as fraction of the scale.
	double clampLow{0.0};
	double clampHigh{100.0};

	void validate() const;
};

struct SamplingConfig {
	double stepPx{1.5};
	std::optional<int> numPoints{};
	int maxPoints{20000};

	void validate() const;
};

//! Complete configuration of one measurement run.
struct AppConfig {
	ExtractionConfig extraction{};
	RegistrationConfig registration{};
	CalibrationConfig calibration{};
	DistanceConfig distance{};
	MetricsConfig metrics{};
	SamplingConfig sampling{};

	void validate() const; //!< Validates every section. Throws ConfigError.
};

} // namespace cutprec::precision::core
