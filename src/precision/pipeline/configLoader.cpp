#include "precision/pipeline/configLoader.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>

namespace cutprec::precision::pipeline {

using core::ConfigError;

namespace {

static nlohmann::json yamlScalarToJson(const YAML::Node& node) {
	// Quoted scalars carry the non-specific tag "!" and stay strings.
	if (node.Tag() == "!") {
		return node.Scalar();
	}

	long long integer = 0;
	if (YAML::convert<long long>::decode(node, integer)) {
		return integer;
	}
	double number = 0.0;
	if (YAML::convert<double>::decode(node, number)) {
		return number;
	}
	bool flag = false;
	if (YAML::convert<bool>::decode(node, flag)) {
		return flag;
	}
	return node.Scalar();
}

static nlohmann::json yamlToJson(const YAML::Node& node) {
	switch (node.Type()) {
	case YAML::NodeType::Map: {
		nlohmann::json object = nlohmann::json::object();
		for (const auto& entry: node) {
			object[entry.first.as<std::string>()] = yamlToJson(entry.second);
		}
		return object;
	}
	case YAML::NodeType::Sequence: {
		nlohmann::json array = nlohmann::json::array();
		for (const auto& item: node) {
			array.push_back(yamlToJson(item));
		}
		return array;
	}
	case YAML::NodeType::Scalar:
		return yamlScalarToJson(node);
	case YAML::NodeType::Null:
	case YAML::NodeType::Undefined:
		break;
	}
	return nullptr;
}

static nlohmann::json readConfigFile(const std::filesystem::path& path) {
	std::string extension = path.extension().string();
	std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (extension == ".json") {
		std::ifstream stream(path);
		if (!stream) {
			throw ConfigError("config", fmt::format("could not open {}", path.string()));
		}
		nlohmann::json document = nlohmann::json::parse(stream, nullptr, false);
		if (document.is_discarded()) {
			throw ConfigError("config", fmt::format("invalid JSON in {}", path.string()));
		}
		return document;
	}

	if (extension == ".yaml" || extension == ".yml") {
		YAML::Node root;
		try {
			root = YAML::LoadFile(path.string());
		} catch (const YAML::Exception& e) {
			throw ConfigError("config", fmt::format("invalid YAML in {}: {}", path.string(), e.what()));
		}
		if (root.IsNull()) {
			return nlohmann::json::object();
		}
		if (!root.IsMap()) {
			throw ConfigError("config", "YAML root must be a mapping");
		}
		return yamlToJson(root);
	}

	throw ConfigError("config", fmt::format("unsupported config extension '{}'", path.extension().string()));
}

//! Copy of base with every override value applied. Keys must exist in base.
static nlohmann::json mergeSections(const nlohmann::json& base, const nlohmann::json& overrides) {
	if (!overrides.is_object()) {
		throw ConfigError("config", "root must be a mapping");
	}

	nlohmann::json merged = base;
	for (const auto& [sectionName, section]: overrides.items()) {
		if (!merged.contains(sectionName)) {
			throw ConfigError(sectionName, "unknown configuration section");
		}
		if (!section.is_object()) {
			throw ConfigError(sectionName, "must be a mapping");
		}
		for (const auto& [key, value]: section.items()) {
			if (!merged[sectionName].contains(key)) {
				throw ConfigError(sectionName + "." + key, "unknown key");
			}
			merged[sectionName][key] = value;
		}
	}
	return merged;
}

//! Typed access to the keys of one section.
class SectionReader {
public:
	SectionReader(const nlohmann::json& document, std::string name) : m_section(document.at(name)), m_name(std::move(name)) {
	}

	void read(const char* key, int& target) const {
		const auto& value = m_section.at(key);
		if (!value.is_number_integer()) {
			throw ConfigError(field(key), "must be an integer");
		}
		target = value.get<int>();
	}

	void read(const char* key, double& target) const {
		const auto& value = m_section.at(key);
		if (!value.is_number()) {
			throw ConfigError(field(key), "must be a number");
		}
		target = value.get<double>();
	}

	void read(const char* key, bool& target) const {
		const auto& value = m_section.at(key);
		if (!value.is_boolean()) {
			throw ConfigError(field(key), "must be a boolean");
		}
		target = value.get<bool>();
	}

	void read(const char* key, std::optional<double>& target) const {
		const auto& value = m_section.at(key);
		if (value.is_null()) {
			target.reset();
			return;
		}
		if (!value.is_number()) {
			throw ConfigError(field(key), "must be a number or null");
		}
		target = value.get<double>();
	}

	void read(const char* key, std::optional<int>& target) const {
		const auto& value = m_section.at(key);
		if (value.is_null()) {
			target.reset();
			return;
		}
		if (!value.is_number_integer()) {
			throw ConfigError(field(key), "must be an integer or null");
		}
		target = value.get<int>();
	}

	void read(const char* key, core::EccMotion& target) const {
		const auto& value = m_section.at(key);
		if (!value.is_string()) {
			throw ConfigError(field(key), "must be a string");
		}
		target = core::parseEccMotion(value.get<std::string>());
	}

private:
	std::string field(const char* key) const {
		return m_name + "." + key;
	}

	const nlohmann::json& m_section;
	std::string m_name;
};

} // namespace

nlohmann::json configToJson(const core::AppConfig& config) {
	const auto optionalValue = [](const auto& value) { return value ? nlohmann::json(*value) : nlohmann::json(nullptr); };

	const auto& e = config.extraction;
	const auto& r = config.registration;
	const auto& c = config.calibration;

	return {
	        {"extraction",
	         {
	                 {"ideal_adaptive_block_size", e.idealAdaptiveBlockSize},
	                 {"ideal_adaptive_c", e.idealAdaptiveC},
	                 {"ideal_close_kernel", e.idealCloseKernel},
	                 {"ideal_dilate_kernel", e.idealDilateKernel},
	                 {"ideal_min_area_ratio", e.idealMinAreaRatio},
	                 {"ideal_group_area_ratio_to_max", e.idealGroupAreaRatioToMax},
	                 {"ideal_group_center_radius_ratio", e.idealGroupCenterRadiusRatio},
	                 {"ideal_group_close_kernel", e.idealGroupCloseKernel},
	                 {"line_removal_min_length_ratio", e.lineRemovalMinLengthRatio},
	                 {"line_removal_thickness", e.lineRemovalThickness},
	                 {"real_lab_l_threshold", e.realLabLThreshold},
	                 {"real_hsv_v_threshold", e.realHsvVThreshold},
	                 {"real_close_kernel", e.realCloseKernel},
	                 {"real_open_kernel", e.realOpenKernel},
	         }},
	        {"registration",
	         {
	                 {"orb_nfeatures", r.orbNFeatures},
	                 {"knn_ratio", r.knnRatio},
	                 {"ransac_reproj_threshold", r.ransacReprojThreshold},
	                 {"min_matches", r.minMatches},
	                 {"min_inlier_ratio", r.minInlierRatio},
	                 {"use_axes_fallback", r.useAxesFallback},
	                 {"axes_canny_low", r.axesCannyLow},
	                 {"axes_canny_high", r.axesCannyHigh},
	                 {"axes_hough_threshold", r.axesHoughThreshold},
	                 {"axes_min_line_ratio", r.axesMinLineRatio},
	                 {"axes_segment_min_line_ratio", r.axesSegmentMinLineRatio},
	                 {"axes_max_line_gap", r.axesMaxLineGap},
	                 {"axes_angle_tolerance_deg", r.axesAngleToleranceDeg},
	                 {"axes_horizontal_roi_min_y_ratio", r.axesHorizontalRoiMinYRatio},
	                 {"axes_vertical_roi_max_x_ratio", r.axesVerticalRoiMaxXRatio},
	                 {"use_ecc_fallback", r.useEccFallback},
	                 {"ecc_motion", std::string(core::toString(r.eccMotion))},
	                 {"ecc_iterations", r.eccIterations},
	                 {"ecc_eps", r.eccEps},
	         }},
	        {"calibration",
	         {
	                 {"manual_mm_per_px", optionalValue(c.manualMmPerPx)},
	                 {"ruler_mm", c.rulerMm},
	                 {"canny_low", c.cannyLow},
	                 {"canny_high", c.cannyHigh},
	                 {"hough_threshold", c.houghThreshold},
	                 {"hough_max_gap", c.houghMaxGap},
	                 {"ruler_min_line_ratio", c.rulerMinLineRatio},
	         }},
	        {"distance",
	         {
	                 {"draw_thickness", config.distance.drawThickness},
	                 {"use_bilinear", config.distance.useBilinear},
	                 {"validate_with_kdtree", config.distance.validateWithKdTree},
	                 {"validation_tolerance_px", config.distance.validationTolerancePx},
	         }},
	        {"metrics",
	         {
	                 {"tau", config.metrics.tau},
	                 {"clamp_low", config.metrics.clampLow},
	                 {"clamp_high", config.metrics.clampHigh},
	         }},
	        {"sampling",
	         {
	                 {"step_px", config.sampling.stepPx},
	                 {"num_points", optionalValue(config.sampling.numPoints)},
	                 {"max_points", config.sampling.maxPoints},
	         }},
	};
}

core::AppConfig configFromJson(const nlohmann::json& document) {
	const nlohmann::json merged = mergeSections(configToJson(core::AppConfig{}), document);

	core::AppConfig config{};

	const SectionReader extraction(merged, "extraction");
	auto& e = config.extraction;
	extraction.read("ideal_adaptive_block_size", e.idealAdaptiveBlockSize);
	extraction.read("ideal_adaptive_c", e.idealAdaptiveC);
	extraction.read("ideal_close_kernel", e.idealCloseKernel);
	extraction.read("ideal_dilate_kernel", e.idealDilateKernel);
	extraction.read("ideal_min_area_ratio", e.idealMinAreaRatio);
	extraction.read("ideal_group_area_ratio_to_max", e.idealGroupAreaRatioToMax);
	extraction.read("ideal_group_center_radius_ratio", e.idealGroupCenterRadiusRatio);
	extraction.read("ideal_group_close_kernel", e.idealGroupCloseKernel);
	extraction.read("line_removal_min_length_ratio", e.lineRemovalMinLengthRatio);
	extraction.read("line_removal_thickness", e.lineRemovalThickness);
	extraction.read("real_lab_l_threshold", e.realLabLThreshold);
	extraction.read("real_hsv_v_threshold", e.realHsvVThreshold);
	extraction.read("real_close_kernel", e.realCloseKernel);
	extraction.read("real_open_kernel", e.realOpenKernel);

	const SectionReader registration(merged, "registration");
	auto& r = config.registration;
	registration.read("orb_nfeatures", r.orbNFeatures);
	registration.read("knn_ratio", r.knnRatio);
	registration.read("ransac_reproj_threshold", r.ransacReprojThreshold);
	registration.read("min_matches", r.minMatches);
	registration.read("min_inlier_ratio", r.minInlierRatio);
	registration.read("use_axes_fallback", r.useAxesFallback);
	registration.read("axes_canny_low", r.axesCannyLow);
	registration.read("axes_canny_high", r.axesCannyHigh);
	registration.read("axes_hough_threshold", r.axesHoughThreshold);
	registration.read("axes_min_line_ratio", r.axesMinLineRatio);
	registration.read("axes_segment_min_line_ratio", r.axesSegmentMinLineRatio);
	registration.read("axes_max_line_gap", r.axesMaxLineGap);
	registration.read("axes_angle_tolerance_deg", r.axesAngleToleranceDeg);
	registration.read("axes_horizontal_roi_min_y_ratio", r.axesHorizontalRoiMinYRatio);
	registration.read("axes_vertical_roi_max_x_ratio", r.axesVerticalRoiMaxXRatio);
	registration.read("use_ecc_fallback", r.useEccFallback);
	registration.read("ecc_motion", r.eccMotion);
	registration.read("ecc_iterations", r.eccIterations);
	registration.read("ecc_eps", r.eccEps);

	const SectionReader calibration(merged, "calibration");
	auto& c = config.calibration;
	calibration.read("manual_mm_per_px", c.manualMmPerPx);
	calibration.read("ruler_mm", c.rulerMm);
	calibration.read("canny_low", c.cannyLow);
	calibration.read("canny_high", c.cannyHigh);
	calibration.read("hough_threshold", c.houghThreshold);
	calibration.read("hough_max_gap", c.houghMaxGap);
	calibration.read("ruler_min_line_ratio", c.rulerMinLineRatio);

	const SectionReader distance(merged, "distance");
	distance.read("draw_thickness", config.distance.drawThickness);
	distance.read("use_bilinear", config.distance.useBilinear);
	distance.read("validate_with_kdtree", config.distance.validateWithKdTree);
	distance.read("validation_tolerance_px", config.distance.validationTolerancePx);

	const SectionReader metrics(merged, "metrics");
	metrics.read("tau", config.metrics.tau);
	metrics.read("clamp_low", config.metrics.clampLow);
	metrics.read("clamp_high", config.metrics.clampHigh);

	const SectionReader sampling(merged, "sampling");
	sampling.read("step_px", config.sampling.stepPx);
	sampling.read("num_points", config.sampling.numPoints);
	sampling.read("max_points", config.sampling.maxPoints);

	config.validate();
	return config;
}

core::AppConfig loadAppConfig(const std::optional<std::filesystem::path>& path) {
	if (!path) {
		return core::AppConfig{};
	}
	if (!std::filesystem::exists(*path)) {
		throw ConfigError("config", fmt::format("file not found: {}", path->string()));
	}
	return configFromJson(readConfigFile(*path));
}

} // namespace cutprec::precision::pipeline
