#pragma once

#include "precision/core/contour.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <utility>
#include <vector>

namespace cutprec::precision::core {

//! Each step in the algorithm.
struct DebugStep {
	std::string name; //!< Some name.
	cv::Mat image;    //!< Image produced by the step.
};

//! The measurement runs in stages (extraction, registration, distances). We collect the images per stage.
struct DebugStage {
	std::string name;                //!< Name of the stage.
	std::vector<DebugStep> images{}; //!< Image name pair for every step that was added.
};

//! Can be passed to the measurement functions to get intermediate images for debugging purposes.
class DebugVisualizer {
public:
	using ColoredContour = std::pair<Contour, cv::Scalar>;

	void beginStage(std::string name);              //!< New stage in the algorithm starts.
	void add(std::string name, const cv::Mat& img); //!< Add an image given some step name. Opens an unnamed stage if none is active.
	void addContours(std::string name, const cv::Mat& base, const std::vector<ColoredContour>& contours); //!< Add base image with outlines drawn on top.
	void endStage();

	cv::Mat buildMosaic(); //!< Returns mosaic of all debug images. Ends currently active stage.

	//! Images of a stage by name, e.g. to write masks to disk. Empty if the stage does not exist.
	std::vector<DebugStep> stageImages(const std::string& stageName) const;
	void clear();

	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Collection of debug info for all stages.
};

} // namespace cutprec::precision::core
