#pragma once

#include "pipelineStep.hpp"

#include "precision/core/config.hpp"

#include <opencv2/core/mat.hpp>

namespace cutprec::precision {

//! Runs the measurement with the DebugVisualizer attached to the desired PipelineStep.
class Analyser {
public:
	Analyser(cv::Mat templateImage, cv::Mat testImage, core::AppConfig config);

	TunerSettings initialSettings() const; //!< Tuner values taken from the loaded configuration.
	cv::Mat analyse(const TunerSettings& settings) const;

private:
	cv::Mat run(const PipelineStep step, const core::AppConfig& config) const;

	cv::Mat m_template;
	cv::Mat m_test;
	core::AppConfig m_config;
};

} // namespace cutprec::precision
