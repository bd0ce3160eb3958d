#pragma once

namespace cutprec {

//! Part of the measurement whose debug images are shown.
enum class PipelineStep {
	Extraction,
	Registration,
	Distance,
	All,
};

//! Values the tuner window lets the user change on top of the loaded configuration.
struct TunerSettings {
	PipelineStep step{PipelineStep::All};
	double stepPx{1.5};
	bool useAxesFallback{true};
	bool useEccFallback{true};
};

} // namespace cutprec
