#pragma once

#include "plantingStep.hpp"

#include "planting/analysis.hpp"

#include <opencv2/core/mat.hpp>

#include <string>

namespace canopy::planting {

//! Runs the analysis of one location with the DebugVisualizer attached and serves the mosaic of a PlantingStep.
class Analyser {
public:
	Analyser(LocationInput input, core::PlantingConfig config);

	//! Re-run the analysis, e.g. after the configuration file changed.
	void rerun(core::PlantingConfig config);

	cv::Mat analyse(PlantingStep step);
	std::string summary() const; //!< One line with coverage and spot count, or the failure reason.

private:
	LocationInput m_input;
	core::PlantingConfig m_config;
	core::DebugVisualizer m_debugger;
	LocationResult m_result;
};

} // namespace canopy::planting
