#pragma once

#include <array>

namespace canopy {

//! Stages of the analysis that can be inspected in the tuner.
enum class PlantingStep { Alignment, Features, Masks, Scoring, Spots, All };

struct PlantingStepInfo {
	PlantingStep step;
	const char* label; //!< Combo box text.
	const char* stage; //!< DebugVisualizer stage name. Null for all stages.
};

inline constexpr std::array<PlantingStepInfo, 6> PLANTING_STEPS{{
        {PlantingStep::Alignment, "Alignment", "Alignment"},
        {PlantingStep::Features, "Feature Detection", "Feature Detection"},
        {PlantingStep::Masks, "Masks", "Masks"},
        {PlantingStep::Scoring, "Scoring", "Scoring"},
        {PlantingStep::Spots, "Critical Spots", "Critical Spots"},
        {PlantingStep::All, "All Stages", nullptr},
}};

} // namespace canopy
