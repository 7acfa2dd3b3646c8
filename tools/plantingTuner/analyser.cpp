#include "analyser.hpp"

#include <algorithm>
#include <format>

#include <opencv2/imgproc.hpp>

namespace canopy::planting {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

Analyser::Analyser(LocationInput input, core::PlantingConfig config) : m_input(std::move(input)) {
	rerun(std::move(config));
}

void Analyser::rerun(core::PlantingConfig config) {
	m_config = std::move(config);
	m_debugger.clear();
	m_debugger.setInteractive(false);
	m_result = analyseLocation(m_input, m_config, &m_debugger);
}

cv::Mat Analyser::analyse(const PlantingStep step) {
	if (m_input.image.empty()) {
		return buildInfoTile("Input Error", "Could not load image.");
	}

	const auto it = std::find_if(PLANTING_STEPS.begin(), PLANTING_STEPS.end(), [step](const PlantingStepInfo& info) { return info.step == step; });
	const cv::Mat mosaic = (it == PLANTING_STEPS.end() || it->stage == nullptr) ? m_debugger.buildMosaic() : m_debugger.buildStageMosaic(it->stage);

	if (mosaic.empty()) {
		if (!m_result.success) {
			return buildInfoTile(it != PLANTING_STEPS.end() ? it->label : "Analysis", m_result.error);
		}
		return buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
	}
	return mosaic;
}

std::string Analyser::summary() const {
	if (!m_result.success) {
		return std::format("{}: failed ({})", m_result.name, m_result.error);
	}
	return std::format("{}: plantable {:.1f}%  critical {:.1f}%  high {:.1f}%  spots {}", m_result.name, m_result.coverage.plantable.percentage,
	                   m_result.distribution[core::PriorityLevel::Critical].percentage, m_result.distribution[core::PriorityLevel::High].percentage,
	                   m_result.spots.size());
}

} // namespace canopy::planting
