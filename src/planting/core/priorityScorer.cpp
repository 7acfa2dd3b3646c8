#include "planting/core/priorityScorer.hpp"

#include "statistics.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string_view>

#include <opencv2/core.hpp>

namespace canopy::planting::core {

namespace {

static bool scoreDebugEnabled() {
	const char* env = std::getenv("CANOPY_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static cv::Mat clampField(const cv::Mat& field, double low, double high) {
	const cv::Mat clampedLow = cv::max(field, low);
	return cv::min(clampedLow, high);
}

} // namespace

const char* toString(const PriorityLevel level) {
	switch (level) {
	case PriorityLevel::NotPlantable:
		return "not_plantable";
	case PriorityLevel::Low:
		return "low";
	case PriorityLevel::Medium:
		return "medium";
	case PriorityLevel::High:
		return "high";
	case PriorityLevel::Critical:
		return "critical";
	}
	return "unknown";
}

cv::Mat scoreBands(const cv::Mat& field, const BandScoreConfig& config) {
	cv::Mat points(field.size(), CV_32F, cv::Scalar(config.otherwise));

	// Walk from the widest band down so the first matching band is written last.
	for (auto it = config.bands.rbegin(); it != config.bands.rend(); ++it) {
		cv::Mat below;
		cv::compare(field, it->upper, below, cv::CMP_LT);
		points.setTo(cv::Scalar(it->points), below);
	}
	return clampField(points, 0.0, config.maxPoints);
}

cv::Mat amenityDensity(const std::vector<GeoPoint>& amenities, const Grid& grid, const AmenityScoreConfig& config) {
	cv::Mat density(grid.size(), CV_32F, cv::Scalar(0.0f));
	if (amenities.empty() || config.radiusM <= 0.0 || !grid.isValid()) {
		return density;
	}

	const double radiusPx = config.radiusM / grid.metersPerPixel();
	const cv::Rect frame(0, 0, grid.width(), grid.height());

	for (const GeoPoint& amenity: amenities) {
		const cv::Point2d c = grid.geoToPixel(amenity);

		const int x0          = static_cast<int>(std::floor(c.x - radiusPx));
		const int y0          = static_cast<int>(std::floor(c.y - radiusPx));
		const int x1          = static_cast<int>(std::ceil(c.x + radiusPx));
		const int y1          = static_cast<int>(std::ceil(c.y + radiusPx));
		const cv::Rect window = cv::Rect(x0, y0, x1 - x0 + 1, y1 - y0 + 1) & frame;
		if (window.empty()) {
			continue;
		}

		for (int y = window.y; y < window.y + window.height; ++y) {
			float* row = density.ptr<float>(y);
			for (int x = window.x; x < window.x + window.width; ++x) {
				const double d = std::hypot(static_cast<double>(x) - c.x, static_cast<double>(y) - c.y);
				if (d > radiusPx) {
					continue;
				}
				const double ratio = d / radiusPx;
				row[x] += static_cast<float>(std::exp(-ratio * ratio));
			}
		}
	}

	double maxDensity = 0.0;
	cv::minMaxLoc(density, nullptr, &maxDensity);
	if (maxDensity <= 0.0) {
		return density; // All amenities outside the frame.
	}
	density *= config.maxPoints / maxDensity;
	return density;
}

PriorityLevel classifyScore(const float score, const ClassificationConfig& config) {
	if (score >= config.criticalMin)
		return PriorityLevel::Critical;
	if (score >= config.highMin)
		return PriorityLevel::High;
	if (score >= config.mediumMin)
		return PriorityLevel::Medium;
	return PriorityLevel::Low;
}

cv::Mat classifyPriority(const cv::Mat& composite, const cv::Mat& plantableMask, const ClassificationConfig& config) {
	CV_Assert(composite.type() == CV_32FC1 && plantableMask.type() == CV_8UC1 && composite.size() == plantableMask.size());

	cv::Mat classes(composite.size(), CV_8U, cv::Scalar(static_cast<int>(PriorityLevel::NotPlantable)));
	for (int y = 0; y < composite.rows; ++y) {
		const float* score         = composite.ptr<float>(y);
		const std::uint8_t* inside = plantableMask.ptr<std::uint8_t>(y);
		std::uint8_t* out          = classes.ptr<std::uint8_t>(y);
		for (int x = 0; x < composite.cols; ++x) {
			if (inside[x] != 0u) {
				out[x] = static_cast<std::uint8_t>(classifyScore(score[x], config));
			}
		}
	}
	return classes;
}

PriorityResult scorePriority(const FeatureResult& features, const MaskResult& masks, const std::vector<GeoPoint>& amenities, const Grid& grid,
                             const PlantingConfig& config, DebugVisualizer* debugger) {
	const cv::Size size = grid.size();
	if (features.shadowIntensity.size() != size || masks.plantableMask.size() != size || masks.distanceToSidewalk.size() != size ||
	    masks.distanceToBuilding.size() != size) {
		std::cerr << "[score] Priority scoring failed: input rasters do not match the grid " << size.width << "x" << size.height << '\n';
		return {false, {}, {}, {}, {}, {}, {}, {}};
	}

	const ScoringConfig& scoring = config.scoring;

	PriorityResult result{true, {}, {}, {}, {}, {}, {}, {}};
	result.sidewalk = scoreBands(masks.distanceToSidewalk, scoring.sidewalk);
	result.building = scoreBands(masks.distanceToBuilding, scoring.building);
	result.sun      = scoreBands(features.shadowIntensity, scoring.sun);
	result.amenity  = amenityDensity(amenities, grid, scoring.amenity);
	result.gap      = cv::Mat(size, CV_32F, cv::Scalar(0.0f));

	const cv::Mat sum = result.sidewalk + result.building + result.sun + result.amenity + result.gap;
	result.composite = clampField(sum, 0.0, scoring.totalPoints);

	cv::Mat notPlantable;
	cv::bitwise_not(masks.plantableMask, notPlantable);
	result.composite.setTo(cv::Scalar(0.0f), notPlantable);

	result.classification = classifyPriority(result.composite, masks.plantableMask, config.classification);

	if (debugger) {
		debugger->beginStage("Scoring");
		debugger->add("Sidewalk", DebugVisualizer::heatmap(result.sidewalk, 0.0, scoring.sidewalk.maxPoints));
		debugger->add("Building Cooling", DebugVisualizer::heatmap(result.building, 0.0, scoring.building.maxPoints));
		debugger->add("Sun Exposure", DebugVisualizer::heatmap(result.sun, 0.0, scoring.sun.maxPoints));
		debugger->add("Amenities", DebugVisualizer::heatmap(result.amenity, 0.0, scoring.amenity.maxPoints));
		debugger->add("Composite", DebugVisualizer::heatmap(result.composite, 0.0, scoring.totalPoints));
		debugger->add("Classes", DebugVisualizer::colorizeLabels(result.classification, {cv::Scalar(0, 0, 0), DebugVisualizer::COLOR_LOW, DebugVisualizer::COLOR_MEDIUM,
		                                                                                DebugVisualizer::COLOR_HIGH, DebugVisualizer::COLOR_CRITICAL}));
		debugger->endStage();
	}

	if (scoreDebugEnabled()) {
		std::cout << "[score] mean composite over plantable=" << maskedMean(result.composite, masks.plantableMask) << '\n';
	}

	return result;
}

} // namespace canopy::planting::core
