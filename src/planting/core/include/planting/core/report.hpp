#pragma once

#include "planting/core/grid.hpp"
#include "planting/core/priorityScorer.hpp"

#include <opencv2/core/mat.hpp>

#include <array>

namespace canopy::planting::core {

//! Pixel count of a mask with its ground area and share.
struct AreaShare {
	int pixels{0};
	double areaM2{0.0};
	double percentage{0.0}; //!< Of the whole frame (coverage) or of the plantable area (distribution).
};

struct CoverageBreakdown {
	int totalPixels{0};
	double totalAreaM2{0.0};
	AreaShare buildings{};
	AreaShare vegetation{};
	AreaShare shadows{};
	AreaShare streets{};
	AreaShare plantable{};
};

struct PriorityDistribution {
	AreaShare plantable{};
	std::array<AreaShare, 4> classes{}; //!< Low, Medium, High, Critical.
	int criticalSpots{0};

	const AreaShare& operator[](PriorityLevel level) const;
};

//! Area of a mask in the frame.
AreaShare measureMask(const cv::Mat& mask, const Grid& grid, int referencePixels);

CoverageBreakdown computeCoverage(const Grid& grid, const cv::Mat& buildingMask, const cv::Mat& vegetationMask, const cv::Mat& shadowMask,
                                  const cv::Mat& streetMask, const cv::Mat& plantableMask);

//! Area per priority class, relative to the plantable area.
PriorityDistribution computeDistribution(const Grid& grid, const cv::Mat& classification, const cv::Mat& plantableMask, int criticalSpots);

} // namespace canopy::planting::core
