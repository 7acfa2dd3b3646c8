#include "planting/core/report.hpp"

#include "statistics.hpp"

#include <opencv2/core.hpp>

namespace canopy::planting::core {

const AreaShare& PriorityDistribution::operator[](const PriorityLevel level) const {
	CV_Assert(level != PriorityLevel::NotPlantable);
	return classes[static_cast<std::size_t>(level) - 1u];
}

AreaShare measureMask(const cv::Mat& mask, const Grid& grid, const int referencePixels) {
	AreaShare share{};
	share.pixels     = mask.empty() ? 0 : cv::countNonZero(mask);
	share.areaM2     = static_cast<double>(share.pixels) * grid.pixelAreaM2();
	share.percentage = percentage(static_cast<double>(share.pixels), static_cast<double>(referencePixels));
	return share;
}

CoverageBreakdown computeCoverage(const Grid& grid, const cv::Mat& buildingMask, const cv::Mat& vegetationMask, const cv::Mat& shadowMask,
                                  const cv::Mat& streetMask, const cv::Mat& plantableMask) {
	CoverageBreakdown coverage{};
	coverage.totalPixels = grid.width() * grid.height();
	coverage.totalAreaM2 = static_cast<double>(coverage.totalPixels) * grid.pixelAreaM2();

	coverage.buildings  = measureMask(buildingMask, grid, coverage.totalPixels);
	coverage.vegetation = measureMask(vegetationMask, grid, coverage.totalPixels);
	coverage.shadows    = measureMask(shadowMask, grid, coverage.totalPixels);
	coverage.streets    = measureMask(streetMask, grid, coverage.totalPixels);
	coverage.plantable  = measureMask(plantableMask, grid, coverage.totalPixels);
	return coverage;
}

PriorityDistribution computeDistribution(const Grid& grid, const cv::Mat& classification, const cv::Mat& plantableMask, const int criticalSpots) {
	PriorityDistribution distribution{};
	distribution.plantable     = measureMask(plantableMask, grid, grid.width() * grid.height());
	distribution.criticalSpots = criticalSpots;

	const PriorityLevel levels[] = {PriorityLevel::Low, PriorityLevel::Medium, PriorityLevel::High, PriorityLevel::Critical};
	for (std::size_t i = 0u; i < distribution.classes.size(); ++i) {
		cv::Mat inClass;
		cv::compare(classification, static_cast<int>(levels[i]), inClass, cv::CMP_EQ);
		distribution.classes[i] = measureMask(inClass, grid, distribution.plantable.pixels);
	}
	return distribution;
}

} // namespace canopy::planting::core
