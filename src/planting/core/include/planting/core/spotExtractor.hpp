#pragma once

#include "planting/core/config.hpp"
#include "planting/core/debugVisualizer.hpp"
#include "planting/core/grid.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace canopy::planting::core {

//! Contiguous cluster of critical priority pixels.
struct CriticalSpot {
	int id;                  //!< Rank, starting at 1.
	int label;               //!< Connected component label the spot was extracted from.
	cv::Point2d centroidPx;  //!< Mean of the member pixel coordinates. May lie outside non-convex clusters.
	GeoPoint centroid;       //!< centroidPx through the grid forward map.
	int pixelCount;
	double areaM2;           //!< pixelCount * metersPerPixel^2.
	double meanScore;        //!< Mean composite score over the member pixels.
};

/*! Extract and rank the critical spots of a location.
 * \param [in]     composite     CV_32F composite score.
 * \param [in]     plantableMask CV_8U plantable mask.
 * \param [in]     grid          Spatial frame of the location.
 * \param [in]     config        Minimum cluster size.
 * \param [in]     criticalMin   Score a pixel needs to be critical.
 * \param [in,out] debugger      Optional debug visualizer.
 * \return Spots sorted by descending mean score, ties by component label. Ids follow that order.
 */
std::vector<CriticalSpot> extractCriticalSpots(const cv::Mat& composite, const cv::Mat& plantableMask, const Grid& grid, const SpotConfig& config,
                                               float criticalMin, DebugVisualizer* debugger = nullptr);

std::string streetViewUrl(const GeoPoint& location);
std::string mapsUrl(const GeoPoint& location);

} // namespace canopy::planting::core
