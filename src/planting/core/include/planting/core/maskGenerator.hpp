#pragma once

#include "planting/core/config.hpp"
#include "planting/core/debugVisualizer.hpp"
#include "planting/core/grid.hpp"
#include "planting/core/projection.hpp"
#include "planting/core/vectorData.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <cstddef>
#include <vector>

namespace canopy::planting::core {

//! Binary masks and distance fields of one location. All rasters have the Grid size.
struct MaskResult {
	bool success;                     //!< False if the grid is invalid or the vegetation mask does not match it.
	cv::Mat buildingMask;             //!< CV_8U {0, 255}. Union of all valid footprints.
	std::array<cv::Mat, 4> tierMasks; //!< CV_8U {0, 255}. Buffered streets per StreetTier.
	cv::Mat streetMask;               //!< CV_8U {0, 255}. Union of the tier masks.
	cv::Mat sidewalkMask;             //!< CV_8U {0, 255}. Pedestrian and low streets with the sidewalk buffer.
	cv::Mat plantableMask;            //!< CV_8U {0, 255}. Neither building, street nor vegetation.
	cv::Mat distanceToSidewalk;       //!< CV_32F. Meters.
	cv::Mat distanceToBuilding;       //!< CV_32F. Meters.
	std::size_t invalidPolygons;      //!< Building polygons skipped as invalid.

	const cv::Mat& tierMask(StreetTier tier) const {
		return tierMasks[static_cast<std::size_t>(tier)];
	}
};

//! A ring is usable if it has at least 3 distinct vertices, a non-zero area and no self-intersection.
bool isValidRing(const std::vector<GeoPoint>& ring);

/*! Fill polygons into a mask of the grid size.
 * \param [in]  polygons Polygons in geographic coordinates. Valid holes are carved out of their exterior, invalid ones are ignored.
 * \param [in]  grid     Spatial frame of the mask.
 * \param [out] skipped  Number of polygons skipped because their exterior ring is invalid.
 * \return      CV_8U mask {0, 255}.
 */
cv::Mat rasterizePolygons(const std::vector<Polygon>& polygons, const Grid& grid, std::size_t* skipped = nullptr);

/*! Buffer a metric line string by a radius.
 *  The buffer is the union of one rectangle per segment and one circle (polygon approximation) per vertex.
 * \returns Convex metric polygons whose union is the buffer. Empty for an empty path.
 */
std::vector<std::vector<cv::Point2d>> bufferPath(const std::vector<cv::Point2d>& path, double radiusM, int circleSegments);

//! Buffer streets by a single radius in the metric CRS and rasterize the union.
cv::Mat bufferStreets(const std::vector<Street>& streets, double radiusM, const Grid& grid, const LocalProjection& projection, int circleSegments);

/*! Euclidean distance of every pixel to the nearest mask pixel, in meters.
 *  Pixels inside the mask have distance 0. An empty mask yields the grid diagonal everywhere.
 * \returns CV_32F field.
 */
cv::Mat distanceToMask(const cv::Mat& mask, double metersPerPixel);

//! NOT building AND NOT street AND NOT vegetation.
cv::Mat computePlantableMask(const cv::Mat& buildingMask, const cv::Mat& streetMask, const cv::Mat& vegetationMask);

/*! Generate the spatial masks and distance fields of a location.
 * \param [in]     aligned        Aligned and classified vector layers.
 * \param [in]     vegetationMask Vegetation mask of the feature stage (grid size).
 * \param [in]     grid           Spatial frame of the location.
 * \param [in]     config         Analysis configuration (buffer radii, projection zone).
 * \param [in,out] debugger       Optional debug visualizer.
 */
MaskResult generateMasks(const VectorData& aligned, const cv::Mat& vegetationMask, const Grid& grid, const PlantingConfig& config,
                         DebugVisualizer* debugger = nullptr);

} // namespace canopy::planting::core
