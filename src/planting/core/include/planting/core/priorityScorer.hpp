#pragma once

#include "planting/core/config.hpp"
#include "planting/core/debugVisualizer.hpp"
#include "planting/core/featureDetector.hpp"
#include "planting/core/grid.hpp"
#include "planting/core/maskGenerator.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <vector>

namespace canopy::planting::core {

//! Priority class of a pixel. Stored as CV_8U in the classification raster.
enum class PriorityLevel : std::uint8_t { NotPlantable = 0, Low, Medium, High, Critical };

const char* toString(PriorityLevel level);

//! Component scores and the composite of one location. All fields CV_32F with the grid size.
struct PriorityResult {
	bool success;           //!< False if the input rasters do not match the grid.
	cv::Mat sidewalk;       //!< [0, 35]. Proximity to pedestrian infrastructure.
	cv::Mat building;       //!< [0, 25]. Cooling benefit near buildings.
	cv::Mat sun;            //!< [0, 20]. Sun exposure.
	cv::Mat amenity;        //!< [0, 10]. Gaussian amenity density.
	cv::Mat gap;            //!< Gap filling. Always 0.
	cv::Mat composite;      //!< [0, 100]. 0 outside the plantable mask.
	cv::Mat classification; //!< CV_8U PriorityLevel values.
};

//! Map a field to points: the first band whose upper bound exceeds the value, else the fallback points.
cv::Mat scoreBands(const cv::Mat& field, const BandScoreConfig& config);

/*! Amenity density component.
 *  Every amenity contributes exp(-(d/r)^2) to the pixels within its radius r. The summed density is
 *  normalised by its maximum and scaled to the point budget.
 * \returns CV_32F field, all zero without amenities.
 */
cv::Mat amenityDensity(const std::vector<GeoPoint>& amenities, const Grid& grid, const AmenityScoreConfig& config);

//! Class of a plantable score.
PriorityLevel classifyScore(float score, const ClassificationConfig& config);

//! Class raster. Pixels outside the plantable mask are NotPlantable.
cv::Mat classifyPriority(const cv::Mat& composite, const cv::Mat& plantableMask, const ClassificationConfig& config);

/*! Score every pixel of a location.
 * \param [in]     features  Output of detectFeatures (shadow intensity).
 * \param [in]     masks     Output of generateMasks (distance fields, plantable mask).
 * \param [in]     amenities Aligned amenity points.
 * \param [in]     grid      Spatial frame of the location.
 * \param [in]     config    Analysis configuration (bands, budgets, class thresholds).
 * \param [in,out] debugger  Optional debug visualizer.
 */
PriorityResult scorePriority(const FeatureResult& features, const MaskResult& masks, const std::vector<GeoPoint>& amenities, const Grid& grid,
                             const PlantingConfig& config, DebugVisualizer* debugger = nullptr);

} // namespace canopy::planting::core
