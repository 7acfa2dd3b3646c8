#pragma once

#include "planting/core/config.hpp"
#include "planting/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

namespace canopy::planting::core {

//! Raster features derived from the satellite image. All fields have the image size.
struct FeatureResult {
	bool success;            //!< False on unsupported input (empty image, unknown channel layout).
	cv::Mat ndvi;            //!< CV_32F. (G - R) / (G + R + eps), within [-1, 1].
	cv::Mat brightness;      //!< CV_8U. HSV value channel.
	cv::Mat vegetationMask;  //!< CV_8U {0, 255}.
	cv::Mat shadowMask;      //!< CV_8U {0, 255}. Cleaned binary shadow mask.
	cv::Mat shadowIntensity; //!< CV_32F in [0, 1]. 1 - V/255, Gaussian smoothed. Independent of shadowMask.
};

//! Compute the NDVI field of an image.
//! \param [in] image BGR (3 channel) or BGRA (4 channel) image as loaded by OpenCV.
cv::Mat computeNdvi(const cv::Mat& image, double epsilon);

//! Remove connected components (8-connectivity) smaller than minPixels from a binary mask.
cv::Mat removeSmallComponents(const cv::Mat& mask, int minPixels);

/*! Detect vegetation and shadows in a satellite image.
 * \param [in]     image    BGR, BGRA or grayscale satellite image.
 * \param [in]     config   Analysis configuration (vegetation and shadow thresholds).
 * \param [in,out] debugger Optional debug visualizer.
 * \note A uniformly dark or bright image yields empty masks, not a failure.
 */
FeatureResult detectFeatures(const cv::Mat& image, const PlantingConfig& config, DebugVisualizer* debugger = nullptr);

} // namespace canopy::planting::core
