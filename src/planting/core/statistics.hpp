#pragma once

#include <opencv2/core/mat.hpp>

namespace canopy::planting::core {

//! Share of part in total in percent. 0 if total is 0.
double percentage(double part, double total);

//! Mean of a CV_32F field over the non-zero pixels of a mask. 0 if the mask is empty.
double maskedMean(const cv::Mat& field, const cv::Mat& mask);

} // namespace canopy::planting::core
