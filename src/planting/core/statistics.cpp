#include "statistics.hpp"

#include <opencv2/core.hpp>

namespace canopy::planting::core {

double percentage(const double part, const double total) {
	if (total <= 0.0) {
		return 0.0;
	}
	return 100.0 * part / total;
}

double maskedMean(const cv::Mat& field, const cv::Mat& mask) {
	if (field.empty() || cv::countNonZero(mask) == 0) {
		return 0.0;
	}
	return cv::mean(field, mask)[0];
}

} // namespace canopy::planting::core
