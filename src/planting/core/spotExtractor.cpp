#include "planting/core/spotExtractor.hpp"

#include <algorithm>
#include <format>

#include <opencv2/imgproc.hpp>

namespace canopy::planting::core {

std::vector<CriticalSpot> extractCriticalSpots(const cv::Mat& composite, const cv::Mat& plantableMask, const Grid& grid, const SpotConfig& config,
                                               const float criticalMin, DebugVisualizer* debugger) {
	CV_Assert(composite.type() == CV_32FC1 && plantableMask.type() == CV_8UC1 && composite.size() == plantableMask.size());

	cv::Mat critical;
	cv::compare(composite, criticalMin, critical, cv::CMP_GE);
	critical &= plantableMask;

	std::vector<CriticalSpot> spots;
	if (cv::countNonZero(critical) == 0) {
		return spots;
	}

	cv::Mat labels, stats, centroids;
	const int labelCount = cv::connectedComponentsWithStats(critical, labels, stats, centroids, 8, CV_32S);

	// Score sum per label in a single pass.
	std::vector<double> scoreSum(static_cast<std::size_t>(labelCount), 0.0);
	for (int y = 0; y < labels.rows; ++y) {
		const int* labelRow   = labels.ptr<int>(y);
		const float* scoreRow = composite.ptr<float>(y);
		for (int x = 0; x < labels.cols; ++x) {
			scoreSum[static_cast<std::size_t>(labelRow[x])] += scoreRow[x];
		}
	}

	const double pixelArea = grid.pixelAreaM2();
	for (int label = 1; label < labelCount; ++label) {
		const int area = stats.at<int>(label, cv::CC_STAT_AREA);
		if (area < config.minClusterPixels) {
			continue;
		}

		const cv::Point2d centroid{centroids.at<double>(label, 0), centroids.at<double>(label, 1)};
		spots.push_back(CriticalSpot{0, label, centroid, grid.pixelToGeo(centroid), area, area * pixelArea,
		                             scoreSum[static_cast<std::size_t>(label)] / static_cast<double>(area)});
	}

	std::sort(spots.begin(), spots.end(), [](const CriticalSpot& a, const CriticalSpot& b) {
		if (a.meanScore != b.meanScore)
			return a.meanScore > b.meanScore;
		return a.label < b.label;
	});
	for (std::size_t i = 0u; i < spots.size(); ++i) {
		spots[i].id = static_cast<int>(i) + 1;
	}

	if (debugger) {
		debugger->beginStage("Critical Spots");
		debugger->add("Critical Pixels", critical);

		cv::Mat marked = DebugVisualizer::overlay(cv::Mat(critical.size(), CV_8UC3, cv::Scalar(0, 0, 0)), critical, DebugVisualizer::COLOR_CRITICAL, 1.0);
		for (const CriticalSpot& spot: spots) {
			const cv::Point c(cvRound(spot.centroidPx.x), cvRound(spot.centroidPx.y));
			cv::drawMarker(marked, c, cv::Scalar(255, 255, 255), cv::MARKER_CROSS, 12, 2);
			cv::putText(marked, std::to_string(spot.id), c + cv::Point(6, -6), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
		}
		debugger->add("Ranked Spots", marked);
		debugger->endStage();
	}

	return spots;
}

std::string streetViewUrl(const GeoPoint& location) {
	return std::format("https://www.google.com/maps/@?api=1&map_action=pano&viewpoint={:.8f},{:.8f}", location.lat, location.lon);
}

std::string mapsUrl(const GeoPoint& location) {
	return std::format("https://www.google.com/maps?q={:.8f},{:.8f}", location.lat, location.lon);
}

} // namespace canopy::planting::core
