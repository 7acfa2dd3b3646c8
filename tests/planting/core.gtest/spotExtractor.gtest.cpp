#include "planting/core/spotExtractor.hpp"

#include <gtest/gtest.h>

#include <cstdint>

namespace canopy::planting::core {
namespace gtest {

static constexpr GeoPoint CENTER{3.1478, 101.6953};

static cv::Mat allPlantable(const int width, const int height) {
	return cv::Mat(height, width, CV_8U, cv::Scalar(255));
}

TEST(SpotExtractorUnit, SmallClusterDiscarded) {
	const Grid grid = Grid::fromCenter(CENTER, 10, 10, 18, 2);
	cv::Mat composite(10, 10, CV_32F, cv::Scalar(10.0f));
	composite(cv::Rect(0, 0, 5, 5)).setTo(90.0f);
	for (const cv::Point p: {cv::Point(8, 8), cv::Point(9, 8), cv::Point(8, 9), cv::Point(9, 9), cv::Point(9, 7)}) {
		composite.at<float>(p) = 90.0f;
	}

	const auto spots = extractCriticalSpots(composite, allPlantable(10, 10), grid, SpotConfig{}, 80.0f);
	ASSERT_EQ(spots.size(), 1u);
	EXPECT_EQ(spots[0].id, 1);
	EXPECT_EQ(spots[0].pixelCount, 25);
	EXPECT_NEAR(spots[0].centroidPx.x, 2.0, 1e-9);
	EXPECT_NEAR(spots[0].centroidPx.y, 2.0, 1e-9);
	EXPECT_NEAR(spots[0].meanScore, 90.0, 1e-6);
	EXPECT_NEAR(spots[0].areaM2, 25.0 * grid.pixelAreaM2(), 1e-9);

	const GeoPoint expected = grid.pixelToGeo({2.0, 2.0});
	EXPECT_DOUBLE_EQ(spots[0].centroid.lat, expected.lat);
	EXPECT_DOUBLE_EQ(spots[0].centroid.lon, expected.lon);
}

TEST(SpotExtractorUnit, RankedByMeanScore) {
	const Grid grid = Grid::fromCenter(CENTER, 60, 20, 18, 2);
	cv::Mat composite(20, 60, CV_32F, cv::Scalar(0.0f));
	composite(cv::Rect(0, 0, 10, 10)).setTo(82.0f);  // Label 1.
	composite(cv::Rect(20, 0, 10, 10)).setTo(95.0f); // Label 2.
	composite(cv::Rect(40, 0, 10, 10)).setTo(88.0f); // Label 3.

	const auto spots = extractCriticalSpots(composite, allPlantable(60, 20), grid, SpotConfig{}, 80.0f);
	ASSERT_EQ(spots.size(), 3u);
	EXPECT_NEAR(spots[0].meanScore, 95.0, 1e-6);
	EXPECT_NEAR(spots[1].meanScore, 88.0, 1e-6);
	EXPECT_NEAR(spots[2].meanScore, 82.0, 1e-6);
	for (std::size_t i = 0u; i < spots.size(); ++i) {
		EXPECT_EQ(spots[i].id, static_cast<int>(i) + 1);
	}
}

TEST(SpotExtractorUnit, EqualMeansOrderedByLabel) {
	const Grid grid = Grid::fromCenter(CENTER, 40, 20, 18, 2);
	cv::Mat composite(20, 40, CV_32F, cv::Scalar(0.0f));
	composite(cv::Rect(0, 0, 6, 6)).setTo(85.0f);
	composite(cv::Rect(20, 10, 6, 6)).setTo(85.0f);

	const auto first  = extractCriticalSpots(composite, allPlantable(40, 20), grid, SpotConfig{}, 80.0f);
	const auto second = extractCriticalSpots(composite, allPlantable(40, 20), grid, SpotConfig{}, 80.0f);
	ASSERT_EQ(first.size(), 2u);
	EXPECT_LT(first[0].label, first[1].label);
	EXPECT_LT(first[0].centroidPx.x, first[1].centroidPx.x);

	ASSERT_EQ(second.size(), first.size());
	for (std::size_t i = 0u; i < first.size(); ++i) {
		EXPECT_EQ(first[i].label, second[i].label);
		EXPECT_EQ(first[i].id, second[i].id);
	}
}

TEST(SpotExtractorUnit, DiagonalPixelsConnect) {
	const Grid grid = Grid::fromCenter(CENTER, 30, 30, 18, 2);
	cv::Mat composite(30, 30, CV_32F, cv::Scalar(0.0f));
	for (int i = 0; i < 25; ++i) {
		composite.at<float>(i, i) = 90.0f;
	}

	const auto spots = extractCriticalSpots(composite, allPlantable(30, 30), grid, SpotConfig{}, 80.0f);
	ASSERT_EQ(spots.size(), 1u);
	EXPECT_EQ(spots[0].pixelCount, 25);
}

TEST(SpotExtractorUnit, NonPlantablePixelsExcluded) {
	const Grid grid = Grid::fromCenter(CENTER, 20, 20, 18, 2);
	cv::Mat composite(20, 20, CV_32F, cv::Scalar(0.0f));
	composite(cv::Rect(0, 0, 10, 10)).setTo(90.0f);

	cv::Mat plantable = allPlantable(20, 20);
	plantable(cv::Rect(0, 0, 10, 5)).setTo(0);

	const auto spots = extractCriticalSpots(composite, plantable, grid, SpotConfig{}, 80.0f);
	ASSERT_EQ(spots.size(), 1u);
	EXPECT_EQ(spots[0].pixelCount, 50);

	plantable.setTo(0);
	EXPECT_TRUE(extractCriticalSpots(composite, plantable, grid, SpotConfig{}, 80.0f).empty());
}

TEST(SpotExtractorUnit, NoCriticalPixels_NoSpots) {
	const Grid grid = Grid::fromCenter(CENTER, 20, 20, 18, 2);
	const cv::Mat composite(20, 20, CV_32F, cv::Scalar(79.9f));
	EXPECT_TRUE(extractCriticalSpots(composite, allPlantable(20, 20), grid, SpotConfig{}, 80.0f).empty());
}

TEST(SpotExtractorUnit, DebugStageRecorded) {
	const Grid grid = Grid::fromCenter(CENTER, 20, 20, 18, 2);
	cv::Mat composite(20, 20, CV_32F, cv::Scalar(0.0f));
	composite(cv::Rect(2, 2, 6, 6)).setTo(90.0f);

	DebugVisualizer debugger;
	extractCriticalSpots(composite, allPlantable(20, 20), grid, SpotConfig{}, 80.0f, &debugger);
	EXPECT_FALSE(debugger.buildStageMosaic("Critical Spots").empty());
}

TEST(SpotExtractorUnit, LinkFormat) {
	const GeoPoint location{3.1478, 101.6953};
	EXPECT_EQ(streetViewUrl(location), "https://www.google.com/maps/@?api=1&map_action=pano&viewpoint=3.14780000,101.69530000");
	EXPECT_EQ(mapsUrl(location), "https://www.google.com/maps?q=3.14780000,101.69530000");
	EXPECT_EQ(mapsUrl({-33.8688, 151.2093}), "https://www.google.com/maps?q=-33.86880000,151.20930000");
}

} // namespace gtest
} // namespace canopy::planting::core
