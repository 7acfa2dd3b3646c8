#include "planting/core/maskGenerator.hpp"

#include <gtest/gtest.h>

#include <cstdint>

namespace canopy::planting::core {
namespace gtest {

static constexpr GeoPoint CENTER{3.1478, 101.6953};

static Grid makeGrid(int size = 200) {
	return Grid::fromCenter(CENTER, size, size, 18, 2);
}

//! Axis aligned rectangle in pixel coordinates as a geographic ring.
static std::vector<GeoPoint> pixelRect(const Grid& grid, const cv::Rect2d& rect) {
	return {
	        grid.pixelToGeo({rect.x, rect.y}),
	        grid.pixelToGeo({rect.x + rect.width, rect.y}),
	        grid.pixelToGeo({rect.x + rect.width, rect.y + rect.height}),
	        grid.pixelToGeo({rect.x, rect.y + rect.height}),
	};
}

static Street horizontalStreet(const Grid& grid, double row, std::string highway, StreetTier tier) {
	return Street{{grid.pixelToGeo({0.0, row}), grid.pixelToGeo({static_cast<double>(grid.width()), row})}, std::move(highway), tier};
}

TEST(MaskGeneratorUnit, RasterizeRectangle_MatchesPixelArea) {
	const Grid grid = makeGrid();

	std::size_t skipped = 99u;
	const cv::Mat mask  = rasterizePolygons({Polygon{pixelRect(grid, {50.0, 60.0, 40.0, 20.0})}}, grid, &skipped);

	EXPECT_EQ(skipped, 0u);
	EXPECT_EQ(mask.type(), CV_8UC1);
	EXPECT_NEAR(cv::countNonZero(mask), 40 * 20, 80);
	EXPECT_EQ(mask.at<std::uint8_t>(70, 70), 255u);
	EXPECT_EQ(mask.at<std::uint8_t>(10, 10), 0u);
}

TEST(MaskGeneratorUnit, RasterizeWithHole_HoleIsCarved) {
	const Grid grid = makeGrid();

	Polygon courtyard{pixelRect(grid, {40.0, 40.0, 60.0, 60.0})};
	courtyard.holes.push_back(pixelRect(grid, {60.0, 60.0, 20.0, 20.0}));

	const cv::Mat mask = rasterizePolygons({courtyard}, grid);
	EXPECT_EQ(mask.at<std::uint8_t>(45, 45), 255u);
	EXPECT_EQ(mask.at<std::uint8_t>(70, 70), 0u);
	EXPECT_NEAR(cv::countNonZero(mask), 60 * 60 - 20 * 20, 150);
}

TEST(MaskGeneratorUnit, InvalidHoles_Ignored) {
	const Grid grid = makeGrid();

	Polygon courtyard{pixelRect(grid, {40.0, 40.0, 100.0, 100.0})};
	courtyard.holes.push_back({grid.pixelToGeo({60.0, 60.0}), grid.pixelToGeo({90.0, 90.0}), grid.pixelToGeo({90.0, 60.0}), grid.pixelToGeo({60.0, 90.0})}); // Bow tie.
	courtyard.holes.push_back({grid.pixelToGeo({100.0, 100.0}), grid.pixelToGeo({120.0, 120.0})});                                                               // Degenerate.
	courtyard.holes.push_back(pixelRect(grid, {110.0, 60.0, 20.0, 20.0}));

	std::size_t skipped = 99u;
	const cv::Mat mask  = rasterizePolygons({courtyard}, grid, &skipped);
	EXPECT_EQ(skipped, 0u);
	EXPECT_EQ(mask.at<std::uint8_t>(66, 75), 255u); // Between the bow tie lobes.
	EXPECT_EQ(mask.at<std::uint8_t>(75, 66), 255u); // Inside the left lobe.
	EXPECT_EQ(mask.at<std::uint8_t>(110, 110), 255u);
	EXPECT_EQ(mask.at<std::uint8_t>(70, 120), 0u); // Valid hole still carved.
	EXPECT_NEAR(cv::countNonZero(mask), 100 * 100 - 20 * 20, 200);
}

TEST(MaskGeneratorUnit, OverlappingBuildings_Union) {
	const Grid grid = makeGrid();

	const cv::Mat mask = rasterizePolygons({Polygon{pixelRect(grid, {20.0, 20.0, 40.0, 40.0})}, Polygon{pixelRect(grid, {40.0, 40.0, 40.0, 40.0})}}, grid);
	EXPECT_NEAR(cv::countNonZero(mask), 2 * 1600 - 400, 150);
}

TEST(MaskGeneratorUnit, InvalidPolygons_SkippedAndCounted) {
	const Grid grid = makeGrid();

	const Polygon line{{grid.pixelToGeo({10.0, 10.0}), grid.pixelToGeo({50.0, 50.0})}};
	const Polygon collinear{{grid.pixelToGeo({10.0, 10.0}), grid.pixelToGeo({20.0, 20.0}), grid.pixelToGeo({30.0, 30.0})}};
	const Polygon bowTie{{grid.pixelToGeo({10.0, 10.0}), grid.pixelToGeo({50.0, 50.0}), grid.pixelToGeo({50.0, 10.0}), grid.pixelToGeo({10.0, 50.0})}};
	const Polygon valid{pixelRect(grid, {100.0, 100.0, 10.0, 10.0})};

	EXPECT_FALSE(isValidRing(line.exterior));
	EXPECT_FALSE(isValidRing(collinear.exterior));
	EXPECT_FALSE(isValidRing(bowTie.exterior));
	EXPECT_TRUE(isValidRing(valid.exterior));

	std::size_t skipped = 0u;
	const cv::Mat mask  = rasterizePolygons({line, collinear, bowTie, valid}, grid, &skipped);
	EXPECT_EQ(skipped, 3u);
	EXPECT_NEAR(cv::countNonZero(mask), 100, 30);
}

TEST(MaskGeneratorUnit, ClosedRing_Accepted) {
	const Grid grid            = makeGrid();
	std::vector<GeoPoint> ring = pixelRect(grid, {10.0, 10.0, 10.0, 10.0});
	ring.push_back(ring.front());
	EXPECT_TRUE(isValidRing(ring));
}

TEST(MaskGeneratorUnit, BufferPath_Parts) {
	EXPECT_TRUE(bufferPath({}, 5.0, 32).empty());
	EXPECT_TRUE(bufferPath({{0.0, 0.0}, {10.0, 0.0}}, 0.0, 32).empty());

	const auto parts = bufferPath({{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}}, 2.0, 16);
	ASSERT_EQ(parts.size(), 2u + 3u); // Two segment rectangles, three round joins/caps.
	EXPECT_EQ(parts[0].size(), 4u);
	EXPECT_EQ(parts[2].size(), 16u);

	// Rectangle corners lie at the radius from the centre line.
	for (const cv::Point2d& corner: parts[0]) {
		EXPECT_NEAR(std::abs(corner.y), 2.0, 1e-12);
	}
}

TEST(MaskGeneratorUnit, StreetBuffer_WidthInMeters) {
	const Grid grid                  = makeGrid();
	const LocalProjection projection = LocalProjection::forLocation(grid.center());

	const cv::Mat mask = bufferStreets({horizontalStreet(grid, 100.0, "residential", StreetTier::Low)}, 10.0, grid, projection, 32);

	// 20 m wide band across the image.
	const double expectedRows = 20.0 / grid.metersPerPixel();
	const int column          = grid.width() / 2;
	EXPECT_NEAR(cv::countNonZero(mask.col(column)), expectedRows, 3.0);
	EXPECT_EQ(mask.at<std::uint8_t>(100, column), 255u);
	EXPECT_EQ(mask.at<std::uint8_t>(0, column), 0u);
}

TEST(MaskGeneratorUnit, TierBuffers_Monotone) {
	const Grid grid                  = makeGrid(300);
	const LocalProjection projection = LocalProjection::forLocation(grid.center());
	const BufferConfig buffers{};

	const std::vector<Street> street{horizontalStreet(grid, 150.0, "any", StreetTier::Low)};
	int previous = 0;
	for (const StreetTier tier: {StreetTier::Pedestrian, StreetTier::Low, StreetTier::Medium, StreetTier::High}) {
		const int area = cv::countNonZero(bufferStreets(street, bufferRadius(tier, buffers), grid, projection, buffers.circleSegments));
		EXPECT_GE(area, previous) << toString(tier);
		previous = area;
	}
}

TEST(MaskGeneratorUnit, DistanceToMask_Meters) {
	cv::Mat mask(10, 10, CV_8U, cv::Scalar(0));
	mask.at<std::uint8_t>(0, 0) = 255u;

	const cv::Mat distance = distanceToMask(mask, 0.5);
	ASSERT_EQ(distance.type(), CV_32FC1);
	EXPECT_FLOAT_EQ(distance.at<float>(0, 0), 0.0f);
	EXPECT_NEAR(distance.at<float>(4, 3), 2.5f, 1e-4f); // 3-4-5 triangle.
	EXPECT_NEAR(distance.at<float>(0, 6), 3.0f, 1e-4f);
}

TEST(MaskGeneratorUnit, DistanceToEmptyMask_Diagonal) {
	const cv::Mat mask(30, 40, CV_8U, cv::Scalar(0));
	const cv::Mat distance = distanceToMask(mask, 0.5);

	double minV = 0.0, maxV = 0.0;
	cv::minMaxLoc(distance, &minV, &maxV);
	EXPECT_DOUBLE_EQ(minV, 25.0);
	EXPECT_DOUBLE_EQ(maxV, 25.0);
}

TEST(MaskGeneratorUnit, PlantableIsComplementOfOccupied) {
	const Grid grid = makeGrid();

	VectorData aligned{};
	aligned.buildings.push_back(Polygon{pixelRect(grid, {20.0, 20.0, 50.0, 50.0})});
	aligned.streets.push_back(horizontalStreet(grid, 150.0, "primary", StreetTier::High));
	aligned.streets.push_back(horizontalStreet(grid, 110.0, "footway", StreetTier::Pedestrian));

	cv::Mat vegetation(grid.size(), CV_8U, cv::Scalar(0));
	vegetation(cv::Rect(120, 10, 60, 60)).setTo(255);

	const MaskResult masks = generateMasks(aligned, vegetation, grid, PlantingConfig{});
	ASSERT_TRUE(masks.success);

	cv::Mat occupied = masks.buildingMask | masks.streetMask | vegetation;
	cv::Mat overlap  = occupied & masks.plantableMask;
	EXPECT_EQ(cv::countNonZero(overlap), 0);
	EXPECT_EQ(cv::countNonZero(occupied) + cv::countNonZero(masks.plantableMask), grid.width() * grid.height());

	EXPECT_GT(cv::countNonZero(masks.tierMask(StreetTier::High)), cv::countNonZero(masks.tierMask(StreetTier::Pedestrian)));
	EXPECT_EQ(cv::countNonZero(masks.tierMask(StreetTier::Low)), 0);

	// The sidewalk follows the footway only.
	EXPECT_EQ(masks.sidewalkMask.at<std::uint8_t>(110, 100), 255u);
	EXPECT_EQ(masks.sidewalkMask.at<std::uint8_t>(150, 100), 0u);
	EXPECT_FLOAT_EQ(masks.distanceToSidewalk.at<float>(110, 100), 0.0f);
	EXPECT_FLOAT_EQ(masks.distanceToBuilding.at<float>(40, 40), 0.0f);
}

TEST(MaskGeneratorUnit, EmptyLayers_EmptyMasksFiniteDistances) {
	const Grid grid = makeGrid(100);
	const cv::Mat vegetation(grid.size(), CV_8U, cv::Scalar(0));

	const MaskResult masks = generateMasks(VectorData{}, vegetation, grid, PlantingConfig{});
	ASSERT_TRUE(masks.success);
	EXPECT_EQ(cv::countNonZero(masks.buildingMask), 0);
	EXPECT_EQ(cv::countNonZero(masks.streetMask), 0);
	EXPECT_EQ(cv::countNonZero(masks.sidewalkMask), 0);
	EXPECT_EQ(cv::countNonZero(masks.plantableMask), 100 * 100);
	EXPECT_TRUE(cv::checkRange(masks.distanceToSidewalk));
	EXPECT_TRUE(cv::checkRange(masks.distanceToBuilding));
}

TEST(MaskGeneratorUnit, MismatchedVegetation_Fails) {
	const Grid grid = makeGrid(100);
	const cv::Mat vegetation(50, 50, CV_8U, cv::Scalar(0));
	EXPECT_FALSE(generateMasks(VectorData{}, vegetation, grid, PlantingConfig{}).success);
}

} // namespace gtest
} // namespace canopy::planting::core
