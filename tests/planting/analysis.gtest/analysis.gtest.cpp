#include "planting/analysis.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdint>

namespace canopy::planting {
namespace gtest {

using namespace core;

static constexpr GeoPoint CENTER{3.1478, 101.6953};
static constexpr int SIZE = 200;

//! Configuration without the imagery correction so pixel positions stay where they were drawn.
static PlantingConfig identityConfig() {
	PlantingConfig config{};
	config.alignment.scale        = 1.0;
	config.alignment.northOffsetM = 0.0;
	config.alignment.eastOffsetM  = 0.0;
	return config;
}

static std::vector<GeoPoint> pixelRing(const Grid& grid, const cv::Rect& rect) {
	return {grid.pixelToGeo({static_cast<double>(rect.x), static_cast<double>(rect.y)}),
	        grid.pixelToGeo({static_cast<double>(rect.x + rect.width), static_cast<double>(rect.y)}),
	        grid.pixelToGeo({static_cast<double>(rect.x + rect.width), static_cast<double>(rect.y + rect.height)}),
	        grid.pixelToGeo({static_cast<double>(rect.x), static_cast<double>(rect.y + rect.height)})};
}

/*! Grey 200x200 scene with a lawn, one building, one residential street along the bottom and a cafe.
 *  Pixel layout:
 *    building  (20, 20) 40x40
 *    lawn      (130, 20) 40x40
 *    street    y = 185
 *    amenity   (100, 100)
 */
static LocationInput syntheticLocation(const std::string& name = "Synthetic") {
	const Grid grid = Grid::fromCenter(CENTER, SIZE, SIZE, 18, 2);

	LocationInput input{};
	input.name        = name;
	input.description = "Synthetic test scene";
	input.center      = CENTER;
	input.image       = cv::Mat(SIZE, SIZE, CV_8UC3, cv::Scalar(150, 150, 150));
	cv::rectangle(input.image, cv::Rect(130, 20, 40, 40), cv::Scalar(40, 200, 40), cv::FILLED);

	input.vectors.buildings.push_back(Polygon{pixelRing(grid, cv::Rect(20, 20, 40, 40)), {}});
	input.vectors.streets.push_back(Street{{grid.pixelToGeo({0.0, 185.0}), grid.pixelToGeo({199.0, 185.0})}, "residential", StreetTier::Low});
	input.vectors.amenities.push_back(grid.pixelToGeo({100.0, 100.0}));
	return input;
}

TEST(AnalysisUnit, SyntheticLocation_Succeeds) {
	const LocationResult result = analyseLocation(syntheticLocation(), identityConfig());
	ASSERT_TRUE(result.success) << result.error;

	EXPECT_EQ(result.grid.size(), cv::Size(SIZE, SIZE));
	EXPECT_EQ(result.alignment.tiers[StreetTier::Low], 1u);

	// Building and lawn are not plantable.
	EXPECT_EQ(result.masks.buildingMask.at<std::uint8_t>(40, 40), 255u);
	EXPECT_EQ(result.masks.plantableMask.at<std::uint8_t>(40, 40), 0u);
	EXPECT_EQ(result.features.vegetationMask.at<std::uint8_t>(40, 150), 255u);
	EXPECT_EQ(result.masks.plantableMask.at<std::uint8_t>(40, 150), 0u);
	EXPECT_EQ(result.masks.streetMask.at<std::uint8_t>(185, 100), 255u);
	EXPECT_EQ(result.masks.plantableMask.at<std::uint8_t>(185, 100), 0u);
	EXPECT_EQ(result.masks.plantableMask.at<std::uint8_t>(100, 100), 255u);

	// Nothing scores outside the plantable area.
	cv::Mat notPlantable;
	cv::bitwise_not(result.masks.plantableMask, notPlantable);
	cv::Mat outside;
	result.priority.composite.copyTo(outside, notPlantable);
	EXPECT_EQ(cv::countNonZero(outside), 0);

	double minV = 0.0, maxV = 0.0;
	cv::minMaxLoc(result.priority.composite, &minV, &maxV);
	EXPECT_GE(minV, 0.0);
	EXPECT_LE(maxV, 100.0);

	EXPECT_GT(result.coverage.plantable.percentage, 0.0);
	EXPECT_NEAR(result.coverage.buildings.percentage, 100.0 * 40.0 * 40.0 / (SIZE * SIZE), 1.0);

	double classShares = 0.0;
	for (const AreaShare& share: result.distribution.classes) {
		classShares += share.percentage;
	}
	EXPECT_NEAR(classShares, 100.0, 1e-6);
	EXPECT_EQ(result.distribution.criticalSpots, static_cast<int>(result.spots.size()));
}

TEST(AnalysisUnit, SyntheticLocation_Deterministic) {
	const LocationResult first  = analyseLocation(syntheticLocation(), identityConfig());
	const LocationResult second = analyseLocation(syntheticLocation(), identityConfig());
	ASSERT_TRUE(first.success);
	ASSERT_TRUE(second.success);

	EXPECT_EQ(cv::norm(first.priority.composite, second.priority.composite, cv::NORM_INF), 0.0);
	ASSERT_EQ(first.spots.size(), second.spots.size());
	for (std::size_t i = 0u; i < first.spots.size(); ++i) {
		EXPECT_EQ(first.spots[i].pixelCount, second.spots[i].pixelCount);
		EXPECT_DOUBLE_EQ(first.spots[i].meanScore, second.spots[i].meanScore);
	}
}

TEST(AnalysisUnit, DebugStagesInPipelineOrder) {
	DebugVisualizer debugger;
	const LocationResult result = analyseLocation(syntheticLocation(), identityConfig(), &debugger);
	ASSERT_TRUE(result.success);

	const std::vector<std::string> expected{"Alignment", "Feature Detection", "Masks", "Scoring", "Critical Spots"};
	EXPECT_EQ(debugger.stageNames(), expected);
	EXPECT_FALSE(debugger.buildMosaic().empty());
}

TEST(AnalysisUnit, InvalidConfig_Fails) {
	PlantingConfig config              = identityConfig();
	config.scoring.building.maxPoints = 30.0f;

	const LocationResult result = analyseLocation(syntheticLocation(), config);
	EXPECT_FALSE(result.success);
	EXPECT_NE(result.error.find("configuration"), std::string::npos);
}

TEST(AnalysisUnit, EmptyImage_Fails) {
	LocationInput input = syntheticLocation();
	input.image         = cv::Mat();
	EXPECT_FALSE(analyseLocation(input, identityConfig()).success);
}

TEST(AnalysisUnit, GridMismatch_Fails) {
	LocationInput input = syntheticLocation();
	input.grid          = Grid::fromCenter(CENTER, 100, 100, 18, 2);
	EXPECT_FALSE(analyseLocation(input, identityConfig()).success);
}

TEST(AnalysisUnit, UnknownTagWithoutDefault_Fails) {
	LocationInput input = syntheticLocation();
	input.vectors.streets.front().highway = "raceway";

	PlantingConfig config              = identityConfig();
	config.streets.defaultTier         = std::nullopt;
	const LocationResult strict        = analyseLocation(input, config);
	EXPECT_FALSE(strict.success);

	const LocationResult lenient = analyseLocation(input, identityConfig());
	ASSERT_TRUE(lenient.success);
	EXPECT_EQ(lenient.alignment.tiers.unmatched, 1u);
	EXPECT_EQ(lenient.alignment.aligned.streets.front().tier, StreetTier::Low);
}

TEST(AnalysisUnit, NoVectors_WholeImagePlantableExceptVegetation) {
	LocationInput input = syntheticLocation();
	input.vectors       = VectorData{};

	const LocationResult result = analyseLocation(input, identityConfig());
	ASSERT_TRUE(result.success);
	EXPECT_EQ(cv::countNonZero(result.masks.buildingMask), 0);
	EXPECT_EQ(cv::countNonZero(result.masks.streetMask), 0);
	EXPECT_EQ(cv::countNonZero(result.priority.amenity), 0);
	EXPECT_EQ(result.coverage.plantable.pixels + result.coverage.vegetation.pixels, SIZE * SIZE);
}

TEST(BatchAnalysisUnit, FailureIsIsolated) {
	std::vector<LocationInput> inputs{syntheticLocation("A"), syntheticLocation("B"), syntheticLocation("C")};
	inputs[1].image = cv::Mat();

	BatchAnalysis batch(identityConfig(), 2u);
	EXPECT_EQ(batch.threadCount(), 2u);

	std::vector<std::size_t> done;
	batch.connect({[&done](std::size_t index, const LocationResult&) { done.push_back(index); }});

	const std::vector<LocationResult> results = batch.run(inputs);
	ASSERT_EQ(results.size(), 3u);
	EXPECT_EQ(results[0].name, "A");
	EXPECT_EQ(results[1].name, "B");
	EXPECT_EQ(results[2].name, "C");
	EXPECT_TRUE(results[0].success);
	EXPECT_FALSE(results[1].success);
	EXPECT_TRUE(results[2].success);

	std::sort(done.begin(), done.end());
	EXPECT_EQ(done, (std::vector<std::size_t>{0u, 1u, 2u}));

	// Results do not depend on the worker that produced them.
	EXPECT_EQ(cv::norm(results[0].priority.composite, results[2].priority.composite, cv::NORM_INF), 0.0);
}

TEST(BatchAnalysisUnit, InvalidConfig_FailsEveryLocation) {
	PlantingConfig config       = identityConfig();
	config.spots.minClusterPixels = 0;

	BatchAnalysis batch(config, 1u);
	const auto results = batch.run({syntheticLocation("A"), syntheticLocation("B")});
	ASSERT_EQ(results.size(), 2u);
	for (const LocationResult& result: results) {
		EXPECT_FALSE(result.success);
		EXPECT_FALSE(result.error.empty());
	}
}

TEST(BatchAnalysisUnit, EmptyBatch) {
	BatchAnalysis batch(identityConfig());
	EXPECT_GE(batch.threadCount(), 1u);
	EXPECT_TRUE(batch.run({}).empty());
}

} // namespace gtest
} // namespace canopy::planting
