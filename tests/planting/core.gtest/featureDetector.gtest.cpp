#include "planting/core/featureDetector.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace canopy::planting::core {
namespace gtest {

static float ndviOf(const cv::Scalar& bgr) {
	const cv::Mat image(4, 4, CV_8UC3, bgr);
	const cv::Mat ndvi = computeNdvi(image, 1e-8);
	EXPECT_EQ(ndvi.type(), CV_32FC1);
	return ndvi.at<float>(0, 0);
}

TEST(FeatureDetectorUnit, Ndvi_PureColours) {
	EXPECT_NEAR(ndviOf(cv::Scalar(0, 0, 255)), -1.0f, 1e-6f);
	EXPECT_NEAR(ndviOf(cv::Scalar(0, 255, 0)), 1.0f, 1e-6f);
	EXPECT_NEAR(ndviOf(cv::Scalar(128, 128, 128)), 0.0f, 1e-6f);
	EXPECT_NEAR(ndviOf(cv::Scalar(0, 0, 0)), 0.0f, 1e-6f); // Epsilon guards the division.
}

TEST(FeatureDetectorUnit, Ndvi_RandomImageWithinRange) {
	cv::Mat image(64, 64, CV_8UC3);
	cv::RNG rng(0x5eed);
	rng.fill(image, cv::RNG::UNIFORM, 0, 256);

	EXPECT_TRUE(cv::checkRange(computeNdvi(image, 1e-8), true, nullptr, -1.0, 1.0 + 1e-6));
	EXPECT_TRUE(cv::checkRange(detectFeatures(image, PlantingConfig{}).ndvi, true, nullptr, -1.0, 1.0 + 1e-6));
}

TEST(FeatureDetectorUnit, Ndvi_AllRedGreenPairsWithinRange) {
	cv::Mat image(256, 256, CV_8UC3);
	for (int r = 0; r < 256; ++r) {
		for (int g = 0; g < 256; ++g) {
			image.at<cv::Vec3b>(r, g) = cv::Vec3b(7, static_cast<std::uint8_t>(g), static_cast<std::uint8_t>(r));
		}
	}
	EXPECT_TRUE(cv::checkRange(computeNdvi(image, 1e-8), true, nullptr, -1.0, 1.0 + 1e-6));
}

TEST(FeatureDetectorUnit, GreenImage_AllVegetationNoShadow) {
	const cv::Mat image(50, 50, CV_8UC3, cv::Scalar(40, 200, 40));
	const FeatureResult result = detectFeatures(image, PlantingConfig{});

	ASSERT_TRUE(result.success);
	EXPECT_EQ(cv::countNonZero(result.vegetationMask), 50 * 50);
	EXPECT_EQ(cv::countNonZero(result.shadowMask), 0);
}

TEST(FeatureDetectorUnit, DarkGreen_NotVegetation) {
	// Green dominates but the pixel is below the brightness gate.
	const cv::Mat image(20, 20, CV_8UC3, cv::Scalar(10, 50, 10));
	const FeatureResult result = detectFeatures(image, PlantingConfig{});

	ASSERT_TRUE(result.success);
	EXPECT_EQ(cv::countNonZero(result.vegetationMask), 0);
}

TEST(FeatureDetectorUnit, BrightImage_EmptyMasks) {
	const cv::Mat image(40, 40, CV_8UC3, cv::Scalar(255, 255, 255));
	const FeatureResult result = detectFeatures(image, PlantingConfig{});

	ASSERT_TRUE(result.success);
	EXPECT_EQ(cv::countNonZero(result.vegetationMask), 0);
	EXPECT_EQ(cv::countNonZero(result.shadowMask), 0);

	double minV = 0.0, maxV = 0.0;
	cv::minMaxLoc(result.shadowIntensity, &minV, &maxV);
	EXPECT_NEAR(maxV, 0.0, 1e-6);
}

TEST(FeatureDetectorUnit, DarkImage_NoVegetationNoError) {
	const cv::Mat image(40, 40, CV_8UC3, cv::Scalar(0, 0, 0));
	const FeatureResult result = detectFeatures(image, PlantingConfig{});

	ASSERT_TRUE(result.success);
	EXPECT_EQ(cv::countNonZero(result.vegetationMask), 0);
	EXPECT_TRUE(cv::checkRange(result.ndvi));
	EXPECT_TRUE(cv::checkRange(result.shadowIntensity, true, nullptr, 0.0, 1.0 + 1e-6));
}

TEST(FeatureDetectorUnit, GrayShadowPatch_DetectedAndCleaned) {
	cv::Mat image(100, 100, CV_8UC3, cv::Scalar(180, 180, 180));
	cv::rectangle(image, cv::Rect(20, 20, 30, 30), cv::Scalar(60, 60, 60), cv::FILLED); // 900 px shadow.
	cv::rectangle(image, cv::Rect(80, 80, 3, 3), cv::Scalar(60, 60, 60), cv::FILLED);   // 9 px speck.

	const FeatureResult result = detectFeatures(image, PlantingConfig{});
	ASSERT_TRUE(result.success);

	EXPECT_EQ(result.shadowMask.at<std::uint8_t>(35, 35), 255u);
	EXPECT_EQ(result.shadowMask.at<std::uint8_t>(81, 81), 0u);
	EXPECT_EQ(result.shadowMask.at<std::uint8_t>(5, 5), 0u);
	EXPECT_NEAR(cv::countNonZero(result.shadowMask), 900, 10);

	// Intensity is continuous and independent of the mask.
	EXPECT_GT(result.shadowIntensity.at<float>(35, 35), result.shadowIntensity.at<float>(5, 5));
	EXPECT_GT(result.shadowIntensity.at<float>(81, 81), result.shadowIntensity.at<float>(5, 5));
}

TEST(FeatureDetectorUnit, SaturatedDarkPixel_ShadowOnlyWithVeryDarkRule) {
	// V = 80, S high: not desaturated, not very dark.
	const cv::Mat image(30, 30, CV_8UC3, cv::Scalar(80, 0, 0));

	PlantingConfig config{};
	EXPECT_EQ(cv::countNonZero(detectFeatures(image, config).shadowMask), 0);

	config.shadow.veryDarkThreshold = 90.0;
	EXPECT_EQ(cv::countNonZero(detectFeatures(image, config).shadowMask), 30 * 30);

	config.shadow.useVeryDarkRule = false;
	EXPECT_EQ(cv::countNonZero(detectFeatures(image, config).shadowMask), 0);
}

TEST(FeatureDetectorUnit, Vegetation_ExcludedFromShadow) {
	// Dark enough for the very dark rule, but vegetation once the brightness gate is lowered.
	const cv::Mat image(30, 30, CV_8UC3, cv::Scalar(10, 65, 10));

	PlantingConfig config{};
	config.vegetation.minBrightness = 50.0;
	const FeatureResult result      = detectFeatures(image, config);

	EXPECT_EQ(cv::countNonZero(result.vegetationMask), 30 * 30);
	EXPECT_EQ(cv::countNonZero(result.shadowMask), 0);
}

TEST(FeatureDetectorUnit, RemoveSmallComponents) {
	cv::Mat mask(20, 20, CV_8U, cv::Scalar(0));
	mask(cv::Rect(0, 0, 5, 5)).setTo(255);  // 25 px
	mask(cv::Rect(10, 10, 2, 2)).setTo(255); // 4 px

	const cv::Mat cleaned = removeSmallComponents(mask, 20);
	EXPECT_EQ(cv::countNonZero(cleaned), 25);
	EXPECT_EQ(cleaned.at<std::uint8_t>(10, 10), 0u);
}

TEST(FeatureDetectorUnit, UnsupportedInput_Fails) {
	EXPECT_FALSE(detectFeatures(cv::Mat(), PlantingConfig{}).success);
	EXPECT_FALSE(detectFeatures(cv::Mat(10, 10, CV_8UC2, cv::Scalar(0, 0)), PlantingConfig{}).success);
}

TEST(FeatureDetectorUnit, SixteenBitInput_MatchesEightBit) {
	const cv::Mat image8(40, 40, CV_8UC3, cv::Scalar(40, 200, 40));
	cv::Mat image16;
	image8.convertTo(image16, CV_16U, 257.0);

	const FeatureResult eight   = detectFeatures(image8, PlantingConfig{});
	const FeatureResult sixteen = detectFeatures(image16, PlantingConfig{});
	ASSERT_TRUE(eight.success);
	ASSERT_TRUE(sixteen.success);
	EXPECT_EQ(cv::countNonZero(sixteen.vegetationMask), 40 * 40);
	EXPECT_EQ(cv::countNonZero(eight.vegetationMask != sixteen.vegetationMask), 0);
	EXPECT_EQ(cv::countNonZero(eight.shadowMask != sixteen.shadowMask), 0);
}

TEST(FeatureDetectorUnit, SixteenBitMidGray_NotSaturated) {
	// Without rescaling every 16 bit value clips to white and the shadow vanishes.
	cv::Mat image(60, 60, CV_16UC3, cv::Scalar(180 * 257, 180 * 257, 180 * 257));
	cv::rectangle(image, cv::Rect(10, 10, 30, 30), cv::Scalar(60 * 257, 60 * 257, 60 * 257), cv::FILLED);

	const FeatureResult result = detectFeatures(image, PlantingConfig{});
	ASSERT_TRUE(result.success);
	EXPECT_EQ(result.shadowMask.at<std::uint8_t>(25, 25), 255u);
	EXPECT_EQ(result.shadowMask.at<std::uint8_t>(50, 50), 0u);
}

TEST(FeatureDetectorUnit, FloatInput_Fails) {
	EXPECT_FALSE(detectFeatures(cv::Mat(10, 10, CV_32FC3, cv::Scalar(0.2, 0.8, 0.2)), PlantingConfig{}).success);
}

TEST(FeatureDetectorUnit, DebugVisualizer_ReceivesStage) {
	const cv::Mat image(30, 30, CV_8UC3, cv::Scalar(40, 200, 40));
	DebugVisualizer debugger;
	detectFeatures(image, PlantingConfig{}, &debugger);

	const std::vector<std::string> stages = debugger.stageNames();
	ASSERT_EQ(stages.size(), 1u);
	EXPECT_EQ(stages[0], "Feature Detection");
	EXPECT_FALSE(debugger.buildMosaic().empty());
}

} // namespace gtest
} // namespace canopy::planting::core
