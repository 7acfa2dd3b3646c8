#include "planting/core/featureDetector.hpp"

#include "statistics.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace canopy::planting::core {

namespace {

static bool featureDebugEnabled() {
	const char* env = std::getenv("CANOPY_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

//! Convert any supported layout to 3-channel BGR.
static bool convertToBgr(const cv::Mat& image, cv::Mat& outBgr) {
	if (image.channels() == 3) {
		outBgr = image;
		return true;
	}
	if (image.channels() == 4) {
		cv::cvtColor(image, outBgr, cv::COLOR_BGRA2BGR);
		return true;
	}
	if (image.channels() == 1) {
		cv::cvtColor(image, outBgr, cv::COLOR_GRAY2BGR);
		return true;
	}
	return false;
}

//! Vegetation: green dominates red and the pixel is not too dark.
static cv::Mat detectVegetation(const cv::Mat& ndvi, const cv::Mat& brightness, const VegetationConfig& config) {
	cv::Mat greenEnough;
	cv::compare(ndvi, config.ndviThreshold, greenEnough, cv::CMP_GT);

	cv::Mat brightEnough;
	cv::compare(brightness, config.minBrightness, brightEnough, cv::CMP_GT);

	return greenEnough & brightEnough;
}

//! Shadow candidates: dark and desaturated (or very dark), never vegetation.
static cv::Mat detectShadowCandidates(const cv::Mat& hsv, const cv::Mat& vegetationMask, const ShadowConfig& config) {
	cv::Mat saturation, value;
	cv::extractChannel(hsv, saturation, 1);
	cv::extractChannel(hsv, value, 2);

	cv::Mat dark, desaturated;
	cv::compare(value, config.brightnessThreshold, dark, cv::CMP_LT);
	cv::compare(saturation, config.desaturationThreshold, desaturated, cv::CMP_LT);
	cv::Mat candidates = dark & desaturated;

	if (config.useVeryDarkRule) {
		cv::Mat veryDark;
		cv::compare(value, config.veryDarkThreshold, veryDark, cv::CMP_LT);
		candidates |= veryDark;
	}

	cv::Mat notVegetation;
	cv::bitwise_not(vegetationMask, notVegetation);
	return candidates & notVegetation;
}

} // namespace

cv::Mat computeNdvi(const cv::Mat& image, const double epsilon) {
	cv::Mat bgr;
	if (image.empty() || !convertToBgr(image, bgr)) {
		return {};
	}

	cv::Mat green, red;
	cv::extractChannel(bgr, green, 1);
	cv::extractChannel(bgr, red, 2);
	green.convertTo(green, CV_32F);
	red.convertTo(red, CV_32F);

	cv::Mat denominator = green + red + epsilon;
	cv::Mat ndvi;
	cv::divide(green - red, denominator, ndvi);
	return ndvi;
}

cv::Mat removeSmallComponents(const cv::Mat& mask, const int minPixels) {
	cv::Mat labels, stats, centroids;
	const int labelCount = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

	std::vector<std::uint8_t> keep(static_cast<std::size_t>(labelCount), 0u);
	for (int label = 1; label < labelCount; ++label) {
		if (stats.at<int>(label, cv::CC_STAT_AREA) >= minPixels) {
			keep[static_cast<std::size_t>(label)] = 255u;
		}
	}

	cv::Mat cleaned(mask.size(), CV_8U, cv::Scalar(0));
	for (int y = 0; y < labels.rows; ++y) {
		const int* labelRow  = labels.ptr<int>(y);
		std::uint8_t* outRow = cleaned.ptr<std::uint8_t>(y);
		for (int x = 0; x < labels.cols; ++x) {
			outRow[x] = keep[static_cast<std::size_t>(labelRow[x])];
		}
	}
	return cleaned;
}

FeatureResult detectFeatures(const cv::Mat& image, const PlantingConfig& config, DebugVisualizer* debugger) {
	cv::Mat bgr;
	if (image.empty()) {
		std::cerr << "[features] Feature detection failed: input image is empty\n";
		return {false, {}, {}, {}, {}, {}};
	}
	if (!convertToBgr(image, bgr)) {
		std::cerr << "[features] Feature detection failed: unsupported channel count " << image.channels() << '\n';
		return {false, {}, {}, {}, {}, {}};
	}
	if (bgr.depth() == CV_16U) {
		// Thresholds are on the 8 bit scale.
		cv::Mat converted;
		bgr.convertTo(converted, CV_8U, 1.0 / 257.0);
		bgr = converted;
	} else if (bgr.depth() != CV_8U) {
		std::cerr << "[features] Feature detection failed: unsupported depth " << bgr.depth() << " (expected 8 or 16 bit unsigned)\n";
		return {false, {}, {}, {}, {}, {}};
	}

	if (debugger) {
		debugger->beginStage("Feature Detection");
		debugger->add("Input", bgr);
	}

	FeatureResult result{true, {}, {}, {}, {}, {}};

	// 1. Vegetation from NDVI and brightness.
	result.ndvi = computeNdvi(bgr, config.vegetation.ndviEpsilon);

	cv::Mat hsv;
	cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
	cv::extractChannel(hsv, result.brightness, 2);

	result.vegetationMask = detectVegetation(result.ndvi, result.brightness, config.vegetation);
	if (debugger) {
		debugger->add("NDVI", result.ndvi);
		debugger->add("Vegetation", DebugVisualizer::overlay(bgr, result.vegetationMask, DebugVisualizer::COLOR_VEGETATION));
	}

	// 2. Shadow mask (excluding vegetation), closing and small component removal.
	const cv::Mat candidates = detectShadowCandidates(hsv, result.vegetationMask, config.shadow);
	if (debugger)
		debugger->add("Shadow Candidates", candidates);

	const int kernelSize = config.shadow.closeKernelSize;
	const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernelSize, kernelSize));
	cv::Mat closed;
	cv::morphologyEx(candidates, closed, cv::MORPH_CLOSE, kernel);

	result.shadowMask = removeSmallComponents(closed, config.shadow.minComponentPixels);
	if (debugger)
		debugger->add("Shadow Mask", DebugVisualizer::overlay(bgr, result.shadowMask, DebugVisualizer::COLOR_SHADOW));

	// 3. Continuous shadow intensity for the sun exposure component.
	cv::Mat valueFloat;
	result.brightness.convertTo(valueFloat, CV_32F, 1.0 / 255.0);
	cv::Mat intensity = 1.0 - valueFloat;
	if (config.shadow.intensitySigma > 0.0) {
		cv::GaussianBlur(intensity, intensity, cv::Size(), config.shadow.intensitySigma, config.shadow.intensitySigma, cv::BORDER_REPLICATE);
	}
	const cv::Mat clampedLow = cv::max(intensity, 0.0);
	result.shadowIntensity   = cv::min(clampedLow, 1.0);

	if (debugger) {
		debugger->add("Shadow Intensity", DebugVisualizer::heatmap(result.shadowIntensity, 0.0, 1.0));
		debugger->endStage();
	}

	if (featureDebugEnabled()) {
		const double total = static_cast<double>(bgr.total());
		std::cout << "[features] vegetation=" << percentage(static_cast<double>(cv::countNonZero(result.vegetationMask)), total)
		          << "% shadow=" << percentage(static_cast<double>(cv::countNonZero(result.shadowMask)), total) << "%\n";
	}

	return result;
}

} // namespace canopy::planting::core
