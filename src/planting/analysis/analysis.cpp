#include "planting/analysis.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include <opencv2/imgproc.hpp>

namespace canopy::planting {

namespace {

static LocationResult failed(LocationResult result, std::string error) {
	std::cerr << "[analysis] " << (result.name.empty() ? std::string("<unnamed>") : result.name) << " failed: " << error << '\n';
	result.success = false;
	result.error   = std::move(error);
	return result;
}

static std::vector<cv::Point> toPixels(const std::vector<core::GeoPoint>& points, const core::Grid& grid) {
	std::vector<cv::Point> out;
	out.reserve(points.size());
	for (const core::GeoPoint& p: points) {
		const cv::Point2d px = grid.geoToPixel(p);
		out.emplace_back(cvRound(px.x), cvRound(px.y));
	}
	return out;
}

//! Outline the vector layers on top of the image.
static cv::Mat drawVectors(const cv::Mat& image, const core::VectorData& vectors, const core::Grid& grid, const cv::Scalar& color) {
	cv::Mat canvas = core::DebugVisualizer::overlay(image, cv::Mat(), color);

	for (const core::Polygon& building: vectors.buildings) {
		cv::polylines(canvas, toPixels(building.exterior, grid), true, color, 1, cv::LINE_AA);
	}
	for (const core::Street& street: vectors.streets) {
		cv::polylines(canvas, toPixels(street.path, grid), false, color, 2, cv::LINE_AA);
	}
	for (const cv::Point& amenity: toPixels(vectors.amenities, grid)) {
		cv::circle(canvas, amenity, 3, core::DebugVisualizer::COLOR_AMENITY, cv::FILLED, cv::LINE_AA);
	}
	return canvas;
}

} // namespace

LocationResult analyseLocation(const LocationInput& input, const core::PlantingConfig& config, core::DebugVisualizer* debugger) {
	LocationResult result{};
	result.name        = input.name;
	result.description = input.description;
	result.center      = input.center;

	std::string reason;
	if (!core::validateConfig(config, &reason)) {
		return failed(std::move(result), "invalid configuration: " + reason);
	}
	if (input.image.empty()) {
		return failed(std::move(result), "satellite image is empty");
	}

	try {
		result.grid = input.grid ? *input.grid : core::Grid::fromCenter(input.center, input.image.cols, input.image.rows, config.grid.zoom, config.grid.scale);
		if (!result.grid.isValid() || result.grid.size() != input.image.size()) {
			return failed(std::move(result), "image does not match the location grid");
		}

		// 1. Align the vector layers to the imagery.
		result.alignment = core::alignLocation(input.vectors, input.center, config);
		if (!result.alignment.success) {
			return failed(std::move(result), "street classification failed");
		}
		if (debugger) {
			debugger->beginStage("Alignment");
			debugger->add("Raw Vectors", drawVectors(input.image, input.vectors, result.grid, cv::Scalar(0, 0, 255)));
			debugger->add("Aligned Vectors", drawVectors(input.image, result.alignment.aligned, result.grid, cv::Scalar(255, 255, 0)));
			debugger->endStage();
		}

		// 2. Raster features.
		result.features = core::detectFeatures(input.image, config, debugger);
		if (!result.features.success) {
			return failed(std::move(result), "feature detection failed");
		}

		// 3. Masks and distance fields.
		result.masks = core::generateMasks(result.alignment.aligned, result.features.vegetationMask, result.grid, config, debugger);
		if (!result.masks.success) {
			return failed(std::move(result), "mask generation failed");
		}

		// 4. Scores.
		result.priority = core::scorePriority(result.features, result.masks, result.alignment.aligned.amenities, result.grid, config, debugger);
		if (!result.priority.success) {
			return failed(std::move(result), "priority scoring failed");
		}

		// 5. Critical spots.
		result.spots = core::extractCriticalSpots(result.priority.composite, result.masks.plantableMask, result.grid, config.spots,
		                                          config.classification.criticalMin, debugger);

		result.coverage     = core::computeCoverage(result.grid, result.masks.buildingMask, result.features.vegetationMask, result.features.shadowMask,
		                                            result.masks.streetMask, result.masks.plantableMask);
		result.distribution = core::computeDistribution(result.grid, result.priority.classification, result.masks.plantableMask,
		                                                static_cast<int>(result.spots.size()));
	} catch (const cv::Exception& e) {
		return failed(std::move(result), std::string("OpenCV error: ") + e.what());
	}

	result.success = true;
	std::cout << "[analysis] " << result.name << ": plantable " << result.coverage.plantable.percentage << "%, critical "
	          << result.distribution[core::PriorityLevel::Critical].percentage << "% of plantable, " << result.spots.size() << " critical spot(s)\n";
	return result;
}

BatchAnalysis::BatchAnalysis(core::PlantingConfig config, const unsigned threadCount)
    : m_config{std::move(config)}, m_threadCount{threadCount != 0u ? threadCount : std::max(1u, std::thread::hardware_concurrency())} {
}

void BatchAnalysis::connect(Callbacks callbacks) {
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	m_callbacks = std::move(callbacks);
}

void BatchAnalysis::disconnect() {
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	m_callbacks = {};
}

void BatchAnalysis::notify(const std::size_t index, const LocationResult& result) {
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	if (m_callbacks.onLocationDone) {
		m_callbacks.onLocationDone(index, result);
	}
}

std::vector<LocationResult> BatchAnalysis::run(const std::vector<LocationInput>& inputs) {
	std::vector<LocationResult> results(inputs.size());
	if (inputs.empty()) {
		return results;
	}

	std::string reason;
	if (!core::validateConfig(m_config, &reason)) {
		std::cerr << "[analysis] Batch refused: invalid configuration: " << reason << '\n';
		for (std::size_t i = 0u; i < inputs.size(); ++i) {
			results[i].name  = inputs[i].name;
			results[i].error = "invalid configuration: " + reason;
		}
		return results;
	}

	m_next.store(0u);
	const auto worker = [this, &inputs, &results]() {
		for (std::size_t i = m_next.fetch_add(1u); i < inputs.size(); i = m_next.fetch_add(1u)) {
			results[i] = analyseLocation(inputs[i], m_config);
			notify(i, results[i]);
		}
	};

	const std::size_t workers = std::min<std::size_t>(m_threadCount, inputs.size());
	std::vector<std::thread> pool;
	pool.reserve(workers);
	for (std::size_t t = 0u; t < workers; ++t) {
		pool.emplace_back(worker);
	}
	for (std::thread& thread: pool) {
		thread.join();
	}

	const auto succeeded = std::count_if(results.begin(), results.end(), [](const LocationResult& r) { return r.success; });
	std::cout << "[analysis] Batch finished: " << succeeded << "/" << results.size() << " location(s) analysed on " << workers << " thread(s)\n";
	return results;
}

} // namespace canopy::planting
