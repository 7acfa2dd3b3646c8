#pragma once

#include "planting/core/config.hpp"
#include "planting/core/debugVisualizer.hpp"
#include "planting/core/featureDetector.hpp"
#include "planting/core/geometryAligner.hpp"
#include "planting/core/grid.hpp"
#include "planting/core/maskGenerator.hpp"
#include "planting/core/priorityScorer.hpp"
#include "planting/core/report.hpp"
#include "planting/core/spotExtractor.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace canopy::planting {

//! Everything needed to analyse one location.
struct LocationInput {
	std::string name;
	std::string description{};
	core::GeoPoint center{};
	cv::Mat image{};                  //!< Satellite image centred on `center`.
	core::VectorData vectors{};       //!< Raw (unaligned) vector layers.
	std::optional<core::Grid> grid{}; //!< Known frame of the image. Derived from centre, image size and GridConfig if empty.
};

//! Outcome of one location. Intermediate rasters are kept for reporting and visualisation.
struct LocationResult {
	bool success{false};
	std::string error{}; //!< Reason of the failure if !success.

	std::string name{};
	std::string description{};
	core::GeoPoint center{};
	core::Grid grid{};

	core::AlignResult alignment{};
	core::FeatureResult features{};
	core::MaskResult masks{};
	core::PriorityResult priority{};
	std::vector<core::CriticalSpot> spots{};

	core::CoverageBreakdown coverage{};
	core::PriorityDistribution distribution{};
};

/*! Run the full analysis of one location: alignment, feature detection, masks, scoring and spot extraction.
 *  Never throws. OpenCV errors are caught and reported in the result.
 * \param [in]     input    Location to analyse.
 * \param [in]     config   Validated before use. An invalid configuration fails the location.
 * \param [in,out] debugger Optional debug visualizer. Receives one stage per pipeline step.
 */
LocationResult analyseLocation(const LocationInput& input, const core::PlantingConfig& config, core::DebugVisualizer* debugger = nullptr);

/*! Analyses many locations on a fixed pool of worker threads.
 *  Every location works on its own copy of the inputs. A failing location does not affect the others.
 */
class BatchAnalysis {
public:
	struct Callbacks {
		std::function<void(std::size_t, const LocationResult&)> onLocationDone; //!< Called from a worker thread, serialised.
	};

public:
	explicit BatchAnalysis(core::PlantingConfig config, unsigned threadCount = 0u);

	void connect(Callbacks callbacks); //!< Connect callback functions.
	void disconnect();                 //!< Disconnect the callback functions.

	//! Analyse all locations. Results are in input order.
	std::vector<LocationResult> run(const std::vector<LocationInput>& inputs);

	unsigned threadCount() const {
		return m_threadCount;
	}

private:
	void notify(std::size_t index, const LocationResult& result);

private:
	core::PlantingConfig m_config; //!< Shared read-only by all workers.
	unsigned m_threadCount;        //!< Number of workers. Never more than locations.

	Callbacks m_callbacks;               //!< Callback functions to signal progress.
	std::mutex m_callbackMutex;          //!< Serialises callbacks and connect/disconnect.
	std::atomic<std::size_t> m_next{0u}; //!< Index of the next location to pick up.
};

} // namespace canopy::planting
