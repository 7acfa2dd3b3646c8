#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace canopy::planting::core {

//! Each step in a stage.
struct DebugStep {
	std::string name; //!< Some name.
	cv::Mat image;    //!< Image produced by the step.
};

//! The analysis runs in stages (alignment, features, masks, scoring, spots). We collect the images per stage.
struct DebugStage {
	std::string name;                //!< Name of the stage.
	std::vector<DebugStep> images{}; //!< Image name pair for every step that was added.
};

//! Can be passed to the analysis functions to get intermediate images for debugging and tuning.
class DebugVisualizer {
public:
	// Map palette (BGR).
	static inline const cv::Scalar COLOR_BUILDING{128, 128, 128};
	static inline const cv::Scalar COLOR_SIDEWALK{255, 255, 100};
	static inline const cv::Scalar COLOR_SHADOW{100, 100, 200};
	static inline const cv::Scalar COLOR_VEGETATION{0, 255, 0};
	static inline const cv::Scalar COLOR_AMENITY{0, 255, 255};
	static inline const cv::Scalar COLOR_STREET_LOW{144, 238, 144};
	static inline const cv::Scalar COLOR_STREET_MEDIUM{0, 255, 255};
	static inline const cv::Scalar COLOR_STREET_HIGH{0, 165, 255};
	static inline const cv::Scalar COLOR_CRITICAL{0, 0, 255};
	static inline const cv::Scalar COLOR_HIGH{0, 165, 255};
	static inline const cv::Scalar COLOR_MEDIUM{0, 255, 255};
	static inline const cv::Scalar COLOR_LOW{144, 238, 144};

public:
	void beginStage(std::string name);              //!< New stage in the analysis starts.
	void add(std::string name, const cv::Mat& img); //!< Add an image given some step name. Show image in interactive mode.
	void endStage();

	cv::Mat buildMosaic();                            //!< Returns mosaic of all debug images, one row per stage. Ends currently active stage.
	cv::Mat buildStageMosaic(const std::string& name); //!< Mosaic of a single stage. Empty if the stage was not recorded.
	std::vector<std::string> stageNames() const;

	void setInteractive(bool interactive, unsigned displayTimeMs = 0u); //!< Enable immediate image display in add().
	void clear();

	//! Blend a binary mask onto an image in the given colour.
	static cv::Mat overlay(const cv::Mat& base, const cv::Mat& mask, const cv::Scalar& color, double alpha = 0.6);
	//! Colour-map a continuous field over a fixed value range (values outside are saturated).
	static cv::Mat heatmap(const cv::Mat& field, double minValue, double maxValue);
	//! Colour a label image (CV_8U) with one palette entry per label value. Labels beyond the palette stay black.
	static cv::Mat colorizeLabels(const cv::Mat& labels, const std::vector<cv::Scalar>& palette);

private:
	static cv::Mat toBgr8U(const cv::Mat& in);
	static cv::Mat renderRows(const std::vector<const DebugStage*>& stages);

private:
	bool m_interactive{false};  //!< Immediately show image when it's added.
	unsigned m_displayTime{0u}; //!< How many ms to show the image in interactive mode. 0->inf.

	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Collection of debug info for all stages.
};

} // namespace canopy::planting::core
