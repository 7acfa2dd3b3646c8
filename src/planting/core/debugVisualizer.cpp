#include "planting/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace canopy::planting::core {

void DebugVisualizer::setInteractive(bool interactive, unsigned displayTimeMs) {
	m_interactive = interactive;
	m_displayTime = displayTimeMs;
}

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		std::cerr << "[debug] Image '" << name << "' added outside of a stage. Ignored.\n";
		return;
	}

	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});

	if (m_interactive) {
		cv::imshow(m_currentStage.name, toBgr8U(img));
		cv::waitKey(static_cast<int>(m_displayTime));
		cv::destroyWindow(m_currentStage.name);
	}
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

std::vector<std::string> DebugVisualizer::stageNames() const {
	std::vector<std::string> names;
	names.reserve(m_stages.size());
	for (const auto& stage: m_stages) {
		names.push_back(stage.name);
	}
	return names;
}

cv::Mat DebugVisualizer::buildMosaic() {
	if (m_hasActiveStage) {
		endStage();
	}

	std::vector<const DebugStage*> stages;
	for (const auto& stage: m_stages) {
		stages.push_back(&stage);
	}
	return renderRows(stages);
}

cv::Mat DebugVisualizer::buildStageMosaic(const std::string& name) {
	if (m_hasActiveStage) {
		endStage();
	}

	const auto it = std::find_if(m_stages.begin(), m_stages.end(), [&name](const DebugStage& stage) { return stage.name == name; });
	if (it == m_stages.end()) {
		return {};
	}
	return renderRows({&*it});
}

cv::Mat DebugVisualizer::renderRows(const std::vector<const DebugStage*>& stages) {
	static constexpr int TILE_SIZE     = 320;
	static constexpr int HEADER_W      = 180;
	static constexpr int TILE_LABEL_H  = 26;
	static constexpr int TILE_PAD      = 4;
	static constexpr int MAX_MOSAIC_W  = 2400;

	static const cv::Scalar BG(24, 24, 24);
	static const cv::Scalar HEADER_BG(0, 0, 0);
	static const cv::Scalar HEADER_FG(255, 255, 255);

	std::size_t maxSteps = 0u;
	for (const DebugStage* stage: stages) {
		maxSteps = std::max(maxSteps, stage->images.size());
	}
	if (stages.empty() || maxSteps == 0u) {
		return {};
	}

	// One row per stage; long stages wrap onto further rows of the same stage block.
	const int tilesPerRow = std::max(1, std::min(static_cast<int>(maxSteps), (MAX_MOSAIC_W - HEADER_W) / TILE_SIZE));
	std::vector<int> rowsPerStage;
	int totalRows = 0;
	for (const DebugStage* stage: stages) {
		const int steps = static_cast<int>(stage->images.size());
		const int rows  = std::max(1, (steps + tilesPerRow - 1) / tilesPerRow);
		rowsPerStage.push_back(rows);
		totalRows += rows;
	}

	const int mosaicW = HEADER_W + tilesPerRow * TILE_SIZE;
	const int mosaicH = totalRows * TILE_SIZE;
	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	int rowOffset = 0;
	for (std::size_t s = 0u; s < stages.size(); ++s) {
		const DebugStage& stage = *stages[s];
		const int blockH        = rowsPerStage[s] * TILE_SIZE;

		cv::Mat header = mosaic(cv::Rect(0, rowOffset * TILE_SIZE, HEADER_W, blockH));
		header.setTo(HEADER_BG);
		cv::putText(header, stage.name, cv::Point(8, 30), cv::FONT_HERSHEY_SIMPLEX, 0.6, HEADER_FG, 1, cv::LINE_AA);
		cv::putText(header, std::to_string(stage.images.size()) + " steps", cv::Point(8, 56), cv::FONT_HERSHEY_SIMPLEX, 0.5, HEADER_FG, 1, cv::LINE_AA);

		for (std::size_t i = 0u; i < stage.images.size(); ++i) {
			const int col = static_cast<int>(i) % tilesPerRow;
			const int row = rowOffset + static_cast<int>(i) / tilesPerRow;

			const DebugStep& step = stage.images[i];
			cv::Mat cell          = mosaic(cv::Rect(HEADER_W + col * TILE_SIZE, row * TILE_SIZE, TILE_SIZE, TILE_SIZE));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, TILE_LABEL_H), HEADER_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, 18), cv::FONT_HERSHEY_SIMPLEX, 0.5, HEADER_FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			const int availW = TILE_SIZE - 2 * TILE_PAD;
			const int availH = TILE_SIZE - TILE_LABEL_H - 2 * TILE_PAD;

			const cv::Mat vis  = toBgr8U(step.image);
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			// Nearest neighbour keeps masks crisp when enlarging small rasters.
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

			const int x0 = TILE_PAD + (availW - w) / 2;
			const int y0 = TILE_LABEL_H + TILE_PAD + (availH - h) / 2;
			resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
		}

		rowOffset += rowsPerStage[s];
	}

	return mosaic;
}

cv::Mat DebugVisualizer::overlay(const cv::Mat& base, const cv::Mat& mask, const cv::Scalar& color, double alpha) {
	cv::Mat out = toBgr8U(base).clone();
	if (mask.empty() || mask.size() != out.size()) {
		return out;
	}

	cv::Mat tinted(out.size(), CV_8UC3, color);
	cv::Mat blended;
	cv::addWeighted(out, 1.0 - alpha, tinted, alpha, 0.0, blended);
	blended.copyTo(out, mask);
	return out;
}

cv::Mat DebugVisualizer::heatmap(const cv::Mat& field, double minValue, double maxValue) {
	if (field.empty()) {
		return {};
	}

	const double range = std::max(maxValue - minValue, 1e-9);
	cv::Mat scaled;
	field.convertTo(scaled, CV_8U, 255.0 / range, -minValue * 255.0 / range);

	cv::Mat colored;
	cv::applyColorMap(scaled, colored, cv::COLORMAP_JET);
	return colored;
}

cv::Mat DebugVisualizer::colorizeLabels(const cv::Mat& labels, const std::vector<cv::Scalar>& palette) {
	cv::Mat colored(labels.size(), CV_8UC3, cv::Scalar(0, 0, 0));
	for (std::size_t value = 0u; value < palette.size(); ++value) {
		cv::Mat selected;
		cv::compare(labels, static_cast<double>(value), selected, cv::CMP_EQ);
		colored.setTo(palette[value], selected);
	}
	return colored;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// Normalise depth to 8U for visualisation.
	if (in.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		if (maxV - minV < 1e-9) {
			in.convertTo(out, CV_8U);
		} else {
			in.convertTo(out, CV_8U, 255.0 / (maxV - minV), -minV * 255.0 / (maxV - minV));
		}
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace canopy::planting::core
