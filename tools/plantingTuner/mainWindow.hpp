#pragma once

#include "plantingStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>
#include <string>

class QComboBox;
class QLabel;
class QPushButton;

namespace canopy {

//! Paints a cv::Mat scaled to the widget, keeping the aspect ratio.
class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setSummary(const std::string& text);

	void setStepChangedCallback(std::function<void(PlantingStep)> callback);
	void setReloadCallback(std::function<void()> callback);
	PlantingStep selectedStep() const;

private:
	void buildLayout();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_stepCombo{nullptr};
	QPushButton* m_reloadButton{nullptr};
	QLabel* m_summaryLabel{nullptr};

	std::function<void(PlantingStep)> m_stepChangedCallback{};
	std::function<void()> m_reloadCallback{};
};

} // namespace canopy
