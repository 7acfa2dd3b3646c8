#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QPushButton>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

namespace canopy {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);

	if (m_image.isNull()) {
		return;
	}

	// Nearest neighbour keeps single mask pixels visible when zooming in.
	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::FastTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty()) {
		return {};
	}

	// Mosaics are BGR 8 bit. Everything else is normalised for display.
	cv::Mat bgr8;
	if (mat.depth() == CV_8U) {
		bgr8 = mat;
	} else {
		cv::normalize(mat, bgr8, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat rgb;
	switch (bgr8.channels()) {
	case 1:
		cv::cvtColor(bgr8, rgb, cv::COLOR_GRAY2RGB);
		break;
	case 3:
		cv::cvtColor(bgr8, rgb, cv::COLOR_BGR2RGB);
		break;
	case 4:
		cv::cvtColor(bgr8, rgb, cv::COLOR_BGRA2RGB);
		break;
	default:
		return {};
	}

	const QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
	return image.copy();
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Planting Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setSummary(const std::string& text) {
	if (m_summaryLabel != nullptr) {
		m_summaryLabel->setText(QString::fromStdString(text));
	}
}

void MainWindow::setStepChangedCallback(std::function<void(PlantingStep)> callback) {
	m_stepChangedCallback = std::move(callback);
}

void MainWindow::setReloadCallback(std::function<void()> callback) {
	m_reloadCallback = std::move(callback);
}

PlantingStep MainWindow::selectedStep() const {
	const int index = m_stepCombo != nullptr ? m_stepCombo->currentIndex() : -1;
	if (index < 0 || index >= static_cast<int>(PLANTING_STEPS.size())) {
		return PlantingStep::All;
	}
	return PLANTING_STEPS[static_cast<std::size_t>(index)].step;
}

void MainWindow::buildLayout() {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* controlRow = new QHBoxLayout();
	auto* stepLabel  = new QLabel("Stage:", rootWidget);

	m_stepCombo = new QComboBox(rootWidget);
	for (const PlantingStepInfo& info: PLANTING_STEPS) {
		m_stepCombo->addItem(info.label);
	}
	m_stepCombo->setCurrentIndex(static_cast<int>(PLANTING_STEPS.size()) - 1);

	m_reloadButton = new QPushButton("Reload Config", rootWidget);
	m_summaryLabel = new QLabel(rootWidget);

	controlRow->addWidget(stepLabel);
	controlRow->addWidget(m_stepCombo);
	controlRow->addWidget(m_reloadButton);
	controlRow->addSpacing(16);
	controlRow->addWidget(m_summaryLabel);
	controlRow->addStretch(1);

	m_matrixView = new CvMatrixView(rootWidget);

	rootLayout->addLayout(controlRow);
	rootLayout->addWidget(m_matrixView, 1);

	setCentralWidget(rootWidget);

	QObject::connect(m_stepCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_stepChangedCallback) {
			m_stepChangedCallback(selectedStep());
		}
	});
	QObject::connect(m_reloadButton, &QPushButton::clicked, this, [this]() {
		if (m_reloadCallback) {
			m_reloadCallback();
		}
	});
}

} // namespace canopy
