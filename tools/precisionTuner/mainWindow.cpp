#include "mainWindow.hpp"

#include "precision/core/debugVisualizer.hpp"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

namespace cutprec {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	if (mat.empty()) {
		m_image = QImage();
	} else {
		cv::Mat rgb;
		cv::cvtColor(precision::core::DebugVisualizer::toBgr8U(mat), rgb, cv::COLOR_BGR2RGB);
		m_image = QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
	}
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), QColor(24, 24, 24));
	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	painter.drawImage(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
}

MainWindow::MainWindow(const TunerSettings& initial, QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Precision Tuner");
	buildLayout(initial);
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	m_matrixView->setMat(image);
	m_statusLabel->setText(QString("%1 x %2 px").arg(image.cols).arg(image.rows));
}

void MainWindow::setSettingsChangedCallback(std::function<void(const TunerSettings&)> callback) {
	m_settingsChangedCallback = std::move(callback);
}

TunerSettings MainWindow::settings() const {
	TunerSettings current{};
	current.step            = static_cast<PipelineStep>(m_stepCombo->currentData().toInt());
	current.stepPx          = m_stepPxSpin->value();
	current.useAxesFallback = m_axesCheck->isChecked();
	current.useEccFallback  = m_eccCheck->isChecked();
	return current;
}

void MainWindow::notifySettingsChanged() {
	if (m_settingsChangedCallback) {
		m_settingsChangedCallback(settings());
	}
}

void MainWindow::buildLayout(const TunerSettings& initial) {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* controlRow = new QHBoxLayout();

	m_stepCombo = new QComboBox(rootWidget);
	m_stepCombo->addItem("Extraction", static_cast<int>(PipelineStep::Extraction));
	m_stepCombo->addItem("Registration", static_cast<int>(PipelineStep::Registration));
	m_stepCombo->addItem("Distance", static_cast<int>(PipelineStep::Distance));
	m_stepCombo->addItem("All", static_cast<int>(PipelineStep::All));
	m_stepCombo->setCurrentIndex(m_stepCombo->findData(static_cast<int>(initial.step)));

	m_stepPxSpin = new QDoubleSpinBox(rootWidget);
	m_stepPxSpin->setRange(0.1, 50.0);
	m_stepPxSpin->setSingleStep(0.5);
	m_stepPxSpin->setDecimals(2);
	m_stepPxSpin->setValue(initial.stepPx);

	m_axesCheck = new QCheckBox("Axes fallback", rootWidget);
	m_axesCheck->setChecked(initial.useAxesFallback);
	m_eccCheck = new QCheckBox("ECC fallback", rootWidget);
	m_eccCheck->setChecked(initial.useEccFallback);

	m_statusLabel = new QLabel(rootWidget);

	// The measurement is cheap enough to re-run on every change.
	connect(m_stepCombo, &QComboBox::currentIndexChanged, this, [this](int) { notifySettingsChanged(); });
	connect(m_stepPxSpin, &QDoubleSpinBox::editingFinished, this, [this]() { notifySettingsChanged(); });
	connect(m_axesCheck, &QCheckBox::toggled, this, [this](bool) { notifySettingsChanged(); });
	connect(m_eccCheck, &QCheckBox::toggled, this, [this](bool) { notifySettingsChanged(); });

	controlRow->addWidget(new QLabel("Step:", rootWidget));
	controlRow->addWidget(m_stepCombo);
	controlRow->addWidget(new QLabel("Sampling step [px]:", rootWidget));
	controlRow->addWidget(m_stepPxSpin);
	controlRow->addWidget(m_axesCheck);
	controlRow->addWidget(m_eccCheck);
	controlRow->addStretch(1);
	controlRow->addWidget(m_statusLabel);

	m_matrixView = new CvMatrixView(rootWidget);

	rootLayout->addLayout(controlRow);
	rootLayout->addWidget(m_matrixView, 1);

	setCentralWidget(rootWidget);
}

} // namespace cutprec
