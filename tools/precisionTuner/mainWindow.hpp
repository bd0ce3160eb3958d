#pragma once

#include "pipelineStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;

namespace cutprec {

//! Paints a debug mosaic scaled to the widget size.
class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	explicit MainWindow(const TunerSettings& initial, QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setSettingsChangedCallback(std::function<void(const TunerSettings&)> callback);
	TunerSettings settings() const;

private:
	void buildLayout(const TunerSettings& initial);
	void notifySettingsChanged();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_stepCombo{nullptr};
	QDoubleSpinBox* m_stepPxSpin{nullptr};
	QCheckBox* m_axesCheck{nullptr};
	QCheckBox* m_eccCheck{nullptr};
	QLabel* m_statusLabel{nullptr};
	std::function<void(const TunerSettings&)> m_settingsChangedCallback{};
};

} // namespace cutprec
