#include <filesystem>
#include <iostream>
#include <optional>

#include <QApplication>

#include "analyser.hpp"
#include "mainWindow.hpp"
#include "precision/pipeline/artifacts.hpp"
#include "precision/pipeline/configLoader.hpp"

// Usage: precision_tuner TEMPLATE TEST [CONFIG]
// Shows the debug mosaic of the selected measurement step. Changing a setting re-runs the measurement.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	if (argc < 3) {
		std::cerr << "Usage: precision_tuner TEMPLATE TEST [CONFIG]\n";
		return 1;
	}

	std::optional<cutprec::precision::Analyser> analyser;
	try {
		const std::optional<std::filesystem::path> configPath = argc > 3 ? std::optional<std::filesystem::path>(argv[3]) : std::nullopt;
		analyser.emplace(cutprec::precision::pipeline::readBgrImage(argv[1]), cutprec::precision::pipeline::readBgrImage(argv[2]),
		                 cutprec::precision::pipeline::loadAppConfig(configPath));
	} catch (const std::exception& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	}

	cutprec::MainWindow window(analyser->initialSettings());
	window.resize(1400, 900);
	window.setSettingsChangedCallback([&](const cutprec::TunerSettings& settings) { window.setImage(analyser->analyse(settings)); });
	window.setImage(analyser->analyse(window.settings()));
	window.show();

	return application.exec();
}
