#include "analyser.hpp"
#include "mainWindow.hpp"

#include "planting/io.hpp"

#include <QApplication>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <iostream>
#include <string>

// Interactive inspection of one location. Usage:
//   plantingTuner <image> <vectors.json> <lat> <lon> [--config file.yml]
// "Reload Config" re-reads the configuration file and re-runs the analysis.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	if (argc < 5) {
		std::cerr << "Usage: " << argv[0] << " <image> <vectors.json> <lat> <lon> [--config file]\n";
		return 1;
	}

	std::filesystem::path configPath;
	for (int i = 5; i + 1 < argc; ++i) {
		if (std::string(argv[i]) == "--config") {
			configPath = argv[++i];
		}
	}

	const auto loadConfiguration = [&configPath]() {
		canopy::planting::core::PlantingConfig config{};
		if (!configPath.empty() && !canopy::planting::core::loadConfig(configPath, config)) {
			std::cerr << "[tuner] Using default configuration.\n";
			config = canopy::planting::core::PlantingConfig{};
		}
		return config;
	};

	canopy::planting::LocationInput input{};
	input.name = std::filesystem::path(argv[1]).stem().string();
	try {
		input.center = {std::stod(argv[3]), std::stod(argv[4])};
	} catch (const std::exception&) {
		std::cerr << "[tuner] Invalid coordinates: " << argv[3] << ", " << argv[4] << '\n';
		return 1;
	}
	input.image = cv::imread(argv[1], cv::IMREAD_COLOR);
	if (input.image.empty()) {
		std::cerr << "[tuner] Failed to load image: " << argv[1] << '\n';
		return 1;
	}
	if (!canopy::planting::loadVectors(argv[2], input.vectors)) {
		return 1;
	}

	canopy::planting::Analyser analyser(std::move(input), loadConfiguration());

	canopy::MainWindow window;
	window.resize(1400, 900);
	window.setStepChangedCallback([&window, &analyser](canopy::PlantingStep step) { window.setImage(analyser.analyse(step)); });
	window.setReloadCallback([&window, &analyser, &loadConfiguration]() {
		analyser.rerun(loadConfiguration());
		window.setSummary(analyser.summary());
		window.setImage(analyser.analyse(window.selectedStep()));
	});

	window.setSummary(analyser.summary());
	window.setImage(analyser.analyse(window.selectedStep()));
	window.show();

	return application.exec();
}
