#include "planting/analysis.hpp"
#include "planting/io.hpp"

#include <opencv2/core/persistence.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Options {
	bool batch{false};
	std::filesystem::path image{};
	std::filesystem::path vectors{};
	std::filesystem::path locations{};
	canopy::planting::core::GeoPoint center{};
	std::filesystem::path config{};
	std::filesystem::path out{"summary.json"};
	std::filesystem::path mosaic{};
	std::filesystem::path dumpConfig{};
	unsigned threads{0u};
};

static void printUsage(const char* program) {
	std::cerr << "Usage:\n"
	          << "  " << program << " <image> <vectors.json> <lat> <lon> [--config f] [--out summary.json] [--mosaic f.png]\n"
	          << "  " << program << " --batch <locations.json> [--threads N] [--config f] [--out summary.json]\n"
	          << "  " << program << " --dump-config <file.yml>\n";
}

static bool parseArguments(int argc, char** argv, Options& options) {
	std::vector<std::string> positional;
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		const bool hasValue   = i + 1 < argc;

		if (arg == "--batch" && hasValue) {
			options.batch     = true;
			options.locations = argv[++i];
		} else if (arg == "--threads" && hasValue) {
			options.threads = static_cast<unsigned>(std::stoul(argv[++i]));
		} else if (arg == "--config" && hasValue) {
			options.config = argv[++i];
		} else if (arg == "--out" && hasValue) {
			options.out = argv[++i];
		} else if (arg == "--mosaic" && hasValue) {
			options.mosaic = argv[++i];
		} else if (arg == "--dump-config" && hasValue) {
			options.dumpConfig = argv[++i];
		} else if (arg.starts_with("--")) {
			std::cerr << "Unknown or incomplete option: " << arg << '\n';
			return false;
		} else {
			positional.push_back(arg);
		}
	}

	if (!options.dumpConfig.empty() || options.batch) {
		return positional.empty();
	}
	if (positional.size() != 4u) {
		return false;
	}
	options.image   = positional[0];
	options.vectors = positional[1];
	options.center  = {std::stod(positional[2]), std::stod(positional[3])};
	return true;
}

static int dumpConfig(const std::filesystem::path& path, const canopy::planting::core::PlantingConfig& config) {
	cv::FileStorage fs(path.string(), cv::FileStorage::WRITE);
	if (!fs.isOpened()) {
		std::cerr << "Could not write " << path << '\n';
		return 1;
	}
	canopy::planting::core::writeConfig(fs, config);
	std::cout << "Configuration written to " << path << '\n';
	return 0;
}

static int runSingle(const Options& options, const canopy::planting::core::PlantingConfig& config) {
	using namespace canopy::planting;

	LocationInput input{};
	input.name   = options.image.stem().string();
	input.center = options.center;
	input.image  = cv::imread(options.image.string(), cv::IMREAD_COLOR);
	if (input.image.empty()) {
		std::cerr << "Failed to load image: " << options.image << '\n';
		return 1;
	}
	if (!loadVectors(options.vectors, input.vectors)) {
		return 1;
	}

	core::DebugVisualizer debugger;
	const LocationResult result = analyseLocation(input, config, options.mosaic.empty() ? nullptr : &debugger);
	if (!result.success) {
		return 1;
	}

	if (!options.mosaic.empty()) {
		const cv::Mat mosaic = debugger.buildMosaic();
		if (mosaic.empty() || !cv::imwrite(options.mosaic.string(), mosaic)) {
			std::cerr << "Could not write mosaic " << options.mosaic << '\n';
		}
	}

	if (!saveSummary(options.out, result, config)) {
		return 1;
	}
	std::cout << "Summary written to " << options.out << '\n';
	return 0;
}

static int runBatch(const Options& options, const canopy::planting::core::PlantingConfig& config) {
	using namespace canopy::planting;

	std::vector<LocationSpec> specs;
	if (!loadLocations(options.locations, specs)) {
		return 1;
	}

	// Locations whose inputs cannot be read are reported as failures without running.
	std::vector<LocationInput> inputs;
	std::vector<LocationResult> unreadable;
	for (const LocationSpec& spec: specs) {
		LocationInput input{};
		if (loadLocationInput(spec, input)) {
			inputs.push_back(std::move(input));
		} else {
			LocationResult failed{};
			failed.name  = spec.name;
			failed.error = "could not read inputs";
			unreadable.push_back(std::move(failed));
		}
	}

	BatchAnalysis batch(config, options.threads);
	batch.connect({[total = inputs.size()](std::size_t index, const LocationResult& result) {
		std::cout << "[" << index + 1 << "/" << total << "] " << result.name << (result.success ? " done" : " failed") << '\n';
	}});
	std::vector<LocationResult> results = batch.run(inputs);
	batch.disconnect();

	for (LocationResult& failed: unreadable) {
		results.push_back(std::move(failed));
	}

	if (!saveBatchSummary(options.out, results, config)) {
		return 1;
	}
	std::cout << "Summary written to " << options.out << '\n';

	const bool allSucceeded = std::all_of(results.begin(), results.end(), [](const LocationResult& r) { return r.success; });
	return allSucceeded ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
	Options options{};
	try {
		if (!parseArguments(argc, argv, options)) {
			printUsage(argv[0]);
			return 1;
		}
	} catch (const std::exception&) {
		std::cerr << "Invalid numeric argument.\n";
		printUsage(argv[0]);
		return 1;
	}

	canopy::planting::core::PlantingConfig config{};
	if (!options.config.empty() && !canopy::planting::core::loadConfig(options.config, config)) {
		return 1;
	}

	if (!options.dumpConfig.empty()) {
		return dumpConfig(options.dumpConfig, config);
	}

	std::string reason;
	if (!canopy::planting::core::validateConfig(config, &reason)) {
		std::cerr << "Invalid configuration: " << reason << '\n';
		return 1;
	}

	return options.batch ? runBatch(options, config) : runSingle(options, config);
}
