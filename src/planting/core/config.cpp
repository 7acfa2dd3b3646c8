#include "planting/core/config.hpp"

#include <cmath>
#include <iostream>
#include <set>

#include <opencv2/core/persistence.hpp>

namespace canopy::planting::core {

namespace {

static bool fail(std::string* reason, std::string message) {
	if (reason != nullptr) {
		*reason = std::move(message);
	}
	return false;
}

static bool isValidBandScore(const BandScoreConfig& score, const std::string& name, std::string* reason) {
	if (!std::isfinite(score.maxPoints) || score.maxPoints < 0.0f) {
		return fail(reason, name + ": maxPoints must be non-negative");
	}
	if (!std::isfinite(score.otherwise) || score.otherwise < 0.0f || score.otherwise > score.maxPoints) {
		return fail(reason, name + ": 'otherwise' points exceed the component budget");
	}
	for (std::size_t i = 0u; i < score.bands.size(); ++i) {
		const ScoreBand& band = score.bands[i];
		if (!std::isfinite(band.upper) || band.upper < 0.0) {
			return fail(reason, name + ": band bounds must be finite and non-negative");
		}
		if (i > 0u && band.upper <= score.bands[i - 1].upper) {
			return fail(reason, name + ": band bounds must be strictly ascending");
		}
		if (!std::isfinite(band.points) || band.points < 0.0f || band.points > score.maxPoints) {
			return fail(reason, name + ": band points exceed the component budget");
		}
	}
	return true;
}

// FileNode helpers. Only present keys override the current value.
template <typename T>
static void readValue(const cv::FileNode& node, const char* key, T& value) {
	const cv::FileNode child = node[key];
	if (!child.empty()) {
		child >> value;
	}
}

static void readBool(const cv::FileNode& node, const char* key, bool& value) {
	const cv::FileNode child = node[key];
	if (!child.empty()) {
		value = static_cast<int>(child) != 0;
	}
}

static void readTags(const cv::FileNode& node, const char* key, std::vector<std::string>& tags) {
	const cv::FileNode child = node[key];
	if (child.empty() || !child.isSeq()) {
		return;
	}
	tags.clear();
	for (const cv::FileNode item: child) {
		tags.push_back(static_cast<std::string>(item));
	}
}

static void readBandScore(const cv::FileNode& node, const char* key, BandScoreConfig& score) {
	const cv::FileNode child = node[key];
	if (child.empty()) {
		return;
	}
	readValue(child, "otherwise", score.otherwise);
	readValue(child, "maxPoints", score.maxPoints);

	const cv::FileNode bands = child["bands"];
	if (bands.empty() || !bands.isSeq()) {
		return;
	}
	score.bands.clear();
	for (const cv::FileNode item: bands) {
		ScoreBand band{};
		readValue(item, "upper", band.upper);
		readValue(item, "points", band.points);
		score.bands.push_back(band);
	}
}

static void writeTags(cv::FileStorage& fs, const char* key, const std::vector<std::string>& tags) {
	fs << key << "[";
	for (const std::string& tag: tags) {
		fs << tag;
	}
	fs << "]";
}

static void writeBandScore(cv::FileStorage& fs, const char* key, const BandScoreConfig& score) {
	fs << key << "{";
	fs << "bands" << "[";
	for (const ScoreBand& band: score.bands) {
		fs << "{" << "upper" << band.upper << "points" << band.points << "}";
	}
	fs << "]";
	fs << "otherwise" << score.otherwise << "maxPoints" << score.maxPoints;
	fs << "}";
}

} // namespace

std::optional<StreetTier> streetTierFromString(const std::string& name) {
	if (name == "pedestrian")
		return StreetTier::Pedestrian;
	if (name == "low")
		return StreetTier::Low;
	if (name == "medium")
		return StreetTier::Medium;
	if (name == "high")
		return StreetTier::High;
	return std::nullopt;
}

bool validateConfig(const PlantingConfig& config, std::string* reason) {
	const AlignmentConfig& alignment = config.alignment;
	if (!std::isfinite(alignment.scale) || alignment.scale <= 0.0) {
		return fail(reason, "alignment: scale must be positive");
	}
	if (!std::isfinite(alignment.northOffsetM) || !std::isfinite(alignment.eastOffsetM)) {
		return fail(reason, "alignment: offsets must be finite");
	}
	if (alignment.utmZone < 0 || alignment.utmZone > 60) {
		return fail(reason, "alignment: utmZone must be 0 (automatic) or 1..60");
	}

	if (config.grid.zoom < 0 || config.grid.zoom > 23 || config.grid.scale < 1) {
		return fail(reason, "grid: zoom must be in [0,23] and scale >= 1");
	}

	// A tag may only belong to one tier.
	std::set<std::string> seenTags;
	for (const auto* tags: {&config.streets.pedestrian, &config.streets.low, &config.streets.medium, &config.streets.high}) {
		for (const std::string& tag: *tags) {
			if (!seenTags.insert(tag).second) {
				return fail(reason, "streets: tag '" + tag + "' is assigned to more than one tier");
			}
		}
	}

	const VegetationConfig& vegetation = config.vegetation;
	if (!std::isfinite(vegetation.ndviThreshold) || !std::isfinite(vegetation.minBrightness) || !std::isfinite(vegetation.ndviEpsilon)) {
		return fail(reason, "vegetation: thresholds must be finite");
	}
	if (vegetation.ndviEpsilon <= 0.0) {
		return fail(reason, "vegetation: ndviEpsilon must be positive");
	}

	const ShadowConfig& shadow = config.shadow;
	if (!std::isfinite(shadow.brightnessThreshold) || !std::isfinite(shadow.desaturationThreshold) || !std::isfinite(shadow.veryDarkThreshold) ||
	    !std::isfinite(shadow.intensitySigma)) {
		return fail(reason, "shadow: thresholds must be finite");
	}
	if (shadow.closeKernelSize < 1 || shadow.minComponentPixels < 0 || shadow.intensitySigma < 0.0) {
		return fail(reason, "shadow: kernel size must be >= 1, min size and sigma non-negative");
	}

	const BufferConfig& buffers = config.buffers;
	for (const double radius: {buffers.pedestrianM, buffers.lowM, buffers.mediumM, buffers.highM, buffers.sidewalkM}) {
		if (!std::isfinite(radius) || radius < 0.0) {
			return fail(reason, "buffers: radii must be finite and not negative");
		}
	}
	if (buffers.circleSegments < 8) {
		return fail(reason, "buffers: circleSegments must be >= 8");
	}

	const ScoringConfig& scoring = config.scoring;
	if (!isValidBandScore(scoring.sidewalk, "scoring.sidewalk", reason) || !isValidBandScore(scoring.building, "scoring.building", reason) ||
	    !isValidBandScore(scoring.sun, "scoring.sun", reason)) {
		return false;
	}
	if (!std::isfinite(scoring.amenity.radiusM) || !std::isfinite(scoring.amenity.maxPoints) || scoring.amenity.radiusM <= 0.0 ||
	    scoring.amenity.maxPoints < 0.0f) {
		return fail(reason, "scoring.amenity: radius must be positive and maxPoints non-negative");
	}
	if (scoring.gapMaxPoints < 0.0f) {
		return fail(reason, "scoring: gapMaxPoints must be non-negative");
	}
	const float budget = scoring.sidewalk.maxPoints + scoring.building.maxPoints + scoring.sun.maxPoints + scoring.amenity.maxPoints + scoring.gapMaxPoints;
	if (std::abs(budget - scoring.totalPoints) > 1e-3f) {
		return fail(reason, "scoring: component budgets sum to " + std::to_string(budget) + " instead of " + std::to_string(scoring.totalPoints));
	}

	const ClassificationConfig& classes = config.classification;
	if (!(classes.mediumMin >= 0.0f && classes.mediumMin < classes.highMin && classes.highMin < classes.criticalMin &&
	      classes.criticalMin <= scoring.totalPoints)) {
		return fail(reason, "classification: thresholds must satisfy 0 <= medium < high < critical <= total");
	}

	if (config.spots.minClusterPixels < 1) {
		return fail(reason, "spots: minClusterPixels must be >= 1");
	}

	return true;
}

bool readConfig(const cv::FileNode& node, PlantingConfig& config) {
	if (node.empty()) {
		return true;
	}
	bool valid = true;

	const cv::FileNode alignment = node["alignment"];
	readValue(alignment, "scale", config.alignment.scale);
	readValue(alignment, "northOffsetM", config.alignment.northOffsetM);
	readValue(alignment, "eastOffsetM", config.alignment.eastOffsetM);
	readValue(alignment, "utmZone", config.alignment.utmZone);
	readValue(alignment, "regionName", config.alignment.regionName);

	const cv::FileNode streets = node["streets"];
	readTags(streets, "pedestrian", config.streets.pedestrian);
	readTags(streets, "low", config.streets.low);
	readTags(streets, "medium", config.streets.medium);
	readTags(streets, "high", config.streets.high);
	if (!streets["defaultTier"].empty()) {
		// "none" disables the default tier. Anything else must name a tier.
		const std::string name = static_cast<std::string>(streets["defaultTier"]);
		if (name == "none") {
			config.streets.defaultTier = std::nullopt;
		} else if (const std::optional<StreetTier> tier = streetTierFromString(name)) {
			config.streets.defaultTier = tier;
		} else {
			std::cerr << "[config] Invalid streets.defaultTier '" << name << "'. Expected none, pedestrian, low, medium or high.\n";
			valid = false;
		}
	}

	const cv::FileNode grid = node["grid"];
	readValue(grid, "zoom", config.grid.zoom);
	readValue(grid, "scale", config.grid.scale);

	const cv::FileNode vegetation = node["vegetation"];
	readValue(vegetation, "ndviThreshold", config.vegetation.ndviThreshold);
	readValue(vegetation, "minBrightness", config.vegetation.minBrightness);
	readValue(vegetation, "ndviEpsilon", config.vegetation.ndviEpsilon);

	const cv::FileNode shadow = node["shadow"];
	readValue(shadow, "brightnessThreshold", config.shadow.brightnessThreshold);
	readValue(shadow, "desaturationThreshold", config.shadow.desaturationThreshold);
	readValue(shadow, "veryDarkThreshold", config.shadow.veryDarkThreshold);
	readBool(shadow, "useVeryDarkRule", config.shadow.useVeryDarkRule);
	readValue(shadow, "closeKernelSize", config.shadow.closeKernelSize);
	readValue(shadow, "minComponentPixels", config.shadow.minComponentPixels);
	readValue(shadow, "intensitySigma", config.shadow.intensitySigma);

	const cv::FileNode buffers = node["buffers"];
	readValue(buffers, "pedestrianM", config.buffers.pedestrianM);
	readValue(buffers, "lowM", config.buffers.lowM);
	readValue(buffers, "mediumM", config.buffers.mediumM);
	readValue(buffers, "highM", config.buffers.highM);
	readValue(buffers, "sidewalkM", config.buffers.sidewalkM);
	readValue(buffers, "circleSegments", config.buffers.circleSegments);

	const cv::FileNode scoring = node["scoring"];
	if (!scoring.empty()) {
		readBandScore(scoring, "sidewalk", config.scoring.sidewalk);
		readBandScore(scoring, "building", config.scoring.building);
		readBandScore(scoring, "sun", config.scoring.sun);
		const cv::FileNode amenity = scoring["amenity"];
		readValue(amenity, "radiusM", config.scoring.amenity.radiusM);
		readValue(amenity, "maxPoints", config.scoring.amenity.maxPoints);
		readValue(scoring, "gapMaxPoints", config.scoring.gapMaxPoints);
		readValue(scoring, "totalPoints", config.scoring.totalPoints);
	}

	const cv::FileNode classification = node["classification"];
	readValue(classification, "criticalMin", config.classification.criticalMin);
	readValue(classification, "highMin", config.classification.highMin);
	readValue(classification, "mediumMin", config.classification.mediumMin);

	readValue(node["spots"], "minClusterPixels", config.spots.minClusterPixels);
	return valid;
}

bool loadConfig(const std::filesystem::path& path, PlantingConfig& config) {
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::READ);
		if (!fs.isOpened()) {
			std::cerr << "[config] Could not open configuration file: " << path << '\n';
			return false;
		}
		if (!readConfig(fs.root(), config)) {
			std::cerr << "[config] Rejected configuration file: " << path << '\n';
			return false;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[config] Could not parse " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

void writeConfig(cv::FileStorage& fs, const PlantingConfig& config) {
	fs << "alignment" << "{";
	fs << "scale" << config.alignment.scale << "northOffsetM" << config.alignment.northOffsetM << "eastOffsetM" << config.alignment.eastOffsetM;
	fs << "utmZone" << config.alignment.utmZone << "regionName" << config.alignment.regionName;
	fs << "}";

	fs << "streets" << "{";
	writeTags(fs, "pedestrian", config.streets.pedestrian);
	writeTags(fs, "low", config.streets.low);
	writeTags(fs, "medium", config.streets.medium);
	writeTags(fs, "high", config.streets.high);
	fs << "defaultTier" << (config.streets.defaultTier ? std::string(toString(*config.streets.defaultTier)) : std::string("none"));
	fs << "}";

	fs << "grid" << "{" << "zoom" << config.grid.zoom << "scale" << config.grid.scale << "}";

	fs << "vegetation" << "{";
	fs << "ndviThreshold" << config.vegetation.ndviThreshold << "minBrightness" << config.vegetation.minBrightness;
	fs << "ndviEpsilon" << config.vegetation.ndviEpsilon;
	fs << "}";

	fs << "shadow" << "{";
	fs << "brightnessThreshold" << config.shadow.brightnessThreshold << "desaturationThreshold" << config.shadow.desaturationThreshold;
	fs << "veryDarkThreshold" << config.shadow.veryDarkThreshold << "useVeryDarkRule" << static_cast<int>(config.shadow.useVeryDarkRule);
	fs << "closeKernelSize" << config.shadow.closeKernelSize << "minComponentPixels" << config.shadow.minComponentPixels;
	fs << "intensitySigma" << config.shadow.intensitySigma;
	fs << "}";

	fs << "buffers" << "{";
	fs << "pedestrianM" << config.buffers.pedestrianM << "lowM" << config.buffers.lowM << "mediumM" << config.buffers.mediumM;
	fs << "highM" << config.buffers.highM << "sidewalkM" << config.buffers.sidewalkM << "circleSegments" << config.buffers.circleSegments;
	fs << "}";

	fs << "scoring" << "{";
	writeBandScore(fs, "sidewalk", config.scoring.sidewalk);
	writeBandScore(fs, "building", config.scoring.building);
	writeBandScore(fs, "sun", config.scoring.sun);
	fs << "amenity" << "{" << "radiusM" << config.scoring.amenity.radiusM << "maxPoints" << config.scoring.amenity.maxPoints << "}";
	fs << "gapMaxPoints" << config.scoring.gapMaxPoints << "totalPoints" << config.scoring.totalPoints;
	fs << "}";

	fs << "classification" << "{";
	fs << "criticalMin" << config.classification.criticalMin << "highMin" << config.classification.highMin << "mediumMin" << config.classification.mediumMin;
	fs << "}";

	fs << "spots" << "{" << "minClusterPixels" << config.spots.minClusterPixels << "}";
}

} // namespace canopy::planting::core
