#pragma once

#include "planting/core/vectorData.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cv {
class FileNode;
class FileStorage;
} // namespace cv

namespace canopy::planting::core {

//! Universal regional correction of the OSM vector data against the imagery. Defaults validated for Kuala Lumpur.
struct AlignmentConfig {
	double scale{1.95};        //!< Multiplicative scale around the location centre.
	double northOffsetM{-5.0}; //!< Translation north after scaling (meters).
	double eastOffsetM{-10.0}; //!< Translation east after scaling (meters).
	int utmZone{0};            //!< Metric CRS zone. 0 selects the zone of the location.
	std::string regionName{"kuala_lumpur"};
};

//! Fixed tag sets of the street tiers.
struct StreetClassConfig {
	std::vector<std::string> pedestrian{"footway", "pedestrian", "living_street", "path", "steps"};
	std::vector<std::string> low{"residential", "tertiary", "unclassified", "service"};
	std::vector<std::string> medium{"secondary", "secondary_link"};
	std::vector<std::string> high{"primary", "primary_link", "trunk", "trunk_link", "motorway", "motorway_link"};
	std::optional<StreetTier> defaultTier{StreetTier::Low}; //!< Tier of unmatched tags. Empty -> unmatched tags are a configuration error.
};

//! Satellite tile geometry used to derive the Grid.
struct GridConfig {
	int zoom{18};
	int scale{2};
};

struct VegetationConfig {
	double ndviThreshold{0.2};
	double minBrightness{60.0}; //!< HSV value (0-255). Dark green pixels are not vegetation.
	double ndviEpsilon{1e-8};
};

struct ShadowConfig {
	double brightnessThreshold{95.0};   //!< V below -> dark.
	double desaturationThreshold{60.0}; //!< S below -> desaturated.
	double veryDarkThreshold{70.0};     //!< V below -> shadow regardless of saturation.
	bool useVeryDarkRule{true};
	int closeKernelSize{3};
	int minComponentPixels{20};
	double intensitySigma{2.0}; //!< Gaussian sigma of the continuous shadow intensity.
};

//! Metric buffer radii per street tier.
struct BufferConfig {
	double pedestrianM{5.0};
	double lowM{10.0};
	double mediumM{15.0};
	double highM{25.0};
	double sidewalkM{5.0};
	int circleSegments{32}; //!< Polygon resolution of round joins and caps.
};

//! One step of a piecewise score. Applies to values below `upper`.
struct ScoreBand {
	double upper{0.0};
	float points{0.0f};
};

//! Monotone piecewise mapping of a distance or intensity field to points.
struct BandScoreConfig {
	std::vector<ScoreBand> bands; //!< Ascending by upper bound.
	float otherwise{0.0f};        //!< Points beyond the last band.
	float maxPoints{0.0f};        //!< Point budget of the component.
};

struct AmenityScoreConfig {
	double radiusM{50.0};
	float maxPoints{10.0f};
};

struct ScoringConfig {
	BandScoreConfig sidewalk{{{5.0, 35.0f}, {10.0, 25.0f}, {20.0, 15.0f}, {30.0, 5.0f}}, 0.0f, 35.0f};
	BandScoreConfig building{{{5.0, 0.0f}, {15.0, 25.0f}, {30.0, 15.0f}, {50.0, 5.0f}}, 0.0f, 25.0f};
	BandScoreConfig sun{{{0.3, 20.0f}, {0.6, 12.0f}}, 5.0f, 20.0f};
	AmenityScoreConfig amenity{};
	float gapMaxPoints{10.0f}; //!< Reserved gap filling budget. Contributes nothing yet.
	float totalPoints{100.0f};
};

struct ClassificationConfig {
	float criticalMin{80.0f};
	float highMin{60.0f};
	float mediumMin{40.0f};
};

struct SpotConfig {
	int minClusterPixels{20};
};

//! Every tunable constant of the analysis. Passed explicitly into each stage.
struct PlantingConfig {
	AlignmentConfig alignment{};
	StreetClassConfig streets{};
	GridConfig grid{};
	VegetationConfig vegetation{};
	ShadowConfig shadow{};
	BufferConfig buffers{};
	ScoringConfig scoring{};
	ClassificationConfig classification{};
	SpotConfig spots{};
};

/*! Check a configuration before any location is processed.
 * \param [in]  config Configuration to check.
 * \param [out] reason Set to a description of the first violation.
 * \return      True if the configuration can be used.
 */
bool validateConfig(const PlantingConfig& config, std::string* reason = nullptr);

/*! Override the values present in a FileStorage node (YAML/JSON). Missing keys keep their current value.
 * \returns False if a value cannot be interpreted (e.g. an unknown tier name). The remaining keys are still read.
 */
bool readConfig(const cv::FileNode& node, PlantingConfig& config);

//! Load a YAML/JSON configuration file on top of the defaults.
//! \returns False if the file cannot be opened or parsed.
bool loadConfig(const std::filesystem::path& path, PlantingConfig& config);

void writeConfig(cv::FileStorage& fs, const PlantingConfig& config);

std::optional<StreetTier> streetTierFromString(const std::string& name);

} // namespace canopy::planting::core
