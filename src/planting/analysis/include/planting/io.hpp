#pragma once

#include "planting/analysis.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cv {
class FileNode;
class FileStorage;
} // namespace cv

// JSON/YAML exchange through cv::FileStorage.
//
// Vector file:
//   { "buildings": [ { "exterior": [[lat, lon], ...], "holes": [[[lat, lon], ...]] } ],
//     "streets":   [ { "highway": "residential", "path": [[lat, lon], ...] } ],
//     "amenities": [ [lat, lon], ... ] }
// Locations file:
//   { "locations": [ { "name": ..., "description": ..., "lat": ..., "lon": ..., "image": "a.png", "vectors": "a.json" } ] }
//   Relative paths are resolved against the directory of the locations file.
namespace canopy::planting {

struct LocationSpec {
	std::string name;
	std::string description;
	core::GeoPoint center;
	std::filesystem::path image;
	std::filesystem::path vectors;
};

//! \returns False if a geometry is malformed (a point that is not a [lat, lon] pair).
bool readVectors(const cv::FileNode& node, core::VectorData& out);
bool loadVectors(const std::filesystem::path& path, core::VectorData& out);

//! \returns False if the file cannot be read or a location misses name, description, lat or lon.
bool loadLocations(const std::filesystem::path& path, std::vector<LocationSpec>& out);

//! Read the image and vector data of a location.
bool loadLocationInput(const LocationSpec& spec, LocationInput& out);

//! Write the summary of one location (location, metadata, land coverage, priority distribution, street network, amenities, spots).
void writeSummary(cv::FileStorage& fs, const LocationResult& result, const core::PlantingConfig& config);

bool saveSummary(const std::filesystem::path& path, const LocationResult& result, const core::PlantingConfig& config);

//! Summaries of all successful locations plus the failures.
bool saveBatchSummary(const std::filesystem::path& path, const std::vector<LocationResult>& results, const core::PlantingConfig& config);

} // namespace canopy::planting
