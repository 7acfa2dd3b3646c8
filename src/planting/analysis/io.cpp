#include "planting/io.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/core/persistence.hpp>
#include <opencv2/imgcodecs.hpp>

namespace canopy::planting {

namespace {

static double round1(double v) {
	return std::round(v * 10.0) / 10.0;
}

static bool readPoint(const cv::FileNode& node, core::GeoPoint& out) {
	if (!node.isSeq() || node.size() != 2u) {
		return false;
	}
	for (int i = 0; i < 2; ++i) {
		if (!node[i].isReal() && !node[i].isInt()) {
			return false;
		}
	}
	out.lat = static_cast<double>(node[0]);
	out.lon = static_cast<double>(node[1]);
	return true;
}

static bool readPoints(const cv::FileNode& node, std::vector<core::GeoPoint>& out) {
	out.clear();
	if (node.empty()) {
		return true;
	}
	if (!node.isSeq()) {
		return false;
	}
	for (const cv::FileNode item: node) {
		core::GeoPoint p{};
		if (!readPoint(item, p)) {
			return false;
		}
		out.push_back(p);
	}
	return true;
}

static void writeShare(cv::FileStorage& fs, const char* key, const core::AreaShare& share, const char* percentageKey) {
	fs << key << "{";
	fs << "area_m2" << round1(share.areaM2) << percentageKey << round1(share.percentage) << "pixels" << share.pixels;
	fs << "}";
}

} // namespace

bool readVectors(const cv::FileNode& node, core::VectorData& out) {
	out = core::VectorData{};

	const cv::FileNode buildings = node["buildings"];
	if (buildings.isSeq()) {
		for (const cv::FileNode item: buildings) {
			core::Polygon polygon{};
			if (!readPoints(item["exterior"], polygon.exterior)) {
				std::cerr << "[io] Malformed building exterior\n";
				return false;
			}
			const cv::FileNode holes = item["holes"];
			if (holes.isSeq()) {
				for (const cv::FileNode hole: holes) {
					std::vector<core::GeoPoint> ring;
					if (!readPoints(hole, ring)) {
						std::cerr << "[io] Malformed building hole\n";
						return false;
					}
					polygon.holes.push_back(std::move(ring));
				}
			}
			out.buildings.push_back(std::move(polygon));
		}
	}

	const cv::FileNode streets = node["streets"];
	if (streets.isSeq()) {
		for (const cv::FileNode item: streets) {
			core::Street street{};
			if (!readPoints(item["path"], street.path)) {
				std::cerr << "[io] Malformed street path\n";
				return false;
			}
			if (!item["highway"].empty()) {
				street.highway = static_cast<std::string>(item["highway"]);
			}
			out.streets.push_back(std::move(street));
		}
	}

	if (!readPoints(node["amenities"], out.amenities)) {
		std::cerr << "[io] Malformed amenity list\n";
		return false;
	}
	return true;
}

bool loadVectors(const std::filesystem::path& path, core::VectorData& out) {
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::READ);
		if (!fs.isOpened()) {
			std::cerr << "[io] Could not open vector file: " << path << '\n';
			return false;
		}
		return readVectors(fs.root(), out);
	} catch (const cv::Exception& e) {
		std::cerr << "[io] Could not parse " << path << ": " << e.what() << '\n';
		return false;
	}
}

bool loadLocations(const std::filesystem::path& path, std::vector<LocationSpec>& out) {
	out.clear();
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::READ);
		if (!fs.isOpened()) {
			std::cerr << "[io] Could not open locations file: " << path << '\n';
			return false;
		}

		const cv::FileNode locations = fs["locations"];
		if (locations.empty() || !locations.isSeq()) {
			std::cerr << "[io] " << path << " must contain a 'locations' array\n";
			return false;
		}

		const std::filesystem::path base = path.parent_path();
		for (const cv::FileNode item: locations) {
			for (const char* key: {"name", "description", "lat", "lon"}) {
				if (item[key].empty()) {
					std::cerr << "[io] Location missing required field '" << key << "'\n";
					return false;
				}
			}

			LocationSpec spec{};
			spec.name        = static_cast<std::string>(item["name"]);
			spec.description = static_cast<std::string>(item["description"]);
			spec.center      = {static_cast<double>(item["lat"]), static_cast<double>(item["lon"])};
			spec.image       = base / static_cast<std::string>(item["image"]);
			spec.vectors     = base / static_cast<std::string>(item["vectors"]);
			out.push_back(std::move(spec));
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[io] Could not parse " << path << ": " << e.what() << '\n';
		return false;
	}

	std::cout << "[io] Loaded " << out.size() << " location(s) from " << path << '\n';
	return true;
}

bool loadLocationInput(const LocationSpec& spec, LocationInput& out) {
	out             = LocationInput{};
	out.name        = spec.name;
	out.description = spec.description;
	out.center      = spec.center;

	out.image = cv::imread(spec.image.string(), cv::IMREAD_COLOR);
	if (out.image.empty()) {
		std::cerr << "[io] Could not read image " << spec.image << " of location " << spec.name << '\n';
		return false;
	}
	return loadVectors(spec.vectors, out.vectors);
}

void writeSummary(cv::FileStorage& fs, const LocationResult& result, const core::PlantingConfig& config) {
	fs << "location" << "{";
	fs << "name" << result.name << "description" << result.description;
	fs << "center_coordinates" << "{" << "latitude" << result.center.lat << "longitude" << result.center.lon << "}";
	fs << "}";

	fs << "analysis_metadata" << "{";
	fs << "total_area_m2" << round1(result.coverage.totalAreaM2) << "meters_per_pixel" << result.grid.metersPerPixel();
	fs << "image_dimensions" << "{" << "width_px" << result.grid.width() << "height_px" << result.grid.height() << "}";
	fs << "region" << config.alignment.regionName;
	fs << "alignment" << "{" << "scale" << config.alignment.scale << "north_offset_m" << config.alignment.northOffsetM << "east_offset_m"
	   << config.alignment.eastOffsetM << "}";
	fs << "invalid_building_polygons" << static_cast<int>(result.masks.invalidPolygons);
	fs << "}";

	fs << "land_coverage" << "{";
	writeShare(fs, "buildings", result.coverage.buildings, "percentage");
	writeShare(fs, "existing_vegetation", result.coverage.vegetation, "percentage");
	writeShare(fs, "shadows", result.coverage.shadows, "percentage");
	writeShare(fs, "streets", result.coverage.streets, "percentage");
	writeShare(fs, "plantable_area", result.coverage.plantable, "percentage");
	fs << "building_count" << static_cast<int>(result.alignment.aligned.buildings.size());
	fs << "}";

	const core::ClassificationConfig& classes = config.classification;
	fs << "priority_distribution" << "{";
	const struct {
		const char* key;
		core::PriorityLevel level;
		float low;
		float high;
	} rows[] = {
	        {"critical", core::PriorityLevel::Critical, classes.criticalMin, config.scoring.totalPoints},
	        {"high", core::PriorityLevel::High, classes.highMin, classes.criticalMin},
	        {"medium", core::PriorityLevel::Medium, classes.mediumMin, classes.highMin},
	        {"low", core::PriorityLevel::Low, 0.0f, classes.mediumMin},
	};
	for (const auto& row: rows) {
		const core::AreaShare& share = result.distribution[row.level];
		fs << row.key << "{";
		fs << "score_range" << (std::to_string(static_cast<int>(row.low)) + "-" + std::to_string(static_cast<int>(row.high)));
		fs << "area_m2" << round1(share.areaM2) << "percentage_of_plantable" << round1(share.percentage) << "pixels" << share.pixels;
		if (row.level == core::PriorityLevel::Critical) {
			fs << "spots_count" << result.distribution.criticalSpots;
		}
		fs << "}";
	}
	fs << "}";

	const core::TierCounts& tiers = result.alignment.tiers;
	fs << "street_network" << "{";
	fs << "total_streets" << static_cast<int>(result.alignment.aligned.streets.size());
	fs << "pedestrian_streets" << static_cast<int>(tiers[core::StreetTier::Pedestrian]);
	fs << "low_traffic_streets" << static_cast<int>(tiers[core::StreetTier::Low]);
	fs << "medium_traffic_streets" << static_cast<int>(tiers[core::StreetTier::Medium]);
	fs << "high_traffic_streets" << static_cast<int>(tiers[core::StreetTier::High]);
	fs << "unknown_tags" << static_cast<int>(tiers.unmatched);
	fs << "}";

	fs << "amenities" << "{" << "total_count" << static_cast<int>(result.alignment.aligned.amenities.size()) << "}";

	fs << "critical_priority_spots" << "[";
	for (const core::CriticalSpot& spot: result.spots) {
		fs << "{";
		fs << "spot_id" << spot.id;
		fs << "coordinates" << "{" << "latitude" << spot.centroid.lat << "longitude" << spot.centroid.lon << "}";
		fs << "priority_score" << round1(spot.meanScore) << "area_m2" << round1(spot.areaM2) << "area_pixels" << spot.pixelCount;
		fs << "google_street_view_url" << core::streetViewUrl(spot.centroid) << "google_maps_url" << core::mapsUrl(spot.centroid);
		fs << "}";
	}
	fs << "]";
}

bool saveSummary(const std::filesystem::path& path, const LocationResult& result, const core::PlantingConfig& config) {
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
		if (!fs.isOpened()) {
			std::cerr << "[io] Could not write summary " << path << '\n';
			return false;
		}
		writeSummary(fs, result, config);
	} catch (const cv::Exception& e) {
		std::cerr << "[io] Could not write summary " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

bool saveBatchSummary(const std::filesystem::path& path, const std::vector<LocationResult>& results, const core::PlantingConfig& config) {
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
		if (!fs.isOpened()) {
			std::cerr << "[io] Could not write summary " << path << '\n';
			return false;
		}

		fs << "locations" << "[";
		for (const LocationResult& result: results) {
			if (result.success) {
				fs << "{";
				writeSummary(fs, result, config);
				fs << "}";
			}
		}
		fs << "]";

		fs << "failures" << "[";
		for (const LocationResult& result: results) {
			if (!result.success) {
				fs << "{" << "name" << result.name << "error" << result.error << "}";
			}
		}
		fs << "]";
	} catch (const cv::Exception& e) {
		std::cerr << "[io] Could not write summary " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

} // namespace canopy::planting
