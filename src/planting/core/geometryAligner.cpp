#include "planting/core/geometryAligner.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace canopy::planting::core {

namespace {

static bool alignDebugEnabled() {
	const char* env = std::getenv("CANOPY_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static std::vector<GeoPoint> alignRing(const std::vector<GeoPoint>& ring, const LocalProjection& projection, const cv::Point2d centerMetric,
                                       const AlignmentConfig& config) {
	std::vector<GeoPoint> out;
	out.reserve(ring.size());
	for (const GeoPoint& p: ring) {
		out.push_back(alignPoint(p, projection, centerMetric, config));
	}
	return out;
}

//! First value of a multi-valued tag, trimmed.
static std::string_view primaryTag(std::string_view tag) {
	const std::size_t separator = tag.find(';');
	if (separator != std::string_view::npos) {
		tag = tag.substr(0, separator);
	}
	while (!tag.empty() && tag.front() == ' ')
		tag.remove_prefix(1);
	while (!tag.empty() && tag.back() == ' ')
		tag.remove_suffix(1);
	return tag;
}

static bool contains(const std::vector<std::string>& tags, std::string_view tag) {
	return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace

const char* toString(const StreetTier tier) {
	switch (tier) {
	case StreetTier::Pedestrian:
		return "pedestrian";
	case StreetTier::Low:
		return "low";
	case StreetTier::Medium:
		return "medium";
	case StreetTier::High:
		return "high";
	}
	return "unknown";
}

GeoPoint alignPoint(const GeoPoint point, const LocalProjection& projection, const cv::Point2d centerMetric, const AlignmentConfig& config) {
	const cv::Point2d metric = projection.toMetric(point);
	const cv::Point2d scaled = centerMetric + (metric - centerMetric) * config.scale;
	const cv::Point2d moved{scaled.x + config.eastOffsetM, scaled.y + config.northOffsetM};
	return projection.toGeo(moved);
}

VectorData alignVectors(const VectorData& raw, const GeoPoint center, const AlignmentConfig& config) {
	const LocalProjection projection = LocalProjection::forLocation(center, config.utmZone);
	const cv::Point2d centerMetric   = projection.toMetric(center);

	VectorData aligned{};
	aligned.buildings.reserve(raw.buildings.size());
	for (const Polygon& building: raw.buildings) {
		Polygon out{};
		out.exterior = alignRing(building.exterior, projection, centerMetric, config);
		out.holes.reserve(building.holes.size());
		for (const auto& hole: building.holes) {
			out.holes.push_back(alignRing(hole, projection, centerMetric, config));
		}
		aligned.buildings.push_back(std::move(out));
	}

	aligned.streets.reserve(raw.streets.size());
	for (const Street& street: raw.streets) {
		aligned.streets.push_back({alignRing(street.path, projection, centerMetric, config), street.highway, street.tier});
	}

	aligned.amenities = alignRing(raw.amenities, projection, centerMetric, config);
	return aligned;
}

std::optional<StreetTier> matchStreetTier(const std::string& highway, const StreetClassConfig& config) {
	const std::string_view tag = primaryTag(highway);
	if (contains(config.pedestrian, tag))
		return StreetTier::Pedestrian;
	if (contains(config.low, tag))
		return StreetTier::Low;
	if (contains(config.medium, tag))
		return StreetTier::Medium;
	if (contains(config.high, tag))
		return StreetTier::High;
	return std::nullopt;
}

bool classifyStreets(std::vector<Street>& streets, const StreetClassConfig& config, TierCounts& outCounts) {
	outCounts = TierCounts{};

	for (Street& street: streets) {
		std::optional<StreetTier> tier = matchStreetTier(street.highway, config);
		if (!tier) {
			if (!config.defaultTier) {
				std::cerr << "[align] Street tag '" << street.highway << "' matches no tier and no default tier is configured.\n";
				return false;
			}
			tier = config.defaultTier;
			++outCounts.unmatched;
			if (alignDebugEnabled()) {
				std::cerr << "[align] Unknown street tag '" << street.highway << "' -> " << toString(*tier) << '\n';
			}
		}
		street.tier = *tier;
		++outCounts.streets[static_cast<std::size_t>(*tier)];
	}

	if (outCounts.unmatched > 0u) {
		std::cerr << "[align] Warning: " << outCounts.unmatched << " street(s) with unknown tag assigned the default tier "
		          << toString(*config.defaultTier) << ".\n";
	}
	return true;
}

AlignResult alignLocation(const VectorData& raw, const GeoPoint center, const PlantingConfig& config) {
	AlignResult result{true, alignVectors(raw, center, config.alignment), {}};
	result.success = classifyStreets(result.aligned.streets, config.streets, result.tiers);

	if (alignDebugEnabled()) {
		std::cout << "[align] scale=" << config.alignment.scale << " offset=(" << config.alignment.northOffsetM << "m N, " << config.alignment.eastOffsetM
		          << "m E) buildings=" << result.aligned.buildings.size() << " streets=" << result.aligned.streets.size()
		          << " amenities=" << result.aligned.amenities.size() << " pedestrian=" << result.tiers[StreetTier::Pedestrian]
		          << " low=" << result.tiers[StreetTier::Low] << " medium=" << result.tiers[StreetTier::Medium]
		          << " high=" << result.tiers[StreetTier::High] << '\n';
	}
	return result;
}

double bufferRadius(const StreetTier tier, const BufferConfig& config) {
	switch (tier) {
	case StreetTier::Pedestrian:
		return config.pedestrianM;
	case StreetTier::Low:
		return config.lowM;
	case StreetTier::Medium:
		return config.mediumM;
	case StreetTier::High:
		return config.highM;
	}
	return config.lowM;
}

} // namespace canopy::planting::core
