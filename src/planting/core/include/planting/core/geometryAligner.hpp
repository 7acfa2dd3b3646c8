#pragma once

#include "planting/core/config.hpp"
#include "planting/core/projection.hpp"
#include "planting/core/vectorData.hpp"

#include <array>
#include <string>

// Alignment is the first step of the analysis.
// Motivation: OSM vector data is systematically misregistered against the satellite imagery of a region (scale and offset).
// A single regional correction, applied identically to all layers, removes most of the error without per-location calibration.
//   1) Project the location centre into the metric CRS.
//   2) Scale every vertex around the centre, then translate by the north/east offset.
//   3) Project back to geographic coordinates.
// Street classification assigns each street a traffic tier that controls its buffer in the mask stage.
namespace canopy::planting::core {

//! Number of streets per tier after classification, indexed by StreetTier.
struct TierCounts {
	std::array<std::size_t, 4> streets{};
	std::size_t unmatched{0u}; //!< Streets whose tag matched no tier set and received the default tier.

	std::size_t operator[](StreetTier tier) const {
		return streets[static_cast<std::size_t>(tier)];
	}
};

struct AlignResult {
	bool success;       //!< False if an unmatched street tag met a configuration without default tier.
	VectorData aligned; //!< Aligned layers. Streets carry their tier.
	TierCounts tiers;
};

//! Apply the regional correction to a single point.
GeoPoint alignPoint(GeoPoint point, const LocalProjection& projection, cv::Point2d centerMetric, const AlignmentConfig& config);

//! Apply the regional correction to all layers around the location centre. Empty layers stay empty.
VectorData alignVectors(const VectorData& raw, GeoPoint center, const AlignmentConfig& config);

//! Tier of a raw highway tag. Multi-valued tags ("a;b") use the first value.
//! \returns Empty if the tag is in no tier set.
std::optional<StreetTier> matchStreetTier(const std::string& highway, const StreetClassConfig& config);

//! Assign a tier to every street. Unmatched tags receive the default tier and are reported.
//! \returns False if an unmatched tag is found and no default tier is configured.
bool classifyStreets(std::vector<Street>& streets, const StreetClassConfig& config, TierCounts& outCounts);

//! Align and classify. Entry point of the alignment stage.
AlignResult alignLocation(const VectorData& raw, GeoPoint center, const PlantingConfig& config);

//! Buffer radius of a tier in meters.
double bufferRadius(StreetTier tier, const BufferConfig& config);

} // namespace canopy::planting::core
