#pragma once

#include "planting/core/grid.hpp"

#include <string>
#include <vector>

namespace canopy::planting::core {

//! Traffic classification of a street. Determines its buffer radius.
enum class StreetTier { Pedestrian, Low, Medium, High };

//! Building footprint. Rings are open or closed, both are accepted.
struct Polygon {
	std::vector<GeoPoint> exterior;
	std::vector<std::vector<GeoPoint>> holes{};
};

//! Street centre line with its raw OSM classification.
struct Street {
	std::vector<GeoPoint> path;
	std::string highway;              //!< Raw `highway` tag. Multi-valued tags are separated by ';'.
	StreetTier tier{StreetTier::Low}; //!< Assigned by classifyStreets().
};

//! Vector layers of one location as delivered by the data acquisition. Any layer may be empty.
struct VectorData {
	std::vector<Polygon> buildings;
	std::vector<Street> streets;
	std::vector<GeoPoint> amenities;
};

const char* toString(StreetTier tier);

} // namespace canopy::planting::core
