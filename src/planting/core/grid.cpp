#include "planting/core/grid.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace canopy::planting::core {

namespace {

//! Equatorial ground resolution of zoom level 0 (meters per pixel).
static constexpr double MERCATOR_RESOLUTION_Z0 = 156543.03392;
//! Approximate length of one degree of latitude.
static constexpr double METERS_PER_DEGREE = 111000.0;

static double toRadians(double degrees) {
	return degrees * std::numbers::pi / 180.0;
}

} // namespace

Grid::Grid(int width, int height, GeoBounds bounds, double metersPerPixel)
    : m_width{width}, m_height{height}, m_bounds{bounds}, m_metersPerPixel{metersPerPixel} {
}

Grid Grid::fromCenter(const GeoPoint center, const int width, const int height, const int zoom, const int scale) {
	const double cosLat         = std::cos(toRadians(center.lat));
	const double metersPerPixel = MERCATOR_RESOLUTION_Z0 * cosLat / std::pow(2.0, zoom);

	// The tile was requested as (width / scale) logical pixels at the given scale. Its ground extent is
	// that request times the scale, one Web-Mercator resolution per delivered pixel.
	const int safeScale      = std::max(scale, 1);
	const double extentW     = static_cast<double>((width / safeScale) * safeScale);
	const double extentH     = static_cast<double>((height / safeScale) * safeScale);
	const double halfWidthM  = 0.5 * extentW * metersPerPixel;
	const double halfHeightM = 0.5 * extentH * metersPerPixel;

	const GeoPoint half = metersToDegrees(halfHeightM, halfWidthM, center.lat);

	const GeoBounds bounds{center.lat - half.lat, center.lat + half.lat, center.lon - half.lon, center.lon + half.lon};
	return {width, height, bounds, metersPerPixel};
}

GeoPoint Grid::center() const {
	return {0.5 * (m_bounds.minLat + m_bounds.maxLat), 0.5 * (m_bounds.minLon + m_bounds.maxLon)};
}

GeoPoint Grid::pixelToGeo(const cv::Point2d pixel) const {
	const double xNorm = pixel.x / static_cast<double>(m_width);
	const double yNorm = pixel.y / static_cast<double>(m_height);

	GeoPoint geo{};
	geo.lon = m_bounds.minLon + xNorm * (m_bounds.maxLon - m_bounds.minLon);
	geo.lat = m_bounds.maxLat - yNorm * (m_bounds.maxLat - m_bounds.minLat); // Rows grow downwards, latitude upwards.
	return geo;
}

cv::Point2d Grid::geoToPixel(const GeoPoint geo) const {
	const double xNorm = (geo.lon - m_bounds.minLon) / (m_bounds.maxLon - m_bounds.minLon);
	const double yNorm = (m_bounds.maxLat - geo.lat) / (m_bounds.maxLat - m_bounds.minLat);
	return {xNorm * static_cast<double>(m_width), yNorm * static_cast<double>(m_height)};
}

bool Grid::isValid() const {
	return m_width > 0 && m_height > 0 && m_metersPerPixel > 0.0 && std::isfinite(m_metersPerPixel) && m_bounds.maxLat > m_bounds.minLat &&
	       m_bounds.maxLon > m_bounds.minLon;
}

GeoPoint metersToDegrees(const double metersNorth, const double metersEast, const double atLatitude) {
	const double cosLat = std::cos(toRadians(atLatitude));
	return {metersNorth / METERS_PER_DEGREE, metersEast / (METERS_PER_DEGREE * cosLat)};
}

} // namespace canopy::planting::core
