#include "planting/core/projection.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace canopy::planting::core {

namespace {

// WGS84 ellipsoid and UTM constants.
static constexpr double SEMI_MAJOR       = 6378137.0;
static constexpr double FLATTENING       = 1.0 / 298.257223563;
static constexpr double SCALE_K0         = 0.9996;
static constexpr double FALSE_EASTING    = 500000.0;
static constexpr double FALSE_NORTHING_S = 10000000.0;

static constexpr double E2  = FLATTENING * (2.0 - FLATTENING); //!< First eccentricity squared.
static constexpr double E4  = E2 * E2;
static constexpr double E6  = E4 * E2;
static constexpr double EP2 = E2 / (1.0 - E2); //!< Second eccentricity squared.

static constexpr double DEG = std::numbers::pi / 180.0;

//! Meridian arc length from the equator to latitude phi.
static double meridianArc(double phi) {
	return SEMI_MAJOR * ((1.0 - E2 / 4.0 - 3.0 * E4 / 64.0 - 5.0 * E6 / 256.0) * phi - (3.0 * E2 / 8.0 + 3.0 * E4 / 32.0 + 45.0 * E6 / 1024.0) * std::sin(2.0 * phi) +
	                     (15.0 * E4 / 256.0 + 45.0 * E6 / 1024.0) * std::sin(4.0 * phi) - (35.0 * E6 / 3072.0) * std::sin(6.0 * phi));
}

} // namespace

LocalProjection LocalProjection::forLocation(const GeoPoint center, const int zoneOverride) {
	int zone = zoneOverride;
	if (zone <= 0) {
		zone = static_cast<int>(std::floor((center.lon + 180.0) / 6.0)) + 1;
		zone = std::clamp(zone, 1, 60);
	}
	return {zone, center.lat < 0.0};
}

LocalProjection::LocalProjection(const int zone, const bool southern) : m_zone{zone}, m_southern{southern} {
	m_centralMeridianRad = (static_cast<double>(zone - 1) * 6.0 - 180.0 + 3.0) * DEG;
}

cv::Point2d LocalProjection::toMetric(const GeoPoint geo) const {
	const double phi    = geo.lat * DEG;
	const double sinPhi = std::sin(phi);
	const double cosPhi = std::cos(phi);
	const double tanPhi = std::tan(phi);

	const double N = SEMI_MAJOR / std::sqrt(1.0 - E2 * sinPhi * sinPhi);
	const double T = tanPhi * tanPhi;
	const double C = EP2 * cosPhi * cosPhi;
	const double A = cosPhi * (geo.lon * DEG - m_centralMeridianRad);
	const double M = meridianArc(phi);

	const double A2 = A * A;
	const double A3 = A2 * A;
	const double A4 = A3 * A;
	const double A5 = A4 * A;
	const double A6 = A5 * A;

	const double easting =
	        SCALE_K0 * N * (A + (1.0 - T + C) * A3 / 6.0 + (5.0 - 18.0 * T + T * T + 72.0 * C - 58.0 * EP2) * A5 / 120.0) + FALSE_EASTING;
	double northing = SCALE_K0 * (M + N * tanPhi *
	                                          (A2 / 2.0 + (5.0 - T + 9.0 * C + 4.0 * C * C) * A4 / 24.0 +
	                                           (61.0 - 58.0 * T + T * T + 600.0 * C - 330.0 * EP2) * A6 / 720.0));
	if (m_southern) {
		northing += FALSE_NORTHING_S;
	}
	return {easting, northing};
}

GeoPoint LocalProjection::toGeo(const cv::Point2d metric) const {
	const double x = metric.x - FALSE_EASTING;
	const double y = m_southern ? metric.y - FALSE_NORTHING_S : metric.y;

	// Footpoint latitude.
	const double M  = y / SCALE_K0;
	const double mu = M / (SEMI_MAJOR * (1.0 - E2 / 4.0 - 3.0 * E4 / 64.0 - 5.0 * E6 / 256.0));

	const double sqrtOneMinusE2 = std::sqrt(1.0 - E2);
	const double e1             = (1.0 - sqrtOneMinusE2) / (1.0 + sqrtOneMinusE2);
	const double e1p2           = e1 * e1;
	const double e1p3           = e1p2 * e1;
	const double e1p4           = e1p3 * e1;

	const double phi1 = mu + (3.0 * e1 / 2.0 - 27.0 * e1p3 / 32.0) * std::sin(2.0 * mu) + (21.0 * e1p2 / 16.0 - 55.0 * e1p4 / 32.0) * std::sin(4.0 * mu) +
	                    (151.0 * e1p3 / 96.0) * std::sin(6.0 * mu) + (1097.0 * e1p4 / 512.0) * std::sin(8.0 * mu);

	const double sinPhi1 = std::sin(phi1);
	const double cosPhi1 = std::cos(phi1);
	const double tanPhi1 = std::tan(phi1);

	const double C1    = EP2 * cosPhi1 * cosPhi1;
	const double T1    = tanPhi1 * tanPhi1;
	const double denom = 1.0 - E2 * sinPhi1 * sinPhi1;
	const double N1    = SEMI_MAJOR / std::sqrt(denom);
	const double R1    = SEMI_MAJOR * (1.0 - E2) / std::pow(denom, 1.5);
	const double D     = x / (N1 * SCALE_K0);

	const double D2 = D * D;
	const double D3 = D2 * D;
	const double D4 = D3 * D;
	const double D5 = D4 * D;
	const double D6 = D5 * D;

	const double phi = phi1 - (N1 * tanPhi1 / R1) * (D2 / 2.0 - (5.0 + 3.0 * T1 + 10.0 * C1 - 4.0 * C1 * C1 - 9.0 * EP2) * D4 / 24.0 +
	                                                 (61.0 + 90.0 * T1 + 298.0 * C1 + 45.0 * T1 * T1 - 252.0 * EP2 - 3.0 * C1 * C1) * D6 / 720.0);
	const double lambda = m_centralMeridianRad + (D - (1.0 + 2.0 * T1 + C1) * D3 / 6.0 +
	                                              (5.0 - 2.0 * C1 + 28.0 * T1 - 3.0 * C1 * C1 + 8.0 * EP2 + 24.0 * T1 * T1) * D5 / 120.0) /
	                                                     cosPhi1;

	return {phi / DEG, lambda / DEG};
}

} // namespace canopy::planting::core
