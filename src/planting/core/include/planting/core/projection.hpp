#pragma once

#include "planting/core/grid.hpp"

#include <opencv2/core/types.hpp>

namespace canopy::planting::core {

/*! Metric coordinate reference system used for alignment and buffering.
 *  Universal Transverse Mercator on the WGS84 ellipsoid. Easting/northing in meters (x east, y north).
 *  Buffers and offsets must be applied here, degrees are not isotropic.
 */
class LocalProjection {
public:
	//! Choose the UTM zone containing a location.
	//! \param [in] zoneOverride Force a zone (1..60). 0 selects the zone from the longitude.
	static LocalProjection forLocation(GeoPoint center, int zoneOverride = 0);

	LocalProjection(int zone, bool southern);

	cv::Point2d toMetric(GeoPoint geo) const; //!< Geographic -> (easting, northing).
	GeoPoint toGeo(cv::Point2d metric) const; //!< (easting, northing) -> geographic.

	int zone() const {
		return m_zone;
	}
	bool southern() const {
		return m_southern;
	}

private:
	int m_zone{0};
	bool m_southern{false};
	double m_centralMeridianRad{0.0};
};

} // namespace canopy::planting::core
