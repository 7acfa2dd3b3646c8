#pragma once

#include <opencv2/core/types.hpp>

namespace canopy::planting::core {

//! Geographic coordinate in WGS84 degrees.
struct GeoPoint {
	double lat{0.0};
	double lon{0.0};
};

//! Geographic bounding box of the imaged area.
struct GeoBounds {
	double minLat{0.0};
	double maxLat{0.0};
	double minLon{0.0};
	double maxLon{0.0};
};

/*! Spatial frame shared by every raster of one location.
 *  Pixel (0,0) is the top-left corner. x grows east (linear in longitude), y grows south (linear and inverse in latitude).
 *  All masks, fields and spot coordinates are computed against the same Grid value, never re-derived per stage.
 */
class Grid {
public:
	Grid() = default;
	Grid(int width, int height, GeoBounds bounds, double metersPerPixel);

	/*! Compute the grid of a satellite tile centred on a location.
	 *  Every delivered pixel covers the Web-Mercator resolution 156543.03392 * cos(lat) / 2^zoom, about 0.6 m at zoom 18 near the equator.
	 * \param [in] center Centre of the image.
	 * \param [in] width  Image width in pixels (as delivered, i.e. after the scale factor).
	 * \param [in] height Image height in pixels.
	 * \param [in] zoom   Web-Mercator zoom level of the tile.
	 * \param [in] scale  Tile scale factor. The covered extent is the delivered size rounded down to a multiple of it.
	 */
	static Grid fromCenter(GeoPoint center, int width, int height, int zoom, int scale);

	int width() const {
		return m_width;
	}
	int height() const {
		return m_height;
	}
	cv::Size size() const {
		return {m_width, m_height};
	}
	const GeoBounds& bounds() const {
		return m_bounds;
	}
	double metersPerPixel() const {
		return m_metersPerPixel;
	}
	double pixelAreaM2() const {
		return m_metersPerPixel * m_metersPerPixel;
	}
	GeoPoint center() const;

	GeoPoint pixelToGeo(cv::Point2d pixel) const; //!< Forward affine map.
	cv::Point2d geoToPixel(GeoPoint geo) const;   //!< Inverse affine map. Sub-pixel, not clamped to the image.

	bool isValid() const;

private:
	int m_width{0};
	int m_height{0};
	GeoBounds m_bounds{};
	double m_metersPerPixel{0.0};
};

//! Meters to degree offsets at a latitude (flat-earth, 111 km per degree).
GeoPoint metersToDegrees(double metersNorth, double metersEast, double atLatitude);

} // namespace canopy::planting::core
