#include "planting/core/maskGenerator.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <numbers>
#include <string_view>

#include <opencv2/imgproc.hpp>

namespace canopy::planting::core {

namespace {

//! Fixed point bits for sub-pixel polygon filling.
static constexpr int FILL_SHIFT       = 8;
static constexpr double FILL_SCALE    = 1 << FILL_SHIFT;
static constexpr double MIN_RING_AREA = 1e-18; //!< deg^2. Below this a ring is degenerate.

static bool maskDebugEnabled() {
	const char* env = std::getenv("CANOPY_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static bool samePoint(const GeoPoint& a, const GeoPoint& b) {
	return a.lat == b.lat && a.lon == b.lon;
}

//! Drop repeated consecutive vertices and the closing vertex.
static std::vector<GeoPoint> normalizeRing(const std::vector<GeoPoint>& ring) {
	std::vector<GeoPoint> out;
	out.reserve(ring.size());
	for (const GeoPoint& p: ring) {
		if (out.empty() || !samePoint(out.back(), p)) {
			out.push_back(p);
		}
	}
	while (out.size() > 1u && samePoint(out.front(), out.back())) {
		out.pop_back();
	}
	return out;
}

static double cross(const GeoPoint& o, const GeoPoint& a, const GeoPoint& b) {
	return (a.lon - o.lon) * (b.lat - o.lat) - (a.lat - o.lat) * (b.lon - o.lon);
}

static bool onSegment(const GeoPoint& a, const GeoPoint& b, const GeoPoint& p) {
	return std::min(a.lon, b.lon) <= p.lon && p.lon <= std::max(a.lon, b.lon) && std::min(a.lat, b.lat) <= p.lat && p.lat <= std::max(a.lat, b.lat);
}

static int sign(double v) {
	return (v > 0.0) - (v < 0.0);
}

//! Segments ab and cd share at least one point.
static bool segmentsIntersect(const GeoPoint& a, const GeoPoint& b, const GeoPoint& c, const GeoPoint& d) {
	const int d1 = sign(cross(c, d, a));
	const int d2 = sign(cross(c, d, b));
	const int d3 = sign(cross(a, b, c));
	const int d4 = sign(cross(a, b, d));

	if (d1 * d2 < 0 && d3 * d4 < 0)
		return true;

	if (d1 == 0 && onSegment(c, d, a))
		return true;
	if (d2 == 0 && onSegment(c, d, b))
		return true;
	if (d3 == 0 && onSegment(a, b, c))
		return true;
	if (d4 == 0 && onSegment(a, b, d))
		return true;
	return false;
}

//! Shoelace area relative to the first vertex. Absolute coordinates would cancel out the small footprint areas.
static double ringArea(const std::vector<GeoPoint>& ring) {
	const GeoPoint& origin = ring.front();
	double twiceArea       = 0.0;
	for (std::size_t i = 1u; i + 1u < ring.size(); ++i) {
		twiceArea += cross(origin, ring[i], ring[i + 1u]);
	}
	return 0.5 * std::abs(twiceArea);
}

static std::vector<cv::Point> toFixedPoint(const std::vector<GeoPoint>& ring, const Grid& grid) {
	std::vector<cv::Point> pts;
	pts.reserve(ring.size());
	for (const GeoPoint& p: ring) {
		const cv::Point2d px = grid.geoToPixel(p);
		pts.emplace_back(static_cast<int>(std::lround(px.x * FILL_SCALE)), static_cast<int>(std::lround(px.y * FILL_SCALE)));
	}
	return pts;
}

static void fillPolygon(cv::Mat& mask, const Polygon& polygon, const Grid& grid) {
	const std::vector<cv::Point> exterior = toFixedPoint(normalizeRing(polygon.exterior), grid);

	if (polygon.holes.empty()) {
		cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{exterior}, cv::Scalar(255), cv::LINE_8, FILL_SHIFT);
		return;
	}

	// Carve holes on a separate layer so they do not erase overlapping neighbours.
	cv::Mat layer(mask.size(), CV_8U, cv::Scalar(0));
	cv::fillPoly(layer, std::vector<std::vector<cv::Point>>{exterior}, cv::Scalar(255), cv::LINE_8, FILL_SHIFT);

	std::vector<std::vector<cv::Point>> holes;
	for (const auto& hole: polygon.holes) {
		// An unusable hole leaves the exterior intact.
		if (isValidRing(hole)) {
			holes.push_back(toFixedPoint(normalizeRing(hole), grid));
		}
	}
	if (!holes.empty()) {
		cv::fillPoly(layer, holes, cv::Scalar(0), cv::LINE_8, FILL_SHIFT);
	}
	mask |= layer;
}

static std::vector<cv::Point2d> circlePolygon(const cv::Point2d center, const double radius, const int segments) {
	std::vector<cv::Point2d> out;
	out.reserve(static_cast<std::size_t>(segments));
	for (int k = 0; k < segments; ++k) {
		const double angle = 2.0 * std::numbers::pi * static_cast<double>(k) / static_cast<double>(segments);
		out.emplace_back(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
	}
	return out;
}

} // namespace

bool isValidRing(const std::vector<GeoPoint>& rawRing) {
	const std::vector<GeoPoint> ring = normalizeRing(rawRing);
	const std::size_t n              = ring.size();
	if (n < 3u) {
		return false;
	}
	if (ringArea(ring) < MIN_RING_AREA) {
		return false;
	}

	// Non-adjacent edges must not touch.
	for (std::size_t i = 0u; i < n; ++i) {
		const GeoPoint& a = ring[i];
		const GeoPoint& b = ring[(i + 1u) % n];
		for (std::size_t j = i + 2u; j < n; ++j) {
			if (i == 0u && j == n - 1u) {
				continue;
			}
			if (segmentsIntersect(a, b, ring[j], ring[(j + 1u) % n])) {
				return false;
			}
		}
	}
	return true;
}

cv::Mat rasterizePolygons(const std::vector<Polygon>& polygons, const Grid& grid, std::size_t* skipped) {
	cv::Mat mask(grid.size(), CV_8U, cv::Scalar(0));

	std::size_t invalid = 0u;
	for (const Polygon& polygon: polygons) {
		if (!isValidRing(polygon.exterior)) {
			++invalid;
			continue;
		}
		fillPolygon(mask, polygon, grid);
	}

	if (skipped)
		*skipped = invalid;
	return mask;
}

std::vector<std::vector<cv::Point2d>> bufferPath(const std::vector<cv::Point2d>& path, const double radiusM, const int circleSegments) {
	std::vector<std::vector<cv::Point2d>> parts;
	if (path.empty() || radiusM <= 0.0) {
		return parts;
	}

	for (std::size_t i = 0u; i + 1u < path.size(); ++i) {
		const cv::Point2d a = path[i];
		const cv::Point2d b = path[i + 1u];
		const double length = cv::norm(b - a);
		if (length <= 0.0) {
			continue;
		}

		const cv::Point2d dir = (b - a) / length;
		const cv::Point2d normal{-dir.y * radiusM, dir.x * radiusM};
		parts.push_back({a + normal, b + normal, b - normal, a - normal});
	}

	// Round joins and caps.
	for (const cv::Point2d& vertex: path) {
		parts.push_back(circlePolygon(vertex, radiusM, circleSegments));
	}
	return parts;
}

cv::Mat bufferStreets(const std::vector<Street>& streets, const double radiusM, const Grid& grid, const LocalProjection& projection,
                      const int circleSegments) {
	cv::Mat mask(grid.size(), CV_8U, cv::Scalar(0));

	std::vector<cv::Point2d> metricPath;
	std::vector<cv::Point> pixels;
	for (const Street& street: streets) {
		metricPath.clear();
		for (const GeoPoint& p: street.path) {
			metricPath.push_back(projection.toMetric(p));
		}

		for (const auto& part: bufferPath(metricPath, radiusM, circleSegments)) {
			pixels.clear();
			for (const cv::Point2d& m: part) {
				const cv::Point2d px = grid.geoToPixel(projection.toGeo(m));
				pixels.emplace_back(static_cast<int>(std::lround(px.x * FILL_SCALE)), static_cast<int>(std::lround(px.y * FILL_SCALE)));
			}
			cv::fillConvexPoly(mask, pixels, cv::Scalar(255), cv::LINE_8, FILL_SHIFT);
		}
	}
	return mask;
}

cv::Mat distanceToMask(const cv::Mat& mask, const double metersPerPixel) {
	if (cv::countNonZero(mask) == 0) {
		const double diagonalM = std::hypot(static_cast<double>(mask.cols), static_cast<double>(mask.rows)) * metersPerPixel;
		return cv::Mat(mask.size(), CV_32F, cv::Scalar(diagonalM));
	}

	// distanceTransform measures the distance to the nearest zero pixel.
	cv::Mat inverted;
	cv::bitwise_not(mask, inverted);

	cv::Mat distance;
	cv::distanceTransform(inverted, distance, cv::DIST_L2, cv::DIST_MASK_PRECISE, CV_32F);
	distance *= metersPerPixel;
	return distance;
}

cv::Mat computePlantableMask(const cv::Mat& buildingMask, const cv::Mat& streetMask, const cv::Mat& vegetationMask) {
	cv::Mat occupied = buildingMask | streetMask | vegetationMask;
	cv::Mat plantable;
	cv::bitwise_not(occupied, plantable);
	return plantable;
}

MaskResult generateMasks(const VectorData& aligned, const cv::Mat& vegetationMask, const Grid& grid, const PlantingConfig& config,
                         DebugVisualizer* debugger) {
	if (!grid.isValid()) {
		std::cerr << "[mask] Mask generation failed: invalid grid " << grid.width() << "x" << grid.height() << '\n';
		return {false, {}, {}, {}, {}, {}, {}, {}, 0u};
	}
	if (vegetationMask.size() != grid.size() || vegetationMask.type() != CV_8UC1) {
		std::cerr << "[mask] Mask generation failed: vegetation mask does not match the grid\n";
		return {false, {}, {}, {}, {}, {}, {}, {}, 0u};
	}

	MaskResult result{true, {}, {}, {}, {}, {}, {}, {}, 0u};
	const LocalProjection projection = LocalProjection::forLocation(grid.center(), config.alignment.utmZone);
	const BufferConfig& buffers      = config.buffers;

	// 1. Buildings.
	result.buildingMask = rasterizePolygons(aligned.buildings, grid, &result.invalidPolygons);
	if (result.invalidPolygons > 0u) {
		std::cerr << "[mask] Warning: skipped " << result.invalidPolygons << " invalid building polygon(s).\n";
	}

	// 2. Streets by tier, union into the street mask.
	std::array<std::vector<Street>, 4> byTier{};
	std::vector<Street> sidewalkStreets;
	for (const Street& street: aligned.streets) {
		byTier[static_cast<std::size_t>(street.tier)].push_back(street);
		if (street.tier == StreetTier::Pedestrian || street.tier == StreetTier::Low) {
			sidewalkStreets.push_back(street);
		}
	}

	result.streetMask = cv::Mat(grid.size(), CV_8U, cv::Scalar(0));
	for (std::size_t t = 0u; t < byTier.size(); ++t) {
		const double radius = bufferRadius(static_cast<StreetTier>(t), buffers);
		result.tierMasks[t] = bufferStreets(byTier[t], radius, grid, projection, buffers.circleSegments);
		result.streetMask |= result.tierMasks[t];
	}

	// 3. Sidewalk proxy, independent of the tier buffers.
	result.sidewalkMask = bufferStreets(sidewalkStreets, buffers.sidewalkM, grid, projection, buffers.circleSegments);

	// 4. Plantable area and distance fields.
	result.plantableMask      = computePlantableMask(result.buildingMask, result.streetMask, vegetationMask);
	result.distanceToSidewalk = distanceToMask(result.sidewalkMask, grid.metersPerPixel());
	result.distanceToBuilding = distanceToMask(result.buildingMask, grid.metersPerPixel());

	if (debugger) {
		debugger->beginStage("Masks");
		debugger->add("Buildings", result.buildingMask);

		cv::Mat tiers(grid.size(), CV_8U, cv::Scalar(0));
		for (std::size_t t = 0u; t < result.tierMasks.size(); ++t) {
			tiers.setTo(cv::Scalar(static_cast<double>(t + 1u)), result.tierMasks[t]);
		}
		debugger->add("Street Tiers", DebugVisualizer::colorizeLabels(tiers, {cv::Scalar(0, 0, 0), DebugVisualizer::COLOR_SIDEWALK, DebugVisualizer::COLOR_STREET_LOW,
		                                                                    DebugVisualizer::COLOR_STREET_MEDIUM, DebugVisualizer::COLOR_STREET_HIGH}));
		debugger->add("Sidewalk", result.sidewalkMask);
		debugger->add("Plantable", result.plantableMask);
		debugger->add("Distance Sidewalk", DebugVisualizer::heatmap(result.distanceToSidewalk, 0.0, 50.0));
		debugger->add("Distance Building", DebugVisualizer::heatmap(result.distanceToBuilding, 0.0, 60.0));
		debugger->endStage();
	}

	if (maskDebugEnabled()) {
		const double total = static_cast<double>(grid.size().area());
		std::cout << "[mask] building=" << percentage(cv::countNonZero(result.buildingMask), total)
		          << "% street=" << percentage(cv::countNonZero(result.streetMask), total)
		          << "% sidewalk=" << percentage(cv::countNonZero(result.sidewalkMask), total)
		          << "% plantable=" << percentage(cv::countNonZero(result.plantableMask), total) << "%\n";
	}

	return result;
}

} // namespace canopy::planting::core
