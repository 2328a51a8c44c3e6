#pragma once

#include "Constants.hpp"
#include <glm/glm.hpp>

// [GEO_AGENT] Spherical geometry helpers
// Points are glm::dvec2 with x = latitude, y = longitude, both in degrees

namespace NearbyConnect {
namespace Geo {

// Degrees box around a circle on the sphere
struct BoundingBox {
    double minLat{0.0};
    double maxLat{0.0};
    double minLon{0.0};          // May be < -180 when the box crosses the antimeridian
    double maxLon{0.0};          // May be > 180 when the box crosses the antimeridian
    bool allLongitudes{false};   // Circle reaches a pole, every meridian intersects it
};

[[nodiscard]] bool isValidLatitude(double lat);
[[nodiscard]] bool isValidLongitude(double lon);
[[nodiscard]] bool isValidCoordinate(double lat, double lon);

// Throws ValidationError naming the offending field
void validateCoordinate(double lat, double lon);

// Great-circle distance (haversine) on the mean Earth sphere
[[nodiscard]] double haversineMiles(const glm::dvec2& a, const glm::dvec2& b);
[[nodiscard]] double haversineMiles(double lat1, double lon1, double lat2, double lon2);

// Box that fully contains every point within radiusMiles of (lat, lon)
[[nodiscard]] BoundingBox boundingBox(double lat, double lon, double radiusMiles);

// Wrap any longitude into [-180, 180)
[[nodiscard]] double normalizeLongitude(double lon);

// Half-away-from-zero rounding to a fixed number of decimals
[[nodiscard]] double roundTo(double value, int decimals);

} // namespace Geo
} // namespace NearbyConnect
