// [GEO_AGENT] Haversine distance and bounding boxes
// Bounding box follows the exact spherical form: dLon = asin(sin(d) / cos(lat))

#include "geo/GeoMath.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace NearbyConnect {
namespace Geo {

bool isValidLatitude(double lat) {
    return std::isfinite(lat) &&
           lat >= Constants::MIN_LATITUDE && lat <= Constants::MAX_LATITUDE;
}

bool isValidLongitude(double lon) {
    return std::isfinite(lon) &&
           lon >= Constants::MIN_LONGITUDE && lon <= Constants::MAX_LONGITUDE;
}

bool isValidCoordinate(double lat, double lon) {
    return isValidLatitude(lat) && isValidLongitude(lon);
}

void validateCoordinate(double lat, double lon) {
    if (!isValidLatitude(lat)) {
        std::ostringstream oss;
        oss << "Latitude must be between -90 and 90 (got " << lat << ")";
        throw ValidationError(oss.str());
    }
    if (!isValidLongitude(lon)) {
        std::ostringstream oss;
        oss << "Longitude must be between -180 and 180 (got " << lon << ")";
        throw ValidationError(oss.str());
    }
}

double haversineMiles(const glm::dvec2& a, const glm::dvec2& b) {
    const glm::dvec2 ra = glm::radians(a);
    const glm::dvec2 rb = glm::radians(b);
    const glm::dvec2 half = (rb - ra) * 0.5;

    // sin^2 of the half longitude delta is periodic, so 179.9 vs -179.9
    // resolves to the short way around without explicit wrapping
    const double sinLat = std::sin(half.x);
    const double sinLon = std::sin(half.y);
    const double h = sinLat * sinLat + std::cos(ra.x) * std::cos(rb.x) * sinLon * sinLon;

    const double c = 2.0 * std::asin(std::sqrt(std::clamp(h, 0.0, 1.0)));
    return Constants::EARTH_RADIUS_MILES * c;
}

double haversineMiles(double lat1, double lon1, double lat2, double lon2) {
    return haversineMiles(glm::dvec2(lat1, lon1), glm::dvec2(lat2, lon2));
}

BoundingBox boundingBox(double lat, double lon, double radiusMiles) {
    BoundingBox box;

    const double angular = radiusMiles / Constants::EARTH_RADIUS_MILES;  // radians
    const double dLat = glm::degrees(angular);

    box.minLat = lat - dLat;
    box.maxLat = lat + dLat;

    if (box.maxLat >= Constants::MAX_LATITUDE || box.minLat <= Constants::MIN_LATITUDE) {
        // Pole inside the circle
        box.minLat = std::max(box.minLat, Constants::MIN_LATITUDE);
        box.maxLat = std::min(box.maxLat, Constants::MAX_LATITUDE);
        box.minLon = Constants::MIN_LONGITUDE;
        box.maxLon = Constants::MAX_LONGITUDE;
        box.allLongitudes = true;
        return box;
    }

    const double cosLat = std::cos(glm::radians(lat));
    const double ratio = std::sin(angular) / cosLat;
    if (ratio >= 1.0) {
        box.minLon = Constants::MIN_LONGITUDE;
        box.maxLon = Constants::MAX_LONGITUDE;
        box.allLongitudes = true;
        return box;
    }

    const double dLon = glm::degrees(std::asin(ratio));
    box.minLon = lon - dLon;
    box.maxLon = lon + dLon;
    return box;
}

double normalizeLongitude(double lon) {
    double wrapped = std::fmod(lon + 180.0, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    return wrapped - 180.0;
}

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace Geo
} // namespace NearbyConnect
