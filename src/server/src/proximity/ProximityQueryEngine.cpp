#include "proximity/ProximityQueryEngine.hpp"
#include "geo/GeoMath.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace NearbyConnect {

ProximityQueryEngine::ProximityQueryEngine(const GeoSpatialIndex& index,
                                           const PresenceRegistry& presence,
                                           PresenceRegistry::Window window)
    : index_(index), presence_(presence), window_(window) {}

void ProximityQueryEngine::validateRadius(double radiusMiles) {
    if (!std::isfinite(radiusMiles) ||
        radiusMiles < Constants::MIN_RADIUS_MILES ||
        radiusMiles > Constants::MAX_RADIUS_MILES) {
        std::ostringstream oss;
        oss << "radius_miles must be between " << Constants::MIN_RADIUS_MILES
            << " and " << Constants::MAX_RADIUS_MILES << " (got " << radiusMiles << ")";
        throw ValidationError(oss.str());
    }
}

std::vector<NearbyUser> ProximityQueryEngine::nearby(const UserId& requesterId,
                                                     double lat, double lon,
                                                     double radiusMiles,
                                                     Timestamp now) const {
    validateRadius(radiusMiles);
    Geo::validateCoordinate(lat, lon);

    // Index query uses the exact radius; candidates outside it never come back
    auto hits = index_.query(lat, lon, radiusMiles);

    struct Candidate {
        NearbyUser user;
        double exactDistance;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(hits.size());

    for (auto& hit : hits) {
        // Don't include self
        if (hit.point.userId == requesterId) continue;

        auto lastActive = presence_.lastActive(hit.point.userId);
        if (!lastActive || !PresenceRegistry::withinWindow(*lastActive, now, window_)) {
            continue;
        }

        NearbyUser user;
        user.userId = hit.point.userId;
        // Rounding up must not push a hit past the requested radius
        user.distanceMiles = std::min(Geo::roundTo(hit.distanceMiles, Constants::DISTANCE_DECIMALS),
                                      radiusMiles);
        user.latitude = hit.point.latitude;
        user.longitude = hit.point.longitude;
        user.lastActive = *lastActive;
        candidates.push_back({std::move(user), hit.distanceMiles});
    }

    // Sort on full precision; rounding is presentation only
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.exactDistance != b.exactDistance) {
            return a.exactDistance < b.exactDistance;
        }
        return a.user.userId < b.user.userId;
    });

    std::vector<NearbyUser> result;
    result.reserve(candidates.size());
    for (auto& candidate : candidates) {
        result.push_back(std::move(candidate.user));
    }
    return result;
}

} // namespace NearbyConnect
