#pragma once

#include "core/CoreTypes.hpp"
#include "geo/GeoSpatialIndex.hpp"
#include "presence/PresenceRegistry.hpp"
#include <vector>

// [PROXIMITY_AGENT] Nearby-user discovery
// Composes the spatial index (candidates) with the presence registry (activity gate)

namespace NearbyConnect {

class ProximityQueryEngine {
public:
    ProximityQueryEngine(const GeoSpatialIndex& index, const PresenceRegistry& presence,
                         PresenceRegistry::Window window = Constants::PRESENCE_WINDOW);

    // Active users within radiusMiles of (lat, lon), nearest first, ties by user id.
    // Throws ValidationError for a bad radius or coordinate. The requester only
    // needs to exist upstream; its own presence record is not consulted.
    [[nodiscard]] std::vector<NearbyUser> nearby(const UserId& requesterId,
                                                 double lat, double lon,
                                                 double radiusMiles,
                                                 Timestamp now) const;

    static void validateRadius(double radiusMiles);

    [[nodiscard]] PresenceRegistry::Window presenceWindow() const { return window_; }

private:
    const GeoSpatialIndex& index_;
    const PresenceRegistry& presence_;
    PresenceRegistry::Window window_;
};

} // namespace NearbyConnect
