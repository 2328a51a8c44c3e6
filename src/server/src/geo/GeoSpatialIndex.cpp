// [GEO_AGENT] Geo spatial index implementation
// Lock order: user shard, then cell shards (std::scoped_lock when two are needed).
// Queries only ever hold one cell shard at a time.

#include "geo/GeoSpatialIndex.hpp"
#include "geo/GeoMath.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace NearbyConnect {

GeoSpatialIndex::GeoSpatialIndex() : GeoSpatialIndex(DEFAULT_CELL_SIZE) {}

GeoSpatialIndex::GeoSpatialIndex(double cellSizeDegrees)
    : cellSize_(cellSizeDegrees)
    , invCellSize_(1.0 / cellSizeDegrees)
{
    if (!(cellSizeDegrees > 0.0) || cellSizeDegrees > 90.0) {
        throw ValidationError("Cell size must be in (0, 90] degrees");
    }
    rows_ = static_cast<int32_t>(std::ceil(180.0 * invCellSize_));
    cols_ = static_cast<int32_t>(std::ceil(360.0 * invCellSize_));
}

int32_t GeoSpatialIndex::rowOf(double lat) const {
    int32_t row = static_cast<int32_t>(std::floor((lat + 90.0) * invCellSize_));
    return std::clamp(row, 0, rows_ - 1);
}

int32_t GeoSpatialIndex::wrapColumn(int64_t col) const {
    int64_t wrapped = col % cols_;
    if (wrapped < 0) {
        wrapped += cols_;
    }
    return static_cast<int32_t>(wrapped);
}

GeoSpatialIndex::CellCoord GeoSpatialIndex::getCellCoord(double lat, double lon) const {
    const double normalized = Geo::normalizeLongitude(lon);
    const auto col = static_cast<int64_t>(std::floor((normalized + 180.0) * invCellSize_));
    return { rowOf(lat), wrapColumn(col) };
}

size_t GeoSpatialIndex::cellShardIndex(const CellCoord& coord) const {
    return CellHash{}(coord) % cellShards_.size();
}

GeoSpatialIndex::CellShard& GeoSpatialIndex::cellShardFor(const CellCoord& coord) {
    return cellShards_[cellShardIndex(coord)];
}

const GeoSpatialIndex::CellShard& GeoSpatialIndex::cellShardFor(const CellCoord& coord) const {
    return cellShards_[cellShardIndex(coord)];
}

GeoSpatialIndex::UserShard& GeoSpatialIndex::userShardFor(const UserId& userId) {
    return userShards_[std::hash<UserId>{}(userId) % userShards_.size()];
}

const GeoSpatialIndex::UserShard& GeoSpatialIndex::userShardFor(const UserId& userId) const {
    return userShards_[std::hash<UserId>{}(userId) % userShards_.size()];
}

void GeoSpatialIndex::eraseFromCell(CellShard& shard, const CellCoord& coord, const UserId& userId) {
    auto cellIt = shard.cells.find(coord);
    if (cellIt == shard.cells.end()) {
        return;
    }
    cellIt->second.points.erase(userId);
    if (cellIt->second.points.empty()) {
        shard.cells.erase(cellIt);
    }
}

bool GeoSpatialIndex::upsert(const UserId& userId, double lat, double lon, Timestamp at) {
    Geo::validateCoordinate(lat, lon);

    const CellCoord newCoord = getCellCoord(lat, lon);
    LocationPoint point{userId, lat, lon, at};

    UserShard& users = userShardFor(userId);
    std::lock_guard<std::mutex> userLock(users.mutex);

    auto entryIt = users.entries.find(userId);
    if (entryIt == users.entries.end()) {
        CellShard& shard = cellShardFor(newCoord);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.cells[newCoord].points[userId] = std::move(point);
        users.entries.emplace(userId, UserEntry{newCoord, at});
        return true;
    }

    UserEntry& entry = entryIt->second;
    if (at < entry.updatedAt) {
        return false;  // Stale update, last writer by timestamp wins
    }

    const CellCoord oldCoord = entry.cell;
    const size_t oldShard = cellShardIndex(oldCoord);
    const size_t newShard = cellShardIndex(newCoord);

    if (oldShard == newShard) {
        CellShard& shard = cellShards_[newShard];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        if (oldCoord != newCoord) {
            eraseFromCell(shard, oldCoord, userId);
        }
        shard.cells[newCoord].points[userId] = std::move(point);
    } else {
        CellShard& from = cellShards_[oldShard];
        CellShard& to = cellShards_[newShard];
        std::scoped_lock lock(from.mutex, to.mutex);
        eraseFromCell(from, oldCoord, userId);
        to.cells[newCoord].points[userId] = std::move(point);
    }

    entry.cell = newCoord;
    entry.updatedAt = at;
    return true;
}

bool GeoSpatialIndex::remove(const UserId& userId) {
    UserShard& users = userShardFor(userId);
    std::lock_guard<std::mutex> userLock(users.mutex);

    auto entryIt = users.entries.find(userId);
    if (entryIt == users.entries.end()) {
        return false;
    }

    CellShard& shard = cellShardFor(entryIt->second.cell);
    {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        eraseFromCell(shard, entryIt->second.cell, userId);
    }
    users.entries.erase(entryIt);
    return true;
}

std::vector<GeoSpatialIndex::IndexHit> GeoSpatialIndex::query(double lat, double lon,
                                                              double radiusMiles) const {
    Geo::validateCoordinate(lat, lon);
    if (!std::isfinite(radiusMiles) || radiusMiles < 0.0) {
        throw ValidationError("Radius must be a non-negative number of miles");
    }

    const Geo::BoundingBox box = Geo::boundingBox(lat, lon, radiusMiles);
    const glm::dvec2 center(lat, lon);

    const int32_t firstRow = rowOf(box.minLat);
    const int32_t lastRow = rowOf(box.maxLat);

    // Column range, unwrapped; wrapColumn() folds it across the antimeridian
    int64_t firstCol = 0;
    int64_t lastCol = cols_ - 1;
    if (!box.allLongitudes) {
        firstCol = static_cast<int64_t>(std::floor((box.minLon + 180.0) * invCellSize_));
        lastCol = static_cast<int64_t>(std::floor((box.maxLon + 180.0) * invCellSize_));
        if (lastCol - firstCol + 1 >= cols_) {
            firstCol = 0;
            lastCol = cols_ - 1;
        }
    }

    // A user moving between two visited cells mid-query can be seen twice
    std::unordered_map<UserId, IndexHit> hits;

    for (int32_t row = firstRow; row <= lastRow; ++row) {
        for (int64_t col = firstCol; col <= lastCol; ++col) {
            const CellCoord coord{row, wrapColumn(col)};
            const CellShard& shard = cellShardFor(coord);

            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            auto cellIt = shard.cells.find(coord);
            if (cellIt == shard.cells.end()) {
                continue;
            }

            for (const auto& [userId, point] : cellIt->second.points) {
                const double distance = Geo::haversineMiles(center, point.toVec2());
                if (distance > radiusMiles) {
                    continue;
                }

                auto hitIt = hits.find(userId);
                if (hitIt == hits.end()) {
                    hits.emplace(userId, IndexHit{point, distance});
                } else if (point.updatedAt > hitIt->second.point.updatedAt) {
                    hitIt->second = IndexHit{point, distance};
                }
            }
        }
    }

    std::vector<IndexHit> result;
    result.reserve(hits.size());
    for (auto& [userId, hit] : hits) {
        result.push_back(std::move(hit));
    }
    return result;
}

std::optional<LocationPoint> GeoSpatialIndex::find(const UserId& userId) const {
    CellCoord coord;
    {
        const UserShard& users = userShardFor(userId);
        std::lock_guard<std::mutex> userLock(users.mutex);
        auto entryIt = users.entries.find(userId);
        if (entryIt == users.entries.end()) {
            return std::nullopt;
        }
        coord = entryIt->second.cell;

        // Cell lock taken while the user lock is still held, same order as upsert()
        const CellShard& shard = cellShardFor(coord);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto cellIt = shard.cells.find(coord);
        if (cellIt != shard.cells.end()) {
            auto pointIt = cellIt->second.points.find(userId);
            if (pointIt != cellIt->second.points.end()) {
                return pointIt->second;
            }
        }
    }
    return std::nullopt;
}

std::vector<UserId> GeoSpatialIndex::users() const {
    std::vector<UserId> result;
    for (const auto& shard : userShards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [userId, entry] : shard.entries) {
            result.push_back(userId);
        }
    }
    return result;
}

size_t GeoSpatialIndex::size() const {
    size_t count = 0;
    for (const auto& shard : userShards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        count += shard.entries.size();
    }
    return count;
}

size_t GeoSpatialIndex::cellCount() const {
    size_t count = 0;
    for (const auto& shard : cellShards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        count += shard.cells.size();
    }
    return count;
}

} // namespace NearbyConnect
