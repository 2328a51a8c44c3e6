#pragma once

#include "core/CoreTypes.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

// [GEO_AGENT] Cell-partitioned index of the latest point per user
// Queries visit only the cells under the bounding box of the search circle,
// then filter candidates by exact great-circle distance

namespace NearbyConnect {

class GeoSpatialIndex {
public:
    static constexpr double DEFAULT_CELL_SIZE = Constants::GEO_CELL_SIZE_DEGREES;

    // Grid cell: row counts up from the south pole, col east from -180
    struct CellCoord {
        int32_t row{0};
        int32_t col{0};

        bool operator==(const CellCoord& other) const {
            return row == other.row && col == other.col;
        }
        bool operator!=(const CellCoord& other) const {
            return !(*this == other);
        }
    };

    struct CellHash {
        size_t operator()(const CellCoord& c) const {
            uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(c.row)) << 32) |
                           static_cast<uint32_t>(c.col);
            return std::hash<uint64_t>{}(key);
        }
    };

    // Points currently inside one cell, keyed by user
    struct Cell {
        std::unordered_map<UserId, LocationPoint> points;
    };

    // Query candidate that passed the exact distance filter
    struct IndexHit {
        LocationPoint point;
        double distanceMiles{0.0};
    };

public:
    GeoSpatialIndex();
    explicit GeoSpatialIndex(double cellSizeDegrees);

    GeoSpatialIndex(const GeoSpatialIndex&) = delete;
    GeoSpatialIndex& operator=(const GeoSpatialIndex&) = delete;

    // Insert or replace the user's point. Returns false (and changes nothing)
    // when `at` is older than the stored point. Throws ValidationError on bad coordinates.
    bool upsert(const UserId& userId, double lat, double lon, Timestamp at);

    // Drop the user's point; false if the user had none
    bool remove(const UserId& userId);

    // Every user within radiusMiles of (lat, lon), unordered, one hit per user
    [[nodiscard]] std::vector<IndexHit> query(double lat, double lon, double radiusMiles) const;

    [[nodiscard]] std::optional<LocationPoint> find(const UserId& userId) const;

    [[nodiscard]] CellCoord getCellCoord(double lat, double lon) const;

    // Every user with a point, used by maintenance passes
    [[nodiscard]] std::vector<UserId> users() const;

    // Statistics
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t cellCount() const;
    [[nodiscard]] int32_t rowCount() const { return rows_; }
    [[nodiscard]] int32_t columnCount() const { return cols_; }
    [[nodiscard]] double cellSize() const { return cellSize_; }

private:
    struct CellShard {
        mutable std::shared_mutex mutex;
        std::unordered_map<CellCoord, Cell, CellHash> cells;
    };

    struct UserEntry {
        CellCoord cell;
        Timestamp updatedAt{};
    };

    struct UserShard {
        mutable std::mutex mutex;
        std::unordered_map<UserId, UserEntry> entries;
    };

    double cellSize_{DEFAULT_CELL_SIZE};
    double invCellSize_{1.0 / DEFAULT_CELL_SIZE};
    int32_t rows_{0};
    int32_t cols_{0};

    std::array<CellShard, Constants::GEO_INDEX_CELL_SHARDS> cellShards_;
    std::array<UserShard, Constants::GEO_INDEX_USER_SHARDS> userShards_;

    [[nodiscard]] CellShard& cellShardFor(const CellCoord& coord);
    [[nodiscard]] const CellShard& cellShardFor(const CellCoord& coord) const;
    [[nodiscard]] size_t cellShardIndex(const CellCoord& coord) const;
    [[nodiscard]] UserShard& userShardFor(const UserId& userId);
    [[nodiscard]] const UserShard& userShardFor(const UserId& userId) const;

    [[nodiscard]] int32_t rowOf(double lat) const;
    [[nodiscard]] int32_t wrapColumn(int64_t col) const;

    // Caller holds the shard lock
    static void eraseFromCell(CellShard& shard, const CellCoord& coord, const UserId& userId);
};

} // namespace NearbyConnect
