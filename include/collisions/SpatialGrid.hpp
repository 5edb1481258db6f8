/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_GRID_HPP
#define SPATIAL_GRID_HPP

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/container/small_vector.hpp>
#include "collisions/AABB.hpp"
#include "collisions/ObjectHandle.hpp"

namespace BumperEngine {

/**
 * @brief Two-level spatial hash used as the collision broad phase
 *
 * Design:
 * - Fine Grid (32x32 default): every object is linked into each fine cell its
 *   box covers. Cell entries live in one flat arena and are chained by index;
 *   removed entries go onto a free list and are reused by later inserts.
 *   Each fine cell keeps the union of the boxes it holds.
 * - Coarse Grid (4x fine by default): each coarse cell lists the fine cells
 *   whose bounds intersect it, so region queries skip empty space quickly.
 * - Objects covering too many fine cells are kept on a separate oversized
 *   list and paired against everything instead of flooding the grid.
 *
 * The grid is a filter only: every candidate pair must still go through the
 * exact overlap() test before it is treated as a contact.
 */
class SpatialGrid {
public:
    static constexpr float DEFAULT_FINE_CELL_SIZE = 32.0f;
    static constexpr int32_t DEFAULT_COARSE_FACTOR = 4;     // 128 world units
    static constexpr size_t MAX_FINE_CELLS_PER_OBJECT = 1024;

    // Which pipeline an indexed object belongs to
    enum class BodyClass : uint8_t { Trigger, Physical };

    // Physical: both objects physical. Trigger: at least one trigger.
    enum class PairKind : uint8_t { Physical, Trigger };

    using GridKey = uint64_t; // Packed: (x << 32) | y
    using CandidatePair = std::pair<ObjectHandle, ObjectHandle>; // first < second

    struct CellCoord { int32_t x, y; };

    // Inclusive cell rectangle
    struct CellRange {
        int32_t minX{0}, minY{0}, maxX{-1}, maxY{-1};

        bool empty() const { return maxX < minX || maxY < minY; }
        size_t cellCount() const {
            if (empty()) return 0;
            return static_cast<size_t>(maxX - minX + 1) * static_cast<size_t>(maxY - minY + 1);
        }
        bool contains(int32_t x, int32_t y) const {
            return x >= minX && x <= maxX && y >= minY && y <= maxY;
        }
        CellRange merged(const CellRange& other) const;
        bool operator==(const CellRange&) const = default;
    };

    struct Item {
        ObjectHandle handle;
        AABB aabb;
        BodyClass bodyClass{BodyClass::Physical};
    };

    explicit SpatialGrid(float fineCellSize = DEFAULT_FINE_CELL_SIZE,
                         int32_t coarseFactor = DEFAULT_COARSE_FACTOR);

    /**
     * @brief Changes cell sizes; drops all content
     * @throws std::invalid_argument for a non-positive size or factor
     */
    void configure(float fineCellSize, int32_t coarseFactor);

    // Clears and reinserts everything
    void rebuild(const std::vector<Item>& items);

    // Inserts, or updates when the handle is already indexed
    void insert(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass);

    /**
     * @brief Moves an object to its new box
     *
     * Relocates the object only when the set of covered fine cells changed;
     * otherwise the stored boxes are refreshed in place. A degenerate box
     * removes the object from the index.
     * @return true if the object changed cells
     */
    bool update(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass);

    bool remove(const ObjectHandle& handle);
    void clear();

    /**
     * @brief Compacts storage when the free list dominates the arena
     *
     * Empty coarse cells are always dropped. When free slots exceed
     * fragmentationThreshold of the arena, the arena is rebuilt densely and
     * cell bounds are recomputed tightly. Live objects are never dropped.
     * @return number of arena slots reclaimed
     */
    size_t shrink(float fragmentationThreshold);

    // Sorted, duplicate-free candidate pairs for the given pipeline
    void collectPairs(PairKind kind, std::vector<CandidatePair>& outPairs) const;

    // Sorted handles whose stored box overlaps area
    void query(const AABB& area, std::vector<ObjectHandle>& outHandles) const;

    bool contains(const ObjectHandle& handle) const { return m_objects.contains(handle); }

    float getFineCellSize() const { return m_fineCellSize; }
    float getCoarseCellSize() const { return m_fineCellSize * static_cast<float>(m_coarseFactor); }
    int32_t getCoarseFactor() const { return m_coarseFactor; }

    // Statistics and debugging
    size_t getObjectCount() const { return m_objects.size(); }
    size_t getFineCellCount() const { return m_fineCells.size(); }
    size_t getCoarseCellCount() const { return m_coarseCells.size(); }
    size_t getEntryCount() const { return m_entries.size() - m_freeCount; }
    size_t getArenaSize() const { return m_entries.size(); }
    size_t getFreeSlotCount() const { return m_freeCount; }
    size_t getOversizedCount() const { return m_oversized.size(); }
    float fragmentation() const;
    void logStatistics() const;

    CellRange fineRangeFor(const AABB& aabb) const;
    CellRange coarseRangeFor(const AABB& aabb) const;

private:
    static constexpr int32_t NIL = -1;

    // Arena slot: a cell list node while live, a free list node otherwise
    struct Entry {
        ObjectHandle handle;
        AABB aabb;
        BodyClass bodyClass{BodyClass::Physical};
        int32_t next{NIL};
    };

    struct FineCell {
        int32_t first{NIL};
        uint32_t count{0};
        AABB bounds{};
        CellRange coarseRange{}; // coarse cells currently referencing this cell
    };

    struct CoarseCell {
        boost::container::small_vector<GridKey, 16> fineCells;
    };

    struct TrackedObject {
        AABB aabb;
        BodyClass bodyClass{BodyClass::Physical};
        CellRange range{};
        bool oversized{false};
        boost::container::small_vector<std::pair<GridKey, int32_t>, 4> links; // (fine cell, entry)
    };

    static GridKey computeGridKey(int32_t x, int32_t y) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
               static_cast<uint32_t>(y);
    }
    static CellRange rangeFor(const AABB& aabb, float cellSize);
    static bool accepts(PairKind kind, BodyClass a, BodyClass b);

    void insertTracked(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass);
    void removeTracked(const ObjectHandle& handle, TrackedObject& tracked);

    int32_t allocateEntry(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass);
    void releaseEntry(int32_t index);

    void linkIntoCell(GridKey key, int32_t entryIndex);
    void unlinkFromCell(GridKey key, int32_t entryIndex);
    void recomputeCellBounds(FineCell& cell);
    void registerCoarse(GridKey fineKey, FineCell& cell);
    void unregisterCoarse(GridKey fineKey, const CellRange& coarseRange);

    float m_fineCellSize{DEFAULT_FINE_CELL_SIZE};
    int32_t m_coarseFactor{DEFAULT_COARSE_FACTOR};

    std::vector<Entry> m_entries;
    int32_t m_firstFree{NIL};
    size_t m_freeCount{0};

    std::unordered_map<GridKey, FineCell> m_fineCells;
    std::unordered_map<GridKey, CoarseCell> m_coarseCells;
    std::unordered_map<ObjectHandle, TrackedObject, ObjectHandleHash> m_objects;
    std::vector<ObjectHandle> m_oversized;

    // PERFORMANCE: Persistent buffers to avoid per-query allocations (single-threaded)
    mutable std::unordered_set<GridKey> m_tempVisitedCells;
    mutable std::vector<const Entry*> m_tempCellEntries;
};

} // namespace BumperEngine

#endif // SPATIAL_GRID_HPP
