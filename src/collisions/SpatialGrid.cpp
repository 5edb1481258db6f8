/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace BumperEngine {

namespace {
// Cell bounds are padded so float drift in the unions never hides an entry
constexpr float BOUNDS_PADDING_FRACTION = 0.01f;
constexpr float MAX_CELL_COORD = 1.0e9f;

AABB padded(const AABB& box, float pad) {
    return AABB(box.center, box.size + Vector2D(pad * 2.0f, pad * 2.0f));
}

int32_t coordFromKey(uint64_t part) {
    return static_cast<int32_t>(static_cast<uint32_t>(part));
}
} // namespace

// ========== CellRange ==========

SpatialGrid::CellRange SpatialGrid::CellRange::merged(const CellRange& other) const {
    if (empty()) return other;
    if (other.empty()) return *this;
    CellRange out;
    out.minX = std::min(minX, other.minX);
    out.minY = std::min(minY, other.minY);
    out.maxX = std::max(maxX, other.maxX);
    out.maxY = std::max(maxY, other.maxY);
    return out;
}

// ========== SpatialGrid Implementation ==========

SpatialGrid::SpatialGrid(float fineCellSize, int32_t coarseFactor) {
    configure(fineCellSize, coarseFactor);
    m_entries.reserve(256);
    m_objects.reserve(256);
}

void SpatialGrid::configure(float fineCellSize, int32_t coarseFactor) {
    if (!(fineCellSize > 0.0f) || !std::isfinite(fineCellSize)) {
        throw std::invalid_argument(std::format("SpatialGrid fine cell size must be positive: {}",
                                                fineCellSize));
    }
    if (coarseFactor <= 0) {
        throw std::invalid_argument(std::format("SpatialGrid coarse factor must be positive: {}",
                                                coarseFactor));
    }
    m_fineCellSize = fineCellSize;
    m_coarseFactor = coarseFactor;
    clear();
}

SpatialGrid::CellRange SpatialGrid::rangeFor(const AABB& aabb, float cellSize) {
    CellRange range;
    if (!aabb.center.isFinite() || !aabb.size.isFinite()) {
        return range; // empty
    }
    // Same corner/size arithmetic as overlap(), so touching boxes share a cell
    Rect rect = aabb.toRect();
    auto toCell = [cellSize](float v) {
        float c = std::floor(v / cellSize);
        return static_cast<int32_t>(std::clamp(c, -MAX_CELL_COORD, MAX_CELL_COORD));
    };
    range.minX = toCell(rect.left());
    range.maxX = toCell(rect.right());
    range.minY = toCell(rect.top());
    range.maxY = toCell(rect.bottom());
    return range;
}

SpatialGrid::CellRange SpatialGrid::fineRangeFor(const AABB& aabb) const {
    return rangeFor(aabb, m_fineCellSize);
}

SpatialGrid::CellRange SpatialGrid::coarseRangeFor(const AABB& aabb) const {
    return rangeFor(aabb, getCoarseCellSize());
}

bool SpatialGrid::accepts(PairKind kind, BodyClass a, BodyClass b) {
    if (kind == PairKind::Physical) {
        return a == BodyClass::Physical && b == BodyClass::Physical;
    }
    return a == BodyClass::Trigger || b == BodyClass::Trigger;
}

void SpatialGrid::rebuild(const std::vector<Item>& items) {
    clear();
    m_entries.reserve(items.size() * 2);
    for (const auto& item : items) {
        insert(item.handle, item.aabb, item.bodyClass);
    }
}

void SpatialGrid::insert(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass) {
    if (m_objects.contains(handle)) {
        update(handle, aabb, bodyClass);
        return;
    }
    insertTracked(handle, aabb, bodyClass);
}

bool SpatialGrid::update(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass) {
    auto it = m_objects.find(handle);
    if (it == m_objects.end()) {
        insertTracked(handle, aabb, bodyClass);
        return m_objects.contains(handle);
    }

    TrackedObject& tracked = it->second;
    if (aabb.isDegenerate()) {
        removeTracked(handle, tracked);
        m_objects.erase(it);
        return true;
    }

    CellRange newRange = fineRangeFor(aabb);
    bool newOversized = newRange.cellCount() > MAX_FINE_CELLS_PER_OBJECT;
    bool sameCells = tracked.bodyClass == bodyClass && tracked.oversized == newOversized &&
                     (newOversized || newRange == tracked.range);

    if (sameCells) {
        // Same cell membership: refresh stored boxes, grow cell bounds
        tracked.aabb = aabb;
        tracked.range = newRange;
        for (const auto& [key, entryIndex] : tracked.links) {
            m_entries[entryIndex].aabb = aabb;
            auto cellIt = m_fineCells.find(key);
            if (cellIt != m_fineCells.end()) {
                cellIt->second.bounds = cellIt->second.bounds.unite(aabb);
                registerCoarse(key, cellIt->second);
            }
        }
        return false;
    }

    removeTracked(handle, tracked);
    m_objects.erase(it);
    insertTracked(handle, aabb, bodyClass);
    return true;
}

bool SpatialGrid::remove(const ObjectHandle& handle) {
    auto it = m_objects.find(handle);
    if (it == m_objects.end()) {
        return false;
    }
    removeTracked(handle, it->second);
    m_objects.erase(it);
    return true;
}

void SpatialGrid::clear() {
    m_entries.clear();
    m_firstFree = NIL;
    m_freeCount = 0;
    m_fineCells.clear();
    m_coarseCells.clear();
    m_objects.clear();
    m_oversized.clear();
}

void SpatialGrid::insertTracked(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass) {
    if (aabb.isDegenerate()) {
        return; // takes part in no overlap, nothing to index
    }

    TrackedObject tracked;
    tracked.aabb = aabb;
    tracked.bodyClass = bodyClass;
    tracked.range = fineRangeFor(aabb);

    if (tracked.range.cellCount() > MAX_FINE_CELLS_PER_OBJECT) {
        tracked.oversized = true;
        m_oversized.push_back(handle);
        BROADPHASE_DEBUG(std::format("Object {}#{} spans {} fine cells, tracked as oversized",
                                     static_cast<int>(handle.group), handle.index,
                                     tracked.range.cellCount()));
    } else {
        for (int32_t y = tracked.range.minY; y <= tracked.range.maxY; ++y) {
            for (int32_t x = tracked.range.minX; x <= tracked.range.maxX; ++x) {
                GridKey key = computeGridKey(x, y);
                int32_t entryIndex = allocateEntry(handle, aabb, bodyClass);
                linkIntoCell(key, entryIndex);
                tracked.links.emplace_back(key, entryIndex);
            }
        }
    }

    m_objects.emplace(handle, std::move(tracked));
}

void SpatialGrid::removeTracked(const ObjectHandle& handle, TrackedObject& tracked) {
    if (tracked.oversized) {
        m_oversized.erase(std::remove(m_oversized.begin(), m_oversized.end(), handle),
                          m_oversized.end());
        return;
    }
    for (const auto& [key, entryIndex] : tracked.links) {
        unlinkFromCell(key, entryIndex);
        releaseEntry(entryIndex);
    }
    tracked.links.clear();
}

int32_t SpatialGrid::allocateEntry(const ObjectHandle& handle, const AABB& aabb, BodyClass bodyClass) {
    Entry entry{handle, aabb, bodyClass, NIL};
    if (m_firstFree != NIL) {
        int32_t index = m_firstFree;
        m_firstFree = m_entries[index].next;
        --m_freeCount;
        m_entries[index] = entry;
        return index;
    }
    m_entries.push_back(entry);
    return static_cast<int32_t>(m_entries.size() - 1);
}

void SpatialGrid::releaseEntry(int32_t index) {
    m_entries[index] = Entry{};
    m_entries[index].next = m_firstFree;
    m_firstFree = index;
    ++m_freeCount;
}

void SpatialGrid::linkIntoCell(GridKey key, int32_t entryIndex) {
    FineCell& cell = m_fineCells[key];
    Entry& entry = m_entries[entryIndex];
    cell.bounds = (cell.count == 0) ? entry.aabb : cell.bounds.unite(entry.aabb);
    entry.next = cell.first;
    cell.first = entryIndex;
    ++cell.count;
    registerCoarse(key, cell);
}

void SpatialGrid::unlinkFromCell(GridKey key, int32_t entryIndex) {
    auto cellIt = m_fineCells.find(key);
    if (cellIt == m_fineCells.end()) {
        BROADPHASE_ERROR(std::format("Fine cell {:#x} missing while unlinking entry {}", key, entryIndex));
        return;
    }
    FineCell& cell = cellIt->second;

    int32_t prev = NIL;
    int32_t cur = cell.first;
    while (cur != NIL && cur != entryIndex) {
        prev = cur;
        cur = m_entries[cur].next;
    }
    if (cur == NIL) {
        BROADPHASE_ERROR(std::format("Entry {} not linked in fine cell {:#x}", entryIndex, key));
        return;
    }

    if (prev == NIL) {
        cell.first = m_entries[cur].next;
    } else {
        m_entries[prev].next = m_entries[cur].next;
    }
    m_entries[cur].next = NIL;
    --cell.count;

    if (cell.count == 0) {
        unregisterCoarse(key, cell.coarseRange);
        m_fineCells.erase(cellIt);
    } else {
        // Bounds may only shrink here; coarse references stay a superset until shrink()
        recomputeCellBounds(cell);
    }
}

void SpatialGrid::recomputeCellBounds(FineCell& cell) {
    bool first = true;
    for (int32_t cur = cell.first; cur != NIL; cur = m_entries[cur].next) {
        cell.bounds = first ? m_entries[cur].aabb : cell.bounds.unite(m_entries[cur].aabb);
        first = false;
    }
}

void SpatialGrid::registerCoarse(GridKey fineKey, FineCell& cell) {
    CellRange needed = coarseRangeFor(padded(cell.bounds, m_fineCellSize * BOUNDS_PADDING_FRACTION));
    CellRange merged = cell.coarseRange.merged(needed);
    if (merged == cell.coarseRange) {
        return;
    }
    for (int32_t y = merged.minY; y <= merged.maxY; ++y) {
        for (int32_t x = merged.minX; x <= merged.maxX; ++x) {
            if (!cell.coarseRange.empty() && cell.coarseRange.contains(x, y)) {
                continue;
            }
            m_coarseCells[computeGridKey(x, y)].fineCells.push_back(fineKey);
        }
    }
    cell.coarseRange = merged;
}

void SpatialGrid::unregisterCoarse(GridKey fineKey, const CellRange& coarseRange) {
    if (coarseRange.empty()) {
        return;
    }
    for (int32_t y = coarseRange.minY; y <= coarseRange.maxY; ++y) {
        for (int32_t x = coarseRange.minX; x <= coarseRange.maxX; ++x) {
            auto coarseIt = m_coarseCells.find(computeGridKey(x, y));
            if (coarseIt == m_coarseCells.end()) {
                continue;
            }
            auto& refs = coarseIt->second.fineCells;
            refs.erase(std::remove(refs.begin(), refs.end(), fineKey), refs.end());
            if (refs.empty()) {
                m_coarseCells.erase(coarseIt);
            }
        }
    }
}

float SpatialGrid::fragmentation() const {
    if (m_entries.empty()) {
        return 0.0f;
    }
    return static_cast<float>(m_freeCount) / static_cast<float>(m_entries.size());
}

size_t SpatialGrid::shrink(float fragmentationThreshold) {
    std::erase_if(m_coarseCells, [](const auto& kv) { return kv.second.fineCells.empty(); });

    if (m_entries.empty() || fragmentation() <= fragmentationThreshold) {
        return 0;
    }

    size_t arenaBefore = m_entries.size();

    std::vector<Item> items;
    items.reserve(m_objects.size());
    for (const auto& [handle, tracked] : m_objects) {
        items.push_back(Item{handle, tracked.aabb, tracked.bodyClass});
    }
    std::sort(items.begin(), items.end(),
              [](const Item& a, const Item& b) { return a.handle < b.handle; });

    clear();
    m_entries.shrink_to_fit();
    for (const auto& item : items) {
        insertTracked(item.handle, item.aabb, item.bodyClass);
    }

    size_t reclaimed = arenaBefore - m_entries.size();
    BROADPHASE_DEBUG(std::format("shrink(): arena {} -> {} slots, {} objects, {} fine cells",
                                 arenaBefore, m_entries.size(), m_objects.size(), m_fineCells.size()));
    return reclaimed;
}

void SpatialGrid::collectPairs(PairKind kind, std::vector<CandidatePair>& outPairs) const {
    outPairs.clear();
    m_tempVisitedCells.clear();

    auto pushPair = [&outPairs](const ObjectHandle& a, const ObjectHandle& b) {
        if (a == b) return;
        outPairs.emplace_back(std::min(a, b), std::max(a, b));
    };

    // Walk coarse cells, then the fine cells they reference
    for (const auto& [coarseKey, coarse] : m_coarseCells) {
        for (GridKey fineKey : coarse.fineCells) {
            if (!m_tempVisitedCells.insert(fineKey).second) {
                continue;
            }
            auto cellIt = m_fineCells.find(fineKey);
            if (cellIt == m_fineCells.end() || cellIt->second.count < 2) {
                continue;
            }

            m_tempCellEntries.clear();
            for (int32_t cur = cellIt->second.first; cur != NIL; cur = m_entries[cur].next) {
                m_tempCellEntries.push_back(&m_entries[cur]);
            }

            for (size_t i = 0; i < m_tempCellEntries.size(); ++i) {
                const Entry* a = m_tempCellEntries[i];
                for (size_t j = i + 1; j < m_tempCellEntries.size(); ++j) {
                    const Entry* b = m_tempCellEntries[j];
                    if (accepts(kind, a->bodyClass, b->bodyClass)) {
                        pushPair(a->handle, b->handle);
                    }
                }
            }
        }
    }

    for (const ObjectHandle& big : m_oversized) {
        const TrackedObject& bigTracked = m_objects.at(big);
        for (const auto& [handle, tracked] : m_objects) {
            if (accepts(kind, bigTracked.bodyClass, tracked.bodyClass)) {
                pushPair(big, handle);
            }
        }
    }

    // Objects sharing several cells show up once per shared cell
    std::sort(outPairs.begin(), outPairs.end());
    outPairs.erase(std::unique(outPairs.begin(), outPairs.end()), outPairs.end());
}

void SpatialGrid::query(const AABB& area, std::vector<ObjectHandle>& outHandles) const {
    outHandles.clear();
    if (area.isDegenerate()) {
        return;
    }
    m_tempVisitedCells.clear();

    const float pad = m_fineCellSize * BOUNDS_PADDING_FRACTION;
    CellRange coarseRange = coarseRangeFor(area);

    auto visitCoarse = [&](const CoarseCell& coarse) {
        for (GridKey fineKey : coarse.fineCells) {
            if (!m_tempVisitedCells.insert(fineKey).second) {
                continue;
            }
            auto cellIt = m_fineCells.find(fineKey);
            if (cellIt == m_fineCells.end() || !overlap(padded(cellIt->second.bounds, pad), area)) {
                continue;
            }
            for (int32_t cur = cellIt->second.first; cur != NIL; cur = m_entries[cur].next) {
                if (overlap(m_entries[cur].aabb, area)) {
                    outHandles.push_back(m_entries[cur].handle);
                }
            }
        }
    };

    if (coarseRange.cellCount() > m_coarseCells.size()) {
        // Large area: cheaper to filter the populated coarse cells
        for (const auto& [coarseKey, coarse] : m_coarseCells) {
            if (coarseRange.contains(coordFromKey(coarseKey >> 32), coordFromKey(coarseKey))) {
                visitCoarse(coarse);
            }
        }
    } else {
        for (int32_t y = coarseRange.minY; y <= coarseRange.maxY; ++y) {
            for (int32_t x = coarseRange.minX; x <= coarseRange.maxX; ++x) {
                auto coarseIt = m_coarseCells.find(computeGridKey(x, y));
                if (coarseIt != m_coarseCells.end()) {
                    visitCoarse(coarseIt->second);
                }
            }
        }
    }

    for (const ObjectHandle& big : m_oversized) {
        if (overlap(m_objects.at(big).aabb, area)) {
            outHandles.push_back(big);
        }
    }

    std::sort(outHandles.begin(), outHandles.end());
    outHandles.erase(std::unique(outHandles.begin(), outHandles.end()), outHandles.end());
}

void SpatialGrid::logStatistics() const {
    BROADPHASE_INFO("Spatial Grid Statistics:");
    BROADPHASE_INFO(std::format("  Cell sizes: fine {} / coarse {}", m_fineCellSize, getCoarseCellSize()));
    BROADPHASE_INFO(std::format("  Objects: {} ({} oversized)", m_objects.size(), m_oversized.size()));
    BROADPHASE_INFO(std::format("  Fine cells: {}, coarse cells: {}", m_fineCells.size(), m_coarseCells.size()));
    BROADPHASE_INFO(std::format("  Arena: {} slots, {} free ({:.1f}% fragmented)",
                                m_entries.size(), m_freeCount, fragmentation() * 100.0f));
}

} // namespace BumperEngine
