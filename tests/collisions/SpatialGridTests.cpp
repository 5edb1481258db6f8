/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SpatialGridTests
#include <boost/test/unit_test.hpp>

#include "collisions/AABB.hpp"
#include "collisions/ObjectHandle.hpp"
#include "collisions/SpatialGrid.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

using namespace BumperEngine;

namespace {
using BodyClass = SpatialGrid::BodyClass;
using PairKind = SpatialGrid::PairKind;
using CandidatePair = SpatialGrid::CandidatePair;

ObjectHandle physical(uint32_t i) { return ObjectHandle(ObjectGroup::Physical, i); }
ObjectHandle trigger(uint32_t i) { return ObjectHandle(ObjectGroup::Trigger, i); }

bool hasPair(const std::vector<CandidatePair>& pairs, ObjectHandle a, ObjectHandle b) {
    CandidatePair p(std::min(a, b), std::max(a, b));
    return std::find(pairs.begin(), pairs.end(), p) != pairs.end();
}

// Reference all-pairs broad phase, filtered by the exact overlap test
std::vector<CandidatePair> overlappingPairs(const std::vector<SpatialGrid::Item>& items, PairKind kind) {
    std::vector<CandidatePair> out;
    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            bool bothPhysical = items[i].bodyClass == BodyClass::Physical &&
                                items[j].bodyClass == BodyClass::Physical;
            if (bothPhysical != (kind == PairKind::Physical)) continue;
            if (!overlap(items[i].aabb, items[j].aabb)) continue;
            out.emplace_back(std::min(items[i].handle, items[j].handle),
                             std::max(items[i].handle, items[j].handle));
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<CandidatePair> filterOverlapping(const std::vector<CandidatePair>& candidates,
                                             const std::vector<SpatialGrid::Item>& items) {
    auto boxOf = [&](const ObjectHandle& h) {
        return std::find_if(items.begin(), items.end(),
                            [&](const SpatialGrid::Item& it) { return it.handle == h; })->aabb;
    };
    std::vector<CandidatePair> out;
    for (const auto& p : candidates) {
        if (overlap(boxOf(p.first), boxOf(p.second))) out.push_back(p);
    }
    return out;
}
} // namespace

BOOST_AUTO_TEST_SUITE(SpatialGridBasicTests)

BOOST_AUTO_TEST_CASE(TestConfigureRejectsBadSizes)
{
    BOOST_CHECK_THROW(SpatialGrid(0.0f, 4), std::invalid_argument);
    BOOST_CHECK_THROW(SpatialGrid(32.0f, 0), std::invalid_argument);

    SpatialGrid grid;
    BOOST_CHECK_EQUAL(grid.getFineCellSize(), 32.0f);
    BOOST_CHECK_EQUAL(grid.getCoarseCellSize(), 128.0f);
    BOOST_CHECK_THROW(grid.configure(-5.0f, 2), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestCellRanges)
{
    SpatialGrid grid;
    auto range = grid.fineRangeFor(AABB(16.0f, 16.0f, 8.0f, 8.0f)); // 12..20
    BOOST_CHECK_EQUAL(range.minX, 0);
    BOOST_CHECK_EQUAL(range.maxX, 0);
    BOOST_CHECK_EQUAL(range.cellCount(), 1u);

    range = grid.fineRangeFor(AABB(32.0f, 32.0f, 16.0f, 16.0f)); // 24..40
    BOOST_CHECK_EQUAL(range.minX, 0);
    BOOST_CHECK_EQUAL(range.maxX, 1);
    BOOST_CHECK_EQUAL(range.cellCount(), 4u);

    range = grid.fineRangeFor(AABB(-10.0f, 0.0f, 4.0f, 4.0f)); // negative coordinates
    BOOST_CHECK_EQUAL(range.minX, -1);
    BOOST_CHECK_EQUAL(range.minY, -1);
    BOOST_CHECK_EQUAL(range.maxY, 0);

    auto coarse = grid.coarseRangeFor(AABB(200.0f, 10.0f, 8.0f, 8.0f));
    BOOST_CHECK_EQUAL(coarse.minX, 1);
    BOOST_CHECK_EQUAL(coarse.maxX, 1);
}

BOOST_AUTO_TEST_CASE(TestInsertAndQuery)
{
    SpatialGrid grid;
    grid.insert(physical(0), AABB(16.0f, 16.0f, 8.0f, 8.0f), BodyClass::Physical);
    grid.insert(physical(1), AABB(48.0f, 16.0f, 8.0f, 8.0f), BodyClass::Physical);
    grid.insert(trigger(0), AABB(32.0f, 32.0f, 16.0f, 16.0f), BodyClass::Trigger);

    BOOST_CHECK_EQUAL(grid.getObjectCount(), 3u);
    BOOST_CHECK_EQUAL(grid.getEntryCount(), 6u); // 1 + 1 + 4 cells

    std::vector<ObjectHandle> results;
    grid.query(AABB(14.0f, 14.0f, 12.0f, 12.0f), results);
    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK(results[0] == physical(0));

    grid.query(AABB(32.0f, 24.0f, 64.0f, 16.0f), results);
    BOOST_CHECK_EQUAL(results.size(), 3u);
    BOOST_CHECK(std::is_sorted(results.begin(), results.end()));

    grid.query(AABB(1000.0f, 1000.0f, 10.0f, 10.0f), results);
    BOOST_CHECK(results.empty());
}

BOOST_AUTO_TEST_CASE(TestRemoveReleasesEntries)
{
    SpatialGrid grid;
    grid.insert(physical(0), AABB(32.0f, 32.0f, 16.0f, 16.0f), BodyClass::Physical);
    BOOST_CHECK_EQUAL(grid.getFineCellCount(), 4u);

    BOOST_CHECK(grid.remove(physical(0)));
    BOOST_CHECK(!grid.contains(physical(0)));
    BOOST_CHECK_EQUAL(grid.getEntryCount(), 0u);
    BOOST_CHECK_EQUAL(grid.getFreeSlotCount(), 4u);
    BOOST_CHECK_EQUAL(grid.getFineCellCount(), 0u);
    BOOST_CHECK_EQUAL(grid.getCoarseCellCount(), 0u);
    BOOST_CHECK(!grid.remove(physical(0)));

    // Freed slots are reused before the arena grows
    grid.insert(physical(1), AABB(100.0f, 100.0f, 8.0f, 8.0f), BodyClass::Physical);
    BOOST_CHECK_EQUAL(grid.getArenaSize(), 4u);
    BOOST_CHECK_EQUAL(grid.getFreeSlotCount(), 3u);
}

BOOST_AUTO_TEST_CASE(TestUpdateInPlaceAndRelocation)
{
    SpatialGrid grid;
    ObjectHandle h = physical(0);
    grid.insert(h, AABB(10.0f, 10.0f, 8.0f, 8.0f), BodyClass::Physical);

    // Same cell: refreshed in place
    BOOST_CHECK(!grid.update(h, AABB(12.0f, 10.0f, 8.0f, 8.0f), BodyClass::Physical));
    std::vector<ObjectHandle> results;
    grid.query(AABB(16.5f, 10.0f, 1.0f, 1.0f), results); // only the moved box reaches x = 16
    BOOST_CHECK_EQUAL(results.size(), 1u);

    // Different coarse cell: relocated
    BOOST_CHECK(grid.update(h, AABB(300.0f, 300.0f, 8.0f, 8.0f), BodyClass::Physical));
    grid.query(AABB(10.0f, 10.0f, 16.0f, 16.0f), results);
    BOOST_CHECK(results.empty());
    grid.query(AABB(300.0f, 300.0f, 4.0f, 4.0f), results);
    BOOST_CHECK_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(grid.getObjectCount(), 1u);
    BOOST_CHECK_EQUAL(grid.getEntryCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDegenerateBoxesAreNotIndexed)
{
    SpatialGrid grid;
    grid.insert(physical(0), AABB(10.0f, 10.0f, 0.0f, 0.0f), BodyClass::Physical);
    BOOST_CHECK(!grid.contains(physical(0)));

    grid.insert(physical(1), AABB(10.0f, 10.0f, 8.0f, 8.0f), BodyClass::Physical);
    BOOST_CHECK(grid.update(physical(1), AABB(10.0f, 10.0f, 0.0f, 8.0f), BodyClass::Physical));
    BOOST_CHECK(!grid.contains(physical(1)));
    BOOST_CHECK_EQUAL(grid.getEntryCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestOversizedObjectsPairWithEverything)
{
    SpatialGrid grid;
    // 2048 x 2048 covers 64 x 64 fine cells
    grid.insert(physical(0), AABB(0.0f, 0.0f, 2048.0f, 2048.0f), BodyClass::Physical);
    grid.insert(physical(1), AABB(500.0f, 500.0f, 8.0f, 8.0f), BodyClass::Physical);
    grid.insert(trigger(0), AABB(-500.0f, 100.0f, 8.0f, 8.0f), BodyClass::Trigger);

    BOOST_CHECK_EQUAL(grid.getOversizedCount(), 1u);
    BOOST_CHECK_EQUAL(grid.getEntryCount(), 2u);

    std::vector<CandidatePair> pairs;
    grid.collectPairs(PairKind::Physical, pairs);
    BOOST_CHECK(hasPair(pairs, physical(0), physical(1)));
    grid.collectPairs(PairKind::Trigger, pairs);
    BOOST_CHECK(hasPair(pairs, physical(0), trigger(0)));

    std::vector<ObjectHandle> results;
    grid.query(AABB(-900.0f, -900.0f, 10.0f, 10.0f), results);
    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK(results[0] == physical(0));

    BOOST_CHECK(grid.remove(physical(0)));
    BOOST_CHECK_EQUAL(grid.getOversizedCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SpatialGridPairTests)

BOOST_AUTO_TEST_CASE(TestPairsAreDeduplicated)
{
    SpatialGrid grid;
    // Both boxes straddle the same four fine cells
    grid.insert(physical(0), AABB(32.0f, 32.0f, 16.0f, 16.0f), BodyClass::Physical);
    grid.insert(physical(1), AABB(34.0f, 30.0f, 16.0f, 16.0f), BodyClass::Physical);

    std::vector<CandidatePair> pairs;
    grid.collectPairs(PairKind::Physical, pairs);
    BOOST_REQUIRE_EQUAL(pairs.size(), 1u);
    BOOST_CHECK(pairs[0].first == physical(0));
    BOOST_CHECK(pairs[0].second == physical(1));
}

BOOST_AUTO_TEST_CASE(TestPairKindsSplitPipelines)
{
    SpatialGrid grid;
    grid.insert(physical(0), AABB(10.0f, 10.0f, 16.0f, 16.0f), BodyClass::Physical);
    grid.insert(physical(1), AABB(14.0f, 10.0f, 16.0f, 16.0f), BodyClass::Physical);
    grid.insert(trigger(0), AABB(12.0f, 12.0f, 8.0f, 8.0f), BodyClass::Trigger);
    grid.insert(trigger(1), AABB(12.0f, 14.0f, 8.0f, 8.0f), BodyClass::Trigger);

    std::vector<CandidatePair> pairs;
    grid.collectPairs(PairKind::Physical, pairs);
    BOOST_REQUIRE_EQUAL(pairs.size(), 1u);
    BOOST_CHECK(hasPair(pairs, physical(0), physical(1)));

    grid.collectPairs(PairKind::Trigger, pairs);
    BOOST_CHECK_EQUAL(pairs.size(), 5u); // t0-t1 plus each trigger with each physical
    BOOST_CHECK(hasPair(pairs, trigger(0), trigger(1)));
    BOOST_CHECK(hasPair(pairs, trigger(1), physical(0)));
    BOOST_CHECK(!hasPair(pairs, physical(0), physical(1)));
}

BOOST_AUTO_TEST_CASE(TestTouchingAcrossCellBorderIsFound)
{
    SpatialGrid grid;
    // Shared edge lies exactly on x = 32
    grid.insert(physical(0), AABB(24.0f, 8.0f, 16.0f, 16.0f), BodyClass::Physical);
    grid.insert(physical(1), AABB(40.0f, 8.0f, 16.0f, 16.0f), BodyClass::Physical);

    std::vector<CandidatePair> pairs;
    grid.collectPairs(PairKind::Physical, pairs);
    BOOST_CHECK(hasPair(pairs, physical(0), physical(1)));
}

BOOST_AUTO_TEST_CASE(TestGridMatchesAllPairs)
{
    std::mt19937 rng(98765);
    std::uniform_real_distribution<float> pos(-400.0f, 400.0f);
    std::uniform_real_distribution<float> ext(4.0f, 80.0f);
    std::uniform_int_distribution<int> coin(0, 3);

    std::vector<SpatialGrid::Item> items;
    uint32_t nextTrigger = 0, nextPhysical = 0;
    for (int i = 0; i < 300; ++i) {
        bool isTrigger = coin(rng) == 0;
        ObjectHandle h = isTrigger ? trigger(nextTrigger++) : physical(nextPhysical++);
        items.push_back({h, AABB(pos(rng), pos(rng), ext(rng), ext(rng)),
                         isTrigger ? BodyClass::Trigger : BodyClass::Physical});
    }

    SpatialGrid grid;
    grid.rebuild(items);

    std::vector<CandidatePair> candidates;
    for (PairKind kind : {PairKind::Physical, PairKind::Trigger}) {
        grid.collectPairs(kind, candidates);
        BOOST_CHECK(std::is_sorted(candidates.begin(), candidates.end()));
        BOOST_CHECK(std::adjacent_find(candidates.begin(), candidates.end()) == candidates.end());
        auto expected = overlappingPairs(items, kind);
        auto actual = filterOverlapping(candidates, items);
        BOOST_CHECK_EQUAL(actual.size(), expected.size());
        BOOST_CHECK(actual == expected);
    }

    // Move everything, update incrementally, and compare again
    for (auto& item : items) {
        item.aabb = item.aabb.translated(Vector2D(pos(rng) * 0.1f, pos(rng) * 0.1f));
        grid.update(item.handle, item.aabb, item.bodyClass);
    }
    grid.collectPairs(PairKind::Physical, candidates);
    BOOST_CHECK(filterOverlapping(candidates, items) == overlappingPairs(items, PairKind::Physical));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SpatialGridShrinkTests)

BOOST_AUTO_TEST_CASE(TestShrinkCompactsFragmentedArena)
{
    SpatialGrid grid;
    for (uint32_t i = 0; i < 100; ++i) {
        grid.insert(physical(i), AABB(i * 40.0f, 0.0f, 16.0f, 16.0f), BodyClass::Physical);
    }
    size_t arenaBefore = grid.getArenaSize();
    for (uint32_t i = 0; i < 100; ++i) {
        if (i % 4 != 0) grid.remove(physical(i));
    }
    BOOST_CHECK_GT(grid.fragmentation(), 0.5f);

    size_t reclaimed = grid.shrink(0.5f);
    BOOST_CHECK_GT(reclaimed, 0u);
    BOOST_CHECK_LT(grid.getArenaSize(), arenaBefore);
    BOOST_CHECK_EQUAL(grid.getFreeSlotCount(), 0u);
    BOOST_CHECK_EQUAL(grid.getObjectCount(), 25u);

    // Nothing live was dropped
    for (uint32_t i = 0; i < 100; i += 4) {
        BOOST_CHECK(grid.contains(physical(i)));
        std::vector<ObjectHandle> results;
        grid.query(AABB(i * 40.0f, 0.0f, 4.0f, 4.0f), results);
        BOOST_REQUIRE_EQUAL(results.size(), 1u);
        BOOST_CHECK(results[0] == physical(i));
    }
}

BOOST_AUTO_TEST_CASE(TestShrinkBelowThresholdKeepsArena)
{
    SpatialGrid grid;
    for (uint32_t i = 0; i < 10; ++i) {
        grid.insert(physical(i), AABB(i * 40.0f, 0.0f, 16.0f, 16.0f), BodyClass::Physical);
    }
    grid.remove(physical(3));
    size_t arena = grid.getArenaSize();
    BOOST_CHECK_EQUAL(grid.shrink(0.5f), 0u);
    BOOST_CHECK_EQUAL(grid.getArenaSize(), arena);
    BOOST_CHECK_EQUAL(grid.getObjectCount(), 9u);
}

BOOST_AUTO_TEST_SUITE_END()
