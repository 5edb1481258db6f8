/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AABBTests
#include <boost/test/unit_test.hpp>

#include "collisions/AABB.hpp"
#include "collisions/CollisionPolicy.hpp"
#include "utils/Vector2D.hpp"
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

using namespace BumperEngine;

BOOST_AUTO_TEST_SUITE(AABBGeometryTests)

BOOST_AUTO_TEST_CASE(TestAABBBasicProperties)
{
    AABB aabb(10.0f, 20.0f, 10.0f, 15.0f);

    BOOST_CHECK_CLOSE(aabb.left(), 5.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.right(), 15.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.top(), 12.5f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.bottom(), 27.5f, 0.01f);

    auto [lo, hi] = aabb.corners();
    BOOST_CHECK_CLOSE(lo.getX(), 5.0f, 0.01f);
    BOOST_CHECK_CLOSE(hi.getY(), 27.5f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestRectConversionRoundTrip)
{
    AABB aabb(8.0f, 120.0f, 16.0f, 240.0f);
    Rect rect = aabb.toRect();
    BOOST_CHECK_EQUAL(rect.left(), 0.0f);
    BOOST_CHECK_EQUAL(rect.top(), 0.0f);
    BOOST_CHECK_EQUAL(rect.right(), 16.0f);
    BOOST_CHECK_EQUAL(rect.bottom(), 240.0f);
    BOOST_CHECK(AABB::fromRect(rect) == aabb);

    // Zero-size boxes convert exactly both ways
    AABB point(3.0f, -7.0f, 0.0f, 0.0f);
    BOOST_CHECK(AABB::fromRect(point.toRect()) == point);
}

BOOST_AUTO_TEST_CASE(TestOverlapMagnitudes)
{
    AABB a(0.0f, 0.0f, 16.0f, 16.0f);
    AABB b(12.0f, 2.0f, 16.0f, 16.0f);

    auto result = overlap(a, b);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_CLOSE(result->getX(), 4.0f, 0.001f);
    BOOST_CHECK_CLOSE(result->getY(), 14.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestOverlapContainedBox)
{
    AABB wall(8.0f, 120.0f, 16.0f, 240.0f);
    AABB guy(8.0f, 120.0f, 16.0f, 16.0f);

    auto result = overlap(guy, wall);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->getX(), 16.0f);
    BOOST_CHECK_EQUAL(result->getY(), 16.0f);
}

BOOST_AUTO_TEST_CASE(TestSeparatedBoxesNeverOverlap)
{
    AABB a(0.0f, 0.0f, 10.0f, 10.0f);
    BOOST_CHECK(!overlap(a, AABB(20.0f, 0.0f, 10.0f, 10.0f)).has_value());  // right
    BOOST_CHECK(!overlap(a, AABB(-20.0f, 0.0f, 10.0f, 10.0f)).has_value()); // left
    BOOST_CHECK(!overlap(a, AABB(0.0f, 10.5f, 10.0f, 10.0f)).has_value());  // below
    BOOST_CHECK(!overlap(a, AABB(5.0f, -30.0f, 10.0f, 10.0f)).has_value()); // above, x overlaps
}

BOOST_AUTO_TEST_CASE(TestTouchingBoxesReportZeroOverlap)
{
    AABB a(0.0f, 0.0f, 10.0f, 10.0f);
    AABB b(10.0f, 0.0f, 10.0f, 10.0f);

    auto result = overlap(a, b);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->getX(), 0.0f);
    BOOST_CHECK_EQUAL(result->getY(), 10.0f);
}

BOOST_AUTO_TEST_CASE(TestDegenerateBoxesNeverOverlap)
{
    AABB box(0.0f, 0.0f, 10.0f, 10.0f);
    AABB zero(0.0f, 0.0f, 0.0f, 0.0f);
    AABB flat(0.0f, 0.0f, 10.0f, 0.0f);
    AABB nan(std::numeric_limits<float>::quiet_NaN(), 0.0f, 10.0f, 10.0f);
    AABB inf(0.0f, 0.0f, std::numeric_limits<float>::infinity(), 10.0f);

    BOOST_CHECK(zero.isDegenerate());
    BOOST_CHECK(flat.isDegenerate());
    BOOST_CHECK(nan.isDegenerate());
    BOOST_CHECK(inf.isDegenerate());
    BOOST_CHECK(!box.isDegenerate());

    BOOST_CHECK(!overlap(box, zero).has_value());
    BOOST_CHECK(!overlap(flat, box).has_value());
    BOOST_CHECK(!overlap(box, nan).has_value());
    BOOST_CHECK(!overlap(inf, box).has_value());
}

BOOST_AUTO_TEST_CASE(TestOverlapSymmetry)
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> pos(-100.0f, 100.0f);
    std::uniform_real_distribution<float> ext(0.5f, 60.0f);

    for (int i = 0; i < 500; ++i) {
        AABB a(pos(rng), pos(rng), ext(rng), ext(rng));
        AABB b(pos(rng), pos(rng), ext(rng), ext(rng));
        auto ab = overlap(a, b);
        auto ba = overlap(b, a);
        BOOST_REQUIRE_EQUAL(ab.has_value(), ba.has_value());
        if (ab) {
            BOOST_CHECK_EQUAL(ab->getX(), ba->getX());
            BOOST_CHECK_EQUAL(ab->getY(), ba->getY());
            BOOST_CHECK_GE(ab->getX(), 0.0f);
            BOOST_CHECK_GE(ab->getY(), 0.0f);
        } else {
            Rect ra = a.toRect();
            Rect rb = b.toRect();
            bool apartX = ra.right() < rb.left() || rb.right() < ra.left();
            bool apartY = ra.bottom() < rb.top() || rb.bottom() < ra.top();
            BOOST_CHECK(apartX || apartY);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestUniteIgnoresZeroSizeBox)
{
    AABB a(0.0f, 0.0f, 10.0f, 10.0f);
    AABB b(20.0f, 10.0f, 10.0f, 10.0f);

    AABB both = a.unite(b);
    BOOST_CHECK_CLOSE(both.left(), -5.0f, 0.001f);
    BOOST_CHECK_CLOSE(both.right(), 25.0f, 0.001f);
    BOOST_CHECK_CLOSE(both.top(), -5.0f, 0.001f);
    BOOST_CHECK_CLOSE(both.bottom(), 15.0f, 0.001f);

    AABB empty(100.0f, 100.0f, 0.0f, 0.0f);
    BOOST_CHECK(a.unite(empty) == a);
    BOOST_CHECK(empty.unite(a) == a);
}

BOOST_AUTO_TEST_CASE(TestDilateKeepsCenter)
{
    AABB a(0.0f, 0.0f, 10.0f, 10.0f);
    AABB far(20.0f, 0.0f, 4.0f, 4.0f); // reaches x = 22

    AABB grown = a.dilate(far);
    BOOST_CHECK(grown.center == a.center);
    BOOST_CHECK_CLOSE(grown.size.getX(), 44.0f, 0.001f);
    BOOST_CHECK_CLOSE(grown.size.getY(), 10.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestContainsAndTranslate)
{
    AABB aabb(10.0f, 10.0f, 10.0f, 10.0f);
    BOOST_CHECK(aabb.contains(Vector2D(10.0f, 10.0f)));
    BOOST_CHECK(aabb.contains(Vector2D(5.0f, 5.0f)));
    BOOST_CHECK(!aabb.contains(Vector2D(16.0f, 10.0f)));

    AABB moved = aabb.translated(Vector2D(3.0f, -2.0f));
    BOOST_CHECK_EQUAL(moved.center.getX(), 13.0f);
    BOOST_CHECK_EQUAL(moved.center.getY(), 8.0f);
    BOOST_CHECK(moved.size == aabb.size);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CollisionPolicyTests)

BOOST_AUTO_TEST_CASE(TestPolicyGroups)
{
    BOOST_CHECK(CollisionPolicy::none().group() == ObjectGroup::NonColliding);
    BOOST_CHECK(CollisionPolicy::trigger().group() == ObjectGroup::Trigger);
    BOOST_CHECK(CollisionPolicy::solid().group() == ObjectGroup::Physical);
    BOOST_CHECK(CollisionPolicy::pushableSolid().group() == ObjectGroup::Physical);
}

BOOST_AUTO_TEST_CASE(TestFlagQueries)
{
    CollisionPolicy wall = CollisionPolicy::solid();
    BOOST_CHECK(wall.isSolid());
    BOOST_CHECK(!wall.isPushable());

    CollisionPolicy crate = CollisionPolicy::pushableSolid();
    BOOST_CHECK(crate.isSolid());
    BOOST_CHECK(crate.isPushable());
    BOOST_CHECK(crate.isPushableSolid());

    BOOST_CHECK(!CollisionPolicy::trigger().isSolid());
    BOOST_CHECK(!CollisionPolicy::none().isPushable());
}

BOOST_AUTO_TEST_CASE(TestEmptyCollidingMaskIsRejected)
{
    CollisionPolicy empty = CollisionPolicy::colliding(CollisionFlags(0));
    BOOST_CHECK(!empty.isValid());
    BOOST_CHECK_THROW(empty.validate(), std::invalid_argument);

    CollisionPolicy stray = CollisionPolicy::colliding(CollisionFlags(0b101));
    BOOST_CHECK(!stray.isValid());
    BOOST_CHECK_THROW(stray.validate(), std::invalid_argument);

    BOOST_CHECK_NO_THROW(CollisionPolicy::pushable().validate());
    BOOST_CHECK_NO_THROW(CollisionPolicy::trigger().validate());
    BOOST_CHECK_NO_THROW(CollisionPolicy::none().validate());
}

BOOST_AUTO_TEST_SUITE_END()
