/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GeometryClassifierTests
#include <boost/test/unit_test.hpp>

#include "navigation/GeometryClassifier.hpp"
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace AccessOverlay;
using namespace AccessOverlay::GeometryClassifier;

BOOST_AUTO_TEST_SUITE(CardinalDirectionTests)

BOOST_AUTO_TEST_CASE(TestPrincipalDirections) {
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(1.0f, 0.0f))), std::string("right"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(1.0f, 1.0f))), std::string("up and right"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(0.0f, 1.0f))), std::string("up"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(-1.0f, 1.0f))), std::string("up and left"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(-1.0f, 0.0f))), std::string("left"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(-1.0f, -1.0f))), std::string("down and left"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(0.0f, -1.0f))), std::string("down"));
    BOOST_CHECK_EQUAL(toString(cardinalDirection(Vector2D(1.0f, -1.0f))), std::string("down and right"));
}

BOOST_AUTO_TEST_CASE(TestSectorEdges) {
    // Sectors are 45 degrees wide and centred on each direction
    BOOST_CHECK(cardinalDirection(Vector2D(1.0f, 0.3f)) == CardinalDirection::RIGHT);
    BOOST_CHECK(cardinalDirection(Vector2D(1.0f, -0.3f)) == CardinalDirection::RIGHT);
    BOOST_CHECK(cardinalDirection(Vector2D(1.0f, 0.6f)) == CardinalDirection::UP_RIGHT);
    BOOST_CHECK(cardinalDirection(Vector2D(0.3f, 1.0f)) == CardinalDirection::UP);
    BOOST_CHECK(cardinalDirection(Vector2D(-1.0f, -0.01f)) == CardinalDirection::LEFT);
}

BOOST_AUTO_TEST_CASE(TestScaleInvariance) {
    std::vector<Vector2D> const offsets{
        Vector2D(3.0f, 0.5f), Vector2D(-2.0f, 7.0f), Vector2D(0.1f, -0.9f),
        Vector2D(-4.0f, -4.5f), Vector2D(6.0f, 5.0f), Vector2D(0.0f, 2.0f)};
    std::vector<float> const factors{0.25f, 2.0f, 10.0f, 1000.0f};

    for (const auto& offset : offsets) {
        CardinalDirection const expected = cardinalDirection(offset);
        for (float factor : factors) {
            BOOST_CHECK(cardinalDirection(offset * factor) == expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestEveryOffsetGetsOneOfEightLabels) {
    std::set<std::string> labels;
    for (int degrees = 0; degrees < 360; degrees += 5) {
        float const radians = static_cast<float>(degrees) * 3.14159265f / 180.0f;
        labels.insert(toString(cardinalDirection(Vector2D(std::cos(radians), std::sin(radians)))));
    }
    BOOST_CHECK_EQUAL(labels.size(), 8u);
    BOOST_CHECK(labels.count("unknown") == 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EntryDirectionTests)

BOOST_AUTO_TEST_CASE(TestCompassConvention) {
    BOOST_CHECK_EQUAL(toString(entryDirection(Vector2D(0.0f, -1.0f))), std::string("north"));
    BOOST_CHECK_EQUAL(toString(entryDirection(Vector2D(0.0f, 1.0f))), std::string("south"));
    BOOST_CHECK_EQUAL(toString(entryDirection(Vector2D(1.0f, 0.0f))), std::string("east"));
    BOOST_CHECK_EQUAL(toString(entryDirection(Vector2D(-1.0f, 0.0f))), std::string("west"));
}

BOOST_AUTO_TEST_CASE(TestDiagonalsResolveToNearestQuadrant) {
    BOOST_CHECK(entryDirection(Vector2D(2.0f, -0.5f)) == CompassDirection::EAST);
    BOOST_CHECK(entryDirection(Vector2D(-0.5f, -2.0f)) == CompassDirection::NORTH);
    BOOST_CHECK(entryDirection(Vector2D(-2.0f, 0.5f)) == CompassDirection::WEST);
    BOOST_CHECK(entryDirection(Vector2D(0.5f, 2.0f)) == CompassDirection::SOUTH);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RoomRelativePositionTests)

BOOST_AUTO_TEST_CASE(TestCenterAndCorners) {
    AABB const bounds = AABB::fromMinMax(Vector2D(0.0f, 0.0f), Vector2D(9.0f, 6.0f));

    BOOST_CHECK_EQUAL(roomRelativePosition(Vector2D(4.5f, 3.0f), bounds), "center of the");
    BOOST_CHECK_EQUAL(roomRelativePosition(Vector2D(0.0f, 0.0f), bounds), "bottom left of the");
    BOOST_CHECK_EQUAL(roomRelativePosition(Vector2D(9.0f, 6.0f), bounds), "top right of the");
    BOOST_CHECK_EQUAL(roomRelativePosition(Vector2D(4.5f, 5.5f), bounds), "top middle of the");
    BOOST_CHECK_EQUAL(roomRelativePosition(Vector2D(8.5f, 3.0f), bounds), "middle right of the");
}

BOOST_AUTO_TEST_CASE(TestDegenerateBoundsHaveNoDescriptor) {
    AABB const flat = AABB::fromMinMax(Vector2D(0.0f, 2.0f), Vector2D(10.0f, 2.0f));
    BOOST_CHECK_EQUAL(roomRelativePosition(Vector2D(5.0f, 2.0f), flat), "");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DistanceFormattingTests)

BOOST_AUTO_TEST_CASE(TestRoundsToOneDecimal) {
    BOOST_CHECK_CLOSE(roundDistance(4.24f), 4.2f, 0.001f);
    BOOST_CHECK_CLOSE(roundDistance(4.26f), 4.3f, 0.001f);
    BOOST_CHECK_EQUAL(formatDistance(4.2f), "4.2");
    BOOST_CHECK_EQUAL(formatDistance(4.1999998f), "4.2");
    BOOST_CHECK_EQUAL(formatDistance(3.98f), "4");
    BOOST_CHECK_EQUAL(formatDistance(12.56f), "12.6");
}

BOOST_AUTO_TEST_SUITE_END()
