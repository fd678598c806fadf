/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AnnouncementSinkTests
#include <boost/test/unit_test.hpp>

#include "../mocks/MockHost.hpp"
#include "speech/AnnouncementSink.hpp"

using namespace AccessOverlay;

struct SinkFixture {
    FakeSpeechSink backend;
    AnnouncementSink sink{backend};
};

BOOST_FIXTURE_TEST_SUITE(AnnouncementSinkTestSuite, SinkFixture)

BOOST_AUTO_TEST_CASE(TestForwardsText) {
    sink.speak("Entered Electrical");
    sink.speak("Meeting", true);

    BOOST_REQUIRE_EQUAL(backend.spoken.size(), 2u);
    BOOST_CHECK_EQUAL(backend.spoken[0], "Entered Electrical");
    BOOST_CHECK(!backend.interrupts[0]);
    BOOST_CHECK(backend.interrupts[1]);
}

BOOST_AUTO_TEST_CASE(TestEmptyTextIsSkipped) {
    sink.speak("");

    BOOST_CHECK(backend.spoken.empty());
    BOOST_CHECK_EQUAL(sink.droppedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestBackendFailureIsDropped) {
    backend.failNext = true;
    BOOST_CHECK_NO_THROW(sink.speak("lost"));
    BOOST_CHECK_EQUAL(sink.droppedCount(), 1u);

    sink.speak("delivered");
    BOOST_REQUIRE_EQUAL(backend.spoken.size(), 1u);
    BOOST_CHECK_EQUAL(backend.spoken[0], "delivered");
}

BOOST_AUTO_TEST_CASE(TestNonStandardBackendFailureIsDropped) {
    backend.failNextUnknown = true;
    BOOST_CHECK_NO_THROW(sink.speak("lost"));
    BOOST_CHECK_EQUAL(sink.droppedCount(), 1u);
    BOOST_CHECK(backend.spoken.empty());
}

BOOST_AUTO_TEST_SUITE_END()
