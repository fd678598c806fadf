/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE KeyBindingsTests
#include <boost/test/unit_test.hpp>

#include "input/KeyBindings.hpp"
#include "managers/AccessSettings.hpp"

using namespace AccessOverlay;

namespace {

SDL_Event keyEvent(SDL_EventType type, SDL_Scancode scancode, bool repeat = false) {
    SDL_Event event{};
    event.type = type;
    event.key.scancode = scancode;
    event.key.repeat = repeat;
    event.key.down = (type == SDL_EVENT_KEY_DOWN);
    return event;
}

} // namespace

struct KeyBindingsFixture {
    KeyBindings bindings;
};

BOOST_FIXTURE_TEST_SUITE(KeyBindingsTestSuite, KeyBindingsFixture)

BOOST_AUTO_TEST_CASE(TestDefaultBindings) {
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_DOWN) == AccessCommand::NEXT_ELEMENT);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_UP) == AccessCommand::PREVIOUS_ELEMENT);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_RETURN) == AccessCommand::ACTIVATE_ELEMENT);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_TAB) == AccessCommand::SCAN_SURROUNDINGS);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_T) == AccessCommand::FIND_NEAREST_TASK);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_Q) == AccessCommand::NONE);
    BOOST_CHECK(bindings.keyFor(AccessCommand::SCAN_SURROUNDINGS) == SDL_SCANCODE_TAB);
}

BOOST_AUTO_TEST_CASE(TestTranslateKeyDownOnly) {
    BOOST_CHECK(bindings.translate(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_TAB)) == AccessCommand::SCAN_SURROUNDINGS);
    BOOST_CHECK(bindings.translate(keyEvent(SDL_EVENT_KEY_UP, SDL_SCANCODE_TAB)) == AccessCommand::NONE);
    BOOST_CHECK(bindings.translate(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_A)) == AccessCommand::NONE);

    SDL_Event other{};
    other.type = SDL_EVENT_MOUSE_MOTION;
    BOOST_CHECK(bindings.translate(other) == AccessCommand::NONE);
}

BOOST_AUTO_TEST_CASE(TestRepeatIsIgnored) {
    BOOST_CHECK(bindings.translate(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_DOWN, true)) == AccessCommand::NONE);
}

BOOST_AUTO_TEST_CASE(TestRebindMovesCommand) {
    bindings.bind(SDL_SCANCODE_N, AccessCommand::NEXT_ELEMENT);

    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_N) == AccessCommand::NEXT_ELEMENT);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_DOWN) == AccessCommand::NONE);
    BOOST_CHECK(bindings.keyFor(AccessCommand::NEXT_ELEMENT) == SDL_SCANCODE_N);
}

BOOST_AUTO_TEST_CASE(TestBindTakesKeyFromOtherCommand) {
    bindings.bind(SDL_SCANCODE_TAB, AccessCommand::FIND_NEAREST_TASK);

    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_TAB) == AccessCommand::FIND_NEAREST_TASK);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_T) == AccessCommand::NONE);
    BOOST_CHECK(bindings.keyFor(AccessCommand::SCAN_SURROUNDINGS) == SDL_SCANCODE_UNKNOWN);
}

BOOST_AUTO_TEST_CASE(TestUnbindAndReset) {
    bindings.unbind(AccessCommand::ACTIVATE_ELEMENT);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_RETURN) == AccessCommand::NONE);

    bindings.resetToDefaults();
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_RETURN) == AccessCommand::ACTIVATE_ELEMENT);
}

BOOST_AUTO_TEST_CASE(TestLoadFromSettings) {
    AccessSettings settings;
    settings.set("controls", "scan_surroundings", static_cast<int>(SDL_SCANCODE_S));
    settings.set("controls", "next_element", 100000); // out of range

    bindings.loadFrom(settings);

    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_S) == AccessCommand::SCAN_SURROUNDINGS);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_TAB) == AccessCommand::NONE);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_DOWN) == AccessCommand::NEXT_ELEMENT);
}

BOOST_AUTO_TEST_CASE(TestLoadSingleBinding) {
    AccessSettings settings;
    settings.applyDefaults();
    bindings.loadFrom(settings);

    settings.set("controls", "next_element", static_cast<int>(SDL_SCANCODE_TAB));
    bindings.loadBinding(settings, "next_element");

    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_TAB) == AccessCommand::NEXT_ELEMENT);
    BOOST_CHECK(bindings.commandFor(SDL_SCANCODE_DOWN) == AccessCommand::NONE);
    BOOST_CHECK(bindings.keyFor(AccessCommand::SCAN_SURROUNDINGS) == SDL_SCANCODE_UNKNOWN);

    // Unknown control names leave the bindings alone
    bindings.loadBinding(settings, "jump");
    BOOST_CHECK(bindings.keyFor(AccessCommand::NEXT_ELEMENT) == SDL_SCANCODE_TAB);
}

BOOST_AUTO_TEST_CASE(TestDefaultSettingsMatchDefaultBindings) {
    AccessSettings settings;
    settings.applyDefaults();
    bindings.loadFrom(settings);

    BOOST_CHECK(bindings.keyFor(AccessCommand::NEXT_ELEMENT) == SDL_SCANCODE_DOWN);
    BOOST_CHECK(bindings.keyFor(AccessCommand::PREVIOUS_ELEMENT) == SDL_SCANCODE_UP);
    BOOST_CHECK(bindings.keyFor(AccessCommand::ACTIVATE_ELEMENT) == SDL_SCANCODE_RETURN);
    BOOST_CHECK(bindings.keyFor(AccessCommand::SCAN_SURROUNDINGS) == SDL_SCANCODE_TAB);
    BOOST_CHECK(bindings.keyFor(AccessCommand::FIND_NEAREST_TASK) == SDL_SCANCODE_T);
}

BOOST_AUTO_TEST_SUITE_END()
