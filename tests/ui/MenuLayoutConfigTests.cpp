/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MenuLayoutConfigTests
#include <boost/test/unit_test.hpp>

#include "../mocks/MockHost.hpp"
#include "ui/MenuLayoutConfig.hpp"

using namespace AccessOverlay;

BOOST_AUTO_TEST_SUITE(MenuLayoutBuilderTests)

BOOST_AUTO_TEST_CASE(TestBuilderStoresLowercaseIdentifiers) {
    MenuLayoutConfig const config = MenuLayoutBuilder::forScene("MainMenu")
                                        .withElements({"PlayButton", "QuitButton"})
                                        .hideElements({"CreditsButton"})
                                        .requireElements({"BackButton"})
                                        .hideUnorganized()
                                        .build();

    BOOST_REQUIRE_EQUAL(config.orderedElements.size(), 2u);
    BOOST_CHECK_EQUAL(config.orderedElements[0], "playbutton");
    BOOST_CHECK_EQUAL(config.orderedElements[1], "quitbutton");
    BOOST_CHECK(config.hiddenElements.count("creditsbutton") == 1);
    BOOST_CHECK(config.requiredElements.count("backbutton") == 1);
    BOOST_CHECK(config.hideUnorganizedElements);
}

BOOST_AUTO_TEST_CASE(TestLookupsByObjectOrDisplayName) {
    int actions = 0;
    MenuLayoutConfig const config =
        MenuLayoutBuilder::forScene("MainMenu")
            .withCustomSpeech("Quit Game", "Leave")
            .withCustomSpeechProvider("PlayButton", [](const IUIElement&) { return std::string("Play now"); })
            .withAction("PLAYBUTTON", [&actions](const IUIElement&) { ++actions; })
            .build();

    auto quit = MockUIElement::create(1, "QuitButton", 0.0f, 0.0f);
    quit->label = "Quit Game";
    auto play = MockUIElement::create(2, "PlayButton", 0.0f, 0.0f);

    const std::string* text = config.speechTextFor(*quit);
    BOOST_REQUIRE(text != nullptr);
    BOOST_CHECK_EQUAL(*text, "Leave");
    BOOST_CHECK(config.speechTextFor(*play) == nullptr);

    const SpeechProvider* provider = config.speechProviderFor(*play);
    BOOST_REQUIRE(provider != nullptr);
    BOOST_CHECK_EQUAL((*provider)(*play), "Play now");

    const ActionHandler* action = config.actionFor(*play);
    BOOST_REQUIRE(action != nullptr);
    (*action)(*play);
    BOOST_CHECK_EQUAL(actions, 1);
    BOOST_CHECK(config.actionFor(*quit) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(MenuLayoutRegistryTests)

BOOST_AUTO_TEST_CASE(TestApplyAndReplace) {
    MenuLayoutRegistry registry;
    BOOST_CHECK(registry.find("MainMenu") == nullptr);

    MenuLayoutBuilder::forScene("MainMenu").withElements({"PlayButton"}).apply(registry);
    auto const first = registry.find("MainMenu");
    BOOST_REQUIRE(first != nullptr);
    BOOST_CHECK_EQUAL(first->orderedElements.size(), 1u);

    // Replacement is wholesale; a config already handed out is unaffected
    MenuLayoutBuilder::forScene("MainMenu").hideElements({"QuitButton"}).apply(registry);
    auto const second = registry.find("MainMenu");
    BOOST_REQUIRE(second != nullptr);
    BOOST_CHECK(second->orderedElements.empty());
    BOOST_CHECK_EQUAL(second->hiddenElements.size(), 1u);
    BOOST_CHECK_EQUAL(first->orderedElements.size(), 1u);
    BOOST_CHECK_EQUAL(registry.size(), 1u);

    BOOST_CHECK(registry.remove("MainMenu"));
    BOOST_CHECK(!registry.remove("MainMenu"));
    BOOST_CHECK(registry.find("MainMenu") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestSceneNamesAreExact) {
    MenuLayoutRegistry registry;
    MenuLayoutBuilder::forScene("FindAGame").apply(registry);

    BOOST_CHECK(registry.find("FindAGame") != nullptr);
    BOOST_CHECK(registry.find("findagame") == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(StockMenuTests)

BOOST_AUTO_TEST_CASE(TestDefaultMenusRegisterLobbyList) {
    MenuLayoutRegistry registry;
    configureDefaultMenus(registry);

    auto const config = registry.find("FindAGame");
    BOOST_REQUIRE(config != nullptr);
    BOOST_REQUIRE_EQUAL(config->orderedElements.size(), 1u);
    BOOST_CHECK_EQUAL(config->orderedElements[0], "joinmmgame(clone)");

    auto entry = MockUIElement::create(5, "JoinMMGame(Clone)", 0.0f, 0.0f);
    BOOST_CHECK(config->speechProviderFor(*entry) != nullptr);
}

BOOST_AUTO_TEST_CASE(TestLobbyEntrySpeech) {
    auto entry = MockUIElement::create(5, "JoinMMGame(Clone)", 0.0f, 0.0f);
    entry->label = "Alice 3 of 12";
    entry->children["LanguageText"] = "English";
    entry->children["PlayerCountText_TMP"] = "7/15";
    entry->children["ImpostorCountText_TMP"] = "2";

    BOOST_CHECK_EQUAL(describeLobbyEntry(*entry), "English lobby by Alice with 2 impostors and 7/15 players");

    entry->label = "Bob";
    BOOST_CHECK_EQUAL(describeLobbyEntry(*entry), "English lobby by Bob with 2 impostors and 7/15 players");
}

BOOST_AUTO_TEST_CASE(TestLobbyHostNameKeepsInnerOf) {
    auto entry = MockUIElement::create(5, "JoinMMGame(Clone)", 0.0f, 0.0f);
    entry->children["LanguageText"] = "English";
    entry->children["PlayerCountText_TMP"] = "3/10";
    entry->children["ImpostorCountText_TMP"] = "1";

    entry->label = "Game of Thrones";
    BOOST_CHECK_EQUAL(describeLobbyEntry(*entry), "English lobby by Game of Thrones with 1 impostors and 3/10 players");

    entry->label = "Game of Thrones 2 of 9";
    BOOST_CHECK_EQUAL(describeLobbyEntry(*entry), "English lobby by Game of Thrones with 1 impostors and 3/10 players");

    entry->label = "Lord of 7";
    BOOST_CHECK_EQUAL(describeLobbyEntry(*entry), "English lobby by Lord of 7 with 1 impostors and 3/10 players");
}

BOOST_AUTO_TEST_CASE(TestLobbyEntryReadFailure) {
    auto entry = MockUIElement::create(5, "JoinMMGame(Clone)", 0.0f, 0.0f);
    entry->label = "Alice";
    entry->throwOnChildText = true;

    BOOST_CHECK_EQUAL(describeLobbyEntry(*entry), "Error reading lobby information");
}

BOOST_AUTO_TEST_SUITE_END()
