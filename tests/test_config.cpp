#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <juce_core/juce_core.h>

#include "../jamroom/core/Config.hpp"

using namespace jamroom;

TEST_CASE("Config - Defaults", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();

    REQUIRE(config.getHubPort() == 8787);
    REQUIRE(config.getHeartbeatIntervalMs() == 5000);
    REQUIRE(config.getPresenceTimeoutMs() == 15000);
    REQUIRE(config.getCursorThrottleMs() == 50);
    REQUIRE(config.getReconnectBaseDelayMs() == 250);
    REQUIRE(config.getReconnectMaxDelayMs() == 10000);
    REQUIRE(config.getMixdownSampleRate() == Catch::Approx(44100.0));
    REQUIRE(config.getMixdownBitDepth() == 16);
    REQUIRE(config.getLimiterCeilingDb() == Catch::Approx(-1.0));
    REQUIRE(config.getAudioRoot().empty());
}

TEST_CASE("Config - Parsing lines", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();

    config.parseConfigLine("hubPort", "9000");
    config.parseConfigLine("reconnectJitter", "0.5");
    config.parseConfigLine("audioRoot", "/srv/audio");
    REQUIRE(config.getHubPort() == 9000);
    REQUIRE(config.getReconnectJitter() == Catch::Approx(0.5));
    REQUIRE(config.getAudioRoot() == "/srv/audio");

    SECTION("Bad numbers leave the value alone") {
        config.parseConfigLine("hubPort", "eighty");
        REQUIRE(config.getHubPort() == 9000);
    }

    SECTION("Unknown keys are ignored") {
        config.parseConfigLine("favouriteColour", "12");
        REQUIRE(config.getHubPort() == 9000);
    }

    config.resetToDefaults();
}

TEST_CASE("Config - Save and load", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();

    juce::TemporaryFile temp(".cfg");
    const auto path = temp.getFile().getFullPathName().toStdString();

    config.setHubHost("10.0.0.2");
    config.setMixdownBitDepth(24);
    config.setLimiterCeilingDb(-3.0);
    config.setCursorThrottleMs(80);
    config.saveToFile(path);

    config.resetToDefaults();
    REQUIRE(config.getMixdownBitDepth() == 16);

    config.loadFromFile(path);
    REQUIRE(config.getHubHost() == "10.0.0.2");
    REQUIRE(config.getMixdownBitDepth() == 24);
    REQUIRE(config.getLimiterCeilingDb() == Catch::Approx(-3.0));
    REQUIRE(config.getCursorThrottleMs() == 80);

    SECTION("Comments and blank lines are skipped") {
        REQUIRE(temp.getFile().replaceWithText("# tuned for the studio\n\nhubPort=7000\n"
                                               "not a setting\n"));
        config.resetToDefaults();
        config.loadFromFile(path);
        REQUIRE(config.getHubPort() == 7000);
        REQUIRE(config.getMixdownBitDepth() == 16);
    }

    SECTION("Missing file keeps the current values") {
        config.loadFromFile(path + ".missing");
        REQUIRE(config.getMixdownBitDepth() == 24);
    }

    config.resetToDefaults();
}
