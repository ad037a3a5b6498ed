#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "display_scale.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Display score maps the unit interval onto 1-10", "[DisplayScale]") {
    REQUIRE_THAT(displayScore(0.0), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(displayScore(1.0), WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(displayScore(0.5), WithinAbs(5.5, 1e-12));
    REQUIRE_THAT(displayScore(0.123), WithinAbs(2.1, 1e-12));

    SECTION("Out of range values are clamped") {
        REQUIRE_THAT(displayScore(-0.4), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(displayScore(1.7), WithinAbs(10.0, 1e-12));
    }
}

TEST_CASE("Bands cut the display scale into four ranges", "[DisplayScale]") {
    REQUIRE(bandForDisplay(10.0) == HealthBand::Healthy);
    REQUIRE(bandForDisplay(7.8) == HealthBand::Healthy);
    REQUIRE(bandForDisplay(7.7) == HealthBand::Moderate);
    REQUIRE(bandForDisplay(5.6) == HealthBand::Moderate);
    REQUIRE(bandForDisplay(5.5) == HealthBand::AtRisk);
    REQUIRE(bandForDisplay(3.4) == HealthBand::AtRisk);
    REQUIRE(bandForDisplay(3.3) == HealthBand::Critical);
    REQUIRE(bandForDisplay(1.0) == HealthBand::Critical);
}

TEST_CASE("Composites where high is bad are banded on the complement", "[DisplayScale]") {
    REQUIRE(bandFor(0.9, Polarity::HighIsGood) == HealthBand::Healthy);
    REQUIRE(bandFor(0.9, Polarity::HighIsBad) == HealthBand::Critical);
    REQUIRE(bandFor(0.1, Polarity::HighIsBad) == HealthBand::Healthy);
    REQUIRE(bandFor(0.5, Polarity::HighIsGood) == HealthBand::AtRisk);

    SECTION("Health display runs the other way for risk") {
        REQUIRE_THAT(healthDisplay(0.9, Polarity::HighIsBad), WithinAbs(1.9, 1e-12));
        REQUIRE_THAT(healthDisplay(0.9, Polarity::HighIsGood), WithinAbs(9.1, 1e-12));
        REQUIRE(bandForDisplay(healthDisplay(0.9, Polarity::HighIsBad)) == HealthBand::Critical);
    }

    REQUIRE(bandToString(HealthBand::Healthy) == "Healthy");
    REQUIRE(bandToString(HealthBand::AtRisk) == "At Risk");
    REQUIRE(bandToString(HealthBand::Critical) == "Critical");
}
