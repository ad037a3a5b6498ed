#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "tier_strategy.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Tier selection by population size", "[TierStrategy]") {
    TierConfig config;

    REQUIRE(TierStrategy::selectTier(0, config) == Tier::Absolute);
    REQUIRE(TierStrategy::selectTier(14, config) == Tier::Absolute);
    REQUIRE(TierStrategy::selectTier(15, config) == Tier::Bayesian);
    REQUIRE(TierStrategy::selectTier(49, config) == Tier::Bayesian);
    REQUIRE(TierStrategy::selectTier(50, config) == Tier::Full);
}

TEST_CASE("Percentiles honour the absolute floors", "[TierStrategy]") {
    NormalizationConfig config;
    SignalRegistry registry = SignalRegistry::createDefault();
    TierStrategy strategy(Tier::Full, config, registry);

    // Every value is tiny in absolute terms
    PercentileTable table({0.001, 0.002, 0.003, 0.004});

    SECTION("Values below the floor rank at 0") {
        REQUIRE(strategy.percentile("pagerank", 0.004, table) == 0.0);
    }

    SECTION("Values above the floor use their rank") {
        PercentileTable wide({0.001, 0.01, 0.1, 0.2});
        REQUIRE_THAT(*strategy.percentile("pagerank", 0.1, wide), WithinAbs(0.5, 1e-12));
    }

    SECTION("Signals without a floor are ranked directly") {
        REQUIRE_FALSE(strategy.floorFor("churn_slope").has_value());
        REQUIRE_THAT(*strategy.percentile("churn_slope", 0.004, table), WithinAbs(0.75, 1e-12));
    }

    SECTION("Floors come from configuration") {
        config.floors["pagerank"] = 0.0;
        TierStrategy relaxed(Tier::Full, config, registry);
        REQUIRE_THAT(*relaxed.percentile("pagerank", 0.004, table), WithinAbs(0.75, 1e-12));
    }
}

TEST_CASE("Percentile ranks are monotonic", "[TierStrategy]") {
    NormalizationConfig config;
    SignalRegistry registry = SignalRegistry::createDefault();
    TierStrategy strategy(Tier::Bayesian, config, registry);

    std::vector<double> population;
    for (int i = 0; i < 40; ++i) {
        population.push_back(static_cast<double>((i * 37) % 23));
    }
    PercentileTable table(population);

    double previous = 0.0;
    for (double v = 0.0; v < 25.0; v += 0.25) {
        double p = *strategy.percentile("blast_radius_size", v, table);
        REQUIRE(p >= previous);
        previous = p;
    }
}

TEST_CASE("ABSOLUTE tier scales against thresholds", "[TierStrategy]") {
    NormalizationConfig config;
    SignalRegistry registry = SignalRegistry::createDefault();
    TierStrategy strategy(Tier::Absolute, config, registry);

    REQUIRE_FALSE(strategy.usesPercentiles());
    REQUIRE_FALSE(strategy.percentile("pagerank", 0.5, PercentileTable({0.1, 0.5})).has_value());

    SECTION("Configured threshold") {
        REQUIRE_THAT(*strategy.scaled("cognitive_load", 7.5, std::nullopt), WithinAbs(0.5, 1e-12));
        REQUIRE(*strategy.scaled("pagerank", 0.9, std::nullopt) == 1.0);
    }

    SECTION("Registry threshold when configuration has none") {
        REQUIRE_THAT(*strategy.scaled("lines", 250.0, std::nullopt), WithinAbs(0.5, 1e-12));
    }

    SECTION("Zero threshold flags any non-zero value") {
        REQUIRE(*strategy.scaled("broken_call_count", 2.0, std::nullopt) == 1.0);
        REQUIRE(*strategy.scaled("broken_call_count", 0.0, std::nullopt) == 0.0);
    }

    SECTION("Missing raw value stays null") {
        REQUIRE_FALSE(strategy.scaled("lines", std::nullopt, std::nullopt).has_value());
    }
}

TEST_CASE("Percentile tiers scale by percentile", "[TierStrategy]") {
    NormalizationConfig config;
    SignalRegistry registry = SignalRegistry::createDefault();
    TierStrategy strategy(Tier::Bayesian, config, registry);

    REQUIRE(strategy.scaled("pagerank", 0.9, 0.4) == 0.4);
    REQUIRE_FALSE(strategy.scaled("pagerank", 0.9, std::nullopt).has_value());
}
