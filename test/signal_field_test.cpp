#include <catch2/catch_test_macros.hpp>
#include "signal_field.hpp"
#include <limits>

TEST_CASE("SignalRegistry declares every tier", "[SignalRegistry]") {
    SignalRegistry registry = SignalRegistry::createDefault();

    REQUIRE(registry.find(SignalScope::File, "pagerank") != nullptr);
    REQUIRE(registry.find(SignalScope::File, "risk_score_display") != nullptr);
    REQUIRE(registry.find(SignalScope::Module, "health_score_display") != nullptr);
    REQUIRE(registry.find(SignalScope::Global, "codebase_health") != nullptr);
    REQUIRE(registry.find(SignalScope::Directory, "avg_risk") != nullptr);
    REQUIRE(registry.find(SignalScope::File, "no_such_signal") == nullptr);

    SECTION("Declaring twice is rejected") {
        SignalMeta meta;
        meta.name = "pagerank";
        meta.scope = SignalScope::File;
        REQUIRE_THROWS_AS(registry.declare(meta), SignalFieldError);
    }

    SECTION("Only raw numeric file signals are percentileable") {
        for (const SignalMeta* meta : registry.percentileableFileSignals()) {
            REQUIRE(meta->scope == SignalScope::File);
            REQUIRE(meta->stage == Stage::Collect);
            REQUIRE(meta->type != SignalType::Text);
        }
        auto* risk = registry.find(SignalScope::File, "risk_score");
        REQUIRE_FALSE(risk->percentileable);
        REQUIRE(registry.find(SignalScope::File, "depth")->percentileable);
        REQUIRE_FALSE(registry.find(SignalScope::File, "is_orphan")->percentileable);
    }
}

TEST_CASE("SignalField writes are additive", "[SignalField]") {
    SignalField field;

    field.setFile("a.py", "lines", SignalValue(static_cast<int64_t>(120)));
    REQUIRE(field.fileNumber("a.py", "lines") == 120.0);

    SECTION("A second write of the same signal fails") {
        REQUIRE_THROWS_AS(field.setFile("a.py", "lines", SignalValue(static_cast<int64_t>(5))),
                          SignalFieldError);
        REQUIRE(field.fileNumber("a.py", "lines") == 120.0);
    }

    SECTION("Undeclared signals are rejected") {
        REQUIRE_THROWS_AS(field.setFile("a.py", "mystery", SignalValue(1.0)), SignalFieldError);
    }

    SECTION("Signals of another scope are rejected") {
        REQUIRE_THROWS_AS(field.setModule("core", "pagerank", SignalValue(0.1)), SignalFieldError);
    }

    SECTION("Values must match the declared type") {
        REQUIRE_THROWS_AS(field.setFile("a.py", "pagerank", SignalValue(static_cast<int64_t>(1))),
                          SignalFieldError);
        REQUIRE_THROWS_AS(field.setFile("a.py", "role", SignalValue(1.0)), SignalFieldError);
    }

    SECTION("Null is accepted for any signal") {
        field.setFile("a.py", "docstring_coverage", SignalValue(std::monostate{}));
        REQUIRE(field.has(SignalScope::File, "a.py", "docstring_coverage"));
        REQUIRE_FALSE(field.fileNumber("a.py", "docstring_coverage").has_value());
    }

    SECTION("Non-finite numbers are stored as null") {
        field.setFile("a.py", "churn_slope", SignalValue(std::numeric_limits<double>::infinity()));
        REQUIRE(field.has(SignalScope::File, "a.py", "churn_slope"));
        REQUIRE_FALSE(field.fileNumber("a.py", "churn_slope").has_value());
    }
}

TEST_CASE("SignalField enforces stage ownership", "[SignalField]") {
    SignalField field;
    field.beginStage(Stage::Collect);

    field.setFile("a.py", "pagerank", SignalValue(0.2));
    REQUIRE_THROWS_AS(field.setFile("a.py", "raw_risk", SignalValue(0.5)), SignalFieldError);

    field.beginStage(Stage::RawRisk);
    field.setFile("a.py", "raw_risk", SignalValue(0.5));
    REQUIRE_THROWS_AS(field.setFile("a.py", "lines", SignalValue(static_cast<int64_t>(10))),
                      SignalFieldError);

    SECTION("Stages only move forward") {
        REQUIRE_THROWS_AS(field.beginStage(Stage::Collect), SignalFieldError);
        REQUIRE_THROWS_AS(field.beginStage(Stage::RawRisk), SignalFieldError);
    }

    SECTION("Percentiles belong to the normalize stage") {
        REQUIRE_THROWS_AS(field.setPercentile("a.py", "pagerank", 0.5), SignalFieldError);
        field.beginStage(Stage::Normalize);
        field.setPercentile("a.py", "pagerank", 0.5);
        REQUIRE(field.percentile("a.py", "pagerank") == 0.5);
        REQUIRE_THROWS_AS(field.setPercentile("a.py", "pagerank", 0.7), SignalFieldError);
        REQUIRE_THROWS_AS(field.setPercentile("a.py", "role", 0.1), SignalFieldError);
    }
}

TEST_CASE("SignalField exposes typed views", "[SignalField]") {
    SignalField field;
    field.setFile("a.py", "role", SignalValue(std::string("SERVICE")));
    field.setFile("a.py", "is_orphan", SignalValue(true));
    field.setGlobal("team_size", SignalValue(static_cast<int64_t>(3)));

    REQUIRE(field.text(SignalScope::File, "a.py", "role") == std::string("SERVICE"));
    REQUIRE_FALSE(field.fileNumber("a.py", "role").has_value());
    REQUIRE(field.fileNumber("a.py", "is_orphan") == 1.0);
    REQUIRE(field.globalNumber("team_size") == 3.0);
    REQUIRE(field.entityIds(SignalScope::File) == std::vector<std::string>{"a.py"});
    REQUIRE(field.entities(SignalScope::Module).empty());
    REQUIRE(field.valueCount() == 3);

    field.setPercentile("a.py", "lines", std::nullopt);
    REQUIRE(field.hasPercentile("a.py", "lines"));
    REQUIRE_FALSE(field.percentile("a.py", "lines").has_value());
}
