/**
 * @file test_engine_config.cpp
 * @brief Unit tests for engine configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "engine_config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace impactcalc;
using Catch::Matchers::WithinRel;

namespace fs = std::filesystem;

TEST_CASE("EngineConfig defaults", "[config]") {
    EngineConfig config;

    REQUIRE(config.floor_epsilon == DEFAULT_FLOOR_EPSILON);
    REQUIRE(config.parallel == true);
    REQUIRE(config.max_threads == 0);
    REQUIRE(config.treat_warnings_as_errors == false);
    REQUIRE(config.alignment_policy == AlignmentPolicy::Intersection);
    REQUIRE(config.unit_conversions.empty());
    REQUIRE(config.logging.min_level == LogLevel::INFO);

    REQUIRE_NOTHROW(validate_engine_config(config));
}

TEST_CASE("Parse full engine configuration", "[config]") {
    std::string json = R"({
        "floor_epsilon": 1e-6,
        "parallel": false,
        "max_threads": 8,
        "treat_warnings_as_errors": true,
        "alignment_policy": "union_fill_forward",
        "unit_conversions": [
            {"from": "TWh", "to": "GWh", "factor": 1000},
            {"from": "Mt", "to": "Gt", "factor": 0.001}
        ],
        "logging": {
            "level": "DEBUG",
            "console": false,
            "json": false
        }
    })";

    EngineConfig config = parse_engine_config_from_string(json);

    REQUIRE_THAT(config.floor_epsilon, WithinRel(1e-6, 1e-12));
    REQUIRE(config.parallel == false);
    REQUIRE(config.max_threads == 8);
    REQUIRE(config.treat_warnings_as_errors == true);
    REQUIRE(config.alignment_policy == AlignmentPolicy::UnionFillForward);

    REQUIRE(config.unit_conversions.size() == 2);
    REQUIRE(config.unit_conversions[0].from == "TWh");
    REQUIRE(config.unit_conversions[0].to == "GWh");
    REQUIRE_THAT(config.unit_conversions[0].factor, WithinRel(1000.0, 1e-12));
    REQUIRE_THAT(config.unit_conversions[1].factor, WithinRel(0.001, 1e-12));

    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE(config.logging.enable_console == false);
    REQUIRE(config.logging.enable_json == false);
    REQUIRE(config.logging.enable_file == false);
}

TEST_CASE("Parse empty engine configuration keeps defaults", "[config]") {
    EngineConfig config = parse_engine_config_from_string("{}");

    REQUIRE(config.floor_epsilon == DEFAULT_FLOOR_EPSILON);
    REQUIRE(config.parallel == true);
}

TEST_CASE("Engine configuration errors", "[config][error]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string("{ not json"), ConfigParseError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string("[1, 2]"), ConfigParseError);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"parallel": "yes"})"), ConfigParseError);
    }

    SECTION("Negative epsilon") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"floor_epsilon": -0.5})"), ConfigParseError);
    }

    SECTION("Negative thread count") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"max_threads": -1})"), ConfigParseError);
    }

    SECTION("Unknown alignment policy") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"alignment_policy": "outer"})"),
                          ConfigParseError);
    }

    SECTION("Incomplete unit conversion") {
        REQUIRE_THROWS_AS(
            parse_engine_config_from_string(R"({"unit_conversions": [{"from": "a", "to": "b"}]})"),
            ConfigParseError);
    }

    SECTION("Non-positive conversion factor") {
        REQUIRE_THROWS_AS(
            parse_engine_config_from_string(
                R"({"unit_conversions": [{"from": "a", "to": "b", "factor": 0}]})"),
            ConfigParseError);
    }

    SECTION("Conflicting unit conversions") {
        REQUIRE_THROWS_AS(
            parse_engine_config_from_string(R"({"unit_conversions": [
                {"from": "Mt", "to": "kt", "factor": 1000},
                {"from": "kt", "to": "Mt", "factor": 0.002}
            ]})"),
            ConfigParseError);
    }

    SECTION("Self conversion other than identity") {
        REQUIRE_THROWS_AS(
            parse_engine_config_from_string(
                R"({"unit_conversions": [{"from": "Mt", "to": "Mt", "factor": 2}]})"),
            ConfigParseError);
    }

    SECTION("Conflicts found by validation alone") {
        EngineConfig config;
        config.unit_conversions = {UnitConversion("Mt", "kt", 1000.0), UnitConversion("Mt", "kt", 999.0)};
        REQUIRE_THROWS_AS(validate_engine_config(config), ConfigParseError);
    }

    SECTION("Unknown log level") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"logging": {"level": "verbose"}})"),
                          ConfigParseError);
    }

    SECTION("Error kind") {
        try {
            parse_engine_config_from_string("{ not json");
            FAIL("Expected ConfigParseError");
        } catch (const ImpactError& e) {
            REQUIRE(e.kind() == ErrorKind::Configuration);
        }
    }
}

TEST_CASE("Environment variable expansion", "[config][env]") {
    setenv("IMPACTCALC_TEST_DIR", "/tmp/impactcalc", 1);
    unsetenv("IMPACTCALC_TEST_UNSET");

    REQUIRE(expand_environment_variables("${IMPACTCALC_TEST_DIR}/run.log") == "/tmp/impactcalc/run.log");
    REQUIRE(expand_environment_variables("$IMPACTCALC_TEST_DIR/run.log") == "/tmp/impactcalc/run.log");
    REQUIRE(expand_environment_variables("a${IMPACTCALC_TEST_UNSET}b") == "ab");
    REQUIRE(expand_environment_variables("cost in $ only") == "cost in $ only");
    REQUIRE(expand_environment_variables("plain") == "plain");
    REQUIRE_THROWS_AS(expand_environment_variables("${IMPACTCALC_TEST_DIR"), ConfigParseError);

    EngineConfig config = parse_engine_config_from_string(
        R"({"logging": {"file": "${IMPACTCALC_TEST_DIR}/engine.log"}})");
    REQUIRE(config.logging.enable_file == true);
    REQUIRE(config.logging.log_file_path == "/tmp/impactcalc/engine.log");
}

TEST_CASE("Environment variables expand in every string value", "[config][env]") {
    setenv("IMPACTCALC_TEST_POLICY", "union_fill_zero", 1);
    setenv("IMPACTCALC_TEST_UNIT", "TWh", 1);

    EngineConfig config = parse_engine_config_from_string(R"({
        "alignment_policy": "${IMPACTCALC_TEST_POLICY}",
        "unit_conversions": [{"from": "$IMPACTCALC_TEST_UNIT", "to": "G${IMPACTCALC_TEST_UNIT}", "factor": 1}]
    })");

    REQUIRE(config.alignment_policy == AlignmentPolicy::UnionFillZero);
    REQUIRE(config.unit_conversions.size() == 1);
    REQUIRE(config.unit_conversions[0].from == "TWh");
    REQUIRE(config.unit_conversions[0].to == "GTWh");

    unsetenv("IMPACTCALC_TEST_POLICY");
    unsetenv("IMPACTCALC_TEST_UNIT");
}

TEST_CASE("Parse engine configuration from file", "[config][file]") {
    fs::path dir = fs::temp_directory_path() / "impactcalc_config_test";
    fs::create_directories(dir);
    fs::path config_path = dir / "engine.json";

    {
        std::ofstream out(config_path);
        out << R"({"max_threads": 2, "logging": {"file": "logs/engine.log"}})";
    }

    EngineConfig config = parse_engine_config_from_file(config_path.string());

    REQUIRE(config.max_threads == 2);
    REQUIRE(fs::path(config.logging.log_file_path) == dir / "logs/engine.log");

    REQUIRE_THROWS_AS(parse_engine_config_from_file((dir / "missing.json").string()), ConfigParseError);

    fs::remove_all(dir);
}
