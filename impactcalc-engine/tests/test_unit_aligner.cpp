#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "unit_aligner.hpp"
#include "errors.hpp"

using namespace impactcalc;
using Catch::Matchers::WithinRel;

// ============================================================================
// UnitConversionTable Tests
// ============================================================================

TEST_CASE("UnitConversionTable declares both directions", "[aligner][conversion]") {
    UnitConversionTable table({UnitConversion("TWh", "GWh", 1000.0)});

    REQUIRE(table.can_convert("TWh", "GWh"));
    REQUIRE(table.can_convert("GWh", "TWh"));
    REQUIRE(table.can_convert("Mt", "Mt"));
    REQUIRE_FALSE(table.can_convert("TWh", "Mt"));

    REQUIRE_THAT(table.factor("TWh", "GWh"), WithinRel(1000.0, 1e-12));
    REQUIRE_THAT(table.factor("GWh", "TWh"), WithinRel(0.001, 1e-12));
    REQUIRE(table.factor("Mt", "Mt") == 1.0);
    REQUIRE(table.size() == 2);
}

TEST_CASE("UnitConversionTable unknown pair throws IncompatibleUnitsError", "[aligner][error]") {
    UnitConversionTable table;

    REQUIRE_THROWS_AS(table.factor("TWh", "Mt"), IncompatibleUnitsError);
}

TEST_CASE("UnitConversionTable rejects bad declarations", "[aligner][error]") {
    SECTION("Zero factor") {
        REQUIRE_THROWS_AS(UnitConversionTable({UnitConversion("a", "b", 0.0)}), InvalidInputError);
    }

    SECTION("Negative factor") {
        REQUIRE_THROWS_AS(UnitConversionTable({UnitConversion("a", "b", -2.0)}), InvalidInputError);
    }

    SECTION("Self conversion with factor other than 1") {
        REQUIRE_THROWS_AS(UnitConversionTable({UnitConversion("a", "a", 2.0)}), InvalidInputError);
    }

    SECTION("Conflicting duplicate") {
        REQUIRE_THROWS_AS(UnitConversionTable({UnitConversion("a", "b", 2.0),
                                               UnitConversion("a", "b", 3.0)}),
                          InvalidInputError);
    }

    SECTION("Consistent duplicate is accepted") {
        REQUIRE_NOTHROW(UnitConversionTable({UnitConversion("a", "b", 2.0),
                                             UnitConversion("a", "b", 2.0)}));
    }
}

TEST_CASE("Alignment policy names", "[aligner][config]") {
    REQUIRE(alignment_policy_to_string(AlignmentPolicy::Intersection) == "intersection");
    REQUIRE(string_to_alignment_policy("union_fill_forward") == AlignmentPolicy::UnionFillForward);
    REQUIRE(string_to_alignment_policy("union_fill_zero") == AlignmentPolicy::UnionFillZero);
    REQUIRE_THROWS_AS(string_to_alignment_policy("outer"), ConfigParseError);
}

// ============================================================================
// UnitAligner Tests
// ============================================================================

TEST_CASE("require_aligned checks unit before years", "[aligner]") {
    TimeSeries a("a", "TWh", {2020, 2021}, {1.0, 2.0});
    TimeSeries b("b", "GWh", {2020}, {1.0});
    TimeSeries c("c", "TWh", {2020}, {1.0});

    REQUIRE_NOTHROW(UnitAligner::require_aligned(a, a, "test"));
    REQUIRE_THROWS_AS(UnitAligner::require_aligned(a, b, "test"), UnitMismatchError);
    REQUIRE_THROWS_AS(UnitAligner::require_aligned(a, c, "test"), YearRangeMismatchError);
}

TEST_CASE("UnitAligner converts to a declared unit", "[aligner]") {
    UnitAligner aligner(UnitConversionTable({UnitConversion("TWh", "GWh", 1000.0)}),
                        AlignmentPolicy::Intersection);
    TimeSeries s("s", "GWh", {2020, 2021}, {500.0, 1500.0});

    TimeSeries converted = aligner.convert(s, "TWh");
    REQUIRE(converted.unit() == "TWh");
    REQUIRE_THAT(converted.value_at(2020), WithinRel(0.5, 1e-12));
    REQUIRE_THAT(converted.value_at(2021), WithinRel(1.5, 1e-12));

    REQUIRE_THROWS_AS(aligner.convert(s, "Mt"), IncompatibleUnitsError);
}

TEST_CASE("UnitAligner intersection alignment", "[aligner]") {
    UnitAligner aligner(UnitConversionTable({UnitConversion("TWh", "GWh", 1000.0)}),
                        AlignmentPolicy::Intersection);
    TimeSeries a("a", "TWh", {2020, 2021, 2022}, {1.0, 2.0, 3.0});
    TimeSeries b("b", "GWh", {2021, 2022, 2023}, {1000.0, 2000.0, 3000.0});

    AlignedPair pair = aligner.align(a, b);

    REQUIRE(pair.unit == "TWh");
    REQUIRE(pair.years == std::vector<int>{2021, 2022});
    REQUIRE(pair.first.years() == pair.years);
    REQUIRE(pair.second.years() == pair.years);
    REQUIRE(pair.second.unit() == "TWh");
    REQUIRE_THAT(pair.second.value_at(2021), WithinRel(1.0, 1e-12));
    REQUIRE_THAT(pair.first.value_at(2022), WithinRel(3.0, 1e-12));
}

TEST_CASE("UnitAligner union alignment fills gaps", "[aligner]") {
    TimeSeries a("a", "u", {2020, 2021, 2022}, {1.0, 2.0, 3.0});
    TimeSeries b("b", "u", {2021, 2023}, {10.0, 30.0});

    SECTION("Fill forward") {
        UnitAligner aligner(UnitConversionTable(), AlignmentPolicy::UnionFillForward);
        AlignedPair pair = aligner.align(a, b);

        REQUIRE(pair.years == std::vector<int>{2020, 2021, 2022, 2023});
        // Leading gap takes the first value
        REQUIRE(pair.second.values() == std::vector<double>{10.0, 10.0, 10.0, 30.0});
        REQUIRE(pair.first.values() == std::vector<double>{1.0, 2.0, 3.0, 3.0});
    }

    SECTION("Fill zero") {
        UnitAligner aligner(UnitConversionTable(), AlignmentPolicy::UnionFillZero);
        AlignedPair pair = aligner.align(a, b);

        REQUIRE(pair.second.values() == std::vector<double>{0.0, 10.0, 0.0, 30.0});
        REQUIRE(pair.first.values() == std::vector<double>{1.0, 2.0, 3.0, 0.0});
    }
}

TEST_CASE("UnitAligner failures", "[aligner][error]") {
    TimeSeries a("a", "TWh", {2020, 2021}, {1.0, 2.0});

    SECTION("Incompatible units") {
        UnitAligner aligner;
        TimeSeries b("b", "Mt", {2020, 2021}, {1.0, 2.0});
        REQUIRE_THROWS_AS(aligner.align(a, b), IncompatibleUnitsError);
    }

    SECTION("Disjoint years under intersection") {
        UnitAligner aligner;
        TimeSeries b("b", "TWh", {2030, 2031}, {1.0, 2.0});
        REQUIRE_THROWS_AS(aligner.align(a, b), EmptyIntersectionError);
    }

    SECTION("Disjoint years under union") {
        UnitAligner aligner(UnitConversionTable(), AlignmentPolicy::UnionFillZero);
        TimeSeries b("b", "TWh", {2030, 2031}, {1.0, 2.0});
        REQUIRE_THROWS_AS(aligner.align(a, b), EmptyIntersectionError);
    }
}
