#include "unit_aligner.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

namespace impactcalc {

namespace {

std::string describe_range(const TimeSeries& s) {
    std::ostringstream oss;
    oss << "'" << s.name() << "' ";
    if (s.empty()) {
        oss << "[empty]";
    } else {
        oss << "[" << s.first_year() << ".." << s.last_year() << ", "
            << s.size() << " years]";
    }
    return oss.str();
}

} // anonymous namespace

std::string alignment_policy_to_string(AlignmentPolicy policy) {
    switch (policy) {
        case AlignmentPolicy::Intersection: return "intersection";
        case AlignmentPolicy::UnionFillForward: return "union_fill_forward";
        case AlignmentPolicy::UnionFillZero: return "union_fill_zero";
        default: return "unknown";
    }
}

AlignmentPolicy string_to_alignment_policy(const std::string& name) {
    if (name == "intersection") return AlignmentPolicy::Intersection;
    if (name == "union_fill_forward") return AlignmentPolicy::UnionFillForward;
    if (name == "union_fill_zero") return AlignmentPolicy::UnionFillZero;
    throw ConfigParseError("Unknown alignment policy: " + name);
}

// ============================================================================
// UnitConversionTable
// ============================================================================

UnitConversion::UnitConversion() : from(), to(), factor(1.0) {}

UnitConversion::UnitConversion(const std::string& from_unit, const std::string& to_unit, double f)
    : from(from_unit), to(to_unit), factor(f) {}

UnitConversionTable::UnitConversionTable() = default;

UnitConversionTable::UnitConversionTable(const std::vector<UnitConversion>& conversions) {
    for (const auto& c : conversions) {
        if (!(c.factor > 0.0) || !std::isfinite(c.factor)) {
            throw InvalidInputError("conversion '" + c.from + "' -> '" + c.to +
                                    "' must have a positive finite factor");
        }
        if (c.from == c.to) {
            if (c.factor != 1.0) {
                throw InvalidInputError("conversion of '" + c.from + "' to itself must have factor 1");
            }
            continue;
        }

        auto forward = std::make_pair(c.from, c.to);
        auto existing = factors_.find(forward);
        if (existing != factors_.end() && existing->second != c.factor) {
            throw InvalidInputError("conflicting conversions declared for '" + c.from +
                                    "' -> '" + c.to + "'");
        }
        factors_[forward] = c.factor;
        factors_[std::make_pair(c.to, c.from)] = 1.0 / c.factor;
    }
}

bool UnitConversionTable::can_convert(const std::string& from, const std::string& to) const {
    return from == to || factors_.count(std::make_pair(from, to)) > 0;
}

double UnitConversionTable::factor(const std::string& from, const std::string& to) const {
    if (from == to) {
        return 1.0;
    }
    auto it = factors_.find(std::make_pair(from, to));
    if (it == factors_.end()) {
        throw IncompatibleUnitsError(from, to);
    }
    return it->second;
}

// ============================================================================
// UnitAligner
// ============================================================================

UnitAligner::UnitAligner()
    : conversions_(), policy_(AlignmentPolicy::Intersection) {}

UnitAligner::UnitAligner(UnitConversionTable conversions, AlignmentPolicy policy)
    : conversions_(std::move(conversions)), policy_(policy) {}

void UnitAligner::require_aligned(const TimeSeries& a, const TimeSeries& b,
                                  const std::string& operation) {
    if (a.unit() != b.unit()) {
        throw UnitMismatchError(operation + " of '" + a.name() + "' [" + a.unit() +
                                "] and '" + b.name() + "' [" + b.unit() + "]");
    }
    require_same_years(a, b, operation);
}

void UnitAligner::require_same_years(const TimeSeries& a, const TimeSeries& b,
                                     const std::string& operation) {
    if (!a.same_years(b)) {
        throw YearRangeMismatchError(operation + " of " + describe_range(a) +
                                     " and " + describe_range(b));
    }
}

TimeSeries UnitAligner::convert(const TimeSeries& series, const std::string& unit) const {
    if (series.unit() == unit) {
        return series;
    }
    double f = conversions_.factor(series.unit(), unit);
    return series.scale(f, unit);
}

AlignedPair UnitAligner::align(const TimeSeries& a, const TimeSeries& b) const {
    // Unit check first: converting b into a's unit
    TimeSeries b_converted = convert(b, a.unit());

    std::vector<int> years;
    if (policy_ == AlignmentPolicy::Intersection) {
        std::set_intersection(a.years().begin(), a.years().end(),
                              b.years().begin(), b.years().end(),
                              std::back_inserter(years));
    } else {
        std::set_union(a.years().begin(), a.years().end(),
                       b.years().begin(), b.years().end(),
                       std::back_inserter(years));
    }

    if (years.empty() || a.empty() || b.empty()) {
        throw EmptyIntersectionError(a.name(), b.name());
    }

    // Union policies still need an overlap to be meaningful
    if (policy_ != AlignmentPolicy::Intersection) {
        std::vector<int> common;
        std::set_intersection(a.years().begin(), a.years().end(),
                              b.years().begin(), b.years().end(),
                              std::back_inserter(common));
        if (common.empty()) {
            throw EmptyIntersectionError(a.name(), b.name());
        }
    }

    AlignedPair result;
    result.first = reindex(a, years);
    result.second = reindex(b_converted, years);
    result.years = std::move(years);
    result.unit = a.unit();
    return result;
}

TimeSeries UnitAligner::reindex(const TimeSeries& series, const std::vector<int>& years) const {
    const auto& src_years = series.years();
    const auto& src_values = series.values();

    std::vector<double> values;
    values.reserve(years.size());

    size_t j = 0;
    bool seen = false;
    double last = 0.0;
    for (int year : years) {
        while (j < src_years.size() && src_years[j] < year) {
            last = src_values[j];
            seen = true;
            ++j;
        }
        if (j < src_years.size() && src_years[j] == year) {
            values.push_back(src_values[j]);
            continue;
        }
        // Gap: only reachable under a union policy
        if (policy_ == AlignmentPolicy::UnionFillZero) {
            values.push_back(0.0);
        } else {
            values.push_back(seen ? last : src_values.front());
        }
    }

    return TimeSeries(series.name(), series.unit(), years, std::move(values));
}

} // namespace impactcalc
