#ifndef IMPACTCALC_UNIT_ALIGNER_HPP
#define IMPACTCALC_UNIT_ALIGNER_HPP

#include "time_series.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace impactcalc {

// How align() picks the common year range
enum class AlignmentPolicy {
    Intersection,       // years present in both series
    UnionFillForward,   // all years; gaps take the previous value (leading gap takes the first)
    UnionFillZero       // all years; gaps are 0
};

std::string alignment_policy_to_string(AlignmentPolicy policy);

// Throws ConfigParseError for unknown names
AlignmentPolicy string_to_alignment_policy(const std::string& name);

// A declared multiplicative conversion: value_in_to = value_in_from * factor
struct UnitConversion {
    std::string from;
    std::string to;
    double factor;

    UnitConversion();
    UnitConversion(const std::string& from_unit, const std::string& to_unit, double f);
};

// UnitConversionTable: immutable set of declared conversions.
// Declaring from->to implies to->from with the reciprocal factor.
class UnitConversionTable {
public:
    UnitConversionTable();

    // Throws InvalidInputError for non-positive factors or conflicting duplicates
    explicit UnitConversionTable(const std::vector<UnitConversion>& conversions);

    // True for identical units or a declared (or implied) conversion
    bool can_convert(const std::string& from, const std::string& to) const;

    // Factor to multiply a from-unit value by; throws IncompatibleUnitsError
    double factor(const std::string& from, const std::string& to) const;

    size_t size() const { return factors_.size(); }

private:
    std::map<std::pair<std::string, std::string>, double> factors_;
};

// Both inputs re-expressed on one year range and one unit
struct AlignedPair {
    TimeSeries first;
    TimeSeries second;
    std::vector<int> years;
    std::string unit;
};

// UnitAligner: the single gate every binary series operation passes through.
//
// require_aligned() is the strict check used by add/subtract and the engine:
// it never converts or re-indexes. align() is the permissive form used when
// a caller explicitly wants two differently-shaped series brought together.
class UnitAligner {
public:
    UnitAligner();
    UnitAligner(UnitConversionTable conversions, AlignmentPolicy policy);

    // Throws UnitMismatchError / YearRangeMismatchError, naming the operation
    static void require_aligned(const TimeSeries& a, const TimeSeries& b,
                                const std::string& operation);

    // Throws YearRangeMismatchError if the year sets differ (units not checked)
    static void require_same_years(const TimeSeries& a, const TimeSeries& b,
                                   const std::string& operation);

    // Canonical common range and unit (the first series' unit).
    // Throws IncompatibleUnitsError or EmptyIntersectionError.
    AlignedPair align(const TimeSeries& a, const TimeSeries& b) const;

    // series re-expressed in unit; throws IncompatibleUnitsError
    TimeSeries convert(const TimeSeries& series, const std::string& unit) const;

    AlignmentPolicy policy() const { return policy_; }
    const UnitConversionTable& conversions() const { return conversions_; }

private:
    UnitConversionTable conversions_;
    AlignmentPolicy policy_;

    TimeSeries reindex(const TimeSeries& series, const std::vector<int>& years) const;
};

} // namespace impactcalc

#endif // IMPACTCALC_UNIT_ALIGNER_HPP
