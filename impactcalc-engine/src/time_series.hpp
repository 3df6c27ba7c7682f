#ifndef IMPACTCALC_TIME_SERIES_HPP
#define IMPACTCALC_TIME_SERIES_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace impactcalc {

// How value_at() treats a year the series does not hold
enum class LookupPolicy {
    Strict,     // throw MissingYearError
    Linear      // interpolate between neighbours, never extrapolate
};

// TimeSeries: year-indexed values with a unit tag and a display name.
// Years are unique and strictly ascending; gaps are allowed.
// All transformations return a new series, the receiver is never mutated.
class TimeSeries {
public:
    TimeSeries();

    // Throws InvalidInputError if years are not strictly ascending or the
    // vectors differ in length
    TimeSeries(std::string name, std::string unit,
               std::vector<int> years, std::vector<double> values);

    // Convenience for literal data: {{2020, 1.0}, {2021, 2.0}}
    static TimeSeries from_map(const std::string& name, const std::string& unit,
                               const std::map<int, double>& data);

    // Same value for every year in [first_year, last_year]
    static TimeSeries constant(const std::string& name, const std::string& unit,
                               int first_year, int last_year, double value);

    const std::string& name() const { return name_; }
    const std::string& unit() const { return unit_; }
    const std::vector<int>& years() const { return years_; }
    const std::vector<double>& values() const { return values_; }
    LookupPolicy lookup_policy() const { return lookup_policy_; }

    size_t size() const { return years_.size(); }
    bool empty() const { return years_.empty(); }
    int first_year() const;
    int last_year() const;

    bool has_year(int year) const;

    // Value for a year; missing years throw MissingYearError unless the
    // series was given LookupPolicy::Linear and the year is inside the range
    double value_at(int year) const;

    // Same year set and same unit
    bool aligned_with(const TimeSeries& other) const;
    bool same_years(const TimeSeries& other) const;

    // Strict arithmetic: requires aligned_with(), else UnitMismatchError or
    // YearRangeMismatchError
    TimeSeries add(const TimeSeries& other) const;
    TimeSeries subtract(const TimeSeries& other) const;

    // Element-wise product; requires identical years, units combine as "a*b"
    TimeSeries multiply(const TimeSeries& other) const;
    TimeSeries scale(double factor) const;
    TimeSeries scale(double factor, const std::string& new_unit) const;

    // Every value v < floor + epsilon becomes floor
    TimeSeries clamp_min(double floor, double epsilon = 0.0) const;

    // Inclusive year sub-range; years outside the series are ignored
    TimeSeries slice(int first_year, int last_year) const;

    // Sum of values whose year lies in [first_year, last_year]
    double total(int first_year, int last_year) const;
    double total() const;

    // (v[y] - v[prev]) / v[prev]; years whose previous value is zero are skipped
    TimeSeries growth_rates() const;

    // Same years and unit, values within abs_tol or rel_tol of each other
    bool approx_equal(const TimeSeries& other, double abs_tol = 1e-6,
                      double rel_tol = 1e-6) const;

    TimeSeries with_name(const std::string& name) const;
    TimeSeries with_unit(const std::string& unit) const;
    TimeSeries with_lookup_policy(LookupPolicy policy) const;

    bool operator==(const TimeSeries& other) const;
    bool operator!=(const TimeSeries& other) const { return !(*this == other); }

private:
    std::string name_;
    std::string unit_;
    std::vector<int> years_;
    std::vector<double> values_;
    LookupPolicy lookup_policy_;

    // Index of year in years_, or npos
    size_t index_of(int year) const;
};

} // namespace impactcalc

#endif // IMPACTCALC_TIME_SERIES_HPP
