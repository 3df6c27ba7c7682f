#ifndef IMPACTCALC_COEFFICIENT_HPP
#define IMPACTCALC_COEFFICIENT_HPP

#include "time_series.hpp"
#include <string>
#include <variant>
#include <vector>

namespace impactcalc {

// Coefficient: a per-unit factor that is either a constant or a year-indexed
// series (for factors that change over the horizon, e.g. grid emissions).
class Coefficient {
public:
    Coefficient();
    Coefficient(double value);
    Coefficient(TimeSeries series);

    bool is_constant() const;

    // Series coefficients must hold the exact year; no interpolation
    bool covers(int year) const;

    // First year in years that the coefficient does not hold, or years.end()
    std::vector<int>::const_iterator first_gap(const std::vector<int>& years) const;

    // Throws MissingYearError for a series coefficient without that year
    double value_at(int year) const;

    // nullptr for constants
    const TimeSeries* series() const;

private:
    std::variant<double, TimeSeries> value_;
};

// MetricCoefficients: the per-unit factors for one impact metric, applied to
// solution-served and conventionally-served units respectively.
//
// unit is the declared unit of the resulting metric trajectory; the engine
// trusts it rather than deriving it from coefficient and adoption units.
struct MetricCoefficients {
    Coefficient solution;
    Coefficient conventional;
    std::string unit;

    MetricCoefficients();
    MetricCoefficients(Coefficient soln, Coefficient conv, std::string metric_unit = "");
};

} // namespace impactcalc

#endif // IMPACTCALC_COEFFICIENT_HPP
