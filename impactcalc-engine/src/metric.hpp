#ifndef IMPACTCALC_METRIC_HPP
#define IMPACTCALC_METRIC_HPP

#include "coefficient.hpp"
#include "time_series.hpp"
#include <string>
#include <vector>

namespace impactcalc {

// Metric trajectory for one adoption/conventional split:
//
//   metric(year) = solution_coefficient(year) * adoption(year)
//                + conventional_coefficient(year) * conventional(year)
//
// The result is named after the metric and carries coefficients.unit.
//
// Throws:
//   UnitMismatchError / YearRangeMismatchError if adoption and conventional
//     are not aligned
//   MissingCoefficientYearError if a series coefficient lacks an adoption year
//     (checked before any value is computed, so no partial result escapes)
TimeSeries compute_metric(const std::string& metric_name,
                          const TimeSeries& adoption,
                          const TimeSeries& conventional,
                          const MetricCoefficients& coefficients);

// Throws MissingCoefficientYearError for the first year either coefficient
// does not cover
void require_coefficient_coverage(const std::string& metric_name,
                                  const MetricCoefficients& coefficients,
                                  const std::vector<int>& years);

} // namespace impactcalc

#endif // IMPACTCALC_METRIC_HPP
