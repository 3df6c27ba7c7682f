#ifndef IMPACTCALC_CONVENTIONAL_HPP
#define IMPACTCALC_CONVENTIONAL_HPP

#include "adoption_trajectory.hpp"
#include "market.hpp"
#include "time_series.hpp"

namespace impactcalc {

// Default tolerance for flooring TAM - adoption at zero. Differences below
// this are floating-point noise from upstream curve fitting, not demand.
constexpr double DEFAULT_FLOOR_EPSILON = 1e-9;

// Conventional share: the part of the market not served by the solution.
//
//   conventional(year) = max(tam(year) - adoption(year), 0)
//
// with values below floor_epsilon treated as zero. Always recomputed from its
// inputs and never stored.
//
// Throws UnitMismatchError / YearRangeMismatchError if the market and the
// adoption are not aligned.
TimeSeries derive_conventional(const Market& market,
                               const AdoptionTrajectory& adoption,
                               double floor_epsilon = DEFAULT_FLOOR_EPSILON);

} // namespace impactcalc

#endif // IMPACTCALC_CONVENTIONAL_HPP
