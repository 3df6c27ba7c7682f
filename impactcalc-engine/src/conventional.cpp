#include "conventional.hpp"

namespace impactcalc {

TimeSeries derive_conventional(const Market& market,
                               const AdoptionTrajectory& adoption,
                               double floor_epsilon) {
    TimeSeries remaining = market.series().subtract(adoption.series());
    return remaining.clamp_min(0.0, floor_epsilon)
                    .with_name("conventional (" + adoption.name() + ")");
}

} // namespace impactcalc
