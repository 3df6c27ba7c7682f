#ifndef IMPACTCALC_MARKET_HPP
#define IMPACTCALC_MARKET_HPP

#include "time_series.hpp"
#include <string>
#include <vector>

namespace impactcalc {

// Market: the total addressable market (TAM) for a solution's functional unit.
// Independent of any adoption; immutable once built and shared read-only by
// the reference scenario and every projected scenario of a solution.
class Market {
public:
    // Throws InvalidInputError for an empty series
    explicit Market(TimeSeries tam);

    const TimeSeries& series() const { return tam_; }
    const std::string& name() const { return tam_.name(); }
    const std::string& unit() const { return tam_.unit(); }
    const std::vector<int>& years() const { return tam_.years(); }

    // Same failure semantics as TimeSeries::value_at
    double demand_at(int year) const;

    bool aligned_with(const TimeSeries& other) const { return tam_.aligned_with(other); }

private:
    TimeSeries tam_;
};

} // namespace impactcalc

#endif // IMPACTCALC_MARKET_HPP
