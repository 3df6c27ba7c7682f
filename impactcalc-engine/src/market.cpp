#include "market.hpp"
#include "errors.hpp"

namespace impactcalc {

Market::Market(TimeSeries tam) : tam_(std::move(tam)) {
    if (tam_.empty()) {
        throw InvalidInputError("market '" + tam_.name() + "' has no years");
    }
}

double Market::demand_at(int year) const {
    return tam_.value_at(year);
}

} // namespace impactcalc
