#include "solution.hpp"
#include "errors.hpp"

namespace impactcalc {

Solution::Solution(SolutionInfo info,
                   std::shared_ptr<const Market> market,
                   std::shared_ptr<const ReferenceScenario> reference)
    : info_(std::move(info)), market_(std::move(market)), reference_(std::move(reference)) {
    if (!market_) {
        throw InvalidInputError("solution '" + info_.identifier + "' has no market");
    }
    if (!reference_) {
        throw InvalidInputError("solution '" + info_.identifier + "' has no reference scenario");
    }
    if (!info_.functional_units.empty() && market_->unit() != info_.functional_units) {
        throw InvalidInputError("solution '" + info_.identifier + "' market unit '" +
                                market_->unit() + "' is not its functional unit '" +
                                info_.functional_units + "'");
    }
    if (reference_->market_ptr() != market_) {
        throw InvalidInputError("solution '" + info_.identifier +
                                "' reference scenario is measured against a different market");
    }
}

Scenario Solution::make_scenario(const std::string& name,
                                 TimeSeries projected_adoption,
                                 std::map<std::string, MetricCoefficients> coefficients,
                                 ScenarioMetadata metadata) const {
    return Scenario(name,
                    market_,
                    AdoptionTrajectory(std::move(projected_adoption), AdoptionRole::Projected),
                    reference_,
                    std::move(coefficients),
                    std::move(metadata));
}

} // namespace impactcalc
