#ifndef IMPACTCALC_REFERENCE_SCENARIO_HPP
#define IMPACTCALC_REFERENCE_SCENARIO_HPP

#include "adoption_trajectory.hpp"
#include "market.hpp"
#include <memory>
#include <string>

namespace impactcalc {

// ReferenceScenario: the "no new action" baseline for one solution.
// Wraps exactly one Reference-role trajectory plus the market it is measured
// against. Immutable; every Scenario of the solution points at the same one.
class ReferenceScenario {
public:
    // Throws InvalidInputError for a null market or a Projected-role trajectory
    ReferenceScenario(std::string name,
                      std::shared_ptr<const Market> market,
                      AdoptionTrajectory adoption);

    const std::string& name() const { return name_; }
    const Market& market() const { return *market_; }
    const std::shared_ptr<const Market>& market_ptr() const { return market_; }
    const AdoptionTrajectory& adoption() const { return adoption_; }

private:
    std::string name_;
    std::shared_ptr<const Market> market_;
    AdoptionTrajectory adoption_;
};

} // namespace impactcalc

#endif // IMPACTCALC_REFERENCE_SCENARIO_HPP
