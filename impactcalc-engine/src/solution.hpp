#ifndef IMPACTCALC_SOLUTION_HPP
#define IMPACTCALC_SOLUTION_HPP

#include "market.hpp"
#include "reference_scenario.hpp"
#include "scenario.hpp"
#include <map>
#include <memory>
#include <string>

namespace impactcalc {

/**
 * Descriptive identity of a solution
 */
struct SolutionInfo {
    std::string identifier;             // Short id, e.g. "improvedrice"
    std::string title;                  // English title
    std::string implementation_units;   // What is built or deployed, e.g. "km of bike path"
    std::string functional_units;       // What the market measures, e.g. "pkm"
};

/**
 * Solution: owns the Market and ReferenceScenario its scenarios share.
 *
 * Every solution family has the same analytical shape, so there is one
 * concrete Solution; only the data differs.
 */
class Solution {
public:
    /**
     * @throws InvalidInputError if either pointer is null, the market unit is
     *         not the functional unit, or the reference is measured against a
     *         different Market object
     */
    Solution(SolutionInfo info,
             std::shared_ptr<const Market> market,
             std::shared_ptr<const ReferenceScenario> reference);

    const SolutionInfo& info() const { return info_; }
    const std::string& identifier() const { return info_.identifier; }
    const Market& market() const { return *market_; }
    const ReferenceScenario& reference() const { return *reference_; }

    /**
     * Build a scenario over this solution's shared Market and ReferenceScenario
     *
     * @param name Scenario name (e.g. "PDS2")
     * @param projected_adoption Projected adoption in functional units
     * @param coefficients Metric name -> per-unit coefficients
     * @param metadata Description and report start year
     */
    Scenario make_scenario(const std::string& name,
                           TimeSeries projected_adoption,
                           std::map<std::string, MetricCoefficients> coefficients,
                           ScenarioMetadata metadata = ScenarioMetadata()) const;

private:
    SolutionInfo info_;
    std::shared_ptr<const Market> market_;
    std::shared_ptr<const ReferenceScenario> reference_;
};

} // namespace impactcalc

#endif // IMPACTCALC_SOLUTION_HPP
