#ifndef IMPACTCALC_SCENARIO_HPP
#define IMPACTCALC_SCENARIO_HPP

#include "adoption_trajectory.hpp"
#include "coefficient.hpp"
#include "market.hpp"
#include "reference_scenario.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace impactcalc {

// Descriptive fields that do not take part in the computation
struct ScenarioMetadata {
    std::string description;
    int report_start_year;          // First year counted in reported totals

    ScenarioMetadata();
    ScenarioMetadata(const std::string& desc, int start_year);
};

// Scenario: one projected adoption compared against the solution's reference.
//
// Owns its projected trajectory and its metric -> coefficients mapping; shares
// (does not own) the Market and the ReferenceScenario with every other
// scenario of the same solution. Read-only after construction.
class Scenario {
public:
    // Throws InvalidInputError for null market/reference or a Reference-role
    // projected trajectory
    Scenario(std::string name,
             std::shared_ptr<const Market> market,
             AdoptionTrajectory projected,
             std::shared_ptr<const ReferenceScenario> reference,
             std::map<std::string, MetricCoefficients> coefficients,
             ScenarioMetadata metadata = ScenarioMetadata());

    const std::string& name() const { return name_; }
    const Market& market() const { return *market_; }
    const AdoptionTrajectory& projected() const { return projected_; }
    const ReferenceScenario& reference() const { return *reference_; }
    const ScenarioMetadata& metadata() const { return metadata_; }

    const std::map<std::string, MetricCoefficients>& coefficients() const { return coefficients_; }

    // Sorted metric names
    std::vector<std::string> metric_names() const;
    bool has_metric(const std::string& metric_name) const;

    // Throws InvalidInputError for an undeclared metric
    const MetricCoefficients& coefficients_for(const std::string& metric_name) const;

private:
    std::string name_;
    std::shared_ptr<const Market> market_;
    AdoptionTrajectory projected_;
    std::shared_ptr<const ReferenceScenario> reference_;
    std::map<std::string, MetricCoefficients> coefficients_;
    ScenarioMetadata metadata_;
};

} // namespace impactcalc

#endif // IMPACTCALC_SCENARIO_HPP
