#include "scenario.hpp"
#include "errors.hpp"

namespace impactcalc {

// ============================================================================
// ScenarioMetadata Implementation
// ============================================================================

ScenarioMetadata::ScenarioMetadata()
    : description(), report_start_year(2020) {}

ScenarioMetadata::ScenarioMetadata(const std::string& desc, int start_year)
    : description(desc), report_start_year(start_year) {}

// ============================================================================
// Scenario Implementation
// ============================================================================

Scenario::Scenario(std::string name,
                   std::shared_ptr<const Market> market,
                   AdoptionTrajectory projected,
                   std::shared_ptr<const ReferenceScenario> reference,
                   std::map<std::string, MetricCoefficients> coefficients,
                   ScenarioMetadata metadata)
    : name_(std::move(name)),
      market_(std::move(market)),
      projected_(std::move(projected)),
      reference_(std::move(reference)),
      coefficients_(std::move(coefficients)),
      metadata_(std::move(metadata)) {
    if (!market_) {
        throw InvalidInputError("scenario '" + name_ + "' has no market");
    }
    if (!reference_) {
        throw InvalidInputError("scenario '" + name_ + "' has no reference scenario");
    }
    if (projected_.role() != AdoptionRole::Projected) {
        throw InvalidInputError("scenario '" + name_ +
                                "' requires a projected-role adoption trajectory");
    }
}

std::vector<std::string> Scenario::metric_names() const {
    std::vector<std::string> names;
    names.reserve(coefficients_.size());
    for (const auto& entry : coefficients_) {
        names.push_back(entry.first);
    }
    return names;
}

bool Scenario::has_metric(const std::string& metric_name) const {
    return coefficients_.find(metric_name) != coefficients_.end();
}

const MetricCoefficients& Scenario::coefficients_for(const std::string& metric_name) const {
    auto it = coefficients_.find(metric_name);
    if (it == coefficients_.end()) {
        throw InvalidInputError("scenario '" + name_ + "' declares no metric '" + metric_name + "'");
    }
    return it->second;
}

} // namespace impactcalc
