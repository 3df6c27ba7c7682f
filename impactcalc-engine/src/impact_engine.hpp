#ifndef IMPACTCALC_IMPACT_ENGINE_HPP
#define IMPACTCALC_IMPACT_ENGINE_HPP

#include "adoption_trajectory.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "scenario.hpp"
#include "time_series.hpp"
#include "unit_aligner.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace impactcalc {

// Impact of one scenario on one metric: metric_scenario - metric_reference
struct Impact {
    std::string metric_name;
    std::string scenario_name;
    TimeSeries series;                                 // In the metric's declared unit
    std::vector<AdoptionWarning> projected_warnings;   // Informational only
    std::vector<AdoptionWarning> reference_warnings;

    Impact();
    Impact(const std::string& metric, const std::string& scenario, TimeSeries values);

    const std::string& unit() const { return series.unit(); }
    const std::vector<int>& years() const { return series.years(); }
    double value_at(int year) const { return series.value_at(year); }
};

// Every intermediate of an impact computation, for presentation collaborators
struct ImpactTrajectories {
    TimeSeries conventional_projected;
    TimeSeries conventional_reference;
    TimeSeries metric_projected;
    TimeSeries metric_reference;
    Impact impact;
};

// Result of one metric inside compute_impact_all
struct ImpactOutcome {
    bool success;
    std::optional<Impact> impact;       // Set iff success
    ErrorKind error_kind;               // Meaningful iff !success
    std::string error_message;

    ImpactOutcome();

    static ImpactOutcome succeeded(Impact impact);
    static ImpactOutcome failed(ErrorKind kind, const std::string& message);
};

// Per-metric results of compute_impact_all, keyed (and so ordered) by metric name
struct ImpactBatch {
    std::string scenario_name;
    std::map<std::string, ImpactOutcome> outcomes;
    size_t succeeded;
    size_t failed;
    double execution_time_ms;

    ImpactBatch();

    bool all_succeeded() const { return failed == 0; }

    // Throws InvalidInputError for an unknown metric, or the recorded
    // failure's message (as ImpactError of the recorded kind) for a failed one
    const Impact& impact(const std::string& metric_name) const;

    std::vector<std::string> failed_metrics() const;
};

// ImpactEngine: computes scenario impact against the reference baseline.
//
// For a metric m:
//   conventional_p = floor0(tam - projected)      conventional_r = floor0(tam - reference)
//   metric_p = c_soln * projected + c_conv * conventional_p
//   metric_r = c_soln * reference + c_conv * conventional_r
//   impact   = metric_p - metric_r
//
// Both trajectories use the scenario's Market. The engine is stateless apart
// from its configuration: every call recomputes from the scenario and nothing
// is cached, so one engine may be shared by any number of threads.
class ImpactEngine {
public:
    ImpactEngine();

    // Throws ConfigParseError if the configuration is invalid
    explicit ImpactEngine(EngineConfig config);

    // Throws:
    //   InvalidInputError          metric not declared by the scenario
    //   InconsistentHorizonError   market / projected / reference years differ
    //   UnitMismatchError          adoption unit is not the market unit and
    //                              no conversion is declared
    //   MissingCoefficientYearError coefficient series with a gap
    Impact compute_impact(const Scenario& scenario, const std::string& metric_name) const;

    // Same contract as compute_impact, keeping every intermediate
    ImpactTrajectories compute_trajectories(const Scenario& scenario,
                                            const std::string& metric_name) const;

    // Every declared metric; per-metric failures are recorded, never thrown.
    // Adoption is validated once for the whole batch, so a horizon or
    // warnings-as-errors failure is recorded against every metric.
    ImpactBatch compute_impact_all(const Scenario& scenario) const;

    // Sum of impact from the scenario's report_start_year to last_year
    double reported_total(const Impact& impact, const Scenario& scenario, int last_year) const;

    // a - b after aligning them with the configured policy and conversions
    // (for comparing two scenarios' impacts over different horizons).
    // Throws IncompatibleUnitsError / EmptyIntersectionError.
    TimeSeries compare_impacts(const Impact& a, const Impact& b) const;

    const EngineConfig& config() const { return config_; }
    const UnitAligner& aligner() const { return aligner_; }

private:
    // Scenario adoption checked against its market, shared by every metric
    struct ValidatedAdoption {
        AdoptionTrajectory projected;
        AdoptionTrajectory reference;
        std::vector<AdoptionWarning> projected_warnings;
        std::vector<AdoptionWarning> reference_warnings;
    };

    EngineConfig config_;
    UnitAligner aligner_;

    void check_horizons(const Scenario& scenario) const;

    // Projected/reference adoption expressed in the market unit where a
    // conversion is declared; otherwise returned unchanged
    AdoptionTrajectory in_market_unit(const AdoptionTrajectory& adoption, const Market& market) const;

    // Horizon and unit checks plus soft-bound validation; logs one
    // adoption_warning event per trajectory with warnings
    ValidatedAdoption validate_adoption(const Scenario& scenario, ImpactContext ctx) const;

    ImpactTrajectories derive_trajectories(const Scenario& scenario,
                                           const std::string& metric_name,
                                           const MetricCoefficients& coefficients,
                                           const ValidatedAdoption& adoption) const;
};

} // namespace impactcalc

#endif // IMPACTCALC_IMPACT_ENGINE_HPP
