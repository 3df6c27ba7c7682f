#include "impact_engine.hpp"
#include "conventional.hpp"
#include "logger.hpp"
#include "metric.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <sstream>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace impactcalc {

namespace {

std::string describe_years(const std::string& label, const TimeSeries& s) {
    std::ostringstream oss;
    oss << label << " '" << s.name() << "' ";
    if (s.empty()) {
        oss << "[no years]";
    } else {
        oss << "[" << s.first_year() << ".." << s.last_year() << ", " << s.size() << " years]";
    }
    return oss.str();
}

double elapsed_ms_since(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

// ============================================================================
// Result types
// ============================================================================

Impact::Impact() : metric_name(), scenario_name(), series() {}

Impact::Impact(const std::string& metric, const std::string& scenario, TimeSeries values)
    : metric_name(metric), scenario_name(scenario), series(std::move(values)) {}

ImpactOutcome::ImpactOutcome()
    : success(false), impact(), error_kind(ErrorKind::Internal), error_message() {}

ImpactOutcome ImpactOutcome::succeeded(Impact impact) {
    ImpactOutcome outcome;
    outcome.success = true;
    outcome.impact = std::move(impact);
    return outcome;
}

ImpactOutcome ImpactOutcome::failed(ErrorKind kind, const std::string& message) {
    ImpactOutcome outcome;
    outcome.success = false;
    outcome.error_kind = kind;
    outcome.error_message = message;
    return outcome;
}

ImpactBatch::ImpactBatch()
    : scenario_name(), outcomes(), succeeded(0), failed(0), execution_time_ms(0.0) {}

const Impact& ImpactBatch::impact(const std::string& metric_name) const {
    auto it = outcomes.find(metric_name);
    if (it == outcomes.end()) {
        throw InvalidInputError("batch for scenario '" + scenario_name +
                                "' has no metric '" + metric_name + "'");
    }
    if (!it->second.success) {
        throw ImpactError(it->second.error_kind, it->second.error_message);
    }
    return *it->second.impact;
}

std::vector<std::string> ImpactBatch::failed_metrics() const {
    std::vector<std::string> names;
    for (const auto& [name, outcome] : outcomes) {
        if (!outcome.success) {
            names.push_back(name);
        }
    }
    return names;
}

// ============================================================================
// ImpactEngine
// ============================================================================

ImpactEngine::ImpactEngine() : ImpactEngine(EngineConfig()) {}

ImpactEngine::ImpactEngine(EngineConfig config)
    : config_(std::move(config)), aligner_() {
    validate_engine_config(config_);
    aligner_ = UnitAligner(UnitConversionTable(config_.unit_conversions), config_.alignment_policy);
}

void ImpactEngine::check_horizons(const Scenario& scenario) const {
    const TimeSeries& tam = scenario.market().series();
    const TimeSeries& projected = scenario.projected().series();
    const TimeSeries& reference = scenario.reference().adoption().series();
    const TimeSeries& reference_tam = scenario.reference().market().series();

    if (!tam.same_years(projected)) {
        throw InconsistentHorizonError(describe_years("market", tam) + " vs " +
                                       describe_years("projected adoption", projected));
    }
    if (!projected.same_years(reference)) {
        throw InconsistentHorizonError(describe_years("projected adoption", projected) + " vs " +
                                       describe_years("reference adoption", reference));
    }
    if (!tam.same_years(reference_tam)) {
        throw InconsistentHorizonError(describe_years("scenario market", tam) + " vs " +
                                       describe_years("reference market", reference_tam));
    }
}

AdoptionTrajectory ImpactEngine::in_market_unit(const AdoptionTrajectory& adoption,
                                                const Market& market) const {
    if (adoption.unit() == market.unit() ||
        !aligner_.conversions().can_convert(adoption.unit(), market.unit())) {
        return adoption;
    }
    return AdoptionTrajectory(aligner_.convert(adoption.series(), market.unit()), adoption.role());
}

ImpactEngine::ValidatedAdoption ImpactEngine::validate_adoption(const Scenario& scenario,
                                                               ImpactContext ctx) const {
    Logger& logger = Logger::get_instance();
    const Market& market = scenario.market();

    check_horizons(scenario);

    ValidatedAdoption adoption{in_market_unit(scenario.projected(), market),
                               in_market_unit(scenario.reference().adoption(), market),
                               {}, {}};

    // Soft bounds: reported, never used to alter values
    ctx.phase = "validate";
    adoption.projected_warnings = adoption.projected.validate_against(market);
    adoption.reference_warnings = adoption.reference.validate_against(market);
    logger.log_adoption_warnings(ctx, AdoptionRole::Projected, adoption.projected_warnings);
    logger.log_adoption_warnings(ctx, AdoptionRole::Reference, adoption.reference_warnings);

    if (config_.treat_warnings_as_errors &&
        (!adoption.projected_warnings.empty() || !adoption.reference_warnings.empty())) {
        std::ostringstream oss;
        oss << "scenario '" << scenario.name() << "' adoption violates market bounds ("
            << adoption.projected_warnings.size() << " projected, "
            << adoption.reference_warnings.size() << " reference warnings)";
        throw InvalidInputError(oss.str());
    }

    return adoption;
}

ImpactTrajectories ImpactEngine::derive_trajectories(const Scenario& scenario,
                                                     const std::string& metric_name,
                                                     const MetricCoefficients& coefficients,
                                                     const ValidatedAdoption& adoption) const {
    Logger& logger = Logger::get_instance();
    ImpactContext ctx(scenario.name(), metric_name);
    auto start_time = std::chrono::high_resolution_clock::now();

    const Market& market = scenario.market();
    logger.log_impact_start(ctx, market.years().size());

    ImpactTrajectories result;

    ctx.phase = "derive";
    result.conventional_projected = derive_conventional(market, adoption.projected, config_.floor_epsilon);
    result.conventional_reference = derive_conventional(market, adoption.reference, config_.floor_epsilon);

    ctx.phase = "metric";
    result.metric_projected = compute_metric(metric_name, adoption.projected.series(),
                                             result.conventional_projected, coefficients)
                                  .with_name(metric_name + " (" + scenario.name() + ")");
    result.metric_reference = compute_metric(metric_name, adoption.reference.series(),
                                             result.conventional_reference, coefficients)
                                  .with_name(metric_name + " (" + scenario.reference().name() + ")");
    logger.log_trajectory(ctx, result.metric_projected);
    logger.log_trajectory(ctx, result.metric_reference);

    // Both derive from one market, so a mismatch here is a configuration defect
    if (!result.metric_projected.aligned_with(result.metric_reference)) {
        throw InconsistentHorizonError(describe_years("scenario metric", result.metric_projected) +
                                       " vs " +
                                       describe_years("reference metric", result.metric_reference));
    }

    ctx.phase = "difference";
    TimeSeries difference = result.metric_projected.subtract(result.metric_reference)
                                .with_name(metric_name + " impact (" + scenario.name() + ")");

    result.impact = Impact(metric_name, scenario.name(), std::move(difference));
    result.impact.projected_warnings = adoption.projected_warnings;
    result.impact.reference_warnings = adoption.reference_warnings;

    logger.log_impact_complete(ctx, result.impact.series, elapsed_ms_since(start_time));

    return result;
}

ImpactTrajectories ImpactEngine::compute_trajectories(const Scenario& scenario,
                                                      const std::string& metric_name) const {
    const MetricCoefficients& coefficients = scenario.coefficients_for(metric_name);
    ValidatedAdoption adoption = validate_adoption(scenario, ImpactContext(scenario.name(), metric_name));
    return derive_trajectories(scenario, metric_name, coefficients, adoption);
}

Impact ImpactEngine::compute_impact(const Scenario& scenario, const std::string& metric_name) const {
    return compute_trajectories(scenario, metric_name).impact;
}

ImpactBatch ImpactEngine::compute_impact_all(const Scenario& scenario) const {
    ImpactBatch batch;
    batch.scenario_name = scenario.name();

    auto start_time = std::chrono::high_resolution_clock::now();

    const std::vector<std::string> names = scenario.metric_names();
    std::vector<ImpactOutcome> results(names.size());

    // Validated once; a failure here fails every metric the same way
    std::optional<ValidatedAdoption> adoption;
    std::optional<ImpactOutcome> shared_failure;
    try {
        adoption.emplace(validate_adoption(scenario, ImpactContext(scenario.name(), "")));
    } catch (const ImpactError& e) {
        shared_failure = ImpactOutcome::failed(e.kind(), e.what());
    } catch (const std::exception& e) {
        shared_failure = ImpactOutcome::failed(ErrorKind::Internal, e.what());
    }

    // Each slot is written by exactly one iteration; nothing else is shared
    auto run_metric = [&](size_t i) {
        try {
            results[i] = ImpactOutcome::succeeded(
                derive_trajectories(scenario, names[i], scenario.coefficients_for(names[i]), *adoption)
                    .impact);
        } catch (const ImpactError& e) {
            results[i] = ImpactOutcome::failed(e.kind(), e.what());
        } catch (const std::exception& e) {
            results[i] = ImpactOutcome::failed(ErrorKind::Internal, e.what());
        }
    };

    const std::ptrdiff_t count = shared_failure ? 0 : static_cast<std::ptrdiff_t>(names.size());
    if (shared_failure) {
        std::fill(results.begin(), results.end(), *shared_failure);
    }

#ifdef HAVE_OPENMP
    const int threads = config_.max_threads > 0 ? config_.max_threads : omp_get_max_threads();
    const bool fan_out = config_.parallel && count > 1;

    #pragma omp parallel for if(fan_out) num_threads(threads) schedule(dynamic, 1)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        run_metric(static_cast<size_t>(i));
    }
#else
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        run_metric(static_cast<size_t>(i));
    }
#endif

    // Collected in name order regardless of completion order
    Logger& logger = Logger::get_instance();
    for (size_t i = 0; i < names.size(); ++i) {
        if (results[i].success) {
            batch.succeeded++;
        } else {
            batch.failed++;
            ImpactContext ctx(scenario.name(), names[i]);
            ctx.phase = "batch";
            logger.log_metric_failure(ctx, results[i].error_kind, results[i].error_message);
        }
        batch.outcomes.emplace(names[i], std::move(results[i]));
    }

    batch.execution_time_ms = elapsed_ms_since(start_time);

    ImpactContext summary(scenario.name(), "");
    summary.phase = "batch";
    logger.log_batch_complete(summary, batch.succeeded, batch.failed, batch.execution_time_ms);

    return batch;
}

double ImpactEngine::reported_total(const Impact& impact, const Scenario& scenario, int last_year) const {
    return impact.series.total(scenario.metadata().report_start_year, last_year);
}

TimeSeries ImpactEngine::compare_impacts(const Impact& a, const Impact& b) const {
    AlignedPair aligned = aligner_.align(a.series, b.series);
    return aligned.first.subtract(aligned.second)
        .with_name(a.metric_name + " impact (" + a.scenario_name + " vs " + b.scenario_name + ")");
}

} // namespace impactcalc
