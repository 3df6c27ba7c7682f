#include "metric.hpp"
#include "errors.hpp"
#include "unit_aligner.hpp"
#include <vector>

namespace impactcalc {

void require_coefficient_coverage(const std::string& metric_name,
                                  const MetricCoefficients& coefficients,
                                  const std::vector<int>& years) {
    auto gap = coefficients.solution.first_gap(years);
    if (gap != years.end()) {
        throw MissingCoefficientYearError(metric_name, "solution", *gap);
    }
    gap = coefficients.conventional.first_gap(years);
    if (gap != years.end()) {
        throw MissingCoefficientYearError(metric_name, "conventional", *gap);
    }
}

TimeSeries compute_metric(const std::string& metric_name,
                          const TimeSeries& adoption,
                          const TimeSeries& conventional,
                          const MetricCoefficients& coefficients) {
    UnitAligner::require_aligned(adoption, conventional, "metric '" + metric_name + "'");

    const std::vector<int>& years = adoption.years();
    require_coefficient_coverage(metric_name, coefficients, years);

    const std::vector<double>& adopted = adoption.values();
    const std::vector<double>& conv = conventional.values();

    std::vector<double> values(years.size());
    for (size_t i = 0; i < years.size(); ++i) {
        int year = years[i];
        values[i] = coefficients.solution.value_at(year) * adopted[i] +
                    coefficients.conventional.value_at(year) * conv[i];
    }

    return TimeSeries(metric_name, coefficients.unit, years, std::move(values));
}

} // namespace impactcalc
