#include "coefficient.hpp"
#include "errors.hpp"
#include <algorithm>

namespace impactcalc {

Coefficient::Coefficient() : value_(0.0) {}

Coefficient::Coefficient(double value) : value_(value) {}

Coefficient::Coefficient(TimeSeries series) : value_(std::move(series)) {}

bool Coefficient::is_constant() const {
    return std::holds_alternative<double>(value_);
}

bool Coefficient::covers(int year) const {
    if (is_constant()) {
        return true;
    }
    return std::get<TimeSeries>(value_).has_year(year);
}

std::vector<int>::const_iterator Coefficient::first_gap(const std::vector<int>& years) const {
    return std::find_if(years.begin(), years.end(),
                        [this](int year) { return !covers(year); });
}

double Coefficient::value_at(int year) const {
    if (is_constant()) {
        return std::get<double>(value_);
    }
    const TimeSeries& s = std::get<TimeSeries>(value_);
    // Coefficients never interpolate, whatever policy the series carries
    if (!s.has_year(year)) {
        throw MissingYearError(s.name(), year);
    }
    return s.value_at(year);
}

const TimeSeries* Coefficient::series() const {
    return std::get_if<TimeSeries>(&value_);
}

MetricCoefficients::MetricCoefficients() : solution(), conventional(), unit() {}

MetricCoefficients::MetricCoefficients(Coefficient soln, Coefficient conv, std::string metric_unit)
    : solution(std::move(soln)), conventional(std::move(conv)), unit(std::move(metric_unit)) {}

} // namespace impactcalc
