#include "time_series.hpp"
#include "errors.hpp"
#include "unit_aligner.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace impactcalc {

namespace {

constexpr size_t npos = std::numeric_limits<size_t>::max();

void validate_shape(const std::string& name, const std::vector<int>& years,
                    const std::vector<double>& values) {
    if (years.size() != values.size()) {
        std::ostringstream oss;
        oss << "series '" << name << "' has " << years.size() << " years but "
            << values.size() << " values";
        throw InvalidInputError(oss.str());
    }
    for (size_t i = 1; i < years.size(); ++i) {
        if (years[i] <= years[i - 1]) {
            std::ostringstream oss;
            oss << "series '" << name << "' years must be strictly ascending (year "
                << years[i] << " follows " << years[i - 1] << ")";
            throw InvalidInputError(oss.str());
        }
    }
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TimeSeries::TimeSeries()
    : name_(), unit_(), years_(), values_(), lookup_policy_(LookupPolicy::Strict) {}

TimeSeries::TimeSeries(std::string name, std::string unit,
                       std::vector<int> years, std::vector<double> values)
    : name_(std::move(name)),
      unit_(std::move(unit)),
      years_(std::move(years)),
      values_(std::move(values)),
      lookup_policy_(LookupPolicy::Strict) {
    validate_shape(name_, years_, values_);
}

TimeSeries TimeSeries::from_map(const std::string& name, const std::string& unit,
                                const std::map<int, double>& data) {
    std::vector<int> years;
    std::vector<double> values;
    years.reserve(data.size());
    values.reserve(data.size());
    for (const auto& [year, value] : data) {
        years.push_back(year);
        values.push_back(value);
    }
    return TimeSeries(name, unit, std::move(years), std::move(values));
}

TimeSeries TimeSeries::constant(const std::string& name, const std::string& unit,
                                int first_year, int last_year, double value) {
    if (last_year < first_year) {
        throw InvalidInputError("constant series '" + name + "' has last year before first year");
    }
    // Counted in 64 bits so a range ending at INT_MAX terminates
    const std::int64_t count = static_cast<std::int64_t>(last_year) - first_year + 1;
    std::vector<int> years;
    years.reserve(static_cast<size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        years.push_back(static_cast<int>(first_year + i));
    }
    std::vector<double> values(years.size(), value);
    return TimeSeries(name, unit, std::move(years), std::move(values));
}

// ============================================================================
// Lookup
// ============================================================================

int TimeSeries::first_year() const {
    if (years_.empty()) {
        throw InvalidInputError("series '" + name_ + "' is empty");
    }
    return years_.front();
}

int TimeSeries::last_year() const {
    if (years_.empty()) {
        throw InvalidInputError("series '" + name_ + "' is empty");
    }
    return years_.back();
}

size_t TimeSeries::index_of(int year) const {
    auto it = std::lower_bound(years_.begin(), years_.end(), year);
    if (it == years_.end() || *it != year) {
        return npos;
    }
    return static_cast<size_t>(it - years_.begin());
}

bool TimeSeries::has_year(int year) const {
    return index_of(year) != npos;
}

double TimeSeries::value_at(int year) const {
    size_t idx = index_of(year);
    if (idx != npos) {
        return values_[idx];
    }

    if (lookup_policy_ == LookupPolicy::Linear && !years_.empty() &&
        year > years_.front() && year < years_.back()) {
        auto upper = std::upper_bound(years_.begin(), years_.end(), year);
        size_t hi = static_cast<size_t>(upper - years_.begin());
        size_t lo = hi - 1;
        double frac = static_cast<double>(year - years_[lo]) /
                      static_cast<double>(years_[hi] - years_[lo]);
        return values_[lo] * (1.0 - frac) + values_[hi] * frac;
    }

    throw MissingYearError(name_, year);
}

bool TimeSeries::same_years(const TimeSeries& other) const {
    return years_ == other.years_;
}

bool TimeSeries::aligned_with(const TimeSeries& other) const {
    return unit_ == other.unit_ && same_years(other);
}

// ============================================================================
// Arithmetic
// ============================================================================

TimeSeries TimeSeries::add(const TimeSeries& other) const {
    UnitAligner::require_aligned(*this, other, "add");
    std::vector<double> out(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        out[i] = values_[i] + other.values_[i];
    }
    return TimeSeries(name_ + " + " + other.name_, unit_, years_, std::move(out));
}

TimeSeries TimeSeries::subtract(const TimeSeries& other) const {
    UnitAligner::require_aligned(*this, other, "subtract");
    std::vector<double> out(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        out[i] = values_[i] - other.values_[i];
    }
    return TimeSeries(name_ + " - " + other.name_, unit_, years_, std::move(out));
}

TimeSeries TimeSeries::multiply(const TimeSeries& other) const {
    UnitAligner::require_same_years(*this, other, "multiply");
    std::vector<double> out(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        out[i] = values_[i] * other.values_[i];
    }
    return TimeSeries(name_ + " * " + other.name_, unit_ + "*" + other.unit_,
                      years_, std::move(out));
}

TimeSeries TimeSeries::scale(double factor) const {
    return scale(factor, unit_);
}

TimeSeries TimeSeries::scale(double factor, const std::string& new_unit) const {
    std::vector<double> out(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        out[i] = values_[i] * factor;
    }
    return TimeSeries(name_, new_unit, years_, std::move(out));
}

TimeSeries TimeSeries::clamp_min(double floor, double epsilon) const {
    std::vector<double> out(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        out[i] = values_[i] < floor + epsilon ? floor : values_[i];
    }
    TimeSeries result(name_, unit_, years_, std::move(out));
    result.lookup_policy_ = lookup_policy_;
    return result;
}

TimeSeries TimeSeries::slice(int first_year, int last_year) const {
    std::vector<int> years;
    std::vector<double> values;
    for (size_t i = 0; i < years_.size(); ++i) {
        if (years_[i] >= first_year && years_[i] <= last_year) {
            years.push_back(years_[i]);
            values.push_back(values_[i]);
        }
    }
    return TimeSeries(name_, unit_, std::move(years), std::move(values));
}

double TimeSeries::total(int first_year, int last_year) const {
    double sum = 0.0;
    for (size_t i = 0; i < years_.size(); ++i) {
        if (years_[i] >= first_year && years_[i] <= last_year) {
            sum += values_[i];
        }
    }
    return sum;
}

double TimeSeries::total() const {
    double sum = 0.0;
    for (double v : values_) {
        sum += v;
    }
    return sum;
}

TimeSeries TimeSeries::growth_rates() const {
    std::vector<int> years;
    std::vector<double> rates;
    for (size_t i = 1; i < years_.size(); ++i) {
        if (values_[i - 1] == 0.0) {
            continue;
        }
        years.push_back(years_[i]);
        rates.push_back((values_[i] - values_[i - 1]) / values_[i - 1]);
    }
    return TimeSeries(name_ + " growth", "fraction", std::move(years), std::move(rates));
}

bool TimeSeries::approx_equal(const TimeSeries& other, double abs_tol, double rel_tol) const {
    if (!aligned_with(other)) {
        return false;
    }
    for (size_t i = 0; i < values_.size(); ++i) {
        double a = values_[i];
        double b = other.values_[i];
        if (std::isnan(a) || std::isnan(b)) {
            if (std::isnan(a) && std::isnan(b)) {
                continue;
            }
            return false;
        }
        double diff = std::fabs(a - b);
        if (diff > abs_tol && diff > rel_tol * std::max(std::fabs(a), std::fabs(b))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Copies with changed metadata
// ============================================================================

TimeSeries TimeSeries::with_name(const std::string& name) const {
    TimeSeries copy(*this);
    copy.name_ = name;
    return copy;
}

TimeSeries TimeSeries::with_unit(const std::string& unit) const {
    TimeSeries copy(*this);
    copy.unit_ = unit;
    return copy;
}

TimeSeries TimeSeries::with_lookup_policy(LookupPolicy policy) const {
    TimeSeries copy(*this);
    copy.lookup_policy_ = policy;
    return copy;
}

bool TimeSeries::operator==(const TimeSeries& other) const {
    return name_ == other.name_ && unit_ == other.unit_ &&
           years_ == other.years_ && values_ == other.values_;
}

} // namespace impactcalc
