#include "adoption_trajectory.hpp"
#include "errors.hpp"
#include <sstream>

namespace impactcalc {

std::string adoption_role_to_string(AdoptionRole role) {
    switch (role) {
        case AdoptionRole::Projected: return "projected";
        case AdoptionRole::Reference: return "reference";
        default: return "unknown";
    }
}

std::string adoption_warning_kind_to_string(AdoptionWarningKind kind) {
    switch (kind) {
        case AdoptionWarningKind::Negative: return "negative";
        case AdoptionWarningKind::ExceedsMarket: return "exceeds_market";
        case AdoptionWarningKind::OutsideMarketHorizon: return "outside_market_horizon";
        default: return "unknown";
    }
}

std::string AdoptionWarning::describe() const {
    std::ostringstream oss;
    oss << "year " << year << ": " << adoption_warning_kind_to_string(kind)
        << " by " << magnitude;
    return oss.str();
}

AdoptionTrajectory::AdoptionTrajectory(TimeSeries adoption, AdoptionRole role)
    : adoption_(std::move(adoption)), role_(role) {}

std::vector<AdoptionWarning> AdoptionTrajectory::validate_against(const Market& market) const {
    std::vector<AdoptionWarning> warnings;
    const auto& years = adoption_.years();
    const auto& values = adoption_.values();

    for (size_t i = 0; i < years.size(); ++i) {
        int year = years[i];
        double adoption = values[i];

        if (adoption < 0.0) {
            warnings.emplace_back(year, -adoption, AdoptionWarningKind::Negative);
        }

        if (!market.series().has_year(year)) {
            warnings.emplace_back(year, adoption, AdoptionWarningKind::OutsideMarketHorizon);
            continue;
        }

        double tam = market.demand_at(year);
        if (adoption > tam) {
            warnings.emplace_back(year, adoption - tam, AdoptionWarningKind::ExceedsMarket);
        }
    }

    return warnings;
}

TimeSeries AdoptionTrajectory::share_of(const Market& market) const {
    if (adoption_.unit() != market.unit()) {
        throw UnitMismatchError("share of '" + adoption_.name() + "' [" + adoption_.unit() +
                                "] in '" + market.name() + "' [" + market.unit() + "]");
    }

    std::vector<int> years;
    std::vector<double> shares;
    const auto& adoption_years = adoption_.years();
    const auto& adoption_values = adoption_.values();
    for (size_t i = 0; i < adoption_years.size(); ++i) {
        int year = adoption_years[i];
        if (!market.series().has_year(year)) {
            continue;
        }
        double tam = market.demand_at(year);
        years.push_back(year);
        shares.push_back(tam == 0.0 ? 0.0 : adoption_values[i] / tam);
    }

    return TimeSeries(adoption_.name() + " share", "fraction", std::move(years), std::move(shares));
}

} // namespace impactcalc
