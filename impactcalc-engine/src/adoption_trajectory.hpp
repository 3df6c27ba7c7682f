#ifndef IMPACTCALC_ADOPTION_TRAJECTORY_HPP
#define IMPACTCALC_ADOPTION_TRAJECTORY_HPP

#include "market.hpp"
#include "time_series.hpp"
#include <string>
#include <vector>

namespace impactcalc {

// Which side of the comparison a trajectory plays
enum class AdoptionRole {
    Projected,   // scenario-specific
    Reference    // the "no new action" baseline, one per solution
};

std::string adoption_role_to_string(AdoptionRole role);

// Soft-bound violations found by validate_against()
enum class AdoptionWarningKind {
    Negative,              // adoption < 0, magnitude = -adoption
    ExceedsMarket,         // adoption > tam, magnitude = adoption - tam
    OutsideMarketHorizon   // year has no TAM value, magnitude = adoption
};

std::string adoption_warning_kind_to_string(AdoptionWarningKind kind);

struct AdoptionWarning {
    int year;
    double magnitude;
    AdoptionWarningKind kind;

    AdoptionWarning(int y, double m, AdoptionWarningKind k)
        : year(y), magnitude(m), kind(k) {}

    std::string describe() const;
};

// AdoptionTrajectory: solution-served quantity per year, in the market's unit.
// Projected and reference trajectories share this one shape; only the role
// tag tells them apart.
class AdoptionTrajectory {
public:
    AdoptionTrajectory(TimeSeries adoption, AdoptionRole role);

    const TimeSeries& series() const { return adoption_; }
    AdoptionRole role() const { return role_; }
    const std::string& name() const { return adoption_.name(); }
    const std::string& unit() const { return adoption_.unit(); }
    const std::vector<int>& years() const { return adoption_.years(); }

    double adoption_at(int year) const { return adoption_.value_at(year); }

    // Checks 0 <= adoption <= tam per year. Never throws on a violation:
    // the engine keeps using the raw values and the caller decides.
    std::vector<AdoptionWarning> validate_against(const Market& market) const;

    // adoption / tam per year over the shared years; zero TAM gives 0.
    // Throws UnitMismatchError if the units differ.
    TimeSeries share_of(const Market& market) const;

private:
    TimeSeries adoption_;
    AdoptionRole role_;
};

} // namespace impactcalc

#endif // IMPACTCALC_ADOPTION_TRAJECTORY_HPP
