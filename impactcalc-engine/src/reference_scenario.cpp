#include "reference_scenario.hpp"
#include "errors.hpp"

namespace impactcalc {

ReferenceScenario::ReferenceScenario(std::string name,
                                     std::shared_ptr<const Market> market,
                                     AdoptionTrajectory adoption)
    : name_(std::move(name)), market_(std::move(market)), adoption_(std::move(adoption)) {
    if (!market_) {
        throw InvalidInputError("reference scenario '" + name_ + "' has no market");
    }
    if (adoption_.role() != AdoptionRole::Reference) {
        throw InvalidInputError("reference scenario '" + name_ +
                                "' requires a reference-role adoption trajectory");
    }
}

} // namespace impactcalc
