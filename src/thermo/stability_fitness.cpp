#include "latticegpm/thermo/stability_fitness.hpp"
#include "latticegpm/thermo/thermodynamics.hpp"
#include "latticegpm/core/errors.hpp"

#include <string>

namespace latticegpm {

StabilityFitness::StabilityFitness(const FoldOracle& oracle, double temperature)
    : oracle_(oracle)
    , temperature_(temperature) {
    if (!(temperature_ > 0.0)) {
        throw ValidationError("temperature must be positive, got " + std::to_string(temperature_));
    }
}

double StabilityFitness::fitness(const std::string& sequence) const {
    FoldResult result = oracle_.fold(sequence, temperature_);
    if (!result.folded) {
        return 0.0;
    }
    return fraction_folded(result, temperature_);
}

} // namespace latticegpm
