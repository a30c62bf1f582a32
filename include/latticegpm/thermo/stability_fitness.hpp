#ifndef LATTICEGPM_THERMO_STABILITY_FITNESS_HPP
#define LATTICEGPM_THERMO_STABILITY_FITNESS_HPP

/**
 * @file stability_fitness.hpp
 * @brief Fitness defined as the fraction of a protein that is folded.
 */

#include "latticegpm/lattice/fold_oracle.hpp"

namespace latticegpm {

/**
 * @class StabilityFitness
 * @brief Fitness oracle built on a fold oracle.
 *
 * A sequence with a unique native state has fitness equal to its fraction
 * folded at the oracle's temperature; any other sequence has fitness 0.
 */
class StabilityFitness : public FitnessOracle {
public:
    /**
     * @param oracle Folding engine (not owned; must outlive this object).
     * @param temperature Temperature in units of kT.
     * @throws ValidationError if temperature <= 0.
     */
    StabilityFitness(const FoldOracle& oracle, double temperature);
    StabilityFitness(const FoldOracle&& oracle, double temperature) = delete;

    [[nodiscard]] std::size_t length() const override { return oracle_.length(); }

    [[nodiscard]] double fitness(const std::string& sequence) const override;

private:
    const FoldOracle& oracle_;
    double temperature_;
};

} // namespace latticegpm

#endif // LATTICEGPM_THERMO_STABILITY_FITNESS_HPP
