#ifndef LATTICEGPM_THERMO_THERMODYNAMICS_HPP
#define LATTICEGPM_THERMO_THERMODYNAMICS_HPP

/**
 * @file thermodynamics.hpp
 * @brief Partition-function thermodynamics of a set of genotypes.
 *
 * This header defines the ThermodynamicsEngine, which scores every genotype
 * of a sequence space either by asking a fold oracle or by summing Boltzmann
 * weights over an explicit list of conformations, and the pure functions
 * deriving stability and fraction folded from a scored record.
 */

#include "latticegpm/core/types.hpp"
#include "latticegpm/lattice/conformation.hpp"
#include "latticegpm/lattice/fold_oracle.hpp"
#include "latticegpm/lattice/interaction_table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace latticegpm {

/**
 * @struct ScoringSource
 * @brief Where a scoring pass takes its energies from.
 *
 * An explicit, non-empty conformation list takes precedence over the oracle.
 */
struct ScoringSource {
    /** @brief Folding engine (not owned). */
    const FoldOracle* oracle = nullptr;

    /** @brief Candidate conformations for the partition function. */
    std::optional<std::vector<std::string>> conformations;

    /** @brief True when there is nothing to score with. */
    [[nodiscard]] bool empty() const {
        return oracle == nullptr && (!conformations || conformations->empty());
    }
};

/**
 * @brief Folding stability of a scored genotype.
 *
 *   ΔG = E_native + T · ln(Z - exp(-E_native / T))
 *
 * The native state's own Boltzmann weight is removed from Z before the log.
 * When Z <= exp(-E_native / T) the result is -inf or NaN; callers must keep
 * other states in the partition sum.
 */
[[nodiscard]] double stability(const ThermoRecord& record, double temperature);

/**
 * @brief Two-state fraction folded: 1 / (1 + exp(ΔG / T)).
 */
[[nodiscard]] double fraction_folded_from_stability(double stability, double temperature);

/**
 * @brief Fraction folded of a scored genotype.
 */
[[nodiscard]] double fraction_folded(const ThermoRecord& record, double temperature);

/**
 * @brief The derived quantity selected by a phenotype type.
 */
[[nodiscard]] double phenotype_value(const ThermoRecord& record,
                                     double temperature,
                                     PhenotypeType type);

/**
 * @class ThermodynamicsEngine
 * @brief Scores genotypes into thermodynamic records.
 *
 * Scoring is stateless apart from the temperature, the contact table and the
 * energy function fixed at construction, so one engine can be reused for any
 * number of passes.
 *
 * Usage:
 * @code
 * ThermodynamicsEngine engine(1.0, default_interaction_table());
 * ScoringSource source;
 * source.conformations = std::vector<std::string>{"URD", "UUR"};
 * auto records = engine.score(genotypes, source);
 * @endcode
 */
class ThermodynamicsEngine {
public:
    /**
     * @brief Construct an engine.
     * @param temperature Temperature in units of kT.
     * @param table Contact energies passed to the energy function.
     * @param energy Energy-scoring function (lattice fold_energy by default).
     * @throws ValidationError if temperature <= 0 or energy is empty.
     */
    ThermodynamicsEngine(double temperature,
                         InteractionTable table,
                         EnergyFunction energy = fold_energy);

    /**
     * @brief Score every genotype.
     * @param genotypes Genotypes in map order.
     * @param source Oracle and/or explicit conformations.
     * @param target_conformation When set, every native state is forced to it.
     * @return One record per genotype, same order.
     * @throws NoScoringSourceError if the source is empty.
     *
     * In explicit mode the native state is the first conformation of minimum
     * energy; a tied minimum marks the genotype as not folded. No unfolded
     * reference state is added to the list.
     */
    [[nodiscard]] std::vector<ThermoRecord> score(
        const std::vector<std::string>& genotypes,
        const ScoringSource& source,
        const std::optional<std::string>& target_conformation = std::nullopt) const;

    /**
     * @brief Score one genotype against explicit conformations.
     * @throws NoScoringSourceError if the list is empty.
     */
    [[nodiscard]] ThermoRecord score_conformations(
        const std::string& genotype,
        const std::vector<std::string>& conformations) const;

    /**
     * @brief Energy of a genotype in one conformation.
     */
    [[nodiscard]] double energy(const std::string& genotype,
                                const std::string& conformation) const {
        return energy_(genotype, conformation, table_);
    }

    [[nodiscard]] double temperature() const { return temperature_; }

    [[nodiscard]] const InteractionTable& interaction_table() const { return table_; }

private:
    double temperature_;
    InteractionTable table_;
    EnergyFunction energy_;
};

} // namespace latticegpm

#endif // LATTICEGPM_THERMO_THERMODYNAMICS_HPP
