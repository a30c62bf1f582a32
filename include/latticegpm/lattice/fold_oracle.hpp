#ifndef LATTICEGPM_LATTICE_FOLD_ORACLE_HPP
#define LATTICEGPM_LATTICE_FOLD_ORACLE_HPP

/**
 * @file fold_oracle.hpp
 * @brief Interfaces to external folding and fitness engines.
 *
 * The thermodynamics engine and the landscape search only talk to a folding
 * engine through these two interfaces.
 */

#include "latticegpm/core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace latticegpm {

/**
 * @brief Thermodynamic outcome of folding one sequence.
 */
using FoldResult = ThermoRecord;

/**
 * @class FoldOracle
 * @brief Abstract folding engine.
 *
 * Implementations must be reentrant: fold() may be called concurrently for
 * different sequences.
 */
class FoldOracle {
public:
    virtual ~FoldOracle() = default;

    /**
     * @brief Name of the folding engine, for logging.
     */
    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * @brief Sequence length this oracle folds.
     */
    [[nodiscard]] virtual std::size_t length() const = 0;

    /**
     * @brief Fold a sequence at a temperature.
     * @param sequence Sequence of length length().
     * @param temperature Temperature in units of kT (> 0).
     * @return Native energy, native conformation, partition sum and folded flag.
     */
    [[nodiscard]] virtual FoldResult fold(const std::string& sequence,
                                          double temperature) const = 0;
};

/**
 * @class FitnessOracle
 * @brief Abstract scalar fitness of a sequence.
 */
class FitnessOracle {
public:
    virtual ~FitnessOracle() = default;

    /**
     * @brief Sequence length this oracle scores.
     */
    [[nodiscard]] virtual std::size_t length() const = 0;

    /**
     * @brief Fitness of a sequence of length length().
     */
    [[nodiscard]] virtual double fitness(const std::string& sequence) const = 0;
};

} // namespace latticegpm

#endif // LATTICEGPM_LATTICE_FOLD_ORACLE_HPP
