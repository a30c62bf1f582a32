#ifndef LATTICEGPM_SEARCH_LANDSCAPE_SEARCH_HPP
#define LATTICEGPM_SEARCH_LANDSCAPE_SEARCH_HPP

/**
 * @file landscape_search.hpp
 * @brief Random search for fully divergent endpoints of a sequence space.
 *
 * A landscape has no closed-form inverse, so endpoints are found by rejection
 * sampling: random sequences are drawn until one passes the threshold, then
 * until a second one passes it while differing from the first at every site.
 */

#include "latticegpm/core/random.hpp"
#include "latticegpm/lattice/fold_oracle.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace latticegpm {

/**
 * @brief Default number of random draws in a search.
 */
inline constexpr int kDefaultSearchIterations = 1000;

/**
 * @brief Two endpoint sequences that differ at every site.
 */
using SequencePair = std::pair<std::string, std::string>;

/**
 * @brief Generic rejection search.
 * @param length Length of the drawn sequences.
 * @param accept Predicate deciding whether a drawn sequence qualifies.
 * @param rng Random source (the only state the search mutates).
 * @param max_iterations Maximum number of draws.
 * @return The first qualifying sequence and the first later qualifying
 *         sequence at Hamming distance `length` from it.
 * @throws ValidationError if max_iterations <= 0.
 * @throws SearchExhaustedError if the budget runs out first.
 */
[[nodiscard]] SequencePair search_landscape(
    std::size_t length,
    const std::function<bool(const std::string&)>& accept,
    WichmannHillRNG& rng,
    int max_iterations = kDefaultSearchIterations);

/**
 * @brief Search for two divergent sequences folding below an energy threshold.
 * @param oracle Folding engine; fixes the sequence length.
 * @param temperature Folding temperature.
 * @param threshold A draw qualifies when its native energy is strictly lower.
 * @param rng Random source.
 * @param max_iterations Maximum number of draws.
 * @throws SearchExhaustedError if no pair is found within the budget.
 */
[[nodiscard]] SequencePair search_conformation_space(
    const FoldOracle& oracle,
    double temperature,
    double threshold,
    WichmannHillRNG& rng,
    int max_iterations = kDefaultSearchIterations);

/**
 * @brief Search for two divergent sequences with fitness above a threshold.
 * @param oracle Fitness function; fixes the sequence length.
 * @param threshold A draw qualifies when its fitness is strictly higher.
 * @param rng Random source.
 * @param max_iterations Maximum number of draws.
 * @throws SearchExhaustedError if no pair is found within the budget.
 */
[[nodiscard]] SequencePair search_fitness_landscape(
    const FitnessOracle& oracle,
    double threshold,
    WichmannHillRNG& rng,
    int max_iterations = kDefaultSearchIterations);

} // namespace latticegpm

#endif // LATTICEGPM_SEARCH_LANDSCAPE_SEARCH_HPP
