#ifndef LATTICEGPM_CORE_RANDOM_HPP
#define LATTICEGPM_CORE_RANDOM_HPP

/**
 * @file random.hpp
 * @brief Wichmann-Hill random number generator for reproducible searches.
 *
 * Landscape searches draw their random sequences from this generator, so a
 * fixed seed reproduces the same pair of endpoint sequences.
 *
 * Reference:
 * Wichmann BA & Hill ID. 1982. An efficient and portable pseudo-random number
 * generator. Appl. Stat. 31:188-190
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace latticegpm {

/**
 * @class WichmannHillRNG
 * @brief Wichmann-Hill pseudo-random number generator.
 *
 * Combines three linear congruential generators to produce uniform random
 * numbers in [0,1). The generator holds all of its state, so independent
 * searches that each own a generator share nothing.
 */
class WichmannHillRNG {
public:
    /**
     * @brief Construct a new RNG with the given seed.
     * @param seed Initial seed value.
     */
    explicit WichmannHillRNG(int seed = 12345);

    /**
     * @brief Reset the generator to the state produced by a seed.
     * @param seed New seed value.
     */
    void set_seed(int seed);

    /**
     * @brief Generate a uniform random number in [0,1).
     */
    [[nodiscard]] double uniform();

    /**
     * @brief Draw a uniform index in [0, n).
     * @param n Number of choices (must be > 0).
     * @throws std::invalid_argument if n == 0.
     */
    [[nodiscard]] std::size_t uniform_index(std::size_t n);

    /**
     * @brief Draw a sequence with residues chosen uniformly from an alphabet.
     * @param length Sequence length.
     * @param alphabet Characters to draw from (must be non-empty).
     * @return Random sequence string.
     * @throws std::invalid_argument if the alphabet is empty.
     */
    [[nodiscard]] std::string random_sequence(std::size_t length, std::string_view alphabet);

    /**
     * @brief Draw a random sequence over the 20 standard amino acids.
     * @param length Sequence length.
     */
    [[nodiscard]] std::string random_protein(std::size_t length);

private:
    // State variables for the three LCGs
    int x_{11};
    int y_{23};
    int z_{137};
};

} // namespace latticegpm

#endif // LATTICEGPM_CORE_RANDOM_HPP
