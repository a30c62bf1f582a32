#ifndef LATTICEGPM_SEQUENCE_BINARY_ENCODER_HPP
#define LATTICEGPM_SEQUENCE_BINARY_ENCODER_HPP

/**
 * @file binary_encoder.hpp
 * @brief Binary sequence space between a wildtype and a fully divergent mutant.
 *
 * Every genotype in the space is described by an L-bit binary string: bit j
 * is 0 when site j carries the wildtype residue and 1 when it carries the
 * mutant residue. Genotypes are always listed in ascending lexicographic
 * order of those strings ("0...0" first, "1...1" last), and the position of a
 * genotype in that list is its index everywhere else in the library.
 */

#include "latticegpm/core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace latticegpm {

/**
 * @brief Largest number of sites whose space can be enumerated (2^30 genotypes).
 */
inline constexpr std::size_t kMaxBinarySites = 30;

/**
 * @brief Count the sites at which two sequences differ.
 * @throws ValidationError if the lengths differ.
 */
[[nodiscard]] std::size_t hamming_distance(const std::string& a, const std::string& b);

/**
 * @brief Build the mutation map between a wildtype and a mutant.
 * @param wildtype Wildtype sequence.
 * @param mutant Mutant sequence differing from the wildtype at every site.
 * @return Map from site index to (wildtype residue, mutant residue).
 * @throws ValidationError if the lengths differ or exceed kMaxBinarySites.
 * @throws DivergenceError if the sequences share a residue at any site.
 */
[[nodiscard]] MutationMap binary_mutations_map(const std::string& wildtype,
                                               const std::string& mutant);

/**
 * @brief Enumerate all 2^L genotypes between a wildtype and a mutant.
 * @param wildtype Wildtype sequence.
 * @param mutant Mutant sequence differing from the wildtype at every site.
 * @return Genotypes in ascending lexicographic binary order.
 * @throws ValidationError if the lengths differ or exceed kMaxBinarySites.
 * @throws DivergenceError if the sequences are not fully divergent.
 */
[[nodiscard]] std::vector<std::string> enumerate(const std::string& wildtype,
                                                 const std::string& mutant);

/**
 * @brief Enumerate the genotypes described by a mutation map.
 * @param wildtype Wildtype sequence.
 * @param mutations Mutation map with one entry per wildtype site.
 * @return Genotypes in ascending lexicographic binary order.
 * @throws ValidationError if the map does not cover sites 0..L-1 or its
 *         wildtype residues disagree with the wildtype sequence.
 * @throws DivergenceError if a site maps a residue onto itself.
 */
[[nodiscard]] std::vector<std::string> mutations_to_genotypes(const std::string& wildtype,
                                                              const MutationMap& mutations);

/**
 * @brief All L-bit binary strings in ascending lexicographic order.
 * @throws ValidationError if length exceeds kMaxBinarySites.
 */
[[nodiscard]] std::vector<std::string> binary_strings(std::size_t length);

/**
 * @brief Binary representation of a single genotype.
 * @param genotype A genotype of the space.
 * @param wildtype Wildtype sequence.
 * @param mutant Mutant sequence.
 * @return '1' where the genotype carries the mutant residue, '0' otherwise.
 * @throws ValidationError if a site matches neither endpoint.
 */
[[nodiscard]] std::string genotype_to_binary(const std::string& genotype,
                                             const std::string& wildtype,
                                             const std::string& mutant);

} // namespace latticegpm

#endif // LATTICEGPM_SEQUENCE_BINARY_ENCODER_HPP
