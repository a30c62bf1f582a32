#ifndef LATTICEGPM_CORE_TYPES_HPP
#define LATTICEGPM_CORE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core type definitions for latticegpm.
 *
 * This header defines the fundamental types shared by the sequence-space,
 * thermodynamics and map modules: the amino acid alphabet used for random
 * sequences, the per-genotype thermodynamic record and the phenotype selector.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace latticegpm {

/**
 * @brief Number of standard amino acids.
 */
inline constexpr std::size_t kNumAminoAcids = 20;

/**
 * @brief Standard amino acid one-letter codes in canonical order.
 *
 * A R N D C Q E G H I L K M F P S T W Y V
 */
inline constexpr std::array<char, kNumAminoAcids> kAminoAcidChars = {
    'A', 'R', 'N', 'D', 'C',
    'Q', 'E', 'G', 'H', 'I',
    'L', 'K', 'M', 'F', 'P',
    'S', 'T', 'W', 'Y', 'V'
};

/**
 * @brief Check whether a character is one of the 20 standard amino acids.
 */
[[nodiscard]] constexpr bool is_amino_acid(char c) {
    for (char aa : kAminoAcidChars) {
        if (aa == c) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Mutation map: site index -> (wildtype residue, mutant residue).
 */
using MutationMap = std::map<std::size_t, std::pair<char, char>>;

/**
 * @struct ThermoRecord
 * @brief Folding thermodynamics of one genotype.
 *
 * One record is stored per genotype, in the same order as the genotype set.
 */
struct ThermoRecord {
    /** @brief Energy of the native state. */
    double native_energy = 0.0;

    /** @brief Native conformation; empty when the oracle found no unique one. */
    std::string native_conformation;

    /** @brief Boltzmann-weighted sum over all candidate conformations. */
    double partition_sum = 0.0;

    /** @brief True when the genotype has a unique ground state. */
    bool folded = false;
};

/**
 * @brief Which derived quantity a map exposes as its phenotype.
 */
enum class PhenotypeType : std::uint8_t {
    NativeEnergy = 0,   ///< Native-state energy
    Stability = 1,      ///< Folding free energy of the native state (default)
    FractionFolded = 2  ///< Two-state equilibrium fraction folded
};

/**
 * @brief Convert PhenotypeType to its persisted name.
 *
 * The names are the ones used in saved map files:
 * "nativeEs", "stabilities" and "fracfolded".
 */
[[nodiscard]] constexpr std::string_view to_string(PhenotypeType type) {
    switch (type) {
        case PhenotypeType::NativeEnergy: return "nativeEs";
        case PhenotypeType::Stability: return "stabilities";
        case PhenotypeType::FractionFolded: return "fracfolded";
    }
    return "Unknown";
}

/**
 * @brief Parse a persisted phenotype type name.
 * @param name One of "nativeEs", "stabilities", "fracfolded".
 * @return The matching PhenotypeType.
 * @throws InvalidPhenotypeTypeError if the name is not recognised.
 */
[[nodiscard]] PhenotypeType phenotype_type_from_string(std::string_view name);

} // namespace latticegpm

#endif // LATTICEGPM_CORE_TYPES_HPP
