#ifndef LATTICEGPM_LATTICE_LATTICE_CONFORMATIONS_HPP
#define LATTICEGPM_LATTICE_LATTICE_CONFORMATIONS_HPP

/**
 * @file lattice_conformations.hpp
 * @brief Exhaustive folding of short chains on a 2D square lattice.
 *
 * All self-avoiding walks of the chain are enumerated once, up to the
 * rotations and reflections of the lattice: the first step is always 'U' and
 * the first step that is not 'U' is always 'R'. Walks with the same set of
 * topological contacts have the same energy for every sequence, so they are
 * stored once per contact set together with the number of walks realising it.
 */

#include "latticegpm/lattice/conformation.hpp"
#include "latticegpm/lattice/fold_oracle.hpp"
#include "latticegpm/lattice/interaction_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace latticegpm {

/**
 * @brief Shortest chain LatticeConformations accepts.
 */
inline constexpr std::size_t kMinLatticeLength = 2;

/**
 * @brief Longest chain LatticeConformations accepts.
 */
inline constexpr std::size_t kMaxLatticeLength = 16;

/**
 * @struct ContactSet
 * @brief A distinct set of contacts and the walks that realise it.
 */
struct ContactSet {
    /** @brief Sorted topological contacts. */
    std::vector<Contact> contacts;

    /** @brief First walk found with these contacts. */
    std::string conformation;

    /** @brief Number of walks with exactly these contacts. */
    std::size_t degeneracy = 0;
};

/**
 * @class LatticeConformations
 * @brief Fold oracle over every conformation of a fixed-length chain.
 *
 * For a sequence at temperature T the partition sum is
 *   Z = Σ_sets degeneracy · exp(-E_set / T)
 * and the native state is the lowest-energy contact set. The sequence is
 * folded only if that minimum is unique and realised by a single walk;
 * otherwise the native conformation is reported as empty.
 *
 * Usage:
 * @code
 * LatticeConformations conformations(8);
 * FoldResult result = conformations.fold("PWKRHHEA", 1.0);
 * @endcode
 */
class LatticeConformations : public FoldOracle {
public:
    /**
     * @brief Enumerate every conformation of a chain.
     * @param length Number of residues.
     * @param table Contact energies (copied).
     * @throws ValidationError if length is outside
     *         [kMinLatticeLength, kMaxLatticeLength].
     */
    explicit LatticeConformations(std::size_t length,
                                  InteractionTable table = default_interaction_table());

    [[nodiscard]] std::string_view name() const override { return "2D lattice"; }

    [[nodiscard]] std::size_t length() const override { return length_; }

    /**
     * @throws ValidationError if the sequence length does not match.
     * @throws std::out_of_range if a residue pair is missing from the table.
     */
    [[nodiscard]] FoldResult fold(const std::string& sequence,
                                  double temperature) const override;

    /**
     * @brief Distinct contact sets, in order of first appearance.
     */
    [[nodiscard]] const std::vector<ContactSet>& contact_sets() const { return contact_sets_; }

    /**
     * @brief Total number of walks enumerated.
     */
    [[nodiscard]] std::size_t num_conformations() const { return num_conformations_; }

    /**
     * @brief Energy of a sequence in one contact set.
     */
    [[nodiscard]] double contact_energy(const std::string& sequence,
                                        const ContactSet& set) const;

    /**
     * @brief Contact energies used for folding.
     */
    [[nodiscard]] const InteractionTable& interaction_table() const { return table_; }

private:
    void enumerate_walks();

    std::size_t length_;
    InteractionTable table_;
    std::vector<ContactSet> contact_sets_;
    std::size_t num_conformations_ = 0;
};

} // namespace latticegpm

#endif // LATTICEGPM_LATTICE_LATTICE_CONFORMATIONS_HPP
