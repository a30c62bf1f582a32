#ifndef LATTICEGPM_LATTICE_INTERACTION_TABLE_HPP
#define LATTICEGPM_LATTICE_INTERACTION_TABLE_HPP

/**
 * @file interaction_table.hpp
 * @brief Contact energies between pairs of residues.
 *
 * The thermodynamics engine never looks inside the table; it hands it
 * unmodified to the energy-scoring function.
 */

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>

namespace latticegpm {

/**
 * @class InteractionTable
 * @brief Symmetric mapping from a residue pair to a contact energy.
 *
 * Pairs are identified by the two residue characters; setting (a, b) also
 * sets (b, a).
 */
class InteractionTable {
public:
    InteractionTable() = default;

    /**
     * @brief Set the contact energy of a residue pair (both orders).
     */
    void set(char a, char b, double energy);

    /**
     * @brief Contact energy of a residue pair.
     * @throws std::out_of_range if the pair is not in the table.
     */
    [[nodiscard]] double energy(char a, char b) const;

    /**
     * @brief Whether the pair has an energy.
     */
    [[nodiscard]] bool contains(char a, char b) const;

    /**
     * @brief Number of distinct unordered pairs in the table.
     */
    [[nodiscard]] std::size_t size() const { return pair_count_; }

    [[nodiscard]] bool empty() const { return pair_count_ == 0; }

private:
    static std::string key(char a, char b) { return std::string{a, b}; }

    std::unordered_map<std::string, double> energies_;
    std::size_t pair_count_ = 0;
};

/**
 * @brief Contact potential over the 20 standard amino acids.
 *
 * Statistical pair potential derived from contacts in solved protein
 * structures. Returned by reference to a table built on first use.
 */
[[nodiscard]] const InteractionTable& default_interaction_table();

/**
 * @brief Parse an interaction table.
 * @param is Input stream with one "<residue> <residue> <energy>" per line.
 *           Blank lines and lines starting with '#' are ignored.
 * @return Parsed table.
 * @throws ValidationError on a malformed line.
 */
[[nodiscard]] InteractionTable read_interaction_table(std::istream& is);

/**
 * @brief Read an interaction table from a file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws ValidationError on a malformed line.
 */
[[nodiscard]] InteractionTable read_interaction_table(const std::string& filename);

} // namespace latticegpm

#endif // LATTICEGPM_LATTICE_INTERACTION_TABLE_HPP
