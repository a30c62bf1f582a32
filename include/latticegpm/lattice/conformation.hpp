#ifndef LATTICEGPM_LATTICE_CONFORMATION_HPP
#define LATTICEGPM_LATTICE_CONFORMATION_HPP

/**
 * @file conformation.hpp
 * @brief Conformations on a 2D square lattice and their contact energies.
 *
 * A conformation of an L-residue chain is a string of L-1 unit steps, each
 * one of 'U' (up), 'D' (down), 'L' (left) or 'R' (right). Residue 0 sits at
 * the origin and residue i+1 sits one step from residue i.
 *
 * Example: "URD" places four residues on the corners of a unit square, so
 * residues 0 and 3 form a contact.
 */

#include "latticegpm/lattice/interaction_table.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace latticegpm {

/**
 * @brief Lattice point (x, y).
 */
using LatticePoint = std::array<int, 2>;

/**
 * @brief Topological contact between residues i < j.
 */
using Contact = std::pair<std::size_t, std::size_t>;

/**
 * @brief Energy-scoring function: energy of a sequence in a conformation.
 *
 * Must be pure and deterministic given its inputs.
 */
using EnergyFunction = std::function<double(
    const std::string& sequence,
    const std::string& conformation,
    const InteractionTable& table)>;

/**
 * @brief Lattice steps in canonical order.
 */
inline constexpr std::array<char, 4> kLatticeSteps = {'U', 'R', 'D', 'L'};

/**
 * @brief Unit displacement of a lattice step.
 * @throws ConformationError if the character is not U, D, L or R.
 */
[[nodiscard]] LatticePoint step_offset(char step);

/**
 * @brief Coordinates of every residue of a conformation.
 * @param conformation Step string.
 * @return L = conformation.size() + 1 lattice points, starting at the origin.
 * @throws ConformationError on an unknown step or a self-intersection.
 */
[[nodiscard]] std::vector<LatticePoint> lattice_coordinates(const std::string& conformation);

/**
 * @brief Topological contacts of a conformation.
 *
 * Residues i and j form a contact when j > i + 1 and they occupy adjacent
 * lattice sites. Contacts are returned sorted by (i, j).
 *
 * @throws ConformationError on an unknown step or a self-intersection.
 */
[[nodiscard]] std::vector<Contact> conformation_contacts(const std::string& conformation);

/**
 * @brief Energy of a sequence folded into a lattice conformation.
 * @param sequence Residue sequence of length L.
 * @param conformation Step string of length L - 1.
 * @param table Contact energies.
 * @return Sum of table energies over all topological contacts.
 * @throws ConformationError if the conformation does not fit the sequence.
 * @throws std::out_of_range if a contacting pair is missing from the table.
 */
[[nodiscard]] double fold_energy(const std::string& sequence,
                                 const std::string& conformation,
                                 const InteractionTable& table);

/**
 * @brief Render a sequence on its lattice path as ASCII art.
 *
 * Residues are joined by '-' (horizontal bonds) and '|' (vertical bonds);
 * the top row of the drawing is the highest lattice row.
 *
 * @throws ConformationError if the conformation does not fit the sequence.
 */
[[nodiscard]] std::string draw_conformation(const std::string& sequence,
                                            const std::string& conformation);

} // namespace latticegpm

#endif // LATTICEGPM_LATTICE_CONFORMATION_HPP
