#include "latticegpm/lattice/conformation.hpp"
#include "latticegpm/core/errors.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace latticegpm {

namespace {

void check_fits(const std::string& sequence, const std::string& conformation) {
    if (sequence.empty() || conformation.size() + 1 != sequence.size()) {
        throw ConformationError(
            "conformation '" + conformation + "' has " +
            std::to_string(conformation.size()) + " steps but the sequence has " +
            std::to_string(sequence.size()) + " residues");
    }
}

} // anonymous namespace

LatticePoint step_offset(char step) {
    switch (step) {
        case 'U': return {0, 1};
        case 'D': return {0, -1};
        case 'L': return {-1, 0};
        case 'R': return {1, 0};
        default: break;
    }
    throw ConformationError(std::string("unknown lattice step '") + step + "'");
}

std::vector<LatticePoint> lattice_coordinates(const std::string& conformation) {
    std::vector<LatticePoint> coords;
    coords.reserve(conformation.size() + 1);
    coords.push_back({0, 0});

    std::map<LatticePoint, std::size_t> occupied;
    occupied.emplace(coords.back(), 0);

    for (char step : conformation) {
        LatticePoint offset = step_offset(step);
        LatticePoint next = {coords.back()[0] + offset[0], coords.back()[1] + offset[1]};
        if (!occupied.emplace(next, coords.size()).second) {
            throw ConformationError(
                "conformation '" + conformation + "' intersects itself at residue " +
                std::to_string(coords.size()));
        }
        coords.push_back(next);
    }
    return coords;
}

std::vector<Contact> conformation_contacts(const std::string& conformation) {
    std::vector<LatticePoint> coords = lattice_coordinates(conformation);

    std::map<LatticePoint, std::size_t> index_at;
    for (std::size_t i = 0; i < coords.size(); ++i) {
        index_at.emplace(coords[i], i);
    }

    std::vector<Contact> contacts;
    for (std::size_t i = 0; i < coords.size(); ++i) {
        for (char step : kLatticeSteps) {
            LatticePoint offset = step_offset(step);
            auto it = index_at.find({coords[i][0] + offset[0], coords[i][1] + offset[1]});
            if (it != index_at.end() && it->second > i + 1) {
                contacts.emplace_back(i, it->second);
            }
        }
    }
    std::sort(contacts.begin(), contacts.end());
    return contacts;
}

double fold_energy(const std::string& sequence,
                   const std::string& conformation,
                   const InteractionTable& table) {
    check_fits(sequence, conformation);

    double energy = 0.0;
    for (const auto& [i, j] : conformation_contacts(conformation)) {
        energy += table.energy(sequence[i], sequence[j]);
    }
    return energy;
}

std::string draw_conformation(const std::string& sequence, const std::string& conformation) {
    check_fits(sequence, conformation);
    std::vector<LatticePoint> coords = lattice_coordinates(conformation);

    int min_x = 0, max_x = 0, min_y = 0, max_y = 0;
    for (const auto& p : coords) {
        min_x = std::min(min_x, p[0]);
        max_x = std::max(max_x, p[0]);
        min_y = std::min(min_y, p[1]);
        max_y = std::max(max_y, p[1]);
    }

    // Every lattice point takes a character cell with a bond cell between neighbours
    auto width = static_cast<std::size_t>(2 * (max_x - min_x) + 1);
    auto height = static_cast<std::size_t>(2 * (max_y - min_y) + 1);
    std::vector<std::string> grid(height, std::string(width, ' '));

    auto column = [&](int x) { return static_cast<std::size_t>(2 * (x - min_x)); };
    auto row = [&](int y) { return static_cast<std::size_t>(2 * (max_y - y)); };

    for (std::size_t i = 0; i < coords.size(); ++i) {
        grid[row(coords[i][1])][column(coords[i][0])] = sequence[i];
        if (i + 1 < coords.size()) {
            const auto& a = coords[i];
            const auto& b = coords[i + 1];
            std::size_t bond_row = (row(a[1]) + row(b[1])) / 2;
            std::size_t bond_col = (column(a[0]) + column(b[0])) / 2;
            grid[bond_row][bond_col] = (a[1] == b[1]) ? '-' : '|';
        }
    }

    std::ostringstream out;
    for (auto& line : grid) {
        line.erase(line.find_last_not_of(' ') + 1);
        out << line << '\n';
    }
    return out.str();
}

} // namespace latticegpm
