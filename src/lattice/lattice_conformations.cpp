#include "latticegpm/lattice/lattice_conformations.hpp"
#include "latticegpm/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <utility>

namespace latticegpm {

LatticeConformations::LatticeConformations(std::size_t length, InteractionTable table)
    : length_(length)
    , table_(std::move(table)) {
    if (length_ < kMinLatticeLength || length_ > kMaxLatticeLength) {
        throw ValidationError(
            "lattice chain length must be in [" + std::to_string(kMinLatticeLength) + ", " +
            std::to_string(kMaxLatticeLength) + "], got " + std::to_string(length_));
    }
    enumerate_walks();
}

void LatticeConformations::enumerate_walks() {
    std::map<std::vector<Contact>, std::size_t> set_index;
    std::map<LatticePoint, std::size_t> occupied;
    std::vector<Contact> contacts;
    std::string walk;

    occupied.emplace(LatticePoint{0, 0}, 0);

    // Depth-first growth of the chain one residue at a time
    std::function<void(LatticePoint, bool)> extend = [&](LatticePoint tip, bool turned) {
        if (walk.size() + 1 == length_) {
            std::vector<Contact> key = contacts;
            std::sort(key.begin(), key.end());
            auto [it, inserted] = set_index.emplace(key, contact_sets_.size());
            if (inserted) {
                contact_sets_.push_back(ContactSet{std::move(key), walk, 0});
            }
            ++contact_sets_[it->second].degeneracy;
            ++num_conformations_;
            return;
        }

        for (char step : kLatticeSteps) {
            // Fix the orientation: first step up, first turn right
            if (walk.empty() && step != 'U') continue;
            if (!turned && step != 'U' && step != 'R') continue;

            LatticePoint offset = step_offset(step);
            LatticePoint next = {tip[0] + offset[0], tip[1] + offset[1]};
            const std::size_t residue = walk.size() + 1;
            if (!occupied.emplace(next, residue).second) continue;

            std::size_t added = 0;
            for (char around : kLatticeSteps) {
                LatticePoint d = step_offset(around);
                auto it = occupied.find({next[0] + d[0], next[1] + d[1]});
                if (it != occupied.end() && it->second + 1 < residue) {
                    contacts.emplace_back(it->second, residue);
                    ++added;
                }
            }

            walk.push_back(step);
            extend(next, turned || step == 'R');
            walk.pop_back();

            contacts.resize(contacts.size() - added);
            occupied.erase(next);
        }
    };

    extend(LatticePoint{0, 0}, false);
}

double LatticeConformations::contact_energy(const std::string& sequence,
                                            const ContactSet& set) const {
    double energy = 0.0;
    for (const auto& [i, j] : set.contacts) {
        energy += table_.energy(sequence[i], sequence[j]);
    }
    return energy;
}

FoldResult LatticeConformations::fold(const std::string& sequence, double temperature) const {
    if (sequence.size() != length_) {
        throw ValidationError(
            "sequence " + sequence + " has length " + std::to_string(sequence.size()) +
            " but the conformations are for length " + std::to_string(length_));
    }
    if (!(temperature > 0.0)) {
        throw ValidationError("temperature must be positive, got " + std::to_string(temperature));
    }

    double partition_sum = 0.0;
    double min_energy = 0.0;
    std::size_t min_index = 0;
    bool unique = true;

    for (std::size_t k = 0; k < contact_sets_.size(); ++k) {
        const ContactSet& set = contact_sets_[k];
        double energy = contact_energy(sequence, set);
        partition_sum += static_cast<double>(set.degeneracy) * std::exp(-energy / temperature);

        if (k == 0 || energy < min_energy) {
            min_energy = energy;
            min_index = k;
            unique = true;
        } else if (energy == min_energy) {
            unique = false;
        }
    }

    FoldResult result;
    result.native_energy = min_energy;
    result.partition_sum = partition_sum;
    result.folded = unique && contact_sets_[min_index].degeneracy == 1;
    if (result.folded) {
        result.native_conformation = contact_sets_[min_index].conformation;
    }
    return result;
}

} // namespace latticegpm
