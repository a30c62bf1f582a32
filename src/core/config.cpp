#include "latticegpm/core/config.hpp"

#include <stdexcept>
#include <string>

namespace latticegpm {

void MapConfig::validate() const {
    // A saved map needs nothing else
    if (input_map_file.has_value()) {
        return;
    }

    // Endpoints come in pairs
    if (wildtype.has_value() != mutant.has_value()) {
        throw std::invalid_argument(
            "wildtype and mutant must be given together");
    }

    if (!wildtype.has_value()) {
        if (search_length <= 1) {
            throw std::invalid_argument(
                "search_length must be greater than 1 when no endpoints are given, got " +
                std::to_string(search_length));
        }
        if (conformations_file.has_value()) {
            throw std::invalid_argument(
                "a landscape search needs the lattice oracle; "
                "it cannot be combined with a conformations file");
        }
    } else if (wildtype->size() != mutant->size()) {
        throw std::invalid_argument(
            "wildtype and mutant must have the same length (" +
            std::to_string(wildtype->size()) + " vs " +
            std::to_string(mutant->size()) + ")");
    }

    if (max_iterations <= 0) {
        throw std::invalid_argument(
            "max_iterations must be positive, got " + std::to_string(max_iterations));
    }

    if (!(temperature > 0.0)) {
        throw std::invalid_argument(
            "temperature must be positive, got " + std::to_string(temperature));
    }

    if (target_conformation.has_value() && target_conformation->empty()) {
        throw std::invalid_argument("target_conformation must not be empty");
    }
}

} // namespace latticegpm
