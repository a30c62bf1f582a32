#include "latticegpm/search/landscape_search.hpp"
#include "latticegpm/sequence/binary_encoder.hpp"
#include "latticegpm/core/errors.hpp"

#include <optional>

namespace latticegpm {

SequencePair search_landscape(
    std::size_t length,
    const std::function<bool(const std::string&)>& accept,
    WichmannHillRNG& rng,
    int max_iterations) {

    if (max_iterations <= 0) {
        throw ValidationError(
            "max_iterations must be positive, got " + std::to_string(max_iterations));
    }

    std::optional<std::string> first;
    for (int iteration = 0; iteration < max_iterations; ++iteration) {
        std::string candidate = rng.random_protein(length);
        if (!accept(candidate)) {
            continue;
        }

        if (!first) {
            first = std::move(candidate);
        } else if (hamming_distance(*first, candidate) == length) {
            return {std::move(*first), std::move(candidate)};
        }
    }

    throw SearchExhaustedError(max_iterations);
}

SequencePair search_conformation_space(
    const FoldOracle& oracle,
    double temperature,
    double threshold,
    WichmannHillRNG& rng,
    int max_iterations) {

    return search_landscape(
        oracle.length(),
        [&](const std::string& sequence) {
            return oracle.fold(sequence, temperature).native_energy < threshold;
        },
        rng,
        max_iterations);
}

SequencePair search_fitness_landscape(
    const FitnessOracle& oracle,
    double threshold,
    WichmannHillRNG& rng,
    int max_iterations) {

    return search_landscape(
        oracle.length(),
        [&](const std::string& sequence) {
            return oracle.fitness(sequence) > threshold;
        },
        rng,
        max_iterations);
}

} // namespace latticegpm
