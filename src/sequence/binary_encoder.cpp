#include "latticegpm/sequence/binary_encoder.hpp"
#include "latticegpm/core/errors.hpp"

namespace latticegpm {

namespace {

void check_enumerable(std::size_t length) {
    if (length > kMaxBinarySites) {
        throw ValidationError(
            "cannot enumerate " + std::to_string(length) +
            " sites (at most " + std::to_string(kMaxBinarySites) + ")");
    }
}

// Genotype for binary index `index`; site 0 is the most significant bit.
std::string build_genotype(std::size_t index,
                           const std::string& wildtype,
                           const std::string& mutant) {
    const std::size_t length = wildtype.size();
    std::string genotype(length, ' ');
    for (std::size_t site = 0; site < length; ++site) {
        bool mutated = ((index >> (length - 1 - site)) & 1U) != 0;
        genotype[site] = mutated ? mutant[site] : wildtype[site];
    }
    return genotype;
}

} // anonymous namespace

std::size_t hamming_distance(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        throw ValidationError(
            "sequences must be the same length (" + std::to_string(a.size()) +
            " vs " + std::to_string(b.size()) + ")");
    }
    std::size_t distance = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) {
            ++distance;
        }
    }
    return distance;
}

MutationMap binary_mutations_map(const std::string& wildtype, const std::string& mutant) {
    if (wildtype.size() != mutant.size()) {
        throw ValidationError(
            "wildtype and mutant must be the same length (" +
            std::to_string(wildtype.size()) + " vs " + std::to_string(mutant.size()) + ")");
    }
    check_enumerable(wildtype.size());

    std::size_t distance = hamming_distance(wildtype, mutant);
    if (distance != wildtype.size()) {
        throw DivergenceError(
            "wildtype and mutant must differ at all sites (" + wildtype + " vs " + mutant +
            " differ at " + std::to_string(distance) + " of " +
            std::to_string(wildtype.size()) + ")");
    }

    MutationMap mutations;
    for (std::size_t site = 0; site < wildtype.size(); ++site) {
        mutations.emplace(site, std::make_pair(wildtype[site], mutant[site]));
    }
    return mutations;
}

std::vector<std::string> enumerate(const std::string& wildtype, const std::string& mutant) {
    // Validates lengths and divergence
    (void)binary_mutations_map(wildtype, mutant);

    const std::size_t count = std::size_t{1} << wildtype.size();
    std::vector<std::string> genotypes;
    genotypes.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        genotypes.push_back(build_genotype(index, wildtype, mutant));
    }
    return genotypes;
}

std::vector<std::string> mutations_to_genotypes(const std::string& wildtype,
                                                const MutationMap& mutations) {
    if (mutations.size() != wildtype.size()) {
        throw ValidationError(
            "mutation map has " + std::to_string(mutations.size()) +
            " sites but the wildtype has " + std::to_string(wildtype.size()));
    }

    std::string mutant(wildtype.size(), ' ');
    for (std::size_t site = 0; site < wildtype.size(); ++site) {
        auto it = mutations.find(site);
        if (it == mutations.end()) {
            throw ValidationError("mutation map has no entry for site " + std::to_string(site));
        }
        if (it->second.first != wildtype[site]) {
            throw ValidationError(
                "mutation map disagrees with the wildtype at site " + std::to_string(site));
        }
        mutant[site] = it->second.second;
    }
    return enumerate(wildtype, mutant);
}

std::vector<std::string> binary_strings(std::size_t length) {
    check_enumerable(length);
    return enumerate(std::string(length, '0'), std::string(length, '1'));
}

std::string genotype_to_binary(const std::string& genotype,
                               const std::string& wildtype,
                               const std::string& mutant) {
    if (genotype.size() != wildtype.size() || mutant.size() != wildtype.size()) {
        throw ValidationError("genotype, wildtype and mutant must be the same length");
    }
    std::string binary(genotype.size(), '0');
    for (std::size_t site = 0; site < genotype.size(); ++site) {
        if (genotype[site] == mutant[site]) {
            binary[site] = '1';
        } else if (genotype[site] != wildtype[site]) {
            throw ValidationError(
                "genotype " + genotype + " is outside the space at site " +
                std::to_string(site));
        }
    }
    return binary;
}

} // namespace latticegpm
