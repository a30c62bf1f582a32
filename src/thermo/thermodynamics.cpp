#include "latticegpm/thermo/thermodynamics.hpp"
#include "latticegpm/core/errors.hpp"

#include <cmath>
#include <utility>

namespace latticegpm {

double stability(const ThermoRecord& record, double temperature) {
    double native_weight = std::exp(-record.native_energy / temperature);
    return record.native_energy +
           temperature * std::log(record.partition_sum - native_weight);
}

double fraction_folded_from_stability(double stability, double temperature) {
    return 1.0 / (1.0 + std::exp(stability / temperature));
}

double fraction_folded(const ThermoRecord& record, double temperature) {
    return fraction_folded_from_stability(stability(record, temperature), temperature);
}

double phenotype_value(const ThermoRecord& record, double temperature, PhenotypeType type) {
    switch (type) {
        case PhenotypeType::NativeEnergy: return record.native_energy;
        case PhenotypeType::Stability: return stability(record, temperature);
        case PhenotypeType::FractionFolded: return fraction_folded(record, temperature);
    }
    throw InvalidPhenotypeTypeError(std::to_string(static_cast<int>(type)));
}

ThermodynamicsEngine::ThermodynamicsEngine(double temperature,
                                           InteractionTable table,
                                           EnergyFunction energy)
    : temperature_(temperature)
    , table_(std::move(table))
    , energy_(std::move(energy)) {
    if (!(temperature_ > 0.0)) {
        throw ValidationError("temperature must be positive, got " + std::to_string(temperature_));
    }
    if (!energy_) {
        throw ValidationError("an energy function is required");
    }
}

ThermoRecord ThermodynamicsEngine::score_conformations(
    const std::string& genotype,
    const std::vector<std::string>& conformations) const {

    if (conformations.empty()) {
        throw NoScoringSourceError();
    }

    ThermoRecord record;
    bool unique = true;

    for (std::size_t k = 0; k < conformations.size(); ++k) {
        double e = energy(genotype, conformations[k]);
        record.partition_sum += std::exp(-e / temperature_);

        // The minimum search starts from the first conformation, not from zero
        if (k == 0 || e < record.native_energy) {
            record.native_energy = e;
            record.native_conformation = conformations[k];
            unique = true;
        } else if (e == record.native_energy) {
            unique = false;
        }
    }

    record.folded = unique;
    return record;
}

std::vector<ThermoRecord> ThermodynamicsEngine::score(
    const std::vector<std::string>& genotypes,
    const ScoringSource& source,
    const std::optional<std::string>& target_conformation) const {

    if (source.empty()) {
        throw NoScoringSourceError();
    }
    const bool explicit_mode = source.conformations && !source.conformations->empty();

    // Built locally and returned whole: no partially scored array escapes
    std::vector<ThermoRecord> records(genotypes.size());
    for (std::size_t i = 0; i < genotypes.size(); ++i) {
        if (explicit_mode) {
            records[i] = score_conformations(genotypes[i], *source.conformations);
        } else {
            records[i] = source.oracle->fold(genotypes[i], temperature_);
        }

        if (target_conformation) {
            records[i].native_energy = energy(genotypes[i], *target_conformation);
            records[i].native_conformation = *target_conformation;
        }
    }
    return records;
}

} // namespace latticegpm
