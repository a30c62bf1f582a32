#include "latticegpm/map/genotype_phenotype_map.hpp"
#include "latticegpm/sequence/binary_encoder.hpp"
#include "latticegpm/core/errors.hpp"

#include <stdexcept>
#include <utility>

namespace latticegpm {

namespace {

template <typename T>
void check_field_size(const std::vector<T>& values, std::size_t expected, std::string_view field) {
    if (values.size() != expected) {
        throw ValidationError(
            std::string(field) + " has " + std::to_string(values.size()) +
            " entries but the map has " + std::to_string(expected) + " genotypes");
    }
}

} // anonymous namespace

LatticeGenotypePhenotypeMap::LatticeGenotypePhenotypeMap(const std::string& wildtype,
                                                         const std::string& mutant,
                                                         double temperature,
                                                         PhenotypeType phenotype_type,
                                                         InteractionTable table,
                                                         EnergyFunction energy)
    : wildtype_(wildtype)
    , mutant_(mutant)
    , mutations_(binary_mutations_map(wildtype, mutant))
    , genotypes_(enumerate(wildtype, mutant))
    , temperature_(temperature)
    , phenotype_type_(phenotype_type)
    , table_(std::move(table))
    , energy_(std::move(energy)) {
    if (!(temperature_ > 0.0)) {
        throw ValidationError("temperature must be positive, got " + std::to_string(temperature_));
    }
}

LatticeGenotypePhenotypeMap LatticeGenotypePhenotypeMap::from_mutant(
    const std::string& wildtype,
    const std::string& mutant,
    const FoldOracle& oracle,
    double temperature,
    const std::optional<std::string>& target_conformation,
    PhenotypeType phenotype_type) {

    LatticeGenotypePhenotypeMap gpm(wildtype, mutant, temperature, phenotype_type);
    gpm.target_conf_ = target_conformation;
    gpm.fold(oracle);
    return gpm;
}

LatticeGenotypePhenotypeMap LatticeGenotypePhenotypeMap::from_length(
    const FoldOracle& oracle,
    double threshold,
    WichmannHillRNG& rng,
    int max_iterations,
    double temperature,
    PhenotypeType phenotype_type) {

    auto [wildtype, mutant] =
        search_conformation_space(oracle, temperature, threshold, rng, max_iterations);
    return from_mutant(wildtype, mutant, oracle, temperature, std::nullopt, phenotype_type);
}

LatticeGenotypePhenotypeMap LatticeGenotypePhenotypeMap::from_record(
    const MapRecord& record,
    InteractionTable table,
    EnergyFunction energy) {

    std::vector<std::string> expected = mutations_to_genotypes(record.wildtype, record.mutations);
    if (record.genotypes != expected) {
        throw ValidationError("genotypes do not match the enumeration of the mutation map");
    }

    const std::size_t n = expected.size();
    check_field_size(record.native_energies, n, "nativeEs");
    check_field_size(record.partition_sums, n, "partition_sum");
    check_field_size(record.conformations, n, "confs");
    check_field_size(record.folded, n, "folded");

    std::string mutant(record.wildtype.size(), ' ');
    for (const auto& [site, residues] : record.mutations) {
        mutant[site] = residues.second;
    }

    LatticeGenotypePhenotypeMap gpm(record.wildtype,
                                    mutant,
                                    record.temperature,
                                    phenotype_type_from_string(record.phenotype_type),
                                    std::move(table),
                                    std::move(energy));

    gpm.records_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        gpm.records_[i].native_energy = record.native_energies[i];
        gpm.records_[i].partition_sum = record.partition_sums[i];
        gpm.records_[i].native_conformation = record.conformations[i];
        gpm.records_[i].folded = record.folded[i];
    }
    return gpm;
}

MapRecord LatticeGenotypePhenotypeMap::to_record() const {
    require_scored();

    MapRecord record;
    record.wildtype = wildtype_;
    record.genotypes = genotypes_;
    record.native_energies = native_energies();
    record.partition_sums = partition_sums();
    record.conformations = conformations();
    record.folded = folded();
    record.phenotype_type = std::string(to_string(phenotype_type_));
    record.temperature = temperature_;
    record.mutations = mutations_;
    return record;
}

//==============================================================================
// Scoring
//==============================================================================

ScoringSource LatticeGenotypePhenotypeMap::source() const {
    ScoringSource source;
    source.oracle = oracle_;
    source.conformations = partition_confs_;
    return source;
}

ThermodynamicsEngine LatticeGenotypePhenotypeMap::engine() const {
    return ThermodynamicsEngine(temperature_, table_, energy_);
}

void LatticeGenotypePhenotypeMap::score() {
    records_ = engine().score(genotypes_, source(), target_conf_);
}

void LatticeGenotypePhenotypeMap::fold(const FoldOracle& oracle) {
    if (oracle.length() != length()) {
        throw ValidationError(
            "oracle folds sequences of length " + std::to_string(oracle.length()) +
            " but the map has " + std::to_string(length()) + " sites");
    }

    ScoringSource next;
    next.oracle = &oracle;
    auto records = engine().score(genotypes_, next, target_conf_);

    oracle_ = &oracle;
    partition_confs_.reset();
    records_ = std::move(records);
}

void LatticeGenotypePhenotypeMap::set_partition_confs(std::vector<std::string> conformations) {
    ScoringSource next;
    next.conformations = std::move(conformations);
    auto records = engine().score(genotypes_, next, target_conf_);

    oracle_ = nullptr;
    partition_confs_ = std::move(next.conformations);
    records_ = std::move(records);
}

void LatticeGenotypePhenotypeMap::set_target_conf(const std::string& conformation) {
    if (!source().empty()) {
        auto records = engine().score(genotypes_, source(), conformation);
        target_conf_ = conformation;
        records_ = std::move(records);
        return;
    }

    // Restored from a record: only the native states can be recomputed
    std::vector<ThermoRecord> records = records_;
    ThermodynamicsEngine eng = engine();
    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].native_energy = eng.energy(genotypes_[i], conformation);
        records[i].native_conformation = conformation;
    }
    target_conf_ = conformation;
    records_ = std::move(records);
}

void LatticeGenotypePhenotypeMap::clear_target_conf() {
    if (source().empty()) {
        if (is_scored()) {
            throw NoScoringSourceError();
        }
        target_conf_.reset();
        return;
    }

    auto records = engine().score(genotypes_, source(), std::nullopt);
    target_conf_.reset();
    records_ = std::move(records);
}

void LatticeGenotypePhenotypeMap::set_temperature(double temperature) {
    if (!(temperature > 0.0)) {
        throw ValidationError("temperature must be positive, got " + std::to_string(temperature));
    }
    if (source().empty()) {
        if (is_scored()) {
            throw NoScoringSourceError();
        }
        temperature_ = temperature;
        return;
    }

    auto records = ThermodynamicsEngine(temperature, table_, energy_)
                       .score(genotypes_, source(), target_conf_);
    temperature_ = temperature;
    records_ = std::move(records);
}

void LatticeGenotypePhenotypeMap::rescore() {
    score();
}

//==============================================================================
// Phenotypes
//==============================================================================

void LatticeGenotypePhenotypeMap::set_phenotype_type(std::string_view name) {
    phenotype_type_ = phenotype_type_from_string(name);
}

void LatticeGenotypePhenotypeMap::require_scored() const {
    if (!is_scored()) {
        throw std::runtime_error("Map has not been scored: call fold() or set_partition_confs()");
    }
}

std::vector<double> LatticeGenotypePhenotypeMap::phenotypes() const {
    require_scored();
    std::vector<double> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(phenotype_value(record, temperature_, phenotype_type_));
    }
    return values;
}

std::vector<double> LatticeGenotypePhenotypeMap::native_energies() const {
    std::vector<double> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(record.native_energy);
    }
    return values;
}

std::vector<double> LatticeGenotypePhenotypeMap::partition_sums() const {
    std::vector<double> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(record.partition_sum);
    }
    return values;
}

std::vector<double> LatticeGenotypePhenotypeMap::stabilities() const {
    std::vector<double> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(stability(record, temperature_));
    }
    return values;
}

std::vector<double> LatticeGenotypePhenotypeMap::fraction_folded() const {
    std::vector<double> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(latticegpm::fraction_folded(record, temperature_));
    }
    return values;
}

std::vector<std::string> LatticeGenotypePhenotypeMap::conformations() const {
    std::vector<std::string> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(record.native_conformation);
    }
    return values;
}

std::vector<bool> LatticeGenotypePhenotypeMap::folded() const {
    std::vector<bool> values;
    values.reserve(records_.size());
    for (const auto& record : records_) {
        values.push_back(record.folded);
    }
    return values;
}

//==============================================================================
// Sequence space
//==============================================================================

std::vector<std::string> LatticeGenotypePhenotypeMap::binary_genotypes() const {
    return binary_strings(length());
}

std::size_t LatticeGenotypePhenotypeMap::index_of(const std::string& genotype) const {
    std::string binary = genotype_to_binary(genotype, wildtype_, mutant_);
    std::size_t index = 0;
    for (char bit : binary) {
        index = (index << 1) | (bit == '1' ? 1U : 0U);
    }
    return index;
}

void LatticeGenotypePhenotypeMap::print_sequences(std::ostream& os,
                                                  const std::vector<std::string>& sequences) const {
    require_scored();
    for (const auto& sequence : sequences) {
        const ThermoRecord& record = records_[index_of(sequence)];
        os << sequence << '\n';
        if (record.native_conformation.empty()) {
            os << "(no unique native conformation)\n";
        } else {
            os << draw_conformation(sequence, record.native_conformation);
        }
        os << '\n';
    }
}

} // namespace latticegpm
