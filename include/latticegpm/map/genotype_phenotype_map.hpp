#ifndef LATTICEGPM_MAP_GENOTYPE_PHENOTYPE_MAP_HPP
#define LATTICEGPM_MAP_GENOTYPE_PHENOTYPE_MAP_HPP

/**
 * @file genotype_phenotype_map.hpp
 * @brief Genotype-phenotype map of a binary lattice-protein sequence space.
 *
 * This header defines LatticeGenotypePhenotypeMap, which owns the genotypes
 * between a wildtype and a fully divergent mutant together with their
 * folding thermodynamics, and MapRecord, the field set a map is saved as.
 */

#include "latticegpm/core/random.hpp"
#include "latticegpm/core/types.hpp"
#include "latticegpm/lattice/conformation.hpp"
#include "latticegpm/lattice/fold_oracle.hpp"
#include "latticegpm/lattice/interaction_table.hpp"
#include "latticegpm/search/landscape_search.hpp"
#include "latticegpm/thermo/thermodynamics.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace latticegpm {

/**
 * @brief Names of the persisted fields, in the order they are checked.
 */
inline constexpr std::array<std::string_view, 9> kMapFields = {
    "wildtype", "genotypes", "nativeEs", "partition_sum", "confs",
    "folded", "phenotype_type", "temperature", "mutations"
};

/**
 * @struct MapRecord
 * @brief Everything needed to rebuild a scored map.
 *
 * List-valued fields are in genotype order.
 */
struct MapRecord {
    std::string wildtype;
    std::vector<std::string> genotypes;
    std::vector<double> native_energies;
    std::vector<double> partition_sums;
    std::vector<std::string> conformations;
    std::vector<bool> folded;
    std::string phenotype_type;
    double temperature = 1.0;
    MutationMap mutations;
};

/**
 * @class LatticeGenotypePhenotypeMap
 * @brief Binary genotype-phenotype map scored by folding thermodynamics.
 *
 * The genotype set is fixed at construction. Thermodynamic records start
 * empty and are filled by an explicit scoring operation (fold(),
 * set_partition_confs() or rescore()); every pass replaces all records at
 * once. The map remembers its last scoring source so that changing the
 * temperature or the target conformation rescores it.
 *
 * Usage:
 * @code
 * LatticeConformations conformations(4);
 * LatticeGenotypePhenotypeMap gpm("PWKR", "ACDE", 1.0);
 * gpm.fold(conformations);
 * auto stabilities = gpm.phenotypes();
 * @endcode
 */
class LatticeGenotypePhenotypeMap {
public:
    /**
     * @brief Build the (unscored) map between two sequences.
     * @param wildtype Wildtype sequence.
     * @param mutant Mutant sequence differing at every site.
     * @param temperature Temperature in units of kT.
     * @param phenotype_type Phenotype exposed by phenotypes().
     * @param table Contact energies.
     * @param energy Energy-scoring function for explicit conformations.
     * @throws ValidationError on a length mismatch or temperature <= 0.
     * @throws DivergenceError if the sequences are not fully divergent.
     */
    LatticeGenotypePhenotypeMap(const std::string& wildtype,
                                const std::string& mutant,
                                double temperature = 1.0,
                                PhenotypeType phenotype_type = PhenotypeType::Stability,
                                InteractionTable table = default_interaction_table(),
                                EnergyFunction energy = fold_energy);

    /**
     * @brief Build a map between two sequences and fold it with an oracle.
     */
    [[nodiscard]] static LatticeGenotypePhenotypeMap from_mutant(
        const std::string& wildtype,
        const std::string& mutant,
        const FoldOracle& oracle,
        double temperature = 1.0,
        const std::optional<std::string>& target_conformation = std::nullopt,
        PhenotypeType phenotype_type = PhenotypeType::Stability);

    /** @brief The map keeps the oracle for rescoring; a temporary would dangle. */
    static LatticeGenotypePhenotypeMap from_mutant(
        const std::string& wildtype,
        const std::string& mutant,
        const FoldOracle&& oracle,
        double temperature = 1.0,
        const std::optional<std::string>& target_conformation = std::nullopt,
        PhenotypeType phenotype_type = PhenotypeType::Stability) = delete;

    /**
     * @brief Search endpoints with the oracle, then build and fold the map.
     * @param oracle Folding engine; fixes the sequence length.
     * @param threshold Energy below which a searched sequence qualifies.
     * @param rng Random source for the search.
     * @param max_iterations Search budget.
     * @param temperature Temperature in units of kT.
     * @throws SearchExhaustedError if no endpoints are found.
     */
    [[nodiscard]] static LatticeGenotypePhenotypeMap from_length(
        const FoldOracle& oracle,
        double threshold,
        WichmannHillRNG& rng,
        int max_iterations = kDefaultSearchIterations,
        double temperature = 1.0,
        PhenotypeType phenotype_type = PhenotypeType::Stability);

    static LatticeGenotypePhenotypeMap from_length(
        const FoldOracle&& oracle,
        double threshold,
        WichmannHillRNG& rng,
        int max_iterations = kDefaultSearchIterations,
        double temperature = 1.0,
        PhenotypeType phenotype_type = PhenotypeType::Stability) = delete;

    /**
     * @brief Rebuild a scored map from its persisted fields.
     * @throws ValidationError if a list has the wrong length, the genotypes
     *         do not match the mutation map, or the temperature is invalid.
     * @throws InvalidPhenotypeTypeError if the phenotype type is unknown.
     */
    [[nodiscard]] static LatticeGenotypePhenotypeMap from_record(
        const MapRecord& record,
        InteractionTable table = default_interaction_table(),
        EnergyFunction energy = fold_energy);

    /**
     * @brief Export the persisted fields.
     * @throws std::runtime_error if the map has not been scored.
     */
    [[nodiscard]] MapRecord to_record() const;

    //==========================================================================
    // Scoring
    //==========================================================================

    /**
     * @brief Score every genotype with a fold oracle.
     * @param oracle Folding engine (not owned; kept for rescoring, so it must
     *        outlive the map or the next fold()).
     */
    void fold(const FoldOracle& oracle);
    void fold(const FoldOracle&& oracle) = delete;

    /**
     * @brief Score every genotype against an explicit conformation list.
     * @throws NoScoringSourceError if the list is empty.
     */
    void set_partition_confs(std::vector<std::string> conformations);

    /**
     * @brief Force every native state to a conformation.
     *
     * Rescores when a source is known; a map restored from a record has its
     * native energies recomputed directly against the target.
     */
    void set_target_conf(const std::string& conformation);

    /**
     * @brief Go back to native states found by minimisation.
     * @throws NoScoringSourceError if the map is scored but has no source.
     */
    void clear_target_conf();

    /**
     * @brief Change the temperature, rescoring a scored map.
     * @throws ValidationError if temperature <= 0.
     * @throws NoScoringSourceError if the map is scored but has no source.
     */
    void set_temperature(double temperature);

    /**
     * @brief Repeat the last scoring pass.
     * @throws NoScoringSourceError if no source is known.
     */
    void rescore();

    //==========================================================================
    // Phenotypes
    //==========================================================================

    void set_phenotype_type(PhenotypeType type) { phenotype_type_ = type; }

    /**
     * @brief Select the phenotype by its persisted name.
     * @throws InvalidPhenotypeTypeError if the name is unknown.
     */
    void set_phenotype_type(std::string_view name);

    [[nodiscard]] PhenotypeType phenotype_type() const { return phenotype_type_; }

    /**
     * @brief The selected phenotype of every genotype.
     * @throws std::runtime_error if the map has not been scored.
     */
    [[nodiscard]] std::vector<double> phenotypes() const;

    [[nodiscard]] std::vector<double> native_energies() const;
    [[nodiscard]] std::vector<double> partition_sums() const;
    [[nodiscard]] std::vector<double> stabilities() const;
    [[nodiscard]] std::vector<double> fraction_folded() const;
    [[nodiscard]] std::vector<std::string> conformations() const;
    [[nodiscard]] std::vector<bool> folded() const;

    /**
     * @brief Thermodynamic records in genotype order (empty until scored).
     */
    [[nodiscard]] const std::vector<ThermoRecord>& records() const { return records_; }

    [[nodiscard]] bool is_scored() const { return !records_.empty(); }

    //==========================================================================
    // Sequence space
    //==========================================================================

    [[nodiscard]] const std::string& wildtype() const { return wildtype_; }
    [[nodiscard]] const std::string& mutant() const { return mutant_; }
    [[nodiscard]] const MutationMap& mutations() const { return mutations_; }
    [[nodiscard]] const std::vector<std::string>& genotypes() const { return genotypes_; }

    /**
     * @brief Binary representation of every genotype.
     */
    [[nodiscard]] std::vector<std::string> binary_genotypes() const;

    /**
     * @brief Index of a genotype in the map.
     * @throws ValidationError if the sequence is not in the space.
     */
    [[nodiscard]] std::size_t index_of(const std::string& genotype) const;

    /** @brief Number of sites. */
    [[nodiscard]] std::size_t length() const { return wildtype_.size(); }

    /** @brief Number of genotypes (2^length). */
    [[nodiscard]] std::size_t n() const { return genotypes_.size(); }

    [[nodiscard]] double temperature() const { return temperature_; }
    [[nodiscard]] const std::optional<std::string>& target_conf() const { return target_conf_; }
    [[nodiscard]] const InteractionTable& interaction_table() const { return table_; }

    /**
     * @brief Draw the native conformation of each listed genotype.
     * @throws ValidationError if a sequence is not in the map.
     * @throws std::runtime_error if the map has not been scored.
     */
    void print_sequences(std::ostream& os, const std::vector<std::string>& sequences) const;

private:
    [[nodiscard]] ScoringSource source() const;
    [[nodiscard]] ThermodynamicsEngine engine() const;
    void score();
    void require_scored() const;

    std::string wildtype_;
    std::string mutant_;
    MutationMap mutations_;
    std::vector<std::string> genotypes_;

    double temperature_;
    PhenotypeType phenotype_type_;
    InteractionTable table_;
    EnergyFunction energy_;

    std::optional<std::string> target_conf_;
    const FoldOracle* oracle_ = nullptr;
    std::optional<std::vector<std::string>> partition_confs_;

    std::vector<ThermoRecord> records_;
};

} // namespace latticegpm

#endif // LATTICEGPM_MAP_GENOTYPE_PHENOTYPE_MAP_HPP
