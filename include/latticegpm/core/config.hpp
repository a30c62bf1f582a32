#ifndef LATTICEGPM_CORE_CONFIG_HPP
#define LATTICEGPM_CORE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Run configuration for building a lattice genotype-phenotype map.
 *
 * This header defines the MapConfig struct that holds every parameter of a
 * run of the latticegpm tool, filled in by the command-line parser.
 */

#include "latticegpm/core/types.hpp"

#include <optional>
#include <string>

namespace latticegpm {

/**
 * @struct MapConfig
 * @brief Complete configuration for one map-building run.
 *
 * Either both endpoint sequences are given, or a length is given and the
 * endpoints are found with a landscape search; alternatively a saved map is
 * loaded and printed without recomputation.
 */
struct MapConfig {
    //==========================================================================
    // Sequence space
    //==========================================================================

    /** @brief Wildtype endpoint of the sequence space. */
    std::optional<std::string> wildtype;

    /** @brief Mutant endpoint; must differ from the wildtype at every site. */
    std::optional<std::string> mutant;

    /**
     * @brief Sequence length for a landscape search.
     *
     * Only used when no endpoints are given. Default: 0 (no search).
     */
    int search_length = 0;

    //==========================================================================
    // Landscape search
    //==========================================================================

    /**
     * @brief Energy threshold for accepting a searched sequence.
     *
     * A draw is accepted when its native energy is strictly below this value.
     * Default: -1.0.
     */
    double search_threshold = -1.0;

    /** @brief Maximum number of random draws. Default: 1000. */
    int max_iterations = 1000;

    /** @brief Random seed for reproducibility. */
    int seed = 12345;

    //==========================================================================
    // Thermodynamics
    //==========================================================================

    /** @brief Temperature (in units of kT). Default: 1.0. */
    double temperature = 1.0;

    /** @brief Phenotype exposed by the map. Default: stability. */
    PhenotypeType phenotype_type = PhenotypeType::Stability;

    /** @brief Optional target conformation forced as every native state. */
    std::optional<std::string> target_conformation;

    //==========================================================================
    // Input files
    //==========================================================================

    /**
     * @brief File listing conformations for the partition function.
     *
     * One conformation per line. When absent, sequences are folded with the
     * exhaustive lattice oracle.
     */
    std::optional<std::string> conformations_file;

    /** @brief Optional contact-energy table file (default table otherwise). */
    std::optional<std::string> interaction_table_file;

    /** @brief Saved map to load instead of computing one. */
    std::optional<std::string> input_map_file;

    //==========================================================================
    // Output options
    //==========================================================================

    /** @brief Output file for the JSON map. */
    std::optional<std::string> output_map_file;

    /** @brief Draw the native conformation of every folded genotype. */
    bool draw_conformations = false;

    //==========================================================================
    // Validation
    //==========================================================================

    /**
     * @brief Validate configuration parameters.
     * @throws std::invalid_argument if any parameter is invalid.
     */
    void validate() const;
};

} // namespace latticegpm

#endif // LATTICEGPM_CORE_CONFIG_HPP
