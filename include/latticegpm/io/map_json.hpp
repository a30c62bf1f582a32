#ifndef LATTICEGPM_IO_MAP_JSON_HPP
#define LATTICEGPM_IO_MAP_JSON_HPP

/**
 * @file map_json.hpp
 * @brief JSON persistence of lattice genotype-phenotype maps.
 *
 * A saved map is a JSON object with exactly the keys listed in kMapFields:
 *
 * @code
 * {
 *   "wildtype": "PW", "genotypes": ["PW", "PA", "CW", "CA"],
 *   "nativeEs": [...], "partition_sum": [...], "confs": [...],
 *   "folded": [...], "phenotype_type": "stabilities", "temperature": 1.0,
 *   "mutations": {"0": ["P", "C"], "1": ["W", "A"]}
 * }
 * @endcode
 *
 * Loading is strict: keys are checked in kMapFields order and the first
 * absent one raises MissingFieldError; a wrongly typed value or an unknown
 * key raises ValidationError naming the field.
 */

#include "latticegpm/map/genotype_phenotype_map.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace latticegpm {

/**
 * @brief Convert a persisted record to JSON.
 * @throws ValidationError if an energy, partition sum or the temperature is
 *         not finite.
 */
[[nodiscard]] nlohmann::json record_to_json(const MapRecord& record);

/**
 * @brief Parse and validate a persisted record.
 * @throws MissingFieldError if a required key is absent.
 * @throws ValidationError on a wrongly typed value or an unknown key.
 */
[[nodiscard]] MapRecord record_from_json(const nlohmann::json& data);

/**
 * @brief Serialize a scored map.
 * @throws std::runtime_error if the map has not been scored.
 * @throws ValidationError if a value is not finite.
 */
[[nodiscard]] nlohmann::json map_to_json(const LatticeGenotypePhenotypeMap& gpm);

/**
 * @brief Rebuild a map from JSON.
 * @throws MissingFieldError, ValidationError, InvalidPhenotypeTypeError.
 */
[[nodiscard]] LatticeGenotypePhenotypeMap map_from_json(const nlohmann::json& data);

/**
 * @brief Write a scored map to a JSON file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws ValidationError if a value is not finite; nothing is written.
 */
void write_map_json(const std::string& filename, const LatticeGenotypePhenotypeMap& gpm);

/**
 * @brief Read a map from a JSON file.
 * @throws std::runtime_error if the file cannot be read or is not JSON.
 * @throws MissingFieldError, ValidationError, InvalidPhenotypeTypeError.
 */
[[nodiscard]] LatticeGenotypePhenotypeMap read_map_json(const std::string& filename);

} // namespace latticegpm

#endif // LATTICEGPM_IO_MAP_JSON_HPP
