#ifndef LATTICEGPM_IO_TABLE_WRITER_HPP
#define LATTICEGPM_IO_TABLE_WRITER_HPP

/**
 * @file table_writer.hpp
 * @brief Tab-separated output of a scored map.
 */

#include "latticegpm/map/genotype_phenotype_map.hpp"

#include <ostream>
#include <string>

namespace latticegpm {

/**
 * @brief Write one row per genotype.
 *
 * Columns: binary, genotype, nativeE, conf, folded, stability, fracfolded,
 * preceded by a header line. An empty conformation is written as '-'.
 *
 * @throws std::runtime_error if the map has not been scored.
 */
void write_phenotype_table(std::ostream& os, const LatticeGenotypePhenotypeMap& gpm);

/**
 * @brief Write the phenotype table to a file.
 * @throws std::runtime_error if the file cannot be opened.
 */
void write_phenotype_table(const std::string& filename, const LatticeGenotypePhenotypeMap& gpm);

} // namespace latticegpm

#endif // LATTICEGPM_IO_TABLE_WRITER_HPP
