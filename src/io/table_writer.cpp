#include "latticegpm/io/table_writer.hpp"

#include <fstream>
#include <stdexcept>

namespace latticegpm {

void write_phenotype_table(std::ostream& os, const LatticeGenotypePhenotypeMap& gpm) {
    if (!gpm.is_scored()) {
        throw std::runtime_error("Cannot write an unscored map");
    }

    const auto binaries = gpm.binary_genotypes();
    const auto stabilities = gpm.stabilities();
    const auto fractions = gpm.fraction_folded();
    const auto& records = gpm.records();

    os << "binary\tgenotype\tnativeE\tconf\tfolded\tstability\tfracfolded\n";
    for (std::size_t i = 0; i < gpm.n(); ++i) {
        const ThermoRecord& record = records[i];
        os << binaries[i] << '\t'
           << gpm.genotypes()[i] << '\t'
           << record.native_energy << '\t'
           << (record.native_conformation.empty() ? "-" : record.native_conformation) << '\t'
           << (record.folded ? "true" : "false") << '\t'
           << stabilities[i] << '\t'
           << fractions[i] << '\n';
    }
}

void write_phenotype_table(const std::string& filename, const LatticeGenotypePhenotypeMap& gpm) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    write_phenotype_table(file, gpm);
}

} // namespace latticegpm
