/**
 * latticegpm - Lattice protein genotype-phenotype maps
 *
 * Enumerates the binary sequence space between a wildtype and a mutant that
 * differs at every site, folds every genotype on a 2D lattice (or against a
 * given list of conformations) and reports native energies, folding
 * stabilities and fractions folded.
 */

#include "latticegpm/core/types.hpp"
#include "latticegpm/core/config.hpp"
#include "latticegpm/core/random.hpp"
#include "latticegpm/lattice/interaction_table.hpp"
#include "latticegpm/lattice/lattice_conformations.hpp"
#include "latticegpm/map/genotype_phenotype_map.hpp"
#include "latticegpm/search/landscape_search.hpp"
#include "latticegpm/io/map_json.hpp"
#include "latticegpm/io/table_writer.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <cstdlib>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "latticegpm - Lattice protein genotype-phenotype maps\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Sequence space (give -w and -m, or -L):\n";
    std::cerr << "  -w <seq>     Wildtype sequence\n";
    std::cerr << "  -m <seq>     Mutant sequence (must differ at every site)\n";
    std::cerr << "  -L <int>     Search for endpoints of this length\n\n";
    std::cerr << "Search options:\n";
    std::cerr << "  -e <float>   Native energy threshold (default: -1.0)\n";
    std::cerr << "  -n <int>     Maximum number of random draws (default: 1000)\n";
    std::cerr << "  -S <int>     Random seed (default: 12345)\n\n";
    std::cerr << "Thermodynamics:\n";
    std::cerr << "  -T <float>   Temperature (default: 1.0)\n";
    std::cerr << "  -c <file>    Conformations for the partition function, one per line\n";
    std::cerr << "               (default: every lattice conformation)\n";
    std::cerr << "  -t <conf>    Target conformation for every genotype\n";
    std::cerr << "  -p <type>    Phenotype: nativeEs, stabilities, fracfolded\n";
    std::cerr << "               (default: stabilities)\n";
    std::cerr << "  -I <file>    Contact energy table (<res> <res> <energy> per line)\n\n";
    std::cerr << "Input/output:\n";
    std::cerr << "  -i <file>    Load a saved map instead of computing one\n";
    std::cerr << "  -o <file>    Save the map as JSON\n";
    std::cerr << "  -d           Draw the native conformation of every folded genotype\n";
    std::cerr << "  -h           Show this help message\n";
}

void print_version() {
    std::cout << "latticegpm 1.0.0\n";
    std::cout << "Genotype-phenotype maps of 2D lattice proteins\n";
}

std::vector<std::string> read_conformations(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open conformations file: " + filename);
    }
    std::vector<std::string> conformations;
    std::string line;
    while (std::getline(file, line)) {
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty() || line[0] == '#') continue;
        conformations.push_back(line);
    }
    return conformations;
}

void draw_folded(std::ostream& os, const latticegpm::LatticeGenotypePhenotypeMap& gpm) {
    std::vector<std::string> folded_genotypes;
    const auto& records = gpm.records();
    for (std::size_t i = 0; i < gpm.n(); ++i) {
        if (records[i].folded && !records[i].native_conformation.empty()) {
            folded_genotypes.push_back(gpm.genotypes()[i]);
        }
    }
    gpm.print_sequences(os, folded_genotypes);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    latticegpm::MapConfig config;

    // Parse command-line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            print_version();
            return 0;
        }
        if (arg == "-d") {
            config.draw_conformations = true;
            continue;
        }

        // Options that take a value
        if (i + 1 >= argc && arg[0] == '-' && arg.length() == 2) {
            std::cerr << "Error: Option " << arg << " requires an argument\n";
            return 1;
        }

        if (arg == "-w") {
            config.wildtype = argv[++i];
        } else if (arg == "-m") {
            config.mutant = argv[++i];
        } else if (arg == "-L") {
            config.search_length = std::atoi(argv[++i]);
        } else if (arg == "-e") {
            config.search_threshold = std::atof(argv[++i]);
        } else if (arg == "-n") {
            config.max_iterations = std::atoi(argv[++i]);
        } else if (arg == "-S") {
            config.seed = std::atoi(argv[++i]);
        } else if (arg == "-T") {
            config.temperature = std::atof(argv[++i]);
        } else if (arg == "-c") {
            config.conformations_file = argv[++i];
        } else if (arg == "-t") {
            config.target_conformation = argv[++i];
        } else if (arg == "-p") {
            try {
                config.phenotype_type = latticegpm::phenotype_type_from_string(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        } else if (arg == "-I") {
            config.interaction_table_file = argv[++i];
        } else if (arg == "-i") {
            config.input_map_file = argv[++i];
        } else if (arg == "-o") {
            config.output_map_file = argv[++i];
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Validate configuration
    try {
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // A saved map is printed as is
    if (config.input_map_file) {
        try {
            auto gpm = latticegpm::read_map_json(*config.input_map_file);
            std::cerr << "Loaded map with " << gpm.n() << " genotypes from "
                      << *config.input_map_file << "\n";
            latticegpm::write_phenotype_table(std::cout, gpm);
            if (config.draw_conformations) {
                draw_folded(std::cout, gpm);
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    try {
        latticegpm::InteractionTable table = latticegpm::default_interaction_table();
        if (config.interaction_table_file) {
            table = latticegpm::read_interaction_table(*config.interaction_table_file);
            std::cerr << "Loaded " << table.size() << " contact energies from "
                      << *config.interaction_table_file << "\n";
        }

        // The lattice oracle is needed for a search or when no list is given
        std::unique_ptr<latticegpm::LatticeConformations> oracle;
        if (!config.conformations_file) {
            std::size_t length = config.wildtype
                ? config.wildtype->size()
                : static_cast<std::size_t>(config.search_length);
            std::cerr << "Enumerating lattice conformations of length " << length << "...\n";
            oracle = std::make_unique<latticegpm::LatticeConformations>(length, table);
            std::cerr << "Found " << oracle->num_conformations() << " conformations in "
                      << oracle->contact_sets().size() << " contact sets\n";
        }

        // Endpoints
        if (!config.wildtype) {
            latticegpm::WichmannHillRNG rng(config.seed);
            std::cerr << "Searching for endpoints with native energy below "
                      << config.search_threshold << "...\n";
            auto [wildtype, mutant] = latticegpm::search_conformation_space(
                *oracle, config.temperature, config.search_threshold, rng,
                config.max_iterations);
            config.wildtype = wildtype;
            config.mutant = mutant;
            std::cerr << "Found " << wildtype << " and " << mutant << "\n";
        }

        latticegpm::LatticeGenotypePhenotypeMap gpm(
            *config.wildtype, *config.mutant, config.temperature,
            config.phenotype_type, table);
        std::cerr << "Sequence space has " << gpm.n() << " genotypes\n";

        if (config.target_conformation) {
            gpm.set_target_conf(*config.target_conformation);
        }

        // Score
        if (config.conformations_file) {
            auto conformations = read_conformations(*config.conformations_file);
            std::cerr << "Scoring against " << conformations.size() << " conformations...\n";
            gpm.set_partition_confs(std::move(conformations));
        } else {
            std::cerr << "Folding with the " << oracle->name() << " oracle...\n";
            gpm.fold(*oracle);
        }
        std::cerr << "Scoring complete.\n";

        latticegpm::write_phenotype_table(std::cout, gpm);
        if (config.draw_conformations) {
            draw_folded(std::cout, gpm);
        }

        if (config.output_map_file) {
            latticegpm::write_map_json(*config.output_map_file, gpm);
            std::cerr << "Wrote map to: " << *config.output_map_file << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Done.\n";
    return 0;
}
