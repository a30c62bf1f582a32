#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "latticegpm/map/genotype_phenotype_map.hpp"
#include "latticegpm/lattice/lattice_conformations.hpp"
#include "latticegpm/sequence/binary_encoder.hpp"
#include "latticegpm/core/errors.hpp"

#include <cmath>
#include <sstream>
#include <utility>

using namespace latticegpm;
using Catch::Approx;

namespace {

// H-H contacts attract, everything else is neutral
InteractionTable hp_table() {
    InteractionTable table;
    table.set('H', 'H', -1.0);
    table.set('H', 'P', 0.0);
    table.set('P', 'P', 0.0);
    return table;
}

LatticeGenotypePhenotypeMap hp_map(double temperature = 1.0) {
    return LatticeGenotypePhenotypeMap("HPPH", "PHHP", temperature,
                                       PhenotypeType::Stability, hp_table());
}

template <typename Oracle>
concept FoldsWith = requires(LatticeGenotypePhenotypeMap& gpm, Oracle&& oracle) {
    gpm.fold(std::forward<Oracle>(oracle));
};

template <typename Oracle>
concept BuildsFromMutant = requires(Oracle&& oracle) {
    LatticeGenotypePhenotypeMap::from_mutant("PWKR", "ACDE", std::forward<Oracle>(oracle));
};

template <typename Oracle>
concept BuildsFromLength = requires(Oracle&& oracle, WichmannHillRNG& rng) {
    LatticeGenotypePhenotypeMap::from_length(std::forward<Oracle>(oracle), -1.0, rng);
};

} // anonymous namespace

TEST_CASE("LatticeGenotypePhenotypeMap keeps only long-lived oracles", "[map]") {
    // The map rescores through the oracle later, so temporaries are rejected
    STATIC_REQUIRE(FoldsWith<LatticeConformations&>);
    STATIC_REQUIRE(FoldsWith<const LatticeConformations&>);
    STATIC_REQUIRE_FALSE(FoldsWith<LatticeConformations>);

    STATIC_REQUIRE(BuildsFromMutant<const LatticeConformations&>);
    STATIC_REQUIRE_FALSE(BuildsFromMutant<LatticeConformations>);

    STATIC_REQUIRE(BuildsFromLength<const LatticeConformations&>);
    STATIC_REQUIRE_FALSE(BuildsFromLength<LatticeConformations>);
}

TEST_CASE("LatticeGenotypePhenotypeMap construction", "[map]") {
    SECTION("Sequence space") {
        auto gpm = hp_map();
        REQUIRE(gpm.wildtype() == "HPPH");
        REQUIRE(gpm.mutant() == "PHHP");
        REQUIRE(gpm.length() == 4);
        REQUIRE(gpm.n() == 16);
        REQUIRE(gpm.genotypes() == enumerate("HPPH", "PHHP"));
        REQUIRE(gpm.mutations().size() == 4);
        REQUIRE(gpm.mutations().at(1) == std::make_pair('P', 'H'));
        REQUIRE(gpm.temperature() == Approx(1.0));
        REQUIRE(gpm.phenotype_type() == PhenotypeType::Stability);
        REQUIRE_FALSE(gpm.target_conf().has_value());
    }

    SECTION("Starts unscored") {
        auto gpm = hp_map();
        REQUIRE_FALSE(gpm.is_scored());
        REQUIRE(gpm.records().empty());
        REQUIRE_THROWS_AS(gpm.phenotypes(), std::runtime_error);
        REQUIRE_THROWS_AS(gpm.to_record(), std::runtime_error);
    }

    SECTION("Invalid endpoints throw") {
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap("AB", "ABC"), ValidationError);
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap("AB", "AB"), DivergenceError);
    }

    SECTION("Non-positive temperature throws") {
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap("PW", "CA", 0.0), ValidationError);
    }
}

TEST_CASE("LatticeGenotypePhenotypeMap sequence space", "[map]") {
    auto gpm = hp_map();

    SECTION("Binary genotypes follow genotype order") {
        REQUIRE(gpm.binary_genotypes() == binary_strings(4));
    }

    SECTION("index_of inverts the enumeration") {
        REQUIRE(gpm.index_of("HPPH") == 0);
        REQUIRE(gpm.index_of("PPPH") == 8);
        REQUIRE(gpm.index_of("PHHP") == 15);
        for (std::size_t i = 0; i < gpm.n(); ++i) {
            REQUIRE(gpm.index_of(gpm.genotypes()[i]) == i);
        }
    }

    SECTION("Sequence outside the space throws") {
        REQUIRE_THROWS_AS(gpm.index_of("AAAA"), ValidationError);
        REQUIRE_THROWS_AS(gpm.index_of("HPP"), ValidationError);
    }
}

TEST_CASE("LatticeGenotypePhenotypeMap folding with the lattice oracle", "[map]") {
    LatticeConformations conformations(4, hp_table());
    auto gpm = hp_map();
    gpm.fold(conformations);

    SECTION("Every genotype is scored") {
        REQUIRE(gpm.is_scored());
        REQUIRE(gpm.records().size() == 16);
        REQUIRE(gpm.phenotypes().size() == 16);
    }

    SECTION("Wildtype folds into the square") {
        const ThermoRecord& wt = gpm.records()[0];
        REQUIRE(wt.folded);
        REQUIRE(wt.native_conformation == "URD");
        REQUIRE(wt.native_energy == Approx(-1.0));
        REQUIRE(wt.partition_sum == Approx(4.0 + std::exp(1.0)));
    }

    SECTION("Mutant has no unique native state") {
        const ThermoRecord& mut = gpm.records()[15];
        REQUIRE_FALSE(mut.folded);
        REQUIRE(mut.native_conformation.empty());
        REQUIRE(mut.native_energy == Approx(0.0));
        REQUIRE(mut.partition_sum == Approx(5.0));
    }

    SECTION("Records agree with the oracle") {
        for (std::size_t i = 0; i < gpm.n(); ++i) {
            FoldResult expected = conformations.fold(gpm.genotypes()[i], 1.0);
            REQUIRE(gpm.records()[i].native_energy == Approx(expected.native_energy));
            REQUIRE(gpm.records()[i].partition_sum == Approx(expected.partition_sum));
            REQUIRE(gpm.records()[i].folded == expected.folded);
        }
    }

    SECTION("Phenotype accessors") {
        REQUIRE(gpm.stabilities()[0] == Approx(-1.0 + std::log(4.0)));
        REQUIRE(gpm.phenotypes() == gpm.stabilities());
        REQUIRE(gpm.native_energies()[0] == Approx(-1.0));
        REQUIRE(gpm.partition_sums()[15] == Approx(5.0));
        REQUIRE(gpm.conformations()[0] == "URD");
        REQUIRE(gpm.folded()[0]);
        REQUIRE_FALSE(gpm.folded()[15]);
        REQUIRE(gpm.fraction_folded()[0] ==
                Approx(1.0 / (1.0 + std::exp(-1.0 + std::log(4.0)))));
    }

    SECTION("Phenotype selection") {
        gpm.set_phenotype_type(PhenotypeType::NativeEnergy);
        REQUIRE(gpm.phenotypes() == gpm.native_energies());

        gpm.set_phenotype_type("fracfolded");
        REQUIRE(gpm.phenotype_type() == PhenotypeType::FractionFolded);
        REQUIRE(gpm.phenotypes() == gpm.fraction_folded());

        REQUIRE_THROWS_AS(gpm.set_phenotype_type("fitness"), InvalidPhenotypeTypeError);
        REQUIRE(gpm.phenotype_type() == PhenotypeType::FractionFolded);
    }

    SECTION("Changing temperature rescores") {
        gpm.set_temperature(2.0);
        REQUIRE(gpm.temperature() == Approx(2.0));
        REQUIRE(gpm.records()[0].partition_sum == Approx(4.0 + std::exp(0.5)));
    }

    SECTION("Invalid temperature leaves the map unchanged") {
        REQUIRE_THROWS_AS(gpm.set_temperature(0.0), ValidationError);
        REQUIRE(gpm.temperature() == Approx(1.0));
        REQUIRE(gpm.records()[0].partition_sum == Approx(4.0 + std::exp(1.0)));
    }

    SECTION("Target conformation overrides native states") {
        gpm.set_target_conf("UUU");
        REQUIRE(gpm.target_conf() == std::optional<std::string>("UUU"));
        for (const auto& record : gpm.records()) {
            REQUIRE(record.native_conformation == "UUU");
            REQUIRE(record.native_energy == Approx(0.0));
        }
        REQUIRE(gpm.records()[0].partition_sum == Approx(4.0 + std::exp(1.0)));
        REQUIRE(gpm.records()[0].folded);

        gpm.clear_target_conf();
        REQUIRE_FALSE(gpm.target_conf().has_value());
        REQUIRE(gpm.records()[0].native_conformation == "URD");
        REQUIRE(gpm.records()[0].native_energy == Approx(-1.0));
    }

    SECTION("Target survives a temperature change") {
        gpm.set_target_conf("URD");
        gpm.set_temperature(0.5);
        REQUIRE(gpm.records()[15].native_conformation == "URD");
    }

    SECTION("rescore repeats the pass") {
        auto before = gpm.native_energies();
        gpm.rescore();
        REQUIRE(gpm.native_energies() == before);
    }

    SECTION("Oracle of the wrong length throws") {
        LatticeConformations other(5, hp_table());
        REQUIRE_THROWS_AS(gpm.fold(other), ValidationError);
        REQUIRE(gpm.records().size() == 16);
    }
}

TEST_CASE("LatticeGenotypePhenotypeMap explicit conformations", "[map]") {
    auto gpm = hp_map();

    SECTION("Scores against the given list") {
        gpm.set_partition_confs({"URD", "UUU"});

        const ThermoRecord& wt = gpm.records()[0];
        REQUIRE(wt.native_conformation == "URD");
        REQUIRE(wt.native_energy == Approx(-1.0));
        REQUIRE(wt.partition_sum == Approx(std::exp(1.0) + 1.0));
        REQUIRE(wt.folded);

        const ThermoRecord& mut = gpm.records()[15];
        REQUIRE_FALSE(mut.folded);
        REQUIRE(mut.native_conformation == "URD");
        REQUIRE(mut.native_energy == Approx(0.0));
        REQUIRE(mut.partition_sum == Approx(2.0));
    }

    SECTION("List replaces a previous oracle") {
        LatticeConformations conformations(4, hp_table());
        gpm.fold(conformations);
        gpm.set_partition_confs({"UUU"});
        REQUIRE(gpm.records()[0].partition_sum == Approx(1.0));

        gpm.set_temperature(2.0);
        REQUIRE(gpm.records()[0].partition_sum == Approx(1.0));
    }

    SECTION("Empty list throws and keeps the previous scores") {
        gpm.set_partition_confs({"URD"});
        REQUIRE_THROWS_AS(gpm.set_partition_confs({}), NoScoringSourceError);
        REQUIRE(gpm.is_scored());
        REQUIRE(gpm.records()[0].native_conformation == "URD");
    }

    SECTION("Invalid conformation throws and keeps the map unscored") {
        REQUIRE_THROWS_AS(gpm.set_partition_confs({"URDL"}), ConformationError);
        REQUIRE_FALSE(gpm.is_scored());
    }

    SECTION("Rescoring without a source throws") {
        REQUIRE_THROWS_AS(gpm.rescore(), NoScoringSourceError);
    }

    SECTION("Target set before scoring applies to the first pass") {
        gpm.set_target_conf("UUU");
        REQUIRE_FALSE(gpm.is_scored());
        gpm.set_partition_confs({"URD", "UUU"});
        REQUIRE(gpm.records()[0].native_conformation == "UUU");
        REQUIRE(gpm.records()[0].partition_sum == Approx(std::exp(1.0) + 1.0));
    }
}

TEST_CASE("LatticeGenotypePhenotypeMap factories", "[map]") {
    LatticeConformations conformations(4);

    SECTION("from_mutant folds the space") {
        auto gpm = LatticeGenotypePhenotypeMap::from_mutant("PWKR", "ACDE", conformations);
        REQUIRE(gpm.is_scored());
        REQUIRE_NOTHROW(gpm.set_temperature(2.0));
        REQUIRE(gpm.n() == 16);
        FoldResult expected = conformations.fold("PWKR", 1.0);
        REQUIRE(gpm.records()[0].native_energy == Approx(expected.native_energy));
    }

    SECTION("from_mutant with a target and phenotype type") {
        auto gpm = LatticeGenotypePhenotypeMap::from_mutant(
            "PWKR", "ACDE", conformations, 1.0, std::string("URD"),
            PhenotypeType::NativeEnergy);
        REQUIRE(gpm.target_conf() == std::optional<std::string>("URD"));
        REQUIRE(gpm.phenotypes()[0] ==
                Approx(default_interaction_table().energy('P', 'R')));
    }

    SECTION("from_length searches then folds") {
        WichmannHillRNG rng(12345);
        auto gpm = LatticeGenotypePhenotypeMap::from_length(conformations, -0.1, rng);
        REQUIRE(gpm.is_scored());
        REQUIRE(hamming_distance(gpm.wildtype(), gpm.mutant()) == 4);
        REQUIRE(gpm.native_energies().front() < -0.1);
        REQUIRE(gpm.native_energies().back() < -0.1);
    }

    SECTION("from_length propagates an exhausted search") {
        WichmannHillRNG rng(12345);
        REQUIRE_THROWS_AS(
            LatticeGenotypePhenotypeMap::from_length(conformations, -100.0, rng, 20),
            SearchExhaustedError);
    }
}

TEST_CASE("LatticeGenotypePhenotypeMap records", "[map]") {
    LatticeConformations conformations(4, hp_table());
    auto gpm = hp_map();
    gpm.fold(conformations);
    MapRecord record = gpm.to_record();

    SECTION("Record holds every field") {
        REQUIRE(record.wildtype == "HPPH");
        REQUIRE(record.genotypes.size() == 16);
        REQUIRE(record.native_energies.size() == 16);
        REQUIRE(record.partition_sums.size() == 16);
        REQUIRE(record.conformations[0] == "URD");
        REQUIRE(record.folded[0]);
        REQUIRE(record.phenotype_type == "stabilities");
        REQUIRE(record.temperature == Approx(1.0));
        REQUIRE(record.mutations == gpm.mutations());
    }

    SECTION("Restored map has the same phenotypes") {
        auto restored = LatticeGenotypePhenotypeMap::from_record(record, hp_table());
        REQUIRE(restored.mutant() == "PHHP");
        REQUIRE(restored.genotypes() == gpm.genotypes());
        REQUIRE(restored.phenotypes() == gpm.phenotypes());
        REQUIRE(restored.conformations() == gpm.conformations());
        REQUIRE(restored.folded() == gpm.folded());
    }

    SECTION("Restored map recomputes a target directly") {
        auto restored = LatticeGenotypePhenotypeMap::from_record(record, hp_table());
        restored.set_target_conf("UUU");
        REQUIRE(restored.records()[0].native_energy == Approx(0.0));
        REQUIRE(restored.records()[0].native_conformation == "UUU");
        REQUIRE(restored.records()[0].partition_sum == Approx(4.0 + std::exp(1.0)));
    }

    SECTION("Restored map cannot be rescored") {
        auto restored = LatticeGenotypePhenotypeMap::from_record(record, hp_table());
        REQUIRE_THROWS_AS(restored.set_temperature(2.0), NoScoringSourceError);
        REQUIRE_THROWS_AS(restored.clear_target_conf(), NoScoringSourceError);
        REQUIRE(restored.temperature() == Approx(1.0));
    }

    SECTION("Restored map can be folded again") {
        auto restored = LatticeGenotypePhenotypeMap::from_record(record, hp_table());
        restored.fold(conformations);
        REQUIRE_NOTHROW(restored.set_temperature(2.0));
    }

    SECTION("List of the wrong length throws") {
        record.native_energies.pop_back();
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap::from_record(record), ValidationError);
    }

    SECTION("Folded flags of the wrong length throw") {
        record.folded.push_back(true);
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap::from_record(record), ValidationError);
    }

    SECTION("Genotypes must match the mutation map") {
        std::swap(record.genotypes[0], record.genotypes[1]);
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap::from_record(record), ValidationError);
    }

    SECTION("Unknown phenotype type throws") {
        record.phenotype_type = "fitness";
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap::from_record(record),
                          InvalidPhenotypeTypeError);
    }

    SECTION("Invalid temperature throws") {
        record.temperature = -1.0;
        REQUIRE_THROWS_AS(LatticeGenotypePhenotypeMap::from_record(record), ValidationError);
    }
}

TEST_CASE("LatticeGenotypePhenotypeMap print_sequences", "[map]") {
    LatticeConformations conformations(4, hp_table());
    auto gpm = hp_map();

    SECTION("Unscored map throws") {
        std::ostringstream out;
        REQUIRE_THROWS_AS(gpm.print_sequences(out, {"HPPH"}), std::runtime_error);
    }

    SECTION("Draws folded genotypes") {
        gpm.fold(conformations);
        std::ostringstream out;
        gpm.print_sequences(out, {"HPPH", "PHHP"});
        REQUIRE(out.str() ==
                "HPPH\n"
                "P-P\n"
                "| |\n"
                "H H\n"
                "\n"
                "PHHP\n"
                "(no unique native conformation)\n"
                "\n");
    }

    SECTION("Sequence outside the map throws") {
        gpm.fold(conformations);
        std::ostringstream out;
        REQUIRE_THROWS_AS(gpm.print_sequences(out, {"AAAA"}), ValidationError);
    }
}
