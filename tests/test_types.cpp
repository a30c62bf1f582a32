#include <catch2/catch_test_macros.hpp>

#include "latticegpm/core/types.hpp"
#include "latticegpm/core/errors.hpp"

using namespace latticegpm;

TEST_CASE("Amino acid character array", "[types]") {
    SECTION("Contains 20 standard amino acids") {
        REQUIRE(kAminoAcidChars.size() == 20);
        REQUIRE(kNumAminoAcids == 20);
    }

    SECTION("Array is in canonical order") {
        // A R N D C Q E G H I L K M F P S T W Y V
        REQUIRE(kAminoAcidChars[0] == 'A');
        REQUIRE(kAminoAcidChars[1] == 'R');
        REQUIRE(kAminoAcidChars[4] == 'C');
        REQUIRE(kAminoAcidChars[14] == 'P');
        REQUIRE(kAminoAcidChars[17] == 'W');
        REQUIRE(kAminoAcidChars[19] == 'V');
    }
}

TEST_CASE("is_amino_acid", "[types]") {
    SECTION("Standard residues are accepted") {
        for (char c : kAminoAcidChars) {
            REQUIRE(is_amino_acid(c));
        }
    }

    SECTION("Other characters are rejected") {
        REQUIRE_FALSE(is_amino_acid('B'));
        REQUIRE_FALSE(is_amino_acid('X'));
        REQUIRE_FALSE(is_amino_acid('a'));
        REQUIRE_FALSE(is_amino_acid('-'));
    }

    SECTION("Usable at compile time") {
        static_assert(is_amino_acid('W'));
        static_assert(!is_amino_acid('Z'));
    }
}

TEST_CASE("ThermoRecord defaults", "[types]") {
    ThermoRecord record;
    REQUIRE(record.native_energy == 0.0);
    REQUIRE(record.native_conformation.empty());
    REQUIRE(record.partition_sum == 0.0);
    REQUIRE_FALSE(record.folded);
}

TEST_CASE("PhenotypeType enum", "[types]") {
    SECTION("Enum values are sequential") {
        REQUIRE(static_cast<int>(PhenotypeType::NativeEnergy) == 0);
        REQUIRE(static_cast<int>(PhenotypeType::Stability) == 1);
        REQUIRE(static_cast<int>(PhenotypeType::FractionFolded) == 2);
    }

    SECTION("to_string returns persisted names") {
        REQUIRE(to_string(PhenotypeType::NativeEnergy) == "nativeEs");
        REQUIRE(to_string(PhenotypeType::Stability) == "stabilities");
        REQUIRE(to_string(PhenotypeType::FractionFolded) == "fracfolded");
    }

    SECTION("Names parse back") {
        REQUIRE(phenotype_type_from_string("nativeEs") == PhenotypeType::NativeEnergy);
        REQUIRE(phenotype_type_from_string("stabilities") == PhenotypeType::Stability);
        REQUIRE(phenotype_type_from_string("fracfolded") == PhenotypeType::FractionFolded);
    }

    SECTION("Unknown names throw") {
        REQUIRE_THROWS_AS(phenotype_type_from_string("fitness"), InvalidPhenotypeTypeError);
        REQUIRE_THROWS_AS(phenotype_type_from_string("Stabilities"), InvalidPhenotypeTypeError);
        REQUIRE_THROWS_AS(phenotype_type_from_string(""), InvalidPhenotypeTypeError);
    }

    SECTION("Error message names the bad value") {
        try {
            (void)phenotype_type_from_string("fitness");
            FAIL("expected InvalidPhenotypeTypeError");
        } catch (const InvalidPhenotypeTypeError& e) {
            REQUIRE(std::string(e.what()) == "fitness is not a valid phenotype type");
        }
    }
}
