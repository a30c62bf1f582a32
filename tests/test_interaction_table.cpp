#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "latticegpm/lattice/interaction_table.hpp"
#include "latticegpm/core/errors.hpp"
#include "latticegpm/core/types.hpp"

#include <sstream>

using namespace latticegpm;
using Catch::Approx;

TEST_CASE("InteractionTable basic operations", "[interaction]") {
    InteractionTable table;

    SECTION("New table is empty") {
        REQUIRE(table.empty());
        REQUIRE(table.size() == 0);
        REQUIRE_FALSE(table.contains('H', 'P'));
    }

    SECTION("Setting a pair sets both orders") {
        table.set('H', 'P', -0.5);
        REQUIRE(table.energy('H', 'P') == Approx(-0.5));
        REQUIRE(table.energy('P', 'H') == Approx(-0.5));
        REQUIRE(table.size() == 1);
    }

    SECTION("Overwriting a pair keeps the count") {
        table.set('H', 'H', -1.0);
        table.set('H', 'H', -2.0);
        REQUIRE(table.energy('H', 'H') == Approx(-2.0));
        REQUIRE(table.size() == 1);
    }

    SECTION("Reversed overwrite keeps the count") {
        table.set('H', 'P', -1.0);
        table.set('P', 'H', 0.5);
        REQUIRE(table.energy('H', 'P') == Approx(0.5));
        REQUIRE(table.size() == 1);
    }

    SECTION("Missing pair throws") {
        table.set('H', 'H', -1.0);
        REQUIRE_THROWS_AS(table.energy('H', 'P'), std::out_of_range);
    }
}

TEST_CASE("Default interaction table", "[interaction]") {
    const InteractionTable& table = default_interaction_table();

    SECTION("Covers every unordered pair of amino acids") {
        REQUIRE(table.size() == 210);
        for (char a : kAminoAcidChars) {
            for (char b : kAminoAcidChars) {
                REQUIRE(table.contains(a, b));
            }
        }
    }

    SECTION("Is symmetric") {
        for (char a : kAminoAcidChars) {
            for (char b : kAminoAcidChars) {
                REQUIRE(table.energy(a, b) == table.energy(b, a));
            }
        }
    }

    SECTION("Known values") {
        REQUIRE(table.energy('A', 'A') == Approx(-0.13));
        REQUIRE(table.energy('R', 'D') == Approx(-0.72));
        REQUIRE(table.energy('E', 'K') == Approx(-0.97));
        REQUIRE(table.energy('H', 'M') == Approx(0.99));
    }

    SECTION("Returns the same instance") {
        REQUIRE(&default_interaction_table() == &table);
    }
}

TEST_CASE("read_interaction_table", "[interaction]") {
    SECTION("Parses pairs, comments and blank lines") {
        std::istringstream input(
            "# HP model\n"
            "H H -1.0\n"
            "\n"
            "H P 0.0\n"
            "   # indented comment\n"
            "P P 0.0\n");
        InteractionTable table = read_interaction_table(input);
        REQUIRE(table.size() == 3);
        REQUIRE(table.energy('H', 'H') == Approx(-1.0));
        REQUIRE(table.energy('P', 'H') == Approx(0.0));
    }

    SECTION("Missing energy throws") {
        std::istringstream input("H H\n");
        REQUIRE_THROWS_AS(read_interaction_table(input), ValidationError);
    }

    SECTION("Non-numeric energy throws") {
        std::istringstream input("H H low\n");
        REQUIRE_THROWS_AS(read_interaction_table(input), ValidationError);
    }

    SECTION("Multi-character residue throws") {
        std::istringstream input("HH P -1.0\n");
        REQUIRE_THROWS_AS(read_interaction_table(input), ValidationError);
    }

    SECTION("Trailing field throws") {
        std::istringstream input("H P -1.0 extra\n");
        REQUIRE_THROWS_AS(read_interaction_table(input), ValidationError);
    }

    SECTION("Missing file throws") {
        REQUIRE_THROWS_AS(read_interaction_table(std::string("/nonexistent/table.txt")),
                          std::runtime_error);
    }
}
