#include "latticegpm/core/random.hpp"
#include "latticegpm/core/types.hpp"

#include <stdexcept>

namespace latticegpm {

WichmannHillRNG::WichmannHillRNG(int seed) {
    set_seed(seed);
}

void WichmannHillRNG::set_seed(int seed) {
    z_ = 170 * (seed % 178) + 137;
    x_ = 11;
    y_ = 23;
}

double WichmannHillRNG::uniform() {
    x_ = 171 * (x_ % 177) -  2 * (x_ / 177);
    y_ = 172 * (y_ % 176) - 35 * (y_ / 176);
    z_ = 170 * (z_ % 178) - 63 * (z_ / 178);

    if (x_ < 0) x_ += 30269;
    if (y_ < 0) y_ += 30307;
    if (z_ < 0) z_ += 30323;

    double r = static_cast<double>(x_) / 30269.0
             + static_cast<double>(y_) / 30307.0
             + static_cast<double>(z_) / 30323.0;

    return r - static_cast<int>(r);
}

std::size_t WichmannHillRNG::uniform_index(std::size_t n) {
    if (n == 0) {
        throw std::invalid_argument("uniform_index requires at least one choice");
    }
    auto index = static_cast<std::size_t>(uniform() * static_cast<double>(n));
    // uniform() < 1, but guard the rounding at the top edge
    return index < n ? index : n - 1;
}

std::string WichmannHillRNG::random_sequence(std::size_t length, std::string_view alphabet) {
    if (alphabet.empty()) {
        throw std::invalid_argument("Cannot draw a sequence from an empty alphabet");
    }
    std::string sequence;
    sequence.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        sequence.push_back(alphabet[uniform_index(alphabet.size())]);
    }
    return sequence;
}

std::string WichmannHillRNG::random_protein(std::size_t length) {
    return random_sequence(
        length, std::string_view(kAminoAcidChars.data(), kAminoAcidChars.size()));
}

} // namespace latticegpm
