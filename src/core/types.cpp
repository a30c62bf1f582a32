#include "latticegpm/core/types.hpp"
#include "latticegpm/core/errors.hpp"

namespace latticegpm {

PhenotypeType phenotype_type_from_string(std::string_view name) {
    for (auto type : {PhenotypeType::NativeEnergy,
                      PhenotypeType::Stability,
                      PhenotypeType::FractionFolded}) {
        if (to_string(type) == name) {
            return type;
        }
    }
    throw InvalidPhenotypeTypeError(std::string(name));
}

} // namespace latticegpm
