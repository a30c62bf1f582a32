#include "latticegpm/io/map_json.hpp"
#include "latticegpm/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace latticegpm {

using nlohmann::json;

namespace {

const json& require_type(const json& data, const std::string& field,
                         json::value_t type, const char* expected) {
    const json& value = data.at(field);
    bool ok = (type == json::value_t::number_float) ? value.is_number()
                                                    : value.type() == type;
    if (!ok) {
        throw ValidationError(field + " must be " + expected + ", got " + value.type_name());
    }
    return value;
}

std::vector<std::string> string_list(const json& data, const std::string& field) {
    const json& values = require_type(data, field, json::value_t::array, "an array");
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        if (!value.is_string()) {
            throw ValidationError(field + " must contain only strings");
        }
        result.push_back(value.get<std::string>());
    }
    return result;
}

std::vector<double> number_list(const json& data, const std::string& field) {
    const json& values = require_type(data, field, json::value_t::array, "an array");
    std::vector<double> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        if (!value.is_number()) {
            throw ValidationError(field + " must contain only numbers");
        }
        result.push_back(value.get<double>());
    }
    return result;
}

std::vector<bool> bool_list(const json& data, const std::string& field) {
    const json& values = require_type(data, field, json::value_t::array, "an array");
    std::vector<bool> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        if (!value.is_boolean()) {
            throw ValidationError(field + " must contain only booleans");
        }
        result.push_back(value.get<bool>());
    }
    return result;
}

char single_residue(const json& value, const std::string& field) {
    if (!value.is_string() || value.get<std::string>().size() != 1) {
        throw ValidationError(field + " residues must be one-character strings");
    }
    return value.get<std::string>()[0];
}

MutationMap mutation_map(const json& data, const std::string& field) {
    const json& sites = require_type(data, field, json::value_t::object, "an object");
    MutationMap mutations;
    for (auto it = sites.begin(); it != sites.end(); ++it) {
        const std::string& key = it.key();
        if (key.empty() || !std::all_of(key.begin(), key.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw ValidationError(field + " has a non-numeric site '" + key + "'");
        }
        const json& pair = it.value();
        if (!pair.is_array() || pair.size() != 2) {
            throw ValidationError(field + " site " + key + " must map to [wildtype, mutant]");
        }
        std::size_t site = 0;
        try {
            site = static_cast<std::size_t>(std::stoul(key));
        } catch (const std::out_of_range&) {
            throw ValidationError(field + " site " + key + " is out of range");
        }
        mutations.emplace(site,
                          std::make_pair(single_residue(pair[0], field),
                                         single_residue(pair[1], field)));
    }
    return mutations;
}

// JSON has no encoding for inf or NaN; dump() would write null
void require_finite(const std::vector<double>& values, const std::string& field) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw ValidationError(field + " entry " + std::to_string(i) +
                                  " is not finite and cannot be saved");
        }
    }
}

} // anonymous namespace

json record_to_json(const MapRecord& record) {
    require_finite(record.native_energies, "nativeEs");
    require_finite(record.partition_sums, "partition_sum");
    require_finite({record.temperature}, "temperature");

    json data;
    data["wildtype"] = record.wildtype;
    data["genotypes"] = record.genotypes;
    data["nativeEs"] = record.native_energies;
    data["partition_sum"] = record.partition_sums;
    data["confs"] = record.conformations;

    json folded = json::array();
    for (bool f : record.folded) {
        folded.push_back(f);
    }
    data["folded"] = std::move(folded);

    data["phenotype_type"] = record.phenotype_type;
    data["temperature"] = record.temperature;

    json mutations = json::object();
    for (const auto& [site, residues] : record.mutations) {
        mutations[std::to_string(site)] = json::array({std::string(1, residues.first),
                                                       std::string(1, residues.second)});
    }
    data["mutations"] = std::move(mutations);
    return data;
}

MapRecord record_from_json(const json& data) {
    if (!data.is_object()) {
        throw ValidationError(std::string("a saved map must be a JSON object, got ") +
                              data.type_name());
    }

    for (std::string_view field : kMapFields) {
        if (!data.contains(std::string(field))) {
            throw MissingFieldError(std::string(field));
        }
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (std::find(kMapFields.begin(), kMapFields.end(), it.key()) == kMapFields.end()) {
            throw ValidationError("unknown field " + it.key());
        }
    }

    MapRecord record;
    record.wildtype = require_type(data, "wildtype", json::value_t::string, "a string")
                          .get<std::string>();
    record.genotypes = string_list(data, "genotypes");
    record.native_energies = number_list(data, "nativeEs");
    record.partition_sums = number_list(data, "partition_sum");
    record.conformations = string_list(data, "confs");
    record.folded = bool_list(data, "folded");
    record.phenotype_type = require_type(data, "phenotype_type", json::value_t::string, "a string")
                                .get<std::string>();
    record.temperature = require_type(data, "temperature", json::value_t::number_float, "a number")
                             .get<double>();
    record.mutations = mutation_map(data, "mutations");
    return record;
}

json map_to_json(const LatticeGenotypePhenotypeMap& gpm) {
    return record_to_json(gpm.to_record());
}

LatticeGenotypePhenotypeMap map_from_json(const json& data) {
    return LatticeGenotypePhenotypeMap::from_record(record_from_json(data));
}

void write_map_json(const std::string& filename, const LatticeGenotypePhenotypeMap& gpm) {
    json data = map_to_json(gpm);
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file << data.dump() << '\n';
}

LatticeGenotypePhenotypeMap read_map_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open map file: " + filename);
    }

    json data;
    try {
        file >> data;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse map file " + filename + ": " + e.what());
    }
    return map_from_json(data);
}

} // namespace latticegpm
