#ifndef LATTICEGPM_CORE_ERRORS_HPP
#define LATTICEGPM_CORE_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Exception types raised by latticegpm.
 *
 * Every error is thrown at the point of violation. None is retried inside
 * the library; callers decide whether to retry (e.g. with a relaxed search
 * threshold) or abort.
 */

#include <stdexcept>
#include <string>

namespace latticegpm {

/**
 * @class ValidationError
 * @brief Invalid input: length mismatch, bad parameter or malformed field.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument("Validation error: " + message) {}
};

/**
 * @class DivergenceError
 * @brief Two sequences that must differ at every site do not.
 */
class DivergenceError : public std::invalid_argument {
public:
    explicit DivergenceError(const std::string& message)
        : std::invalid_argument("Divergence error: " + message) {}
};

/**
 * @class SearchExhaustedError
 * @brief A landscape search used its whole iteration budget without a pair.
 */
class SearchExhaustedError : public std::runtime_error {
public:
    explicit SearchExhaustedError(int iterations)
        : std::runtime_error(
              "Random search reached max iterations (" + std::to_string(iterations) +
              ") before finding satisfying sequences") {}
};

/**
 * @class NoScoringSourceError
 * @brief A scoring pass was requested with neither an oracle nor conformations.
 */
class NoScoringSourceError : public std::logic_error {
public:
    NoScoringSourceError()
        : std::logic_error(
              "No scoring source: give a fold oracle or a list of conformations") {}
};

/**
 * @class InvalidPhenotypeTypeError
 * @brief Unrecognised phenotype selector name.
 */
class InvalidPhenotypeTypeError : public std::invalid_argument {
public:
    explicit InvalidPhenotypeTypeError(const std::string& name)
        : std::invalid_argument(name + " is not a valid phenotype type") {}
};

/**
 * @class MissingFieldError
 * @brief A persisted map lacks a required field.
 */
class MissingFieldError : public std::runtime_error {
public:
    explicit MissingFieldError(const std::string& field)
        : std::runtime_error("Missing required field: " + field), field_(field) {}

    /** @brief Name of the absent field. */
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/**
 * @class ConformationError
 * @brief A lattice conformation is malformed or self-intersecting.
 */
class ConformationError : public std::invalid_argument {
public:
    explicit ConformationError(const std::string& message)
        : std::invalid_argument("Conformation error: " + message) {}
};

} // namespace latticegpm

#endif // LATTICEGPM_CORE_ERRORS_HPP
