#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Invalid run configuration (utilization, capacity, algorithm,
 *        output format or command-line usage).
 *
 * Raised before any demand is expanded.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A record or operation that breaks the core's input contract.
 *
 * The input layer is expected to reject such records, so reaching the core
 * with one is a programming error on the caller's side.
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Malformed input file, row or time string.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};
