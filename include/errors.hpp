#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace asian_pricer {

class PricerError : public std::runtime_error {
public:
    explicit PricerError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidOptionKind : public PricerError {
public:
    explicit InvalidOptionKind(const std::string& tag)
        : PricerError("Invalid option kind: '" + tag + "' (expected 'call' or 'put')") {}
};

class InvalidEquationKind : public PricerError {
public:
    explicit InvalidEquationKind(const std::string& tag)
        : PricerError("Invalid equation kind: '" + tag + "' (expected 'H' or 'W')") {}
};

class InvalidParameters : public PricerError {
public:
    explicit InvalidParameters(const std::string& message) : PricerError(message) {}
};

class ConfigurationError : public PricerError {
public:
    explicit ConfigurationError(const std::string& message) : PricerError(message) {}
};

class ConfigurationMissing : public ConfigurationError {
public:
    explicit ConfigurationMissing(const std::string& key)
        : ConfigurationError("Missing configuration entry: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class ExpressionError : public ConfigurationError {
public:
    explicit ExpressionError(const std::string& message) : ConfigurationError(message) {}
};

class SingularMatrix : public PricerError {
public:
    explicit SingularMatrix(size_t row)
        : PricerError("Singular matrix: zero pivot at row " + std::to_string(row)), row_(row) {}

    size_t row() const { return row_; }

private:
    size_t row_;
};

class NumericInstability : public PricerError {
public:
    NumericInstability(size_t step, size_t index)
        : PricerError("Non-finite value at time step " + std::to_string(step) +
                      ", spatial index " + std::to_string(index)),
          step_(step) {}

    size_t step() const { return step_; }

private:
    size_t step_;
};

class SolverCancelled : public PricerError {
public:
    explicit SolverCancelled(size_t step)
        : PricerError("Solver cancelled before time step " + std::to_string(step)) {}
};

} // namespace asian_pricer
