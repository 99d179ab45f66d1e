#pragma once

#include <string>
#include <cstddef>

namespace asian_pricer {

enum class OptionKind { Call, Put };

// H and W are reciprocal transforms of the same Asian option value
enum class EquationKind { H, W };

enum class Scheme { Explicit, CrankNicolson };

OptionKind parseOptionKind(const std::string& text);
Scheme parseScheme(const std::string& text);

std::string toString(OptionKind kind);
std::string toString(EquationKind kind);
std::string toString(Scheme scheme);

struct ModelParameters {
    size_t M = 0;         // Number of spatial points
    size_t N = 0;         // Number of time steps
    double xMin = 0.0;
    double xMax = 0.0;
    double T = 0.0;       // Maturity of the Asian option
    double sigma = 0.0;   // Volatility
    double r = 0.0;       // Risk-free interest rate

    // tau runs over [0, sigma^2 T / 2]
    double tauMax() const { return 0.5 * sigma * sigma * T; }

    // Throws InvalidParameters if the tuple cannot define a mesh
    void validate() const;
};

} // namespace asian_pricer
