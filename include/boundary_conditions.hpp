#pragma once

#include "mesh.hpp"
#include "option.hpp"
#include <vector>

namespace asian_pricer {

// Values injected at m = 0 (x -> -inf) and m = M-1 (x -> +inf) for layer n+1
struct BoundaryValues {
    double left = 0.0;
    double right = 0.0;
};

// previous is the layer n, tauNext is tau_{n+1}
BoundaryValues explicitBoundary(EquationKind equation, OptionKind option,
                                const ModelParameters& params,
                                const SchemeCoefficients& coefficients,
                                const std::vector<double>& x,
                                const std::vector<double>& previous,
                                double tauNext);

BoundaryValues crankNicolsonBoundary(EquationKind equation, OptionKind option,
                                     const ModelParameters& params,
                                     const std::vector<double>& previous,
                                     double tauNext);

} // namespace asian_pricer
