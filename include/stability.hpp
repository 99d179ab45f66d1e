#pragma once

#include "mesh.hpp"
#include "option.hpp"
#include "logger.hpp"
#include <vector>
#include <cstddef>

namespace asian_pricer {

struct StabilityReport {
    bool adjusted = false;
    size_t oldM = 0, newM = 0;
    size_t oldN = 0, newN = 0;
    double oldH = 0.0, newH = 0.0;
    double oldK = 0.0, newK = 0.0;
    double bound = 0.0;  // Largest admissible k for the final mesh
};

struct StabilityResult {
    Mesh mesh;
    StabilityReport report;
};

// Equation H: min over interior points of 1/(2 A_m^2) if A_m^2 h^2 >= 1, else h^2/2,
// with A_m = e^{-x_m}/T - r - sigma^2/2
double stabilityBoundH(const ModelParameters& params, const std::vector<double>& x, double h);

// Equation W: max over the grid of |B(x) - 1| with B(x) = (r - e^x/T) / sigma^2
double maxDriftDeviationW(const ModelParameters& params, const std::vector<double>& x);

// Shrinks k when it exceeds the bound. N is kept, so the rebuilt tau axis j*k ends before tau_max.
StabilityResult adjustStabilityH(const ModelParameters& params, Logger& logger);

// Enforces h * max|B - 1| <= 2 by refining x (M grows) and then k / h^2 <= 1/2 by refining tau
// (N grows, tau_max fixed)
StabilityResult adjustStabilityW(const ModelParameters& params, Logger& logger);

StabilityResult adjustStability(EquationKind equation, const ModelParameters& params, Logger& logger);

} // namespace asian_pricer
