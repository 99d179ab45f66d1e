#pragma once

#include "option.hpp"
#include "mesh.hpp"
#include "stability.hpp"
#include "tridiagonal.hpp"
#include "logger.hpp"
#include <atomic>
#include <vector>
#include <memory>

namespace asian_pricer {

// Result of one solver invocation: grids plus the M x (N+1) solution indexed [spatial, temporal]
struct Solution {
    std::vector<double> x;
    std::vector<double> tau;
    SolutionMatrix values;
    SchemeCoefficients coefficients;
    StabilityReport stability;
};

// Weights of the three-point explicit update
//   u[m, n+1] = up * u[m+1, n] + mid * u[m, n] + down * u[m-1, n]
struct StencilWeights {
    double down = 0.0;
    double mid = 0.0;
    double up = 0.0;
};

StencilWeights explicitWeights(EquationKind equation, const ModelParameters& params,
                               const SchemeCoefficients& coefficients, double x);

// A (implicit operator) and B (explicit operator) of the Crank-Nicolson step A u^{n+1} = B u^n.
// Rows 0 and M-1 are identity rows carrying the boundary values.
struct CrankNicolsonSystem {
    TridiagonalMatrix A;
    TridiagonalMatrix B;
};

CrankNicolsonSystem buildCrankNicolsonSystem(EquationKind equation, const ModelParameters& params,
                                             const std::vector<double>& x,
                                             const SchemeCoefficients& coefficients);

// Throws NumericInstability if column n holds a NaN or an infinity
void checkFinite(const SolutionMatrix& values, size_t n);

class PDESolver {
public:
    PDESolver(const ModelParameters& params, EquationKind equation, OptionKind option,
              std::shared_ptr<Logger> logger = nullptr);

    // Forward-difference scheme; the step sizes are first brought inside the stability region
    Solution solveExplicit() const;

    // Crank-Nicolson scheme; one banded direct solve per time step
    Solution solveCrankNicolson() const;

    Solution solve(Scheme scheme) const;

    // Checked once per time step; a raised flag aborts the invocation with SolverCancelled
    void setCancellationFlag(const std::atomic<bool>* flag) { cancelFlag_ = flag; }

private:
    ModelParameters params_;
    EquationKind equation_;
    OptionKind option_;
    std::shared_ptr<Logger> logger_;
    const std::atomic<bool>* cancelFlag_ = nullptr;

    void checkCancelled(size_t step) const;
};

} // namespace asian_pricer
