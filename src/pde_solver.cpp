#include "pde_solver.hpp"
#include "boundary_conditions.hpp"
#include "errors.hpp"
#include <cmath>
#include <vector>
#include <string>
#include <utility>

namespace asian_pricer {

using std::vector;
using std::exp;

StencilWeights explicitWeights(EquationKind equation, const ModelParameters& p,
                               const SchemeCoefficients& c, double x) {
    const double sigma2 = p.sigma * p.sigma;

    switch (equation) {
        case EquationKind::H: {
            const double A = exp(-x) / p.T - p.r - 0.5 * sigma2;
            const double drift = (c.lambda / sigma2) * A;
            return {c.mu - drift, 1.0 - 2.0 * c.mu, c.mu + drift};
        }
        case EquationKind::W: {
            const double B = (2.0 / sigma2) * (p.r - exp(x) / p.T);
            const double drift = 0.5 * c.lambda * (B - 1.0);
            return {c.mu - drift, 1.0 - 2.0 * c.mu - B * c.k, c.mu + drift};
        }
    }
    throw InvalidEquationKind(std::to_string(static_cast<int>(equation)));
}

CrankNicolsonSystem buildCrankNicolsonSystem(EquationKind equation, const ModelParameters& p,
                                             const vector<double>& x,
                                             const SchemeCoefficients& c) {
    if (equation != EquationKind::H && equation != EquationKind::W) {
        throw InvalidEquationKind(std::to_string(static_cast<int>(equation)));
    }

    const size_t M = x.size();
    const double sigma2 = p.sigma * p.sigma;
    CrankNicolsonSystem system{TridiagonalMatrix(M), TridiagonalMatrix(M)};

    for (size_t m = 1; m + 1 < M; ++m) {
        if (equation == EquationKind::H) {
            const double a = (1.0 / (2.0 * sigma2)) * (exp(-x[m]) / p.T - p.r - 0.5 * sigma2);
            const double drift = c.lambda * a;
            system.A.setRow(m, -0.5 * c.mu + drift, 1.0 + c.mu, -0.5 * c.mu - drift);
            system.B.setRow(m, 0.5 * c.mu - drift, 1.0 - c.mu, 0.5 * c.mu + drift);
        } else {
            const double b = (2.0 / sigma2) * (p.r - exp(x[m]) / p.T);
            const double drift = 0.25 * c.lambda * (b - 1.0);
            const double reaction = 0.5 * b * c.k;
            system.A.setRow(m, -0.5 * c.mu + drift, 1.0 + c.mu + reaction, -0.5 * c.mu - drift);
            system.B.setRow(m, 0.5 * c.mu - drift, 1.0 - c.mu - reaction, 0.5 * c.mu + drift);
        }
    }

    system.A.setIdentityRow(0);
    system.A.setIdentityRow(M - 1);
    system.B.setIdentityRow(0);
    system.B.setIdentityRow(M - 1);
    return system;
}

void checkFinite(const SolutionMatrix& values, size_t n) {
    const double* column = values.columnData(n);
    for (size_t m = 0; m < values.rows(); ++m) {
        if (!std::isfinite(column[m])) {
            throw NumericInstability(n, m);
        }
    }
}

PDESolver::PDESolver(const ModelParameters& params, EquationKind equation, OptionKind option,
                     std::shared_ptr<Logger> logger)
    : params_(params), equation_(equation), option_(option), logger_(orNullLogger(std::move(logger))) {
    params_.validate();
    if (equation_ != EquationKind::H && equation_ != EquationKind::W) {
        throw InvalidEquationKind(std::to_string(static_cast<int>(equation_)));
    }
    if (option_ != OptionKind::Call && option_ != OptionKind::Put) {
        throw InvalidOptionKind(std::to_string(static_cast<int>(option_)));
    }
}

void PDESolver::checkCancelled(size_t step) const {
    if (cancelFlag_ && cancelFlag_->load(std::memory_order_relaxed)) {
        throw SolverCancelled(step);
    }
}

Solution PDESolver::solveExplicit() const {
    StabilityResult stable = adjustStability(equation_, params_, *logger_);
    const Mesh& mesh = stable.mesh;
    const SchemeCoefficients& c = mesh.coefficients;
    const size_t M = mesh.M();
    const size_t N = mesh.N();

    Solution solution;
    solution.x = mesh.x;
    solution.tau = mesh.tau;
    solution.coefficients = c;
    solution.stability = stable.report;
    solution.values = SolutionMatrix(M, N + 1);

    SolutionMatrix& u = solution.values;
    setInitialCondition(u, mesh.x, equation_, option_);

    // Stencil weights depend on x only
    vector<double> down(M), mid(M), up(M);
    for (size_t m = 1; m + 1 < M; ++m) {
        const StencilWeights w = explicitWeights(equation_, params_, c, mesh.x[m]);
        down[m] = w.down;
        mid[m] = w.mid;
        up[m] = w.up;
    }

    vector<double> previous(M);
    for (size_t n = 0; n < N; ++n) {
        checkCancelled(n + 1);

        const double* current = u.columnData(n);
        double* next = u.columnData(n + 1);

        #pragma omp simd
        for (size_t m = 1; m < M - 1; ++m) {
            next[m] = up[m] * current[m + 1] + mid[m] * current[m] + down[m] * current[m - 1];
        }

        previous.assign(current, current + M);
        const BoundaryValues bc = explicitBoundary(equation_, option_, params_, c, mesh.x,
                                                   previous, mesh.tau[n + 1]);
        next[0] = bc.left;
        next[M - 1] = bc.right;

        checkFinite(u, n + 1);
    }

    return solution;
}

Solution PDESolver::solveCrankNicolson() const {
    const Mesh mesh = buildMesh(params_);
    const SchemeCoefficients& c = mesh.coefficients;
    const size_t M = mesh.M();
    const size_t N = mesh.N();

    Solution solution;
    solution.x = mesh.x;
    solution.tau = mesh.tau;
    solution.coefficients = c;
    solution.stability.oldM = solution.stability.newM = M;
    solution.stability.oldN = solution.stability.newN = N;
    solution.stability.oldH = solution.stability.newH = c.h;
    solution.stability.oldK = solution.stability.newK = c.k;
    solution.values = SolutionMatrix(M, N + 1);

    SolutionMatrix& u = solution.values;
    setInitialCondition(u, mesh.x, equation_, option_);

    const CrankNicolsonSystem system = buildCrankNicolsonSystem(equation_, params_, mesh.x, c);
    const TridiagonalLU lu(system.A);

    for (size_t n = 0; n < N; ++n) {
        checkCancelled(n + 1);

        const vector<double> current = u.column(n);
        vector<double> b = system.B.multiply(current);

        const BoundaryValues bc = crankNicolsonBoundary(equation_, option_, params_,
                                                        current, mesh.tau[n + 1]);
        b[0] = bc.left;
        b[M - 1] = bc.right;

        u.setColumn(n + 1, lu.solve(std::move(b)));
        checkFinite(u, n + 1);
    }

    return solution;
}

Solution PDESolver::solve(Scheme scheme) const {
    switch (scheme) {
        case Scheme::Explicit: return solveExplicit();
        case Scheme::CrankNicolson: return solveCrankNicolson();
    }
    throw ConfigurationError("Unknown scheme: " + std::to_string(static_cast<int>(scheme)));
}

} // namespace asian_pricer
