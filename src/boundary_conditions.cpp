#include "boundary_conditions.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace asian_pricer {

using std::exp;

namespace {

[[noreturn]] void throwInvalid(EquationKind equation, OptionKind option) {
    if (equation != EquationKind::H && equation != EquationKind::W) {
        throw InvalidEquationKind(std::to_string(static_cast<int>(equation)));
    }
    throw InvalidOptionKind(std::to_string(static_cast<int>(option)));
}

// W(x -> -inf, tau) for a put decays with the discount factor
double discountedPutLeft(const ModelParameters& p, double tauNext) {
    return exp(-2.0 * p.r * tauNext / (p.sigma * p.sigma)) / p.T;
}

} // namespace

BoundaryValues explicitBoundary(EquationKind equation, OptionKind option,
                                const ModelParameters& p,
                                const SchemeCoefficients& c,
                                const std::vector<double>& x,
                                const std::vector<double>& previous,
                                double tauNext) {
    const double sigma2 = p.sigma * p.sigma;

    if (equation == EquationKind::H) {
        if (option == OptionKind::Call) {
            // First-order upwind update of H at x_0 using the layer n values
            const double left = previous[0] +
                (2.0 / sigma2) * c.k * (exp(-x[0]) / p.T) * (previous[1] - previous[0]) / c.h;
            return {left, 0.0};
        }
        if (option == OptionKind::Put) {
            return {0.0, exp((-2.0 / sigma2) * p.r * tauNext + p.xMax)};
        }
    } else if (equation == EquationKind::W) {
        if (option == OptionKind::Call) {
            // W(x, tau) ~ e^x / T as x -> inf
            return {0.0, exp(p.xMax) / p.T};
        }
        if (option == OptionKind::Put) {
            return {discountedPutLeft(p, tauNext), 0.0};
        }
    }
    throwInvalid(equation, option);
}

BoundaryValues crankNicolsonBoundary(EquationKind equation, OptionKind option,
                                     const ModelParameters& p,
                                     const std::vector<double>& previous,
                                     double tauNext) {
    const double sigma2 = p.sigma * p.sigma;

    if (equation == EquationKind::H) {
        if (option == OptionKind::Call) {
            // Zero-gradient pinning at x -> -inf
            return {previous[0], 0.0};
        }
        if (option == OptionKind::Put) {
            return {0.0, exp(p.xMax) - 1.0};
        }
    } else if (equation == EquationKind::W) {
        if (option == OptionKind::Call) {
            return {0.0, (2.0 / sigma2) * exp(p.xMax) / p.T};
        }
        if (option == OptionKind::Put) {
            return {discountedPutLeft(p, tauNext), 0.0};
        }
    }
    throwInvalid(equation, option);
}

} // namespace asian_pricer
