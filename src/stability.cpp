#include "stability.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace asian_pricer {

using std::vector;

double stabilityBoundH(const ModelParameters& p, const vector<double>& x, double h) {
    double minBound = std::numeric_limits<double>::infinity();
    for (size_t m = 1; m + 1 < x.size(); ++m) {
        const double A = std::exp(-x[m]) / p.T - p.r - 0.5 * p.sigma * p.sigma;
        const double bound = (A * A * h * h >= 1.0) ? 1.0 / (2.0 * A * A) : 0.5 * h * h;
        minBound = std::min(minBound, bound);
    }
    return minBound;
}

double maxDriftDeviationW(const ModelParameters& p, const vector<double>& x) {
    double deviation = 0.0;
    for (double xm : x) {
        const double B = (p.r - std::exp(xm) / p.T) / (p.sigma * p.sigma);
        deviation = std::max(deviation, std::abs(B - 1.0));
    }
    return deviation;
}

StabilityResult adjustStabilityH(const ModelParameters& params, Logger& logger) {
    StabilityResult result;
    result.mesh = buildMesh(params);

    Mesh& mesh = result.mesh;
    StabilityReport& report = result.report;
    report.oldM = report.newM = params.M;
    report.oldN = report.newN = params.N;
    report.oldH = report.newH = mesh.coefficients.h;
    report.oldK = report.newK = mesh.coefficients.k;
    report.bound = stabilityBoundH(params, mesh.x, mesh.coefficients.h);

    if (mesh.coefficients.k > report.bound) {
        const double k = report.bound;
        mesh.coefficients = SchemeCoefficients::fromSteps(mesh.coefficients.h, k);
        mesh.tau = timeAxis(params.N, k);
        report.newK = k;
        report.adjusted = true;

        std::ostringstream msg;
        msg << std::setprecision(10)
            << "k = " << report.oldK << " violates the stability bound for H; adjusted to k = " << k;
        logger.info(msg.str());

        std::ostringstream coverage;
        coverage << "H time axis keeps N = " << params.N << " steps and now ends at tau = "
                 << mesh.tau.back() << " instead of tau_max = " << params.tauMax();
        logger.warning(coverage.str());
    }
    return result;
}

StabilityResult adjustStabilityW(const ModelParameters& params, Logger& logger) {
    StabilityResult result;
    result.mesh = buildMesh(params);

    Mesh& mesh = result.mesh;
    StabilityReport& report = result.report;
    report.oldM = params.M;
    report.oldN = params.N;
    report.oldH = mesh.coefficients.h;
    report.oldK = mesh.coefficients.k;

    const double length = params.xMax - params.xMin;
    const double tauMax = params.tauMax();
    size_t M = params.M;
    size_t N = params.N;
    double h = mesh.coefficients.h;
    double k = mesh.coefficients.k;

    double deviation = maxDriftDeviationW(params, mesh.x);
    if (h * deviation > 2.0) {
        M = static_cast<size_t>(std::ceil(length * deviation / 2.0)) + 1;
        h = length / static_cast<double>(M - 1);
        mesh.x = linspace(params.xMin, params.xMax, M);
        deviation = maxDriftDeviationW(params, mesh.x);
        while (h * deviation > 2.0) {
            ++M;
            h = length / static_cast<double>(M - 1);
            mesh.x = linspace(params.xMin, params.xMax, M);
            deviation = maxDriftDeviationW(params, mesh.x);
        }
        report.adjusted = true;

        std::ostringstream msg;
        msg << std::setprecision(16) << "Adjusted h for stability: h = " << report.oldH << " (M = " << report.oldM
            << ") -> h = " << h << " (M = " << M << ")";
        logger.info(msg.str());
    }

    if (k / (h * h) > 0.5) {
        N = static_cast<size_t>(std::ceil(tauMax / (0.5 * h * h)));
        k = tauMax / static_cast<double>(N);
        while (k / (h * h) > 0.5) {
            ++N;
            k = tauMax / static_cast<double>(N);
        }
        mesh.tau = linspace(0.0, tauMax, N + 1);
        report.adjusted = true;

        std::ostringstream msg;
        msg << std::setprecision(16) << "Adjusted k for stability: k = " << report.oldK << " (N = " << report.oldN
            << ") -> k = " << k << " (N = " << N << ")";
        logger.info(msg.str());
    }

    mesh.coefficients = SchemeCoefficients::fromSteps(h, k);
    report.newM = M;
    report.newN = N;
    report.newH = h;
    report.newK = k;
    report.bound = 0.5 * h * h;
    return result;
}

StabilityResult adjustStability(EquationKind equation, const ModelParameters& params, Logger& logger) {
    switch (equation) {
        case EquationKind::H: return adjustStabilityH(params, logger);
        case EquationKind::W: return adjustStabilityW(params, logger);
    }
    throw InvalidEquationKind(std::to_string(static_cast<int>(equation)));
}

} // namespace asian_pricer
