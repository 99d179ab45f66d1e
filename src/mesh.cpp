#include "mesh.hpp"
#include "errors.hpp"
#include <cmath>
#include <algorithm>

namespace asian_pricer {

using std::vector;
using std::max;
using std::exp;

SolutionMatrix::SolutionMatrix(size_t rows, size_t cols, double value)
    : rows_(rows), cols_(cols), data_(rows * cols, value) {}

vector<double> SolutionMatrix::column(size_t n) const {
    const double* begin = columnData(n);
    return vector<double>(begin, begin + rows_);
}

void SolutionMatrix::setColumn(size_t n, const vector<double>& values) {
    if (values.size() != rows_) {
        throw InvalidParameters("Column size does not match the number of spatial points");
    }
    std::copy(values.begin(), values.end(), columnData(n));
}

SolutionMatrix SolutionMatrix::rowSlice(size_t begin, size_t end) const {
    end = std::min(end, rows_);
    begin = std::min(begin, end);

    SolutionMatrix slice(end - begin, cols_);
    for (size_t n = 0; n < cols_; ++n) {
        for (size_t m = begin; m < end; ++m) {
            slice(m - begin, n) = (*this)(m, n);
        }
    }
    return slice;
}

vector<double> linspace(double start, double stop, size_t count) {
    vector<double> points(count);
    if (count == 0) {
        return points;
    }
    if (count == 1) {
        points[0] = start;
        return points;
    }

    const double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        points[i] = start + static_cast<double>(i) * step;
    }
    points[count - 1] = stop;
    return points;
}

Mesh buildMesh(const ModelParameters& params) {
    params.validate();

    const double h = (params.xMax - params.xMin) / static_cast<double>(params.M);
    const double k = params.tauMax() / static_cast<double>(params.N);

    Mesh mesh;
    mesh.x = linspace(params.xMin, params.xMax, params.M);
    mesh.tau = linspace(0.0, params.tauMax(), params.N + 1);
    mesh.coefficients = SchemeCoefficients::fromSteps(h, k);
    return mesh;
}

vector<double> timeAxis(size_t N, double k) {
    vector<double> tau(N + 1);
    for (size_t j = 0; j <= N; ++j) {
        tau[j] = static_cast<double>(j) * k;
    }
    return tau;
}

double payoff(EquationKind equation, OptionKind option, double x) {
    double sign = 0.0;
    switch (option) {
        case OptionKind::Call: sign = 1.0; break;
        case OptionKind::Put: sign = -1.0; break;
        default: throw InvalidOptionKind(std::to_string(static_cast<int>(option)));
    }

    switch (equation) {
        case EquationKind::H: return max(sign * (1.0 - exp(x)), 0.0);
        case EquationKind::W: return max(sign * (exp(x) - 1.0), 0.0);
        default: throw InvalidEquationKind(std::to_string(static_cast<int>(equation)));
    }
}

void setInitialCondition(SolutionMatrix& values, const vector<double>& x,
                         EquationKind equation, OptionKind option) {
    if (values.rows() != x.size() || values.cols() == 0) {
        throw InvalidParameters("Solution matrix does not match the spatial grid");
    }
    for (size_t m = 0; m < x.size(); ++m) {
        values(m, 0) = payoff(equation, option, x[m]);
    }
}

} // namespace asian_pricer
