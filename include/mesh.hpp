#pragma once

#include "option.hpp"
#include <vector>
#include <cstddef>

namespace asian_pricer {

struct SchemeCoefficients {
    double h = 0.0;       // Spatial step
    double k = 0.0;       // Time step
    double lambda = 0.0;  // k / h
    double mu = 0.0;      // k / h^2

    static SchemeCoefficients fromSteps(double h, double k) {
        return SchemeCoefficients{h, k, k / h, k / (h * h)};
    }
};

// Dense M x (N+1) matrix indexed [spatial, temporal]. Columns are stored contiguously
// so that a whole time layer can be read or written at once.
class SolutionMatrix {
public:
    SolutionMatrix() = default;
    SolutionMatrix(size_t rows, size_t cols, double value = 0.0);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }

    double& operator()(size_t m, size_t n) { return data_[n * rows_ + m]; }
    double operator()(size_t m, size_t n) const { return data_[n * rows_ + m]; }

    double* columnData(size_t n) { return data_.data() + n * rows_; }
    const double* columnData(size_t n) const { return data_.data() + n * rows_; }

    std::vector<double> column(size_t n) const;
    void setColumn(size_t n, const std::vector<double>& values);

    // Rows [begin, end) with every column
    SolutionMatrix rowSlice(size_t begin, size_t end) const;

    bool operator==(const SolutionMatrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
    }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> data_;
};

struct Mesh {
    std::vector<double> x;    // M points over [x_min, x_max]
    std::vector<double> tau;  // N+1 points starting at 0
    SchemeCoefficients coefficients;

    size_t M() const { return x.size(); }
    size_t N() const { return tau.empty() ? 0 : tau.size() - 1; }
};

// count equally spaced points with both end points included
std::vector<double> linspace(double start, double stop, size_t count);

// h = (x_max - x_min) / M, k = tau_max / N, x and tau uniform over their full ranges
Mesh buildMesh(const ModelParameters& params);

// tau_j = j * k for j = 0..N
std::vector<double> timeAxis(size_t N, double k);

// Payoff at tau = 0; the sign convention of W is the reverse of H
double payoff(EquationKind equation, OptionKind option, double x);

// Fills column 0 with the payoff at every spatial point
void setInitialCondition(SolutionMatrix& values, const std::vector<double>& x,
                         EquationKind equation, OptionKind option);

} // namespace asian_pricer
