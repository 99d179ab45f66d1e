#include "tridiagonal.hpp"
#include "errors.hpp"
#include <cmath>
#include <algorithm>
#include <limits>

namespace asian_pricer {

TridiagonalMatrix::TridiagonalMatrix(size_t n)
    : lower_(n, 0.0), diag_(n, 0.0), upper_(n, 0.0) {
    if (n == 0) {
        throw InvalidParameters("Tridiagonal matrix must have at least one row");
    }
}

void TridiagonalMatrix::setRow(size_t i, double lower, double diag, double upper) {
    lower_[i] = (i > 0) ? lower : 0.0;
    diag_[i] = diag;
    upper_[i] = (i + 1 < size()) ? upper : 0.0;
}

void TridiagonalMatrix::setIdentityRow(size_t i) {
    setRow(i, 0.0, 1.0, 0.0);
}

double TridiagonalMatrix::at(size_t i, size_t j) const {
    if (i == j) return diag_[i];
    if (j + 1 == i) return lower_[i];
    if (i + 1 == j) return upper_[i];
    return 0.0;
}

std::vector<double> TridiagonalMatrix::multiply(const std::vector<double>& v) const {
    const size_t n = size();
    if (v.size() != n) {
        throw InvalidParameters("Vector size does not match matrix size");
    }

    std::vector<double> result(n);
    for (size_t i = 0; i < n; ++i) {
        double sum = diag_[i] * v[i];
        if (i > 0) sum += lower_[i] * v[i - 1];
        if (i + 1 < n) sum += upper_[i] * v[i + 1];
        result[i] = sum;
    }
    return result;
}

TridiagonalLU::TridiagonalLU(const TridiagonalMatrix& matrix) {
    const size_t n = matrix.size();

    d_.resize(n);
    dl_.assign(n > 1 ? n - 1 : 0, 0.0);
    du_.assign(n > 1 ? n - 1 : 0, 0.0);
    du2_.assign(n > 2 ? n - 2 : 0, 0.0);
    ipiv_.resize(n);

    double scale = 0.0;
    for (size_t i = 0; i < n; ++i) {
        d_[i] = matrix.diag(i);
        scale = std::max(scale, std::abs(d_[i]));
        if (i + 1 < n) {
            dl_[i] = matrix.lower(i + 1);
            du_[i] = matrix.upper(i);
            scale = std::max({scale, std::abs(dl_[i]), std::abs(du_[i])});
        }
        ipiv_[i] = i;
    }
    const double tolerance = std::numeric_limits<double>::epsilon() * scale;

    // Forward elimination, swapping rows i and i+1 whenever the sub-diagonal entry dominates
    for (size_t i = 0; i + 1 < n; ++i) {
        if (std::abs(d_[i]) >= std::abs(dl_[i])) {
            if (std::abs(d_[i]) <= tolerance) {
                throw SingularMatrix(i);
            }
            const double fact = dl_[i] / d_[i];
            dl_[i] = fact;
            d_[i + 1] -= fact * du_[i];
        } else {
            const double fact = d_[i] / dl_[i];
            d_[i] = dl_[i];
            dl_[i] = fact;
            const double temp = du_[i];
            du_[i] = d_[i + 1];
            d_[i + 1] = temp - fact * d_[i + 1];
            if (i + 2 < n) {
                du2_[i] = du_[i + 1];
                du_[i + 1] = -fact * du_[i + 1];
            }
            ipiv_[i] = i + 1;
        }
    }

    if (std::abs(d_[n - 1]) <= tolerance) {
        throw SingularMatrix(n - 1);
    }
}

std::vector<double> TridiagonalLU::solve(std::vector<double> b) const {
    const size_t n = size();
    if (b.size() != n) {
        throw InvalidParameters("Right-hand side size does not match matrix size");
    }

    // Apply L^-1 together with the recorded row interchanges
    for (size_t i = 0; i + 1 < n; ++i) {
        if (ipiv_[i] == i) {
            b[i + 1] -= dl_[i] * b[i];
        } else {
            const double temp = b[i] - dl_[i] * b[i + 1];
            b[i] = b[i + 1];
            b[i + 1] = temp;
        }
    }

    // Back substitution with U
    b[n - 1] /= d_[n - 1];
    if (n > 1) {
        b[n - 2] = (b[n - 2] - du_[n - 2] * b[n - 1]) / d_[n - 2];
    }
    if (n > 2) {
        for (size_t i = n - 2; i-- > 0;) {
            b[i] = (b[i] - du_[i] * b[i + 1] - du2_[i] * b[i + 2]) / d_[i];
        }
    }
    return b;
}

std::vector<double> solveTridiagonal(const TridiagonalMatrix& matrix, const std::vector<double>& rhs) {
    return TridiagonalLU(matrix).solve(rhs);
}

} // namespace asian_pricer
