#pragma once

#include <vector>
#include <cstddef>

namespace asian_pricer {

// Square matrix whose only nonzero entries lie on the main diagonal and its two neighbours.
// Row i holds lower(i) at column i-1, diag(i) at column i and upper(i) at column i+1.
class TridiagonalMatrix {
public:
    explicit TridiagonalMatrix(size_t n);

    size_t size() const { return diag_.size(); }

    void setRow(size_t i, double lower, double diag, double upper);

    // Dirichlet row: 1 on the diagonal, 0 elsewhere
    void setIdentityRow(size_t i);

    double lower(size_t i) const { return lower_[i]; }
    double diag(size_t i) const { return diag_[i]; }
    double upper(size_t i) const { return upper_[i]; }

    // Dense view of entry (i, j); zero outside the band
    double at(size_t i, size_t j) const;

    std::vector<double> multiply(const std::vector<double>& v) const;

private:
    std::vector<double> lower_;  // lower_[0] unused
    std::vector<double> diag_;
    std::vector<double> upper_;  // upper_[n-1] unused
};

// LU factorisation with partial pivoting (row interchanges), following LAPACK gttrf/gttrs.
// Pivoting introduces one extra super-diagonal of fill-in.
class TridiagonalLU {
public:
    // Throws SingularMatrix if a pivot vanishes
    explicit TridiagonalLU(const TridiagonalMatrix& matrix);

    std::vector<double> solve(std::vector<double> rhs) const;

    size_t size() const { return d_.size(); }

private:
    std::vector<double> dl_;   // multipliers
    std::vector<double> d_;    // diagonal of U
    std::vector<double> du_;   // first super-diagonal of U
    std::vector<double> du2_;  // second super-diagonal of U (fill-in)
    std::vector<size_t> ipiv_;
};

// One-shot factorise and solve of A x = b
std::vector<double> solveTridiagonal(const TridiagonalMatrix& matrix, const std::vector<double>& rhs);

} // namespace asian_pricer
